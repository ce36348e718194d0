// ==============================================================================
// openai_compat.cpp - Провайдер OpenAI-совместимого API (libcurl)
// ==============================================================================

#include "budgetaudit/provider.hpp"

#include "budgetaudit/issue.hpp"

#include <curl/curl.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <memory>
#include <mutex>

namespace budgetaudit::ai {

namespace {

constexpr const char* SYSTEM_PROMPT =
    "你是预决算公开文本审校助手。只输出 JSON 对象 {\"hits\": [...]}，不要输出其他内容。"
    "每个 hit 包含 budgetText, budgetSpan, finalText, finalSpan, stmtText, stmtSpan，"
    "可选 reasonText, reasonSpan, itemTitle, clip, confidence。"
    "span 为 [start, end)，按字符（非字节）计，相对于给定文本；各 text 必须与原文完全一致。";

void global_init() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

ErrorKind classify_curl(CURLcode code) {
    switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
        return ErrorKind::Timeout;
    case CURLE_ABORTED_BY_CALLBACK:
    case CURLE_WRITE_ERROR:  // write_cb вернул 0 при отмене
        return ErrorKind::Cancelled;
    default:
        // DNS, соединение, TLS, обрыв передачи
        return ErrorKind::Network;
    }
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, CurlDeleter>;

struct WriteContext {
    std::string body;
    const cancel::CancelToken* cancel = nullptr;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx == nullptr) {
        return 0;
    }
    if (ctx->cancel != nullptr && ctx->cancel->cancelled()) {
        return 0;
    }
    ctx->body.append(ptr, total);
    return total;
}

/// Прерывает передачу при отмене (и во время ожидания ответа)
int progress_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx != nullptr && ctx->cancel != nullptr && ctx->cancel->cancelled()) {
        return 1;
    }
    return 0;
}

/// Содержимое сообщения модели может быть обёрнуто в ```json ... ```
std::string_view strip_fences(std::string_view content) {
    size_t open = content.find('{');
    size_t close = content.rfind('}');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
        return content;
    }
    return content.substr(open, close - open + 1);
}

}  // anonymous namespace

OpenAICompatProvider::OpenAICompatProvider(ProviderConfig config) : config_(std::move(config)) {}

std::string OpenAICompatProvider::build_body(const ExtractRequest& request) const {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    auto str = [&](const std::string& s) {
        rapidjson::Value v;
        v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return v;
    };

    doc.AddMember("model", str(config_.model), alloc);

    rapidjson::Value messages(rapidjson::kArrayType);
    rapidjson::Value system(rapidjson::kObjectType);
    system.AddMember("role", "system", alloc);
    system.AddMember("content", str(SYSTEM_PROMPT), alloc);
    messages.PushBack(system, alloc);

    rapidjson::Value user(rapidjson::kObjectType);
    user.AddMember("role", "user", alloc);
    user.AddMember("content", str(request.prompt.empty() ? request.section_text : request.prompt), alloc);
    messages.PushBack(user, alloc);
    doc.AddMember("messages", messages, alloc);

    doc.AddMember("temperature", 0.0, alloc);
    rapidjson::Value format(rapidjson::kObjectType);
    format.AddMember("type", "json_object", alloc);
    doc.AddMember("response_format", format, alloc);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

ProviderResult OpenAICompatProvider::parse_body(std::string_view body) {
    rapidjson::Document doc;
    doc.Parse(body.data(), body.size());
    if (doc.HasParseError()) {
        return ProviderResult::failure(ErrorKind::InvalidResponse,
                                       rapidjson::GetParseError_En(doc.GetParseError()));
    }

    const auto* choices = issue::find_member(doc, {"choices"});
    if (choices == nullptr || !choices->IsArray() || choices->Empty()) {
        return ProviderResult::failure(ErrorKind::InvalidResponse, "response has no choices");
    }
    const auto& first = (*choices)[0];
    const auto* message = issue::find_member(first, {"message"});
    const auto* content = message != nullptr ? issue::find_member(*message, {"content"}) : nullptr;
    if (content == nullptr || !content->IsString()) {
        return ProviderResult::failure(ErrorKind::InvalidResponse, "response has no message content");
    }

    std::string_view payload = strip_fences(std::string_view(content->GetString(), content->GetStringLength()));
    rapidjson::Document inner;
    inner.Parse(payload.data(), payload.size());
    if (inner.HasParseError()) {
        return ProviderResult::failure(ErrorKind::InvalidResponse,
                                       std::string("content is not JSON: ") +
                                           rapidjson::GetParseError_En(inner.GetParseError()));
    }

    ExtractResponse response;
    std::string error;
    if (!response_from_json(inner, response, error)) {
        return ProviderResult::failure(ErrorKind::InvalidResponse, error);
    }

    if (const auto* model = issue::find_member(doc, {"model"}); model != nullptr && model->IsString()) {
        response.model = model->GetString();
    }
    if (const auto* usage = issue::find_member(doc, {"usage"}); usage != nullptr && usage->IsObject()) {
        const auto* total = issue::find_member(*usage, {"total_tokens", "totalTokens"});
        if (total != nullptr && total->IsUint64()) {
            response.tokens_used = static_cast<size_t>(total->GetUint64());
        }
    }
    return ProviderResult::success(std::move(response));
}

ProviderResult OpenAICompatProvider::extract(const ExtractRequest& request,
                                             const cancel::CancelToken* cancel) {
    if (!available()) {
        return ProviderResult::failure(ErrorKind::Unavailable, "API key is not configured");
    }
    if (cancel != nullptr && cancel->cancelled()) {
        return ProviderResult::failure(ErrorKind::Cancelled, "cancelled");
    }

    std::string url = config_.base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += "/chat/completions";
    std::string body = build_body(request);
    std::string auth = "Authorization: Bearer " + config_.api_key;

    global_init();
    CurlHandle handle(curl_easy_init());
    if (!handle) {
        return ProviderResult::failure(ErrorKind::Network, "curl_easy_init failed");
    }
    CURL* curl = handle.get();

    HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"));
    curl_slist* appended = headers ? curl_slist_append(headers.get(), auth.c_str()) : nullptr;
    if (appended == nullptr) {
        return ProviderResult::failure(ErrorKind::Network, "curl_slist_append failed");
    }

    WriteContext ctx;
    ctx.cancel = cancel;

    long timeout_ms = static_cast<long>(config_.timeout.count());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min<long>(timeout_ms, 10000));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    if (cancel != nullptr && cancel->cancelled()) {
        return ProviderResult::failure(ErrorKind::Cancelled, "cancelled");
    }
    if (rc != CURLE_OK) {
        return ProviderResult::failure(classify_curl(rc), curl_easy_strerror(rc));
    }
    if (status < 200 || status >= 300) {
        std::string snippet = ctx.body.substr(0, 200);
        return ProviderResult::failure(classify_status(status), snippet, status);
    }
    return parse_body(ctx.body);
}

}  // namespace budgetaudit::ai
