// ==============================================================================
// provider.cpp - Провайдеры AI-извлечения: общие части и regex-провайдер
// ==============================================================================

#include "budgetaudit/provider.hpp"

#include "budgetaudit/issue.hpp"
#include "budgetaudit/relation.hpp"
#include "budgetaudit/text.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace budgetaudit::ai {

// ============================================================================
// Tier
// ============================================================================

std::string to_string(Tier t) {
    switch (t) {
    case Tier::Primary:
        return "primary";
    case Tier::Backup:
        return "backup";
    case Tier::DisasterPrimary:
        return "disasterPrimary";
    case Tier::DisasterBackup:
        return "disasterBackup";
    case Tier::Fallback:
        return "fallback";
    }
    return "unknown";
}

Tier parse_tier(std::string_view s) {
    if (s == "primary")
        return Tier::Primary;
    if (s == "backup")
        return Tier::Backup;
    if (s == "disasterPrimary" || s == "disaster_primary" || s == "disaster-primary")
        return Tier::DisasterPrimary;
    if (s == "disasterBackup" || s == "disaster_backup" || s == "disaster-backup")
        return Tier::DisasterBackup;
    if (s == "fallback")
        return Tier::Fallback;
    throw std::invalid_argument(
        "unknown tier, must be: primary, backup, disaster_primary, disaster_backup, fallback");
}

// ============================================================================
// Ошибки
// ============================================================================

std::string to_string(ErrorKind k) {
    switch (k) {
    case ErrorKind::Auth:
        return "auth";
    case ErrorKind::ModelNotFound:
        return "model_not_found";
    case ErrorKind::RateLimit:
        return "rate_limit";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::Server:
        return "server";
    case ErrorKind::InvalidRequest:
        return "invalid_request";
    case ErrorKind::InvalidResponse:
        return "invalid_response";
    case ErrorKind::Network:
        return "network";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Unavailable:
        return "unavailable";
    }
    return "unknown";
}

ErrorKind classify_status(long status) {
    if (status == 401 || status == 403)
        return ErrorKind::Auth;
    if (status == 404)
        return ErrorKind::ModelNotFound;
    if (status == 408)
        return ErrorKind::Timeout;
    if (status == 429)
        return ErrorKind::RateLimit;
    if (status >= 500)
        return ErrorKind::Server;
    if (status >= 400)
        return ErrorKind::InvalidRequest;
    return ErrorKind::InvalidResponse;
}

bool ProviderError::retryable() const {
    return kind == ErrorKind::RateLimit || kind == ErrorKind::Timeout || kind == ErrorKind::Server ||
           kind == ErrorKind::Network;
}

std::string ProviderError::format() const {
    std::ostringstream oss;
    oss << to_string(kind);
    if (status != 0) {
        oss << " (HTTP " << status << ")";
    }
    if (!message.empty()) {
        oss << ": " << message;
    }
    return oss.str();
}

ProviderResult ProviderResult::success(ExtractResponse response) {
    ProviderResult r;
    r.ok = true;
    r.response = std::move(response);
    return r;
}

ProviderResult ProviderResult::failure(ErrorKind kind, std::string message, long status) {
    ProviderResult r;
    r.error = ProviderError{kind, status, std::move(message)};
    return r;
}

// ============================================================================
// Конфигурация
// ============================================================================

bool ProviderConfig::available() const {
    return enabled && !api_key.empty() && api_key.rfind("your_", 0) != 0 && !base_url.empty();
}

std::vector<ProviderConfig> default_provider_chain() {
    std::vector<ProviderConfig> chain;

    ProviderConfig flash;
    flash.name = "zhipu-flash";
    flash.tier = Tier::Primary;
    flash.model = "glm-4.5-flash";
    flash.base_url = "https://open.bigmodel.cn/api/paas/v4";
    flash.api_key_env = "ZHIPU_FLASH_API_KEY";
    chain.push_back(flash);

    ProviderConfig glm45;
    glm45.name = "zhipu-glm45";
    glm45.tier = Tier::Backup;
    glm45.model = "ZhipuAI/GLM-4.5";
    glm45.base_url = "https://api-inference.modelscope.cn/v1";
    glm45.api_key_env = "ZHIPU_GLM45_API_KEY";
    chain.push_back(glm45);

    ProviderConfig ds_primary;
    ds_primary.name = "deepseek-primary";
    ds_primary.tier = Tier::DisasterPrimary;
    ds_primary.model = "deepseek-ai/DeepSeek-V3.1";
    ds_primary.base_url = "https://api.deepseek.com/v1";
    ds_primary.api_key_env = "DEEPSEEK_API_KEY";
    chain.push_back(ds_primary);

    ProviderConfig ds_backup = ds_primary;
    ds_backup.name = "deepseek-backup";
    ds_backup.tier = Tier::DisasterBackup;
    ds_backup.model = "deepseek-ai/DeepSeek-V3";
    chain.push_back(ds_backup);

    return chain;
}

std::string mask_api_key(std::string_view key) {
    if (key.empty()) {
        return "";
    }
    if (key.size() <= 8) {
        return "***";
    }
    return std::string(key.substr(0, 4)) + "***" + std::string(key.substr(key.size() - 3));
}

// ============================================================================
// Протокол
// ============================================================================

namespace {

using issue::find_member;

rapidjson::Value make_string(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

rapidjson::Value make_span(const Span& span, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v(rapidjson::kArrayType);
    v.PushBack(static_cast<uint64_t>(span.first), alloc);
    v.PushBack(static_cast<uint64_t>(span.second), alloc);
    return v;
}

std::optional<std::string> get_string(const rapidjson::Value& obj,
                                      std::initializer_list<const char*> names) {
    const rapidjson::Value* v = find_member(obj, names);
    if (v == nullptr || !v->IsString()) {
        return std::nullopt;
    }
    return std::string(v->GetString(), v->GetStringLength());
}

/// [start, end] или {"start":..,"end":..}
std::optional<Span> get_span(const rapidjson::Value& obj, std::initializer_list<const char*> names) {
    const rapidjson::Value* v = find_member(obj, names);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (v->IsArray() && v->Size() == 2 && (*v)[0].IsUint64() && (*v)[1].IsUint64()) {
        return Span{static_cast<size_t>((*v)[0].GetUint64()), static_cast<size_t>((*v)[1].GetUint64())};
    }
    if (v->IsObject()) {
        const auto* s = find_member(*v, {"start"});
        const auto* e = find_member(*v, {"end"});
        if (s != nullptr && e != nullptr && s->IsUint64() && e->IsUint64()) {
            return Span{static_cast<size_t>(s->GetUint64()), static_cast<size_t>(e->GetUint64())};
        }
    }
    return std::nullopt;
}

bool hit_from_json(const rapidjson::Value& json, Hit& hit, std::string& error) {
    if (!json.IsObject()) {
        error = "hit must be a JSON object";
        return false;
    }
    auto budget = get_string(json, {"budget_text", "budgetText"});
    auto final_text = get_string(json, {"final_text", "finalText"});
    auto stmt = get_string(json, {"stmt_text", "stmtText"});
    auto budget_span = get_span(json, {"budget_span", "budgetSpan"});
    auto final_span = get_span(json, {"final_span", "finalSpan"});
    auto stmt_span = get_span(json, {"stmt_span", "stmtSpan"});
    if (!budget || !final_text || !stmt || !budget_span || !final_span || !stmt_span) {
        error = "hit is missing text or span fields";
        return false;
    }

    hit.budget_text = *budget;
    hit.final_text = *final_text;
    hit.stmt_text = *stmt;
    hit.budget_span = *budget_span;
    hit.final_span = *final_span;
    hit.stmt_span = *stmt_span;
    hit.reason_text = get_string(json, {"reason_text", "reasonText"});
    hit.reason_span = get_span(json, {"reason_span", "reasonSpan"});
    hit.item_title = get_string(json, {"item_title", "itemTitle", "item"});
    hit.clip = get_string(json, {"clip"}).value_or("");
    hit.note = get_string(json, {"note"}).value_or("");
    if (const auto* c = find_member(json, {"confidence"}); c != nullptr && c->IsNumber()) {
        hit.confidence = issue::clamp_confidence(c->GetDouble());
    }
    return true;
}

}  // anonymous namespace

void request_to_json(const ExtractRequest& request, rapidjson::Value& out,
                     rapidjson::Document::AllocatorType& alloc) {
    out.SetObject();
    out.AddMember("task", make_string(request.task, alloc), alloc);
    out.AddMember("sectionText", make_string(request.section_text, alloc), alloc);
    out.AddMember("docHash", make_string(request.doc_hash, alloc), alloc);
    out.AddMember("maxWindows", static_cast<uint64_t>(request.max_windows), alloc);
}

void response_to_json(const ExtractResponse& response, rapidjson::Value& out,
                      rapidjson::Document::AllocatorType& alloc) {
    out.SetObject();
    rapidjson::Value hits(rapidjson::kArrayType);
    for (const auto& h : response.hits) {
        rapidjson::Value v(rapidjson::kObjectType);
        v.AddMember("budgetText", make_string(h.budget_text, alloc), alloc);
        v.AddMember("budgetSpan", make_span(h.budget_span, alloc), alloc);
        v.AddMember("finalText", make_string(h.final_text, alloc), alloc);
        v.AddMember("finalSpan", make_span(h.final_span, alloc), alloc);
        v.AddMember("stmtText", make_string(h.stmt_text, alloc), alloc);
        v.AddMember("stmtSpan", make_span(h.stmt_span, alloc), alloc);
        if (h.reason_text) {
            v.AddMember("reasonText", make_string(*h.reason_text, alloc), alloc);
        }
        if (h.reason_span) {
            v.AddMember("reasonSpan", make_span(*h.reason_span, alloc), alloc);
        }
        if (h.item_title) {
            v.AddMember("itemTitle", make_string(*h.item_title, alloc), alloc);
        }
        v.AddMember("clip", make_string(h.clip, alloc), alloc);
        v.AddMember("confidence", h.confidence, alloc);
        if (!h.note.empty()) {
            v.AddMember("note", make_string(h.note, alloc), alloc);
        }
        hits.PushBack(v, alloc);
    }
    out.AddMember("hits", hits, alloc);

    rapidjson::Value meta(rapidjson::kObjectType);
    meta.AddMember("model", make_string(response.model, alloc), alloc);
    meta.AddMember("cached", response.cached, alloc);
    out.AddMember("meta", meta, alloc);
}

bool response_from_json(const rapidjson::Value& json, ExtractResponse& out, std::string& error) {
    if (!json.IsObject()) {
        error = "response must be a JSON object";
        return false;
    }
    const auto* hits = find_member(json, {"hits", "pairs"});
    if (hits == nullptr || !hits->IsArray()) {
        error = "response is missing 'hits' array";
        return false;
    }

    ExtractResponse response;
    for (const auto& item : hits->GetArray()) {
        Hit hit;
        if (!hit_from_json(item, hit, error)) {
            return false;
        }
        response.hits.push_back(std::move(hit));
    }
    if (const auto* meta = find_member(json, {"meta"}); meta != nullptr && meta->IsObject()) {
        response.model = get_string(*meta, {"model"}).value_or("");
        if (const auto* c = find_member(*meta, {"cached"}); c != nullptr && c->IsBool()) {
            response.cached = c->GetBool();
        }
    }
    out = std::move(response);
    return true;
}

// ============================================================================
// RegexFallbackProvider
// ============================================================================

ProviderResult RegexFallbackProvider::extract(const ExtractRequest& request,
                                              const cancel::CancelToken* cancel) {
    if (cancel != nullptr && cancel->cancelled()) {
        return ProviderResult::failure(ErrorKind::Cancelled, "cancelled");
    }

    std::wstring window = text::widen(request.section_text);
    ExtractResponse response;
    response.model = model_id();

    for (const auto& pair : relation::dedupe_pairs(relation::extract_pairs(window))) {
        Hit hit;
        hit.budget_text = pair.budget_text;
        hit.budget_span = pair.budget_span;
        hit.final_text = pair.final_text;
        hit.final_span = pair.final_span;
        hit.stmt_text = pair.stmt_text;
        hit.stmt_span = pair.stmt_span;
        if (pair.reason_text) {
            std::wstring reason = text::widen(*pair.reason_text);
            size_t pos = window.find(reason, pair.stmt_span.second);
            size_t marker = pos == std::wstring::npos ? pos : window.rfind(L"原因", pos);
            if (marker != std::wstring::npos && marker >= pair.stmt_span.second) {
                // Причина вместе с маркером "主要原因："
                size_t start = std::max(pair.stmt_span.second, marker >= 2 ? marker - 2 : 0);
                size_t end = pos + reason.size();
                hit.reason_text = text::narrow(window.substr(start, end - start));
                hit.reason_span = Span{start, end};
            }
        }
        hit.item_title = pair.item_title;
        hit.clip = pair.clip;
        hit.confidence = 0.6;
        hit.note = pair.origin;
        response.hits.push_back(std::move(hit));
    }
    return ProviderResult::success(std::move(response));
}

// ============================================================================
// Фабрика
// ============================================================================

std::unique_ptr<Provider> make_provider(const ProviderConfig& config) {
    if (config.tier == Tier::Fallback) {
        return std::make_unique<RegexFallbackProvider>();
    }
    return std::make_unique<OpenAICompatProvider>(config);
}

}  // namespace budgetaudit::ai
