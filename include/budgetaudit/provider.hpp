// ==============================================================================
// budgetaudit/provider.hpp - Провайдеры AI-извлечения
// ==============================================================================
//
// Назначение:
// - Provider: единый интерфейс extract(request, cancel)
// - OpenAICompatProvider: POST {base}/chat/completions через libcurl
// - RegexFallbackProvider: извлечение троек регулярными выражениями,
//   без сети, не отказывает
// - Таксономия ошибок провайдера и классификация HTTP-статусов
// - Протокол обмена (JSON): запрос {task, sectionText, docHash, maxWindows},
//   ответ {hits: [...], meta: {model, cached}}
//
// Смещения span в ответе - [start, end) в кодовых точках текста окна.
//
// ==============================================================================

#ifndef BUDGETAUDIT_PROVIDER_HPP
#define BUDGETAUDIT_PROVIDER_HPP

#include "budgetaudit/cancel.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <rapidjson/document.h>

namespace budgetaudit::ai {

// ============================================================================
// Tier
// ============================================================================

/// Позиция в цепочке: primary, backup, disaster-primary, disaster-backup.
/// Fallback - регулярные выражения после исчерпания цепочки
enum class Tier { Primary, Backup, DisasterPrimary, DisasterBackup, Fallback };

std::string to_string(Tier t);

/// @throw std::invalid_argument если строка не распознана
Tier parse_tier(std::string_view s);

// ============================================================================
// Ошибки
// ============================================================================

enum class ErrorKind {
    Auth,            // 401 / 403
    ModelNotFound,   // 404
    RateLimit,       // 429
    Timeout,         // 408 или таймаут транспорта
    Server,          // 5xx
    InvalidRequest,  // 400
    InvalidResponse, // ответ не разобран
    Network,         // соединение, DNS, обрыв
    Cancelled,
    Unavailable      // нет ключа
};

std::string to_string(ErrorKind k);

/// HTTP-статус -> вид ошибки
ErrorKind classify_status(long status);

struct ProviderError {
    ErrorKind kind = ErrorKind::Network;
    long status = 0;
    std::string message;

    /// rate_limit, timeout, server, network
    bool retryable() const;

    std::string format() const;
};

// ============================================================================
// Запрос / ответ
// ============================================================================

using Span = std::pair<size_t, size_t>;

/// Тройка, найденная провайдером в окне
struct Hit {
    std::string budget_text;
    Span budget_span{0, 0};
    std::string final_text;
    Span final_span{0, 0};
    std::string stmt_text;
    Span stmt_span{0, 0};
    std::optional<std::string> reason_text;
    std::optional<Span> reason_span;
    std::optional<std::string> item_title;
    std::string clip;
    double confidence = 0.8;
    std::string note;
};

struct ExtractRequest {
    std::string task;
    std::string section_text;  // текст окна
    std::string doc_hash;
    size_t max_windows = 0;
    std::string prompt;        // готовый промпт для чат-моделей
};

struct ExtractResponse {
    std::vector<Hit> hits;
    std::string model;
    bool cached = false;
    size_t tokens_used = 0;
};

struct ProviderResult {
    bool ok = false;
    ExtractResponse response;
    ProviderError error;

    explicit operator bool() const { return ok; }

    static ProviderResult success(ExtractResponse response);
    static ProviderResult failure(ErrorKind kind, std::string message, long status = 0);
};

// ============================================================================
// Provider
// ============================================================================

class Provider {
public:
    virtual ~Provider() = default;

    virtual std::string name() const = 0;
    virtual Tier tier() const = 0;
    virtual std::string model_id() const = 0;

    /// Ключ и адрес заданы
    virtual bool available() const = 0;

    /// Один вызов без повторов. Отмена завершает вызов с ErrorKind::Cancelled
    virtual ProviderResult extract(const ExtractRequest& request,
                                   const cancel::CancelToken* cancel) = 0;
};

// ============================================================================
// Конфигурация
// ============================================================================

struct ProviderConfig {
    std::string name;
    Tier tier = Tier::Primary;
    std::string model;
    std::string base_url;
    std::string api_key;
    std::string api_key_env;  // переменная окружения ключа
    std::chrono::milliseconds timeout{60000};
    bool enabled = true;

    /// Ключ задан и не является заглушкой "your_..."
    bool available() const;
};

/// Цепочка по умолчанию: glm-4.5-flash, GLM-4.5, DeepSeek-V3.1, DeepSeek-V3 (без ключей)
std::vector<ProviderConfig> default_provider_chain();

/// "abcd***xyz"; короткие ключи маскируются целиком
std::string mask_api_key(std::string_view key);

// ============================================================================
// Протокол
// ============================================================================

void request_to_json(const ExtractRequest& request, rapidjson::Value& out,
                     rapidjson::Document::AllocatorType& alloc);

void response_to_json(const ExtractResponse& response, rapidjson::Value& out,
                      rapidjson::Document::AllocatorType& alloc);

/// Разобрать ответ; принимает "hits" или "pairs", snake_case и camelCase
bool response_from_json(const rapidjson::Value& json, ExtractResponse& out, std::string& error);

// ============================================================================
// Реализации
// ============================================================================

class OpenAICompatProvider : public Provider {
public:
    explicit OpenAICompatProvider(ProviderConfig config);

    std::string name() const override { return config_.name; }
    Tier tier() const override { return config_.tier; }
    std::string model_id() const override { return config_.model; }
    bool available() const override { return config_.available(); }

    ProviderResult extract(const ExtractRequest& request,
                           const cancel::CancelToken* cancel) override;

    /// Тело запроса chat/completions
    std::string build_body(const ExtractRequest& request) const;

    /// Разобрать тело ответа chat/completions (choices[0].message.content)
    static ProviderResult parse_body(std::string_view body);

private:
    ProviderConfig config_;
};

class RegexFallbackProvider : public Provider {
public:
    std::string name() const override { return "regex-fallback"; }
    Tier tier() const override { return Tier::Fallback; }
    std::string model_id() const override { return "regex"; }
    bool available() const override { return true; }

    ProviderResult extract(const ExtractRequest& request,
                           const cancel::CancelToken* cancel) override;
};

/// Провайдер по конфигурации
std::unique_ptr<Provider> make_provider(const ProviderConfig& config);

}  // namespace budgetaudit::ai

#endif  // BUDGETAUDIT_PROVIDER_HPP
