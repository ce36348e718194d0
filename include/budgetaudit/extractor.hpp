// ==============================================================================
// budgetaudit/extractor.hpp - Клиент AI-извлечения
// ==============================================================================
//
// Назначение:
// - Разбиение раздела на перекрывающиеся окна (кодовые точки)
// - Промпт на окно, параллельные вызовы цепочки провайдеров
//   (не более concurrency одновременно)
// - Перепроверка каждого ответа по тексту окна: ответ модели не принимается
//   на веру
// - Дедупликация между окнами, фильтр шума, преобразование в AIFinding
//   той же логикой, что и у правила сверки текста с числами
//
// ==============================================================================

#ifndef BUDGETAUDIT_EXTRACTOR_HPP
#define BUDGETAUDIT_EXTRACTOR_HPP

#include "budgetaudit/cancel.hpp"
#include "budgetaudit/document.hpp"
#include "budgetaudit/issue.hpp"
#include "budgetaudit/output.hpp"
#include "budgetaudit/provider.hpp"
#include "budgetaudit/resilience.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace budgetaudit::ai {

// ============================================================================
// Окна
// ============================================================================

struct WindowOptions {
    size_t window_size = 1700;
    size_t overlap = 200;
    size_t min_window = 500;
    size_t max_windows = 20;
};

/// Окно [start, end) в тексте раздела
struct Window {
    size_t index = 0;
    size_t start = 0;
    size_t end = 0;
    std::wstring text;
};

struct WindowSplit {
    std::vector<Window> windows;
    bool truncated = false;
};

/// Хвост короче min_window присоединяется к предыдущему окну
WindowSplit split_windows(std::wstring_view text, const WindowOptions& options = {});

/// Промпт: идентификатор задачи и текст окна без изменений
std::string build_prompt(std::string_view task, std::string_view window_text);

// ============================================================================
// Проверка ответа
// ============================================================================

struct Validation {
    bool ok = false;
    std::string reason;

    explicit operator bool() const { return ok; }
};

/// Каждый span совпадает со своим текстом, суммы несут число и единицу,
/// вывод - фраза сравнения, суммы не перекрываются более чем на 80%,
/// причина содержит "原因"
Validation validate_hit(const Hit& hit, std::wstring_view window_text);

/// Единственное обоснование - многократное появление ("出现多次", "重复出现", "出现3次")
bool is_noise(std::string_view justification);

// ============================================================================
// ExtractionClient
// ============================================================================

struct ClientOptions {
    WindowOptions windows;
    size_t concurrency = 4;
    std::string task = "budget_vs_final";
    double dedup_similarity = 0.9;
    int dedup_page_tolerance = 1;
    std::string rule_id = "V33-110";
    std::string category = "text-number";
    issue::Severity mismatch_severity = issue::Severity::High;
    issue::Severity missing_reason_severity = issue::Severity::Medium;
    std::string section_start;  // пусто - весь документ
    std::string section_end;
};

struct ProviderStat {
    size_t window = 0;
    Tier tier = Tier::Fallback;
    std::string provider;
    bool fell_back = false;
    bool regex_fallback = false;
    int attempts = 0;
};

struct Meta {
    size_t tokens_used = 0;
    long elapsed_ms = 0;
    std::vector<ProviderStat> provider_stats;
    size_t windows = 0;
    size_t validation_failures = 0;
    size_t noise_suppressed = 0;
    size_t duplicates = 0;
    bool truncated = false;
    bool fell_back = false;       // хотя бы одно окно обслужил не первый провайдер
    bool regex_fallback = false;  // хотя бы одно окно ушло в regex
};

struct ExtractionResult {
    std::vector<issue::AIFinding> findings;
    Meta meta;
    bool cancelled = false;
};

class ExtractionClient {
public:
    ExtractionClient(ResilientExtractor& extractor, ClientOptions options = {},
                     output::Writer* writer = nullptr);

    /// Извлечь находки из документа (раздел по section_start/section_end или весь текст)
    ExtractionResult run(const document::Document& doc, const cancel::CancelToken* cancel = nullptr);

    const ClientOptions& options() const { return options_; }

private:
    ResilientExtractor& extractor_;
    ClientOptions options_;
    output::Writer* writer_;
};

void meta_to_json(const Meta& meta, rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc);

}  // namespace budgetaudit::ai

#endif  // BUDGETAUDIT_EXTRACTOR_HPP
