// ==============================================================================
// budgetaudit/relation.hpp - Сопоставление "预算 / 决算 / 结论" в тексте
// ==============================================================================
//
// Назначение:
// - Поиск троек (预算数, 决算数, 结论短语) в тексте раздела: прямой,
//   запасной и обратный порядок
// - Отбрасывание сравнений с прошлым годом (同比, 比上年 ...) рядом с выводом
// - Дедупликация по позиции и числам с динамическим допуском
// - Проверка: заявленное отношение против вычисленного, формулировка
//   "基本持平", отсутствие причины после "其中"
//
// Общий код для правила сверки текста с числами, AI-клиента и
// regex-провайдера: обе стороны формируют находки одинаково.
//
// ==============================================================================

#ifndef BUDGETAUDIT_RELATION_HPP
#define BUDGETAUDIT_RELATION_HPP

#include "budgetaudit/issue.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace budgetaudit::relation {

// ============================================================================
// Отношение
// ============================================================================

/// Отношение决算 к 预算 (等于 и 持平 - одно и то же)
enum class Relation { Greater, Less, Flat };

std::string to_string(Relation r);

/// "大于" / "小于" / "持平"
std::string to_chinese(Relation r);

/// Разобрать结论短语: содержит 持平 -> Flat, 大于 -> Greater, 小于 -> Less, иначе Flat (等于)
Relation parse_statement(std::string_view stmt);

/// Формулировка "基本持平"
bool is_basic_parity_wording(std::string_view stmt);

/// Отношение по числам с динамическим допуском
Relation compute_relation(double budget, double final_value);

/// Фраза结论 ("决算数小于预算数" и т.п.)
bool is_statement(std::string_view text);

// ============================================================================
// Тройки
// ============================================================================

/// Найденная тройка; смещения - кодовые точки внутри текста раздела
struct Pair {
    std::string budget_text;  // число как в тексте
    std::string final_text;
    std::string stmt_text;
    double budget = 0.0;
    double final_value = 0.0;

    std::pair<size_t, size_t> budget_span;
    std::pair<size_t, size_t> final_span;
    std::pair<size_t, size_t> stmt_span;
    size_t match_start = 0;
    size_t match_end = 0;

    std::optional<std::string> reason_text;
    std::optional<std::string> item_title;
    bool in_items = false;  // после "其中"
    std::string clip;
    std::string origin;     // regex | fallback | reverse | ai
    double confidence = 1.0;
};

struct ExtractOptions {
    size_t reason_window = 320;
    size_t negative_window = 40;
    size_t clip_chars = 80;
};

/// Найти тройки в тексте раздела (три прохода, с фильтром отрицательных слов)
std::vector<Pair> extract_pairs(std::wstring_view section, const ExtractOptions& options = {});

/// Причина после позиции from: до следующего пункта "N、" или reason_window символов
std::optional<std::string> find_reason(std::wstring_view section, size_t from,
                                       size_t reason_window);

/// Позиция "其中" в разделе
std::optional<size_t> items_anchor(std::wstring_view section);

/// Удалить дубликаты: позиция в пределах 60 символов и числа в пределах допуска.
/// Из дубликатов сохраняется вариант с причиной
std::vector<Pair> dedupe_pairs(const std::vector<Pair>& pairs);

/// Число из текста суммы ("1,234.5万元" -> 1234.5)
std::optional<double> parse_amount(std::string_view text);

/// Текст несёт единицу измерения (万元 / 元 / 亿元)
bool has_unit(std::string_view text);

// ============================================================================
// Находки
// ============================================================================

/// Контекст формирования находок для тройки
struct IssueContext {
    std::string rule_id;
    std::string category;
    issue::Source source = issue::Source::Rule;
    issue::Severity mismatch_severity = issue::Severity::High;
    issue::Severity missing_reason_severity = issue::Severity::Medium;
    int page = 0;
    std::optional<std::pair<size_t, size_t>> span;  // в тексте страницы
    std::optional<std::string> section;
};

/// Заголовки находок
inline constexpr const char* TITLE_MISMATCH = "预决算对比表述与数值不一致";
inline constexpr const char* TITLE_MISSING_REASON = "预决算差异未说明主要原因";
inline constexpr const char* TITLE_PARITY_WORDING = "用语“基本持平”不规范";

/// Находки для тройки (0..3): несоответствие, формулировка, нет причины.
/// id не заполняется - его назначает детектор
std::vector<issue::Issue> pair_issues(const Pair& pair, const IssueContext& ctx);

}  // namespace budgetaudit::relation

#endif  // BUDGETAUDIT_RELATION_HPP
