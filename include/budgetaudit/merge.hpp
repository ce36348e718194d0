// ==============================================================================
// budgetaudit/merge.hpp - Слияние находок правил и AI
// ==============================================================================
//
// Назначение:
// - Сопоставление находок по первичному ключу (правило/категория, страница,
//   таблица, предмет) и вторичному (похожесть заголовка, соседние страницы)
// - Классы: agreement, conflict, ai_only, rule_only; каждая входная находка
//   попадает ровно в один
// - Разрешение конфликтов: preferRule / preferAi / composite
// - Дубликаты ключа на одной стороне не сливаются и попадают в inconsistencies
//
// Результат детерминирован: входы сортируются по id, сопоставление жадное
// в порядке (вид ключа, похожесть, id). Повторное слияние результата
// даёт побайтно тот же JSON.
//
// ==============================================================================

#ifndef BUDGETAUDIT_MERGE_HPP
#define BUDGETAUDIT_MERGE_HPP

#include "budgetaudit/issue.hpp"

#include <optional>
#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace budgetaudit::merge {

struct MergeOptions {
    double title_similarity = 0.85;
    int page_tolerance = 1;
    int severity_tolerance = 0;
    double money_tolerance = 0.005;   // относительный, для метрик budget/final
    double percent_tolerance = 0.002;
    double agreement_boost = 0.1;
};

// ============================================================================
// Классификация
// ============================================================================

enum class ConflictReason { SeverityMismatch, CategoryMismatch, ScopeMismatch, Missing };

enum class Resolution { PreferRule, PreferAi, Composite };

std::string to_string(ConflictReason r);
std::string to_string(Resolution r);

struct Conflict {
    std::string key;
    std::optional<std::string> ai_issue_id;
    std::optional<std::string> rule_issue_id;
    ConflictReason reason = ConflictReason::SeverityMismatch;
    Resolution resolution = Resolution::PreferRule;
    issue::Severity final_severity = issue::Severity::Info;
};

struct Agreement {
    std::string key;
    std::string ai_issue_id;
    std::string rule_issue_id;
    double confidence = 0.0;
};

/// Дубликат ключа или id на одной стороне (MergeInconsistency)
struct Inconsistency {
    std::string key;
    issue::Source source = issue::Source::Rule;
    std::vector<std::string> issue_ids;
    std::string reason;
};

struct Totals {
    size_t ai = 0;
    size_t rule = 0;
    size_t merged = 0;
    size_t conflicts = 0;
    size_t agreements = 0;
    size_t ai_only = 0;
    size_t rule_only = 0;
};

struct MergedResult {
    std::vector<issue::AIFinding> ai_findings;
    std::vector<issue::RuleFinding> rule_findings;
    std::vector<issue::Finding> merged;
    std::vector<Conflict> conflicts;
    std::vector<Agreement> agreements;
    std::vector<std::string> ai_only;
    std::vector<std::string> rule_only;
    std::vector<Inconsistency> inconsistencies;
    Totals totals;
};

// ============================================================================
// Операции
// ============================================================================

/// Ключ правила: rule_id, при отсутствии - категория
std::string rule_key(const issue::Issue& is);

/// Строка первичного ключа (для отчёта и поиска дубликатов)
std::string primary_key(const issue::Issue& is);

/// Совпадение первичного ключа с учётом допуска сумм
bool primary_match(const issue::Issue& a, const issue::Issue& b, const MergeOptions& options = {});

/// Находка о значении (числовая категория/тег или есть метрики)
bool is_value_finding(const issue::Issue& is);

MergedResult merge(const std::vector<issue::RuleFinding>& rule_findings,
                   const std::vector<issue::AIFinding>& ai_findings, const MergeOptions& options = {});

/// Без сопоставления: все находки попадают в ai_only / rule_only
MergedResult concatenate(const std::vector<issue::RuleFinding>& rule_findings,
                         const std::vector<issue::AIFinding>& ai_findings);

void result_to_json(const MergedResult& result, rapidjson::Value& out,
                    rapidjson::Document::AllocatorType& alloc);

/// Компактный JSON результата
std::string result_to_string(const MergedResult& result);

}  // namespace budgetaudit::merge

#endif  // BUDGETAUDIT_MERGE_HPP
