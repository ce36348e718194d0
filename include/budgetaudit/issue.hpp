// ==============================================================================
// budgetaudit/issue.hpp - Модель находок (Issue, RuleFinding, AIFinding)
// ==============================================================================
//
// Назначение:
// - Каноническая форма находки, общая для детектора правил и AI-детектора
// - Finding - тегированное объединение (std::variant) по источнику
// - Сериализация в JSON (RapidJSON) и адаптер входных форм на границе
//   (snake_case / camelCase, вложенный "result")
//
// Ядро работает только с канонической формой; разбор вариантов формы
// выполняется исключительно в issue_from_json.
//
// ==============================================================================

#ifndef BUDGETAUDIT_ISSUE_HPP
#define BUDGETAUDIT_ISSUE_HPP

#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

namespace budgetaudit::issue {

// ============================================================================
// Enums
// ============================================================================

/// Уровень серьёзности (по убыванию)
enum class Severity { Critical, High, Medium, Low, Info };

/// Источник находки
enum class Source { Rule, AI };

/// Ранг серьёзности: Critical = 4 ... Info = 0
int severity_rank(Severity s);

/// Понизить на один уровень (Info остаётся Info)
Severity reduce_severity(Severity s);

/// Более серьёзная из двух
Severity max_severity(Severity a, Severity b);

std::string to_string(Severity s);
std::string to_string(Source s);

/// Разобрать уровень; принимает также error -> high, warn/warning -> medium
/// @throw std::invalid_argument если строка не распознана
Severity parse_severity(std::string_view s);

/// @throw std::invalid_argument если строка не распознана
Source parse_source(std::string_view s);

// ============================================================================
// Evidence / Location
// ============================================================================

/// Фрагмент-доказательство; span - [start, end) в кодовых точках текста страницы/секции
struct Evidence {
    int page = 0;
    std::string text;
    std::optional<std::pair<size_t, size_t>> span;
    std::optional<std::string> screenshot_ref;

    bool operator==(const Evidence& other) const;
};

/// Положение находки в документе (page = 0 - неизвестно)
struct Location {
    int page = 0;
    std::optional<std::string> section;
    std::optional<std::string> table;
    std::optional<int> row;
    std::optional<int> col;

    bool operator==(const Location& other) const;
};

// ============================================================================
// Issue
// ============================================================================

struct Issue {
    std::string id;
    Source source = Source::Rule;
    Severity severity = Severity::Info;
    std::optional<std::string> rule_id;
    std::string category;
    std::string title;
    std::string message;
    std::vector<Evidence> evidence;
    Location location;
    double confidence = 1.0;      // [0, 1]
    std::set<std::string> tags;   // упорядочено для детерминированного вывода
    std::map<std::string, double> metrics;
    std::string suggestion;
    std::string created_at;       // ISO-8601

    bool operator==(const Issue& other) const;
    bool operator!=(const Issue& other) const { return !(*this == other); }
};

/// Ограничить confidence диапазоном [0, 1]
double clamp_confidence(double value);

// ============================================================================
// Finding - тегированное объединение
// ============================================================================

struct RuleFinding {
    Issue issue;
};

struct AIFinding {
    Issue issue;
};

using Finding = std::variant<RuleFinding, AIFinding>;

/// Доступ к общей части
const Issue& finding_issue(const Finding& f);

/// Источник по дискриминанту варианта
Source finding_source(const Finding& f);

// ============================================================================
// JSON
// ============================================================================

/// Issue -> JSON объект (camelCase, порядок ключей фиксирован)
void issue_to_json(const Issue& issue, rapidjson::Value& out,
                   rapidjson::Document::AllocatorType& alloc);

/// Результат разбора Issue
struct IssueResult {
    bool ok = false;
    Issue issue;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// JSON -> Issue. Принимает snake_case и camelCase, а также объект,
/// вложенный в "result" или "issue"
IssueResult issue_from_json(const rapidjson::Value& json);

/// Прочитать поле по одному из имён (snake_case / camelCase)
const rapidjson::Value* find_member(const rapidjson::Value& obj,
                                    std::initializer_list<const char*> names);

}  // namespace budgetaudit::issue

#endif  // BUDGETAUDIT_ISSUE_HPP
