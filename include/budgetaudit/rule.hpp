// ==============================================================================
// budgetaudit/rule.hpp - Набор правил: модель и загрузка YAML
// ==============================================================================
//
// Назначение:
// - Rule: id, категория, уровень, условие (std::variant), шаблон сообщения
// - Условия: наличие таблиц, числовая сверка, сверка текста с числами,
//   метаданные обложки
// - Загрузка версионированного набора правил (yaml-cpp) с профилями
//   (enabled_rules / disabled_rules / rule_overrides)
// - RuleSetRegistry: замена версии без влияния на выполняющиеся задания
//
// Формат файла:
//   version: "3.3.0"
//   schema_version: 1
//   tables:   [{name, aliases, patterns, required, category, severity, scope}]
//   rules:    [{id, name, category, severity, type, message, tolerance, params}]
//   profiles: {default: {}, strict: {rule_overrides: {"*": {severity: high}}}}
//
// ==============================================================================

#ifndef BUDGETAUDIT_RULE_HPP
#define BUDGETAUDIT_RULE_HPP

#include "budgetaudit/issue.hpp"
#include "budgetaudit/table.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace budgetaudit::rule {

// ============================================================================
// Условия
// ============================================================================

/// Обязательные таблицы присутствуют (пустой список - все обязательные)
struct TablePresence {
    std::vector<std::string> tables;
    double low_confidence_threshold = 0.6;
};

/// Операнд: строка таблицы по подписи, числовой столбец по индексу
struct Operand {
    std::string label;
    std::optional<std::string> table;  // по умолчанию - таблица правила
    size_t column = 0;                 // индекс среди числовых ячеек строки
};

/// left = sum(right) в пределах допуска
struct NumericConsistency {
    std::string table;
    Operand left;
    std::vector<Operand> right;
    size_t proximity_window = 40;
};

/// Сверка "预算 / 决算 / 结论" в разделе
struct TextNumberCrossCheck {
    std::string section_start;
    std::string section_end;
    size_t reason_window = 320;
    issue::Severity missing_reason_severity = issue::Severity::Medium;
};

/// Год и единица измерения на обложке
struct CoverMetadata {
    size_t cover_chars = 4000;
};

using Condition = std::variant<TablePresence, NumericConsistency, TextNumberCrossCheck, CoverMetadata>;

enum class ConditionKind { TablePresence, NumericConsistency, TextNumber, CoverMetadata };

/// @throw std::invalid_argument если строка не распознана
ConditionKind parse_condition_kind(std::string_view s);

std::string to_string(ConditionKind k);

ConditionKind condition_kind(const Condition& c);

// ============================================================================
// Rule / RuleSet
// ============================================================================

/// Допуск: |a-b| <= max(rel * max(|a|,|b|), abs); parity_band - относительная
/// полоса "基本持平" за пределами допуска
struct Tolerance {
    double rel = 0.0;
    double abs = 0.0;
    std::optional<double> parity_band;
};

struct Rule {
    std::string id;
    std::string name;
    std::string category;
    issue::Severity severity = issue::Severity::Medium;
    Condition condition;
    std::string message_template;
    std::optional<Tolerance> tolerance;
    bool enabled = true;
};

struct RuleSet {
    std::string version;
    int schema_version = 1;
    std::string name;
    std::string profile;
    std::vector<table::TableSpec> tables;
    std::vector<Rule> rules;

    /// Индекс таблицы по каноническому имени или псевдониму
    std::optional<size_t> find_table(std::string_view name) const;
};

// ============================================================================
// Загрузка
// ============================================================================

struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    std::shared_ptr<const RuleSet> rule_set;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить набор правил и применить профиль.
/// Неизвестный профиль - ошибка; отсутствие секции profiles допускает только "default"
LoadResult load_rule_set(const std::filesystem::path& path, std::string_view profile = "default");

/// Разобрать набор правил из строки YAML
LoadResult parse_rule_set(std::string_view yaml, std::string_view profile = "default",
                          const std::string& origin = "");

/// Набор по умолчанию: девять таблиц и одно правило наличия
std::shared_ptr<const RuleSet> default_rule_set();

struct LintResult {
    bool ok = false;
    size_t tables = 0;
    size_t rules = 0;
    std::vector<std::string> profiles;
    std::vector<std::string> warnings;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Проверить файл правил: расширение, схема, шаблоны, ссылки на таблицы
LintResult lint(const std::filesystem::path& path, std::string_view profile = "default");

// ============================================================================
// RuleSetRegistry
// ============================================================================

/// Текущая версия набора правил. Задания закрепляют shared_ptr при постановке
/// в очередь, поэтому reload не влияет на выполняющиеся задания
class RuleSetRegistry {
public:
    explicit RuleSetRegistry(std::shared_ptr<const RuleSet> initial = default_rule_set());

    std::shared_ptr<const RuleSet> current() const;

    void install(std::shared_ptr<const RuleSet> rule_set);

    /// Загрузить и установить; при ошибке текущая версия не меняется
    LoadResult reload(const std::filesystem::path& path, std::string_view profile = "default");

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const RuleSet> current_;
};

}  // namespace budgetaudit::rule

#endif  // BUDGETAUDIT_RULE_HPP
