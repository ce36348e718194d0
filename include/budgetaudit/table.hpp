// ==============================================================================
// budgetaudit/table.hpp - Сопоставление заголовков с каноническими таблицами
// ==============================================================================
//
// Назначение:
// - TableSpec: каноническое имя, псевдонимы, шаблоны, обязательность
// - Оценка заголовка: точное имя 3, псевдоним 2, шаблон/нечёткое 1 x ratio
// - Сигналы обложки (部门决算 / 单位决算): бонус и штраф за неоднозначность
// - Поиск таблиц по страницам документа (locate)
//
// Короткое имя, целиком покрытое вхождением более длинного имени другой
// таблицы, не засчитывается: "支出决算表" внутри
// "一般公共预算财政拨款支出决算表" не означает наличие таблицы "支出决算表".
//
// ==============================================================================

#ifndef BUDGETAUDIT_TABLE_HPP
#define BUDGETAUDIT_TABLE_HPP

#include "budgetaudit/document.hpp"
#include "budgetaudit/issue.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace budgetaudit::table {

// ============================================================================
// TableSpec
// ============================================================================

struct TableSpec {
    std::string canonical_name;
    std::vector<std::string> aliases;
    std::vector<std::string> patterns;  // ECMAScript, по нормализованному тексту
    bool required = true;
    std::string category;
    issue::Severity severity = issue::Severity::High;
    std::optional<std::string> scope;  // "部门" или "单位"
};

/// Девять таблиц отчёта о决算 с псевдонимами и шаблонами
std::vector<TableSpec> default_table_specs();

// ============================================================================
// Результаты
// ============================================================================

enum class Method { Exact, Alias, Regex, Fuzzy };

std::string to_string(Method m);

/// Оценка одной спецификации
struct SpecScore {
    size_t spec_index = 0;
    double raw_score = 0.0;
    double confidence = 0.0;
    Method method = Method::Exact;
};

struct MatchResult {
    bool matched = false;
    size_t spec_index = 0;
    double raw_score = 0.0;
    double confidence = 0.0;
    Method method = Method::Exact;
    std::vector<SpecScore> scores;  // все ненулевые, по убыванию raw_score

    explicit operator bool() const { return matched; }
};

/// Положение таблицы в документе
struct TableLocation {
    size_t spec_index = 0;
    int page = 0;
    double raw_score = 0.0;
    double confidence = 0.0;
    Method method = Method::Exact;
    std::string title;
};

struct MatcherOptions {
    double fuzzy_threshold = 0.85;
    double min_score = 0.85;
    size_t cover_chars = 4000;
    double cover_bonus = 0.5;
    double conflict_penalty = 0.5;
    size_t title_lines = 3;
};

// ============================================================================
// Нормализация
// ============================================================================

/// Удалить пробелы, пунктуацию, кавычки и порядковые префиксы (一、 （三） 表3)
std::wstring normalize_title(std::string_view text);

// ============================================================================
// TableMatcher
// ============================================================================

class TableMatcher {
public:
    /// @throw std::invalid_argument при некорректном шаблоне
    explicit TableMatcher(std::vector<TableSpec> specs, MatcherOptions options = {});

    /// Лучшая спецификация для фрагмента текста
    MatchResult match(std::string_view region, std::string_view cover_text = {}) const;

    /// Лучшее положение каждой найденной таблицы
    std::vector<TableLocation> locate(const document::Document& doc) const;

    const std::vector<TableSpec>& specs() const { return specs_; }
    const MatcherOptions& options() const { return options_; }

private:
    struct Compiled {
        std::vector<std::wstring> names;  // [0] - каноническое, далее псевдонимы
        std::vector<std::wregex> patterns;
    };

    std::vector<TableSpec> specs_;
    std::vector<Compiled> compiled_;
    MatcherOptions options_;
};

}  // namespace budgetaudit::table

#endif  // BUDGETAUDIT_TABLE_HPP
