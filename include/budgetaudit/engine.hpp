// ==============================================================================
// budgetaudit/engine.hpp - Движок правил
// ==============================================================================
//
// Назначение:
// - Вычисление набора правил над документом
// - Машина состояний правила: pending -> pass | violation | error, skipped
// - Каждое нарушение превращается в RuleFinding (id "R-<rule>-<n>")
//
// Вычисление чистое: без ввода-вывода, кроме журнала через Writer.
//
// ==============================================================================

#ifndef BUDGETAUDIT_ENGINE_HPP
#define BUDGETAUDIT_ENGINE_HPP

#include "budgetaudit/cancel.hpp"
#include "budgetaudit/document.hpp"
#include "budgetaudit/issue.hpp"
#include "budgetaudit/output.hpp"
#include "budgetaudit/rule.hpp"
#include "budgetaudit/table.hpp"

#include <optional>
#include <string>
#include <vector>

namespace budgetaudit::engine {

// ============================================================================
// Состояние правила
// ============================================================================

enum class State { Pending, Pass, Violation, Skipped, Error };

std::string to_string(State s);

struct RuleOutcome {
    std::string rule_id;
    State state = State::Pending;
    size_t findings = 0;
    std::string reason;  // для Skipped / Error
};

/// Пропущенное правило (RuleEvaluationSkipped)
struct Skipped {
    std::string rule_id;
    std::string reason;
};

struct Evaluation {
    std::vector<issue::RuleFinding> findings;
    std::vector<RuleOutcome> outcomes;
    std::vector<Skipped> skipped;
    bool cancelled = false;
};

// ============================================================================
// RuleEngine
// ============================================================================

struct EngineOptions {
    table::MatcherOptions matcher;
    size_t negative_window = 40;
};

class RuleEngine {
public:
    explicit RuleEngine(output::Writer* writer = nullptr, EngineOptions options = {});

    /// Вычислить все включённые правила. Ошибка одного правила не прерывает остальные
    Evaluation evaluate(const document::Document& doc, const rule::RuleSet& rules,
                        const cancel::CancelToken* cancel = nullptr) const;

private:
    output::Writer* writer_;
    EngineOptions options_;
};

// ============================================================================
// Операнды
// ============================================================================

/// Значение строки таблицы: ячейка с подписью label, column-е числовое значение
std::optional<double> row_value(const document::ExtractedTable& table, std::string_view label,
                                size_t column);

/// Число не далее window символов после подписи в тексте
std::optional<double> proximity_value(std::string_view text, std::string_view label,
                                      size_t column, size_t window);

}  // namespace budgetaudit::engine

#endif  // BUDGETAUDIT_ENGINE_HPP
