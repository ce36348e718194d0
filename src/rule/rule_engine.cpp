// ==============================================================================
// rule_engine.cpp - Движок правил
// ==============================================================================

#include "budgetaudit/engine.hpp"

#include "budgetaudit/platform.hpp"
#include "budgetaudit/relation.hpp"
#include "budgetaudit/text.hpp"

#include <algorithm>
#include <cmath>
#include <cwctype>
#include <map>
#include <memory>
#include <regex>
#include <stdexcept>

namespace budgetaudit::engine {

std::string to_string(State s) {
    switch (s) {
    case State::Pending:
        return "pending";
    case State::Pass:
        return "pass";
    case State::Violation:
        return "violation";
    case State::Skipped:
        return "skipped";
    case State::Error:
        return "error";
    }
    return "unknown";
}

// ============================================================================
// Операнды
// ============================================================================

std::optional<double> row_value(const document::ExtractedTable& table, std::string_view label,
                                size_t column) {
    std::wstring wanted = text::normalize(text::widen(label));
    if (wanted.empty()) {
        return std::nullopt;
    }

    for (const auto& row : table.rows) {
        size_t label_cell = row.size();
        for (size_t i = 0; i < row.size(); ++i) {
            if (!text::parse_number(row[i]).has_value() && !text::trim(row[i]).empty()) {
                label_cell = i;
                break;
            }
        }
        if (label_cell == row.size() || text::normalize(text::widen(row[label_cell])) != wanted) {
            continue;
        }

        size_t seen = 0;
        for (size_t i = label_cell + 1; i < row.size(); ++i) {
            auto value = text::parse_number(row[i]);
            if (!value) {
                continue;
            }
            if (seen == column) {
                return value;
            }
            ++seen;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<double> proximity_value(std::string_view text_utf8, std::string_view label,
                                      size_t column, size_t window) {
    static const std::wregex number_re(L"-?\\d[\\d,]*(?:\\.\\d+)?");

    std::wstring wide = text::widen(text_utf8);
    std::wstring wlabel = text::widen(text::trim(label));
    if (wlabel.empty()) {
        return std::nullopt;
    }

    size_t pos = wide.find(wlabel);
    while (pos != std::wstring::npos) {
        size_t from = pos + wlabel.size();
        std::wstring tail = wide.substr(from, window);

        size_t seen = 0;
        for (std::wsregex_iterator it(tail.begin(), tail.end(), number_re), end; it != end; ++it) {
            auto value = text::parse_number(text::narrow(it->str()));
            if (!value) {
                continue;
            }
            if (seen == column) {
                return value;
            }
            ++seen;
        }
        pos = wide.find(wlabel, from);
    }
    return std::nullopt;
}

// ============================================================================
// RuleEngine
// ============================================================================

namespace {

/// Ошибка вычисления, переводящая правило в Skipped
struct SkipRule : std::runtime_error {
    using std::runtime_error::runtime_error;
};

issue::Issue base_issue(const rule::Rule& r, issue::Severity severity, std::string title,
                        std::string message) {
    issue::Issue is;
    is.source = issue::Source::Rule;
    is.severity = severity;
    is.rule_id = r.id;
    is.category = r.category;
    is.title = std::move(title);
    is.message = std::move(message);
    is.created_at = platform::now_iso8601();
    return is;
}

std::string render(const rule::Rule& r, const std::string& fallback,
                   const std::map<std::string, std::string>& vars) {
    if (r.message_template.empty()) {
        return fallback;
    }
    return text::render_template(r.message_template, vars);
}

class Evaluator {
public:
    Evaluator(const document::Document& doc, const rule::RuleSet& rules,
              const EngineOptions& options)
        : doc_(doc), rules_(rules), options_(options) {}

    std::vector<issue::Issue> run(const rule::Rule& r) {
        return std::visit([&](const auto& cond) { return eval(r, cond); }, r.condition);
    }

private:
    // ------------------------------------------------------------------------
    // Общие данные документа (вычисляются по требованию)
    // ------------------------------------------------------------------------

    const table::TableMatcher& matcher() {
        if (!matcher_) {
            matcher_ = std::make_unique<table::TableMatcher>(rules_.tables, options_.matcher);
        }
        return *matcher_;
    }

    const std::vector<table::TableLocation>& locations() {
        if (!locations_) {
            locations_ = matcher().locate(doc_);
        }
        return *locations_;
    }

    const table::TableLocation* location_of(size_t spec_index) {
        for (const auto& loc : locations()) {
            if (loc.spec_index == spec_index) {
                return &loc;
            }
        }
        return nullptr;
    }

    const std::wstring& full_text() {
        if (!full_) {
            full_ = text::widen(doc_.full_text());
        }
        return *full_;
    }

    // ------------------------------------------------------------------------
    // table_presence
    // ------------------------------------------------------------------------

    std::vector<issue::Issue> eval(const rule::Rule& r, const rule::TablePresence& cond) {
        std::vector<size_t> wanted;
        if (cond.tables.empty()) {
            for (size_t i = 0; i < rules_.tables.size(); ++i) {
                if (rules_.tables[i].required) {
                    wanted.push_back(i);
                }
            }
        } else {
            for (const auto& name : cond.tables) {
                auto idx = rules_.find_table(name);
                if (!idx) {
                    throw SkipRule("unknown table '" + name + "'");
                }
                wanted.push_back(*idx);
            }
        }

        std::vector<issue::Issue> out;
        for (size_t idx : wanted) {
            const auto& spec = rules_.tables[idx];
            const auto* loc = location_of(idx);

            if (loc == nullptr) {
                auto is = base_issue(r, spec.severity, "缺少必需表格：" + spec.canonical_name,
                                     render(r, "未找到必需表格“" + spec.canonical_name + "”。",
                                            {{"table", spec.canonical_name}}));
                is.location.table = spec.canonical_name;
                is.tags = {"table-presence"};
                is.suggestion = "补充“" + spec.canonical_name + "”或核对表名";
                out.push_back(std::move(is));
                continue;
            }

            if (loc->confidence < cond.low_confidence_threshold) {
                auto is = base_issue(r, issue::reduce_severity(spec.severity),
                                     "表格识别置信度低：" + spec.canonical_name,
                                     "“" + spec.canonical_name + "”仅以" + table::to_string(loc->method) +
                                         "方式匹配到标题“" + loc->title + "”，请核对表名。");
                is.location.page = loc->page;
                is.location.table = spec.canonical_name;
                is.evidence.push_back(issue::Evidence{loc->page, loc->title, std::nullopt, std::nullopt});
                is.confidence = issue::clamp_confidence(loc->confidence);
                is.tags = {"table-presence", "low-confidence-match"};
                is.metrics = {{"confidence", loc->confidence}, {"raw_score", loc->raw_score}};
                out.push_back(std::move(is));
            }
        }
        return out;
    }

    // ------------------------------------------------------------------------
    // numeric_consistency
    // ------------------------------------------------------------------------

    struct OperandSource {
        const document::ExtractedTable* table = nullptr;
        const document::PageText* page = nullptr;
        std::optional<std::string> table_name;
    };

    OperandSource source_for(const std::string& table_name) {
        OperandSource src;
        if (table_name.empty()) {
            return src;
        }
        auto idx = rules_.find_table(table_name);
        if (!idx) {
            throw SkipRule("unknown table '" + table_name + "'");
        }
        src.table_name = rules_.tables[*idx].canonical_name;

        // Таблица с распознанным заголовком
        for (const auto& t : doc_.tables) {
            if (t.title) {
                auto m = matcher().match(*t.title);
                if (m && m.spec_index == *idx) {
                    src.table = &t;
                    src.page = doc_.page(t.page);
                    return src;
                }
            }
        }

        const auto* loc = location_of(*idx);
        if (loc == nullptr) {
            throw SkipRule("table '" + table_name + "' not found");
        }
        src.page = doc_.page(loc->page);
        for (const auto& t : doc_.tables) {
            if (t.page == loc->page) {
                src.table = &t;
                break;
            }
        }
        return src;
    }

    double operand_value(const rule::Operand& op, const OperandSource& src, size_t window) {
        if (src.table != nullptr) {
            if (auto v = row_value(*src.table, op.label, op.column)) {
                return *v;
            }
        }
        std::string haystack = src.page != nullptr ? src.page->text : doc_.full_text();
        if (auto v = proximity_value(haystack, op.label, op.column, window)) {
            return *v;
        }
        throw SkipRule("operand '" + op.label + "' not found");
    }

    std::vector<issue::Issue> eval(const rule::Rule& r, const rule::NumericConsistency& cond) {
        OperandSource base = source_for(cond.table);

        auto value_of = [&](const rule::Operand& op) {
            if (op.table && *op.table != cond.table) {
                return operand_value(op, source_for(*op.table), cond.proximity_window);
            }
            return operand_value(op, base, cond.proximity_window);
        };

        double left = value_of(cond.left);
        double right = 0.0;
        std::string right_labels;
        for (const auto& op : cond.right) {
            right += value_of(op);
            if (!right_labels.empty()) {
                right_labels += "+";
            }
            right_labels += op.label;
        }

        rule::Tolerance tol = r.tolerance.value_or(rule::Tolerance{});
        if (text::consistency_check(left, right, tol.rel, tol.abs)) {
            return {};
        }

        double diff = left - right;
        double scale = std::max(std::fabs(left), std::fabs(right));
        bool parity = tol.parity_band && std::fabs(diff) <= *tol.parity_band * scale;

        std::map<std::string, std::string> vars = {{"left", cond.left.label},
                                                   {"right", right_labels},
                                                   {"left_value", text::format_amount(left)},
                                                   {"right_value", text::format_amount(right)},
                                                   {"diff", text::format_amount(diff)}};
        std::string fallback = cond.left.label + "=" + text::format_amount(left) + "，" +
                               right_labels + "=" + text::format_amount(right) + "，差额" +
                               text::format_amount(diff) + "。";

        auto is = parity ? base_issue(r, issue::Severity::Medium, r.name + "（基本持平）",
                                      render(r, fallback, vars))
                         : base_issue(r, r.severity, r.name, render(r, fallback, vars));
        if (base.page != nullptr) {
            is.location.page = base.page->number;
            is.evidence.push_back(issue::Evidence{base.page->number,
                                                  cond.left.label + " " + text::format_amount(left),
                                                  std::nullopt, std::nullopt});
        }
        is.location.table = base.table_name;
        is.tags = {"numeric"};
        if (parity) {
            is.tags.insert("basic-parity");
        }
        is.metrics = {{"left", left}, {"right", right}, {"diff", diff},
                      {"tolerance", std::max(tol.rel * scale, tol.abs)}};
        is.suggestion = "核对" + cond.left.label + "与" + right_labels + "的数值";
        return {is};
    }

    // ------------------------------------------------------------------------
    // text_number
    // ------------------------------------------------------------------------

    std::vector<issue::Issue> eval(const rule::Rule& r, const rule::TextNumberCrossCheck& cond) {
        std::wregex start_re = document::compile_line_pattern(cond.section_start);
        std::wregex end_re = document::compile_line_pattern(cond.section_end);

        auto section = document::find_section(full_text(), start_re, end_re);
        if (!section) {
            throw SkipRule("section not found");
        }

        relation::ExtractOptions eo;
        eo.reason_window = cond.reason_window;
        eo.negative_window = options_.negative_window;
        auto pairs = relation::dedupe_pairs(relation::extract_pairs(section->text, eo));

        std::wstring heading = section->text.substr(0, section->text.find(L'\n'));
        document::PageMap pages(doc_);

        std::vector<issue::Issue> out;
        for (const auto& pair : pairs) {
            size_t stmt_global = section->start + pair.stmt_span.first;
            size_t in_page = pages.offset_in_page(stmt_global);

            relation::IssueContext ctx;
            ctx.rule_id = r.id;
            ctx.category = r.category;
            ctx.mismatch_severity = r.severity;
            ctx.missing_reason_severity = cond.missing_reason_severity;
            ctx.page = pages.page_at(stmt_global);
            ctx.span = std::make_pair(in_page, in_page + (pair.stmt_span.second - pair.stmt_span.first));
            ctx.section = text::trim(text::narrow(heading));

            for (auto& is : relation::pair_issues(pair, ctx)) {
                out.push_back(std::move(is));
            }
        }
        return out;
    }

    // ------------------------------------------------------------------------
    // cover_metadata
    // ------------------------------------------------------------------------

    std::vector<issue::Issue> eval(const rule::Rule& r, const rule::CoverMetadata& cond) {
        static const std::wregex year_re(L"20\\d\\d");
        static const std::wregex unit_re(L"单位\\s*[:：]\\s*(万元|元|亿元)");

        std::wstring cover = full_text().substr(0, cond.cover_chars);

        bool has_year = false;
        for (std::wsregex_iterator it(cover.begin(), cover.end(), year_re), end; it != end; ++it) {
            size_t pos = static_cast<size_t>(it->position());
            size_t after = pos + 4;
            bool digit_before = pos > 0 && std::iswdigit(cover[pos - 1]);
            bool digit_after = after < cover.size() && std::iswdigit(cover[after]);
            if (!digit_before && !digit_after) {
                has_year = true;
                break;
            }
        }
        bool has_unit = std::regex_search(cover, unit_re);

        std::vector<issue::Issue> out;
        auto missing = [&](const std::string& item, const std::string& suggestion) {
            auto is = base_issue(r, r.severity, "封面缺少" + item,
                                 render(r, "封面及前部未找到" + item + "。", {{"item", item}}));
            is.location.page = doc_.pages.empty() ? 0 : doc_.pages.front().number;
            is.location.section = "封面";
            is.tags = {"cover"};
            is.suggestion = suggestion;
            out.push_back(std::move(is));
        };
        if (!has_year) {
            missing("年度", "在封面注明决算年度（如2024年度）");
        }
        if (!has_unit) {
            missing("金额单位", "注明“单位：万元”");
        }
        return out;
    }

    const document::Document& doc_;
    const rule::RuleSet& rules_;
    const EngineOptions& options_;
    std::unique_ptr<table::TableMatcher> matcher_;
    std::optional<std::vector<table::TableLocation>> locations_;
    std::optional<std::wstring> full_;
};

}  // anonymous namespace

RuleEngine::RuleEngine(output::Writer* writer, EngineOptions options)
    : writer_(writer), options_(std::move(options)) {}

Evaluation RuleEngine::evaluate(const document::Document& doc, const rule::RuleSet& rules,
                                const cancel::CancelToken* cancel) const {
    Evaluation result;
    Evaluator evaluator(doc, rules, options_);

    for (const auto& r : rules.rules) {
        if (!r.enabled) {
            continue;
        }
        if (cancel != nullptr && cancel->cancelled()) {
            result.cancelled = true;
            break;
        }

        RuleOutcome outcome;
        outcome.rule_id = r.id;
        try {
            auto issues = evaluator.run(r);
            size_t seq = 0;
            for (auto& is : issues) {
                is.id = "R-" + r.id + "-" + std::to_string(++seq);
                result.findings.push_back(issue::RuleFinding{std::move(is)});
            }
            outcome.findings = issues.size();
            outcome.state = issues.empty() ? State::Pass : State::Violation;
        } catch (const SkipRule& e) {
            outcome.state = State::Skipped;
            outcome.reason = e.what();
            result.skipped.push_back(Skipped{r.id, e.what()});
            if (writer_ != nullptr) {
                writer_->debug("rule " + r.id + " skipped: " + e.what());
            }
        } catch (const std::regex_error& e) {
            outcome.state = State::Error;
            outcome.reason = std::string("invalid pattern: ") + e.what();
        } catch (const std::exception& e) {
            outcome.state = State::Error;
            outcome.reason = e.what();
        }

        if (outcome.state == State::Error && writer_ != nullptr) {
            writer_->warn("rule " + r.id + " failed: " + outcome.reason);
        }
        result.outcomes.push_back(std::move(outcome));
    }

    if (writer_ != nullptr) {
        writer_->debug("rules evaluated: " + std::to_string(result.outcomes.size()) + ", findings: " +
                       std::to_string(result.findings.size()));
    }
    return result;
}

}  // namespace budgetaudit::engine
