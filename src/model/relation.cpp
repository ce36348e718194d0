// ==============================================================================
// relation.cpp - Сопоставление "预算 / 决算 / 结论" в тексте
// ==============================================================================

#include "budgetaudit/relation.hpp"

#include "budgetaudit/document.hpp"
#include "budgetaudit/platform.hpp"
#include "budgetaudit/text.hpp"

#include <cmath>
#include <cstdlib>
#include <regex>

namespace budgetaudit::relation {

// ============================================================================
// Шаблоны
// ============================================================================

namespace {

// Части шаблона тройки
#define BUDGET_WORD L"(?:年初?\\s*预算|预算|年初预算数|预算数)(?:数)?[为是]?\\s*"
#define FINAL_WORD L"(?:支出\\s*决算|决算|决算支出)(?:数)?[为是]?\\s*"
#define AMOUNT L"(\\d+(?:,\\d{3})*(?:\\.\\d+)?)\\s*(?:亿元|万元|元)?"
#define STATEMENT L"(决算(?:数)?(?:大于|小于|等于|持平|基本持平)预算(?:数)?)"

const std::wregex& pair_re() {
    static const std::wregex re(BUDGET_WORD AMOUNT L"(?:[^决]{0,50}?)?" FINAL_WORD AMOUNT
                                L"(?:[^。]{0,50}?)?" STATEMENT);
    return re;
}

const std::wregex& pair_fallback_re() {
    static const std::wregex re(BUDGET_WORD AMOUNT L"(?:[^决]{0,80}?)?" FINAL_WORD AMOUNT
                                L"(?:[^。]{0,80}?)?" STATEMENT);
    return re;
}

const std::wregex& pair_reverse_re() {
    static const std::wregex re(FINAL_WORD AMOUNT L"(?:[^预]{0,50}?)?" BUDGET_WORD AMOUNT
                                L"(?:[^。]{0,50}?)?" STATEMENT);
    return re;
}

const std::wregex& statement_re() {
    static const std::wregex re(STATEMENT);
    return re;
}

#undef BUDGET_WORD
#undef FINAL_WORD
#undef AMOUNT
#undef STATEMENT

const std::wregex& negative_re() {
    static const std::wregex re(L"同比|比上年|比上年度|比上期|增长|减少|较去年|与去年|上年同期");
    return re;
}

const std::wregex& reason_re() {
    static const std::wregex re(L"(主要原因|增减原因|变动原因)\\s*[:：]");
    return re;
}

const std::wregex& next_item_re() {
    static const std::wregex re(L"\\s*\\d+、");
    return re;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

std::pair<size_t, size_t> group_span(const std::wsmatch& m, size_t group) {
    auto start = static_cast<size_t>(m.position(group));
    return {start, start + static_cast<size_t>(m.length(group))};
}

}  // namespace

// ============================================================================
// Отношение
// ============================================================================

std::string to_string(Relation r) {
    switch (r) {
    case Relation::Greater:
        return "greater";
    case Relation::Less:
        return "less";
    case Relation::Flat:
        return "flat";
    }
    return "unknown";
}

std::string to_chinese(Relation r) {
    switch (r) {
    case Relation::Greater:
        return "大于";
    case Relation::Less:
        return "小于";
    case Relation::Flat:
        return "持平";
    }
    return "";
}

Relation parse_statement(std::string_view stmt) {
    if (contains(stmt, "持平")) {
        return Relation::Flat;
    }
    if (contains(stmt, "大于")) {
        return Relation::Greater;
    }
    if (contains(stmt, "小于")) {
        return Relation::Less;
    }
    return Relation::Flat;
}

bool is_basic_parity_wording(std::string_view stmt) {
    return contains(stmt, "基本持平");
}

Relation compute_relation(double budget, double final_value) {
    double tol = text::dynamic_tolerance(final_value, budget);
    if (final_value > budget + tol) {
        return Relation::Greater;
    }
    if (final_value < budget - tol) {
        return Relation::Less;
    }
    return Relation::Flat;
}

bool is_statement(std::string_view stmt) {
    std::wstring w = text::widen(stmt);
    return std::regex_search(w, statement_re());
}

// ============================================================================
// Числа
// ============================================================================

std::optional<double> parse_amount(std::string_view amount) {
    std::string s(amount);
    for (const char* unit : {"亿元", "万元", "元"}) {
        size_t pos = s.find(unit);
        if (pos != std::string::npos) {
            s.erase(pos);
            break;
        }
    }
    return text::parse_number(text::trim(s));
}

bool has_unit(std::string_view amount) {
    return contains(amount, "元");
}

// ============================================================================
// Поиск троек
// ============================================================================

std::optional<size_t> items_anchor(std::wstring_view section) {
    size_t pos = section.find(L"其中");
    if (pos == std::wstring_view::npos) {
        return std::nullopt;
    }
    return pos;
}

std::optional<std::string> find_reason(std::wstring_view section, size_t from,
                                       size_t reason_window) {
    if (from > section.size()) {
        return std::nullopt;
    }
    std::wstring_view tail = section.substr(from);

    size_t end = std::min(tail.size(), reason_window);
    // Граница следующего пункта "N、" заменяет лимит символов
    if (auto next = document::search_line_start(tail, next_item_re()); next.has_value()) {
        end = next->first;
    }
    std::wstring window(tail.substr(0, end));

    std::wsmatch m;
    if (!std::regex_search(window, m, reason_re())) {
        return std::nullopt;
    }
    std::wstring content = window.substr(static_cast<size_t>(m.position(0) + m.length(0)));
    size_t period = content.find(L'。');
    if (period != std::wstring::npos) {
        content.resize(period);
    }
    std::string reason = text::trim(text::narrow(content));
    if (reason.empty()) {
        return std::nullopt;
    }
    return reason;
}

namespace {

/// Рядом с выводом есть сравнение с прошлым периодом
bool near_negative(std::wstring_view section, std::pair<size_t, size_t> stmt, size_t window) {
    size_t lo = stmt.first > window ? stmt.first - window : 0;
    size_t hi = std::min(section.size(), stmt.second + window);
    std::wstring slice(section.substr(lo, hi - lo));
    return std::regex_search(slice, negative_re());
}

enum class Order { Forward, Reverse };

void scan(const std::wstring& sec, const std::wregex& re, Order order, const std::string& origin,
          bool skip_near_existing, const ExtractOptions& options, std::optional<size_t> anchor,
          std::vector<Pair>& out) {
    for (auto it = std::wsregex_iterator(sec.begin(), sec.end(), re); it != std::wsregex_iterator();
         ++it) {
        const std::wsmatch& m = *it;
        auto match_start = static_cast<size_t>(m.position(0));

        if (skip_near_existing) {
            bool near = false;
            for (const auto& p : out) {
                auto d = static_cast<long long>(p.match_start) - static_cast<long long>(match_start);
                if (std::llabs(d) < 50) {
                    near = true;
                    break;
                }
            }
            if (near) {
                continue;
            }
        }

        auto stmt_span = group_span(m, 3);
        if (near_negative(sec, stmt_span, options.negative_window)) {
            continue;
        }

        size_t budget_group = order == Order::Forward ? 1 : 2;
        size_t final_group = order == Order::Forward ? 2 : 1;

        Pair p;
        p.budget_text = text::narrow(m.str(budget_group));
        p.final_text = text::narrow(m.str(final_group));
        p.stmt_text = text::narrow(m.str(3));

        auto budget = text::parse_number(p.budget_text);
        auto final_value = text::parse_number(p.final_text);
        if (!budget.has_value() || !final_value.has_value()) {
            continue;
        }
        p.budget = *budget;
        p.final_value = *final_value;

        p.budget_span = group_span(m, budget_group);
        p.final_span = group_span(m, final_group);
        p.stmt_span = stmt_span;
        p.match_start = match_start;
        p.match_end = match_start + static_cast<size_t>(m.length(0));
        p.origin = origin;
        p.clip = text::narrow(std::wstring_view(sec).substr(
            match_start, std::min<size_t>(options.clip_chars, p.match_end - match_start)));

        p.in_items = anchor.has_value() && match_start > *anchor;
        if (p.in_items) {
            p.reason_text = find_reason(sec, p.match_end, options.reason_window);
        }
        out.push_back(std::move(p));
    }
}

}  // namespace

std::vector<Pair> extract_pairs(std::wstring_view section, const ExtractOptions& options) {
    std::wstring sec(section);
    auto anchor = items_anchor(sec);

    std::vector<Pair> pairs;
    scan(sec, pair_re(), Order::Forward, "regex", false, options, anchor, pairs);
    scan(sec, pair_fallback_re(), Order::Forward, "fallback", true, options, anchor, pairs);
    scan(sec, pair_reverse_re(), Order::Reverse, "reverse", true, options, anchor, pairs);
    return pairs;
}

std::vector<Pair> dedupe_pairs(const std::vector<Pair>& pairs) {
    std::vector<Pair> unique;
    for (const auto& pair : pairs) {
        bool duplicate = false;
        for (auto& existing : unique) {
            auto d = static_cast<long long>(pair.match_start) -
                     static_cast<long long>(existing.match_start);
            if (std::llabs(d) > 60) {
                continue;
            }
            double bud_tol = text::dynamic_tolerance(existing.budget, pair.budget);
            double fin_tol = text::dynamic_tolerance(existing.final_value, pair.final_value);
            if (std::fabs(existing.budget - pair.budget) <= bud_tol &&
                std::fabs(existing.final_value - pair.final_value) <= fin_tol) {
                duplicate = true;
                if (pair.reason_text.has_value() && !existing.reason_text.has_value()) {
                    existing = pair;
                }
                break;
            }
        }
        if (!duplicate) {
            unique.push_back(pair);
        }
    }
    return unique;
}

// ============================================================================
// Находки
// ============================================================================

std::vector<issue::Issue> pair_issues(const Pair& pair, const IssueContext& ctx) {
    std::vector<issue::Issue> issues;

    Relation stated = parse_statement(pair.stmt_text);
    Relation computed = compute_relation(pair.budget, pair.final_value);
    double tol = text::dynamic_tolerance(pair.final_value, pair.budget);
    std::string clip = "片段：「" + pair.clip + "」";

    auto make = [&](issue::Severity severity, const char* title, std::string message,
                    const char* kind) {
        issue::Issue is;
        is.source = ctx.source;
        is.severity = severity;
        is.rule_id = ctx.rule_id;
        is.category = ctx.category;
        is.title = title;
        is.message = std::move(message);
        is.evidence.push_back(issue::Evidence{ctx.page, pair.clip, ctx.span, std::nullopt});
        is.location.page = ctx.page;
        is.location.section = ctx.section;
        is.confidence = issue::clamp_confidence(pair.confidence);
        is.tags = {"text-number", kind};
        is.metrics = {{"budget", pair.budget},
                      {"final", pair.final_value},
                      {"diff", pair.final_value - pair.budget},
                      {"tolerance", tol}};
        is.created_at = platform::now_iso8601();
        return is;
    };

    if (is_basic_parity_wording(pair.stmt_text)) {
        auto is = make(issue::Severity::Low, TITLE_PARITY_WORDING,
                       "用语“基本持平”不规范，建议写“持平”并说明原因。" + clip, "parity-wording");
        is.suggestion = "建议写“持平”并说明原因";
        issues.push_back(std::move(is));
    }

    if (stated != computed) {
        auto is = make(ctx.mismatch_severity, TITLE_MISMATCH,
                       "年初预算=" + pair.budget_text + "，决算=" + pair.final_text + "（判定为" +
                           to_chinese(computed) + "，文本表述" + to_chinese(stated) + "）" + clip,
                       "relation-mismatch");
        is.suggestion = "将表述改为“决算数" + to_chinese(computed) + "预算数”或核对数字";
        issues.push_back(std::move(is));
    }

    if (stated != Relation::Flat && pair.in_items && !pair.reason_text.has_value()) {
        auto is = make(ctx.missing_reason_severity, TITLE_MISSING_REASON,
                       "本项表述决算数" + to_chinese(stated) + "预算数后未见主要原因，请补充原因说明。" +
                           clip,
                       "missing-reason");
        is.suggestion = "补充“主要原因：…”说明";
        issues.push_back(std::move(is));
    }

    return issues;
}

}  // namespace budgetaudit::relation
