// ==============================================================================
// merge.cpp - Слияние находок правил и AI
// ==============================================================================

#include "budgetaudit/merge.hpp"

#include "budgetaudit/text.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <set>
#include <sstream>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace budgetaudit::merge {

std::string to_string(ConflictReason r) {
    switch (r) {
    case ConflictReason::SeverityMismatch:
        return "severityMismatch";
    case ConflictReason::CategoryMismatch:
        return "categoryMismatch";
    case ConflictReason::ScopeMismatch:
        return "scopeMismatch";
    case ConflictReason::Missing:
        return "missing";
    }
    return "unknown";
}

std::string to_string(Resolution r) {
    switch (r) {
    case Resolution::PreferRule:
        return "preferRule";
    case Resolution::PreferAi:
        return "preferAi";
    case Resolution::Composite:
        return "composite";
    }
    return "unknown";
}

// ============================================================================
// Ключи
// ============================================================================

namespace {

/// Метрики, определяющие предмет находки
constexpr const char* SUBJECT_METRICS[] = {"budget", "final", "left", "right"};

bool is_percent_metric(const std::string& name) {
    return name.find("pct") != std::string::npos || name.find("percent") != std::string::npos ||
           name.find("rate") != std::string::npos;
}

std::wstring subject_title(const issue::Issue& is) {
    return text::normalize(text::widen(is.title.empty() ? is.message : is.title));
}

bool metrics_match(const issue::Issue& a, const issue::Issue& b, const MergeOptions& options) {
    for (const auto& [name, va] : a.metrics) {
        auto it = b.metrics.find(name);
        if (it == b.metrics.end()) {
            continue;
        }
        double vb = it->second;
        if (is_percent_metric(name)) {
            if (std::fabs(va - vb) > options.percent_tolerance) {
                return false;
            }
            continue;
        }
        bool subject = std::find_if(std::begin(SUBJECT_METRICS), std::end(SUBJECT_METRICS),
                                    [&](const char* m) { return name == m; }) != std::end(SUBJECT_METRICS);
        if (subject && std::fabs(va - vb) > options.money_tolerance * std::max(std::fabs(va), std::fabs(vb))) {
            return false;
        }
    }
    return true;
}

}  // anonymous namespace

std::string rule_key(const issue::Issue& is) {
    if (is.rule_id && !is.rule_id->empty()) {
        return *is.rule_id;
    }
    return "category:" + is.category;
}

std::string primary_key(const issue::Issue& is) {
    std::ostringstream oss;
    oss << rule_key(is) << "|p" << is.location.page;
    if (is.location.table) {
        oss << "|" << *is.location.table;
    }
    oss << "|" << text::narrow(subject_title(is));
    for (const char* m : SUBJECT_METRICS) {
        auto it = is.metrics.find(m);
        if (it != is.metrics.end()) {
            oss << "|" << m << "=" << text::format_amount(it->second);
        }
    }
    return oss.str();
}

bool primary_match(const issue::Issue& a, const issue::Issue& b, const MergeOptions& options) {
    if (rule_key(a) != rule_key(b) || a.location.page != b.location.page) {
        return false;
    }
    if (a.location.table && b.location.table && *a.location.table != *b.location.table) {
        return false;
    }
    return subject_title(a) == subject_title(b) && metrics_match(a, b, options);
}

bool is_value_finding(const issue::Issue& is) {
    if (!is.metrics.empty()) {
        return true;
    }
    if (is.category.find("numeric") != std::string::npos) {
        return true;
    }
    return is.tags.count("numeric") > 0;
}

// ============================================================================
// merge
// ============================================================================

namespace {

enum class KeyKind { Primary = 0, Secondary = 1 };

struct Candidate {
    KeyKind kind;
    double score;
    size_t rule;
    size_t ai;
};

template <typename F>
std::vector<F> sorted_by_id(const std::vector<F>& in) {
    std::vector<F> out = in;
    std::stable_sort(out.begin(), out.end(),
                     [](const F& a, const F& b) { return a.issue.id < b.issue.id; });
    return out;
}

/// Пометить дубликаты id и первичного ключа; записать inconsistencies
template <typename F>
std::vector<bool> find_duplicates(const std::vector<F>& items, issue::Source source,
                                  const MergeOptions& options, std::vector<Inconsistency>& out) {
    std::vector<bool> excluded(items.size(), false);

    std::map<std::string, std::vector<size_t>> by_id;
    for (size_t i = 0; i < items.size(); ++i) {
        by_id[items[i].issue.id].push_back(i);
    }
    for (const auto& [id, idx] : by_id) {
        if (idx.size() < 2) {
            continue;
        }
        Inconsistency inc{id, source, {}, "duplicate id"};
        for (size_t i : idx) {
            excluded[i] = true;
            inc.issue_ids.push_back(items[i].issue.id);
        }
        out.push_back(std::move(inc));
    }

    std::vector<bool> grouped(items.size(), false);
    for (size_t i = 0; i < items.size(); ++i) {
        if (grouped[i] || excluded[i]) {
            continue;
        }
        std::vector<size_t> group{i};
        for (size_t j = i + 1; j < items.size(); ++j) {
            if (!grouped[j] && !excluded[j] && primary_match(items[i].issue, items[j].issue, options)) {
                group.push_back(j);
            }
        }
        if (group.size() < 2) {
            continue;
        }
        Inconsistency inc{primary_key(items[i].issue), source, {}, "duplicate key"};
        for (size_t k : group) {
            grouped[k] = true;
            inc.issue_ids.push_back(items[k].issue.id);
        }
        out.push_back(std::move(inc));
    }
    for (size_t i = 0; i < items.size(); ++i) {
        excluded[i] = excluded[i] || grouped[i];
    }
    return excluded;
}

double title_similarity(const issue::Issue& a, const issue::Issue& b) {
    double t = text::similarity(subject_title(a), subject_title(b));
    auto ma = text::normalize(text::widen(a.message));
    auto mb = text::normalize(text::widen(b.message));
    // Пустые сообщения не считаются совпадающими
    if (ma.empty() || mb.empty()) {
        return t;
    }
    return std::max(t, text::similarity(ma, mb));
}

issue::Issue composite_issue(const issue::Issue& r, const issue::Issue& a) {
    issue::Issue is = r;
    is.id = "M-" + r.id;
    is.severity = issue::max_severity(r.severity, a.severity);
    is.confidence = std::max(r.confidence, a.confidence);
    for (const auto& ev : a.evidence) {
        if (std::find(is.evidence.begin(), is.evidence.end(), ev) == is.evidence.end()) {
            is.evidence.push_back(ev);
        }
    }
    is.tags.insert(a.tags.begin(), a.tags.end());
    is.tags.insert("category:" + r.category);
    is.tags.insert("category:" + a.category);
    if (is.suggestion.empty()) {
        is.suggestion = a.suggestion;
    }
    return is;
}

int page_sort_key(const issue::Issue& is) {
    return is.location.page == 0 ? 1 << 30 : is.location.page;
}

/// Ранжирование merged (серьёзность, страница, id) и итоги
void rank_and_count(MergedResult& result) {
    std::stable_sort(result.merged.begin(), result.merged.end(),
                     [](const issue::Finding& x, const issue::Finding& y) {
                         const auto& a = issue::finding_issue(x);
                         const auto& b = issue::finding_issue(y);
                         int ra = issue::severity_rank(a.severity);
                         int rb = issue::severity_rank(b.severity);
                         if (ra != rb)
                             return ra > rb;
                         if (page_sort_key(a) != page_sort_key(b))
                             return page_sort_key(a) < page_sort_key(b);
                         return a.id < b.id;
                     });

    result.totals.ai = result.ai_findings.size();
    result.totals.rule = result.rule_findings.size();
    result.totals.merged = result.merged.size();
    result.totals.conflicts = result.conflicts.size();
    result.totals.agreements = result.agreements.size();
    result.totals.ai_only = result.ai_only.size();
    result.totals.rule_only = result.rule_only.size();
}

}  // anonymous namespace

MergedResult merge(const std::vector<issue::RuleFinding>& rule_input,
                   const std::vector<issue::AIFinding>& ai_input, const MergeOptions& options) {
    MergedResult result;
    result.rule_findings = sorted_by_id(rule_input);
    result.ai_findings = sorted_by_id(ai_input);
    const auto& rules = result.rule_findings;
    const auto& ais = result.ai_findings;

    auto rule_excluded = find_duplicates(rules, issue::Source::Rule, options, result.inconsistencies);
    auto ai_excluded = find_duplicates(ais, issue::Source::AI, options, result.inconsistencies);

    // ------------------------------------------------------------------------
    // Кандидаты
    // ------------------------------------------------------------------------

    std::vector<Candidate> candidates;
    for (size_t r = 0; r < rules.size(); ++r) {
        if (rule_excluded[r]) {
            continue;
        }
        const auto& ri = rules[r].issue;
        for (size_t a = 0; a < ais.size(); ++a) {
            if (ai_excluded[a]) {
                continue;
            }
            const auto& ai = ais[a].issue;
            if (primary_match(ri, ai, options)) {
                candidates.push_back(Candidate{KeyKind::Primary, 1.0, r, a});
                continue;
            }
            double sim = title_similarity(ri, ai);
            if (sim < options.title_similarity) {
                continue;
            }
            bool missing = ri.location.page == 0 || ai.location.page == 0;
            if (missing || std::abs(ri.location.page - ai.location.page) <= options.page_tolerance) {
                candidates.push_back(Candidate{KeyKind::Secondary, sim, r, a});
            }
        }
    }

    std::sort(candidates.begin(), candidates.end(), [&](const Candidate& x, const Candidate& y) {
        if (x.kind != y.kind)
            return x.kind < y.kind;
        if (x.score != y.score)
            return x.score > y.score;
        if (rules[x.rule].issue.id != rules[y.rule].issue.id)
            return rules[x.rule].issue.id < rules[y.rule].issue.id;
        return ais[x.ai].issue.id < ais[y.ai].issue.id;
    });

    // ------------------------------------------------------------------------
    // Жадное сопоставление и классификация
    // ------------------------------------------------------------------------

    std::vector<bool> rule_used(rules.size(), false);
    std::vector<bool> ai_used(ais.size(), false);

    for (const auto& c : candidates) {
        if (rule_used[c.rule] || ai_used[c.ai]) {
            continue;
        }
        rule_used[c.rule] = true;
        ai_used[c.ai] = true;

        const auto& ri = rules[c.rule].issue;
        const auto& ai = ais[c.ai].issue;
        std::string key = primary_key(ri);

        Conflict conflict;
        conflict.key = key;
        conflict.rule_issue_id = ri.id;
        conflict.ai_issue_id = ai.id;

        // Страница неизвестна ровно у одной стороны; без страниц у обеих - обычная классификация
        if (c.kind == KeyKind::Secondary && (ri.location.page == 0) != (ai.location.page == 0)) {
            conflict.reason = ConflictReason::Missing;
            conflict.resolution = ri.location.page != 0 ? Resolution::PreferRule : Resolution::PreferAi;
        } else if (c.kind == KeyKind::Secondary && ri.location.table && ai.location.table &&
                   *ri.location.table != *ai.location.table) {
            conflict.reason = ConflictReason::ScopeMismatch;
            conflict.resolution = Resolution::PreferRule;
        } else if (ri.category != ai.category) {
            conflict.reason = ConflictReason::CategoryMismatch;
            conflict.resolution = Resolution::Composite;
        } else if (std::abs(issue::severity_rank(ri.severity) - issue::severity_rank(ai.severity)) >
                   options.severity_tolerance) {
            conflict.reason = ConflictReason::SeverityMismatch;
            conflict.resolution = is_value_finding(ri) || is_value_finding(ai) ? Resolution::PreferRule
                                                                               : Resolution::PreferAi;
        } else {
            // Согласие: каноническая - находка правила
            issue::Issue canonical = ri;
            canonical.confidence =
                std::min(1.0, std::max(ri.confidence, ai.confidence) + options.agreement_boost);
            canonical.tags.insert("agreement");
            result.agreements.push_back(Agreement{key, ai.id, ri.id, canonical.confidence});
            result.merged.push_back(issue::RuleFinding{std::move(canonical)});
            continue;
        }

        switch (conflict.resolution) {
        case Resolution::PreferRule:
            conflict.final_severity = ri.severity;
            result.merged.push_back(issue::RuleFinding{ri});
            break;
        case Resolution::PreferAi:
            conflict.final_severity = ai.severity;
            result.merged.push_back(issue::AIFinding{ai});
            break;
        case Resolution::Composite: {
            issue::Issue comp = composite_issue(ri, ai);
            conflict.final_severity = comp.severity;
            result.merged.push_back(issue::RuleFinding{std::move(comp)});
            break;
        }
        }
        result.conflicts.push_back(std::move(conflict));
    }

    for (size_t r = 0; r < rules.size(); ++r) {
        if (!rule_used[r]) {
            result.rule_only.push_back(rules[r].issue.id);
            result.merged.push_back(rules[r]);
        }
    }
    for (size_t a = 0; a < ais.size(); ++a) {
        if (!ai_used[a]) {
            result.ai_only.push_back(ais[a].issue.id);
            result.merged.push_back(ais[a]);
        }
    }

    rank_and_count(result);
    return result;
}

MergedResult concatenate(const std::vector<issue::RuleFinding>& rule_input,
                         const std::vector<issue::AIFinding>& ai_input) {
    MergedResult result;
    result.rule_findings = sorted_by_id(rule_input);
    result.ai_findings = sorted_by_id(ai_input);
    for (const auto& f : result.rule_findings) {
        result.rule_only.push_back(f.issue.id);
        result.merged.push_back(f);
    }
    for (const auto& f : result.ai_findings) {
        result.ai_only.push_back(f.issue.id);
        result.merged.push_back(f);
    }
    rank_and_count(result);
    return result;
}

// ============================================================================
// JSON
// ============================================================================

namespace {

rapidjson::Value str(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

template <typename F>
rapidjson::Value findings_array(const std::vector<F>& items, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (const auto& f : items) {
        rapidjson::Value v;
        issue::issue_to_json(issue::finding_issue(f), v, alloc);
        arr.PushBack(v, alloc);
    }
    return arr;
}

rapidjson::Value ids_array(const std::vector<std::string>& ids, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (const auto& id : ids) {
        arr.PushBack(str(id, alloc), alloc);
    }
    return arr;
}

}  // anonymous namespace

void result_to_json(const MergedResult& result, rapidjson::Value& out,
                    rapidjson::Document::AllocatorType& alloc) {
    out.SetObject();
    out.AddMember("aiFindings", findings_array(result.ai_findings, alloc), alloc);
    out.AddMember("ruleFindings", findings_array(result.rule_findings, alloc), alloc);
    out.AddMember("merged", findings_array(result.merged, alloc), alloc);

    rapidjson::Value conflicts(rapidjson::kArrayType);
    for (const auto& c : result.conflicts) {
        rapidjson::Value v(rapidjson::kObjectType);
        v.AddMember("key", str(c.key, alloc), alloc);
        if (c.ai_issue_id) {
            v.AddMember("aiIssueId", str(*c.ai_issue_id, alloc), alloc);
        }
        if (c.rule_issue_id) {
            v.AddMember("ruleIssueId", str(*c.rule_issue_id, alloc), alloc);
        }
        v.AddMember("reason", str(to_string(c.reason), alloc), alloc);
        v.AddMember("resolution", str(to_string(c.resolution), alloc), alloc);
        v.AddMember("finalSeverity", str(issue::to_string(c.final_severity), alloc), alloc);
        conflicts.PushBack(v, alloc);
    }
    out.AddMember("conflicts", conflicts, alloc);

    rapidjson::Value agreements(rapidjson::kArrayType);
    for (const auto& a : result.agreements) {
        rapidjson::Value v(rapidjson::kObjectType);
        v.AddMember("key", str(a.key, alloc), alloc);
        v.AddMember("aiIssueId", str(a.ai_issue_id, alloc), alloc);
        v.AddMember("ruleIssueId", str(a.rule_issue_id, alloc), alloc);
        v.AddMember("confidence", a.confidence, alloc);
        agreements.PushBack(v, alloc);
    }
    out.AddMember("agreements", agreements, alloc);

    out.AddMember("aiOnly", ids_array(result.ai_only, alloc), alloc);
    out.AddMember("ruleOnly", ids_array(result.rule_only, alloc), alloc);

    rapidjson::Value inconsistencies(rapidjson::kArrayType);
    for (const auto& inc : result.inconsistencies) {
        rapidjson::Value v(rapidjson::kObjectType);
        v.AddMember("key", str(inc.key, alloc), alloc);
        v.AddMember("source", str(issue::to_string(inc.source), alloc), alloc);
        v.AddMember("issueIds", ids_array(inc.issue_ids, alloc), alloc);
        v.AddMember("reason", str(inc.reason, alloc), alloc);
        inconsistencies.PushBack(v, alloc);
    }
    out.AddMember("inconsistencies", inconsistencies, alloc);

    rapidjson::Value totals(rapidjson::kObjectType);
    totals.AddMember("ai", static_cast<uint64_t>(result.totals.ai), alloc);
    totals.AddMember("rule", static_cast<uint64_t>(result.totals.rule), alloc);
    totals.AddMember("merged", static_cast<uint64_t>(result.totals.merged), alloc);
    totals.AddMember("conflicts", static_cast<uint64_t>(result.totals.conflicts), alloc);
    totals.AddMember("agreements", static_cast<uint64_t>(result.totals.agreements), alloc);
    totals.AddMember("aiOnly", static_cast<uint64_t>(result.totals.ai_only), alloc);
    totals.AddMember("ruleOnly", static_cast<uint64_t>(result.totals.rule_only), alloc);
    out.AddMember("totals", totals, alloc);
}

std::string result_to_string(const MergedResult& result) {
    rapidjson::Document doc;
    result_to_json(result, doc, doc.GetAllocator());
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace budgetaudit::merge
