// ==============================================================================
// issue.cpp - Модель находок
// ==============================================================================

#include "budgetaudit/issue.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>

namespace budgetaudit::issue {

// ============================================================================
// Severity / Source
// ============================================================================

int severity_rank(Severity s) {
    switch (s) {
    case Severity::Critical:
        return 4;
    case Severity::High:
        return 3;
    case Severity::Medium:
        return 2;
    case Severity::Low:
        return 1;
    case Severity::Info:
        return 0;
    }
    return 0;
}

Severity reduce_severity(Severity s) {
    switch (s) {
    case Severity::Critical:
        return Severity::High;
    case Severity::High:
        return Severity::Medium;
    case Severity::Medium:
        return Severity::Low;
    case Severity::Low:
    case Severity::Info:
        return Severity::Info;
    }
    return Severity::Info;
}

Severity max_severity(Severity a, Severity b) {
    return severity_rank(a) >= severity_rank(b) ? a : b;
}

std::string to_string(Severity s) {
    switch (s) {
    case Severity::Critical:
        return "critical";
    case Severity::High:
        return "high";
    case Severity::Medium:
        return "medium";
    case Severity::Low:
        return "low";
    case Severity::Info:
        return "info";
    }
    return "unknown";
}

std::string to_string(Source s) {
    switch (s) {
    case Source::Rule:
        return "rule";
    case Source::AI:
        return "ai";
    }
    return "unknown";
}

Severity parse_severity(std::string_view s) {
    if (s == "critical")
        return Severity::Critical;
    if (s == "high" || s == "error")
        return Severity::High;
    if (s == "medium" || s == "warn" || s == "warning")
        return Severity::Medium;
    if (s == "low")
        return Severity::Low;
    if (s == "info")
        return Severity::Info;
    throw std::invalid_argument(
        "unknown severity, must be: critical, high, medium, low, info (or error, warn)");
}

Source parse_source(std::string_view s) {
    if (s == "rule" || s == "engine")
        return Source::Rule;
    if (s == "ai")
        return Source::AI;
    throw std::invalid_argument("unknown source, must be: rule or ai");
}

// ============================================================================
// Сравнение
// ============================================================================

bool Evidence::operator==(const Evidence& other) const {
    return page == other.page && text == other.text && span == other.span &&
           screenshot_ref == other.screenshot_ref;
}

bool Location::operator==(const Location& other) const {
    return page == other.page && section == other.section && table == other.table &&
           row == other.row && col == other.col;
}

bool Issue::operator==(const Issue& other) const {
    return id == other.id && source == other.source && severity == other.severity &&
           rule_id == other.rule_id && category == other.category && title == other.title &&
           message == other.message && evidence == other.evidence &&
           location == other.location && confidence == other.confidence && tags == other.tags &&
           metrics == other.metrics && suggestion == other.suggestion &&
           created_at == other.created_at;
}

double clamp_confidence(double value) {
    if (!(value >= 0.0)) {  // NaN тоже сюда
        return 0.0;
    }
    return std::min(value, 1.0);
}

// ============================================================================
// Finding
// ============================================================================

const Issue& finding_issue(const Finding& f) {
    return std::visit([](const auto& v) -> const Issue& { return v.issue; }, f);
}

Source finding_source(const Finding& f) {
    return std::visit(
        [](const auto& v) -> Source {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, RuleFinding>) {
                return Source::Rule;
            } else {
                static_assert(std::is_same_v<T, AIFinding>, "Unhandled finding type");
                return Source::AI;
            }
        },
        f);
}

// ============================================================================
// JSON: сериализация
// ============================================================================

namespace {

rapidjson::Value make_string(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

}  // namespace

void issue_to_json(const Issue& issue, rapidjson::Value& out,
                   rapidjson::Document::AllocatorType& alloc) {
    out.SetObject();
    out.AddMember("id", make_string(issue.id, alloc), alloc);
    out.AddMember("source", make_string(to_string(issue.source), alloc), alloc);
    out.AddMember("severity", make_string(to_string(issue.severity), alloc), alloc);
    if (issue.rule_id.has_value()) {
        out.AddMember("ruleId", make_string(*issue.rule_id, alloc), alloc);
    }
    out.AddMember("category", make_string(issue.category, alloc), alloc);
    out.AddMember("title", make_string(issue.title, alloc), alloc);
    out.AddMember("message", make_string(issue.message, alloc), alloc);

    rapidjson::Value evidence(rapidjson::kArrayType);
    for (const auto& ev : issue.evidence) {
        rapidjson::Value e(rapidjson::kObjectType);
        e.AddMember("page", ev.page, alloc);
        e.AddMember("text", make_string(ev.text, alloc), alloc);
        if (ev.span.has_value()) {
            rapidjson::Value span(rapidjson::kArrayType);
            span.PushBack(static_cast<uint64_t>(ev.span->first), alloc);
            span.PushBack(static_cast<uint64_t>(ev.span->second), alloc);
            e.AddMember("span", span, alloc);
        }
        if (ev.screenshot_ref.has_value()) {
            e.AddMember("screenshotRef", make_string(*ev.screenshot_ref, alloc), alloc);
        }
        evidence.PushBack(e, alloc);
    }
    out.AddMember("evidence", evidence, alloc);

    rapidjson::Value location(rapidjson::kObjectType);
    location.AddMember("page", issue.location.page, alloc);
    if (issue.location.section.has_value()) {
        location.AddMember("section", make_string(*issue.location.section, alloc), alloc);
    }
    if (issue.location.table.has_value()) {
        location.AddMember("table", make_string(*issue.location.table, alloc), alloc);
    }
    if (issue.location.row.has_value()) {
        location.AddMember("row", *issue.location.row, alloc);
    }
    if (issue.location.col.has_value()) {
        location.AddMember("col", *issue.location.col, alloc);
    }
    out.AddMember("location", location, alloc);

    out.AddMember("confidence", issue.confidence, alloc);

    rapidjson::Value tags(rapidjson::kArrayType);
    for (const auto& t : issue.tags) {
        tags.PushBack(make_string(t, alloc), alloc);
    }
    out.AddMember("tags", tags, alloc);

    rapidjson::Value metrics(rapidjson::kObjectType);
    for (const auto& [name, value] : issue.metrics) {
        metrics.AddMember(make_string(name, alloc), value, alloc);
    }
    out.AddMember("metrics", metrics, alloc);

    out.AddMember("suggestion", make_string(issue.suggestion, alloc), alloc);
    out.AddMember("createdAt", make_string(issue.created_at, alloc), alloc);
}

// ============================================================================
// JSON: адаптер входной формы
// ============================================================================

const rapidjson::Value* find_member(const rapidjson::Value& obj,
                                    std::initializer_list<const char*> names) {
    if (!obj.IsObject()) {
        return nullptr;
    }
    for (const char* name : names) {
        auto it = obj.FindMember(name);
        if (it != obj.MemberEnd() && !it->value.IsNull()) {
            return &it->value;
        }
    }
    return nullptr;
}

namespace {

std::optional<std::string> get_string(const rapidjson::Value& obj,
                                      std::initializer_list<const char*> names) {
    const rapidjson::Value* v = find_member(obj, names);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (v->IsString()) {
        return std::string(v->GetString(), v->GetStringLength());
    }
    if (v->IsInt64()) {
        return std::to_string(v->GetInt64());
    }
    return std::nullopt;
}

std::optional<int> get_int(const rapidjson::Value& obj, std::initializer_list<const char*> names) {
    const rapidjson::Value* v = find_member(obj, names);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (v->IsInt()) {
        return v->GetInt();
    }
    if (v->IsDouble()) {
        return static_cast<int>(v->GetDouble());
    }
    return std::nullopt;
}

std::optional<std::pair<size_t, size_t>> get_span(const rapidjson::Value& obj,
                                                  std::initializer_list<const char*> names) {
    const rapidjson::Value* v = find_member(obj, names);
    if (v == nullptr || !v->IsArray() || v->Size() != 2 || !(*v)[0].IsUint64() ||
        !(*v)[1].IsUint64()) {
        return std::nullopt;
    }
    return std::make_pair(static_cast<size_t>((*v)[0].GetUint64()),
                          static_cast<size_t>((*v)[1].GetUint64()));
}

}  // namespace

IssueResult issue_from_json(const rapidjson::Value& input) {
    IssueResult result;

    const rapidjson::Value* json = &input;
    // Вложенная форма {"result": {...}} или {"issue": {...}}
    if (const auto* nested = find_member(input, {"result", "issue"}); nested && nested->IsObject()) {
        json = nested;
    }
    if (!json->IsObject()) {
        result.error = "issue must be a JSON object";
        return result;
    }

    Issue issue;
    auto id = get_string(*json, {"id", "issue_id", "issueId"});
    if (!id.has_value() || id->empty()) {
        result.error = "issue is missing 'id'";
        return result;
    }
    issue.id = *id;

    try {
        issue.source = parse_source(get_string(*json, {"source"}).value_or("rule"));
        issue.severity = parse_severity(get_string(*json, {"severity", "level"}).value_or("info"));
    } catch (const std::invalid_argument& e) {
        result.error = std::string("issue '") + issue.id + "': " + e.what();
        return result;
    }

    issue.rule_id = get_string(*json, {"rule_id", "ruleId"});
    issue.category = get_string(*json, {"category"}).value_or("");
    issue.title = get_string(*json, {"title"}).value_or("");
    issue.message = get_string(*json, {"message", "desc", "description"}).value_or("");
    issue.suggestion = get_string(*json, {"suggestion"}).value_or("");
    issue.created_at = get_string(*json, {"created_at", "createdAt"}).value_or("");

    if (const auto* ev = find_member(*json, {"evidence"}); ev && ev->IsArray()) {
        for (const auto& item : ev->GetArray()) {
            Evidence e;
            e.page = get_int(item, {"page", "page_number", "pageNumber"}).value_or(0);
            e.text = get_string(item, {"text", "text_snippet", "textSnippet"}).value_or("");
            e.span = get_span(item, {"span"});
            e.screenshot_ref = get_string(item, {"screenshot_ref", "screenshotRef"});
            issue.evidence.push_back(std::move(e));
        }
    }

    if (const auto* loc = find_member(*json, {"location"}); loc && loc->IsObject()) {
        issue.location.page = get_int(*loc, {"page", "page_number", "pageNumber"}).value_or(0);
        issue.location.section = get_string(*loc, {"section"});
        issue.location.table = get_string(*loc, {"table"});
        issue.location.row = get_int(*loc, {"row"});
        issue.location.col = get_int(*loc, {"col", "column"});
    } else {
        // Плоская форма: page_number на верхнем уровне
        issue.location.page = get_int(*json, {"page_number", "pageNumber", "page"}).value_or(0);
    }

    if (const auto* conf = find_member(*json, {"confidence"}); conf && conf->IsNumber()) {
        issue.confidence = clamp_confidence(conf->GetDouble());
    }

    if (const auto* tags = find_member(*json, {"tags"}); tags && tags->IsArray()) {
        for (const auto& t : tags->GetArray()) {
            if (t.IsString()) {
                issue.tags.insert(std::string(t.GetString(), t.GetStringLength()));
            }
        }
    }

    if (const auto* metrics = find_member(*json, {"metrics"}); metrics && metrics->IsObject()) {
        for (auto it = metrics->MemberBegin(); it != metrics->MemberEnd(); ++it) {
            if (it->value.IsNumber()) {
                issue.metrics[it->name.GetString()] = it->value.GetDouble();
            }
        }
    }

    result.ok = true;
    result.issue = std::move(issue);
    return result;
}

}  // namespace budgetaudit::issue
