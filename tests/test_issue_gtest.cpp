// ==============================================================================
// test_issue_gtest.cpp - Тесты модели находок (GoogleTest)
// ==============================================================================
//
// Severity/Source, Finding, сериализация Issue и разбор входных форм JSON.
//
// ==============================================================================

#include "budgetaudit/issue.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <rapidjson/document.h>
#include <stdexcept>
#include <string>

namespace budgetaudit::issue::test {

namespace {

rapidjson::Document parse_json(const char* text) {
    rapidjson::Document doc;
    doc.Parse(text);
    return doc;
}

}  // anonymous namespace

// ============================================================================
// Severity / Source
// ============================================================================

TEST(IssueTest, SeverityRank_Ordered) {
    EXPECT_GT(severity_rank(Severity::Critical), severity_rank(Severity::High));
    EXPECT_GT(severity_rank(Severity::High), severity_rank(Severity::Medium));
    EXPECT_GT(severity_rank(Severity::Medium), severity_rank(Severity::Low));
    EXPECT_GT(severity_rank(Severity::Low), severity_rank(Severity::Info));
}

TEST(IssueTest, ReduceSeverity_StopsAtInfo) {
    EXPECT_EQ(reduce_severity(Severity::Critical), Severity::High);
    EXPECT_EQ(reduce_severity(Severity::Low), Severity::Info);
    EXPECT_EQ(reduce_severity(Severity::Info), Severity::Info);
}

TEST(IssueTest, MaxSeverity_PicksMoreSevere) {
    EXPECT_EQ(max_severity(Severity::Low, Severity::High), Severity::High);
    EXPECT_EQ(max_severity(Severity::Critical, Severity::Medium), Severity::Critical);
}

TEST(IssueTest, ParseSeverity_Aliases) {
    EXPECT_EQ(parse_severity("critical"), Severity::Critical);
    EXPECT_EQ(parse_severity("error"), Severity::High);
    EXPECT_EQ(parse_severity("warn"), Severity::Medium);
    EXPECT_EQ(parse_severity("warning"), Severity::Medium);
    EXPECT_EQ(parse_severity("info"), Severity::Info);
    EXPECT_THROW(parse_severity("fatal"), std::invalid_argument);
}

TEST(IssueTest, ParseSource_EngineIsRule) {
    EXPECT_EQ(parse_source("rule"), Source::Rule);
    EXPECT_EQ(parse_source("engine"), Source::Rule);
    EXPECT_EQ(parse_source("ai"), Source::AI);
    EXPECT_THROW(parse_source("human"), std::invalid_argument);
    EXPECT_EQ(to_string(Source::AI), "ai");
    EXPECT_EQ(to_string(Severity::Medium), "medium");
}

TEST(IssueTest, ClampConfidence_Range) {
    EXPECT_DOUBLE_EQ(clamp_confidence(0.4), 0.4);
    EXPECT_DOUBLE_EQ(clamp_confidence(1.7), 1.0);
    EXPECT_DOUBLE_EQ(clamp_confidence(-0.2), 0.0);
    EXPECT_DOUBLE_EQ(clamp_confidence(std::numeric_limits<double>::quiet_NaN()), 0.0);
}

// ============================================================================
// Finding
// ============================================================================

TEST(IssueTest, FindingSource_FollowsVariant) {
    Issue base;
    base.id = "X-1";
    base.source = Source::AI;  // дискриминант важнее поля

    Finding rule = RuleFinding{base};
    Finding ai = AIFinding{base};

    EXPECT_EQ(finding_source(rule), Source::Rule);
    EXPECT_EQ(finding_source(ai), Source::AI);
    EXPECT_EQ(finding_issue(rule).id, "X-1");
}

// ============================================================================
// JSON
// ============================================================================

TEST(IssueJsonTest, ToJson_CamelCaseKeys) {
    Issue is;
    is.id = "R-V33-110-1";
    is.severity = Severity::High;
    is.rule_id = "V33-110";
    is.category = "text-number";
    is.evidence.push_back(Evidence{3, "决算数大于预算数", std::pair<size_t, size_t>(4, 12), std::nullopt});
    is.location.page = 3;
    is.location.table = "收入支出决算总表";
    is.tags = {"b", "a"};
    is.metrics = {{"budget", 200.0}};
    rapidjson::Document doc;

    issue_to_json(is, doc, doc.GetAllocator());

    ASSERT_TRUE(doc.IsObject());
    EXPECT_STREQ(doc["id"].GetString(), "R-V33-110-1");
    EXPECT_STREQ(doc["source"].GetString(), "rule");
    EXPECT_STREQ(doc["severity"].GetString(), "high");
    EXPECT_STREQ(doc["ruleId"].GetString(), "V33-110");
    ASSERT_EQ(doc["evidence"].Size(), 1u);
    EXPECT_EQ(doc["evidence"][0u]["span"][1u].GetUint64(), 12u);
    EXPECT_FALSE(doc["evidence"][0u].HasMember("screenshotRef"));
    EXPECT_EQ(doc["location"]["page"].GetInt(), 3);
    EXPECT_FALSE(doc["location"].HasMember("row"));
    EXPECT_STREQ(doc["tags"][0u].GetString(), "a");
    EXPECT_DOUBLE_EQ(doc["metrics"]["budget"].GetDouble(), 200.0);
    EXPECT_TRUE(doc.HasMember("createdAt"));
}

TEST(IssueJsonTest, FromJson_SnakeCaseFlat) {
    auto doc = parse_json(R"({
        "issue_id": "A-1", "source": "ai", "level": "warn", "rule_id": "V33-110",
        "desc": "缺少原因说明", "page_number": 7, "confidence": 1.4,
        "evidence": [{"page_number": 7, "text_snippet": "主要原因", "span": [2, 6]}],
        "tags": ["ai", 5], "metrics": {"budget": 100, "label": "x"}
    })");

    auto r = issue_from_json(doc);

    ASSERT_TRUE(r) << r.error;
    EXPECT_EQ(r.issue.id, "A-1");
    EXPECT_EQ(r.issue.source, Source::AI);
    EXPECT_EQ(r.issue.severity, Severity::Medium);
    EXPECT_EQ(r.issue.rule_id.value_or(""), "V33-110");
    EXPECT_EQ(r.issue.message, "缺少原因说明");
    EXPECT_EQ(r.issue.location.page, 7);
    EXPECT_DOUBLE_EQ(r.issue.confidence, 1.0);
    ASSERT_EQ(r.issue.evidence.size(), 1u);
    EXPECT_EQ(r.issue.evidence[0].text, "主要原因");
    ASSERT_TRUE(r.issue.evidence[0].span.has_value());
    EXPECT_EQ(r.issue.evidence[0].span->first, 2u);
    EXPECT_EQ(r.issue.tags.size(), 1u);
    EXPECT_EQ(r.issue.metrics.size(), 1u);
}

TEST(IssueJsonTest, FromJson_NestedResultCamelCase) {
    auto doc = parse_json(R"({"result": {
        "issueId": "R-2", "severity": "critical", "ruleId": "V33-101",
        "location": {"pageNumber": 4, "table": "收入决算表", "column": 3},
        "createdAt": "2026-01-01T00:00:00Z"
    }})");

    auto r = issue_from_json(doc);

    ASSERT_TRUE(r) << r.error;
    EXPECT_EQ(r.issue.id, "R-2");
    EXPECT_EQ(r.issue.source, Source::Rule);
    EXPECT_EQ(r.issue.severity, Severity::Critical);
    EXPECT_EQ(r.issue.location.page, 4);
    EXPECT_EQ(r.issue.location.table.value_or(""), "收入决算表");
    EXPECT_EQ(r.issue.location.col.value_or(0), 3);
    EXPECT_FALSE(r.issue.location.row.has_value());
    EXPECT_EQ(r.issue.created_at, "2026-01-01T00:00:00Z");
}

TEST(IssueJsonTest, FromJson_RoundTripOfSerialized) {
    Issue is;
    is.id = "M-R-1";
    is.source = Source::AI;
    is.severity = Severity::Low;
    is.category = "composite";
    is.title = "t";
    is.message = "m";
    is.location.page = 2;
    is.location.section = "三";
    is.confidence = 0.5;
    is.tags = {"agreement"};
    is.created_at = "2026-10-19T00:00:00Z";
    rapidjson::Document doc;
    issue_to_json(is, doc, doc.GetAllocator());

    auto r = issue_from_json(doc);

    ASSERT_TRUE(r) << r.error;
    EXPECT_EQ(r.issue, is);
}

TEST(IssueJsonTest, FromJson_Errors) {
    EXPECT_EQ(issue_from_json(parse_json("[1, 2]")).error, "issue must be a JSON object");
    EXPECT_EQ(issue_from_json(parse_json(R"({"severity": "high"})")).error, "issue is missing 'id'");
    EXPECT_EQ(issue_from_json(parse_json(R"({"id": "", "severity": "high"})")).error,
              "issue is missing 'id'");

    auto bad = issue_from_json(parse_json(R"({"id": "X", "severity": "fatal"})"));
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.error.rfind("issue 'X': unknown severity", 0), 0u);
}

TEST(IssueJsonTest, FromJson_NumericIdAccepted) {
    auto r = issue_from_json(parse_json(R"({"id": 42})"));

    ASSERT_TRUE(r) << r.error;
    EXPECT_EQ(r.issue.id, "42");
    EXPECT_EQ(r.issue.severity, Severity::Info);
    EXPECT_DOUBLE_EQ(r.issue.confidence, 1.0);
}

}  // namespace budgetaudit::issue::test
