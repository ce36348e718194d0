// ==============================================================================
// test_merge_gtest.cpp - Тесты слияния находок (GoogleTest)
// ==============================================================================

#include "budgetaudit/merge.hpp"

#include <algorithm>
#include <gtest/gtest.h>

namespace budgetaudit::merge::test {

namespace {

const char* MISMATCH = "预决算对比表述与数值不一致";

issue::Issue make_issue(const std::string& id, issue::Source source, int page,
                        const std::string& title = MISMATCH,
                        issue::Severity severity = issue::Severity::High) {
    issue::Issue is;
    is.id = id;
    is.source = source;
    is.severity = severity;
    is.rule_id = "V33-110";
    is.category = "text-number";
    is.title = title;
    is.location.page = page;
    return is;
}

issue::RuleFinding rule(const std::string& id, int page, const std::string& title = MISMATCH,
                        issue::Severity severity = issue::Severity::High) {
    return issue::RuleFinding{make_issue(id, issue::Source::Rule, page, title, severity)};
}

issue::AIFinding ai(const std::string& id, int page, const std::string& title = MISMATCH,
                    issue::Severity severity = issue::Severity::High) {
    return issue::AIFinding{make_issue(id, issue::Source::AI, page, title, severity)};
}

void with_amounts(issue::Issue& is, double budget, double final_value) {
    is.metrics["budget"] = budget;
    is.metrics["final"] = final_value;
}

}  // namespace

// ==============================================================================
// Ключи
// ==============================================================================

TEST(MergeKeyTest, RuleKey_FallsBackToCategory) {
    auto is = make_issue("R-1", issue::Source::Rule, 3);
    EXPECT_EQ(rule_key(is), "V33-110");

    is.rule_id.reset();
    EXPECT_EQ(rule_key(is), "category:text-number");
}

TEST(MergeKeyTest, PrimaryKey_IncludesPageTableTitleAndAmounts) {
    auto is = make_issue("R-1", issue::Source::Rule, 11, "预决算 对比，表述");
    is.location.table = "收入支出决算总表";
    with_amounts(is, 200, 260.5);
    is.metrics["diff"] = 60.5;

    EXPECT_EQ(primary_key(is), "V33-110|p11|收入支出决算总表|预决算对比表述|budget=200|final=260.5");
}

TEST(MergeKeyTest, PrimaryMatch_MoneyTolerance) {
    auto a = make_issue("R-1", issue::Source::Rule, 11);
    auto near = make_issue("A-1", issue::Source::AI, 11);
    auto far = make_issue("A-2", issue::Source::AI, 11);
    with_amounts(a, 200, 260);
    with_amounts(near, 200.5, 260);
    with_amounts(far, 210, 260);

    EXPECT_TRUE(primary_match(a, near));
    EXPECT_FALSE(primary_match(a, far));
}

TEST(MergeKeyTest, PrimaryMatch_PageAndTableMustAgree) {
    auto a = make_issue("R-1", issue::Source::Rule, 11);
    auto other_page = make_issue("A-1", issue::Source::AI, 12);
    auto with_table = make_issue("A-2", issue::Source::AI, 11);
    with_table.location.table = "收入决算表";

    EXPECT_FALSE(primary_match(a, other_page));
    // Таблица только с одной стороны не мешает
    EXPECT_TRUE(primary_match(a, with_table));
}

TEST(MergeKeyTest, IsValueFinding) {
    auto plain = make_issue("R-1", issue::Source::Rule, 1);
    auto numeric = plain;
    numeric.category = "numeric";
    auto measured = plain;
    measured.metrics["diff"] = 1.0;

    EXPECT_FALSE(is_value_finding(plain));
    EXPECT_TRUE(is_value_finding(numeric));
    EXPECT_TRUE(is_value_finding(measured));
}

// ==============================================================================
// Классификация
// ==============================================================================

TEST(MergeTest, Agreement_BoostsConfidence) {
    auto r = rule("R-V33-110-1", 11);
    r.issue.confidence = 0.7;
    auto a = ai("A-V33-110-1", 11);
    a.issue.confidence = 0.8;

    auto result = merge({r}, {a});

    ASSERT_EQ(result.agreements.size(), 1u);
    EXPECT_EQ(result.agreements[0].rule_issue_id, "R-V33-110-1");
    EXPECT_EQ(result.agreements[0].ai_issue_id, "A-V33-110-1");
    EXPECT_NEAR(result.agreements[0].confidence, 0.9, 1e-9);
    ASSERT_EQ(result.merged.size(), 1u);
    const auto& merged = issue::finding_issue(result.merged[0]);
    EXPECT_EQ(merged.id, "R-V33-110-1");
    EXPECT_EQ(issue::finding_source(result.merged[0]), issue::Source::Rule);
    EXPECT_EQ(merged.tags.count("agreement"), 1u);
    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_EQ(result.totals.agreements, 1u);
    EXPECT_EQ(result.totals.merged, 1u);
}

TEST(MergeTest, Agreement_ConfidenceCappedAtOne) {
    auto result = merge({rule("R-1", 11)}, {ai("A-1", 11)});

    ASSERT_EQ(result.agreements.size(), 1u);
    EXPECT_DOUBLE_EQ(result.agreements[0].confidence, 1.0);
}

TEST(MergeTest, SeverityMismatch_ValueFinding_PreferRule) {
    auto r = rule("R-1", 11, MISMATCH, issue::Severity::High);
    with_amounts(r.issue, 200, 260);
    auto a = ai("A-1", 11, MISMATCH, issue::Severity::Low);
    with_amounts(a.issue, 200, 260);

    auto result = merge({r}, {a});

    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].reason, ConflictReason::SeverityMismatch);
    EXPECT_EQ(result.conflicts[0].resolution, Resolution::PreferRule);
    EXPECT_EQ(result.conflicts[0].final_severity, issue::Severity::High);
    ASSERT_EQ(result.merged.size(), 1u);
    EXPECT_EQ(issue::finding_issue(result.merged[0]).id, "R-1");
}

TEST(MergeTest, SeverityMismatch_TextFinding_PreferAi) {
    auto r = rule("R-1", 4, "表述不规范", issue::Severity::Low);
    auto a = ai("A-1", 4, "表述不规范", issue::Severity::Medium);

    auto result = merge({r}, {a});

    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].resolution, Resolution::PreferAi);
    EXPECT_EQ(result.conflicts[0].final_severity, issue::Severity::Medium);
    ASSERT_EQ(result.merged.size(), 1u);
    EXPECT_EQ(issue::finding_source(result.merged[0]), issue::Source::AI);
}

TEST(MergeTest, SeverityTolerance_AllowsOneStep) {
    MergeOptions options;
    options.severity_tolerance = 1;

    auto result = merge({rule("R-1", 11, MISMATCH, issue::Severity::High)},
                        {ai("A-1", 11, MISMATCH, issue::Severity::Medium)}, options);

    EXPECT_EQ(result.agreements.size(), 1u);
    EXPECT_TRUE(result.conflicts.empty());
}

TEST(MergeTest, CategoryMismatch_Composite) {
    auto r = rule("R-1", 11, MISMATCH, issue::Severity::Medium);
    r.issue.evidence.push_back(issue::Evidence{11, "规则片段", std::nullopt, std::nullopt});
    auto a = ai("A-1", 11, MISMATCH, issue::Severity::High);
    a.issue.category = "numeric";
    a.issue.evidence.push_back(issue::Evidence{11, "模型片段", std::nullopt, std::nullopt});
    a.issue.suggestion = "核对数字";

    auto result = merge({r}, {a});

    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].reason, ConflictReason::CategoryMismatch);
    EXPECT_EQ(result.conflicts[0].resolution, Resolution::Composite);
    EXPECT_EQ(result.conflicts[0].final_severity, issue::Severity::High);
    ASSERT_EQ(result.merged.size(), 1u);
    const auto& comp = issue::finding_issue(result.merged[0]);
    EXPECT_EQ(comp.id, "M-R-1");
    EXPECT_EQ(comp.evidence.size(), 2u);
    EXPECT_EQ(comp.tags.count("category:text-number"), 1u);
    EXPECT_EQ(comp.tags.count("category:numeric"), 1u);
    EXPECT_EQ(comp.suggestion, "核对数字");
}

TEST(MergeTest, SecondaryMatch_MissingPage) {
    auto result = merge({rule("R-1", 11)}, {ai("A-1", 0)});

    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].reason, ConflictReason::Missing);
    EXPECT_EQ(result.conflicts[0].resolution, Resolution::PreferRule);
    EXPECT_EQ(issue::finding_issue(result.merged[0]).id, "R-1");
}

TEST(MergeTest, SecondaryMatch_RulePageMissing_PreferAi) {
    auto result = merge({rule("R-1", 0)}, {ai("A-1", 11)});

    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].resolution, Resolution::PreferAi);
}

TEST(MergeTest, SecondaryMatch_NoPageOnEitherSide_Agreement) {
    auto a = ai("A-1", 0, "封面缺少年度");
    a.issue.rule_id = "V33-001";

    auto result = merge({rule("R-1", 0, "封面缺少年度")}, {a});

    EXPECT_TRUE(result.conflicts.empty());
    ASSERT_EQ(result.agreements.size(), 1u);
    EXPECT_EQ(result.agreements[0].rule_issue_id, "R-1");
}

TEST(MergeTest, SecondaryMatch_NoPageOnEitherSide_SeverityConflict) {
    auto a = ai("A-1", 0, "封面缺少年度", issue::Severity::Low);
    a.issue.rule_id = "V33-001";

    auto result = merge({rule("R-1", 0, "封面缺少年度")}, {a});

    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].reason, ConflictReason::SeverityMismatch);
}

TEST(MergeTest, SecondaryMatch_DifferentTables_ScopeMismatch) {
    auto r = rule("R-1", 2);
    r.issue.location.table = "收入支出决算总表";
    auto a = ai("A-1", 2);
    a.issue.location.table = "财政拨款收入支出决算总表";

    auto result = merge({r}, {a});

    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].reason, ConflictReason::ScopeMismatch);
    EXPECT_EQ(result.conflicts[0].resolution, Resolution::PreferRule);
}

TEST(MergeTest, SecondaryMatch_AdjacentPage_Agreement) {
    auto result = merge({rule("R-1", 11)}, {ai("A-1", 12)});

    EXPECT_EQ(result.agreements.size(), 1u);
}

TEST(MergeTest, FarApartOrUnrelated_OnlyLists) {
    auto result = merge({rule("R-1", 11), rule("R-2", 1, "封面缺少年度")},
                        {ai("A-1", 14), ai("A-2", 11, "缺少单位说明")});

    EXPECT_TRUE(result.agreements.empty());
    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_EQ(result.rule_only, (std::vector<std::string>{"R-1", "R-2"}));
    EXPECT_EQ(result.ai_only, (std::vector<std::string>{"A-1", "A-2"}));
    EXPECT_EQ(result.merged.size(), 4u);
}

TEST(MergeTest, SimilarMessages_SecondaryMatch) {
    auto r = rule("R-1", 11, "表述不一致");
    r.issue.message = "年初预算=200，决算=260（判定为大于，文本表述持平）";
    auto a = ai("A-1", 11, "数值与结论冲突");
    a.issue.message = "年初预算=200，决算=260（判定为大于，文本表述持平）。";

    auto result = merge({r}, {a});

    EXPECT_EQ(result.agreements.size(), 1u);
}

TEST(MergeTest, EveryInputClassifiedOnce) {
    auto sev_r = rule("R-3", 4, "表述不规范", issue::Severity::Low);
    auto sev_a = ai("A-3", 4, "表述不规范", issue::Severity::Medium);
    std::vector<issue::RuleFinding> rules{rule("R-1", 11), rule("R-2", 1, "封面缺少年度"), sev_r};
    std::vector<issue::AIFinding> ais{ai("A-1", 11), sev_a, ai("A-4", 7, "缺少单位说明")};

    auto result = merge(rules, ais);

    size_t rule_seen = result.rule_only.size() + result.agreements.size() + result.conflicts.size();
    size_t ai_seen = result.ai_only.size() + result.agreements.size() + result.conflicts.size();
    EXPECT_EQ(rule_seen, rules.size());
    EXPECT_EQ(ai_seen, ais.size());
    EXPECT_EQ(result.totals.rule, 3u);
    EXPECT_EQ(result.totals.ai, 3u);
    EXPECT_EQ(result.totals.merged, 4u);
}

// ==============================================================================
// Дубликаты
// ==============================================================================

TEST(MergeTest, DuplicateKeyOnOneSide_Inconsistency) {
    auto result = merge({rule("R-1", 11), rule("R-2", 11)}, {ai("A-1", 11)});

    ASSERT_EQ(result.inconsistencies.size(), 1u);
    const auto& inc = result.inconsistencies[0];
    EXPECT_EQ(inc.reason, "duplicate key");
    EXPECT_EQ(inc.source, issue::Source::Rule);
    EXPECT_EQ(inc.issue_ids, (std::vector<std::string>{"R-1", "R-2"}));
    EXPECT_TRUE(result.agreements.empty());
    EXPECT_EQ(result.rule_only.size(), 2u);
    EXPECT_EQ(result.ai_only.size(), 1u);
}

TEST(MergeTest, DuplicateId_Inconsistency) {
    auto result = merge({}, {ai("A-1", 11), ai("A-1", 3, "缺少单位说明")});

    ASSERT_EQ(result.inconsistencies.size(), 1u);
    EXPECT_EQ(result.inconsistencies[0].reason, "duplicate id");
    EXPECT_EQ(result.inconsistencies[0].source, issue::Source::AI);
    EXPECT_EQ(result.ai_only.size(), 2u);
}

// ==============================================================================
// Порядок и детерминизм
// ==============================================================================

TEST(MergeTest, Ranking_SeverityThenPageThenId) {
    auto result = merge({rule("R-2", 5, "甲", issue::Severity::Medium), rule("R-1", 0, "乙", issue::Severity::High),
                         rule("R-3", 2, "丙", issue::Severity::High)},
                        {ai("A-1", 2, "丁", issue::Severity::High)});

    std::vector<std::string> ids;
    for (const auto& f : result.merged) {
        ids.push_back(issue::finding_issue(f).id);
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"A-1", "R-3", "R-1", "R-2"}));
}

TEST(MergeTest, InputOrderDoesNotChangeResult) {
    std::vector<issue::RuleFinding> rules{rule("R-1", 11), rule("R-2", 1, "封面缺少年度"),
                                          rule("R-3", 4, "表述不规范", issue::Severity::Low)};
    std::vector<issue::AIFinding> ais{ai("A-1", 11), ai("A-3", 4, "表述不规范", issue::Severity::Medium)};
    auto rules_rev = rules;
    std::reverse(rules_rev.begin(), rules_rev.end());
    auto ais_rev = ais;
    std::reverse(ais_rev.begin(), ais_rev.end());

    EXPECT_EQ(result_to_string(merge(rules, ais)), result_to_string(merge(rules_rev, ais_rev)));
    EXPECT_EQ(result_to_string(merge(rules, ais)), result_to_string(merge(rules, ais)));
}

TEST(MergeTest, MergeOfMergedInputs_Idempotent) {
    auto amounts = rule("R-1", 11);
    with_amounts(amounts.issue, 200, 260);
    auto amounts_ai = ai("A-1", 11, MISMATCH, issue::Severity::Low);
    with_amounts(amounts_ai.issue, 200, 260);
    std::vector<issue::RuleFinding> rules{amounts, rule("R-2", 1, "封面缺少年度"), rule("R-3", 4, "表述不规范"),
                                          rule("R-4", 4, "表述不规范")};
    std::vector<issue::AIFinding> ais{amounts_ai, ai("A-2", 0, "封面缺少年度"),
                                      ai("A-3", 7, "说明缺失", issue::Severity::Medium)};

    auto once = merge(rules, ais);
    auto twice = merge(once.rule_findings, once.ai_findings);

    EXPECT_EQ(result_to_string(twice), result_to_string(once));
    EXPECT_EQ(twice.totals.merged, once.totals.merged);
    EXPECT_FALSE(once.conflicts.empty());
}

TEST(MergeTest, Concatenate_NoMatching) {
    auto result = concatenate({rule("R-1", 11)}, {ai("A-1", 11)});

    EXPECT_TRUE(result.agreements.empty());
    EXPECT_EQ(result.rule_only, (std::vector<std::string>{"R-1"}));
    EXPECT_EQ(result.ai_only, (std::vector<std::string>{"A-1"}));
    EXPECT_EQ(result.totals.merged, 2u);
}

TEST(MergeTest, ResultToJson) {
    auto r = rule("R-1", 11, MISMATCH, issue::Severity::High);
    with_amounts(r.issue, 200, 260);
    auto a = ai("A-1", 11, MISMATCH, issue::Severity::Low);
    with_amounts(a.issue, 200, 260);
    rapidjson::Document doc;

    result_to_json(merge({r}, {a}), doc, doc.GetAllocator());

    ASSERT_EQ(doc["conflicts"].Size(), 1u);
    EXPECT_STREQ(doc["conflicts"][0u]["reason"].GetString(), "severityMismatch");
    EXPECT_STREQ(doc["conflicts"][0u]["resolution"].GetString(), "preferRule");
    EXPECT_STREQ(doc["conflicts"][0u]["finalSeverity"].GetString(), "high");
    EXPECT_STREQ(doc["conflicts"][0u]["ruleIssueId"].GetString(), "R-1");
    EXPECT_EQ(doc["totals"]["conflicts"].GetUint64(), 1u);
    EXPECT_EQ(doc["aiFindings"].Size(), 1u);
    EXPECT_EQ(doc["ruleFindings"].Size(), 1u);
    EXPECT_TRUE(doc["inconsistencies"].Empty());
}

}  // namespace budgetaudit::merge::test
