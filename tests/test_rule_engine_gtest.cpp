// ==============================================================================
// test_rule_engine_gtest.cpp - Тесты движка правил (GoogleTest)
// ==============================================================================

#include "budgetaudit/cancel.hpp"
#include "budgetaudit/engine.hpp"
#include "budgetaudit/relation.hpp"
#include "budgetaudit/text.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <set>
#include <string>

#ifndef CMAKE_SOURCE_DIR
#define CMAKE_SOURCE_DIR "."
#endif

namespace budgetaudit::engine::test {

namespace {

document::Document make_doc(std::initializer_list<std::string> texts) {
    document::Document doc;
    int n = 0;
    for (const auto& t : texts) {
        doc.pages.push_back(document::PageText{++n, t});
    }
    return doc;
}

/// Набор с одним правилом и таблицами по умолчанию
rule::RuleSet single_rule(rule::Rule r) {
    rule::RuleSet rs;
    rs.version = "test";
    rs.tables = table::default_table_specs();
    rs.rules.push_back(std::move(r));
    return rs;
}

rule::Rule balance_rule() {
    rule::Rule r;
    r.id = "N-1";
    r.name = "总表收支平衡";
    r.category = "numeric";
    r.severity = issue::Severity::High;
    rule::NumericConsistency c;
    c.table = "收入支出决算总表";
    c.left.label = "收入总计";
    c.right.push_back(rule::Operand{"支出总计", std::nullopt, 0});
    r.condition = c;
    r.tolerance = rule::Tolerance{0.005, 1.0, std::nullopt};
    return r;
}

const RuleOutcome* outcome_of(const Evaluation& ev, const std::string& id) {
    for (const auto& o : ev.outcomes) {
        if (o.rule_id == id) {
            return &o;
        }
    }
    return nullptr;
}

}  // namespace

// ==============================================================================
// Операнды
// ==============================================================================

TEST(OperandTest, RowValue_LabelAndNumericColumn) {
    document::ExtractedTable t;
    t.rows = {{"项目", "合计", "基本支出"}, {"合计", "1,200.00", "800.00"}, {"", "", ""}};

    EXPECT_DOUBLE_EQ(row_value(t, "合计", 0).value(), 1200.0);
    EXPECT_DOUBLE_EQ(row_value(t, "合计", 1).value(), 800.0);
    EXPECT_FALSE(row_value(t, "合计", 2).has_value());
    EXPECT_FALSE(row_value(t, "总计", 0).has_value());
    EXPECT_FALSE(row_value(t, "", 0).has_value());
}

TEST(OperandTest, RowValue_LeadingNumberCellSkipped) {
    document::ExtractedTable t;
    t.rows = {{"201", "一般公共服务支出", "300.00"}};

    EXPECT_DOUBLE_EQ(row_value(t, "一般公共服务支出", 0).value(), 300.0);
}

TEST(OperandTest, ProximityValue_WithinWindow) {
    std::string text = "收入总计 1,200.00 支出总计 1,100.00";

    EXPECT_DOUBLE_EQ(proximity_value(text, "支出总计", 0, 40).value(), 1100.0);
    EXPECT_DOUBLE_EQ(proximity_value(text, "收入总计", 1, 40).value(), 1100.0);
    EXPECT_FALSE(proximity_value(text, "收入总计", 0, 1).has_value());
    EXPECT_FALSE(proximity_value(text, "结余", 0, 40).has_value());
}

TEST(OperandTest, StateToString) {
    EXPECT_EQ(to_string(State::Pass), "pass");
    EXPECT_EQ(to_string(State::Violation), "violation");
    EXPECT_EQ(to_string(State::Skipped), "skipped");
}

// ==============================================================================
// Образцовый документ
// ==============================================================================

TEST(RuleEngineTest, Fixture_TextNumberFindings) {
    auto doc = document::load(std::filesystem::path(CMAKE_SOURCE_DIR) / "tests" / "fixtures" /
                              "documents" / "final_account_2024.json");
    ASSERT_TRUE(doc) << doc.error.format();
    auto rules = rule::load_rule_set(std::filesystem::path(CMAKE_SOURCE_DIR) / "rules" / "budget_v3_3.yml");
    ASSERT_TRUE(rules) << rules.error.format();
    RuleEngine engine;

    auto ev = engine.evaluate(*doc.document, *rules.rule_set);

    ASSERT_EQ(ev.outcomes.size(), 5u);
    EXPECT_EQ(outcome_of(ev, "V33-001")->state, State::Pass);
    EXPECT_EQ(outcome_of(ev, "V33-002")->state, State::Pass);
    EXPECT_EQ(outcome_of(ev, "V33-101")->state, State::Pass);
    EXPECT_EQ(outcome_of(ev, "V33-102")->state, State::Pass);
    EXPECT_EQ(outcome_of(ev, "V33-110")->state, State::Violation);
    EXPECT_EQ(outcome_of(ev, "V33-110")->findings, 2u);
    EXPECT_TRUE(ev.skipped.empty());

    ASSERT_EQ(ev.findings.size(), 2u);
    const auto& mismatch = ev.findings[0].issue;
    EXPECT_EQ(mismatch.id, "R-V33-110-1");
    EXPECT_EQ(mismatch.source, issue::Source::Rule);
    EXPECT_EQ(mismatch.title, relation::TITLE_MISMATCH);
    EXPECT_EQ(mismatch.severity, issue::Severity::High);
    EXPECT_EQ(mismatch.location.page, 11);
    EXPECT_EQ(mismatch.location.section.value(), "（三）一般公共预算财政拨款支出决算情况说明");
    EXPECT_DOUBLE_EQ(mismatch.metrics.at("budget"), 200.0);
    EXPECT_DOUBLE_EQ(mismatch.metrics.at("final"), 260.0);

    const auto& missing = ev.findings[1].issue;
    EXPECT_EQ(missing.id, "R-V33-110-2");
    EXPECT_EQ(missing.title, relation::TITLE_MISSING_REASON);
    EXPECT_EQ(missing.severity, issue::Severity::Medium);
    EXPECT_EQ(missing.location.page, 11);
}

TEST(RuleEngineTest, Fixture_EvidenceSpanInPageText) {
    auto doc = document::load(std::filesystem::path(CMAKE_SOURCE_DIR) / "tests" / "fixtures" /
                              "documents" / "final_account_2024.json");
    ASSERT_TRUE(doc) << doc.error.format();
    RuleEngine engine;

    auto ev = engine.evaluate(*doc.document, *rule::default_rule_set());

    ASSERT_FALSE(ev.findings.empty());
    const auto& is = ev.findings[0].issue;
    ASSERT_EQ(is.evidence.size(), 1u);
    ASSERT_TRUE(is.evidence[0].span.has_value());
    std::wstring page = text::widen(doc.document->page(11)->text);
    auto [start, end] = *is.evidence[0].span;
    EXPECT_EQ(page.substr(start, end - start), L"决算数等于预算数");
}

// ==============================================================================
// table_presence / cover_metadata
// ==============================================================================

TEST(RuleEngineTest, MissingTables_OneFindingPerTable) {
    auto doc = make_doc({"收入支出决算总表\n单位：万元\n收入总计 100"});
    RuleEngine engine;

    auto ev = engine.evaluate(doc, *rule::default_rule_set());

    // обложка без года + 6 отсутствующих обязательных таблиц
    ASSERT_EQ(ev.findings.size(), 7u);
    EXPECT_EQ(ev.findings[0].issue.id, "R-V33-001-1");
    EXPECT_EQ(ev.findings[0].issue.title, "封面缺少年度");
    EXPECT_EQ(ev.findings[0].issue.location.section.value(), "封面");
    EXPECT_EQ(ev.findings[0].issue.location.page, 1);

    const auto& first_missing = ev.findings[1].issue;
    EXPECT_EQ(first_missing.id, "R-V33-002-1");
    EXPECT_EQ(first_missing.title, "缺少必需表格：收入决算表");
    EXPECT_EQ(first_missing.message, "未找到必需表格：收入决算表");
    EXPECT_EQ(first_missing.location.table.value(), "收入决算表");
    EXPECT_EQ(first_missing.tags.count("table-presence"), 1u);
    EXPECT_EQ(ev.findings[6].issue.id, "R-V33-002-6");

    // раздела нет - правило пропущено
    const auto* cross = outcome_of(ev, "V33-110");
    ASSERT_NE(cross, nullptr);
    EXPECT_EQ(cross->state, State::Skipped);
    EXPECT_EQ(cross->reason, "section not found");
    ASSERT_EQ(ev.skipped.size(), 1u);
    EXPECT_EQ(ev.skipped[0].rule_id, "V33-110");
}

TEST(RuleEngineTest, LowConfidenceMatch_ReducedSeverity) {
    rule::Rule r;
    r.id = "P-1";
    r.severity = issue::Severity::High;
    r.condition = rule::TablePresence{{"收入支出决算总表"}, 0.7};
    auto rs = single_rule(r);
    auto doc = make_doc({"收支决算总表\n单位：万元"});
    RuleEngine engine;

    auto ev = engine.evaluate(doc, rs);

    ASSERT_EQ(ev.findings.size(), 1u);
    const auto& is = ev.findings[0].issue;
    EXPECT_EQ(is.title, "表格识别置信度低：收入支出决算总表");
    EXPECT_EQ(is.severity, issue::Severity::Medium);
    EXPECT_EQ(is.tags.count("low-confidence-match"), 1u);
    EXPECT_NEAR(is.confidence, 2.0 / 3.0, 1e-9);
    EXPECT_EQ(is.location.page, 1);
}

TEST(RuleEngineTest, AliasAboveThreshold_Pass) {
    rule::Rule r;
    r.id = "P-1";
    r.condition = rule::TablePresence{{"收入支出决算总表"}, 0.6};
    auto rs = single_rule(r);
    auto doc = make_doc({"收支决算总表\n单位：万元"});
    RuleEngine engine;

    auto ev = engine.evaluate(doc, rs);

    EXPECT_TRUE(ev.findings.empty());
    EXPECT_EQ(ev.outcomes[0].state, State::Pass);
}

TEST(RuleEngineTest, Cover_YearAdjacentToDigits_NotAYear) {
    rule::Rule r;
    r.id = "C-1";
    r.severity = issue::Severity::Medium;
    r.condition = rule::CoverMetadata{};
    auto rs = single_rule(r);
    RuleEngine engine;

    auto bad = engine.evaluate(make_doc({"编号120245\n单位:元"}), rs);
    auto good = engine.evaluate(make_doc({"2024年度部门决算", "单位：万元"}), rs);

    ASSERT_EQ(bad.findings.size(), 1u);
    EXPECT_EQ(bad.findings[0].issue.title, "封面缺少年度");
    EXPECT_TRUE(good.findings.empty());
}

TEST(RuleEngineTest, Cover_MissingUnit) {
    rule::Rule r;
    r.id = "C-1";
    r.condition = rule::CoverMetadata{};
    auto rs = single_rule(r);
    RuleEngine engine;

    auto ev = engine.evaluate(make_doc({"2024年度部门决算"}), rs);

    ASSERT_EQ(ev.findings.size(), 1u);
    EXPECT_EQ(ev.findings[0].issue.title, "封面缺少金额单位");
    EXPECT_EQ(ev.findings[0].issue.tags.count("cover"), 1u);
}

// ==============================================================================
// numeric_consistency
// ==============================================================================

TEST(RuleEngineTest, Numeric_ExtractedTableViolation) {
    auto r = balance_rule();
    r.message_template = "收入总计{left_value}与支出总计{right_value}不一致，差额{diff}";
    auto rs = single_rule(r);
    auto doc = make_doc({"收入支出决算总表\n单位：万元"});
    doc.tables.push_back(document::ExtractedTable{
        1, std::string("收入支出决算总表"), {{"收入总计", "1,200"}, {"支出总计", "1,100"}}});
    RuleEngine engine;

    auto ev = engine.evaluate(doc, rs);

    ASSERT_EQ(ev.findings.size(), 1u);
    const auto& is = ev.findings[0].issue;
    EXPECT_EQ(is.id, "R-N-1-1");
    EXPECT_EQ(is.message, "收入总计1200与支出总计1100不一致，差额100");
    EXPECT_EQ(is.severity, issue::Severity::High);
    EXPECT_EQ(is.title, "总表收支平衡");
    EXPECT_EQ(is.location.page, 1);
    EXPECT_EQ(is.location.table.value(), "收入支出决算总表");
    EXPECT_EQ(is.tags, (std::set<std::string>{"numeric"}));
    EXPECT_DOUBLE_EQ(is.metrics.at("left"), 1200.0);
    EXPECT_DOUBLE_EQ(is.metrics.at("right"), 1100.0);
    EXPECT_DOUBLE_EQ(is.metrics.at("diff"), 100.0);
    EXPECT_NEAR(is.metrics.at("tolerance"), 6.0, 1e-9);
}

TEST(RuleEngineTest, Numeric_ParityBand_MediumSeverity) {
    auto r = balance_rule();
    r.tolerance->parity_band = 0.01;
    auto rs = single_rule(r);
    auto doc = make_doc({"收入支出决算总表\n单位：万元\n收入总计 1,000.00\n支出总计 1,008.00"});
    RuleEngine engine;

    auto ev = engine.evaluate(doc, rs);

    ASSERT_EQ(ev.findings.size(), 1u);
    const auto& is = ev.findings[0].issue;
    EXPECT_EQ(is.severity, issue::Severity::Medium);
    EXPECT_EQ(is.title, "总表收支平衡（基本持平）");
    EXPECT_EQ(is.tags.count("basic-parity"), 1u);
    // без шаблона - сообщение по умолчанию
    EXPECT_EQ(is.message, "收入总计=1000，支出总计=1008，差额-8。");
}

TEST(RuleEngineTest, Numeric_BudgetHundredFinalHundredPointThree_ParityNotError) {
    auto r = balance_rule();
    r.tolerance = rule::Tolerance{0.0, 0.05, 0.01};
    auto rs = single_rule(r);
    auto doc = make_doc({"收入支出决算总表\n单位：万元\n收入总计 100.00\n支出总计 100.30"});
    RuleEngine engine;

    auto ev = engine.evaluate(doc, rs);

    ASSERT_EQ(ev.findings.size(), 1u);
    const auto& is = ev.findings[0].issue;
    EXPECT_EQ(is.severity, issue::Severity::Medium);
    EXPECT_NE(is.severity, issue::Severity::High);
    EXPECT_NE(is.title.find("基本持平"), std::string::npos);
    EXPECT_EQ(is.tags.count("basic-parity"), 1u);
    EXPECT_NEAR(is.metrics.at("diff"), -0.3, 1e-9);
}

TEST(RuleEngineTest, Numeric_OutsideParityBand_RuleSeverity) {
    auto r = balance_rule();
    r.tolerance = rule::Tolerance{0.0, 0.05, 0.01};
    auto rs = single_rule(r);
    auto doc = make_doc({"收入支出决算总表\n单位：万元\n收入总计 100.00\n支出总计 102.00"});
    RuleEngine engine;

    auto ev = engine.evaluate(doc, rs);

    ASSERT_EQ(ev.findings.size(), 1u);
    EXPECT_EQ(ev.findings[0].issue.severity, issue::Severity::High);
    EXPECT_EQ(ev.findings[0].issue.tags.count("basic-parity"), 0u);
}

TEST(RuleEngineTest, Numeric_PageTextWithinTolerance_Pass) {
    auto rs = single_rule(balance_rule());
    auto doc = make_doc({"收入支出决算总表\n单位：万元\n收入总计 500.00\n支出总计 500.50"});
    RuleEngine engine;

    auto ev = engine.evaluate(doc, rs);

    EXPECT_TRUE(ev.findings.empty());
    EXPECT_EQ(ev.outcomes[0].state, State::Pass);
}

TEST(RuleEngineTest, Numeric_MissingOperand_Skipped) {
    auto rs = single_rule(balance_rule());
    auto doc = make_doc({"收入支出决算总表\n单位：万元\n收入总计 500.00"});
    RuleEngine engine;

    auto ev = engine.evaluate(doc, rs);

    ASSERT_EQ(ev.outcomes.size(), 1u);
    EXPECT_EQ(ev.outcomes[0].state, State::Skipped);
    EXPECT_EQ(ev.outcomes[0].reason, "operand '支出总计' not found");
}

TEST(RuleEngineTest, Numeric_TableNotLocated_Skipped) {
    auto rs = single_rule(balance_rule());
    auto doc = make_doc({"正文"});
    RuleEngine engine;

    auto ev = engine.evaluate(doc, rs);

    EXPECT_EQ(ev.outcomes[0].state, State::Skipped);
    EXPECT_EQ(ev.outcomes[0].reason, "table '收入支出决算总表' not found");
}

TEST(RuleEngineTest, Numeric_UnknownTable_Skipped) {
    auto r = balance_rule();
    std::get<rule::NumericConsistency>(r.condition).table = "资产负债表";
    auto rs = single_rule(r);
    RuleEngine engine;

    auto ev = engine.evaluate(make_doc({"正文"}), rs);

    EXPECT_EQ(ev.outcomes[0].state, State::Skipped);
    EXPECT_EQ(ev.outcomes[0].reason, "unknown table '资产负债表'");
}

// ==============================================================================
// Ошибки, отключение, отмена
// ==============================================================================

TEST(RuleEngineTest, InvalidSectionPattern_ErrorOtherRulesContinue) {
    rule::Rule broken;
    broken.id = "T-1";
    broken.condition = rule::TextNumberCrossCheck{"(（三）", "^（四）", 320, issue::Severity::Medium};
    rule::Rule cover;
    cover.id = "C-1";
    cover.condition = rule::CoverMetadata{};
    auto rs = single_rule(broken);
    rs.rules.push_back(cover);
    RuleEngine engine;

    auto ev = engine.evaluate(make_doc({"2024年度\n单位：万元"}), rs);

    ASSERT_EQ(ev.outcomes.size(), 2u);
    EXPECT_EQ(ev.outcomes[0].state, State::Error);
    EXPECT_EQ(ev.outcomes[0].reason.rfind("invalid pattern: ", 0), 0u);
    EXPECT_EQ(ev.outcomes[1].state, State::Pass);
}

TEST(RuleEngineTest, DisabledRule_NotEvaluated) {
    rule::Rule cover;
    cover.id = "C-1";
    cover.condition = rule::CoverMetadata{};
    cover.enabled = false;
    auto rs = single_rule(cover);
    RuleEngine engine;

    auto ev = engine.evaluate(make_doc({"正文"}), rs);

    EXPECT_TRUE(ev.outcomes.empty());
    EXPECT_TRUE(ev.findings.empty());
}

TEST(RuleEngineTest, CancelledBeforeStart_NoOutcomes) {
    cancel::CancelToken token;
    token.cancel();
    RuleEngine engine;

    auto ev = engine.evaluate(make_doc({"正文"}), *rule::default_rule_set(), &token);

    EXPECT_TRUE(ev.cancelled);
    EXPECT_TRUE(ev.outcomes.empty());
}

}  // namespace budgetaudit::engine::test
