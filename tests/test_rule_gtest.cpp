// ==============================================================================
// test_rule_gtest.cpp - Тесты набора правил (GoogleTest)
// ==============================================================================
//
// Загрузка YAML, профили, ошибки схемы, lint и RuleSetRegistry.
//
// ==============================================================================

#include "budgetaudit/rule.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#ifndef CMAKE_SOURCE_DIR
#define CMAKE_SOURCE_DIR "."
#endif

namespace budgetaudit::rule::test {

namespace {

std::filesystem::path rules_file() {
    return std::filesystem::path(CMAKE_SOURCE_DIR) / "rules" / "budget_v3_3.yml";
}

std::filesystem::path fixture(const std::string& name) {
    return std::filesystem::path(CMAKE_SOURCE_DIR) / "tests" / "fixtures" / "rules" / name;
}

const Rule& rule_by_id(const RuleSet& rs, const std::string& id) {
    for (const auto& r : rs.rules) {
        if (r.id == id) {
            return r;
        }
    }
    throw std::out_of_range("no rule " + id);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

}  // namespace

// ==============================================================================
// ConditionKind
// ==============================================================================

TEST(RuleTest, ParseConditionKind_Variants) {
    EXPECT_EQ(parse_condition_kind("table_presence"), ConditionKind::TablePresence);
    EXPECT_EQ(parse_condition_kind("numeric-consistency"), ConditionKind::NumericConsistency);
    EXPECT_EQ(parse_condition_kind("text_number_crosscheck"), ConditionKind::TextNumber);
    EXPECT_EQ(parse_condition_kind("cover_metadata"), ConditionKind::CoverMetadata);
    EXPECT_THROW(parse_condition_kind("regex"), std::invalid_argument);
}

TEST(RuleTest, ConditionKind_FromVariant) {
    Condition c = TextNumberCrossCheck{};
    EXPECT_EQ(condition_kind(c), ConditionKind::TextNumber);
    EXPECT_EQ(to_string(condition_kind(c)), "text_number");
}

// ==============================================================================
// Загрузка файла правил
// ==============================================================================

TEST(RuleLoadTest, BudgetRules_DefaultProfile) {
    auto r = load_rule_set(rules_file());

    ASSERT_TRUE(r) << r.error.format();
    const auto& rs = *r.rule_set;
    EXPECT_EQ(rs.version, "3.3.0");
    EXPECT_EQ(rs.schema_version, 1);
    EXPECT_EQ(rs.profile, "default");
    EXPECT_EQ(rs.tables.size(), 9u);
    ASSERT_EQ(rs.rules.size(), 5u);
    for (const auto& rule : rs.rules) {
        EXPECT_TRUE(rule.enabled) << rule.id;
    }
    EXPECT_FALSE(rs.tables[7].required);
    EXPECT_EQ(rs.tables[7].severity, issue::Severity::Medium);
}

TEST(RuleLoadTest, BudgetRules_NumericConsistency) {
    auto r = load_rule_set(rules_file());
    ASSERT_TRUE(r) << r.error.format();

    const auto& balance = rule_by_id(*r.rule_set, "V33-101");
    const auto* nc = std::get_if<NumericConsistency>(&balance.condition);
    ASSERT_NE(nc, nullptr);
    EXPECT_EQ(nc->table, "收入支出决算总表");
    EXPECT_EQ(nc->left.label, "收入总计");
    ASSERT_EQ(nc->right.size(), 1u);
    EXPECT_EQ(nc->right[0].label, "支出总计");
    ASSERT_TRUE(balance.tolerance.has_value());
    EXPECT_DOUBLE_EQ(balance.tolerance->rel, 0.005);
    EXPECT_DOUBLE_EQ(balance.tolerance->abs, 1.0);
    EXPECT_FALSE(balance.tolerance->parity_band.has_value());
    EXPECT_EQ(balance.severity, issue::Severity::High);

    const auto& sum = rule_by_id(*r.rule_set, "V33-102");
    const auto* nc2 = std::get_if<NumericConsistency>(&sum.condition);
    ASSERT_NE(nc2, nullptr);
    EXPECT_EQ(nc2->left.column, 0u);
    ASSERT_EQ(nc2->right.size(), 2u);
    EXPECT_EQ(nc2->right[0].column, 1u);
    EXPECT_EQ(nc2->right[1].column, 2u);
    ASSERT_TRUE(sum.tolerance->parity_band.has_value());
    EXPECT_DOUBLE_EQ(*sum.tolerance->parity_band, 0.0);
}

TEST(RuleLoadTest, BudgetRules_TextNumberAndPresence) {
    auto r = load_rule_set(rules_file());
    ASSERT_TRUE(r) << r.error.format();

    const auto& cross = rule_by_id(*r.rule_set, "V33-110");
    const auto* tn = std::get_if<TextNumberCrossCheck>(&cross.condition);
    ASSERT_NE(tn, nullptr);
    EXPECT_EQ(tn->reason_window, 320u);
    EXPECT_EQ(tn->missing_reason_severity, issue::Severity::Medium);
    EXPECT_TRUE(cross.message_template.empty());
    EXPECT_EQ(cross.name, "预决算对比表述与数值一致");

    const auto& presence = rule_by_id(*r.rule_set, "V33-002");
    const auto* tp = std::get_if<TablePresence>(&presence.condition);
    ASSERT_NE(tp, nullptr);
    EXPECT_TRUE(tp->tables.empty());
    EXPECT_DOUBLE_EQ(tp->low_confidence_threshold, 0.6);
    EXPECT_EQ(presence.message_template, "未找到必需表格：{table}");
}

TEST(RuleLoadTest, StrictProfile_OverridesMergedByKey) {
    auto r = load_rule_set(rules_file(), "strict");

    ASSERT_TRUE(r) << r.error.format();
    for (const auto& rule : r.rule_set->rules) {
        EXPECT_EQ(rule.severity, issue::Severity::High) << rule.id;
    }
    const auto* tn = std::get_if<TextNumberCrossCheck>(&rule_by_id(*r.rule_set, "V33-110").condition);
    ASSERT_NE(tn, nullptr);
    EXPECT_EQ(tn->missing_reason_severity, issue::Severity::High);
    // остальные параметры сохранены
    EXPECT_EQ(tn->reason_window, 320u);
}

TEST(RuleLoadTest, MinimalProfile_OnlyListedRulesEnabled) {
    auto r = load_rule_set(rules_file(), "minimal");

    ASSERT_TRUE(r) << r.error.format();
    EXPECT_EQ(r.rule_set->rules.size(), 5u);
    EXPECT_FALSE(rule_by_id(*r.rule_set, "V33-001").enabled);
    EXPECT_TRUE(rule_by_id(*r.rule_set, "V33-002").enabled);
    EXPECT_FALSE(rule_by_id(*r.rule_set, "V33-101").enabled);
    EXPECT_TRUE(rule_by_id(*r.rule_set, "V33-110").enabled);
}

TEST(RuleLoadTest, UnknownProfile_Error) {
    auto r = load_rule_set(rules_file(), "nope");

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.message, "unknown profile 'nope'");
}

TEST(RuleLoadTest, WrongExtension_Error) {
    auto r = load_rule_set("rules.json");

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.message, "rule set must have a yaml file extension");
    EXPECT_EQ(r.error.format(), "rule error [rules.json]: rule set must have a yaml file extension");
}

TEST(RuleLoadTest, MissingFile_Error) {
    auto r = load_rule_set(fixture("missing.yml"));

    EXPECT_FALSE(r);
    EXPECT_FALSE(r.error.message.empty());
}

TEST(RuleLoadTest, Fixture_NoVersion) {
    auto r = load_rule_set(fixture("no_version.yml"));

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.message, "rule set must have a version");
}

TEST(RuleLoadTest, Fixture_BadSectionPattern) {
    auto r = load_rule_set(fixture("bad_pattern.yml"));

    EXPECT_FALSE(r);
    EXPECT_TRUE(starts_with(r.error.message, "rule 'T-1': invalid section pattern: ")) << r.error.message;
}

TEST(RuleLoadTest, Fixture_DuplicateId) {
    auto r = load_rule_set(fixture("duplicate_id.yml"));

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.message, "duplicate rule id 'D-1'");
}

TEST(RuleLoadTest, Fixture_UnknownTable) {
    auto r = load_rule_set(fixture("unknown_table.yml"));

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.message, "rule 'U-1': unknown table '资产负债表'");
}

// ==============================================================================
// Разбор из строки
// ==============================================================================

TEST(RuleParseTest, NoTablesSection_DefaultSpecs) {
    auto r = parse_rule_set(R"yaml(
version: "2"
rules:
  - id: P-1
    type: table_presence
)yaml");

    ASSERT_TRUE(r) << r.error.format();
    EXPECT_EQ(r.rule_set->tables.size(), 9u);
    EXPECT_EQ(r.rule_set->rules[0].name, "P-1");
    EXPECT_EQ(r.rule_set->rules[0].severity, issue::Severity::Medium);
}

TEST(RuleParseTest, NoProfilesSection_OnlyDefaultAccepted) {
    const char* yaml = "version: '2'\nrules: []\n";

    EXPECT_TRUE(parse_rule_set(yaml, "default"));
    auto r = parse_rule_set(yaml, "strict");
    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.message, "unknown profile 'strict'");
}

TEST(RuleParseTest, EnabledRulesWildcard_AllEnabled) {
    auto r = parse_rule_set(R"yaml(
version: "2"
rules:
  - {id: A, type: cover_metadata}
  - {id: B, type: table_presence}
profiles:
  all:
    enabled_rules: ["*"]
    disabled_rules: [B]
)yaml",
                            "all");

    ASSERT_TRUE(r) << r.error.format();
    EXPECT_TRUE(r.rule_set->rules[0].enabled);
    EXPECT_FALSE(r.rule_set->rules[1].enabled);
}

TEST(RuleParseTest, ToleranceOverride_MergedByKey) {
    auto r = parse_rule_set(R"yaml(
version: "2"
rules:
  - id: N
    type: numeric_consistency
    left: 收入总计
    right: 支出总计
    tolerance: {rel: 0.01, abs: 2}
profiles:
  loose:
    rule_overrides:
      N: {tolerance: {abs: 10}, severity: low}
)yaml",
                            "loose");

    ASSERT_TRUE(r) << r.error.format();
    const auto& rule = r.rule_set->rules[0];
    ASSERT_TRUE(rule.tolerance.has_value());
    EXPECT_DOUBLE_EQ(rule.tolerance->rel, 0.01);
    EXPECT_DOUBLE_EQ(rule.tolerance->abs, 10.0);
    EXPECT_EQ(rule.severity, issue::Severity::Low);
}

TEST(RuleParseTest, OperandWithTableAndColumn) {
    auto r = parse_rule_set(R"yaml(
version: "2"
rules:
  - id: N
    type: numeric_consistency
    table: 支出决算表
    left: {row: 合计, col: 0}
    right: {label: 合计, table: 收入决算表, column: 1}
)yaml");

    ASSERT_TRUE(r) << r.error.format();
    const auto* nc = std::get_if<NumericConsistency>(&r.rule_set->rules[0].condition);
    ASSERT_NE(nc, nullptr);
    ASSERT_EQ(nc->right.size(), 1u);
    ASSERT_TRUE(nc->right[0].table.has_value());
    EXPECT_EQ(*nc->right[0].table, "收入决算表");
    EXPECT_EQ(nc->right[0].column, 1u);
}

TEST(RuleParseTest, UnknownType_ListsValidTypes) {
    auto r = parse_rule_set("version: '2'\nrules:\n  - {id: X, type: regex}\n");

    EXPECT_FALSE(r);
    EXPECT_TRUE(starts_with(r.error.message, "rule 'X': unknown rule type, must be: table_presence"))
        << r.error.message;
}

TEST(RuleParseTest, NegativeTolerance_Error) {
    auto r = parse_rule_set(R"yaml(
version: "2"
rules:
  - {id: X, type: numeric_consistency, left: a, right: b, tolerance: {abs: -1}}
)yaml");

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.message, "rule 'X': tolerance must not be negative");
}

TEST(RuleParseTest, NumericWithoutRight_Error) {
    auto r = parse_rule_set("version: '2'\nrules:\n  - {id: X, type: numeric_consistency, left: a}\n");

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.message, "rule 'X': numeric_consistency requires 'left' and 'right'");
}

TEST(RuleParseTest, RuleWithoutId_Error) {
    auto r = parse_rule_set("version: '2'\nrules:\n  - {type: cover_metadata}\n");

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.message, "rule must have an id");
}

TEST(RuleParseTest, InvalidYaml_Error) {
    auto r = parse_rule_set("version: [unclosed", "default", "inline.yml");

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.path, "inline.yml");
}

TEST(RuleParseTest, NotAMapping_Error) {
    auto r = parse_rule_set("- a\n- b\n");

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.message, "rule set must be a YAML mapping");
}

// ==============================================================================
// RuleSet
// ==============================================================================

TEST(RuleSetTest, FindTable_CanonicalAliasNormalized) {
    auto rs = default_rule_set();

    EXPECT_EQ(rs->find_table("收入支出决算总表"), 0u);
    EXPECT_EQ(rs->find_table("收支总表"), 0u);
    EXPECT_EQ(rs->find_table("（一）收入决算表"), 1u);
    EXPECT_EQ(rs->find_table("一般公共预算财政拨款三公经费支出决算表"), 6u);
    EXPECT_FALSE(rs->find_table("资产负债表").has_value());
}

TEST(RuleSetTest, DefaultRuleSet_BuiltinRules) {
    auto rs = default_rule_set();

    EXPECT_EQ(rs->version, "builtin");
    ASSERT_EQ(rs->rules.size(), 3u);
    EXPECT_EQ(rs->rules[0].id, "V33-001");
    EXPECT_EQ(condition_kind(rs->rules[0].condition), ConditionKind::CoverMetadata);
    EXPECT_EQ(rs->rules[1].id, "V33-002");
    EXPECT_EQ(rs->rules[1].severity, issue::Severity::High);
    EXPECT_EQ(rs->rules[2].id, "V33-110");
    EXPECT_EQ(condition_kind(rs->rules[2].condition), ConditionKind::TextNumber);
}

// ==============================================================================
// lint
// ==============================================================================

TEST(RuleLintTest, BudgetRules_NoWarnings) {
    auto r = lint(rules_file());

    ASSERT_TRUE(r) << r.error.format();
    EXPECT_EQ(r.tables, 9u);
    EXPECT_EQ(r.rules, 5u);
    EXPECT_EQ(r.profiles, (std::vector<std::string>{"default", "strict", "minimal"}));
    EXPECT_TRUE(r.warnings.empty());
}

TEST(RuleLintTest, Fixture_Warnings) {
    auto r = lint(fixture("lint_warnings.yml"));

    ASSERT_TRUE(r) << r.error.format();
    EXPECT_EQ(r.tables, 1u);
    EXPECT_EQ(r.rules, 2u);
    EXPECT_EQ(r.profiles, (std::vector<std::string>{"default", "all"}));
    EXPECT_EQ(r.warnings, (std::vector<std::string>{
                              "rule 'N-1': no tolerance, exact comparison",
                              "rule 'N-1': no table, operands from full text",
                              "rule 'N-2': disabled in profile 'default'",
                              "table '收入决算表': exact name only",
                          }));
}

TEST(RuleLintTest, InvalidFile_Error) {
    auto r = lint(fixture("duplicate_id.yml"));

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.message, "duplicate rule id 'D-1'");
}

// ==============================================================================
// RuleSetRegistry
// ==============================================================================

TEST(RuleSetRegistryTest, StartsWithBuiltin) {
    RuleSetRegistry registry;

    EXPECT_EQ(registry.current()->version, "builtin");
}

TEST(RuleSetRegistryTest, Reload_PinnedVersionUnaffected) {
    RuleSetRegistry registry;
    auto pinned = registry.current();

    auto r = registry.reload(rules_file());

    ASSERT_TRUE(r) << r.error.format();
    EXPECT_EQ(registry.current()->version, "3.3.0");
    EXPECT_EQ(pinned->version, "builtin");
    EXPECT_EQ(pinned->rules.size(), 3u);
}

TEST(RuleSetRegistryTest, ReloadFailure_KeepsCurrent) {
    RuleSetRegistry registry;
    ASSERT_TRUE(registry.reload(rules_file()));

    auto r = registry.reload(fixture("no_version.yml"));

    EXPECT_FALSE(r);
    EXPECT_EQ(registry.current()->version, "3.3.0");
}

TEST(RuleSetRegistryTest, Install_ReplacesCurrent) {
    RuleSetRegistry registry;
    auto rs = std::make_shared<RuleSet>();
    rs->version = "manual";

    registry.install(rs);

    EXPECT_EQ(registry.current()->version, "manual");
}

}  // namespace budgetaudit::rule::test
