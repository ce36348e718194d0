// ==============================================================================
// rule.cpp - Набор правил: модель и загрузка YAML
// ==============================================================================

#include "budgetaudit/rule.hpp"

#include "budgetaudit/document.hpp"
#include "budgetaudit/platform.hpp"
#include "budgetaudit/text.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace budgetaudit::rule {

// ============================================================================
// Error formatting
// ============================================================================

std::string Error::format() const {
    std::ostringstream oss;
    oss << "rule error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

// ============================================================================
// ConditionKind
// ============================================================================

ConditionKind parse_condition_kind(std::string_view s) {
    if (s == "table_presence" || s == "table-presence")
        return ConditionKind::TablePresence;
    if (s == "numeric_consistency" || s == "numeric-consistency")
        return ConditionKind::NumericConsistency;
    if (s == "text_number" || s == "text-number" || s == "text_number_crosscheck")
        return ConditionKind::TextNumber;
    if (s == "cover_metadata" || s == "cover-metadata")
        return ConditionKind::CoverMetadata;
    throw std::invalid_argument(
        "unknown rule type, must be: table_presence, numeric_consistency, text_number, cover_metadata");
}

std::string to_string(ConditionKind k) {
    switch (k) {
    case ConditionKind::TablePresence:
        return "table_presence";
    case ConditionKind::NumericConsistency:
        return "numeric_consistency";
    case ConditionKind::TextNumber:
        return "text_number";
    case ConditionKind::CoverMetadata:
        return "cover_metadata";
    }
    return "unknown";
}

ConditionKind condition_kind(const Condition& c) {
    struct Visitor {
        ConditionKind operator()(const TablePresence&) const { return ConditionKind::TablePresence; }
        ConditionKind operator()(const NumericConsistency&) const {
            return ConditionKind::NumericConsistency;
        }
        ConditionKind operator()(const TextNumberCrossCheck&) const { return ConditionKind::TextNumber; }
        ConditionKind operator()(const CoverMetadata&) const { return ConditionKind::CoverMetadata; }
    };
    return std::visit(Visitor{}, c);
}

std::optional<size_t> RuleSet::find_table(std::string_view name) const {
    std::wstring wanted = table::normalize_title(name);
    for (size_t i = 0; i < tables.size(); ++i) {
        if (table::normalize_title(tables[i].canonical_name) == wanted) {
            return i;
        }
        for (const auto& alias : tables[i].aliases) {
            if (table::normalize_title(alias) == wanted) {
                return i;
            }
        }
    }
    return std::nullopt;
}

// ============================================================================
// YAML helpers
// ============================================================================

namespace {

constexpr const char* SECTION_START_DEFAULT =
    "^\\s*(（三）|三、)\\s*一般公共预算财政拨款支出决算(?:具体)?情况";
constexpr const char* SECTION_END_DEFAULT =
    "^\\s*(（四）|四、|（六）|六、|一般公共预算财政拨款基本支出决算情况说明)";

bool is_yaml_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext == ".yml" || ext == ".yaml";
}

/// Первое присутствующее поле из списка имён; иначе неопределённый узел
/// (YAML::Node() - это null, as<std::string> вернул бы "null")
YAML::Node field(const YAML::Node& node, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (node[name]) {
            return node[name];
        }
    }
    return YAML::Node(YAML::NodeType::Undefined);
}

std::vector<std::string> string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) {
        return out;
    }
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return out;
    }
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

table::TableSpec parse_table_spec(const YAML::Node& node) {
    table::TableSpec spec;
    spec.canonical_name = field(node, {"name", "canonical_name", "canonicalName"}).as<std::string>("");
    if (spec.canonical_name.empty()) {
        throw std::invalid_argument("table must have a name");
    }
    spec.aliases = string_list(node["aliases"]);
    spec.patterns = string_list(field(node, {"patterns", "regex_patterns"}));
    spec.required = node["required"].as<bool>(true);
    spec.category = node["category"].as<std::string>("");
    spec.severity = issue::parse_severity(node["severity"].as<std::string>(spec.required ? "high" : "medium"));
    if (node["scope"]) {
        spec.scope = node["scope"].as<std::string>();
    }
    return spec;
}

Tolerance parse_tolerance(const YAML::Node& node) {
    Tolerance t;
    t.rel = field(node, {"rel", "rel_tol", "relTol"}).as<double>(0.0);
    t.abs = field(node, {"abs", "abs_tol", "absTol"}).as<double>(0.0);
    if (auto band = field(node, {"parity_band", "parityBand"}); band) {
        t.parity_band = band.as<double>();
    }
    if (t.rel < 0.0 || t.abs < 0.0 || (t.parity_band && *t.parity_band < 0.0)) {
        throw std::invalid_argument("tolerance must not be negative");
    }
    return t;
}

Operand parse_operand(const YAML::Node& node) {
    Operand op;
    if (node.IsScalar()) {
        op.label = node.as<std::string>();
        return op;
    }
    op.label = field(node, {"row", "label"}).as<std::string>("");
    if (auto t = node["table"]; t) {
        op.table = t.as<std::string>();
    }
    op.column = field(node, {"col", "column"}).as<size_t>(0);
    if (op.label.empty()) {
        throw std::invalid_argument("operand must have a row label");
    }
    return op;
}

Condition parse_condition(ConditionKind kind, const YAML::Node& node) {
    const YAML::Node params = node["params"] ? node["params"] : YAML::Node(YAML::NodeType::Map);

    switch (kind) {
    case ConditionKind::TablePresence: {
        TablePresence c;
        c.tables = string_list(node["tables"]);
        c.low_confidence_threshold = params["low_confidence_threshold"].as<double>(0.6);
        return c;
    }
    case ConditionKind::NumericConsistency: {
        NumericConsistency c;
        c.table = node["table"].as<std::string>("");
        if (!node["left"] || !node["right"]) {
            throw std::invalid_argument("numeric_consistency requires 'left' and 'right'");
        }
        c.left = parse_operand(node["left"]);
        if (node["right"].IsSequence()) {
            for (const auto& r : node["right"]) {
                c.right.push_back(parse_operand(r));
            }
        } else {
            c.right.push_back(parse_operand(node["right"]));
        }
        c.proximity_window = params["proximity_window"].as<size_t>(40);
        return c;
    }
    case ConditionKind::TextNumber: {
        TextNumberCrossCheck c;
        c.section_start = node["section_start"].as<std::string>(SECTION_START_DEFAULT);
        c.section_end = node["section_end"].as<std::string>(SECTION_END_DEFAULT);
        c.reason_window = params["reason_window"].as<size_t>(320);
        c.missing_reason_severity =
            issue::parse_severity(params["missing_reason_severity"].as<std::string>("medium"));
        // Проверка шаблонов на этапе загрузки
        (void)document::compile_line_pattern(c.section_start);
        (void)document::compile_line_pattern(c.section_end);
        return c;
    }
    case ConditionKind::CoverMetadata: {
        CoverMetadata c;
        c.cover_chars = params["cover_chars"].as<size_t>(4000);
        return c;
    }
    }
    throw std::invalid_argument("unhandled rule type");
}

Rule parse_rule(const YAML::Node& node) {
    Rule r;
    r.id = node["id"].as<std::string>("");
    if (r.id.empty()) {
        throw std::invalid_argument("rule must have an id");
    }
    try {
        r.name = field(node, {"name", "title", "desc"}).as<std::string>(r.id);
        r.category = node["category"].as<std::string>("");
        r.severity = issue::parse_severity(node["severity"].as<std::string>("medium"));
        r.message_template = field(node, {"message", "message_template"}).as<std::string>("");
        r.enabled = node["enabled"].as<bool>(true);
        if (node["tolerance"]) {
            r.tolerance = parse_tolerance(node["tolerance"]);
        }
        std::string type = field(node, {"type", "kind"}).as<std::string>("");
        r.condition = parse_condition(parse_condition_kind(type), node);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("rule '" + r.id + "': invalid section pattern: " + e.what());
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument("rule '" + r.id + "': " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("rule '" + r.id + "': " + e.what());
    }
    return r;
}

/// Наложить переопределение профиля на узел правила (params/tolerance - по ключам)
void merge_override(YAML::Node rule, const YAML::Node& ov) {
    for (auto it = ov.begin(); it != ov.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if ((key == "params" || key == "tolerance") && it->second.IsMap()) {
            YAML::Node target = rule[key];
            for (auto p = it->second.begin(); p != it->second.end(); ++p) {
                target[p->first.as<std::string>()] = YAML::Clone(p->second);
            }
        } else {
            rule[key] = YAML::Clone(it->second);
        }
    }
}

/// Проверить ссылки на таблицы
void check_table_refs(const RuleSet& rs) {
    auto require = [&](const Rule& r, const std::string& name) {
        if (!rs.find_table(name).has_value()) {
            throw std::invalid_argument("rule '" + r.id + "': unknown table '" + name + "'");
        }
    };
    for (const auto& r : rs.rules) {
        if (const auto* tp = std::get_if<TablePresence>(&r.condition)) {
            for (const auto& t : tp->tables) {
                require(r, t);
            }
        } else if (const auto* nc = std::get_if<NumericConsistency>(&r.condition)) {
            if (!nc->table.empty()) {
                require(r, nc->table);
            }
            if (nc->left.table) {
                require(r, *nc->left.table);
            }
            for (const auto& op : nc->right) {
                if (op.table) {
                    require(r, *op.table);
                }
            }
        }
    }
}

std::shared_ptr<RuleSet> build_rule_set(const YAML::Node& root, std::string_view profile) {
    if (!root.IsMap()) {
        throw std::invalid_argument("rule set must be a YAML mapping");
    }

    auto rs = std::make_shared<RuleSet>();
    rs->version = root["version"].as<std::string>("");
    if (rs->version.empty()) {
        throw std::invalid_argument("rule set must have a version");
    }
    rs->schema_version = root["schema_version"].as<int>(1);
    rs->name = root["name"].as<std::string>("");
    rs->profile = std::string(profile);

    if (root["tables"]) {
        for (const auto& t : root["tables"]) {
            rs->tables.push_back(parse_table_spec(t));
        }
    } else {
        rs->tables = table::default_table_specs();
    }

    // Профиль
    YAML::Node prof(YAML::NodeType::Map);
    if (root["profiles"]) {
        YAML::Node found = root["profiles"][std::string(profile)];
        if (!found) {
            throw std::invalid_argument("unknown profile '" + std::string(profile) + "'");
        }
        if (found.IsMap()) {
            prof = found;
        }
    } else if (profile != "default") {
        throw std::invalid_argument("unknown profile '" + std::string(profile) + "'");
    }

    const YAML::Node& cprof = prof;
    // enabled_rules: ["*"] - все правила
    std::optional<std::set<std::string>> enabled_only;
    if (cprof["enabled_rules"]) {
        auto list = string_list(cprof["enabled_rules"]);
        if (std::find(list.begin(), list.end(), "*") == list.end()) {
            enabled_only = std::set<std::string>(list.begin(), list.end());
        }
    }
    auto disabled_list = string_list(cprof["disabled_rules"]);
    std::set<std::string> disabled(disabled_list.begin(), disabled_list.end());
    const YAML::Node overrides = cprof["rule_overrides"];

    std::set<std::string> seen;
    if (root["rules"]) {
        for (const auto& node : root["rules"]) {
            YAML::Node copy = YAML::Clone(node);
            std::string id = copy["id"].as<std::string>("");
            if (overrides) {
                if (overrides["*"]) {
                    merge_override(copy, overrides["*"]);
                }
                if (!id.empty() && overrides[id]) {
                    merge_override(copy, overrides[id]);
                }
            }

            Rule r = parse_rule(copy);
            if (!seen.insert(r.id).second) {
                throw std::invalid_argument("duplicate rule id '" + r.id + "'");
            }
            if ((enabled_only && enabled_only->count(r.id) == 0) || disabled.count(r.id) > 0) {
                r.enabled = false;
            }
            rs->rules.push_back(std::move(r));
        }
    }

    check_table_refs(*rs);
    // Шаблоны таблиц компилируются здесь же
    table::TableMatcher probe(rs->tables);
    (void)probe;
    return rs;
}

}  // anonymous namespace

// ============================================================================
// Load
// ============================================================================

LoadResult parse_rule_set(std::string_view yaml, std::string_view profile, const std::string& origin) {
    LoadResult result;
    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        result.rule_set = build_rule_set(root, profile);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), origin};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), origin};
    }
    return result;
}

LoadResult load_rule_set(const std::filesystem::path& path, std::string_view profile) {
    LoadResult result;
    std::string origin = platform::path_to_utf8(path);

    if (!is_yaml_extension(path)) {
        result.error = Error{"rule set must have a yaml file extension", origin};
        return result;
    }

    try {
        YAML::Node root = YAML::LoadFile(origin);
        result.rule_set = build_rule_set(root, profile);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), origin};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), origin};
    }
    return result;
}

std::shared_ptr<const RuleSet> default_rule_set() {
    auto rs = std::make_shared<RuleSet>();
    rs->version = "builtin";
    rs->name = "部门决算（内置）";
    rs->profile = "default";
    rs->tables = table::default_table_specs();

    Rule cover;
    cover.id = "V33-001";
    cover.name = "封面年度与金额单位";
    cover.category = "cover";
    cover.severity = issue::Severity::Medium;
    cover.condition = CoverMetadata{};
    rs->rules.push_back(std::move(cover));

    Rule presence;
    presence.id = "V33-002";
    presence.name = "九张表齐全";
    presence.category = "table-presence";
    presence.severity = issue::Severity::High;
    presence.condition = TablePresence{};
    presence.message_template = "未找到必需表格：{table}";
    rs->rules.push_back(std::move(presence));

    Rule cross;
    cross.id = "V33-110";
    cross.name = "预决算对比表述与数值一致";
    cross.category = "text-number";
    cross.severity = issue::Severity::High;
    cross.condition = TextNumberCrossCheck{SECTION_START_DEFAULT, SECTION_END_DEFAULT, 320,
                                           issue::Severity::Medium};
    rs->rules.push_back(std::move(cross));

    return rs;
}

// ============================================================================
// Lint
// ============================================================================

LintResult lint(const std::filesystem::path& path, std::string_view profile) {
    LintResult result;

    auto loaded = load_rule_set(path, profile);
    if (!loaded.ok) {
        result.error = loaded.error;
        return result;
    }
    const RuleSet& rs = *loaded.rule_set;
    result.tables = rs.tables.size();
    result.rules = rs.rules.size();

    try {
        YAML::Node root = YAML::LoadFile(platform::path_to_utf8(path));
        if (root["profiles"]) {
            for (auto it = root["profiles"].begin(); it != root["profiles"].end(); ++it) {
                result.profiles.push_back(it->first.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), platform::path_to_utf8(path)};
        return result;
    }

    for (const auto& r : rs.rules) {
        if (const auto* nc = std::get_if<NumericConsistency>(&r.condition)) {
            if (!r.tolerance.has_value()) {
                result.warnings.push_back("rule '" + r.id + "': no tolerance, exact comparison");
            }
            if (nc->table.empty() && !nc->left.table) {
                result.warnings.push_back("rule '" + r.id + "': no table, operands from full text");
            }
        }
        if (!r.enabled) {
            result.warnings.push_back("rule '" + r.id + "': disabled in profile '" + rs.profile + "'");
        }
    }
    for (const auto& t : rs.tables) {
        if (t.required && t.aliases.empty() && t.patterns.empty()) {
            result.warnings.push_back("table '" + t.canonical_name + "': exact name only");
        }
    }

    result.ok = true;
    return result;
}

// ============================================================================
// RuleSetRegistry
// ============================================================================

RuleSetRegistry::RuleSetRegistry(std::shared_ptr<const RuleSet> initial)
    : current_(std::move(initial)) {}

std::shared_ptr<const RuleSet> RuleSetRegistry::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void RuleSetRegistry::install(std::shared_ptr<const RuleSet> rule_set) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(rule_set);
}

LoadResult RuleSetRegistry::reload(const std::filesystem::path& path, std::string_view profile) {
    auto result = load_rule_set(path, profile);
    if (result.ok) {
        install(result.rule_set);
    }
    return result;
}

}  // namespace budgetaudit::rule
