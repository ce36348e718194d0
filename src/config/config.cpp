// ==============================================================================
// config.cpp - Конфигурация приложения
// ==============================================================================

#include "budgetaudit/config.hpp"

#include "budgetaudit/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace budgetaudit::config {

std::string Error::format() const {
    std::ostringstream oss;
    oss << "config error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

bool parse_bool(std::string_view s) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        return false;
    }
    throw std::invalid_argument("invalid boolean '" + std::string(s) + "'");
}

namespace {

std::chrono::milliseconds seconds(double s) {
    if (s <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }
    return std::chrono::milliseconds(static_cast<long long>(s * 1000));
}

// ----------------------------------------------------------------------------
// YAML секции
// ----------------------------------------------------------------------------

void parse_mode(const YAML::Node& node, Config& cfg) {
    if (!node) {
        return;
    }
    if (node.IsScalar()) {
        std::string m = node.as<std::string>();
        if (m == "dual") {
            cfg.dual = true;
        } else if (m == "rule-only" || m == "rule_only") {
            cfg.ai_enabled = false;
        } else if (m == "ai-only" || m == "ai_only") {
            cfg.rule_enabled = false;
        } else {
            throw std::invalid_argument("unknown mode '" + m + "'");
        }
        return;
    }
    cfg.dual = node["dual"].as<bool>(cfg.dual);
    cfg.ai_enabled = node["ai_enabled"].as<bool>(cfg.ai_enabled);
    cfg.rule_enabled = node["rule_enabled"].as<bool>(cfg.rule_enabled);
    cfg.merge_enabled = node["merge_enabled"].as<bool>(cfg.merge_enabled);
}

void parse_ai(const YAML::Node& node, Config& cfg) {
    if (!node) {
        return;
    }
    if (node["timeout_seconds"]) {
        cfg.ai_timeout = seconds(node["timeout_seconds"].as<double>());
    }
    cfg.resilience.network_retries = node["retry"].as<int>(cfg.resilience.network_retries);
    cfg.resilience.failure_threshold = node["failure_threshold"].as<int>(cfg.resilience.failure_threshold);
    if (node["probe_interval_seconds"]) {
        cfg.resilience.probe_interval = seconds(node["probe_interval_seconds"].as<double>());
    }
    if (node["reprobe_after_seconds"]) {
        cfg.resilience.reprobe_after = seconds(node["reprobe_after_seconds"].as<double>());
    }

    auto& c = cfg.client;
    c.concurrency = node["concurrency"].as<size_t>(c.concurrency);
    c.task = node["task"].as<std::string>(c.task);
    c.dedup_similarity = node["dedup_similarity"].as<double>(c.dedup_similarity);
    c.section_start = node["section_start"].as<std::string>(c.section_start);
    c.section_end = node["section_end"].as<std::string>(c.section_end);
    if (const auto w = node["window"]) {
        c.windows.window_size = w["size"].as<size_t>(c.windows.window_size);
        c.windows.overlap = w["overlap"].as<size_t>(c.windows.overlap);
        c.windows.min_window = w["min"].as<size_t>(c.windows.min_window);
        c.windows.max_windows = w["max_windows"].as<size_t>(c.windows.max_windows);
    }
    if (c.concurrency == 0) {
        throw std::invalid_argument("ai.concurrency must be at least 1");
    }
    if (c.windows.overlap >= c.windows.window_size) {
        throw std::invalid_argument("ai.window.overlap must be smaller than ai.window.size");
    }
    if (cfg.resilience.network_retries < 0) {
        throw std::invalid_argument("ai.retry must not be negative");
    }
    if (cfg.resilience.network_retries > ai::MAX_NETWORK_RETRIES) {
        throw std::invalid_argument("ai.retry must be 0 or 1");
    }
}

ai::ProviderConfig parse_provider(const YAML::Node& node, const Config& cfg) {
    ai::ProviderConfig p;
    p.name = node["name"].as<std::string>("");
    if (p.name.empty()) {
        throw std::invalid_argument("provider without name");
    }
    p.tier = ai::parse_tier(node["tier"].as<std::string>("primary"));
    p.model = node["model"].as<std::string>("");
    p.base_url = node["base_url"].as<std::string>("");
    p.api_key = node["api_key"].as<std::string>("");
    p.api_key_env = node["api_key_env"].as<std::string>("");
    p.enabled = node["enabled"].as<bool>(true);
    p.timeout = node["timeout_seconds"] ? seconds(node["timeout_seconds"].as<double>()) : cfg.ai_timeout;
    return p;
}

void parse_merge(const YAML::Node& node, Config& cfg) {
    if (!node) {
        return;
    }
    auto& m = cfg.merge;
    cfg.merge_enabled = node["enabled"].as<bool>(cfg.merge_enabled);
    m.title_similarity = node["title_similarity"].as<double>(m.title_similarity);
    m.money_tolerance = node["money_tolerance"].as<double>(m.money_tolerance);
    m.percent_tolerance = node["percent_tolerance"].as<double>(m.percent_tolerance);
    m.page_tolerance = node["page_tolerance"].as<int>(m.page_tolerance);
    m.severity_tolerance = node["severity_tolerance"].as<int>(m.severity_tolerance);
    m.agreement_boost = node["agreement_boost"].as<double>(m.agreement_boost);
}

void validate_merge(const merge::MergeOptions& m) {
    if (m.title_similarity < 0 || m.title_similarity > 1) {
        throw std::invalid_argument("merge.title_similarity must be within [0, 1]");
    }
    if (m.money_tolerance < 0 || m.percent_tolerance < 0 || m.page_tolerance < 0 ||
        m.severity_tolerance < 0) {
        throw std::invalid_argument("merge tolerances must not be negative");
    }
}

Config build_config(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw std::invalid_argument("configuration must be a mapping");
    }

    parse_mode(root["mode"], cfg);

    if (const auto rules = root["rules"]) {
        if (rules["path"]) {
            cfg.rules_path = platform::path_from_utf8(rules["path"].as<std::string>());
        }
        cfg.profile = rules["profile"].as<std::string>(cfg.profile);
    }

    parse_ai(root["ai"], cfg);

    if (const auto providers = root["providers"]) {
        cfg.providers.clear();
        for (const auto& node : providers) {
            cfg.providers.push_back(parse_provider(node, cfg));
        }
    } else {
        for (auto& p : cfg.providers) {
            p.timeout = cfg.ai_timeout;
        }
    }

    parse_merge(root["merge"], cfg);
    validate_merge(cfg.merge);

    if (const auto orch = root["orchestrator"]) {
        cfg.workers = orch["workers"].as<size_t>(cfg.workers);
        if (cfg.workers == 0) {
            throw std::invalid_argument("orchestrator.workers must be at least 1");
        }
    }

    if (const auto logging = root["logging"]) {
        if (logging["level"]) {
            cfg.log_level = output::parse_log_level(logging["level"].as<std::string>());
        }
        if (logging["file"]) {
            cfg.log_file = platform::path_from_utf8(logging["file"].as<std::string>());
        }
    }
    return cfg;
}

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

double env_number(const std::string& name, const std::string& value) {
    size_t pos = 0;
    double v = 0;
    try {
        v = std::stod(value, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != value.size()) {
        throw std::invalid_argument(name + ": invalid number '" + value + "'");
    }
    return v;
}

/// Целое без дробной части в диапазоне int
int env_int(const std::string& name, const std::string& value) {
    double v = env_number(name, value);
    if (std::floor(v) != v || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(name + ": invalid integer '" + value + "'");
    }
    return static_cast<int>(v);
}

bool env_bool(const std::string& name, const std::string& value) {
    try {
        return parse_bool(value);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(name + ": " + e.what());
    }
}

}  // anonymous namespace

// ============================================================================
// Load
// ============================================================================

ConfigResult parse_config(std::string_view yaml, const std::string& origin) {
    ConfigResult result;
    try {
        result.config = build_config(YAML::Load(std::string(yaml)));
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), origin};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), origin};
    }
    return result;
}

ConfigResult load_config(const std::filesystem::path& path) {
    ConfigResult result;
    std::string origin = platform::path_to_utf8(path);
    try {
        result.config = build_config(YAML::LoadFile(origin));
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), origin};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), origin};
    }
    return result;
}

EnvLookup platform_env() {
    return [](const std::string& name) { return platform::get_env(name); };
}

void apply_env_overrides(Config& config, const EnvLookup& env) {
    if (auto v = env("DUAL_MODE")) {
        config.dual = env_bool("DUAL_MODE", *v);
    }
    if (auto v = env("AI_ENABLED")) {
        config.ai_enabled = env_bool("AI_ENABLED", *v);
    }
    if (auto v = env("RULE_ENABLED")) {
        config.rule_enabled = env_bool("RULE_ENABLED", *v);
    }
    if (auto v = env("MERGE_ENABLED")) {
        config.merge_enabled = env_bool("MERGE_ENABLED", *v);
    }

    // AI_TIMEOUT_SECONDS - прежнее имя переменной
    auto timeout = env("AI_TIMEOUT");
    if (!timeout) {
        timeout = env("AI_TIMEOUT_SECONDS");
    }
    if (timeout) {
        double s = env_number("AI_TIMEOUT", *timeout);
        if (s <= 0) {
            throw std::invalid_argument("AI_TIMEOUT: must be positive");
        }
        config.ai_timeout = seconds(s);
        for (auto& p : config.providers) {
            p.timeout = config.ai_timeout;
        }
    }
    if (auto v = env("AI_RETRY")) {
        int n = env_int("AI_RETRY", *v);
        if (n < 0) {
            throw std::invalid_argument("AI_RETRY: must not be negative");
        }
        if (n > ai::MAX_NETWORK_RETRIES) {
            throw std::invalid_argument("AI_RETRY: at most one immediate re-attempt is allowed");
        }
        config.resilience.network_retries = n;
    }

    if (auto v = env("MERGE_TITLE_SIM")) {
        config.merge.title_similarity = env_number("MERGE_TITLE_SIM", *v);
    }
    if (auto v = env("MERGE_MONEY_TOL")) {
        config.merge.money_tolerance = env_number("MERGE_MONEY_TOL", *v);
    }
    if (auto v = env("MERGE_PCT_TOL")) {
        config.merge.percent_tolerance = env_number("MERGE_PCT_TOL", *v);
    }
    if (auto v = env("MERGE_PAGE_TOL")) {
        config.merge.page_tolerance = env_int("MERGE_PAGE_TOL", *v);
    }
    validate_merge(config.merge);

    if (auto v = env("LOG_LEVEL")) {
        config.log_level = output::parse_log_level(*v);
    }
    if (auto v = env("LOG_FILE")) {
        config.log_file = platform::path_from_utf8(*v);
    }

    for (auto& p : config.providers) {
        if (p.api_key_env.empty()) {
            continue;
        }
        if (auto key = env(p.api_key_env)) {
            p.api_key = *key;
        }
    }
}

}  // namespace budgetaudit::config
