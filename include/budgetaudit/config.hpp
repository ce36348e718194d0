// ==============================================================================
// budgetaudit/config.hpp - Конфигурация приложения
// ==============================================================================
//
// Назначение:
// - Загрузка YAML конфигурации (yaml-cpp)
// - Переопределения из переменных окружения
// - Режимы: двойной (правила + AI), только правила, только AI, без слияния
//
// Формат:
//   mode: {dual: true, ai_enabled: true, rule_enabled: true, merge_enabled: true}
//   rules: {path: rules/budget_v3_3.yml, profile: default}
//   ai: {timeout_seconds: 60, retry: 1, concurrency: 4, window: {...}, ...}
//   providers: [{name, tier, model, base_url, api_key_env}, ...]
//   merge: {title_similarity, money_tolerance, percent_tolerance, page_tolerance}
//   orchestrator: {workers: 2}
//   logging: {level: info, file: logs/budgetaudit.log}
//
// ==============================================================================

#ifndef BUDGETAUDIT_CONFIG_HPP
#define BUDGETAUDIT_CONFIG_HPP

#include "budgetaudit/extractor.hpp"
#include "budgetaudit/merge.hpp"
#include "budgetaudit/output.hpp"
#include "budgetaudit/provider.hpp"
#include "budgetaudit/resilience.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace budgetaudit::config {

struct Config {
    // mode
    bool dual = true;  // false: только правила
    bool ai_enabled = true;
    bool rule_enabled = true;
    bool merge_enabled = true;

    // rules
    std::optional<std::filesystem::path> rules_path;
    std::string profile = "default";

    // ai
    std::chrono::milliseconds ai_timeout{60000};
    ai::ClientOptions client;
    ai::ResilienceOptions resilience;
    std::vector<ai::ProviderConfig> providers = ai::default_provider_chain();

    merge::MergeOptions merge;

    size_t workers = 2;

    output::LogLevel log_level = output::LogLevel::Info;
    std::optional<std::filesystem::path> log_file;

    bool run_rules() const { return rule_enabled; }
    bool run_ai() const { return dual && ai_enabled; }
};

struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из YAML файла. Отсутствующие секции - значения по умолчанию
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из строки YAML
ConfigResult parse_config(std::string_view yaml, const std::string& origin = "");

/// Поиск переменной окружения (подменяется в тестах)
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// EnvLookup поверх platform::get_env
EnvLookup platform_env();

/// Применить DUAL_MODE, AI_ENABLED, RULE_ENABLED, MERGE_ENABLED, AI_TIMEOUT, AI_RETRY,
/// MERGE_*, LOG_LEVEL, LOG_FILE и ключи провайдеров (api_key_env)
/// @throw std::invalid_argument при некорректном значении
void apply_env_overrides(Config& config, const EnvLookup& env = platform_env());

/// "true/false/1/0/yes/no/on/off"
/// @throw std::invalid_argument если строка не распознана
bool parse_bool(std::string_view s);

}  // namespace budgetaudit::config

#endif  // BUDGETAUDIT_CONFIG_HPP
