// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации, документа и правил
// 4. Dispatch команды
// 5. Возврат exit code: 0 - успех, 1 - ошибка выполнения, 2 - ошибка использования
//
// ==============================================================================

#include "budgetaudit/cli.hpp"
#include "budgetaudit/config.hpp"
#include "budgetaudit/document.hpp"
#include "budgetaudit/engine.hpp"
#include "budgetaudit/extractor.hpp"
#include "budgetaudit/job.hpp"
#include "budgetaudit/output.hpp"
#include "budgetaudit/platform.hpp"
#include "budgetaudit/provider.hpp"
#include "budgetaudit/resilience.hpp"
#include "budgetaudit/rule.hpp"
#include "budgetaudit/table.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <rapidjson/document.h>
#include <sstream>

namespace {

using namespace budgetaudit;

constexpr const char* BANNER = R"(
  ___         _          _     _            _ _ _
 | _ )_  _ __| |__ _ ___| |_  /_\ _  _ __| (_) |_
 | _ \ || / _` / _` / -_)  _|/ _ \ || / _` | |  _|
 |___/\_,_\__,_\__, \___|\__/_/ \_\_,_\__,_|_|\__|
               |___/
)";

void print_banner(output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(output::Stream::Stderr, BANNER);
    writer.write_line(output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Общие шаги загрузки
// ----------------------------------------------------------------------------

/// Конфигурация из файла (если задан) + переменные окружения
std::optional<config::Config> load_app_config(const std::optional<std::filesystem::path>& path,
                                              output::Writer& writer) {
    config::Config cfg;
    if (path.has_value()) {
        auto loaded = config::load_config(*path);
        if (!loaded) {
            writer.error(loaded.error.format());
            return std::nullopt;
        }
        cfg = std::move(loaded.config);
    }
    try {
        config::apply_env_overrides(cfg);
    } catch (const std::invalid_argument& e) {
        writer.error(std::string("config error: ") + e.what());
        return std::nullopt;
    }
    return cfg;
}

std::shared_ptr<const rule::RuleSet> load_rules(const std::optional<std::filesystem::path>& path,
                                                const std::string& profile, output::Writer& writer) {
    if (!path.has_value()) {
        writer.debug("using built-in rule set");
        return rule::default_rule_set();
    }
    auto loaded = rule::load_rule_set(*path, profile);
    if (!loaded) {
        writer.error(loaded.error.format());
        return nullptr;
    }
    writer.info("Loaded rule set " + loaded.rule_set->version + " (profile " + profile + ", " +
                std::to_string(loaded.rule_set->rules.size()) + " rules)");
    return loaded.rule_set;
}

std::shared_ptr<const document::Document> load_document(const std::filesystem::path& path,
                                                        output::Writer& writer) {
    auto loaded = document::load(path);
    if (!loaded) {
        writer.error(loaded.error.format());
        return nullptr;
    }
    return loaded.document;
}

// ----------------------------------------------------------------------------
// Текстовый вывод
// ----------------------------------------------------------------------------

/// Длинные сообщения ИИ обрезаются в текстовом отчёте; JSON отдаёт их целиком
constexpr size_t MESSAGE_LIMIT = 240;

std::string format_issue_line(const issue::Issue& is) {
    std::ostringstream oss;
    oss << "[" << issue::to_string(is.severity) << "] " << is.id;
    if (is.location.page > 0) {
        oss << " p." << is.location.page;
    }
    oss << " " << output::clip_text(is.title, 0);
    if (!is.message.empty() && is.message != is.title) {
        oss << " - " << output::clip_text(is.message, MESSAGE_LIMIT);
    }
    return oss.str();
}

void print_job_text(const job::Job& job, output::Writer& out) {
    const auto& result = *job.result;
    for (const auto& f : result.merged) {
        out.write_line(output::Stream::Stdout, format_issue_line(issue::finding_issue(f)));
    }
    for (const auto& c : result.conflicts) {
        out.write_line(output::Stream::Stdout,
                       "conflict " + c.key + ": " + merge::to_string(c.reason) + " -> " +
                           merge::to_string(c.resolution));
    }

    const auto& t = result.totals;
    std::ostringstream summary;
    summary << "Findings: " << t.merged << " (rule " << t.rule << ", ai " << t.ai << ", agreements "
            << t.agreements << ", conflicts " << t.conflicts << ")";
    out.green_line(summary.str());
}

void report_detector(const std::string& name, const job::DetectorInfo& info, output::Writer& writer) {
    if (info.status == job::DetectorStatus::Failed) {
        writer.warn(name + " detector failed: " + info.error);
    } else if (info.degraded) {
        writer.warn(name + " detector degraded: provider chain exhausted, regex fallback used");
    }
    for (const auto& s : info.skipped) {
        writer.debug("rule " + s.rule_id + " skipped: " + s.reason);
    }
}

// ----------------------------------------------------------------------------
// check
// ----------------------------------------------------------------------------

int run_check(const cli::CheckCommand& cmd, const cli::GlobalOptions& global,
              output::Writer& writer) {
    auto cfg = load_app_config(cmd.config, writer);
    if (!cfg) {
        return 1;
    }

    // Журнал по конфигурации; флаги -v/-q имеют приоритет
    output::OutputConfig out_cfg = writer.config();
    if (global.verbose == 0 && !global.quiet) {
        out_cfg.level = cfg->log_level;
    }
    out_cfg.log_path = cfg->log_file;
    out_cfg.output_path = cmd.output;
    output::Writer out(out_cfg);
    if (cmd.output.has_value() && !out.has_output_file()) {
        out.error("Unable to open output file: " + platform::path_to_utf8(*cmd.output));
        return 1;
    }
    if (cfg->log_file.has_value() && !out.has_log_file()) {
        out.warn("Unable to open log file: " + platform::path_to_utf8(*cfg->log_file));
    }

    auto doc = load_document(cmd.document, out);
    if (!doc) {
        return 1;
    }

    std::string profile = cmd.profile.value_or(cfg->profile);
    auto rules_path = cmd.rules.has_value() ? cmd.rules : cfg->rules_path;
    auto rules = load_rules(rules_path, profile, out);
    if (!rules) {
        return 1;
    }
    rule::RuleSetRegistry registry(rules);

    bool rules_on = cfg->run_rules() && !cmd.no_rules;
    bool ai_on = cfg->run_ai() && !cmd.no_ai;

    std::unique_ptr<job::Detector> rule_detector;
    if (rules_on) {
        rule_detector = std::make_unique<job::RuleDetector>(engine::RuleEngine(&out));
    }

    // Цепочка провайдеров живёт дольше оркестратора
    std::unique_ptr<ai::ResilientExtractor> extractor;
    std::unique_ptr<job::Detector> ai_detector;
    if (ai_on) {
        std::vector<std::unique_ptr<ai::Provider>> chain;
        for (const auto& pc : cfg->providers) {
            if (!pc.enabled) {
                continue;
            }
            if (!pc.available()) {
                out.debug("provider " + pc.name + " has no API key, skipped");
            }
            chain.push_back(ai::make_provider(pc));
        }
        ai::ResilienceOptions resilience = cfg->resilience;
        resilience.start_probe = false;
        extractor = std::make_unique<ai::ResilientExtractor>(std::move(chain), resilience, &out);
        auto client = std::make_shared<ai::ExtractionClient>(*extractor, cfg->client, &out);
        ai_detector = std::make_unique<job::AIDetector>(client);
    }

    job::OrchestratorOptions options;
    options.workers = 1;
    options.rule_enabled = rules_on;
    options.ai_enabled = ai_on;
    options.merge_enabled = cfg->merge_enabled && !cmd.no_merge;
    options.merge = cfg->merge;

    job::Orchestrator orchestrator(registry, std::move(rule_detector), std::move(ai_detector), options,
                                   &out);

    out.info("Checking " + platform::path_to_utf8(cmd.document) + " (" +
             std::to_string(doc->pages.size()) + " pages, rules " + (rules_on ? "on" : "off") +
             ", ai " + (ai_on ? "on" : "off") + ")");

    std::string id = orchestrator.submit(doc);
    auto [result, done] = orchestrator.wait_result(id, std::chrono::seconds(cmd.timeout_seconds));
    if (!done) {
        orchestrator.cancel(id);
        out.error("Job " + id + " did not finish within " + std::to_string(cmd.timeout_seconds) + "s");
        return 1;
    }

    auto job = orchestrator.snapshot(id);
    if (!job) {
        out.error("Job " + id + " disappeared");
        return 1;
    }
    report_detector("rule", job->rule_detector, out);
    report_detector("ai", job->ai_detector, out);

    if (job->status == job::Status::Error) {
        out.error("Job " + id + " failed: " + job->error.value_or("unknown error"));
        return 1;
    }

    if (cmd.json) {
        rapidjson::Document d;
        job::job_to_json(*job, d, d.GetAllocator());
        out.write_json_pretty(d);
    } else if (cmd.jsonl) {
        for (const auto& f : result->merged) {
            rapidjson::Document d;
            issue::issue_to_json(issue::finding_issue(f), d, d.GetAllocator());
            out.write_json_line(d);
        }
    } else {
        print_job_text(*job, out);
    }
    out.flush();
    return 0;
}

// ----------------------------------------------------------------------------
// lint
// ----------------------------------------------------------------------------

int run_lint(const cli::LintCommand& cmd, output::Writer& writer) {
    auto result = rule::lint(cmd.path, cmd.profile);
    if (!result) {
        writer.error(result.error.format());
        return 1;
    }
    for (const auto& w : result.warnings) {
        writer.warn(w);
    }

    std::string profiles;
    for (size_t i = 0; i < result.profiles.size(); ++i) {
        if (i > 0) {
            profiles += ", ";
        }
        profiles += result.profiles[i];
    }
    writer.info("Validated " + std::to_string(result.tables) + " tables and " +
                std::to_string(result.rules) + " rules" +
                (profiles.empty() ? std::string() : " (profiles: " + profiles + ")"));
    return 0;
}

// ----------------------------------------------------------------------------
// match
// ----------------------------------------------------------------------------

int run_match(const cli::MatchCommand& cmd, output::Writer& writer) {
    auto doc = load_document(cmd.document, writer);
    if (!doc) {
        return 1;
    }
    auto rules = load_rules(cmd.rules, "default", writer);
    if (!rules) {
        return 1;
    }

    std::vector<table::TableLocation> locations;
    try {
        table::TableMatcher matcher(rules->tables);
        locations = matcher.locate(*doc);
    } catch (const std::exception& e) {
        writer.error(std::string("table matcher: ") + e.what());
        return 1;
    }

    std::vector<bool> found(rules->tables.size(), false);
    for (const auto& loc : locations) {
        found[loc.spec_index] = true;
    }

    if (cmd.json) {
        rapidjson::Document d;
        d.SetArray();
        auto& alloc = d.GetAllocator();
        for (size_t i = 0; i < rules->tables.size(); ++i) {
            const auto& spec = rules->tables[i];
            rapidjson::Value v(rapidjson::kObjectType);
            v.AddMember("table", rapidjson::Value(spec.canonical_name.c_str(), alloc), alloc);
            v.AddMember("required", spec.required, alloc);
            v.AddMember("found", static_cast<bool>(found[i]), alloc);
            for (const auto& loc : locations) {
                if (loc.spec_index != i) {
                    continue;
                }
                v.AddMember("page", loc.page, alloc);
                v.AddMember("method", rapidjson::Value(table::to_string(loc.method).c_str(), alloc), alloc);
                v.AddMember("confidence", loc.confidence, alloc);
                v.AddMember("title", rapidjson::Value(loc.title.c_str(), alloc), alloc);
            }
            d.PushBack(v, alloc);
        }
        writer.write_json_pretty(d);
        return 0;
    }

    for (const auto& loc : locations) {
        std::ostringstream oss;
        oss.precision(2);
        oss << std::fixed << rules->tables[loc.spec_index].canonical_name << "  p." << loc.page << "  "
            << table::to_string(loc.method) << "  " << loc.confidence;
        writer.write_line(output::Stream::Stdout, oss.str());
    }
    size_t missing = 0;
    for (size_t i = 0; i < rules->tables.size(); ++i) {
        if (!found[i] && rules->tables[i].required) {
            writer.warn("Missing required table: " + rules->tables[i].canonical_name);
            ++missing;
        }
    }
    writer.info("Matched " + std::to_string(locations.size()) + " of " +
                std::to_string(rules->tables.size()) + " tables, " + std::to_string(missing) +
                " required missing");
    return 0;
}

// ----------------------------------------------------------------------------
// providers
// ----------------------------------------------------------------------------

int run_providers(const cli::ProvidersCommand& cmd, output::Writer& writer) {
    auto cfg = load_app_config(cmd.config, writer);
    if (!cfg) {
        return 1;
    }

    if (cmd.json) {
        rapidjson::Document d;
        d.SetArray();
        auto& alloc = d.GetAllocator();
        for (const auto& p : cfg->providers) {
            std::string tier = ai::to_string(p.tier);
            std::string key = ai::mask_api_key(p.api_key);
            rapidjson::Value v(rapidjson::kObjectType);
            v.AddMember("name", rapidjson::Value(p.name.c_str(), alloc), alloc);
            v.AddMember("tier", rapidjson::Value(tier.c_str(), alloc), alloc);
            v.AddMember("model", rapidjson::Value(p.model.c_str(), alloc), alloc);
            v.AddMember("baseUrl", rapidjson::Value(p.base_url.c_str(), alloc), alloc);
            v.AddMember("apiKey", rapidjson::Value(key.c_str(), alloc), alloc);
            v.AddMember("enabled", p.enabled, alloc);
            v.AddMember("available", p.available(), alloc);
            d.PushBack(v, alloc);
        }
        writer.write_json_pretty(d);
        return 0;
    }

    size_t available = 0;
    for (const auto& p : cfg->providers) {
        std::string key = p.api_key.empty() ? "<unset " + p.api_key_env + ">" : ai::mask_api_key(p.api_key);
        std::string state = !p.enabled ? "disabled" : (p.available() ? "available" : "unavailable");
        writer.write_line(output::Stream::Stdout, ai::to_string(p.tier) + "  " + p.name + "  " + p.model +
                                                      "  " + p.base_url + "  " + key + "  " + state);
        if (p.enabled && p.available()) {
            ++available;
        }
    }
    if (available == 0) {
        writer.warn("No provider has an API key; AI detection will use the regex fallback");
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Dispatch
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    auto parsed = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.level = output::level_from_flags(parsed.global.quiet, parsed.global.verbose);
    output::Writer writer(out_cfg);

    if (!parsed.ok) {
        writer.write(output::Stream::Stderr, parsed.diagnostic.stderr_message);
        return parsed.diagnostic.exit_code;
    }

    if (const auto* help = std::get_if<cli::HelpCommand>(&parsed.command)) {
        writer.write(output::Stream::Stdout, cli::render_help(help->command));
        return 0;
    }
    if (std::holds_alternative<cli::VersionCommand>(parsed.command)) {
        writer.write(output::Stream::Stdout, cli::render_version());
        return 0;
    }

    print_banner(writer, parsed.global.no_banner, parsed.global.quiet);

    if (const auto* cmd = std::get_if<cli::CheckCommand>(&parsed.command)) {
        return run_check(*cmd, parsed.global, writer);
    }
    if (const auto* cmd = std::get_if<cli::LintCommand>(&parsed.command)) {
        return run_lint(*cmd, writer);
    }
    if (const auto* cmd = std::get_if<cli::MatchCommand>(&parsed.command)) {
        return run_match(*cmd, writer);
    }
    if (const auto* cmd = std::get_if<cli::ProvidersCommand>(&parsed.command)) {
        return run_providers(*cmd, writer);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Перехват исключений на границе app
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
