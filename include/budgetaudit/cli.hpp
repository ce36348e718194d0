// ==============================================================================
// budgetaudit/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2 - ошибка использования)
//
// CLI - локальный драйвер ядра: загружает документ (JSON), правила и
// конфигурацию, ставит задание в оркестратор и печатает результат.
//
// ==============================================================================

#ifndef BUDGETAUDIT_CLI_HPP
#define BUDGETAUDIT_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace budgetaudit::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// check - полный прогон документа через правила и AI
struct CheckCommand {
    std::filesystem::path document;
    std::optional<std::filesystem::path> rules;   // -r, --rules
    std::optional<std::string> profile;           // --profile
    std::optional<std::filesystem::path> config;  // -c, --config
    bool json = false;                            // --json
    bool jsonl = false;                           // --jsonl
    std::optional<std::filesystem::path> output;  // -o, --output
    bool no_ai = false;                           // --no-ai
    bool no_rules = false;                        // --no-rules
    bool no_merge = false;                        // --no-merge
    int timeout_seconds = 600;                    // --timeout
};

/// lint - проверка набора правил
struct LintCommand {
    std::filesystem::path path;
    std::string profile = "default";  // --profile
};

/// match - сопоставление таблиц документа со спецификациями
struct MatchCommand {
    std::filesystem::path document;
    std::optional<std::filesystem::path> rules;  // -r, --rules
    bool json = false;                           // --json
};

/// providers - цепочка провайдеров и их доступность
struct ProvidersCommand {
    std::optional<std::filesystem::path> config;  // -c, --config
    bool json = false;                            // --json
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<CheckCommand, LintCommand, MatchCommand, ProvidersCommand, HelpCommand,
                             VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

constexpr const char* VERSION = "0.3.0";

constexpr const char* ABOUT = "Audit budget and final-account disclosures with rules and AI";

}  // namespace budgetaudit::cli

#endif  // BUDGETAUDIT_CLI_HPP
