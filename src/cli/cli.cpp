// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "budgetaudit/cli.hpp"

#include "budgetaudit/platform.hpp"

#include <cstring>
#include <stdexcept>

namespace budgetaudit::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

std::string render_usage_error(const std::string& error_msg, const std::string& usage) {
    return error_msg + "\n\nUsage: " + usage + "\n\nFor more information, try '--help'.\n";
}

/// Разбор аргументов подкоманды; ошибка использования - std::invalid_argument
class ArgCursor {
public:
    ArgCursor(int argc, char** argv, int start) : argc_(argc), argv_(argv), i_(start) {}

    bool done() const { return i_ >= argc_; }

    const char* next() { return argv_[i_++]; }

    /// Значение опции (следующий аргумент)
    const char* value(const char* option) {
        if (i_ >= argc_) {
            throw std::invalid_argument("error: a value is required for '" + std::string(option) +
                                        "' but none was supplied");
        }
        return argv_[i_++];
    }

private:
    int argc_;
    char** argv_;
    int i_;
};

[[noreturn]] void unexpected(const char* arg) {
    throw std::invalid_argument("error: unexpected argument '" + std::string(arg) + "' found");
}

[[noreturn]] void missing(const char* what) {
    throw std::invalid_argument(
        "error: the following required arguments were not provided:\n  " + std::string(what));
}

int parse_positive(const char* option, const char* value) {
    size_t pos = 0;
    int n = 0;
    try {
        n = std::stoi(value, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || value[pos] != '\0' || n <= 0) {
        throw std::invalid_argument("error: invalid value '" + std::string(value) + "' for '" +
                                    std::string(option) + "'");
    }
    return n;
}

/// Глобальные опции допустимы и после подкоманды
bool global_option(const char* arg, GlobalOptions& global) {
    if (str_eq(arg, "-v")) {
        global.verbose++;
    } else if (str_eq(arg, "-vv")) {
        global.verbose += 2;
    } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        global.quiet = true;
    } else if (str_eq(arg, "--no-banner")) {
        global.no_banner = true;
    } else {
        return false;
    }
    return true;
}

bool is_help(const char* arg) {
    return str_eq(arg, "-h") || str_eq(arg, "--help");
}

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

Command parse_check(ArgCursor& args, GlobalOptions& global) {
    CheckCommand cmd;
    bool have_document = false;
    while (!args.done()) {
        const char* arg = args.next();
        if (is_help(arg)) {
            return HelpCommand{"check"};
        } else if (global_option(arg, global)) {
            continue;
        } else if (str_eq(arg, "-r") || str_eq(arg, "--rules")) {
            cmd.rules = platform::path_from_utf8(args.value(arg));
        } else if (str_eq(arg, "--profile")) {
            cmd.profile = args.value(arg);
        } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
            cmd.config = platform::path_from_utf8(args.value(arg));
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            cmd.output = platform::path_from_utf8(args.value(arg));
        } else if (str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "--jsonl")) {
            cmd.jsonl = true;
        } else if (str_eq(arg, "--no-ai")) {
            cmd.no_ai = true;
        } else if (str_eq(arg, "--no-rules")) {
            cmd.no_rules = true;
        } else if (str_eq(arg, "--no-merge")) {
            cmd.no_merge = true;
        } else if (str_eq(arg, "--timeout")) {
            cmd.timeout_seconds = parse_positive(arg, args.value(arg));
        } else if (arg[0] != '-' && !have_document) {
            cmd.document = platform::path_from_utf8(arg);
            have_document = true;
        } else {
            unexpected(arg);
        }
    }
    if (!have_document) {
        missing("<DOCUMENT>");
    }
    if (cmd.json && cmd.jsonl) {
        throw std::invalid_argument("error: the argument '--json' cannot be used with '--jsonl'");
    }
    if (cmd.no_ai && cmd.no_rules) {
        throw std::invalid_argument("error: the argument '--no-ai' cannot be used with '--no-rules'");
    }
    return cmd;
}

Command parse_lint(ArgCursor& args, GlobalOptions& global) {
    LintCommand cmd;
    bool have_path = false;
    while (!args.done()) {
        const char* arg = args.next();
        if (is_help(arg)) {
            return HelpCommand{"lint"};
        } else if (global_option(arg, global)) {
            continue;
        } else if (str_eq(arg, "--profile")) {
            cmd.profile = args.value(arg);
        } else if (arg[0] != '-' && !have_path) {
            cmd.path = platform::path_from_utf8(arg);
            have_path = true;
        } else {
            unexpected(arg);
        }
    }
    if (!have_path) {
        missing("<RULES>");
    }
    return cmd;
}

Command parse_match(ArgCursor& args, GlobalOptions& global) {
    MatchCommand cmd;
    bool have_document = false;
    while (!args.done()) {
        const char* arg = args.next();
        if (is_help(arg)) {
            return HelpCommand{"match"};
        } else if (global_option(arg, global)) {
            continue;
        } else if (str_eq(arg, "-r") || str_eq(arg, "--rules")) {
            cmd.rules = platform::path_from_utf8(args.value(arg));
        } else if (str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (arg[0] != '-' && !have_document) {
            cmd.document = platform::path_from_utf8(arg);
            have_document = true;
        } else {
            unexpected(arg);
        }
    }
    if (!have_document) {
        missing("<DOCUMENT>");
    }
    return cmd;
}

Command parse_providers(ArgCursor& args, GlobalOptions& global) {
    ProvidersCommand cmd;
    while (!args.done()) {
        const char* arg = args.next();
        if (is_help(arg)) {
            return HelpCommand{"providers"};
        } else if (global_option(arg, global)) {
            continue;
        } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
            cmd.config = platform::path_from_utf8(args.value(arg));
        } else if (str_eq(arg, "--json")) {
            cmd.json = true;
        } else {
            unexpected(arg);
        }
    }
    return cmd;
}

std::string usage_of(const std::string& command) {
    if (command == "check") {
        return "budgetaudit check [OPTIONS] <DOCUMENT>";
    }
    if (command == "lint") {
        return "budgetaudit lint [OPTIONS] <RULES>";
    }
    if (command == "match") {
        return "budgetaudit match [OPTIONS] <DOCUMENT>";
    }
    if (command == "providers") {
        return "budgetaudit providers [OPTIONS]";
    }
    return "budgetaudit [OPTIONS] <COMMAND>";
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("budgetaudit ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: budgetaudit [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  check      Run rule and AI detection on a document and merge the findings\n"
               "  lint       Lint a rule set to ensure that it loads correctly\n"
               "  match      Match document tables against the required table specs\n"
               "  providers  Show the AI provider chain and key availability\n"
               "  help       Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -v...            Print verbose output\n"
               "  -q               Suppress informational output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Check a document with the bundled rules:\n"
               "        ./budgetaudit check doc.json -r rules/budget_v3_3.yml\n"
               "\n"
               "    Rules only, JSON output:\n"
               "        ./budgetaudit check doc.json --no-ai --json\n";
    } else if (*command == "check") {
        return "Run rule and AI detection on a document and merge the findings\n"
               "\n"
               "Usage: budgetaudit check [OPTIONS] <DOCUMENT>\n"
               "\n"
               "Arguments:\n"
               "  <DOCUMENT>  Extracted document (JSON: pages and tables)\n"
               "\n"
               "Options:\n"
               "  -r, --rules <RULES>      Rule set (YAML)\n"
               "      --profile <PROFILE>  Rule profile (default, strict, minimal)\n"
               "  -c, --config <CONFIG>    Application config (YAML)\n"
               "      --json               Output as JSON\n"
               "      --jsonl              Output merged findings as JSON lines\n"
               "  -o, --output <OUTPUT>    Save output to a file\n"
               "      --no-ai              Rule detection only\n"
               "      --no-rules           AI detection only\n"
               "      --no-merge           Concatenate findings without merging\n"
               "      --timeout <SECONDS>  Wait at most this long for the job (default: 600)\n"
               "  -h, --help               Print help\n";
    } else if (*command == "lint") {
        return "Lint a rule set to ensure that it loads correctly\n"
               "\n"
               "Usage: budgetaudit lint [OPTIONS] <RULES>\n"
               "\n"
               "Arguments:\n"
               "  <RULES>  The path to a rule set\n"
               "\n"
               "Options:\n"
               "      --profile <PROFILE>  Profile to apply (default: default)\n"
               "  -h, --help               Print help\n";
    } else if (*command == "match") {
        return "Match document tables against the required table specs\n"
               "\n"
               "Usage: budgetaudit match [OPTIONS] <DOCUMENT>\n"
               "\n"
               "Arguments:\n"
               "  <DOCUMENT>  Extracted document (JSON)\n"
               "\n"
               "Options:\n"
               "  -r, --rules <RULES>  Rule set with table specs\n"
               "      --json           Output as JSON\n"
               "  -h, --help           Print help\n";
    } else if (*command == "providers") {
        return "Show the AI provider chain and key availability\n"
               "\n"
               "Usage: budgetaudit providers [OPTIONS]\n"
               "\n"
               "Options:\n"
               "  -c, --config <CONFIG>  Application config (YAML)\n"
               "      --json             Output as JSON\n"
               "  -h, --help             Print help\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (global_option(arg, result.global)) {
            continue;
        } else if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message = render_usage_error(
                "error: unexpected argument '" + std::string(arg) + "' found", usage_of(""));
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    std::string cmd = argv[cmd_idx];
    ArgCursor args(argc, argv, cmd_idx + 1);

    try {
        if (cmd == "check") {
            result.command = parse_check(args, result.global);
        } else if (cmd == "lint") {
            result.command = parse_lint(args, result.global);
        } else if (cmd == "match") {
            result.command = parse_match(args, result.global);
        } else if (cmd == "providers") {
            result.command = parse_providers(args, result.global);
        } else if (cmd == "help") {
            HelpCommand help;
            if (!args.done()) {
                help.command = std::string(args.next());
            }
            result.command = help;
        } else {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                render_usage_error("error: unrecognized subcommand '" + cmd + "'", usage_of(""));
            return result;
        }
    } catch (const std::invalid_argument& e) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_usage_error(e.what(), usage_of(cmd));
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace budgetaudit::cli
