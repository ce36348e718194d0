// ==============================================================================
// output.cpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны, std::endl не используем.
//
// ==============================================================================

#include "budgetaudit/output.hpp"

#include "budgetaudit/platform.hpp"

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>

namespace budgetaudit::output {

namespace {

constexpr std::string_view ANSI_RESET = "\x1b[0m";

std::string_view level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\x1b[35m";
    case LogLevel::Debug:
        return "\x1b[36m";
    case LogLevel::Info:
        return "\x1b[32m";
    case LogLevel::Warn:
        return "\x1b[33m";
    case LogLevel::Error:
        return "\x1b[31m";
    }
    return "";
}

FILE* open_for_write(const std::filesystem::path& path, const char* mode) {
    return std::fopen(path.c_str(), mode);
}

template <typename JsonWriter>
std::string serialize(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace

// ----------------------------------------------------------------------------
// LogLevel
// ----------------------------------------------------------------------------

LogLevel parse_log_level(std::string_view s) {
    if (s == "trace")
        return LogLevel::Trace;
    if (s == "debug")
        return LogLevel::Debug;
    if (s == "info")
        return LogLevel::Info;
    if (s == "warn" || s == "warning")
        return LogLevel::Warn;
    if (s == "error")
        return LogLevel::Error;
    throw std::invalid_argument("unknown log level, must be: trace, debug, info, warn or error");
}

std::string to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

LogLevel level_from_flags(bool quiet, int verbose) {
    if (quiet) {
        return LogLevel::Error;
    }
    if (verbose >= 2) {
        return LogLevel::Trace;
    }
    return verbose == 1 ? LogLevel::Debug : LogLevel::Info;
}

std::string_view level_marker(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "[~] ";
    case LogLevel::Debug:
        return "[*] ";
    case LogLevel::Info:
        return "[+] ";
    case LogLevel::Warn:
        return "[!] ";
    case LogLevel::Error:
        return "[x] ";
    }
    return "";
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        output_file_ = open_for_write(*config_.output_path, "wb");
    }
    if (config_.log_path.has_value()) {
        log_file_ = open_for_write(*config_.log_path, "ab");
    }
}

Writer::~Writer() {
    for (FILE* f : {output_file_, log_file_}) {
        if (f != nullptr) {
            std::fflush(f);
            std::fclose(f);
        }
    }
    std::fflush(stdout);
    std::fflush(stderr);
}

void Writer::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(s, bytes);
    write_unlocked(s, "\n");
}

void Writer::write_unlocked(Stream s, std::string_view bytes) {
    FILE* f = stderr;
    if (s == Stream::Stdout) {
        f = output_file_ != nullptr ? output_file_ : stdout;
    }
    std::fwrite(bytes.data(), 1, bytes.size(), f);
}

bool Writer::use_color(Stream s) const {
    if (s == Stream::Stdout) {
        return output_file_ == nullptr && platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

void Writer::log(LogLevel level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string_view marker = level_marker(level);
    if (use_color(Stream::Stderr)) {
        write_unlocked(Stream::Stderr, level_color(level));
        write_unlocked(Stream::Stderr, marker);
        write_unlocked(Stream::Stderr, ANSI_RESET);
    } else {
        write_unlocked(Stream::Stderr, marker);
    }
    write_unlocked(Stream::Stderr, message);
    write_unlocked(Stream::Stderr, "\n");

    if (log_file_ != nullptr) {
        // 2026-10-19T08:00:00Z warn provider local-flash marked as down
        std::string line = platform::now_iso8601();
        line += ' ';
        line += to_string(level);
        line += ' ';
        line.append(message);
        line += '\n';
        std::fwrite(line.data(), 1, line.size(), log_file_);
    }
}

void Writer::green_line(std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool color = use_color(Stream::Stdout);
    if (color) {
        write_unlocked(Stream::Stdout, level_color(LogLevel::Info));
    }
    write_unlocked(Stream::Stdout, message);
    if (color) {
        write_unlocked(Stream::Stdout, ANSI_RESET);
    }
    write_unlocked(Stream::Stdout, "\n");
}

void Writer::write_json_line(const rapidjson::Value& value) {
    write_line(Stream::Stdout, serialize<rapidjson::Writer<rapidjson::StringBuffer>>(value));
    flush();
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    write_line(Stream::Stdout, serialize<rapidjson::PrettyWriter<rapidjson::StringBuffer>>(value));
    flush();
}

void Writer::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string clip_text(std::string_view text, size_t limit) {
    std::string result;
    result.reserve(text.size());

    bool prev_space = true;  // ведущие пробелы отбрасываются
    for (char c : text) {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            if (!prev_space) {
                result += ' ';
                prev_space = true;
            }
            continue;
        }
        result += c;
        prev_space = false;
    }
    if (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }

    if (limit > 0 && result.size() > limit) {
        size_t cut = limit;
        // не разрезаем многобайтовую последовательность UTF-8
        while (cut > 0 && (static_cast<unsigned char>(result[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        result.resize(cut);
        result += "...";
    }
    return result;
}

}  // namespace budgetaudit::output
