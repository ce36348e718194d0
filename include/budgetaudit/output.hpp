// ==============================================================================
// budgetaudit/output.hpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Журнал с порогом уровня (LOG_LEVEL, -q, -v)
// - Файл результатов (--output) и файл журнала (LOG_FILE)
// - JSON вывод отчёта (RapidJSON)
//
// Writer потокобезопасен: задания пишут в журнал из рабочих потоков.
//
// ==============================================================================

#ifndef BUDGETAUDIT_OUTPUT_HPP
#define BUDGETAUDIT_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace budgetaudit::output {

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Уровень журнала
// ----------------------------------------------------------------------------

/// Упорядочены по возрастанию важности
enum class LogLevel { Trace, Debug, Info, Warn, Error };

/// @throw std::invalid_argument если строка не распознана
LogLevel parse_log_level(std::string_view s);

std::string to_string(LogLevel level);

/// Порог по флагам командной строки: -q оставляет только ошибки,
/// -v включает debug, -vv включает trace
LogLevel level_from_flags(bool quiet, int verbose);

/// Маркер строки журнала в stderr: "[~] ", "[*] ", "[+] ", "[!] ", "[x] "
std::string_view level_marker(LogLevel level);

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    LogLevel level = LogLevel::Info;

    // Результаты вместо stdout (--output)
    std::optional<std::filesystem::path> output_path;

    // Дубликат журнала без цвета, с меткой времени (дописывается)
    std::optional<std::filesystem::path> log_path;
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);

    void write_line(Stream s, std::string_view bytes);

    /// Сообщение пройдёт порог журнала
    bool enabled(LogLevel level) const { return level >= config_.level; }

    /// Строка журнала в stderr (+ файл журнала), если уровень проходит порог
    void log(LogLevel level, std::string_view message);

    void trace(std::string_view message) { log(LogLevel::Trace, message); }
    void debug(std::string_view message) { log(LogLevel::Debug, message); }
    void info(std::string_view message) { log(LogLevel::Info, message); }
    void warn(std::string_view message) { log(LogLevel::Warn, message); }
    void error(std::string_view message) { log(LogLevel::Error, message); }

    /// Итоговая строка отчёта (зелёным на терминале)
    void green_line(std::string_view message);

    /// Компактный JSON + newline (JSONL)
    void write_json_line(const rapidjson::Value& value);

    /// JSON с отступами + newline
    void write_json_pretty(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

    bool has_output_file() const { return output_file_ != nullptr; }

    bool has_log_file() const { return log_file_ != nullptr; }

private:
    /// mutex_ уже захвачен
    void write_unlocked(Stream s, std::string_view bytes);

    /// Цвет только для терминала, не для --output
    bool use_color(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
    FILE* log_file_ = nullptr;
    std::mutex mutex_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Текст находки в одну строку: пробельные символы схлопнуты,
/// длина не больше limit байт по границе UTF-8 (0 = без ограничения)
std::string clip_text(std::string_view text, size_t limit);

}  // namespace budgetaudit::output

#endif  // BUDGETAUDIT_OUTPUT_HPP
