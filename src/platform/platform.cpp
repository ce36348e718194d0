// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8.
// Только POSIX: модулю text нужен 32-битный wchar_t (кодовая точка на символ).
//
// ==============================================================================

#include "budgetaudit/platform.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <random>

#include <unistd.h>

namespace budgetaudit::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // нативная кодировка путей POSIX - байты; UTF-8 проходит без изменений
    return std::filesystem::path(std::string(u8str));
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.native();
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
    return isatty(fileno(stdout)) != 0;
}

bool is_tty_stderr() {
    return isatty(fileno(stderr)) != 0;
}

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

std::optional<std::string> get_env(const std::string& name) {
    // std::getenv не потокобезопасен относительно setenv; читаем под общим mutex
    static std::mutex env_mutex;
    std::lock_guard<std::mutex> lock(env_mutex);
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

// ----------------------------------------------------------------------------
// UUID v4
// ----------------------------------------------------------------------------

std::string generate_uuid() {
    static std::mutex gen_mutex;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<std::uint64_t> dis;

    std::uint64_t high = 0;
    std::uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        high = dis(gen);
        low = dis(gen);
    }

    // version 4 (random)
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    // variant RFC 4122
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(high >> 32), static_cast<unsigned>((high >> 16) & 0xFFFF),
                  static_cast<unsigned>(high & 0xFFFF), static_cast<unsigned>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);

    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(millis));
    return std::string(buf);
}

std::string now_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

}  // namespace budgetaudit::platform
