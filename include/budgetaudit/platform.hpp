// ==============================================================================
// budgetaudit/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
// - Доступ к переменным окружения
// - Идентификаторы (UUID v4) и временные метки ISO-8601
//
// Платформенная специфика изолирована здесь, остальные модули её не видят.
//
// ==============================================================================

#ifndef BUDGETAUDIT_PLATFORM_HPP
#define BUDGETAUDIT_PLATFORM_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace budgetaudit::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

/// Значение переменной окружения; пустое значение считается отсутствующим
std::optional<std::string> get_env(const std::string& name);

// ----------------------------------------------------------------------------
// Идентификаторы и время
// ----------------------------------------------------------------------------

/// Случайный UUID v4 в канонической форме 8-4-4-4-12
std::string generate_uuid();

/// Время в формате ISO-8601 UTC с миллисекундами: 2024-05-01T10:00:00.000Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);

/// Текущее время в формате ISO-8601 UTC
std::string now_iso8601();

}  // namespace budgetaudit::platform

#endif  // BUDGETAUDIT_PLATFORM_HPP
