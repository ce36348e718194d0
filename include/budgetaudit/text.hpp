// ==============================================================================
// budgetaudit/text.hpp - Текстовые и числовые утилиты
// ==============================================================================
//
// Назначение:
// - UTF-8 <-> std::wstring (кодовые точки) для std::wregex и смещений span
// - Нормализация заголовков (пробелы, пунктуация CJK/ASCII)
// - Похожесть строк (Ratcliff/Obershelp, как difflib.SequenceMatcher)
// - Разбор чисел из ячеек таблиц (разделители тысяч, проценты, прочерки)
// - Закон допуска и динамический допуск по величине суммы
//
// Все смещения в публичных API - в кодовых точках, не в байтах.
//
// ==============================================================================

#ifndef BUDGETAUDIT_TEXT_HPP
#define BUDGETAUDIT_TEXT_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace budgetaudit::text {

static_assert(sizeof(wchar_t) >= 4, "budgetaudit::text requires a 32-bit wchar_t: one code point per element");

// ----------------------------------------------------------------------------
// UTF-8
// ----------------------------------------------------------------------------

/// Декодировать UTF-8; некорректные байты заменяются на U+FFFD
std::wstring widen(std::string_view utf8);

/// Закодировать кодовые точки в UTF-8
std::string narrow(std::wstring_view wide);

/// Длина в кодовых точках
size_t length(std::string_view utf8);

/// Подстрока [start, end) в кодовых точках; границы обрезаются по длине
std::string slice(std::string_view utf8, size_t start, size_t end);

/// Первые n кодовых точек
std::string prefix(std::string_view utf8, size_t n);

// ----------------------------------------------------------------------------
// Нормализация
// ----------------------------------------------------------------------------

/// Пробельный символ (ASCII + полноширинный пробел U+3000 + NBSP)
bool is_space(wchar_t c);

/// Знак пунктуации ASCII или CJK (，。、：；“”《》（）【】 и т.д.)
bool is_punct(wchar_t c);

/// Удалить пробелы и пунктуацию
std::wstring normalize(std::wstring_view s);

/// Удалить только пробелы
std::wstring strip_spaces(std::wstring_view s);

/// Обрезать пробелы по краям (UTF-8)
std::string trim(std::string_view s);

// ----------------------------------------------------------------------------
// Похожесть
// ----------------------------------------------------------------------------

/// Коэффициент 2*M/T по алгоритму Ratcliff/Obershelp, в [0, 1]
double similarity(std::wstring_view a, std::wstring_view b);

// ----------------------------------------------------------------------------
// Числа
// ----------------------------------------------------------------------------

/// Разобрать число из ячейки: "1,234.50", "-12", "3.5%", прочерки -> nullopt
std::optional<double> parse_number(std::string_view cell);

/// Процентная ячейка ("12.5%")
bool looks_like_percent(std::string_view cell);

/// Форматировать сумму: две цифры после точки, без хвостовых нулей
std::string format_amount(double value);

// ----------------------------------------------------------------------------
// Допуски
// ----------------------------------------------------------------------------

/// |a-b| <= max(rel_tol * max(|a|,|b|), abs_tol)
bool consistency_check(double a, double b, double rel_tol, double abs_tol);

/// Допуск по величине: < 100 -> base; < 10000 -> max(base, 0.5%); иначе max(base, 0.3%)
double dynamic_tolerance(double a, double b, double base = 1.0);

// ----------------------------------------------------------------------------
// Прочее
// ----------------------------------------------------------------------------

/// Подставить {name} из vars; неизвестные плейсхолдеры остаются как есть
std::string render_template(std::string_view tpl, const std::map<std::string, std::string>& vars);

/// FNV-1a 64, hex (16 символов) - ключ кеша документа/окна
std::string content_hash(std::string_view data);

}  // namespace budgetaudit::text

#endif  // BUDGETAUDIT_TEXT_HPP
