// ==============================================================================
// budgetaudit/document.hpp - Нормализованный документ
// ==============================================================================
//
// Назначение:
// - Document: текст по страницам + извлечённые таблицы
// - Загрузка из JSON (адаптер входной формы: snake_case/camelCase,
//   вложенный "document"/"result", массив строк page_texts)
// - Карта смещений "полный текст -> страница" и поиск разделов
//   по регулярным выражениям с привязкой к началу строки
//
// Документ неизменяем после загрузки; задания держат его через
// std::shared_ptr<const Document>.
//
// ==============================================================================

#ifndef BUDGETAUDIT_DOCUMENT_HPP
#define BUDGETAUDIT_DOCUMENT_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace budgetaudit::document {

// ============================================================================
// Модель
// ============================================================================

/// Текст одной страницы (number начинается с 1)
struct PageText {
    int number = 0;
    std::string text;
};

/// Таблица, выделенная внешним сборщиком
struct ExtractedTable {
    int page = 0;
    std::optional<std::string> title;
    std::vector<std::vector<std::string>> rows;
};

struct Document {
    std::string id;
    std::vector<PageText> pages;
    std::vector<ExtractedTable> tables;

    /// Нет ни одной страницы с непустым текстом
    bool empty() const;

    /// Текст страниц через "\n"
    std::string full_text() const;

    /// Текст страницы по номеру (nullptr если нет)
    const PageText* page(int number) const;
};

// ============================================================================
// Карта страниц
// ============================================================================

/// Смещения страниц в full_text() (в кодовых точках)
class PageMap {
public:
    explicit PageMap(const Document& doc);

    /// Номер страницы для смещения в полном тексте (0 если документ пуст)
    int page_at(size_t offset) const;

    /// Смещение относительно начала своей страницы
    size_t offset_in_page(size_t offset) const;

private:
    std::vector<size_t> starts_;
    std::vector<int> numbers_;
};

// ============================================================================
// Разделы
// ============================================================================

/// Найти совпадение, начинающееся в начале строки (аналог (?m)^)
/// Возвращает [start, end) в кодовых точках
std::optional<std::pair<size_t, size_t>> search_line_start(std::wstring_view text,
                                                           const std::wregex& re,
                                                           size_t from = 0);

/// Скомпилировать шаблон раздела; ведущий '^' отбрасывается, привязка к строке
/// выполняется search_line_start
/// @throw std::regex_error при некорректном шаблоне
std::wregex compile_line_pattern(std::string_view pattern);

/// Раздел текста: [start, end) в полном тексте
struct Section {
    size_t start = 0;
    size_t end = 0;
    std::wstring text;
};

/// Раздел от start_re до ближайшего end_re после заголовка (или до конца текста)
std::optional<Section> find_section(std::wstring_view full, const std::wregex& start_re,
                                    const std::wregex& end_re);

// ============================================================================
// Загрузка
// ============================================================================

struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    std::shared_ptr<const Document> document;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить документ из JSON файла
LoadResult load(const std::filesystem::path& path);

/// Разобрать документ из строки JSON
LoadResult parse(std::string_view json, const std::string& origin = "");

/// JSON -> Document. Принимает "pages" как массив объектов {number|page, text}
/// или массив строк, а также "page_texts"/"pageTexts"
bool document_from_json(const rapidjson::Value& json, Document& out, std::string& error);

}  // namespace budgetaudit::document

#endif  // BUDGETAUDIT_DOCUMENT_HPP
