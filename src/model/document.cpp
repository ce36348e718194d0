// ==============================================================================
// document.cpp - Нормализованный документ
// ==============================================================================

#include "budgetaudit/document.hpp"

#include "budgetaudit/issue.hpp"
#include "budgetaudit/platform.hpp"
#include "budgetaudit/text.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <rapidjson/error/en.h>

namespace budgetaudit::document {

// ============================================================================
// Document
// ============================================================================

bool Document::empty() const {
    for (const auto& p : pages) {
        if (!text::trim(p.text).empty()) {
            return false;
        }
    }
    return true;
}

std::string Document::full_text() const {
    std::string out;
    for (size_t i = 0; i < pages.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += pages[i].text;
    }
    return out;
}

const PageText* Document::page(int number) const {
    for (const auto& p : pages) {
        if (p.number == number) {
            return &p;
        }
    }
    return nullptr;
}

// ============================================================================
// PageMap
// ============================================================================

PageMap::PageMap(const Document& doc) {
    size_t acc = 0;
    for (const auto& p : doc.pages) {
        starts_.push_back(acc);
        numbers_.push_back(p.number);
        acc += text::length(p.text) + 1;  // + '\n'
    }
}

int PageMap::page_at(size_t offset) const {
    if (starts_.empty()) {
        return 0;
    }
    auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
    size_t idx = static_cast<size_t>(std::distance(starts_.begin(), it));
    return numbers_[idx == 0 ? 0 : idx - 1];
}

size_t PageMap::offset_in_page(size_t offset) const {
    if (starts_.empty()) {
        return offset;
    }
    auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
    size_t idx = static_cast<size_t>(std::distance(starts_.begin(), it));
    return offset - starts_[idx == 0 ? 0 : idx - 1];
}

// ============================================================================
// Разделы
// ============================================================================

std::optional<std::pair<size_t, size_t>> search_line_start(std::wstring_view text,
                                                           const std::wregex& re, size_t from) {
    size_t pos = from;
    // from внутри строки: ближайшее начало строки дальше
    if (pos > 0 && pos <= text.size() && text[pos - 1] != L'\n') {
        size_t nl = text.find(L'\n', pos);
        if (nl == std::wstring_view::npos) {
            return std::nullopt;
        }
        pos = nl + 1;
    }
    while (pos <= text.size()) {
        std::match_results<std::wstring_view::const_iterator> m;
        if (std::regex_search(text.begin() + static_cast<std::ptrdiff_t>(pos), text.end(), m, re,
                              std::regex_constants::match_continuous)) {
            size_t start = pos + static_cast<size_t>(m.position(0));
            return std::make_pair(start, start + static_cast<size_t>(m.length(0)));
        }
        size_t nl = text.find(L'\n', pos);
        if (nl == std::wstring_view::npos) {
            break;
        }
        pos = nl + 1;
    }
    return std::nullopt;
}

std::wregex compile_line_pattern(std::string_view pattern) {
    std::string_view p = pattern;
    // Флаги вида (?m) ECMAScript не поддерживает
    if (p.substr(0, 4) == "(?m)") {
        p.remove_prefix(4);
    }
    if (!p.empty() && p.front() == '^') {
        p.remove_prefix(1);
    }
    return std::wregex(text::widen(p), std::regex_constants::ECMAScript);
}

std::optional<Section> find_section(std::wstring_view full, const std::wregex& start_re,
                                    const std::wregex& end_re) {
    auto head = search_line_start(full, start_re);
    if (!head.has_value()) {
        return std::nullopt;
    }

    Section sec;
    sec.start = head->first;
    sec.end = full.size();
    if (auto tail = search_line_start(full, end_re, head->second); tail.has_value()) {
        sec.end = tail->first;
    }
    sec.text = std::wstring(full.substr(sec.start, sec.end - sec.start));
    return sec;
}

// ============================================================================
// Загрузка
// ============================================================================

std::string Error::format() const {
    std::ostringstream oss;
    oss << "document error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

namespace {

using issue::find_member;

bool read_pages(const rapidjson::Value& arr, Document& out, std::string& error) {
    int next = 1;
    for (const auto& item : arr.GetArray()) {
        PageText page;
        if (item.IsString()) {
            page.number = next;
            page.text.assign(item.GetString(), item.GetStringLength());
        } else if (item.IsObject()) {
            const auto* num = find_member(item, {"number", "page", "page_number", "pageNumber"});
            page.number = (num != nullptr && num->IsInt()) ? num->GetInt() : next;
            const auto* txt = find_member(item, {"text", "content"});
            if (txt != nullptr && txt->IsString()) {
                page.text.assign(txt->GetString(), txt->GetStringLength());
            }
        } else {
            error = "page " + std::to_string(next) + " must be a string or an object";
            return false;
        }
        next = page.number + 1;
        out.pages.push_back(std::move(page));
    }
    return true;
}

bool read_tables(const rapidjson::Value& arr, Document& out, std::string& error) {
    size_t idx = 0;
    for (const auto& item : arr.GetArray()) {
        if (!item.IsObject()) {
            error = "table " + std::to_string(idx) + " must be an object";
            return false;
        }
        ExtractedTable table;
        const auto* page = find_member(item, {"page", "page_number", "pageNumber"});
        table.page = (page != nullptr && page->IsInt()) ? page->GetInt() : 0;
        const auto* title = find_member(item, {"title", "name"});
        if (title != nullptr && title->IsString()) {
            table.title = std::string(title->GetString(), title->GetStringLength());
        }
        const auto* rows = find_member(item, {"rows", "cells", "data"});
        if (rows != nullptr && rows->IsArray()) {
            for (const auto& row : rows->GetArray()) {
                if (!row.IsArray()) {
                    continue;
                }
                std::vector<std::string> cells;
                for (const auto& cell : row.GetArray()) {
                    if (cell.IsString()) {
                        cells.emplace_back(cell.GetString(), cell.GetStringLength());
                    } else if (cell.IsNumber()) {
                        cells.push_back(text::format_amount(cell.GetDouble()));
                    } else {
                        cells.emplace_back();
                    }
                }
                table.rows.push_back(std::move(cells));
            }
        }
        out.tables.push_back(std::move(table));
        ++idx;
    }
    return true;
}

}  // namespace

bool document_from_json(const rapidjson::Value& input, Document& out, std::string& error) {
    const rapidjson::Value* json = &input;
    if (const auto* nested = find_member(input, {"document", "result"});
        nested != nullptr && nested->IsObject()) {
        json = nested;
    }
    if (!json->IsObject()) {
        error = "document must be a JSON object";
        return false;
    }

    const auto* id = find_member(*json, {"id", "doc_id", "docId", "job_id", "jobId"});
    if (id != nullptr && id->IsString()) {
        out.id.assign(id->GetString(), id->GetStringLength());
    }

    const auto* pages = find_member(*json, {"pages", "page_texts", "pageTexts"});
    if (pages == nullptr || !pages->IsArray()) {
        error = "document is missing 'pages'";
        return false;
    }
    if (!read_pages(*pages, out, error)) {
        return false;
    }

    if (const auto* tables = find_member(*json, {"tables", "page_tables", "pageTables"});
        tables != nullptr && tables->IsArray()) {
        if (!read_tables(*tables, out, error)) {
            return false;
        }
    }
    return true;
}

LoadResult parse(std::string_view json, const std::string& origin) {
    LoadResult result;

    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        result.error = Error{std::string("invalid JSON: ") + rapidjson::GetParseError_En(doc.GetParseError()) +
                                 " at offset " + std::to_string(doc.GetErrorOffset()),
                             origin};
        return result;
    }

    auto parsed = std::make_shared<Document>();
    std::string error;
    if (!document_from_json(doc, *parsed, error)) {
        result.error = Error{error, origin};
        return result;
    }

    result.ok = true;
    result.document = std::move(parsed);
    return result;
}

LoadResult load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LoadResult result;
        result.error = Error{"cannot open file", platform::path_to_utf8(path)};
        return result;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    auto result = parse(buf.str(), platform::path_to_utf8(path));
    if (result.ok && result.document->id.empty()) {
        // Без id в файле - имя файла
        auto copy = std::make_shared<Document>(*result.document);
        copy->id = platform::path_to_utf8(path.stem());
        result.document = std::move(copy);
    }
    return result;
}

}  // namespace budgetaudit::document
