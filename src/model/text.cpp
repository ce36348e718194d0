// ==============================================================================
// text.cpp - Текстовые и числовые утилиты
// ==============================================================================

#include "budgetaudit/text.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <regex>
#include <vector>

namespace budgetaudit::text {

// ============================================================================
// UTF-8
// ============================================================================

namespace {

constexpr wchar_t REPLACEMENT = 0xFFFD;

/// Декодировать одну кодовую точку начиная с pos; сдвигает pos
wchar_t decode_one(std::string_view s, size_t& pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(s[i]); };

    unsigned char c = byte(pos);
    if (c < 0x80) {
        ++pos;
        return static_cast<wchar_t>(c);
    }

    size_t need = 0;
    std::uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
        need = 1;
        cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        need = 2;
        cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        need = 3;
        cp = c & 0x07;
    } else {
        ++pos;
        return REPLACEMENT;
    }

    if (pos + need >= s.size()) {
        // обрезанная последовательность в конце строки
        pos = s.size();
        return REPLACEMENT;
    }
    for (size_t i = 1; i <= need; ++i) {
        unsigned char cc = byte(pos + i);
        if ((cc & 0xC0) != 0x80) {
            pos += i;
            return REPLACEMENT;
        }
        cp = (cp << 6) | (cc & 0x3F);
    }
    pos += need + 1;
    return static_cast<wchar_t>(cp);
}

void encode_one(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

}  // namespace

std::wstring widen(std::string_view utf8) {
    std::wstring out;
    out.reserve(utf8.size());
    size_t pos = 0;
    while (pos < utf8.size()) {
        out += decode_one(utf8, pos);
    }
    return out;
}

std::string narrow(std::wstring_view wide) {
    std::string out;
    out.reserve(wide.size() * 3);
    for (wchar_t c : wide) {
        encode_one(static_cast<std::uint32_t>(c), out);
    }
    return out;
}

size_t length(std::string_view utf8) {
    size_t n = 0;
    for (char c : utf8) {
        // считаем все байты, кроме байтов продолжения
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

std::string slice(std::string_view utf8, size_t start, size_t end) {
    std::wstring w = widen(utf8);
    if (start >= w.size() || start >= end) {
        return {};
    }
    end = std::min(end, w.size());
    return narrow(std::wstring_view(w).substr(start, end - start));
}

std::string prefix(std::string_view utf8, size_t n) {
    return slice(utf8, 0, n);
}

// ============================================================================
// Нормализация
// ============================================================================

bool is_space(wchar_t c) {
    return c == L' ' || c == L'\t' || c == L'\n' || c == L'\r' || c == L'\f' || c == L'\v' ||
           c == 0x3000 || c == 0x00A0;
}

bool is_punct(wchar_t c) {
    if (c < 0x80) {
        return (c >= 0x21 && c <= 0x2F) || (c >= 0x3A && c <= 0x40) || (c >= 0x5B && c <= 0x60) ||
               (c >= 0x7B && c <= 0x7E);
    }
    // Общая пунктуация (кавычки, тире, многоточие)
    if (c >= 0x2010 && c <= 0x2027) {
        return true;
    }
    // CJK символы и пунктуация: 、。〈〉《》「」『』【】〔〕
    if (c >= 0x3001 && c <= 0x301F) {
        return true;
    }
    // Полноширинные формы: ！（），．：；？［］｛｝
    if ((c >= 0xFF01 && c <= 0xFF0F) || (c >= 0xFF1A && c <= 0xFF20) ||
        (c >= 0xFF3B && c <= 0xFF40) || (c >= 0xFF5B && c <= 0xFF65)) {
        return true;
    }
    return c == 0x00B7;  // ·
}

std::wstring normalize(std::wstring_view s) {
    std::wstring out;
    out.reserve(s.size());
    for (wchar_t c : s) {
        if (is_space(c) || is_punct(c)) {
            continue;
        }
        out += c;
    }
    return out;
}

std::wstring strip_spaces(std::wstring_view s) {
    std::wstring out;
    out.reserve(s.size());
    for (wchar_t c : s) {
        if (!is_space(c)) {
            out += c;
        }
    }
    return out;
}

std::string trim(std::string_view s) {
    std::wstring w = widen(s);
    size_t b = 0;
    size_t e = w.size();
    while (b < e && is_space(w[b])) {
        ++b;
    }
    while (e > b && is_space(w[e - 1])) {
        --e;
    }
    return narrow(std::wstring_view(w).substr(b, e - b));
}

// ============================================================================
// Похожесть (Ratcliff/Obershelp)
// ============================================================================

namespace {

struct Block {
    size_t a = 0;
    size_t b = 0;
    size_t size = 0;
};

/// Самая длинная общая подстрока в a[alo,ahi) и b[blo,bhi)
Block longest_match(std::wstring_view a, size_t alo, size_t ahi, std::wstring_view b, size_t blo,
                    size_t bhi) {
    Block best{alo, blo, 0};
    std::vector<size_t> prev(bhi - blo + 1, 0);
    std::vector<size_t> cur(bhi - blo + 1, 0);

    for (size_t i = alo; i < ahi; ++i) {
        for (size_t j = blo; j < bhi; ++j) {
            size_t k = j - blo + 1;
            if (a[i] == b[j]) {
                cur[k] = prev[k - 1] + 1;
                if (cur[k] > best.size) {
                    best.size = cur[k];
                    best.a = i + 1 - cur[k];
                    best.b = j + 1 - cur[k];
                }
            } else {
                cur[k] = 0;
            }
        }
        std::swap(prev, cur);
        std::fill(cur.begin(), cur.end(), 0);
    }
    return best;
}

size_t matching_chars(std::wstring_view a, size_t alo, size_t ahi, std::wstring_view b, size_t blo,
                      size_t bhi) {
    if (alo >= ahi || blo >= bhi) {
        return 0;
    }
    Block m = longest_match(a, alo, ahi, b, blo, bhi);
    if (m.size == 0) {
        return 0;
    }
    return m.size + matching_chars(a, alo, m.a, b, blo, m.b) +
           matching_chars(a, m.a + m.size, ahi, b, m.b + m.size, bhi);
}

}  // namespace

double similarity(std::wstring_view a, std::wstring_view b) {
    if (a.empty() && b.empty()) {
        return 1.0;
    }
    size_t m = matching_chars(a, 0, a.size(), b, 0, b.size());
    return 2.0 * static_cast<double>(m) / static_cast<double>(a.size() + b.size());
}

// ============================================================================
// Числа
// ============================================================================

namespace {

const std::regex& number_re() {
    static const std::regex re(R"(^-?(?:\d{1,3}(?:,\d{3})*|\d+)(?:\.\d+)?$)");
    return re;
}

const std::regex& percent_re() {
    static const std::regex re(R"(^-?(?:\d{1,3}(?:,\d{3})*|\d+)(?:\.\d+)?%$)");
    return re;
}

/// Ячейка-прочерк: только -, —, – и пробелы
bool is_dash_cell(std::wstring_view w) {
    for (wchar_t c : w) {
        if (c != L'-' && c != 0x2014 && c != 0x2013 && !is_space(c)) {
            return false;
        }
    }
    return true;
}

std::string ascii_compact(std::wstring_view w) {
    std::string out;
    for (wchar_t c : w) {
        if (is_space(c)) {
            continue;
        }
        if (c == 0xFF05) {  // ％
            out += '%';
        } else if (c == 0xFF0C) {  // ，
            out += ',';
        } else if (c == 0xFF0E) {  // ．
            out += '.';
        } else if (c == 0xFF0D) {  // －
            out += '-';
        } else if (c < 0x80) {
            out += static_cast<char>(c);
        } else {
            // посторонний символ: строка не число
            return {};
        }
    }
    return out;
}

}  // namespace

std::optional<double> parse_number(std::string_view cell) {
    std::wstring w = widen(cell);
    if (is_dash_cell(w)) {
        return std::nullopt;
    }

    std::string s = ascii_compact(w);
    if (s.empty()) {
        return std::nullopt;
    }

    bool percent = std::regex_match(s, percent_re());
    if (!percent && !std::regex_match(s, number_re())) {
        return std::nullopt;
    }

    std::string digits;
    for (char c : s) {
        if (c != ',' && c != '%') {
            digits += c;
        }
    }
    try {
        return std::stod(digits);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool looks_like_percent(std::string_view cell) {
    return cell.find('%') != std::string_view::npos ||
           cell.find("\xef\xbc\x85") != std::string_view::npos;  // ％
}

std::string format_amount(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    std::string s(buf);
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') {
            s.pop_back();
        }
        if (!s.empty() && s.back() == '.') {
            s.pop_back();
        }
    }
    if (s == "-0") {
        s = "0";
    }
    return s;
}

// ============================================================================
// Допуски
// ============================================================================

bool consistency_check(double a, double b, double rel_tol, double abs_tol) {
    double diff = std::fabs(a - b);
    double scale = std::max(std::fabs(a), std::fabs(b));
    double tol = std::max(rel_tol * scale, abs_tol);
    // 1e-9: погрешность представления десятичных дробей в double
    return diff <= tol + 1e-9;
}

double dynamic_tolerance(double a, double b, double base) {
    double max_val = std::max(std::fabs(a), std::fabs(b));
    if (max_val < 100.0) {
        return base;
    }
    if (max_val < 10000.0) {
        return std::max(base, max_val * 0.005);
    }
    return std::max(base, max_val * 0.003);
}

// ============================================================================
// Прочее
// ============================================================================

std::string render_template(std::string_view tpl, const std::map<std::string, std::string>& vars) {
    std::string out;
    out.reserve(tpl.size());

    size_t i = 0;
    while (i < tpl.size()) {
        if (tpl[i] == '{') {
            size_t close = tpl.find('}', i + 1);
            if (close != std::string_view::npos) {
                std::string name(tpl.substr(i + 1, close - i - 1));
                auto it = vars.find(name);
                if (it != vars.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        out += tpl[i];
        ++i;
    }
    return out;
}

std::string content_hash(std::string_view data) {
    std::uint64_t h = 0xcbf29ce484222325ULL;
    for (char c : data) {
        h ^= static_cast<unsigned char>(c);
        h *= 0x100000001b3ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(h));
    return std::string(buf);
}

}  // namespace budgetaudit::text
