// ==============================================================================
// table_matcher.cpp - Сопоставление заголовков с каноническими таблицами
// ==============================================================================

#include "budgetaudit/table.hpp"

#include "budgetaudit/text.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace budgetaudit::table {

// ============================================================================
// Спецификации по умолчанию
// ============================================================================

std::vector<TableSpec> default_table_specs() {
    std::vector<TableSpec> specs;

    auto add = [&](std::string name, std::vector<std::string> aliases,
                   std::vector<std::string> patterns, std::string category, bool required) {
        TableSpec s;
        s.canonical_name = std::move(name);
        s.aliases = std::move(aliases);
        s.patterns = std::move(patterns);
        s.category = std::move(category);
        s.required = required;
        s.severity = required ? issue::Severity::High : issue::Severity::Medium;
        specs.push_back(std::move(s));
    };

    add("收入支出决算总表", {"收支决算总表", "收入支出总表", "收支总表", "决算总表"},
        {"收入.*支出.*决算.*总表", "收支.*决算.*总表"}, "总表", true);
    add("收入决算表", {"决算收入表", "财政收入决算表", "收入决算明细表"},
        {"收入.*决算表?", "决算.*收入表?"}, "收入", true);
    add("支出决算表", {"决算支出表", "财政支出决算表", "支出决算明细表"},
        {"支出.*决算表?", "决算.*支出表?"}, "支出", true);
    add("财政拨款收入支出决算总表", {"财政拨款收支决算总表", "财政拨款总表", "拨款收支总表"},
        {"财政拨款.*收入.*支出.*决算.*总表", "财政拨款.*收支.*决算.*总表"}, "拨款总表", true);
    add("一般公共预算财政拨款支出决算表", {"一般公共预算支出决算表", "公共预算拨款支出表"},
        {"一般公共预算.*财政拨款.*支出.*决算表?", "一般公共预算.*支出.*决算表?"}, "一般预算", true);
    add("一般公共预算财政拨款基本支出决算表", {"基本支出决算表", "公共预算基本支出表"},
        {"一般公共预算.*财政拨款.*基本支出.*决算表?", "基本支出.*决算表?"}, "基本支出", true);
    add("一般公共预算财政拨款“三公”经费支出决算表",
        {"一般公共预算财政拨款三公经费支出决算表", "三公经费支出决算表", "三公经费决算表"},
        {"三公.*经费.*支出.*决算表?", "三公.*经费.*表"}, "三公经费", true);
    add("政府性基金预算财政拨款收入支出决算表", {"政府性基金收支决算表", "政府性基金预算决算表"},
        {"政府性基金预算.*财政拨款.*收入.*支出.*决算表?", "政府性基金.*收支.*决算表?"}, "政府基金",
        false);
    add("国有资本经营预算财政拨款支出决算表", {"国有资本经营支出决算表", "国资预算决算表"},
        {"国有资本经营预算.*财政拨款.*支出.*决算表?", "国有资本经营.*支出.*决算表?"}, "国有资本",
        false);

    return specs;
}

std::string to_string(Method m) {
    switch (m) {
    case Method::Exact:
        return "exact";
    case Method::Alias:
        return "alias";
    case Method::Regex:
        return "regex";
    case Method::Fuzzy:
        return "fuzzy";
    }
    return "unknown";
}

// ============================================================================
// Нормализация
// ============================================================================

namespace {

const std::wregex& ordinal_prefix_re() {
    static const std::wregex re(
        L"^\\s*(?:[（(][一二三四五六七八九十0-9]+[)）]|[一二三四五六七八九十]+、|[0-9]+[、.．]|表\\s*[0-9]+(?:-[0-9]+)?)\\s*");
    return re;
}

std::vector<std::wstring> split_lines(std::wstring_view w) {
    std::vector<std::wstring> lines;
    size_t start = 0;
    while (start <= w.size()) {
        size_t nl = w.find(L'\n', start);
        if (nl == std::wstring_view::npos) {
            lines.emplace_back(w.substr(start));
            break;
        }
        lines.emplace_back(w.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::wstring normalize_line(const std::wstring& line) {
    std::wstring stripped = std::regex_replace(line, ordinal_prefix_re(), L"",
                                               std::regex_constants::format_first_only);
    return text::normalize(stripped);
}

}  // namespace

std::wstring normalize_title(std::string_view s) {
    std::wstring out;
    for (const auto& line : split_lines(text::widen(s))) {
        out += normalize_line(line);
    }
    return out;
}

// ============================================================================
// TableMatcher
// ============================================================================

TableMatcher::TableMatcher(std::vector<TableSpec> specs, MatcherOptions options)
    : specs_(std::move(specs)), options_(options) {
    compiled_.reserve(specs_.size());
    for (const auto& spec : specs_) {
        Compiled c;
        c.names.push_back(normalize_title(spec.canonical_name));
        for (const auto& alias : spec.aliases) {
            std::wstring n = normalize_title(alias);
            if (!n.empty() && std::find(c.names.begin(), c.names.end(), n) == c.names.end()) {
                c.names.push_back(std::move(n));
            }
        }
        for (const auto& p : spec.patterns) {
            try {
                c.patterns.emplace_back(text::widen(p), std::regex_constants::ECMAScript);
            } catch (const std::regex_error& e) {
                throw std::invalid_argument("table '" + spec.canonical_name + "': invalid pattern '" +
                                            p + "': " + e.what());
            }
        }
        compiled_.push_back(std::move(c));
    }
}

namespace {

/// Вхождение имени таблицы в нормализованный текст
struct Occurrence {
    size_t spec = 0;
    size_t start = 0;
    size_t end = 0;
    bool canonical = false;
};

/// Отрезок [start, end) покрыт вхождением имени другой таблицы
bool shadowed(const std::vector<Occurrence>& occs, size_t spec, size_t start, size_t end,
              bool strictly_longer) {
    size_t len = end - start;
    for (const auto& o : occs) {
        if (o.spec == spec || o.start > start || o.end < end) {
            continue;
        }
        size_t olen = o.end - o.start;
        if (olen > len || (!strictly_longer && olen == len)) {
            return true;
        }
    }
    return false;
}

}  // namespace

MatchResult TableMatcher::match(std::string_view region, std::string_view cover_text) const {
    MatchResult result;

    // Нормализованные строки и их смещения в склеенном тексте
    std::vector<std::wstring> lines;
    std::vector<size_t> line_start;
    std::wstring joined;
    for (const auto& raw : split_lines(text::widen(region))) {
        std::wstring n = normalize_line(raw);
        if (n.empty()) {
            continue;
        }
        line_start.push_back(joined.size());
        joined += n;
        lines.push_back(std::move(n));
    }
    if (joined.empty()) {
        return result;
    }

    std::vector<Occurrence> occs;
    for (size_t i = 0; i < compiled_.size(); ++i) {
        const auto& names = compiled_[i].names;
        for (size_t k = 0; k < names.size(); ++k) {
            if (names[k].empty()) {
                continue;
            }
            for (size_t pos = joined.find(names[k]); pos != std::wstring::npos;
                 pos = joined.find(names[k], pos + 1)) {
                occs.push_back(Occurrence{i, pos, pos + names[k].size(), k == 0});
            }
        }
    }

    std::wstring cover = text::strip_spaces(text::widen(text::prefix(cover_text, options_.cover_chars)));
    bool cover_dept = cover.find(L"部门决算") != std::wstring::npos;
    bool cover_unit = cover.find(L"单位决算") != std::wstring::npos;

    for (size_t i = 0; i < compiled_.size(); ++i) {
        SpecScore score;
        score.spec_index = i;

        for (const auto& o : occs) {
            if (o.spec != i || shadowed(occs, i, o.start, o.end, true)) {
                continue;
            }
            double raw = o.canonical ? 3.0 : 2.0;
            if (raw > score.raw_score) {
                score.raw_score = raw;
                score.method = o.canonical ? Method::Exact : Method::Alias;
            }
        }

        if (score.raw_score == 0.0) {
            for (size_t li = 0; li < lines.size() && score.raw_score == 0.0; ++li) {
                for (const auto& re : compiled_[i].patterns) {
                    const auto& line = lines[li];
                    for (auto it = std::wsregex_iterator(line.begin(), line.end(), re);
                         it != std::wsregex_iterator(); ++it) {
                        if (it->length(0) == 0) {
                            continue;
                        }
                        size_t start = line_start[li] + static_cast<size_t>(it->position(0));
                        size_t end = start + static_cast<size_t>(it->length(0));
                        if (!shadowed(occs, i, start, end, false)) {
                            score.raw_score = 1.0;
                            score.method = Method::Regex;
                            break;
                        }
                    }
                    if (score.raw_score > 0.0) {
                        break;
                    }
                }
            }
        }

        if (score.raw_score == 0.0) {
            double best = 0.0;
            for (size_t li = 0; li < lines.size(); ++li) {
                size_t start = line_start[li];
                if (shadowed(occs, i, start, start + lines[li].size(), false)) {
                    continue;
                }
                for (const auto& name : compiled_[i].names) {
                    best = std::max(best, text::similarity(lines[li], name));
                }
            }
            if (best >= options_.fuzzy_threshold) {
                score.raw_score = best;
                score.method = Method::Fuzzy;
            }
        }

        if (score.raw_score == 0.0) {
            continue;
        }

        // Сигналы обложки только для таблиц, уже найденных в тексте
        if (const auto& scope = specs_[i].scope; scope.has_value()) {
            if (cover_dept && cover_unit) {
                score.raw_score -= options_.conflict_penalty;
            } else if ((*scope == "部门" && cover_dept) || (*scope == "单位" && cover_unit)) {
                score.raw_score += options_.cover_bonus;
            }
        }
        score.confidence = std::clamp(score.raw_score / 3.0, 0.0, 1.0);
        result.scores.push_back(score);
    }

    std::stable_sort(result.scores.begin(), result.scores.end(),
                     [](const SpecScore& a, const SpecScore& b) { return a.raw_score > b.raw_score; });

    if (!result.scores.empty() && result.scores.front().raw_score >= options_.min_score) {
        const auto& top = result.scores.front();
        result.matched = true;
        result.spec_index = top.spec_index;
        result.raw_score = top.raw_score;
        result.confidence = top.confidence;
        result.method = top.method;
    }
    return result;
}

// ============================================================================
// locate
// ============================================================================

namespace {

bool contains(std::string_view s, std::string_view needle) {
    return s.find(needle) != std::string_view::npos;
}

bool is_non_table_page(std::string_view s) {
    return contains(s, "目录") || contains(s, "名词解释") || contains(s, "情况说明");
}

bool is_table_page(std::string_view s) {
    return contains(s, "单位：") || contains(s, "单位:") || contains(s, "本表反映");
}

std::vector<std::string> utf8_lines(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t nl = s.find('\n', start);
        std::string line = s.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        out.push_back(text::trim(line));
        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }
    return out;
}

std::vector<std::string> last_non_empty(const std::vector<std::string>& lines, size_t end, size_t n) {
    std::vector<std::string> out;
    for (size_t i = end; i > 0 && out.size() < n; --i) {
        if (!lines[i - 1].empty()) {
            out.insert(out.begin(), lines[i - 1]);
        }
    }
    return out;
}

std::vector<std::string> first_non_empty(const std::vector<std::string>& lines, size_t n) {
    std::vector<std::string> out;
    for (const auto& l : lines) {
        if (out.size() >= n) {
            break;
        }
        if (!l.empty()) {
            out.push_back(l);
        }
    }
    return out;
}

/// Заголовок для вывода: строки через пробел
std::string display_title(const std::string& title) {
    std::string out = title;
    std::replace(out.begin(), out.end(), '\n', ' ');
    return out;
}

std::string join(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += lines[i];
    }
    return out;
}

/// Заголовочная область: строки над строкой "单位："
std::vector<std::string> title_region(const std::vector<std::string>& lines, size_t n) {
    for (size_t i = 0; i < lines.size(); ++i) {
        size_t pos = lines[i].find("单位：");
        if (pos == std::string::npos) {
            pos = lines[i].find("单位:");
        }
        if (pos == std::string::npos) {
            continue;
        }
        auto region = last_non_empty(lines, i, n);
        // Заголовок в одной строке с "单位："
        std::string head = text::trim(lines[i].substr(0, pos));
        if (!head.empty()) {
            region.push_back(head);
        }
        return region;
    }
    return first_non_empty(lines, n);
}

}  // namespace

std::vector<TableLocation> TableMatcher::locate(const document::Document& doc) const {
    std::string cover = text::prefix(doc.full_text(), options_.cover_chars);
    std::map<size_t, TableLocation> best;

    auto record = [&](const MatchResult& r, int page, const std::string& title) {
        for (const auto& s : r.scores) {
            if (s.raw_score < options_.min_score) {
                continue;
            }
            TableLocation loc{s.spec_index, page, s.raw_score, s.confidence, s.method, title};
            auto it = best.find(s.spec_index);
            if (it == best.end()) {
                best.emplace(s.spec_index, std::move(loc));
            } else if (loc.confidence > it->second.confidence ||
                       (loc.confidence == it->second.confidence && loc.page < it->second.page)) {
                it->second = std::move(loc);
            }
        }
    };

    for (size_t pi = 0; pi < doc.pages.size(); ++pi) {
        const auto& page = doc.pages[pi];
        if (is_non_table_page(page.text) || !is_table_page(page.text)) {
            continue;
        }

        auto lines = utf8_lines(page.text);
        auto region = title_region(lines, options_.title_lines);
        if (region.empty() && pi > 0) {
            // Заголовок внизу предыдущей страницы
            auto prev = utf8_lines(doc.pages[pi - 1].text);
            region = last_non_empty(prev, prev.size(), options_.title_lines);
        }

        std::string title = join(region);
        MatchResult r = match(title, cover);
        if (!r.matched && pi + 1 < doc.pages.size()) {
            // Заголовок, разорванный переносом страницы
            auto next = first_non_empty(utf8_lines(doc.pages[pi + 1].text), options_.title_lines);
            title = join(region) + "\n" + join(next);
            r = match(title, cover);
        }
        if (r.matched) {
            record(r, page.number, display_title(title));
        }
    }

    for (const auto& t : doc.tables) {
        if (!t.title.has_value()) {
            continue;
        }
        MatchResult r = match(*t.title, cover);
        if (r.matched) {
            record(r, t.page, *t.title);
        }
    }

    std::vector<TableLocation> out;
    out.reserve(best.size());
    for (auto& [idx, loc] : best) {
        out.push_back(std::move(loc));
    }
    return out;
}

}  // namespace budgetaudit::table
