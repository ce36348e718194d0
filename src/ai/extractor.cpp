// ==============================================================================
// extractor.cpp - Клиент AI-извлечения
// ==============================================================================

#include "budgetaudit/extractor.hpp"

#include "budgetaudit/relation.hpp"
#include "budgetaudit/text.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <future>
#include <optional>
#include <regex>

namespace budgetaudit::ai {

// ============================================================================
// Окна
// ============================================================================

WindowSplit split_windows(std::wstring_view text, const WindowOptions& options) {
    WindowSplit split;
    const size_t n = text.size();
    if (n == 0 || options.window_size == 0) {
        return split;
    }
    const size_t overlap = options.overlap < options.window_size ? options.overlap : 0;

    size_t start = 0;
    while (start < n) {
        if (options.max_windows > 0 && split.windows.size() == options.max_windows) {
            split.truncated = true;
            break;
        }
        size_t end = std::min(start + options.window_size, n);
        // Следующее окно было бы короче min_window: хвост остаётся в текущем
        if (end < n && (n - end) + overlap < options.min_window) {
            end = n;
        }

        Window w;
        w.index = split.windows.size();
        w.start = start;
        w.end = end;
        w.text = std::wstring(text.substr(start, end - start));
        split.windows.push_back(std::move(w));

        if (end == n) {
            break;
        }
        start = end - overlap;
    }
    return split;
}

std::string build_prompt(std::string_view task, std::string_view window_text) {
    std::string prompt;
    prompt += "任务：";
    prompt += task;
    prompt += "\n请找出文本中的“年初预算数 / 决算数 / 决算数与预算数比较结论”三元组，"
              "以及结论后的主要原因说明（如有）。区间按字符计，相对于下列文本。\n文本：\n<<<\n";
    prompt += window_text;
    prompt += "\n>>>";
    return prompt;
}

// ============================================================================
// Проверка ответа
// ============================================================================

namespace {

bool span_matches(const Span& span, const std::string& claimed, std::wstring_view window) {
    if (span.first >= span.second || span.second > window.size()) {
        return false;
    }
    return window.substr(span.first, span.second - span.first) == text::widen(claimed);
}

/// Единица в тексте суммы или сразу после её span
bool carries_unit(const std::string& amount, const Span& span, std::wstring_view window) {
    if (relation::has_unit(amount)) {
        return true;
    }
    size_t pos = span.second;
    while (pos < window.size() && text::is_space(window[pos])) {
        ++pos;
    }
    std::wstring_view rest = window.substr(std::min(pos, window.size()));
    return rest.rfind(L"万元", 0) == 0 || rest.rfind(L"亿元", 0) == 0 || rest.rfind(L"元", 0) == 0;
}

size_t overlap_len(const Span& a, const Span& b) {
    size_t lo = std::max(a.first, b.first);
    size_t hi = std::min(a.second, b.second);
    return hi > lo ? hi - lo : 0;
}

}  // anonymous namespace

Validation validate_hit(const Hit& hit, std::wstring_view window) {
    Validation v;
    if (!span_matches(hit.budget_span, hit.budget_text, window)) {
        v.reason = "budget span does not match text";
        return v;
    }
    if (!span_matches(hit.final_span, hit.final_text, window)) {
        v.reason = "final span does not match text";
        return v;
    }
    if (!span_matches(hit.stmt_span, hit.stmt_text, window)) {
        v.reason = "statement span does not match text";
        return v;
    }
    if (hit.reason_text) {
        bool found = hit.reason_span ? span_matches(*hit.reason_span, *hit.reason_text, window)
                                     : window.find(text::widen(*hit.reason_text)) != std::wstring_view::npos;
        if (!found) {
            v.reason = "reason span does not match text";
            return v;
        }
        if (hit.reason_text->find("原因") == std::string::npos) {
            v.reason = "reason does not mention 原因";
            return v;
        }
    }

    if (!relation::parse_amount(hit.budget_text) || !relation::parse_amount(hit.final_text)) {
        v.reason = "amount without number";
        return v;
    }
    if (!carries_unit(hit.budget_text, hit.budget_span, window) ||
        !carries_unit(hit.final_text, hit.final_span, window)) {
        v.reason = "amount without unit";
        return v;
    }
    if (!relation::is_statement(hit.stmt_text)) {
        v.reason = "statement is not a budget/final comparison";
        return v;
    }

    size_t shorter = std::min(hit.budget_span.second - hit.budget_span.first,
                              hit.final_span.second - hit.final_span.first);
    if (overlap_len(hit.budget_span, hit.final_span) * 10 > shorter * 8) {
        v.reason = "budget and final spans overlap";
        return v;
    }

    v.ok = true;
    return v;
}

bool is_noise(std::string_view justification) {
    static const std::wregex noise_re(L"出现多次|重复出现|多次出现|出现\\s*\\d+\\s*次");
    if (justification.empty()) {
        return false;
    }
    std::wstring w = text::widen(justification);
    return std::regex_search(w, noise_re);
}

// ============================================================================
// ExtractionClient
// ============================================================================

namespace {

struct Candidate {
    relation::Pair pair;
    int page = 0;
    size_t stmt_global = 0;
};

bool same_numbers(const relation::Pair& a, const relation::Pair& b) {
    return std::fabs(a.budget - b.budget) <= text::dynamic_tolerance(a.budget, b.budget) &&
           std::fabs(a.final_value - b.final_value) <= text::dynamic_tolerance(a.final_value, b.final_value);
}

}  // anonymous namespace

ExtractionClient::ExtractionClient(ResilientExtractor& extractor, ClientOptions options,
                                   output::Writer* writer)
    : extractor_(extractor), options_(std::move(options)), writer_(writer) {}

ExtractionResult ExtractionClient::run(const document::Document& doc,
                                       const cancel::CancelToken* cancel) {
    auto started = std::chrono::steady_clock::now();
    ExtractionResult result;

    std::wstring full = text::widen(doc.full_text());
    std::wstring section_text = full;
    size_t section_offset = 0;
    std::optional<std::string> heading;

    if (!options_.section_start.empty()) {
        auto start_re = document::compile_line_pattern(options_.section_start);
        auto end_re = document::compile_line_pattern(options_.section_end.empty() ? "$^" : options_.section_end);
        if (auto section = document::find_section(full, start_re, end_re)) {
            section_text = std::move(section->text);
            section_offset = section->start;
            heading = text::trim(text::narrow(section_text.substr(0, section_text.find(L'\n'))));
        } else if (writer_ != nullptr) {
            writer_->debug("ai: section not found, using full text");
        }
    }

    WindowSplit split = split_windows(section_text, options_.windows);
    result.meta.windows = split.windows.size();
    result.meta.truncated = split.truncated;
    if (split.truncated && writer_ != nullptr) {
        writer_->warn("ai: text truncated to " + std::to_string(split.windows.size()) + " windows");
    }

    // ------------------------------------------------------------------------
    // Параллельные вызовы: пул из concurrency исполнителей
    // ------------------------------------------------------------------------

    const size_t n = split.windows.size();
    std::vector<ExtractOutcome> outcomes(n);
    std::atomic<size_t> next{0};
    auto worker = [&] {
        for (size_t i = next.fetch_add(1); i < n; i = next.fetch_add(1)) {
            if (cancel != nullptr && cancel->cancelled()) {
                outcomes[i].cancelled = true;
                continue;
            }
            const Window& w = split.windows[i];
            ExtractRequest request;
            request.task = options_.task;
            request.section_text = text::narrow(w.text);
            request.doc_hash = text::content_hash(request.section_text);
            request.max_windows = options_.windows.max_windows;
            request.prompt = build_prompt(options_.task, request.section_text);
            outcomes[i] = extractor_.extract(request, cancel);
        }
    };

    size_t workers = std::min(std::max<size_t>(options_.concurrency, 1), n);
    std::vector<std::future<void>> futures;
    for (size_t i = 0; i < workers; ++i) {
        futures.push_back(std::async(std::launch::async, worker));
    }
    for (auto& f : futures) {
        f.get();
    }

    // ------------------------------------------------------------------------
    // Проверка и дедупликация (в порядке окон)
    // ------------------------------------------------------------------------

    document::PageMap pages(doc);
    auto anchor = relation::items_anchor(section_text);
    std::vector<Candidate> candidates;

    for (size_t i = 0; i < n; ++i) {
        const Window& w = split.windows[i];
        const ExtractOutcome& o = outcomes[i];
        if (o.cancelled) {
            result.cancelled = true;
            continue;
        }

        result.meta.tokens_used += o.response.tokens_used;
        result.meta.fell_back = result.meta.fell_back || o.fell_back;
        result.meta.regex_fallback = result.meta.regex_fallback || o.regex_fallback;
        result.meta.provider_stats.push_back(ProviderStat{i, o.used_tier.value_or(Tier::Fallback), o.provider,
                                                          o.fell_back, o.regex_fallback, o.attempts});

        for (const auto& hit : o.response.hits) {
            if (is_noise(hit.note)) {
                ++result.meta.noise_suppressed;
                continue;
            }
            auto valid = validate_hit(hit, w.text);
            if (!valid) {
                ++result.meta.validation_failures;
                if (writer_ != nullptr) {
                    writer_->trace("ai: hit dropped in window " + std::to_string(i) + ": " + valid.reason);
                }
                continue;
            }

            relation::Pair p;
            p.budget_text = hit.budget_text;
            p.final_text = hit.final_text;
            p.stmt_text = hit.stmt_text;
            p.budget = *relation::parse_amount(hit.budget_text);
            p.final_value = *relation::parse_amount(hit.final_text);
            p.budget_span = {w.start + hit.budget_span.first, w.start + hit.budget_span.second};
            p.final_span = {w.start + hit.final_span.first, w.start + hit.final_span.second};
            p.stmt_span = {w.start + hit.stmt_span.first, w.start + hit.stmt_span.second};
            p.match_start = std::min({p.budget_span.first, p.final_span.first, p.stmt_span.first});
            p.match_end = std::max({p.budget_span.second, p.final_span.second, p.stmt_span.second});
            p.reason_text = hit.reason_text;
            p.item_title = hit.item_title;
            p.in_items = anchor.has_value() && p.stmt_span.first > *anchor;
            p.clip = hit.clip.empty()
                         ? text::narrow(section_text.substr(p.match_start, p.match_end - p.match_start))
                         : hit.clip;
            p.origin = "ai";
            p.confidence = issue::clamp_confidence(hit.confidence);

            Candidate cand;
            cand.stmt_global = section_offset + p.stmt_span.first;
            cand.page = pages.page_at(cand.stmt_global);
            cand.pair = std::move(p);

            // Дубликат: тот же span вывода или почти тот же фрагмент на соседних страницах
            auto dup = std::find_if(candidates.begin(), candidates.end(), [&](const Candidate& c) {
                if (c.pair.stmt_span == cand.pair.stmt_span) {
                    return true;
                }
                return std::abs(c.page - cand.page) <= options_.dedup_page_tolerance &&
                       same_numbers(c.pair, cand.pair) &&
                       text::similarity(text::widen(c.pair.clip), text::widen(cand.pair.clip)) >=
                           options_.dedup_similarity;
            });
            if (dup == candidates.end()) {
                candidates.push_back(std::move(cand));
                continue;
            }
            ++result.meta.duplicates;
            if (cand.pair.confidence > dup->pair.confidence) {
                *dup = std::move(cand);
            }
        }
    }

    // ------------------------------------------------------------------------
    // Находки
    // ------------------------------------------------------------------------

    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& a, const Candidate& b) { return a.stmt_global < b.stmt_global; });

    size_t seq = 0;
    for (const auto& c : candidates) {
        relation::IssueContext ctx;
        ctx.rule_id = options_.rule_id;
        ctx.category = options_.category;
        ctx.source = issue::Source::AI;
        ctx.mismatch_severity = options_.mismatch_severity;
        ctx.missing_reason_severity = options_.missing_reason_severity;
        ctx.page = c.page;
        size_t in_page = pages.offset_in_page(c.stmt_global);
        ctx.span = std::make_pair(in_page, in_page + (c.pair.stmt_span.second - c.pair.stmt_span.first));
        ctx.section = heading;

        for (auto& is : relation::pair_issues(c.pair, ctx)) {
            is.id = "A-" + options_.rule_id + "-" + std::to_string(++seq);
            is.tags.insert("ai");
            result.findings.push_back(issue::AIFinding{std::move(is)});
        }
    }

    result.meta.elapsed_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                   std::chrono::steady_clock::now() - started)
                                                   .count());
    if (writer_ != nullptr) {
        writer_->debug("ai: windows " + std::to_string(n) + ", findings " +
                       std::to_string(result.findings.size()) + ", validation failures " +
                       std::to_string(result.meta.validation_failures));
    }
    return result;
}

// ============================================================================
// JSON
// ============================================================================

void meta_to_json(const Meta& meta, rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) {
    out.SetObject();
    out.AddMember("tokensUsed", static_cast<uint64_t>(meta.tokens_used), alloc);
    out.AddMember("elapsedMs", static_cast<int64_t>(meta.elapsed_ms), alloc);

    rapidjson::Value stats(rapidjson::kArrayType);
    for (const auto& s : meta.provider_stats) {
        rapidjson::Value v(rapidjson::kObjectType);
        v.AddMember("window", static_cast<uint64_t>(s.window), alloc);
        std::string tier = to_string(s.tier);
        v.AddMember("tier", rapidjson::Value(tier.c_str(), alloc), alloc);
        v.AddMember("provider", rapidjson::Value(s.provider.c_str(), alloc), alloc);
        v.AddMember("fellBack", s.fell_back, alloc);
        v.AddMember("regexFallback", s.regex_fallback, alloc);
        v.AddMember("attempts", s.attempts, alloc);
        stats.PushBack(v, alloc);
    }
    out.AddMember("providerStats", stats, alloc);

    out.AddMember("windows", static_cast<uint64_t>(meta.windows), alloc);
    out.AddMember("validationFailures", static_cast<uint64_t>(meta.validation_failures), alloc);
    out.AddMember("noiseSuppressed", static_cast<uint64_t>(meta.noise_suppressed), alloc);
    out.AddMember("duplicates", static_cast<uint64_t>(meta.duplicates), alloc);
    out.AddMember("truncated", meta.truncated, alloc);
    out.AddMember("fellBack", meta.fell_back, alloc);
    out.AddMember("regexFallback", meta.regex_fallback, alloc);
}

}  // namespace budgetaudit::ai
