// ==============================================================================
// resilience.cpp - Отказоустойчивая цепочка провайдеров
// ==============================================================================

#include "budgetaudit/resilience.hpp"

#include <algorithm>

namespace budgetaudit::ai {

namespace {

long elapsed_ms(Clock::time_point since) {
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count());
}

}  // anonymous namespace

ResilientExtractor::ResilientExtractor(std::vector<std::unique_ptr<Provider>> chain,
                                       ResilienceOptions options, output::Writer* writer)
    : chain_(std::move(chain)), options_(options), writer_(writer) {
    options_.network_retries = std::clamp(options_.network_retries, 0, MAX_NETWORK_RETRIES);
    for (const auto& p : chain_) {
        ProviderState st;
        st.tier = p->tier();
        st.name = p->name();
        st.model_id = p->model_id();
        st.available = p->available();
        states_.push_back(std::move(st));
    }
    if (options_.start_probe) {
        start_probe();
    }
}

ResilientExtractor::~ResilientExtractor() { stop_probe(); }

// ----------------------------------------------------------------------------
// Здоровье
// ----------------------------------------------------------------------------

bool ResilientExtractor::is_alive(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_[index].alive;
}

void ResilientExtractor::record_success(size_t index, long latency_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& st = states_[index];
    st.alive = true;
    st.consecutive_failures = 0;
    st.last_latency_ms = latency_ms;
    st.last_attempt = Clock::now();
    ++st.successes;
}

void ResilientExtractor::record_failure(size_t index, long latency_ms, const ProviderError& error) {
    bool tripped = false;
    std::string name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& st = states_[index];
        st.last_latency_ms = latency_ms;
        st.last_attempt = Clock::now();
        ++st.failures;
        ++st.consecutive_failures;
        if (st.alive && st.consecutive_failures >= options_.failure_threshold) {
            st.alive = false;
            tripped = true;
        }
        name = st.name;
    }
    if (writer_ != nullptr) {
        writer_->debug("provider " + name + " failed: " + error.format());
        if (tripped) {
            writer_->warn("provider " + name + " marked as down");
        }
    }
}

std::vector<ProviderState> ResilientExtractor::health() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_;
}

size_t ResilientExtractor::probe_once(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t restored = 0;
    for (auto& st : states_) {
        if (st.alive) {
            continue;
        }
        if (!st.last_attempt || now - *st.last_attempt >= options_.reprobe_after) {
            // Полуоткрытое состояние: одна неудача снова выключит провайдер
            st.alive = true;
            st.consecutive_failures = std::max(0, options_.failure_threshold - 1);
            ++restored;
        }
    }
    return restored;
}

void ResilientExtractor::start_probe() {
    if (probe_thread_.joinable()) {
        return;
    }
    probe_stop_ = cancel::CancelToken{};
    cancel::CancelToken stop = probe_stop_;
    probe_thread_ = std::thread([this, stop] {
        while (!stop.wait_for(options_.probe_interval)) {
            size_t restored = probe_once(Clock::now());
            if (restored > 0 && writer_ != nullptr) {
                writer_->debug("health probe restored " + std::to_string(restored) + " provider(s)");
            }
        }
    });
}

void ResilientExtractor::stop_probe() {
    probe_stop_.cancel();
    if (probe_thread_.joinable()) {
        probe_thread_.join();
    }
}

// ----------------------------------------------------------------------------
// extract
// ----------------------------------------------------------------------------

ExtractOutcome ResilientExtractor::extract(const ExtractRequest& request,
                                           const cancel::CancelToken* cancel) {
    ExtractOutcome outcome;

    for (size_t i = 0; i < chain_.size(); ++i) {
        Provider& provider = *chain_[i];
        if (!provider.available()) {
            outcome.errors.push_back(ProviderError{ErrorKind::Unavailable, 0, provider.name() + ": no API key"});
            continue;
        }
        if (!is_alive(i)) {
            continue;
        }

        int retries = 0;
        while (true) {
            if (cancel != nullptr && cancel->cancelled()) {
                outcome.cancelled = true;
                return outcome;
            }

            auto started = Clock::now();
            ++outcome.attempts;
            ProviderResult result = provider.extract(request, cancel);
            long latency = elapsed_ms(started);

            if (result.ok) {
                record_success(i, latency);
                outcome.response = std::move(result.response);
                outcome.used_tier = provider.tier();
                outcome.provider = provider.name();
                outcome.fell_back = i > 0;
                return outcome;
            }
            if (result.error.kind == ErrorKind::Cancelled) {
                outcome.cancelled = true;
                return outcome;
            }

            outcome.errors.push_back(result.error);
            if (result.error.kind == ErrorKind::Network && retries < options_.network_retries) {
                ++retries;
                continue;
            }
            record_failure(i, latency, result.error);
            break;
        }
    }

    if (cancel != nullptr && cancel->cancelled()) {
        outcome.cancelled = true;
        return outcome;
    }

    // Цепочка исчерпана
    ProviderResult fallback = fallback_.extract(request, cancel);
    if (!fallback.ok) {
        outcome.cancelled = fallback.error.kind == ErrorKind::Cancelled;
        outcome.errors.push_back(fallback.error);
        return outcome;
    }
    ++outcome.attempts;
    outcome.response = std::move(fallback.response);
    outcome.used_tier = Tier::Fallback;
    outcome.provider = fallback_.name();
    outcome.fell_back = true;
    outcome.regex_fallback = true;
    if (writer_ != nullptr && !chain_.empty()) {
        writer_->debug("provider chain exhausted, using regex fallback");
    }
    return outcome;
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

void health_to_json(const std::vector<ProviderState>& states, rapidjson::Value& out,
                    rapidjson::Document::AllocatorType& alloc) {
    out.SetArray();
    for (const auto& st : states) {
        rapidjson::Value v(rapidjson::kObjectType);
        std::string tier = to_string(st.tier);
        v.AddMember("tier", rapidjson::Value(tier.c_str(), alloc), alloc);
        v.AddMember("name", rapidjson::Value(st.name.c_str(), alloc), alloc);
        v.AddMember("modelId", rapidjson::Value(st.model_id.c_str(), alloc), alloc);
        v.AddMember("available", st.available, alloc);
        v.AddMember("alive", st.alive, alloc);
        v.AddMember("consecutiveFailures", st.consecutive_failures, alloc);
        v.AddMember("lastLatencyMs", static_cast<int64_t>(st.last_latency_ms), alloc);
        v.AddMember("successes", static_cast<uint64_t>(st.successes), alloc);
        v.AddMember("failures", static_cast<uint64_t>(st.failures), alloc);
        out.PushBack(v, alloc);
    }
}

}  // namespace budgetaudit::ai
