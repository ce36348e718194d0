// ==============================================================================
// budgetaudit/resilience.hpp - Отказоустойчивая цепочка провайдеров
// ==============================================================================
//
// Назначение:
// - Статический порядок: primary -> backup -> disaster-primary -> disaster-backup
// - Учёт здоровья провайдера (ProviderState) под собственным mutex
// - Немедленный повтор при сетевой ошибке (network_retries), без повторов
//   в остальных случаях
// - Ответ не первого провайдера цепочки -> fell_back = true
// - Исчерпание цепочки -> RegexFallbackProvider, regex_fallback = true
// - Полуоткрытая проба: фоновый поток возвращает alive = true провайдерам,
//   которых давно не пробовали
//
// Отмена не меняет состояние здоровья провайдеров.
//
// ==============================================================================

#ifndef BUDGETAUDIT_RESILIENCE_HPP
#define BUDGETAUDIT_RESILIENCE_HPP

#include "budgetaudit/cancel.hpp"
#include "budgetaudit/output.hpp"
#include "budgetaudit/provider.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <rapidjson/document.h>

namespace budgetaudit::ai {

using Clock = std::chrono::steady_clock;

/// Здоровье одного провайдера цепочки
struct ProviderState {
    Tier tier = Tier::Primary;
    std::string name;
    std::string model_id;
    bool available = true;  // ключ задан
    bool alive = true;
    int consecutive_failures = 0;
    long last_latency_ms = 0;
    std::optional<Clock::time_point> last_attempt;
    size_t successes = 0;
    size_t failures = 0;
};

/// Не больше одного немедленного повтора в пределах одного уровня
constexpr int MAX_NETWORK_RETRIES = 1;

struct ResilienceOptions {
    int failure_threshold = 3;
    int network_retries = 1;  // немедленные повторы при сетевой ошибке
    std::chrono::milliseconds probe_interval{30000};
    std::chrono::milliseconds reprobe_after{60000};
    bool start_probe = true;
};

struct ExtractOutcome {
    ExtractResponse response;
    std::optional<Tier> used_tier;  // nullopt только при отмене
    std::string provider;
    bool fell_back = false;       // ответил не первый провайдер цепочки
    bool regex_fallback = false;  // цепочка исчерпана
    bool cancelled = false;
    int attempts = 0;
    std::vector<ProviderError> errors;
};

class ResilientExtractor {
public:
    ResilientExtractor(std::vector<std::unique_ptr<Provider>> chain, ResilienceOptions options = {},
                       output::Writer* writer = nullptr);
    ~ResilientExtractor();

    ResilientExtractor(const ResilientExtractor&) = delete;
    ResilientExtractor& operator=(const ResilientExtractor&) = delete;

    /// Пройти цепочку; никогда не возвращается с пустыми руками, кроме отмены
    ExtractOutcome extract(const ExtractRequest& request, const cancel::CancelToken* cancel = nullptr);

    /// Копия состояния всех провайдеров
    std::vector<ProviderState> health() const;

    /// Полуоткрытая проба: вернуть alive провайдерам, не опрашиваемым reprobe_after.
    /// Возвращает число восстановленных
    size_t probe_once(Clock::time_point now);

    void start_probe();
    void stop_probe();

    const ResilienceOptions& options() const { return options_; }

private:
    bool is_alive(size_t index) const;
    void record_success(size_t index, long latency_ms);
    void record_failure(size_t index, long latency_ms, const ProviderError& error);

    std::vector<std::unique_ptr<Provider>> chain_;
    RegexFallbackProvider fallback_;
    ResilienceOptions options_;
    output::Writer* writer_;

    mutable std::mutex mutex_;
    std::vector<ProviderState> states_;

    std::thread probe_thread_;
    cancel::CancelToken probe_stop_;
};

/// Снимок здоровья в JSON
void health_to_json(const std::vector<ProviderState>& states, rapidjson::Value& out,
                    rapidjson::Document::AllocatorType& alloc);

}  // namespace budgetaudit::ai

#endif  // BUDGETAUDIT_RESILIENCE_HPP
