// ==============================================================================
// budgetaudit/job.hpp - Оркестратор заданий
// ==============================================================================
//
// Назначение:
// - Job: статус, прогресс, закреплённая версия набора правил, результат
// - Ограниченный пул рабочих потоков, одно задание на поток
// - Внутри задания детектор правил и AI-детектор работают параллельно;
//   слияние начинается только после завершения обоих (барьер на futures)
// - Изоляция детекторов: отказ одного не прерывает задание
// - Отмена: токен передаётся в вызовы провайдеров, задание сразу
//   переходит в терминальный error
//
// Все изменения Job выполняет оркестратор под mutex задания; читатели
// получают только копии.
//
// ==============================================================================

#ifndef BUDGETAUDIT_JOB_HPP
#define BUDGETAUDIT_JOB_HPP

#include "budgetaudit/cancel.hpp"
#include "budgetaudit/document.hpp"
#include "budgetaudit/engine.hpp"
#include "budgetaudit/extractor.hpp"
#include "budgetaudit/issue.hpp"
#include "budgetaudit/merge.hpp"
#include "budgetaudit/output.hpp"
#include "budgetaudit/rule.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <rapidjson/document.h>

namespace budgetaudit::job {

// ============================================================================
// Состояния
// ============================================================================

enum class Status { Queued, Processing, Done, Error };

enum class DetectorStatus { Pending, Running, Done, Failed, Disabled, Cancelled };

std::string to_string(Status s);
std::string to_string(DetectorStatus s);

bool is_terminal(Status s);

/// Сведения о детекторе в задании
struct DetectorInfo {
    DetectorStatus status = DetectorStatus::Pending;
    std::string error;
    size_t findings = 0;
    long elapsed_ms = 0;
    bool degraded = false;
    std::optional<ai::Meta> ai_meta;
    std::vector<engine::Skipped> skipped;
};

struct Stage {
    std::string name;
    int weight = 0;
    bool done = false;
};

struct Job {
    std::string id;
    Status status = Status::Queued;
    int progress = 0;
    std::shared_ptr<const document::Document> document;
    std::shared_ptr<const rule::RuleSet> rule_set;
    std::optional<merge::MergedResult> result;
    std::optional<std::string> error;
    DetectorInfo rule_detector;
    DetectorInfo ai_detector;
    std::vector<Stage> stages;
    std::string created_at;
    std::string updated_at;
};

struct StatusView {
    Status status = Status::Queued;
    int progress = 0;
};

// ============================================================================
// Детекторы
// ============================================================================

struct DetectorOutput {
    std::vector<issue::Finding> findings;
    bool cancelled = false;
    bool degraded = false;
    std::optional<ai::Meta> ai_meta;
    std::vector<engine::Skipped> skipped;
};

class Detector {
public:
    virtual ~Detector() = default;

    virtual std::string name() const = 0;

    /// Исключение означает отказ детектора
    virtual DetectorOutput run(const document::Document& doc, const rule::RuleSet& rules,
                               const cancel::CancelToken& cancel) = 0;
};

class RuleDetector : public Detector {
public:
    explicit RuleDetector(engine::RuleEngine engine) : engine_(std::move(engine)) {}

    std::string name() const override { return "rule"; }

    DetectorOutput run(const document::Document& doc, const rule::RuleSet& rules,
                       const cancel::CancelToken& cancel) override;

private:
    engine::RuleEngine engine_;
};

class AIDetector : public Detector {
public:
    explicit AIDetector(std::shared_ptr<ai::ExtractionClient> client) : client_(std::move(client)) {}

    std::string name() const override { return "ai"; }

    DetectorOutput run(const document::Document& doc, const rule::RuleSet& rules,
                       const cancel::CancelToken& cancel) override;

private:
    std::shared_ptr<ai::ExtractionClient> client_;
};

// ============================================================================
// Orchestrator
// ============================================================================

struct OrchestratorOptions {
    size_t workers = 2;
    bool rule_enabled = true;
    bool ai_enabled = true;
    bool merge_enabled = true;
    merge::MergeOptions merge;
};

class Orchestrator {
public:
    /// Детектор может быть nullptr - соответствующая сторона отключена
    Orchestrator(rule::RuleSetRegistry& registry, std::unique_ptr<Detector> rule_detector,
                 std::unique_ptr<Detector> ai_detector, OrchestratorOptions options = {},
                 output::Writer* writer = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Сохранить задание, закрепить текущую версию правил, поставить в очередь
    std::string submit(std::shared_ptr<const document::Document> document);

    std::optional<StatusView> status(const std::string& id) const;

    /// Копия задания
    std::optional<Job> snapshot(const std::string& id) const;

    std::optional<merge::MergedResult> result(const std::string& id) const;

    /// Ждать терминального состояния. second = задание завершено
    std::pair<std::optional<merge::MergedResult>, bool> wait_result(const std::string& id,
                                                                    std::chrono::milliseconds timeout) const;

    /// Отменить; false если задание не найдено
    bool cancel(const std::string& id);

    /// Отменить и удалить
    bool remove(const std::string& id);

    std::vector<std::string> list() const;

    /// Остановить рабочие потоки (задания в очереди отменяются)
    void shutdown();

private:
    struct Entry {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        Job job;
        cancel::CancelToken cancel;
    };

    std::shared_ptr<Entry> find(const std::string& id) const;
    void worker_loop();
    void process(const std::shared_ptr<Entry>& entry);
    void complete_stage(Entry& entry, const std::string& stage);
    void fail(Entry& entry, const std::string& message);

    rule::RuleSetRegistry& registry_;
    std::unique_ptr<Detector> rule_detector_;
    std::unique_ptr<Detector> ai_detector_;
    OrchestratorOptions options_;
    output::Writer* writer_;

    mutable std::mutex jobs_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> jobs_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::shared_ptr<Entry>> queue_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

/// Задание в JSON (результат - если есть)
void job_to_json(const Job& job, rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc);

}  // namespace budgetaudit::job

#endif  // BUDGETAUDIT_JOB_HPP
