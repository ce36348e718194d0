// ==============================================================================
// orchestrator.cpp - Оркестратор заданий
// ==============================================================================

#include "budgetaudit/job.hpp"

#include "budgetaudit/platform.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

namespace budgetaudit::job {

std::string to_string(Status s) {
    switch (s) {
    case Status::Queued:
        return "queued";
    case Status::Processing:
        return "processing";
    case Status::Done:
        return "done";
    case Status::Error:
        return "error";
    }
    return "unknown";
}

std::string to_string(DetectorStatus s) {
    switch (s) {
    case DetectorStatus::Pending:
        return "pending";
    case DetectorStatus::Running:
        return "running";
    case DetectorStatus::Done:
        return "done";
    case DetectorStatus::Failed:
        return "failed";
    case DetectorStatus::Disabled:
        return "disabled";
    case DetectorStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

bool is_terminal(Status s) { return s == Status::Done || s == Status::Error; }

// ============================================================================
// Детекторы
// ============================================================================

DetectorOutput RuleDetector::run(const document::Document& doc, const rule::RuleSet& rules,
                                 const cancel::CancelToken& cancel) {
    auto evaluation = engine_.evaluate(doc, rules, &cancel);

    DetectorOutput out;
    out.cancelled = evaluation.cancelled;
    out.skipped = std::move(evaluation.skipped);
    for (auto& f : evaluation.findings) {
        out.findings.emplace_back(std::move(f));
    }
    return out;
}

DetectorOutput AIDetector::run(const document::Document& doc, const rule::RuleSet&,
                               const cancel::CancelToken& cancel) {
    auto extraction = client_->run(doc, &cancel);

    DetectorOutput out;
    out.cancelled = extraction.cancelled;
    out.degraded = extraction.meta.regex_fallback;
    out.ai_meta = extraction.meta;
    for (auto& f : extraction.findings) {
        out.findings.emplace_back(std::move(f));
    }
    return out;
}

// ============================================================================
// Orchestrator
// ============================================================================

namespace {

const char* STAGE_HANDOFF = "extraction-handoff";
const char* STAGE_RULES = "rule-evaluation";
const char* STAGE_AI = "ai-extraction";
const char* STAGE_MERGE = "merge";

std::vector<Stage> initial_stages() {
    return {{STAGE_HANDOFF, 10, false}, {STAGE_RULES, 30, false}, {STAGE_AI, 40, false}, {STAGE_MERGE, 20, false}};
}

}  // anonymous namespace

Orchestrator::Orchestrator(rule::RuleSetRegistry& registry, std::unique_ptr<Detector> rule_detector,
                           std::unique_ptr<Detector> ai_detector, OrchestratorOptions options,
                           output::Writer* writer)
    : registry_(registry),
      rule_detector_(std::move(rule_detector)),
      ai_detector_(std::move(ai_detector)),
      options_(options),
      writer_(writer) {
    size_t n = options_.workers == 0 ? 1 : options_.workers;
    for (size_t i = 0; i < n; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

Orchestrator::~Orchestrator() { shutdown(); }

std::shared_ptr<Orchestrator::Entry> Orchestrator::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

// ----------------------------------------------------------------------------
// Публичные операции
// ----------------------------------------------------------------------------

std::string Orchestrator::submit(std::shared_ptr<const document::Document> document) {
    auto entry = std::make_shared<Entry>();
    entry->job.id = platform::generate_uuid();
    entry->job.document = std::move(document);
    entry->job.rule_set = registry_.current();
    entry->job.stages = initial_stages();
    entry->job.created_at = platform::now_iso8601();
    entry->job.updated_at = entry->job.created_at;
    std::string id = entry->job.id;

    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        jobs_[id] = entry;
    }

    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!stopping_) {
            queue_.push_back(entry);
            accepted = true;
        }
    }
    if (!accepted) {
        fail(*entry, "orchestrator is stopped");
        return id;
    }
    queue_cv_.notify_one();

    if (writer_ != nullptr) {
        writer_->debug("job " + id + " queued (rules " + entry->job.rule_set->version + ")");
    }
    return id;
}

std::optional<StatusView> Orchestrator::status(const std::string& id) const {
    auto entry = find(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return StatusView{entry->job.status, entry->job.progress};
}

std::optional<Job> Orchestrator::snapshot(const std::string& id) const {
    auto entry = find(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->job;
}

std::optional<merge::MergedResult> Orchestrator::result(const std::string& id) const {
    auto entry = find(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->job.result;
}

std::pair<std::optional<merge::MergedResult>, bool> Orchestrator::wait_result(
    const std::string& id, std::chrono::milliseconds timeout) const {
    auto entry = find(id);
    if (!entry) {
        return {std::nullopt, false};
    }
    std::unique_lock<std::mutex> lock(entry->mutex);
    bool done = entry->cv.wait_for(lock, timeout, [&] { return is_terminal(entry->job.status); });
    return {entry->job.result, done};
}

bool Orchestrator::cancel(const std::string& id) {
    auto entry = find(id);
    if (!entry) {
        return false;
    }
    entry->cancel.cancel();
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!is_terminal(entry->job.status)) {
            entry->job.status = Status::Error;
            entry->job.error = "cancelled";
            for (auto* info : {&entry->job.rule_detector, &entry->job.ai_detector}) {
                if (info->status == DetectorStatus::Pending || info->status == DetectorStatus::Running) {
                    info->status = DetectorStatus::Cancelled;
                }
            }
            entry->job.updated_at = platform::now_iso8601();
        }
    }
    entry->cv.notify_all();
    if (writer_ != nullptr) {
        writer_->debug("job " + id + " cancelled");
    }
    return true;
}

bool Orchestrator::remove(const std::string& id) {
    if (!cancel(id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    jobs_.erase(id);
    return true;
}

std::vector<std::string> Orchestrator::list() const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, entry] : jobs_) {
        ids.push_back(id);
    }
    return ids;
}

void Orchestrator::shutdown() {
    std::deque<std::shared_ptr<Entry>> pending;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        pending.swap(queue_);
    }
    queue_cv_.notify_all();

    for (const auto& id : list()) {
        cancel(id);
    }
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
    workers_.clear();
}

// ----------------------------------------------------------------------------
// Выполнение
// ----------------------------------------------------------------------------

void Orchestrator::worker_loop() {
    while (true) {
        std::shared_ptr<Entry> entry;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            entry = queue_.front();
            queue_.pop_front();
        }
        try {
            process(entry);
        } catch (const std::exception& e) {
            fail(*entry, e.what());
        }
    }
}

void Orchestrator::complete_stage(Entry& entry, const std::string& stage) {
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        if (is_terminal(entry.job.status)) {
            return;
        }
        int progress = 0;
        for (auto& s : entry.job.stages) {
            if (s.name == stage) {
                s.done = true;
            }
            if (s.done) {
                progress += s.weight;
            }
        }
        // Прогресс не убывает
        entry.job.progress = std::max(entry.job.progress, progress);
        entry.job.updated_at = platform::now_iso8601();
    }
    entry.cv.notify_all();
}

void Orchestrator::fail(Entry& entry, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        if (is_terminal(entry.job.status)) {
            return;
        }
        entry.job.status = Status::Error;
        entry.job.error = message;
        entry.job.updated_at = platform::now_iso8601();
    }
    entry.cv.notify_all();
    if (writer_ != nullptr) {
        writer_->warn("job " + entry.job.id + " failed: " + message);
    }
}

void Orchestrator::process(const std::shared_ptr<Entry>& entry) {
    std::shared_ptr<const document::Document> doc;
    std::shared_ptr<const rule::RuleSet> rules;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (is_terminal(entry->job.status)) {
            return;
        }
        entry->job.status = Status::Processing;
        entry->job.updated_at = platform::now_iso8601();
        doc = entry->job.document;
        rules = entry->job.rule_set;
    }

    if (!doc || doc->empty()) {
        fail(*entry, "extraction unavailable: document has no text");
        return;
    }
    complete_stage(*entry, STAGE_HANDOFF);

    // Один детектор в отдельном потоке; результат nullopt - отказ или отключён
    auto launch = [this, entry, doc, rules](Detector* detector, DetectorInfo Job::*slot,
                                            std::string stage) {
        return std::async(std::launch::async, [this, entry, doc, rules, detector, slot, stage]() {
            std::optional<DetectorOutput> out;
            if (detector == nullptr) {
                {
                    std::lock_guard<std::mutex> lock(entry->mutex);
                    (entry->job.*slot).status = DetectorStatus::Disabled;
                }
                complete_stage(*entry, stage);
                return out;
            }

            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                if (!is_terminal(entry->job.status)) {
                    (entry->job.*slot).status = DetectorStatus::Running;
                }
            }

            auto started = std::chrono::steady_clock::now();
            std::string error;
            try {
                out = detector->run(*doc, *rules, entry->cancel);
            } catch (const std::exception& e) {
                error = e.what();
            }
            long elapsed = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                 std::chrono::steady_clock::now() - started)
                                                 .count());

            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                if (!is_terminal(entry->job.status)) {
                    DetectorInfo& info = entry->job.*slot;
                    info.elapsed_ms = elapsed;
                    if (out) {
                        info.status = out->cancelled ? DetectorStatus::Cancelled : DetectorStatus::Done;
                        info.findings = out->findings.size();
                        info.degraded = out->degraded;
                        info.ai_meta = out->ai_meta;
                        info.skipped = out->skipped;
                    } else {
                        info.status = DetectorStatus::Failed;
                        info.error = error;
                    }
                }
            }
            if (!out && writer_ != nullptr) {
                writer_->warn(detector->name() + " detector failed: " + error);
            }
            complete_stage(*entry, stage);
            return out;
        });
    };

    Detector* rule_side = options_.rule_enabled ? rule_detector_.get() : nullptr;
    Detector* ai_side = options_.ai_enabled ? ai_detector_.get() : nullptr;
    auto rule_future = launch(rule_side, &Job::rule_detector, STAGE_RULES);
    auto ai_future = launch(ai_side, &Job::ai_detector, STAGE_AI);

    // Барьер: слияние только после обоих детекторов
    std::optional<DetectorOutput> rule_out = rule_future.get();
    std::optional<DetectorOutput> ai_out = ai_future.get();

    if (entry->cancel.cancelled()) {
        return;
    }

    bool rule_failed = rule_side != nullptr && !rule_out;
    bool ai_failed = ai_side != nullptr && !ai_out;
    if (!rule_out && !ai_out && (rule_failed || ai_failed)) {
        std::string message = "all detectors failed";
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (rule_failed) {
                message += "; rule: " + entry->job.rule_detector.error;
            }
            if (ai_failed) {
                message += "; ai: " + entry->job.ai_detector.error;
            }
        }
        fail(*entry, message);
        return;
    }

    std::vector<issue::RuleFinding> rule_findings;
    std::vector<issue::AIFinding> ai_findings;
    for (const auto* out : {&rule_out, &ai_out}) {
        if (!*out) {
            continue;
        }
        for (const auto& f : (*out)->findings) {
            if (const auto* r = std::get_if<issue::RuleFinding>(&f)) {
                rule_findings.push_back(*r);
            } else if (const auto* a = std::get_if<issue::AIFinding>(&f)) {
                ai_findings.push_back(*a);
            }
        }
    }

    merge::MergedResult merged = options_.merge_enabled
                                     ? merge::merge(rule_findings, ai_findings, options_.merge)
                                     : merge::concatenate(rule_findings, ai_findings);

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (is_terminal(entry->job.status)) {
            return;
        }
        for (auto& s : entry->job.stages) {
            s.done = true;
        }
        entry->job.result = std::move(merged);
        entry->job.progress = 100;
        entry->job.status = Status::Done;
        entry->job.updated_at = platform::now_iso8601();
    }
    entry->cv.notify_all();

    if (writer_ != nullptr) {
        writer_->debug("job " + entry->job.id + " done");
    }
}

// ============================================================================
// JSON
// ============================================================================

namespace {

rapidjson::Value str(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

rapidjson::Value detector_json(const DetectorInfo& info, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v(rapidjson::kObjectType);
    v.AddMember("status", str(to_string(info.status), alloc), alloc);
    if (!info.error.empty()) {
        v.AddMember("error", str(info.error, alloc), alloc);
    }
    v.AddMember("findings", static_cast<uint64_t>(info.findings), alloc);
    v.AddMember("elapsedMs", static_cast<int64_t>(info.elapsed_ms), alloc);
    v.AddMember("degraded", info.degraded, alloc);
    if (!info.skipped.empty()) {
        rapidjson::Value skipped(rapidjson::kArrayType);
        for (const auto& s : info.skipped) {
            rapidjson::Value item(rapidjson::kObjectType);
            item.AddMember("ruleId", str(s.rule_id, alloc), alloc);
            item.AddMember("reason", str(s.reason, alloc), alloc);
            skipped.PushBack(item, alloc);
        }
        v.AddMember("skipped", skipped, alloc);
    }
    if (info.ai_meta) {
        rapidjson::Value meta;
        ai::meta_to_json(*info.ai_meta, meta, alloc);
        v.AddMember("meta", meta, alloc);
    }
    return v;
}

}  // anonymous namespace

void job_to_json(const Job& job, rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) {
    out.SetObject();
    out.AddMember("id", str(job.id, alloc), alloc);
    out.AddMember("status", str(to_string(job.status), alloc), alloc);
    out.AddMember("progress", job.progress, alloc);
    if (job.document) {
        out.AddMember("documentId", str(job.document->id, alloc), alloc);
    }
    if (job.rule_set) {
        out.AddMember("ruleSetVersion", str(job.rule_set->version, alloc), alloc);
        out.AddMember("ruleSetProfile", str(job.rule_set->profile, alloc), alloc);
    }
    if (job.error) {
        out.AddMember("error", str(*job.error, alloc), alloc);
    }

    rapidjson::Value detectors(rapidjson::kObjectType);
    detectors.AddMember("rule", detector_json(job.rule_detector, alloc), alloc);
    detectors.AddMember("ai", detector_json(job.ai_detector, alloc), alloc);
    out.AddMember("detectors", detectors, alloc);

    rapidjson::Value stages(rapidjson::kArrayType);
    for (const auto& s : job.stages) {
        rapidjson::Value v(rapidjson::kObjectType);
        v.AddMember("name", str(s.name, alloc), alloc);
        v.AddMember("weight", s.weight, alloc);
        v.AddMember("done", s.done, alloc);
        stages.PushBack(v, alloc);
    }
    out.AddMember("stages", stages, alloc);
    out.AddMember("createdAt", str(job.created_at, alloc), alloc);
    out.AddMember("updatedAt", str(job.updated_at, alloc), alloc);

    if (job.result) {
        rapidjson::Value result;
        merge::result_to_json(*job.result, result, alloc);
        out.AddMember("result", result, alloc);
    }
}

}  // namespace budgetaudit::job
