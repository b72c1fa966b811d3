/**
 * @file execution_service.hpp
 * @brief Admission control and the fixed sandbox worker pool.
 *
 * Lifecycle of a submission:
 *
 *   submit() ─┬─ worker idle ──────────► Accepted ─┐
 *             ├─ queue has room ───────► Queued ───┼─► worker ─► runner ─► future
 *             └─ queue full ───────────► CapacityExceeded (nothing allocated)
 *
 * The queue, the running-job table and the counters are the only shared
 * mutable state and are guarded by one mutex. Submission never waits on an
 * execution.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "language/language.hpp"
#include "limits/budget_policy.hpp"
#include "service/execution_queue.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace runbox {

// ─────────────────────────────────────────────
// Submission types
// ─────────────────────────────────────────────

struct SubmissionRequest {
    Language language{Language::Python};
    std::string source;
    std::optional<std::string> stdin_data;
    PartialBudget limits_override;
    SubmitterId submitter;
    std::optional<JobId> job_id;        ///< Caller-chosen id; generated when absent
};

enum class AdmissionDecision : uint8_t {
    Accepted,       ///< A worker was idle; execution starts immediately
    Queued          ///< Waiting for a worker
};

[[nodiscard]] constexpr std::string_view to_string(AdmissionDecision decision) noexcept {
    switch (decision) {
        case AdmissionDecision::Accepted: return "accepted";
        case AdmissionDecision::Queued:   return "queued";
    }
    return "unknown";
}

struct Submission {
    JobId job_id;
    AdmissionDecision decision{AdmissionDecision::Accepted};
    size_t queue_position{0};           ///< 1-based when queued, 0 when accepted
    std::future<Result<ExecutionResult>> result;
};

enum class CancelOutcome : uint8_t {
    RemovedFromQueue,
    KillRequested,
    NotFound
};

[[nodiscard]] constexpr std::string_view to_string(CancelOutcome outcome) noexcept {
    switch (outcome) {
        case CancelOutcome::RemovedFromQueue: return "removed_from_queue";
        case CancelOutcome::KillRequested:    return "kill_requested";
        case CancelOutcome::NotFound:         return "not_found";
    }
    return "unknown";
}

struct ServiceStats {
    size_t workers{0};
    size_t busy{0};
    size_t queued{0};
    uint64_t accepted{0};
    uint64_t queued_total{0};
    uint64_t rejected{0};
    uint64_t completed{0};
    uint64_t cancelled{0};
    Millis uptime{0};
};

// ─────────────────────────────────────────────
// ExecutionService
// ─────────────────────────────────────────────

/**
 * @brief Owns the worker pool and the execution queue.
 *
 * @tparam RunnerT Executes one job to a verdict; shared by all workers, so
 *                 its run() must be safe to call concurrently.
 */
template <SandboxRunnerLike RunnerT>
class ExecutionService {
public:
    ExecutionService(const Config& config, RunnerT& runner,
                     Logger* logger = nullptr, MetricsCollector* metrics = nullptr);
    ~ExecutionService();

    ExecutionService(const ExecutionService&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;

    /**
     * @brief Validate and admit a job. Never blocks on execution.
     *
     * Errors: UnsupportedLanguage, InvalidBudget, InvalidRequest (duplicate
     * id), CapacityExceeded, ShuttingDown.
     */
    [[nodiscard]] Result<Submission> submit(SubmissionRequest request);

    /**
     * @brief Cancel by id.
     *
     * A waiting job is removed without any sandbox being created and its
     * future resolves to Error{JobCancelled}. A running job is killed and its
     * future resolves to a result with state Cancelled.
     */
    CancelOutcome cancel(const JobId& id);

    [[nodiscard]] ServiceStats stats() const;

    /// Stop admitting, fail waiting jobs with ShuttingDown, kill running ones, join workers.
    void shutdown();

    [[nodiscard]] const LanguageRegistry& languages() const noexcept { return languages_; }
    [[nodiscard]] const BudgetPolicy& budget_policy() const noexcept { return policy_; }

private:
    void worker_loop(std::stop_token stop);
    Result<ExecutionResult> execute(QueueSlot& slot);
    JobId next_job_id();

    RunnerT& runner_;
    BudgetPolicy policy_;
    LanguageRegistry languages_;
    Logger* logger_;
    MetricsCollector* metrics_;

    const size_t worker_count_;
    const size_t queue_capacity_;
    const SteadyTime started_at_;

    mutable std::mutex mutex_;
    std::condition_variable_any work_cv_;
    ExecutionQueue queue_;
    std::unordered_map<JobId, std::stop_source> running_;
    bool stopping_{false};
    uint64_t next_sequence_{0};
    uint64_t accepted_{0};
    uint64_t queued_total_{0};
    uint64_t rejected_{0};
    uint64_t completed_{0};
    uint64_t cancelled_{0};

    std::vector<std::jthread> workers_;
};

// ── Template implementations ─────────────────

template <SandboxRunnerLike RunnerT>
ExecutionService<RunnerT>::ExecutionService(const Config& config, RunnerT& runner,
                                            Logger* logger, MetricsCollector* metrics)
    : runner_(runner)
    , policy_(config.limits)
    , languages_(config.languages)
    , logger_(logger)
    , metrics_(metrics)
    , worker_count_(config.service.workers)
    , queue_capacity_(config.service.queue_capacity)
    , started_at_(std::chrono::steady_clock::now())
    , queue_(config.service.queue_capacity + config.service.workers) {
    workers_.reserve(worker_count_);
    for (size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

template <SandboxRunnerLike RunnerT>
ExecutionService<RunnerT>::~ExecutionService() {
    shutdown();
}

template <SandboxRunnerLike RunnerT>
Result<Submission> ExecutionService<RunnerT>::submit(SubmissionRequest request) {
    if (!languages_.supports(request.language)) {
        return Error{ErrorCode::UnsupportedLanguage,
                     "Unsupported language: " + std::string{to_string(request.language)}};
    }
    auto budget = policy_.resolve(request.limits_override);
    if (!budget) return budget.error();

    auto job = std::make_shared<ExecutionJob>();
    job->language = request.language;
    job->source = std::move(request.source);
    job->stdin_data = std::move(request.stdin_data);
    job->limits_override = request.limits_override;
    job->budget = *budget;
    job->submitted_at = std::chrono::system_clock::now();
    job->submitter = std::move(request.submitter);

    Submission submission;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return Error{ErrorCode::ShuttingDown, "Service is shutting down"};
        }

        job->id = request.job_id ? *request.job_id : next_job_id();
        if (queue_.contains(job->id) || running_.contains(job->id)) {
            return Error{ErrorCode::InvalidRequest, "Job id already in flight: " + job->id};
        }

        // Slots still in the queue but covered by idle workers count as accepted.
        const size_t idle = worker_count_ - running_.size();
        const size_t depth = queue_.size() + 1;
        if (depth <= idle) {
            submission.decision = AdmissionDecision::Accepted;
            submission.queue_position = 0;
        } else {
            const size_t waiting = depth - idle;
            if (waiting > queue_capacity_) {
                ++rejected_;
                if (metrics_) metrics_->record_rejection("capacity_exceeded");
                return Error{ErrorCode::CapacityExceeded,
                             "Execution queue is full; retry later"};
            }
            submission.decision = AdmissionDecision::Queued;
            submission.queue_position = waiting;
        }

        QueueSlot slot;
        slot.job = job;
        slot.arrived_at = std::chrono::steady_clock::now();
        slot.sequence = ++next_sequence_;
        submission.result = slot.promise.get_future();
        submission.job_id = job->id;

        if (!queue_.push(std::move(slot))) {
            ++rejected_;
            return Error{ErrorCode::CapacityExceeded, "Execution queue is full; retry later"};
        }
        if (submission.decision == AdmissionDecision::Accepted) {
            ++accepted_;
        } else {
            ++queued_total_;
        }
    }
    work_cv_.notify_one();

    if (metrics_) {
        metrics_->record_admission(submission.job_id, to_string(submission.decision),
                                   submission.queue_position);
    }
    if (logger_) {
        logger_->debug("Job admitted", {
            {"job_id", submission.job_id},
            {"language", std::string{to_string(job->language)}},
            {"decision", std::string{to_string(submission.decision)}}
        });
    }
    return Result<Submission>{std::move(submission)};
}

template <SandboxRunnerLike RunnerT>
CancelOutcome ExecutionService<RunnerT>::cancel(const JobId& id) {
    std::optional<QueueSlot> removed;
    CancelOutcome outcome = CancelOutcome::NotFound;
    {
        std::lock_guard lock(mutex_);
        removed = queue_.remove(id);
        if (removed) {
            ++cancelled_;
            outcome = CancelOutcome::RemovedFromQueue;
        } else if (auto it = running_.find(id); it != running_.end()) {
            it->second.request_stop();
            outcome = CancelOutcome::KillRequested;
        }
    }

    if (removed) {
        removed->promise.set_value(Error{ErrorCode::JobCancelled, "Job cancelled before dispatch"});
    }
    if (outcome != CancelOutcome::NotFound && metrics_) {
        metrics_->record_cancelled(id, to_string(outcome));
    }
    return outcome;
}

template <SandboxRunnerLike RunnerT>
ServiceStats ExecutionService<RunnerT>::stats() const {
    std::lock_guard lock(mutex_);
    ServiceStats s;
    s.workers = worker_count_;
    s.busy = running_.size();
    const size_t idle = worker_count_ - running_.size();
    s.queued = queue_.size() > idle ? queue_.size() - idle : 0;
    s.accepted = accepted_;
    s.queued_total = queued_total_;
    s.rejected = rejected_;
    s.completed = completed_;
    s.cancelled = cancelled_;
    s.uptime = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - started_at_);
    return s;
}

template <SandboxRunnerLike RunnerT>
void ExecutionService<RunnerT>::shutdown() {
    std::vector<QueueSlot> pending;
    size_t interrupted = 0;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
        interrupted = running_.size();
        pending = queue_.drain();
        for (auto& [id, stop] : running_) {
            stop.request_stop();
        }
    }

    for (auto& slot : pending) {
        slot.promise.set_value(Error{ErrorCode::ShuttingDown, "Service shut down before dispatch"});
    }

    for (auto& worker : workers_) {
        worker.request_stop();
    }
    work_cv_.notify_all();
    workers_.clear();

    if (logger_) {
        logger_->info("Execution service stopped", {
            {"dropped", std::to_string(pending.size())},
            {"interrupted", std::to_string(interrupted)}
        });
    }
}

template <SandboxRunnerLike RunnerT>
void ExecutionService<RunnerT>::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        QueueSlot slot;
        {
            std::unique_lock lock(mutex_);
            work_cv_.wait(lock, stop, [this] { return !queue_.empty(); });
            if (queue_.empty()) return;     // stop requested

            slot = std::move(*queue_.pop());
            running_.emplace(slot.job->id, slot.stop);
        }

        auto result = execute(slot);

        {
            std::lock_guard lock(mutex_);
            running_.erase(slot.job->id);
            ++completed_;
            if (result && result->state == TerminalState::Cancelled) ++cancelled_;
        }

        if (result && metrics_) metrics_->record_finished(*result);
        slot.promise.set_value(std::move(result));
    }
}

template <SandboxRunnerLike RunnerT>
Result<ExecutionResult> ExecutionService<RunnerT>::execute(QueueSlot& slot) {
    const ExecutionJob& job = *slot.job;
    try {
        return runner_.run(job, job.budget, slot.stop.get_token());
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->error("Runner raised; reporting sandbox failure", {
                {"job_id", job.id},
                {"error", e.what()}
            });
        }
        ExecutionResult failed;
        failed.job_id = job.id;
        failed.state = TerminalState::SandboxFailure;
        return failed;
    } catch (...) {
        if (logger_) {
            logger_->error("Runner raised a non-standard exception; reporting sandbox failure",
                           {{"job_id", job.id}});
        }
        ExecutionResult failed;
        failed.job_id = job.id;
        failed.state = TerminalState::SandboxFailure;
        return failed;
    }
}

template <SandboxRunnerLike RunnerT>
JobId ExecutionService<RunnerT>::next_job_id() {
    JobId id;
    do {
        id = "job-" + std::to_string(++next_sequence_);
    } while (queue_.contains(id) || running_.contains(id));
    return id;
}

}  // namespace runbox
