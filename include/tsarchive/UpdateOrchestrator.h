/**
 * UpdateOrchestrator.h - Drives an archive update over a selection of series
 *
 * For every selected series the orchestrator reads the archive fresh from
 * disk, plans the missing windows, then interleaves the plans by time layer:
 * every series' earliest pending window is fetched before any series'
 * second-earliest. Each fetch passes the shared RateLimiter; each result is
 * committed on a background CommitWorker while the next fetch waits for its
 * grant.
 *
 * Run states: Idle -> Running -> {Completed, Cancelled, Failed}.
 * Progress lives only in the archive itself, so a later run resumes where an
 * interrupted one stopped.
 */

#pragma once

#include "tsarchive/ArchiveTypes.h"
#include "tsarchive/CancellationToken.h"
#include "tsarchive/DataSource.h"
#include "tsarchive/Frequency.h"
#include "tsarchive/RateLimiter.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class RunState {
    Idle,
    Running,
    Completed,
    Cancelled,
    Failed
};

enum class ProgressPhase {
    FetchStarted,
    FetchFinished,
    Committed,
    Failed
};

std::string run_state_name(RunState state);
std::string progress_phase_name(ProgressPhase phase);

/**
 * ProgressCallback - Invoked before and after each fetch (orchestrator thread)
 * and after each commit (commit worker thread).
 */
using ProgressCallback = std::function<void(const std::string& series_id,
                                            Frequency frequency,
                                            int64_t range_start,
                                            int64_t range_end,
                                            ProgressPhase phase)>;

using NowFunction = std::function<int64_t()>;

struct TaskOutcome {
    enum class Result {
        Committed,
        FetchFailed,
        StoreFailed,
        QuotaExceeded,
        PlanFailed
    };

    Series series;
    int64_t range_start = 0;
    int64_t range_end = 0;
    Result result = Result::Committed;
    ChunkStatus committed_status = ChunkStatus::Complete;
    std::string message;
};

std::string task_result_name(TaskOutcome::Result result);

struct RunReport {
    RunState state = RunState::Idle;
    std::vector<TaskOutcome> outcomes;
    size_t tasks_planned = 0;
    size_t fetches_issued = 0;
    size_t chunks_committed = 0;
    size_t tasks_failed = 0;
    std::string fatal_error;
    int64_t started_at = 0;
    int64_t finished_at = 0;

    json to_json() const;
};

struct OrchestratorOptions {
    std::map<Frequency, FrequencySpec> frequency_specs;
    std::map<Frequency, size_t> estimated_payload_bytes;
    bool fatal_on_disk_errors = true;   // NoSpace / Permission end the run as Failed

    static OrchestratorOptions defaults();
};

class UpdateOrchestrator;

/**
 * UpdateHandle - Caller's view of one run.
 */
class UpdateHandle {
public:
    RunState state() const;
    bool is_finished() const;

    void cancel() { token_.cancel(); }
    bool cancel_requested() const { return token_.is_cancelled(); }

    /**
     * @brief Block until the run reaches a terminal state.
     */
    RunReport wait() const;

    /**
     * @brief Wait up to `timeout`; true when the run finished.
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

    RunReport report() const;
    const std::vector<Series>& selection() const { return selection_; }

private:
    friend class UpdateOrchestrator;

    explicit UpdateHandle(std::vector<Series> selection) : selection_(std::move(selection)) {}

    void set_state(RunState state);
    void record(TaskOutcome outcome);
    template <typename F>
    void update_report(F&& f) {
        std::lock_guard<std::mutex> lock(mutex_);
        f(report_);
    }

    const std::vector<Series> selection_;
    CancellationToken token_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    RunReport report_;
};

class UpdateOrchestrator {
public:
    UpdateOrchestrator(std::string archive_root,
                       std::shared_ptr<DataSource> source,
                       std::shared_ptr<RateLimiter> limiter,
                       OrchestratorOptions options = OrchestratorOptions::defaults(),
                       NowFunction now = nullptr);

    ~UpdateOrchestrator();

    UpdateOrchestrator(const UpdateOrchestrator&) = delete;
    UpdateOrchestrator& operator=(const UpdateOrchestrator&) = delete;

    /**
     * @brief Start a run over `selection` on a background thread.
     *
     * Duplicate series are dropped (first occurrence wins); the remaining
     * order decides the visiting order inside each time layer.
     *
     * @throws std::logic_error if a run is already in progress.
     */
    std::shared_ptr<UpdateHandle> start_update(const std::vector<Series>& selection,
                                               ProgressCallback progress = nullptr);

    void cancel(const std::shared_ptr<UpdateHandle>& handle);

    /**
     * @brief Cancel the active run (if any) and wait for it to finish.
     */
    void stop();

    bool is_running() const;
    std::shared_ptr<UpdateHandle> current_run() const;

    /**
     * @brief Missing windows of one series, freshly planned from disk.
     * @throws StoreIOError if the archive cannot be read.
     */
    std::vector<ChunkTask> plan_series(const Series& series) const;

    /**
     * @brief Merge per-series plans layer by layer: index 0 of every series,
     *        then index 1, and so on; series keep their input order.
     */
    static std::vector<std::pair<Series, ChunkTask>> interleave(
        const std::vector<std::pair<Series, std::vector<ChunkTask>>>& plans);

    const std::string& archive_root() const { return archive_root_; }
    std::shared_ptr<RateLimiter> rate_limiter() const { return limiter_; }

    json get_statistics() const;
    void set_logging_enabled(bool enabled) { logging_enabled_.store(enabled); }

private:
    std::string archive_root_;
    std::shared_ptr<DataSource> source_;
    std::shared_ptr<RateLimiter> limiter_;
    OrchestratorOptions options_;
    NowFunction now_;

    mutable std::mutex state_mutex_;
    std::thread run_thread_;
    std::shared_ptr<UpdateHandle> current_;
    std::atomic<bool> logging_enabled_{true};

    // Lifetime statistics
    std::atomic<uint64_t> runs_started_{0};
    std::atomic<uint64_t> fetches_issued_{0};
    std::atomic<uint64_t> chunks_committed_{0};
    std::atomic<uint64_t> tasks_failed_{0};
    std::atomic<int64_t> last_fetch_timestamp_{0};

    void run(std::shared_ptr<UpdateHandle> handle, ProgressCallback progress);

    FrequencySpec spec_for(Frequency frequency) const;
    size_t estimate_for(Frequency frequency) const;

    void notify(const ProgressCallback& progress, const Series& series,
                const ChunkTask& task, ProgressPhase phase) const;

    void log_info(const std::string& msg) const;
    void log_error(const std::string& msg) const;
};
