/**
 * UpdateOrchestrator.cpp - Rate-limited, resumable archive update runs
 */

#include "tsarchive/UpdateOrchestrator.h"
#include "tsarchive/ChunkPlanner.h"
#include "tsarchive/ChunkStore.h"
#include "tsarchive/CommitWorker.h"
#include "tsarchive/TimeUtils.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace {
    std::vector<Series> deduplicate(const std::vector<Series>& selection) {
        std::vector<Series> unique;
        unique.reserve(selection.size());
        for (const auto& series : selection) {
            if (std::find(unique.begin(), unique.end(), series) == unique.end()) {
                unique.push_back(series);
            }
        }
        return unique;
    }

    // Rough wire size of a fetched table, used to settle rate limiter grants.
    size_t table_bytes(const RowTable& table) {
        size_t total = 0;
        for (const auto& column : table.columns) total += column.size() + 1;
        for (const auto& row : table.rows) {
            total += 21;  // ISO timestamp + separator
            for (const auto& value : row.values) total += value.size() + 1;
        }
        return total;
    }

    bool is_fatal_store_kind(StoreIOError::Kind kind) {
        return kind == StoreIOError::Kind::NoSpace || kind == StoreIOError::Kind::Permission;
    }

    std::string describe(const Series& series, const ChunkTask& task) {
        return series_label(series) + " [" + format_utc_iso(task.range_start) + ", " +
               format_utc_iso(task.range_end) + ")";
    }
}

// ============================================================================
// Names and serialization
// ============================================================================

std::string run_state_name(RunState state) {
    switch (state) {
        case RunState::Idle: return "idle";
        case RunState::Running: return "running";
        case RunState::Completed: return "completed";
        case RunState::Cancelled: return "cancelled";
        case RunState::Failed: return "failed";
    }
    return "unknown";
}

std::string progress_phase_name(ProgressPhase phase) {
    switch (phase) {
        case ProgressPhase::FetchStarted: return "fetch_started";
        case ProgressPhase::FetchFinished: return "fetch_finished";
        case ProgressPhase::Committed: return "committed";
        case ProgressPhase::Failed: return "failed";
    }
    return "unknown";
}

std::string task_result_name(TaskOutcome::Result result) {
    switch (result) {
        case TaskOutcome::Result::Committed: return "committed";
        case TaskOutcome::Result::FetchFailed: return "fetch_failed";
        case TaskOutcome::Result::StoreFailed: return "store_failed";
        case TaskOutcome::Result::QuotaExceeded: return "quota_exceeded";
        case TaskOutcome::Result::PlanFailed: return "plan_failed";
    }
    return "unknown";
}

json RunReport::to_json() const {
    json tasks = json::array();
    for (const auto& outcome : outcomes) {
        json entry = {
            {"series", outcome.series.id},
            {"frequency", frequency_name(outcome.series.frequency)},
            {"range_start", format_utc_iso(outcome.range_start)},
            {"range_end", format_utc_iso(outcome.range_end)},
            {"result", task_result_name(outcome.result)}
        };
        if (outcome.result == TaskOutcome::Result::Committed) {
            entry["status"] = chunk_status_name(outcome.committed_status);
        }
        if (!outcome.message.empty()) {
            entry["message"] = outcome.message;
        }
        tasks.push_back(entry);
    }

    json report = {
        {"state", run_state_name(state)},
        {"tasks_planned", tasks_planned},
        {"fetches_issued", fetches_issued},
        {"chunks_committed", chunks_committed},
        {"tasks_failed", tasks_failed},
        {"started_at", started_at},
        {"finished_at", finished_at},
        {"tasks", tasks}
    };
    if (!fatal_error.empty()) {
        report["fatal_error"] = fatal_error;
    }
    return report;
}

OrchestratorOptions OrchestratorOptions::defaults() {
    OrchestratorOptions options;
    for (Frequency frequency : ALL_FREQUENCIES) {
        options.frequency_specs[frequency] = default_frequency_spec(frequency);
        options.estimated_payload_bytes[frequency] = default_estimated_payload_bytes(frequency);
    }
    return options;
}

// ============================================================================
// UpdateHandle
// ============================================================================

RunState UpdateHandle::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_.state;
}

bool UpdateHandle::is_finished() const {
    RunState s = state();
    return s == RunState::Completed || s == RunState::Cancelled || s == RunState::Failed;
}

RunReport UpdateHandle::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() {
        return report_.state != RunState::Idle && report_.state != RunState::Running;
    });
    return report_;
}

bool UpdateHandle::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() {
        return report_.state != RunState::Idle && report_.state != RunState::Running;
    });
}

RunReport UpdateHandle::report() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_;
}

void UpdateHandle::set_state(RunState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        report_.state = state;
    }
    cv_.notify_all();
}

void UpdateHandle::record(TaskOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome.result == TaskOutcome::Result::Committed) {
        ++report_.chunks_committed;
    } else {
        ++report_.tasks_failed;
    }
    report_.outcomes.push_back(std::move(outcome));
}

// ============================================================================
// UpdateOrchestrator
// ============================================================================

UpdateOrchestrator::UpdateOrchestrator(std::string archive_root,
                                       std::shared_ptr<DataSource> source,
                                       std::shared_ptr<RateLimiter> limiter,
                                       OrchestratorOptions options,
                                       NowFunction now)
    : archive_root_(std::move(archive_root)),
      source_(std::move(source)),
      limiter_(std::move(limiter)),
      options_(std::move(options)),
      now_(now ? std::move(now) : NowFunction(utc_now_seconds)) {
    if (!source_) throw std::invalid_argument("UpdateOrchestrator requires a data source");
    if (!limiter_) throw std::invalid_argument("UpdateOrchestrator requires a rate limiter");
}

UpdateOrchestrator::~UpdateOrchestrator() {
    stop();
}

void UpdateOrchestrator::log_info(const std::string& msg) const {
    if (logging_enabled_.load()) {
        std::cout << "ℹ️  " << msg << std::endl;
    }
}

void UpdateOrchestrator::log_error(const std::string& msg) const {
    if (logging_enabled_.load()) {
        std::cerr << "❌ " << msg << std::endl;
    }
}

FrequencySpec UpdateOrchestrator::spec_for(Frequency frequency) const {
    auto it = options_.frequency_specs.find(frequency);
    if (it != options_.frequency_specs.end()) return it->second;
    return default_frequency_spec(frequency);
}

size_t UpdateOrchestrator::estimate_for(Frequency frequency) const {
    auto it = options_.estimated_payload_bytes.find(frequency);
    if (it != options_.estimated_payload_bytes.end()) return it->second;
    return default_estimated_payload_bytes(frequency);
}

void UpdateOrchestrator::notify(const ProgressCallback& progress, const Series& series,
                                const ChunkTask& task, ProgressPhase phase) const {
    if (!progress) return;
    try {
        progress(series.id, series.frequency, task.range_start, task.range_end, phase);
    } catch (const std::exception& e) {
        log_error("Progress callback threw: " + std::string(e.what()));
    }
}

std::vector<ChunkTask> UpdateOrchestrator::plan_series(const Series& series) const {
    ChunkStore store(archive_root_, series);
    return plan_chunks(store.list_chunks(), spec_for(series.frequency), now_());
}

std::vector<std::pair<Series, ChunkTask>> UpdateOrchestrator::interleave(
    const std::vector<std::pair<Series, std::vector<ChunkTask>>>& plans) {
    std::vector<std::pair<Series, ChunkTask>> schedule;

    size_t layers = 0;
    for (const auto& plan : plans) {
        layers = std::max(layers, plan.second.size());
    }

    for (size_t layer = 0; layer < layers; ++layer) {
        for (const auto& plan : plans) {
            if (layer < plan.second.size()) {
                schedule.emplace_back(plan.first, plan.second[layer]);
            }
        }
    }
    return schedule;
}

std::shared_ptr<UpdateHandle> UpdateOrchestrator::start_update(const std::vector<Series>& selection,
                                                               ProgressCallback progress) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (current_ && !current_->is_finished()) {
        throw std::logic_error("An update is already running");
    }
    if (run_thread_.joinable()) {
        run_thread_.join();
    }

    auto handle = std::shared_ptr<UpdateHandle>(new UpdateHandle(deduplicate(selection)));
    handle->update_report([this](RunReport& report) {
        report.state = RunState::Running;
        report.started_at = now_();
    });
    current_ = handle;
    runs_started_.fetch_add(1);

    run_thread_ = std::thread([this, handle, progress = std::move(progress)]() {
        this->run(handle, progress);
    });
    return handle;
}

void UpdateOrchestrator::cancel(const std::shared_ptr<UpdateHandle>& handle) {
    if (handle) handle->cancel();
}

void UpdateOrchestrator::stop() {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (current_) current_->cancel();
        finished = std::move(run_thread_);
    }
    if (finished.joinable()) {
        finished.join();
    }
}

bool UpdateOrchestrator::is_running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return current_ && !current_->is_finished();
}

std::shared_ptr<UpdateHandle> UpdateOrchestrator::current_run() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return current_;
}

void UpdateOrchestrator::run(std::shared_ptr<UpdateHandle> handle, ProgressCallback progress) {
    const CancellationToken& token = handle->token_;

    log_info("Update started for " + std::to_string(handle->selection().size()) + " series");

    // Plan every series from fresh disk state.
    std::map<std::string, std::unique_ptr<ChunkStore>> stores;
    std::vector<std::pair<Series, std::vector<ChunkTask>>> plans;

    for (const auto& series : handle->selection()) {
        try {
            auto store = std::make_unique<ChunkStore>(archive_root_, series);
            size_t removed = store->recover();
            if (removed > 0) {
                log_info("Recovered " + series_label(series) + ": removed " +
                         std::to_string(removed) + " interrupted write(s)");
            }
            auto tasks = plan_chunks(store->list_chunks(), spec_for(series.frequency), now_());
            log_info("Planned " + std::to_string(tasks.size()) + " chunk(s) for " + series_label(series));
            plans.emplace_back(series, std::move(tasks));
            stores[series_label(series)] = std::move(store);
        } catch (const std::exception& e) {
            log_error("Planning failed for " + series_label(series) + ": " + e.what());
            TaskOutcome outcome;
            outcome.series = series;
            outcome.result = TaskOutcome::Result::PlanFailed;
            outcome.message = e.what();
            handle->record(std::move(outcome));
            tasks_failed_.fetch_add(1);
        }
    }

    auto schedule = interleave(plans);
    handle->update_report([&](RunReport& report) { report.tasks_planned = schedule.size(); });

    // Written from the commit worker, read at task boundaries.
    std::mutex fatal_mutex;
    std::string fatal_store_error;

    bool cancelled = false;
    std::string fatal_error;

    {
        CommitWorker committer;

        for (const auto& entry : schedule) {
            const Series& series = entry.first;
            const ChunkTask& task = entry.second;

            if (token.is_cancelled()) {
                cancelled = true;
                break;
            }
            {
                std::lock_guard<std::mutex> lock(fatal_mutex);
                if (!fatal_store_error.empty()) {
                    fatal_error = fatal_store_error;
                    break;
                }
            }

            TaskOutcome outcome;
            outcome.series = series;
            outcome.range_start = task.range_start;
            outcome.range_end = task.range_end;

            RateLimiter::Grant grant;
            try {
                grant = limiter_->acquire(estimate_for(series.frequency), token);
            } catch (const CancellationError&) {
                cancelled = true;
                break;
            } catch (const QuotaExceededError& e) {
                log_error("Skipping " + describe(series, task) + ": " + e.what());
                outcome.result = TaskOutcome::Result::QuotaExceeded;
                outcome.message = e.what();
                handle->record(std::move(outcome));
                tasks_failed_.fetch_add(1);
                notify(progress, series, task, ProgressPhase::Failed);
                continue;
            }

            // Whether the window is over is judged when the request goes out:
            // rows arriving after that instant cannot be in the response.
            const int64_t fetch_time = now_();
            const bool elapsed = ChunkStore::is_period_elapsed(task.range_end, fetch_time);

            notify(progress, series, task, ProgressPhase::FetchStarted);
            handle->update_report([](RunReport& report) { ++report.fetches_issued; });
            fetches_issued_.fetch_add(1);

            RowTable rows;
            try {
                rows = source_->fetch(series.id, series.frequency, task.range_start, task.range_end);
            } catch (const FetchError& e) {
                log_error("Fetch failed for " + describe(series, task) + ": " + e.what());
                outcome.result = TaskOutcome::Result::FetchFailed;
                outcome.message = e.what();
                handle->record(std::move(outcome));
                tasks_failed_.fetch_add(1);
                notify(progress, series, task, ProgressPhase::Failed);
                if (e.is_fatal()) {
                    fatal_error = e.what();
                    break;
                }
                continue;
            } catch (const std::exception& e) {
                log_error("Fetch failed for " + describe(series, task) + ": " + e.what());
                outcome.result = TaskOutcome::Result::FetchFailed;
                outcome.message = e.what();
                handle->record(std::move(outcome));
                tasks_failed_.fetch_add(1);
                notify(progress, series, task, ProgressPhase::Failed);
                continue;
            }

            limiter_->settle(grant, table_bytes(rows));
            last_fetch_timestamp_.store(utc_now_seconds());
            notify(progress, series, task, ProgressPhase::FetchFinished);

            ChunkStore* store = stores.at(series_label(series)).get();
            Chunk chunk;
            chunk.series = series;
            chunk.range_start = task.range_start;
            chunk.range_end = task.range_end;

            const int64_t commit_time = now_();
            committer.submit([this, store, chunk, rows = std::move(rows), elapsed, commit_time, outcome,
                              series, task, &progress, &handle, &fatal_mutex, &fatal_store_error]() mutable {
                std::string earlier_fatal;
                {
                    std::lock_guard<std::mutex> lock(fatal_mutex);
                    earlier_fatal = fatal_store_error;
                }
                // Nothing more is written once the disk is known to be unusable.
                if (!earlier_fatal.empty()) {
                    log_error("Skipping commit of " + describe(series, task) + " after fatal store error");
                    outcome.result = TaskOutcome::Result::StoreFailed;
                    outcome.message = "Commit skipped after fatal store error: " + earlier_fatal;
                    handle->record(std::move(outcome));
                    tasks_failed_.fetch_add(1);
                    notify(progress, series, task, ProgressPhase::Failed);
                    return;
                }
                try {
                    Chunk committed = store->commit(chunk, rows, elapsed, commit_time);
                    outcome.result = TaskOutcome::Result::Committed;
                    outcome.committed_status = committed.status;
                    handle->record(std::move(outcome));
                    chunks_committed_.fetch_add(1);
                    notify(progress, series, task, ProgressPhase::Committed);
                } catch (const StoreIOError& e) {
                    log_error("Commit failed for " + describe(series, task) + ": " + e.what());
                    outcome.result = TaskOutcome::Result::StoreFailed;
                    outcome.message = e.what();
                    handle->record(std::move(outcome));
                    tasks_failed_.fetch_add(1);
                    notify(progress, series, task, ProgressPhase::Failed);
                    if (options_.fatal_on_disk_errors && is_fatal_store_kind(e.kind())) {
                        std::lock_guard<std::mutex> lock(fatal_mutex);
                        fatal_store_error = e.what();
                    }
                } catch (const std::exception& e) {
                    log_error("Commit failed for " + describe(series, task) + ": " + e.what());
                    outcome.result = TaskOutcome::Result::StoreFailed;
                    outcome.message = e.what();
                    handle->record(std::move(outcome));
                    tasks_failed_.fetch_add(1);
                    notify(progress, series, task, ProgressPhase::Failed);
                }
            });
        }

        // Never discard fetched data: the last commit always completes.
        committer.drain();
    }

    if (fatal_error.empty()) {
        std::lock_guard<std::mutex> lock(fatal_mutex);
        fatal_error = fatal_store_error;
    }
    if (!cancelled && fatal_error.empty() && token.is_cancelled()) {
        cancelled = true;
    }

    RunState final_state = RunState::Completed;
    if (!fatal_error.empty()) {
        final_state = RunState::Failed;
    } else if (cancelled) {
        final_state = RunState::Cancelled;
    }

    handle->update_report([&](RunReport& report) {
        report.fatal_error = fatal_error;
        report.finished_at = now_();
    });
    handle->set_state(final_state);

    auto report = handle->report();
    log_info("Update " + run_state_name(final_state) + ": " +
             std::to_string(report.chunks_committed) + " committed, " +
             std::to_string(report.tasks_failed) + " failed, " +
             std::to_string(report.tasks_planned) + " planned");
}

json UpdateOrchestrator::get_statistics() const {
    json stats = {
        {"archive_root", archive_root_},
        {"data_source", source_->name()},
        {"runs_started", runs_started_.load()},
        {"fetches_issued", fetches_issued_.load()},
        {"chunks_committed", chunks_committed_.load()},
        {"tasks_failed", tasks_failed_.load()},
        {"last_fetch_timestamp", last_fetch_timestamp_.load()},
        {"rate_limiter", limiter_->stats()}
    };

    auto run = current_run();
    if (run) {
        auto report = run->report();
        stats["is_running"] = !run->is_finished();
        stats["current_run"] = {
            {"state", run_state_name(report.state)},
            {"tasks_planned", report.tasks_planned},
            {"fetches_issued", report.fetches_issued},
            {"chunks_committed", report.chunks_committed},
            {"tasks_failed", report.tasks_failed}
        };
    } else {
        stats["is_running"] = false;
    }
    return stats;
}
