/**
 * test_orchestrator.cpp - Update runs against an in-memory data source
 */

#include "tsarchive/UpdateOrchestrator.h"
#include "tsarchive/ChunkStore.h"
#include "tsarchive/TimeUtils.h"
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace fs = std::filesystem;

namespace {
    void log_info(const std::string& msg) {
        std::cout << "ℹ️  " << msg << std::endl;
    }

    void log_success(const std::string& msg) {
        std::cout << "✅ " << msg << std::endl;
    }

    void log_error(const std::string& msg) {
        std::cerr << "❌ " << msg << std::endl;
    }

    int64_t year(int y) {
        return utc_from_civil(CivilTime{y, 1, 1});
    }

    struct FetchCall {
        std::string series_id;
        int64_t range_start;
    };

    /**
     * Serves one row per window. Individual windows can be made to fail or
     * come back empty, and fetches can be held until released.
     */
    class FakeDataSource : public DataSource {
    public:
        RowTable fetch(const std::string& series_id, Frequency, int64_t range_start, int64_t) override {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                calls_.push_back({series_id, range_start});
                cv_.notify_all();
                cv_.wait(lock, [this]() { return !hold_; });

                auto failure = failures_.find(key(series_id, range_start));
                if (failure != failures_.end()) {
                    throw FetchError(failure->second, "injected failure for " + series_id);
                }
                if (empty_.count(key(series_id, range_start))) {
                    return RowTable{};
                }
            }
            RowTable table;
            table.columns = {"CLOSE"};
            table.rows.push_back({range_start + 3600, {"100"}});
            return table;
        }

        std::string name() const override { return "fake"; }

        void fail(const std::string& id, int64_t start, FetchError::Category category) {
            std::lock_guard<std::mutex> lock(mutex_);
            failures_[key(id, start)] = category;
        }

        void serve_empty(const std::string& id, int64_t start) {
            std::lock_guard<std::mutex> lock(mutex_);
            empty_.insert(key(id, start));
        }

        void clear_failures() {
            std::lock_guard<std::mutex> lock(mutex_);
            failures_.clear();
        }

        void hold(bool on) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                hold_ = on;
            }
            cv_.notify_all();
        }

        void wait_for_calls(size_t count) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&]() { return calls_.size() >= count; });
        }

        std::vector<FetchCall> take_calls() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto calls = std::move(calls_);
            calls_.clear();
            return calls;
        }

    private:
        static std::string key(const std::string& id, int64_t start) {
            return id + "@" + std::to_string(start);
        }

        std::mutex mutex_;
        std::condition_variable cv_;
        std::vector<FetchCall> calls_;
        std::map<std::string, FetchError::Category> failures_;
        std::set<std::string> empty_;
        bool hold_ = false;
    };

    std::shared_ptr<RateLimiter> fast_limiter(size_t cap = 64 * 1024 * 1024) {
        RateLimitConfig config;
        config.min_spacing = std::chrono::milliseconds(0);
        config.rolling_window = std::chrono::milliseconds(1000);
        config.payload_cap_bytes = cap;
        return std::make_shared<RateLimiter>(config);
    }

    size_t count_status(const std::string& root, const Series& series, ChunkStatus status) {
        size_t n = 0;
        for (const auto& chunk : ChunkStore(root, series).list_chunks()) {
            if (chunk.status == status) ++n;
        }
        return n;
    }
}

int main() {
    log_info("=== Update Orchestrator Tests ===\n");

    const std::string root = (fs::temp_directory_path() / "tsarchive_test_orchestrator").string();
    // Mid-1983: windows 1980, 1981, 1982 are elapsed and 1983 is current.
    const int64_t now = utc_from_civil(CivilTime{1983, 6, 15, 12});
    auto clock = [now]() { return now; };

    const Series a{"AAA", Frequency::Daily};
    const Series b{"BBB", Frequency::Daily};

    // Test 1: Time-layer interleaving
    {
        log_info("Test 1: Interleave by time layer");
        ChunkTask t1, t2, t3;
        t1.range_start = 1;
        t2.range_start = 2;
        t3.range_start = 3;
        std::vector<std::pair<Series, std::vector<ChunkTask>>> plans;
        plans.emplace_back(a, std::vector<ChunkTask>{t1, t2, t3});
        plans.emplace_back(b, std::vector<ChunkTask>{t1});
        auto merged = UpdateOrchestrator::interleave(plans);
        if (merged.size() != 4 || merged[0].first != a || merged[1].first != b ||
            merged[2].second.range_start != 2 || merged[3].second.range_start != 3) {
            log_error("Test 1 failed");
            return 1;
        }
        log_success("Test 1 passed");
    }

    // Test 2: Full run from an empty archive
    {
        log_info("\nTest 2: Fresh run over two series");
        fs::remove_all(root);
        auto source = std::make_shared<FakeDataSource>();
        UpdateOrchestrator orchestrator(root, source, fast_limiter(), OrchestratorOptions::defaults(), clock);
        orchestrator.set_logging_enabled(false);

        std::mutex phase_mutex;
        std::vector<ProgressPhase> phases;
        auto handle = orchestrator.start_update({a, b, a},
            [&](const std::string& id, Frequency, int64_t start, int64_t, ProgressPhase phase) {
                if (id == "AAA" && start == year(1980)) {
                    std::lock_guard<std::mutex> lock(phase_mutex);
                    phases.push_back(phase);
                }
            });
        RunReport report = handle->wait();

        auto calls = source->take_calls();
        bool layered = calls.size() == 8;
        for (size_t i = 0; layered && i < calls.size(); ++i) {
            layered = calls[i].series_id == (i % 2 == 0 ? "AAA" : "BBB") &&
                      calls[i].range_start == year(1980 + static_cast<int>(i / 2));
        }
        if (report.state != RunState::Completed || report.tasks_planned != 8 ||
            report.chunks_committed != 8 || report.tasks_failed != 0 || !layered) {
            log_error("Test 2 failed: state=" + run_state_name(report.state) +
                      " calls=" + std::to_string(calls.size()));
            return 1;
        }
        if (count_status(root, a, ChunkStatus::Complete) != 3 ||
            count_status(root, a, ChunkStatus::Incomplete) != 1 ||
            count_status(root, b, ChunkStatus::Complete) != 3) {
            log_error("Test 2 failed: archive contents");
            return 1;
        }
        std::vector<ProgressPhase> expected = {ProgressPhase::FetchStarted, ProgressPhase::FetchFinished,
                                               ProgressPhase::Committed};
        if (phases != expected) {
            log_error("Test 2 failed: progress phases for one task");
            return 1;
        }
        if (report.to_json()["tasks"].size() != 8) {
            log_error("Test 2 failed: report JSON");
            return 1;
        }
        log_success("Test 2 passed");
    }

    // Test 3: Re-running only refreshes the current period
    {
        log_info("\nTest 3: Idempotent re-run");
        auto source = std::make_shared<FakeDataSource>();
        UpdateOrchestrator orchestrator(root, source, fast_limiter(), OrchestratorOptions::defaults(), clock);
        orchestrator.set_logging_enabled(false);

        RunReport report = orchestrator.start_update({a, b})->wait();
        auto calls = source->take_calls();
        if (report.state != RunState::Completed || calls.size() != 2 ||
            calls[0].range_start != year(1983) || calls[1].range_start != year(1983)) {
            log_error("Test 3 failed: " + std::to_string(calls.size()) + " fetches");
            return 1;
        }
        if (ChunkStore(root, a).list_backups().size() != 1 ||
            count_status(root, a, ChunkStatus::Incomplete) != 1) {
            log_error("Test 3 failed: previous incomplete not backed up");
            return 1;
        }
        log_success("Test 3 passed");
    }

    // Test 4: Transient failures are skipped and retried next run
    {
        log_info("\nTest 4: Transient failure");
        fs::remove_all(root);
        auto source = std::make_shared<FakeDataSource>();
        source->fail("AAA", year(1981), FetchError::Category::Transient);
        source->serve_empty("BBB", year(1981));
        UpdateOrchestrator orchestrator(root, source, fast_limiter(), OrchestratorOptions::defaults(), clock);
        orchestrator.set_logging_enabled(false);

        RunReport report = orchestrator.start_update({a, b})->wait();
        if (report.state != RunState::Completed || report.tasks_failed != 1 ||
            report.chunks_committed != 7 || count_status(root, b, ChunkStatus::Empty) != 1) {
            log_error("Test 4 failed: state=" + run_state_name(report.state));
            return 1;
        }

        source->take_calls();
        source->clear_failures();
        report = orchestrator.start_update({a, b})->wait();
        auto calls = source->take_calls();
        // AAA 1981 and 1983, BBB 1983
        if (report.state != RunState::Completed || calls.size() != 3 ||
            calls[0].series_id != "AAA" || calls[0].range_start != year(1981)) {
            log_error("Test 4 failed: retry fetched " + std::to_string(calls.size()) + " windows");
            return 1;
        }
        log_success("Test 4 passed");
    }

    // Test 5: Fatal failures stop the run
    {
        log_info("\nTest 5: Fatal failure");
        fs::remove_all(root);
        auto source = std::make_shared<FakeDataSource>();
        source->fail("BBB", year(1980), FetchError::Category::Fatal);
        UpdateOrchestrator orchestrator(root, source, fast_limiter(), OrchestratorOptions::defaults(), clock);
        orchestrator.set_logging_enabled(false);

        RunReport report = orchestrator.start_update({a, b})->wait();
        if (report.state != RunState::Failed || report.fatal_error.empty() ||
            source->take_calls().size() != 2 || report.chunks_committed != 1) {
            log_error("Test 5 failed: state=" + run_state_name(report.state));
            return 1;
        }
        log_success("Test 5 passed");
    }

    // Test 6: Requests that can never fit the budget are skipped
    {
        log_info("\nTest 6: Quota exceeded");
        fs::remove_all(root);
        auto source = std::make_shared<FakeDataSource>();
        UpdateOrchestrator orchestrator(root, source, fast_limiter(1024), OrchestratorOptions::defaults(), clock);
        orchestrator.set_logging_enabled(false);

        RunReport report = orchestrator.start_update({a})->wait();
        bool all_quota = report.outcomes.size() == 4;
        for (const auto& outcome : report.outcomes) {
            all_quota = all_quota && outcome.result == TaskOutcome::Result::QuotaExceeded;
        }
        if (report.state != RunState::Completed || !all_quota || !source->take_calls().empty()) {
            log_error("Test 6 failed");
            return 1;
        }
        log_success("Test 6 passed");
    }

    // Test 7: Cancellation completes the in-flight task, later runs resume
    {
        log_info("\nTest 7: Cancel and resume");
        fs::remove_all(root);
        auto source = std::make_shared<FakeDataSource>();
        UpdateOrchestrator orchestrator(root, source, fast_limiter(), OrchestratorOptions::defaults(), clock);
        orchestrator.set_logging_enabled(false);

        source->hold(true);
        auto handle = orchestrator.start_update({a, b});
        source->wait_for_calls(1);

        bool rejected = false;
        try {
            orchestrator.start_update({a});
        } catch (const std::logic_error&) {
            rejected = true;
        }

        orchestrator.cancel(handle);
        source->hold(false);
        RunReport report = handle->wait();

        if (!rejected || report.state != RunState::Cancelled || report.chunks_committed != 1 ||
            source->take_calls().size() != 1) {
            log_error("Test 7 failed: state=" + run_state_name(report.state) +
                      " committed=" + std::to_string(report.chunks_committed));
            return 1;
        }

        report = orchestrator.start_update({a, b})->wait();
        auto calls = source->take_calls();
        // AAA resumes at 1981, BBB starts from scratch
        if (report.state != RunState::Completed || calls.size() != 7 ||
            calls[0].series_id != "AAA" || calls[0].range_start != year(1981) ||
            calls[1].series_id != "BBB" || calls[1].range_start != year(1980)) {
            log_error("Test 7 failed: resume fetched " + std::to_string(calls.size()) + " windows");
            return 1;
        }
        log_success("Test 7 passed");
    }

    // Test 8: Statistics
    {
        log_info("\nTest 8: Statistics");
        auto source = std::make_shared<FakeDataSource>();
        UpdateOrchestrator orchestrator(root, source, fast_limiter(), OrchestratorOptions::defaults(), clock);
        orchestrator.set_logging_enabled(false);
        orchestrator.start_update({a})->wait();

        auto stats = orchestrator.get_statistics();
        if (stats["runs_started"] != 1 || stats["is_running"] != false ||
            stats["data_source"] != "fake" || !stats.contains("rate_limiter")) {
            log_error("Test 8 failed: " + stats.dump());
            return 1;
        }
        log_success("Test 8 passed");
    }

    // Test 9: A full disk ends the run, unless disk errors are tolerated
    if (!fs::exists("/dev/full")) {
        log_info("\nTest 9: skipped, /dev/full not available");
    } else {
        log_info("\nTest 9: Disk-full commits");
        const fs::path a_dir = ChunkStore(root, a).directory();

        // Points the commit temporary of AAA 1980 at /dev/full so its write fails with ENOSPC.
        auto fill_disk = [&](const std::string& id, Frequency, int64_t start, int64_t, ProgressPhase phase) {
            if (id == "AAA" && start == year(1980) && phase == ProgressPhase::FetchFinished) {
                fs::create_directories(a_dir);
                fs::create_symlink("/dev/full", a_dir / ".1980.csv.tmp");
            }
        };

        fs::remove_all(root);
        auto source = std::make_shared<FakeDataSource>();
        UpdateOrchestrator fatal(root, source, fast_limiter(), OrchestratorOptions::defaults(), clock);
        fatal.set_logging_enabled(false);

        RunReport report = fatal.start_update({a, b}, fill_disk)->wait();
        // BBB 1980 may already be fetched when the failure lands; its commit is then skipped.
        bool all_store_failed = !report.outcomes.empty() && report.outcomes.size() <= 2;
        for (const auto& outcome : report.outcomes) {
            all_store_failed = all_store_failed && outcome.result == TaskOutcome::Result::StoreFailed;
        }
        if (report.state != RunState::Failed || report.fatal_error.empty() ||
            report.chunks_committed != 0 || !all_store_failed ||
            !ChunkStore(root, b).list_chunks().empty()) {
            log_error("Test 9 failed: fatal run state=" + run_state_name(report.state) +
                      " committed=" + std::to_string(report.chunks_committed));
            return 1;
        }

        fs::remove_all(root);
        source->take_calls();
        OrchestratorOptions tolerant_options = OrchestratorOptions::defaults();
        tolerant_options.fatal_on_disk_errors = false;
        UpdateOrchestrator tolerant(root, source, fast_limiter(), tolerant_options, clock);
        tolerant.set_logging_enabled(false);

        report = tolerant.start_update({a, b}, fill_disk)->wait();
        bool first_failed = !report.outcomes.empty() &&
                            report.outcomes[0].result == TaskOutcome::Result::StoreFailed &&
                            report.outcomes[0].range_start == year(1980) &&
                            !report.outcomes[0].message.empty();
        if (report.state != RunState::Completed || !report.fatal_error.empty() ||
            report.chunks_committed != 7 || report.tasks_failed != 1 || !first_failed ||
            fs::exists(a_dir / ".1980.csv.tmp")) {
            log_error("Test 9 failed: tolerant run state=" + run_state_name(report.state) +
                      " committed=" + std::to_string(report.chunks_committed));
            return 1;
        }

        source->take_calls();
        report = tolerant.start_update({a})->wait();
        auto calls = source->take_calls();
        if (report.state != RunState::Completed || calls.empty() || calls[0].range_start != year(1980) ||
            count_status(root, a, ChunkStatus::Complete) != 3) {
            log_error("Test 9 failed: skipped window not fetched again");
            return 1;
        }
        log_success("Test 9 passed");
    }

    // Test 10: An incomplete window left behind by a failed run never precedes newer data
    {
        log_info("\nTest 10: Stale incomplete after partial catch-up");
        fs::remove_all(root);
        auto source = std::make_shared<FakeDataSource>();
        UpdateOrchestrator first(root, source, fast_limiter(), OrchestratorOptions::defaults(), clock);
        first.set_logging_enabled(false);
        first.start_update({a})->wait();

        const int64_t later = utc_from_civil(CivilTime{1985, 6, 15, 12});
        source->fail("AAA", year(1983), FetchError::Category::Transient);
        source->fail("AAA", year(1985), FetchError::Category::Transient);
        UpdateOrchestrator second(root, source, fast_limiter(), OrchestratorOptions::defaults(),
                                  [later]() { return later; });
        second.set_logging_enabled(false);

        RunReport report = second.start_update({a})->wait();
        if (report.state != RunState::Completed || report.chunks_committed != 1 ||
            count_status(root, a, ChunkStatus::Incomplete) != 0 ||
            ChunkStore(root, a).list_backups().size() != 1) {
            log_error("Test 10 failed: 1983 should be retired once 1984 is finalized");
            return 1;
        }

        source->take_calls();
        source->clear_failures();
        report = second.start_update({a})->wait();
        auto chunks = ChunkStore(root, a).list_chunks();
        if (report.state != RunState::Completed || source->take_calls().size() != 2 ||
            chunks.size() != 6 || chunks.back().range_start != year(1985) ||
            chunks.back().status != ChunkStatus::Incomplete ||
            count_status(root, a, ChunkStatus::Incomplete) != 1) {
            log_error("Test 10 failed: catch-up did not restore the archive");
            return 1;
        }
        log_success("Test 10 passed");
    }

    fs::remove_all(root);
    log_info("\n=== Update orchestrator tests completed ===");
    return 0;
}
