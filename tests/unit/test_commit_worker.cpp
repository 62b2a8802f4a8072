/**
 * test_commit_worker.cpp - Single-slot background commit stage
 */

#include "tsarchive/CommitWorker.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

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
}

int main() {
    log_info("=== Commit Worker Tests ===\n");

    // Test 1: Jobs run in submission order
    {
        log_info("Test 1: Ordered execution");
        CommitWorker worker;
        std::mutex mutex;
        std::vector<int> order;
        for (int i = 0; i < 5; ++i) {
            worker.submit([&, i]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(i);
            });
        }
        worker.drain();
        if (order != std::vector<int>{0, 1, 2, 3, 4} || worker.busy()) {
            log_error("Test 1 failed");
            return 1;
        }
        log_success("Test 1 passed");
    }

    // Test 2: At most one job in flight
    {
        log_info("\nTest 2: Single slot");
        CommitWorker worker;
        std::atomic<int> running{0};
        std::atomic<int> max_running{0};
        for (int i = 0; i < 4; ++i) {
            worker.submit([&]() {
                int now = running.fetch_add(1) + 1;
                int seen = max_running.load();
                while (now > seen && !max_running.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                running.fetch_sub(1);
            });
        }
        worker.drain();
        if (max_running.load() != 1) {
            log_error("Test 2 failed: " + std::to_string(max_running.load()) + " jobs overlapped");
            return 1;
        }
        log_success("Test 2 passed");
    }

    // Test 3: A throwing job does not stop the worker
    {
        log_info("\nTest 3: Job exceptions are contained");
        CommitWorker worker;
        std::atomic<bool> ran{false};
        worker.submit([]() { throw std::runtime_error("disk on fire"); });
        worker.submit([&]() { ran.store(true); });
        worker.drain();
        if (!ran.load()) {
            log_error("Test 3 failed");
            return 1;
        }
        log_success("Test 3 passed");
    }

    // Test 4: Shutdown finishes the accepted job
    {
        log_info("\nTest 4: Shutdown");
        std::atomic<bool> committed{false};
        CommitWorker worker;
        worker.submit([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            committed.store(true);
        });
        worker.shutdown();
        bool accepted = worker.submit([]() {});
        if (!committed.load() || accepted) {
            log_error("Test 4 failed");
            return 1;
        }
        log_success("Test 4 passed");
    }

    log_info("\n=== Commit worker tests completed ===");
    return 0;
}
