/**
 * CommitWorker.cpp - Implementation
 */

#include "tsarchive/CommitWorker.h"
#include <exception>
#include <iostream>

CommitWorker::CommitWorker() {
    thread_ = std::thread([this]() { this->worker_loop(); });
}

CommitWorker::~CommitWorker() {
    shutdown();
}

bool CommitWorker::submit(Job job) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() {
        return stop_.load() || (!has_pending_ && !running_job_);
    });
    if (stop_.load()) return false;

    pending_ = std::move(job);
    has_pending_ = true;
    lock.unlock();
    cv_.notify_all();
    return true;
}

void CommitWorker::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !has_pending_ && !running_job_; });
}

void CommitWorker::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.load()) return;
        stop_.store(true);
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

bool CommitWorker::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return has_pending_ || running_job_;
}

void CommitWorker::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() {
                return stop_.load() || has_pending_;
            });

            // A commit accepted before shutdown is always carried out.
            if (!has_pending_) {
                break;
            }

            job = std::move(pending_);
            pending_ = nullptr;
            has_pending_ = false;
            running_job_ = true;
        }

        try {
            if (job) job();
        } catch (const std::exception& e) {
            std::cerr << "❌ Commit job exception: " << e.what() << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_job_ = false;
        }
        cv_.notify_all();
    }
}
