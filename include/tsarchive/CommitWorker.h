/**
 * CommitWorker.h - Background stage that writes fetched chunks to disk
 *
 * Holds at most one commit at a time: submit() blocks until the previous
 * commit has finished, so the fetch pipeline never has more than one fetch
 * and one commit in flight.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

class CommitWorker {
public:
    using Job = std::function<void()>;

    CommitWorker();
    ~CommitWorker();

    CommitWorker(const CommitWorker&) = delete;
    CommitWorker& operator=(const CommitWorker&) = delete;

    /**
     * @brief Hand a commit to the worker, waiting for the previous one first.
     * @return false if the worker has been shut down.
     */
    bool submit(Job job);

    /**
     * @brief Wait until no commit is pending or running.
     */
    void drain();

    /**
     * @brief Finish the pending commit, then stop the thread.
     */
    void shutdown();

    bool busy() const;

private:
    Job pending_;
    bool has_pending_ = false;
    bool running_job_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    std::atomic<bool> stop_{false};

    void worker_loop();
};
