#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace mesh {

// ============================================================================
// Periodic Task
// ============================================================================

// Runs a callback on its own thread every interval until stopped. An exception
// escaping the callback is logged and the task keeps its schedule.
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    // Run the callback now instead of waiting for the interval
    void wake();

    [[nodiscard]] bool running() const { return running_.load(); }
    [[nodiscard]] std::uint64_t runs() const { return runs_.load(); }
    [[nodiscard]] std::uint64_t failures() const { return failures_.load(); }
    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
    std::chrono::milliseconds interval_;
    Callback callback_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    bool woken_ = false;

    std::atomic<std::uint64_t> runs_{0};
    std::atomic<std::uint64_t> failures_{0};

    void worker_loop();
    void run_once();
};

}  // namespace mesh
