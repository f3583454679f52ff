#include "periodic_task.hh"
#include "core/logging.hh"
#include <exception>

namespace mesh {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback)
    : name_(std::move(name))
    , interval_(interval)
    , callback_(std::move(callback)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }
    worker_thread_ = std::thread(&PeriodicTask::worker_loop, this);
    MESH_LOG_DEBUG(log::core) << "Started task " << name_
                              << " every " << interval_.count() << "ms";
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false) && !worker_thread_.joinable()) {
            return;
        }
    }
    cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    MESH_LOG_DEBUG(log::core) << "Stopped task " << name_ << " after " << runs_.load() << " runs";
}

void PeriodicTask::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        woken_ = true;
    }
    cv_.notify_all();
}

void PeriodicTask::run_once() {
    try {
        callback_();
    } catch (const std::exception& e) {
        failures_.fetch_add(1);
        MESH_LOG_ERROR(log::core) << "Task " << name_ << " failed: " << e.what();
    }
    runs_.fetch_add(1);
}

void PeriodicTask::worker_loop() {
    while (running_.load()) {
        run_once();

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, interval_, [this]() {
            return woken_ || !running_.load();
        });
        woken_ = false;
    }
}

}  // namespace mesh
