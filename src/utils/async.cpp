#include "call_relay/utils/async.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

#include "call_relay/logging.hpp"

namespace call_relay::utils {

namespace {

struct TaskTracker {
    std::mutex mutex;
    std::condition_variable idle;
    size_t pending = 0;
};

TaskTracker& tracker() {
    static TaskTracker instance;
    return instance;
}

void task_finished() {
    auto& state = tracker();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (--state.pending == 0) {
        state.idle.notify_all();
    }
}

}

void run_async(std::function<void()> task, const char* name) {
    {
        auto& state = tracker();
        std::lock_guard<std::mutex> lock(state.mutex);
        ++state.pending;
    }
    try {
        std::thread worker([task = std::move(task), name]() mutable {
            try {
                task();
            } catch (const std::exception& ex) {
                logging::error(
                    "Async task failed",
                    {kv("task", name),
                     kv("error", ex.what())});
            }
            task_finished();
        });
        worker.detach();
    } catch (const std::system_error&) {
        task_finished();
        throw;
    }
}

size_t pending_async_tasks() {
    auto& state = tracker();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.pending;
}

bool wait_for_async_tasks(std::chrono::milliseconds timeout) {
    auto& state = tracker();
    std::unique_lock<std::mutex> lock(state.mutex);
    return state.idle.wait_for(lock, timeout, [&state]() { return state.pending == 0; });
}

}
