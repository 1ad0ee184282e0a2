#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace call_relay {
namespace utils {

// Runs posted tasks one at a time, in posting order, on a dedicated thread.
class SerialQueue {
public:
    using Task = std::function<void()>;

    explicit SerialQueue(std::string name);
    ~SerialQueue();

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    // Returns false once the queue has been stopped.
    bool post(Task task);

    // Drains tasks posted before the call, then joins the worker. Safe to call
    // from a task; in that case the worker exits after the current task.
    void stop();

    bool on_worker_thread() const;

private:
    void worker_loop();

    std::string name_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Task> tasks_;
    bool stop_worker_ = false;
    std::thread worker_;
};

}
}
