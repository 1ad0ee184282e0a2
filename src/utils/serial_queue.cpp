#include "call_relay/utils/serial_queue.hpp"

#include <exception>

#include "call_relay/logging.hpp"

namespace call_relay::utils {

SerialQueue::SerialQueue(std::string name) : name_(std::move(name)) {
    worker_ = std::thread([this]() { worker_loop(); });
}

SerialQueue::~SerialQueue() {
    stop();
}

bool SerialQueue::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_worker_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void SerialQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_worker_ = true;
    }
    queue_cv_.notify_one();
    if (!worker_.joinable()) {
        return;
    }
    if (std::this_thread::get_id() == worker_.get_id()) {
        worker_.detach();
        return;
    }
    worker_.join();
}

bool SerialQueue::on_worker_thread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void SerialQueue::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stop_worker_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                break;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error(
                "Queued task failed",
                {kv("queue", name_),
                 kv("error", ex.what())});
        }
    }
}

}
