#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

namespace call_relay {
namespace utils {

// Runs the task on a detached thread. Exceptions escaping the task are logged.
void run_async(std::function<void()> task, const char* name = "async");

// Number of run_async tasks that have not returned yet.
size_t pending_async_tasks();

// Blocks until every run_async task has returned. Returns false if some are
// still running when the timeout expires.
bool wait_for_async_tasks(std::chrono::milliseconds timeout);

}
}
