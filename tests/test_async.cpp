#include <catch2/catch_test_macros.hpp>

#include "call_relay/utils/async.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

using namespace std::chrono_literals;

TEST_CASE("wait_for_async_tasks waits for running tasks") {
    REQUIRE(call_relay::utils::wait_for_async_tasks(2000ms));

    std::promise<void> gate;
    auto released = gate.get_future().share();
    std::atomic<bool> finished{false};
    call_relay::utils::run_async(
        [released, &finished]() {
            released.wait();
            finished = true;
        },
        "gated");

    REQUIRE(call_relay::utils::pending_async_tasks() >= 1);
    REQUIRE_FALSE(call_relay::utils::wait_for_async_tasks(20ms));

    gate.set_value();
    REQUIRE(call_relay::utils::wait_for_async_tasks(2000ms));
    REQUIRE(finished);
    REQUIRE(call_relay::utils::pending_async_tasks() == 0);
}

TEST_CASE("a throwing task still counts as finished") {
    call_relay::utils::run_async([]() { throw std::runtime_error("boom"); }, "throwing");
    REQUIRE(call_relay::utils::wait_for_async_tasks(2000ms));
    REQUIRE(call_relay::utils::pending_async_tasks() == 0);
}
