#include <catch2/catch_test_macros.hpp>
#include "core/signal_watcher.hpp"

#include <chrono>
#include <csignal>
#include <stop_token>
#include <thread>

using namespace auditfusion;

namespace {

bool wait_for_stop(const std::stop_source& source, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!source.stop_requested()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace

TEST_CASE("SignalWatcher: notified signal requests stop", "[signal]") {
    std::stop_source cancel;
    SignalWatcher watcher(cancel, std::chrono::milliseconds(5));

    SECTION("direct notification") {
        SignalWatcher::notify(SIGINT);
        CHECK(wait_for_stop(cancel, std::chrono::seconds(2)));
    }
    SECTION("raised through the installed handler") {
        SignalWatcher::install();
        REQUIRE(std::raise(SIGTERM) == 0);
        CHECK(wait_for_stop(cancel, std::chrono::seconds(2)));
    }
}

TEST_CASE("SignalWatcher: no signal leaves the run alone", "[signal]") {
    std::stop_source cancel;
    {
        SignalWatcher watcher(cancel, std::chrono::milliseconds(5));
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
    }
    CHECK_FALSE(cancel.stop_requested());
}
