#include "core/signal_watcher.hpp"
#include "core/utils.hpp"

#include <csignal>
#include <format>

namespace auditfusion {

std::atomic<int> SignalWatcher::pending_signal_{0};

SignalWatcher::SignalWatcher(std::stop_source target, std::chrono::milliseconds poll_interval)
    : target_(std::move(target)),
      poll_interval_(poll_interval),
      thread_([this](std::stop_token stop) { watch(stop); }) {}

void SignalWatcher::notify(int signal) noexcept {
    pending_signal_.store(signal, std::memory_order_relaxed);
}

void SignalWatcher::install() {
    std::signal(SIGINT, &SignalWatcher::notify);
    std::signal(SIGTERM, &SignalWatcher::notify);
}

void SignalWatcher::watch(std::stop_token stop) {
    while (!stop.stop_requested()) {
        const int signal = pending_signal_.exchange(0, std::memory_order_relaxed);
        if (signal != 0) {
            utils::log::warn(std::format("Received signal {}, cancelling detection run...", signal));
            target_.request_stop();
        }
        std::this_thread::sleep_for(poll_interval_);
    }
}

} // namespace auditfusion
