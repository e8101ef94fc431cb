#pragma once

#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>

namespace auditfusion {

/**
 * @brief Turns process signals into a stop request on a stop_source.
 *
 * notify() is the only call made from signal context: it stores the signal
 * number in a lock-free atomic. A watcher thread polls that flag, logs the
 * signal and requests stop on the target.
 */
class SignalWatcher {
public:
    explicit SignalWatcher(std::stop_source target,
                           std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));
    ~SignalWatcher() = default;

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /// Async-signal-safe; suitable as (or from) a signal handler.
    static void notify(int signal) noexcept;

    /// Install notify() for SIGINT and SIGTERM.
    static void install();

private:
    void watch(std::stop_token stop);

    static std::atomic<int> pending_signal_;
    static_assert(std::atomic<int>::is_always_lock_free);

    std::stop_source target_;
    std::chrono::milliseconds poll_interval_;
    std::jthread thread_;
};

} // namespace auditfusion
