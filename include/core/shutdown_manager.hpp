#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Process-wide shutdown coordination.
 * - Signal handlers for SIGINT/SIGTERM only set sig_atomic_t flags
 * - A watcher thread turns those flags into a shutdown request
 * - Registered callbacks run once, on the thread that requested shutdown
 */
class ShutdownManager
{
public:
    using ShutdownCallback = std::function<void(const std::string &reason)>;

    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Safe from any thread, not from a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    /**
     * @brief Register work to run when shutdown is requested
     * @param callback Invoked once; exceptions it throws are logged
     */
    void addShutdownCallback(ShutdownCallback callback);

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    void waitForShutdown();

    /**
     * @brief Wait until shutdown is requested or the predicate holds
     * @param done Checked every poll_ms milliseconds
     * @return true if shutdown was requested
     */
    bool waitForShutdownOr(const std::function<bool()> &done, int poll_ms = 100);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<ShutdownCallback> callbacks_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
