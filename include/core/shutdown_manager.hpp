#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Process-wide cancellation for the CLI.
 * - SIGINT/SIGTERM/SIGQUIT only set sig_atomic_t flags; a watcher thread
 *   turns them into a shutdown request
 * - Registered callbacks run once when shutdown is requested, so batches
 *   stop between items
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Safe from any thread, not from a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    // Runs immediately if shutdown was already requested
    void onShutdown(std::function<void()> callback);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Tests only
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();
    void runCallbacks(std::vector<std::function<void()>> callbacks) noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    std::vector<std::function<void()>> callbacks_;
    mutable std::mutex mutex_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
