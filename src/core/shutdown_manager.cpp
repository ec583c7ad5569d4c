#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

namespace
{
    constexpr std::chrono::milliseconds WATCH_INTERVAL{50};
}

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    for (int sig : {SIGINT, SIGTERM, SIGQUIT})
    {
        std::signal(sig, &ShutdownManager::handleSignal);
    }
    startWatcher();
    Logger::debug("Signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
        return;
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load() && !shutdown_requested_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("signal received", sig);
                break;
            }
            std::this_thread::sleep_for(WATCH_INTERVAL);
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
    {
        watcher_.join();
    }
}

void ShutdownManager::runCallbacks(std::vector<std::function<void()>> callbacks) noexcept
{
    for (auto &callback : callbacks)
    {
        try
        {
            callback();
        }
        catch (const std::exception &e)
        {
            Logger::error("Shutdown callback failed: " + std::string(e.what()));
        }
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
            return;
        reason_ = reason;
        last_signal_.store(signal_number);
        shutdown_requested_.store(true);
        callbacks.swap(callbacks_);
    }

    if (signal_number != 0)
        Logger::warn("Received signal " + std::to_string(signal_number) + ", stopping after the current item");
    else
        Logger::info("Shutdown requested: " + reason);

    runCallbacks(std::move(callbacks));
}

void ShutdownManager::onShutdown(std::function<void()> callback)
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!shutdown_requested_.load())
        {
            callbacks_.push_back(std::move(callback));
            return;
        }
    }
    runCallbacks({std::move(callback)});
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();
    signal_flag_ = 0;
    signal_num_ = 0;
    last_signal_.store(0);

    std::lock_guard<std::mutex> lk(mutex_);
    shutdown_requested_.store(false);
    reason_.clear();
    callbacks_.clear();
}
