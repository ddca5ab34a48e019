#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <string>
#include <unistd.h>

volatile sig_atomic_t ShutdownManager::signal_num_ = 0;
volatile sig_atomic_t ShutdownManager::signal_count_ = 0;

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
    std::lock_guard<std::mutex> lk(mutex_);
    if (!handlers_installed_)
    {
        struct sigaction action{};
        action.sa_handler = &ShutdownManager::handleSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;

        sigaction(SIGINT, &action, &previous_int_);
        sigaction(SIGTERM, &action, &previous_term_);
        sigaction(SIGQUIT, &action, &previous_quit_);
        handlers_installed_ = true;
    }

    startWatcher();
    Logger::debug("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    // Second signal while the first is still being honoured: leave immediately
    if (signal_count_ > 0)
        _exit(128 + sig);
    signal_count_ = signal_count_ + 1;
    signal_num_ = sig;
}

void ShutdownManager::setShutdownCallback(ShutdownCallback callback)
{
    std::lock_guard<std::mutex> lk(mutex_);
    callback_ = std::move(callback);
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
        return;

    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load() && !shutdown_requested_.load())
        {
            int sig = signal_num_;
            if (sig != 0)
            {
                requestShutdown(sig);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
        watcher_.join();
}

void ShutdownManager::requestShutdown(int signal_number) noexcept
{
    if (shutdown_requested_.exchange(true))
        return;
    last_signal_.store(signal_number);

    ShutdownCallback callback;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        callback = callback_;
    }

    if (signal_number != 0)
    {
        Logger::warn("Received signal " + std::to_string(signal_number) +
                     ", cancelling the run (send it again to exit immediately)");
    }
    else
    {
        Logger::info("Cancellation requested");
    }

    if (!callback)
        return;
    try
    {
        callback(signal_number);
    }
    catch (const std::exception &e)
    {
        Logger::error("Shutdown callback failed: " + std::string(e.what()));
    }
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    std::lock_guard<std::mutex> lk(mutex_);
    if (handlers_installed_)
    {
        sigaction(SIGINT, &previous_int_, nullptr);
        sigaction(SIGTERM, &previous_term_, nullptr);
        sigaction(SIGQUIT, &previous_quit_, nullptr);
        handlers_installed_ = false;
    }

    shutdown_requested_.store(false);
    last_signal_.store(0);
    signal_num_ = 0;
    signal_count_ = 0;
    callback_ = nullptr;
}
