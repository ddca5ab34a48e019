#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <thread>

/**
 * @brief Turns SIGINT, SIGTERM and SIGQUIT into one cancellation request
 *
 * The handler only sets sig_atomic_t flags; a watcher thread picks them up and
 * runs the callback outside signal context. A second signal exits with 128+sig.
 */
class ShutdownManager
{
public:
    // Receives the signal number, or 0 for a request made from code
    using ShutdownCallback = std::function<void(int signal_number)>;

    static ShutdownManager &getInstance();

    void installSignalHandlers();
    void setShutdownCallback(ShutdownCallback callback);

    // Runs the callback at most once per install; not for use inside a signal handler
    void requestShutdown(int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }
    int signalNumber() const noexcept { return last_signal_.load(); }

    // Stops the watcher, restores the previous handlers and drops the callback
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
    std::atomic<int> last_signal_{0};
    ShutdownCallback callback_;
    std::mutex mutex_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    bool handlers_installed_ = false;
    struct sigaction previous_int_{};
    struct sigaction previous_term_{};
    struct sigaction previous_quit_{};

    static volatile sig_atomic_t signal_num_;
    static volatile sig_atomic_t signal_count_;
};
