#pragma once
#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include "logging/logger.hpp"

/**
 * @brief Exponential backoff for transient upload failures
 *
 * attempt counts the failures already seen for a task, starting at 0.
 */
struct RetryPolicy
{
    int max_retries = 3;
    std::chrono::milliseconds base_delay{200};
    std::chrono::milliseconds max_delay{10000};

    bool allowsRetry(int attempt) const { return attempt < max_retries; }

    std::chrono::milliseconds delayFor(int attempt) const
    {
        if (attempt < 0)
            attempt = 0;
        // Past 2^20 the cap has long been reached
        if (attempt > 20)
            return max_delay;
        auto delay = base_delay * (1LL << attempt);
        return std::min<std::chrono::milliseconds>(delay, max_delay);
    }

    // Synchronous retry for one-off calls outside the work queue; func(error, retryable) -> success
    template <typename Func>
    bool retryWithBackoff(Func func, const std::string &operation_name) const
    {
        for (int attempt = 0;; ++attempt)
        {
            std::string error;
            bool retryable = true;
            if (func(error, retryable))
                return true;

            if (!retryable || !allowsRetry(attempt))
            {
                Logger::error("Operation '" + operation_name + "' failed after " + std::to_string(attempt + 1) +
                              " attempts: " + error);
                return false;
            }

            auto delay = delayFor(attempt);
            Logger::warn("Operation '" + operation_name + "' failed, retrying in " +
                         std::to_string(delay.count()) + "ms (attempt " + std::to_string(attempt + 1) + "/" +
                         std::to_string(max_retries + 1) + "): " + error);
            std::this_thread::sleep_for(delay);
        }
    }
};
