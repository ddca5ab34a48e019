#include <gtest/gtest.h>
#include "core/retry_policy.hpp"
#include "core/retry_scheduler.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace
{
    UploadTask makeTask(const std::string &name, int attempt = 1)
    {
        UploadTask task(std::make_shared<const FileEntry>("/nowhere/" + name, name, 1, 1));
        task.attempt = attempt;
        return task;
    }
}

TEST(RetrySchedulerTest, TaskReturnsToQueueAfterDelay)
{
    WorkQueue queue(4);
    RetryScheduler scheduler(queue, nullptr);
    scheduler.start();

    auto scheduled_at = std::chrono::steady_clock::now();
    scheduler.schedule(makeTask("a", 2), 50ms);
    EXPECT_EQ(scheduler.pending(), 1u);

    auto task = queue.dequeue();
    auto waited = std::chrono::steady_clock::now() - scheduled_at;
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->entry->relativePath(), "a");
    EXPECT_EQ(task->attempt, 2);
    EXPECT_GE(waited, 50ms);

    EXPECT_TRUE(scheduler.stop().empty());
    EXPECT_FALSE(scheduler.isRunning());
}

TEST(RetrySchedulerTest, EarlierDeadlineComesFirst)
{
    WorkQueue queue(4);
    RetryScheduler scheduler(queue, nullptr);
    scheduler.start();

    scheduler.schedule(makeTask("slow"), 120ms);
    scheduler.schedule(makeTask("fast"), 10ms);

    EXPECT_EQ(queue.dequeue()->entry->relativePath(), "fast");
    EXPECT_EQ(queue.dequeue()->entry->relativePath(), "slow");
    scheduler.stop();
}

TEST(RetrySchedulerTest, StopReturnsWaitingTasks)
{
    WorkQueue queue(4);
    RetryScheduler scheduler(queue, nullptr);
    scheduler.start();

    scheduler.schedule(makeTask("a"), 10s);
    scheduler.schedule(makeTask("b"), 10s);

    auto leftover = scheduler.stop();
    EXPECT_EQ(leftover.size(), 2u);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(RetrySchedulerTest, RejectedTaskGoesToCallback)
{
    WorkQueue queue(4);
    queue.close();

    std::mutex mutex;
    std::vector<std::string> rejected;
    RetryScheduler scheduler(queue, [&](UploadTask &&task)
                             {
                                 std::lock_guard<std::mutex> lock(mutex);
                                 rejected.push_back(task.entry->relativePath());
                             });
    scheduler.start();
    scheduler.schedule(makeTask("a"), 0ms);

    for (int i = 0; i < 100 && scheduler.pending() > 0; ++i)
        std::this_thread::sleep_for(5ms);
    scheduler.stop();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0], "a");
}

TEST(RetryPolicyTest, ExponentialDelayIsCapped)
{
    RetryPolicy policy;
    policy.base_delay = 100ms;
    policy.max_delay = 1000ms;

    EXPECT_EQ(policy.delayFor(0), 100ms);
    EXPECT_EQ(policy.delayFor(1), 200ms);
    EXPECT_EQ(policy.delayFor(3), 800ms);
    EXPECT_EQ(policy.delayFor(4), 1000ms);
    EXPECT_EQ(policy.delayFor(60), 1000ms);
}

TEST(RetryPolicyTest, AllowsRetryBelowLimit)
{
    RetryPolicy policy;
    policy.max_retries = 2;
    EXPECT_TRUE(policy.allowsRetry(0));
    EXPECT_TRUE(policy.allowsRetry(1));
    EXPECT_FALSE(policy.allowsRetry(2));

    policy.max_retries = 0;
    EXPECT_FALSE(policy.allowsRetry(0));
}

TEST(RetryPolicyTest, RetryWithBackoffStopsOnPermanentError)
{
    RetryPolicy policy;
    policy.max_retries = 5;
    policy.base_delay = 1ms;

    int calls = 0;
    bool ok = policy.retryWithBackoff([&](std::string &error, bool &retryable)
                               {
                                   ++calls;
                                   error = "bad request";
                                   retryable = false;
                                   return false; },
                               "permanent");
    EXPECT_FALSE(ok);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, RetryWithBackoffRetriesTransientErrors)
{
    RetryPolicy policy;
    policy.max_retries = 3;
    policy.base_delay = 1ms;

    int calls = 0;
    bool ok = policy.retryWithBackoff([&](std::string &error, bool &retryable)
                               {
                                   ++calls;
                                   if (calls < 3)
                                   {
                                       error = "timeout";
                                       retryable = true;
                                       return false;
                                   }
                                   return true; },
                               "transient");
    EXPECT_TRUE(ok);
    EXPECT_EQ(calls, 3);
}
