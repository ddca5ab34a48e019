#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <thread>
#include "core/shutdown_manager.hpp"

class ShutdownManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ShutdownManager::getInstance().reset();
    }

    void TearDown() override
    {
        ShutdownManager::getInstance().reset();
    }
};

TEST_F(ShutdownManagerTest, RequestFromCodeRecordsNoSignal)
{
    auto &mgr = ShutdownManager::getInstance();
    ASSERT_FALSE(mgr.isShutdownRequested());

    mgr.requestShutdown();

    EXPECT_TRUE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.signalNumber(), 0);
}

TEST_F(ShutdownManagerTest, CallbackRunsOnce)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<int> calls{0};
    std::atomic<int> seen_signal{-1};
    mgr.setShutdownCallback([&](int signal_number)
                            {
        ++calls;
        seen_signal.store(signal_number); });

    mgr.requestShutdown(SIGINT);
    mgr.requestShutdown(SIGTERM);

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(seen_signal.load(), SIGINT);
    EXPECT_EQ(mgr.signalNumber(), SIGINT);
}

TEST_F(ShutdownManagerTest, ThrowingCallbackIsContained)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.setShutdownCallback([](int)
                            { throw std::runtime_error("callback failed"); });

    EXPECT_NO_THROW(mgr.requestShutdown());
    EXPECT_TRUE(mgr.isShutdownRequested());
}

TEST_F(ShutdownManagerTest, ResetClearsStateAndCallback)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<int> calls{0};
    mgr.setShutdownCallback([&](int)
                            { ++calls; });
    mgr.requestShutdown(SIGTERM);
    ASSERT_EQ(calls.load(), 1);

    mgr.reset();
    EXPECT_FALSE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.signalNumber(), 0);

    mgr.requestShutdown();
    EXPECT_EQ(calls.load(), 1);
    EXPECT_TRUE(mgr.isShutdownRequested());
}

TEST_F(ShutdownManagerTest, DeliveredSignalInvokesCallback)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<int> seen_signal{0};
    mgr.setShutdownCallback([&](int signal_number)
                            { seen_signal.store(signal_number); });
    mgr.installSignalHandlers();

    std::raise(SIGTERM);

    for (int i = 0; i < 100 && seen_signal.load() == 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(seen_signal.load(), SIGTERM);
    EXPECT_EQ(mgr.signalNumber(), SIGTERM);
}

TEST_F(ShutdownManagerTest, ResetRestoresPreviousHandler)
{
    auto &mgr = ShutdownManager::getInstance();
    struct sigaction before{};
    sigaction(SIGTERM, nullptr, &before);

    mgr.installSignalHandlers();
    struct sigaction during{};
    sigaction(SIGTERM, nullptr, &during);
    EXPECT_NE(during.sa_handler, before.sa_handler);

    mgr.reset();
    struct sigaction after{};
    sigaction(SIGTERM, nullptr, &after);
    EXPECT_EQ(after.sa_handler, before.sa_handler);
}
