#include <gtest/gtest.h>
#include <atomic>
#include <csignal>
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

TEST_F(ShutdownManagerTest, ProgrammaticShutdownRunsCallbacks)
{
    auto &mgr = ShutdownManager::getInstance();
    // Signal handlers are not installed in tests

    std::atomic<int> calls{0};
    mgr.onShutdown([&calls]()
                   { calls++; });
    mgr.requestShutdown("unit-test");

    ASSERT_TRUE(mgr.isShutdownRequested());
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(mgr.getSignalNumber(), 0);
    EXPECT_EQ(mgr.getReason(), "unit-test");

    // A second request is ignored and callbacks do not run again
    mgr.requestShutdown("again");
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(mgr.getReason(), "unit-test");
}

TEST_F(ShutdownManagerTest, CallbackRegisteredAfterShutdownRunsImmediately)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("test-signal", SIGTERM);

    bool called = false;
    mgr.onShutdown([&called]()
                   { called = true; });
    EXPECT_TRUE(called);
    EXPECT_EQ(mgr.getSignalNumber(), SIGTERM);
}

TEST_F(ShutdownManagerTest, ThrowingCallbackDoesNotStopOthers)
{
    auto &mgr = ShutdownManager::getInstance();
    bool second = false;
    mgr.onShutdown([]()
                   { throw std::runtime_error("boom"); });
    mgr.onShutdown([&second]()
                   { second = true; });
    mgr.requestShutdown("unit-test");
    EXPECT_TRUE(second);
}

TEST_F(ShutdownManagerTest, ResetClearsState)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("unit-test");
    mgr.reset();
    EXPECT_FALSE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getReason(), "");
}
