#include "pnp/event_queue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

using namespace ippusb;

class EventQueueTest : public ::testing::Test {
protected:
    // wait() on another thread, so a test can check whether it is still blocked
    std::future<pnp::PnpEvent> wait_async() {
        return std::async(std::launch::async, [this]() { return queue.wait(); });
    }

    static bool still_blocked(std::future<pnp::PnpEvent> &waiter) {
        return waiter.wait_for(std::chrono::milliseconds(30)) == std::future_status::timeout;
    }

    static pnp::PnpEvent get_within(std::future<pnp::PnpEvent> &waiter) {
        EXPECT_EQ(waiter.wait_for(std::chrono::seconds(2)), std::future_status::ready);
        return waiter.get();
    }

    pnp::EventQueue queue;
};

TEST_F(EventQueueTest, WaitBlocksWithoutEvent) {
    auto waiter = wait_async();
    EXPECT_TRUE(still_blocked(waiter));

    // Release the waiter so the future can be joined
    queue.post_terminate("SIGTERM");
    EXPECT_EQ(get_within(waiter).kind, pnp::PnpEvent::Kind::TERMINATE);
}

TEST_F(EventQueueTest, HotplugDelivered) {
    queue.post_hotplug();

    EXPECT_EQ(queue.wait().kind, pnp::PnpEvent::Kind::HOTPLUG);
}

TEST_F(EventQueueTest, HotplugNotificationsCoalesce) {
    queue.post_hotplug();
    queue.post_hotplug();
    queue.post_hotplug();

    EXPECT_EQ(queue.wait().kind, pnp::PnpEvent::Kind::HOTPLUG);

    // All three were folded into the one delivered above
    auto waiter = wait_async();
    EXPECT_TRUE(still_blocked(waiter));
    queue.post_terminate("SIGTERM");
    EXPECT_EQ(get_within(waiter).kind, pnp::PnpEvent::Kind::TERMINATE);
}

TEST_F(EventQueueTest, TerminateTakesPriorityOverHotplug) {
    queue.post_hotplug();
    queue.post_terminate("SIGTERM");

    pnp::PnpEvent event = queue.wait();
    EXPECT_EQ(event.kind, pnp::PnpEvent::Kind::TERMINATE);
    EXPECT_EQ(event.reason, "SIGTERM");
}

TEST_F(EventQueueTest, TerminateIsSticky) {
    queue.post_terminate("SIGINT");

    EXPECT_EQ(queue.wait().kind, pnp::PnpEvent::Kind::TERMINATE);
    EXPECT_EQ(queue.wait().kind, pnp::PnpEvent::Kind::TERMINATE);
}

TEST_F(EventQueueTest, FirstTerminateReasonWins) {
    queue.post_terminate("SIGHUP");
    queue.post_terminate("SIGTERM");

    EXPECT_EQ(queue.wait().reason, "SIGHUP");
}

TEST_F(EventQueueTest, WaitWakesOnPostFromOtherThread) {
    auto waiter = wait_async();

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.post_hotplug();

    EXPECT_EQ(get_within(waiter).kind, pnp::PnpEvent::Kind::HOTPLUG);
}
