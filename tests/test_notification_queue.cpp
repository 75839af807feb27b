/**
 * Gridsync core - Notification Queue Tests
 */

#include <gtest/gtest.h>
#include "notification_queue.hpp"
#include "text_util.hpp"

#include <glib.h>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using namespace gridsync;

/**
 * Collects deferred tasks so tests decide when the next tick happens.
 */
class ManualScheduler {
public:
    Scheduler scheduler() {
        return [this](std::function<void()> task) { tasks_.push_back(std::move(task)); };
    }

    size_t pending() const { return tasks_.size(); }

    void run_all() {
        std::vector<std::function<void()>> tasks;
        tasks.swap(tasks_);
        for (auto& task : tasks) {
            task();
        }
    }

private:
    std::vector<std::function<void()>> tasks_;
};

class NotificationQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway = std::make_shared<Gateway>();
        gateway->name = "TestGrid";
        registry.add(gateway);

        queue = std::make_unique<NotificationQueue>(registry, ticks.scheduler(), "Gridsync");
        queue->set_display_callback([this](const PendingNotification& n) { displayed.push_back(n); });
        queue->set_indicator_callback([this](size_t count) { indicator_counts.push_back(count); });
    }

    GatewayRegistry registry;
    GatewayPtr gateway;
    ManualScheduler ticks;
    std::unique_ptr<NotificationQueue> queue;
    std::vector<PendingNotification> displayed;
    std::vector<size_t> indicator_counts;
};

TEST_F(NotificationQueueTest, VisibleWindowDisplaysImmediately) {
    queue->on_shown();
    ASSERT_EQ(queue->enqueue(gateway, "Hello", "World"), Status::Ok);

    ASSERT_EQ(displayed.size(), 1u);
    EXPECT_EQ(displayed[0].title, "Hello");
    EXPECT_EQ(displayed[0].body, "World");
    EXPECT_FALSE(queue->pending().has_value());
    EXPECT_EQ(queue->unread_count(), 1u);
    EXPECT_EQ(indicator_counts, std::vector<size_t>({1}));
}

TEST_F(NotificationQueueTest, HiddenWindowHoldsMessage) {
    ASSERT_EQ(queue->enqueue(gateway, "Hello", "World"), Status::Ok);

    EXPECT_TRUE(displayed.empty());
    ASSERT_TRUE(queue->pending().has_value());
    EXPECT_EQ(queue->pending()->title, "Hello");
    EXPECT_EQ(queue->unread_count(), 1u);
}

/**
 * Only the most recent message waits for the window; the unread list
 * still has every message until each one is marked displayed.
 */
TEST_F(NotificationQueueTest, OnlyLatestHiddenMessageIsShown) {
    queue->enqueue(gateway, "First", "one");
    queue->enqueue(gateway, "Second", "two");
    EXPECT_EQ(queue->unread_count(), 2u);

    queue->on_shown();
    ticks.run_all();

    ASSERT_EQ(displayed.size(), 1u);
    EXPECT_EQ(displayed[0].title, "Second");
    EXPECT_EQ(queue->unread_count(), 2u);

    EXPECT_EQ(queue->on_displayed(gateway, "Second", "two"), Status::Ok);
    EXPECT_EQ(queue->unread_count(), 1u);
    EXPECT_EQ(queue->unread()[0].title, "First");
    EXPECT_EQ(queue->on_displayed(gateway, "First", "one"), Status::Ok);
    EXPECT_EQ(queue->unread_count(), 0u);
}

TEST_F(NotificationQueueTest, ShownDefersDisplayToNextTick) {
    queue->enqueue(gateway, "Hello", "World");
    queue->on_shown();

    EXPECT_TRUE(displayed.empty());
    EXPECT_FALSE(queue->pending().has_value());
    EXPECT_EQ(ticks.pending(), 1u);

    ticks.run_all();
    ASSERT_EQ(displayed.size(), 1u);
    EXPECT_EQ(displayed[0].title, "Hello");
}

TEST_F(NotificationQueueTest, ShownWithNothingPendingSchedulesNothing) {
    queue->on_shown();
    EXPECT_EQ(ticks.pending(), 0u);
    queue->on_shown();
    EXPECT_EQ(ticks.pending(), 0u);
}

TEST_F(NotificationQueueTest, HidingAfterShowDoesNotCancelDisplay) {
    queue->enqueue(gateway, "Hello", "World");
    queue->on_shown();
    queue->on_hidden();
    ticks.run_all();

    EXPECT_EQ(displayed.size(), 1u);
    EXPECT_FALSE(queue->is_window_visible());
}

TEST_F(NotificationQueueTest, DestroyedQueueSkipsDeferredDisplay) {
    queue->enqueue(gateway, "Hello", "World");
    queue->on_shown();
    queue.reset();

    ticks.run_all();
    EXPECT_TRUE(displayed.empty());
}

// Deferred displays point at the queue, so it must stay where it was built
static_assert(!std::is_copy_constructible<NotificationQueue>::value, "NotificationQueue must not be copyable");
static_assert(!std::is_copy_assignable<NotificationQueue>::value, "NotificationQueue must not be copyable");
static_assert(!std::is_move_constructible<NotificationQueue>::value, "NotificationQueue must not be movable");
static_assert(!std::is_move_assignable<NotificationQueue>::value, "NotificationQueue must not be movable");

TEST_F(NotificationQueueTest, DisplayedRemovesExactTupleOnly) {
    queue->enqueue(gateway, "Hello", "World");

    EXPECT_EQ(queue->on_displayed(gateway, "Hello", "world"), Status::DisplayMismatch);
    auto other = std::make_shared<Gateway>(*gateway);
    EXPECT_EQ(queue->on_displayed(other, "Hello", "World"), Status::DisplayMismatch);
    EXPECT_EQ(queue->unread_count(), 1u);

    EXPECT_EQ(queue->on_displayed(gateway, "Hello", "World"), Status::Ok);
    EXPECT_EQ(queue->on_displayed(gateway, "Hello", "World"), Status::DisplayMismatch);
    EXPECT_EQ(queue->unread_count(), 0u);
}

TEST_F(NotificationQueueTest, IndicatorTracksUnreadCount) {
    queue->enqueue(gateway, "A", "1");
    queue->enqueue(gateway, "B", "2");
    queue->on_displayed(gateway, "A", "1");
    queue->on_displayed(gateway, "A", "1");  // already gone, no update

    EXPECT_EQ(indicator_counts, std::vector<size_t>({1, 2, 1}));
}

TEST_F(NotificationQueueTest, UnknownGatewayIsIgnored) {
    auto stranger = std::make_shared<Gateway>();
    stranger->name = "Stranger";

    EXPECT_EQ(queue->enqueue(stranger, "Hi", "there"), Status::UnknownGateway);
    EXPECT_EQ(queue->on_upgrade_required(stranger), Status::UnknownGateway);
    EXPECT_EQ(queue->on_message_received(stranger, "text"), Status::UnknownGateway);
    EXPECT_EQ(queue->unread_count(), 0u);
    EXPECT_FALSE(queue->pending().has_value());
    EXPECT_TRUE(indicator_counts.empty());
}

TEST_F(NotificationQueueTest, UpgradeRequiredNamesGatewayAndApp) {
    queue->on_shown();
    ASSERT_EQ(queue->on_upgrade_required(gateway), Status::Ok);

    ASSERT_EQ(displayed.size(), 1u);
    EXPECT_EQ(displayed[0].title, "Upgrade required");
    EXPECT_NE(displayed[0].body.find("from TestGrid in an unsupported format"), std::string::npos);
    EXPECT_NE(displayed[0].body.find("out-of-date version of Gridsync"), std::string::npos);
    EXPECT_EQ(queue->unread_count(), 1u);
}

TEST_F(NotificationQueueTest, MessageReceivedNotifiesDesktopWithPlainText) {
    std::string desktop_title;
    std::string desktop_text;
    queue->set_message_callback([&](const std::string& title, const std::string& text) {
        desktop_title = title;
        desktop_text = text;
    });

    ASSERT_EQ(queue->on_message_received(gateway, "<p>Maintenance <b>tonight</b></p>"), Status::Ok);

    EXPECT_EQ(desktop_title, "New message from TestGrid");
    EXPECT_EQ(desktop_text, "\n\nMaintenance tonight");
    ASSERT_TRUE(queue->pending().has_value());
    EXPECT_EQ(queue->pending()->title, "New message from TestGrid");
    EXPECT_EQ(queue->pending()->body, "<p>Maintenance <b>tonight</b></p>");
}

TEST(StripHtmlTagsTests, ParagraphsBecomeBlankLines) {
    EXPECT_EQ(strip_html_tags("<p>One</p><p>Two</p>"), "\n\nOne\n\nTwo");
    EXPECT_EQ(strip_html_tags("plain"), "plain");
    EXPECT_EQ(strip_html_tags("<a href=\"x\">link</a>"), "link");
}

/**
 * The default scheduler posts to the GLib main context; nothing runs
 * until the loop iterates.
 */
TEST(MainLoopDispatchTests, RunsOnNextIteration) {
    int calls = 0;
    dispatch_next_tick([&calls]() { ++calls; });
    EXPECT_EQ(calls, 0);

    while (g_main_context_iteration(nullptr, FALSE)) {
    }
    EXPECT_EQ(calls, 1);
}

TEST(MainLoopDispatchTests, ThrowingTaskDoesNotStopLaterTasks) {
    int calls = 0;
    dispatch_next_tick([]() { throw 42; });
    dispatch_next_tick([]() { throw std::runtime_error("boom"); });
    dispatch_next_tick([&calls]() { ++calls; });

    while (g_main_context_iteration(nullptr, FALSE)) {
    }
    EXPECT_EQ(calls, 1);
}
