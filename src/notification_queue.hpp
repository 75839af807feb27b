#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "app_info.hpp"
#include "gateway.hpp"
#include "gateway_registry.hpp"
#include "main_loop.hpp"
#include "status.hpp"

namespace gridsync {

/**
 * A message from a gateway waiting to be shown or read.
 */
struct PendingNotification {
    GatewayPtr gateway;
    std::string title;
    std::string body;

    bool operator==(const PendingNotification& other) const {
        return gateway == other.gateway && title == other.title && body == other.body;
    }
    bool operator!=(const PendingNotification& other) const { return !(*this == other); }
};

/**
 * Notification Queue
 *
 * Decouples gateway messages from the window:
 * - every message goes to the unread list that drives the tray badge
 * - a message arriving while the window is visible is displayed at once
 * - otherwise it takes the single pending slot (a newer one replaces it)
 *   and is displayed on the main-loop iteration after the window is shown
 */
class NotificationQueue {
public:
    using DisplayCallback = std::function<void(const PendingNotification& notification)>;
    using IndicatorCallback = std::function<void(size_t unread_count)>;
    using MessageCallback = std::function<void(const std::string& title, const std::string& text)>;

    explicit NotificationQueue(const GatewayRegistry& registry,
                               Scheduler scheduler = dispatch_next_tick,
                               std::string app_name = APP_NAME);

    // Deferred displays hold a pointer to this queue
    NotificationQueue(const NotificationQueue&) = delete;
    NotificationQueue& operator=(const NotificationQueue&) = delete;
    NotificationQueue(NotificationQueue&&) = delete;
    NotificationQueue& operator=(NotificationQueue&&) = delete;

    void set_display_callback(DisplayCallback callback);
    void set_indicator_callback(IndicatorCallback callback);
    // Desktop (tray) notification for newly received gateway messages
    void set_message_callback(MessageCallback callback);

    Status enqueue(const GatewayPtr& gateway, const std::string& title, const std::string& body);

    // News message from a gateway's newscap
    Status on_message_received(const GatewayPtr& gateway, const std::string& message);

    // A newscap message arrived in a format this version cannot read
    Status on_upgrade_required(const GatewayPtr& gateway);

    void on_shown();
    void on_hidden();
    bool is_window_visible() const { return window_visible_; }

    // The presentation layer showed this message; drop it from the unread list
    Status on_displayed(const GatewayPtr& gateway, const std::string& title, const std::string& body);

    const std::vector<PendingNotification>& unread() const { return unread_; }
    size_t unread_count() const { return unread_.size(); }
    const std::optional<PendingNotification>& pending() const { return pending_; }

private:
    void request_display(const PendingNotification& notification);
    void update_indicator();

    const GatewayRegistry& registry_;
    Scheduler scheduler_;
    std::string app_name_;

    bool window_visible_ = false;
    std::vector<PendingNotification> unread_;
    std::optional<PendingNotification> pending_;

    DisplayCallback display_callback_;
    IndicatorCallback indicator_callback_;
    MessageCallback message_callback_;

    // Deferred displays check this before touching the queue
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace gridsync
