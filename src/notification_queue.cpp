#include "notification_queue.hpp"
#include "logger.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <utility>

namespace gridsync {

NotificationQueue::NotificationQueue(const GatewayRegistry& registry, Scheduler scheduler,
                                     std::string app_name)
    : registry_(registry),
      scheduler_(std::move(scheduler)),
      app_name_(std::move(app_name)) {}

void NotificationQueue::set_display_callback(DisplayCallback callback) {
    display_callback_ = std::move(callback);
}

void NotificationQueue::set_indicator_callback(IndicatorCallback callback) {
    indicator_callback_ = std::move(callback);
}

void NotificationQueue::set_message_callback(MessageCallback callback) {
    message_callback_ = std::move(callback);
}

Status NotificationQueue::enqueue(const GatewayPtr& gateway, const std::string& title,
                                  const std::string& body) {
    if (!registry_.contains(gateway)) {
        Logger::debug("[Notifications] Dropping message for unregistered gateway: " + title);
        return Status::UnknownGateway;
    }

    PendingNotification notification{gateway, title, body};
    unread_.push_back(notification);
    update_indicator();

    if (window_visible_) {
        request_display(notification);
    } else {
        if (pending_) {
            Logger::debug("[Notifications] Replacing pending message: " + pending_->title);
        }
        pending_ = std::move(notification);
    }
    return Status::Ok;
}

Status NotificationQueue::on_message_received(const GatewayPtr& gateway, const std::string& message) {
    if (!registry_.contains(gateway)) {
        return Status::UnknownGateway;
    }
    std::string title = "New message from " + gateway->name;
    if (message_callback_) {
        message_callback_(title, strip_html_tags(message));
    }
    return enqueue(gateway, title, message);
}

Status NotificationQueue::on_upgrade_required(const GatewayPtr& gateway) {
    if (!registry_.contains(gateway)) {
        return Status::UnknownGateway;
    }
    std::string body =
        "A message was received from " + gateway->name + " in an unsupported format. This "
        "suggests that you are running an out-of-date version of " + app_name_ + ".\n\n"
        "To avoid seeing this warning, please upgrade to the latest version.";
    Logger::warn("[Notifications] Unsupported newscap message format from " + gateway->name);
    return enqueue(gateway, "Upgrade required", body);
}

void NotificationQueue::on_shown() {
    window_visible_ = true;
    if (!pending_) {
        return;
    }
    PendingNotification notification = std::move(*pending_);
    pending_.reset();

    // Not from inside the show handler; a later hide does not cancel it
    std::weak_ptr<bool> alive = alive_;
    scheduler_([this, alive, notification]() {
        if (alive.expired()) {
            return;
        }
        request_display(notification);
    });
}

void NotificationQueue::on_hidden() {
    window_visible_ = false;
}

Status NotificationQueue::on_displayed(const GatewayPtr& gateway, const std::string& title,
                                       const std::string& body) {
    PendingNotification notification{gateway, title, body};
    auto it = std::find(unread_.begin(), unread_.end(), notification);
    if (it == unread_.end()) {
        return Status::DisplayMismatch;
    }
    unread_.erase(it);
    update_indicator();
    return Status::Ok;
}

void NotificationQueue::request_display(const PendingNotification& notification) {
    Logger::info("[Notifications] Showing: " + notification.title);
    if (display_callback_) {
        display_callback_(notification);
    }
}

void NotificationQueue::update_indicator() {
    if (indicator_callback_) {
        indicator_callback_(unread_.size());
    }
}

} // namespace gridsync
