// notification_center.cpp
#include "notification_center.hpp"

#include "collab_ids.hpp"
#include "collab_log.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

namespace collab {

namespace {

constexpr std::array<std::pair<NotificationType, const char *>, 6> kNotificationTypes{{
    {NotificationType::UserJoined, "user_joined"},
    {NotificationType::UserLeft, "user_left"},
    {NotificationType::Conflict, "conflict"},
    {NotificationType::SyncError, "sync_error"},
    {NotificationType::ConnectionLost, "connection_lost"},
    {NotificationType::ConnectionRestored, "connection_restored"},
}};

// Dismissed notifications kept around before the oldest are dropped
constexpr std::size_t kMaxRetained = 100;

} // namespace

const char *to_string(NotificationType type) {
  for (const auto &[value, name] : kNotificationTypes) {
    if (value == type) {
      return name;
    }
  }
  return "unknown";
}

std::optional<NotificationType> notification_type_from_string(std::string_view s) {
  for (const auto &[value, name] : kNotificationTypes) {
    if (s == name) {
      return value;
    }
  }
  return std::nullopt;
}

NotificationCenter::NotificationCenter(Scheduler &scheduler, uint64_t ttl_ms)
    : scheduler_(scheduler), ttl_ms_(ttl_ms) {}

NotificationCenter::~NotificationCenter() {
  for (auto &[id, timer] : expiry_timers_) {
    timer.cancel();
  }
}

std::string NotificationCenter::add(NotificationType type, std::string title, std::string message,
                                    std::vector<NotificationAction> actions) {
  Notification n;
  n.id = generate_notification_id();
  n.type = type;
  n.title = std::move(title);
  n.message = std::move(message);
  n.timestamp = scheduler_.clock().now_ms();
  n.actions = std::move(actions);

  log_debug(std::string("notification [") + to_string(type) + "] " + n.title + ": " + n.message);

  std::string id = n.id;
  notifications_.push_back(std::move(n));
  if (auto_dismisses(type)) {
    expiry_timers_[id] = scheduler_.schedule_after(ttl_ms_, [this, id]() { dismiss(id); });
  }

  // Drop the oldest dismissed entries once the list grows large
  while (notifications_.size() > kMaxRetained) {
    auto oldest = std::find_if(notifications_.begin(), notifications_.end(),
                               [](const Notification &x) { return x.dismissed; });
    if (oldest == notifications_.end()) {
      break;
    }
    notifications_.erase(oldest);
  }

  if (listener_) {
    auto it = std::find_if(notifications_.begin(), notifications_.end(),
                           [&](const Notification &x) { return x.id == id; });
    if (it != notifications_.end()) {
      listener_(*it);
    }
  }
  return id;
}

bool NotificationCenter::dismiss(const std::string &id) {
  if (auto t = expiry_timers_.find(id); t != expiry_timers_.end()) {
    t->second.cancel();
    expiry_timers_.erase(t);
  }

  auto it = std::find_if(notifications_.begin(), notifications_.end(),
                         [&](const Notification &n) { return n.id == id; });
  if (it == notifications_.end() || it->dismissed) {
    return false;
  }
  it->dismissed = true;
  return true;
}

void NotificationCenter::clear() {
  for (auto &[id, timer] : expiry_timers_) {
    timer.cancel();
  }
  expiry_timers_.clear();
  notifications_.clear();
}

bool NotificationCenter::trigger(const std::string &id, const std::string &label) {
  auto it = std::find_if(notifications_.begin(), notifications_.end(),
                         [&](const Notification &n) { return n.id == id; });
  if (it == notifications_.end()) {
    return false;
  }
  for (const auto &action : it->actions) {
    if (action.label == label && action.handler) {
      // Copy first: the handler may add or dismiss notifications
      auto handler = action.handler;
      handler();
      return true;
    }
  }
  return false;
}

std::vector<Notification> NotificationCenter::active() const {
  std::vector<Notification> out;
  std::copy_if(notifications_.begin(), notifications_.end(), std::back_inserter(out),
               [](const Notification &n) { return !n.dismissed; });
  return out;
}

std::size_t NotificationCenter::active_count() const {
  return static_cast<std::size_t>(std::count_if(notifications_.begin(), notifications_.end(),
                                                [](const Notification &n) { return !n.dismissed; }));
}

} // namespace collab
