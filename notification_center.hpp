// notification_center.hpp
#ifndef COLLAB_NOTIFICATION_CENTER_HPP
#define COLLAB_NOTIFICATION_CENTER_HPP

#include "collab_types.hpp"
#include "scheduler.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace collab {

enum class NotificationType { UserJoined, UserLeft, Conflict, SyncError, ConnectionLost, ConnectionRestored };

const char *to_string(NotificationType type);
std::optional<NotificationType> notification_type_from_string(std::string_view s);

/// A labelled action offered with a notification ("Resolve" on conflicts).
struct NotificationAction {
  std::string label;
  std::function<void()> handler;
};

struct Notification {
  std::string id;
  NotificationType type = NotificationType::SyncError;
  std::string title;
  std::string message;
  Timestamp timestamp = 0;
  bool dismissed = false;
  std::vector<NotificationAction> actions;
};

/// User-visible notifications with auto-expiry.
///
/// Everything except conflict and sync_error notifications is dismissed
/// automatically after the configured lifetime.
class NotificationCenter {
public:
  using Listener = std::function<void(const Notification &notification)>;

  NotificationCenter(Scheduler &scheduler, uint64_t ttl_ms = 5000);
  ~NotificationCenter();

  NotificationCenter(const NotificationCenter &) = delete;
  NotificationCenter &operator=(const NotificationCenter &) = delete;

  /// Records a notification and returns its id.
  std::string add(NotificationType type, std::string title, std::string message,
                  std::vector<NotificationAction> actions = {});

  /// Returns false for an unknown or already dismissed id.
  bool dismiss(const std::string &id);

  /// Drops every notification.
  void clear();

  /// Runs the action labelled `label` of notification `id`. Returns false if
  /// there is no such action.
  bool trigger(const std::string &id, const std::string &label);

  /// Notifications not yet dismissed, oldest first.
  std::vector<Notification> active() const;
  std::size_t active_count() const;

  /// Called for every new notification.
  void set_listener(Listener listener) { listener_ = std::move(listener); }

  static bool auto_dismisses(NotificationType type) {
    return type != NotificationType::Conflict && type != NotificationType::SyncError;
  }

private:
  Scheduler &scheduler_;
  uint64_t ttl_ms_;
  std::vector<Notification> notifications_;
  std::unordered_map<std::string, TimerHandle> expiry_timers_;
  Listener listener_;
};

} // namespace collab

#endif // COLLAB_NOTIFICATION_CENTER_HPP
