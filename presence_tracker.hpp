// presence_tracker.hpp
#ifndef COLLAB_PRESENCE_TRACKER_HPP
#define COLLAB_PRESENCE_TRACKER_HPP

#include "collab_types.hpp"
#include "scheduler.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace collab {

/// Cursor, selection and viewport of every participant in one session.
///
/// Local changes are merged into one record and broadcast after a debounce
/// window; at most one broadcast is armed at a time and it sends whatever the
/// record holds when it fires. Presence is transient: nothing is queued or
/// retried while the link is down.
class PresenceTracker {
public:
  /// Sends the local record. Returns false when it could not be transmitted.
  using Broadcaster = std::function<bool(const PresenceInfo &presence)>;

  PresenceTracker(Scheduler &scheduler, uint64_t debounce_ms = 100, uint64_t stale_after_ms = 60000);
  ~PresenceTracker();

  PresenceTracker(const PresenceTracker &) = delete;
  PresenceTracker &operator=(const PresenceTracker &) = delete;

  void set_broadcaster(Broadcaster broadcaster) { broadcaster_ = std::move(broadcaster); }

  /// Identifies the local record. Resets it when the identity changes.
  void set_local_identity(const std::string &user_id, const std::string &session_id);

  /// Merges a partial update into the local record and arms the broadcast.
  ///
  /// @throws StateError when no local identity is set
  /// @throws ProtocolError when the merged record cannot be encoded; the
  ///         previous record is kept
  const PresenceInfo &update_presence(const PresenceUpdate &update);

  /// Replaces the record of another participant.
  void apply_remote(const PresenceInfo &presence);

  bool remove(const std::string &user_id);

  const std::optional<PresenceInfo> &local() const { return local_; }
  std::optional<PresenceInfo> find(const std::string &user_id) const;

  /// Records of other participants, ordered by user id.
  std::vector<PresenceInfo> snapshot() const;

  /// True when nothing was heard from `user_id` for stale_after_ms.
  /// Participants without any record count from `last_seen`.
  bool is_stale(const std::string &user_id, Timestamp last_seen = 0) const;

  /// The participant's status with staleness applied: online becomes away
  /// when stale. Offline is never derived here.
  PresenceStatus effective_status(const Participant &participant) const;

  bool broadcast_pending() const { return broadcast_timer_.active(); }
  void cancel_pending_broadcast() { broadcast_timer_.cancel(); }

  /// Drops every record and any armed broadcast.
  void clear();

private:
  struct RemotePresence {
    PresenceInfo info;
    Timestamp received_at = 0;
  };

  void broadcast();

  Scheduler &scheduler_;
  uint64_t debounce_ms_;
  uint64_t stale_after_ms_;
  std::string user_id_;
  std::string session_id_;

  std::optional<PresenceInfo> local_;
  std::map<std::string, RemotePresence> remote_;
  TimerHandle broadcast_timer_;
  Broadcaster broadcaster_;
};

} // namespace collab

#endif // COLLAB_PRESENCE_TRACKER_HPP
