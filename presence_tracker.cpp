// presence_tracker.cpp
#include "presence_tracker.hpp"

#include "collab_errors.hpp"
#include "collab_log.hpp"
#include "wire_protocol.hpp"

#include <algorithm>

namespace collab {

PresenceTracker::PresenceTracker(Scheduler &scheduler, uint64_t debounce_ms, uint64_t stale_after_ms)
    : scheduler_(scheduler), debounce_ms_(debounce_ms), stale_after_ms_(stale_after_ms) {}

PresenceTracker::~PresenceTracker() { broadcast_timer_.cancel(); }

void PresenceTracker::set_local_identity(const std::string &user_id, const std::string &session_id) {
  if (user_id == user_id_ && session_id == session_id_) {
    return;
  }
  user_id_ = user_id;
  session_id_ = session_id;
  local_.reset();
  broadcast_timer_.cancel();
}

const PresenceInfo &PresenceTracker::update_presence(const PresenceUpdate &update) {
  if (user_id_.empty() || session_id_.empty()) {
    throw StateError("presence update without a current user and session");
  }

  PresenceInfo merged;
  if (local_) {
    merged = *local_;
  } else {
    merged.user_id = user_id_;
    merged.session_id = session_id_;
    merged.last_activity = scheduler_.clock().now_ms();
  }

  if (update.cursor)
    merged.cursor = *update.cursor;
  if (update.selection)
    merged.selection = *update.selection;
  if (update.viewport)
    merged.viewport = *update.viewport;
  if (update.last_activity)
    merged.last_activity = *update.last_activity;

  check_encodable(PresenceUpdateMessage{merged});
  local_ = std::move(merged);

  if (!broadcast_timer_.active()) {
    broadcast_timer_ = scheduler_.schedule_after(debounce_ms_, [this]() { broadcast(); });
  }
  return *local_;
}

void PresenceTracker::apply_remote(const PresenceInfo &presence) {
  if (presence.user_id == user_id_) {
    return;
  }
  remote_[presence.user_id] = RemotePresence{presence, scheduler_.clock().now_ms()};
}

bool PresenceTracker::remove(const std::string &user_id) { return remote_.erase(user_id) != 0; }

std::optional<PresenceInfo> PresenceTracker::find(const std::string &user_id) const {
  if (local_ && local_->user_id == user_id) {
    return local_;
  }
  auto it = remote_.find(user_id);
  if (it == remote_.end()) {
    return std::nullopt;
  }
  return it->second.info;
}

std::vector<PresenceInfo> PresenceTracker::snapshot() const {
  std::vector<PresenceInfo> out;
  out.reserve(remote_.size());
  for (const auto &[id, entry] : remote_) {
    out.push_back(entry.info);
  }
  return out;
}

bool PresenceTracker::is_stale(const std::string &user_id, Timestamp last_seen) const {
  Timestamp heard = last_seen;
  auto it = remote_.find(user_id);
  if (it != remote_.end()) {
    heard = std::max(heard, it->second.received_at);
  }
  return scheduler_.clock().now_ms() - heard >= static_cast<Timestamp>(stale_after_ms_);
}

PresenceStatus PresenceTracker::effective_status(const Participant &participant) const {
  if (participant.status != PresenceStatus::Online || participant.id == user_id_) {
    return participant.status;
  }
  return is_stale(participant.id, participant.last_seen) ? PresenceStatus::Away : PresenceStatus::Online;
}

void PresenceTracker::clear() {
  broadcast_timer_.cancel();
  local_.reset();
  remote_.clear();
}

void PresenceTracker::broadcast() {
  if (!local_ || !broadcaster_) {
    return;
  }
  if (!broadcaster_(*local_)) {
    log_debug("presence update dropped: not connected");
  }
}

} // namespace collab
