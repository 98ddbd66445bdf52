// event_log.cpp
#include "event_log.hpp"

#include "collab_errors.hpp"
#include "collab_ids.hpp"
#include "collab_log.hpp"

#include <algorithm>

namespace collab {

const char *to_string(ProcessResult result) {
  switch (result) {
  case ProcessResult::Applied:
    return "applied";
  case ProcessResult::Acknowledged:
    return "acknowledged";
  case ProcessResult::Duplicate:
    return "duplicate";
  case ProcessResult::Stale:
    return "stale";
  case ProcessResult::Conflict:
    return "conflict";
  }
  return "unknown";
}

EventLog::EventLog(const Clock &clock, std::size_t history_limit)
    : clock_(clock), history_limit_(std::max<std::size_t>(history_limit, 1)) {}

Event EventLog::send_event(EventDraft draft, const std::string &session_id, const std::string &author_id) {
  Event event;
  event.id = generate_event_id();
  event.session_id = session_id;
  event.author_id = author_id;
  event.timestamp = clock_.now_ms();
  event.payload = std::move(draft.payload);
  event.version = draft.version.value_or(base_version_);
  check_encodable(EventMessage{event});

  // Optimistic local effect; a refusal leaves no trace
  if (applier_) {
    applier_(event);
  }
  append_history(event);

  bool transmitted = untransmitted_count() == 0 && transmit(event);
  if (!transmitted) {
    log_debug("event " + event.id + " queued until the connection resumes");
  }
  pending_.push_back(PendingEvent{event, transmitted});
  return event;
}

std::size_t EventLog::flush_pending() {
  std::size_t sent = 0;
  for (auto &p : pending_) {
    if (p.transmitted) {
      continue;
    }
    if (!transmit(p.event)) {
      break;
    }
    p.transmitted = true;
    ++sent;
  }
  if (sent > 0) {
    log_info("flushed " + std::to_string(sent) + " queued event(s)");
  }
  return sent;
}

ProcessResult EventLog::process_event(const Event &event) {
  if (is_pending(event.id)) {
    acknowledge_event(event.id);
    mark_processed(event.id, event.version);
    base_version_ = std::max(base_version_, event.version);
    prune_processed();
    return ProcessResult::Acknowledged;
  }

  if (was_processed(event.id)) {
    return ProcessResult::Duplicate;
  }

  if (event.version < base_version_) {
    log_debug("rejecting stale event " + event.id + " (version " + std::to_string(event.version) + " < base " +
              std::to_string(base_version_) + ")");
    return ProcessResult::Stale;
  }

  if (conflict_gate_ && conflict_gate_(event)) {
    mark_processed(event.id, event.version);
    return ProcessResult::Conflict;
  }

  if (applier_) {
    applier_(event);
  }
  mark_processed(event.id, event.version);
  append_history(event);
  base_version_ = std::max(base_version_, event.version);
  prune_processed();
  return ProcessResult::Applied;
}

bool EventLog::acknowledge_event(const std::string &event_id) {
  auto it = std::find_if(pending_.begin(), pending_.end(),
                         [&](const PendingEvent &p) { return p.event.id == event_id; });
  if (it != pending_.end()) {
    mark_processed(event_id, it->event.version);
    pending_.erase(it);
    mark_history_acknowledged(event_id);
    return true;
  }

  auto h = std::find_if(history_.begin(), history_.end(), [&](const Event &e) { return e.id == event_id; });
  if (h == history_.end()) {
    return false;
  }
  h->acknowledged = true;
  mark_processed(event_id, h->version);
  return true;
}

bool EventLog::request_sync(const std::string &session_id, std::optional<Version> from_version,
                            SyncCompletion completion) {
  SyncRequestMessage request{session_id, from_version.value_or(base_version_)};
  if (!sender_ || !sender_(request)) {
    log_debug("sync request not sent: not connected");
    return false;
  }

  SyncRequest pending_request{std::move(completion), {}};
  for (const auto &p : pending_) {
    if (p.transmitted) {
      pending_request.in_flight.push_back(p.event.id);
    }
  }
  sync_requests_.push_back(std::move(pending_request));
  return true;
}

std::size_t EventLog::handle_sync_response(const std::vector<Event> &events, Version version) {
  std::size_t applied = 0;
  for (const auto &event : events) {
    try {
      if (process_event(event) == ProcessResult::Applied) {
        ++applied;
      }
    } catch (const CollabException &e) {
      log_warn("sync replay skipped event " + event.id + ": " + e.what());
    }
  }
  base_version_ = std::max(base_version_, version);
  prune_processed();
  log_info("sync complete at version " + std::to_string(base_version_) + ", " + std::to_string(applied) +
           " event(s) applied");

  if (sync_requests_.empty()) {
    return applied;
  }
  SyncRequest answered = std::move(sync_requests_.front());
  sync_requests_.pop_front();

  // The relay answers after everything it received before the request
  if (std::size_t lost = requeue_lost(answered.in_flight); lost > 0) {
    log_info(std::to_string(lost) + " event(s) never reached the relay, sending again");
    flush_pending();
  }
  if (answered.completion) {
    answered.completion(base_version_);
  }
  return applied;
}

std::vector<Event> EventLog::pending_events() const {
  std::vector<Event> events;
  events.reserve(pending_.size());
  for (const auto &p : pending_) {
    events.push_back(p.event);
  }
  return events;
}

std::size_t EventLog::untransmitted_count() const {
  return static_cast<std::size_t>(
      std::count_if(pending_.begin(), pending_.end(), [](const PendingEvent &p) { return !p.transmitted; }));
}

bool EventLog::is_pending(const std::string &event_id) const {
  return std::any_of(pending_.begin(), pending_.end(), [&](const PendingEvent &p) { return p.event.id == event_id; });
}

void EventLog::reset() {
  history_.clear();
  pending_.clear();
  processed_.clear();
  processed_by_version_.clear();
  sync_requests_.clear();
  base_version_ = 0;
}

void EventLog::append_history(const Event &event) {
  history_.push_back(event);
  while (history_.size() > history_limit_) {
    history_.pop_front();
  }
}

void EventLog::mark_history_acknowledged(const std::string &event_id) {
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (it->id == event_id) {
      it->acknowledged = true;
      return;
    }
  }
}

bool EventLog::transmit(const Event &event) { return sender_ && sender_(EventMessage{event}); }

void EventLog::mark_processed(const std::string &event_id, Version version) {
  if (processed_.insert(event_id).second) {
    processed_by_version_.emplace(version, event_id);
  }
}

void EventLog::prune_processed() {
  while (!processed_by_version_.empty() && processed_by_version_.begin()->first + history_limit_ < base_version_) {
    processed_.erase(processed_by_version_.begin()->second);
    processed_by_version_.erase(processed_by_version_.begin());
  }
}

std::size_t EventLog::requeue_lost(const std::vector<std::string> &event_ids) {
  std::size_t lost = 0;
  for (auto &p : pending_) {
    if (p.transmitted && std::find(event_ids.begin(), event_ids.end(), p.event.id) != event_ids.end()) {
      p.transmitted = false;
      ++lost;
    }
  }
  return lost;
}

} // namespace collab
