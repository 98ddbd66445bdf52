// event_log.hpp
#ifndef COLLAB_EVENT_LOG_HPP
#define COLLAB_EVENT_LOG_HPP

#include "collab_types.hpp"
#include "scheduler.hpp"
#include "wire_protocol.hpp"

#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace collab {

/// Outcome of process_event().
enum class ProcessResult {
  Applied,      // dispatched, appended to history, base version advanced
  Acknowledged, // echo of one of our own pending events
  Duplicate,    // id already processed
  Stale,        // version below the base version
  Conflict      // parked in the conflict set, not applied
};

const char *to_string(ProcessResult result);

/// Ordered log of session events with the acknowledgement protocol.
///
/// Own events are applied when sent and stay in the pending queue until the
/// relay echoes their id back. While the link is down they are queued and
/// later flushed in submission order, each exactly once. Events that were in
/// flight when a sync was requested and are still unacknowledged once its
/// response has been replayed never reached the relay; they are sent again.
///
/// The log does not know about sessions or participants; dispatching an event
/// into session state is the applier's job, and conflict detection is the
/// conflict gate's.
class EventLog {
public:
  /// Applies an event to session state. May throw to refuse it.
  using Applier = std::function<void(const Event &event)>;
  /// Writes a message to the relay; false when it could not be transmitted.
  using Sender = std::function<bool(const WireMessage &message)>;
  /// Returns true when the event raised (and recorded) a conflict.
  using ConflictGate = std::function<bool(const Event &event)>;
  using SyncCompletion = std::function<void(Version version)>;

  explicit EventLog(const Clock &clock, std::size_t history_limit = 1000);

  void set_applier(Applier applier) { applier_ = std::move(applier); }
  void set_sender(Sender sender) { sender_ = std::move(sender); }
  void set_conflict_gate(ConflictGate gate) { conflict_gate_ = std::move(gate); }

  /// Creates an event from a draft, applies it locally, then transmits it or
  /// queues it. The version defaults to the current base version.
  ///
  /// @throws ProtocolError if the event cannot be encoded; nothing is applied
  Event send_event(EventDraft draft, const std::string &session_id, const std::string &author_id);

  /// Transmits queued events in submission order. Stops at the first event
  /// that cannot be sent. Returns how many were sent.
  std::size_t flush_pending();

  /// Single entry point for inbound events.
  ProcessResult process_event(const Event &event);

  /// Marks an event acknowledged. Returns false for an unknown id.
  bool acknowledge_event(const std::string &event_id);

  /// Asks the relay for every event after `from_version` (default: base version).
  /// Returns false when the request could not be sent.
  bool request_sync(const std::string &session_id, std::optional<Version> from_version = std::nullopt,
                    SyncCompletion completion = {});

  /// Replays `events` through process_event, then raises the base version to
  /// `version` (never lowers it) and resends events the relay never received.
  /// Responses are matched to requests in order. Returns how many events were
  /// applied.
  std::size_t handle_sync_response(const std::vector<Event> &events, Version version);

  /// Drops unanswered sync requests. A closed link never gets their responses.
  void abandon_sync_requests() { sync_requests_.clear(); }

  Version base_version() const { return base_version_; }
  void set_base_version(Version version) { base_version_ = version; }

  const std::deque<Event> &history() const { return history_; }
  std::vector<Event> pending_events() const;
  std::size_t pending_count() const { return pending_.size(); }
  std::size_t untransmitted_count() const;
  bool is_pending(const std::string &event_id) const;
  bool was_processed(const std::string &event_id) const { return processed_.count(event_id) != 0; }

  void clear_pending() { pending_.clear(); }

  /// Forgets everything: history, pending queue, processed ids and base version.
  void reset();

private:
  struct PendingEvent {
    Event event;
    bool transmitted = false;
  };

  struct SyncRequest {
    SyncCompletion completion;
    std::vector<std::string> in_flight; // transmitted, unacknowledged ids when the request went out
  };

  void append_history(const Event &event);
  void mark_history_acknowledged(const std::string &event_id);
  bool transmit(const Event &event);
  void mark_processed(const std::string &event_id, Version version);
  void prune_processed();
  std::size_t requeue_lost(const std::vector<std::string> &event_ids);

  const Clock &clock_;
  std::size_t history_limit_;
  Version base_version_ = 0;

  std::deque<Event> history_;
  std::vector<PendingEvent> pending_;
  // Acknowledged own ids and processed inbound ids. Ids more than history_limit_
  // versions below the base are dropped: a redelivery of those is stale anyway.
  std::unordered_set<std::string> processed_;
  std::multimap<Version, std::string> processed_by_version_;
  std::deque<SyncRequest> sync_requests_;

  Applier applier_;
  Sender sender_;
  ConflictGate conflict_gate_;
};

} // namespace collab

#endif // COLLAB_EVENT_LOG_HPP
