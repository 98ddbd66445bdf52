// sync_engine.hpp
#ifndef COLLAB_SYNC_ENGINE_HPP
#define COLLAB_SYNC_ENGINE_HPP

#include "collab_config.hpp"
#include "collab_types.hpp"
#include "conflict_resolver.hpp"
#include "connection_manager.hpp"
#include "event_log.hpp"
#include "identity_store.hpp"
#include "notification_center.hpp"
#include "operational_transform.hpp"
#include "presence_tracker.hpp"
#include "scheduler.hpp"
#include "session_registry.hpp"
#include "transport.hpp"
#include "wire_protocol.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace collab {

/// Synchronization engine for one collaborative session.
///
/// Owns the connection, the event log, the shared document, the conflict set,
/// presence and notifications, and is the single ordered loop through which
/// every inbound message passes. Construct one engine per session; nothing is
/// global.
///
/// ⚠️  Not thread-safe. All calls, transport callbacks and Scheduler::run_due()
/// must happen on one thread.
///
/// Error Handling:
/// - Local API calls raise PermissionError / StateError to the caller, and
///   ProtocolError for text that cannot go on the wire (invalid UTF-8)
///   before any state changes
/// - Nothing escapes handle_message(): malformed or refused inbound messages
///   are logged and dropped, later messages are unaffected
/// - Transport failures go through the reconnect policy and notifications
/// - StorageError from the identity store reaches the caller of the API that
///   persisted (set_current_user, connect, settings changes)
///
/// Usage:
/// @code
///   SystemClock clock;
///   Scheduler scheduler(clock);
///   SyncEngine engine(transport, scheduler);
///   engine.set_current_user(me);
///   engine.connect("wss://relay.example/collab");
///   // ... once connected
///   engine.create_session("Design review");
///   engine.send_operation({OperationType::Insert, 0, std::string("hello")});
/// @endcode
class SyncEngine {
public:
  using StatusListener = ConnectionManager::StatusListener;
  using DocumentListener = std::function<void(const std::string &tentative_text)>;

  SyncEngine(Transport &transport, Scheduler &scheduler, EngineConfig config = {}, IdentityStore *store = nullptr);
  ~SyncEngine();

  SyncEngine(const SyncEngine &) = delete;
  SyncEngine &operator=(const SyncEngine &) = delete;

  // ---- identity & preferences ----

  void set_current_user(Participant user);
  const std::optional<Participant> &current_user() const { return registry_.current_user(); }

  /// Loads the stored user and preferences. No-op without an identity store.
  EnginePreferences restore();

  void set_sync_enabled(bool enabled);
  void set_auto_reconnect(bool enabled);
  bool sync_enabled() const { return sync_enabled_; }

  // ---- connection ----

  void connect(const std::string &endpoint);
  void disconnect();
  void reconnect();
  bool is_connected() const { return connection_.is_connected(); }
  const ConnectionState &connection_state() const { return connection_.state(); }

  // ---- sessions ----

  /// Creates a session owned by the current user and announces it with a
  /// SESSION_SYNC {create} event at base version + 1. The session's sync delay
  /// defaults to EngineConfig::sync_delay_ms.
  const Session &create_session(const std::string &name, const ShareOptions &options = {});

  /// @throws StateError when not connected
  void join_session(const std::string &session_id, Participant user);

  /// @throws StateError when not connected or not in a session
  void leave_session();

  std::string share_session(const ShareOptions &options);
  void delete_session();
  void update_session_settings(const PermissionOverrides &permissions, const SettingsOverrides &settings);
  void change_role(const std::string &user_id, Role role);

  void update_user_status(const std::string &user_id, PresenceStatus status);
  void set_typing_status(bool is_typing);

  // ---- events ----

  /// @throws StateError without a session, PermissionError for refused messaging
  Event send_event(EventDraft draft);
  bool acknowledge_event(const std::string &event_id) { return events_.acknowledge_event(event_id); }

  /// Returns false when not connected.
  bool request_sync(std::optional<Version> from_version = std::nullopt, EventLog::SyncCompletion completion = {});

  // ---- operations ----

  /// Applies a local edit to the tentative text and transmits it (or queues
  /// it while disconnected).
  ///
  /// @throws PermissionError unless the current user may edit
  /// @throws ProtocolError if the content cannot be encoded; nothing is queued
  Operation send_operation(const OperationDraft &draft);

  // ---- presence ----

  const PresenceInfo &update_presence(const PresenceUpdate &update);

  // ---- conflicts ----

  ConflictRecord resolve_conflict(const std::string &conflict_id, std::optional<std::string> payload = std::nullopt);

  // ---- inbound ----

  /// Decodes and processes one message from the relay.
  void handle_message(const std::string &payload);

  // ---- read accessors ----

  const SessionRegistry &sessions() const { return registry_; }
  const EventLog &events() const { return events_; }
  const DocumentState &document() const { return document_; }
  const ConflictResolver &conflicts() const { return conflicts_; }
  const PresenceTracker &presence() const { return presence_; }
  NotificationCenter &notifications() { return notifications_; }
  const NotificationCenter &notifications() const { return notifications_; }
  const EngineConfig &config() const { return config_; }

  /// Participants in join order, with stale presence reported as away.
  std::vector<Participant> participants() const;

  bool is_session_owner(const std::optional<std::string> &user_id = std::nullopt) const;
  bool can_user_edit(const std::optional<std::string> &user_id = std::nullopt) const;
  Version base_version() const { return events_.base_version(); }

  // ---- callbacks ----

  void set_status_listener(StatusListener listener) { status_listener_ = std::move(listener); }
  void set_conflict_listener(ConflictResolver::ConflictListener listener) {
    conflicts_.set_listener(std::move(listener));
  }
  void set_notification_listener(NotificationCenter::Listener listener) {
    notifications_.set_listener(std::move(listener));
  }
  void set_document_listener(DocumentListener listener) { document_listener_ = std::move(listener); }

private:
  void on_status_changed(ConnectionStatus previous, ConnectionStatus current);
  void on_transport_error(const std::string &error);

  void dispatch(const WireMessage &message);
  void handle_event(const Event &event);
  void handle_operation(const Operation &operation);
  void handle_presence(const PresenceInfo &presence);

  void apply_event(const Event &event);
  bool gate_conflict(const Event &event);
  void register_conflict(ConflictRecord conflict);

  bool send_message(const WireMessage &message);
  void flush_operations();
  void publish_session(SessionSyncAction action);
  void begin_session();
  void reset_session_state();
  void arm_expiry_timer();
  void persist_preferences();
  void notify_document();

  bool in_current_session(const std::string &session_id) const;
  const Participant &require_user() const;
  const std::string &require_session_id() const;

  EngineConfig config_;
  Scheduler &scheduler_;
  IdentityStore *store_;
  bool sync_enabled_;
  bool was_connected_ = false;

  SessionRegistry registry_;
  EventLog events_;
  DocumentState document_;
  ConflictResolver conflicts_;
  PresenceTracker presence_;
  NotificationCenter notifications_;
  TimerHandle expiry_timer_;
  std::unordered_map<std::string, std::string> conflict_notifications_; // conflict id -> notification id

  StatusListener status_listener_;
  DocumentListener document_listener_;

  // Last member: destroyed first, detaching the transport callbacks
  ConnectionManager connection_;
};

} // namespace collab

#endif // COLLAB_SYNC_ENGINE_HPP
