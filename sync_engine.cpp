// sync_engine.cpp
#include "sync_engine.hpp"

#include "collab_errors.hpp"
#include "collab_ids.hpp"
#include "collab_log.hpp"

#include <type_traits>

namespace collab {

SyncEngine::SyncEngine(Transport &transport, Scheduler &scheduler, EngineConfig config, IdentityStore *store)
    : config_(std::move(config)), scheduler_(scheduler), store_(store), sync_enabled_(config_.sync_enabled),
      registry_(scheduler.clock(), config_.share_base_url), events_(scheduler.clock(), config_.history_limit),
      document_(std::string(), config_.history_limit), conflicts_(scheduler.clock()),
      presence_(scheduler, config_.presence_debounce_ms, config_.presence_stale_after_ms),
      notifications_(scheduler, config_.notification_ttl_ms), connection_(transport, scheduler, config_.connection()) {
  events_.set_sender([this](const WireMessage &message) { return send_message(message); });
  events_.set_applier([this](const Event &event) { apply_event(event); });
  events_.set_conflict_gate([this](const Event &event) { return gate_conflict(event); });

  presence_.set_broadcaster(
      [this](const PresenceInfo &presence) { return send_message(PresenceUpdateMessage{presence}); });

  connection_.set_status_listener(
      [this](ConnectionStatus previous, ConnectionStatus current) { on_status_changed(previous, current); });
  connection_.set_error_listener([this](const std::string &error) { on_transport_error(error); });
  connection_.set_message_sink([this](const std::string &payload) { handle_message(payload); });
}

SyncEngine::~SyncEngine() { expiry_timer_.cancel(); }

// -----------------------------------------
// Identity & preferences
// -----------------------------------------

void SyncEngine::set_current_user(Participant user) {
  check_encodable(JoinSessionMessage{std::string(), user});
  registry_.set_current_user(std::move(user));
  if (store_) {
    store_->save_user(*registry_.current_user());
  }
}

EnginePreferences SyncEngine::restore() {
  EnginePreferences preferences;
  if (!store_) {
    return preferences;
  }

  if (auto user = store_->load_user()) {
    registry_.set_current_user(std::move(*user));
    log_info("restored user " + registry_.current_user()->id);
  }
  preferences = store_->load_preferences();
  sync_enabled_ = preferences.sync_enabled;
  connection_.set_auto_reconnect(preferences.auto_reconnect);
  return preferences;
}

void SyncEngine::set_sync_enabled(bool enabled) {
  sync_enabled_ = enabled;
  persist_preferences();
}

void SyncEngine::set_auto_reconnect(bool enabled) {
  connection_.set_auto_reconnect(enabled);
  persist_preferences();
}

// -----------------------------------------
// Connection
// -----------------------------------------

void SyncEngine::connect(const std::string &endpoint) {
  connection_.connect(endpoint);
  persist_preferences();
}

void SyncEngine::disconnect() {
  connection_.disconnect();
  presence_.cancel_pending_broadcast();
}

void SyncEngine::reconnect() { connection_.reconnect(); }

void SyncEngine::on_status_changed(ConnectionStatus previous, ConnectionStatus current) {
  if (current == ConnectionStatus::Connected) {
    if (was_connected_) {
      notifications_.add(NotificationType::ConnectionRestored, "Connection restored",
                         "Reconnected to the collaboration server");
      // The relay may not have received what was in flight when the link dropped
      if (std::size_t resend = document_.requeue_transmitted(); resend > 0) {
        log_info("resending " + std::to_string(resend) + " unacknowledged operation(s)");
      }
    }
    was_connected_ = true;

    events_.flush_pending();
    flush_operations();
    if (sync_enabled_ && registry_.has_session() && !request_sync()) {
      log_warn("sync request after connect was not sent");
    }
  } else if (current == ConnectionStatus::Disconnected || current == ConnectionStatus::Error) {
    presence_.cancel_pending_broadcast();
    events_.abandon_sync_requests();
    if (previous == ConnectionStatus::Connected) {
      notifications_.add(NotificationType::ConnectionLost, "Connection lost",
                         "Changes are kept locally until the connection resumes");
    }
  }

  if (status_listener_) {
    status_listener_(previous, current);
  }
}

void SyncEngine::on_transport_error(const std::string &error) {
  notifications_.add(NotificationType::SyncError, "Connection error", error);
}

// -----------------------------------------
// Sessions
// -----------------------------------------

const Session &SyncEngine::create_session(const std::string &name, const ShareOptions &options) {
  Session named;
  named.name = name;
  Event announcement;
  announcement.payload = SessionSync{SessionSyncAction::Create, named};
  check_encodable(EventMessage{announcement});

  ShareOptions effective = options;
  if (!effective.settings.sync_delay_ms) {
    effective.settings.sync_delay_ms = config_.sync_delay_ms;
  }
  registry_.create_session(name, effective);
  begin_session();

  EventDraft draft{SessionSync{SessionSyncAction::Create, *registry_.session()}, events_.base_version() + 1};
  events_.send_event(std::move(draft), registry_.session()->id, require_user().id);
  persist_preferences();
  return *registry_.session();
}

void SyncEngine::join_session(const std::string &session_id, Participant user) {
  if (!connection_.is_connected()) {
    throw StateError("not connected to the collaboration server");
  }
  check_encodable(JoinSessionMessage{session_id, user});

  bool same_session = registry_.session_id() == session_id;
  registry_.join_session(session_id, std::move(user));
  if (!same_session) {
    begin_session();
  }
  if (store_) {
    store_->save_user(*registry_.current_user());
  }

  // Catch up on history first so the USER_JOINED echo is newer than everything replayed
  if (sync_enabled_ && !request_sync()) {
    log_warn("sync request for join was not sent");
  }
  if (!send_message(JoinSessionMessage{session_id, *registry_.current_user()})) {
    log_warn("join for session " + session_id + " was not delivered");
  }
  notifications_.add(NotificationType::UserJoined, "Session joined",
                     "You joined the session as " + registry_.current_user()->name);
  persist_preferences();
}

void SyncEngine::leave_session() {
  if (!connection_.is_connected()) {
    throw StateError("not connected to the collaboration server");
  }
  std::string session_id = require_session_id();
  std::string user_id = require_user().id;

  if (!send_message(LeaveSessionMessage{session_id, user_id})) {
    log_warn("leave for session " + session_id + " was not delivered");
  }
  if (registry_.leave_session()) {
    reset_session_state();
  }
  persist_preferences();
}

std::string SyncEngine::share_session(const ShareOptions &options) {
  std::string url = registry_.share_session(options);
  arm_expiry_timer();
  publish_session(SessionSyncAction::Update);
  return url;
}

void SyncEngine::delete_session() {
  require_session_id();
  if (!registry_.is_owner()) {
    throw PermissionError("only the session owner may delete the session");
  }

  publish_session(SessionSyncAction::Delete);
  registry_.delete_session();
  reset_session_state();
  persist_preferences();
}

void SyncEngine::update_session_settings(const PermissionOverrides &permissions, const SettingsOverrides &settings) {
  registry_.update_settings(permissions, settings);
  publish_session(SessionSyncAction::Update);
}

void SyncEngine::change_role(const std::string &user_id, Role role) {
  registry_.change_role(user_id, role);
  publish_session(SessionSyncAction::Update);
}

void SyncEngine::update_user_status(const std::string &user_id, PresenceStatus status) {
  if (!registry_.update_user_status(user_id, status)) {
    throw StateError("unknown user '" + user_id + "'");
  }
  if (store_ && registry_.current_user() && registry_.current_user()->id == user_id) {
    store_->save_user(*registry_.current_user());
  }
}

void SyncEngine::set_typing_status(bool is_typing) {
  if (is_typing) {
    send_event(EventDraft{TypingStart{}, std::nullopt});
  } else {
    send_event(EventDraft{TypingStop{}, std::nullopt});
  }
}

void SyncEngine::publish_session(SessionSyncAction action) {
  const Session *session = registry_.session();
  if (!session) {
    return;
  }
  events_.send_event(EventDraft{SessionSync{action, *session}, std::nullopt}, session->id, require_user().id);
}

void SyncEngine::begin_session() {
  const Participant &user = require_user();
  const std::string &session_id = require_session_id();

  events_.reset();
  document_.reset(std::string());
  conflicts_.clear();
  presence_.clear();
  presence_.set_local_identity(user.id, session_id);
  arm_expiry_timer();
}

void SyncEngine::reset_session_state() {
  expiry_timer_.cancel();
  presence_.clear();
  events_.clear_pending();
  document_.clear_pending();
}

void SyncEngine::arm_expiry_timer() {
  expiry_timer_.cancel();
  const Session *session = registry_.session();
  if (!session || !session->expires_at) {
    return;
  }

  Timestamp now = scheduler_.clock().now_ms();
  uint64_t delay = *session->expires_at > now ? static_cast<uint64_t>(*session->expires_at - now) : 0;
  expiry_timer_ = scheduler_.schedule_after(delay, [this]() {
    if (registry_.expire_if_due()) {
      reset_session_state();
    }
  });
}

// -----------------------------------------
// Events & operations
// -----------------------------------------

Event SyncEngine::send_event(EventDraft draft) {
  const std::string &session_id = require_session_id();
  const Participant &user = require_user();
  return events_.send_event(std::move(draft), session_id, user.id);
}

bool SyncEngine::request_sync(std::optional<Version> from_version, EventLog::SyncCompletion completion) {
  const std::string &session_id = require_session_id();
  return events_.request_sync(session_id, from_version, std::move(completion));
}

Operation SyncEngine::send_operation(const OperationDraft &draft) {
  require_session_id();
  const Participant &user = require_user();
  if (!registry_.can_edit(user.id)) {
    throw PermissionError("user " + user.id + " may not edit this session");
  }

  Operation op;
  op.id = generate_operation_id();
  op.type = draft.type;
  op.position = draft.position;
  op.author_id = user.id;
  op.timestamp = scheduler_.clock().now_ms();
  op.base_version = document_.revision();
  op.content = draft.content;
  op.length = draft.length;
  op.attributes = draft.attributes;
  check_encodable(OperationMessage{op});

  document_.add_local(op);
  flush_operations();
  notify_document();
  return op;
}

void SyncEngine::flush_operations() {
  if (!connection_.is_connected()) {
    return;
  }
  while (true) {
    std::vector<Operation> batch = document_.compose_untransmitted(config_.operation_batch_size);
    if (batch.empty()) {
      return;
    }
    for (const auto &op : batch) {
      if (!send_message(OperationMessage{op})) {
        return;
      }
      document_.mark_transmitted(op.id);
    }
  }
}

const PresenceInfo &SyncEngine::update_presence(const PresenceUpdate &update) {
  return presence_.update_presence(update);
}

ConflictRecord SyncEngine::resolve_conflict(const std::string &conflict_id, std::optional<std::string> payload) {
  const Participant &user = require_user();
  const Session *session = registry_.session();
  ConflictResolutionMode mode = session ? session->settings.conflict_resolution : ConflictResolutionMode::Manual;

  ConflictRecord resolved = conflicts_.resolve_conflict(conflict_id, user.id, std::move(payload), mode);
  if (auto it = conflict_notifications_.find(conflict_id); it != conflict_notifications_.end()) {
    notifications_.dismiss(it->second);
    conflict_notifications_.erase(it);
  }
  return resolved;
}

// -----------------------------------------
// Inbound loop
// -----------------------------------------

void SyncEngine::handle_message(const std::string &payload) {
  WireMessage message;
  try {
    message = decode_message(payload);
  } catch (const ProtocolError &e) {
    log_warn(std::string("dropping inbound message: ") + e.what());
    return;
  }

  try {
    dispatch(message);
  } catch (const CollabException &e) {
    log_warn(std::string(message_type_name(message)) + " dropped: " + e.what());
  } catch (const std::exception &e) {
    log_error(std::string(message_type_name(message)) + " failed: " + e.what());
  }
}

void SyncEngine::dispatch(const WireMessage &message) {
  std::visit(
      [this, &message](const auto &m) {
        using M = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<M, EventMessage>) {
          handle_event(m.event);
        } else if constexpr (std::is_same_v<M, OperationMessage>) {
          handle_operation(m.operation);
        } else if constexpr (std::is_same_v<M, PresenceUpdateMessage>) {
          handle_presence(m.presence);
        } else if constexpr (std::is_same_v<M, HeartbeatMessage>) {
          connection_.record_heartbeat(scheduler_.clock().now_ms());
        } else if constexpr (std::is_same_v<M, SyncResponseMessage>) {
          if (in_current_session(m.session_id)) {
            events_.handle_sync_response(m.events, m.version);
          }
        } else if constexpr (std::is_same_v<M, ConflictMessage>) {
          if (in_current_session(m.conflict.session_id)) {
            register_conflict(m.conflict);
          }
        } else if constexpr (std::is_same_v<M, ErrorMessage>) {
          std::string text = m.error;
          if (m.code) {
            text += " (code " + std::to_string(*m.code) + ")";
          }
          log_error("relay error: " + text);
          notifications_.add(NotificationType::SyncError, "Sync error", text);
        } else {
          // JOIN_SESSION, LEAVE_SESSION and SYNC_REQUEST are addressed to the relay
          log_debug(std::string("ignoring relay-bound ") + message_type_name(message));
        }
      },
      message);
}

void SyncEngine::handle_event(const Event &event) {
  if (!in_current_session(event.session_id)) {
    log_debug("event " + event.id + " for session " + event.session_id + " dropped");
    return;
  }
  ProcessResult result = events_.process_event(event);
  log_debug("event " + event.id + " (" + to_string(event.type()) + "): " + to_string(result));
}

void SyncEngine::handle_operation(const Operation &operation) {
  if (!registry_.has_session()) {
    log_debug("operation " + operation.id + " dropped: no session");
    return;
  }

  const auto &user = registry_.current_user();
  if (user && operation.author_id == user->id && document_.acknowledge(operation.id)) {
    notify_document();
    return;
  }
  if (document_.apply_remote(operation)) {
    registry_.touch_participant(operation.author_id, scheduler_.clock().now_ms());
    notify_document();
  }
}

void SyncEngine::handle_presence(const PresenceInfo &presence) {
  if (!in_current_session(presence.session_id)) {
    return;
  }
  presence_.apply_remote(presence);
  registry_.touch_participant(presence.user_id, scheduler_.clock().now_ms());
  if (!registry_.set_cursor(presence.user_id, presence.cursor)) {
    log_debug("presence from unknown participant " + presence.user_id);
  }
}

void SyncEngine::apply_event(const Event &event) {
  const auto &user = registry_.current_user();
  bool own = user && user->id == event.author_id;
  registry_.touch_participant(event.author_id, event.timestamp);

  std::visit(
      [&](const auto &p) {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, UserJoined>) {
          registry_.add_participant(p.user);
          if (!user || p.user.id != user->id) {
            notifications_.add(NotificationType::UserJoined, "User joined", p.user.name + " joined the session");
          }
        } else if constexpr (std::is_same_v<P, UserLeft>) {
          const Participant *leaving = registry_.find_participant(p.user_id);
          std::string name = leaving ? leaving->name : p.user_id;
          presence_.remove(p.user_id);
          if (registry_.remove_participant(p.user_id) && (!user || p.user_id != user->id)) {
            notifications_.add(NotificationType::UserLeft, "User left", name + " left the session");
          }
        } else if constexpr (std::is_same_v<P, MessageSent> || std::is_same_v<P, MessageEdited> ||
                             std::is_same_v<P, MessageDeleted>) {
          if (!registry_.can_message(event.author_id)) {
            throw PermissionError("messaging is disabled for " + event.author_id);
          }
        } else if constexpr (std::is_same_v<P, CursorMove>) {
          registry_.set_cursor(event.author_id, p.cursor);
        } else if constexpr (std::is_same_v<P, TypingStart>) {
          registry_.set_typing(event.author_id, true);
        } else if constexpr (std::is_same_v<P, TypingStop>) {
          registry_.set_typing(event.author_id, false);
        } else if constexpr (std::is_same_v<P, SessionSync>) {
          if (!own) {
            registry_.adopt_session(p);
            arm_expiry_timer();
          }
        } else if constexpr (std::is_same_v<P, ConflictDetected>) {
          log_debug("peer reported conflict " + p.conflict_id);
        }
      },
      event.payload);

  if (!registry_.has_session()) {
    reset_session_state();
  }
}

bool SyncEngine::gate_conflict(const Event &event) {
  const Session *session = registry_.session();
  const auto &user = registry_.current_user();
  if (!session || !user) {
    return false;
  }

  auto conflict = conflicts_.detect_conflict({event}, events_.base_version(), user->id, session->id,
                                             session->settings.conflict_resolution);
  if (!conflict) {
    return false;
  }
  register_conflict(std::move(*conflict));
  return true;
}

void SyncEngine::register_conflict(ConflictRecord conflict) {
  std::string id = conflict.id;
  bool open = !conflict.resolved;
  std::size_t count = conflict.conflicting_events.size();
  conflicts_.record_conflict(std::move(conflict));

  if (!open || conflict_notifications_.count(id) != 0) {
    return;
  }
  std::vector<NotificationAction> actions;
  actions.push_back(NotificationAction{"Resolve", [this, id]() { resolve_conflict(id); }});
  conflict_notifications_[id] =
      notifications_.add(NotificationType::Conflict, "Conflict detected",
                         std::to_string(count) + " concurrent event(s) need resolution", std::move(actions));
}

// -----------------------------------------
// Helpers
// -----------------------------------------

bool SyncEngine::send_message(const WireMessage &message) {
  try {
    return connection_.send(encode_message(message));
  } catch (const ProtocolError &e) {
    log_error(e.what());
    return false;
  }
}

void SyncEngine::persist_preferences() {
  if (!store_) {
    return;
  }
  EnginePreferences preferences;
  preferences.sync_enabled = sync_enabled_;
  preferences.auto_reconnect = connection_.config().auto_reconnect;
  if (!connection_.endpoint().empty()) {
    preferences.last_endpoint = connection_.endpoint();
  }
  preferences.last_session_id = registry_.session_id();
  store_->save_preferences(preferences);
}

void SyncEngine::notify_document() {
  if (document_listener_) {
    document_listener_(document_.tentative_text());
  }
}

bool SyncEngine::in_current_session(const std::string &session_id) const {
  return registry_.has_session() && registry_.session()->id == session_id;
}

const Participant &SyncEngine::require_user() const {
  if (!registry_.current_user()) {
    throw StateError("no current user set");
  }
  return *registry_.current_user();
}

const std::string &SyncEngine::require_session_id() const {
  if (!registry_.has_session()) {
    throw StateError("no active session");
  }
  return registry_.session()->id;
}

std::vector<Participant> SyncEngine::participants() const {
  std::vector<Participant> list = registry_.participants();
  for (auto &p : list) {
    p.status = presence_.effective_status(p);
  }
  return list;
}

bool SyncEngine::is_session_owner(const std::optional<std::string> &user_id) const {
  return user_id ? registry_.is_owner(*user_id) : registry_.is_owner();
}

bool SyncEngine::can_user_edit(const std::optional<std::string> &user_id) const {
  return user_id ? registry_.can_edit(*user_id) : registry_.can_edit();
}

} // namespace collab
