// collab_types.hpp
#ifndef COLLAB_TYPES_HPP
#define COLLAB_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace collab {

/// Milliseconds since the Unix epoch.
using Timestamp = int64_t;

/// Per-session version assigned by the relay.
using Version = uint64_t;

enum class Role { Owner, Editor, Viewer };

enum class PresenceStatus { Online, Away, Offline };

/// Session-level policy for conflicts.
enum class ConflictResolutionMode { Manual, Auto, OwnerWins };

/// Strategy stored on a ConflictRecord.
enum class ResolutionStrategy { Merge, Overwrite, Manual };

enum class ConnectionStatus { Disconnected, Connecting, Connected, Reconnecting, Error };

enum class OperationType { Insert, Delete, Retain, Format };

enum class EventType {
  UserJoined,
  UserLeft,
  MessageSent,
  MessageEdited,
  MessageDeleted,
  CursorMove,
  TypingStart,
  TypingStop,
  SessionSync,
  ConflictDetected
};

// String forms match the wire protocol ("owner", "USER_JOINED", "insert", ...).
const char *to_string(Role role);
const char *to_string(PresenceStatus status);
const char *to_string(ConflictResolutionMode mode);
const char *to_string(ResolutionStrategy strategy);
const char *to_string(ConnectionStatus status);
const char *to_string(OperationType type);
const char *to_string(EventType type);

std::optional<Role> role_from_string(std::string_view s);
std::optional<PresenceStatus> presence_status_from_string(std::string_view s);
std::optional<ConflictResolutionMode> resolution_mode_from_string(std::string_view s);
std::optional<ResolutionStrategy> resolution_strategy_from_string(std::string_view s);
std::optional<OperationType> operation_type_from_string(std::string_view s);
std::optional<EventType> event_type_from_string(std::string_view s);

/// Default conflict strategy for a session policy.
ResolutionStrategy default_strategy_for(ConflictResolutionMode mode);

struct Cursor {
  double x = 0.0;
  double y = 0.0;
  std::optional<std::string> element_id;

  bool operator==(const Cursor &) const = default;
};

/// A collaboration user as seen from one session.
struct Participant {
  std::string id;
  std::string name;
  std::string email;
  std::optional<std::string> avatar;
  Role role = Role::Viewer;
  PresenceStatus status = PresenceStatus::Online;
  Timestamp last_seen = 0;
  bool is_typing = false;
  std::optional<Cursor> cursor;
  std::optional<std::string> current_session;

  bool operator==(const Participant &) const = default;
};

struct SessionPermissions {
  bool allow_editing = true;
  bool allow_inviting = true;
  bool allow_messaging = true;
  bool require_approval = false;

  bool operator==(const SessionPermissions &) const = default;
};

struct SessionSettings {
  uint32_t max_participants = 10;
  bool allow_anonymous = false;
  bool auto_save = true;
  uint32_t sync_delay_ms = 500;
  ConflictResolutionMode conflict_resolution = ConflictResolutionMode::Manual;

  bool operator==(const SessionSettings &) const = default;
};

/// Partial permission update. Unset fields keep the current value.
struct PermissionOverrides {
  std::optional<bool> allow_editing;
  std::optional<bool> allow_inviting;
  std::optional<bool> allow_messaging;
  std::optional<bool> require_approval;

  void apply_to(SessionPermissions &permissions) const;
};

/// Partial settings update. Unset fields keep the current value.
struct SettingsOverrides {
  std::optional<uint32_t> max_participants;
  std::optional<bool> allow_anonymous;
  std::optional<bool> auto_save;
  std::optional<uint32_t> sync_delay_ms;
  std::optional<ConflictResolutionMode> conflict_resolution;

  void apply_to(SessionSettings &settings) const;
};

/// Options for createSession / shareSession.
struct ShareOptions {
  PermissionOverrides permissions;
  SettingsOverrides settings;
  std::optional<uint32_t> expires_in_hours;
  bool require_auth = false;
  std::vector<std::string> allowed_domains;
};

struct Session {
  std::string id;
  std::string name;
  std::string owner_id;
  std::vector<Participant> participants; // join order
  SessionPermissions permissions;
  SessionSettings settings;
  Timestamp created_at = 0;
  Timestamp updated_at = 0;
  bool is_active = true;
  std::optional<Timestamp> expires_at;
  std::optional<std::string> share_url;

  Participant *find_participant(const std::string &user_id);
  const Participant *find_participant(const std::string &user_id) const;

  bool operator==(const Session &) const = default;
};

// -----------------------------------------
// Event payloads: one alternative per event type
// -----------------------------------------

struct UserJoined {
  Participant user;
  bool operator==(const UserJoined &) const = default;
};

struct UserLeft {
  std::string user_id;
  bool operator==(const UserLeft &) const = default;
};

struct MessageSent {
  std::string message_id;
  std::string content;
  bool operator==(const MessageSent &) const = default;
};

struct MessageEdited {
  std::string message_id;
  std::string content;
  bool operator==(const MessageEdited &) const = default;
};

struct MessageDeleted {
  std::string message_id;
  bool operator==(const MessageDeleted &) const = default;
};

struct CursorMove {
  Cursor cursor;
  bool operator==(const CursorMove &) const = default;
};

struct TypingStart {
  bool operator==(const TypingStart &) const = default;
};

struct TypingStop {
  bool operator==(const TypingStop &) const = default;
};

enum class SessionSyncAction { Create, Update, Delete };

const char *to_string(SessionSyncAction action);
std::optional<SessionSyncAction> session_sync_action_from_string(std::string_view s);

struct SessionSync {
  SessionSyncAction action = SessionSyncAction::Update;
  std::optional<Session> session;
  bool operator==(const SessionSync &) const = default;
};

struct ConflictDetected {
  std::string conflict_id;
  bool operator==(const ConflictDetected &) const = default;
};

// Alternative order follows EventType.
using EventPayload = std::variant<UserJoined, UserLeft, MessageSent, MessageEdited, MessageDeleted, CursorMove,
                                  TypingStart, TypingStop, SessionSync, ConflictDetected>;

EventType event_type_of(const EventPayload &payload);

/// A session event. Immutable once created.
struct Event {
  std::string id;
  std::string session_id;
  std::string author_id;
  Timestamp timestamp = 0;
  EventPayload payload;
  Version version = 0;
  bool acknowledged = false;

  EventType type() const { return event_type_of(payload); }

  bool operator==(const Event &) const = default;
};

/// What a caller supplies to sendEvent; id, timestamp and (by default) version are assigned.
struct EventDraft {
  EventPayload payload;
  std::optional<Version> version;
};

// -----------------------------------------
// Operations
// -----------------------------------------

/// A single document edit. Positions and lengths count characters (code points).
struct Operation {
  std::string id;
  OperationType type = OperationType::Retain;
  std::size_t position = 0;
  std::string author_id;
  Timestamp timestamp = 0;
  Version base_version = 0;
  std::optional<std::string> content;
  std::optional<std::size_t> length;
  std::map<std::string, std::string> attributes; // format metadata

  bool operator==(const Operation &) const = default;
};

/// What a caller supplies to sendOperation; id, author, timestamp and base version are assigned.
struct OperationDraft {
  OperationType type = OperationType::Retain;
  std::size_t position = 0;
  std::optional<std::string> content;
  std::optional<std::size_t> length;
  std::map<std::string, std::string> attributes;
};

// -----------------------------------------
// Conflicts
// -----------------------------------------

struct ConflictResolutionDetail {
  std::string resolved_by;
  Timestamp resolved_at = 0;
  ConflictResolutionMode mode = ConflictResolutionMode::Manual;
  std::optional<std::string> payload; // caller-supplied (merged content, chosen event id, ...)

  bool operator==(const ConflictResolutionDetail &) const = default;
};

struct ConflictRecord {
  std::string id;
  std::string session_id;
  std::vector<Event> conflicting_events;
  ResolutionStrategy strategy = ResolutionStrategy::Manual;
  Timestamp detected_at = 0;
  bool resolved = false;
  std::optional<ConflictResolutionDetail> resolution;

  bool operator==(const ConflictRecord &) const = default;
};

// -----------------------------------------
// Presence
// -----------------------------------------

struct Selection {
  std::size_t start = 0;
  std::size_t end = 0;
  std::string element_id;

  bool operator==(const Selection &) const = default;
};

struct Viewport {
  double scroll_top = 0.0;
  double scroll_left = 0.0;

  bool operator==(const Viewport &) const = default;
};

struct PresenceInfo {
  std::string user_id;
  std::string session_id;
  Cursor cursor;
  std::optional<Selection> selection;
  Viewport viewport;
  Timestamp last_activity = 0;

  bool operator==(const PresenceInfo &) const = default;
};

/// Partial presence update for the local user.
struct PresenceUpdate {
  std::optional<Cursor> cursor;
  std::optional<Selection> selection;
  std::optional<Viewport> viewport;
  std::optional<Timestamp> last_activity;
};

// -----------------------------------------
// Connection
// -----------------------------------------

struct ConnectionState {
  ConnectionStatus status = ConnectionStatus::Disconnected;
  uint32_t reconnect_attempts = 0;
  std::optional<Timestamp> last_heartbeat;
};

} // namespace collab

#endif // COLLAB_TYPES_HPP
