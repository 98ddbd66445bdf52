// wire_protocol.cpp
#include "wire_protocol.hpp"

#include "collab_errors.hpp"

#include <type_traits>

using json = nlohmann::json;

namespace collab {

namespace {

// Unsigned fields (positions, lengths, versions) reject negative or fractional numbers
template <typename T> T field_value(const json &value, const char *key) {
  if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
    if (value.is_number() && !value.is_number_unsigned()) {
      throw ProtocolError(std::string("field '") + key + "' must be a non-negative integer");
    }
  }
  return value.get<T>();
}

template <typename T> T required(const json &j, const char *key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    throw ProtocolError(std::string("missing field '") + key + "'");
  }
  return field_value<T>(j.at(key), key);
}

template <typename T> T value_or(const json &j, const char *key, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return field_value<T>(*it, key);
}

template <typename T> std::optional<T> optional_field(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return field_value<T>(*it, key);
}

template <typename T> void put_optional(json &j, const char *key, const std::optional<T> &value) {
  if (value) {
    j[key] = *value;
  }
}

template <typename E> E enum_field(const json &j, const char *key, std::optional<E> (*parse)(std::string_view)) {
  std::string text = required<std::string>(j, key);
  auto value = parse(text);
  if (!value) {
    throw ProtocolError(std::string("unknown ") + key + " '" + text + "'");
  }
  return *value;
}

template <typename E>
E enum_field_or(const json &j, const char *key, std::optional<E> (*parse)(std::string_view), E fallback) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return fallback;
  }
  return enum_field(j, key, parse);
}

// -----------------------------------------
// Event payload <-> `data`
// -----------------------------------------

json payload_to_json(const EventPayload &payload) {
  return std::visit(
      [](const auto &p) -> json {
        using P = std::decay_t<decltype(p)>;
        json data = json::object();
        if constexpr (std::is_same_v<P, UserJoined>) {
          data["user"] = p.user;
        } else if constexpr (std::is_same_v<P, UserLeft>) {
          data["userId"] = p.user_id;
        } else if constexpr (std::is_same_v<P, MessageSent> || std::is_same_v<P, MessageEdited>) {
          data["messageId"] = p.message_id;
          data["content"] = p.content;
        } else if constexpr (std::is_same_v<P, MessageDeleted>) {
          data["messageId"] = p.message_id;
        } else if constexpr (std::is_same_v<P, CursorMove>) {
          data["cursor"] = p.cursor;
        } else if constexpr (std::is_same_v<P, SessionSync>) {
          data["action"] = to_string(p.action);
          if (p.session) {
            data["session"] = *p.session;
          }
        } else if constexpr (std::is_same_v<P, ConflictDetected>) {
          data["conflictId"] = p.conflict_id;
        }
        return data;
      },
      payload);
}

EventPayload payload_from_json(EventType type, const json &data) {
  switch (type) {
  case EventType::UserJoined:
    return UserJoined{required<Participant>(data, "user")};
  case EventType::UserLeft:
    return UserLeft{required<std::string>(data, "userId")};
  case EventType::MessageSent:
    return MessageSent{required<std::string>(data, "messageId"), value_or<std::string>(data, "content", "")};
  case EventType::MessageEdited:
    return MessageEdited{required<std::string>(data, "messageId"), value_or<std::string>(data, "content", "")};
  case EventType::MessageDeleted:
    return MessageDeleted{required<std::string>(data, "messageId")};
  case EventType::CursorMove:
    return CursorMove{required<Cursor>(data, "cursor")};
  case EventType::TypingStart:
    return TypingStart{};
  case EventType::TypingStop:
    return TypingStop{};
  case EventType::SessionSync:
    return SessionSync{enum_field(data, "action", &session_sync_action_from_string),
                       optional_field<Session>(data, "session")};
  case EventType::ConflictDetected:
    return ConflictDetected{required<std::string>(data, "conflictId")};
  }
  throw ProtocolError("unhandled event type");
}

// -----------------------------------------
// Envelope
// -----------------------------------------

json message_to_json(const WireMessage &message) {
  json j = std::visit(
      [](const auto &m) -> json {
        using M = std::decay_t<decltype(m)>;
        json body = json::object();
        if constexpr (std::is_same_v<M, JoinSessionMessage>) {
          body["sessionId"] = m.session_id;
          body["user"] = m.user;
        } else if constexpr (std::is_same_v<M, LeaveSessionMessage>) {
          body["sessionId"] = m.session_id;
          body["userId"] = m.user_id;
        } else if constexpr (std::is_same_v<M, EventMessage>) {
          body["event"] = m.event;
        } else if constexpr (std::is_same_v<M, OperationMessage>) {
          body["operation"] = m.operation;
        } else if constexpr (std::is_same_v<M, PresenceUpdateMessage>) {
          body["presence"] = m.presence;
        } else if constexpr (std::is_same_v<M, HeartbeatMessage>) {
          body["timestamp"] = m.timestamp;
        } else if constexpr (std::is_same_v<M, SyncRequestMessage>) {
          body["sessionId"] = m.session_id;
          body["fromVersion"] = m.from_version;
        } else if constexpr (std::is_same_v<M, SyncResponseMessage>) {
          body["sessionId"] = m.session_id;
          body["events"] = m.events;
          body["version"] = m.version;
        } else if constexpr (std::is_same_v<M, ConflictMessage>) {
          body["conflict"] = m.conflict;
        } else if constexpr (std::is_same_v<M, ErrorMessage>) {
          body["error"] = m.error;
          put_optional(body, "code", m.code);
        }
        return body;
      },
      message);
  j["type"] = message_type_name(message);
  return j;
}

WireMessage message_from_json(const json &j) {
  if (!j.is_object()) {
    throw ProtocolError("message is not a JSON object");
  }
  std::string type = required<std::string>(j, "type");

  if (type == "JOIN_SESSION") {
    return JoinSessionMessage{required<std::string>(j, "sessionId"), required<Participant>(j, "user")};
  }
  if (type == "LEAVE_SESSION") {
    return LeaveSessionMessage{required<std::string>(j, "sessionId"), required<std::string>(j, "userId")};
  }
  if (type == "EVENT") {
    return EventMessage{required<Event>(j, "event")};
  }
  if (type == "OPERATION") {
    return OperationMessage{required<Operation>(j, "operation")};
  }
  if (type == "PRESENCE_UPDATE") {
    return PresenceUpdateMessage{required<PresenceInfo>(j, "presence")};
  }
  if (type == "HEARTBEAT") {
    return HeartbeatMessage{value_or<Timestamp>(j, "timestamp", 0)};
  }
  if (type == "SYNC_REQUEST") {
    return SyncRequestMessage{required<std::string>(j, "sessionId"), value_or<Version>(j, "fromVersion", 0)};
  }
  if (type == "SYNC_RESPONSE") {
    return SyncResponseMessage{required<std::string>(j, "sessionId"),
                               value_or<std::vector<Event>>(j, "events", {}), required<Version>(j, "version")};
  }
  if (type == "CONFLICT") {
    return ConflictMessage{required<ConflictRecord>(j, "conflict")};
  }
  if (type == "ERROR") {
    return ErrorMessage{value_or<std::string>(j, "error", ""), optional_field<int>(j, "code")};
  }
  throw ProtocolError("unknown message type '" + type + "'");
}

} // namespace

const char *message_type_name(const WireMessage &message) {
  static constexpr const char *kNames[] = {"JOIN_SESSION",    "LEAVE_SESSION", "EVENT",        "OPERATION",
                                           "PRESENCE_UPDATE", "HEARTBEAT",     "SYNC_REQUEST", "SYNC_RESPONSE",
                                           "CONFLICT",        "ERROR"};
  return kNames[message.index()];
}

std::string encode_message(const WireMessage &message) {
  try {
    return message_to_json(message).dump();
  } catch (const json::exception &e) {
    throw ProtocolError(std::string("cannot encode ") + message_type_name(message) + ": " + e.what());
  }
}

void check_encodable(const WireMessage &message) { encode_message(message); }

WireMessage decode_message(const std::string &payload) {
  try {
    return message_from_json(json::parse(payload));
  } catch (const json::exception &e) {
    throw ProtocolError(e.what());
  }
}

// -----------------------------------------
// Model mapping
// -----------------------------------------

void to_json(json &j, const Cursor &cursor) {
  j = json{{"x", cursor.x}, {"y", cursor.y}};
  put_optional(j, "elementId", cursor.element_id);
}

void from_json(const json &j, Cursor &cursor) {
  cursor.x = value_or<double>(j, "x", 0.0);
  cursor.y = value_or<double>(j, "y", 0.0);
  cursor.element_id = optional_field<std::string>(j, "elementId");
}

void to_json(json &j, const Participant &participant) {
  j = json{{"id", participant.id},
           {"name", participant.name},
           {"email", participant.email},
           {"role", to_string(participant.role)},
           {"status", to_string(participant.status)},
           {"lastSeen", participant.last_seen},
           {"isTyping", participant.is_typing}};
  put_optional(j, "avatar", participant.avatar);
  put_optional(j, "cursor", participant.cursor);
  put_optional(j, "currentSession", participant.current_session);
}

void from_json(const json &j, Participant &participant) {
  participant.id = required<std::string>(j, "id");
  participant.name = value_or<std::string>(j, "name", "");
  participant.email = value_or<std::string>(j, "email", "");
  participant.avatar = optional_field<std::string>(j, "avatar");
  participant.role = enum_field_or(j, "role", &role_from_string, Role::Viewer);
  participant.status = enum_field_or(j, "status", &presence_status_from_string, PresenceStatus::Online);
  participant.last_seen = value_or<Timestamp>(j, "lastSeen", 0);
  participant.is_typing = value_or<bool>(j, "isTyping", false);
  participant.cursor = optional_field<Cursor>(j, "cursor");
  participant.current_session = optional_field<std::string>(j, "currentSession");
}

void to_json(json &j, const Session &session) {
  const auto &p = session.permissions;
  const auto &s = session.settings;
  j = json{{"id", session.id},
           {"name", session.name},
           {"ownerId", session.owner_id},
           {"participants", session.participants},
           {"permissions",
            {{"allowEditing", p.allow_editing},
             {"allowInviting", p.allow_inviting},
             {"allowMessaging", p.allow_messaging},
             {"requireApproval", p.require_approval}}},
           {"settings",
            {{"maxParticipants", s.max_participants},
             {"allowAnonymous", s.allow_anonymous},
             {"autoSave", s.auto_save},
             {"syncDelay", s.sync_delay_ms},
             {"conflictResolution", to_string(s.conflict_resolution)}}},
           {"createdAt", session.created_at},
           {"updatedAt", session.updated_at},
           {"isActive", session.is_active}};
  put_optional(j, "expiresAt", session.expires_at);
  put_optional(j, "shareUrl", session.share_url);
}

void from_json(const json &j, Session &session) {
  session.id = required<std::string>(j, "id");
  session.name = value_or<std::string>(j, "name", "");
  session.owner_id = required<std::string>(j, "ownerId");
  session.participants = value_or<std::vector<Participant>>(j, "participants", {});

  SessionPermissions permissions;
  if (auto it = j.find("permissions"); it != j.end() && it->is_object()) {
    permissions.allow_editing = value_or<bool>(*it, "allowEditing", permissions.allow_editing);
    permissions.allow_inviting = value_or<bool>(*it, "allowInviting", permissions.allow_inviting);
    permissions.allow_messaging = value_or<bool>(*it, "allowMessaging", permissions.allow_messaging);
    permissions.require_approval = value_or<bool>(*it, "requireApproval", permissions.require_approval);
  }
  session.permissions = permissions;

  SessionSettings settings;
  if (auto it = j.find("settings"); it != j.end() && it->is_object()) {
    settings.max_participants = value_or<uint32_t>(*it, "maxParticipants", settings.max_participants);
    settings.allow_anonymous = value_or<bool>(*it, "allowAnonymous", settings.allow_anonymous);
    settings.auto_save = value_or<bool>(*it, "autoSave", settings.auto_save);
    settings.sync_delay_ms = value_or<uint32_t>(*it, "syncDelay", settings.sync_delay_ms);
    settings.conflict_resolution =
        enum_field_or(*it, "conflictResolution", &resolution_mode_from_string, settings.conflict_resolution);
  }
  session.settings = settings;

  session.created_at = value_or<Timestamp>(j, "createdAt", 0);
  session.updated_at = value_or<Timestamp>(j, "updatedAt", session.created_at);
  session.is_active = value_or<bool>(j, "isActive", true);
  session.expires_at = optional_field<Timestamp>(j, "expiresAt");
  session.share_url = optional_field<std::string>(j, "shareUrl");
}

void to_json(json &j, const Event &event) {
  j = json{{"id", event.id},
           {"type", to_string(event.type())},
           {"sessionId", event.session_id},
           {"userId", event.author_id},
           {"timestamp", event.timestamp},
           {"data", payload_to_json(event.payload)},
           {"version", event.version},
           {"acknowledged", event.acknowledged}};
}

void from_json(const json &j, Event &event) {
  EventType type = enum_field(j, "type", &event_type_from_string);
  event.id = required<std::string>(j, "id");
  event.session_id = required<std::string>(j, "sessionId");
  event.author_id = required<std::string>(j, "userId");
  event.timestamp = value_or<Timestamp>(j, "timestamp", 0);
  event.payload = payload_from_json(type, value_or<json>(j, "data", json::object()));
  event.version = required<Version>(j, "version");
  event.acknowledged = value_or<bool>(j, "acknowledged", false);
}

void to_json(json &j, const Operation &operation) {
  j = json{{"id", operation.id},
           {"type", to_string(operation.type)},
           {"position", operation.position},
           {"userId", operation.author_id},
           {"timestamp", operation.timestamp},
           {"baseVersion", operation.base_version}};
  put_optional(j, "content", operation.content);
  put_optional(j, "length", operation.length);
  if (!operation.attributes.empty()) {
    j["attributes"] = operation.attributes;
  }
}

void from_json(const json &j, Operation &operation) {
  operation.id = required<std::string>(j, "id");
  operation.type = enum_field(j, "type", &operation_type_from_string);
  operation.position = required<std::size_t>(j, "position");
  operation.author_id = required<std::string>(j, "userId");
  operation.timestamp = value_or<Timestamp>(j, "timestamp", 0);
  operation.base_version = value_or<Version>(j, "baseVersion", 0);
  operation.content = optional_field<std::string>(j, "content");
  operation.length = optional_field<std::size_t>(j, "length");

  operation.attributes.clear();
  if (auto it = j.find("attributes"); it != j.end() && it->is_object()) {
    for (const auto &[key, value] : it->items()) {
      // Non-string attribute values are kept in their JSON text form
      operation.attributes[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
  }
}

void to_json(json &j, const ConflictRecord &conflict) {
  j = json{{"id", conflict.id},
           {"sessionId", conflict.session_id},
           {"conflictingEvents", conflict.conflicting_events},
           {"resolutionStrategy", to_string(conflict.strategy)},
           {"timestamp", conflict.detected_at},
           {"resolved", conflict.resolved}};
  if (conflict.resolution) {
    const auto &r = *conflict.resolution;
    j["resolvedBy"] = r.resolved_by;
    j["resolvedAt"] = r.resolved_at;
    json resolution{{"strategy", to_string(r.mode)}};
    put_optional(resolution, "payload", r.payload);
    j["resolution"] = resolution;
  }
}

void from_json(const json &j, ConflictRecord &conflict) {
  conflict.id = required<std::string>(j, "id");
  conflict.session_id = required<std::string>(j, "sessionId");
  conflict.conflicting_events = value_or<std::vector<Event>>(j, "conflictingEvents", {});
  conflict.strategy = enum_field_or(j, "resolutionStrategy", &resolution_strategy_from_string,
                                    ResolutionStrategy::Manual);
  conflict.detected_at = value_or<Timestamp>(j, "timestamp", 0);
  conflict.resolved = value_or<bool>(j, "resolved", false);

  conflict.resolution.reset();
  if (conflict.resolved || j.contains("resolvedBy")) {
    ConflictResolutionDetail detail;
    detail.resolved_by = value_or<std::string>(j, "resolvedBy", "");
    detail.resolved_at = value_or<Timestamp>(j, "resolvedAt", 0);
    if (auto it = j.find("resolution"); it != j.end() && it->is_object()) {
      detail.mode = enum_field_or(*it, "strategy", &resolution_mode_from_string, detail.mode);
      detail.payload = optional_field<std::string>(*it, "payload");
    }
    conflict.resolution = detail;
  }
}

void to_json(json &j, const PresenceInfo &presence) {
  j = json{{"userId", presence.user_id},
           {"sessionId", presence.session_id},
           {"cursor", presence.cursor},
           {"viewport", {{"scrollTop", presence.viewport.scroll_top}, {"scrollLeft", presence.viewport.scroll_left}}},
           {"lastActivity", presence.last_activity}};
  if (presence.selection) {
    j["selection"] = json{{"start", presence.selection->start},
                          {"end", presence.selection->end},
                          {"elementId", presence.selection->element_id}};
  }
}

void from_json(const json &j, PresenceInfo &presence) {
  presence.user_id = required<std::string>(j, "userId");
  presence.session_id = required<std::string>(j, "sessionId");
  presence.cursor = value_or<Cursor>(j, "cursor", Cursor{});

  presence.selection.reset();
  if (auto it = j.find("selection"); it != j.end() && it->is_object()) {
    presence.selection = Selection{value_or<std::size_t>(*it, "start", 0), value_or<std::size_t>(*it, "end", 0),
                                   value_or<std::string>(*it, "elementId", "")};
  }

  presence.viewport = Viewport{};
  if (auto it = j.find("viewport"); it != j.end() && it->is_object()) {
    presence.viewport.scroll_top = value_or<double>(*it, "scrollTop", 0.0);
    presence.viewport.scroll_left = value_or<double>(*it, "scrollLeft", 0.0);
  }
  presence.last_activity = value_or<Timestamp>(j, "lastActivity", 0);
}

} // namespace collab
