// wire_protocol.hpp
// Typed envelope for everything exchanged with the relay, and its JSON encoding.

#ifndef COLLAB_WIRE_PROTOCOL_HPP
#define COLLAB_WIRE_PROTOCOL_HPP

#include "collab_types.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace collab {

struct JoinSessionMessage {
  std::string session_id;
  Participant user;
};

struct LeaveSessionMessage {
  std::string session_id;
  std::string user_id;
};

struct EventMessage {
  Event event;
};

struct OperationMessage {
  Operation operation;
};

struct PresenceUpdateMessage {
  PresenceInfo presence;
};

struct HeartbeatMessage {
  Timestamp timestamp = 0;
};

struct SyncRequestMessage {
  std::string session_id;
  Version from_version = 0;
};

struct SyncResponseMessage {
  std::string session_id;
  std::vector<Event> events;
  Version version = 0;
};

struct ConflictMessage {
  ConflictRecord conflict;
};

struct ErrorMessage {
  std::string error;
  std::optional<int> code;
};

using WireMessage = std::variant<JoinSessionMessage, LeaveSessionMessage, EventMessage, OperationMessage,
                                 PresenceUpdateMessage, HeartbeatMessage, SyncRequestMessage, SyncResponseMessage,
                                 ConflictMessage, ErrorMessage>;

/// Wire tag of a message ("JOIN_SESSION", "EVENT", ...).
const char *message_type_name(const WireMessage &message);

/// Serializes a message to its JSON text form.
///
/// @throws ProtocolError when a text field is not valid UTF-8
std::string encode_message(const WireMessage &message);

/// Throws the ProtocolError encode_message() would, without keeping the text.
/// Local entry points call it before changing any state.
void check_encodable(const WireMessage &message);

/// Parses JSON text into a typed message.
///
/// @throws ProtocolError on invalid JSON, an unknown `type` tag, an unknown
///         event/operation type, or a missing/mistyped required field
WireMessage decode_message(const std::string &payload);

// JSON mapping of the data model (field names follow the wire protocol).
void to_json(nlohmann::json &j, const Cursor &cursor);
void from_json(const nlohmann::json &j, Cursor &cursor);
void to_json(nlohmann::json &j, const Participant &participant);
void from_json(const nlohmann::json &j, Participant &participant);
void to_json(nlohmann::json &j, const Session &session);
void from_json(const nlohmann::json &j, Session &session);
void to_json(nlohmann::json &j, const Event &event);
void from_json(const nlohmann::json &j, Event &event);
void to_json(nlohmann::json &j, const Operation &operation);
void from_json(const nlohmann::json &j, Operation &operation);
void to_json(nlohmann::json &j, const ConflictRecord &conflict);
void from_json(const nlohmann::json &j, ConflictRecord &conflict);
void to_json(nlohmann::json &j, const PresenceInfo &presence);
void from_json(const nlohmann::json &j, PresenceInfo &presence);

} // namespace collab

#endif // COLLAB_WIRE_PROTOCOL_HPP
