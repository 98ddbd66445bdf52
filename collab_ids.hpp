// collab_ids.hpp
// Identifier generation for sessions, events, operations, conflicts and notifications.
// Random UUIDs from libuuid keep ids from different clients from colliding.

#ifndef COLLAB_IDS_HPP
#define COLLAB_IDS_HPP

#include <string>
#include <string_view>
#include <uuid/uuid.h> // libuuid

namespace collab {

/// Returns a fresh lowercase UUID, e.g. "550e8400-e29b-41d4-a716-446655440000".
inline std::string generate_uuid() {
  uuid_t uuid;
  uuid_generate(uuid);

  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);

  return std::string(uuid_str);
}

/// Returns `<prefix>_<uuid>`, e.g. "event_550e8400-...".
inline std::string generate_id(std::string_view prefix) {
  std::string id(prefix);
  id += '_';
  id += generate_uuid();
  return id;
}

inline std::string generate_session_id() { return generate_id("session"); }
inline std::string generate_event_id() { return generate_id("event"); }
inline std::string generate_operation_id() { return generate_id("op"); }
inline std::string generate_conflict_id() { return generate_id("conflict"); }
inline std::string generate_notification_id() { return generate_id("notification"); }

} // namespace collab

#endif // COLLAB_IDS_HPP
