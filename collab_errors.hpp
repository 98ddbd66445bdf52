// collab_errors.hpp
#ifndef COLLAB_ERRORS_HPP
#define COLLAB_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace collab {

/// Base class for every error raised by the synchronization engine.
///
/// Error Handling:
/// - TransportError and ProtocolError are absorbed by the engine's inbound loop
///   and turned into notifications / log lines
/// - PermissionError and StateError are raised to the caller of the API that
///   detected them and are never retried
/// - StorageError is raised by IdentityStore on SQLite failures
///
/// Conflicts are not errors: they are ConflictRecord values (see conflict_resolver.hpp).
class CollabException : public std::runtime_error {
public:
  explicit CollabException(const std::string &msg) : std::runtime_error(msg) {}
};

/// Connect or send failure on the transport. Triggers the reconnect policy.
class TransportError : public CollabException {
public:
  explicit TransportError(const std::string &msg) : CollabException("transport: " + msg) {}
};

/// Malformed or unknown wire message.
class ProtocolError : public CollabException {
public:
  explicit ProtocolError(const std::string &msg) : CollabException("protocol: " + msg) {}
};

/// Edit, invite or owner-only action attempted without the required role.
class PermissionError : public CollabException {
public:
  explicit PermissionError(const std::string &msg) : CollabException("permission: " + msg) {}
};

/// Operation referencing an unknown session/user, or invalid in the current state.
class StateError : public CollabException {
public:
  explicit StateError(const std::string &msg) : CollabException("state: " + msg) {}
};

/// Persistence layer failure (SQLite).
class StorageError : public CollabException {
public:
  explicit StorageError(const std::string &msg) : CollabException("storage: " + msg) {}
};

} // namespace collab

#endif // COLLAB_ERRORS_HPP
