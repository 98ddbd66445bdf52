// conflict_resolver.hpp
#ifndef COLLAB_CONFLICT_RESOLVER_HPP
#define COLLAB_CONFLICT_RESOLVER_HPP

#include "collab_types.hpp"
#include "scheduler.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace collab {

/// Classifies concurrent events and keeps the conflict set of one session.
///
/// Detection never resolves anything: a detected conflict stays open until
/// resolve_conflict() is called for it.
class ConflictResolver {
public:
  using ConflictListener = std::function<void(const ConflictRecord &conflict)>;

  explicit ConflictResolver(const Clock &clock) : clock_(clock) {}

  /// Returns a record iff some event has version == base_version and was
  /// authored by someone other than `local_user_id`. The record lists every
  /// such event; its strategy follows `mode`. Nothing is stored.
  std::optional<ConflictRecord> detect_conflict(const std::vector<Event> &events, Version base_version,
                                                const std::string &local_user_id, const std::string &session_id,
                                                ConflictResolutionMode mode) const;

  /// Adds a record to the conflict set (detected locally or received as CONFLICT).
  /// A record whose id is already known replaces the stored one.
  void record_conflict(ConflictRecord conflict);

  /// Marks a conflict resolved and stores the caller's resolution payload.
  ///
  /// @throws StateError for an unknown id or an already resolved conflict
  ConflictRecord resolve_conflict(const std::string &conflict_id, const std::string &resolved_by,
                                 std::optional<std::string> payload, ConflictResolutionMode mode);

  const ConflictRecord *find(const std::string &conflict_id) const;
  const std::vector<ConflictRecord> &conflicts() const { return conflicts_; }
  std::vector<ConflictRecord> unresolved() const;

  void clear() { conflicts_.clear(); }

  /// Called after a record is added or resolved.
  void set_listener(ConflictListener listener) { listener_ = std::move(listener); }

private:
  const Clock &clock_;
  std::vector<ConflictRecord> conflicts_; // detection order
  ConflictListener listener_;
};

} // namespace collab

#endif // COLLAB_CONFLICT_RESOLVER_HPP
