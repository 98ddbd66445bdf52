// conflict_resolver.cpp
#include "conflict_resolver.hpp"

#include "collab_errors.hpp"
#include "collab_ids.hpp"
#include "collab_log.hpp"

#include <algorithm>
#include <iterator>

namespace collab {

std::optional<ConflictRecord> ConflictResolver::detect_conflict(const std::vector<Event> &events,
                                                                Version base_version,
                                                                const std::string &local_user_id,
                                                                const std::string &session_id,
                                                                ConflictResolutionMode mode) const {
  std::vector<Event> conflicting;
  for (const auto &event : events) {
    if (event.version == base_version && event.author_id != local_user_id) {
      conflicting.push_back(event);
    }
  }
  if (conflicting.empty()) {
    return std::nullopt;
  }

  ConflictRecord record;
  record.id = generate_conflict_id();
  record.session_id = session_id;
  record.conflicting_events = std::move(conflicting);
  record.strategy = default_strategy_for(mode);
  record.detected_at = clock_.now_ms();
  return record;
}

void ConflictResolver::record_conflict(ConflictRecord conflict) {
  auto it = std::find_if(conflicts_.begin(), conflicts_.end(),
                         [&](const ConflictRecord &c) { return c.id == conflict.id; });
  if (it != conflicts_.end()) {
    *it = std::move(conflict);
    if (listener_) {
      listener_(*it);
    }
    return;
  }

  log_info("conflict " + conflict.id + " recorded with " + std::to_string(conflict.conflicting_events.size()) +
           " event(s), strategy " + to_string(conflict.strategy));
  conflicts_.push_back(std::move(conflict));
  if (listener_) {
    listener_(conflicts_.back());
  }
}

ConflictRecord ConflictResolver::resolve_conflict(const std::string &conflict_id, const std::string &resolved_by,
                                                  std::optional<std::string> payload, ConflictResolutionMode mode) {
  auto it = std::find_if(conflicts_.begin(), conflicts_.end(),
                         [&](const ConflictRecord &c) { return c.id == conflict_id; });
  if (it == conflicts_.end()) {
    throw StateError("unknown conflict '" + conflict_id + "'");
  }
  if (it->resolved) {
    throw StateError("conflict '" + conflict_id + "' is already resolved");
  }

  it->resolved = true;
  it->resolution = ConflictResolutionDetail{resolved_by, clock_.now_ms(), mode, std::move(payload)};
  log_info("conflict " + conflict_id + " resolved by " + resolved_by);

  ConflictRecord resolved = *it;
  if (listener_) {
    listener_(resolved);
  }
  return resolved;
}

const ConflictRecord *ConflictResolver::find(const std::string &conflict_id) const {
  auto it = std::find_if(conflicts_.begin(), conflicts_.end(),
                         [&](const ConflictRecord &c) { return c.id == conflict_id; });
  return it == conflicts_.end() ? nullptr : &*it;
}

std::vector<ConflictRecord> ConflictResolver::unresolved() const {
  std::vector<ConflictRecord> open;
  std::copy_if(conflicts_.begin(), conflicts_.end(), std::back_inserter(open),
               [](const ConflictRecord &c) { return !c.resolved; });
  return open;
}

} // namespace collab
