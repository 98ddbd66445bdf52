// collab_types.cpp
#include "collab_types.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace collab {

namespace {

template <typename E, std::size_t N>
std::optional<E> lookup(const std::array<std::pair<E, const char *>, N> &table, std::string_view s) {
  for (const auto &[value, name] : table) {
    if (s == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename E, std::size_t N> const char *name_of(const std::array<std::pair<E, const char *>, N> &table, E e) {
  for (const auto &[value, name] : table) {
    if (value == e) {
      return name;
    }
  }
  return "unknown";
}

constexpr std::array<std::pair<Role, const char *>, 3> kRoles{{
    {Role::Owner, "owner"},
    {Role::Editor, "editor"},
    {Role::Viewer, "viewer"},
}};

constexpr std::array<std::pair<PresenceStatus, const char *>, 3> kPresenceStatuses{{
    {PresenceStatus::Online, "online"},
    {PresenceStatus::Away, "away"},
    {PresenceStatus::Offline, "offline"},
}};

constexpr std::array<std::pair<ConflictResolutionMode, const char *>, 3> kResolutionModes{{
    {ConflictResolutionMode::Manual, "manual"},
    {ConflictResolutionMode::Auto, "auto"},
    {ConflictResolutionMode::OwnerWins, "owner_wins"},
}};

constexpr std::array<std::pair<ResolutionStrategy, const char *>, 3> kStrategies{{
    {ResolutionStrategy::Merge, "merge"},
    {ResolutionStrategy::Overwrite, "overwrite"},
    {ResolutionStrategy::Manual, "manual"},
}};

constexpr std::array<std::pair<ConnectionStatus, const char *>, 5> kConnectionStatuses{{
    {ConnectionStatus::Disconnected, "disconnected"},
    {ConnectionStatus::Connecting, "connecting"},
    {ConnectionStatus::Connected, "connected"},
    {ConnectionStatus::Reconnecting, "reconnecting"},
    {ConnectionStatus::Error, "error"},
}};

constexpr std::array<std::pair<OperationType, const char *>, 4> kOperationTypes{{
    {OperationType::Insert, "insert"},
    {OperationType::Delete, "delete"},
    {OperationType::Retain, "retain"},
    {OperationType::Format, "format"},
}};

constexpr std::array<std::pair<EventType, const char *>, 10> kEventTypes{{
    {EventType::UserJoined, "USER_JOINED"},
    {EventType::UserLeft, "USER_LEFT"},
    {EventType::MessageSent, "MESSAGE_SENT"},
    {EventType::MessageEdited, "MESSAGE_EDITED"},
    {EventType::MessageDeleted, "MESSAGE_DELETED"},
    {EventType::CursorMove, "CURSOR_MOVE"},
    {EventType::TypingStart, "TYPING_START"},
    {EventType::TypingStop, "TYPING_STOP"},
    {EventType::SessionSync, "SESSION_SYNC"},
    {EventType::ConflictDetected, "CONFLICT_DETECTED"},
}};

constexpr std::array<std::pair<SessionSyncAction, const char *>, 3> kSyncActions{{
    {SessionSyncAction::Create, "create"},
    {SessionSyncAction::Update, "update"},
    {SessionSyncAction::Delete, "delete"},
}};

} // namespace

const char *to_string(Role role) { return name_of(kRoles, role); }
const char *to_string(PresenceStatus status) { return name_of(kPresenceStatuses, status); }
const char *to_string(ConflictResolutionMode mode) { return name_of(kResolutionModes, mode); }
const char *to_string(ResolutionStrategy strategy) { return name_of(kStrategies, strategy); }
const char *to_string(ConnectionStatus status) { return name_of(kConnectionStatuses, status); }
const char *to_string(OperationType type) { return name_of(kOperationTypes, type); }
const char *to_string(EventType type) { return name_of(kEventTypes, type); }
const char *to_string(SessionSyncAction action) { return name_of(kSyncActions, action); }

std::optional<Role> role_from_string(std::string_view s) { return lookup(kRoles, s); }

std::optional<PresenceStatus> presence_status_from_string(std::string_view s) { return lookup(kPresenceStatuses, s); }

std::optional<ConflictResolutionMode> resolution_mode_from_string(std::string_view s) {
  return lookup(kResolutionModes, s);
}

std::optional<ResolutionStrategy> resolution_strategy_from_string(std::string_view s) { return lookup(kStrategies, s); }

std::optional<OperationType> operation_type_from_string(std::string_view s) { return lookup(kOperationTypes, s); }

std::optional<EventType> event_type_from_string(std::string_view s) { return lookup(kEventTypes, s); }

std::optional<SessionSyncAction> session_sync_action_from_string(std::string_view s) { return lookup(kSyncActions, s); }

ResolutionStrategy default_strategy_for(ConflictResolutionMode mode) {
  switch (mode) {
  case ConflictResolutionMode::Auto:
    return ResolutionStrategy::Merge;
  case ConflictResolutionMode::OwnerWins:
    return ResolutionStrategy::Overwrite;
  case ConflictResolutionMode::Manual:
    break;
  }
  return ResolutionStrategy::Manual;
}

EventType event_type_of(const EventPayload &payload) { return static_cast<EventType>(payload.index()); }

void PermissionOverrides::apply_to(SessionPermissions &permissions) const {
  if (allow_editing)
    permissions.allow_editing = *allow_editing;
  if (allow_inviting)
    permissions.allow_inviting = *allow_inviting;
  if (allow_messaging)
    permissions.allow_messaging = *allow_messaging;
  if (require_approval)
    permissions.require_approval = *require_approval;
}

void SettingsOverrides::apply_to(SessionSettings &settings) const {
  if (max_participants)
    settings.max_participants = *max_participants;
  if (allow_anonymous)
    settings.allow_anonymous = *allow_anonymous;
  if (auto_save)
    settings.auto_save = *auto_save;
  if (sync_delay_ms)
    settings.sync_delay_ms = *sync_delay_ms;
  if (conflict_resolution)
    settings.conflict_resolution = *conflict_resolution;
}

Participant *Session::find_participant(const std::string &user_id) {
  auto it = std::find_if(participants.begin(), participants.end(),
                         [&](const Participant &p) { return p.id == user_id; });
  return it == participants.end() ? nullptr : &*it;
}

const Participant *Session::find_participant(const std::string &user_id) const {
  auto it = std::find_if(participants.begin(), participants.end(),
                         [&](const Participant &p) { return p.id == user_id; });
  return it == participants.end() ? nullptr : &*it;
}

} // namespace collab
