// session_registry.hpp
#ifndef COLLAB_SESSION_REGISTRY_HPP
#define COLLAB_SESSION_REGISTRY_HPP

#include "collab_types.hpp"
#include "scheduler.hpp"

#include <optional>
#include <string>
#include <vector>

namespace collab {

/// Session, participant, role and permission state of the local client.
///
/// Holds at most one session: the one the local user created or joined.
/// Participants are kept in join order.
///
/// Error Handling:
/// - StateError when there is no current user or session, or an id is unknown
/// - PermissionError when the current user lacks the role for an action
class SessionRegistry {
public:
  explicit SessionRegistry(const Clock &clock, std::string share_base_url = "https://collab.local/session");

  void set_current_user(Participant user);
  const std::optional<Participant> &current_user() const { return current_user_; }

  /// Creates a session owned by the current user (role owner) with the
  /// overrides of `options` merged onto the defaults.
  ///
  /// @throws StateError without a current user
  const Session &create_session(const std::string &name, const ShareOptions &options = {});

  /// Enters `session_id` as `user`, who becomes the current user. Session
  /// metadata stays a placeholder until a SESSION_SYNC is adopted.
  const Session &join_session(const std::string &session_id, Participant user);

  /// Forgets the session and its participants. Returns the id that was left.
  std::optional<std::string> leave_session();

  /// Sets the share URL and merges the overrides of `options`.
  ///
  /// @throws PermissionError unless the current user is the owner, or an
  ///         editor while allowInviting is set
  std::string share_session(const ShareOptions &options);

  /// Owner only. Returns the id of the deleted session.
  std::string delete_session();

  /// Owner only.
  void update_settings(const PermissionOverrides &permissions, const SettingsOverrides &settings);

  /// Owner only. The owner's own role cannot change and no one else can become owner.
  void change_role(const std::string &user_id, Role role);

  /// Adds a participant or refreshes an existing entry (join order is kept).
  ///
  /// @throws StateError when the session is full
  void add_participant(Participant participant);

  /// Removes a participant. The session is destroyed locally when its last
  /// participant leaves. Returns false for an unknown id.
  bool remove_participant(const std::string &user_id);

  bool set_typing(const std::string &user_id, bool is_typing);
  bool set_cursor(const std::string &user_id, const Cursor &cursor);

  /// Updates a participant's status and stamps last-seen.
  bool update_user_status(const std::string &user_id, PresenceStatus status);

  /// Stamps last-seen of a participant that was just heard from.
  void touch_participant(const std::string &user_id, Timestamp at);

  /// Applies a SESSION_SYNC from another client: create/update adopt the
  /// carried metadata, delete destroys the local session.
  void adopt_session(const SessionSync &sync);

  /// Destroys the session if its expiry has passed. Returns true if it did.
  bool expire_if_due();

  bool has_session() const { return session_.has_value(); }
  const Session *session() const { return session_ ? &*session_ : nullptr; }
  std::optional<std::string> session_id() const;

  bool is_owner(const std::string &user_id) const;
  bool is_owner() const;
  bool can_edit(const std::string &user_id) const;
  bool can_edit() const;
  bool can_message(const std::string &user_id) const;

  const Participant *find_participant(const std::string &user_id) const;
  std::vector<Participant> participants() const;

private:
  Session &require_session();
  void require_owner(const char *action) const;
  void touch();

  const Clock &clock_;
  std::string share_base_url_;
  std::optional<Participant> current_user_;
  std::optional<Session> session_;
};

} // namespace collab

#endif // COLLAB_SESSION_REGISTRY_HPP
