// session_registry.cpp
#include "session_registry.hpp"

#include "collab_errors.hpp"
#include "collab_ids.hpp"
#include "collab_log.hpp"

#include <algorithm>

namespace collab {

SessionRegistry::SessionRegistry(const Clock &clock, std::string share_base_url)
    : clock_(clock), share_base_url_(std::move(share_base_url)) {
  while (!share_base_url_.empty() && share_base_url_.back() == '/') {
    share_base_url_.pop_back();
  }
}

void SessionRegistry::set_current_user(Participant user) {
  if (user.id.empty()) {
    throw StateError("current user needs an id");
  }
  current_user_ = std::move(user);
}

const Session &SessionRegistry::create_session(const std::string &name, const ShareOptions &options) {
  if (!current_user_) {
    throw StateError("no current user set");
  }

  Timestamp now = clock_.now_ms();
  Session session;
  session.id = generate_session_id();
  session.name = name;
  session.owner_id = current_user_->id;
  options.permissions.apply_to(session.permissions);
  options.settings.apply_to(session.settings);
  session.created_at = now;
  session.updated_at = now;
  session.is_active = true;
  if (options.expires_in_hours) {
    session.expires_at = now + static_cast<Timestamp>(*options.expires_in_hours) * 60 * 60 * 1000;
  }

  current_user_->role = Role::Owner;
  current_user_->current_session = session.id;
  current_user_->last_seen = now;
  session.participants.push_back(*current_user_);

  session_ = std::move(session);
  log_info("created session " + session_->id + " (" + name + ")");
  return *session_;
}

const Session &SessionRegistry::join_session(const std::string &session_id, Participant user) {
  if (session_id.empty()) {
    throw StateError("join needs a session id");
  }

  Timestamp now = clock_.now_ms();
  user.current_session = session_id;
  user.last_seen = now;
  set_current_user(user);

  if (!session_ || session_->id != session_id) {
    Session placeholder;
    placeholder.id = session_id;
    placeholder.owner_id = user.role == Role::Owner ? user.id : std::string();
    placeholder.created_at = now;
    placeholder.updated_at = now;
    session_ = std::move(placeholder);
  }
  add_participant(std::move(user));
  log_info("joined session " + session_id + " as " + current_user_->id);
  return *session_;
}

std::optional<std::string> SessionRegistry::leave_session() {
  if (!session_) {
    return std::nullopt;
  }
  std::string id = session_->id;
  session_.reset();
  if (current_user_) {
    current_user_->current_session.reset();
    current_user_->is_typing = false;
  }
  log_info("left session " + id);
  return id;
}

std::string SessionRegistry::share_session(const ShareOptions &options) {
  Session &session = require_session();
  if (!current_user_) {
    throw StateError("no current user set");
  }

  const Participant *me = session.find_participant(current_user_->id);
  bool owner = session.owner_id == current_user_->id;
  bool inviting_editor = me && me->role == Role::Editor && session.permissions.allow_inviting;
  if (!owner && !inviting_editor) {
    throw PermissionError("user " + current_user_->id + " may not share session " + session.id);
  }

  session.share_url = share_base_url_ + "/" + session.id;
  options.permissions.apply_to(session.permissions);
  options.settings.apply_to(session.settings);
  if (options.expires_in_hours) {
    session.expires_at = clock_.now_ms() + static_cast<Timestamp>(*options.expires_in_hours) * 60 * 60 * 1000;
  }
  touch();
  return *session.share_url;
}

std::string SessionRegistry::delete_session() {
  require_session();
  require_owner("delete the session");
  std::string id = session_->id;
  session_.reset();
  if (current_user_) {
    current_user_->current_session.reset();
  }
  log_info("deleted session " + id);
  return id;
}

void SessionRegistry::update_settings(const PermissionOverrides &permissions, const SettingsOverrides &settings) {
  Session &session = require_session();
  require_owner("change settings");
  permissions.apply_to(session.permissions);
  settings.apply_to(session.settings);
  touch();
}

void SessionRegistry::change_role(const std::string &user_id, Role role) {
  Session &session = require_session();
  require_owner("change roles");

  Participant *target = session.find_participant(user_id);
  if (!target) {
    throw StateError("unknown participant '" + user_id + "'");
  }
  if (user_id == session.owner_id || role == Role::Owner) {
    throw StateError("the owner role cannot be reassigned");
  }

  target->role = role;
  if (current_user_ && current_user_->id == user_id) {
    current_user_->role = role;
  }
  touch();
}

void SessionRegistry::add_participant(Participant participant) {
  Session &session = require_session();

  if (Participant *existing = session.find_participant(participant.id)) {
    *existing = std::move(participant);
    touch();
    return;
  }
  if (session.participants.size() >= session.settings.max_participants) {
    throw StateError("session " + session.id + " is full");
  }

  if (participant.role == Role::Owner && session.owner_id.empty()) {
    session.owner_id = participant.id;
  }
  session.participants.push_back(std::move(participant));
  touch();
}

bool SessionRegistry::remove_participant(const std::string &user_id) {
  if (!session_) {
    return false;
  }
  auto &list = session_->participants;
  auto it = std::find_if(list.begin(), list.end(), [&](const Participant &p) { return p.id == user_id; });
  if (it == list.end()) {
    return false;
  }
  list.erase(it);
  touch();

  if (list.empty()) {
    log_info("session " + session_->id + " has no participants left");
    session_.reset();
  }
  return true;
}

bool SessionRegistry::set_typing(const std::string &user_id, bool is_typing) {
  if (current_user_ && current_user_->id == user_id) {
    current_user_->is_typing = is_typing;
  }
  if (!session_) {
    return false;
  }
  Participant *p = session_->find_participant(user_id);
  if (!p) {
    return false;
  }
  p->is_typing = is_typing;
  return true;
}

bool SessionRegistry::set_cursor(const std::string &user_id, const Cursor &cursor) {
  if (!session_) {
    return false;
  }
  Participant *p = session_->find_participant(user_id);
  if (!p) {
    return false;
  }
  p->cursor = cursor;
  return true;
}

bool SessionRegistry::update_user_status(const std::string &user_id, PresenceStatus status) {
  Timestamp now = clock_.now_ms();
  bool found = false;
  if (current_user_ && current_user_->id == user_id) {
    current_user_->status = status;
    current_user_->last_seen = now;
    found = true;
  }
  if (session_) {
    if (Participant *p = session_->find_participant(user_id)) {
      p->status = status;
      p->last_seen = now;
      found = true;
    }
  }
  return found;
}

void SessionRegistry::touch_participant(const std::string &user_id, Timestamp at) {
  if (!session_) {
    return;
  }
  if (Participant *p = session_->find_participant(user_id)) {
    p->last_seen = std::max(p->last_seen, at);
  }
}

void SessionRegistry::adopt_session(const SessionSync &sync) {
  switch (sync.action) {
  case SessionSyncAction::Create:
  case SessionSyncAction::Update:
    if (!sync.session) {
      log_warn("session sync without session metadata ignored");
      return;
    }
    if (session_ && session_->id != sync.session->id) {
      log_debug("session sync for " + sync.session->id + " ignored; current session is " + session_->id);
      return;
    }
    session_ = *sync.session;
    if (current_user_ && !session_->find_participant(current_user_->id)) {
      session_->participants.push_back(*current_user_);
    }
    return;
  case SessionSyncAction::Delete:
    if (session_ && (!sync.session || sync.session->id == session_->id)) {
      log_info("session " + session_->id + " deleted remotely");
      session_.reset();
      if (current_user_) {
        current_user_->current_session.reset();
      }
    }
    return;
  }
}

bool SessionRegistry::expire_if_due() {
  if (!session_ || !session_->expires_at || clock_.now_ms() < *session_->expires_at) {
    return false;
  }
  log_info("session " + session_->id + " expired");
  session_.reset();
  if (current_user_) {
    current_user_->current_session.reset();
  }
  return true;
}

std::optional<std::string> SessionRegistry::session_id() const {
  if (!session_) {
    return std::nullopt;
  }
  return session_->id;
}

bool SessionRegistry::is_owner(const std::string &user_id) const {
  return session_ && !user_id.empty() && session_->owner_id == user_id;
}

bool SessionRegistry::is_owner() const { return current_user_ && is_owner(current_user_->id); }

bool SessionRegistry::can_edit(const std::string &user_id) const {
  if (is_owner(user_id)) {
    return true;
  }
  const Participant *p = find_participant(user_id);
  return p && (p->role == Role::Owner || p->role == Role::Editor);
}

bool SessionRegistry::can_edit() const { return current_user_ && can_edit(current_user_->id); }

bool SessionRegistry::can_message(const std::string &user_id) const {
  return session_ && (is_owner(user_id) || session_->permissions.allow_messaging);
}

const Participant *SessionRegistry::find_participant(const std::string &user_id) const {
  return session_ ? session_->find_participant(user_id) : nullptr;
}

std::vector<Participant> SessionRegistry::participants() const {
  return session_ ? session_->participants : std::vector<Participant>{};
}

Session &SessionRegistry::require_session() {
  if (!session_) {
    throw StateError("no active session");
  }
  return *session_;
}

void SessionRegistry::require_owner(const char *action) const {
  if (!is_owner()) {
    std::string who = current_user_ ? current_user_->id : std::string("anonymous");
    throw PermissionError("only the session owner may " + std::string(action) + " (" + who + ")");
  }
}

void SessionRegistry::touch() {
  if (session_) {
    session_->updated_at = clock_.now_ms();
  }
}

} // namespace collab
