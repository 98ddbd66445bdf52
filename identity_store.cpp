// identity_store.cpp
#include "identity_store.hpp"

#include "collab_errors.hpp"
#include "collab_log.hpp"

namespace collab {

namespace {

constexpr const char *kSyncEnabled = "sync_enabled";
constexpr const char *kAutoReconnect = "auto_reconnect";
constexpr const char *kLastEndpoint = "last_endpoint";
constexpr const char *kLastSessionId = "last_session_id";

std::optional<std::string> column_text(sqlite3_stmt *stmt, int col) {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return std::string(reinterpret_cast<const char *>(sqlite3_column_text(stmt, col)));
}

void bind_text(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value) {
  if (value) {
    sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

} // namespace

IdentityStore::IdentityStore(const std::string &path) : db_(nullptr) {
  int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string error = "failed to open database: " + std::string(db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError(error);
  }

  try {
    exec_or_throw("PRAGMA journal_mode=WAL");
    create_schema();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

IdentityStore::~IdentityStore() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void IdentityStore::create_schema() {
  // Single-row table: slot is always 1
  exec_or_throw(R"(
    CREATE TABLE IF NOT EXISTS current_user (
      slot INTEGER PRIMARY KEY CHECK (slot = 1),
      id TEXT NOT NULL,
      name TEXT NOT NULL,
      email TEXT NOT NULL,
      avatar TEXT,
      role TEXT NOT NULL,
      status TEXT NOT NULL,
      last_seen INTEGER NOT NULL
    )
  )");

  exec_or_throw(R"(
    CREATE TABLE IF NOT EXISTS preferences (
      key TEXT PRIMARY KEY,
      value TEXT
    )
  )");
}

void IdentityStore::save_user(const Participant &user) {
  Statement stmt = prepare("INSERT OR REPLACE INTO current_user "
                           "(slot, id, name, email, avatar, role, status, last_seen) "
                           "VALUES (1, ?, ?, ?, ?, ?, ?, ?)");
  sqlite3_bind_text(stmt.get(), 1, user.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, user.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, user.email.c_str(), -1, SQLITE_TRANSIENT);
  bind_text(stmt.get(), 4, user.avatar);
  sqlite3_bind_text(stmt.get(), 5, to_string(user.role), -1, SQLITE_STATIC);
  sqlite3_bind_text(stmt.get(), 6, to_string(user.status), -1, SQLITE_STATIC);
  sqlite3_bind_int64(stmt.get(), 7, user.last_seen);
  step_done(stmt, "save user");
}

std::optional<Participant> IdentityStore::load_user() const {
  Statement stmt = prepare("SELECT id, name, email, avatar, role, status, last_seen FROM current_user WHERE slot = 1");
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    throw StorageError("failed to load user: " + get_error());
  }

  Participant user;
  user.id = column_text(stmt.get(), 0).value_or("");
  user.name = column_text(stmt.get(), 1).value_or("");
  user.email = column_text(stmt.get(), 2).value_or("");
  user.avatar = column_text(stmt.get(), 3);

  std::string role = column_text(stmt.get(), 4).value_or("");
  std::string status = column_text(stmt.get(), 5).value_or("");
  auto parsed_role = role_from_string(role);
  auto parsed_status = presence_status_from_string(status);
  if (!parsed_role || !parsed_status) {
    throw StorageError("stored user has invalid role '" + role + "' or status '" + status + "'");
  }
  user.role = *parsed_role;
  user.status = *parsed_status;
  user.last_seen = sqlite3_column_int64(stmt.get(), 6);
  return user;
}

void IdentityStore::clear_user() { exec_or_throw("DELETE FROM current_user"); }

void IdentityStore::save_preferences(const EnginePreferences &preferences) {
  exec_or_throw("BEGIN");
  try {
    put_preference(kSyncEnabled, std::string(preferences.sync_enabled ? "1" : "0"));
    put_preference(kAutoReconnect, std::string(preferences.auto_reconnect ? "1" : "0"));
    put_preference(kLastEndpoint, preferences.last_endpoint);
    put_preference(kLastSessionId, preferences.last_session_id);
    exec_or_throw("COMMIT");
  } catch (const StorageError &) {
    if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
      log_warn("identity store: rollback failed: " + get_error());
    }
    throw;
  }
}

EnginePreferences IdentityStore::load_preferences() const {
  EnginePreferences preferences;
  if (auto v = get_preference(kSyncEnabled)) {
    preferences.sync_enabled = *v == "1";
  }
  if (auto v = get_preference(kAutoReconnect)) {
    preferences.auto_reconnect = *v == "1";
  }
  preferences.last_endpoint = get_preference(kLastEndpoint);
  preferences.last_session_id = get_preference(kLastSessionId);
  return preferences;
}

void IdentityStore::put_preference(const char *key, const std::optional<std::string> &value) {
  Statement stmt = prepare("INSERT OR REPLACE INTO preferences (key, value) VALUES (?, ?)");
  sqlite3_bind_text(stmt.get(), 1, key, -1, SQLITE_STATIC);
  bind_text(stmt.get(), 2, value);
  step_done(stmt, "save preference");
}

std::optional<std::string> IdentityStore::get_preference(const char *key) const {
  Statement stmt = prepare("SELECT value FROM preferences WHERE key = ?");
  sqlite3_bind_text(stmt.get(), 1, key, -1, SQLITE_STATIC);
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    throw StorageError(std::string("failed to read preference ") + key + ": " + get_error());
  }
  return column_text(stmt.get(), 0);
}

void IdentityStore::exec_or_throw(const char *sql) {
  char *err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = "SQL execution failed: ";
    if (err_msg) {
      error += err_msg;
      sqlite3_free(err_msg);
    }
    throw StorageError(error);
  }
}

IdentityStore::Statement IdentityStore::prepare(const char *sql) const {
  sqlite3_stmt *stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw StorageError("failed to prepare statement: " + get_error());
  }
  return Statement(stmt);
}

void IdentityStore::step_done(Statement &stmt, const char *what) {
  int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    throw StorageError(std::string("failed to ") + what + ": " + get_error());
  }
}

std::string IdentityStore::get_error() const { return sqlite3_errmsg(db_); }

} // namespace collab
