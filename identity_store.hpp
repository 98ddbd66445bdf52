// identity_store.hpp
#ifndef COLLAB_IDENTITY_STORE_HPP
#define COLLAB_IDENTITY_STORE_HPP

#include "collab_types.hpp"

#include <optional>
#include <sqlite3.h>
#include <string>

namespace collab {

/// Engine preferences that survive restarts.
struct EnginePreferences {
  bool sync_enabled = true;
  bool auto_reconnect = true;
  std::optional<std::string> last_endpoint;
  std::optional<std::string> last_session_id;

  bool operator==(const EnginePreferences &) const = default;
};

/// SQLite-backed storage for the current user identity and engine preferences.
///
/// Pass ":memory:" for a throwaway database.
///
/// ⚠️  Not thread-safe: one store per engine, used from the engine's thread.
///
/// Error Handling:
/// Every SQLite failure (open, schema creation, read, write) raises StorageError.
class IdentityStore {
public:
  explicit IdentityStore(const std::string &path);
  ~IdentityStore();

  IdentityStore(const IdentityStore &) = delete;
  IdentityStore &operator=(const IdentityStore &) = delete;

  /// Replaces the stored current user. Typing flag, cursor and session are not persisted.
  void save_user(const Participant &user);
  std::optional<Participant> load_user() const;
  void clear_user();

  void save_preferences(const EnginePreferences &preferences);

  /// Stored preferences, defaults for anything never saved.
  EnginePreferences load_preferences() const;

  sqlite3 *get_db() const { return db_; }

private:
  /// RAII wrapper for sqlite3_stmt*; finalizes on destruction.
  class Statement {
  public:
    explicit Statement(sqlite3_stmt *stmt) : stmt_(stmt) {}
    ~Statement() {
      if (stmt_)
        sqlite3_finalize(stmt_);
    }
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;
    Statement(Statement &&other) noexcept : stmt_(other.stmt_) { other.stmt_ = nullptr; }
    sqlite3_stmt *get() const { return stmt_; }

  private:
    sqlite3_stmt *stmt_;
  };

  void create_schema();
  void exec_or_throw(const char *sql);
  Statement prepare(const char *sql) const;
  void step_done(Statement &stmt, const char *what);
  void put_preference(const char *key, const std::optional<std::string> &value);
  std::optional<std::string> get_preference(const char *key) const;
  std::string get_error() const;

  sqlite3 *db_;
};

} // namespace collab

#endif // COLLAB_IDENTITY_STORE_HPP
