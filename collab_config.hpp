// collab_config.hpp
#ifndef COLLAB_CONFIG_HPP
#define COLLAB_CONFIG_HPP

#include "connection_manager.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace collab {

/// Tunables of one SyncEngine.
struct EngineConfig {
  // Connection
  uint32_t max_reconnect_attempts = 5;
  uint64_t heartbeat_interval_ms = 30000;
  uint64_t base_backoff_ms = 1000;
  uint64_t max_backoff_ms = 30000;
  bool auto_reconnect = true;

  // Sync
  bool sync_enabled = true;
  std::size_t operation_batch_size = 10;
  uint32_t sync_delay_ms = 500; // default SessionSettings::sync_delay_ms for created sessions
  std::size_t history_limit = 1000;

  // Presence
  uint64_t presence_debounce_ms = 100;
  uint64_t presence_stale_after_ms = 60000;

  // Notifications
  uint64_t notification_ttl_ms = 5000;

  std::string share_base_url = "https://collab.local/session";

  ConnectionConfig connection() const;
};

/// Reads an EngineConfig from a JSON object. Missing keys keep their default,
/// unknown keys are ignored. Keys use the wire casing ("maxReconnectAttempts").
///
/// @throws CollabException naming the key whose value has the wrong type
EngineConfig config_from_json(const nlohmann::json &j);

/// Loads a JSON config file.
///
/// @throws CollabException if the file cannot be read or parsed
EngineConfig load_config_file(const std::string &path);

nlohmann::json config_to_json(const EngineConfig &config);

} // namespace collab

#endif // COLLAB_CONFIG_HPP
