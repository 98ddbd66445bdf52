// collab_config.cpp
#include "collab_config.hpp"

#include "collab_errors.hpp"

#include <fstream>

using json = nlohmann::json;

namespace collab {

namespace {

template <typename T> void read_key(const json &j, const char *key, T &out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const json::exception &e) {
    throw CollabException(std::string("config key '") + key + "': " + e.what());
  }
}

} // namespace

ConnectionConfig EngineConfig::connection() const {
  ConnectionConfig c;
  c.auto_reconnect = auto_reconnect;
  c.max_reconnect_attempts = max_reconnect_attempts;
  c.heartbeat_interval_ms = heartbeat_interval_ms;
  c.base_backoff_ms = base_backoff_ms;
  c.max_backoff_ms = max_backoff_ms;
  return c;
}

EngineConfig config_from_json(const json &j) {
  if (!j.is_object()) {
    throw CollabException("config must be a JSON object");
  }

  EngineConfig config;
  read_key(j, "maxReconnectAttempts", config.max_reconnect_attempts);
  read_key(j, "heartbeatInterval", config.heartbeat_interval_ms);
  read_key(j, "baseBackoff", config.base_backoff_ms);
  read_key(j, "maxBackoff", config.max_backoff_ms);
  read_key(j, "autoReconnect", config.auto_reconnect);
  read_key(j, "syncEnabled", config.sync_enabled);
  read_key(j, "operationBatchSize", config.operation_batch_size);
  read_key(j, "syncDelay", config.sync_delay_ms);
  read_key(j, "historyLimit", config.history_limit);
  read_key(j, "presenceDebounce", config.presence_debounce_ms);
  read_key(j, "presenceStaleAfter", config.presence_stale_after_ms);
  read_key(j, "notificationTtl", config.notification_ttl_ms);
  read_key(j, "shareBaseUrl", config.share_base_url);

  if (config.operation_batch_size == 0) {
    throw CollabException("config key 'operationBatchSize': must be at least 1");
  }
  return config;
}

EngineConfig load_config_file(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw CollabException("cannot open config file " + path);
  }

  json j;
  try {
    j = json::parse(in);
  } catch (const json::parse_error &e) {
    throw CollabException("config file " + path + ": " + e.what());
  }
  return config_from_json(j);
}

json config_to_json(const EngineConfig &config) {
  return json{{"maxReconnectAttempts", config.max_reconnect_attempts},
              {"heartbeatInterval", config.heartbeat_interval_ms},
              {"baseBackoff", config.base_backoff_ms},
              {"maxBackoff", config.max_backoff_ms},
              {"autoReconnect", config.auto_reconnect},
              {"syncEnabled", config.sync_enabled},
              {"operationBatchSize", config.operation_batch_size},
              {"syncDelay", config.sync_delay_ms},
              {"historyLimit", config.history_limit},
              {"presenceDebounce", config.presence_debounce_ms},
              {"presenceStaleAfter", config.presence_stale_after_ms},
              {"notificationTtl", config.notification_ttl_ms},
              {"shareBaseUrl", config.share_base_url}};
}

} // namespace collab
