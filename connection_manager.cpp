// connection_manager.cpp
#include "connection_manager.hpp"

#include "collab_errors.hpp"
#include "collab_log.hpp"
#include "wire_protocol.hpp"

#include <algorithm>

namespace collab {

ConnectionManager::ConnectionManager(Transport &transport, Scheduler &scheduler, ConnectionConfig config)
    : transport_(transport), scheduler_(scheduler), config_(config) {
  Transport::Handlers handlers;
  handlers.on_open = [this]() { handle_open(); };
  handlers.on_close = [this](const std::string &reason) { handle_close(reason); };
  handlers.on_error = [this](const std::string &error) { handle_error(error); };
  handlers.on_message = [this](const std::string &payload) { handle_message(payload); };
  transport_.set_handlers(std::move(handlers));
}

ConnectionManager::~ConnectionManager() {
  heartbeat_timer_.cancel();
  reconnect_timer_.cancel();
  transport_.set_handlers({});
}

void ConnectionManager::connect(const std::string &endpoint) {
  if (state_.status == ConnectionStatus::Connected || state_.status == ConnectionStatus::Connecting) {
    log_debug("connect ignored: already " + std::string(to_string(state_.status)));
    return;
  }

  endpoint_ = endpoint;
  reconnect_timer_.cancel();
  set_status(ConnectionStatus::Connecting);
  open_transport();
}

void ConnectionManager::disconnect() {
  heartbeat_timer_.cancel();
  reconnect_timer_.cancel();

  closing_ = true;
  transport_.close();
  set_status(ConnectionStatus::Disconnected);
}

void ConnectionManager::reconnect() {
  if (state_.status == ConnectionStatus::Connected || state_.status == ConnectionStatus::Connecting) {
    return;
  }
  if (endpoint_.empty()) {
    throw StateError("reconnect requested before any connect");
  }

  reconnect_timer_.cancel();
  ++state_.reconnect_attempts;
  log_info("reconnecting to " + endpoint_ + " (attempt " + std::to_string(state_.reconnect_attempts) + ")");

  set_status(ConnectionStatus::Reconnecting);
  set_status(ConnectionStatus::Connecting);
  open_transport();
}

bool ConnectionManager::send(const std::string &payload) {
  if (!is_connected()) {
    return false;
  }

  try {
    transport_.send(payload);
  } catch (const TransportError &e) {
    log_warn(e.what());
    lose_connection(e.what());
    return false;
  }
  return true;
}

uint64_t ConnectionManager::backoff_delay_ms(uint32_t attempt) const {
  uint64_t delay = config_.base_backoff_ms;
  for (uint32_t i = 0; i < attempt && delay < config_.max_backoff_ms; ++i) {
    delay *= 2;
  }
  return std::min(delay, config_.max_backoff_ms);
}

void ConnectionManager::record_heartbeat(Timestamp at) { state_.last_heartbeat = at; }

void ConnectionManager::handle_open() {
  closing_ = false;
  state_.reconnect_attempts = 0;
  set_status(ConnectionStatus::Connected);
  start_heartbeat();
}

void ConnectionManager::handle_close(const std::string &reason) {
  heartbeat_timer_.cancel();

  if (closing_) {
    closing_ = false;
    return;
  }
  if (state_.status == ConnectionStatus::Error || state_.status == ConnectionStatus::Disconnected) {
    return;
  }

  log_info("connection closed: " + reason);
  set_status(ConnectionStatus::Disconnected);
  schedule_reconnect();
}

void ConnectionManager::handle_error(const std::string &error) {
  log_error("transport error: " + error);
  heartbeat_timer_.cancel();
  reconnect_timer_.cancel();
  set_status(ConnectionStatus::Error);
  if (error_listener_) {
    error_listener_(error);
  }
}

void ConnectionManager::handle_message(const std::string &payload) {
  if (message_sink_) {
    message_sink_(payload);
  }
}

void ConnectionManager::set_status(ConnectionStatus status) {
  if (state_.status == status) {
    return;
  }
  ConnectionStatus previous = state_.status;
  state_.status = status;
  log_debug(std::string("connection ") + to_string(previous) + " -> " + to_string(status));
  if (status_listener_) {
    status_listener_(previous, status);
  }
}

void ConnectionManager::open_transport() {
  closing_ = false;
  try {
    transport_.open(endpoint_);
  } catch (const TransportError &e) {
    handle_error(e.what());
  }
}

void ConnectionManager::start_heartbeat() {
  heartbeat_timer_.cancel();
  if (config_.heartbeat_interval_ms == 0) {
    return;
  }
  heartbeat_timer_ = scheduler_.schedule_every(config_.heartbeat_interval_ms, [this]() { send_heartbeat(); });
}

void ConnectionManager::send_heartbeat() {
  if (!is_connected() || !transport_.is_open()) {
    heartbeat_timer_.cancel();
    return;
  }
  if (!send(encode_message(HeartbeatMessage{scheduler_.clock().now_ms()}))) {
    log_debug("heartbeat not delivered");
  }
}

void ConnectionManager::schedule_reconnect() {
  if (!config_.auto_reconnect) {
    return;
  }
  if (state_.reconnect_attempts >= config_.max_reconnect_attempts) {
    log_warn("giving up after " + std::to_string(state_.reconnect_attempts) + " reconnect attempts");
    return;
  }

  uint64_t delay = backoff_delay_ms(state_.reconnect_attempts);
  log_info("reconnecting in " + std::to_string(delay) + " ms");
  reconnect_timer_ = scheduler_.schedule_after(delay, [this]() { reconnect(); });
}

void ConnectionManager::lose_connection(const std::string &reason) {
  heartbeat_timer_.cancel();
  log_info("connection lost: " + reason);

  set_status(ConnectionStatus::Disconnected);
  closing_ = true;
  transport_.close();
  schedule_reconnect();
}

} // namespace collab
