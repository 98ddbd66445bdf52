// connection_manager.hpp
#ifndef COLLAB_CONNECTION_MANAGER_HPP
#define COLLAB_CONNECTION_MANAGER_HPP

#include "collab_types.hpp"
#include "scheduler.hpp"
#include "transport.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace collab {

struct ConnectionConfig {
  bool auto_reconnect = true;
  uint32_t max_reconnect_attempts = 5;
  uint64_t heartbeat_interval_ms = 30000;
  uint64_t base_backoff_ms = 1000;
  uint64_t max_backoff_ms = 30000;
};

/// Owns the transport lifecycle: connect, heartbeat and reconnection with
/// exponential backoff.
///
/// State machine:
///   disconnected -> connecting -> connected
///   connected --close--> disconnected [--backoff--> reconnecting -> connecting]
///   any --transport error--> error (left only by connect() / reconnect())
///
/// Every transition is reported once through the status listener.
class ConnectionManager {
public:
  using StatusListener = std::function<void(ConnectionStatus previous, ConnectionStatus current)>;
  using MessageSink = std::function<void(const std::string &payload)>;
  using ErrorListener = std::function<void(const std::string &error)>;

  ConnectionManager(Transport &transport, Scheduler &scheduler, ConnectionConfig config = {});
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager &) = delete;
  ConnectionManager &operator=(const ConnectionManager &) = delete;

  /// Opens the transport. No-op while connected or connecting.
  void connect(const std::string &endpoint);

  /// Closes the transport and cancels heartbeat and reconnect timers.
  void disconnect();

  /// Bumps the attempt counter and connects again to the last endpoint.
  void reconnect();

  /// Writes a payload. Returns false (caller queues) when not connected or
  /// when the write fails; a failed write is treated as a lost connection.
  bool send(const std::string &payload);

  bool is_connected() const { return state_.status == ConnectionStatus::Connected; }
  const ConnectionState &state() const { return state_; }
  const std::string &endpoint() const { return endpoint_; }
  const ConnectionConfig &config() const { return config_; }

  /// min(base * 2^attempt, max).
  uint64_t backoff_delay_ms(uint32_t attempt) const;

  /// Records an inbound HEARTBEAT.
  void record_heartbeat(Timestamp at);

  void set_auto_reconnect(bool enabled) { config_.auto_reconnect = enabled; }

  void set_status_listener(StatusListener listener) { status_listener_ = std::move(listener); }
  void set_message_sink(MessageSink sink) { message_sink_ = std::move(sink); }
  void set_error_listener(ErrorListener listener) { error_listener_ = std::move(listener); }

  bool heartbeat_active() const { return heartbeat_timer_.active(); }
  bool reconnect_pending() const { return reconnect_timer_.active(); }

private:
  void handle_open();
  void handle_close(const std::string &reason);
  void handle_error(const std::string &error);
  void handle_message(const std::string &payload);

  void set_status(ConnectionStatus status);
  void open_transport();
  void start_heartbeat();
  void send_heartbeat();
  void schedule_reconnect();
  void lose_connection(const std::string &reason);

  Transport &transport_;
  Scheduler &scheduler_;
  ConnectionConfig config_;
  ConnectionState state_;
  std::string endpoint_;
  bool closing_ = false; // close requested through disconnect()

  TimerHandle heartbeat_timer_;
  TimerHandle reconnect_timer_;

  StatusListener status_listener_;
  MessageSink message_sink_;
  ErrorListener error_listener_;
};

} // namespace collab

#endif // COLLAB_CONNECTION_MANAGER_HPP
