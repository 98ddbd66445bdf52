// transport.hpp
#ifndef COLLAB_TRANSPORT_HPP
#define COLLAB_TRANSPORT_HPP

#include <functional>
#include <string>

namespace collab {

/// Message-oriented duplex link to the relay (typically a WebSocket).
///
/// The engine never owns the socket implementation; a host application
/// adapts its networking library to this interface. Handlers must be invoked
/// on the thread that drives the engine, one at a time, in arrival order.
///
/// Error Handling:
/// - open() may throw TransportError for failures detected synchronously;
///   asynchronous failures are reported through on_error
/// - send() throws TransportError when the payload cannot be written
class Transport {
public:
  struct Handlers {
    std::function<void()> on_open;
    std::function<void(const std::string &reason)> on_close;
    std::function<void(const std::string &error)> on_error;
    std::function<void(const std::string &payload)> on_message;
  };

  virtual ~Transport() = default;

  /// Installs the callbacks. Passing empty Handlers detaches the previous owner.
  virtual void set_handlers(Handlers handlers) = 0;

  /// Starts connecting to `endpoint`. on_open fires once the link is usable.
  virtual void open(const std::string &endpoint) = 0;

  virtual void send(const std::string &payload) = 0;

  /// Closes the link. on_close may or may not fire afterwards.
  virtual void close() = 0;

  virtual bool is_open() const = 0;
};

} // namespace collab

#endif // COLLAB_TRANSPORT_HPP
