// Example: driving a SyncEngine over an in-process loopback relay
#include "collab_config.hpp"
#include "collab_errors.hpp"
#include "collab_log.hpp"
#include "sync_engine.hpp"

#include <deque>
#include <iostream>
#include <string>

using namespace collab;

// Stands in for a WebSocket to the relay: stamps event versions and echoes
// everything back, the way the relay echoes to the sender.
class LoopbackTransport : public Transport {
public:
  void set_handlers(Handlers handlers) override { handlers_ = std::move(handlers); }

  void open(const std::string &endpoint) override {
    std::cout << "Opening " << endpoint << std::endl;
    open_ = true;
    if (handlers_.on_open) {
      handlers_.on_open();
    }
  }

  void send(const std::string &payload) override {
    if (!open_) {
      throw TransportError("loopback is closed");
    }
    outbox_.push_back(payload);
  }

  void close() override {
    open_ = false;
    if (handlers_.on_close) {
      handlers_.on_close("closed by client");
    }
  }

  bool is_open() const override { return open_; }

  // Delivers everything queued so far
  void pump() {
    while (!outbox_.empty() && open_) {
      WireMessage message = decode_message(outbox_.front());
      outbox_.pop_front();

      if (auto *m = std::get_if<EventMessage>(&message)) {
        m->event.version = ++version_;
        deliver(*m);
      } else if (auto *m = std::get_if<SyncRequestMessage>(&message)) {
        deliver(SyncResponseMessage{m->session_id, {}, version_});
      } else if (std::holds_alternative<OperationMessage>(message) ||
                 std::holds_alternative<HeartbeatMessage>(message)) {
        deliver(message);
      }
    }
  }

private:
  void deliver(const WireMessage &message) {
    if (handlers_.on_message) {
      handlers_.on_message(encode_message(message));
    }
  }

  Handlers handlers_;
  std::deque<std::string> outbox_;
  Version version_ = 0;
  bool open_ = false;
};

int main(int argc, char **argv) {
  EngineConfig config;
  if (argc > 1) {
    try {
      config = load_config_file(argv[1]);
    } catch (const CollabException &e) {
      std::cerr << e.what() << std::endl;
      return 1;
    }
  }
  set_log_level(LogLevel::Info);

  ManualClock clock(1700000000000);
  Scheduler scheduler(clock);
  LoopbackTransport transport;
  IdentityStore store(":memory:");
  SyncEngine engine(transport, scheduler, config, &store);

  engine.set_notification_listener([](const Notification &n) {
    std::cout << "[" << to_string(n.type) << "] " << n.title << ": " << n.message << std::endl;
  });
  engine.set_document_listener([](const std::string &text) { std::cout << "Document: \"" << text << "\"" << std::endl; });

  Participant me;
  me.id = "user_alice";
  me.name = "Alice";
  me.email = "alice@example.com";
  engine.set_current_user(me);
  engine.connect("wss://relay.example/collab");

  const Session &session = engine.create_session("Design review");
  std::cout << "Created session " << session.id << std::endl;
  transport.pump();

  engine.send_operation(OperationDraft{OperationType::Insert, 0, std::string("Hello"), std::nullopt, {}});
  engine.send_operation(OperationDraft{OperationType::Insert, 5, std::string(", world"), std::nullopt, {}});
  engine.send_event(EventDraft{MessageSent{"msg_1", "First draft is in"}, std::nullopt});
  transport.pump();

  std::cout << "Share URL: " << engine.share_session(ShareOptions{}) << std::endl;
  transport.pump();

  std::cout << "Confirmed text: \"" << engine.document().confirmed_text() << "\"" << std::endl;
  std::cout << "Base version: " << engine.base_version() << std::endl;
  std::cout << "Pending events: " << engine.events().pending_count() << std::endl;

  engine.disconnect();
  return 0;
}
