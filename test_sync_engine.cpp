// test_sync_engine.cpp
// End-to-end behaviour of SyncEngine against an in-memory relay.

#include "sync_engine.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <vector>

using namespace collab;

namespace {

const std::string kEndpoint = "wss://relay.test/collab";

Participant person(const std::string &id, Role role = Role::Viewer) {
  Participant p;
  p.id = id;
  p.name = id;
  p.email = id + "@example.com";
  p.role = role;
  return p;
}

struct Client {
  FakeTransport transport;
  SyncEngine engine;

  Client(Scheduler &scheduler, FakeRelay &relay, const std::string &user_id, EngineConfig config = {},
         IdentityStore *store = nullptr)
      : engine(transport, scheduler, std::move(config), store) {
    relay.attach(transport);
    engine.set_current_user(person(user_id));
  }
};

std::size_t count_notifications(const SyncEngine &engine, NotificationType type) {
  std::size_t n = 0;
  for (const auto &notification : engine.notifications().active()) {
    if (notification.type == type) {
      ++n;
    }
  }
  return n;
}

Event injected(const std::string &session_id, const std::string &id, Version version, EventPayload payload,
               const std::string &author = "bob") {
  Event e;
  e.id = id;
  e.session_id = session_id;
  e.author_id = author;
  e.version = version;
  e.payload = std::move(payload);
  return e;
}

/// Alice owns a session that bob has joined; both are connected and caught up.
struct TwoClients {
  ManualClock clock{1000000};
  Scheduler scheduler{clock};
  FakeRelay relay;
  Client alice{scheduler, relay, "alice"};
  Client bob{scheduler, relay, "bob"};
  std::string session_id;

  explicit TwoClients(Role bob_role = Role::Editor) {
    alice.engine.connect(kEndpoint);
    bob.engine.connect(kEndpoint);

    session_id = alice.engine.create_session("Design doc").id;
    relay.route_all();

    bob.engine.join_session(session_id, person("bob", bob_role));
    relay.route_all();
  }

  void insert(Client &client, std::size_t pos, const std::string &text) {
    OperationDraft draft;
    draft.type = OperationType::Insert;
    draft.position = pos;
    draft.content = text;
    client.engine.send_operation(draft);
  }
};

} // namespace

TEST(create_and_join_session) {
  TwoClients t;

  ASSERT_EQ(t.alice.engine.base_version(), 2u);
  ASSERT_EQ(t.bob.engine.base_version(), 2u);
  ASSERT_TRUE(t.alice.engine.is_session_owner());
  ASSERT_FALSE(t.bob.engine.is_session_owner());
  ASSERT_TRUE(t.bob.engine.can_user_edit());

  // Bob adopted the session metadata replayed from the relay
  const Session *seen_by_bob = t.bob.engine.sessions().session();
  ASSERT_TRUE(seen_by_bob != nullptr);
  ASSERT_EQ(seen_by_bob->name, "Design doc");
  ASSERT_EQ(seen_by_bob->owner_id, "alice");

  auto alice_view = t.alice.engine.participants();
  ASSERT_EQ(alice_view.size(), 2u);
  ASSERT_EQ(alice_view[0].id, "alice");
  ASSERT_EQ(alice_view[1].id, "bob");
  ASSERT_TRUE(alice_view[1].role == Role::Editor);
  ASSERT_TRUE(alice_view[1].status == PresenceStatus::Online);
  ASSERT_EQ(t.bob.engine.participants().size(), 2u);

  ASSERT_EQ(count_notifications(t.alice.engine, NotificationType::UserJoined), 1u);
  // Bob only sees his own "Session joined"
  ASSERT_EQ(count_notifications(t.bob.engine, NotificationType::UserJoined), 1u);
  ASSERT_EQ(t.alice.engine.events().pending_count(), 0u);
}

TEST(join_and_leave_need_a_connection) {
  ManualClock clock;
  Scheduler scheduler(clock);
  FakeRelay relay;
  Client carol(scheduler, relay, "carol");

  ASSERT_THROWS(carol.engine.join_session("session_x", person("carol")), StateError);
  ASSERT_THROWS(carol.engine.leave_session(), StateError);
  ASSERT_THROWS(carol.engine.send_event(EventDraft{TypingStart{}, std::nullopt}), StateError);
}

TEST(concurrent_inserts_converge_in_either_order) {
  for (bool alice_first : {true, false}) {
    TwoClients t;
    t.insert(t.alice, 0, "x");
    t.insert(t.bob, 0, "y");
    ASSERT_EQ(t.relay.queued(), 2u);

    if (alice_first) {
      t.relay.route_next(&t.alice.transport);
      t.relay.route_next(&t.bob.transport);
    } else {
      t.relay.route_next(&t.bob.transport);
      t.relay.route_next(&t.alice.transport);
    }

    const std::string expected = alice_first ? "xy" : "yx";
    ASSERT_EQ(t.alice.engine.document().confirmed_text(), expected);
    ASSERT_EQ(t.bob.engine.document().confirmed_text(), expected);
    ASSERT_EQ(t.alice.engine.document().pending_count(), 0u);
    ASSERT_EQ(t.bob.engine.document().pending_count(), 0u);
  }
}

TEST(typing_burst_is_composed_and_converges) {
  TwoClients t;
  std::vector<std::string> seen;
  t.bob.engine.set_document_listener([&](const std::string &text) { seen.push_back(text); });

  t.insert(t.alice, 0, "hello");
  t.relay.route_all();
  t.insert(t.alice, 5, " world");
  OperationDraft del;
  del.type = OperationType::Delete;
  del.position = 0;
  del.length = 1;
  t.bob.engine.send_operation(del);
  t.relay.route_all();

  ASSERT_EQ(t.alice.engine.document().confirmed_text(), t.bob.engine.document().confirmed_text());
  ASSERT_EQ(t.bob.engine.document().confirmed_text(), "ello world");
  ASSERT_FALSE(seen.empty());
  ASSERT_EQ(seen.back(), "ello world");
}

TEST(viewer_cannot_edit_until_promoted) {
  TwoClients t(Role::Viewer);
  OperationDraft draft;
  draft.type = OperationType::Insert;
  draft.content = std::string("nope");
  ASSERT_THROWS(t.bob.engine.send_operation(draft), PermissionError);
  ASSERT_THROWS(t.bob.engine.change_role("bob", Role::Editor), PermissionError);

  t.alice.engine.change_role("bob", Role::Editor);
  t.relay.route_all();
  ASSERT_TRUE(t.bob.engine.can_user_edit());
  t.bob.engine.send_operation(draft);
  t.relay.route_all();
  ASSERT_EQ(t.alice.engine.document().confirmed_text(), "nope");
}

TEST(user_left_notifies_exactly_once) {
  TwoClients t;
  t.bob.engine.leave_session();
  ASSERT_FALSE(t.bob.engine.sessions().has_session());
  t.relay.route_all();

  auto participants = t.alice.engine.participants();
  ASSERT_EQ(participants.size(), 1u);
  ASSERT_EQ(participants[0].id, "alice");
  ASSERT_EQ(count_notifications(t.alice.engine, NotificationType::UserLeft), 1u);

  // Redelivery of the same event changes nothing
  t.alice.transport.receive(WireMessage{EventMessage{t.relay.log().back()}});
  ASSERT_EQ(count_notifications(t.alice.engine, NotificationType::UserLeft), 1u);
  ASSERT_EQ(count_notifications(t.bob.engine, NotificationType::UserLeft), 0u);
}

TEST(events_queued_offline_flush_once_in_order) {
  TwoClients t;
  t.alice.transport.drop();
  ASSERT_FALSE(t.alice.engine.is_connected());
  ASSERT_EQ(count_notifications(t.alice.engine, NotificationType::ConnectionLost), 1u);

  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    ids.push_back(t.alice.engine.send_event(EventDraft{MessageSent{"m" + std::to_string(i), "text"}, std::nullopt}).id);
  }
  ASSERT_EQ(t.alice.engine.events().untransmitted_count(), 3u);
  std::size_t sent_before = t.alice.transport.sent_of<EventMessage>().size();

  t.scheduler.advance(t.clock, 1000);
  ASSERT_TRUE(t.alice.engine.is_connected());
  ASSERT_EQ(count_notifications(t.alice.engine, NotificationType::ConnectionRestored), 1u);

  auto sent = t.alice.transport.sent_of<EventMessage>();
  ASSERT_EQ(sent.size(), sent_before + 3);
  for (std::size_t i = 0; i < 3; ++i) {
    ASSERT_EQ(sent[sent_before + i].event.id, ids[i]);
  }

  t.relay.route_all();
  ASSERT_EQ(t.alice.engine.events().pending_count(), 0u);
  ASSERT_EQ(t.alice.engine.base_version(), 5u);
  ASSERT_EQ(t.bob.engine.base_version(), 5u);

  // Nothing is sent twice
  ASSERT_EQ(t.alice.transport.sent_of<EventMessage>().size(), sent_before + 3);
}

TEST(stale_events_are_rejected) {
  TwoClients t;
  t.alice.transport.receive(WireMessage{EventMessage{injected(t.session_id, "late", 1, TypingStart{})}});
  ASSERT_EQ(t.alice.engine.base_version(), 2u);
  ASSERT_FALSE(t.alice.engine.sessions().find_participant("bob")->is_typing);
  ASSERT_FALSE(t.alice.engine.events().was_processed("late"));

  t.alice.transport.receive(WireMessage{EventMessage{injected(t.session_id, "fresh", 3, TypingStart{})}});
  ASSERT_EQ(t.alice.engine.base_version(), 3u);
  ASSERT_TRUE(t.alice.engine.sessions().find_participant("bob")->is_typing);
}

TEST(concurrent_event_raises_conflict) {
  TwoClients t;
  std::vector<ConflictRecord> seen;
  t.alice.engine.set_conflict_listener([&](const ConflictRecord &c) { seen.push_back(c); });

  t.alice.transport.receive(
      WireMessage{EventMessage{injected(t.session_id, "rival", 2, MessageEdited{"m1", "bob's edit"})}});
  ASSERT_EQ(t.alice.engine.base_version(), 2u);
  ASSERT_EQ(t.alice.engine.conflicts().unresolved().size(), 1u);
  ASSERT_EQ(seen.size(), 1u);
  ASSERT_EQ(seen[0].conflicting_events[0].id, "rival");

  auto active = t.alice.engine.notifications().active();
  std::string notification_id;
  for (const auto &n : active) {
    if (n.type == NotificationType::Conflict) {
      notification_id = n.id;
    }
  }
  ASSERT_FALSE(notification_id.empty());

  ASSERT_TRUE(t.alice.engine.notifications().trigger(notification_id, "Resolve"));
  ASSERT_EQ(t.alice.engine.conflicts().unresolved().size(), 0u);
  ASSERT_EQ(count_notifications(t.alice.engine, NotificationType::Conflict), 0u);
  ASSERT_EQ(seen.size(), 2u);
  ASSERT_EQ(seen[1].resolution->resolved_by, "alice");
}

TEST(relay_conflict_and_error_messages) {
  TwoClients t;
  ConflictRecord c;
  c.id = "conflict_relay";
  c.session_id = t.session_id;
  c.conflicting_events.push_back(injected(t.session_id, "e", 2, TypingStop{}));
  t.alice.transport.receive(WireMessage{ConflictMessage{c}});
  ASSERT_TRUE(t.alice.engine.conflicts().find("conflict_relay") != nullptr);

  ConflictRecord resolved =
      t.alice.engine.resolve_conflict("conflict_relay", std::string("keep alice"));
  ASSERT_EQ(resolved.resolution->payload.value(), "keep alice");
  ASSERT_THROWS(t.alice.engine.resolve_conflict("conflict_relay"), StateError);

  t.alice.transport.receive(WireMessage{ErrorMessage{"quota exceeded", 429}});
  ASSERT_EQ(count_notifications(t.alice.engine, NotificationType::SyncError), 1u);
}

TEST(malformed_messages_do_not_block_later_ones) {
  TwoClients t;
  LogCapture capture(LogLevel::Warn);

  t.alice.transport.receive("{{{ not json");
  t.alice.transport.receive(R"({"type":"EVENT"})");
  t.alice.transport.receive(R"({"type":"WARP","payload":1})");
  ASSERT_TRUE(capture.contains("dropping inbound message"));

  t.alice.transport.receive(WireMessage{EventMessage{injected(t.session_id, "ok", 3, TypingStart{})}});
  ASSERT_EQ(t.alice.engine.base_version(), 3u);
}

TEST(sync_replay_is_idempotent) {
  TwoClients t;
  Version completed = 0;
  ASSERT_TRUE(t.alice.engine.request_sync(Version{0}, [&](Version v) { completed = v; }));
  ASSERT_TRUE(t.alice.engine.request_sync(Version{0}));
  t.relay.route_all();

  ASSERT_EQ(completed, 2u);
  ASSERT_EQ(t.alice.engine.base_version(), 2u);
  ASSERT_EQ(t.alice.engine.participants().size(), 2u);
  ASSERT_EQ(count_notifications(t.alice.engine, NotificationType::UserJoined), 1u);
}

TEST(messaging_can_be_disabled) {
  TwoClients t;
  t.bob.engine.send_event(EventDraft{MessageSent{"m1", "hi"}, std::nullopt});
  t.relay.route_all();

  t.alice.engine.update_session_settings(PermissionOverrides{std::nullopt, std::nullopt, false, std::nullopt}, {});
  t.relay.route_all();
  ASSERT_FALSE(t.bob.engine.sessions().session()->permissions.allow_messaging);

  ASSERT_THROWS(t.bob.engine.send_event(EventDraft{MessageSent{"m2", "hi again"}, std::nullopt}), PermissionError);
  // The owner may still post
  t.alice.engine.send_event(EventDraft{MessageSent{"m3", "announcement"}, std::nullopt});
  t.relay.route_all();
  ASSERT_EQ(t.alice.engine.events().pending_count(), 0u);
}

TEST(presence_reaches_other_participants) {
  TwoClients t;
  PresenceUpdate update;
  update.cursor = Cursor{12.5, 40, std::string("canvas")};
  t.alice.engine.update_presence(update);
  t.alice.engine.update_presence(PresenceUpdate{Cursor{13, 41, std::string("canvas")}, std::nullopt, std::nullopt,
                                                std::nullopt});

  t.scheduler.advance(t.clock, 100);
  ASSERT_EQ(t.alice.transport.sent_of<PresenceUpdateMessage>().size(), 1u);
  t.relay.route_all();

  auto seen = t.bob.engine.presence().find("alice");
  ASSERT_TRUE(seen.has_value());
  ASSERT_EQ(seen->cursor.x, 13.0);
  ASSERT_EQ(t.bob.engine.sessions().find_participant("alice")->cursor->y, 41.0);
  ASSERT_FALSE(t.alice.engine.presence().find("bob").has_value());
}

TEST(typing_status_and_cursor_events) {
  TwoClients t;
  t.bob.engine.set_typing_status(true);
  t.relay.route_all();
  ASSERT_TRUE(t.alice.engine.sessions().find_participant("bob")->is_typing);

  t.bob.engine.set_typing_status(false);
  t.bob.engine.send_event(EventDraft{CursorMove{Cursor{3, 4, std::nullopt}}, std::nullopt});
  t.relay.route_all();
  ASSERT_FALSE(t.alice.engine.sessions().find_participant("bob")->is_typing);
  ASSERT_EQ(t.alice.engine.sessions().find_participant("bob")->cursor->x, 3.0);
}

TEST(delete_session_reaches_participants) {
  TwoClients t;
  ASSERT_THROWS(t.bob.engine.delete_session(), PermissionError);
  t.alice.engine.delete_session();
  ASSERT_FALSE(t.alice.engine.sessions().has_session());
  t.relay.route_all();
  ASSERT_FALSE(t.bob.engine.sessions().has_session());
}

TEST(share_session_publishes_url) {
  TwoClients t;
  ShareOptions options;
  options.settings.max_participants = 5;
  std::string url = t.alice.engine.share_session(options);
  ASSERT_EQ(url, "https://collab.local/session/" + t.session_id);
  t.relay.route_all();
  ASSERT_EQ(t.bob.engine.sessions().session()->share_url.value(), url);
  ASSERT_EQ(t.bob.engine.sessions().session()->settings.max_participants, 5u);
}

TEST(session_expires) {
  ManualClock clock;
  Scheduler scheduler(clock);
  FakeRelay relay;
  Client alice(scheduler, relay, "alice");
  alice.engine.connect(kEndpoint);

  ShareOptions options;
  options.expires_in_hours = 1;
  alice.engine.create_session("Short lived", options);
  relay.route_all();

  scheduler.advance(clock, 3600000 - 1);
  ASSERT_TRUE(alice.engine.sessions().has_session());
  scheduler.advance(clock, 1);
  ASSERT_FALSE(alice.engine.sessions().has_session());
}

TEST(heartbeat_echo_is_recorded) {
  TwoClients t;
  ASSERT_FALSE(t.alice.engine.connection_state().last_heartbeat.has_value());
  t.scheduler.advance(t.clock, 30000);
  t.relay.route_all();
  ASSERT_EQ(t.alice.engine.connection_state().last_heartbeat.value(), t.clock.now_ms());

  t.alice.engine.disconnect();
  std::size_t sent = t.alice.transport.sent.size();
  t.scheduler.advance(t.clock, 90000);
  ASSERT_EQ(t.alice.transport.sent.size(), sent);
}

TEST(status_listener_sees_each_transition) {
  ManualClock clock;
  Scheduler scheduler(clock);
  FakeRelay relay;
  Client alice(scheduler, relay, "alice");
  std::vector<ConnectionStatus> statuses;
  alice.engine.set_status_listener([&](ConnectionStatus, ConnectionStatus current) { statuses.push_back(current); });

  alice.engine.connect(kEndpoint);
  alice.engine.disconnect();
  ASSERT_EQ(statuses.size(), 3u);
  ASSERT_TRUE(statuses[0] == ConnectionStatus::Connecting);
  ASSERT_TRUE(statuses[1] == ConnectionStatus::Connected);
  ASSERT_TRUE(statuses[2] == ConnectionStatus::Disconnected);

  alice.transport.fail_open = true;
  alice.engine.connect(kEndpoint);
  ASSERT_TRUE(statuses.back() == ConnectionStatus::Error);
  ASSERT_EQ(count_notifications(alice.engine, NotificationType::SyncError), 1u);
}

TEST(identity_and_preferences_persist) {
  IdentityStore store(":memory:");
  ManualClock clock;
  Scheduler scheduler(clock);
  FakeRelay relay;
  {
    Client alice(scheduler, relay, "alice", EngineConfig{}, &store);
    alice.engine.connect(kEndpoint);
    alice.engine.set_sync_enabled(false);
  }

  FakeTransport transport;
  SyncEngine restored(transport, scheduler, EngineConfig{}, &store);
  EnginePreferences prefs = restored.restore();
  ASSERT_EQ(restored.current_user()->id, "alice");
  ASSERT_EQ(prefs.last_endpoint.value(), kEndpoint);
  ASSERT_FALSE(prefs.sync_enabled);
  ASSERT_FALSE(restored.sync_enabled());
}

namespace {

std::size_t times_sent(const FakeTransport &transport, const std::string &event_id) {
  std::size_t n = 0;
  for (const auto &m : transport.sent_of<EventMessage>()) {
    if (m.event.id == event_id) {
      ++n;
    }
  }
  return n;
}

} // namespace

TEST(invalid_utf8_is_refused_before_any_state_changes) {
  TwoClients t;
  OperationDraft bad;
  bad.type = OperationType::Insert;
  bad.position = 0;
  bad.content = std::string("\xff\xfe");
  ASSERT_THROWS(t.alice.engine.send_operation(bad), ProtocolError);
  ASSERT_EQ(t.alice.engine.document().pending_count(), 0u);
  ASSERT_EQ(t.alice.engine.document().untransmitted_count(), 0u);
  ASSERT_EQ(t.relay.queued(), 0u);

  // The operation queue is not blocked
  t.insert(t.alice, 0, "ok");
  t.relay.route_all();
  ASSERT_EQ(t.bob.engine.document().confirmed_text(), "ok");
  ASSERT_EQ(t.alice.engine.document().pending_count(), 0u);

  std::size_t history = t.alice.engine.events().history().size();
  ASSERT_THROWS(t.alice.engine.send_event(EventDraft{MessageSent{"m1", std::string("\xc3")}, std::nullopt}),
                ProtocolError);
  ASSERT_EQ(t.alice.engine.events().history().size(), history);
  ASSERT_EQ(t.alice.engine.events().pending_count(), 0u);

  std::optional<PresenceInfo> presence_before = t.alice.engine.presence().local();
  PresenceUpdate update;
  update.cursor = Cursor{1, 2, std::string("\xff")};
  ASSERT_THROWS(t.alice.engine.update_presence(update), ProtocolError);
  ASSERT_TRUE(t.alice.engine.presence().local() == presence_before);
  ASSERT_FALSE(t.alice.engine.presence().broadcast_pending());

  // Reconnect replays nothing unencodable
  t.alice.transport.drop();
  t.scheduler.advance(t.clock, 1000);
  ASSERT_TRUE(t.alice.engine.is_connected());
  t.insert(t.alice, 2, "!");
  t.relay.route_all();
  ASSERT_EQ(t.bob.engine.document().confirmed_text(), "ok!");
}

TEST(event_lost_in_flight_is_resent_after_sync) {
  TwoClients t;
  Event lost = t.alice.engine.send_event(EventDraft{MessageSent{"m1", "hello"}, std::nullopt});
  ASSERT_EQ(t.relay.discard_from(&t.alice.transport), 1u);

  t.alice.transport.drop();
  t.scheduler.advance(t.clock, 1000);
  ASSERT_TRUE(t.alice.engine.is_connected());
  ASSERT_TRUE(t.alice.engine.events().is_pending(lost.id));

  t.relay.route_all();
  ASSERT_EQ(times_sent(t.alice.transport, lost.id), 2u);
  ASSERT_EQ(t.alice.engine.events().pending_count(), 0u);
  ASSERT_EQ(t.alice.engine.base_version(), 3u);
  ASSERT_EQ(t.bob.engine.base_version(), 3u);
  ASSERT_EQ(t.bob.engine.events().history().back().id, lost.id);
}

TEST(event_received_before_drop_is_not_resent) {
  TwoClients t;
  Event delivered = t.alice.engine.send_event(EventDraft{MessageSent{"m1", "hello"}, std::nullopt});
  t.alice.transport.drop();
  t.relay.route_all();
  ASSERT_EQ(t.bob.engine.base_version(), 3u);

  t.scheduler.advance(t.clock, 1000);
  t.relay.route_all();
  ASSERT_EQ(times_sent(t.alice.transport, delivered.id), 1u);
  ASSERT_EQ(t.alice.engine.events().pending_count(), 0u);
  ASSERT_EQ(t.alice.engine.base_version(), 3u);
  ASSERT_EQ(t.relay.version(), 3u);
}

TEST(operation_lost_in_flight_is_resent_on_reconnect) {
  TwoClients t;
  t.insert(t.alice, 0, "hi");
  ASSERT_EQ(t.relay.discard_from(&t.alice.transport), 1u);

  t.alice.transport.drop();
  t.scheduler.advance(t.clock, 1000);
  ASSERT_TRUE(t.alice.engine.is_connected());
  ASSERT_EQ(t.alice.engine.document().untransmitted_count(), 0u);

  t.relay.route_all();
  ASSERT_EQ(t.alice.transport.sent_of<OperationMessage>().size(), 2u);
  ASSERT_EQ(t.bob.engine.document().confirmed_text(), "hi");
  ASSERT_EQ(t.alice.engine.document().confirmed_text(), "hi");
  ASSERT_EQ(t.alice.engine.document().pending_count(), 0u);
}

TEST(resent_operation_is_applied_once) {
  TwoClients t;
  t.insert(t.alice, 0, "hi");
  t.alice.transport.drop();
  t.relay.route_all();
  ASSERT_EQ(t.bob.engine.document().confirmed_text(), "hi");

  t.scheduler.advance(t.clock, 1000);
  t.relay.route_all();
  ASSERT_EQ(t.alice.transport.sent_of<OperationMessage>().size(), 2u);
  ASSERT_EQ(t.bob.engine.document().confirmed_text(), "hi");
  ASSERT_EQ(t.bob.engine.document().revision(), 1u);
  ASSERT_EQ(t.alice.engine.document().confirmed_text(), "hi");
  ASSERT_EQ(t.alice.engine.document().pending_count(), 0u);

  // Later edits still line up
  t.insert(t.bob, 2, "!");
  t.relay.route_all();
  ASSERT_EQ(t.alice.engine.document().confirmed_text(), "hi!");
}

TEST(created_session_takes_configured_sync_delay) {
  ManualClock clock;
  Scheduler scheduler(clock);
  FakeRelay relay;
  EngineConfig config;
  config.sync_delay_ms = 250;

  Client alice(scheduler, relay, "alice", config);
  alice.engine.connect(kEndpoint);
  ASSERT_EQ(alice.engine.create_session("Tuned").settings.sync_delay_ms, 250u);

  Client bob(scheduler, relay, "bob", config);
  bob.engine.connect(kEndpoint);
  ShareOptions options;
  options.settings.sync_delay_ms = 900;
  ASSERT_EQ(bob.engine.create_session("Explicit", options).settings.sync_delay_ms, 900u);
}

int main() {
  std::cout << "Running sync engine tests..." << std::endl << std::endl;

  RUN_TEST(create_and_join_session);
  RUN_TEST(join_and_leave_need_a_connection);
  RUN_TEST(concurrent_inserts_converge_in_either_order);
  RUN_TEST(typing_burst_is_composed_and_converges);
  RUN_TEST(viewer_cannot_edit_until_promoted);
  RUN_TEST(user_left_notifies_exactly_once);
  RUN_TEST(events_queued_offline_flush_once_in_order);
  RUN_TEST(stale_events_are_rejected);
  RUN_TEST(concurrent_event_raises_conflict);
  RUN_TEST(relay_conflict_and_error_messages);
  RUN_TEST(malformed_messages_do_not_block_later_ones);
  RUN_TEST(sync_replay_is_idempotent);
  RUN_TEST(messaging_can_be_disabled);
  RUN_TEST(presence_reaches_other_participants);
  RUN_TEST(typing_status_and_cursor_events);
  RUN_TEST(delete_session_reaches_participants);
  RUN_TEST(share_session_publishes_url);
  RUN_TEST(session_expires);
  RUN_TEST(heartbeat_echo_is_recorded);
  RUN_TEST(status_listener_sees_each_transition);
  RUN_TEST(identity_and_preferences_persist);
  RUN_TEST(invalid_utf8_is_refused_before_any_state_changes);
  RUN_TEST(event_lost_in_flight_is_resent_after_sync);
  RUN_TEST(event_received_before_drop_is_not_resent);
  RUN_TEST(operation_lost_in_flight_is_resent_on_reconnect);
  RUN_TEST(resent_operation_is_applied_once);
  RUN_TEST(created_session_takes_configured_sync_delay);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
