// test_wire_protocol.cpp
#include "wire_protocol.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

using namespace collab;
using json = nlohmann::json;

namespace {

Event sample_event() {
  Event e;
  e.id = "event_1";
  e.session_id = "session_1";
  e.author_id = "alice";
  e.timestamp = 1700000000000;
  e.version = 7;
  e.payload = MessageSent{"msg_1", "hello"};
  return e;
}

} // namespace

TEST(event_uses_wire_field_names) {
  json j = json::parse(encode_message(EventMessage{sample_event()}));
  ASSERT_EQ(j["type"].get<std::string>(), "EVENT");
  ASSERT_EQ(j["event"]["type"].get<std::string>(), "MESSAGE_SENT");
  ASSERT_EQ(j["event"]["sessionId"].get<std::string>(), "session_1");
  ASSERT_EQ(j["event"]["userId"].get<std::string>(), "alice");
  ASSERT_EQ(j["event"]["version"].get<uint64_t>(), 7u);
  ASSERT_EQ(j["event"]["data"]["content"].get<std::string>(), "hello");
}

TEST(event_decodes_typed_payload) {
  Event original = sample_event();
  WireMessage decoded = decode_message(encode_message(EventMessage{original}));
  auto *m = std::get_if<EventMessage>(&decoded);
  ASSERT_TRUE(m != nullptr);
  ASSERT_TRUE(m->event == original);
  ASSERT_TRUE(m->event.type() == EventType::MessageSent);
}

TEST(decode_hand_written_operation) {
  std::string payload = R"({"type":"OPERATION","operation":{"id":"op_1","type":"insert","position":3,
    "userId":"bob","content":"xyz","attributes":{"bold":true,"font":"mono"}}})";
  WireMessage decoded = decode_message(payload);
  auto *m = std::get_if<OperationMessage>(&decoded);
  ASSERT_TRUE(m != nullptr);
  ASSERT_TRUE(m->operation.type == OperationType::Insert);
  ASSERT_EQ(m->operation.position, 3u);
  ASSERT_EQ(m->operation.content.value(), "xyz");
  ASSERT_EQ(m->operation.base_version, 0u);
  ASSERT_EQ(m->operation.attributes.at("bold"), "true");
  ASSERT_EQ(m->operation.attributes.at("font"), "mono");
}

TEST(session_sync_carries_settings) {
  Session s;
  s.id = "session_9";
  s.name = "Review";
  s.owner_id = "alice";
  s.settings.max_participants = 3;
  s.settings.conflict_resolution = ConflictResolutionMode::OwnerWins;
  s.permissions.allow_messaging = false;
  Participant p;
  p.id = "alice";
  p.role = Role::Owner;
  s.participants.push_back(p);

  Event e = sample_event();
  e.payload = SessionSync{SessionSyncAction::Update, s};

  json j = json::parse(encode_message(EventMessage{e}));
  ASSERT_EQ(j["event"]["data"]["action"].get<std::string>(), "update");
  ASSERT_EQ(j["event"]["data"]["session"]["settings"]["conflictResolution"].get<std::string>(), "owner_wins");

  WireMessage decoded = decode_message(j.dump());
  const auto &sync = std::get<SessionSync>(std::get<EventMessage>(decoded).event.payload);
  ASSERT_TRUE(sync.session.has_value());
  ASSERT_TRUE(*sync.session == s);
}

TEST(conflict_resolution_fields) {
  ConflictRecord c;
  c.id = "conflict_1";
  c.session_id = "session_1";
  c.conflicting_events.push_back(sample_event());
  c.strategy = ResolutionStrategy::Overwrite;
  c.detected_at = 10;
  c.resolved = true;
  c.resolution = ConflictResolutionDetail{"alice", 20, ConflictResolutionMode::OwnerWins, std::string("event_1")};

  json j = json::parse(encode_message(ConflictMessage{c}));
  ASSERT_EQ(j["conflict"]["resolutionStrategy"].get<std::string>(), "overwrite");
  ASSERT_EQ(j["conflict"]["resolvedBy"].get<std::string>(), "alice");
  ASSERT_EQ(j["conflict"]["resolution"]["payload"].get<std::string>(), "event_1");

  WireMessage decoded = decode_message(j.dump());
  ASSERT_TRUE(std::get<ConflictMessage>(decoded).conflict == c);
}

TEST(participant_defaults_when_fields_absent) {
  WireMessage decoded = decode_message(R"({"type":"JOIN_SESSION","sessionId":"s","user":{"id":"u1"}})");
  const auto &join = std::get<JoinSessionMessage>(decoded);
  ASSERT_EQ(join.user.id, "u1");
  ASSERT_TRUE(join.user.role == Role::Viewer);
  ASSERT_TRUE(join.user.status == PresenceStatus::Online);
  ASSERT_FALSE(join.user.cursor.has_value());
}

TEST(error_and_heartbeat_messages) {
  WireMessage err = decode_message(R"({"type":"ERROR","error":"rate limited","code":429})");
  ASSERT_EQ(std::get<ErrorMessage>(err).error, "rate limited");
  ASSERT_EQ(std::get<ErrorMessage>(err).code.value(), 429);

  WireMessage hb = decode_message(R"({"type":"HEARTBEAT","timestamp":42})");
  ASSERT_EQ(std::get<HeartbeatMessage>(hb).timestamp, 42);
  ASSERT_EQ(std::string(message_type_name(hb)), "HEARTBEAT");
}

TEST(malformed_payloads_raise_protocol_error) {
  ASSERT_THROWS(decode_message("not json"), ProtocolError);
  ASSERT_THROWS(decode_message("[1,2,3]"), ProtocolError);
  ASSERT_THROWS(decode_message(R"({"sessionId":"s"})"), ProtocolError);
  ASSERT_THROWS(decode_message(R"({"type":"TELEPORT"})"), ProtocolError);
  ASSERT_THROWS(decode_message(R"({"type":"EVENT","event":{"id":"e","type":"DANCE","sessionId":"s",
    "userId":"u","version":1}})"),
                ProtocolError);
  // version is required on events
  ASSERT_THROWS(decode_message(R"({"type":"EVENT","event":{"id":"e","type":"TYPING_START","sessionId":"s",
    "userId":"u"}})"),
                ProtocolError);
  // position has the wrong type
  ASSERT_THROWS(decode_message(R"({"type":"OPERATION","operation":{"id":"o","type":"insert","position":"x",
    "userId":"u"}})"),
                ProtocolError);
  // negative offsets never wrap around to huge positions
  ASSERT_THROWS(decode_message(R"({"type":"OPERATION","operation":{"id":"o","type":"insert","position":-1,
    "content":"X","userId":"u"}})"),
                ProtocolError);
  ASSERT_THROWS(decode_message(R"({"type":"OPERATION","operation":{"id":"o","type":"delete","position":0,
    "length":-3,"userId":"u"}})"),
                ProtocolError);
  ASSERT_THROWS(decode_message(R"({"type":"OPERATION","operation":{"id":"o","type":"insert","position":2.5,
    "content":"X","userId":"u"}})"),
                ProtocolError);
  ASSERT_THROWS(decode_message(R"({"type":"SYNC_RESPONSE","sessionId":"s","events":[],"version":-4})"),
                ProtocolError);
}

TEST(sync_response_round_trip) {
  SyncResponseMessage response{"session_1", {sample_event()}, 12};
  WireMessage decoded = decode_message(encode_message(response));
  const auto &r = std::get<SyncResponseMessage>(decoded);
  ASSERT_EQ(r.version, 12u);
  ASSERT_EQ(r.events.size(), 1u);
  ASSERT_EQ(r.events[0].id, "event_1");
}

TEST(invalid_utf8_cannot_be_encoded) {
  Event bad = sample_event();
  bad.payload = MessageSent{"msg_1", std::string("caf\xc3")};
  ASSERT_THROWS(encode_message(EventMessage{bad}), ProtocolError);
  ASSERT_THROWS(check_encodable(EventMessage{bad}), ProtocolError);

  Participant user;
  user.id = "u1";
  user.name = std::string("\xff\xfe");
  ASSERT_THROWS(check_encodable(JoinSessionMessage{"session_1", user}), ProtocolError);

  check_encodable(EventMessage{sample_event()});
}

int main() {
  std::cout << "Running wire protocol tests..." << std::endl << std::endl;

  RUN_TEST(event_uses_wire_field_names);
  RUN_TEST(event_decodes_typed_payload);
  RUN_TEST(decode_hand_written_operation);
  RUN_TEST(session_sync_carries_settings);
  RUN_TEST(conflict_resolution_fields);
  RUN_TEST(participant_defaults_when_fields_absent);
  RUN_TEST(error_and_heartbeat_messages);
  RUN_TEST(malformed_payloads_raise_protocol_error);
  RUN_TEST(sync_response_round_trip);
  RUN_TEST(invalid_utf8_cannot_be_encoded);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
