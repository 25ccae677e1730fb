#include <waybill/blake3/hash.hpp>
#include <waybill/schema/encoding/json/encoder.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

using waybill::schema::event_type_t;
using waybill::schema::lifecycle_state_t;
using waybill::schema::role_id_t;

namespace {

using json_encoder_t = waybill::schema::encoding::json_encoder_t;

waybill::schema::shipment_event_t make_approval() {
  auto event = waybill::schema::shipment_event_t{};
  event.event_id = "EVT-SHP-0000000007-02";
  event.shipment_id = "SHP-0000000007";
  event.event_seq = 2;
  event.event_type = event_type_t::manager_approved;
  event.previous_state = lifecycle_state_t::created;
  event.new_state = lifecycle_state_t::manager_approved;
  event.emitting_role = role_id_t::sender_manager;
  event.timestamp = 1'768'833'045'123;
  event.payload = {{"approver", "ops"}, {"note", "line one\nline two"}};
  return event;
}

std::optional<waybill::schema::shipment_event_t> try_event(
    const std::string_view text) {
  auto bytes = waybill::schema::make_bytes(text);
  return json_encoder_t{}.try_decode<waybill::schema::shipment_event_t>(
      waybill::schema::make_bytes_view(bytes));
}

std::string event_text() {
  auto bytes = json_encoder_t{}.encode(make_approval());
  return std::string{std::begin(bytes), std::end(bytes)};
}

}  // namespace

TEST(json_encoding, event_is_one_line_with_sorted_keys) {
  auto text = event_text();
  EXPECT_EQ(text.find('\n'), std::string::npos);
  EXPECT_EQ(text.rfind("{\"emitting_role\":\"SENDER_MANAGER\",", 0), 0u);
  EXPECT_NE(text.find("\"timestamp\":\"2026-01-19T14:30:45.123Z\""),
            std::string::npos);

  auto decoded = try_event(text);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->payload.at("note"), "line one\nline two");
  EXPECT_EQ(decoded->timestamp, 1'768'833'045'123u);
  EXPECT_EQ(decoded->new_state, lifecycle_state_t::manager_approved);
}

TEST(json_encoding, malformed_events_do_not_decode) {
  auto valid = nlohmann::json::parse(event_text());

  auto missing = valid;
  missing.erase("emitting_role");
  EXPECT_FALSE(try_event(missing.dump()).has_value());

  auto unknown_state = valid;
  unknown_state["new_state"] = "LOST_AT_SEA";
  EXPECT_FALSE(try_event(unknown_state.dump()).has_value());

  auto negative_seq = valid;
  negative_seq["event_seq"] = -2;
  EXPECT_FALSE(try_event(negative_seq.dump()).has_value());

  auto epoch_seconds = valid;
  epoch_seconds["timestamp"] = 1'768'833'045;
  EXPECT_FALSE(try_event(epoch_seconds.dump()).has_value());

  auto nested_payload = valid;
  nested_payload["payload"]["dims"] = nlohmann::json::array({1, 2});
  EXPECT_FALSE(try_event(nested_payload.dump()).has_value());

  EXPECT_FALSE(try_event("{\"event_id\":").has_value());
  EXPECT_FALSE(try_event("[]").has_value());
}

TEST(json_encoding, frame_record_is_the_line_without_framing_keys) {
  auto encoder = json_encoder_t{};
  auto frame = waybill::schema::log_frame_t{};
  frame.position = 9;
  frame.record = encoder.encode(make_approval());
  frame.digest = waybill::blake3::chain(
      waybill::schema::make_zero_hash(),
      waybill::schema::make_bytes_view(frame.record));

  auto line = encoder.encode(frame);
  auto parsed = nlohmann::json::parse(std::begin(line), std::end(line));
  EXPECT_EQ(parsed.at("position"), 9);
  EXPECT_EQ(parsed.at("digest"), waybill::schema::to_hex(frame.digest));
  EXPECT_EQ(parsed.at("event_seq"), 2);

  auto decoded = encoder.try_decode<waybill::schema::log_frame_t>(
      waybill::schema::make_bytes_view(line));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->position, 9u);
  EXPECT_EQ(decoded->digest, frame.digest);
  EXPECT_EQ(decoded->record, frame.record);
}

TEST(json_encoding, frame_needs_a_full_digest) {
  auto line = nlohmann::json::parse(event_text());
  line["position"] = 1;
  line["digest"] = "abcd";
  auto bytes = waybill::schema::make_bytes(line.dump());
  EXPECT_FALSE(json_encoder_t{}
                   .try_decode<waybill::schema::log_frame_t>(
                       waybill::schema::make_bytes_view(bytes))
                   .has_value());
}

TEST(json_encoding, counter_record_uses_named_fields) {
  auto record = waybill::schema::counter_record_t{};
  record.counter = 42;
  record.timestamp = 0;
  auto bytes = json_encoder_t{}.encode(record);
  EXPECT_EQ(std::string(std::begin(bytes), std::end(bytes)),
            "{\"action\":\"ID_GENERATED\",\"counter\":42,\"schema_version\":1,"
            "\"timestamp\":\"1970-01-01T00:00:00.000Z\"}");
}
