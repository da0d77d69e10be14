#include <cursorctl/schema/encoding/scale/encoder.hpp>
#include <cursorctl/schema/action_result.hpp>
#include <cursorctl/schema/history_record.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>

namespace {

using encoder_t = cursorctl::schema::encoding::encoder<
    cursorctl::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(encoding_types, defaults_are_stable) {
  auto record = cursorctl::schema::history_record_t{};
  EXPECT_EQ(record.version, 1u);
  EXPECT_EQ(record.id, 0u);
  EXPECT_FALSE(record.value.has_value());

  auto result = cursorctl::schema::action_result_t{};
  EXPECT_EQ(result.version, 1u);
  EXPECT_EQ(result.code, 0u);
  EXPECT_TRUE(cursorctl::schema::succeeded(result));
  EXPECT_FALSE(result.record.has_value());
}

TEST(encoding_types, identifier_record_keeps_value_and_timestamp) {
  auto encoder = encoder_t{};
  auto record = cursorctl::schema::history_record_t{
      .id = 7,
      .action = cursorctl::schema::action_type_t::device_id,
      .value = std::string{"8d3f0c1e-2b7a-4c55-9e10-5a7f3b2c1d0e"},
      .recorded_at = 1'700'000'123'456};

  auto encoded = encoder.encode(record);
  auto decoded = encoder.try_decode<cursorctl::schema::history_record_t>(
      cursorctl::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->version, 1u);
  EXPECT_EQ(decoded->id, 7u);
  EXPECT_EQ(decoded->action, cursorctl::schema::action_type_t::device_id);
  ASSERT_TRUE(decoded->value.has_value());
  EXPECT_EQ(*decoded->value, "8d3f0c1e-2b7a-4c55-9e10-5a7f3b2c1d0e");
  EXPECT_EQ(decoded->recorded_at, 1'700'000'123'456u);
}

TEST(encoding_types, update_record_without_value_stays_empty) {
  auto encoder = encoder_t{};
  auto record = cursorctl::schema::history_record_t{
      .id = 2,
      .action = cursorctl::schema::action_type_t::update_unblock,
      .recorded_at = 5};

  auto encoded = encoder.encode(record);
  auto decoded = encoder.decode<cursorctl::schema::history_record_t>(
      cursorctl::schema::make_bytes_view(encoded));
  EXPECT_EQ(decoded.action, cursorctl::schema::action_type_t::update_unblock);
  EXPECT_FALSE(decoded.value.has_value());
}

TEST(encoding_types, try_decode_rejects_truncated_record) {
  auto encoder = encoder_t{};
  auto record = cursorctl::schema::history_record_t{
      .id = 3,
      .action = cursorctl::schema::action_type_t::machine_id,
      .value = std::string{"abc123"},
      .recorded_at = 9};
  auto encoded = encoder.encode(record);
  encoded.resize(encoded.size() / 2);

  auto decoded = encoder.try_decode<cursorctl::schema::history_record_t>(
      cursorctl::schema::make_bytes_view(encoded));
  EXPECT_FALSE(decoded.has_value());
}

TEST(encoding_types, try_decode_rejects_unknown_action_value) {
  auto encoder = encoder_t{};
  auto record = cursorctl::schema::history_record_t{
      .id = 4,
      .action = cursorctl::schema::action_type_t::update_block,
      .recorded_at = 1};
  auto encoded = encoder.encode(record);
  // version (2 bytes) + id (8 bytes) precede the action byte.
  ASSERT_GT(encoded.size(), 10u);
  encoded[10] = 0x7F;

  auto decoded = encoder.try_decode<cursorctl::schema::history_record_t>(
      cursorctl::schema::make_bytes_view(encoded));
  EXPECT_FALSE(decoded.has_value());
}
