#include <cursorctl/common/errors.hpp>
#include <cursorctl/identity/generator.hpp>
#include <gtest/gtest.h>

#include <string>

using cursorctl::schema::identifier_slot_t;

namespace {

bool is_lower_hex(const std::string& value) {
  return value.find_first_not_of("0123456789abcdef") == std::string::npos;
}

}  // namespace

TEST(identity_generator, default_formats_match_slot_lengths) {
  auto generator = cursorctl::identity::generator{};

  auto machine_id = generator.generate(identifier_slot_t::machine_id);
  EXPECT_EQ(machine_id.size(), 64u);
  EXPECT_TRUE(is_lower_hex(machine_id));

  auto mac_machine_id = generator.generate(identifier_slot_t::mac_machine_id);
  EXPECT_EQ(mac_machine_id.size(), 128u);
  EXPECT_TRUE(is_lower_hex(mac_machine_id));

  auto sqm_id = generator.generate(identifier_slot_t::sqm_id);
  EXPECT_EQ(sqm_id.size(), 128u);
  EXPECT_TRUE(is_lower_hex(sqm_id));
}

TEST(identity_generator, device_id_is_a_version_4_uuid) {
  auto generator = cursorctl::identity::generator{};
  auto device_id = generator.generate(identifier_slot_t::device_id);

  ASSERT_EQ(device_id.size(), 36u);
  EXPECT_EQ(device_id[8], '-');
  EXPECT_EQ(device_id[13], '-');
  EXPECT_EQ(device_id[18], '-');
  EXPECT_EQ(device_id[23], '-');
  EXPECT_EQ(device_id[14], '4');
  EXPECT_NE(std::string{"89ab"}.find(device_id[19]), std::string::npos);
}

TEST(identity_generator, format_uuid_v4_sets_version_and_variant) {
  auto bytes = cursorctl::schema::bytes_t(16, 0xFF);
  EXPECT_EQ(cursorctl::identity::format_uuid_v4(bytes),
            "ffffffff-ffff-4fff-bfff-ffffffffffff");

  bytes.assign(16, 0x00);
  EXPECT_EQ(cursorctl::identity::format_uuid_v4(bytes),
            "00000000-0000-4000-8000-000000000000");
}

TEST(identity_generator, consecutive_values_differ) {
  auto generator = cursorctl::identity::generator{};
  for (const auto slot : cursorctl::schema::kIdentifierSlots) {
    EXPECT_NE(generator.generate(slot), generator.generate(slot));
  }
}

TEST(identity_generator, named_generation_validates_slot) {
  auto generator = cursorctl::identity::generator{};
  EXPECT_EQ(generator.generate(std::string_view{"machine_id"}).size(), 64u);
  EXPECT_THROW(generator.generate(std::string_view{"serial_number"}),
               cursorctl::common::validation_error);

  EXPECT_EQ(cursorctl::identity::generator::parse_slot("device_id"),
            identifier_slot_t::device_id);
  EXPECT_FALSE(cursorctl::identity::generator::parse_slot("MACHINE_ID")
                   .has_value());
}

TEST(identity_generator, configured_byte_counts_are_honoured) {
  auto generator =
      cursorctl::identity::generator{cursorctl::identity::generator_options{
          .machine_id_bytes = 4, .mac_machine_id_bytes = 8, .sqm_id_bytes = 1}};
  EXPECT_EQ(generator.generate(identifier_slot_t::machine_id).size(), 8u);
  EXPECT_EQ(generator.generate(identifier_slot_t::mac_machine_id).size(), 16u);
  EXPECT_EQ(generator.generate(identifier_slot_t::sqm_id).size(), 2u);
  EXPECT_EQ(generator.generate(identifier_slot_t::device_id).size(), 36u);
}

TEST(identity_generator, random_bytes_returns_requested_count) {
  EXPECT_TRUE(cursorctl::identity::random_bytes(0).empty());
  EXPECT_EQ(cursorctl::identity::random_bytes(33).size(), 33u);
}
