#include <gtest/gtest.h>
#include <tandem/schema/error_code.hpp>
#include <tandem/schema/audit_event_type.hpp>
#include <tandem/schema/primitives.hpp>

TEST(primitives, try_make_hash32_accepts_exactly_32_raw_bytes) {
  auto input = tandem::schema::bytes_t(32, 0xAB);
  auto hash = tandem::schema::try_make_hash32(
      tandem::schema::make_bytes_view(input));
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0xAB);
  EXPECT_EQ((*hash)[31], 0xAB);

  input.pop_back();
  EXPECT_FALSE(tandem::schema::try_make_hash32(
                   tandem::schema::make_bytes_view(input))
                   .has_value());
}

TEST(primitives, try_make_hash32_decodes_prefixed_hex) {
  auto hash = tandem::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(tandem::schema::try_make_hash32("0x0102").has_value());
  EXPECT_FALSE(tandem::schema::try_make_hash32(std::string(64, 'z')).has_value());
  EXPECT_FALSE(tandem::schema::try_make_hash32("abc").has_value());
}

TEST(primitives, to_hex_matches_try_from_hex) {
  auto payload = tandem::schema::bytes_t{0x00, 0x01, 0xFE, 0xFF};
  auto hex = tandem::schema::to_hex(tandem::schema::make_bytes_view(payload));
  EXPECT_EQ(hex, "0001feff");
  auto decoded = tandem::schema::try_from_hex(hex);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, payload);
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = tandem::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, error_code_names_are_stable) {
  EXPECT_EQ(tandem::schema::to_string(tandem::schema::error_code::not_admin),
            "not_admin");
  EXPECT_EQ(tandem::schema::to_string(
                tandem::schema::error_code::already_holding_capability),
            "already_holding_capability");
  auto parsed = tandem::schema::try_from_string<tandem::schema::error_code>(
      "wrong_target");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, tandem::schema::error_code::wrong_target);
  EXPECT_EQ(static_cast<uint32_t>(tandem::schema::error_code::wrong_target), 9u);
}

TEST(primitives, audit_event_type_names_round_trip) {
  for (const auto& [name, type] : tandem::schema::kAuditEventTypeMappings) {
    EXPECT_EQ(tandem::schema::to_string(type), name);
    auto parsed =
        tandem::schema::try_from_string<tandem::schema::audit_event_type_t>(
            name);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, type);
  }
  EXPECT_FALSE(
      tandem::schema::try_from_string<tandem::schema::audit_event_type_t>(
          "revoked")
          .has_value());
}
