#include <gtest/gtest.h>
#include <bastion/schema/call_result.hpp>
#include <bastion/schema/error_code.hpp>
#include <bastion/schema/primitives.hpp>
#include <bastion/schema/transaction_status.hpp>

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = bastion::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  EXPECT_FALSE(bastion::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(bastion::schema::try_make_hash32("zz").has_value());
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = bastion::schema::bytes_t{0x00, 0x7f, 0xab, 0xff};
  auto hex = bastion::schema::to_hex(bastion::schema::make_bytes_view(payload));
  EXPECT_EQ(hex, "007fabff");
  EXPECT_EQ(bastion::schema::try_from_hex(hex), payload);
  EXPECT_EQ(bastion::schema::try_from_hex("0X007FABFF"), payload);
}

TEST(primitives, try_from_hex_rejects_odd_length_and_bad_digits) {
  EXPECT_FALSE(bastion::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(bastion::schema::try_from_hex("0g").has_value());
}

TEST(primitives, null_identity_is_all_zero) {
  auto identity = bastion::schema::make_null_identity();
  EXPECT_TRUE(bastion::schema::is_null(identity));
  identity[17] = 1;
  EXPECT_FALSE(bastion::schema::is_null(identity));
}

TEST(primitives, routing_key_requires_four_bytes) {
  auto key = bastion::schema::try_make_routing_key("0xdeadbeef");
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ((*key)[0], 0xde);
  EXPECT_EQ((*key)[3], 0xef);
  EXPECT_FALSE(bastion::schema::try_make_routing_key("deadbe").has_value());
  EXPECT_FALSE(bastion::schema::try_make_routing_key("deadbeef00").has_value());
}

TEST(error_codes, categories_follow_code_ranges) {
  using bastion::schema::category_of;
  using bastion::schema::error_category_t;
  using bastion::schema::error_code;
  EXPECT_EQ(category_of(error_code::ok), error_category_t::none);
  EXPECT_EQ(category_of(error_code::caller_not_dispatcher),
            error_category_t::authorization);
  EXPECT_EQ(category_of(error_code::caller_not_owner),
            error_category_t::authorization);
  EXPECT_EQ(category_of(error_code::transaction_missing),
            error_category_t::not_found);
  EXPECT_EQ(category_of(error_code::invalid_threshold),
            error_category_t::invariant_violation);
  EXPECT_EQ(category_of(error_code::already_confirmed),
            error_category_t::already_in_state);
  EXPECT_EQ(category_of(error_code::content_hash_mismatch),
            error_category_t::integrity_mismatch);
  EXPECT_EQ(category_of(error_code::call_reverted),
            error_category_t::forwarded_call_failure);
}

TEST(error_codes, category_names_round_trip) {
  using bastion::schema::error_category_t;
  EXPECT_EQ(bastion::schema::to_string(error_category_t::already_in_state),
            "already_in_state");
  EXPECT_EQ(bastion::schema::try_from_string<error_category_t>("not_found"),
            error_category_t::not_found);
  EXPECT_FALSE(
      bastion::schema::try_from_string<error_category_t>("bogus").has_value());
}

TEST(call_result, failure_keeps_data_untouched) {
  auto data = bastion::schema::bytes_t{0xde, 0xad};
  auto result = bastion::schema::make_failure(
      bastion::schema::error_code::call_reverted, "reverted", "test", data);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.code, 50u);
  EXPECT_EQ(result.data, data);
  EXPECT_EQ(result.codespace, "test");
  EXPECT_EQ(result.category(),
            bastion::schema::error_category_t::forwarded_call_failure);
  EXPECT_TRUE(bastion::schema::make_success().ok());
}

TEST(transaction_status, derives_from_record_and_threshold) {
  using bastion::schema::transaction_status_t;
  auto record = bastion::schema::transaction_record_t{};
  record.confirmations = 1;
  EXPECT_EQ(bastion::schema::status_of(record, 2),
            transaction_status_t::proposed);
  record.confirmations = 2;
  EXPECT_EQ(bastion::schema::status_of(record, 2),
            transaction_status_t::executable);
  record.executed = true;
  EXPECT_EQ(bastion::schema::status_of(record, 2),
            transaction_status_t::executed);
  EXPECT_EQ(bastion::schema::to_string(transaction_status_t::executable),
            "executable");
}
