#pragma once

#include <bastion/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace bastion::schema {

enum class error_code : uint32_t {
  ok = 0,

  // authorization
  caller_not_dispatcher = 1,
  caller_not_self = 2,
  caller_not_owner = 3,
  caller_not_authorized = 4,

  // not found
  module_not_installed = 10,
  module_not_initialized = 11,
  transaction_missing = 12,
  owner_missing = 13,
  confirmation_missing = 14,
  endpoint_missing = 15,

  // invariant violation
  invalid_payload = 20,
  null_identity = 21,
  invalid_threshold = 22,
  duplicate_owner = 23,
  owner_count_below_threshold = 24,
  threshold_not_met = 25,
  mismatched_batch = 26,
  insufficient_balance = 27,

  // already in state
  module_already_installed = 30,
  already_initialized = 31,
  already_confirmed = 32,
  already_executed = 33,
  owner_exists = 34,

  // integrity
  content_hash_mismatch = 40,

  // forwarded call
  call_reverted = 50,
  prefund_failed = 51,
  request_rejected = 52,
};

/// Failure taxonomy used by callers to reason about a code without knowing
/// every individual value.
enum class error_category_t : uint8_t {
  none = 0,
  authorization = 1,
  not_found = 2,
  invariant_violation = 3,
  already_in_state = 4,
  integrity_mismatch = 5,
  forwarded_call_failure = 6,
};

constexpr error_category_t category_of(const error_code code) {
  const auto value = static_cast<uint32_t>(code);
  if (value == 0) {
    return error_category_t::none;
  }
  if (value < 10) {
    return error_category_t::authorization;
  }
  if (value < 20) {
    return error_category_t::not_found;
  }
  if (value < 30) {
    return error_category_t::invariant_violation;
  }
  if (value < 40) {
    return error_category_t::already_in_state;
  }
  if (value < 50) {
    return error_category_t::integrity_mismatch;
  }
  return error_category_t::forwarded_call_failure;
}

constexpr error_category_t category_of(const uint32_t code) {
  return category_of(static_cast<error_code>(code));
}

inline constexpr auto kErrorCategoryMappings = std::array{
    enum_mapping_t<error_category_t>{"none", error_category_t::none},
    enum_mapping_t<error_category_t>{"authorization",
                                     error_category_t::authorization},
    enum_mapping_t<error_category_t>{"not_found", error_category_t::not_found},
    enum_mapping_t<error_category_t>{"invariant_violation",
                                     error_category_t::invariant_violation},
    enum_mapping_t<error_category_t>{"already_in_state",
                                     error_category_t::already_in_state},
    enum_mapping_t<error_category_t>{"integrity_mismatch",
                                     error_category_t::integrity_mismatch},
    enum_mapping_t<error_category_t>{"forwarded_call_failure",
                                     error_category_t::forwarded_call_failure}};

template <>
inline std::optional<error_category_t> try_from_string<error_category_t>(
    const std::string_view value) {
  return from_string(value, kErrorCategoryMappings);
}

inline constexpr std::string_view to_string(const error_category_t value) {
  return to_string(value, kErrorCategoryMappings);
}

}  // namespace bastion::schema
