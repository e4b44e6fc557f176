#pragma once
#include <bastion/schema/primitives.hpp>

// Schema type: authorization request.
// Unit of work a trusted dispatcher asks an account to authorize. The core
// reads `sender`, `call_payload` and `approval`; budgets, fees and the
// auxiliary payload are carried through untouched.
namespace bastion::schema {

template <uint16_t Version>
struct authorization_request;

template <>
struct authorization_request<1> final {
  uint16_t version{1};
  identity_t sender{};
  uint64_t sequence{};
  bytes_t init_payload;
  /// Routing key followed by the SCALE encoded account call.
  bytes_t call_payload;
  uint64_t call_budget{};
  uint64_t verification_budget{};
  uint64_t pre_verification_budget{};
  amount_t max_fee{};
  amount_t max_priority_fee{};
  bytes_t auxiliary_payload;
  bytes_t approval;
};

using authorization_request_t = authorization_request<1>;

}  // namespace bastion::schema
