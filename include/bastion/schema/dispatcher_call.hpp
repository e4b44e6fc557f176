#pragma once
#include <bastion/schema/authorization_request.hpp>
#include <bastion/schema/primitives.hpp>
#include <variant>
#include <vector>

// Schema type: dispatcher call.
// Operations of the reference trusted dispatcher. A value transfer with an
// empty payload tops up the sender's deposit.
namespace bastion::schema {

template <uint16_t Version>
struct deposit_to;

template <>
struct deposit_to<1> final {
  uint16_t version{1};
  identity_t account{};
};

using deposit_to_t = deposit_to<1>;

template <uint16_t Version>
struct withdraw_to;

template <>
struct withdraw_to<1> final {
  uint16_t version{1};
  identity_t destination{};
  amount_t amount{};
};

using withdraw_to_t = withdraw_to<1>;

template <uint16_t Version>
struct handle_requests;

template <>
struct handle_requests<1> final {
  uint16_t version{1};
  std::vector<authorization_request_t> requests;
  identity_t beneficiary{};
};

using handle_requests_t = handle_requests<1>;

using dispatcher_call_t =
    std::variant<deposit_to_t, withdraw_to_t, handle_requests_t>;

}  // namespace bastion::schema
