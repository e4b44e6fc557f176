#pragma once
#include <bastion/schema/authorization_request.hpp>
#include <bastion/schema/primitives.hpp>
#include <variant>
#include <vector>

// Schema type: account call.
// Payloads understood by an account endpoint. An empty payload is a plain
// value transfer into the account.
namespace bastion::schema {

template <uint16_t Version>
struct authorize;

template <>
struct authorize<1> final {
  uint16_t version{1};
  authorization_request_t request;
  hash32_t request_hash{};
  amount_t shortfall{};
};

using authorize_t = authorize<1>;

template <uint16_t Version>
struct install_module;

template <>
struct install_module<1> final {
  uint16_t version{1};
  routing_key_t key{};
  identity_t module{};
  bytes_t init_data;
};

using install_module_t = install_module<1>;

template <uint16_t Version>
struct uninstall_module;

template <>
struct uninstall_module<1> final {
  uint16_t version{1};
  routing_key_t key{};
  bytes_t data;
};

using uninstall_module_t = uninstall_module<1>;

template <uint16_t Version>
struct forward;

template <>
struct forward<1> final {
  uint16_t version{1};
  identity_t target{};
  amount_t value{};
  bytes_t payload;
};

using forward_t = forward<1>;

template <uint16_t Version>
struct forward_batch;

template <>
struct forward_batch<1> final {
  uint16_t version{1};
  std::vector<identity_t> targets;
  std::vector<amount_t> values;
  std::vector<bytes_t> payloads;
};

using forward_batch_t = forward_batch<1>;

using account_call_t = std::variant<authorize_t,
                                    install_module_t,
                                    uninstall_module_t,
                                    forward_t,
                                    forward_batch_t>;

}  // namespace bastion::schema
