#pragma once
#include <bastion/schema/authorization_request.hpp>
#include <bastion/schema/primitives.hpp>
#include <variant>

// Schema type: module call.
// Envelope every validator module understands. The first three alternatives
// are the lifecycle and decision hooks an account drives; `extension_call_t`
// carries the module's own operations.
namespace bastion::schema {

template <uint16_t Version>
struct install_hook;

template <>
struct install_hook<1> final {
  uint16_t version{1};
  bytes_t data;
};

using install_hook_t = install_hook<1>;

template <uint16_t Version>
struct uninstall_hook;

template <>
struct uninstall_hook<1> final {
  uint16_t version{1};
  bytes_t data;
};

using uninstall_hook_t = uninstall_hook<1>;

template <uint16_t Version>
struct decide;

template <>
struct decide<1> final {
  uint16_t version{1};
  authorization_request_t request;
  hash32_t request_hash{};
};

using decide_t = decide<1>;

template <uint16_t Version>
struct extension_call;

template <>
struct extension_call<1> final {
  uint16_t version{1};
  bytes_t body;
};

using extension_call_t = extension_call<1>;

using module_call_t =
    std::variant<install_hook_t, uninstall_hook_t, decide_t, extension_call_t>;

}  // namespace bastion::schema
