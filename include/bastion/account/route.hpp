#pragma once

#include <bastion/schema/primitives.hpp>

#include <variant>

namespace bastion::account {

/// Authorization is delegated to the module installed under the routing key.
struct module_route final {
  bastion::schema::identity_t module{};
};

/// No module under the routing key: single-signer recovery over the approval
/// blob.
struct default_route final {};

using route_t = std::variant<module_route, default_route>;

}  // namespace bastion::account
