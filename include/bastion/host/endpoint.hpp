#pragma once

#include <bastion/schema/call_result.hpp>
#include <bastion/schema/primitives.hpp>

#include <string_view>

namespace bastion::host {

class runtime;

/// What a callee sees of the call that reached it. `value` has already been
/// credited to `self` when the handler runs.
struct call_context final {
  bastion::schema::identity_t caller{};
  bastion::schema::identity_t self{};
  bastion::schema::amount_t value{};
  bastion::schema::bytes_t payload;
};

/// Code attached to an identity. Handlers report failure through the result
/// code; the runtime unwinds the callee's frame whenever the code is non-zero.
class endpoint {
 public:
  virtual ~endpoint() = default;

  virtual bastion::schema::call_result_t handle(runtime& rt,
                                                const call_context& context) = 0;

  virtual std::string_view name() const = 0;
};

}  // namespace bastion::host
