#pragma once

#include <bastion/host/endpoint.hpp>
#include <bastion/host/runtime.hpp>
#include <bastion/schema/dispatcher_call.hpp>

#include <optional>
#include <string_view>

namespace bastion::dispatcher {

inline constexpr auto kCodespace = std::string_view{"bastion.dispatcher"};

/// Reference trusted dispatcher.
///
/// Holds per-account deposits and drives accounts through authorize and
/// forward. Requests are independent: a rejected request aborts the whole
/// batch, a forwarded body that fails only marks its own request as failed.
class dispatcher final : public host::endpoint {
 public:
  explicit dispatcher(const bastion::schema::identity_t& self);

  bastion::schema::call_result_t handle(
      host::runtime& rt,
      const host::call_context& context) override;

  std::string_view name() const override { return "dispatcher"; }
  const bastion::schema::identity_t& self() const { return self_; }

  bastion::schema::call_result_t deposit_to(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::deposit_to_t& call);

  bastion::schema::call_result_t withdraw_to(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::withdraw_to_t& call);

  bastion::schema::call_result_t handle_requests(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::handle_requests_t& call);

  bastion::schema::amount_t deposit_of(
      state::journal& journal,
      const bastion::schema::identity_t& account) const;

  bastion::schema::hash32_t request_hash(
      host::runtime& rt,
      const bastion::schema::authorization_request_t& request) const;

 private:
  void credit(state::journal& journal,
              const bastion::schema::identity_t& account,
              const bastion::schema::amount_t& amount);

  bastion::schema::identity_t self_;
};

/// Hash of the request fields, independent of who processes it.
bastion::schema::hash32_t make_request_digest(
    state::encoder_t& encoder,
    const bastion::schema::authorization_request_t& request);

/// Request digest bound to a dispatcher and a chain.
bastion::schema::hash32_t make_request_hash(
    state::encoder_t& encoder,
    const bastion::schema::authorization_request_t& request,
    const bastion::schema::identity_t& dispatcher,
    uint64_t chain_id);

/// (call + verification + pre-verification budget) * max fee, or nothing
/// when the product does not fit an amount.
std::optional<bastion::schema::amount_t> required_prefund(
    const bastion::schema::authorization_request_t& request);

}  // namespace bastion::dispatcher
