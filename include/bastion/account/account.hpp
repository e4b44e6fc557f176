#pragma once

#include <bastion/account/route.hpp>
#include <bastion/account/self_capability.hpp>
#include <bastion/host/endpoint.hpp>
#include <bastion/host/runtime.hpp>
#include <bastion/schema/account_call.hpp>
#include <bastion/schema/registry_entry.hpp>
#include <bastion/state/journal.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace bastion::account {

inline constexpr auto kCodespace = std::string_view{"bastion.account"};

/// Account router.
///
/// Owns the validator registry and the sequence counter of one identity. The
/// trusted dispatcher is fixed at construction and is the only caller allowed
/// to ask for authorization. Registry changes are only reachable through a
/// call the account makes to itself.
class account final : public host::endpoint {
 public:
  account(const bastion::schema::identity_t& self,
          const bastion::schema::identity_t& dispatcher);

  bastion::schema::call_result_t handle(
      host::runtime& rt,
      const host::call_context& context) override;

  std::string_view name() const override { return "account"; }

  const bastion::schema::identity_t& self() const { return self_; }
  const bastion::schema::identity_t& dispatcher() const { return dispatcher_; }

  bastion::schema::call_result_t authorize(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::authorize_t& call);

  bastion::schema::call_result_t install(
      host::runtime& rt,
      const self_capability& capability,
      const bastion::schema::install_module_t& call);

  bastion::schema::call_result_t uninstall(
      host::runtime& rt,
      const self_capability& capability,
      const bastion::schema::uninstall_module_t& call);

  bastion::schema::call_result_t forward(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::forward_t& call);

  bastion::schema::call_result_t forward_batch(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::forward_batch_t& call);

  route_t resolve(state::journal& journal,
                  const bastion::schema::routing_key_t& key) const;

 private:
  std::optional<self_capability> mint(const host::call_context& context) const;
  bool may_forward(const host::call_context& context) const;

  bastion::schema::call_result_t receive(host::runtime& rt,
                                         const host::call_context& context);

  bastion::schema::call_result_t decide(
      host::runtime& rt,
      const bastion::schema::authorize_t& call,
      const route_t& route);

  bastion::schema::identity_t self_;
  bastion::schema::identity_t dispatcher_;
};

/// Digest signed for the default route: the request hash bound to the
/// account and the chain.
bastion::schema::hash32_t make_default_route_digest(
    state::encoder_t& encoder,
    const bastion::schema::hash32_t& request_hash,
    const bastion::schema::identity_t& account,
    uint64_t chain_id);

/// Routing key at the front of a call payload, or std::nullopt when the
/// payload is too short to carry one.
std::optional<bastion::schema::routing_key_t> routing_key_of(
    const bastion::schema::bytes_view_t& call_payload);

/// Routing key followed by the encoded account call.
bastion::schema::bytes_t make_call_payload(
    state::encoder_t& encoder,
    const bastion::schema::routing_key_t& key,
    const bastion::schema::account_call_t& call);

std::optional<bastion::schema::registry_entry_t> installed_module(
    state::journal& journal,
    const bastion::schema::identity_t& account,
    const bastion::schema::routing_key_t& key);

std::vector<bastion::schema::registry_entry_t> list_registry(
    state::journal& journal,
    const bastion::schema::identity_t& account);

uint64_t sequence_of(state::journal& journal,
                     const bastion::schema::identity_t& account);

}  // namespace bastion::account
