#pragma once

#include <bastion/modules/approval_ledger.hpp>
#include <bastion/modules/validator_module.hpp>
#include <bastion/schema/approval_call.hpp>
#include <bastion/schema/execution_outcome.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace bastion::modules {

inline constexpr auto kApprovalCodespace =
    std::string_view{"bastion.approval"};

/// Multi-owner threshold approval.
///
/// Per (account, id): proposed -> executable once confirmations reach the
/// threshold -> executed. A forwarded call that fails during execution puts
/// the transaction back to executable and is reported, not raised.
///
/// Value sent to the module is escrowed per account; a transaction spends
/// only from the escrow of the account that owns it.
class approval_engine final : public validator_module {
 public:
  explicit approval_engine(const bastion::schema::identity_t& self);

  std::string_view name() const override { return "approval_engine"; }
  const bastion::schema::identity_t& self() const { return self_; }

  bastion::schema::call_result_t submit_transaction(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::submit_transaction_t& call);

  bastion::schema::call_result_t confirm_transaction(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::confirm_transaction_t& call);

  bastion::schema::call_result_t revoke_confirmation(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::revoke_confirmation_t& call);

  bastion::schema::call_result_t execute_transaction(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::execute_transaction_t& call);

  bastion::schema::call_result_t add_owner(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::add_owner_t& call);

  bastion::schema::call_result_t remove_owner(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::remove_owner_t& call);

  bastion::schema::call_result_t change_threshold(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::change_threshold_t& call);

  approval_ledger ledger(state::journal& journal,
                         const bastion::schema::identity_t& account) const;

  std::optional<bastion::schema::approval_config_t> configuration(
      state::journal& journal,
      const bastion::schema::identity_t& account) const;

  std::optional<bastion::schema::transaction_record_t> transaction(
      state::journal& journal,
      const bastion::schema::identity_t& account,
      bastion::schema::transaction_id_t id) const;

  std::vector<bastion::schema::identity_t> confirmations(
      state::journal& journal,
      const bastion::schema::identity_t& account,
      bastion::schema::transaction_id_t id) const;

  bool is_owner(state::journal& journal,
                const bastion::schema::identity_t& account,
                const bastion::schema::identity_t& owner) const;

  std::vector<bastion::schema::transaction_id_t> pending(
      state::journal& journal,
      const bastion::schema::identity_t& account) const;

  std::vector<bastion::schema::transaction_id_t> confirmed_by(
      state::journal& journal,
      const bastion::schema::identity_t& account,
      const bastion::schema::identity_t& owner) const;

  uint64_t transaction_count(state::journal& journal,
                             const bastion::schema::identity_t& account) const;

  bastion::schema::amount_t escrow_of(
      state::journal& journal,
      const bastion::schema::identity_t& account) const;

  std::optional<bastion::schema::transaction_status_t> status(
      state::journal& journal,
      const bastion::schema::identity_t& account,
      bastion::schema::transaction_id_t id) const;

 protected:
  bastion::schema::call_result_t on_install(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::bytes_t& data) override;

  bastion::schema::call_result_t on_uninstall(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::bytes_t& data) override;

  bastion::schema::validation_code_t decide(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::authorization_request_t& request,
      const bastion::schema::hash32_t& request_hash) override;

  bastion::schema::call_result_t on_extension(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::bytes_t& body) override;

  std::string_view codespace() const override { return kApprovalCodespace; }

 private:
  /// Active configuration of `account` when `caller` is one of its owners,
  /// otherwise the failure to return.
  std::variant<bastion::schema::approval_config_t,
               bastion::schema::call_result_t>
  require_owner(approval_ledger& ledger,
                const bastion::schema::identity_t& caller) const;

  bastion::schema::identity_t self_;
};

/// Binds a transaction record to one exact forwarded call.
bastion::schema::hash32_t make_content_hash(
    state::encoder_t& encoder,
    const bastion::schema::identity_t& target,
    const bastion::schema::amount_t& value,
    const bastion::schema::bytes_t& payload);

}  // namespace bastion::modules
