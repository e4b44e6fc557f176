#pragma once

#include <bastion/schema/approval_config.hpp>
#include <bastion/schema/transaction_record.hpp>
#include <bastion/schema/transaction_status.hpp>
#include <bastion/state/journal.hpp>

#include <optional>
#include <vector>

namespace bastion::modules {

/// State one approval module keeps for one account: configuration, owner
/// membership, the id counter, transaction records and confirmations with
/// their per-owner reverse index. All reads and writes go through the
/// journal, so they follow the frame of the call that issued them.
class approval_ledger final {
 public:
  approval_ledger(state::journal& journal,
                  const bastion::schema::identity_t& module,
                  const bastion::schema::identity_t& account);

  std::optional<bastion::schema::approval_config_t> config() const;
  bool active() const;
  void put_config(const bastion::schema::approval_config_t& config);

  bool is_owner(const bastion::schema::identity_t& owner) const;
  void add_member(const bastion::schema::identity_t& owner);
  void remove_member(const bastion::schema::identity_t& owner);

  /// Value the module holds for this account and may spend on its behalf.
  bastion::schema::amount_t escrow() const;
  void credit_escrow(const bastion::schema::amount_t& amount);
  /// False, with nothing written, when the escrow cannot cover `amount`.
  bool debit_escrow(const bastion::schema::amount_t& amount);

  bastion::schema::transaction_id_t next_id() const;
  bastion::schema::transaction_id_t allocate_id();

  std::optional<bastion::schema::transaction_record_t> transaction(
      bastion::schema::transaction_id_t id) const;
  void put_transaction(const bastion::schema::transaction_record_t& record);

  /// Every record ever allocated for this account, ordered by id.
  std::vector<bastion::schema::transaction_record_t> transactions() const;

  /// Ids of existing, unexecuted records, ascending.
  std::vector<bastion::schema::transaction_id_t> pending() const;

  std::optional<bastion::schema::confirmation_entry_t> confirmation(
      bastion::schema::transaction_id_t id,
      const bastion::schema::identity_t& owner) const;

  /// Writes the entry and its reverse index entry.
  void put_confirmation(const bastion::schema::confirmation_entry_t& entry);

  /// Removes the entry and its reverse index entry.
  void erase_confirmation(bastion::schema::transaction_id_t id,
                          const bastion::schema::identity_t& owner);

  std::vector<bastion::schema::identity_t> confirming_owners(
      bastion::schema::transaction_id_t id) const;

  /// Reverse index: ids `owner` has confirmed, ascending.
  std::vector<bastion::schema::transaction_id_t> confirmed_by(
      const bastion::schema::identity_t& owner) const;

  std::optional<bastion::schema::transaction_status_t> status(
      bastion::schema::transaction_id_t id) const;

  /// Remove everything listed above, including the id counter and the
  /// escrow entry.
  void clear();

 private:
  bastion::schema::bytes_t scope_prefix(std::string_view prefix) const;

  state::journal& journal_;
  bastion::schema::identity_t module_;
  bastion::schema::identity_t account_;
};

}  // namespace bastion::modules
