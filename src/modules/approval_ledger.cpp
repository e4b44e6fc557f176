#include <bastion/modules/approval_ledger.hpp>
#include <bastion/schema/key/state_keys.hpp>

#include <algorithm>

namespace bastion::modules {

namespace key = bastion::schema::key;

approval_ledger::approval_ledger(state::journal& journal,
                                 const bastion::schema::identity_t& module,
                                 const bastion::schema::identity_t& account)
    : journal_{journal}, module_{module}, account_{account} {}

std::optional<bastion::schema::approval_config_t> approval_ledger::config()
    const {
  return journal_.get<bastion::schema::approval_config_t>(
      key::make_approval_config_key(journal_.encoder(), module_, account_));
}

bool approval_ledger::active() const {
  auto current = config();
  return current &&
         current->lifecycle == bastion::schema::module_lifecycle_t::active;
}

void approval_ledger::put_config(
    const bastion::schema::approval_config_t& config) {
  journal_.put(
      key::make_approval_config_key(journal_.encoder(), module_, account_),
      config);
}

bool approval_ledger::is_owner(const bastion::schema::identity_t& owner) const {
  return journal_
      .get_raw(key::make_approval_owner_key(journal_.encoder(), module_,
                                            account_, owner))
      .has_value();
}

void approval_ledger::add_member(const bastion::schema::identity_t& owner) {
  journal_.put(key::make_approval_owner_key(journal_.encoder(), module_,
                                            account_, owner),
               true);
}

void approval_ledger::remove_member(const bastion::schema::identity_t& owner) {
  journal_.erase(key::make_approval_owner_key(journal_.encoder(), module_,
                                              account_, owner));
}

bastion::schema::amount_t approval_ledger::escrow() const {
  return journal_
      .get<bastion::schema::amount_t>(
          key::make_approval_escrow_key(journal_.encoder(), module_, account_))
      .value_or(bastion::schema::amount_t{0});
}

void approval_ledger::credit_escrow(const bastion::schema::amount_t& amount) {
  journal_.put(
      key::make_approval_escrow_key(journal_.encoder(), module_, account_),
      bastion::schema::amount_t{escrow() + amount});
}

bool approval_ledger::debit_escrow(const bastion::schema::amount_t& amount) {
  auto available = escrow();
  if (available < amount) {
    return false;
  }
  journal_.put(
      key::make_approval_escrow_key(journal_.encoder(), module_, account_),
      bastion::schema::amount_t{available - amount});
  return true;
}

bastion::schema::transaction_id_t approval_ledger::next_id() const {
  return journal_
      .get<bastion::schema::transaction_id_t>(
          key::make_approval_next_id_key(journal_.encoder(), module_, account_))
      .value_or(0);
}

bastion::schema::transaction_id_t approval_ledger::allocate_id() {
  auto id = next_id();
  journal_.put(
      key::make_approval_next_id_key(journal_.encoder(), module_, account_),
      bastion::schema::transaction_id_t{id + 1});
  return id;
}

std::optional<bastion::schema::transaction_record_t>
approval_ledger::transaction(const bastion::schema::transaction_id_t id) const {
  return journal_.get<bastion::schema::transaction_record_t>(
      key::make_approval_transaction_key(journal_.encoder(), module_, account_,
                                         id));
}

void approval_ledger::put_transaction(
    const bastion::schema::transaction_record_t& record) {
  journal_.put(key::make_approval_transaction_key(journal_.encoder(), module_,
                                                  account_, record.id),
               record);
}

std::vector<bastion::schema::transaction_record_t>
approval_ledger::transactions() const {
  auto& encoder = journal_.encoder();
  auto records = std::vector<bastion::schema::transaction_record_t>{};
  for (const auto& [entry_key, value] : journal_.list_by_prefix(
           scope_prefix(key::kApprovalTransactionKeyPrefix))) {
    records.push_back(encoder.decode<bastion::schema::transaction_record_t>(
        bastion::schema::make_bytes_view(value)));
  }
  // Ids are encoded little-endian, so key order is not id order.
  std::ranges::sort(records, {}, &bastion::schema::transaction_record_t::id);
  return records;
}

std::vector<bastion::schema::transaction_id_t> approval_ledger::pending()
    const {
  auto ids = std::vector<bastion::schema::transaction_id_t>{};
  for (const auto& record : transactions()) {
    if (!record.executed) {
      ids.push_back(record.id);
    }
  }
  return ids;
}

std::optional<bastion::schema::confirmation_entry_t>
approval_ledger::confirmation(const bastion::schema::transaction_id_t id,
                              const bastion::schema::identity_t& owner) const {
  return journal_.get<bastion::schema::confirmation_entry_t>(
      key::make_approval_confirmation_key(journal_.encoder(), module_,
                                          account_, id, owner));
}

void approval_ledger::put_confirmation(
    const bastion::schema::confirmation_entry_t& entry) {
  auto& encoder = journal_.encoder();
  journal_.put(key::make_approval_confirmation_key(encoder, module_, account_,
                                                   entry.id, entry.owner),
               entry);
  journal_.put(key::make_approval_confirmed_by_key(encoder, module_, account_,
                                                   entry.owner, entry.id),
               entry);
}

void approval_ledger::erase_confirmation(
    const bastion::schema::transaction_id_t id,
    const bastion::schema::identity_t& owner) {
  auto& encoder = journal_.encoder();
  journal_.erase(key::make_approval_confirmation_key(encoder, module_,
                                                     account_, id, owner));
  journal_.erase(key::make_approval_confirmed_by_key(encoder, module_,
                                                     account_, owner, id));
}

std::vector<bastion::schema::identity_t> approval_ledger::confirming_owners(
    const bastion::schema::transaction_id_t id) const {
  auto& encoder = journal_.encoder();
  auto prefix = key::make_prefixed_key(
      encoder, key::kApprovalConfirmationKeyPrefix,
      std::tuple{module_, account_, id});
  auto owners = std::vector<bastion::schema::identity_t>{};
  for (const auto& [entry_key, value] : journal_.list_by_prefix(prefix)) {
    owners.push_back(encoder
                         .decode<bastion::schema::confirmation_entry_t>(
                             bastion::schema::make_bytes_view(value))
                         .owner);
  }
  return owners;
}

std::vector<bastion::schema::transaction_id_t> approval_ledger::confirmed_by(
    const bastion::schema::identity_t& owner) const {
  auto& encoder = journal_.encoder();
  auto prefix = key::make_prefixed_key(encoder,
                                       key::kApprovalConfirmedByKeyPrefix,
                                       std::tuple{module_, account_, owner});
  auto ids = std::vector<bastion::schema::transaction_id_t>{};
  for (const auto& [entry_key, value] : journal_.list_by_prefix(prefix)) {
    ids.push_back(encoder
                      .decode<bastion::schema::confirmation_entry_t>(
                          bastion::schema::make_bytes_view(value))
                      .id);
  }
  std::ranges::sort(ids);
  return ids;
}

std::optional<bastion::schema::transaction_status_t> approval_ledger::status(
    const bastion::schema::transaction_id_t id) const {
  auto record = transaction(id);
  if (!record) {
    return std::nullopt;
  }
  auto current = config();
  return bastion::schema::status_of(*record, current ? current->threshold : 0);
}

void approval_ledger::clear() {
  for (const auto prefix :
       {key::kApprovalConfigKeyPrefix, key::kApprovalOwnerKeyPrefix,
        key::kApprovalNextIdKeyPrefix, key::kApprovalTransactionKeyPrefix,
        key::kApprovalConfirmationKeyPrefix,
        key::kApprovalConfirmedByKeyPrefix, key::kApprovalEscrowKeyPrefix}) {
    journal_.erase_prefix(scope_prefix(prefix));
  }
}

bastion::schema::bytes_t approval_ledger::scope_prefix(
    const std::string_view prefix) const {
  return key::make_approval_scope_prefix_key(journal_.encoder(), prefix,
                                             module_, account_);
}

}  // namespace bastion::modules
