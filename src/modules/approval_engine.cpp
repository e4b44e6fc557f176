#include <bastion/account/account.hpp>
#include <bastion/blake3/hash.hpp>
#include <bastion/modules/approval_engine.hpp>
#include <bastion/schema/account_call.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace bastion::modules {

namespace {

using bastion::schema::call_result_t;
using bastion::schema::error_code;
using bastion::schema::identity_t;
using bastion::schema::make_attribute;
using bastion::schema::make_success;
using bastion::schema::to_hex;
using bastion::schema::transaction_id_t;

call_result_t fail(const error_code code, std::string log) {
  return bastion::schema::make_failure(code, std::move(log),
                                       kApprovalCodespace);
}

bastion::schema::event_t make_transaction_event(std::string type,
                                                const identity_t& account,
                                                const transaction_id_t id) {
  return bastion::schema::event_t{
      .type = std::move(type),
      .attributes = {make_attribute("account", to_hex(account)),
                     make_attribute("id", std::to_string(id))}};
}

bastion::schema::event_t make_owner_event(std::string type,
                                          const identity_t& account,
                                          const identity_t& owner) {
  return bastion::schema::event_t{
      .type = std::move(type),
      .attributes = {make_attribute("account", to_hex(account)),
                     make_attribute("owner", to_hex(owner))}};
}

const identity_t& account_of(const bastion::schema::approval_call_t& call) {
  return std::visit(
      [](const auto& value) -> const identity_t& { return value.account; },
      call);
}

bool has_duplicates(std::vector<identity_t> owners) {
  std::ranges::sort(owners);
  return std::ranges::adjacent_find(owners) != owners.end();
}

}  // namespace

approval_engine::approval_engine(const identity_t& self) : self_{self} {}

approval_ledger approval_engine::ledger(state::journal& journal,
                                        const identity_t& account) const {
  return approval_ledger{journal, self_, account};
}

std::variant<bastion::schema::approval_config_t, call_result_t>
approval_engine::require_owner(approval_ledger& ledger,
                               const identity_t& caller) const {
  auto config = ledger.config();
  if (!config ||
      config->lifecycle != bastion::schema::module_lifecycle_t::active) {
    return fail(error_code::module_not_initialized,
                "approval module is not active for account");
  }
  if (!ledger.is_owner(caller)) {
    return fail(error_code::caller_not_owner,
                "caller " + to_hex(caller) + " is not an owner");
  }
  return *config;
}

call_result_t approval_engine::on_install(host::runtime& rt,
                                          const host::call_context& context,
                                          const bastion::schema::bytes_t& data) {
  auto& journal = rt.journal();
  auto book = ledger(journal, context.caller);
  if (book.active()) {
    return fail(error_code::already_initialized,
                "approval module is already active for account");
  }

  auto setup = journal.encoder().try_decode<bastion::schema::approval_setup_t>(
      bastion::schema::make_bytes_view(data));
  if (!setup) {
    return fail(error_code::invalid_payload, "install data is malformed");
  }
  if (setup->threshold == 0 || setup->threshold > setup->owners.size()) {
    return fail(error_code::invalid_threshold,
                "threshold must be between 1 and the owner count");
  }
  if (std::ranges::any_of(setup->owners, [](const identity_t& owner) {
        return bastion::schema::is_null(owner);
      })) {
    return fail(error_code::null_identity, "owner must not be null");
  }
  if (has_duplicates(setup->owners)) {
    return fail(error_code::duplicate_owner, "owners must be unique");
  }

  for (const auto& owner : setup->owners) {
    book.add_member(owner);
  }
  book.put_config(bastion::schema::approval_config_t{
      .owners = setup->owners,
      .threshold = setup->threshold,
      .lifecycle = bastion::schema::module_lifecycle_t::active});
  if (context.value > 0) {
    book.credit_escrow(context.value);
  }

  spdlog::info("approval module active for account {} with {} owners, "
               "threshold {}",
               to_hex(context.caller), setup->owners.size(),
               setup->threshold);
  return make_success();
}

call_result_t approval_engine::on_uninstall(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::bytes_t&) {
  auto book = ledger(rt.journal(), context.caller);
  if (!book.active()) {
    return fail(error_code::module_not_initialized,
                "approval module is not active for account");
  }
  auto refund = book.escrow();
  book.clear();
  if (refund > 0) {
    auto returned = rt.call(self_, context.caller, refund,
                            bastion::schema::bytes_t{});
    if (!returned.ok()) {
      return returned;
    }
  }
  spdlog::info("approval state cleared for account {}, refunded {}",
               to_hex(context.caller), refund.str());
  return make_success();
}

bastion::schema::validation_code_t approval_engine::decide(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::authorization_request_t& request,
    const bastion::schema::hash32_t&) {
  using bastion::schema::validation_code_t;
  auto& journal = rt.journal();
  auto& encoder = journal.encoder();
  auto book = ledger(journal, context.caller);

  auto config = book.config();
  if (!config ||
      config->lifecycle != bastion::schema::module_lifecycle_t::active) {
    return validation_code_t::rejected;
  }

  auto proof = encoder.try_decode<bastion::schema::approval_proof_t>(
      bastion::schema::make_bytes_view(request.approval));
  if (!proof) {
    spdlog::debug("approval blob is malformed");
    return validation_code_t::rejected;
  }

  auto record = book.transaction(proof->id);
  if (!record || record->executed) {
    spdlog::debug("transaction {} is missing or executed", proof->id);
    return validation_code_t::rejected;
  }

  auto key = bastion::account::routing_key_of(
      bastion::schema::make_bytes_view(request.call_payload));
  if (!key) {
    return validation_code_t::rejected;
  }
  auto body = bastion::schema::bytes_view_t{request.call_payload}.subspan(
      key->size());
  auto call = encoder.try_decode<bastion::schema::account_call_t>(body);
  if (!call || !std::holds_alternative<bastion::schema::forward_t>(*call)) {
    spdlog::debug("call payload is not a single forward");
    return validation_code_t::rejected;
  }
  const auto& forwarded = std::get<bastion::schema::forward_t>(*call);
  if (make_content_hash(encoder, forwarded.target, forwarded.value,
                        forwarded.payload) != record->content_hash) {
    constexpr auto code = error_code::content_hash_mismatch;
    spdlog::warn("{} (code={}): content hash differs for transaction {} of "
                 "account {}",
                 bastion::schema::to_string(bastion::schema::category_of(code)),
                 static_cast<uint32_t>(code), proof->id,
                 to_hex(context.caller));
    return validation_code_t::rejected;
  }

  auto counted = std::set<identity_t>{};
  for (const auto& signer : proof->signers) {
    if (book.is_owner(signer) && book.confirmation(proof->id, signer)) {
      counted.insert(signer);
    }
  }
  if (counted.size() < config->threshold) {
    return validation_code_t::rejected;
  }
  return validation_code_t::accepted;
}

call_result_t approval_engine::on_extension(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::bytes_t& body) {
  auto call = rt.journal().encoder().try_decode<bastion::schema::approval_call_t>(
      bastion::schema::make_bytes_view(body));
  if (!call) {
    return fail(error_code::invalid_payload, "approval call is malformed");
  }
  if (context.value > 0) {
    // Value sent with a call is held for the account the call names.
    const auto& account = account_of(*call);
    ledger(rt.journal(), account).credit_escrow(context.value);
    rt.journal().emit(
        self_, bastion::schema::event_t{
                   .type = "escrow_credited",
                   .attributes = {make_attribute("account", to_hex(account)),
                                  make_attribute("from",
                                                 to_hex(context.caller)),
                                  make_attribute("value", context.value.str(),
                                                 false)}});
  }
  return std::visit(
      overloaded{
          [&](const bastion::schema::submit_transaction_t& value) {
            return submit_transaction(rt, context, value);
          },
          [&](const bastion::schema::confirm_transaction_t& value) {
            return confirm_transaction(rt, context, value);
          },
          [&](const bastion::schema::revoke_confirmation_t& value) {
            return revoke_confirmation(rt, context, value);
          },
          [&](const bastion::schema::execute_transaction_t& value) {
            return execute_transaction(rt, context, value);
          },
          [&](const bastion::schema::add_owner_t& value) {
            return add_owner(rt, context, value);
          },
          [&](const bastion::schema::remove_owner_t& value) {
            return remove_owner(rt, context, value);
          },
          [&](const bastion::schema::change_threshold_t& value) {
            return change_threshold(rt, context, value);
          }},
      *call);
}

call_result_t approval_engine::submit_transaction(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::submit_transaction_t& call) {
  auto& journal = rt.journal();
  auto book = ledger(journal, call.account);
  auto gate = require_owner(book, context.caller);
  if (auto* failure = std::get_if<call_result_t>(&gate)) {
    return *failure;
  }
  if (bastion::schema::is_null(call.target)) {
    return fail(error_code::null_identity, "target must not be null");
  }

  auto id = book.allocate_id();
  book.put_transaction(bastion::schema::transaction_record_t{
      .id = id,
      .target = call.target,
      .value = call.value,
      .payload = call.payload,
      .content_hash = make_content_hash(journal.encoder(), call.target,
                                        call.value, call.payload),
      .executed = false,
      .confirmations = 0,
      .submitted_by = context.caller,
      .created_at = rt.now()});

  auto event = make_transaction_event("transaction_submitted", call.account, id);
  event.attributes.push_back(make_attribute("submitter", to_hex(context.caller)));
  event.attributes.push_back(make_attribute("target", to_hex(call.target)));
  event.attributes.push_back(make_attribute("value", call.value.str(), false));
  journal.emit(self_, std::move(event));

  auto confirmed = confirm_transaction(
      rt, context,
      bastion::schema::confirm_transaction_t{.account = call.account, .id = id});
  if (!confirmed.ok()) {
    return confirmed;
  }
  return make_success(journal.encoder().encode(id));
}

call_result_t approval_engine::confirm_transaction(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::confirm_transaction_t& call) {
  auto& journal = rt.journal();
  auto book = ledger(journal, call.account);
  auto gate = require_owner(book, context.caller);
  if (auto* failure = std::get_if<call_result_t>(&gate)) {
    return *failure;
  }

  auto record = book.transaction(call.id);
  if (!record) {
    return fail(error_code::transaction_missing,
                "transaction " + std::to_string(call.id) + " does not exist");
  }
  if (record->executed) {
    return fail(error_code::already_executed,
                "transaction " + std::to_string(call.id) + " is executed");
  }
  if (book.confirmation(call.id, context.caller)) {
    return fail(error_code::already_confirmed,
                "owner already confirmed transaction " +
                    std::to_string(call.id));
  }

  book.put_confirmation(bastion::schema::confirmation_entry_t{
      .id = call.id, .owner = context.caller, .confirmed_at = rt.now()});
  ++record->confirmations;
  book.put_transaction(*record);

  auto event = make_transaction_event("transaction_confirmed", call.account,
                                      call.id);
  event.attributes.push_back(make_attribute("owner", to_hex(context.caller)));
  journal.emit(self_, std::move(event));
  return make_success();
}

call_result_t approval_engine::revoke_confirmation(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::revoke_confirmation_t& call) {
  auto& journal = rt.journal();
  auto book = ledger(journal, call.account);
  auto gate = require_owner(book, context.caller);
  if (auto* failure = std::get_if<call_result_t>(&gate)) {
    return *failure;
  }

  auto record = book.transaction(call.id);
  if (!record) {
    return fail(error_code::transaction_missing,
                "transaction " + std::to_string(call.id) + " does not exist");
  }
  if (record->executed) {
    return fail(error_code::already_executed,
                "transaction " + std::to_string(call.id) + " is executed");
  }
  if (!book.confirmation(call.id, context.caller)) {
    return fail(error_code::confirmation_missing,
                "owner has not confirmed transaction " +
                    std::to_string(call.id));
  }

  book.erase_confirmation(call.id, context.caller);
  --record->confirmations;
  book.put_transaction(*record);

  auto event = make_transaction_event("confirmation_revoked", call.account,
                                      call.id);
  event.attributes.push_back(make_attribute("owner", to_hex(context.caller)));
  journal.emit(self_, std::move(event));
  return make_success();
}

call_result_t approval_engine::execute_transaction(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::execute_transaction_t& call) {
  auto& journal = rt.journal();
  auto book = ledger(journal, call.account);
  auto gate = require_owner(book, context.caller);
  if (auto* failure = std::get_if<call_result_t>(&gate)) {
    return *failure;
  }
  const auto& config = std::get<bastion::schema::approval_config_t>(gate);

  auto record = book.transaction(call.id);
  if (!record) {
    return fail(error_code::transaction_missing,
                "transaction " + std::to_string(call.id) + " does not exist");
  }
  if (record->executed) {
    return fail(error_code::already_executed,
                "transaction " + std::to_string(call.id) + " is executed");
  }
  if (record->confirmations < config.threshold) {
    return fail(error_code::threshold_not_met,
                "transaction " + std::to_string(call.id) + " has " +
                    std::to_string(record->confirmations) + " of " +
                    std::to_string(config.threshold) + " confirmations");
  }

  record->executed = true;
  book.put_transaction(*record);

  auto result = call_result_t{};
  if (book.debit_escrow(record->value)) {
    result = rt.call(self_, record->target, record->value, record->payload);
    if (!result.ok()) {
      book.credit_escrow(record->value);
    }
  } else {
    result = fail(error_code::insufficient_balance,
                  "escrow of account " + to_hex(call.account) +
                      " does not cover the transaction value");
  }
  auto outcome = bastion::schema::execution_outcome_t{
      .id = call.id, .success = result.ok(), .code = result.code,
      .data = result.data};
  if (result.ok()) {
    journal.emit(self_, make_transaction_event("execution_success",
                                               call.account, call.id));
    spdlog::info("executed transaction {} of account {}", call.id,
                 to_hex(call.account));
  } else {
    // The attempt is kept; the transaction becomes executable again.
    record->executed = false;
    book.put_transaction(*record);
    auto event =
        make_transaction_event("execution_failure", call.account, call.id);
    event.attributes.push_back(
        make_attribute("code", std::to_string(result.code)));
    event.attributes.push_back(
        make_attribute("data", bastion::schema::to_hex(
                                   bastion::schema::make_bytes_view(result.data)),
                       false));
    journal.emit(self_, std::move(event));
    spdlog::warn("transaction {} of account {} failed to execute: code={}",
                 call.id, to_hex(call.account), result.code);
  }
  return make_success(journal.encoder().encode(outcome));
}

call_result_t approval_engine::add_owner(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::add_owner_t& call) {
  auto& journal = rt.journal();
  auto book = ledger(journal, call.account);
  auto gate = require_owner(book, context.caller);
  if (auto* failure = std::get_if<call_result_t>(&gate)) {
    return *failure;
  }
  auto config = std::get<bastion::schema::approval_config_t>(std::move(gate));

  if (bastion::schema::is_null(call.owner)) {
    return fail(error_code::null_identity, "owner must not be null");
  }
  if (book.is_owner(call.owner)) {
    return fail(error_code::owner_exists,
                "owner " + to_hex(call.owner) + " already exists");
  }

  config.owners.push_back(call.owner);
  book.add_member(call.owner);
  book.put_config(config);
  journal.emit(self_, make_owner_event("owner_added", call.account, call.owner));
  return make_success();
}

call_result_t approval_engine::remove_owner(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::remove_owner_t& call) {
  auto& journal = rt.journal();
  auto book = ledger(journal, call.account);
  auto gate = require_owner(book, context.caller);
  if (auto* failure = std::get_if<call_result_t>(&gate)) {
    return *failure;
  }
  auto config = std::get<bastion::schema::approval_config_t>(std::move(gate));

  if (!book.is_owner(call.owner)) {
    return fail(error_code::owner_missing,
                "owner " + to_hex(call.owner) + " does not exist");
  }
  if (config.owners.size() - 1 < config.threshold) {
    return fail(error_code::owner_count_below_threshold,
                "removing owner would leave fewer owners than the threshold");
  }

  std::erase(config.owners, call.owner);
  book.remove_member(call.owner);
  book.put_config(config);

  // Keep each pending counter equal to its present confirmations.
  for (const auto id : book.confirmed_by(call.owner)) {
    auto record = book.transaction(id);
    if (!record || record->executed) {
      continue;
    }
    book.erase_confirmation(id, call.owner);
    --record->confirmations;
    book.put_transaction(*record);
    auto event = make_transaction_event("confirmation_revoked", call.account, id);
    event.attributes.push_back(make_attribute("owner", to_hex(call.owner)));
    journal.emit(self_, std::move(event));
  }

  journal.emit(self_,
               make_owner_event("owner_removed", call.account, call.owner));
  return make_success();
}

call_result_t approval_engine::change_threshold(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::change_threshold_t& call) {
  auto& journal = rt.journal();
  auto book = ledger(journal, call.account);
  auto gate = require_owner(book, context.caller);
  if (auto* failure = std::get_if<call_result_t>(&gate)) {
    return *failure;
  }
  auto config = std::get<bastion::schema::approval_config_t>(std::move(gate));

  if (call.threshold == 0 || call.threshold > config.owners.size()) {
    return fail(error_code::invalid_threshold,
                "threshold must be between 1 and the owner count");
  }

  config.threshold = call.threshold;
  book.put_config(config);
  journal.emit(self_, bastion::schema::event_t{
                          .type = "threshold_changed",
                          .attributes = {make_attribute("account",
                                                        to_hex(call.account)),
                                         make_attribute(
                                             "threshold",
                                             std::to_string(call.threshold))}});
  return make_success();
}

std::optional<bastion::schema::approval_config_t>
approval_engine::configuration(state::journal& journal,
                               const identity_t& account) const {
  return ledger(journal, account).config();
}

std::optional<bastion::schema::transaction_record_t>
approval_engine::transaction(state::journal& journal,
                             const identity_t& account,
                             const transaction_id_t id) const {
  return ledger(journal, account).transaction(id);
}

std::vector<identity_t> approval_engine::confirmations(
    state::journal& journal,
    const identity_t& account,
    const transaction_id_t id) const {
  return ledger(journal, account).confirming_owners(id);
}

bool approval_engine::is_owner(state::journal& journal,
                               const identity_t& account,
                               const identity_t& owner) const {
  return ledger(journal, account).is_owner(owner);
}

std::vector<transaction_id_t> approval_engine::pending(
    state::journal& journal,
    const identity_t& account) const {
  return ledger(journal, account).pending();
}

std::vector<transaction_id_t> approval_engine::confirmed_by(
    state::journal& journal,
    const identity_t& account,
    const identity_t& owner) const {
  return ledger(journal, account).confirmed_by(owner);
}

uint64_t approval_engine::transaction_count(state::journal& journal,
                                            const identity_t& account) const {
  return ledger(journal, account).next_id();
}

bastion::schema::amount_t approval_engine::escrow_of(
    state::journal& journal,
    const identity_t& account) const {
  return ledger(journal, account).escrow();
}

std::optional<bastion::schema::transaction_status_t> approval_engine::status(
    state::journal& journal,
    const identity_t& account,
    const transaction_id_t id) const {
  return ledger(journal, account).status(id);
}

bastion::schema::hash32_t make_content_hash(
    state::encoder_t& encoder,
    const identity_t& target,
    const bastion::schema::amount_t& value,
    const bastion::schema::bytes_t& payload) {
  return bastion::blake3::hash_encoded(encoder,
                                       std::tuple{target, value, payload});
}

}  // namespace bastion::modules
