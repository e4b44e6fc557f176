#include <bastion/account/account.hpp>
#include <bastion/blake3/hash.hpp>
#include <bastion/dispatcher/dispatcher.hpp>
#include <bastion/schema/key/state_keys.hpp>
#include <bastion/schema/validation_code.hpp>

#include <spdlog/spdlog.h>

#include <limits>

namespace bastion::dispatcher {

namespace {

using bastion::schema::amount_t;
using bastion::schema::bytes_view_t;
using bastion::schema::call_result_t;
using bastion::schema::error_code;
using bastion::schema::make_attribute;
using bastion::schema::make_failure;
using bastion::schema::make_success;
using bastion::schema::to_hex;

bastion::schema::hash32_t hash_bytes(const bastion::schema::bytes_t& bytes) {
  return bastion::blake3::hash(bytes_view_t{bytes.data(), bytes.size()});
}

}  // namespace

dispatcher::dispatcher(const bastion::schema::identity_t& self)
    : self_{self} {}

call_result_t dispatcher::handle(host::runtime& rt,
                                 const host::call_context& context) {
  if (context.payload.empty()) {
    // Plain value transfers top up the sender's own deposit.
    return deposit_to(rt, context,
                      bastion::schema::deposit_to_t{.account = context.caller});
  }
  auto call = rt.journal().encoder().try_decode<bastion::schema::dispatcher_call_t>(
      bastion::schema::make_bytes_view(context.payload));
  if (!call) {
    return make_failure(error_code::invalid_payload,
                        "dispatcher call payload is malformed", kCodespace);
  }
  return std::visit(
      overloaded{[&](const bastion::schema::deposit_to_t& value) {
                   return deposit_to(rt, context, value);
                 },
                 [&](const bastion::schema::withdraw_to_t& value) {
                   return withdraw_to(rt, context, value);
                 },
                 [&](const bastion::schema::handle_requests_t& value) {
                   return handle_requests(rt, context, value);
                 }},
      *call);
}

call_result_t dispatcher::deposit_to(host::runtime& rt,
                                     const host::call_context& context,
                                     const bastion::schema::deposit_to_t& call) {
  if (bastion::schema::is_null(call.account)) {
    return make_failure(error_code::null_identity,
                        "deposit account must not be null", kCodespace);
  }
  auto& journal = rt.journal();
  credit(journal, call.account, context.value);
  journal.emit(self_,
               bastion::schema::event_t{
                   .type = "deposited",
                   .attributes = {make_attribute("account",
                                                 to_hex(call.account)),
                                  make_attribute("total",
                                                 deposit_of(journal,
                                                            call.account)
                                                     .str(),
                                                 false)}});
  return make_success();
}

call_result_t dispatcher::withdraw_to(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::withdraw_to_t& call) {
  auto& journal = rt.journal();
  auto available = deposit_of(journal, context.caller);
  if (available < call.amount) {
    return make_failure(error_code::insufficient_balance,
                        "withdrawal exceeds deposit", kCodespace);
  }
  journal.put(bastion::schema::key::make_deposit_key(journal.encoder(), self_,
                                                     context.caller),
              amount_t{available - call.amount});
  auto sent = rt.call(self_, call.destination, call.amount, {});
  if (!sent.ok()) {
    return sent;
  }
  journal.emit(self_,
               bastion::schema::event_t{
                   .type = "withdrawn",
                   .attributes = {make_attribute("account",
                                                 to_hex(context.caller)),
                                  make_attribute("destination",
                                                 to_hex(call.destination)),
                                  make_attribute("amount", call.amount.str(),
                                                 false)}});
  return make_success();
}

call_result_t dispatcher::handle_requests(
    host::runtime& rt,
    const host::call_context&,
    const bastion::schema::handle_requests_t& call) {
  auto& journal = rt.journal();
  auto& encoder = journal.encoder();

  for (size_t index = 0; index < call.requests.size(); ++index) {
    const auto& request = call.requests[index];
    if (!rt.has_endpoint(request.sender)) {
      return make_failure(error_code::endpoint_missing,
                          "request " + std::to_string(index) +
                              " names a sender with no account",
                          kCodespace);
    }

    auto hash = request_hash(rt, request);
    auto prefund = required_prefund(request);
    if (!prefund) {
      return make_failure(error_code::invalid_payload,
                          "request " + std::to_string(index) +
                              " prefund exceeds the amount range",
                          kCodespace);
    }
    auto deposit = deposit_of(journal, request.sender);
    auto shortfall = *prefund > deposit ? amount_t{*prefund - deposit}
                                        : amount_t{0};

    // The shortfall comes back as a plain transfer, which tops up the deposit.
    auto authorize = bastion::schema::account_call_t{bastion::schema::authorize_t{
        .request = request, .request_hash = hash, .shortfall = shortfall}};
    auto verdict =
        rt.call(self_, request.sender, 0, encoder.encode(authorize));
    if (!verdict.ok()) {
      return verdict;
    }
    auto code = encoder.try_decode<uint32_t>(
        bastion::schema::make_bytes_view(verdict.data));
    if (!code ||
        *code !=
            static_cast<uint32_t>(bastion::schema::validation_code_t::accepted)) {
      spdlog::warn("request {} from {} rejected", index,
                   to_hex(request.sender));
      return make_failure(error_code::request_rejected,
                          "request " + std::to_string(index) +
                              " was rejected by its account",
                          kCodespace);
    }
    // The account sees the call body without its routing key.
    auto body = bastion::schema::bytes_t{};
    constexpr auto kKeySize = std::tuple_size_v<bastion::schema::routing_key_t>;
    if (request.call_payload.size() > kKeySize) {
      body.assign(request.call_payload.begin() + kKeySize,
                  request.call_payload.end());
    }
    auto executed = call_result_t{};
    if (!body.empty()) {
      executed = rt.call(self_, request.sender, 0, body);
    }
    if (!executed.ok()) {
      spdlog::warn("request {} from {} failed during execution: code={}",
                   index, to_hex(request.sender), executed.code);
    }

    journal.emit(self_,
                 bastion::schema::event_t{
                     .type = "request_processed",
                     .attributes = {
                         make_attribute("request_hash", to_hex(hash)),
                         make_attribute("sender", to_hex(request.sender)),
                         make_attribute("sequence",
                                        std::to_string(request.sequence)),
                         make_attribute("success",
                                        executed.ok() ? "true" : "false"),
                         make_attribute("code", std::to_string(executed.code),
                                        false),
                         make_attribute("beneficiary",
                                        to_hex(call.beneficiary), false)}});
  }
  return make_success();
}

bastion::schema::amount_t dispatcher::deposit_of(
    state::journal& journal,
    const bastion::schema::identity_t& account) const {
  return journal
      .get<amount_t>(bastion::schema::key::make_deposit_key(journal.encoder(),
                                                            self_, account))
      .value_or(amount_t{0});
}

bastion::schema::hash32_t dispatcher::request_hash(
    host::runtime& rt,
    const bastion::schema::authorization_request_t& request) const {
  return make_request_hash(rt.journal().encoder(), request, self_,
                           rt.chain_id());
}

void dispatcher::credit(state::journal& journal,
                        const bastion::schema::identity_t& account,
                        const bastion::schema::amount_t& amount) {
  auto key =
      bastion::schema::key::make_deposit_key(journal.encoder(), self_, account);
  auto current = journal.get<amount_t>(key).value_or(amount_t{0});
  journal.put(key, amount_t{current + amount});
}

bastion::schema::hash32_t make_request_digest(
    state::encoder_t& encoder,
    const bastion::schema::authorization_request_t& request) {
  return bastion::blake3::hash_encoded(
      encoder,
      std::tuple{request.sender, request.sequence,
                 hash_bytes(request.init_payload),
                 hash_bytes(request.call_payload), request.call_budget,
                 request.verification_budget, request.pre_verification_budget,
                 request.max_fee, request.max_priority_fee,
                 hash_bytes(request.auxiliary_payload)});
}

bastion::schema::hash32_t make_request_hash(
    state::encoder_t& encoder,
    const bastion::schema::authorization_request_t& request,
    const bastion::schema::identity_t& dispatcher,
    const uint64_t chain_id) {
  return bastion::blake3::hash_encoded(
      encoder,
      std::tuple{make_request_digest(encoder, request), dispatcher, chain_id});
}

std::optional<bastion::schema::amount_t> required_prefund(
    const bastion::schema::authorization_request_t& request) {
  auto budget = amount_t{amount_t{request.call_budget} +
                         amount_t{request.verification_budget} +
                         amount_t{request.pre_verification_budget}};
  if (budget != 0 &&
      request.max_fee > std::numeric_limits<amount_t>::max() / budget) {
    return std::nullopt;
  }
  return amount_t{budget * request.max_fee};
}

}  // namespace bastion::dispatcher
