#include <bastion/account/account.hpp>
#include <bastion/blake3/hash.hpp>
#include <bastion/crypto/secp256k1.hpp>
#include <bastion/schema/key/state_keys.hpp>
#include <bastion/schema/module_call.hpp>
#include <bastion/schema/validation_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace bastion::account {

namespace {

using bastion::schema::call_result_t;
using bastion::schema::error_code;
using bastion::schema::make_attribute;
using bastion::schema::make_failure;
using bastion::schema::make_success;

std::string routing_key_hex(const bastion::schema::routing_key_t& key) {
  return bastion::schema::to_hex(
      bastion::schema::bytes_view_t{key.data(), key.size()});
}

call_result_t make_validation_result(
    state::encoder_t& encoder,
    const bastion::schema::validation_code_t code) {
  return make_success(encoder.encode(static_cast<uint32_t>(code)));
}

}  // namespace

account::account(const bastion::schema::identity_t& self,
                 const bastion::schema::identity_t& dispatcher)
    : self_{self}, dispatcher_{dispatcher} {}

call_result_t account::handle(host::runtime& rt,
                              const host::call_context& context) {
  if (context.payload.empty()) {
    return receive(rt, context);
  }

  auto& encoder = rt.journal().encoder();
  auto call = encoder.try_decode<bastion::schema::account_call_t>(
      bastion::schema::make_bytes_view(context.payload));
  if (!call) {
    return make_failure(error_code::invalid_payload,
                        "account call payload is malformed", kCodespace);
  }

  return std::visit(
      overloaded{
          [&](const bastion::schema::authorize_t& value) {
            return authorize(rt, context, value);
          },
          [&](const bastion::schema::install_module_t& value) {
            auto capability = mint(context);
            if (!capability) {
              return make_failure(error_code::caller_not_self,
                                  "install requires a self call", kCodespace);
            }
            return install(rt, *capability, value);
          },
          [&](const bastion::schema::uninstall_module_t& value) {
            auto capability = mint(context);
            if (!capability) {
              return make_failure(error_code::caller_not_self,
                                  "uninstall requires a self call",
                                  kCodespace);
            }
            return uninstall(rt, *capability, value);
          },
          [&](const bastion::schema::forward_t& value) {
            return forward(rt, context, value);
          },
          [&](const bastion::schema::forward_batch_t& value) {
            return forward_batch(rt, context, value);
          }},
      *call);
}

call_result_t account::authorize(host::runtime& rt,
                                 const host::call_context& context,
                                 const bastion::schema::authorize_t& call) {
  if (context.caller != dispatcher_) {
    return make_failure(error_code::caller_not_dispatcher,
                        "authorize is reserved to the trusted dispatcher",
                        kCodespace);
  }

  if (call.shortfall > 0) {
    auto prefund = rt.call(self_, context.caller, call.shortfall, {});
    if (!prefund.ok()) {
      return make_failure(error_code::prefund_failed,
                          "failed to return prefund shortfall to dispatcher",
                          kCodespace, prefund.data);
    }
  }

  auto key = routing_key_of(
      bastion::schema::make_bytes_view(call.request.call_payload));
  if (!key) {
    return make_failure(error_code::invalid_payload,
                        "call payload is shorter than a routing key",
                        kCodespace);
  }

  auto route = resolve(rt.journal(), *key);
  auto decision = decide(rt, call, route);
  if (!decision.ok()) {
    return decision;
  }

  auto& encoder = rt.journal().encoder();
  auto code = encoder.decode<uint32_t>(
      bastion::schema::make_bytes_view(decision.data));
  if (code == static_cast<uint32_t>(bastion::schema::validation_code_t::accepted)) {
    auto sequence_key = bastion::schema::key::make_sequence_key(encoder, self_);
    auto sequence = rt.journal().get<uint64_t>(sequence_key).value_or(0);
    rt.journal().put(sequence_key, uint64_t{sequence + 1});
  } else {
    spdlog::warn("account {} rejected request with routing key {}",
                 bastion::schema::to_hex(self_), routing_key_hex(*key));
  }
  return decision;
}

call_result_t account::decide(host::runtime& rt,
                              const bastion::schema::authorize_t& call,
                              const route_t& route) {
  auto& encoder = rt.journal().encoder();
  return std::visit(
      overloaded{
          [&](const module_route& value) {
            spdlog::debug("routing authorization to module {}",
                          bastion::schema::to_hex(value.module));
            auto envelope = bastion::schema::module_call_t{
                bastion::schema::decide_t{.request = call.request,
                                          .request_hash = call.request_hash}};
            auto result =
                rt.call(self_, value.module, 0, encoder.encode(envelope));
            if (!result.ok()) {
              return result;
            }
            auto code = encoder.try_decode<uint32_t>(
                bastion::schema::make_bytes_view(result.data));
            if (!code) {
              return make_failure(error_code::invalid_payload,
                                  "module returned a malformed decision",
                                  kCodespace, result.data);
            }
            return make_success(encoder.encode(*code));
          },
          [&](const default_route&) {
            // Weak fallback: any recoverable signer is accepted. There is no
            // owner binding on this path.
            auto digest = make_default_route_digest(encoder, call.request_hash,
                                                    self_, rt.chain_id());
            auto signer = bastion::crypto::recover_identity(
                digest, bastion::schema::make_bytes_view(call.request.approval));
            if (bastion::schema::is_null(signer)) {
              return make_validation_result(
                  encoder, bastion::schema::validation_code_t::rejected);
            }
            spdlog::warn(
                "account {} accepted request on the default route for signer "
                "{}",
                bastion::schema::to_hex(self_), bastion::schema::to_hex(signer));
            return make_validation_result(
                encoder, bastion::schema::validation_code_t::accepted);
          }},
      route);
}

call_result_t account::install(host::runtime& rt,
                               const self_capability&,
                               const bastion::schema::install_module_t& call) {
  auto& journal = rt.journal();
  auto& encoder = journal.encoder();
  if (bastion::schema::is_null(call.module)) {
    return make_failure(error_code::null_identity,
                        "module identity must not be null", kCodespace);
  }
  auto registry_key =
      bastion::schema::key::make_registry_key(encoder, self_, call.key);
  if (journal.get_raw(registry_key)) {
    return make_failure(error_code::module_already_installed,
                        "routing key " + routing_key_hex(call.key) +
                            " is already bound",
                        kCodespace);
  }

  journal.put(registry_key,
              bastion::schema::registry_entry_t{.key = call.key,
                                                .module = call.module,
                                                .installed_at = rt.now()});

  auto hook = bastion::schema::module_call_t{
      bastion::schema::install_hook_t{.data = call.init_data}};
  auto result = rt.call(self_, call.module, 0, encoder.encode(hook));
  if (!result.ok()) {
    return result;
  }

  journal.emit(self_,
               bastion::schema::event_t{
                   .type = "module_installed",
                   .attributes = {make_attribute("account",
                                                 bastion::schema::to_hex(self_)),
                                  make_attribute("routing_key",
                                                 routing_key_hex(call.key)),
                                  make_attribute("module",
                                                 bastion::schema::to_hex(
                                                     call.module))}});
  spdlog::info("account {} installed module {} under routing key {}",
               bastion::schema::to_hex(self_),
               bastion::schema::to_hex(call.module), routing_key_hex(call.key));
  return make_success();
}

call_result_t account::uninstall(
    host::runtime& rt,
    const self_capability&,
    const bastion::schema::uninstall_module_t& call) {
  auto& journal = rt.journal();
  auto& encoder = journal.encoder();
  auto registry_key =
      bastion::schema::key::make_registry_key(encoder, self_, call.key);
  auto entry = journal.get<bastion::schema::registry_entry_t>(registry_key);
  if (!entry) {
    return make_failure(error_code::module_not_installed,
                        "routing key " + routing_key_hex(call.key) +
                            " is not bound",
                        kCodespace);
  }

  journal.erase(registry_key);

  auto hook = bastion::schema::module_call_t{
      bastion::schema::uninstall_hook_t{.data = call.data}};
  auto result = rt.call(self_, entry->module, 0, encoder.encode(hook));
  if (!result.ok()) {
    return result;
  }

  journal.emit(self_,
               bastion::schema::event_t{
                   .type = "module_uninstalled",
                   .attributes = {make_attribute("account",
                                                 bastion::schema::to_hex(self_)),
                                  make_attribute("routing_key",
                                                 routing_key_hex(call.key)),
                                  make_attribute("module",
                                                 bastion::schema::to_hex(
                                                     entry->module))}});
  spdlog::info("account {} uninstalled module {} from routing key {}",
               bastion::schema::to_hex(self_),
               bastion::schema::to_hex(entry->module),
               routing_key_hex(call.key));
  return make_success();
}

call_result_t account::forward(host::runtime& rt,
                               const host::call_context& context,
                               const bastion::schema::forward_t& call) {
  if (!may_forward(context)) {
    return make_failure(error_code::caller_not_authorized,
                        "forward requires the account or its dispatcher",
                        kCodespace);
  }
  auto result = rt.call(self_, call.target, call.value, call.payload);
  if (!result.ok()) {
    spdlog::warn("account {} forwarded call to {} failed: code={}",
                 bastion::schema::to_hex(self_),
                 bastion::schema::to_hex(call.target), result.code);
    return result;
  }
  return make_success(std::move(result.data));
}

call_result_t account::forward_batch(
    host::runtime& rt,
    const host::call_context& context,
    const bastion::schema::forward_batch_t& call) {
  if (!may_forward(context)) {
    return make_failure(error_code::caller_not_authorized,
                        "forward requires the account or its dispatcher",
                        kCodespace);
  }
  if (call.targets.size() != call.values.size() ||
      call.targets.size() != call.payloads.size()) {
    return make_failure(error_code::mismatched_batch,
                        "batch targets, values and payloads differ in length",
                        kCodespace);
  }
  for (size_t i = 0; i < call.targets.size(); ++i) {
    auto result =
        rt.call(self_, call.targets[i], call.values[i], call.payloads[i]);
    if (!result.ok()) {
      spdlog::warn("account {} batch entry {} failed: code={}",
                   bastion::schema::to_hex(self_), i, result.code);
      return result;
    }
  }
  return make_success();
}

route_t account::resolve(state::journal& journal,
                         const bastion::schema::routing_key_t& key) const {
  auto entry = installed_module(journal, self_, key);
  if (entry) {
    return module_route{.module = entry->module};
  }
  return default_route{};
}

std::optional<self_capability> account::mint(
    const host::call_context& context) const {
  if (context.caller != self_) {
    return std::nullopt;
  }
  return self_capability{};
}

bool account::may_forward(const host::call_context& context) const {
  return context.caller == self_ || context.caller == dispatcher_;
}

call_result_t account::receive(host::runtime& rt,
                               const host::call_context& context) {
  rt.journal().emit(
      self_, bastion::schema::event_t{
                 .type = "received",
                 .attributes = {make_attribute("account",
                                               bastion::schema::to_hex(self_)),
                                make_attribute("sender",
                                               bastion::schema::to_hex(
                                                   context.caller)),
                                make_attribute("value",
                                               context.value.str(), false)}});
  return make_success();
}

bastion::schema::hash32_t make_default_route_digest(
    state::encoder_t& encoder,
    const bastion::schema::hash32_t& request_hash,
    const bastion::schema::identity_t& account,
    const uint64_t chain_id) {
  return bastion::blake3::hash_encoded(
      encoder, std::tuple{request_hash, account, chain_id});
}

std::optional<bastion::schema::routing_key_t> routing_key_of(
    const bastion::schema::bytes_view_t& call_payload) {
  auto key = bastion::schema::routing_key_t{};
  if (call_payload.size() < key.size()) {
    return std::nullopt;
  }
  std::copy_n(call_payload.begin(), key.size(), key.begin());
  return key;
}

bastion::schema::bytes_t make_call_payload(
    state::encoder_t& encoder,
    const bastion::schema::routing_key_t& key,
    const bastion::schema::account_call_t& call) {
  auto payload = bastion::schema::bytes_t{key.begin(), key.end()};
  encoder.encode(call, payload);
  return payload;
}

std::optional<bastion::schema::registry_entry_t> installed_module(
    state::journal& journal,
    const bastion::schema::identity_t& account,
    const bastion::schema::routing_key_t& key) {
  return journal.get<bastion::schema::registry_entry_t>(
      bastion::schema::key::make_registry_key(journal.encoder(), account, key));
}

std::vector<bastion::schema::registry_entry_t> list_registry(
    state::journal& journal,
    const bastion::schema::identity_t& account) {
  auto& encoder = journal.encoder();
  auto entries = std::vector<bastion::schema::registry_entry_t>{};
  for (const auto& [key, value] : journal.list_by_prefix(
           bastion::schema::key::make_registry_prefix_key(encoder, account))) {
    entries.push_back(encoder.decode<bastion::schema::registry_entry_t>(
        bastion::schema::make_bytes_view(value)));
  }
  return entries;
}

uint64_t sequence_of(state::journal& journal,
                     const bastion::schema::identity_t& account) {
  return journal
      .get<uint64_t>(bastion::schema::key::make_sequence_key(journal.encoder(),
                                                             account))
      .value_or(0);
}

}  // namespace bastion::account
