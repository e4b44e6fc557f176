#include <bastion/host/runtime.hpp>
#include <bastion/schema/key/state_keys.hpp>

#include <spdlog/spdlog.h>

namespace bastion::host {

namespace {

inline constexpr auto kCodespace = std::string_view{"bastion.host"};

}  // namespace

runtime::runtime(state::storage_t& store, runtime_options options)
    : options_{options}, journal_{store}, now_ms_{options.initial_time_ms} {}

void runtime::attach(const bastion::schema::identity_t& identity,
                     std::shared_ptr<endpoint> handler) {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("attached endpoint '{}' at {}", handler->name(),
               bastion::schema::to_hex(identity));
  endpoints_[identity] = std::move(handler);
}

bool runtime::has_endpoint(const bastion::schema::identity_t& identity) const {
  return endpoints_.contains(identity);
}

bastion::schema::call_result_t runtime::submit(
    const bastion::schema::identity_t& caller,
    const bastion::schema::identity_t& target,
    const bastion::schema::amount_t& value,
    const bastion::schema::bytes_t& payload) {
  auto lock = std::scoped_lock{mutex_};
  auto result = call(caller, target, value, payload);
  result.events = journal_.staged_events();
  auto committed = journal_.flush();
  if (!result.ok()) {
    spdlog::warn("step {} failed: code={} codespace={} log={}",
                 committed.height, result.code, result.codespace, result.log);
  }
  return result;
}

bastion::schema::call_result_t runtime::call(
    const bastion::schema::identity_t& caller,
    const bastion::schema::identity_t& target,
    const bastion::schema::amount_t& value,
    const bastion::schema::bytes_t& payload) {
  auto frame = state::frame_guard{journal_};

  if (value > 0) {
    auto moved = transfer(caller, target, value);
    if (!moved.ok()) {
      return moved;
    }
  }

  auto handler = endpoints_.find(target);
  if (handler == endpoints_.end()) {
    // Plain identities accept value and ignore the payload.
    frame.commit();
    return bastion::schema::make_success();
  }

  auto context = call_context{
      .caller = caller, .self = target, .value = value, .payload = payload};
  auto result = handler->second->handle(*this, context);
  if (result.ok()) {
    frame.commit();
  } else {
    spdlog::debug("call into '{}' unwound: code={} log={}",
                  handler->second->name(), result.code, result.log);
  }
  return result;
}

bastion::storage::committed_state runtime::fund(
    const bastion::schema::identity_t& identity,
    const bastion::schema::amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto key =
      bastion::schema::key::make_balance_key(journal_.encoder(), identity);
  auto balance =
      journal_.get<bastion::schema::amount_t>(key).value_or(
          bastion::schema::amount_t{0});
  journal_.put(key, bastion::schema::amount_t{balance + amount});
  return journal_.flush();
}

bastion::schema::amount_t runtime::balance_of(
    const bastion::schema::identity_t& identity) {
  auto key =
      bastion::schema::key::make_balance_key(journal_.encoder(), identity);
  return journal_.get<bastion::schema::amount_t>(key).value_or(
      bastion::schema::amount_t{0});
}

void runtime::set_time(const bastion::schema::timestamp_milliseconds_t now_ms) {
  auto lock = std::scoped_lock{mutex_};
  now_ms_ = now_ms;
}

bastion::storage::committed_state runtime::last_committed() const {
  auto lock = std::scoped_lock{mutex_};
  return journal_.committed();
}

bastion::schema::call_result_t runtime::transfer(
    const bastion::schema::identity_t& from,
    const bastion::schema::identity_t& to,
    const bastion::schema::amount_t& value) {
  auto& encoder = journal_.encoder();
  auto from_key = bastion::schema::key::make_balance_key(encoder, from);
  auto from_balance = journal_.get<bastion::schema::amount_t>(from_key).value_or(
      bastion::schema::amount_t{0});
  if (from_balance < value) {
    return bastion::schema::make_failure(
        bastion::schema::error_code::insufficient_balance,
        "insufficient balance for value transfer", kCodespace);
  }
  journal_.put(from_key, bastion::schema::amount_t{from_balance - value});
  auto to_key = bastion::schema::key::make_balance_key(encoder, to);
  auto to_balance = journal_.get<bastion::schema::amount_t>(to_key).value_or(
      bastion::schema::amount_t{0});
  journal_.put(to_key, bastion::schema::amount_t{to_balance + value});
  return bastion::schema::make_success();
}

}  // namespace bastion::host
