#pragma once

#include <bastion/host/endpoint.hpp>
#include <bastion/schema/call_result.hpp>
#include <bastion/state/journal.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

namespace bastion::host {

inline constexpr auto kDefaultChainId = uint64_t{31337};

struct runtime_options final {
  uint64_t chain_id{kDefaultChainId};
  bastion::schema::timestamp_milliseconds_t initial_time_ms{};
};

/// Routes calls between identities over one journal.
///
/// `submit` is a top-level step: it is serialized against other steps and
/// persisted when it returns, whether it succeeded or not (a failed step only
/// persists the committed-state advance). `call` is for endpoints calling out
/// while handling a step and never locks.
///
/// Queries (`has_endpoint`, `balance_of`, `journal` and the module readers
/// built on it) do not lock either, since a step reaches them from inside
/// `submit`. They are valid on the thread driving steps, inside a step or
/// between steps, never concurrently with a `submit` on another thread.
class runtime final {
 public:
  runtime(state::storage_t& store, runtime_options options);

  runtime(const runtime&) = delete;
  runtime& operator=(const runtime&) = delete;

  /// Endpoints are attached before the first step that reaches them.
  void attach(const bastion::schema::identity_t& identity,
              std::shared_ptr<endpoint> handler);
  bool has_endpoint(const bastion::schema::identity_t& identity) const;

  bastion::schema::call_result_t submit(
      const bastion::schema::identity_t& caller,
      const bastion::schema::identity_t& target,
      const bastion::schema::amount_t& value,
      const bastion::schema::bytes_t& payload);

  bastion::schema::call_result_t call(
      const bastion::schema::identity_t& caller,
      const bastion::schema::identity_t& target,
      const bastion::schema::amount_t& value,
      const bastion::schema::bytes_t& payload);

  /// Credit `amount` to `identity` in a step of its own.
  bastion::storage::committed_state fund(
      const bastion::schema::identity_t& identity,
      const bastion::schema::amount_t& amount);

  bastion::schema::amount_t balance_of(
      const bastion::schema::identity_t& identity);

  uint64_t chain_id() const { return options_.chain_id; }
  bastion::schema::timestamp_milliseconds_t now() const { return now_ms_; }
  void set_time(bastion::schema::timestamp_milliseconds_t now_ms);

  state::journal& journal() { return journal_; }
  bastion::storage::committed_state last_committed() const;

 private:
  bastion::schema::call_result_t transfer(
      const bastion::schema::identity_t& from,
      const bastion::schema::identity_t& to,
      const bastion::schema::amount_t& value);

  runtime_options options_;
  state::journal journal_;
  std::map<bastion::schema::identity_t, std::shared_ptr<endpoint>> endpoints_;
  bastion::schema::timestamp_milliseconds_t now_ms_{};
  mutable std::mutex mutex_;
};

}  // namespace bastion::host
