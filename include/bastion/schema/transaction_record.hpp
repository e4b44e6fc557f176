#pragma once
#include <bastion/schema/primitives.hpp>

// Schema type: transaction record.
// Proposed call held by the approval engine until enough owners confirm it.
// `content_hash` binds the record to exactly one (target, value, payload).
namespace bastion::schema {

template <uint16_t Version>
struct transaction_record;

template <>
struct transaction_record<1> final {
  uint16_t version{1};
  transaction_id_t id{};
  identity_t target{};
  amount_t value{};
  bytes_t payload;
  hash32_t content_hash{};
  bool executed{false};
  uint32_t confirmations{};
  identity_t submitted_by{};
  timestamp_milliseconds_t created_at{};
};

using transaction_record_t = transaction_record<1>;

/// Presence marker for one owner's confirmation of one transaction. Stored
/// under both the per-transaction key and the per-owner reverse index.
template <uint16_t Version>
struct confirmation_entry;

template <>
struct confirmation_entry<1> final {
  uint16_t version{1};
  transaction_id_t id{};
  identity_t owner{};
  timestamp_milliseconds_t confirmed_at{};
};

using confirmation_entry_t = confirmation_entry<1>;

}  // namespace bastion::schema
