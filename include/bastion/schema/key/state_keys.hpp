#pragma once

#include <bastion/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

// Schema key type: state keys.
// Canonical key prefixes for persisted account, module, dispatcher and event
// state. A key is SCALE(prefix) followed by SCALE(id); listing by
// SCALE(prefix) + SCALE(leading id fields) selects a sub-range.
namespace bastion::schema::key {

inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kRegistryKeyPrefix{"SYS|STATE|REGISTRY|"};
inline constexpr std::string_view kSequenceKeyPrefix{"SYS|STATE|SEQUENCE|"};
inline constexpr std::string_view kDepositKeyPrefix{"SYS|STATE|DEPOSIT|"};
inline constexpr std::string_view kApprovalConfigKeyPrefix{
    "SYS|STATE|APPROVAL_CONFIG|"};
inline constexpr std::string_view kApprovalOwnerKeyPrefix{
    "SYS|STATE|APPROVAL_OWNER|"};
inline constexpr std::string_view kApprovalNextIdKeyPrefix{
    "SYS|STATE|APPROVAL_NEXT_ID|"};
inline constexpr std::string_view kApprovalTransactionKeyPrefix{
    "SYS|STATE|APPROVAL_TX|"};
inline constexpr std::string_view kApprovalConfirmationKeyPrefix{
    "SYS|STATE|APPROVAL_CONFIRMATION|"};
inline constexpr std::string_view kApprovalConfirmedByKeyPrefix{
    "SYS|STATE|APPROVAL_CONFIRMED_BY|"};
inline constexpr std::string_view kApprovalEscrowKeyPrefix{
    "SYS|STATE|APPROVAL_ESCROW|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder, typename T>
bastion::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // Equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
bastion::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
bastion::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const bastion::schema::identity_t& holder) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix, holder);
}

template <typename Encoder>
bastion::schema::bytes_t make_registry_key(
    Encoder& encoder,
    const bastion::schema::identity_t& account,
    const bastion::schema::routing_key_t& routing_key) {
  return make_prefixed_key(encoder, kRegistryKeyPrefix,
                           std::tuple{account, routing_key});
}

template <typename Encoder>
bastion::schema::bytes_t make_registry_prefix_key(
    Encoder& encoder,
    const bastion::schema::identity_t& account) {
  return make_prefixed_key(encoder, kRegistryKeyPrefix, account);
}

template <typename Encoder>
bastion::schema::bytes_t make_sequence_key(
    Encoder& encoder,
    const bastion::schema::identity_t& account) {
  return make_prefixed_key(encoder, kSequenceKeyPrefix, account);
}

template <typename Encoder>
bastion::schema::bytes_t make_deposit_key(
    Encoder& encoder,
    const bastion::schema::identity_t& dispatcher,
    const bastion::schema::identity_t& account) {
  return make_prefixed_key(encoder, kDepositKeyPrefix,
                           std::tuple{dispatcher, account});
}

template <typename Encoder>
bastion::schema::bytes_t make_approval_config_key(
    Encoder& encoder,
    const bastion::schema::identity_t& module,
    const bastion::schema::identity_t& account) {
  return make_prefixed_key(encoder, kApprovalConfigKeyPrefix,
                           std::tuple{module, account});
}

template <typename Encoder>
bastion::schema::bytes_t make_approval_owner_key(
    Encoder& encoder,
    const bastion::schema::identity_t& module,
    const bastion::schema::identity_t& account,
    const bastion::schema::identity_t& owner) {
  return make_prefixed_key(encoder, kApprovalOwnerKeyPrefix,
                           std::tuple{module, account, owner});
}

template <typename Encoder>
bastion::schema::bytes_t make_approval_next_id_key(
    Encoder& encoder,
    const bastion::schema::identity_t& module,
    const bastion::schema::identity_t& account) {
  return make_prefixed_key(encoder, kApprovalNextIdKeyPrefix,
                           std::tuple{module, account});
}

/// Value held by an approval module on behalf of one account.
template <typename Encoder>
bastion::schema::bytes_t make_approval_escrow_key(
    Encoder& encoder,
    const bastion::schema::identity_t& module,
    const bastion::schema::identity_t& account) {
  return make_prefixed_key(encoder, kApprovalEscrowKeyPrefix,
                           std::tuple{module, account});
}

template <typename Encoder>
bastion::schema::bytes_t make_approval_transaction_key(
    Encoder& encoder,
    const bastion::schema::identity_t& module,
    const bastion::schema::identity_t& account,
    const bastion::schema::transaction_id_t id) {
  return make_prefixed_key(encoder, kApprovalTransactionKeyPrefix,
                           std::tuple{module, account, id});
}

template <typename Encoder>
bastion::schema::bytes_t make_approval_confirmation_key(
    Encoder& encoder,
    const bastion::schema::identity_t& module,
    const bastion::schema::identity_t& account,
    const bastion::schema::transaction_id_t id,
    const bastion::schema::identity_t& owner) {
  return make_prefixed_key(encoder, kApprovalConfirmationKeyPrefix,
                           std::tuple{module, account, id, owner});
}

template <typename Encoder>
bastion::schema::bytes_t make_approval_confirmed_by_key(
    Encoder& encoder,
    const bastion::schema::identity_t& module,
    const bastion::schema::identity_t& account,
    const bastion::schema::identity_t& owner,
    const bastion::schema::transaction_id_t id) {
  return make_prefixed_key(encoder, kApprovalConfirmedByKeyPrefix,
                           std::tuple{module, account, owner, id});
}

/// Prefix under which every per-(module, account) approval keyspace lives.
template <typename Encoder>
bastion::schema::bytes_t make_approval_scope_prefix_key(
    Encoder& encoder,
    std::string_view prefix,
    const bastion::schema::identity_t& module,
    const bastion::schema::identity_t& account) {
  return make_prefixed_key(encoder, prefix, std::tuple{module, account});
}

template <typename Encoder>
bastion::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
bastion::schema::bytes_t make_event_key(Encoder& encoder, uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix, sequence);
}

template <typename Encoder>
std::optional<uint64_t> parse_event_key(
    Encoder& encoder,
    const bastion::schema::bytes_view_t& key) {
  auto decoded =
      encoder.template try_decode<std::tuple<std::string, uint64_t>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kEventPrefix) {
    return std::nullopt;
  }
  return std::get<1>(decoded.value());
}

}  // namespace bastion::schema::key
