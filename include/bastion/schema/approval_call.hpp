#pragma once
#include <bastion/schema/primitives.hpp>
#include <variant>
#include <vector>

// Schema type: approval call.
// Owner-gated operations of the approval engine. Every operation names the
// account whose ledger it touches; the immediate caller must be one of that
// account's owners.
namespace bastion::schema {

template <uint16_t Version>
struct submit_transaction;

template <>
struct submit_transaction<1> final {
  uint16_t version{1};
  identity_t account{};
  identity_t target{};
  amount_t value{};
  bytes_t payload;
};

using submit_transaction_t = submit_transaction<1>;

template <uint16_t Version>
struct confirm_transaction;

template <>
struct confirm_transaction<1> final {
  uint16_t version{1};
  identity_t account{};
  transaction_id_t id{};
};

using confirm_transaction_t = confirm_transaction<1>;

template <uint16_t Version>
struct revoke_confirmation;

template <>
struct revoke_confirmation<1> final {
  uint16_t version{1};
  identity_t account{};
  transaction_id_t id{};
};

using revoke_confirmation_t = revoke_confirmation<1>;

template <uint16_t Version>
struct execute_transaction;

template <>
struct execute_transaction<1> final {
  uint16_t version{1};
  identity_t account{};
  transaction_id_t id{};
};

using execute_transaction_t = execute_transaction<1>;

template <uint16_t Version>
struct add_owner;

template <>
struct add_owner<1> final {
  uint16_t version{1};
  identity_t account{};
  identity_t owner{};
};

using add_owner_t = add_owner<1>;

template <uint16_t Version>
struct remove_owner;

template <>
struct remove_owner<1> final {
  uint16_t version{1};
  identity_t account{};
  identity_t owner{};
};

using remove_owner_t = remove_owner<1>;

template <uint16_t Version>
struct change_threshold;

template <>
struct change_threshold<1> final {
  uint16_t version{1};
  identity_t account{};
  uint32_t threshold{};
};

using change_threshold_t = change_threshold<1>;

using approval_call_t = std::variant<submit_transaction_t,
                                     confirm_transaction_t,
                                     revoke_confirmation_t,
                                     execute_transaction_t,
                                     add_owner_t,
                                     remove_owner_t,
                                     change_threshold_t>;

/// Install data accepted by the approval engine's install hook.
template <uint16_t Version>
struct approval_setup;

template <>
struct approval_setup<1> final {
  uint16_t version{1};
  std::vector<identity_t> owners;
  uint32_t threshold{};
};

using approval_setup_t = approval_setup<1>;

/// Approval blob the approval engine reads from an authorization request.
template <uint16_t Version>
struct approval_proof;

template <>
struct approval_proof<1> final {
  uint16_t version{1};
  transaction_id_t id{};
  std::vector<identity_t> signers;
};

using approval_proof_t = approval_proof<1>;

}  // namespace bastion::schema
