#pragma once
#include <bastion/schema/primitives.hpp>

// Schema type: execution outcome.
// Returned by executeTransaction. A failed forwarded call is reported here
// rather than as an error so the attempt itself still commits.
namespace bastion::schema {

template <uint16_t Version>
struct execution_outcome;

template <>
struct execution_outcome<1> final {
  uint16_t version{1};
  transaction_id_t id{};
  bool success{false};
  uint32_t code{};
  bytes_t data;
};

using execution_outcome_t = execution_outcome<1>;

}  // namespace bastion::schema
