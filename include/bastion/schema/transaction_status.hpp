#pragma once

#include <bastion/schema/enum_string.hpp>
#include <bastion/schema/transaction_record.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace bastion::schema {

/// Derived, never persisted. A failed execution lands back in `executable`.
enum class transaction_status_t : uint8_t {
  proposed = 0,
  executable = 1,
  executed = 2,
};

inline constexpr auto kTransactionStatusMappings = std::array{
    enum_mapping_t<transaction_status_t>{"proposed",
                                         transaction_status_t::proposed},
    enum_mapping_t<transaction_status_t>{"executable",
                                         transaction_status_t::executable},
    enum_mapping_t<transaction_status_t>{"executed",
                                         transaction_status_t::executed}};

template <>
inline std::optional<transaction_status_t>
try_from_string<transaction_status_t>(const std::string_view value) {
  return from_string(value, kTransactionStatusMappings);
}

inline constexpr std::string_view to_string(const transaction_status_t value) {
  return to_string(value, kTransactionStatusMappings);
}

inline transaction_status_t status_of(const transaction_record_t& record,
                                      const uint32_t threshold) {
  if (record.executed) {
    return transaction_status_t::executed;
  }
  if (threshold > 0 && record.confirmations >= threshold) {
    return transaction_status_t::executable;
  }
  return transaction_status_t::proposed;
}

}  // namespace bastion::schema
