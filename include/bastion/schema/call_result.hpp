#pragma once

#include <bastion/schema/error_code.hpp>
#include <bastion/schema/event.hpp>
#include <bastion/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bastion::schema {

template <uint16_t Version>
struct call_result;

/// Outcome of one call between identities.
///
/// `code == 0` means the callee completed and its writes are kept. Any other
/// value unwinds the callee's frame; `data` then carries the callee's raw
/// failure payload untouched so callers can re-raise it verbatim.
template <>
struct call_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string codespace;
  std::vector<event_t> events;

  bool ok() const { return code == 0; }
  error_category_t category() const { return category_of(code); }
};

using call_result_t = call_result<1>;

inline call_result_t make_success(bytes_t data = {}) {
  auto result = call_result_t{};
  result.data = std::move(data);
  return result;
}

inline call_result_t make_failure(const error_code code,
                                  std::string log,
                                  const std::string_view codespace,
                                  bytes_t data = {}) {
  auto result = call_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{codespace};
  result.data = std::move(data);
  return result;
}

}  // namespace bastion::schema
