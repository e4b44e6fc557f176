#pragma once

#include <bastion/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: validation code.
// Flat accept/reject answer returned by `authorize` and module `decide`.
namespace bastion::schema {

enum class validation_code_t : uint32_t { accepted = 0, rejected = 1 };

inline constexpr auto kValidationCodeMappings = std::array{
    enum_mapping_t<validation_code_t>{"accepted", validation_code_t::accepted},
    enum_mapping_t<validation_code_t>{"rejected",
                                      validation_code_t::rejected}};

inline constexpr std::string_view to_string(const validation_code_t value) {
  return to_string(value, kValidationCodeMappings);
}

}  // namespace bastion::schema
