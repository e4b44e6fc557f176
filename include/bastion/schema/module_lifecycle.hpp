#pragma once

#include <bastion/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace bastion::schema {

enum class module_lifecycle_t : uint8_t { uninitialized = 0, active = 1 };

inline constexpr auto kModuleLifecycleMappings = std::array{
    enum_mapping_t<module_lifecycle_t>{"uninitialized",
                                       module_lifecycle_t::uninitialized},
    enum_mapping_t<module_lifecycle_t>{"active", module_lifecycle_t::active}};

template <>
inline std::optional<module_lifecycle_t> try_from_string<module_lifecycle_t>(
    const std::string_view value) {
  return from_string(value, kModuleLifecycleMappings);
}

inline constexpr std::string_view to_string(const module_lifecycle_t value) {
  return to_string(value, kModuleLifecycleMappings);
}

}  // namespace bastion::schema
