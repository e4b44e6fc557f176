#pragma once
#include <bastion/schema/primitives.hpp>

namespace bastion::schema {

template <uint16_t Version>
struct registry_entry;

template <>
struct registry_entry<1> final {
  uint16_t version{1};
  routing_key_t key{};
  identity_t module{};
  timestamp_milliseconds_t installed_at{};
};

using registry_entry_t = registry_entry<1>;

}  // namespace bastion::schema
