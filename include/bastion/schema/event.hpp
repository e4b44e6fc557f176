#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Schema type: event.
// Emitted by accounts, modules and the dispatcher inside a step. Events of a
// frame that unwinds are dropped together with its state writes.
namespace bastion::schema {

template <uint16_t Version>
struct event_attribute;

template <>
struct event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using event_attribute_t = event_attribute<1>;

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;
};

using event_t = event<1>;

inline event_attribute_t make_attribute(std::string key,
                                        std::string value,
                                        const bool index = true) {
  return event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

}  // namespace bastion::schema
