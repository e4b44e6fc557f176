#pragma once
#include <bastion/schema/event.hpp>
#include <bastion/schema/primitives.hpp>

// Schema type: event record.
// Persisted form of an event: sequence numbers are global and dense, assigned
// when the step that emitted the event commits.
namespace bastion::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  uint64_t height{};
  identity_t emitter{};
  event_t event;
};

using event_record_t = event_record<1>;

}  // namespace bastion::schema
