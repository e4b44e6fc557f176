#pragma once
#include <bastion/schema/module_lifecycle.hpp>
#include <bastion/schema/primitives.hpp>
#include <vector>

// Schema type: approval configuration.
// Owners of one account under one approval module instance, in insertion
// order, together with the acceptance threshold.
namespace bastion::schema {

template <uint16_t Version>
struct approval_config;

template <>
struct approval_config<1> final {
  uint16_t version{1};
  std::vector<identity_t> owners;
  uint32_t threshold{};
  module_lifecycle_t lifecycle{module_lifecycle_t::uninitialized};
};

using approval_config_t = approval_config<1>;

}  // namespace bastion::schema
