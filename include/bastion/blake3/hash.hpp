#pragma once
#include <bastion/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace bastion::blake3 {

bastion::schema::hash32_t hash(const std::string_view& str);
bastion::schema::hash32_t hash(const bastion::schema::bytes_view_t& bytes);

/// Hash of the concatenation of `parts`.
bastion::schema::hash32_t hash(
    std::initializer_list<bastion::schema::bytes_view_t> parts);

/// Hash of the canonical encoding of `value`.
template <typename Encoder, typename T>
bastion::schema::hash32_t hash_encoded(Encoder& encoder, const T& value) {
  auto encoded = encoder.encode(value);
  return hash(bastion::schema::bytes_view_t{encoded.data(), encoded.size()});
}

}  // namespace bastion::blake3
