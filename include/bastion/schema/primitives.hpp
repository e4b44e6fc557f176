#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bastion::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;

/// Opaque 32-byte identity of an account, module, dispatcher or external
/// party. The all-zero value is the null identity.
using identity_t = hash32_t;

/// Fixed-width selector carried at the front of a request's call payload.
using routing_key_t = std::array<uint8_t, 4>;

/// Compressed secp256k1 public key.
using public_key_t = std::array<uint8_t, 33>;

/// Recoverable secp256k1 signature laid out as [r || s || v].
using recoverable_signature_t = std::array<uint8_t, 65>;

/// Sequential per-account transaction id allocated by the approval engine.
using transaction_id_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::optional<bytes_t> try_from_hex(std::string_view hex);
std::string to_hex(const bytes_view_t& bytes);

hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

identity_t make_null_identity();
bool is_null(const identity_t& identity);
std::string to_hex(const identity_t& identity);

std::optional<routing_key_t> try_make_routing_key(std::string_view hex);

}  // namespace bastion::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
