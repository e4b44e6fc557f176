#pragma once
#include <bastion/schema/primitives.hpp>
#include <optional>
#include <span>

namespace bastion::schema::encoding {

/// Codec selected at build time by tag. `encode`/`decode` treat failure as a
/// fault; `try_decode` is for bytes that arrive from another identity.
template <typename Library>
struct encoder {
  template <typename T>
  bastion::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bastion::schema::bytes_t& out);

  template <typename T>
  T decode(const bastion::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bastion::schema::bytes_view_t& bytes);
};

}  // namespace bastion::schema::encoding
