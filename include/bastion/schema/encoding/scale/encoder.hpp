#pragma once
#include <bastion/common/critical.hpp>
#include <bastion/schema/account_call.hpp>
#include <bastion/schema/approval_call.hpp>
#include <bastion/schema/approval_config.hpp>
#include <bastion/schema/dispatcher_call.hpp>
#include <bastion/schema/encoding/encoder.hpp>
#include <bastion/schema/encoding/scale/module_lifecycle.hpp>
#include <bastion/schema/encoding/scale/transaction_status.hpp>
#include <bastion/schema/encoding/scale/validation_code.hpp>
#include <bastion/schema/event_record.hpp>
#include <bastion/schema/execution_outcome.hpp>
#include <bastion/schema/module_call.hpp>
#include <bastion/schema/registry_entry.hpp>
#include <bastion/schema/transaction_record.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Schema structs are aggregates and encode field by field in declaration
// order; only enums need explicit value lists.
namespace bastion::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  bastion::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bastion::schema::bytes_t& out);

  template <typename T>
  T decode(const bastion::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bastion::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
bastion::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    bastion::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        bastion::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const bastion::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    bastion::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const bastion::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace bastion::schema::encoding
