#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <bastion/common/critical.hpp>
#include <bastion/schema/encoding/scale/encoder.hpp>
#include <bastion/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>

namespace bastion::storage {

namespace detail {

using encoder_t = bastion::schema::encoding::scale_encoder_t;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const bastion::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline bastion::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  bool read_only{false};

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const bastion::schema::bytes_view_t& key) const;

  std::optional<bastion::schema::bytes_t> get_raw(
      const bastion::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const bastion::schema::bytes_view_t& key,
           const T& value);

  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const bastion::schema::bytes_view_t& prefix) const;
  void apply(const std::vector<write_entry_t>& writes,
             const committed_state& state);
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <>
storage<rocksdb_storage_tag> make_read_only_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<bastion::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const bastion::schema::bytes_view_t& key) const {
  if (!database) {
    bastion::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    bastion::common::critical("Failed to get value from RocksDB: {}",
                              status.ToString());
  }
  return bastion::schema::bytes_t{std::begin(value), std::end(value)};
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const bastion::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      bastion::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const bastion::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    bastion::common::critical("RocksDB database is not initialized");
  }
  if (read_only) {
    bastion::common::critical("RocksDB database is opened read-only");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(bastion::schema::bytes_view_t{encoded_value.data(),
                                                     encoded_value.size()}));
  if (!status.ok()) {
    bastion::common::critical("Failed to put value into RocksDB: {}",
                              status.ToString());
  }
}

}  // namespace bastion::storage
