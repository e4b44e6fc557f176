#pragma once
#include <bastion/schema/primitives.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace bastion::storage {

using key_value_entry_t =
    std::pair<bastion::schema::bytes_t, bastion::schema::bytes_t>;

/// A staged write: a value to store, or std::nullopt to delete the key.
using write_entry_t = std::pair<bastion::schema::bytes_t,
                                std::optional<bastion::schema::bytes_t>>;

/// Last committed step persisted by the storage backend.
struct committed_state final {
  uint64_t height{};
  bastion::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const bastion::schema::bytes_view_t& key) const;

  /// Return raw bytes at key, or std::nullopt when missing.
  std::optional<bastion::schema::bytes_t> get_raw(
      const bastion::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const bastion::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed step (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const bastion::schema::bytes_view_t& prefix) const;

  /// Atomically apply writes and deletes together with the new committed
  /// state.
  void apply(const std::vector<write_entry_t>& writes,
             const committed_state& state);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// Open an existing store without write access.
template <typename Library>
storage<Library> make_read_only_storage(const std::string_view& path);

}  // namespace bastion::storage
