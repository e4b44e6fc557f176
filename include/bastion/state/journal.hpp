#pragma once

#include <bastion/schema/encoding/scale/encoder.hpp>
#include <bastion/schema/event_record.hpp>
#include <bastion/schema/primitives.hpp>
#include <bastion/storage/rocksdb/storage.hpp>

#include <map>
#include <optional>
#include <vector>

namespace bastion::state {

using encoder_t = bastion::schema::encoding::scale_encoder_t;
using storage_t =
    bastion::storage::storage<bastion::storage::rocksdb_storage_tag>;

/// Layered write overlay on top of committed storage.
///
/// The staged layer collects everything a step has kept so far. Each nested
/// call opens a frame above it; committing a frame folds it into the layer
/// below, rolling it back drops its writes and events. `flush` persists the
/// staged layer as one batch and advances the committed state.
class journal final {
 public:
  explicit journal(storage_t& store);

  journal(const journal&) = delete;
  journal& operator=(const journal&) = delete;

  encoder_t& encoder() { return encoder_; }

  std::optional<bastion::schema::bytes_t> get_raw(
      const bastion::schema::bytes_view_t& key) const;

  template <typename T>
  std::optional<T> get(const bastion::schema::bytes_view_t& key) {
    auto raw = get_raw(key);
    if (!raw) {
      return std::nullopt;
    }
    return encoder_.decode<T>(
        bastion::schema::bytes_view_t{raw->data(), raw->size()});
  }

  template <typename T>
  void put(const bastion::schema::bytes_view_t& key, const T& value) {
    put_raw(key, encoder_.encode(value));
  }

  void put_raw(const bastion::schema::bytes_view_t& key,
               bastion::schema::bytes_t value);
  void erase(const bastion::schema::bytes_view_t& key);

  /// Committed entries merged with every open layer, ordered by key.
  std::vector<bastion::storage::key_value_entry_t> list_by_prefix(
      const bastion::schema::bytes_view_t& prefix) const;

  /// Delete every visible key under prefix.
  void erase_prefix(const bastion::schema::bytes_view_t& prefix);

  void emit(const bastion::schema::identity_t& emitter,
            bastion::schema::event_t event);

  void begin();
  void commit();
  void rollback();
  size_t depth() const { return frames_.size(); }

  /// Events kept by the current step, in emission order.
  std::vector<bastion::schema::event_t> staged_events() const;

  /// Persist the staged layer and return the new committed state.
  bastion::storage::committed_state flush();

  /// Drop the staged layer without persisting it.
  void discard();

  bastion::storage::committed_state committed() const { return committed_; }

 private:
  struct frame final {
    std::map<bastion::schema::bytes_t, std::optional<bastion::schema::bytes_t>>
        writes;
    std::vector<std::pair<bastion::schema::identity_t, bastion::schema::event_t>>
        events;
  };

  frame& top();

  storage_t& store_;
  encoder_t encoder_{};
  frame staged_{};
  std::vector<frame> frames_{};
  bastion::storage::committed_state committed_{};
};

/// Opens a frame on construction and rolls it back on scope exit unless
/// `commit` was called.
class frame_guard final {
 public:
  explicit frame_guard(journal& j) : journal_{j} { journal_.begin(); }
  ~frame_guard() {
    if (!done_) {
      journal_.rollback();
    }
  }

  frame_guard(const frame_guard&) = delete;
  frame_guard& operator=(const frame_guard&) = delete;

  void commit() {
    journal_.commit();
    done_ = true;
  }

 private:
  journal& journal_;
  bool done_{false};
};

}  // namespace bastion::state
