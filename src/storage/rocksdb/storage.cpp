#include <bastion/common/critical.hpp>
#include <bastion/storage/rocksdb/storage.hpp>

namespace bastion::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    bastion::common::critical("Failed to open RocksDB at {}: {}", path,
                              status.ToString());
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

template <>
storage<rocksdb_storage_tag> make_read_only_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();
  store.read_only = true;

  auto options = ROCKSDB_NAMESPACE::Options{};
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::OpenForReadOnly(
      options, std::string{path}, &database);
  if (!status.ok()) {
    bastion::common::critical("Failed to open RocksDB read-only at {}: {}",
                              path, status.ToString());
  }
  spdlog::debug("Opened RocksDB read-only at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(bastion::schema::make_bytes_view(
      std::string_view{detail::kCommittedStateKey}));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, bastion::schema::hash32_t>>(
          bastion::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    bastion::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const bastion::schema::bytes_view_t& prefix) const {
  if (!database) {
    bastion::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice); iterator->Valid(); iterator->Next()) {
    if (!iterator->key().starts_with(prefix_slice)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    bastion::common::critical("RocksDB iteration failed: {}",
                              iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::apply(
    const std::vector<write_entry_t>& writes,
    const committed_state& state) {
  if (!database) {
    bastion::common::critical("RocksDB database is not initialized");
  }
  if (read_only) {
    bastion::common::critical("RocksDB database is opened read-only");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice = detail::to_slice(key);
    auto status = value ? batch.Put(key_slice, detail::to_slice(*value))
                        : batch.Delete(key_slice);
    if (!status.ok()) {
      bastion::common::critical("failed staging write batch entry: {}",
                                status.ToString());
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status =
      batch.Put(ROCKSDB_NAMESPACE::Slice{detail::kCommittedStateKey.data(),
                                         detail::kCommittedStateKey.size()},
                detail::to_slice(encoded));
  if (!state_status.ok()) {
    bastion::common::critical("failed staging committed state");
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    bastion::common::critical("failed to commit write batch: {}",
                              write_status.ToString());
  }
}

}  // namespace bastion::storage
