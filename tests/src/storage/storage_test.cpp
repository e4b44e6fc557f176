#include <gtest/gtest.h>
#include <bastion/schema/encoding/scale/encoder.hpp>
#include <bastion/storage/rocksdb/storage.hpp>
#include <bastion/storage/storage.hpp>
#include <bastion/testing/common.hpp>

#include <optional>
#include <string>

namespace {

using storage_t =
    bastion::storage::storage<bastion::storage::rocksdb_storage_tag>;
using encoder_t = bastion::schema::encoding::scale_encoder_t;

bastion::schema::bytes_t bytes_of(const std::string_view value) {
  return bastion::schema::make_bytes(value);
}

}  // namespace

TEST(storage, defaults_are_stable) {
  auto committed = bastion::storage::committed_state{};
  EXPECT_EQ(committed.height, 0u);
  EXPECT_EQ(committed.state_root, bastion::schema::make_zero_hash());

  auto entry = bastion::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage, apply_writes_and_committed_state_together) {
  auto path = bastion::testing::temporary_path{"bastion_storage_apply"};
  {
    auto store =
        bastion::storage::make_storage<bastion::storage::rocksdb_storage_tag>(
            path.string());
    EXPECT_FALSE(store.load_committed_state().has_value());

    auto writes = std::vector<bastion::storage::write_entry_t>{
        {bytes_of("a"), bytes_of("1")}, {bytes_of("b"), bytes_of("2")}};
    store.apply(writes, bastion::storage::committed_state{
                            .height = 1,
                            .state_root = bastion::testing::make_hash(3)});

    store.apply({{bytes_of("a"), std::nullopt}},
                bastion::storage::committed_state{
                    .height = 2, .state_root = bastion::testing::make_hash(4)});
  }

  auto reopened =
      bastion::storage::make_storage<bastion::storage::rocksdb_storage_tag>(
          path.string());
  auto committed = reopened.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 2u);
  EXPECT_EQ(committed->state_root, bastion::testing::make_hash(4));
  EXPECT_FALSE(reopened.get_raw(bastion::schema::make_bytes_view(
                                    std::string_view{"a"}))
                   .has_value());
  EXPECT_EQ(reopened.get_raw(bastion::schema::make_bytes_view(
                std::string_view{"b"})),
            bytes_of("2"));
}

TEST(storage, put_and_get_decode_values) {
  auto path = bastion::testing::temporary_path{"bastion_storage_put"};
  auto store =
      bastion::storage::make_storage<bastion::storage::rocksdb_storage_tag>(
          path.string());
  auto encoder = encoder_t{};
  auto key = bytes_of("counter");
  store.put(encoder, bastion::schema::make_bytes_view(key), uint64_t{99});
  auto value =
      store.get<uint64_t>(encoder, bastion::schema::make_bytes_view(key));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 99u);
  EXPECT_FALSE(store
                   .get<uint64_t>(encoder, bastion::schema::make_bytes_view(
                                               std::string_view{"missing"}))
                   .has_value());
}

TEST(storage, list_by_prefix_returns_only_matching_keys_in_order) {
  auto path = bastion::testing::temporary_path{"bastion_storage_prefix"};
  auto store =
      bastion::storage::make_storage<bastion::storage::rocksdb_storage_tag>(
          path.string());
  store.apply({{bytes_of("p|2"), bytes_of("two")},
               {bytes_of("p|1"), bytes_of("one")},
               {bytes_of("q|1"), bytes_of("other")}},
              bastion::storage::committed_state{.height = 1});

  auto entries = store.list_by_prefix(
      bastion::schema::make_bytes_view(std::string_view{"p|"}));
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].first, bytes_of("p|1"));
  EXPECT_EQ(entries[1].second, bytes_of("two"));
}

TEST(storage, read_only_store_sees_committed_data) {
  auto path = bastion::testing::temporary_path{"bastion_storage_read_only"};
  {
    auto store =
        bastion::storage::make_storage<bastion::storage::rocksdb_storage_tag>(
            path.string());
    store.apply({{bytes_of("k"), bytes_of("v")}},
                bastion::storage::committed_state{.height = 5});
  }
  auto reader = bastion::storage::make_read_only_storage<
      bastion::storage::rocksdb_storage_tag>(path.string());
  EXPECT_TRUE(reader.read_only);
  EXPECT_EQ(reader.load_committed_state()->height, 5u);
  EXPECT_EQ(reader.get_raw(bastion::schema::make_bytes_view(
                std::string_view{"k"})),
            bytes_of("v"));
}
