#include <gtest/gtest.h>
#include <timeshare/schema/encoding/scale/encoder.hpp>
#include <timeshare/schema/timeshare_info.hpp>
#include <timeshare/storage/rocksdb/storage.hpp>
#include <timeshare/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using storage_t =
    timeshare::storage::storage<timeshare::storage::rocksdb_storage_tag>;
using encoder_t = timeshare::schema::encoding::encoder<
    timeshare::schema::encoding::scale_encoder_tag>;

timeshare::schema::bytes_t key_of(const std::string_view text) {
  return timeshare::schema::make_bytes(text);
}

timeshare::schema::bytes_view_t view_of(const timeshare::schema::bytes_t& b) {
  return timeshare::schema::bytes_view_t{b.data(), b.size()};
}

}  // namespace

TEST(rocksdb_storage, put_then_get_returns_decoded_value) {
  auto db = timeshare::testing::make_db_path("timeshare_storage_put_get");
  {
    auto encoder = encoder_t{};
    auto storage =
        timeshare::storage::make_storage<timeshare::storage::rocksdb_storage_tag>(
            db);
    auto key = key_of("info|1");
    auto info = timeshare::schema::timeshare_info_t{
        .hotel = "Grand Hotel", .room = "305", .week = 28};

    EXPECT_FALSE(storage.contains(view_of(key)));
    EXPECT_FALSE((storage.get<timeshare::schema::timeshare_info_t>(
                      encoder, view_of(key))
                      .has_value()));

    storage.put(encoder, view_of(key), info);
    EXPECT_TRUE(storage.contains(view_of(key)));
    auto loaded =
        storage.get<timeshare::schema::timeshare_info_t>(encoder, view_of(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, info);
  }
  timeshare::testing::remove_path(db);
}

TEST(rocksdb_storage, values_persist_across_reopen) {
  auto db = timeshare::testing::make_db_path("timeshare_storage_reopen");
  auto key = key_of("counter");
  {
    auto encoder = encoder_t{};
    auto storage =
        timeshare::storage::make_storage<timeshare::storage::rocksdb_storage_tag>(
            db);
    storage.put(encoder, view_of(key), uint64_t{9});
  }
  {
    auto encoder = encoder_t{};
    auto storage =
        timeshare::storage::make_storage<timeshare::storage::rocksdb_storage_tag>(
            db);
    auto loaded = storage.get<uint64_t>(encoder, view_of(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 9u);
  }
  timeshare::testing::remove_path(db);
}

TEST(rocksdb_storage, write_commits_every_entry_of_the_batch) {
  auto db = timeshare::testing::make_db_path("timeshare_storage_batch");
  {
    auto encoder = encoder_t{};
    auto storage =
        timeshare::storage::make_storage<timeshare::storage::rocksdb_storage_tag>(
            db);
    storage.put(encoder, view_of(key_of("a")), uint64_t{1});

    storage.write({{key_of("a"), encoder.encode(uint64_t{2})},
                   {key_of("b"), encoder.encode(uint64_t{3})}});

    EXPECT_EQ(storage.get<uint64_t>(encoder, view_of(key_of("a"))),
              std::optional<uint64_t>{2});
    EXPECT_EQ(storage.get<uint64_t>(encoder, view_of(key_of("b"))),
              std::optional<uint64_t>{3});
  }
  timeshare::testing::remove_path(db);
}

TEST(rocksdb_storage, list_by_prefix_only_returns_matching_keys_in_order) {
  auto db = timeshare::testing::make_db_path("timeshare_storage_prefix");
  {
    auto encoder = encoder_t{};
    auto storage =
        timeshare::storage::make_storage<timeshare::storage::rocksdb_storage_tag>(
            db);
    storage.write({{key_of("OWNER|2"), encoder.encode(uint64_t{2})},
                   {key_of("OWNER|1"), encoder.encode(uint64_t{1})},
                   {key_of("INFO|1"), encoder.encode(uint64_t{7})},
                   {key_of("OWNERS"), encoder.encode(uint64_t{8})}});

    auto prefix = key_of("OWNER|");
    auto entries = storage.list_by_prefix(view_of(prefix));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, key_of("OWNER|1"));
    EXPECT_EQ(entries[1].first, key_of("OWNER|2"));

    auto none = storage.list_by_prefix(view_of(key_of("MISSING|")));
    EXPECT_TRUE(none.empty());
  }
  timeshare::testing::remove_path(db);
}
