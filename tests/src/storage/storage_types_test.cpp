#include <tandem/schema/encoding/scale/codec.hpp>
#include <tandem/storage/rocksdb/storage.hpp>
#include <tandem/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using storage_t =
    tandem::storage::storage<tandem::storage::rocksdb_storage_tag>;
using encoder_t = tandem::schema::encoding::scale_encoder_t;
using tandem::testing::make_hash;

tandem::schema::bytes_t make_key(const std::string_view text) {
  return tandem::schema::make_bytes(text);
}

}  // namespace

TEST(storage, missing_key_reads_as_nullopt) {
  auto dir = tandem::testing::temp_db_dir{"tandem_storage_missing"};
  {
    auto storage =
        tandem::storage::make_storage<tandem::storage::rocksdb_storage_tag>(
            dir.path());
    EXPECT_FALSE(storage.get(make_key("absent")).has_value());
    EXPECT_FALSE(storage.contains(make_key("absent")));
  }
}

TEST(storage, apply_commits_puts_and_deletes_together) {
  auto dir = tandem::testing::temp_db_dir{"tandem_storage_apply"};
  {
    auto storage =
        tandem::storage::make_storage<tandem::storage::rocksdb_storage_tag>(
            dir.path());
    storage.apply(tandem::storage::write_set_t{
        {.key = make_key("a"), .value = tandem::schema::bytes_t{1}},
        {.key = make_key("b"), .value = tandem::schema::bytes_t{2}}});
    ASSERT_TRUE(storage.contains(make_key("a")));
    ASSERT_TRUE(storage.contains(make_key("b")));

    storage.apply(tandem::storage::write_set_t{
        {.key = make_key("a"), .value = std::nullopt},
        {.key = make_key("c"), .value = tandem::schema::bytes_t{3}}});
    EXPECT_FALSE(storage.contains(make_key("a")));
    EXPECT_EQ(storage.get(make_key("b")).value_or(tandem::schema::bytes_t{}),
              (tandem::schema::bytes_t{2}));
    EXPECT_EQ(storage.get(make_key("c")).value_or(tandem::schema::bytes_t{}),
              (tandem::schema::bytes_t{3}));
  }
}

TEST(storage, typed_get_decodes_through_record_codec) {
  auto dir = tandem::testing::temp_db_dir{"tandem_storage_typed"};
  {
    auto encoder = encoder_t{};
    auto storage =
        tandem::storage::make_storage<tandem::storage::rocksdb_storage_tag>(
            dir.path());
    auto management = tandem::schema::management_state_t{};
    management.admin = make_hash(5);
    management.unclaimed = {make_hash(6)};
    storage.apply(tandem::storage::write_set_t{
        {.key = make_key("management"),
         .value = tandem::schema::encoding::record_codec<
             tandem::schema::management_state_t,
             tandem::schema::encoding::scale_encoder_tag>::encode(encoder,
                                                                  management)}});

    auto loaded = storage.get<tandem::schema::management_state_t>(
        encoder, make_key("management"));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->admin, make_hash(5));
    EXPECT_EQ(loaded->unclaimed.size(), 1u);
  }
}

TEST(storage, list_by_prefix_stops_at_prefix_boundary) {
  auto dir = tandem::testing::temp_db_dir{"tandem_storage_prefix"};
  {
    auto storage =
        tandem::storage::make_storage<tandem::storage::rocksdb_storage_tag>(
            dir.path());
    storage.apply(tandem::storage::write_set_t{
        {.key = make_key("P|2"), .value = tandem::schema::bytes_t{2}},
        {.key = make_key("P|1"), .value = tandem::schema::bytes_t{1}},
        {.key = make_key("Q|1"), .value = tandem::schema::bytes_t{9}}});

    auto rows = storage.list_by_prefix(make_key("P|"));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, make_key("P|1"));
    EXPECT_EQ(rows[1].first, make_key("P|2"));
    EXPECT_TRUE(storage.list_by_prefix(make_key("R|")).empty());
  }
}

TEST(storage, values_survive_reopen) {
  auto dir = tandem::testing::temp_db_dir{"tandem_storage_reopen"};
  {
    auto storage =
        tandem::storage::make_storage<tandem::storage::rocksdb_storage_tag>(
            dir.path());
    storage.apply(tandem::storage::write_set_t{
        {.key = make_key("kept"), .value = tandem::schema::bytes_t{7}}});
  }
  {
    auto storage =
        tandem::storage::make_storage<tandem::storage::rocksdb_storage_tag>(
            dir.path());
    EXPECT_EQ(storage.get(make_key("kept")).value_or(tandem::schema::bytes_t{}),
              (tandem::schema::bytes_t{7}));
  }
}
