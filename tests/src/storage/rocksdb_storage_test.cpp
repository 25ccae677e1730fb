#include <waybill/storage/backend.hpp>
#include <waybill/storage/rocksdb/storage.hpp>
#include <waybill/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

TEST(rocksdb_storage, log_keys_sort_in_append_order) {
  auto first = waybill::storage::detail::make_log_key(
      waybill::storage::log_channel::events, 255);
  auto second = waybill::storage::detail::make_log_key(
      waybill::storage::log_channel::events, 256);
  EXPECT_LT(first, second);
  EXPECT_EQ(waybill::storage::detail::parse_log_key(
                waybill::storage::log_channel::events, second),
            256u);
  EXPECT_FALSE(waybill::storage::detail::parse_log_key(
                   waybill::storage::log_channel::counters, second)
                   .has_value());
}

TEST(rocksdb_storage, appends_survive_reopen_through_backend_variant) {
  auto dir = waybill::testing::make_data_dir("waybill_rocksdb_reopen");
  auto one = waybill::schema::make_bytes(std::string_view{"one"});
  auto two = waybill::schema::make_bytes(std::string_view{"two"});
  auto tick = waybill::schema::make_bytes(std::string_view{"tick"});
  {
    auto backend = waybill::storage::make_backend(
        waybill::storage::backend_kind_t::rocksdb, dir);
    ASSERT_TRUE(waybill::storage::append(backend,
                                         waybill::storage::log_channel::events,
                                         waybill::schema::make_bytes_view(one)));
    ASSERT_TRUE(waybill::storage::append(
        backend, waybill::storage::log_channel::counters,
        waybill::schema::make_bytes_view(tick)));
  }
  {
    auto backend = waybill::storage::make_backend(
        waybill::storage::backend_kind_t::rocksdb, dir);
    ASSERT_TRUE(waybill::storage::append(backend,
                                         waybill::storage::log_channel::events,
                                         waybill::schema::make_bytes_view(two)));
    auto events =
        waybill::storage::read(backend, waybill::storage::log_channel::events);
    ASSERT_TRUE(events.has_value());
    ASSERT_EQ(events->size(), 2u);
    EXPECT_EQ((*events)[0].ordinal, 1u);
    EXPECT_EQ((*events)[1].ordinal, 2u);
    EXPECT_EQ(*(*events)[0].bytes, one);
    EXPECT_EQ(*(*events)[1].bytes, two);

    auto counters =
        waybill::storage::read(backend, waybill::storage::log_channel::counters);
    ASSERT_TRUE(counters.has_value());
    ASSERT_EQ(counters->size(), 1u);
    EXPECT_EQ(*(*counters)[0].bytes, tick);
  }
  waybill::testing::remove_path(dir);
}
