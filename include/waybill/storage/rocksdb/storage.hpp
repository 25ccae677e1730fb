#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <boost/endian/buffers.hpp>
#include <waybill/common/critical.hpp>
#include <waybill/schema/encoding/scale/encoder.hpp>
#include <waybill/storage/storage.hpp>
#include <algorithm>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string_view>

namespace waybill::storage {

namespace detail {

inline constexpr auto kEventLogPrefix = std::string_view{"LOG|EVT|"};
inline constexpr auto kCounterLogPrefix = std::string_view{"LOG|CTR|"};

inline std::string_view prefix_for(const log_channel channel) {
  return channel == log_channel::events ? kEventLogPrefix : kCounterLogPrefix;
}

// Big-endian ordinals keep RocksDB's byte order equal to append order.
inline std::string make_log_key(const log_channel channel,
                                const uint64_t ordinal) {
  auto encoded = boost::endian::big_uint64_buf_t{ordinal};
  auto key = std::string{prefix_for(channel)};
  key.append(reinterpret_cast<const char*>(encoded.data()), sizeof(uint64_t));
  return key;
}

inline std::optional<uint64_t> parse_log_key(const log_channel channel,
                                             std::string_view key) {
  auto prefix = prefix_for(channel);
  if (!key.starts_with(prefix) ||
      key.size() != prefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  auto encoded = boost::endian::big_uint64_buf_t{};
  std::copy_n(key.data() + prefix.size(), sizeof(uint64_t),
              reinterpret_cast<char*>(&encoded));
  return encoded.value();
}

inline waybill::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

/// Durable log service backed by RocksDB; each channel is a key range of
/// big-endian ordinals written with synchronous WAL flushes.
template <>
struct storage<rocksdb_storage_tag> final {
  using encoder_t = waybill::schema::encoding::scale_encoder_t;

  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  uint64_t last_event_ordinal{};
  uint64_t last_counter_ordinal{};

  bool append(log_channel channel,
              const waybill::schema::bytes_view_t& record);
  std::optional<std::vector<log_entry>> read(log_channel channel) const;

  /// Highest ordinal currently stored in channel (0 when empty).
  uint64_t load_last_ordinal(log_channel channel) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline bool storage<rocksdb_storage_tag>::append(
    const log_channel channel,
    const waybill::schema::bytes_view_t& record) {
  if (!database) {
    waybill::common::critical("RocksDB database is not initialized");
  }
  auto& last = channel == log_channel::events ? last_event_ordinal
                                              : last_counter_ordinal;
  auto key = detail::make_log_key(channel, last + 1);
  auto value_slice = ROCKSDB_NAMESPACE::Slice{
      reinterpret_cast<const char*>(record.data()), record.size()};
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Put(write_options, key, value_slice);
  if (!status.ok()) {
    spdlog::error("Failed to append record into RocksDB: {}",
                  status.ToString());
    return false;
  }
  ++last;
  return true;
}

inline std::optional<std::vector<log_entry>>
storage<rocksdb_storage_tag>::read(const log_channel channel) const {
  if (!database) {
    waybill::common::critical("RocksDB database is not initialized");
  }
  auto entries = std::vector<log_entry>{};
  auto prefix = std::string{detail::prefix_for(channel)};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix)) {
      break;
    }
    auto entry = log_entry{};
    if (auto ordinal = detail::parse_log_key(channel, key_view)) {
      entry.ordinal = *ordinal;
      entry.bytes = detail::to_bytes(iterator->value());
    } else {
      entry.error = "malformed log key";
    }
    entries.push_back(std::move(entry));
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("Failed iterating RocksDB log: {}",
                  iterator->status().ToString());
    return std::nullopt;
  }
  return entries;
}

inline uint64_t storage<rocksdb_storage_tag>::load_last_ordinal(
    const log_channel channel) const {
  if (!database) {
    waybill::common::critical("RocksDB database is not initialized");
  }
  auto upper = detail::make_log_key(channel, UINT64_MAX);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->SeekForPrev(upper);
  if (!iterator->Valid()) {
    return 0;
  }
  auto key_view =
      std::string_view{iterator->key().data(), iterator->key().size()};
  return detail::parse_log_key(channel, key_view).value_or(0);
}

}  // namespace waybill::storage
