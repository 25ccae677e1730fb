#pragma once
#include <spdlog/spdlog.h>
#include <waybill/schema/encoding/json/encoder.hpp>
#include <waybill/storage/storage.hpp>
#include <filesystem>
#include <string_view>

namespace waybill::storage {

namespace detail {

inline constexpr auto kEventsFileName = std::string_view{"shipments.log"};
inline constexpr auto kCountersFileName =
    std::string_view{"shipment_counter.log"};

/// Owning POSIX descriptor opened for appending.
class file_descriptor final {
 public:
  file_descriptor() = default;
  explicit file_descriptor(int fd) : fd_{fd} {}
  file_descriptor(const file_descriptor&) = delete;
  file_descriptor& operator=(const file_descriptor&) = delete;
  file_descriptor(file_descriptor&& other) noexcept;
  file_descriptor& operator=(file_descriptor&& other) noexcept;
  ~file_descriptor();

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

 private:
  int fd_{-1};
};

}  // namespace detail

struct append_file_storage_tag {};

/// Newline-delimited UTF-8 text log: one JSON record per line, one file per
/// channel. Every append is flushed to stable storage before it returns.
template <>
struct storage<append_file_storage_tag> final {
  using encoder_t = waybill::schema::encoding::json_encoder_t;

  std::filesystem::path directory;
  detail::file_descriptor events_file;
  detail::file_descriptor counters_file;
  bool sync_writes{true};

  bool append(log_channel channel,
              const waybill::schema::bytes_view_t& record);
  std::optional<std::vector<log_entry>> read(log_channel channel) const;

  std::filesystem::path path_for(log_channel channel) const;
};

template <>
storage<append_file_storage_tag> make_storage<append_file_storage_tag>(
    const std::string_view& path);

}  // namespace waybill::storage
