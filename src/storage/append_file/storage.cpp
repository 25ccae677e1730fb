#include <fcntl.h>
#include <unistd.h>
#include <waybill/common/critical.hpp>
#include <waybill/storage/append_file/storage.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace waybill::storage {

namespace detail {

file_descriptor::file_descriptor(file_descriptor&& other) noexcept
    : fd_{std::exchange(other.fd_, -1)} {}

file_descriptor& file_descriptor::operator=(file_descriptor&& other) noexcept {
  if (this != &other) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

file_descriptor::~file_descriptor() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

}  // namespace detail

namespace {

detail::file_descriptor open_for_append(const std::filesystem::path& path) {
  auto fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC,
                   0644);
  if (fd < 0) {
    waybill::common::critical("Failed to open log file {}: {}", path.string(),
                              std::strerror(errno));
  }
  return detail::file_descriptor{fd};
}

bool write_fully(const int fd, const std::string& line) {
  auto written = std::size_t{0};
  while (written < line.size()) {
    auto result = ::write(fd, line.data() + written, line.size() - written);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<std::size_t>(result);
  }
  return true;
}

// A final line without its newline was never acknowledged to a caller; cut it
// off so the next record starts on a line of its own.
void repair_torn_tail(const std::filesystem::path& path) {
  auto error = std::error_code{};
  auto size = std::filesystem::file_size(path, error);
  if (error || size == 0) {
    return;
  }

  auto in = std::ifstream{path, std::ios::binary};
  auto content = std::string{std::istreambuf_iterator<char>{in},
                             std::istreambuf_iterator<char>{}};
  if (content.empty() || content.back() == '\n') {
    return;
  }

  auto keep = content.rfind('\n');
  auto new_size = keep == std::string::npos ? std::uintmax_t{0}
                                            : static_cast<std::uintmax_t>(keep + 1);
  spdlog::warn("Discarding {} byte(s) of torn record at the end of {}",
               content.size() - new_size, path.string());
  std::filesystem::resize_file(path, new_size, error);
  if (error) {
    waybill::common::critical("Failed to repair torn log {}: {}",
                              path.string(), error.message());
  }
}

}  // namespace

std::filesystem::path storage<append_file_storage_tag>::path_for(
    const log_channel channel) const {
  switch (channel) {
    case log_channel::events:
      return directory / detail::kEventsFileName;
    case log_channel::counters:
      return directory / detail::kCountersFileName;
  }
  return directory / detail::kEventsFileName;
}

bool storage<append_file_storage_tag>::append(
    const log_channel channel,
    const waybill::schema::bytes_view_t& record) {
  const auto& file =
      channel == log_channel::events ? events_file : counters_file;
  if (!file.valid()) {
    waybill::common::critical("append-only log file is not open");
  }

  auto line = std::string{std::begin(record), std::end(record)};
  if (line.find('\n') != std::string::npos) {
    spdlog::error("Refusing record with an embedded newline for {}",
                  path_for(channel).string());
    return false;
  }
  line.push_back('\n');

  auto offset = ::lseek(file.get(), 0, SEEK_END);
  if (offset < 0) {
    spdlog::error("Failed to seek log {}: {}", path_for(channel).string(),
                  std::strerror(errno));
    return false;
  }

  auto ok = write_fully(file.get(), line);
  if (ok && sync_writes) {
    ok = ::fdatasync(file.get()) == 0;
  }
  if (!ok) {
    spdlog::error("Failed to append record to {}: {}",
                  path_for(channel).string(), std::strerror(errno));
    if (::ftruncate(file.get(), offset) != 0) {
      spdlog::critical("Failed to roll back partial record in {}: {}",
                       path_for(channel).string(), std::strerror(errno));
    }
    return false;
  }
  return true;
}

std::optional<std::vector<log_entry>> storage<append_file_storage_tag>::read(
    const log_channel channel) const {
  auto path = path_for(channel);
  auto error = std::error_code{};
  if (!std::filesystem::exists(path, error)) {
    return std::vector<log_entry>{};
  }

  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    spdlog::error("Failed to open log {} for reading", path.string());
    return std::nullopt;
  }
  auto buffer = std::stringstream{};
  buffer << in.rdbuf();
  if (in.bad()) {
    spdlog::error("Failed reading log {}", path.string());
    return std::nullopt;
  }
  auto content = buffer.str();

  auto entries = std::vector<log_entry>{};
  auto start = std::size_t{0};
  auto ordinal = uint64_t{0};
  while (start < content.size()) {
    auto end = content.find('\n', start);
    auto terminated = end != std::string::npos;
    if (!terminated) {
      end = content.size();
    }
    auto line = std::string_view{content}.substr(start, end - start);
    start = end + 1;

    auto entry = log_entry{};
    entry.ordinal = ++ordinal;
    entry.truncated = !terminated;
    if (line.empty()) {
      entry.error = "empty line";
    } else {
      entry.bytes = waybill::schema::make_bytes(line);
    }
    if (entry.truncated && entry.error.empty()) {
      entry.error = "unterminated final line";
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

template <>
storage<append_file_storage_tag> make_storage<append_file_storage_tag>(
    const std::string_view& path) {
  auto store = storage<append_file_storage_tag>{};
  store.directory = std::filesystem::path{path};

  auto error = std::error_code{};
  std::filesystem::create_directories(store.directory, error);
  if (error) {
    waybill::common::critical("Failed to create data directory {}: {}", path,
                              error.message());
  }

  repair_torn_tail(store.path_for(log_channel::events));
  repair_torn_tail(store.path_for(log_channel::counters));
  store.events_file = open_for_append(store.path_for(log_channel::events));
  store.counters_file = open_for_append(store.path_for(log_channel::counters));
  spdlog::info("Opened append-only logs in {}", path);
  return store;
}

}  // namespace waybill::storage
