#include <waybill/storage/backend.hpp>

namespace waybill::storage {

backend_t make_backend(const backend_kind_t kind,
                       const std::string_view& path) {
  switch (kind) {
    case backend_kind_t::append_file:
      return backend_t{make_storage<append_file_storage_tag>(path)};
    case backend_kind_t::rocksdb:
      return backend_t{make_storage<rocksdb_storage_tag>(path)};
  }
  waybill::common::critical("unknown storage backend");
}

bool append(backend_t& backend,
            const log_channel channel,
            const waybill::schema::bytes_view_t& record) {
  return std::visit(
      [&](auto& store) { return store.append(channel, record); }, backend);
}

std::optional<std::vector<log_entry>> read(const backend_t& backend,
                                           const log_channel channel) {
  return std::visit([&](const auto& store) { return store.read(channel); },
                    backend);
}

}  // namespace waybill::storage
