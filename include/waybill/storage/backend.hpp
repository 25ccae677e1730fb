#pragma once
#include <waybill/schema/enum_string.hpp>
#include <waybill/storage/append_file/storage.hpp>
#include <waybill/storage/rocksdb/storage.hpp>
#include <waybill/storage/storage.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <variant>

namespace waybill::storage {

enum class backend_kind_t : uint8_t { append_file = 0, rocksdb = 1 };

inline constexpr auto kBackendKindMappings = std::array{
    std::pair<std::string_view, backend_kind_t>{"file",
                                                backend_kind_t::append_file},
    std::pair<std::string_view, backend_kind_t>{"rocksdb",
                                                backend_kind_t::rocksdb}};

inline constexpr std::string_view to_string(const backend_kind_t value) {
  return waybill::schema::to_string(value, kBackendKindMappings)
      .value_or("unknown");
}

inline std::optional<backend_kind_t> try_backend_from_string(
    const std::string_view value) {
  return waybill::schema::from_string(value, kBackendKindMappings);
}

/// Either durable log implementation; everything above the storage layer is
/// written against this variant only.
using backend_t = std::variant<storage<append_file_storage_tag>,
                               storage<rocksdb_storage_tag>>;

backend_t make_backend(backend_kind_t kind, const std::string_view& path);

bool append(backend_t& backend,
            log_channel channel,
            const waybill::schema::bytes_view_t& record);

std::optional<std::vector<log_entry>> read(const backend_t& backend,
                                           log_channel channel);

/// Serialize obj with the record codec of the active backend.
template <typename T>
waybill::schema::bytes_t encode_record(const backend_t& backend, const T& obj) {
  return std::visit(
      [&](const auto& store) {
        using encoder_t = typename std::decay_t<decltype(store)>::encoder_t;
        return encoder_t{}.encode(obj);
      },
      backend);
}

template <typename T>
std::optional<T> try_decode_record(const backend_t& backend,
                                   const waybill::schema::bytes_view_t& bytes) {
  return std::visit(
      [&](const auto& store) {
        using encoder_t = typename std::decay_t<decltype(store)>::encoder_t;
        return encoder_t{}.template try_decode<T>(bytes);
      },
      backend);
}

}  // namespace waybill::storage
