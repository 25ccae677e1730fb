#pragma once

#include <waybill/schema/primitives.hpp>
#include <cstdint>

// Schema type: log frame.
// Durable log envelope: one encoded record plus its position in the log and
// a BLAKE3 digest chained from the previous frame's digest.
namespace waybill::schema {

template <uint16_t Version>
struct log_frame;

template <>
struct log_frame<1> final {
  uint16_t version{1};
  uint64_t position{};
  bytes_t record;
  hash32_t digest{};
};

using log_frame_t = log_frame<1>;

}  // namespace waybill::schema
