#pragma once
#include <waybill/schema/primitives.hpp>

namespace waybill::blake3 {

/// Digest of `previous || bytes`; links one log frame to the frame before it.
waybill::schema::hash32_t chain(const waybill::schema::hash32_t& previous,
                                const waybill::schema::bytes_view_t& bytes);

}  // namespace waybill::blake3
