#include <blake3.h>
#include <waybill/blake3/hash.hpp>

namespace waybill::blake3 {

waybill::schema::hash32_t chain(const waybill::schema::hash32_t& previous,
                                const waybill::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, previous.data(), previous.size());
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = waybill::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace waybill::blake3
