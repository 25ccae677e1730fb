#include <waybill/schema/encoding/scale/primitives.hpp>

#include <string>
#include <tuple>
#include <vector>

using namespace waybill::schema;

namespace waybill::schema::encoding::scale {

void encode(payload_t&& o, ::scale::Encoder& encoder) {
  auto entries = std::vector<std::tuple<std::string, std::string>>{};
  entries.reserve(o.size());
  for (const auto& [key, value] : o) {
    entries.emplace_back(key, value);
  }
  encode(entries, encoder);
}

void decode(payload_t&& o, ::scale::Decoder& decoder) {
  auto entries = std::vector<std::tuple<std::string, std::string>>{};
  decode(entries, decoder);
  o.clear();
  for (auto& [key, value] : entries) {
    o.insert_or_assign(std::move(key), std::move(value));
  }
}

}  // namespace waybill::schema::encoding::scale
