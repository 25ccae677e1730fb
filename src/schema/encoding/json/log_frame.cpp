#include <waybill/schema/encoding/json/log_frame.hpp>
#include <waybill/schema/encoding/json/primitives.hpp>

#include <iterator>

using namespace waybill::schema;

namespace waybill::schema::encoding::json {

namespace {

constexpr auto kPositionKey = "position";
constexpr auto kDigestKey = "digest";

}  // namespace

void encode(const log_frame<1>& o, nlohmann::json& out) {
  out = nlohmann::json::parse(std::begin(o.record), std::end(o.record));
  if (!out.is_object() || out.contains(kPositionKey) ||
      out.contains(kDigestKey)) {
    throw std::invalid_argument{"frame record must be a plain JSON object"};
  }
  out[kPositionKey] = o.position;
  out[kDigestKey] = to_hex(o.digest);
}

// The record is whatever remains once the frame keys are removed, re-emitted
// in canonical form; that is the byte string the digest covers.
void decode(const nlohmann::json& in, log_frame<1>& o) {
  if (!in.is_object()) {
    throw std::invalid_argument{"frame must be a JSON object"};
  }
  o.version = 1;
  o.position = decode_unsigned(in.at(kPositionKey));
  o.digest = decode_digest(in.at(kDigestKey));

  auto record = in;
  record.erase(kPositionKey);
  record.erase(kDigestKey);
  o.record = make_bytes(record.dump());
}

}  // namespace waybill::schema::encoding::json
