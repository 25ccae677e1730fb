#include <waybill/schema/integrity_report.hpp>

#include <set>

namespace waybill::schema {

std::vector<shipment_id_t> integrity_report<1>::offending_shipments() const {
  auto unique = std::set<shipment_id_t>{};
  for (const auto& violation : violations) {
    if (violation.shipment_id.has_value()) {
      unique.insert(*violation.shipment_id);
    }
  }
  return {std::begin(unique), std::end(unique)};
}

}  // namespace waybill::schema
