#include <trafficviz/snapshot.hpp>
#include <algorithm>
#include <cctype>

namespace trafficviz {

VehicleCategory classify_vehicle_type(std::string_view type_tag) {
  std::string lower(type_tag);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  for (const auto& rule : kCategoryRules) {
    if (lower.find(rule.pattern) != std::string::npos) return rule.category;
  }
  return VehicleCategory::Passenger;
}

const char* category_name(VehicleCategory c) {
  switch (c) {
    case VehicleCategory::Passenger:  return "passenger";
    case VehicleCategory::Truck:      return "truck";
    case VehicleCategory::Bus:        return "bus";
    case VehicleCategory::Motorcycle: return "motorcycle";
    case VehicleCategory::Bicycle:    return "bicycle";
    case VehicleCategory::Emergency:  return "emergency";
    default: return "unknown";
  }
}

} // namespace trafficviz
