#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <trafficviz/geom.hpp>

namespace trafficviz {

enum class VehicleCategory : int {
  Passenger = 0,
  Truck,
  Bus,
  Motorcycle,
  Bicycle,
  Emergency,
  Count
};

inline constexpr std::size_t kVehicleCategoryCount = static_cast<std::size_t>(VehicleCategory::Count);

// One substring rule of the type-tag classifier.
struct CategoryRule {
  std::string_view pattern;   // lower-case
  VehicleCategory  category;
};

// Evaluated top to bottom; first match wins. Anything else is a passenger car.
inline constexpr std::array<CategoryRule, 9> kCategoryRules{{
  {"bus",        VehicleCategory::Bus},
  {"truck",      VehicleCategory::Truck},
  {"trailer",    VehicleCategory::Truck},
  {"motorcycle", VehicleCategory::Motorcycle},
  {"moped",      VehicleCategory::Motorcycle},
  {"bicycle",    VehicleCategory::Bicycle},
  {"emergency",  VehicleCategory::Emergency},
  {"police",     VehicleCategory::Emergency},
  {"ambulance",  VehicleCategory::Emergency},
}};

// Case-insensitive classification of a free-text vehicle type tag.
VehicleCategory classify_vehicle_type(std::string_view type_tag);

const char* category_name(VehicleCategory c);

// Per-frame copy of one vehicle's dynamic state.
struct VehicleSnapshot {
  std::string     id;
  Vec2            position{};              // simulation space
  double          heading_deg{0.0};        // 0 = east, counter-clockwise
  VehicleCategory category{VehicleCategory::Passenger};
  double          speed{0.0};              // m/s, >= 0
  double          waiting_time{0.0};       // s stationary, >= 0
};

// Per-frame copy of one signal's state.
struct SignalSnapshot {
  std::string id;
  Vec2        position{};   // simulation space, resolved at session start
  std::string state;        // one of G/g/Y/y/R/r/other per controlled link
};

} // namespace trafficviz
