#pragma once
#include <array>
#include <trafficviz/geom.hpp>
#include <trafficviz/snapshot.hpp>

namespace trafficviz {

namespace palette {
inline constexpr Rgba kBlack{0, 0, 0, 255};
inline constexpr Rgba kWhite{255, 255, 255, 255};
inline constexpr Rgba kRed{255, 0, 0, 255};
inline constexpr Rgba kGreen{0, 255, 0, 255};
inline constexpr Rgba kYellow{255, 255, 0, 255};
inline constexpr Rgba kBlue{0, 0, 255, 255};
inline constexpr Rgba kCyan{0, 255, 255, 255};
inline constexpr Rgba kMagenta{255, 0, 255, 255};
inline constexpr Rgba kGray{200, 200, 200, 255};
inline constexpr Rgba kDarkGray{100, 100, 100, 255};
inline constexpr Rgba kLightGreen{100, 255, 100, 255};
} // namespace palette

struct VehicleStyle {
  Rgba  color{};
  float length{8.0f};  // px at zoom 1
  float width{4.0f};
};

// Every color, size and normalization constant used by the renderer.
struct Theme {
  Rgba background{palette::kWhite};

  Rgba  road_color{palette::kDarkGray};
  float road_width{10.0f};

  // Indexed by VehicleCategory.
  std::array<VehicleStyle, kVehicleCategoryCount> vehicles{{
    {palette::kBlue,       8.0f, 4.0f},   // passenger
    {palette::kDarkGray,  10.0f, 5.0f},   // truck
    {palette::kLightGreen,12.0f, 5.0f},   // bus
    {palette::kMagenta,    6.0f, 3.0f},   // motorcycle
    {palette::kCyan,       4.0f, 2.0f},   // bicycle
    {palette::kRed,        8.0f, 4.0f},   // emergency
  }};
  Rgba   heading_marker{palette::kBlack};
  Rgba   stopped_color{palette::kRed};
  double speed_norm_ceiling{30.0};  // m/s at which the speed tint saturates
  double wait_norm_ceiling{60.0};   // s at which the stopped blend saturates
  double speed_lighten{0.5};        // fraction of the way to white at full speed

  Rgba  signal_green{palette::kGreen};
  Rgba  signal_yellow{palette::kYellow};
  Rgba  signal_red{palette::kRed};
  Rgba  signal_off{palette::kDarkGray};
  Rgba  signal_frame{palette::kBlack};
  Rgba  signal_panel{palette::kGray};
  float signal_radius{10.0f};
  float signal_spacing{6.0f};
  float signal_padding{8.0f};

  Rgba  junction_fill{palette::kDarkGray};
  Rgba  junction_outline{palette::kBlack};
  float junction_radius{15.0f};

  Rgba label_text{palette::kWhite};
  Rgba label_background{palette::kBlack};
  int  label_font_px{10};

  Rgba overlay_text{palette::kBlack};
  int  overlay_font_px{16};
  Vec2 overlay_anchor{10.0, 10.0};
  int  overlay_line_px{20};

  Rgba help_text{50, 50, 50, 255};
  int  help_font_px{14};

  const VehicleStyle& style_for(VehicleCategory c) const {
    const auto i = static_cast<std::size_t>(c);
    return vehicles[i < vehicles.size() ? i : 0];
  }
};

} // namespace trafficviz
