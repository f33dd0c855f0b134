#pragma once
#include <optional>
#include <string>
#include <vector>
#include <trafficviz/geom.hpp>
#include <trafficviz/snapshot.hpp>
#include <trafficviz/surface.hpp>
#include <trafficviz/theme.hpp>
#include <trafficviz/viewport.hpp>

namespace trafficviz {

// Explicit road piece in simulation space (used instead of the topology).
struct RoadStroke {
  Vec2  from{};
  Vec2  to{};
  float width{10.0f};
  Rgba  color{palette::kDarkGray};
};

struct OverlayLine {
  std::string key;
  std::string value;
};

// Base category color, lightened with speed, then blended toward the stopped
// color with waiting time. Each step is linear per channel and clamped.
Rgba vehicle_color(const Theme& theme, VehicleCategory category,
                   std::optional<double> speed, std::optional<double> waiting_time);

// Simulation heading (0 = east, CCW) to the clockwise screen rotation of a
// glyph that points up at rest.
inline double screen_rotation_deg(double heading_deg) { return -heading_deg + 90.0; }

// Indicator color for one character of a signal state string.
Rgba signal_color(const Theme& theme, char state);

// Draw operations for one frame. Holds no per-frame state: everything drawn
// comes from the arguments, the topology and the viewport's current view.
class FrameRenderer {
public:
  FrameRenderer(DrawSurface& surface, const Viewport& viewport, Theme theme = {});

  void render_network();
  void render_network(const std::vector<RoadStroke>& roads);
  void render_vehicle(const VehicleSnapshot& v, const std::optional<std::string>& label = std::nullopt);
  void render_traffic_light(const std::string& id, Vec2 position, const std::string& state);
  void render_junction(const std::string& node_id);
  void render_overlay(const std::vector<OverlayLine>& lines);
  // Key-binding hints anchored to the bottom-left corner.
  void render_help(const std::vector<std::string>& lines);

  const Theme& theme() const { return theme_; }
  const Viewport& viewport() const { return viewport_; }

private:
  void draw_label_(const std::string& text, Vec2 center);
  float zoomed_(float px) const { return px * static_cast<float>(viewport_.view().zoom); }

  DrawSurface&    surface_;
  const Viewport& viewport_;
  const Theme     theme_;
};

} // namespace trafficviz
