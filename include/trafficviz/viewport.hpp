#pragma once
#include <optional>
#include <string>
#include <vector>
#include <trafficviz/geom.hpp>
#include <trafficviz/topology.hpp>

namespace trafficviz {

// Run-time camera state applied on top of the fitted projection.
struct ViewState {
  Vec2   pan{};       // pixels
  double zoom{1.0};   // multiplicative, about the screen origin
};

// Maps simulation space onto a fixed-size window.
// The fitted (base) projection is computed once from the topology; pan/zoom
// are composed on top: final = base * zoom + pan.
class Viewport {
public:
  static constexpr double kDefaultMargin = 50.0;

  Viewport(const Topology& topo, int window_width, int window_height,
           double margin = kDefaultMargin);

  // Fitted projection only (no pan/zoom). Y is inverted: simulation Y grows
  // north, screen Y grows down.
  Vec2 base_project(Vec2 sim) const;
  // Fitted projection composed with the current view.
  Vec2 project(Vec2 sim) const;
  // Pan/zoom only, for points already in base screen space.
  Vec2 apply_view(Vec2 base_screen) const;

  // Projected positions; nullopt when the id is unknown.
  std::optional<Vec2> node_position(const std::string& node_id) const;
  std::optional<std::vector<Vec2>> edge_shape(const std::string& edge_id) const;

  const ViewState& view() const { return view_; }
  void set_view(const ViewState& v);
  void pan_by(double dx, double dy) { view_.pan.x += dx; view_.pan.y += dy; }
  void zoom_by(double factor);
  void reset_view() { view_ = ViewState{}; }

  Vec2 min_bound() const { return min_; }
  Vec2 max_bound() const { return max_; }
  double base_scale() const { return scale_; }
  Vec2 base_offset() const { return offset_; }
  int window_width() const { return width_; }
  int window_height() const { return height_; }
  double margin() const { return margin_; }
  const Topology& topology() const { return topo_; }

private:
  void compute_bounds_();
  void compute_scaling_();

  const Topology& topo_;
  int    width_;
  int    height_;
  double margin_;

  Vec2   min_{};
  Vec2   max_{};
  double scale_{1.0};
  Vec2   offset_{};
  ViewState view_{};
};

} // namespace trafficviz
