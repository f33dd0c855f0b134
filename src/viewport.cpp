#include <trafficviz/viewport.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <trafficviz/logging.hpp>

namespace trafficviz {

Viewport::Viewport(const Topology& topo, int window_width, int window_height, double margin)
  : topo_(topo), width_(window_width), height_(window_height), margin_(margin) {
  compute_bounds_();
  compute_scaling_();
}

void Viewport::compute_bounds_() {
  constexpr double inf = std::numeric_limits<double>::infinity();
  min_ = {inf, inf};
  max_ = {-inf, -inf};
  auto grow = [&](const Vec2& p){
    min_.x = std::min(min_.x, p.x); min_.y = std::min(min_.y, p.y);
    max_.x = std::max(max_.x, p.x); max_.y = std::max(max_.y, p.y);
  };
  for (const auto& [id, n] : topo_.nodes()) grow(n.position);
  for (const auto& [id, e] : topo_.edges()) {
    for (const auto& p : e.shape) grow(p);
  }
  // Nothing to fit: fall back to a fixed default box.
  if (min_.x == inf) {
    min_ = {0.0, 0.0};
    max_ = {100.0, 100.0};
  }
  logging::get_logger()->debug("Network bounds: ({}, {}) to ({}, {})", min_.x, min_.y, max_.x, max_.y);
}

void Viewport::compute_scaling_() {
  const double avail_w = width_  - 2.0 * margin_;
  const double avail_h = height_ - 2.0 * margin_;
  const double box_w = max_.x - min_.x;
  const double box_h = max_.y - min_.y;

  // A zero-extent axis gets scale 1, which then caps the fitted scale.
  const double scale_x = box_w > 0.0 ? avail_w / box_w : 1.0;
  const double scale_y = box_h > 0.0 ? avail_h / box_h : 1.0;
  scale_ = std::min(scale_x, scale_y);
  if (!(scale_ > 0.0) || !std::isfinite(scale_)) scale_ = 1.0; // window smaller than margins

  offset_.x = margin_ + (avail_w - box_w * scale_) / 2.0;
  offset_.y = margin_ + (avail_h - box_h * scale_) / 2.0;
  logging::get_logger()->debug("Scaling factor: {}, offsets: ({}, {})", scale_, offset_.x, offset_.y);
}

Vec2 Viewport::base_project(Vec2 sim) const {
  return Vec2{
    offset_.x + (sim.x - min_.x) * scale_,
    height_ - (offset_.y + (sim.y - min_.y) * scale_)
  };
}

Vec2 Viewport::apply_view(Vec2 s) const {
  return Vec2{ s.x * view_.zoom + view_.pan.x, s.y * view_.zoom + view_.pan.y };
}

Vec2 Viewport::project(Vec2 sim) const {
  return apply_view(base_project(sim));
}

std::optional<Vec2> Viewport::node_position(const std::string& node_id) const {
  const Node* n = topo_.find_node(node_id);
  if (!n) return std::nullopt;
  return project(n->position);
}

std::optional<std::vector<Vec2>> Viewport::edge_shape(const std::string& edge_id) const {
  const RoadSegment* e = topo_.find_edge(edge_id);
  if (!e) return std::nullopt;
  std::vector<Vec2> out;
  out.reserve(e->shape.size());
  for (const auto& p : e->shape) out.push_back(project(p));
  return out;
}

void Viewport::set_view(const ViewState& v) {
  view_.pan = v.pan;
  if (std::isfinite(v.zoom) && v.zoom > 0.0) view_.zoom = v.zoom;
}

void Viewport::zoom_by(double factor) {
  if (!std::isfinite(factor) || factor <= 0.0) return;
  view_.zoom *= factor;
}

} // namespace trafficviz
