#include <trafficviz/renderer.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace trafficviz {

static std::uint8_t clamp_channel(double v) {
  return static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

static double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

Rgba vehicle_color(const Theme& theme, VehicleCategory category,
                   std::optional<double> speed, std::optional<double> waiting_time) {
  Rgba c = theme.style_for(category).color;

  if (speed.has_value()) {
    const double f = theme.speed_norm_ceiling > 0.0 ? clamp01(*speed / theme.speed_norm_ceiling) : 1.0;
    const double k = theme.speed_lighten * f;
    c.r = clamp_channel(c.r + (255.0 - c.r) * k);
    c.g = clamp_channel(c.g + (255.0 - c.g) * k);
    c.b = clamp_channel(c.b + (255.0 - c.b) * k);
  }

  if (waiting_time.has_value() && *waiting_time > 0.0) {
    const double w = theme.wait_norm_ceiling > 0.0 ? clamp01(*waiting_time / theme.wait_norm_ceiling) : 1.0;
    const Rgba& s = theme.stopped_color;
    c.r = clamp_channel(c.r * (1.0 - w) + s.r * w);
    c.g = clamp_channel(c.g * (1.0 - w) + s.g * w);
    c.b = clamp_channel(c.b * (1.0 - w) + s.b * w);
  }
  return c;
}

Rgba signal_color(const Theme& theme, char state) {
  switch (state) {
    case 'G': case 'g': return theme.signal_green;
    case 'Y': case 'y': return theme.signal_yellow;
    case 'R': case 'r': return theme.signal_red;
    default:            return theme.signal_off;
  }
}

FrameRenderer::FrameRenderer(DrawSurface& surface, const Viewport& viewport, Theme theme)
  : surface_(surface), viewport_(viewport), theme_(std::move(theme)) {}

void FrameRenderer::render_network() {
  const float width = zoomed_(theme_.road_width);
  for (const auto& [id, edge] : viewport_.topology().edges()) {
    if (edge.shape.size() < 2) continue; // unresolved endpoints
    Vec2 prev = viewport_.project(edge.shape.front());
    for (std::size_t i = 1; i < edge.shape.size(); ++i) {
      const Vec2 cur = viewport_.project(edge.shape[i]);
      surface_.draw_line(prev, cur, width, theme_.road_color);
      prev = cur;
    }
  }
}

void FrameRenderer::render_network(const std::vector<RoadStroke>& roads) {
  for (const auto& r : roads) {
    surface_.draw_line(viewport_.project(r.from), viewport_.project(r.to), zoomed_(r.width), r.color);
  }
}

void FrameRenderer::render_vehicle(const VehicleSnapshot& v, const std::optional<std::string>& label) {
  const VehicleStyle& style = theme_.style_for(v.category);
  const Vec2 c = viewport_.project(v.position);
  const float len = zoomed_(style.length);
  const float wid = zoomed_(style.width);
  const double rot = screen_rotation_deg(v.heading_deg);

  surface_.draw_rotated_rect(c, len, wid, static_cast<float>(rot),
                             vehicle_color(theme_, v.category, v.speed, v.waiting_time));

  // Direction marker: small triangle pointing along the glyph's length.
  const double a = rot * kDegToRad;
  const Vec2 fwd{ std::sin(a), -std::cos(a) };   // up at rest, clockwise, screen Y down
  const Vec2 side{ std::cos(a), std::sin(a) };
  const Vec2 tip  { c.x + fwd.x * 0.3 * len,  c.y + fwd.y * 0.3 * len };
  const Vec2 left { c.x - side.x * 0.3 * wid, c.y - side.y * 0.3 * wid };
  const Vec2 right{ c.x + side.x * 0.3 * wid, c.y + side.y * 0.3 * wid };
  surface_.draw_triangle(tip, left, right, theme_.heading_marker);

  if (label.has_value() && !label->empty()) {
    draw_label_(*label, Vec2{c.x, c.y - zoomed_(15.0f)});
  }
}

void FrameRenderer::render_traffic_light(const std::string& id, Vec2 position, const std::string& state) {
  const Vec2 c = viewport_.project(position);
  const float r       = zoomed_(theme_.signal_radius);
  const float spacing = zoomed_(theme_.signal_spacing);
  const float pad     = zoomed_(theme_.signal_padding);
  const double box_w = r * 2.0 + pad;
  const double box_h = (r * 2.0 + spacing) * static_cast<double>(state.size()) + pad;

  const Rect box{c.x - box_w / 2.0, c.y - box_h / 2.0, box_w, box_h};
  surface_.draw_rect(box, theme_.signal_frame);
  surface_.draw_rect(box.inflated(-4.0, -4.0), theme_.signal_panel);

  const double y0 = box.y + r + pad / 2.0;
  for (std::size_t i = 0; i < state.size(); ++i) {
    const Vec2 lc{c.x, y0 + static_cast<double>(i) * (r * 2.0 + spacing)};
    surface_.draw_circle(lc, r + 2.0f, theme_.signal_frame);
    surface_.draw_circle(lc, r, signal_color(theme_, state[i]));
  }
  draw_label_(id, Vec2{c.x, y0 - r - zoomed_(10.0f)});
}

void FrameRenderer::render_junction(const std::string& node_id) {
  const auto pos = viewport_.node_position(node_id);
  if (!pos) return;
  const float r = zoomed_(theme_.junction_radius);
  surface_.draw_circle(*pos, r, theme_.junction_fill);
  surface_.draw_ring(*pos, r, 2.0f, theme_.junction_outline);
}

void FrameRenderer::render_overlay(const std::vector<OverlayLine>& lines) {
  Vec2 at = theme_.overlay_anchor;
  for (const auto& l : lines) {
    surface_.draw_text(l.key + ": " + l.value, at, theme_.overlay_font_px, theme_.overlay_text);
    at.y += theme_.overlay_line_px;
  }
}

void FrameRenderer::render_help(const std::vector<std::string>& lines) {
  double y = surface_.height() - static_cast<double>(lines.size()) * theme_.overlay_line_px - 10.0;
  for (const auto& l : lines) {
    surface_.draw_text(l, Vec2{theme_.overlay_anchor.x, y}, theme_.help_font_px, theme_.help_text);
    y += theme_.overlay_line_px;
  }
}

void FrameRenderer::draw_label_(const std::string& text, Vec2 center) {
  const int fs = theme_.label_font_px;
  const double w = surface_.measure_text(text, fs);
  const Rect bg{center.x - w / 2.0 - 2.0, center.y - fs / 2.0 - 1.0, w + 4.0, fs + 2.0};
  surface_.draw_rect(bg, theme_.label_background);
  surface_.draw_text(text, Vec2{center.x - w / 2.0, center.y - fs / 2.0}, fs, theme_.label_text);
}

} // namespace trafficviz
