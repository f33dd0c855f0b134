#pragma once
#include <string>
#include <trafficviz/config.hpp>
#include <trafficviz/surface.hpp>

namespace trafficviz {

// RAII raylib window: draws frames and reports keyboard/mouse input.
class RaylibDisplay : public DrawSurface, public InputSource {
public:
  explicit RaylibDisplay(const SessionConfig& cfg);
  ~RaylibDisplay() override;
  RaylibDisplay(const RaylibDisplay&) = delete;
  RaylibDisplay& operator=(const RaylibDisplay&) = delete;

  // DrawSurface
  int width() const override;
  int height() const override;
  void clear(Rgba color) override;
  void draw_line(Vec2 a, Vec2 b, float thickness, Rgba color) override;
  void draw_circle(Vec2 center, float radius, Rgba color) override;
  void draw_ring(Vec2 center, float radius, float thickness, Rgba color) override;
  void draw_rect(const Rect& r, Rgba color) override;
  void draw_rotated_rect(Vec2 center, float length, float width, float rotation_deg, Rgba color) override;
  void draw_triangle(Vec2 a, Vec2 b, Vec2 c, Rgba color) override;
  void draw_text(const std::string& text, Vec2 top_left, int font_px, Rgba color) override;
  float measure_text(const std::string& text, int font_px) const override;
  void present() override;
  void close() override;

  // InputSource
  InputFrame poll() override;

private:
  int    width_;
  int    height_;
  double pan_step_;
  double zoom_step_;
  bool   open_{false};
  bool   frame_open_{false};
};

} // namespace trafficviz
