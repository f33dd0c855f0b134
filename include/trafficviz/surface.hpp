#pragma once
#include <string>
#include <trafficviz/geom.hpp>

namespace trafficviz {

// Drawing target for one window. Coordinates are screen pixels.
// A frame is clear() ... draw calls ... present().
class DrawSurface {
public:
  virtual ~DrawSurface() = default;

  virtual int width() const = 0;
  virtual int height() const = 0;

  virtual void clear(Rgba color) = 0;
  virtual void draw_line(Vec2 a, Vec2 b, float thickness, Rgba color) = 0;
  virtual void draw_circle(Vec2 center, float radius, Rgba color) = 0;
  virtual void draw_ring(Vec2 center, float radius, float thickness, Rgba color) = 0;
  virtual void draw_rect(const Rect& r, Rgba color) = 0;
  // Rectangle centered on `center` with its length along screen up at rotation 0,
  // rotated clockwise (as seen on screen).
  virtual void draw_rotated_rect(Vec2 center, float length, float width, float rotation_deg, Rgba color) = 0;
  virtual void draw_triangle(Vec2 a, Vec2 b, Vec2 c, Rgba color) = 0;
  virtual void draw_text(const std::string& text, Vec2 top_left, int font_px, Rgba color) = 0;
  virtual float measure_text(const std::string& text, int font_px) const = 0;

  virtual void present() = 0;
  // Releases the window; further calls are no-ops.
  virtual void close() = 0;
};

// User input gathered since the previous poll.
struct InputFrame {
  bool   quit{false};
  Vec2   pan{};           // pixels to add to the pan offset
  double zoom{1.0};       // factor to multiply into the zoom
  bool   toggle_ids{false};
  bool   toggle_speeds{false};
  bool   toggle_waiting{false};
};

class InputSource {
public:
  virtual ~InputSource() = default;
  virtual InputFrame poll() = 0;
};

} // namespace trafficviz
