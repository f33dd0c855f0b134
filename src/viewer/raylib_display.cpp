#include <raylib.h>
#include <utility>
#include <trafficviz/viewer/raylib_display.hpp>

namespace trafficviz {

namespace {

Color to_color(Rgba c) { return Color{c.r, c.g, c.b, c.a}; }
Vector2 to_vec(Vec2 v) { return Vector2{static_cast<float>(v.x), static_cast<float>(v.y)}; }

} // namespace

RaylibDisplay::RaylibDisplay(const SessionConfig& cfg)
  : width_(cfg.window_width), height_(cfg.window_height),
    pan_step_(cfg.pan_step), zoom_step_(cfg.zoom_step) {
  InitWindow(width_, height_, cfg.title.c_str());
  SetTargetFPS(cfg.target_fps);
  open_ = true;
}

RaylibDisplay::~RaylibDisplay() { close(); }

int RaylibDisplay::width() const  { return open_ ? GetScreenWidth()  : width_; }
int RaylibDisplay::height() const { return open_ ? GetScreenHeight() : height_; }

void RaylibDisplay::clear(Rgba color) {
  if (!open_) return;
  if (!frame_open_) {
    BeginDrawing();
    frame_open_ = true;
  }
  ClearBackground(to_color(color));
}

void RaylibDisplay::draw_line(Vec2 a, Vec2 b, float thickness, Rgba color) {
  if (!frame_open_) return;
  DrawLineEx(to_vec(a), to_vec(b), thickness, to_color(color));
}

void RaylibDisplay::draw_circle(Vec2 center, float radius, Rgba color) {
  if (!frame_open_) return;
  DrawCircleV(to_vec(center), radius, to_color(color));
}

void RaylibDisplay::draw_ring(Vec2 center, float radius, float thickness, Rgba color) {
  if (!frame_open_) return;
  const float inner = radius > thickness ? radius - thickness : 0.0f;
  DrawRing(to_vec(center), inner, radius, 0.0f, 360.0f, 36, to_color(color));
}

void RaylibDisplay::draw_rect(const Rect& r, Rgba color) {
  if (!frame_open_) return;
  DrawRectangleRec(Rectangle{static_cast<float>(r.x), static_cast<float>(r.y),
                             static_cast<float>(r.width), static_cast<float>(r.height)},
                   to_color(color));
}

void RaylibDisplay::draw_rotated_rect(Vec2 center, float length, float width, float rotation_deg, Rgba color) {
  if (!frame_open_) return;
  // Length along Y; raylib rotates clockwise on screen.
  const Rectangle rec{static_cast<float>(center.x), static_cast<float>(center.y), width, length};
  DrawRectanglePro(rec, Vector2{width * 0.5f, length * 0.5f}, rotation_deg, to_color(color));
}

void RaylibDisplay::draw_triangle(Vec2 a, Vec2 b, Vec2 c, Rgba color) {
  if (!frame_open_) return;
  // raylib culls clockwise triangles; with screen Y down that is a positive cross product.
  const double cross = (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
  if (cross > 0.0) std::swap(b, c);
  DrawTriangle(to_vec(a), to_vec(b), to_vec(c), to_color(color));
}

void RaylibDisplay::draw_text(const std::string& text, Vec2 top_left, int font_px, Rgba color) {
  if (!frame_open_) return;
  DrawText(text.c_str(), static_cast<int>(top_left.x), static_cast<int>(top_left.y), font_px, to_color(color));
}

float RaylibDisplay::measure_text(const std::string& text, int font_px) const {
  if (!open_) return 0.0f;
  return static_cast<float>(MeasureText(text.c_str(), font_px));
}

void RaylibDisplay::present() {
  if (!frame_open_) return;
  EndDrawing();
  frame_open_ = false;
}

void RaylibDisplay::close() {
  if (!open_) return;
  if (frame_open_) {
    EndDrawing();
    frame_open_ = false;
  }
  CloseWindow();
  open_ = false;
}

InputFrame RaylibDisplay::poll() {
  InputFrame in{};
  if (!open_) { in.quit = true; return in; }
  if (WindowShouldClose() || IsKeyPressed(KEY_ESCAPE)) { in.quit = true; return in; }

  // Arrow keys move the scene.
  if (IsKeyPressed(KEY_LEFT))  in.pan.x += pan_step_;
  if (IsKeyPressed(KEY_RIGHT)) in.pan.x -= pan_step_;
  if (IsKeyPressed(KEY_UP))    in.pan.y += pan_step_;
  if (IsKeyPressed(KEY_DOWN))  in.pan.y -= pan_step_;

  // Left-drag pan
  if (IsMouseButtonDown(MOUSE_BUTTON_LEFT)) {
    const Vector2 d = GetMouseDelta();
    in.pan.x += d.x;
    in.pan.y += d.y;
  }

  // Zoom
  if (IsKeyPressed(KEY_EQUAL) || IsKeyPressed(KEY_KP_ADD))      in.zoom *= zoom_step_;
  if (IsKeyPressed(KEY_MINUS) || IsKeyPressed(KEY_KP_SUBTRACT)) in.zoom /= zoom_step_;
  const float wheel = GetMouseWheelMove();
  if (wheel > 0.0f) in.zoom *= zoom_step_;
  if (wheel < 0.0f) in.zoom /= zoom_step_;

  in.toggle_ids     = IsKeyPressed(KEY_I);
  in.toggle_speeds  = IsKeyPressed(KEY_S);
  in.toggle_waiting = IsKeyPressed(KEY_W);
  return in;
}

} // namespace trafficviz
