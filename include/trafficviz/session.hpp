#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <trafficviz/config.hpp>
#include <trafficviz/engine.hpp>
#include <trafficviz/renderer.hpp>
#include <trafficviz/signal_placement.hpp>
#include <trafficviz/snapshot.hpp>
#include <trafficviz/stats.hpp>
#include <trafficviz/surface.hpp>
#include <trafficviz/theme.hpp>
#include <trafficviz/topology.hpp>
#include <trafficviz/viewport.hpp>

namespace trafficviz {

enum class SessionState : int {
  Uninitialized = 0,
  Started,
  Closed
};

const char* session_state_name(SessionState s);

// Drives the engine one tick per frame and draws the post-step state.
// Single-threaded: step() advances, pulls, handles input, then renders.
class LiveSession {
public:
  LiveSession(SimEngine& engine, DrawSurface& surface, InputSource& input,
              const Topology& topo, std::string resource,
              SessionConfig cfg = {}, Theme theme = {});
  ~LiveSession();
  LiveSession(const LiveSession&) = delete;
  LiveSession& operator=(const LiveSession&) = delete;

  // Opens the engine session and places every signal. Throws EngineUnavailable
  // (the session is closed first).
  void start();
  // One tick + one frame. False once the session should not continue.
  bool step(int delay_ms = 0);
  // start(), up to `steps` steps, close(). Returns the number of steps run.
  int run(int steps, int delay_ms = 0);
  void close();

  void set_mode_label(std::string label) { stats_.set_mode(std::move(label)); }

  SessionState state() const { return state_; }
  const SessionStats& stats() const { return stats_.stats(); }
  const StatsSeries& series() const { return stats_.series(); }
  const std::map<std::string, SignalPlacement>& signal_placements() const { return placements_; }
  const Viewport& viewport() const { return viewport_; }
  const ViewState& view() const { return viewport_.view(); }
  const DisplayToggles& toggles() const { return toggles_; }
  const SessionConfig& config() const { return cfg_; }

private:
  void resolve_signals_();
  std::optional<Vec2> incoming_lane_end_(const std::string& signal_id);
  void pull_snapshots_();
  bool process_input_();
  void render_frame_();
  std::optional<std::string> vehicle_label_(const VehicleSnapshot& v) const;
  std::vector<OverlayLine> overlay_lines_() const;

  // Dependencies
  SimEngine&      engine_;
  DrawSurface&    surface_;
  InputSource&    input_;
  const Topology& topo_;
  std::string     resource_;
  SessionConfig   cfg_;

  // Projection & drawing
  Viewport      viewport_;
  FrameRenderer renderer_;

  // Per-session state
  StatsAccumulator stats_;
  DisplayToggles   toggles_{};
  std::map<std::string, SignalPlacement> placements_;
  SessionState state_{SessionState::Uninitialized};
  bool engine_open_{false};

  // Current frame (owned for the frame's duration)
  std::vector<VehicleSnapshot> vehicles_;
  std::vector<SignalSnapshot>  signals_;
};

// Pulls one vehicle's attributes. Throws EntityLookupFailure.
VehicleSnapshot pull_vehicle_snapshot(SimEngine& engine, const std::string& id);

} // namespace trafficviz
