#include <trafficviz/session.hpp>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <thread>
#include <utility>
#include <trafficviz/errors.hpp>
#include <trafficviz/logging.hpp>

namespace trafficviz {

namespace {

// Number of signals whose state strings are listed in the overlay.
constexpr std::size_t kSignalDebugLines = 5;

const std::vector<std::string>& help_lines() {
  static const std::vector<std::string> lines{
    "Arrows / Mouse Drag: Pan view",
    "+/- / Mouse Wheel: Zoom in/out",
    "I: Toggle vehicle IDs",
    "S: Toggle speed display",
    "W: Toggle waiting time display",
    "ESC: Quit",
  };
  return lines;
}

} // namespace

const char* session_state_name(SessionState s) {
  switch (s) {
    case SessionState::Uninitialized: return "uninitialized";
    case SessionState::Started:       return "started";
    case SessionState::Closed:        return "closed";
    default: return "unknown";
  }
}

VehicleSnapshot pull_vehicle_snapshot(SimEngine& engine, const std::string& id) {
  VehicleSnapshot v{};
  v.id           = id;
  v.position     = engine.vehicle_position(id);
  v.heading_deg  = engine.vehicle_heading(id);
  v.category     = classify_vehicle_type(engine.vehicle_type(id));
  v.speed        = std::max(0.0, engine.vehicle_speed(id));
  v.waiting_time = std::max(0.0, engine.vehicle_waiting_time(id));
  return v;
}

LiveSession::LiveSession(SimEngine& engine, DrawSurface& surface, InputSource& input,
                         const Topology& topo, std::string resource,
                         SessionConfig cfg, Theme theme)
  : engine_(engine), surface_(surface), input_(input), topo_(topo),
    resource_(std::move(resource)), cfg_(std::move(cfg)),
    viewport_(topo_, surface_.width(), surface_.height(), cfg_.margin),
    renderer_(surface_, viewport_, std::move(theme)),
    toggles_(cfg_.toggles) {
  stats_.set_mode(cfg_.mode);
}

LiveSession::~LiveSession() { close(); }

void LiveSession::start() {
  auto log = logging::get_logger();
  if (state_ == SessionState::Started) return;
  if (state_ == SessionState::Closed) {
    log->warn("start() on a closed session ignored");
    return;
  }

  // Any failure while opening leaves the session closed.
  try {
    engine_.start(resource_);
    engine_open_ = true;
    resolve_signals_();
  } catch (const std::exception& e) {
    log->error("Could not start simulation: {}", e.what());
    close();
    throw;
  }
  state_ = SessionState::Started;
  log->info("Session started ({})", resource_);
}

std::optional<Vec2> LiveSession::incoming_lane_end_(const std::string& signal_id) {
  try {
    const auto lanes = engine_.signal_controlled_lanes(signal_id);
    if (lanes.empty()) return std::nullopt;
    const auto shape = engine_.lane_shape(lanes.front());
    if (shape.empty()) return std::nullopt;
    return shape.back(); // lane end is closest to the junction
  } catch (const EntityLookupFailure& e) {
    logging::get_logger()->debug("No lane geometry for signal {}: {}", signal_id, e.what());
    return std::nullopt;
  }
}

void LiveSession::resolve_signals_() {
  auto log = logging::get_logger();
  placements_.clear();

  const auto ids = engine_.signal_ids();
  if (ids.empty()) log->warn("No traffic signals in the simulation");

  const LaneEndLookup lane_end = [this](const std::string& id){ return incoming_lane_end_(id); };
  std::size_t placed = 0;
  for (const auto& id : ids) {
    SignalPlacement p = resolve_signal_position(id, topo_, lane_end);
    if (p.how == Resolution::Unresolved) {
      log->warn("Signal {} has no resolvable position; it will not be drawn", id);
    } else {
      log->debug("Signal {} placed by {} match", id, resolution_name(p.how));
      ++placed;
    }
    placements_[id] = std::move(p);
  }
  log->info("Placed {} of {} signals", placed, ids.size());
}

void LiveSession::pull_snapshots_() {
  auto log = logging::get_logger();
  vehicles_.clear();
  signals_.clear();

  const auto ids = engine_.vehicle_ids();
  vehicles_.reserve(ids.size());
  for (const auto& id : ids) {
    try {
      vehicles_.push_back(pull_vehicle_snapshot(engine_, id));
    } catch (const EntityLookupFailure& e) {
      log->warn("Skipping vehicle {} this frame: {}", id, e.what());
    }
  }

  for (const auto& id : engine_.signal_ids()) {
    const auto it = placements_.find(id);
    if (it == placements_.end() || !it->second.position) continue;
    try {
      signals_.push_back(SignalSnapshot{id, *it->second.position, engine_.signal_state(id)});
    } catch (const EntityLookupFailure& e) {
      log->warn("Skipping signal {} this frame: {}", id, e.what());
    }
  }

  stats_.record_step(vehicles_, ids.size(), engine_.arrived_count(), engine_.sim_time());
}

bool LiveSession::process_input_() {
  const InputFrame in = input_.poll();
  if (in.quit) return false;

  viewport_.pan_by(in.pan.x, in.pan.y);
  viewport_.zoom_by(in.zoom);

  if (in.toggle_ids)     toggles_.show_ids     = !toggles_.show_ids;
  if (in.toggle_speeds)  toggles_.show_speeds  = !toggles_.show_speeds;
  if (in.toggle_waiting) toggles_.show_waiting = !toggles_.show_waiting;
  return true;
}

std::optional<std::string> LiveSession::vehicle_label_(const VehicleSnapshot& v) const {
  std::string label;
  char buf[32];
  auto append = [&](const std::string& part) {
    if (!label.empty()) label += "  ";
    label += part;
  };
  if (toggles_.show_ids) append(v.id);
  if (toggles_.show_speeds) {
    std::snprintf(buf, sizeof(buf), "%.1f m/s", v.speed);
    append(buf);
  }
  if (toggles_.show_waiting && v.waiting_time > 0.0) {
    std::snprintf(buf, sizeof(buf), "Wait: %.0fs", v.waiting_time);
    append(buf);
  }
  if (label.empty()) return std::nullopt;
  return label;
}

std::vector<OverlayLine> LiveSession::overlay_lines_() const {
  auto lines = stats_.overlay_lines();
  if (cfg_.show_signal_states) {
    const std::size_t n = std::min(kSignalDebugLines, signals_.size());
    for (std::size_t i = 0; i < n; ++i) {
      lines.push_back({"Signal " + signals_[i].id, signals_[i].state});
    }
  }
  return lines;
}

void LiveSession::render_frame_() {
  surface_.clear(renderer_.theme().background);

  renderer_.render_network();
  for (const auto& v : vehicles_) renderer_.render_vehicle(v, vehicle_label_(v));
  for (const auto& s : signals_)  renderer_.render_traffic_light(s.id, s.position, s.state);
  for (const auto& [id, node] : topo_.nodes()) renderer_.render_junction(id);
  renderer_.render_overlay(overlay_lines_());
  if (cfg_.show_help) renderer_.render_help(help_lines());

  surface_.present();
}

bool LiveSession::step(int delay_ms) {
  if (state_ != SessionState::Started) return false;

  if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));

  try {
    engine_.step_once();
    pull_snapshots_();
  } catch (const std::exception& e) {
    logging::get_logger()->error("Simulation step failed: {}", e.what());
    close();
    return false;
  }

  if (!process_input_()) {
    logging::get_logger()->info("Quit requested");
    close();
    return false;
  }

  render_frame_();
  return true;
}

int LiveSession::run(int steps, int delay_ms) {
  start();
  int done = 0;
  while (done < steps && step(delay_ms)) ++done;
  close();
  const auto& s = stats_.stats();
  logging::get_logger()->info("Run finished after {} steps: throughput={} avg_speed={:.2f} avg_wait={:.2f}",
                              done, s.throughput, s.avg_speed, s.avg_waiting_time);
  return done;
}

void LiveSession::close() {
  if (state_ == SessionState::Closed) return;
  state_ = SessionState::Closed;
  if (engine_open_) {
    engine_open_ = false;
    try {
      engine_.close();
    } catch (const std::exception& e) {
      logging::get_logger()->warn("Error while closing simulation: {}", e.what());
    }
  }
  surface_.close();
  logging::get_logger()->info("Session closed");
}

} // namespace trafficviz
