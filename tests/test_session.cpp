#include <catch2/catch.hpp>
#include <string>
#include <vector>

#include <trafficviz/errors.hpp>
#include <trafficviz/session.hpp>
#include "test_helpers.hpp"

using Catch::Detail::Approx;
using namespace trafficviz;
using tvtest::FakeEngine;
using tvtest::RecordingSurface;
using tvtest::ScriptedInput;

namespace {

SessionConfig quiet_config() {
  SessionConfig cfg;
  cfg.show_help = false;
  cfg.show_signal_states = false;
  return cfg;
}

FakeEngine::Vehicle car(double x, double y, double speed = 5.0) {
  FakeEngine::Vehicle v;
  v.position = {x, y};
  v.speed = speed;
  return v;
}

} // namespace

TEST_CASE("Session: arrivals accumulate into throughput") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  engine.arrivals_by_step = {0, 1, 0, 2, 0};
  RecordingSurface surface;
  ScriptedInput input;
  LiveSession session(engine, surface, input, topo, "grid.sumocfg", quiet_config());

  const int ran = session.run(5);
  REQUIRE(ran == 5);
  REQUIRE(session.stats().throughput == 3);
  REQUIRE(session.series().arrivals.size() == 5);
  REQUIRE(session.series().avg_speed.size() == 5);
  REQUIRE(session.stats().steps == 5);
  REQUIRE(surface.frames == 5);
  REQUIRE(engine.started_with == "grid.sumocfg");
  REQUIRE(session.state() == SessionState::Closed);
  REQUIRE(engine.closes == 1);
}

TEST_CASE("Session: step is a no-op before start and after close") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  RecordingSurface surface;
  ScriptedInput input;
  LiveSession session(engine, surface, input, topo, "x.sumocfg", quiet_config());

  REQUIRE(session.state() == SessionState::Uninitialized);
  REQUIRE_FALSE(session.step());
  REQUIRE(engine.steps == 0);
  REQUIRE(surface.frames == 0);

  session.start();
  REQUIRE(session.state() == SessionState::Started);
  REQUIRE(session.step());
  session.close();
  REQUIRE_FALSE(session.step());
  REQUIRE(engine.steps == 1);
}

TEST_CASE("Session: close is idempotent") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  RecordingSurface surface;
  ScriptedInput input;
  {
    LiveSession session(engine, surface, input, topo, "x.sumocfg", quiet_config());
    session.start();
    session.close();
    session.close();
    REQUIRE(engine.closes == 1);
    REQUIRE(surface.closes == 1);
  }
  // Destructor after an explicit close does nothing more.
  REQUIRE(engine.closes == 1);
  REQUIRE(surface.closes == 1);
}

TEST_CASE("Session: engine start failure propagates and closes") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  engine.fail_start = true;
  RecordingSurface surface;
  ScriptedInput input;
  LiveSession session(engine, surface, input, topo, "x.sumocfg", quiet_config());

  REQUIRE_THROWS_AS(session.start(), EngineUnavailable);
  REQUIRE(session.state() == SessionState::Closed);
  REQUIRE(engine.closes == 0);  // never opened
  REQUIRE(surface.closes == 1);
  REQUIRE_FALSE(session.step());
}

TEST_CASE("Session: engine lost while placing signals closes the session") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  engine.signal_states = {{"tls_far", "rG"}};   // needs lane geometry
  engine.lanes_lost = true;
  RecordingSurface surface;
  ScriptedInput input;
  LiveSession session(engine, surface, input, topo, "x.sumocfg", quiet_config());

  REQUIRE_THROWS_AS(session.run(3), EngineUnavailable);
  REQUIRE(session.state() == SessionState::Closed);
  REQUIRE(engine.starts == 1);
  REQUIRE(engine.closes == 1);
  REQUIRE(surface.closes == 1);
  REQUIRE(engine.steps == 0);
  REQUIRE_FALSE(session.step());
}

TEST_CASE("Session: input pans and zooms the viewport itself") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  RecordingSurface surface;
  ScriptedInput input;
  InputFrame pan;
  pan.pan = {10.0, 5.0};
  InputFrame zoom;
  zoom.zoom = 2.0;
  InputFrame bad_zoom;
  bad_zoom.zoom = 0.0;
  input.frames = {pan, zoom, bad_zoom, pan};
  LiveSession session(engine, surface, input, topo, "x.sumocfg", quiet_config());

  session.start();
  for (int i = 0; i < 4; ++i) REQUIRE(session.step());
  REQUIRE(session.viewport().view().pan == Vec2{20.0, 10.0});
  REQUIRE(session.viewport().view().zoom == Approx(2.0));
  REQUIRE(&session.view() == &session.viewport().view());

  // Junction J1 is drawn where the viewport now projects it.
  const Vec2 j1 = *session.viewport().node_position("J1");
  bool found = false;
  for (const auto& c : surface.calls) {
    if (c.op == "ring" && c.a == j1) found = true;
  }
  REQUIRE(found);
}

TEST_CASE("Session: engine failure mid-run ends the run") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  engine.fail_step_at = 3;
  RecordingSurface surface;
  ScriptedInput input;
  LiveSession session(engine, surface, input, topo, "x.sumocfg", quiet_config());

  REQUIRE(session.run(10) == 3);
  REQUIRE(session.state() == SessionState::Closed);
  REQUIRE(engine.closes == 1);
}

TEST_CASE("Session: quit input closes the session") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  RecordingSurface surface;
  ScriptedInput input;
  input.frames.push_back(InputFrame{});
  InputFrame quit;
  quit.quit = true;
  input.frames.push_back(quit);
  LiveSession session(engine, surface, input, topo, "x.sumocfg", quiet_config());

  REQUIRE(session.run(100) == 1);
  REQUIRE(session.state() == SessionState::Closed);
  REQUIRE(surface.frames == 1);
  REQUIRE(engine.closes == 1);
}

TEST_CASE("Session: vehicles whose lookups fail are skipped for the frame") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  engine.vehicles_by_step = {{{"v1", car(10, 10, 4.0)}, {"v2", car(20, 20, 8.0)}}};
  engine.failing_vehicles = {"ghost"};
  RecordingSurface surface;
  ScriptedInput input;
  LiveSession session(engine, surface, input, topo, "x.sumocfg", quiet_config());

  session.start();
  REQUIRE(session.step());
  REQUIRE(surface.count("vehicle") == 2);
  REQUIRE(session.stats().vehicle_count == 3);  // ids reported by the engine
  REQUIRE(session.stats().avg_speed == Approx(6.0));
  REQUIRE(session.state() == SessionState::Started);
}

TEST_CASE("Session: signals are placed once at start") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  engine.signal_states = {{"J2", "GrG"}, {"tlsX", "rr"}, {"lost", "y"}};
  engine.controlled_lanes = {{"tlsX", {"in_0", "in_1"}}};
  engine.lane_shapes = {{"in_0", {{0.0, 0.0}, {40.0, 60.0}}}};
  RecordingSurface surface;
  ScriptedInput input;
  LiveSession session(engine, surface, input, topo, "x.sumocfg", quiet_config());

  session.start();
  const auto& placed = session.signal_placements();
  REQUIRE(placed.size() == 3);
  REQUIRE(placed.at("J2").how == Resolution::ExactMatch);
  REQUIRE(placed.at("tlsX").how == Resolution::GeometryDerived);
  REQUIRE(*placed.at("tlsX").position == Vec2{40.0, 60.0});
  REQUIRE(placed.at("lost").how == Resolution::Unresolved);

  // The unresolved signal is not drawn, and the session carries on.
  REQUIRE(session.step());
  REQUIRE(session.step());
  REQUIRE(surface.has_text("J2"));
  REQUIRE(surface.has_text("tlsX"));
  REQUIRE_FALSE(surface.has_text("lost"));
}

TEST_CASE("Session: frame draw order") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  engine.vehicles_by_step = {{{"v1", car(50, 50)}}};
  engine.signal_states = {{"J2", "G"}};
  RecordingSurface surface;
  ScriptedInput input;
  SessionConfig cfg = quiet_config();
  cfg.show_help = true;
  LiveSession session(engine, surface, input, topo, "x.sumocfg", cfg);

  session.start();
  REQUIRE(session.step());

  auto first = [&](const std::string& op) {
    for (std::size_t i = 0; i < surface.calls.size(); ++i) if (surface.calls[i].op == op) return i;
    return surface.calls.size();
  };
  auto first_text = [&](const std::string& prefix) {
    for (std::size_t i = 0; i < surface.calls.size(); ++i) {
      if (surface.calls[i].op == "text" && surface.calls[i].text.rfind(prefix, 0) == 0) return i;
    }
    return surface.calls.size();
  };

  REQUIRE(first("clear") == 0);
  REQUIRE(first("line") < first("vehicle"));
  REQUIRE(first("vehicle") < first("rect"));   // signal frames follow vehicles
  REQUIRE(first("rect") < first("ring"));      // junction markers follow signals
  REQUIRE(first("ring") < first_text("Vehicles: "));
  REQUIRE(first_text("Vehicles: ") < first_text("ESC"));
  REQUIRE(surface.calls.back().op == "present");
}

TEST_CASE("Session: input pans, zooms and toggles labels") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  engine.vehicles_by_step = {{{"v1", car(50, 50, 3.0)}}};
  RecordingSurface surface;
  ScriptedInput input;
  InputFrame f;
  f.pan = {20.0, -20.0};
  f.zoom = 1.1;
  f.toggle_ids = true;
  f.toggle_speeds = true;
  input.frames.push_back(f);
  LiveSession session(engine, surface, input, topo, "x.sumocfg", quiet_config());

  session.start();
  REQUIRE(session.step());
  REQUIRE(session.view().pan == Vec2{20.0, -20.0});
  REQUIRE(session.view().zoom == Approx(1.1));
  REQUIRE(session.viewport().view().zoom == Approx(1.1));
  REQUIRE(session.toggles().show_ids);
  REQUIRE(surface.has_text("v1  3.0 m/s"));
}

TEST_CASE("Session: overlay shows statistics and signal states") {
  const Topology topo = tvtest::two_node_topology();
  FakeEngine engine;
  engine.vehicles_by_step = {{{"v1", car(10, 10, 2.0)}, {"v2", car(20, 20, 4.0)}}};
  engine.arrivals_by_step = {2};
  engine.signal_states = {{"J2", "GGr"}};
  RecordingSurface surface;
  ScriptedInput input;
  SessionConfig cfg = quiet_config();
  cfg.show_signal_states = true;
  cfg.mode = "Demo";
  LiveSession session(engine, surface, input, topo, "x.sumocfg", cfg);

  session.start();
  REQUIRE(session.step());
  REQUIRE(surface.has_text("Vehicles: 2"));
  REQUIRE(surface.has_text("Avg Speed: 3.00 m/s"));
  REQUIRE(surface.has_text("Throughput: 2"));
  REQUIRE(surface.has_text("Mode: Demo"));
  REQUIRE(surface.has_text("Signal J2: GGr"));
}

TEST_CASE("Session: pull_vehicle_snapshot classifies the type tag") {
  FakeEngine engine;
  FakeEngine::Vehicle bus = car(1, 2, 7.0);
  bus.type = "city_bus";
  bus.heading = 45.0;
  engine.vehicles_by_step = {{{"b1", bus}}};
  engine.steps = 1;

  const VehicleSnapshot v = pull_vehicle_snapshot(engine, "b1");
  REQUIRE(v.category == VehicleCategory::Bus);
  REQUIRE(v.heading_deg == Approx(45.0));
  REQUIRE(v.speed == Approx(7.0));
  REQUIRE_THROWS_AS(pull_vehicle_snapshot(engine, "nope"), EntityLookupFailure);
}
