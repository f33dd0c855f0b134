#include <trafficviz/engine/traci_engine.hpp>
#include <filesystem>
#include <utility>
#include <libsumo/libtraci.h>
#include <trafficviz/errors.hpp>
#include <trafficviz/logging.hpp>

namespace trafficviz {

namespace {

// Per-entity query: TraCI errors become lookup failures, a lost connection
// becomes EngineUnavailable.
template <class F>
auto entity_query(const std::string& id, const char* what, F&& f) -> decltype(f()) {
  try {
    return f();
  } catch (const libsumo::FatalTraCIError& e) {
    throw EngineUnavailable(std::string("TraCI connection lost: ") + e.what());
  } catch (const libsumo::TraCIException& e) {
    throw EntityLookupFailure(id, std::string(what) + " of '" + id + "': " + e.what());
  }
}

// Whole-simulation query: any TraCI error means the engine is unusable.
template <class F>
auto engine_query(const char* what, F&& f) -> decltype(f()) {
  try {
    return f();
  } catch (const libsumo::FatalTraCIError& e) {
    throw EngineUnavailable(std::string(what) + ": " + e.what());
  } catch (const libsumo::TraCIException& e) {
    throw EngineUnavailable(std::string(what) + ": " + e.what());
  }
}

} // namespace

TraciEngine::TraciEngine(std::string binary) : binary_(std::move(binary)) {}

TraciEngine::~TraciEngine() {
  try {
    close();
  } catch (const std::exception& e) {
    logging::get_logger()->warn("Error closing TraCI session: {}", e.what());
  }
}

void TraciEngine::require_running_() const {
  if (!running_) throw EngineUnavailable("simulation not running; call start() first");
}

void TraciEngine::start(const std::string& resource) {
  if (running_) return;
  if (!std::filesystem::exists(resource)) {
    throw EngineUnavailable("SUMO configuration file not found: " + resource);
  }
  engine_query("starting SUMO", [&]{
    libtraci::Simulation::start({binary_, "-c", resource});
    return 0;
  });
  running_ = true;
  logging::get_logger()->info("Started SUMO ({}) with configuration {}", binary_, resource);
}

void TraciEngine::step_once() {
  require_running_();
  engine_query("simulation step", []{ libtraci::Simulation::step(); return 0; });
}

void TraciEngine::close() {
  if (!running_) return;
  running_ = false;
  engine_query("closing SUMO", []{ libtraci::Simulation::close(); return 0; });
  logging::get_logger()->info("Closed SUMO simulation");
}

std::vector<std::string> TraciEngine::vehicle_ids() {
  require_running_();
  return engine_query("vehicle list", []{ return libtraci::Vehicle::getIDList(); });
}

Vec2 TraciEngine::vehicle_position(const std::string& id) {
  return entity_query(id, "position", [&]{
    const auto p = libtraci::Vehicle::getPosition(id);
    return Vec2{p.x, p.y};
  });
}

double TraciEngine::vehicle_heading(const std::string& id) {
  // SUMO angles are navigational (0 = north, clockwise).
  return entity_query(id, "angle", [&]{ return 90.0 - libtraci::Vehicle::getAngle(id); });
}

std::string TraciEngine::vehicle_type(const std::string& id) {
  return entity_query(id, "type", [&]{ return libtraci::Vehicle::getTypeID(id); });
}

double TraciEngine::vehicle_speed(const std::string& id) {
  return entity_query(id, "speed", [&]{ return libtraci::Vehicle::getSpeed(id); });
}

double TraciEngine::vehicle_waiting_time(const std::string& id) {
  return entity_query(id, "waiting time", [&]{ return libtraci::Vehicle::getWaitingTime(id); });
}

std::vector<std::string> TraciEngine::signal_ids() {
  require_running_();
  return engine_query("traffic light list", []{ return libtraci::TrafficLight::getIDList(); });
}

std::string TraciEngine::signal_state(const std::string& id) {
  return entity_query(id, "state", [&]{ return libtraci::TrafficLight::getRedYellowGreenState(id); });
}

std::vector<std::string> TraciEngine::signal_controlled_lanes(const std::string& id) {
  return entity_query(id, "controlled lanes", [&]{ return libtraci::TrafficLight::getControlledLanes(id); });
}

std::vector<Vec2> TraciEngine::lane_shape(const std::string& lane_id) {
  return entity_query(lane_id, "shape", [&]{
    std::vector<Vec2> out;
    for (const auto& p : libtraci::Lane::getShape(lane_id).value) out.push_back(Vec2{p.x, p.y});
    return out;
  });
}

std::uint64_t TraciEngine::arrived_count() {
  require_running_();
  return engine_query("arrived count", []{
    const int n = libtraci::Simulation::getArrivedNumber();
    return static_cast<std::uint64_t>(n < 0 ? 0 : n);
  });
}

double TraciEngine::sim_time() {
  require_running_();
  return engine_query("simulation time", []{ return libtraci::Simulation::getTime(); });
}

} // namespace trafficviz
