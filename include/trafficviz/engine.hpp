#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <trafficviz/geom.hpp>

namespace trafficviz {

// Boundary to the external microscopic simulation.
// Per-entity queries throw EntityLookupFailure; start() throws EngineUnavailable.
class SimEngine {
public:
  virtual ~SimEngine() = default;

  virtual void start(const std::string& resource) = 0;
  virtual void step_once() = 0;
  virtual void close() = 0;

  virtual std::vector<std::string> vehicle_ids() = 0;
  virtual Vec2        vehicle_position(const std::string& id) = 0;
  virtual double      vehicle_heading(const std::string& id) = 0;   // deg, 0 = east, CCW
  virtual std::string vehicle_type(const std::string& id) = 0;      // free-text type tag
  virtual double      vehicle_speed(const std::string& id) = 0;
  virtual double      vehicle_waiting_time(const std::string& id) = 0;

  virtual std::vector<std::string> signal_ids() = 0;
  virtual std::string              signal_state(const std::string& id) = 0;
  virtual std::vector<std::string> signal_controlled_lanes(const std::string& id) = 0;
  virtual std::vector<Vec2>        lane_shape(const std::string& lane_id) = 0;

  virtual std::uint64_t arrived_count() = 0;   // arrivals during the last step
  virtual double        sim_time() = 0;        // engine clock, seconds
};

} // namespace trafficviz
