#pragma once
#include <string>
#include <vector>
#include <trafficviz/engine.hpp>

namespace trafficviz {

// SimEngine backed by a SUMO process driven over TraCI (libtraci).
class TraciEngine : public SimEngine {
public:
  // binary: "sumo" or "sumo-gui"
  explicit TraciEngine(std::string binary = "sumo");
  ~TraciEngine() override;
  TraciEngine(const TraciEngine&) = delete;
  TraciEngine& operator=(const TraciEngine&) = delete;

  void start(const std::string& resource) override;
  void step_once() override;
  void close() override;

  std::vector<std::string> vehicle_ids() override;
  Vec2        vehicle_position(const std::string& id) override;
  double      vehicle_heading(const std::string& id) override;
  std::string vehicle_type(const std::string& id) override;
  double      vehicle_speed(const std::string& id) override;
  double      vehicle_waiting_time(const std::string& id) override;

  std::vector<std::string> signal_ids() override;
  std::string              signal_state(const std::string& id) override;
  std::vector<std::string> signal_controlled_lanes(const std::string& id) override;
  std::vector<Vec2>        lane_shape(const std::string& lane_id) override;

  std::uint64_t arrived_count() override;
  double        sim_time() override;

private:
  void require_running_() const;

  std::string binary_;
  bool running_{false};
};

} // namespace trafficviz
