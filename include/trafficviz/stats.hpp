#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <trafficviz/renderer.hpp>
#include <trafficviz/snapshot.hpp>

namespace trafficviz {

struct SessionStats {
  std::size_t   vehicle_count{0};
  double        avg_speed{0.0};         // m/s over the current vehicle set
  double        avg_waiting_time{0.0};  // s over the current vehicle set
  std::uint64_t throughput{0};          // cumulative arrivals
  double        sim_time{0.0};
  std::uint64_t steps{0};
  std::string   mode{"Live"};
};

// Parallel per-step series, one entry per recorded step.
struct StatsSeries {
  std::vector<double>        avg_speed;
  std::vector<double>        avg_waiting_time;
  std::vector<std::uint64_t> arrivals;
};

// Running statistics for one session.
class StatsAccumulator {
public:
  // vehicle_count is the size of the engine's current id set; averages are
  // taken over the vehicles that produced a snapshot this step.
  void record_step(const std::vector<VehicleSnapshot>& vehicles,
                   std::size_t vehicle_count,
                   std::uint64_t arrived,
                   double sim_time);

  void set_mode(std::string mode) { stats_.mode = std::move(mode); }
  void reset();

  const SessionStats& stats() const { return stats_; }
  const StatsSeries& series() const { return series_; }

  // "Vehicles", "Avg Speed", ... as shown by the overlay.
  std::vector<OverlayLine> overlay_lines() const;

private:
  SessionStats stats_{};
  StatsSeries  series_{};
};

} // namespace trafficviz
