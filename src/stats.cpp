#include <trafficviz/stats.hpp>
#include <cstdio>
#include <utility>

namespace trafficviz {

void StatsAccumulator::record_step(const std::vector<VehicleSnapshot>& vehicles,
                                   std::size_t vehicle_count,
                                   std::uint64_t arrived,
                                   double sim_time) {
  stats_.vehicle_count = vehicle_count;
  if (!vehicles.empty()) {
    double speed_sum = 0.0, wait_sum = 0.0;
    for (const auto& v : vehicles) {
      speed_sum += v.speed;
      wait_sum  += v.waiting_time;
    }
    stats_.avg_speed        = speed_sum / static_cast<double>(vehicles.size());
    stats_.avg_waiting_time = wait_sum  / static_cast<double>(vehicles.size());
  } else {
    stats_.avg_speed = 0.0;
    stats_.avg_waiting_time = 0.0;
  }
  stats_.throughput += arrived;
  stats_.sim_time = sim_time;
  ++stats_.steps;

  series_.avg_speed.push_back(stats_.avg_speed);
  series_.avg_waiting_time.push_back(stats_.avg_waiting_time);
  series_.arrivals.push_back(arrived);
}

void StatsAccumulator::reset() {
  std::string mode = std::move(stats_.mode);
  stats_ = SessionStats{};
  stats_.mode = std::move(mode);
  series_ = StatsSeries{};
}

std::vector<OverlayLine> StatsAccumulator::overlay_lines() const {
  char buf[64];
  std::vector<OverlayLine> out;
  out.reserve(6);
  out.push_back({"Vehicles", std::to_string(stats_.vehicle_count)});
  std::snprintf(buf, sizeof(buf), "%.2f m/s", stats_.avg_speed);
  out.push_back({"Avg Speed", buf});
  std::snprintf(buf, sizeof(buf), "%.2f s", stats_.avg_waiting_time);
  out.push_back({"Avg Wait Time", buf});
  out.push_back({"Throughput", std::to_string(stats_.throughput)});
  std::snprintf(buf, sizeof(buf), "%.1f s", stats_.sim_time);
  out.push_back({"Simulation Time", buf});
  out.push_back({"Mode", stats_.mode});
  return out;
}

} // namespace trafficviz
