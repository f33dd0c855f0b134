#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

#include <trafficviz/config.hpp>
#include <trafficviz/engine/traci_engine.hpp>
#include <trafficviz/errors.hpp>
#include <trafficviz/logging.hpp>
#include <trafficviz/session.hpp>
#include <trafficviz/topology.hpp>
#include <trafficviz/viewer/raylib_display.hpp>

using namespace trafficviz;

namespace {

void print_usage(const char* argv0) {
  std::fprintf(stderr,
               "usage: %s <scenario.sumocfg> [--config FILE] [--steps N] [--delay MS]"
               " [--mode LABEL] [--gui]\n",
               argv0);
}

bool parse_int(const char* s, int& out) {
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0' || v < 0) return false;
  out = static_cast<int>(v);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  auto log = logging::get_logger();

  std::string scenario;
  std::string config_path;
  std::optional<int> steps, delay_ms;
  std::optional<std::string> mode;
  bool gui = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--config" && has_value) {
      config_path = argv[++i];
    } else if (arg == "--steps" && has_value) {
      int v = 0;
      if (!parse_int(argv[++i], v)) { print_usage(argv[0]); return 2; }
      steps = v;
    } else if (arg == "--delay" && has_value) {
      int v = 0;
      if (!parse_int(argv[++i], v)) { print_usage(argv[0]); return 2; }
      delay_ms = v;
    } else if (arg == "--mode" && has_value) {
      mode = argv[++i];
    } else if (arg == "--gui") {
      gui = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (scenario.empty() && !arg.empty() && arg[0] != '-') {
      scenario = arg;
    } else {
      print_usage(argv[0]);
      return 2;
    }
  }
  if (scenario.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  SessionConfig cfg;
  if (!config_path.empty()) {
    auto loaded = load_session_config(config_path);
    if (!loaded) {
      log->error("Cannot open config file {}", config_path);
      return 1;
    }
    cfg = *loaded;
  }
  if (steps) cfg.steps = *steps;
  if (delay_ms) cfg.delay_ms = *delay_ms;
  if (mode) cfg.mode = *mode;
  if (gui) cfg.engine_binary = "sumo-gui";

  try {
    const std::string net_file = resolve_net_file(scenario);
    const Topology topo = load_topology(net_file);

    RaylibDisplay display(cfg);
    TraciEngine engine(cfg.engine_binary);
    LiveSession session(engine, display, display, topo, scenario, cfg);
    session.set_mode_label(cfg.mode);

    const int ran = session.run(cfg.steps, cfg.delay_ms);
    log->info("Viewer finished after {} steps", ran);
  } catch (const Error& e) {
    log->error("{}", e.what());
    return 1;
  }
  return 0;
}
