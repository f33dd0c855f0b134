#pragma once
#include <istream>
#include <optional>
#include <string>

namespace trafficviz {

struct DisplayToggles {
  bool show_ids{false};
  bool show_speeds{false};
  bool show_waiting{false};
};

// Window, camera and loop settings for one live session.
struct SessionConfig {
  int         window_width{1024};
  int         window_height{768};
  double      margin{50.0};
  std::string title{"Traffic Visualization"};
  int         target_fps{30};

  double pan_step{20.0};    // px per arrow-key press
  double zoom_step{1.1};    // factor per zoom key / wheel notch

  DisplayToggles toggles{};
  bool show_help{true};
  bool show_signal_states{true};

  std::string engine_binary{"sumo"};
  int         steps{1000};
  int         delay_ms{100};
  std::string mode{"Live"};
};

// Stream-based "key = value" loader (test-friendly; no filesystem required).
// Ignores blank lines and lines starting with '#'. Whitespace around keys and
// values is trimmed. Unknown keys and invalid values are skipped (logged) and
// leave the default in place.
SessionConfig session_config_from_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<SessionConfig> load_session_config(const std::string& path);

// Network file referenced by a SUMO scenario (<net-file value="..."/>), made
// absolute against the scenario's directory. Falls back to the first
// *.net.xml beside the scenario. Throws ResourceNotFound when neither exists.
std::string resolve_net_file(const std::string& scenario_path);

} // namespace trafficviz
