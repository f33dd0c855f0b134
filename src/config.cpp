#include <trafficviz/config.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <vector>
#include <expat.h>
#include <trafficviz/errors.hpp>
#include <trafficviz/logging.hpp>

namespace trafficviz {

namespace fs = std::filesystem;

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static bool to_double(const std::string& s, double& out) {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

static bool to_int(const std::string& s, int& out) {
  double v = 0.0;
  if (!to_double(s, v) || v != std::floor(v) || std::fabs(v) > 1e9) return false;
  out = static_cast<int>(v);
  return true;
}

static bool to_bool(const std::string& s, bool& out) {
  if (s == "true" || s == "1" || s == "on" || s == "yes")  { out = true;  return true; }
  if (s == "false" || s == "0" || s == "off" || s == "no") { out = false; return true; }
  return false;
}

// Applies one key/value pair; false when the key is unknown or the value bad.
static bool apply_setting(SessionConfig& cfg, const std::string& key, const std::string& value) {
  auto positive_int = [&](int& field) {
    int v = 0;
    if (!to_int(value, v) || v <= 0) return false;
    field = v;
    return true;
  };
  auto non_negative_int = [&](int& field) {
    int v = 0;
    if (!to_int(value, v) || v < 0) return false;
    field = v;
    return true;
  };

  if (key == "window_width")  return positive_int(cfg.window_width);
  if (key == "window_height") return positive_int(cfg.window_height);
  if (key == "target_fps")    return positive_int(cfg.target_fps);
  if (key == "steps")         return non_negative_int(cfg.steps);
  if (key == "delay_ms")      return non_negative_int(cfg.delay_ms);
  if (key == "margin") {
    double v = 0.0;
    if (!to_double(value, v) || v < 0.0) return false;
    cfg.margin = v;
    return true;
  }
  if (key == "pan_step") {
    double v = 0.0;
    if (!to_double(value, v) || v <= 0.0) return false;
    cfg.pan_step = v;
    return true;
  }
  if (key == "zoom_step") {
    double v = 0.0;
    if (!to_double(value, v) || v <= 1.0) return false;
    cfg.zoom_step = v;
    return true;
  }
  if (key == "show_ids")           return to_bool(value, cfg.toggles.show_ids);
  if (key == "show_speeds")        return to_bool(value, cfg.toggles.show_speeds);
  if (key == "show_waiting")       return to_bool(value, cfg.toggles.show_waiting);
  if (key == "show_help")          return to_bool(value, cfg.show_help);
  if (key == "show_signal_states") return to_bool(value, cfg.show_signal_states);
  if (key == "title")         { if (value.empty()) return false; cfg.title = value; return true; }
  if (key == "engine_binary") { if (value.empty()) return false; cfg.engine_binary = value; return true; }
  if (key == "mode")          { cfg.mode = value; return true; }
  return false;
}

SessionConfig session_config_from_stream(std::istream& in) {
  auto log = logging::get_logger();
  SessionConfig cfg;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto eq = raw.find('=');
    if (eq == std::string::npos) {
      log->warn("config line {}: expected 'key = value'", line_no);
      continue;
    }
    const std::string key   = trim(raw.substr(0, eq));
    const std::string value = trim(raw.substr(eq + 1));
    if (!apply_setting(cfg, key, value)) {
      log->warn("config line {}: ignoring '{}' = '{}'", line_no, key, value);
    }
  }
  return cfg;
}

std::optional<SessionConfig> load_session_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return session_config_from_stream(f);
}

namespace {

struct NetFileRef {
  std::string value;
};

void XMLCALL on_scenario_element(void* user, const XML_Char* name, const XML_Char** atts) {
  auto& ref = *static_cast<NetFileRef*>(user);
  if (!ref.value.empty() || std::strcmp(name, "net-file") != 0) return;
  for (int i = 0; atts[i] != nullptr; i += 2) {
    if (std::strcmp(atts[i], "value") == 0) { ref.value = atts[i + 1]; return; }
  }
}

struct ParserDeleter {
  void operator()(XML_ParserStruct* p) const { if (p) XML_ParserFree(p); }
};

// Empty string when the scenario has no usable <net-file>.
std::string read_net_file_entry(const fs::path& scenario) {
  auto log = logging::get_logger();
  std::ifstream f(scenario, std::ios::binary);
  if (!f) throw ResourceNotFound("scenario file not found: " + scenario.string());
  const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

  std::unique_ptr<XML_ParserStruct, ParserDeleter> parser(XML_ParserCreate(nullptr));
  if (!parser) return {};
  NetFileRef ref;
  XML_SetUserData(parser.get(), &ref);
  XML_SetStartElementHandler(parser.get(), on_scenario_element);
  if (XML_Parse(parser.get(), text.data(), static_cast<int>(text.size()), XML_TRUE) == XML_STATUS_ERROR) {
    log->warn("Could not parse scenario {}: {}", scenario.string(),
              XML_ErrorString(XML_GetErrorCode(parser.get())));
    return {};
  }
  // A value may list several files separated by ','; the first one is the network.
  std::string first = ref.value.substr(0, ref.value.find(','));
  return trim(first);
}

} // namespace

std::string resolve_net_file(const std::string& scenario_path) {
  auto log = logging::get_logger();
  const fs::path scenario(scenario_path);
  const fs::path dir = scenario.has_parent_path() ? scenario.parent_path() : fs::path(".");

  const std::string entry = read_net_file_entry(scenario);
  if (!entry.empty()) {
    fs::path net(entry);
    if (net.is_relative()) net = dir / net;
    if (fs::exists(net)) return net.string();
    log->warn("Scenario references missing network {}", net.string());
  } else {
    log->warn("No net-file entry in {}; looking for a .net.xml beside it", scenario_path);
  }

  std::vector<fs::path> candidates;
  std::error_code ec;
  for (const auto& de : fs::directory_iterator(dir, ec)) {
    const std::string name = de.path().filename().string();
    if (de.is_regular_file(ec) && name.size() > 8 && name.compare(name.size() - 8, 8, ".net.xml") == 0) {
      candidates.push_back(de.path());
    }
  }
  if (candidates.empty()) {
    throw ResourceNotFound("no network file found for scenario " + scenario_path);
  }
  std::sort(candidates.begin(), candidates.end());
  return candidates.front().string();
}

} // namespace trafficviz
