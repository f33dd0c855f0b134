#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <trafficviz/config.hpp>
#include <trafficviz/errors.hpp>

using Catch::Detail::Approx;
using namespace trafficviz;
namespace fs = std::filesystem;

namespace {

// Fresh directory under the system temp dir, removed on scope exit.
struct TempDir {
  fs::path path;
  explicit TempDir(const std::string& name) : path(fs::temp_directory_path() / name) {
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  void write(const std::string& file, const std::string& text) const {
    std::ofstream(path / file) << text;
  }
};

} // namespace

TEST_CASE("Config: defaults") {
  const SessionConfig cfg;
  REQUIRE(cfg.window_width == 1024);
  REQUIRE(cfg.window_height == 768);
  REQUIRE(cfg.margin == Approx(50.0));
  REQUIRE(cfg.zoom_step == Approx(1.1));
  REQUIRE(cfg.steps == 1000);
  REQUIRE(cfg.delay_ms == 100);
  REQUIRE(cfg.mode == "Live");
  REQUIRE_FALSE(cfg.toggles.show_ids);
}

TEST_CASE("Config: key = value lines override defaults") {
  std::istringstream in(R"(# viewer settings
window_width = 800
window_height=600

margin = 20.5
show_ids = true
show_speeds = on
engine_binary = sumo-gui
mode = Replay
title =  My Town
)");
  const SessionConfig cfg = session_config_from_stream(in);
  REQUIRE(cfg.window_width == 800);
  REQUIRE(cfg.window_height == 600);
  REQUIRE(cfg.margin == Approx(20.5));
  REQUIRE(cfg.toggles.show_ids);
  REQUIRE(cfg.toggles.show_speeds);
  REQUIRE_FALSE(cfg.toggles.show_waiting);
  REQUIRE(cfg.engine_binary == "sumo-gui");
  REQUIRE(cfg.mode == "Replay");
  REQUIRE(cfg.title == "My Town");
}

TEST_CASE("Config: bad lines and values keep the defaults") {
  std::istringstream in(R"(window_width = -5
window_height = tall
zoom_step = 0.5
no equals sign here
colour = blue
steps = 25
)");
  const SessionConfig cfg = session_config_from_stream(in);
  REQUIRE(cfg.window_width == 1024);
  REQUIRE(cfg.window_height == 768);
  REQUIRE(cfg.zoom_step == Approx(1.1));
  REQUIRE(cfg.steps == 25);
}

TEST_CASE("Config: missing file gives nullopt") {
  REQUIRE_FALSE(load_session_config("/nonexistent/viewer.cfg").has_value());
}

TEST_CASE("Scenario: net-file entry is resolved against the scenario directory") {
  TempDir dir("trafficviz_test_netfile");
  dir.write("grid.net.xml", "<net/>");
  dir.write("other.net.xml", "<net/>");
  dir.write("run.sumocfg", R"(<configuration>
  <input>
    <net-file value="other.net.xml"/>
    <route-files value="grid.rou.xml"/>
  </input>
</configuration>)");

  const std::string net = resolve_net_file((dir.path / "run.sumocfg").string());
  REQUIRE(fs::path(net).filename().string() == "other.net.xml");
  REQUIRE(fs::equivalent(fs::path(net).parent_path(), dir.path));
}

TEST_CASE("Scenario: first listed network wins") {
  TempDir dir("trafficviz_test_netlist");
  dir.write("b.net.xml", "<net/>");
  dir.write("run.sumocfg",
            R"(<configuration><input><net-file value="b.net.xml, a.net.xml"/></input></configuration>)");
  const std::string net = resolve_net_file((dir.path / "run.sumocfg").string());
  REQUIRE(fs::path(net).filename().string() == "b.net.xml");
}

TEST_CASE("Scenario: falls back to a .net.xml beside the scenario") {
  TempDir dir("trafficviz_test_netfallback");
  dir.write("zeta.net.xml", "<net/>");
  dir.write("alpha.net.xml", "<net/>");
  dir.write("run.sumocfg", "<configuration><input/></configuration>");
  const std::string net = resolve_net_file((dir.path / "run.sumocfg").string());
  REQUIRE(fs::path(net).filename().string() == "alpha.net.xml");
}

TEST_CASE("Scenario: missing network or scenario is ResourceNotFound") {
  TempDir dir("trafficviz_test_netmissing");
  dir.write("run.sumocfg", R"(<configuration><input><net-file value="gone.net.xml"/></input></configuration>)");
  REQUIRE_THROWS_AS(resolve_net_file((dir.path / "run.sumocfg").string()), ResourceNotFound);
  REQUIRE_THROWS_AS(resolve_net_file((dir.path / "absent.sumocfg").string()), ResourceNotFound);
}
