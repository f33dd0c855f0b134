#include <catch2/catch.hpp>

#include <trafficviz/signal_placement.hpp>
#include "test_helpers.hpp"

using Catch::Detail::Approx;
using namespace trafficviz;

static Topology placement_topology() {
  return tvtest::topology_from_string(R"(<net>
  <junction id="cluster_10_11" x="10" y="20"/>
  <junction id="gneJ5" x="50" y="60"/>
  <junction id="gneJ55" x="70" y="80"/>
  <junction id="center" x="5" y="5"/>
</net>)");
}

static const LaneEndLookup kNoGeometry = [](const std::string&) { return std::optional<Vec2>{}; };

TEST_CASE("Signal placement: exact id match wins") {
  const Topology topo = placement_topology();
  const auto p = resolve_signal_position("gneJ5", topo, kNoGeometry);
  REQUIRE(p.how == Resolution::ExactMatch);
  REQUIRE(p.matched_node == "gneJ5");
  REQUIRE(*p.position == Vec2{50.0, 60.0});
}

TEST_CASE("Signal placement: prefix match picks the closest-length id") {
  const Topology topo = placement_topology();
  const auto p = match_prefix("gneJ", topo);
  REQUIRE(p.has_value());
  REQUIRE(p->how == Resolution::PrefixMatch);
  REQUIRE(p->matched_node == "gneJ5");

  const auto q = match_prefix("cluster_10", topo);
  REQUIRE(q.has_value());
  REQUIRE(q->matched_node == "cluster_10_11");
}

TEST_CASE("Signal placement: containment is the last name-based resort") {
  const Topology topo = placement_topology();
  const auto p = resolve_signal_position("tl_center_main", topo, kNoGeometry);
  REQUIRE(p.how == Resolution::PrefixMatch);
  REQUIRE(p.matched_node == "center");
}

TEST_CASE("Signal placement: geometry fallback uses the lane end") {
  const Topology topo = placement_topology();
  const LaneEndLookup lane_end = [](const std::string& id) -> std::optional<Vec2> {
    if (id == "tls42") return Vec2{123.0, 456.0};
    return std::nullopt;
  };
  const auto p = resolve_signal_position("tls42", topo, lane_end);
  REQUIRE(p.how == Resolution::GeometryDerived);
  REQUIRE(p.position->x == Approx(123.0));
  REQUIRE(p.position->y == Approx(456.0));
  REQUIRE(p.matched_node.empty());
}

TEST_CASE("Signal placement: unresolved when every strategy fails") {
  const Topology topo = placement_topology();
  const auto p = resolve_signal_position("zzz", topo, kNoGeometry);
  REQUIRE(p.how == Resolution::Unresolved);
  REQUIRE_FALSE(p.position.has_value());

  // A null lookup is treated as "no geometry".
  const auto q = resolve_signal_position("zzz", topo, LaneEndLookup{});
  REQUIRE(q.how == Resolution::Unresolved);
}

TEST_CASE("Signal placement: custom policy order is honored") {
  const Topology topo = placement_topology();
  const LaneEndLookup lane_end = [](const std::string&) -> std::optional<Vec2> { return Vec2{1.0, 2.0}; };
  const auto p = resolve_signal_position("gneJ5", topo, lane_end,
                                         {Resolution::GeometryDerived, Resolution::ExactMatch});
  REQUIRE(p.how == Resolution::GeometryDerived);
  REQUIRE(std::string(resolution_name(p.how)) == "geometry");
}
