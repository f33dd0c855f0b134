#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <trafficviz/geom.hpp>
#include <trafficviz/topology.hpp>

namespace trafficviz {

// How a signal's drawing position was found.
enum class Resolution : int {
  ExactMatch = 0,     // signal id equals a node id
  PrefixMatch,        // node id and signal id share a prefix, else one contains the other
  GeometryDerived,    // end of an incoming lane's shape
  Unresolved          // not drawn
};

const char* resolution_name(Resolution r);

struct SignalPlacement {
  Resolution          how{Resolution::Unresolved};
  std::optional<Vec2> position;    // simulation space
  std::string         matched_node; // for Exact/Prefix
};

// Returns the end point of the signal's first incoming lane, or nullopt.
using LaneEndLookup = std::function<std::optional<Vec2>(const std::string& signal_id)>;

// Strategies tried in order; Unresolved is implied when all fail.
const std::vector<Resolution>& default_resolution_policy();

std::optional<SignalPlacement> match_exact(const std::string& signal_id, const Topology& topo);
std::optional<SignalPlacement> match_prefix(const std::string& signal_id, const Topology& topo);
std::optional<SignalPlacement> derive_from_geometry(const std::string& signal_id, const LaneEndLookup& lane_end);

SignalPlacement resolve_signal_position(const std::string& signal_id,
                                        const Topology& topo,
                                        const LaneEndLookup& lane_end,
                                        const std::vector<Resolution>& policy = default_resolution_policy());

} // namespace trafficviz
