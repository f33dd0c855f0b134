#include <trafficviz/signal_placement.hpp>
#include <cstdlib>
#include <trafficviz/logging.hpp>

namespace trafficviz {

const char* resolution_name(Resolution r) {
  switch (r) {
    case Resolution::ExactMatch:      return "exact";
    case Resolution::PrefixMatch:     return "prefix";
    case Resolution::GeometryDerived: return "geometry";
    case Resolution::Unresolved:      return "unresolved";
    default: return "unknown";
  }
}

const std::vector<Resolution>& default_resolution_policy() {
  static const std::vector<Resolution> policy{
    Resolution::ExactMatch, Resolution::PrefixMatch, Resolution::GeometryDerived
  };
  return policy;
}

std::optional<SignalPlacement> match_exact(const std::string& signal_id, const Topology& topo) {
  const Node* n = topo.find_node(signal_id);
  if (!n) return std::nullopt;
  return SignalPlacement{Resolution::ExactMatch, n->position, n->id};
}

static bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Closest-length candidate wins; ties go to the lexicographically smallest id
// (node iteration is ordered).
std::optional<SignalPlacement> match_prefix(const std::string& signal_id, const Topology& topo) {
  if (signal_id.empty()) return std::nullopt;

  auto pick = [&](auto&& accept) -> std::optional<SignalPlacement> {
    const Node* best = nullptr;
    long best_diff = 0;
    std::size_t hits = 0;
    for (const auto& [id, n] : topo.nodes()) {
      if (!accept(id)) continue;
      ++hits;
      const long diff = std::labs(static_cast<long>(id.size()) - static_cast<long>(signal_id.size()));
      if (!best || diff < best_diff) { best = &n; best_diff = diff; }
    }
    if (!best) return std::nullopt;
    if (hits > 1) {
      logging::get_logger()->warn("Signal {} matches {} junctions by name; using {}", signal_id, hits, best->id);
    }
    return SignalPlacement{Resolution::PrefixMatch, best->position, best->id};
  };

  if (auto p = pick([&](const std::string& id){
        return starts_with(id, signal_id) || starts_with(signal_id, id); })) {
    return p;
  }
  return pick([&](const std::string& id){
    return id.find(signal_id) != std::string::npos || signal_id.find(id) != std::string::npos;
  });
}

std::optional<SignalPlacement> derive_from_geometry(const std::string& signal_id, const LaneEndLookup& lane_end) {
  if (!lane_end) return std::nullopt;
  const auto p = lane_end(signal_id);
  if (!p) return std::nullopt;
  return SignalPlacement{Resolution::GeometryDerived, *p, {}};
}

SignalPlacement resolve_signal_position(const std::string& signal_id,
                                        const Topology& topo,
                                        const LaneEndLookup& lane_end,
                                        const std::vector<Resolution>& policy) {
  for (const Resolution r : policy) {
    std::optional<SignalPlacement> hit;
    switch (r) {
      case Resolution::ExactMatch:      hit = match_exact(signal_id, topo); break;
      case Resolution::PrefixMatch:     hit = match_prefix(signal_id, topo); break;
      case Resolution::GeometryDerived: hit = derive_from_geometry(signal_id, lane_end); break;
      case Resolution::Unresolved:      return SignalPlacement{};
    }
    if (hit) return *hit;
  }
  return SignalPlacement{};
}

} // namespace trafficviz
