#pragma once
#include <istream>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <trafficviz/geom.hpp>

namespace trafficviz {

// Junction.
struct Node {
  std::string id;
  Vec2 position{};
};

// Directed road segment with polyline geometry (simulation space).
struct RoadSegment {
  std::string id;
  std::string from_node;
  std::string to_node;
  std::vector<Vec2> shape; // >= 2 points, or empty when an endpoint is unresolved
};

// Lane-level continuity between two segments.
struct Connection {
  std::string from_edge;
  std::string to_edge;
  int from_lane{0};
  int to_lane{0};
};

// Immutable road graph loaded once per session.
class Topology {
public:
  Topology() = default;
  Topology(std::map<std::string, Node> nodes,
           std::map<std::string, RoadSegment> edges,
           std::vector<Connection> connections)
    : nodes_(std::move(nodes)), edges_(std::move(edges)), connections_(std::move(connections)) {}

  const std::map<std::string, Node>& nodes() const { return nodes_; }
  const std::map<std::string, RoadSegment>& edges() const { return edges_; }
  const std::vector<Connection>& connections() const { return connections_; }

  // nullptr when the id is unknown
  const Node* find_node(const std::string& id) const;
  const RoadSegment* find_edge(const std::string& id) const;

  // Connections leaving the given edge, in document order.
  std::vector<Connection> connections_from(const std::string& edge_id) const;

  bool empty() const { return nodes_.empty() && edges_.empty(); }

private:
  std::map<std::string, Node> nodes_;
  std::map<std::string, RoadSegment> edges_;
  std::vector<Connection> connections_;
};

// Internal (non-traversable) ids in SUMO networks start with ':'.
inline bool is_internal_id(const std::string& id) { return !id.empty() && id.front() == ':'; }

// Parses a SUMO "x1,y1 x2,y2 ..." shape attribute. A third coordinate per point
// is ignored. Throws MalformedTopology on a bad token.
std::vector<Vec2> parse_shape(const std::string& text);

// Stream-based loader (test-friendly; no filesystem required).
// Throws MalformedTopology when the document or a required field is unparseable.
Topology topology_from_xml_stream(std::istream& in);

// Filesystem wrapper; throws ResourceNotFound if the file cannot be opened.
Topology load_topology(const std::string& path);

} // namespace trafficviz
