#include <trafficviz/topology.hpp>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <expat.h>
#include <trafficviz/errors.hpp>
#include <trafficviz/logging.hpp>

namespace trafficviz {

const Node* Topology::find_node(const std::string& id) const {
  auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : &it->second;
}

const RoadSegment* Topology::find_edge(const std::string& id) const {
  auto it = edges_.find(id);
  return it == edges_.end() ? nullptr : &it->second;
}

std::vector<Connection> Topology::connections_from(const std::string& edge_id) const {
  std::vector<Connection> out;
  std::copy_if(connections_.begin(), connections_.end(), std::back_inserter(out),
               [&](const Connection& c){ return c.from_edge == edge_id; });
  return out;
}

static bool parse_double(const std::string& s, double& out) {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

static bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (errno != 0 || end != s.c_str() + s.size() || v < 0 || v > 1 << 20) return false;
  out = static_cast<int>(v);
  return true;
}

std::vector<Vec2> parse_shape(const std::string& text) {
  std::vector<Vec2> pts;
  std::istringstream ss(text);
  std::string token;
  while (ss >> token) {
    // "x,y" or "x,y,z"
    const auto c1 = token.find(',');
    if (c1 == std::string::npos) throw MalformedTopology("shape point without ',': '" + token + "'");
    const auto c2 = token.find(',', c1 + 1);
    const std::string xs = token.substr(0, c1);
    const std::string ys = token.substr(c1 + 1, c2 == std::string::npos ? std::string::npos : c2 - c1 - 1);
    Vec2 p{};
    if (!parse_double(xs, p.x) || !parse_double(ys, p.y)) {
      throw MalformedTopology("bad shape point: '" + token + "'");
    }
    pts.push_back(p);
  }
  return pts;
}

namespace {

// Collects network elements while expat walks the document.
struct NetParseState {
  XML_Parser parser{nullptr};
  std::map<std::string, Node> nodes;
  std::map<std::string, RoadSegment> edges;
  std::vector<Connection> connections;

  std::string current_edge;     // non-internal edge whose lanes are being read
  bool edge_has_shape{false};
  std::string error;

  std::size_t skipped_junctions{0};
  std::size_t skipped_edges{0};
  std::size_t skipped_connections{0};

  void fail(std::string msg) {
    if (!error.empty()) return;
    error = std::move(msg);
    XML_StopParser(parser, XML_FALSE);
  }
};

const char* find_attr(const XML_Char** atts, const char* name) {
  for (int i = 0; atts[i] != nullptr; i += 2) {
    if (std::strcmp(atts[i], name) == 0) return atts[i + 1];
  }
  return nullptr;
}

std::string line_tag(const NetParseState& st) {
  return " (line " + std::to_string(XML_GetCurrentLineNumber(st.parser)) + ")";
}

void on_junction(NetParseState& st, const XML_Char** atts) {
  const char* id = find_attr(atts, "id");
  if (!id || !*id) { st.fail("junction without id" + line_tag(st)); return; }
  const char* type = find_attr(atts, "type");
  if ((type && std::strcmp(type, "internal") == 0) || is_internal_id(id)) {
    ++st.skipped_junctions;
    return;
  }
  const char* xs = find_attr(atts, "x");
  const char* ys = find_attr(atts, "y");
  Node n{id, {}};
  if (!xs || !ys || !parse_double(xs, n.position.x) || !parse_double(ys, n.position.y)) {
    st.fail(std::string("junction '") + id + "' has unparseable coordinates" + line_tag(st));
    return;
  }
  if (!st.nodes.emplace(n.id, n).second) {
    st.fail(std::string("duplicate junction id '") + id + "'" + line_tag(st));
  }
}

void on_edge(NetParseState& st, const XML_Char** atts) {
  st.current_edge.clear();
  st.edge_has_shape = false;
  const char* id = find_attr(atts, "id");
  if (!id || !*id) { st.fail("edge without id" + line_tag(st)); return; }
  const char* function = find_attr(atts, "function");
  if ((function && std::strcmp(function, "internal") == 0) || is_internal_id(id)) {
    ++st.skipped_edges;
    return;
  }
  const char* from = find_attr(atts, "from");
  const char* to   = find_attr(atts, "to");
  if (!from || !*from || !to || !*to) {
    st.fail(std::string("edge '") + id + "' lacks from/to junction references" + line_tag(st));
    return;
  }
  RoadSegment seg{id, from, to, {}};
  if (!st.edges.emplace(seg.id, std::move(seg)).second) {
    st.fail(std::string("duplicate edge id '") + id + "'" + line_tag(st));
    return;
  }
  st.current_edge = id;
}

void on_lane(NetParseState& st, const XML_Char** atts) {
  if (st.current_edge.empty() || st.edge_has_shape) return;
  const char* shape = find_attr(atts, "shape");
  if (!shape) return;
  std::vector<Vec2> pts;
  try {
    pts = parse_shape(shape);
  } catch (const MalformedTopology& e) {
    st.fail("edge '" + st.current_edge + "': " + e.what() + line_tag(st));
    return;
  }
  if (pts.size() < 2) return; // not an explicit polyline; try the next lane
  st.edges[st.current_edge].shape = std::move(pts);
  st.edge_has_shape = true;
}

void on_connection(NetParseState& st, const XML_Char** atts) {
  auto log = logging::get_logger();
  const char* from = find_attr(atts, "from");
  const char* to   = find_attr(atts, "to");
  const char* fl   = find_attr(atts, "fromLane");
  const char* tl   = find_attr(atts, "toLane");
  if (!from || !to) {
    log->warn("Skipping connection without from/to{}", line_tag(st));
    ++st.skipped_connections;
    return;
  }
  if (is_internal_id(from) || is_internal_id(to)) {
    ++st.skipped_connections;
    return;
  }
  Connection c{from, to, 0, 0};
  if (!fl || !tl || !parse_int(fl, c.from_lane) || !parse_int(tl, c.to_lane)) {
    log->warn("Skipping connection {} -> {} with unparseable lane indices{}", from, to, line_tag(st));
    ++st.skipped_connections;
    return;
  }
  st.connections.push_back(std::move(c));
}

void XMLCALL start_element(void* user, const XML_Char* name, const XML_Char** atts) {
  auto& st = *static_cast<NetParseState*>(user);
  if (std::strcmp(name, "junction") == 0)        on_junction(st, atts);
  else if (std::strcmp(name, "edge") == 0)       on_edge(st, atts);
  else if (std::strcmp(name, "lane") == 0)       on_lane(st, atts);
  else if (std::strcmp(name, "connection") == 0) on_connection(st, atts);
}

void XMLCALL end_element(void* user, const XML_Char* name) {
  auto& st = *static_cast<NetParseState*>(user);
  if (std::strcmp(name, "edge") == 0) {
    st.current_edge.clear();
    st.edge_has_shape = false;
  }
}

struct ParserDeleter {
  void operator()(XML_ParserStruct* p) const { if (p) XML_ParserFree(p); }
};

} // namespace

Topology topology_from_xml_stream(std::istream& in) {
  auto log = logging::get_logger();

  std::unique_ptr<XML_ParserStruct, ParserDeleter> parser(XML_ParserCreate(nullptr));
  if (!parser) throw MalformedTopology("could not allocate XML parser");

  NetParseState st;
  st.parser = parser.get();
  XML_SetUserData(parser.get(), &st);
  XML_SetElementHandler(parser.get(), start_element, end_element);

  char buf[64 * 1024];
  bool done = false;
  while (!done) {
    in.read(buf, sizeof(buf));
    const auto n = static_cast<int>(in.gcount());
    done = !in;
    if (XML_Parse(parser.get(), buf, n, done ? XML_TRUE : XML_FALSE) == XML_STATUS_ERROR) {
      if (!st.error.empty()) throw MalformedTopology(st.error);
      throw MalformedTopology(std::string("network XML: ") +
                              XML_ErrorString(XML_GetErrorCode(parser.get())) +
                              " (line " + std::to_string(XML_GetCurrentLineNumber(parser.get())) + ")");
    }
  }

  // Synthesize straight geometry now that every junction is known.
  for (auto& [id, seg] : st.edges) {
    if (!seg.shape.empty()) continue;
    const auto from = st.nodes.find(seg.from_node);
    const auto to   = st.nodes.find(seg.to_node);
    if (from == st.nodes.end() || to == st.nodes.end()) {
      log->debug("Edge {} has unresolved endpoints ({} -> {}); no geometry", id, seg.from_node, seg.to_node);
      continue;
    }
    seg.shape = {from->second.position, to->second.position};
  }

  // Drop connections that reference unknown edges.
  auto unknown = [&](const Connection& c) {
    const bool bad = st.edges.count(c.from_edge) == 0 || st.edges.count(c.to_edge) == 0;
    if (bad) log->warn("Skipping connection {} -> {}: unknown edge", c.from_edge, c.to_edge);
    return bad;
  };
  const auto before = st.connections.size();
  st.connections.erase(std::remove_if(st.connections.begin(), st.connections.end(), unknown),
                       st.connections.end());
  st.skipped_connections += before - st.connections.size();

  log->info("Parsed network with {} nodes, {} edges, {} connections",
            st.nodes.size(), st.edges.size(), st.connections.size());
  log->debug("Excluded {} internal junctions, {} internal edges, {} connections",
             st.skipped_junctions, st.skipped_edges, st.skipped_connections);

  return Topology(std::move(st.nodes), std::move(st.edges), std::move(st.connections));
}

Topology load_topology(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw ResourceNotFound("network file not found: " + path);
  return topology_from_xml_stream(f);
}

} // namespace trafficviz
