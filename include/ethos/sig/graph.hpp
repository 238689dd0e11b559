#pragma once

#include "ethos/common/json.hpp"
#include "ethos/common/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ethos::sig {

constexpr const char *DEFAULT_EVENT_TYPE = "event";
constexpr const char *TOOL_CALL_EVENT_TYPE = "tool_call";
constexpr const char *FOLLOWS_RELATION = "follows";

/// One transcript record. `raw` is the object exactly as read, including
/// fields the typed accessors do not name; it is what the node hash covers.
struct Event {
  std::string type = DEFAULT_EVENT_TYPE;
  std::optional<std::string> ts;
  std::optional<std::string> role;
  std::optional<std::string> tool_name;
  std::optional<common::JsonValue> payload;
  common::JsonValue raw = common::JsonObject{};

  [[nodiscard]] bool is_tool_call() const { return type == TOOL_CALL_EVENT_TYPE; }

  /// Fails with ErrorKind::Input when `value` is not an object or when
  /// `type`, `ts`, `role` or `tool_name` is present but neither a string nor
  /// null. A null field is treated as absent.
  [[nodiscard]] static common::Result<Event> from_json(common::JsonValue value);
};

struct NodeMetadata {
  std::string agent;
  std::optional<std::string> role;
  std::optional<std::string> tool_name;
};

struct Node {
  std::string id;
  std::string type;
  std::string ts;
  std::string content_hash;
  NodeMetadata metadata;
};

struct Edge {
  std::string from;
  std::string to;
  std::string relation = FOLLOWS_RELATION;
};

struct Graph {
  std::vector<Node> nodes;
  std::vector<Edge> edges;

  /// `{"nodes": [...], "edges": [...]}`; this value is what gets signed.
  [[nodiscard]] common::JsonValue to_json() const;
};

[[nodiscard]] std::string node_id_for_index(std::size_t index);

/// Structural check used before signing: object with `nodes` and `edges`
/// arrays, unique string node ids, edge endpoints that exist.
[[nodiscard]] common::Status validate_graph_json(const common::JsonValue &graph);

/// Typed view of a graph document. Runs validate_graph_json first.
[[nodiscard]] common::Result<Graph> parse_graph(const common::JsonValue &graph);

} // namespace ethos::sig
