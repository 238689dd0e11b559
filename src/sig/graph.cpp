#include "ethos/sig/graph.hpp"

#include <unordered_set>

namespace ethos::sig {

namespace {

using common::JsonArray;
using common::JsonObject;
using common::JsonValue;

common::Result<std::optional<std::string>> optional_string_field(const JsonValue &object,
                                                                 const std::string &key) {
  const JsonValue *field = object.find(key);
  if (field == nullptr || field->is_null()) {
    return common::Result<std::optional<std::string>>::success(std::nullopt);
  }
  if (!field->is_string()) {
    return common::Result<std::optional<std::string>>::failure(
        common::ErrorKind::Input, "event field '" + key + "' must be a string");
  }
  return common::Result<std::optional<std::string>>::success(field->as_string());
}

JsonValue optional_to_json(const std::optional<std::string> &value) {
  return value.has_value() ? JsonValue(*value) : JsonValue(nullptr);
}

std::optional<std::string> optional_from_json(const JsonValue *value) {
  if (value == nullptr || !value->is_string()) {
    return std::nullopt;
  }
  return value->as_string();
}

std::string string_or_empty(const JsonValue &object, const std::string &key) {
  const JsonValue *value = object.find(key);
  return value != nullptr && value->is_string() ? value->as_string() : std::string();
}

} // namespace

common::Result<Event> Event::from_json(JsonValue value) {
  if (!value.is_object()) {
    return common::Result<Event>::failure(common::ErrorKind::Input,
                                          "transcript event must be a JSON object");
  }

  Event event;
  auto type = optional_string_field(value, "type");
  if (!type.ok()) {
    return common::Result<Event>::failure(type);
  }
  auto ts = optional_string_field(value, "ts");
  if (!ts.ok()) {
    return common::Result<Event>::failure(ts);
  }
  auto role = optional_string_field(value, "role");
  if (!role.ok()) {
    return common::Result<Event>::failure(role);
  }
  auto tool_name = optional_string_field(value, "tool_name");
  if (!tool_name.ok()) {
    return common::Result<Event>::failure(tool_name);
  }

  if (type.value().has_value()) {
    event.type = *type.value();
  }
  event.ts = ts.value();
  event.role = role.value();
  event.tool_name = tool_name.value();
  if (const JsonValue *payload = value.find("payload"); payload != nullptr && !payload->is_null()) {
    event.payload = *payload;
  }
  event.raw = std::move(value);
  return common::Result<Event>::success(std::move(event));
}

JsonValue Graph::to_json() const {
  JsonArray node_values;
  node_values.reserve(nodes.size());
  for (const auto &node : nodes) {
    node_values.emplace_back(JsonObject{
        {"id", node.id},
        {"type", node.type},
        {"ts", node.ts},
        {"content_hash", node.content_hash},
        {"metadata", JsonObject{
                         {"agent", node.metadata.agent},
                         {"role", optional_to_json(node.metadata.role)},
                         {"tool_name", optional_to_json(node.metadata.tool_name)},
                     }},
    });
  }

  JsonArray edge_values;
  edge_values.reserve(edges.size());
  for (const auto &edge : edges) {
    edge_values.emplace_back(JsonObject{
        {"from", edge.from},
        {"to", edge.to},
        {"relation", edge.relation},
    });
  }

  return JsonObject{
      {"nodes", std::move(node_values)},
      {"edges", std::move(edge_values)},
  };
}

std::string node_id_for_index(const std::size_t index) { return "n" + std::to_string(index + 1); }

common::Status validate_graph_json(const JsonValue &graph) {
  if (!graph.is_object()) {
    return common::Status::error(common::ErrorKind::Input, "graph must be a JSON object");
  }
  const JsonValue *nodes = graph.find("nodes");
  const JsonValue *edges = graph.find("edges");
  if (nodes == nullptr || !nodes->is_array()) {
    return common::Status::error(common::ErrorKind::Input, "graph.nodes must be an array");
  }
  if (edges == nullptr || !edges->is_array()) {
    return common::Status::error(common::ErrorKind::Input, "graph.edges must be an array");
  }

  std::unordered_set<std::string> ids;
  for (std::size_t i = 0; i < nodes->as_array().size(); ++i) {
    const JsonValue &node = nodes->as_array()[i];
    const JsonValue *id = node.find("id");
    if (id == nullptr || !id->is_string()) {
      return common::Status::error(common::ErrorKind::Input,
                                   "graph.nodes[" + std::to_string(i) + "].id must be a string");
    }
    if (!ids.insert(id->as_string()).second) {
      return common::Status::error(common::ErrorKind::Input,
                                   "duplicate node id: " + id->as_string());
    }
  }

  for (std::size_t i = 0; i < edges->as_array().size(); ++i) {
    const JsonValue &edge = edges->as_array()[i];
    for (const char *endpoint : {"from", "to"}) {
      const JsonValue *ref = edge.find(endpoint);
      if (ref == nullptr || !ref->is_string()) {
        return common::Status::error(common::ErrorKind::Input, "graph.edges[" +
                                                                   std::to_string(i) + "]." +
                                                                   endpoint + " must be a string");
      }
      if (!ids.contains(ref->as_string())) {
        return common::Status::error(common::ErrorKind::Input,
                                     "edge references unknown node: " + ref->as_string());
      }
    }
  }
  return common::Status::success();
}

common::Result<Graph> parse_graph(const JsonValue &graph) {
  if (auto valid = validate_graph_json(graph); !valid.ok()) {
    return common::Result<Graph>::failure(valid);
  }

  Graph out;
  for (const auto &node_value : graph.find("nodes")->as_array()) {
    Node node;
    node.id = node_value.find("id")->as_string();
    node.type = string_or_empty(node_value, "type");
    node.ts = string_or_empty(node_value, "ts");
    node.content_hash = string_or_empty(node_value, "content_hash");
    if (const JsonValue *metadata = node_value.find("metadata"); metadata != nullptr) {
      node.metadata.agent = string_or_empty(*metadata, "agent");
      node.metadata.role = optional_from_json(metadata->find("role"));
      node.metadata.tool_name = optional_from_json(metadata->find("tool_name"));
    }
    out.nodes.push_back(std::move(node));
  }
  for (const auto &edge_value : graph.find("edges")->as_array()) {
    Edge edge;
    edge.from = edge_value.find("from")->as_string();
    edge.to = edge_value.find("to")->as_string();
    const std::string relation = string_or_empty(edge_value, "relation");
    if (!relation.empty()) {
      edge.relation = relation;
    }
    out.edges.push_back(std::move(edge));
  }
  return common::Result<Graph>::success(std::move(out));
}

} // namespace ethos::sig
