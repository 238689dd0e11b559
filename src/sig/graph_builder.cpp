#include "ethos/sig/graph_builder.hpp"

#include "ethos/observability/global.hpp"
#include "ethos/sig/hasher.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace ethos::sig {

std::string utc_now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(now - seconds).count();
  const std::time_t tt = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm{};
  gmtime_r(&tt, &tm);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%s.%06lld+00:00", date, static_cast<long long>(micros));
  return buffer;
}

GraphBuilder::GraphBuilder(GraphBuilderOptions options) : options_(std::move(options)) {
  if (!options_.clock) {
    options_.clock = utc_now_iso8601;
  }
}

common::Result<Graph> GraphBuilder::build_graph(const std::vector<Event> &events) const {
  Graph graph;
  graph.nodes.reserve(events.size());
  if (!events.empty()) {
    graph.edges.reserve(events.size() - 1);
  }

  for (std::size_t i = 0; i < events.size(); ++i) {
    const Event &event = events[i];
    if (!event.ts.has_value() && options_.reject_missing_timestamps) {
      return common::Result<Graph>::failure(common::ErrorKind::Input,
                                            "event " + std::to_string(i + 1) +
                                                " has no 'ts' field");
    }

    Node node;
    node.id = node_id_for_index(i);
    node.type = event.type;
    node.ts = event.ts.has_value() ? *event.ts : options_.clock();
    node.content_hash = hash_canonical(event.raw);
    node.metadata = {.agent = options_.agent, .role = event.role, .tool_name = event.tool_name};

    if (i > 0) {
      graph.edges.push_back({.from = graph.nodes.back().id, .to = node.id});
    }
    graph.nodes.push_back(std::move(node));
  }
  return common::Result<Graph>::success(std::move(graph));
}

std::string GraphBuilder::transcript_text(const std::vector<Event> &events) {
  std::string text;
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (i > 0) {
      text.push_back('\n');
    }
    text += common::dump_json(events[i].raw);
  }
  return text;
}

common::Result<BuildOutput> GraphBuilder::build(const std::vector<Event> &events) const {
  const auto started = std::chrono::steady_clock::now();

  auto graph = build_graph(events);
  if (!graph.ok()) {
    observability::record_error("graph_builder", graph.error());
    return common::Result<BuildOutput>::failure(graph);
  }

  checks::DecisionOptions transcript_options = options_.decision;
  transcript_options.tool_name.reset();
  auto summary = checks::build_summary(options_.scorers.run(transcript_text(events)),
                                       transcript_options);

  for (const auto &event : events) {
    if (!event.is_tool_call()) {
      continue;
    }
    const std::string payload_text = event.payload.has_value()
                                         ? common::dump_json(*event.payload)
                                         : std::string("{}");
    checks::DecisionOptions tool_options = options_.decision;
    tool_options.tool_name = event.tool_name.value_or("unknown");
    const auto tool_summary = checks::build_summary(options_.scorers.run(payload_text), tool_options);
    for (const auto &decision : tool_summary.tool_decisions) {
      observability::record_tool_decision(decision.tool_name, decision.decision,
                                          tool_summary.overall_risk_score);
      summary.tool_decisions.push_back(decision);
    }
  }

  observability::record_graph_built(options_.agent, graph.value().nodes.size(),
                                    graph.value().edges.size());
  observability::record_metric(observability::BuildLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});

  return common::Result<BuildOutput>::success(
      BuildOutput{.graph = std::move(graph.value()), .summary = std::move(summary)});
}

} // namespace ethos::sig
