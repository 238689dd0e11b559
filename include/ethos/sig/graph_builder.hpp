#pragma once

#include "ethos/checks/checks.hpp"
#include "ethos/checks/decision.hpp"
#include "ethos/common/result.hpp"
#include "ethos/sig/graph.hpp"

#include <functional>
#include <string>
#include <vector>

namespace ethos::sig {

/// Returns an ISO-8601 UTC timestamp.
using Clock = std::function<std::string()>;

/// Current time as `YYYY-MM-DDTHH:MM:SS.ffffff+00:00`.
[[nodiscard]] std::string utc_now_iso8601();

struct GraphBuilderOptions {
  std::string agent;
  Clock clock = utc_now_iso8601;
  bool reject_missing_timestamps = false;
  checks::ScorerSet scorers = checks::default_scorers();
  checks::DecisionOptions decision;
};

struct BuildOutput {
  Graph graph;
  checks::RiskSummary summary;
};

class GraphBuilder {
public:
  explicit GraphBuilder(GraphBuilderOptions options);

  /// Nodes `n1..nN` in event order linked by `follows` edges, plus the
  /// transcript-level risk summary with one decision per tool call.
  [[nodiscard]] common::Result<BuildOutput> build(const std::vector<Event> &events) const;

  /// Graph construction alone, without scoring.
  [[nodiscard]] common::Result<Graph> build_graph(const std::vector<Event> &events) const;

  /// Events as compact JSON joined by newlines; the text the scorers see.
  [[nodiscard]] static std::string transcript_text(const std::vector<Event> &events);

private:
  GraphBuilderOptions options_;
};

} // namespace ethos::sig
