#include "ethos/observability/log_observer.hpp"

#include <cstdio>
#include <ostream>
#include <string>
#include <type_traits>

namespace ethos::observability {

namespace {

std::string format_score(const double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.4f", value);
  return buffer;
}

} // namespace

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  const auto log_line = [this](const std::string &level, const std::string &message) {
    *out_ << "[" << level << "] " << message << "\n";
  };
  std::visit(
      [&log_line](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, GraphBuiltEvent>) {
          log_line("INFO", "graph.built agent=" + evt.agent + " nodes=" +
                               std::to_string(evt.nodes) + " edges=" + std::to_string(evt.edges));
        } else if constexpr (std::is_same_v<T, GraphSignedEvent>) {
          log_line("INFO", "graph.signed sha256=" + evt.graph_sha256 +
                               " key=" + evt.key_fingerprint);
        } else if constexpr (std::is_same_v<T, VerificationEvent>) {
          log_line(evt.ok ? "INFO" : "WARN",
                   "graph.verify ok=" + (evt.ok ? std::string("true") : std::string("false")) +
                       " reason=\"" + evt.reason + "\"");
        } else if constexpr (std::is_same_v<T, KeypairGeneratedEvent>) {
          log_line("INFO", "keys.generated fingerprint=" + evt.fingerprint +
                               " private=" + evt.private_key_path +
                               " public=" + evt.public_key_path);
        } else if constexpr (std::is_same_v<T, ToolDecisionEvent>) {
          log_line("INFO", "tool.decision name=" + evt.tool + " decision=" + evt.decision +
                               " overall=" + format_score(evt.overall_risk_score));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, BuildLatencyMetric>) {
          *out_ << "[DEBUG] metric.build_latency_ms=" << m.latency.count() << "\n";
        } else if constexpr (std::is_same_v<T, CanonicalBytesMetric>) {
          *out_ << "[DEBUG] metric.canonical_bytes=" << m.bytes << "\n";
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace ethos::observability
