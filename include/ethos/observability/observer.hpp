#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace ethos::observability {

struct GraphBuiltEvent {
  std::string agent;
  std::size_t nodes = 0;
  std::size_t edges = 0;
};

struct GraphSignedEvent {
  std::string graph_sha256;
  std::string key_fingerprint;
};

struct VerificationEvent {
  bool ok = false;
  std::string reason;
};

struct KeypairGeneratedEvent {
  std::string fingerprint;
  std::string private_key_path;
  std::string public_key_path;
};

struct ToolDecisionEvent {
  std::string tool;
  std::string decision;
  double overall_risk_score = 0.0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<GraphBuiltEvent, GraphSignedEvent, VerificationEvent,
                                   KeypairGeneratedEvent, ToolDecisionEvent, ErrorEvent>;

struct BuildLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct CanonicalBytesMetric {
  std::size_t bytes = 0;
};

using ObserverMetric = std::variant<BuildLatencyMetric, CanonicalBytesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace ethos::observability
