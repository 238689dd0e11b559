#include "ethos/observability/global.hpp"

#include <mutex>

namespace ethos::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_graph_built(const std::string &agent, const std::size_t nodes,
                        const std::size_t edges) {
  record_event(GraphBuiltEvent{.agent = agent, .nodes = nodes, .edges = edges});
}

void record_graph_signed(const std::string &graph_sha256, const std::string &key_fingerprint) {
  record_event(GraphSignedEvent{.graph_sha256 = graph_sha256, .key_fingerprint = key_fingerprint});
}

void record_verification(const bool ok, const std::string &reason) {
  record_event(VerificationEvent{.ok = ok, .reason = reason});
}

void record_keypair_generated(const std::string &fingerprint, const std::string &private_key_path,
                              const std::string &public_key_path) {
  record_event(KeypairGeneratedEvent{.fingerprint = fingerprint,
                                     .private_key_path = private_key_path,
                                     .public_key_path = public_key_path});
}

void record_tool_decision(const std::string &tool, const std::string &decision,
                          const double overall_risk_score) {
  record_event(ToolDecisionEvent{
      .tool = tool, .decision = decision, .overall_risk_score = overall_risk_score});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace ethos::observability
