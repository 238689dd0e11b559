#pragma once

#include "ethos/observability/observer.hpp"

#include <memory>

namespace ethos::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_graph_built(const std::string &agent, std::size_t nodes, std::size_t edges);
void record_graph_signed(const std::string &graph_sha256, const std::string &key_fingerprint);
void record_verification(bool ok, const std::string &reason);
void record_keypair_generated(const std::string &fingerprint, const std::string &private_key_path,
                              const std::string &public_key_path);
void record_tool_decision(const std::string &tool, const std::string &decision,
                          double overall_risk_score);
void record_error(const std::string &component, const std::string &message);

} // namespace ethos::observability
