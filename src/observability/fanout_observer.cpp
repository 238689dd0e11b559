#include "ethos/observability/fanout_observer.hpp"

#include <algorithm>
#include <utility>

namespace ethos::observability {

bool FanoutObserver::add(std::unique_ptr<IObserver> sink) {
  if (sink == nullptr) {
    return false;
  }
  const bool duplicate = std::any_of(sinks_.begin(), sinks_.end(), [&sink](const auto &existing) {
    return existing->name() == sink->name();
  });
  if (duplicate) {
    return false;
  }
  name_ = sinks_.empty() ? std::string(sink->name()) : name_ + "+" + std::string(sink->name());
  sinks_.push_back(std::move(sink));
  return true;
}

void FanoutObserver::record_event(const ObserverEvent &event) {
  for (auto &sink : sinks_) {
    sink->record_event(event);
  }
}

void FanoutObserver::record_metric(const ObserverMetric &metric) {
  for (auto &sink : sinks_) {
    sink->record_metric(metric);
  }
}

void FanoutObserver::flush() {
  for (auto &sink : sinks_) {
    sink->flush();
  }
}

} // namespace ethos::observability
