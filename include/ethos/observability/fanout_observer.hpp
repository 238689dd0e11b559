#pragma once

#include "ethos/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ethos::observability {

/// Forwards every event and metric to its sinks in the order they were
/// added. A sink whose name is already present is dropped, so `log,log`
/// logs once. With no sinks it records nothing and is named `none`.
class FanoutObserver final : public IObserver {
public:
  /// False when `sink` is null or a sink with the same name is present.
  bool add(std::unique_ptr<IObserver> sink);
  [[nodiscard]] std::size_t size() const { return sinks_.size(); }
  [[nodiscard]] bool empty() const { return sinks_.empty(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  /// Sink names joined with `+`, e.g. `log`.
  [[nodiscard]] std::string_view name() const override { return name_; }

private:
  std::vector<std::unique_ptr<IObserver>> sinks_;
  std::string name_ = "none";
};

} // namespace ethos::observability
