#pragma once

#include "ethos/observability/observer.hpp"

#include <iosfwd>

namespace ethos::observability {

/// Writes one `[LEVEL] message` line per event to the given stream.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::ostream *out_;
};

} // namespace ethos::observability
