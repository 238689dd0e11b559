#include "ethos/observability/factory.hpp"

#include "ethos/config/config.hpp"
#include "ethos/observability/fanout_observer.hpp"
#include "ethos/observability/log_observer.hpp"

namespace ethos::observability {

common::Result<std::unique_ptr<IObserver>> create_observer(const config::Config &config,
                                                           std::ostream &log_stream) {
  const auto backends = config::observability_backends(config);
  if (!backends.ok()) {
    return common::Result<std::unique_ptr<IObserver>>::failure(backends);
  }

  auto fanout = std::make_unique<FanoutObserver>();
  for (const auto &backend : backends.value()) {
    if (backend == config::BACKEND_LOG) {
      fanout->add(std::make_unique<LogObserver>(log_stream));
    }
  }
  return common::Result<std::unique_ptr<IObserver>>::success(std::move(fanout));
}

} // namespace ethos::observability
