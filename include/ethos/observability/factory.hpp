#pragma once

#include "ethos/common/result.hpp"
#include "ethos/config/schema.hpp"
#include "ethos/observability/observer.hpp"

#include <iosfwd>
#include <memory>

namespace ethos::observability {

/// Builds the sink chain named by `observability.backend`. `log` lines go to
/// `log_stream`. An unknown backend name is an ErrorKind::Config failure.
[[nodiscard]] common::Result<std::unique_ptr<IObserver>>
create_observer(const config::Config &config, std::ostream &log_stream);

} // namespace ethos::observability
