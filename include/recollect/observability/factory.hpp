#pragma once

#include "recollect/config/schema.hpp"
#include "recollect/observability/observer.hpp"

#include <memory>

namespace recollect::observability {

/// Build the observer named by `observability.backend`: "log", "none"/"noop",
/// or a comma list of those. Unknown names fall back to "log" with a warning;
/// repeated names collapse to one observer.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace recollect::observability
