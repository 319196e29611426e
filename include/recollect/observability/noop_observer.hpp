#pragma once

#include "recollect/observability/observer.hpp"

namespace recollect::observability {

/// Default for tests and `backend = "none"`: store, query and index
/// events are dropped.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace recollect::observability
