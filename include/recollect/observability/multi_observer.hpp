#pragma once

#include "recollect/observability/observer.hpp"

#include <memory>
#include <vector>

namespace recollect::observability {

/// Fans each learning/query event out to every child, in the order added.
/// Children are fixed before the observer is installed globally; add() is
/// not synchronized against concurrent recording.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace recollect::observability
