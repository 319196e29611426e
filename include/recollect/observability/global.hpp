#pragma once

#include "recollect/observability/observer.hpp"

#include <memory>

namespace recollect::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_learning_stored(const std::string &id, const std::string &type, bool created,
                            std::optional<double> similarity);
void record_query(std::size_t result_count, std::size_t candidates,
                  std::chrono::milliseconds duration);
void record_embedding_failure(const std::string &provider, const std::string &message,
                              bool timeout);
void record_request(const std::string &method, const std::string &path, int status,
                    std::chrono::milliseconds duration);
void record_error(const std::string &component, const std::string &message);

} // namespace recollect::observability
