#include "recollect/observability/global.hpp"

#include <mutex>

namespace recollect::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_learning_stored(const std::string &id, const std::string &type, const bool created,
                            std::optional<double> similarity) {
  record_event(LearningStoredEvent{
      .id = id, .type = type, .created = created, .similarity = similarity});
}

void record_query(const std::size_t result_count, const std::size_t candidates,
                  const std::chrono::milliseconds duration) {
  record_event(
      QueryEvent{.result_count = result_count, .candidates = candidates, .duration = duration});
}

void record_embedding_failure(const std::string &provider, const std::string &message,
                              const bool timeout) {
  record_event(EmbeddingFailureEvent{.provider = provider, .message = message, .timeout = timeout});
}

void record_request(const std::string &method, const std::string &path, const int status,
                    const std::chrono::milliseconds duration) {
  record_event(RequestEvent{.method = method, .path = path, .status = status, .duration = duration});
  record_metric(RequestLatencyMetric{.latency = duration});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace recollect::observability
