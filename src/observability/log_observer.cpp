#include "recollect/observability/log_observer.hpp"

#include <cstdio>
#include <iostream>
#include <type_traits>

namespace recollect::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string format_score(const double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.4f", value);
  return buf;
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, LearningStoredEvent>) {
          std::string line = std::string(evt.created ? "learning.stored" : "learning.merged") +
                             " id=" + evt.id + " type=" + evt.type;
          if (evt.similarity.has_value()) {
            line += " similarity=" + format_score(*evt.similarity);
          }
          log_line("INFO", line);
        } else if constexpr (std::is_same_v<T, QueryEvent>) {
          log_line("INFO", "query results=" + std::to_string(evt.result_count) +
                               " candidates=" + std::to_string(evt.candidates) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, EmbeddingFailureEvent>) {
          log_line("WARN", "embedding." + std::string(evt.timeout ? "timeout" : "unavailable") +
                               " provider=" + evt.provider + " " + evt.message);
        } else if constexpr (std::is_same_v<T, RequestEvent>) {
          log_line(evt.status >= 500 ? "WARN" : "DEBUG",
                   "http " + evt.method + " " + evt.path + " status=" +
                       std::to_string(evt.status) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, RecordCountMetric>) {
          log_line("DEBUG", "metric.records active=" + std::to_string(m.active) +
                                " indexed=" + std::to_string(m.indexed));
        }
      },
      metric);
}

} // namespace recollect::observability
