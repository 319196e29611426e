#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace recollect::observability {

struct LearningStoredEvent {
  std::string id;
  std::string type;
  bool created = false;
  std::optional<double> similarity;
};

struct QueryEvent {
  std::size_t result_count = 0;
  std::size_t candidates = 0;
  std::chrono::milliseconds duration{0};
};

struct EmbeddingFailureEvent {
  std::string provider;
  std::string message;
  bool timeout = false;
};

struct RequestEvent {
  std::string method;
  std::string path;
  int status = 0;
  std::chrono::milliseconds duration{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<LearningStoredEvent, QueryEvent, EmbeddingFailureEvent,
                                   RequestEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct RecordCountMetric {
  std::uint64_t active = 0;
  std::uint64_t indexed = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, RecordCountMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace recollect::observability
