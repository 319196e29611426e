#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace recollect::health {

struct ComponentStatus {
  std::string status = "unknown";
  std::size_t restart_count = 0;
  std::uint32_t consecutive_failures = 0;
  std::optional<std::string> last_error;
  std::string updated_at;
  std::optional<std::string> last_ok;
};

struct HealthSnapshot {
  std::unordered_map<std::string, ComponentStatus> components;

  /// True when no component is in the `error` state.
  [[nodiscard]] bool healthy() const;
};

void mark_component_starting(const std::string &name);
void mark_component_ok(const std::string &name);
void mark_component_error(const std::string &name, const std::string &error);
void bump_component_restart(const std::string &name);
void reset_component(const std::string &name);

/// Count one failure. The component flips to `error` once `threshold`
/// consecutive failures have been seen. Returns the running count.
std::uint32_t record_component_failure(const std::string &name, const std::string &error,
                                       std::uint32_t threshold);

/// Clear the failure streak and mark the component ok.
void record_component_success(const std::string &name);

[[nodiscard]] std::optional<ComponentStatus> get_component(const std::string &name);
[[nodiscard]] HealthSnapshot snapshot();
[[nodiscard]] std::string snapshot_json();
void clear();

} // namespace recollect::health
