#include "recollect/health/health.hpp"

#include "recollect/common/json_util.hpp"
#include "recollect/memory/learning.hpp"

#include <mutex>
#include <sstream>

namespace recollect::health {

namespace {

std::mutex g_mutex;
std::unordered_map<std::string, ComponentStatus> g_components;

ComponentStatus &ensure_component(const std::string &name) { return g_components[name]; }

std::string now() { return memory::now_rfc3339(); }

} // namespace

bool HealthSnapshot::healthy() const {
  for (const auto &[name, status] : components) {
    if (status.status == "error") {
      return false;
    }
  }
  return true;
}

void mark_component_starting(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = ensure_component(name);
  component.status = "starting";
  component.updated_at = now();
  component.last_error.reset();
}

void mark_component_ok(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = ensure_component(name);
  component.status = "ok";
  component.consecutive_failures = 0;
  component.updated_at = now();
  component.last_ok = component.updated_at;
  component.last_error.reset();
}

void mark_component_error(const std::string &name, const std::string &error) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = ensure_component(name);
  component.status = "error";
  component.updated_at = now();
  component.last_error = error;
}

void bump_component_restart(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = ensure_component(name);
  ++component.restart_count;
  component.updated_at = now();
}

void reset_component(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_components.erase(name);
}

std::uint32_t record_component_failure(const std::string &name, const std::string &error,
                                       const std::uint32_t threshold) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = ensure_component(name);
  ++component.consecutive_failures;
  component.updated_at = now();
  component.last_error = error;
  if (component.consecutive_failures >= threshold) {
    component.status = "error";
  }
  return component.consecutive_failures;
}

void record_component_success(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = ensure_component(name);
  if (component.status == "ok" && component.consecutive_failures == 0) {
    return;
  }
  component.status = "ok";
  component.consecutive_failures = 0;
  component.updated_at = now();
  component.last_ok = component.updated_at;
  component.last_error.reset();
}

std::optional<ComponentStatus> get_component(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto it = g_components.find(name);
  if (it == g_components.end()) {
    return std::nullopt;
  }
  return it->second;
}

HealthSnapshot snapshot() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return HealthSnapshot{.components = g_components};
}

std::string snapshot_json() {
  const auto snap = snapshot();
  std::ostringstream json;
  json << "{";
  bool first = true;
  for (const auto &[name, status] : snap.components) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << "\"" << common::json_escape(name) << "\":{";
    json << "\"status\":\"" << status.status << "\",";
    json << "\"restart_count\":" << status.restart_count << ",";
    json << "\"consecutive_failures\":" << status.consecutive_failures;
    if (!status.updated_at.empty()) {
      json << ",\"updated_at\":\"" << status.updated_at << "\"";
    }
    if (status.last_ok.has_value()) {
      json << ",\"last_ok\":\"" << *status.last_ok << "\"";
    }
    if (status.last_error.has_value()) {
      json << ",\"last_error\":\"" << common::json_escape(*status.last_error) << "\"";
    }
    json << "}";
  }
  json << "}";
  return json.str();
}

void clear() {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_components.clear();
}

} // namespace recollect::health
