#include "recollect/observability/factory.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/observability/log_observer.hpp"
#include "recollect/observability/multi_observer.hpp"
#include "recollect/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>
#include <vector>

namespace recollect::observability {

namespace {

std::unique_ptr<IObserver> make_backend(const std::string &name) {
  if (name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (name != "log") {
    std::cerr << "[observability] unknown backend '" << name << "', using log\n";
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (backend.find(',') == std::string::npos) {
    return make_backend(backend);
  }

  // "log, log" is one log observer, not two copies of every daemon line.
  std::vector<std::string> names;
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    std::string name = common::trim(part);
    if (name.empty()) {
      continue;
    }
    if (name != "none" && name != "noop" && name != "log") {
      std::cerr << "[observability] unknown backend '" << name << "', using log\n";
      name = "log";
    }
    bool seen = false;
    for (const auto &existing : names) {
      seen = seen || existing == name;
    }
    if (!seen) {
      names.push_back(std::move(name));
    }
  }

  if (names.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (names.size() == 1) {
    return make_backend(names.front());
  }
  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : names) {
    multi->add(make_backend(name));
  }
  return multi;
}

} // namespace recollect::observability
