#pragma once

#include "recollect/common/result.hpp"

#include <filesystem>
#include <optional>

namespace recollect::daemon {

/// Single-instance guard: holds `recollect.pid` while the daemon runs.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  /// Fails when another live process holds the file; stale files are replaced.
  [[nodiscard]] common::Status acquire();
  void release();

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  /// Pid recorded in `path`, if the file exists and parses.
  [[nodiscard]] static std::optional<int> read_pid(const std::filesystem::path &path);
  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace recollect::daemon
