#include "recollect/daemon/pid_file.hpp"

#include "recollect/common/fs.hpp"

#include <fstream>

#ifndef _WIN32
#include <signal.h>
#include <unistd.h>
#endif

namespace recollect::daemon {

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

common::Status PidFile::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  if (const auto existing = read_pid(path_); existing.has_value()) {
    if (is_process_running(*existing)) {
      return common::Status::error("recollect already running with pid " +
                                   std::to_string(*existing));
    }
  }

  int pid = 0;
#ifdef _WIN32
  pid = static_cast<int>(GetCurrentProcessId());
#else
  pid = static_cast<int>(getpid());
#endif

  if (auto status = common::write_file_atomic(path_, std::to_string(pid) + "\n"); !status.ok()) {
    return status;
  }
  acquired_ = true;
  return common::Status::success();
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  acquired_ = false;
}

std::optional<int> PidFile::read_pid(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  int pid = 0;
  if (!(in >> pid) || pid <= 0) {
    return std::nullopt;
  }
  return pid;
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
#ifdef _WIN32
  HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
  if (process != nullptr) {
    CloseHandle(process);
    return true;
  }
  return false;
#else
  return kill(pid, 0) == 0;
#endif
}

} // namespace recollect::daemon
