#pragma once

#include "clawwatch/common/result.hpp"

#include <filesystem>

namespace clawwatch::daemon {

/// Single-controller lock. A file left behind by a dead process is taken over.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();
  [[nodiscard]] bool acquired() const { return acquired_; }

  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace clawwatch::daemon
