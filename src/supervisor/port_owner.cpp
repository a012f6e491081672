#include "clawwatch/supervisor/port_owner.hpp"

#include "clawwatch/common/fs.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <sys/types.h>
#include <unistd.h>

namespace clawwatch::supervisor {

LsofPortOwner::LsofPortOwner(process::CommandRunner &runner) : runner_(runner) {}

std::optional<int> LsofPortOwner::find_listener(const std::uint16_t port) {
  process::CommandOptions options;
  options.timeout = std::chrono::seconds(10);
  // lsof exits 1 when nothing matches, so the output decides.
  const auto result =
      runner_.run("lsof -nP -t -iTCP:" + std::to_string(port) + " -sTCP:LISTEN", options);
  return parse_listener_pid(result.output);
}

common::Status LsofPortOwner::terminate(const int pid) {
  if (pid <= 1 || pid == static_cast<int>(getpid())) {
    return common::Status::error("refusing to kill pid " + std::to_string(pid));
  }
  if (kill(static_cast<pid_t>(pid), SIGKILL) != 0) {
    if (errno == ESRCH) {
      return common::Status::success();
    }
    return common::Status::error("kill " + std::to_string(pid) + ": " + std::strerror(errno));
  }
  return common::Status::success();
}

std::optional<int> parse_listener_pid(const std::string &text) {
  for (const auto &raw : common::split_lines(text)) {
    const std::string line = common::trim(raw);
    if (line.empty() || line.size() > 9) {
      continue;
    }
    bool numeric = true;
    for (const char ch : line) {
      if (ch < '0' || ch > '9') {
        numeric = false;
        break;
      }
    }
    if (!numeric) {
      continue;
    }
    const int pid = std::stoi(line);
    if (pid > 0) {
      return pid;
    }
  }
  return std::nullopt;
}

} // namespace clawwatch::supervisor
