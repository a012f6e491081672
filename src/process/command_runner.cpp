#include "clawwatch/process/command_runner.hpp"

#include "clawwatch/common/fs.hpp"

#include <algorithm>
#include <array>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace clawwatch::process {

namespace {

constexpr std::size_t kMaxOutputBytes = 1024 * 1024;

void set_nonblocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Returns false once the descriptor reports EOF.
bool drain(const int fd, std::string &sink) {
  std::array<char, 4096> buffer{};
  while (true) {
    const ssize_t bytes = read(fd, buffer.data(), buffer.size());
    if (bytes == 0) {
      return false;
    }
    if (bytes < 0) {
      return true;
    }
    const std::size_t remaining = kMaxOutputBytes > sink.size() ? kMaxOutputBytes - sink.size() : 0;
    sink.append(buffer.data(), std::min<std::size_t>(remaining, static_cast<std::size_t>(bytes)));
  }
}

} // namespace

std::string CommandResult::combined() const {
  if (errors.empty()) {
    return output;
  }
  if (output.empty()) {
    return errors;
  }
  return output + "\n" + errors;
}

CommandResult ShellCommandRunner::run(const std::string &command, const CommandOptions &options) {
  CommandResult result;

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0) {
    result.errors = "Failed to create pipe";
    return result;
  }
  if (pipe(err_pipe) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    result.errors = "Failed to create pipe";
    return result;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    result.errors = "Failed to fork";
    return result;
  }

  if (pid == 0) {
    setpgid(0, 0);
    close(out_pipe[0]);
    close(err_pipe[0]);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[1]);
    close(err_pipe[1]);

    if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
      _exit(126);
    }

    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }

  // Also set from the parent so a kill on timeout cannot race the child's own setpgid.
  setpgid(pid, pid);
  close(out_pipe[1]);
  close(err_pipe[1]);
  set_nonblocking(out_pipe[0]);
  set_nonblocking(err_pipe[0]);

  const auto started = std::chrono::steady_clock::now();
  int status = 0;
  bool exited = false;
  bool out_open = true;
  bool err_open = true;

  while (!exited) {
    if (std::chrono::steady_clock::now() - started > options.timeout) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      result.timed_out = true;
      break;
    }

    std::array<struct pollfd, 2> fds{{
        {.fd = out_open ? out_pipe[0] : -1, .events = POLLIN, .revents = 0},
        {.fd = err_open ? err_pipe[0] : -1, .events = POLLIN, .revents = 0},
    }};
    (void)poll(fds.data(), fds.size(), 50);

    if (out_open) {
      out_open = drain(out_pipe[0], result.output);
    }
    if (err_open) {
      err_open = drain(err_pipe[0], result.errors);
    }

    if (waitpid(pid, &status, WNOHANG) == pid) {
      exited = true;
    }
  }

  if (exited) {
    // Pick up whatever the child wrote between the last poll and its exit.
    if (out_open) {
      (void)drain(out_pipe[0], result.output);
    }
    if (err_open) {
      (void)drain(err_pipe[0], result.errors);
    }
  } else {
    waitpid(pid, &status, 0);
  }

  close(out_pipe[0]);
  close(err_pipe[0]);

  result.output = common::trim(result.output);
  result.errors = common::trim(result.errors);

  if (result.timed_out) {
    result.ok = false;
    result.exit_code = -1;
    if (!result.errors.empty()) {
      result.errors += "\n";
    }
    result.errors += "command timed out";
    return result;
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  result.ok = WIFEXITED(status) && WEXITSTATUS(status) == 0;
  return result;
}

std::string shell_quote(const std::string &value) {
  std::string out = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out += "'";
  return out;
}

} // namespace clawwatch::process
