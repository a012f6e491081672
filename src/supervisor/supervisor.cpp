#include "clawwatch/supervisor/supervisor.hpp"

#include "clawwatch/common/fs.hpp"
#include "clawwatch/common/json_util.hpp"

#include <chrono>
#include <filesystem>

namespace clawwatch::supervisor {

namespace {

bool reports_missing_process(const std::string &text) {
  const std::string lowered = common::to_lower(text);
  return lowered.find("not found") != std::string::npos ||
         lowered.find("process or namespace") != std::string::npos;
}

} // namespace

Pm2Supervisor::Pm2Supervisor(process::CommandRunner &runner, config::SupervisorConfig config)
    : runner_(runner), config_(std::move(config)) {}

process::CommandResult Pm2Supervisor::invoke(const std::string &args,
                                             const std::uint64_t timeout_secs,
                                             const std::string &cwd) const {
  process::CommandOptions options;
  options.timeout = std::chrono::seconds(timeout_secs);
  options.cwd = cwd.empty() ? config_.cwd : cwd;
  return runner_.run(config_.command + " " + args, options);
}

bool Pm2Supervisor::ping() { return invoke("ping", config_.timeout_secs, "").ok; }

common::Result<std::vector<ProcessInfo>> Pm2Supervisor::list() {
  const auto result = invoke("jlist", config_.timeout_secs, "");
  if (!result.ok) {
    return common::Result<std::vector<ProcessInfo>>::failure(
        "jlist failed: " + (result.errors.empty() ? result.output : result.errors));
  }
  return parse_process_list(result.output);
}

RestartResult Pm2Supervisor::restart(const std::string &name) {
  const auto result = invoke("restart " + process::shell_quote(name), config_.timeout_secs, "");
  const std::string detail = result.combined();
  if (result.ok && !reports_missing_process(detail)) {
    return RestartResult{.outcome = RestartOutcome::Restarted, .detail = detail};
  }
  if (reports_missing_process(detail)) {
    return RestartResult{.outcome = RestartOutcome::NotRegistered, .detail = detail};
  }
  return RestartResult{.outcome = RestartOutcome::Failed, .detail = detail};
}

common::Status Pm2Supervisor::start(const std::string &descriptor, const std::string &only) {
  std::string args = "start " + process::shell_quote(descriptor);
  if (!only.empty()) {
    args += " --only " + process::shell_quote(only);
  }
  const std::string cwd = std::filesystem::path(descriptor).parent_path().string();
  const auto result = invoke(args, config_.start_timeout_secs, cwd);
  if (!result.ok) {
    return common::Status::error("start " + descriptor + " failed: " + result.combined());
  }
  return common::Status::success();
}

common::Result<std::vector<ProcessInfo>> parse_process_list(const std::string &text) {
  // pm2 may print "[PM2] ..." banners ahead of the array.
  auto open = text.find('[');
  while (open != std::string::npos) {
    const auto next = common::json_skip_ws(text, open + 1);
    if (next < text.size() && (text[next] == '{' || text[next] == ']')) {
      break;
    }
    open = text.find('[', open + 1);
  }
  if (open == std::string::npos) {
    return common::Result<std::vector<ProcessInfo>>::failure("process list is not a JSON array");
  }
  const auto close = common::json_find_matching_token(text, open, '[', ']');
  if (close == std::string::npos) {
    return common::Result<std::vector<ProcessInfo>>::failure("process list is truncated");
  }

  std::vector<ProcessInfo> out;
  for (const auto &object :
       common::json_split_top_level_objects(text.substr(open, close - open + 1))) {
    const auto fields = common::json_parse_flat(object);
    ProcessInfo info;
    if (const auto it = fields.find("name"); it != fields.end()) {
      info.name = it->second;
    }
    if (const auto it = fields.find("pm2_env"); it != fields.end()) {
      const auto env = common::json_parse_flat(it->second);
      if (const auto status = env.find("status"); status != env.end()) {
        info.status = status->second;
      }
    }
    if (!info.name.empty()) {
      out.push_back(std::move(info));
    }
  }
  return common::Result<std::vector<ProcessInfo>>::success(std::move(out));
}

std::string to_string(const RestartOutcome outcome) {
  switch (outcome) {
  case RestartOutcome::Restarted:
    return "restarted";
  case RestartOutcome::NotRegistered:
    return "not registered";
  case RestartOutcome::Failed:
    return "failed";
  }
  return "failed";
}

} // namespace clawwatch::supervisor
