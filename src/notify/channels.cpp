#include "clawwatch/common/fs.hpp"
#include "clawwatch/notify/notifier.hpp"

#include <chrono>

namespace clawwatch::notify {

namespace {

// AppleScript string literal.
std::string applescript_quote(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch == '\n' ? ' ' : ch);
  }
  out += "\"";
  return out;
}

// Header values cannot carry line breaks.
std::string header_value(const std::string &value) {
  std::string out;
  for (const char ch : value) {
    out.push_back(ch == '\r' || ch == '\n' ? ' ' : ch);
  }
  return common::trim(out);
}

} // namespace

DesktopPlatform host_desktop_platform() {
#ifdef __APPLE__
  return DesktopPlatform::MacOS;
#else
  return DesktopPlatform::Linux;
#endif
}

DesktopChannel::DesktopChannel(process::CommandRunner &runner,
                               config::DesktopNotificationConfig config,
                               const DesktopPlatform platform)
    : runner_(runner), config_(config), platform_(platform) {}

std::string DesktopChannel::build_command(const Notification &notification) const {
  if (platform_ == DesktopPlatform::MacOS) {
    std::string script = "display notification " + applescript_quote(notification.message) +
                         " with title " + applescript_quote(notification.title);
    if (!config_.silent) {
      script += " sound name \"default\"";
    }
    return "osascript -e " + process::shell_quote(script);
  }

  std::string command = "notify-send --app-name=clawwatch";
  command += notification.severity == Severity::Critical ? " --urgency=critical"
                                                         : " --urgency=normal";
  if (config_.silent) {
    command += " --hint=boolean:suppress-sound:true";
  }
  command += " " + process::shell_quote(notification.title) + " " +
             process::shell_quote(notification.message);
  return command;
}

common::Status DesktopChannel::send(const Notification &notification) {
  process::CommandOptions options;
  options.timeout = std::chrono::seconds(10);
  const auto result = runner_.run(build_command(notification), options);
  if (!result.ok) {
    return common::Status::error(result.combined().empty() ? "exit " +
                                                                 std::to_string(result.exit_code)
                                                           : result.combined());
  }
  return common::Status::success();
}

NtfyChannel::NtfyChannel(http::HttpClient &http, config::NtfyConfig config)
    : http_(http), config_(std::move(config)) {}

std::string NtfyChannel::topic_url() const {
  std::string server = common::trim(config_.server);
  while (!server.empty() && server.back() == '/') {
    server.pop_back();
  }
  return server + "/" + common::trim(config_.topic);
}

http::Headers NtfyChannel::build_headers(const Notification &notification) const {
  http::Headers headers;
  headers["Title"] = header_value(notification.title);
  headers["Priority"] = notification.severity == Severity::Critical ? config_.critical_priority
                                                                     : config_.priority;
  if (!config_.tags.empty()) {
    std::string tags;
    for (const auto &tag : config_.tags) {
      if (!tags.empty()) {
        tags += ",";
      }
      tags += tag;
    }
    headers["Tags"] = header_value(tags);
  }
  headers["Content-Type"] = "text/plain; charset=utf-8";
  return headers;
}

common::Status NtfyChannel::send(const Notification &notification) {
  if (common::trim(config_.topic).empty()) {
    return common::Status::error("no ntfy topic configured");
  }
  const auto response = http_.post(topic_url(), build_headers(notification),
                                   notification.message, config_.timeout_secs * 1000);
  if (response.network_error) {
    return common::Status::error(response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Status::error("HTTP " + std::to_string(response.status));
  }
  return common::Status::success();
}

} // namespace clawwatch::notify
