#pragma once

#include "clawwatch/common/result.hpp"
#include "clawwatch/config/schema.hpp"
#include "clawwatch/http/http_client.hpp"
#include "clawwatch/process/command_runner.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace clawwatch::notify {

enum class Severity {
  Info,
  Critical,
};

struct Notification {
  std::string title;
  std::string message;
  Severity severity = Severity::Info;
};

struct DeliveryReport {
  std::string channel;
  bool delivered = false;
  std::string error;
};

class NotificationChannel {
public:
  virtual ~NotificationChannel() = default;
  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Status send(const Notification &notification) = 0;
};

enum class DesktopPlatform {
  Linux,
  MacOS,
};

[[nodiscard]] DesktopPlatform host_desktop_platform();

class DesktopChannel final : public NotificationChannel {
public:
  DesktopChannel(process::CommandRunner &runner, config::DesktopNotificationConfig config,
                 DesktopPlatform platform = host_desktop_platform());

  [[nodiscard]] std::string_view name() const override { return "desktop"; }
  [[nodiscard]] common::Status send(const Notification &notification) override;

  [[nodiscard]] std::string build_command(const Notification &notification) const;

private:
  process::CommandRunner &runner_;
  config::DesktopNotificationConfig config_;
  DesktopPlatform platform_;
};

/// Push notification through an ntfy server: plain-text body, metadata in headers.
class NtfyChannel final : public NotificationChannel {
public:
  NtfyChannel(http::HttpClient &http, config::NtfyConfig config);

  [[nodiscard]] std::string_view name() const override { return "ntfy"; }
  [[nodiscard]] common::Status send(const Notification &notification) override;

  [[nodiscard]] std::string topic_url() const;
  [[nodiscard]] http::Headers build_headers(const Notification &notification) const;

private:
  http::HttpClient &http_;
  config::NtfyConfig config_;
};

/// Fans a notification out to every channel at once. One channel failing, or throwing,
/// never stops the others and never reaches the caller.
class Notifier {
public:
  void add(std::unique_ptr<NotificationChannel> channel);
  [[nodiscard]] std::size_t size() const { return channels_.size(); }

  std::vector<DeliveryReport> notify(const Notification &notification);

private:
  std::vector<std::unique_ptr<NotificationChannel>> channels_;
};

[[nodiscard]] std::unique_ptr<Notifier> create_notifier(const config::NotificationConfig &config,
                                                        process::CommandRunner &runner,
                                                        http::HttpClient &http);

[[nodiscard]] std::string to_string(Severity severity);

} // namespace clawwatch::notify
