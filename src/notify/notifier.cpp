#include "clawwatch/notify/notifier.hpp"

#include "clawwatch/observability/global.hpp"

#include <future>

namespace clawwatch::notify {

void Notifier::add(std::unique_ptr<NotificationChannel> channel) {
  if (channel != nullptr) {
    channels_.push_back(std::move(channel));
  }
}

std::vector<DeliveryReport> Notifier::notify(const Notification &notification) {
  std::vector<std::future<DeliveryReport>> pending;
  pending.reserve(channels_.size());
  for (auto &channel : channels_) {
    pending.push_back(std::async(std::launch::async, [&channel, &notification]() {
      DeliveryReport report;
      report.channel = std::string(channel->name());
      try {
        const auto status = channel->send(notification);
        report.delivered = status.ok();
        report.error = status.error();
      } catch (const std::exception &e) {
        report.error = e.what();
      }
      return report;
    }));
  }

  std::vector<DeliveryReport> reports;
  reports.reserve(pending.size());
  for (auto &future : pending) {
    auto report = future.get();
    observability::record_notification(report.channel, notification.title + ": " +
                                                            notification.message,
                                       report.delivered, report.error);
    reports.push_back(std::move(report));
  }
  return reports;
}

std::unique_ptr<Notifier> create_notifier(const config::NotificationConfig &config,
                                          process::CommandRunner &runner,
                                          http::HttpClient &http) {
  auto notifier = std::make_unique<Notifier>();
  if (config.desktop.enabled) {
    notifier->add(std::make_unique<DesktopChannel>(runner, config.desktop));
  }
  if (config.ntfy.enabled) {
    notifier->add(std::make_unique<NtfyChannel>(http, config.ntfy));
  }
  return notifier;
}

std::string to_string(const Severity severity) {
  return severity == Severity::Critical ? "critical" : "info";
}

} // namespace clawwatch::notify
