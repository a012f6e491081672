#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "clawwatch/notify/notifier.hpp"

void register_notify_tests(std::vector<clawwatch::tests::TestCase> &tests) {
  using clawwatch::tests::require;
  namespace nt = clawwatch::notify;
  namespace cfg = clawwatch::config;
  namespace ct = clawwatch::testing;

  tests.push_back({"notify_desktop_linux_command", [] {
                     ct::FakeCommandRunner runner;
                     nt::DesktopChannel channel(runner, cfg::DesktopNotificationConfig{},
                                                nt::DesktopPlatform::Linux);
                     const auto command = channel.build_command(
                         nt::Notification{.title = "OpenClaw Monitor CRITICAL",
                                          .message = "Repair failed: Gateway's port",
                                          .severity = nt::Severity::Critical});
                     require(command.find("notify-send --app-name=clawwatch --urgency=critical") == 0,
                             command);
                     require(command.find("'Repair failed: Gateway'\\''s port'") != std::string::npos,
                             "message must be shell quoted: " + command);

                     require(channel.send(nt::Notification{.title = "t", .message = "m"}).ok(),
                             "send should pass through the runner");
                     require(runner.count("--urgency=normal") == 1, "info urgency");
                   }});

  tests.push_back({"notify_desktop_silent_and_macos", [] {
                     ct::FakeCommandRunner runner;
                     const nt::Notification note{.title = "Claw", .message = "say \"hi\""};

                     nt::DesktopChannel silent_linux(runner, cfg::DesktopNotificationConfig{.silent = true},
                                                     nt::DesktopPlatform::Linux);
                     require(silent_linux.build_command(note).find("suppress-sound") !=
                                 std::string::npos,
                             "silent hint on linux");

                     nt::DesktopChannel mac(runner, cfg::DesktopNotificationConfig{},
                                            nt::DesktopPlatform::MacOS);
                     const auto command = mac.build_command(note);
                     require(command.find("osascript -e ") == 0, command);
                     require(command.find("sound name") != std::string::npos, "sound by default");
                     require(command.find("\\\"hi\\\"") != std::string::npos,
                             "applescript quotes escaped: " + command);

                     nt::DesktopChannel silent_mac(runner, cfg::DesktopNotificationConfig{.silent = true},
                                                   nt::DesktopPlatform::MacOS);
                     require(silent_mac.build_command(note).find("sound name") == std::string::npos,
                             "silent mac has no sound");
                   }});

  tests.push_back({"notify_desktop_failure_is_reported", [] {
                     ct::FakeCommandRunner runner;
                     runner.on("notify-send", ct::fail_result(127, "notify-send: not found"));
                     nt::DesktopChannel channel(runner, cfg::DesktopNotificationConfig{},
                                                nt::DesktopPlatform::Linux);
                     const auto status = channel.send(nt::Notification{.title = "t", .message = "m"});
                     require(!status.ok(), "missing binary should fail");
                     require(status.error().find("not found") != std::string::npos, status.error());
                   }});

  tests.push_back({"notify_ntfy_posts_plain_text_with_headers", [] {
                     ct::FakeHttpClient http;
                     cfg::NtfyConfig config;
                     config.enabled = true;
                     config.server = "https://ntfy.example.com//";
                     config.topic = "claw-alerts";
                     config.tags = {"warning", "robot"};
                     nt::NtfyChannel channel(http, config);

                     require(channel.topic_url() == "https://ntfy.example.com/claw-alerts",
                             channel.topic_url());
                     const auto status = channel.send(
                         nt::Notification{.title = "Claw\nCRITICAL", .message = "Gateway down",
                                          .severity = nt::Severity::Critical});
                     require(status.ok(), status.error());

                     const auto posts = http.posts();
                     require(posts.size() == 1, "one post");
                     require(posts[0].body == "Gateway down", "plain text body");
                     require(posts[0].headers.at("Title") == "Claw CRITICAL",
                             "header must not carry newlines");
                     require(posts[0].headers.at("Priority") == "urgent", "critical priority");
                     require(posts[0].headers.at("Tags") == "warning,robot", "tags joined");
                     require(posts[0].timeout_ms == 10000, "timeout from config");

                     (void)channel.send(nt::Notification{.title = "Claw", .message = "back"});
                     require(http.posts()[1].headers.at("Priority") == "high", "info priority");
                   }});

  tests.push_back({"notify_ntfy_errors", [] {
                     ct::FakeHttpClient http;
                     cfg::NtfyConfig config;
                     nt::NtfyChannel no_topic(http, config);
                     require(!no_topic.send(nt::Notification{.title = "t", .message = "m"}).ok(),
                             "empty topic should fail");
                     require(http.posts().empty(), "nothing posted without a topic");

                     config.topic = "alerts";
                     http.set_post(ct::http_status(429));
                     nt::NtfyChannel limited(http, config);
                     const auto status = limited.send(nt::Notification{.title = "t", .message = "m"});
                     require(!status.ok() && status.error() == "HTTP 429", status.error());
                   }});

  tests.push_back({"notify_fan_out_isolates_channel_failures", [] {
                     ct::ChannelLog log;
                     nt::Notifier notifier;
                     notifier.add(std::make_unique<ct::RecordingChannel>(
                         "broken", log, ct::RecordingChannel::Mode::Throw));
                     notifier.add(std::make_unique<ct::RecordingChannel>(
                         "flaky", log, ct::RecordingChannel::Mode::Fail));
                     notifier.add(std::make_unique<ct::RecordingChannel>("good", log));

                     const auto reports =
                         notifier.notify(nt::Notification{.title = "Claw", .message = "hello"});
                     require(reports.size() == 3, "one report per channel");
                     require(!reports[0].delivered && reports[0].error.find("exploded") !=
                                                          std::string::npos,
                             "thrown error captured");
                     require(!reports[1].delivered && reports[1].error == "flaky unavailable",
                             "status error captured");
                     require(reports[2].delivered, "healthy channel still delivers");
                     require(log.size() == 2, "both non-throwing channels received it");
                   }});

  tests.push_back({"notify_factory_honours_enabled_flags", [] {
                     ct::FakeCommandRunner runner;
                     ct::FakeHttpClient http;
                     cfg::NotificationConfig config;
                     config.desktop.enabled = true;
                     config.ntfy.enabled = true;
                     config.ntfy.topic = "t";
                     require(nt::create_notifier(config, runner, http)->size() == 2, "both channels");

                     config.desktop.enabled = false;
                     config.ntfy.enabled = false;
                     require(nt::create_notifier(config, runner, http)->size() == 0, "no channels");
                   }});
}
