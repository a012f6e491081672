#include "clawwatch/common/time.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace clawwatch::common {

std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

Clock system_clock() { return [] { return now_ms(); }; }

Sleeper thread_sleeper() {
  return [](const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

std::string format_clock_time(const std::int64_t epoch_ms) {
  const auto t = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm{};
  localtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%H:%M:%S");
  return out.str();
}

std::string format_age(std::int64_t seconds) {
  if (seconds < 0) {
    seconds = 0;
  }
  std::ostringstream out;
  if (seconds < 60) {
    out << seconds << "s";
  } else if (seconds < 3600) {
    out << seconds / 60 << "m " << seconds % 60 << "s";
  } else if (seconds < 86400) {
    out << seconds / 3600 << "h " << (seconds % 3600) / 60 << "m";
  } else {
    out << seconds / 86400 << "d " << (seconds % 86400) / 3600 << "h";
  }
  return out.str();
}

} // namespace clawwatch::common
