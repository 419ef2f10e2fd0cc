#include "pensync/logging/log_formatter.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace pensync {
namespace logging {

static std::string formatTimestamp(
    const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

  return oss.str();
}

std::string DefaultFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  oss << '[' << formatTimestamp(msg.timestamp) << "] ";
  oss << '[' << logLevelToString(msg.level) << "] ";
  oss << "[T:" << msg.thread_id << "] ";

  if (!msg.logger_name.empty()) {
    oss << '[' << msg.logger_name << "] ";
  } else if (msg.component != Component::Root) {
    oss << '[' << componentToString(msg.component) << "] ";
  }

  if (msg.file && msg.line > 0) {
    // Only the basename, full build paths are noise
    const char* base = msg.file;
    for (const char* p = msg.file; *p; ++p) {
      if (*p == '/') {
        base = p + 1;
      }
    }
    oss << '[' << base << ':' << msg.line;
    if (msg.function) {
      oss << " " << msg.function << "()";
    }
    oss << "] ";
  }

  if (!msg.device.empty()) {
    oss << "[dev:" << msg.device << "] ";
  }

  oss << msg.message;

  if (!msg.key_values.empty()) {
    oss << " {";
    bool first = true;
    for (const auto& kv : msg.key_values) {
      if (!first)
        oss << ", ";
      oss << kv.first << "=" << kv.second;
      first = false;
    }
    oss << "}";
  }

  return oss.str();
}

}  // namespace logging
}  // namespace pensync
