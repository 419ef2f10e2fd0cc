#pragma once

#include <cstdint>
#include <string>

namespace pensync {
namespace logging {

// Log levels (RFC-5424 severities)
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Alert = 6,
  Emergency = 7,
  Off = 8
};

// Component identifiers for hierarchical logging
enum class Component {
  Root,
  Transport,
  Protocol,
  Event,
  Ftp,
  Streaming,
  Config,
  Count
};

// Sink types
enum class SinkType { File, Stdio, Null, External };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Alert: return "ALERT";
    case LogLevel::Emergency: return "EMERGENCY";
    case LogLevel::Off: return "OFF";
    default: return "UNKNOWN";
  }
}

// Returns false if the string names no level; `level` is left untouched.
inline bool parseLogLevel(const std::string& str, LogLevel& level) {
  if (str == "DEBUG" || str == "debug") level = LogLevel::Debug;
  else if (str == "INFO" || str == "info") level = LogLevel::Info;
  else if (str == "NOTICE" || str == "notice") level = LogLevel::Notice;
  else if (str == "WARNING" || str == "warning") level = LogLevel::Warning;
  else if (str == "ERROR" || str == "error") level = LogLevel::Error;
  else if (str == "CRITICAL" || str == "critical") level = LogLevel::Critical;
  else if (str == "ALERT" || str == "alert") level = LogLevel::Alert;
  else if (str == "EMERGENCY" || str == "emergency") level = LogLevel::Emergency;
  else if (str == "OFF" || str == "off") level = LogLevel::Off;
  else return false;
  return true;
}

inline const char* componentToString(Component component) {
  switch (component) {
    case Component::Root: return "Root";
    case Component::Transport: return "Transport";
    case Component::Protocol: return "Protocol";
    case Component::Event: return "Event";
    case Component::Ftp: return "Ftp";
    case Component::Streaming: return "Streaming";
    case Component::Config: return "Config";
    default: return "Unknown";
  }
}

}  // namespace logging
}  // namespace pensync
