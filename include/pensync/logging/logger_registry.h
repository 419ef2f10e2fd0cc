#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "pensync/logging/logger.h"

namespace pensync {
namespace logging {

class LoggerRegistry {
 public:
  // Singleton instance with zero-configuration defaults
  static LoggerRegistry& instance();

  // Get or create a named logger sharing the default sink
  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  std::shared_ptr<Logger> getDefaultLogger();

  // Applies to every logger without a per-name override
  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  // Per-name override, kept for loggers created later
  void setLevel(const std::string& name, LogLevel level);

  // Replaces the sink of every registered logger
  void setDefaultSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getDefaultSink() const;

  bool shouldLog(const std::string& logger_name, LogLevel level);

  std::vector<std::string> getLoggerNames() const;

  static std::string getComponentPath(Component comp, const std::string& name);

 private:
  LoggerRegistry();

  LogLevel effectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::unordered_map<std::string, LogLevel> overrides_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

// Logger bound to a component, named "<Component>.<name>"
class ComponentLogger {
 public:
  ComponentLogger(Component component, const std::string& name)
      : component_(component),
        logger_(LoggerRegistry::instance().getOrCreateLogger(
            LoggerRegistry::getComponentPath(component, name))) {}

  template <typename... Args>
  void log(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger_->shouldLog(level)) {
      logger_->logWithComponent(level, component_, fmt,
                                std::forward<Args>(args)...);
    }
  }

 private:
  Component component_;
  std::shared_ptr<Logger> logger_;
};

}  // namespace logging
}  // namespace pensync
