#include "pensync/logging/logger_registry.h"

namespace pensync {
namespace logging {

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry() : global_level_(LogLevel::Info) {
  default_logger_ = std::make_shared<Logger>("default");
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
  default_logger_->setSink(default_sink_);
  default_logger_->setLevel(global_level_);

  loggers_["default"] = default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(effectiveLevelLocked(name));
  logger->setSink(default_sink_);

  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;

  for (auto& [name, logger] : loggers_) {
    if (overrides_.find(name) == overrides_.end()) {
      logger->setLevel(level);
    }
  }
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setLevel(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  overrides_[name] = level;

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    it->second->setLevel(level);
  }
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = sink ? std::move(sink) : std::make_shared<NullSink>();

  for (auto& [name, logger] : loggers_) {
    logger->setSink(default_sink_);
  }
}

std::shared_ptr<LogSink> LoggerRegistry::getDefaultSink() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_sink_;
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  LogLevel effective = effectiveLevelLocked(name);
  return effective != LogLevel::Off && level >= effective;
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& [name, logger] : loggers_) {
    names.push_back(name);
  }
  return names;
}

std::string LoggerRegistry::getComponentPath(Component comp,
                                             const std::string& name) {
  return std::string(componentToString(comp)) + "." + name;
}

LogLevel LoggerRegistry::effectiveLevelLocked(const std::string& name) const {
  auto it = overrides_.find(name);
  if (it != overrides_.end()) {
    return it->second;
  }
  return global_level_;
}

}  // namespace logging
}  // namespace pensync
