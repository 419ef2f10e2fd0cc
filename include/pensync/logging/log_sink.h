#pragma once

#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "pensync/logging/log_formatter.h"
#include "pensync/logging/log_message.h"

namespace pensync {
namespace logging {

class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;
  virtual SinkType type() const = 0;

  virtual void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Stdio sink (stdout/stderr)
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
    stream << formatter_->format(msg) << std::endl;
  }

  void flush() override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
    stream.flush();
  }

  SinkType type() const override { return SinkType::Stdio; }

 private:
  Target target_;
  std::mutex mutex_;
};

// Appends formatted records to a file
class FileSink : public LogSink {
 public:
  explicit FileSink(const std::string& filename);
  ~FileSink() override;

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::File; }

  bool isOpen() const;
  const std::string& filename() const { return filename_; }

 private:
  std::string filename_;
  std::ofstream file_;
  mutable std::mutex mutex_;
};

class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}
  void flush() override {}
  SinkType type() const override { return SinkType::Null; }
};

// Hands formatted records to an application callback
class ExternalSink : public LogSink {
 public:
  using LogCallback =
      std::function<void(LogLevel, const std::string&, const std::string&)>;

  explicit ExternalSink(LogCallback callback) : callback_(std::move(callback)) {}

  void log(const LogMessage& msg) override {
    if (callback_) {
      callback_(msg.level, msg.logger_name, formatter_->format(msg));
    }
  }

  void flush() override {}
  SinkType type() const override { return SinkType::External; }

 private:
  LogCallback callback_;
};

class SinkFactory {
 public:
  static std::unique_ptr<LogSink> createFileSink(const std::string& filename) {
    return std::make_unique<FileSink>(filename);
  }

  static std::unique_ptr<LogSink> createStdioSink(bool use_stderr = true) {
    return std::make_unique<StdioSink>(use_stderr ? StdioSink::Stderr
                                                  : StdioSink::Stdout);
  }

  static std::unique_ptr<LogSink> createNullSink() {
    return std::make_unique<NullSink>();
  }

  static std::unique_ptr<LogSink> createExternalSink(
      ExternalSink::LogCallback callback) {
    return std::make_unique<ExternalSink>(std::move(callback));
  }
};

}  // namespace logging
}  // namespace pensync
