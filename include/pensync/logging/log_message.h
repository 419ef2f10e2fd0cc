#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>

#include "pensync/logging/log_level.h"

namespace pensync {
namespace logging {

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  // Component information
  Component component{Component::Root};
  std::string logger_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  std::thread::id thread_id;

  // Peer address or service name the record refers to, if any
  std::string device;

  std::map<std::string, std::string> key_values;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        thread_id(std::this_thread::get_id()) {}
};

}  // namespace logging
}  // namespace pensync
