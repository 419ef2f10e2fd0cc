#pragma once

#include <string>

#include "pensync/logging/log_message.h"

namespace pensync {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// [timestamp] [LEVEL] [T:thread] [logger] [file:line fn()] message {k=v}
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// Bare message text, used by the CLI for user-facing output
class MessageOnlyFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override {
    return msg.message;
  }
};

}  // namespace logging
}  // namespace pensync
