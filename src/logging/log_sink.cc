#include "pensync/logging/log_sink.h"

namespace pensync {
namespace logging {

FileSink::FileSink(const std::string& filename)
    : filename_(filename), file_(filename, std::ios::app) {}

FileSink::~FileSink() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

void FileSink::log(const LogMessage& msg) {
  std::string formatted = formatter_->format(msg);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    return;
  }
  file_ << formatted;
  if (formatted.empty() || formatted.back() != '\n') {
    file_ << '\n';
  }
}

void FileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

bool FileSink::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

}  // namespace logging
}  // namespace pensync
