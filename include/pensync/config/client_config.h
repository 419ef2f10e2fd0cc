/**
 * @file client_config.h
 * @brief JSON configuration for the pen tablet services
 *
 * Example:
 * {
 *   "logging":   { "level": "info", "file": "" },
 *   "ftp":       { "devices": ["btgoep://0017EC558162:2"],
 *                  "store_directory": "/tmp/sync", "debug": false },
 *   "streaming": { "devices": ["btspp://0017EC558162:1"],
 *                  "listen_address": "btspp://localhost:1",
 *                  "client_platform": 8, "debug": false }
 * }
 *
 * Every section and field is optional and takes the service defaults.
 */

#ifndef PENSYNC_CONFIG_CLIENT_CONFIG_H
#define PENSYNC_CONFIG_CLIENT_CONFIG_H

#include <stdexcept>
#include <string>

#include "pensync/logging/log_level.h"
#include "pensync/service/ftp_service.h"
#include "pensync/service/streaming_service.h"

namespace pensync {
namespace config {

/**
 * @brief Configuration parse error with the offending field and file
 */
class ConfigParseError : public std::runtime_error {
 public:
  ConfigParseError(const std::string& message,
                   const std::string& field = "",
                   const std::string& file = "")
      : std::runtime_error(formatError(message, field, file)),
        message_(message),
        field_(field),
        file_(file) {}

  const std::string& message() const { return message_; }
  const std::string& field() const { return field_; }
  const std::string& file() const { return file_; }

 private:
  static std::string formatError(const std::string& msg,
                                 const std::string& field,
                                 const std::string& file);

  std::string message_;
  std::string field_;
  std::string file_;
};

struct LoggingConfig {
  logging::LogLevel level{logging::LogLevel::Info};
  // Append log lines to this file instead of stderr when non-empty
  std::string file;
};

struct ClientConfig {
  LoggingConfig logging;
  service::FtpServiceConfig ftp;
  service::StreamingServiceConfig streaming;
};

/**
 * @brief Parse a JSON document
 * @param source_name Reported as the file of a ConfigParseError
 * @throws ConfigParseError on malformed JSON or invalid field values
 */
ClientConfig parseClientConfig(const std::string& text,
                               const std::string& source_name = "");

/**
 * @brief Read and parse a JSON file
 * @throws ConfigParseError if the file cannot be read or parsed
 */
ClientConfig loadClientConfig(const std::string& path);

/**
 * @brief Set the global log level and, if configured, the log file
 * @throws ConfigParseError if the log file cannot be opened
 */
void applyLoggingConfig(const LoggingConfig& config);

}  // namespace config
}  // namespace pensync

#endif  // PENSYNC_CONFIG_CLIENT_CONFIG_H
