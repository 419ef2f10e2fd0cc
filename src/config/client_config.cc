#include "pensync/config/client_config.h"

#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

#include "pensync/logging/log_sink.h"

#undef PENSYNC_LOG_COMPONENT
#define PENSYNC_LOG_COMPONENT "config"
#include "pensync/logging/log_macros.h"

namespace pensync {
namespace config {

namespace {

using json = nlohmann::json;

/**
 * Tracks the dotted path of the field being parsed, so errors name it.
 */
class ParseContext {
 public:
  explicit ParseContext(std::string file) : file_(std::move(file)) {}

  class FieldScope {
   public:
    FieldScope(ParseContext& ctx, const std::string& field) : ctx_(ctx) {
      ctx_.path_.push_back(field);
    }
    ~FieldScope() { ctx_.path_.pop_back(); }

   private:
    ParseContext& ctx_;
  };

  std::string currentPath() const {
    std::ostringstream oss;
    for (size_t i = 0; i < path_.size(); ++i) {
      if (i > 0) {
        oss << ".";
      }
      oss << path_[i];
    }
    return oss.str();
  }

  ConfigParseError createError(const std::string& message) const {
    return ConfigParseError(message, currentPath(), file_);
  }

 private:
  std::string file_;
  std::vector<std::string> path_;
};

const char* typeName(const json& j) { return j.type_name(); }

// Optional object section; absent or null yields nullptr
const json* getSection(const json& parent,
                       const std::string& field,
                       ParseContext& ctx) {
  auto it = parent.find(field);
  if (it == parent.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    ParseContext::FieldScope scope(ctx, field);
    throw ctx.createError(std::string("expected object, got ") +
                          typeName(*it));
  }
  return &*it;
}

bool getOptionalString(const json& parent,
                       const std::string& field,
                       std::string& value,
                       ParseContext& ctx) {
  auto it = parent.find(field);
  if (it == parent.end() || it->is_null()) {
    return false;
  }
  ParseContext::FieldScope scope(ctx, field);
  if (!it->is_string()) {
    throw ctx.createError(std::string("expected string, got ") +
                          typeName(*it));
  }
  value = it->get<std::string>();
  return true;
}

bool getOptionalBool(const json& parent,
                     const std::string& field,
                     bool& value,
                     ParseContext& ctx) {
  auto it = parent.find(field);
  if (it == parent.end() || it->is_null()) {
    return false;
  }
  ParseContext::FieldScope scope(ctx, field);
  if (!it->is_boolean()) {
    throw ctx.createError(std::string("expected boolean, got ") +
                          typeName(*it));
  }
  value = it->get<bool>();
  return true;
}

bool getOptionalStringList(const json& parent,
                           const std::string& field,
                           std::vector<std::string>& value,
                           ParseContext& ctx) {
  auto it = parent.find(field);
  if (it == parent.end() || it->is_null()) {
    return false;
  }
  ParseContext::FieldScope scope(ctx, field);
  if (!it->is_array()) {
    throw ctx.createError(std::string("expected array, got ") +
                          typeName(*it));
  }

  std::vector<std::string> result;
  for (size_t i = 0; i < it->size(); ++i) {
    const json& entry = (*it)[i];
    if (!entry.is_string()) {
      ParseContext::FieldScope index_scope(ctx, "[" + std::to_string(i) + "]");
      throw ctx.createError(std::string("expected string, got ") +
                            typeName(entry));
    }
    result.push_back(entry.get<std::string>());
  }
  value = std::move(result);
  return true;
}

LoggingConfig parseLogging(const json& j, ParseContext& ctx) {
  LoggingConfig config;

  std::string level;
  if (getOptionalString(j, "level", level, ctx)) {
    ParseContext::FieldScope scope(ctx, "level");
    if (!logging::parseLogLevel(level, config.level)) {
      throw ctx.createError("unknown log level '" + level + "'");
    }
  }
  getOptionalString(j, "file", config.file, ctx);
  return config;
}

service::FtpServiceConfig parseFtp(const json& j, ParseContext& ctx) {
  service::FtpServiceConfig config;
  getOptionalStringList(j, "devices", config.devices, ctx);
  getOptionalString(j, "store_directory", config.store_directory, ctx);
  getOptionalBool(j, "debug", config.debug, ctx);

  if (config.store_directory.empty()) {
    ParseContext::FieldScope scope(ctx, "store_directory");
    throw ctx.createError("must not be empty");
  }
  return config;
}

service::StreamingServiceConfig parseStreaming(const json& j,
                                               ParseContext& ctx) {
  service::StreamingServiceConfig config;
  getOptionalStringList(j, "devices", config.devices, ctx);
  getOptionalString(j, "listen_address", config.listen_address, ctx);
  getOptionalBool(j, "debug", config.debug, ctx);

  auto it = j.find("client_platform");
  if (it != j.end() && !it->is_null()) {
    ParseContext::FieldScope scope(ctx, "client_platform");
    if (!it->is_number_integer()) {
      throw ctx.createError(std::string("expected integer, got ") +
                            typeName(*it));
    }
    int64_t platform = it->get<int64_t>();
    if (platform < 0 || platform > 255) {
      throw ctx.createError("out of range 0..255: " +
                            std::to_string(platform));
    }
    config.client_platform = static_cast<uint8_t>(platform);
  }
  return config;
}

}  // namespace

std::string ConfigParseError::formatError(const std::string& msg,
                                          const std::string& field,
                                          const std::string& file) {
  std::ostringstream oss;
  oss << "Configuration parse error";
  if (!file.empty()) {
    oss << " in " << file;
  }
  if (!field.empty()) {
    oss << " at field '" << field << "'";
  }
  oss << ": " << msg;
  return oss.str();
}

ClientConfig parseClientConfig(const std::string& text,
                               const std::string& source_name) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigParseError(std::string("JSON syntax error: ") + e.what(), "",
                           source_name);
  }

  ParseContext ctx(source_name);
  if (!root.is_object()) {
    throw ctx.createError(std::string("expected object at top level, got ") +
                          typeName(root));
  }

  ClientConfig config;
  if (const json* section = getSection(root, "logging", ctx)) {
    ParseContext::FieldScope scope(ctx, "logging");
    config.logging = parseLogging(*section, ctx);
  }
  if (const json* section = getSection(root, "ftp", ctx)) {
    ParseContext::FieldScope scope(ctx, "ftp");
    config.ftp = parseFtp(*section, ctx);
  }
  if (const json* section = getSection(root, "streaming", ctx)) {
    ParseContext::FieldScope scope(ctx, "streaming");
    config.streaming = parseStreaming(*section, ctx);
  }
  return config;
}

ClientConfig loadClientConfig(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigParseError("failed to open file", "", path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw ConfigParseError("failed to read file", "", path);
  }

  LOG_DEBUG("loaded configuration from {}", path);
  return parseClientConfig(content, path);
}

void applyLoggingConfig(const LoggingConfig& config) {
  auto& registry = logging::LoggerRegistry::instance();

  if (!config.file.empty()) {
    auto sink = std::make_shared<logging::FileSink>(config.file);
    if (!sink->isOpen()) {
      throw ConfigParseError("cannot open log file " + config.file,
                             "logging.file");
    }
    registry.setDefaultSink(sink);
  }
  registry.setGlobalLevel(config.level);
}

}  // namespace config
}  // namespace pensync
