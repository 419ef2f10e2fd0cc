#include "pensync/service/device_discovery.h"

#undef PENSYNC_LOG_COMPONENT
#define PENSYNC_LOG_COMPONENT "service"
#include "pensync/logging/log_macros.h"

namespace pensync {
namespace service {

namespace {

std::string secondLine(const std::string& text) {
  auto first_break = text.find('\n');
  if (first_break == std::string::npos) {
    return std::string();
  }
  auto start = first_break + 1;
  auto end = text.find('\n', start);
  std::string line = text.substr(
      start, end == std::string::npos ? std::string::npos : end - start);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

}  // namespace

std::vector<std::string> selectSyncAddresses(
    const std::map<std::string, PeerRecord>& peers) {
  std::vector<std::string> addresses;
  for (const auto& entry : peers) {
    const PeerRecord& record = entry.second;
    if (record.device_kind != kSyncDeviceKind) {
      continue;
    }
    std::string address = secondLine(record.address_info);
    if (address.empty()) {
      LOG_WARNING("peer {} has no service address line", entry.first);
      continue;
    }
    LOG_DEBUG("found pen tablet {} at {}", entry.first, address);
    addresses.push_back(address);
  }
  return addresses;
}

}  // namespace service
}  // namespace pensync
