#include "pensync/transport/bluetooth_url.h"

#include <cctype>
#include <cstdlib>

namespace pensync {
namespace transport {

namespace {

constexpr int kMinChannel = 1;
constexpr int kMaxChannel = 30;

std::string toLower(std::string s) {
  for (auto& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

bool isHexAddress(const std::string& s) {
  if (s.size() != 12) {
    return false;
  }
  for (char c : s) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string BluetoothUrl::deviceAddress() const {
  if (isLocal()) {
    return std::string();
  }
  std::string out;
  out.reserve(17);
  for (size_t i = 0; i < address.size(); i += 2) {
    if (i > 0) {
      out += ':';
    }
    out += address.substr(i, 2);
  }
  return out;
}

bool BluetoothUrl::flag(const std::string& name, bool fallback) const {
  auto it = options.find(name);
  if (it == options.end()) {
    return fallback;
  }
  std::string value = toLower(it->second);
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  return fallback;
}

optional<BluetoothUrl> parseBluetoothUrl(const std::string& url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return nullopt;
  }

  BluetoothUrl result;
  result.scheme = toLower(url.substr(0, scheme_end));
  if (result.scheme != "btspp" && result.scheme != "btgoep") {
    return nullopt;
  }

  std::string rest = url.substr(scheme_end + 3);
  std::string target = rest;
  std::string params;
  auto semi = rest.find(';');
  if (semi != std::string::npos) {
    target = rest.substr(0, semi);
    params = rest.substr(semi + 1);
  }

  auto colon = target.rfind(':');
  if (colon == std::string::npos || colon + 1 >= target.size()) {
    return nullopt;
  }

  std::string host = target.substr(0, colon);
  std::string channel = target.substr(colon + 1);

  if (toLower(host) == "localhost") {
    result.address = "localhost";
  } else if (isHexAddress(host)) {
    for (auto& c : host) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    result.address = host;
  } else {
    return nullopt;
  }

  for (char c : channel) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return nullopt;
    }
  }
  if (channel.size() > 2) {
    return nullopt;
  }
  int channel_value = std::atoi(channel.c_str());
  if (channel_value < kMinChannel || channel_value > kMaxChannel) {
    return nullopt;
  }
  result.channel = static_cast<uint8_t>(channel_value);

  size_t pos = 0;
  while (pos < params.size()) {
    auto next = params.find(';', pos);
    std::string item = params.substr(
        pos, next == std::string::npos ? std::string::npos : next - pos);
    auto eq = item.find('=');
    if (eq != std::string::npos && eq > 0) {
      result.options[toLower(item.substr(0, eq))] = item.substr(eq + 1);
    } else if (!item.empty()) {
      result.options[toLower(item)] = std::string();
    }
    if (next == std::string::npos) {
      break;
    }
    pos = next + 1;
  }

  return result;
}

}  // namespace transport
}  // namespace pensync
