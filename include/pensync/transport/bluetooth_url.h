#ifndef PENSYNC_TRANSPORT_BLUETOOTH_URL_H
#define PENSYNC_TRANSPORT_BLUETOOTH_URL_H

#include <cstdint>
#include <map>
#include <string>

#include "pensync/core/compat.h"

namespace pensync {
namespace transport {

/**
 * A parsed Bluetooth service URL such as
 * `btgoep://0017EC558162:2;authenticate=false;encrypt=false;master=false`.
 */
struct BluetoothUrl {
  std::string scheme;   // "btspp" or "btgoep"
  std::string address;  // 12 hex digits, upper case, or "localhost"
  uint8_t channel{0};   // RFCOMM channel, 1..30
  std::map<std::string, std::string> options;

  bool isLocal() const { return address == "localhost"; }

  /**
   * Device address in colon form ("00:17:EC:55:81:62"). Empty for localhost.
   */
  std::string deviceAddress() const;

  /**
   * Value of a boolean option, `fallback` if absent or not true/false.
   */
  bool flag(const std::string& name, bool fallback) const;
};

/**
 * Parse `scheme://address:channel[;key=value...]`.
 * @return nullopt if the scheme is unknown, the address is not 12 hex
 *         digits or "localhost", or the channel is missing or out of range.
 */
optional<BluetoothUrl> parseBluetoothUrl(const std::string& url);

}  // namespace transport
}  // namespace pensync

#endif  // PENSYNC_TRANSPORT_BLUETOOTH_URL_H
