#ifndef PENSYNC_SERVICE_DEVICE_DISCOVERY_H
#define PENSYNC_SERVICE_DEVICE_DISCOVERY_H

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pensync {
namespace service {

// Device kind advertised by the pen tablet
constexpr char kSyncDeviceKind[] = "Sync";

/**
 * Service class to look for during discovery
 */
enum class ServiceClass {
  FileTransfer,  // OBEX File Transfer profile
  SerialPort     // Serial Port profile, used for streaming
};

/**
 * What discovery knows about one peer. `address_info` is multi-line text
 * whose second line is the connectable service URL.
 */
struct PeerRecord {
  std::string device_kind;
  std::string address_info;
};

/**
 * Resolves paired peers offering a service.
 */
class DeviceDiscovery {
 public:
  virtual ~DeviceDiscovery() = default;

  /**
   * Blocking lookup, keyed by peer id.
   */
  virtual std::map<std::string, PeerRecord> findPeers(
      ServiceClass service) = 0;
};

using DeviceDiscoverySharedPtr = std::shared_ptr<DeviceDiscovery>;

/**
 * Service URLs of the peers whose kind is kSyncDeviceKind, in peer id
 * order. Records without a second address line are skipped.
 */
std::vector<std::string> selectSyncAddresses(
    const std::map<std::string, PeerRecord>& peers);

}  // namespace service
}  // namespace pensync

#endif  // PENSYNC_SERVICE_DEVICE_DISCOVERY_H
