#ifndef PENSYNC_TRANSPORT_RFCOMM_ENDPOINT_H
#define PENSYNC_TRANSPORT_RFCOMM_ENDPOINT_H

#include "pensync/transport/connection.h"

#ifdef PENSYNC_HAS_BLUEZ

namespace pensync {
namespace transport {

/**
 * TransportEndpoint over BlueZ RFCOMM stream sockets.
 *
 * Addresses are Bluetooth URLs (see parseBluetoothUrl). `authenticate` and
 * `encrypt` options map onto the RFCOMM link mode; `master=true` requests
 * the master role.
 */
class RfcommEndpoint : public TransportEndpoint {
 public:
  IoResult<ConnectionPtr> dial(const std::string& address) override;
  IoResult<AcceptorPtr> listen(const std::string& address) override;
};

}  // namespace transport
}  // namespace pensync

#endif  // PENSYNC_HAS_BLUEZ

#endif  // PENSYNC_TRANSPORT_RFCOMM_ENDPOINT_H
