//
//  Tunnel.hpp
//  usbmuxrelay
//

#ifndef Tunnel_hpp
#define Tunnel_hpp

#include "DeviceFinder.hpp"
#include "DeviceRegistry.hpp"
#include "MuxAddress.hpp"
#include <stdint.h>

/*
 Asks usbmuxd for a connection to port on the device with deviceID.
 On success the returned socket is a raw byte stream to the device port, owned by the caller.
 Throws MUXException_result when usbmuxd refuses. There is no timeout.
 */
int tunnel_connect(const MuxAddress &address, uint32_t deviceID, uint16_t port);

/*
 The Connect exchange on an already connected daemon socket. Leaves fd open either way.
 */
void tunnel_handshake(int fd, uint32_t deviceID, uint16_t port);

/*
 tunnel_connect to the pinned (or earliest attached) device, running find_device first
 if the registry does not know a matching device yet.
 */
int tunnel_get(DeviceRegistry &registry, const MuxAddress &address, uint16_t devicePort, const RelayOptions &opts = {});

#endif /* Tunnel_hpp */
