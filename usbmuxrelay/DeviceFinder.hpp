//
//  DeviceFinder.hpp
//  usbmuxrelay
//

#ifndef DeviceFinder_hpp
#define DeviceFinder_hpp

#include "DeviceRegistry.hpp"
#include "MuxAddress.hpp"
#include <stdint.h>
#include <string>

#define DEFAULT_DISCOVERY_TIMEOUT_MS 1000

struct RelayOptions{
    uint32_t timeout = DEFAULT_DISCOVERY_TIMEOUT_MS; //milliseconds
    std::string udid;                                //empty: any device
};

/*
 Waits up to opts.timeout for a matching device to attach and returns its current DeviceID.
 Throws MUXException_no_device on timeout, failures of the Listen connection are rethrown as they are.
 */
uint32_t find_device(DeviceRegistry &registry, const MuxAddress &address, const RelayOptions &opts = {});

#endif /* DeviceFinder_hpp */
