//
//  DeviceRegistry.hpp
//  usbmuxrelay
//

#ifndef DeviceRegistry_hpp
#define DeviceRegistry_hpp

#include "Protocol.hpp"
#include <libgeneral/GuardAccess.hpp>
#include <string>
#include <vector>

/*
 UDID -> device properties of currently attached devices.
 Entries are kept in attachment order, the front is the device that has been attached the longest.
 Only a Listener writes to a registry, every other component just reads.
 */
class DeviceRegistry{
    std::vector<DeviceDescriptor> _devices;
    mutable tihmstar::GuardAccess _devicesGuard;
public:
    DeviceRegistry();
    DeviceRegistry(const DeviceRegistry &) = delete;
    ~DeviceRegistry();

#pragma mark writer
    void insert(const DeviceDescriptor &dev) noexcept;
    bool remove(const std::string &udid) noexcept;
    void clear() noexcept;

#pragma mark reader
    bool contains(const std::string &udid) const noexcept;
    DeviceDescriptor device(const std::string &udid) const;
    DeviceDescriptor firstDevice() const;
    std::string udidForDeviceID(uint32_t deviceID) const noexcept;
    std::vector<std::string> udids() const noexcept;
    size_t size() const noexcept;
    bool empty() const noexcept;
};

#endif /* DeviceRegistry_hpp */
