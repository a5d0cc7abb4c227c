//
//  DeviceRegistry.cpp
//  usbmuxrelay
//

#include "DeviceRegistry.hpp"
#include "MUXException.hpp"
#include <libgeneral/macros.h>

DeviceRegistry::DeviceRegistry(){
    //
}

DeviceRegistry::~DeviceRegistry(){
    guardWrite(_devicesGuard);
    _devices.clear();
}

#pragma mark writer
void DeviceRegistry::insert(const DeviceDescriptor &dev) noexcept{
    debug("[DeviceRegistry] insert %s id=%u",dev.serialNumber.c_str(),dev.deviceID);
    guardWrite(_devicesGuard);
    for (auto &d : _devices) {
        if (d.serialNumber == dev.serialNumber) {
            //known UDID, update properties but keep its position
            d = dev;
            return;
        }
    }
    _devices.push_back(dev);
}

bool DeviceRegistry::remove(const std::string &udid) noexcept{
    debug("[DeviceRegistry] remove %s",udid.c_str());
    guardWrite(_devicesGuard);
    for (auto it = _devices.begin(); it != _devices.end(); ++it) {
        if (it->serialNumber == udid) {
            _devices.erase(it);
            return true;
        }
    }
    return false;
}

void DeviceRegistry::clear() noexcept{
    guardWrite(_devicesGuard);
    _devices.clear();
}

#pragma mark reader
bool DeviceRegistry::contains(const std::string &udid) const noexcept{
    guardRead(_devicesGuard);
    for (auto &d : _devices) {
        if (d.serialNumber == udid) return true;
    }
    return false;
}

DeviceDescriptor DeviceRegistry::device(const std::string &udid) const{
    guardRead(_devicesGuard);
    for (auto &d : _devices) {
        if (d.serialNumber == udid) return d;
    }
    retcustomerror(MUXException_no_device, "Requested device not connected");
}

DeviceDescriptor DeviceRegistry::firstDevice() const{
    guardRead(_devicesGuard);
    if (!_devices.size()) {
        retcustomerror(MUXException_no_device, "No devices connected");
    }
    return _devices.front();
}

std::string DeviceRegistry::udidForDeviceID(uint32_t deviceID) const noexcept{
    guardRead(_devicesGuard);
    for (auto &d : _devices) {
        if (d.deviceID == deviceID) return d.serialNumber;
    }
    return {};
}

std::vector<std::string> DeviceRegistry::udids() const noexcept{
    std::vector<std::string> ret;
    guardRead(_devicesGuard);
    for (auto &d : _devices) {
        ret.push_back(d.serialNumber);
    }
    return ret;
}

size_t DeviceRegistry::size() const noexcept{
    guardRead(_devicesGuard);
    return _devices.size();
}

bool DeviceRegistry::empty() const noexcept{
    return size() == 0;
}
