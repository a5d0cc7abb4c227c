//
//  DeviceFinder.cpp
//  usbmuxrelay
//

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include "DeviceFinder.hpp"
#include "Listener.hpp"
#include "MUXException.hpp"
#include <libgeneral/macros.h>

namespace {

class FinderDelegate : public ListenerDelegate{
    DeviceRegistry &_registry;
    const std::string &_udid;
public:
    std::mutex lck;
    std::condition_variable cv;
    bool found;
    uint32_t deviceID;
    std::exception_ptr failure;

    FinderDelegate(DeviceRegistry &registry, const std::string &udid)
    : _registry(registry), _udid(udid), found(false), deviceID(0), failure(nullptr)
    {}

    virtual void listener_attached(const std::string &udid) override{
        if (_udid.size() && _udid != udid) return;
        std::unique_lock<std::mutex> ul(lck);
        if (found) return;
        try {
            deviceID = _registry.device(udid).deviceID;
        } catch (tihmstar::exception &e) {
            debug("[find_device] %s vanished before it could be picked",udid.c_str());
            return;
        }
        found = true;
        cv.notify_all();
    }

    virtual void listener_detached(const std::string &udid) override{
        //
    }

    virtual void listener_error(const tihmstar::exception &e) override{
        debug("[find_device] listener error=%s",e.what());
        std::unique_lock<std::mutex> ul(lck);
        if (!failure) failure = std::current_exception();
        cv.notify_all();
    }
};

};

uint32_t find_device(DeviceRegistry &registry, const MuxAddress &address, const RelayOptions &opts){
    FinderDelegate delegate(registry, opts.udid);
    uint32_t timeout = opts.timeout ? opts.timeout : DEFAULT_DISCOVERY_TIMEOUT_MS;
    bool found = false;
    std::exception_ptr failure = nullptr;

    debug("[find_device] looking for %s (timeout=%ums)",opts.udid.size() ? opts.udid.c_str() : "any device",timeout);
    {
        Listener listener(registry, address, &delegate);
        listener.start();
        {
            std::unique_lock<std::mutex> ul(delegate.lck);
            delegate.cv.wait_for(ul, std::chrono::milliseconds(timeout), [&]{return delegate.found || delegate.failure;});
            found = delegate.found;
            failure = delegate.failure;
        }
        listener.stop();
    }

    if (!found) {
        if (failure) std::rethrow_exception(failure);
        if (opts.udid.size()) {
            retcustomerror(MUXException_no_device, "Requested device not connected");
        }
        retcustomerror(MUXException_no_device, "No devices connected");
    }
    debug("[find_device] found device with id %u",delegate.deviceID);
    return delegate.deviceID;
}
