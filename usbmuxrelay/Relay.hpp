//
//  Relay.hpp
//  usbmuxrelay
//

#ifndef Relay_hpp
#define Relay_hpp

#include "DeviceFinder.hpp"
#include "DeviceRegistry.hpp"
#include "Listener.hpp"
#include "MuxAddress.hpp"
#include <libgeneral/Manager.hpp>
#include <libgeneral/Event.hpp>
#include <libgeneral/DeliveryEvent.hpp>
#include <libgeneral/exception.hpp>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>

class RelayConnection;

/*
 Relay events. Callbacks come from the listener, acceptor, watchdog and connection threads.
 None of them may stop or delete the Relay.
 */
class RelayDelegate{
public:
    virtual ~RelayDelegate();

    virtual void relay_ready(const std::string &udid);
    virtual void relay_warning(const tihmstar::exception &e);
    virtual void relay_attached(const std::string &udid);
    virtual void relay_detached(const std::string &udid);
    virtual void relay_error(const tihmstar::exception &e);
    virtual void relay_connect();
    virtual void relay_disconnect();
    virtual void relay_close();
};

/*
 Forwards every connection accepted on relayPort to devicePort on the device.
 stop() closes the listener and the acceptor, already established tunnels keep running
 until either side closes them. Destroying the Relay tears them down.
 */
class Relay : public tihmstar::Manager, public ListenerDelegate{
    DeviceRegistry &_registry;
    MuxAddress _address;
    RelayDelegate *_delegate; //not owned
    uint16_t _devicePort;
    uint16_t _relayPort;
    std::string _udid;
    uint32_t _timeout;
    Listener *_listener;
    int _listenfd;
    int _wakePipe[2];
    std::atomic_bool _isReady;
    std::atomic_bool _isStopping;

    std::thread _watchdogThread;
    std::mutex _watchdogLck;
    std::condition_variable _watchdogCV;
    bool _watchdogCleared;

    std::set<RelayConnection *> _children;
    std::mutex _childrenLck;
    tihmstar::Event _childrenEvent;
    std::thread _connReaperThread;
    tihmstar::DeliveryEvent<RelayConnection *> _reapConnections;

#pragma mark inheritance function
    virtual bool loopEvent() override;
    virtual void afterLoop() noexcept override;
    virtual void stopAction() noexcept override;

#pragma mark ListenerDelegate
    virtual void listener_attached(const std::string &udid) override;
    virtual void listener_detached(const std::string &udid) override;
    virtual void listener_error(const tihmstar::exception &e) override;

#pragma mark private member function
    void watchdog_runloop() noexcept;
    void clear_watchdog() noexcept;
    void check_discovery() const;
    void reaper_runloop() noexcept;

    int accept_connection();
    void handle_connection(int cfd);
    DeviceDescriptor select_device() const;

    void notify_connect() noexcept;
    void notify_disconnect() noexcept;
    void notify_error(const tihmstar::exception &e) noexcept;

public:
    Relay(DeviceRegistry &registry, const MuxAddress &address, uint16_t devicePort, uint16_t relayPort, const RelayOptions &opts = {}, RelayDelegate *delegate = NULL);
    Relay(const Relay &) = delete;
    virtual ~Relay() override;

    /*
     must not be called from a delegate callback
     */
    void stop() noexcept;

    uint16_t devicePort() const noexcept {return _devicePort;}
    /*
     the bound local port, useful when relayPort was 0
     */
    uint16_t relayPort() const noexcept {return _relayPort;}
    bool isReady() const noexcept {return _isReady;}

    friend RelayConnection;
};

#endif /* Relay_hpp */
