//
//  Listener.hpp
//  usbmuxrelay
//

#ifndef Listener_hpp
#define Listener_hpp

#include "DeviceRegistry.hpp"
#include "MuxAddress.hpp"
#include "Protocol.hpp"
#include <libgeneral/Manager.hpp>
#include <libgeneral/exception.hpp>
#include <atomic>
#include <string>

class ListenerDelegate{
public:
    virtual ~ListenerDelegate();

    /*
     called on the listener thread, after the registry was updated
     */
    virtual void listener_attached(const std::string &udid) = 0;
    /*
     called on the listener thread, before the device is removed from the registry
     */
    virtual void listener_detached(const std::string &udid) = 0;
    /*
     called on the listener thread while e is being handled, std::current_exception() refers to it
     */
    virtual void listener_error(const tihmstar::exception &e) = 0;
    virtual void listener_closed() noexcept;
};

/*
 Long lived "Listen" connection to usbmuxd.
 Keeps the registry in sync with attach/detach notifications. Does not reconnect.
 */
class Listener : public tihmstar::Manager{
public:
    static constexpr int bufsize = 0x4000;
    enum state{
        LISTENER_CONNECTING,
        LISTENER_AWAITING_ACK,
        LISTENER_LISTENING,
        LISTENER_CLOSED,
        LISTENER_ERRORED
    };
private:
    DeviceRegistry &_registry;
    MuxAddress _address;
    ListenerDelegate *_delegate; //not owned
    std::atomic<int> _fd;
    std::atomic<state> _state;
    std::atomic_bool _stopRequested;
    MessageParser _parser;
    char *_recvbuffer;

#pragma mark inheritance function
    virtual void beforeLoop() override;
    virtual bool loopEvent() override;
    virtual void afterLoop() noexcept override;
    virtual void stopAction() noexcept override;

#pragma mark private member function
    void handleMessage(const MuxMessage &msg);

public:
    Listener(DeviceRegistry &registry, const MuxAddress &address, ListenerDelegate *delegate);
    Listener(const Listener &) = delete;
    virtual ~Listener() override;

    void start();
    /*
     must not be called from a delegate callback
     */
    void stop() noexcept;

    state getState() const noexcept {return _state;}
};

#endif /* Listener_hpp */
