//
//  RelayConnection.hpp
//  usbmuxrelay
//

#ifndef RelayConnection_hpp
#define RelayConnection_hpp

#include <libgeneral/Manager.hpp>
#include <stdint.h>
#include <atomic>
#include <poll.h>

class Relay;

/*
 One accepted local connection: opens the tunnel, then copies bytes both ways until the local side is done.
 Deletes itself through the parent's reaper once the loop ended.
 */
class RelayConnection : public tihmstar::Manager{
    static constexpr size_t bufsize = 0x4000;
    Relay *_parent; //not owned
    uint32_t _deviceID;
    uint16_t _dPort;
    std::atomic<int> _cfd; //local socket lifetime managed by this class
    std::atomic<int> _tfd; //tunnel socket also managed
    std::atomic_bool _killInProcess;
    std::atomic_bool _isDestructing;
    struct pollfd _pfds[2];
    char *_buf;

#pragma mark inheritance function
    virtual void beforeLoop() override;
    virtual bool loopEvent() override;
    virtual void afterLoop() noexcept override;
    virtual void stopAction() noexcept override;

#pragma mark private member function
    void closeSockets() noexcept;

public:
    RelayConnection(Relay *parent, int cfd, uint32_t deviceID, uint16_t dPort);
    RelayConnection(const RelayConnection &) = delete;
    virtual ~RelayConnection() override;

    /*
     tear the connection down without waiting for it
     */
    void kill() noexcept;
};

#endif /* RelayConnection_hpp */
