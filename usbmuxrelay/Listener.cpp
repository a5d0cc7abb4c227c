//
//  Listener.cpp
//  usbmuxrelay
//

#include <sys/socket.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include "Listener.hpp"
#include "MUXException.hpp"
#include <libgeneral/macros.h>

#pragma mark ListenerDelegate
ListenerDelegate::~ListenerDelegate(){
    //
}

void ListenerDelegate::listener_closed() noexcept{
    //
}

#pragma mark Listener
Listener::Listener(DeviceRegistry &registry, const MuxAddress &address, ListenerDelegate *delegate)
: _registry(registry), _address(address), _delegate(delegate)
, _fd(-1), _state(LISTENER_CONNECTING), _stopRequested(false)
, _parser([this](const MuxMessage &msg){handleMessage(msg);})
, _recvbuffer(NULL)
{
    assure(_recvbuffer = (char*)malloc(Listener::bufsize));
}

Listener::~Listener(){
    debug("[Listener] destroying Listener %d",(int)_fd);
    _stopRequested = true;
    stopLoop();
    {
        int fd = _fd.exchange(-1);
        safeClose(fd);
    }
    safeFree(_recvbuffer);
}

#pragma mark inheritance function
void Listener::beforeLoop(){
    int fd = -1;
    try {
        retassure(!_stopRequested, "Listener stopped before connecting");
        fd = _address.connect();
        if (_stopRequested) {
            close(fd);
            reterror("Listener stopped while connecting");
        }
        _fd = fd;
        _state = LISTENER_AWAITING_ACK;
        debug("[Listener] connected to %s on fd %d, sending Listen request",_address.description().c_str(),fd);
        {
            const std::vector<uint8_t> &req = Protocol::listenFrame();
            sock_send_all(fd, req.data(), req.size());
        }
    } catch (tihmstar::exception &e) {
        if (!_stopRequested) {
            error("[Listener] failed to start listening on %s with error=%s",_address.description().c_str(),e.what());
            _state = LISTENER_ERRORED;
            if (_delegate) _delegate->listener_error(e);
        }
        throw;
    }
}

bool Listener::loopEvent(){
    try {
        ssize_t got = 0;
        retassure(_fd >= 0, "Listener has no connection");
        while ((got = recv(_fd, _recvbuffer, Listener::bufsize, 0)) < 0 && errno == EINTR)
            ;
        if (got == 0) {
            if (_stopRequested) return false;
            retcustomerror(MUXException_disconnected, "usbmuxd closed the listen connection");
        }
        if (got < 0) {
            if (_stopRequested) return false;
            retcustomerror(MUXException, "recv failed on listen connection: %s",strerror(errno));
        }
        _parser.feed(_recvbuffer, got);
    } catch (tihmstar::exception &e) {
        error("[Listener] listen connection failed with error=%s code=%d",e.what(),e.code());
        _state = LISTENER_ERRORED;
        if (_delegate) _delegate->listener_error(e);
        throw;
    }
    return true;
}

void Listener::afterLoop() noexcept{
    {
        int fd = _fd.exchange(-1);
        safeClose(fd);
    }
    if (_state != LISTENER_ERRORED) _state = LISTENER_CLOSED;
    debug("[Listener] closed");
    if (_delegate) _delegate->listener_closed();
}

void Listener::stopAction() noexcept{
    int fd = _fd;
    _stopRequested = true;
    if (fd >= 0) shutdown(fd, SHUT_RDWR);
}

#pragma mark private member function
void Listener::handleMessage(const MuxMessage &msg){
    switch (msg.type) {
        case MuxMessage::MSG_RESULT:
            if (_state == LISTENER_AWAITING_ACK) {
                if (msg.number != RESULT_OK) {
                    tihmstar::throw_result_error("Listen failed", msg.number);
                }
                debug("[Listener] now LISTENING");
                _state = LISTENER_LISTENING;
            } else {
                debug("[Listener] ignoring unexpected Result %u",msg.number);
            }
            break;

        case MuxMessage::MSG_ATTACHED:
        {
            const std::string &udid = msg.properties.serialNumber;
            info("Device attached %s (id=%u type=%s)",udid.c_str(),msg.properties.deviceID,msg.properties.connectionType.c_str());
            _registry.insert(msg.properties);
            if (_delegate) _delegate->listener_attached(udid);
            break;
        }

        case MuxMessage::MSG_DETACHED:
        {
            std::string udid = _registry.udidForDeviceID(msg.deviceID);
            if (!udid.size()) {
                debug("[Listener] ignoring Detached for unknown device id %u",msg.deviceID);
                break;
            }
            info("Device detached %s (id=%u)",udid.c_str(),msg.deviceID);
            if (_delegate) _delegate->listener_detached(udid);
            _registry.remove(udid);
            break;
        }

        default:
            debug("[Listener] ignoring '%s' message",msg.messageType.c_str());
            break;
    }
}

#pragma mark public member function
void Listener::start(){
    startLoop();
}

void Listener::stop() noexcept{
    debug("[Listener] stopping Listener");
    _stopRequested = true;
    stopLoop();
}
