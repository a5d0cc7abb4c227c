//
//  RelayConnection.cpp
//  usbmuxrelay
//

#include <sys/socket.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include "RelayConnection.hpp"
#include "Relay.hpp"
#include "Tunnel.hpp"
#include <libgeneral/macros.h>

RelayConnection::RelayConnection(Relay *parent, int cfd, uint32_t deviceID, uint16_t dPort)
: _parent(parent), _deviceID(deviceID), _dPort(dPort)
, _cfd(cfd), _tfd(-1), _killInProcess(false), _isDestructing(false), _pfds{}, _buf(NULL)
{
    assure(_buf = (char*)malloc(RelayConnection::bufsize));
}

RelayConnection::~RelayConnection(){
    debug("[RelayConnection] destroying RelayConnection (%p) dPort=%u",this,_dPort);
    _isDestructing = true;
    _killInProcess = true;
    stopLoop();
    {
        std::unique_lock<std::mutex> ul(_parent->_childrenLck);
        _parent->_children.erase(this);
        _parent->_childrenEvent.notifyAll();
        _parent = NULL;
    }
    closeSockets();
    safeFree(_buf);
}

#pragma mark inheritance function
void RelayConnection::beforeLoop(){
    retassure(!_killInProcess, "RelayConnection killed before connecting");
    try {
        _tfd = _parent->_address.connect();
        //from here on kill() wakes the handshake through _tfd
        retassure(!_killInProcess, "RelayConnection killed while connecting");
        tunnel_handshake(_tfd, _deviceID, _dPort);
    } catch (tihmstar::exception &e) {
        error("[RelayConnection] tunnel to device %u port %u failed with error=%s",_deviceID,_dPort,e.what());
        if (!_killInProcess) _parent->notify_error(e);
        throw;
    }

    debug("[RelayConnection] splicing C=%d T=%d",(int)_cfd,(int)_tfd);
    _pfds[0].fd = _cfd;
    _pfds[0].events = POLLIN;
    _pfds[1].fd = _tfd;
    _pfds[1].events = POLLIN;
    _parent->notify_connect();
}

bool RelayConnection::loopEvent(){
    ssize_t cnt = 0;
    if (poll(_pfds,2,-1) == -1) {
        retassure(errno == EINTR, "poll failed with error=%s",strerror(errno));
        return true;
    }

    //local side
    if (_pfds[0].revents) {
        cnt = read(_pfds[0].fd, _buf, RelayConnection::bufsize);
        if (cnt == 0) {
            debug("[RelayConnection] local connection ended C=%d",_pfds[0].fd);
            if (!_killInProcess) _parent->notify_disconnect();
            return false;
        }
        if (cnt < 0) {
            if (errno == EINTR) return true;
            debug("[RelayConnection] local connection error C=%d err=%s",_pfds[0].fd,strerror(errno));
            return false;
        }
        if (_pfds[1].fd < 0) {
            debug("[RelayConnection] discarding %zd bytes for closed tunnel",cnt);
            return true;
        }
        try {
            sock_send_all(_pfds[1].fd, _buf, cnt);
        } catch (tihmstar::exception &e) {
            warning("[RelayConnection] writing to tunnel failed with error=%s",e.what());
            return false;
        }
    }

    //tunnel side
    if (_pfds[1].fd >= 0 && _pfds[1].revents) {
        cnt = read(_pfds[1].fd, _buf, RelayConnection::bufsize);
        if (cnt == 0) {
            //pass the end on to the local peer and keep reading from it until it closes as well
            debug("[RelayConnection] tunnel ended T=%d",_pfds[1].fd);
            shutdown(_pfds[0].fd, SHUT_WR);
            _pfds[1].fd = -1;
            return true;
        }
        if (cnt < 0) {
            if (errno == EINTR) return true;
            warning("[RelayConnection] tunnel error T=%d err=%s",_pfds[1].fd,strerror(errno));
            return false;
        }
        try {
            sock_send_all(_pfds[0].fd, _buf, cnt);
        } catch (tihmstar::exception &e) {
            debug("[RelayConnection] writing to local connection failed with error=%s",e.what());
            return false;
        }
    }
    return true;
}

void RelayConnection::afterLoop() noexcept{
    closeSockets();
    if (!_isDestructing) _parent->_reapConnections.post(this);
}

void RelayConnection::stopAction() noexcept{
    int cfd = _cfd;
    int tfd = _tfd;
    if (cfd >= 0) shutdown(cfd, SHUT_RDWR);
    if (tfd >= 0) shutdown(tfd, SHUT_RDWR);
}

#pragma mark private member function
void RelayConnection::closeSockets() noexcept{
    for (int fd : {_cfd.exchange(-1), _tfd.exchange(-1)}) {
        safeClose(fd);
    }
}

#pragma mark public member function
void RelayConnection::kill() noexcept{
    if (!_killInProcess.exchange(true)) {
        debug("[RelayConnection] killing RelayConnection (%p)",this);
        stopAction();
    }
}
