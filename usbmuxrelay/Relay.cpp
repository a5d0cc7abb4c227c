//
//  Relay.cpp
//  usbmuxrelay
//

#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <poll.h>
#include <chrono>
#include "Relay.hpp"
#include "RelayConnection.hpp"
#include "MUXException.hpp"
#include <libgeneral/macros.h>

#pragma mark RelayDelegate
RelayDelegate::~RelayDelegate(){
    //
}

void RelayDelegate::relay_ready(const std::string &udid){
    //
}

void RelayDelegate::relay_warning(const tihmstar::exception &e){
    //
}

void RelayDelegate::relay_attached(const std::string &udid){
    //
}

void RelayDelegate::relay_detached(const std::string &udid){
    //
}

void RelayDelegate::relay_error(const tihmstar::exception &e){
    //
}

void RelayDelegate::relay_connect(){
    //
}

void RelayDelegate::relay_disconnect(){
    //
}

void RelayDelegate::relay_close(){
    //
}

#pragma mark Relay
Relay::Relay(DeviceRegistry &registry, const MuxAddress &address, uint16_t devicePort, uint16_t relayPort, const RelayOptions &opts, RelayDelegate *delegate)
: _registry(registry), _address(address), _delegate(delegate)
, _devicePort(devicePort), _relayPort(relayPort), _udid(opts.udid)
, _timeout(opts.timeout ? opts.timeout : DEFAULT_DISCOVERY_TIMEOUT_MS)
, _listener(nullptr), _listenfd(-1), _wakePipe{-1,-1}
, _isReady(false), _isStopping(false), _watchdogCleared(false)
{
    try {
        struct sockaddr_in bind_addr = {};
        socklen_t bind_addr_len = sizeof(bind_addr);
        constexpr int yes = 1;

        retassure((_listenfd = socket(AF_INET, SOCK_STREAM, 0))>=0, "socket() failed: %s", strerror(errno));
        setsockopt(_listenfd, SOL_SOCKET, SO_REUSEADDR, (void*)&yes, sizeof(int));

        bind_addr.sin_family = AF_INET;
        bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
        bind_addr.sin_port = htons(_relayPort);
        retassure(!bind(_listenfd, (struct sockaddr*)&bind_addr, sizeof(bind_addr)), "bind() to port %u failed: %s", _relayPort, strerror(errno));
        retassure(!listen(_listenfd, 16), "listen() failed: %s", strerror(errno));

        assure(!getsockname(_listenfd, (struct sockaddr*)&bind_addr, &bind_addr_len));
        _relayPort = ntohs(bind_addr.sin_port);

        assure(!pipe(_wakePipe));
    } catch (tihmstar::exception &e) {
        safeClose(_listenfd);
        safeClose(_wakePipe[0]);
        safeClose(_wakePipe[1]);
        throw;
    }

    info("Starting relay localhost:%u -> device port %u (%s, timeout=%ums)",_relayPort,_devicePort,
         _udid.size() ? _udid.c_str() : "any device", _timeout);

    _connReaperThread = std::thread([this]{
        reaper_runloop();
    });

    _watchdogThread = std::thread([this]{
        watchdog_runloop();
    });

    try {
        _listener = new Listener(_registry, _address, this);
        _listener->start();
        startLoop();
    } catch (tihmstar::exception &e) {
        error("[Relay] failed to start relay on port %u with error=%s",_relayPort,e.what());
        _isStopping = true;
        clear_watchdog();
        safeDelete(_listener);
        _watchdogThread.join();
        _reapConnections.kill();
        _connReaperThread.join();
        safeClose(_wakePipe[0]);
        safeClose(_wakePipe[1]);
        safeClose(_listenfd);
        throw;
    }
}

Relay::~Relay(){
    info("[destroying] Relay localhost:%u -> device port %u",_relayPort,_devicePort);
    stop();
    safeDelete(_listener);

    if (_watchdogThread.joinable()) _watchdogThread.join();

    {
        std::unique_lock<std::mutex> ul(_childrenLck);
        while (size_t s = _children.size()) {
            for (auto c : _children) c->kill();
            uint64_t wevent = _childrenEvent.getNextEvent();
            ul.unlock();
            debug("Need to kill %zu more relay connections",s);
            _childrenEvent.waitForEvent(wevent);
            ul.lock();
        }
    }
    _reapConnections.kill();
    _connReaperThread.join();

    safeClose(_wakePipe[0]);
    safeClose(_wakePipe[1]);
    safeClose(_listenfd);
}

#pragma mark inheritance function
bool Relay::loopEvent(){
    int cfd = -1;
    try {
        cfd = accept_connection();
    } catch (tihmstar::exception &e) {
        if (_isStopping) throw;
        error("[Relay] accepting connections on port %u failed with error=%s",_relayPort,e.what());
        _listener->stop();
        if (_delegate) _delegate->relay_error(e);
        throw;
    }
    if (cfd == -1) return true;
    try {
        handle_connection(cfd); //always consumes cfd
    } catch (tihmstar::exception &e) {
        error("[Relay] failed to handle connection with error=%s code=%d",e.what(),e.code());
    }
    return true;
}

void Relay::afterLoop() noexcept{
    safeClose(_listenfd);
    debug("[Relay] acceptor on port %u closed",_relayPort);
    if (_delegate) _delegate->relay_close();
}

void Relay::stopAction() noexcept{
    if (_listenfd > 0) shutdown(_listenfd, SHUT_RDWR);
    safeClose(_wakePipe[1]);
}

#pragma mark ListenerDelegate
void Relay::listener_attached(const std::string &udid){
    if (!_udid.size() || _udid == udid) {
        if (!_isReady.exchange(true)) {
            clear_watchdog();
            info("Relay on port %u ready with device %s",_relayPort,udid.c_str());
            if (_delegate) _delegate->relay_ready(udid);
        }
    }
    if (_delegate) _delegate->relay_attached(udid);
}

void Relay::listener_detached(const std::string &udid){
    if (_delegate) _delegate->relay_detached(udid);
}

void Relay::listener_error(const tihmstar::exception &e){
    if (_delegate) _delegate->relay_error(e);
}

#pragma mark private member function
void Relay::watchdog_runloop() noexcept{
    {
        std::unique_lock<std::mutex> ul(_watchdogLck);
        if (_watchdogCV.wait_for(ul, std::chrono::milliseconds(_timeout), [this]{return _watchdogCleared;})) {
            return;
        }
        _watchdogCleared = true;
    }
    try {
        check_discovery();
    } catch (tihmstar::exception &e) {
        warning("[Relay] %s",e.what());
        if (_delegate) _delegate->relay_warning(e);
    }
}

void Relay::clear_watchdog() noexcept{
    std::unique_lock<std::mutex> ul(_watchdogLck);
    _watchdogCleared = true;
    _watchdogCV.notify_all();
}

void Relay::check_discovery() const{
    if (_udid.size()) {
        if (!_registry.contains(_udid)) {
            retcustomerror(MUXException_no_device, "Requested device not connected");
        }
    } else if (_registry.empty()) {
        retcustomerror(MUXException_no_device, "No devices connected");
    }
}

void Relay::reaper_runloop() noexcept{
    while (true) {
        RelayConnection *conn = NULL;
        try {
            conn = _reapConnections.wait();
        } catch (...) {
            break;
        }
        delete conn;
    }
}

int Relay::accept_connection(){
    struct sockaddr_in addr = {};
    int err = 0;
    int cfd = 0;
    socklen_t len = sizeof(addr);
    struct pollfd pfd[2] = {
        {
            .fd = _listenfd,
            .events = POLLIN
        },
        {
            .fd = _wakePipe[0],
            .events = POLLIN
        }
    };
    if ((err = poll(pfd,2,-1)) == -1){
        retassure(errno == EINTR, "[Relay] poll failed errno=%d (%s)",errno,strerror(errno));
        return -1;
    }
    retassure(!(pfd[1].revents & POLLHUP), "graceful kill requested");
    retassure(pfd[0].revents & POLLIN, "poll returned, but there is no POLLIN event on acceptor");
    retassure((cfd = accept(_listenfd, (struct sockaddr *)&addr, &len))>=0, "accept() failed (%s)", strerror(errno));
    sock_set_nosigpipe(cfd);
    return cfd;
}

void Relay::handle_connection(int cfd){
    RelayConnection *conn = NULL;
    cleanup([&]{
        if (cfd > 0) {
            close(cfd); cfd = -1;
        }
    });
    DeviceDescriptor dev{};

    debug("[Relay] new local connection %d",cfd);
    try {
        dev = select_device();
    } catch (tihmstar::MUXException_no_device &e) {
        warning("[Relay] dropping local connection: %s",e.what());
        if (_delegate) _delegate->relay_error(e);
        return;
    }

    debug("[Relay] forwarding connection %d to %s (id=%u) port %u",cfd,dev.serialNumber.c_str(),dev.deviceID,_devicePort);
    conn = new RelayConnection(this, cfd, dev.deviceID, _devicePort); cfd = -1;
    {
        std::unique_lock<std::mutex> ul(_childrenLck);
        _children.insert(conn);
    }
    try {
        conn->startLoop();
    } catch (tihmstar::exception &e) {
        delete conn;
        throw;
    }
}

DeviceDescriptor Relay::select_device() const{
    if (_registry.empty()) {
        retcustomerror(MUXException_no_device, "No devices connected");
    }
    if (_udid.size()) {
        return _registry.device(_udid);
    }
    return _registry.firstDevice();
}

void Relay::notify_connect() noexcept{
    if (_delegate) _delegate->relay_connect();
}

void Relay::notify_disconnect() noexcept{
    if (_delegate) _delegate->relay_disconnect();
}

void Relay::notify_error(const tihmstar::exception &e) noexcept{
    if (_delegate) _delegate->relay_error(e);
}

#pragma mark public member function
void Relay::stop() noexcept{
    debug("[Relay] stopping relay on port %u",_relayPort);
    _isStopping = true;
    clear_watchdog();
    if (_listener) _listener->stop();
    stopLoop();
}
