//
//  MuxAddress.cpp
//  usbmuxrelay
//

#include <sys/socket.h>
#include <sys/un.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <unistd.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include "MuxAddress.hpp"
#include "MUXException.hpp"
#include <libgeneral/macros.h>

MuxAddress::MuxAddress()
: _path(USBMUXD_SOCKET_PATH), _port(0)
{
    //
}

MuxAddress::MuxAddress(const std::string &address)
: _port(0)
{
    size_t colonPos = 0;
    retassure(address.size(), "Empty daemon address");

    if (address.rfind("UNIX:", 0) == 0) {
        _path = address.substr(sizeof("UNIX:")-1);
        retassure(_path.size(), "Empty unix socket path in '%s'",address.c_str());
    } else if (address[0] == '/') {
        _path = address;
    } else if ((colonPos = address.rfind(':')) != std::string::npos) {
        unsigned long port = 0;
        char *endp = NULL;
        _host = address.substr(0,colonPos);
        port = strtoul(address.c_str()+colonPos+1, &endp, 10);
        retassure(*endp == '\0' && port > 0 && port <= 0xffff, "Bad port in daemon address '%s'",address.c_str());
        _port = (uint16_t)port;
        if (!_host.size()) _host = "127.0.0.1";
    } else {
        reterror("Unrecognized daemon address '%s'",address.c_str());
    }
}

MuxAddress MuxAddress::unixSocket(const std::string &path){
    MuxAddress ret;
    ret._path = path;
    return ret;
}

MuxAddress MuxAddress::tcp(const std::string &host, uint16_t port){
    MuxAddress ret;
    ret._path.clear();
    ret._host = host;
    ret._port = port;
    return ret;
}

MuxAddress MuxAddress::fromEnvironment(const std::string &fallback){
    const char *env = getenv(USBMUXD_SOCKET_ADDRESS_ENV);
    if (env && *env) {
        debug("Using daemon address from %s=%s",USBMUXD_SOCKET_ADDRESS_ENV,env);
        return MuxAddress(env);
    }
    return MuxAddress(fallback);
}

std::string MuxAddress::description() const{
    if (isUnix()) return "UNIX:" + _path;
    return _host + ":" + std::to_string(_port);
}

int MuxAddress::connect() const{
    int fd = -1;
    cleanup([&]{
        safeClose(fd);
    });

    if (isUnix()) {
        struct sockaddr_un addr = {};
        retassure(_path.size() < sizeof(addr.sun_path), "Socket path too long '%s'",_path.c_str());
        retassure((fd = socket(AF_UNIX, SOCK_STREAM, 0)) >= 0, "socket() failed: %s", strerror(errno));
        addr.sun_family = AF_UNIX;
        strncpy(addr.sun_path, _path.c_str(), sizeof(addr.sun_path)-1);
        if (::connect(fd, (struct sockaddr*)&addr, sizeof(addr))) {
            retcustomerror(MUXException, "Failed to connect to usbmuxd at %s: %s", _path.c_str(), strerror(errno));
        }
    } else {
        struct addrinfo hints = {};
        struct addrinfo *res = NULL;
        cleanup([&]{
            safeFreeCustom(res, freeaddrinfo);
        });
        int err = 0;
        constexpr int yes = 1;
        std::string portstr = std::to_string(_port);
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        retassure(!(err = getaddrinfo(_host.c_str(), portstr.c_str(), &hints, &res)), "Failed to resolve '%s': %s", _host.c_str(), gai_strerror(err));
        retassure((fd = socket(res->ai_family, res->ai_socktype, res->ai_protocol)) >= 0, "socket() failed: %s", strerror(errno));
        if (::connect(fd, res->ai_addr, res->ai_addrlen)) {
            retcustomerror(MUXException, "Failed to connect to usbmuxd at %s:%u: %s", _host.c_str(), _port, strerror(errno));
        }
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (void*)&yes, sizeof(int));
    }
    sock_set_nosigpipe(fd);

    {
        int ret = fd; fd = -1;
        return ret;
    }
}

#pragma mark socket helpers
void sock_send_all(int fd, const void *buf, size_t len){
    const char *cur = (const char*)buf;
    while (len) {
        ssize_t didSend = send(fd, cur, len, MSG_NOSIGNAL);
        if (didSend < 0 && errno == EINTR) continue;
        if (didSend <= 0) {
            retcustomerror(MUXException, "send failed on fd=%d: %s",fd,strerror(errno));
        }
        cur += didSend;
        len -= didSend;
    }
}

void sock_recv_all(int fd, void *buf, size_t len){
    char *cur = (char*)buf;
    while (len) {
        ssize_t got = recv(fd, cur, len, 0);
        if (got < 0 && errno == EINTR) continue;
        if (got == 0) {
            retcustomerror(MUXException_disconnected, "usbmuxd closed the connection (fd=%d)",fd);
        }
        if (got < 0) {
            retcustomerror(MUXException, "recv failed on fd=%d: %s",fd,strerror(errno));
        }
        cur += got;
        len -= got;
    }
}

void sock_set_nosigpipe(int fd) noexcept{
#ifdef SO_NOSIGPIPE
    constexpr int yes = 1;
    setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void*)&yes, sizeof(int));
#endif
}
