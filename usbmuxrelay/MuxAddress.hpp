//
//  MuxAddress.hpp
//  usbmuxrelay
//

#ifndef MuxAddress_hpp
#define MuxAddress_hpp

#include <stdint.h>
#include <string>

#ifdef SOCKET_PATH
#   define USBMUXD_SOCKET_PATH SOCKET_PATH
#else
#   define USBMUXD_SOCKET_PATH "/var/run/usbmuxd"
#endif

#define USBMUXD_SOCKET_ADDRESS_ENV "USBMUXD_SOCKET_ADDRESS"

/*
 where the daemon can be reached: a unix domain socket path or a tcp host:port
 */
class MuxAddress{
    std::string _path;
    std::string _host;
    uint16_t _port;
public:
    MuxAddress();
    MuxAddress(const std::string &address);

    static MuxAddress unixSocket(const std::string &path);
    static MuxAddress tcp(const std::string &host, uint16_t port);

    /*
     USBMUXD_SOCKET_ADDRESS if set, otherwise fallback
     */
    static MuxAddress fromEnvironment(const std::string &fallback = USBMUXD_SOCKET_PATH);

    bool isUnix() const noexcept {return _path.size() > 0;}
    std::string description() const;

    /*
     returns a connected stream socket, owned by the caller
     */
    int connect() const;
};

#pragma mark socket helpers
void sock_send_all(int fd, const void *buf, size_t len);
void sock_recv_all(int fd, void *buf, size_t len);
void sock_set_nosigpipe(int fd) noexcept;

#endif /* MuxAddress_hpp */
