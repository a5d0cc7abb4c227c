//
//  Tunnel.cpp
//  usbmuxrelay
//

#include <endian.h>
#include <unistd.h>
#include <vector>
#include "Tunnel.hpp"
#include "Protocol.hpp"
#include "MUXException.hpp"
#include <libgeneral/macros.h>

void tunnel_handshake(int fd, uint32_t deviceID, uint16_t port){
    bool gotMessage = false;
    MuxMessage rsp{};
    MessageParser parser([&](const MuxMessage &msg){
        rsp = msg;
        gotMessage = true;
    });

    {
        std::vector<uint8_t> req = Protocol::connectFrame(deviceID, port);
        sock_send_all(fd, req.data(), req.size());
    }

    /*
     read exactly one frame, everything after it belongs to the tunnel
     */
    {
        usbmuxd_header hdr{};
        std::vector<char> payload;
        sock_recv_all(fd, &hdr, sizeof(hdr));
        parser.feed(&hdr, sizeof(hdr));
        payload.resize(le32toh(hdr.length) - sizeof(hdr));
        if (payload.size()) {
            sock_recv_all(fd, payload.data(), payload.size());
            parser.feed(payload.data(), payload.size());
        }
    }
    retassure(gotMessage, "No response to Connect request");
    if (rsp.type != MuxMessage::MSG_RESULT) {
        reterror("Tunnel failed, unexpected '%s' response",rsp.messageType.c_str());
    }
    if (rsp.number != RESULT_OK) {
        tihmstar::throw_result_error("Tunnel failed", rsp.number);
    }
}

int tunnel_connect(const MuxAddress &address, uint32_t deviceID, uint16_t port){
    int fd = -1;
    cleanup([&]{
        safeClose(fd);
    });

    debug("[Tunnel] connecting to device %u port %u",deviceID,port);
    fd = address.connect();
    tunnel_handshake(fd, deviceID, port);

    debug("[Tunnel] connected to device %u port %u on fd %d",deviceID,port,fd);
    {
        int ret = fd; fd = -1;
        return ret;
    }
}

int tunnel_get(DeviceRegistry &registry, const MuxAddress &address, uint16_t devicePort, const RelayOptions &opts){
    uint32_t deviceID = 0;

    if (opts.udid.size() && registry.contains(opts.udid)) {
        try {
            deviceID = registry.device(opts.udid).deviceID;
            return tunnel_connect(address, deviceID, devicePort);
        } catch (tihmstar::MUXException_no_device &e) {
            debug("[Tunnel] %s detached meanwhile, searching",opts.udid.c_str());
        }
    } else if (!opts.udid.size() && !registry.empty()) {
        try {
            deviceID = registry.firstDevice().deviceID;
            return tunnel_connect(address, deviceID, devicePort);
        } catch (tihmstar::MUXException_no_device &e) {
            debug("[Tunnel] all devices detached meanwhile, searching");
        }
    }

    deviceID = find_device(registry, address, opts);
    return tunnel_connect(address, deviceID, devicePort);
}
