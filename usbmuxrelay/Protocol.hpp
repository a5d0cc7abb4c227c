//
//  Protocol.hpp
//  usbmuxrelay
//

#ifndef Protocol_hpp
#define Protocol_hpp

#include "usbmuxrelay-proto.h"
#include <plist/plist.h>
#include <stdint.h>
#include <functional>
#include <string>
#include <vector>

struct DeviceDescriptor{
    std::string connectionType;
    uint32_t deviceID;          //only valid while the device is attached
    uint32_t locationID;
    uint32_t productID;
    uint32_t connectionSpeed;
    std::string serialNumber;   //UDID
};

struct MuxMessage{
    enum msg_type{
        MSG_UNKNOWN = 0,
        MSG_RESULT,
        MSG_ATTACHED,
        MSG_DETACHED
    };
    msg_type type;
    std::string messageType;
    uint32_t number;    //Result
    uint32_t deviceID;  //Attached, Detached
    DeviceDescriptor properties; //Attached
};

class Protocol{
public:
    static constexpr size_t headerSize = sizeof(usbmuxd_header);
    static constexpr uint32_t maxMessageSize = 0x20000;

    /*
     serializes payload as xml plist and prepends the frame header
     */
    static std::vector<uint8_t> pack(plist_t payload);
    static std::vector<uint8_t> connectFrame(uint32_t deviceID, uint16_t port);
    static const std::vector<uint8_t> &listenFrame();

    static MuxMessage decode(const char *payload, size_t payloadSize);

    static constexpr uint16_t byteSwap16(uint16_t val) noexcept{
        return (uint16_t)(((val & 0xff) << 8) | ((val >> 8) & 0xff));
    }

    /*
     must be called before the first listenFrame() call to have an effect on it
     */
    static void setClientInfo(const std::string &progName, const std::string &clientVersionString);
    static const std::string &progName() noexcept;
    static const std::string &clientVersionString() noexcept;
};

/*
 Reassembles frames from an arbitrarily chunked byte stream.
 onMessage is called once per complete message, in stream order.
 */
class MessageParser{
public:
    using message_cb_t = std::function<void(const MuxMessage &msg)>;
private:
    message_cb_t _onMessage;
    usbmuxd_header _hdr;
    size_t _hdrBytesCnt;
    bool _inMessage;
    uint32_t _remaining;
    std::string _payload;

    void completeMessage();
public:
    MessageParser(message_cb_t onMessage);
    MessageParser(const MessageParser &) = delete;

    void feed(const void *buf, size_t len);

    bool inMessage() const noexcept {return _inMessage || _hdrBytesCnt;}
};

#endif /* Protocol_hpp */
