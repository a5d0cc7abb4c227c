//
//  Protocol.cpp
//  usbmuxrelay
//

#include <endian.h>
#include <string.h>
#include "Protocol.hpp"
#include <libgeneral/macros.h>

#ifndef MIN
#   define MIN(a,b) ((a) > (b) ? (b) : (a))
#endif

static std::string gProgName = "usbmuxrelay";
static std::string gClientVersionString = "usbmuxrelay";

#pragma mark helpers
static plist_t new_request(const char *messageType){
    plist_t p_req = NULL;
    assure(p_req = plist_new_dict());
    plist_dict_set_item(p_req, "MessageType", plist_new_string(messageType));
    plist_dict_set_item(p_req, "ClientVersionString", plist_new_string(gClientVersionString.c_str()));
    plist_dict_set_item(p_req, "ProgName", plist_new_string(gProgName.c_str()));
    return p_req;
}

static uint32_t dict_get_uint(plist_t dict, const char *key){
    plist_t p_intval = NULL;
    uint64_t intval = 0;
    retassure(p_intval = plist_dict_get_item(dict, key), "Message is missing '%s'",key);
    retassure(plist_get_node_type(p_intval) == PLIST_UINT, "'%s' is not an integer",key);
    plist_get_uint_val(p_intval, &intval);
    return (uint32_t)intval;
}

static uint32_t dict_get_uint_default(plist_t dict, const char *key, uint32_t defaultValue) noexcept{
    plist_t p_intval = NULL;
    uint64_t intval = defaultValue;
    if ((p_intval = plist_dict_get_item(dict, key)) && plist_get_node_type(p_intval) == PLIST_UINT) {
        plist_get_uint_val(p_intval, &intval);
    }
    return (uint32_t)intval;
}

static std::string dict_get_string(plist_t dict, const char *key){
    plist_t p_str = NULL;
    const char *str = NULL;
    uint64_t str_len = 0;
    retassure(p_str = plist_dict_get_item(dict, key), "Message is missing '%s'",key);
    retassure(str = plist_get_string_ptr(p_str, &str_len), "Failed to get str ptr from '%s'",key);
    return std::string(str,str_len);
}

#pragma mark Protocol
std::vector<uint8_t> Protocol::pack(plist_t payload){
    char *xml = NULL;
    cleanup([&]{
        safeFree(xml);
    });
    uint32_t xmlsize = 0;
    std::vector<uint8_t> ret;

    plist_to_xml(payload, &xml, &xmlsize);
    retassure(xml, "Failed to serialize payload");

    usbmuxd_header hdr{
        .length = htole32((uint32_t)(sizeof(hdr) + xmlsize)),
        .version = htole32(USBMUXD_PROTO_VERSION_PLIST),
        .message = htole32(MESSAGE_PLIST),
        .tag = htole32(USBMUXD_CLIENT_TAG)
    };

    ret.resize(sizeof(hdr) + xmlsize);
    memcpy(ret.data(), &hdr, sizeof(hdr));
    memcpy(ret.data() + sizeof(hdr), xml, xmlsize);
    return ret;
}

std::vector<uint8_t> Protocol::connectFrame(uint32_t deviceID, uint16_t port){
    plist_t p_req = NULL;
    cleanup([&]{
        safeFreeCustom(p_req, plist_free);
    });
    p_req = new_request("Connect");
    plist_dict_set_item(p_req, "DeviceID", plist_new_uint(deviceID));
    //PortNumber must be network-endian
    plist_dict_set_item(p_req, "PortNumber", plist_new_uint(byteSwap16(port)));
    return pack(p_req);
}

const std::vector<uint8_t> &Protocol::listenFrame(){
    static const std::vector<uint8_t> listen = []{
        plist_t p_req = NULL;
        cleanup([&]{
            safeFreeCustom(p_req, plist_free);
        });
        p_req = new_request("Listen");
        return pack(p_req);
    }();
    return listen;
}

MuxMessage Protocol::decode(const char *payload, size_t payloadSize){
    plist_t p_msg = NULL;
    cleanup([&]{
        safeFreeCustom(p_msg, plist_free);
    });
    MuxMessage msg{};

    retassure(payloadSize, "Received message without payload");
    plist_from_memory(payload, (uint32_t)payloadSize, &p_msg, NULL);
    retassure(p_msg && plist_get_node_type(p_msg) == PLIST_DICT, "Failed to parse message plist");

    msg.messageType = dict_get_string(p_msg, "MessageType");

    if (msg.messageType == "Result") {
        msg.type = MuxMessage::MSG_RESULT;
        msg.number = dict_get_uint(p_msg, "Number");
    } else if (msg.messageType == "Attached") {
        plist_t p_props = NULL;
        retassure((p_props = plist_dict_get_item(p_msg, "Properties")) && plist_get_node_type(p_props) == PLIST_DICT,
              "Attached message without Properties");
        msg.type = MuxMessage::MSG_ATTACHED;
        msg.properties.deviceID = dict_get_uint(p_props, "DeviceID");
        msg.properties.serialNumber = dict_get_string(p_props, "SerialNumber");
        msg.properties.locationID = dict_get_uint_default(p_props, "LocationID", 0);
        msg.properties.productID = dict_get_uint_default(p_props, "ProductID", 0);
        msg.properties.connectionSpeed = dict_get_uint_default(p_props, "ConnectionSpeed", 0);
        try {
            msg.properties.connectionType = dict_get_string(p_props, "ConnectionType");
        } catch (tihmstar::exception &e) {
            msg.properties.connectionType = "USB";
        }
        msg.deviceID = dict_get_uint_default(p_msg, "DeviceID", msg.properties.deviceID);
    } else if (msg.messageType == "Detached") {
        msg.type = MuxMessage::MSG_DETACHED;
        msg.deviceID = dict_get_uint(p_msg, "DeviceID");
    } else {
        debug("Decoded message of unhandled type '%s'",msg.messageType.c_str());
        msg.type = MuxMessage::MSG_UNKNOWN;
        msg.deviceID = dict_get_uint_default(p_msg, "DeviceID", 0);
    }
    return msg;
}

void Protocol::setClientInfo(const std::string &progName, const std::string &clientVersionString){
    gProgName = progName;
    gClientVersionString = clientVersionString;
}

const std::string &Protocol::progName() noexcept{
    return gProgName;
}

const std::string &Protocol::clientVersionString() noexcept{
    return gClientVersionString;
}

#pragma mark MessageParser
MessageParser::MessageParser(message_cb_t onMessage)
: _onMessage(onMessage), _hdr{}, _hdrBytesCnt(0), _inMessage(false), _remaining(0)
{
    //
}

void MessageParser::completeMessage(){
    MuxMessage msg;
    _inMessage = false;
    msg = Protocol::decode(_payload.data(), _payload.size());
    _payload.clear();
    _onMessage(msg);
}

void MessageParser::feed(const void *buf, size_t len){
    const char *cur = (const char *)buf;

    while (len) {
        if (!_inMessage) {
            size_t take = MIN(sizeof(_hdr) - _hdrBytesCnt, len);
            uint32_t msglen = 0;
            memcpy(((char*)&_hdr) + _hdrBytesCnt, cur, take);
            _hdrBytesCnt += take;
            cur += take;
            len -= take;
            if (_hdrBytesCnt < sizeof(_hdr)) break; //wait for the rest of the header

            _hdrBytesCnt = 0;
            msglen = le32toh(_hdr.length);
            retassure(msglen >= sizeof(_hdr), "Bad message length %u",msglen);
            retassure(msglen <= Protocol::maxMessageSize, "Message length %u exceeds limit",msglen);
            debug("Got header len=%u ver=%u msg=%u tag=%u",msglen,le32toh(_hdr.version),le32toh(_hdr.message),le32toh(_hdr.tag));

            _remaining = msglen - (uint32_t)sizeof(_hdr);
            _payload.clear();
            _payload.reserve(_remaining);
            _inMessage = true;
            if (!_remaining) completeMessage();
            continue;
        }

        {
            size_t take = MIN((size_t)_remaining, len);
            _payload.append(cur, take);
            _remaining -= (uint32_t)take;
            cur += take;
            len -= take;
        }
        if (!_remaining) completeMessage();
    }
}
