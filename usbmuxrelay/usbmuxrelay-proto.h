//
//  usbmuxrelay-proto.h
//  usbmuxrelay
//

#ifndef usbmuxrelay_proto_h
#define usbmuxrelay_proto_h

#ifdef __cplusplus
extern "C"{
#endif
    
#include <stdint.h>
    
    enum usbmuxd_result {
        RESULT_OK = 0,
        RESULT_BADCOMMAND = 1,
        RESULT_BADDEV = 2,
        RESULT_CONNREFUSED = 3,
        RESULT_MALFORMED = 5,
        RESULT_BADVERSION = 6,
    };
    
    struct usbmuxd_header {
        uint32_t length;    // length of message, including header
        uint32_t version;   // protocol version
        uint32_t message;   // message type
        uint32_t tag;       // responses to this query will echo back this tag
    } __attribute__((__packed__));
    
    //binary (version 0) message types are never sent by this client
    enum usbmuxd_msgtype {
        MESSAGE_PLIST = 8,
    };

#define USBMUXD_PROTO_VERSION_PLIST 1
#define USBMUXD_CLIENT_TAG          1
    
#ifdef __cplusplus
};
#endif

#endif /* usbmuxrelay_proto_h */
