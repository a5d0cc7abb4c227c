//
//  test_protocol.cpp
//  usbmuxrelay
//

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <endian.h>
#include <string.h>
#include "MockDaemon.hpp"
#include "Protocol.hpp"
#include "MUXException.hpp"
#include <libgeneral/macros.h>

namespace {

usbmuxd_header header_of(const std::vector<uint8_t> &frame){
    usbmuxd_header hdr{};
    memcpy(&hdr, frame.data(), sizeof(hdr));
    return hdr;
}

plist_t payload_of(const std::vector<uint8_t> &frame){
    plist_t ret = NULL;
    plist_from_memory((const char*)frame.data() + sizeof(usbmuxd_header), (uint32_t)(frame.size() - sizeof(usbmuxd_header)), &ret, NULL);
    return ret;
}

std::string string_of(plist_t dict, const char *key){
    plist_t p_str = plist_dict_get_item(dict, key);
    const char *str = NULL;
    uint64_t len = 0;
    if (!p_str || !(str = plist_get_string_ptr(p_str, &len))) return {};
    return std::string(str,len);
}

uint64_t uint_of(plist_t dict, const char *key){
    plist_t p_uint = plist_dict_get_item(dict, key);
    uint64_t ret = 0;
    if (p_uint) plist_get_uint_val(p_uint, &ret);
    return ret;
}

class ParserTest : public ::testing::Test{
protected:
    std::vector<MuxMessage> messages;
    MessageParser parser{[this](const MuxMessage &msg){messages.push_back(msg);}};
};

};

TEST(Protocol, HeaderFieldsAreFixed){
    std::vector<uint8_t> frame = MockDaemon::resultFrame(0);
    usbmuxd_header hdr = header_of(frame);

    EXPECT_EQ(le32toh(hdr.length), frame.size());
    EXPECT_EQ(le32toh(hdr.version), 1u);
    EXPECT_EQ(le32toh(hdr.message), 8u);
    EXPECT_EQ(le32toh(hdr.tag), 1u);
}

TEST(Protocol, ConnectFrameSwapsPortBytes){
    std::vector<uint8_t> frame = Protocol::connectFrame(7, 0x1234);
    plist_t p_req = payload_of(frame);
    ASSERT_NE(p_req, nullptr);

    EXPECT_EQ(string_of(p_req, "MessageType"), "Connect");
    EXPECT_EQ(uint_of(p_req, "DeviceID"), 7u);
    EXPECT_EQ(uint_of(p_req, "PortNumber"), 0x3412u);
    EXPECT_EQ(string_of(p_req, "ProgName"), Protocol::progName());
    EXPECT_EQ(string_of(p_req, "ClientVersionString"), Protocol::clientVersionString());
    EXPECT_EQ(le32toh(header_of(frame).length), frame.size());
    plist_free(p_req);
}

TEST(Protocol, ConnectFramePortIsNetworkOrder){
    std::vector<uint8_t> frame = Protocol::connectFrame(1, 62078);
    plist_t p_req = payload_of(frame);
    ASSERT_NE(p_req, nullptr);
    EXPECT_EQ(uint_of(p_req, "PortNumber"), htons(62078));
    plist_free(p_req);
}

TEST(Protocol, ListenFrame){
    const std::vector<uint8_t> &frame = Protocol::listenFrame();
    plist_t p_req = payload_of(frame);
    ASSERT_NE(p_req, nullptr);
    EXPECT_EQ(string_of(p_req, "MessageType"), "Listen");
    EXPECT_FALSE(string_of(p_req, "ProgName").empty());
    EXPECT_EQ(&frame, &Protocol::listenFrame());
    plist_free(p_req);
}

TEST(Protocol, DecodeAttached){
    std::vector<uint8_t> frame = MockDaemon::attachedFrame("ABC", 7);
    MuxMessage msg = Protocol::decode((const char*)frame.data() + Protocol::headerSize, frame.size() - Protocol::headerSize);

    EXPECT_EQ(msg.type, MuxMessage::MSG_ATTACHED);
    EXPECT_EQ(msg.deviceID, 7u);
    EXPECT_EQ(msg.properties.serialNumber, "ABC");
    EXPECT_EQ(msg.properties.deviceID, 7u);
    EXPECT_EQ(msg.properties.connectionType, "USB");
    EXPECT_EQ(msg.properties.productID, 0x12a8u);
    EXPECT_EQ(msg.properties.connectionSpeed, 480000000u);
}

TEST(Protocol, DecodeUnknownMessageType){
    std::vector<uint8_t> frame = MockDaemon::messageFrame("Paired", 3);
    MuxMessage msg = Protocol::decode((const char*)frame.data() + Protocol::headerSize, frame.size() - Protocol::headerSize);

    EXPECT_EQ(msg.type, MuxMessage::MSG_UNKNOWN);
    EXPECT_EQ(msg.messageType, "Paired");
    EXPECT_EQ(msg.deviceID, 3u);
}

TEST(Protocol, DecodeRejectsGarbage){
    const char garbage[] = "this is not a plist";
    EXPECT_THROW(Protocol::decode(garbage, sizeof(garbage)), tihmstar::exception);
}

TEST(Protocol, DecodeRejectsAttachedWithoutProperties){
    std::vector<uint8_t> frame = MockDaemon::messageFrame("Attached", 3);
    EXPECT_THROW(Protocol::decode((const char*)frame.data() + Protocol::headerSize, frame.size() - Protocol::headerSize), tihmstar::exception);
}

TEST_F(ParserTest, AnySplitDecodesOnce){
    std::vector<uint8_t> frame = MockDaemon::attachedFrame("ABC", 7);
    for (size_t split = 0; split <= frame.size(); split++) {
        std::vector<MuxMessage> got;
        MessageParser p([&](const MuxMessage &msg){got.push_back(msg);});
        p.feed(frame.data(), split);
        p.feed(frame.data() + split, frame.size() - split);
        ASSERT_EQ(got.size(), 1u) << "split at " << split;
        EXPECT_EQ(got[0].properties.serialNumber, "ABC");
        EXPECT_FALSE(p.inMessage());
    }
}

TEST_F(ParserTest, ConcatenatedFramesDecodeInOrder){
    std::vector<uint8_t> buf = MockDaemon::resultFrame(0);
    std::vector<uint8_t> second = MockDaemon::attachedFrame("ABC", 7);
    buf.insert(buf.end(), second.begin(), second.end());

    parser.feed(buf.data(), buf.size());

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].type, MuxMessage::MSG_RESULT);
    EXPECT_EQ(messages[0].number, 0u);
    EXPECT_EQ(messages[1].type, MuxMessage::MSG_ATTACHED);
}

TEST_F(ParserTest, OneByteChunks){
    std::vector<uint8_t> buf = MockDaemon::attachedFrame("ABC", 7);
    std::vector<uint8_t> second = MockDaemon::detachedFrame(7);
    buf.insert(buf.end(), second.begin(), second.end());

    for (size_t i = 0; i < buf.size(); i++) {
        parser.feed(&buf[i], 1);
    }

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].type, MuxMessage::MSG_ATTACHED);
    EXPECT_EQ(messages[1].type, MuxMessage::MSG_DETACHED);
    EXPECT_EQ(messages[1].deviceID, 7u);
}

TEST_F(ParserTest, HeaderWithoutPayloadWaits){
    std::vector<uint8_t> frame = MockDaemon::resultFrame(3);

    parser.feed(frame.data(), Protocol::headerSize);
    EXPECT_TRUE(messages.empty());
    EXPECT_TRUE(parser.inMessage());

    parser.feed(frame.data() + Protocol::headerSize, frame.size() - Protocol::headerSize);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].number, 3u);
}

TEST_F(ParserTest, RejectsShortLength){
    usbmuxd_header hdr{
        .length = htole32(8),
        .version = htole32(USBMUXD_PROTO_VERSION_PLIST),
        .message = htole32(MESSAGE_PLIST),
        .tag = htole32(USBMUXD_CLIENT_TAG)
    };
    EXPECT_THROW(parser.feed(&hdr, sizeof(hdr)), tihmstar::exception);
}

TEST_F(ParserTest, RejectsOversizedLength){
    usbmuxd_header hdr{
        .length = htole32(Protocol::maxMessageSize + 1),
        .version = htole32(USBMUXD_PROTO_VERSION_PLIST),
        .message = htole32(MESSAGE_PLIST),
        .tag = htole32(USBMUXD_CLIENT_TAG)
    };
    EXPECT_THROW(parser.feed(&hdr, sizeof(hdr)), tihmstar::exception);
}

TEST(Errors, ResultCodeIsCarried){
    try {
        tihmstar::throw_result_error("Tunnel failed", RESULT_CONNREFUSED);
        FAIL() << "no exception thrown";
    } catch (tihmstar::MUXException_result &e) {
        EXPECT_EQ(e.result(), (uint32_t)RESULT_CONNREFUSED);
        EXPECT_NE(strstr(e.what(), "Port isn't available or open"), nullptr);
    }
}

TEST(Errors, UnknownResultCodePassesThrough){
    try {
        tihmstar::throw_result_error("Listen failed", 42);
        FAIL() << "no exception thrown";
    } catch (tihmstar::MUXException_result &e) {
        EXPECT_EQ(e.result(), 42u);
        EXPECT_NE(strstr(e.what(), "42"), nullptr);
    }
}
