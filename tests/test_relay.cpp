//
//  test_relay.cpp
//  usbmuxrelay
//

#include <gtest/gtest.h>
#include <unistd.h>
#include <chrono>
#include <thread>
#include "MockDaemon.hpp"
#include "Protocol.hpp"
#include "Relay.hpp"
#include "MUXException.hpp"
#include <libgeneral/macros.h>

using namespace std::chrono_literals;

namespace {

class RecordingDelegate : public RelayDelegate{
    std::mutex _lck;
    std::string _lastError;
    std::string _lastWarning;
    uint32_t _lastResult = 0;
public:
    EventLog log;

    virtual void relay_ready(const std::string &udid) override{
        log.push("ready:" + udid);
    }
    virtual void relay_warning(const tihmstar::exception &e) override{
        {
            std::unique_lock<std::mutex> ul(_lck);
            _lastWarning = e.what();
        }
        log.push("warning");
    }
    virtual void relay_attached(const std::string &udid) override{
        log.push("attached:" + udid);
    }
    virtual void relay_detached(const std::string &udid) override{
        log.push("detached:" + udid);
    }
    virtual void relay_error(const tihmstar::exception &e) override{
        {
            std::unique_lock<std::mutex> ul(_lck);
            _lastError = e.what();
            if (const tihmstar::MUXException_result *re = dynamic_cast<const tihmstar::MUXException_result*>(&e)) {
                _lastResult = re->result();
            }
        }
        log.push("error");
    }
    virtual void relay_connect() override{
        log.push("connect");
    }
    virtual void relay_disconnect() override{
        log.push("disconnect");
    }
    virtual void relay_close() override{
        log.push("close");
    }

    std::string lastError(){
        std::unique_lock<std::mutex> ul(_lck);
        return _lastError;
    }
    std::string lastWarning(){
        std::unique_lock<std::mutex> ul(_lck);
        return _lastWarning;
    }
    uint32_t lastResult(){
        std::unique_lock<std::mutex> ul(_lck);
        return _lastResult;
    }
};

RelayOptions pinned(const std::string &udid, uint32_t timeout = 1000){
    RelayOptions ret{};
    ret.udid = udid;
    ret.timeout = timeout;
    return ret;
}

};

TEST(Relay, UnreachableDaemonWarns){
    DeviceRegistry registry;
    RecordingDelegate delegate;
    RelayOptions opts{};
    opts.timeout = 50;
    auto start = std::chrono::steady_clock::now();

    Relay relay(registry, MuxAddress::unixSocket("/nonexistent/usbmuxd"), 22, 0, opts, &delegate);

    ASSERT_TRUE(delegate.log.waitFor("warning", 200ms));
    EXPECT_LE(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count(), 200);
    EXPECT_NE(delegate.lastWarning().find("No devices connected"), std::string::npos);
    EXPECT_GE(delegate.log.count("error"), 1u);
    EXPECT_FALSE(relay.isReady());
}

TEST(Relay, PinnedAbsentWarns){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    daemon.addDevice("OTHER", 3);

    Relay relay(registry, daemon.address(), 22, 0, pinned("ABC", 50), &delegate);

    ASSERT_TRUE(delegate.log.waitFor("warning", 500ms));
    EXPECT_NE(delegate.lastWarning().find("Requested device not connected"), std::string::npos);
    EXPECT_EQ(delegate.log.count("ready:OTHER"), 0u);
}

TEST(Relay, DeviceInTimeSilencesWatchdog){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    RelayOptions opts{};
    opts.timeout = 100;
    daemon.addDevice("ABC", 7);

    Relay relay(registry, daemon.address(), 22, 0, opts, &delegate);

    ASSERT_TRUE(delegate.log.waitFor("ready:ABC", 1s));
    std::this_thread::sleep_for(250ms);
    EXPECT_EQ(delegate.log.count("warning"), 0u);
    EXPECT_TRUE(relay.isReady());
}

TEST(Relay, ReadyPrecedesAttachedAndFiresOnce){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    daemon.addDevice("ABC", 7);

    Relay relay(registry, daemon.address(), 22, 0, {}, &delegate);
    ASSERT_TRUE(delegate.log.waitFor("attached:ABC", 1s));
    daemon.addDevice("DEF", 8);
    ASSERT_TRUE(delegate.log.waitFor("attached:DEF", 1s));
    daemon.removeDevice(7);
    ASSERT_TRUE(delegate.log.waitFor("detached:ABC", 1s));

    EXPECT_EQ(delegate.log.events(), (std::vector<std::string>{"ready:ABC","attached:ABC","attached:DEF","detached:ABC"}));
}

TEST(Relay, EmptyRegistryRefusesConnection){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;

    Relay relay(registry, daemon.address(), 22, 0, {}, &delegate);
    ASSERT_TRUE(daemon.waitForListeners(1, 1s));

    int fd = connect_local(relay.relayPort());
    ASSERT_TRUE(delegate.log.waitFor("error", 1s));
    EXPECT_TRUE(wait_for_eof(fd, 1s));
    close(fd);

    EXPECT_NE(delegate.lastError().find("No devices connected"), std::string::npos);
    EXPECT_EQ(daemon.connectCount(), 0u);
    EXPECT_EQ(delegate.log.count("connect"), 0u);
}

TEST(Relay, PinnedAbsentRefusesConnection){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    daemon.addDevice("OTHER", 3);

    Relay relay(registry, daemon.address(), 22, 0, pinned("ABC"), &delegate);
    ASSERT_TRUE(delegate.log.waitFor("attached:OTHER", 1s));

    int fd = connect_local(relay.relayPort());
    ASSERT_TRUE(delegate.log.waitFor("error", 1s));
    EXPECT_TRUE(wait_for_eof(fd, 1s));
    close(fd);

    EXPECT_NE(delegate.lastError().find("Requested device not connected"), std::string::npos);
    EXPECT_EQ(daemon.connectCount(), 0u);
}

TEST(Relay, EndToEndEcho){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    daemon.addDevice("ABC", 7);

    Relay relay(registry, daemon.address(), 2222, 0, pinned("ABC"), &delegate);
    ASSERT_TRUE(delegate.log.waitFor("ready:ABC", 1s));
    EXPECT_NE(relay.relayPort(), 0);
    EXPECT_EQ(relay.devicePort(), 2222);

    int fd = connect_local(relay.relayPort());
    send_string(fd, "ping");
    EXPECT_EQ(recv_bytes(fd, 4, 2s), "ping");
    send_string(fd, "second message");
    EXPECT_EQ(recv_bytes(fd, 14, 2s), "second message");
    EXPECT_TRUE(delegate.log.waitFor("connect", 1s));
    EXPECT_EQ(delegate.log.count("connect"), 1u);

    close(fd);
    EXPECT_TRUE(delegate.log.waitFor("disconnect", 1s));

    auto requests = daemon.connectRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].deviceID, 7u);
    EXPECT_EQ(requests[0].portNumber, Protocol::byteSwap16(2222));
    EXPECT_EQ(delegate.log.count("error"), 0u);
}

TEST(Relay, UnpinnedUsesEarliestDevice){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    daemon.addDevice("FIRST", 3);
    daemon.addDevice("SECOND", 4);

    Relay relay(registry, daemon.address(), 22, 0, {}, &delegate);
    ASSERT_TRUE(delegate.log.waitFor("attached:SECOND", 1s));

    int fd = connect_local(relay.relayPort());
    send_string(fd, "x");
    EXPECT_EQ(recv_bytes(fd, 1, 2s), "x");
    close(fd);

    auto requests = daemon.connectRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].deviceID, 3u);
}

TEST(Relay, SelectsDeviceAtConnectionTime){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    daemon.addDevice("FIRST", 3);
    daemon.addDevice("SECOND", 4);

    Relay relay(registry, daemon.address(), 22, 0, {}, &delegate);
    ASSERT_TRUE(delegate.log.waitFor("attached:SECOND", 1s));
    daemon.removeDevice(3);
    ASSERT_TRUE(delegate.log.waitFor("detached:FIRST", 1s));

    int fd = connect_local(relay.relayPort());
    send_string(fd, "x");
    EXPECT_EQ(recv_bytes(fd, 1, 2s), "x");
    close(fd);

    auto requests = daemon.connectRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].deviceID, 4u);
}

TEST(Relay, RefusedTunnelIsReported){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    daemon.addDevice("ABC", 7);
    daemon.setConnectResult(RESULT_CONNREFUSED);

    Relay relay(registry, daemon.address(), 22, 0, {}, &delegate);
    ASSERT_TRUE(delegate.log.waitFor("ready:ABC", 1s));

    int fd = connect_local(relay.relayPort());
    ASSERT_TRUE(delegate.log.waitFor("error", 1s));
    EXPECT_TRUE(wait_for_eof(fd, 1s));
    close(fd);

    EXPECT_EQ(delegate.lastResult(), (uint32_t)RESULT_CONNREFUSED);
    EXPECT_EQ(delegate.log.count("connect"), 0u);
}

TEST(Relay, StopKeepsRunningTunnels){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    daemon.addDevice("ABC", 7);

    Relay relay(registry, daemon.address(), 22, 0, {}, &delegate);
    ASSERT_TRUE(delegate.log.waitFor("ready:ABC", 1s));
    uint16_t port = relay.relayPort();

    int fd = connect_local(port);
    send_string(fd, "before");
    ASSERT_EQ(recv_bytes(fd, 6, 2s), "before");

    relay.stop();
    EXPECT_TRUE(delegate.log.waitFor("close", 1s));
    EXPECT_THROW(connect_local(port), tihmstar::exception);

    send_string(fd, "after");
    EXPECT_EQ(recv_bytes(fd, 5, 2s), "after");
    close(fd);
    EXPECT_TRUE(delegate.log.waitFor("disconnect", 1s));
}

TEST(Relay, DestroyingTearsDownTunnels){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    daemon.addDevice("ABC", 7);
    int fd = -1;
    {
        Relay relay(registry, daemon.address(), 22, 0, {}, &delegate);
        ASSERT_TRUE(delegate.log.waitFor("ready:ABC", 1s));
        fd = connect_local(relay.relayPort());
        send_string(fd, "ping");
        ASSERT_EQ(recv_bytes(fd, 4, 2s), "ping");
    }
    EXPECT_TRUE(wait_for_eof(fd, 1s));
    close(fd);
}

TEST(Relay, DestroyingDuringHandshakeReturns){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    Relay *relay = NULL;
    cleanup([&]{
        safeDelete(relay);
    });
    daemon.addDevice("ABC", 7);
    daemon.setHoldConnectResult(true);

    relay = new Relay(registry, daemon.address(), 22, 0, {}, &delegate);
    ASSERT_TRUE(delegate.log.waitFor("ready:ABC", 1s));
    int fd = connect_local(relay->relayPort());
    ASSERT_TRUE(daemon.waitForConnects(1, 1s));

    auto start = std::chrono::steady_clock::now();
    safeDelete(relay);
    EXPECT_LE(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count(), 1000);

    EXPECT_TRUE(wait_for_eof(fd, 1s));
    close(fd);
    EXPECT_EQ(delegate.log.count("connect"), 0u);
    EXPECT_EQ(delegate.log.count("error"), 0u);
}

TEST(Relay, TunnelEndWaitsForLocalEnd){
    MockDaemon daemon;
    DeviceRegistry registry;
    RecordingDelegate delegate;
    daemon.addDevice("ABC", 7);
    daemon.setHangupAfterConnect(true);

    Relay relay(registry, daemon.address(), 22, 0, {}, &delegate);
    ASSERT_TRUE(delegate.log.waitFor("ready:ABC", 1s));

    int fd = connect_local(relay.relayPort());
    ASSERT_TRUE(delegate.log.waitFor("connect", 1s));
    ASSERT_TRUE(wait_for_eof(fd, 1s));

    send_string(fd, "late data");
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(delegate.log.count("disconnect"), 0u);

    close(fd);
    EXPECT_TRUE(delegate.log.waitFor("disconnect", 1s));
    EXPECT_EQ(delegate.log.count("error"), 0u);
}

TEST(Relay, BusyPortThrows){
    DeviceRegistry registry;
    RecordingDelegate delegate;
    Relay first(registry, MuxAddress::unixSocket("/nonexistent/usbmuxd"), 22, 0, {}, &delegate);

    EXPECT_THROW(Relay(registry, MuxAddress::unixSocket("/nonexistent/usbmuxd"), 22, first.relayPort(), {}, &delegate), tihmstar::exception);
}
