// DiscoveryTests.cpp - broadcast/collect cycle and reply parsing
//
// Reply layout: magic len 7161 00 hw[6] spaces[6] rev_hw[6] ... "SOC"/"IRD"

#include <gtest/gtest.h>
#include <chrono>
#include <string>

#include "Discovery.hpp"
#include "FakeSocket.hpp"

using namespace PacketCodec;

namespace {

const HardwareId kSocketMac{0xAC, 0xCF, 0x23, 0x11, 0x22, 0x33};
const HardwareId kBlasterMac{0xAC, 0xCF, 0x23, 0x44, 0x55, 0x66};

Bytes discover_reply(const HardwareId& id, const std::string& model) {
    Bytes tail(model.begin(), model.end());
    return encode(CMD_DISCOVER, {Bytes{0x00}, to_bytes(id), SPACES_6, reversed(id), SPACES_6,
                                 Bytes{0x00, 0x00, 0x00, 0x00}, tail});
}

} // namespace

class DiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sock = std::make_unique<ScriptedSocket>();
        socket_ = sock.get();
        transport_ = std::make_unique<Transport>(std::move(sock));
    }

    ScriptedSocket* socket_ = nullptr;
    std::unique_ptr<Transport> transport_;
    Discovery discovery_{3};
};

TEST(DiscoveryParseTest, SocketReply) {
    Endpoint from{"10.0.0.5", PORT};
    auto device = Discovery::parse_reply(from, discover_reply(kSocketMac, "SOC002"));
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->address, from);
    EXPECT_EQ(device->hardware_id, kSocketMac);
    EXPECT_EQ(device->device_class, DeviceClass::Socket);
}

TEST(DiscoveryParseTest, BlasterReply) {
    auto device = Discovery::parse_reply(Endpoint{"10.0.0.6", PORT}, discover_reply(kBlasterMac, "IRD005"));
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->hardware_id, kBlasterMac);
    EXPECT_EQ(device->device_class, DeviceClass::InfraredBlaster);
}

TEST(DiscoveryParseTest, UnrecognisedModelIsUnknown) {
    auto device = Discovery::parse_reply(Endpoint{"10.0.0.7", PORT}, discover_reply(kSocketMac, "XYZ"));
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->device_class, DeviceClass::Unknown);
}

TEST(DiscoveryParseTest, GhostReplyHasNoIdentity) {
    // our own broadcast echoed back: header only
    EXPECT_FALSE(Discovery::parse_reply(Endpoint{"10.0.0.1", PORT}, encode(CMD_DISCOVER)).has_value());
    EXPECT_FALSE(Discovery::parse_reply(Endpoint{"10.0.0.1", PORT}, encode(CMD_DISCOVER, {Bytes{0x00, 0xAC}})).has_value());
}

TEST_F(DiscoveryTest, BroadcastsDiscoverFrame) {
    discovery_.discover_all(*transport_);
    ASSERT_GE(socket_->sent().size(), 1u);
    EXPECT_EQ(socket_->sent()[0].data, encode(CMD_DISCOVER));
    EXPECT_EQ(socket_->sent()[0].to.ip, "255.255.255.255");
    EXPECT_EQ(socket_->sent()[0].to.port, PORT);
}

TEST_F(DiscoveryTest, CollectsDevicesAndDropsGhosts) {
    socket_->push_inbound(Endpoint{"10.0.0.1", PORT}, encode(CMD_DISCOVER));
    socket_->push_inbound(Endpoint{"10.0.0.5", PORT}, discover_reply(kSocketMac, "SOC002"));
    socket_->push_inbound(Endpoint{"10.0.0.6", PORT}, encode(CMD_SUBSCRIBE, {Bytes(20, 0x01)}));
    socket_->push_inbound(Endpoint{"10.0.0.7", PORT}, discover_reply(kBlasterMac, "IRD005"));

    DeviceMap devices = discovery_.discover_all(*transport_);

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices.at("10.0.0.5").device_class, DeviceClass::Socket);
    EXPECT_EQ(devices.at("10.0.0.7").device_class, DeviceClass::InfraredBlaster);
    EXPECT_EQ(devices.count("10.0.0.1"), 0u);
    EXPECT_EQ(devices.count("10.0.0.6"), 0u);
}

TEST_F(DiscoveryTest, SameAddressTwiceKeepsLastReply) {
    socket_->push_inbound(Endpoint{"10.0.0.5", PORT}, discover_reply(kSocketMac, "SOC002"));
    socket_->push_inbound(Endpoint{"10.0.0.5", PORT}, discover_reply(kBlasterMac, "IRD005"));

    DeviceMap devices = discovery_.discover_all(*transport_);

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.at("10.0.0.5").hardware_id, kBlasterMac);
    EXPECT_EQ(devices.at("10.0.0.5").device_class, DeviceClass::InfraredBlaster);
}

TEST_F(DiscoveryTest, DiscoverOneFindsAddress) {
    socket_->push_inbound(Endpoint{"10.0.0.5", PORT}, discover_reply(kSocketMac, "SOC002"));
    DiscoverResult r = discovery_.discover_one(*transport_, "10.0.0.5");
    ASSERT_EQ(r.status, Status::Ok);
    ASSERT_TRUE(r.device.has_value());
    EXPECT_EQ(r.device->hardware_id, kSocketMac);
}

TEST_F(DiscoveryTest, DiscoverOneMissIsDeviceNotFound) {
    socket_->push_inbound(Endpoint{"10.0.0.5", PORT}, discover_reply(kSocketMac, "SOC002"));
    DiscoverResult r = discovery_.discover_one(*transport_, "10.0.0.99");
    EXPECT_EQ(r.status, Status::DeviceNotFound);
    EXPECT_FALSE(r.device.has_value());
}

TEST_F(DiscoveryTest, FailedBroadcastYieldsNothing) {
    socket_->set_writable(false);
    socket_->push_inbound(Endpoint{"10.0.0.5", PORT}, discover_reply(kSocketMac, "SOC002"));
    EXPECT_TRUE(discovery_.discover_all(*transport_).empty());
}

TEST_F(DiscoveryTest, ReplyFloodStopsAtReplyCap) {
    socket_->set_flood(Endpoint{"10.0.0.5", PORT}, discover_reply(kSocketMac, "SOC002"));

    auto start = std::chrono::steady_clock::now();
    DeviceMap devices = discovery_.discover_all(*transport_);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.at("10.0.0.5").hardware_id, kSocketMac);
    EXPECT_EQ(socket_->reads(), Discovery::MAX_REPLIES);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST_F(DiscoveryTest, SlowReplyStreamStopsAtScanWindow) {
    Discovery discovery{1};
    socket_->set_read_delay(50);
    socket_->set_flood(Endpoint{"10.0.0.5", PORT}, discover_reply(kSocketMac, "SOC002"));

    auto start = std::chrono::steady_clock::now();
    DeviceMap devices = discovery.discover_all(*transport_);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(devices.size(), 1u);
    EXPECT_LT(socket_->reads(), Discovery::MAX_REPLIES);
    EXPECT_GE(elapsed, std::chrono::milliseconds(1000));
    EXPECT_LT(elapsed, std::chrono::milliseconds(2500));
}
