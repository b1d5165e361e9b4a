#include <gtest/gtest.h>
#include "client/adb_protocol.hpp"

using namespace bridgelink;
using namespace bridgelink::client;

TEST(AdbProtocolTest, EncodeRequestPrefixesHexLength) {
    auto encoded = adb::encode_request("host:devices-l");
    EXPECT_EQ(std::string(encoded.begin(), encoded.end()), "000ehost:devices-l");
}

TEST(AdbProtocolTest, EncodeRequestRejectsOversizedService) {
    std::string service(0x10000, 'x');
    EXPECT_THROW(adb::encode_request(service), std::length_error);
}

TEST(AdbProtocolTest, ParseHexLength) {
    EXPECT_EQ(adb::parse_hex_length("0000"), 0u);
    EXPECT_EQ(adb::parse_hex_length("001f"), 31u);
    EXPECT_EQ(adb::parse_hex_length("FFFF"), 0xFFFFu);
    EXPECT_FALSE(adb::parse_hex_length("12").has_value());
    EXPECT_FALSE(adb::parse_hex_length("00g1").has_value());
}

TEST(AdbProtocolTest, DecodeTransportIdLittleEndian) {
    std::vector<uint8_t> data = {0x2a, 0x01, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(adb::decode_transport_id(data), 0x012au);

    std::vector<uint8_t> short_data = {1, 2, 3};
    EXPECT_THROW(adb::decode_transport_id(short_data), std::invalid_argument);
}

TEST(AdbProtocolTest, ServiceNames) {
    EXPECT_EQ(adb::transport_by_serial_service("ABC123"), "host:tport:serial:ABC123");
    EXPECT_EQ(adb::switch_transport_service(7), "host:transport-id:7");
    EXPECT_EQ(adb::wait_for_disconnect_service(7), "host-transport-id:7:wait-for-any-disconnect");
    EXPECT_EQ(adb::shell_service("read"), "shell:read");
}

TEST(AdbProtocolTest, ParseDeviceList) {
    auto devices = adb::parse_device_list(
        "1WMHH815K91234         device usb:1-1 product:hollywood model:Quest_2 device:hollywood transport_id:3\n"
        "emulator-5554          unauthorized transport_id:4\n"
        "\n"
        "2G0YC1ZF8B0123         no permissions (user not in plugdev group); see [http://developer.android.com/tools/device.html] usb:1-2 transport_id:5\n");

    ASSERT_EQ(devices.size(), 3u);

    EXPECT_EQ(devices[0].serial, "1WMHH815K91234");
    EXPECT_EQ(devices[0].state, DeviceState::DEVICE);
    EXPECT_EQ(devices[0].product, "hollywood");
    EXPECT_EQ(devices[0].model, "Quest_2");
    EXPECT_EQ(devices[0].device, "hollywood");
    EXPECT_EQ(devices[0].transport_id, 3u);

    EXPECT_EQ(devices[1].state, DeviceState::UNAUTHORIZED);
    EXPECT_FALSE(devices[1].model.has_value());

    EXPECT_EQ(devices[2].state, DeviceState::NO_PERMISSIONS);
    EXPECT_EQ(devices[2].transport_id, 5u);
}

TEST(AdbProtocolTest, DeviceStateNames) {
    EXPECT_EQ(parse_device_state("authorizing"), DeviceState::AUTHORIZING);
    EXPECT_EQ(parse_device_state("bogus"), DeviceState::UNKNOWN);
    EXPECT_STREQ(device_state_name(DeviceState::OFFLINE), "offline");
}

namespace {

DeviceRecord record(std::string serial, DeviceState state) {
    DeviceRecord r;
    r.serial = std::move(serial);
    r.state = state;
    return r;
}

} // namespace

TEST(SnapshotTest, EqualWhenSameRecordsSameOrder) {
    DeviceSnapshot a = {record("A", DeviceState::DEVICE), record("B", DeviceState::DEVICE)};
    DeviceSnapshot b = a;
    EXPECT_TRUE(snapshots_equal(a, b));
    EXPECT_TRUE(snapshots_equal({}, {}));
}

TEST(SnapshotTest, ReorderingCountsAsChange) {
    DeviceSnapshot a = {record("A", DeviceState::DEVICE), record("B", DeviceState::DEVICE)};
    DeviceSnapshot b = {record("B", DeviceState::DEVICE), record("A", DeviceState::DEVICE)};
    EXPECT_FALSE(snapshots_equal(a, b));
}

TEST(SnapshotTest, AnyFieldDifferenceCountsAsChange) {
    DeviceSnapshot a = {record("A", DeviceState::DEVICE)};
    DeviceSnapshot b = a;
    b[0].model = "Quest_3";
    EXPECT_FALSE(snapshots_equal(a, b));

    DeviceSnapshot c = {record("A", DeviceState::DEVICE), record("B", DeviceState::DEVICE)};
    EXPECT_FALSE(snapshots_equal(a, c));
}

TEST(SnapshotTest, FilterKeepsReadyDevicesOnly) {
    DeviceSnapshot all = {
        record("A", DeviceState::DEVICE),
        record("B", DeviceState::AUTHORIZING),
        record("C", DeviceState::UNAUTHORIZED),
        record("D", DeviceState::OFFLINE),
        record("E", DeviceState::DEVICE),
    };
    auto ready = filter_ready_devices(all);
    ASSERT_EQ(ready.size(), 2u);
    EXPECT_EQ(ready[0].serial, "A");
    EXPECT_EQ(ready[1].serial, "E");
}
