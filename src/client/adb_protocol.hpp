#pragma once

#include "common/byte_channel.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bridgelink::client {

// ============================================================================
// Device records as listed by the relay (host:devices-l)
// ============================================================================
enum class DeviceState : uint8_t {
    DEVICE,
    UNAUTHORIZED,
    AUTHORIZING,
    OFFLINE,
    NO_PERMISSIONS,
    BOOTLOADER,
    RECOVERY,
    SIDELOAD,
    RESCUE,
    HOST,
    CONNECTING,
    UNKNOWN,
};

const char* device_state_name(DeviceState state);
DeviceState parse_device_state(std::string_view text);

struct DeviceRecord {
    std::string serial;
    DeviceState state = DeviceState::UNKNOWN;
    std::optional<std::string> product;
    std::optional<std::string> model;
    std::optional<std::string> device;
    std::optional<uint64_t> transport_id;

    bool operator==(const DeviceRecord&) const = default;
};

using DeviceSnapshot = std::vector<DeviceRecord>;

// Same length and equal records at every index. Reordering the same devices
// counts as a change.
bool snapshots_equal(const DeviceSnapshot& a, const DeviceSnapshot& b);

// Keeps the records that are ready for use (state "device")
DeviceSnapshot filter_ready_devices(DeviceSnapshot snapshot);

namespace adb {

// ============================================================================
// Smart-socket wire format
//
//   request : <4 hex digits length><service>
//   reply   : "OKAY" | "FAIL" <4 hex digits length><message>
// ============================================================================
inline constexpr std::string_view kOkay = "OKAY";
inline constexpr std::string_view kFail = "FAIL";
inline constexpr size_t kStatusSize = 4;
inline constexpr size_t kLengthSize = 4;
inline constexpr size_t kMaxPayload = 0xFFFF;

// Throws std::length_error if the service does not fit the length prefix
Bytes encode_request(std::string_view service);

std::string encode_hex_length(size_t length);

// nullopt unless exactly four hex digits
std::optional<size_t> parse_hex_length(std::string_view digits);

uint64_t decode_transport_id(std::span<const uint8_t> data);

// Lines of "host:devices-l" output. Lines without a serial and a state are
// skipped.
DeviceSnapshot parse_device_list(std::string_view text);

// Service names
std::string devices_service();
std::string version_service();
std::string transport_by_serial_service(std::string_view serial);
std::string switch_transport_service(uint64_t transport_id);
std::string wait_for_disconnect_service(uint64_t transport_id);
std::string shell_service(std::string_view command);

} // namespace adb

} // namespace bridgelink::client
