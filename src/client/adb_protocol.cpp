#include "client/adb_protocol.hpp"

#include <charconv>
#include <stdexcept>

namespace bridgelink::client {

namespace {

struct StateName {
    std::string_view text;
    DeviceState state;
};

constexpr StateName kStateNames[] = {
    {"device", DeviceState::DEVICE},
    {"unauthorized", DeviceState::UNAUTHORIZED},
    {"authorizing", DeviceState::AUTHORIZING},
    {"offline", DeviceState::OFFLINE},
    {"no permissions", DeviceState::NO_PERMISSIONS},
    {"bootloader", DeviceState::BOOTLOADER},
    {"recovery", DeviceState::RECOVERY},
    {"sideload", DeviceState::SIDELOAD},
    {"rescue", DeviceState::RESCUE},
    {"host", DeviceState::HOST},
    {"connecting", DeviceState::CONNECTING},
    {"unknown", DeviceState::UNKNOWN},
};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && is_space(line[pos])) ++pos;
        size_t start = pos;
        while (pos < line.size() && !is_space(line[pos])) ++pos;
        if (pos > start) {
            fields.push_back(line.substr(start, pos - start));
        }
    }
    return fields;
}

} // anonymous namespace

const char* device_state_name(DeviceState state) {
    for (const auto& entry : kStateNames) {
        if (entry.state == state) {
            return entry.text.data();
        }
    }
    return "unknown";
}

DeviceState parse_device_state(std::string_view text) {
    for (const auto& entry : kStateNames) {
        if (entry.text == text) {
            return entry.state;
        }
    }
    return DeviceState::UNKNOWN;
}

bool snapshots_equal(const DeviceSnapshot& a, const DeviceSnapshot& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (!(a[i] == b[i])) {
            return false;
        }
    }
    return true;
}

DeviceSnapshot filter_ready_devices(DeviceSnapshot snapshot) {
    std::erase_if(snapshot, [](const DeviceRecord& r) {
        return r.state != DeviceState::DEVICE;
    });
    return snapshot;
}

namespace adb {

std::string encode_hex_length(size_t length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    if (length > kMaxPayload) {
        throw std::length_error("ADB payload too long: " + std::to_string(length));
    }
    std::string out(kLengthSize, '0');
    for (size_t i = 0; i < kLengthSize; ++i) {
        out[kLengthSize - 1 - i] = kDigits[(length >> (4 * i)) & 0xF];
    }
    return out;
}

Bytes encode_request(std::string_view service) {
    auto prefix = encode_hex_length(service.size());
    Bytes out;
    out.reserve(kLengthSize + service.size());
    out.insert(out.end(), prefix.begin(), prefix.end());
    out.insert(out.end(), service.begin(), service.end());
    return out;
}

std::optional<size_t> parse_hex_length(std::string_view digits) {
    if (digits.size() != kLengthSize) {
        return std::nullopt;
    }
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

uint64_t decode_transport_id(std::span<const uint8_t> data) {
    if (data.size() < 8) {
        throw std::invalid_argument("transport id needs 8 bytes");
    }
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[i]) << (8 * i);
    }
    return value;
}

DeviceSnapshot parse_device_list(std::string_view text) {
    DeviceSnapshot devices;

    while (!text.empty()) {
        auto eol = text.find('\n');
        auto line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);

        auto fields = split_fields(line);
        if (fields.size() < 2) {
            continue;
        }

        DeviceRecord record;
        record.serial = std::string(fields[0]);

        size_t next = 2;
        if (fields[1] == "no" && fields.size() > 2 && fields[2] == "permissions") {
            record.state = DeviceState::NO_PERMISSIONS;
            next = 3;
        } else {
            record.state = parse_device_state(fields[1]);
        }

        for (size_t i = next; i < fields.size(); ++i) {
            auto field = fields[i];
            auto colon = field.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            auto key = field.substr(0, colon);
            auto value = field.substr(colon + 1);

            if (key == "product") {
                record.product = std::string(value);
            } else if (key == "model") {
                record.model = std::string(value);
            } else if (key == "device") {
                record.device = std::string(value);
            } else if (key == "transport_id") {
                uint64_t id = 0;
                auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), id);
                if (ec == std::errc{} && ptr == value.data() + value.size()) {
                    record.transport_id = id;
                }
            }
        }

        devices.push_back(std::move(record));
    }

    return devices;
}

std::string devices_service() {
    return "host:devices-l";
}

std::string version_service() {
    return "host:version";
}

std::string transport_by_serial_service(std::string_view serial) {
    return "host:tport:serial:" + std::string(serial);
}

std::string switch_transport_service(uint64_t transport_id) {
    return "host:transport-id:" + std::to_string(transport_id);
}

std::string wait_for_disconnect_service(uint64_t transport_id) {
    return "host-transport-id:" + std::to_string(transport_id) + ":wait-for-any-disconnect";
}

std::string shell_service(std::string_view command) {
    return "shell:" + std::string(command);
}

} // namespace adb

} // namespace bridgelink::client
