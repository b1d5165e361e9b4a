#include "client/bridge_client.hpp"
#include "client/errors.hpp"
#include "common/logger.hpp"

#include <algorithm>

namespace bridgelink::client {

namespace {
auto& log() { return Logger::get("client.bridge"); }
} // anonymous namespace

// ============================================================================
// AdbSocket
// ============================================================================

AdbSocket::AdbSocket(SessionHandle handle) : handle_(std::move(handle)) {}

cobalt::task<AdbSocket> AdbSocket::open(SessionConnector& connector, std::string service) {
    auto session = co_await connector.connect();
    if (!session) {
        throw TransportFailure(std::move(session.error()));
    }

    AdbSocket socket(std::move(*session));
    socket.send_request(service);
    co_await socket.read_okay();
    log().trace("Service '{}' accepted", service);
    co_return socket;
}

void AdbSocket::send_request(std::string_view service) {
    handle_.write(adb::encode_request(service));
}

cobalt::task<void> AdbSocket::read_okay() {
    auto status = co_await read_exact(adb::kStatusSize);
    std::string_view text(reinterpret_cast<const char*>(status.data()), status.size());

    if (text == adb::kOkay) {
        co_return;
    }
    if (text == adb::kFail) {
        auto message = co_await read_hex_prefixed_string();
        throw AdbServerError(message);
    }
    throw AdbServerError("unexpected reply status '" + std::string(text) + "'");
}

cobalt::task<Bytes> AdbSocket::read_exact(size_t size) {
    while (buffer_.size() < size) {
        auto chunk = co_await handle_.read();
        if (!chunk) {
            throw AdbServerError("connection closed after " + std::to_string(buffer_.size()) +
                                 " of " + std::to_string(size) + " bytes");
        }
        buffer_.insert(buffer_.end(), chunk->begin(), chunk->end());
    }

    Bytes out(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(size));
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(size));
    co_return out;
}

cobalt::task<std::string> AdbSocket::read_hex_prefixed_string() {
    auto prefix = co_await read_exact(adb::kLengthSize);
    auto length = adb::parse_hex_length(
        std::string_view(reinterpret_cast<const char*>(prefix.data()), prefix.size()));
    if (!length) {
        throw AdbServerError("invalid length prefix in reply");
    }
    auto payload = co_await read_exact(*length);
    co_return std::string(payload.begin(), payload.end());
}

cobalt::task<std::string> AdbSocket::read_to_end() {
    std::string out(buffer_.begin(), buffer_.end());
    buffer_.clear();
    while (auto chunk = co_await handle_.read()) {
        out.append(chunk->begin(), chunk->end());
    }
    co_return out;
}

// ============================================================================
// AdbBridgeClient
// ============================================================================

AdbBridgeClient::AdbBridgeClient(std::shared_ptr<SessionConnector> connector)
    : connector_(std::move(connector)) {}

cobalt::task<DeviceSnapshot> AdbBridgeClient::get_devices() {
    auto socket = co_await AdbSocket::open(*connector_, adb::devices_service());
    auto text = co_await socket.read_hex_prefixed_string();
    socket.close();

    auto devices = adb::parse_device_list(text);
    log().trace("Relay listed {} device(s)", devices.size());
    co_return devices;
}

cobalt::task<uint32_t> AdbBridgeClient::get_version() {
    auto socket = co_await AdbSocket::open(*connector_, adb::version_service());
    auto text = co_await socket.read_hex_prefixed_string();
    socket.close();

    auto version = adb::parse_hex_length(text);
    if (!version) {
        throw AdbServerError("invalid version reply '" + text + "'");
    }
    co_return static_cast<uint32_t>(*version);
}

cobalt::task<std::shared_ptr<DeviceSession>> AdbBridgeClient::create_device_session(DeviceRecord device) {
    auto socket = co_await AdbSocket::open(*connector_, adb::transport_by_serial_service(device.serial));
    auto id_bytes = co_await socket.read_exact(8);
    socket.close();

    auto transport_id = adb::decode_transport_id(id_bytes);
    log().info("Device {} reachable through relay (transport {})", device.serial, transport_id);

    co_return std::make_shared<AdbServerDeviceSession>(connector_, device.serial, transport_id);
}

// ============================================================================
// AdbServerDeviceSession
// ============================================================================

AdbServerDeviceSession::AdbServerDeviceSession(std::shared_ptr<SessionConnector> connector,
                                               std::string serial,
                                               uint64_t transport_id)
    : connector_(std::move(connector))
    , serial_(std::move(serial))
    , transport_id_(transport_id) {}

void AdbServerDeviceSession::track(AdbSocket& socket) {
    auto stream = socket.handle().stream();
    {
        std::lock_guard lock(mutex_);
        if (!closed_) {
            std::erase_if(sockets_, [](const std::weak_ptr<DuplexStream>& s) { return s.expired(); });
            sockets_.push_back(std::move(stream));
            return;
        }
    }

    // Opened while close() ran
    socket.close();
    throw AdbServerError("device session " + serial_ + " is closed");
}

cobalt::task<AdbSocket> AdbServerDeviceSession::open_service(std::string service) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            throw AdbServerError("device session " + serial_ + " is closed");
        }
    }
    auto socket = co_await AdbSocket::open(*connector_, std::move(service));
    track(socket);
    co_return socket;
}

cobalt::task<AdbSocket> AdbServerDeviceSession::open_shell(std::string command) {
    auto socket = co_await open_service(adb::switch_transport_service(transport_id_));
    socket.send_request(adb::shell_service(command));
    co_await socket.read_okay();
    co_return socket;
}

cobalt::task<void> AdbServerDeviceSession::transport_disconnected() {
    // First OKAY: request accepted. Second OKAY: device gone.
    auto socket = co_await open_service(adb::wait_for_disconnect_service(transport_id_));
    co_await socket.read_okay();
    socket.close();
}

cobalt::task<std::string> AdbServerDeviceSession::spawn_wait_text(std::string command) {
    auto socket = co_await open_shell(std::move(command));
    co_return co_await socket.read_to_end();
}

cobalt::task<void> AdbServerDeviceSession::spawn_and_wait(std::string command) {
    auto socket = co_await open_shell(std::move(command));
    auto output = co_await socket.read_to_end();
    log().trace("{}: command finished ({} bytes of output)", serial_, output.size());
}

void AdbServerDeviceSession::close() {
    std::vector<std::weak_ptr<DuplexStream>> sockets;
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        closed_ = true;
        sockets.swap(sockets_);
    }

    log().debug("{}: closing {} relay socket(s)", serial_, sockets.size());
    for (auto& weak : sockets) {
        if (auto stream = weak.lock()) {
            stream->close();
        }
    }
}

} // namespace bridgelink::client
