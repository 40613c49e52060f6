#include "transfer.hpp"
#include "checksum.hpp"
#include "pending_write.hpp"
#include "errors.hpp"
#include <vector>
#include <array>
#include <fstream>
#include <chrono>
#include <algorithm>

namespace transfer {

namespace {

bool is_disconnect(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::broken_pipe;
}

void read_exact(boost::asio::ip::tcp::socket& socket, void* data, size_t size, const char* what) {
    boost::system::error_code ec;
    size_t n = boost::asio::read(socket, boost::asio::buffer(data, size), ec);
    if (is_disconnect(ec)) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::TRUNCATED,
            std::string("connection closed in ") + what + " after " + std::to_string(n) +
            " of " + std::to_string(size) + " bytes");
    }
    if (ec) {
        throw errors::IoError(std::string("recv: ") + ec.message());
    }
}

void write_all(boost::asio::ip::tcp::socket& socket, const boost::asio::const_buffer& data) {
    boost::system::error_code ec;
    boost::asio::write(socket, data, ec);
    if (ec) {
        throw errors::IoError(std::string("send: ") + ec.message());
    }
}

std::optional<protocol::Envelope> read_envelope(boost::asio::ip::tcp::socket& socket, bool allow_eof) {
    std::array<uint8_t, protocol::HEADER_SIZE> buf;
    boost::system::error_code ec;
    size_t n = boost::asio::read(socket, boost::asio::buffer(buf), ec);
    if (ec) {
        if (allow_eof && n == 0 && ec == boost::asio::error::eof) {
            return std::nullopt;
        }
        if (is_disconnect(ec)) {
            throw errors::ProtocolError(errors::ProtocolErrorKind::TRUNCATED,
                "connection closed in message header after " + std::to_string(n) + " bytes");
        }
        throw errors::IoError(std::string("recv: ") + ec.message());
    }

    protocol::PacketHeader header = protocol::deserialize_header(buf);

    // Checked before the payload buffer exists
    if (header.payload_size > protocol::MAX_PAYLOAD_SIZE) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::OVERSIZED_MESSAGE,
            "declared length " + std::to_string(header.payload_size) +
            " exceeds limit " + std::to_string(protocol::MAX_PAYLOAD_SIZE));
    }
    if (!protocol::is_known_type(header.type)) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::UNKNOWN_MESSAGE_TYPE,
            "type tag " + std::to_string(header.type));
    }

    protocol::Envelope envelope{static_cast<protocol::MessageType>(header.type), std::string()};
    if (header.payload_size > 0) {
        envelope.payload.resize(header.payload_size);
        read_exact(socket, &envelope.payload[0], header.payload_size, "message payload");
    }
    return envelope;
}

// Calls back at most every 300ms, and always on the last byte
class ProgressTracker {
public:
    ProgressTracker(const std::string& name, uint64_t total, TransferProgressCallback cb)
        : name_(name), total_(total), cb_(std::move(cb)),
          start_time_(std::chrono::steady_clock::now()), last_cb_time_(start_time_) {}

    void advance(uint64_t done) {
        if (!cb_) return;
        auto now = std::chrono::steady_clock::now();
        auto elapsed_since_cb = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_cb_time_).count();
        if (elapsed_since_cb >= 300 || done == total_) {
            double elapsed = std::chrono::duration<double>(now - start_time_).count();
            double speed = (elapsed > 0) ? (done / elapsed / (1024.0 * 1024.0)) : 0;
            cb_(name_, done, total_, speed);
            last_cb_time_ = now;
        }
    }

private:
    std::string name_;
    uint64_t total_;
    TransferProgressCallback cb_;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_cb_time_;
};

} // namespace

void MessageSender::send_envelope(boost::asio::ip::tcp::socket& socket, protocol::MessageType type,
                                  const std::string& payload) {
    if (payload.size() > protocol::MAX_PAYLOAD_SIZE) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::OVERSIZED_MESSAGE,
            std::string("refusing to send ") + protocol::type_name(type) + " of " +
            std::to_string(payload.size()) + " bytes");
    }

    protocol::PacketHeader header{static_cast<uint8_t>(type), static_cast<uint32_t>(payload.size())};
    auto buf = protocol::serialize_header(header);

    std::array<boost::asio::const_buffer, 2> buffers{
        boost::asio::buffer(buf),
        boost::asio::buffer(payload)
    };
    boost::system::error_code ec;
    boost::asio::write(socket, buffers, ec);
    if (ec) {
        throw errors::IoError(std::string("send: ") + ec.message());
    }
}

void MessageSender::send_file(boost::asio::ip::tcp::socket& socket, const std::filesystem::path& filepath,
                              uint64_t file_size, TransferProgressCallback progress_cb) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw errors::IoError("Could not open file for reading: " + filepath.string());
    }

    ProgressTracker progress(filepath.filename().string(), file_size, std::move(progress_cb));
    std::vector<char> buffer(protocol::CHUNK_SIZE);
    uint64_t total_sent = 0;

    while (total_sent < file_size) {
        size_t to_read = static_cast<size_t>(std::min<uint64_t>(file_size - total_sent, buffer.size()));
        file.read(buffer.data(), static_cast<std::streamsize>(to_read));
        std::streamsize bytes_read = file.gcount();
        if (bytes_read <= 0) {
            throw errors::IoError("File size mismatch: sent " + std::to_string(total_sent) +
                                  " bytes, expected " + std::to_string(file_size) +
                                  " (" + filepath.string() + ")");
        }

        write_all(socket, boost::asio::buffer(buffer.data(), static_cast<size_t>(bytes_read)));
        total_sent += static_cast<uint64_t>(bytes_read);
        progress.advance(total_sent);
    }
}

protocol::Envelope MessageReceiver::receive_envelope(boost::asio::ip::tcp::socket& socket) {
    return *read_envelope(socket, false);
}

std::optional<protocol::Envelope> MessageReceiver::try_receive_envelope(boost::asio::ip::tcp::socket& socket) {
    return read_envelope(socket, true);
}

uint64_t MessageReceiver::receive_file(boost::asio::ip::tcp::socket& socket, storage::PendingWrite& pending,
                                       uint64_t expected_size, checksum::StreamingChecksum* hasher,
                                       const std::string& name, TransferProgressCallback progress_cb) {
    ProgressTracker progress(name, expected_size, std::move(progress_cb));
    std::vector<char> buffer(protocol::CHUNK_SIZE);
    uint64_t total_received = 0;

    // Never reads past expected_size: the next envelope follows immediately
    while (total_received < expected_size) {
        size_t to_read = static_cast<size_t>(std::min<uint64_t>(expected_size - total_received, buffer.size()));
        read_exact(socket, buffer.data(), to_read, "file data");

        pending.write(buffer.data(), to_read);
        if (hasher) {
            hasher->update(buffer.data(), to_read);
        }
        total_received += to_read;
        progress.advance(total_received);
    }
    return total_received;
}

} // namespace transfer
