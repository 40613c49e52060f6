#pragma once

#include <string>
#include <functional>
#include <optional>
#include <filesystem>
#include <boost/asio.hpp>
#include "protocol/packet.hpp"
#include "protocol/messages.hpp"

namespace checksum { class StreamingChecksum; }
namespace storage { class PendingWrite; }

namespace transfer {

// Progress callback: filename, bytes_transferred, bytes_total, speed_mbps
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;

class MessageSender {
public:
    // Writes one envelope; the whole buffer is on the socket when this returns
    static void send_envelope(boost::asio::ip::tcp::socket& socket, protocol::MessageType type,
                              const std::string& payload);

    template <typename Message>
    static void send_message(boost::asio::ip::tcp::socket& socket, const Message& message) {
        send_envelope(socket, Message::TYPE, protocol::encode(message));
    }

    // Streams exactly file_size raw bytes of filepath, unframed.
    // Throws errors::IoError if the file ends early.
    static void send_file(boost::asio::ip::tcp::socket& socket, const std::filesystem::path& filepath,
                          uint64_t file_size, TransferProgressCallback progress_cb = nullptr);
};

class MessageReceiver {
public:
    // Blocks for a full envelope. Any EOF is ProtocolError(TRUNCATED).
    static protocol::Envelope receive_envelope(boost::asio::ip::tcp::socket& socket);

    // Same, but an EOF before the first header byte returns nullopt
    static std::optional<protocol::Envelope> try_receive_envelope(boost::asio::ip::tcp::socket& socket);

    template <typename Message>
    static Message receive_message(boost::asio::ip::tcp::socket& socket) {
        return protocol::decode<Message>(receive_envelope(socket));
    }

    // Reads exactly expected_size raw bytes into pending, feeding hasher if given
    static uint64_t receive_file(boost::asio::ip::tcp::socket& socket, storage::PendingWrite& pending,
                                 uint64_t expected_size, checksum::StreamingChecksum* hasher,
                                 const std::string& name, TransferProgressCallback progress_cb = nullptr);
};

} // namespace transfer
