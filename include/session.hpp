#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <set>
#include <vector>
#include <chrono>
#include <functional>
#include <boost/asio.hpp>
#include "transfer.hpp"
#include "entries.hpp"
#include "admission.hpp"
#include "protocol/messages.hpp"

namespace transfer {

using StatusCallback = std::function<void(const std::string&)>;

struct SessionCallbacks {
    StatusCallback on_status;
    StatusCallback on_debug;
    TransferProgressCallback on_progress;
};

enum class SessionState {
    IDLE,
    HANDSHAKING,
    ESTABLISHED,
    META_SENT,
    AWAITING_ADMISSION,
    STREAMING,
    VERIFYING,
    CLOSED
};

const char* state_name(SessionState state);

struct Session {
    std::string session_id;
    std::string protocol_version;
    std::set<std::string> capabilities;
    std::chrono::seconds keepalive_interval{0};
};

struct TransferOutcome {
    bool ok = false;
    protocol::ErrorCode error_code = protocol::ErrorCode::NONE;
    std::string reason;
    uint64_t received_bytes = 0;
    std::vector<uint8_t> checksum;
};

enum class EntryStatus {
    TRANSFERRED, // file streamed, see outcome
    CREATED,     // directory accepted, nothing streamed
    REJECTED     // receiver refused at preflight
};

struct EntryResult {
    EntryStatus status = EntryStatus::REJECTED;
    protocol::ErrorCode error_code = protocol::ErrorCode::NONE;
    std::string reason;
    TransferOutcome outcome;
};

// "session_" followed by 16 random alphanumerics
std::string generate_session_id();

// Drives one connection from the sending side
class SenderSession {
public:
    SenderSession(boost::asio::ip::tcp::socket& socket, std::string session_id,
                  SessionCallbacks callbacks = {});

    const Session& handshake(const std::string& client_name, bool want_checksum = true);

    // Meta, preflight and, for accepted files, TransferStart, raw bytes and
    // TransferResult. A failed TransferResult is returned, not thrown.
    EntryResult transfer_entry(const entries::Entry& entry, bool tree_member);

    void close();

    SessionState state() const { return state_; }
    const Session& session() const { return session_; }

private:
    void expect_session(const std::string& session_id) const;
    void debug(const std::string& message) const;

    boost::asio::ip::tcp::socket& socket_;
    Session session_;
    SessionCallbacks callbacks_;
    SessionState state_ = SessionState::IDLE;
};

struct ReceiveSummary {
    size_t files_received = 0;
    size_t directories_created = 0;
    size_t entries_skipped = 0;
    size_t entries_failed = 0;
    uint64_t bytes_received = 0;

    // First non-ok result of the session, NONE if everything was accepted
    protocol::ErrorCode first_error = protocol::ErrorCode::NONE;
    std::string first_error_reason;

    void merge(const ReceiveSummary& other);
};

// Serves one connection from the receiving side
class ReceiverSession {
public:
    ReceiverSession(boost::asio::ip::tcp::socket& socket, admission::AdmissionController& admission,
                    bool verify_checksum, SessionCallbacks callbacks = {});

    const Session& handshake();

    // Handles one Meta exchange; false once the peer closed at a message boundary
    bool serve_next_entry();

    // handshake() then entries until the sender hangs up
    ReceiveSummary serve();

    SessionState state() const { return state_; }
    const Session& session() const { return session_; }
    const ReceiveSummary& summary() const { return summary_; }

private:
    void handle_meta(const protocol::Meta& meta);
    void reject(const protocol::FileMeta& file, protocol::ErrorCode code, const std::string& reason);
    void record_failure(protocol::ErrorCode code, const std::string& reason);
    void apply_attributes(const std::filesystem::path& path, const protocol::FileMeta& file) const;
    void expect_session(const std::string& session_id) const;
    void debug(const std::string& message) const;

    boost::asio::ip::tcp::socket& socket_;
    admission::AdmissionController& admission_;
    bool verify_checksum_;
    SessionCallbacks callbacks_;
    Session session_;
    SessionState state_ = SessionState::IDLE;
    ReceiveSummary summary_;
};

} // namespace transfer
