#include "session.hpp"
#include "checksum.hpp"
#include "pending_write.hpp"
#include "diskspace.hpp"
#include "errors.hpp"
#include <sodium.h>
#include <ctime>
#include <stdexcept>
#include <fcntl.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace transfer {

namespace {

constexpr const char* CAP_RAW_TRANSFER = "raw-transfer";
constexpr const char* CAP_DIRECTORIES = "directories";
constexpr const char* CAP_CHECKSUM_BLAKE2B = "checksum:blake2b";

std::string major_version(const std::string& version) {
    return version.substr(0, version.find('.'));
}

} // namespace

const char* state_name(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "Idle";
        case SessionState::HANDSHAKING: return "Handshaking";
        case SessionState::ESTABLISHED: return "Established";
        case SessionState::META_SENT: return "MetaSent";
        case SessionState::AWAITING_ADMISSION: return "AwaitingAdmission";
        case SessionState::STREAMING: return "Streaming";
        case SessionState::VERIFYING: return "Verifying";
        case SessionState::CLOSED: return "Closed";
    }
    return "Unknown";
}

std::string generate_session_id() {
    if (sodium_init() < 0) {
        throw errors::NcpError("libsodium initialization failed", errors::ExitCode::GENERAL_ERROR);
    }
    const char charset[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    std::string id = "session_";
    for (int i = 0; i < 16; ++i) {
        id += charset[randombytes_uniform(sizeof(charset) - 1)];
    }
    return id;
}

// ─── SenderSession ──────────────────────────────────────────────────────────

SenderSession::SenderSession(boost::asio::ip::tcp::socket& socket, std::string session_id,
                             SessionCallbacks callbacks)
    : socket_(socket), callbacks_(std::move(callbacks)) {
    session_.session_id = std::move(session_id);
    session_.protocol_version = protocol::PROTOCOL_VERSION;
}

const Session& SenderSession::handshake(const std::string& client_name, bool want_checksum) {
    if (state_ != SessionState::IDLE) {
        throw std::logic_error(std::string("handshake in state ") + state_name(state_));
    }
    state_ = SessionState::HANDSHAKING;

    protocol::Probe probe;
    probe.session_id = session_.session_id;
    probe.protocol_version = protocol::PROTOCOL_VERSION;
    probe.client_name = client_name;
    probe.capabilities = {CAP_RAW_TRANSFER, CAP_DIRECTORIES};
    if (want_checksum) {
        probe.capabilities.push_back(CAP_CHECKSUM_BLAKE2B);
    }
    probe.keepalive_seconds = protocol::DEFAULT_KEEPALIVE_SECONDS;

    debug("Sending Probe with session_id: " + session_.session_id);
    MessageSender::send_message(socket_, probe);

    auto established = MessageReceiver::receive_message<protocol::Established>(socket_);
    expect_session(established.session_id);
    if (major_version(established.protocol_version) != major_version(protocol::PROTOCOL_VERSION)) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::VERSION_MISMATCH,
            "receiver speaks " + established.protocol_version);
    }

    session_.protocol_version = established.protocol_version;
    session_.capabilities.insert(established.capabilities.begin(), established.capabilities.end());
    session_.keepalive_interval = std::chrono::seconds(probe.keepalive_seconds);
    state_ = SessionState::ESTABLISHED;

    if (want_checksum && !session_.capabilities.count(CAP_CHECKSUM_BLAKE2B)) {
        debug("Receiver does not verify checksums");
    }
    if (callbacks_.on_status) callbacks_.on_status("Connection established");
    return session_;
}

EntryResult SenderSession::transfer_entry(const entries::Entry& entry, bool tree_member) {
    if (state_ != SessionState::ESTABLISHED) {
        throw std::logic_error(std::string("transfer_entry in state ") + state_name(state_));
    }

    protocol::Meta meta{session_.session_id, entries::to_file_meta(entry, tree_member)};
    MessageSender::send_message(socket_, meta);
    state_ = SessionState::META_SENT;
    debug("Meta sent: " + meta.file.name + " (" + std::to_string(entry.size) + " bytes)");

    state_ = SessionState::AWAITING_ADMISSION;
    protocol::Envelope reply = MessageReceiver::receive_envelope(socket_);

    EntryResult result;
    if (reply.type == protocol::MessageType::PREFLIGHT_FAIL) {
        auto fail = protocol::decode<protocol::PreflightFail>(reply);
        expect_session(fail.session_id);
        state_ = SessionState::ESTABLISHED;

        result.status = EntryStatus::REJECTED;
        result.error_code = fail.code;
        result.reason = fail.reason.empty()
            ? std::string("Preflight failed with code: ") + protocol::error_code_name(fail.code)
            : fail.reason;
        return result;
    }

    auto ok = protocol::decode<protocol::PreflightOk>(reply);
    expect_session(ok.session_id);
    debug("Preflight check passed, receiver has " + storage::format_size(ok.available_space) + " free");

    if (entry.is_directory) {
        state_ = SessionState::ESTABLISHED;
        result.status = EntryStatus::CREATED;
        return result;
    }

    state_ = SessionState::STREAMING;
    MessageSender::send_message(socket_, protocol::TransferStart{session_.session_id, entry.size});
    MessageSender::send_file(socket_, entry.source_path, entry.size, callbacks_.on_progress);

    state_ = SessionState::VERIFYING;
    auto transfer_result = MessageReceiver::receive_message<protocol::TransferResult>(socket_);
    expect_session(transfer_result.session_id);
    state_ = SessionState::ESTABLISHED;

    result.status = EntryStatus::TRANSFERRED;
    result.outcome.ok = transfer_result.ok;
    result.outcome.error_code = transfer_result.code;
    result.outcome.received_bytes = transfer_result.received_bytes;
    result.outcome.checksum = transfer_result.checksum;
    result.outcome.reason = transfer_result.reason;
    if (!transfer_result.ok && result.outcome.reason.empty()) {
        result.outcome.reason = std::string("Transfer failed with code: ") +
                                protocol::error_code_name(transfer_result.code);
    }
    if (transfer_result.ok && transfer_result.received_bytes != entry.size) {
        debug("Warning: Received bytes (" + std::to_string(transfer_result.received_bytes) +
              ") != sent bytes (" + std::to_string(entry.size) + ")");
    }
    return result;
}

void SenderSession::close() {
    state_ = SessionState::CLOSED;
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec) {
        debug("shutdown: " + ec.message());
    }
}

void SenderSession::expect_session(const std::string& session_id) const {
    if (session_id != session_.session_id) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::SESSION_MISMATCH,
            "expected " + session_.session_id + ", got " + session_id);
    }
}

void SenderSession::debug(const std::string& message) const {
    if (callbacks_.on_debug) callbacks_.on_debug(message);
}

// ─── ReceiverSession ────────────────────────────────────────────────────────

void ReceiveSummary::merge(const ReceiveSummary& other) {
    files_received += other.files_received;
    directories_created += other.directories_created;
    entries_skipped += other.entries_skipped;
    entries_failed += other.entries_failed;
    bytes_received += other.bytes_received;
    if (first_error == protocol::ErrorCode::NONE) {
        first_error = other.first_error;
        first_error_reason = other.first_error_reason;
    }
}

ReceiverSession::ReceiverSession(boost::asio::ip::tcp::socket& socket,
                                 admission::AdmissionController& admission,
                                 bool verify_checksum, SessionCallbacks callbacks)
    : socket_(socket),
      admission_(admission),
      verify_checksum_(verify_checksum),
      callbacks_(std::move(callbacks)) {}

const Session& ReceiverSession::handshake() {
    if (state_ != SessionState::IDLE) {
        throw std::logic_error(std::string("handshake in state ") + state_name(state_));
    }
    state_ = SessionState::HANDSHAKING;

    auto probe = MessageReceiver::receive_message<protocol::Probe>(socket_);
    if (major_version(probe.protocol_version) != major_version(protocol::PROTOCOL_VERSION)) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::VERSION_MISMATCH,
            "sender speaks " + probe.protocol_version);
    }
    if (callbacks_.on_status) callbacks_.on_status("Received probe from client: " + probe.client_name);
    debug("Probe received: session_id=" + probe.session_id + ", client=" + probe.client_name);

    session_.session_id = probe.session_id;
    session_.protocol_version = protocol::PROTOCOL_VERSION;
    session_.keepalive_interval = std::chrono::seconds(probe.keepalive_seconds);
    session_.capabilities = {CAP_RAW_TRANSFER, CAP_DIRECTORIES};
    if (verify_checksum_) {
        session_.capabilities.insert(CAP_CHECKSUM_BLAKE2B);
    }

    protocol::Established established;
    established.session_id = session_.session_id;
    established.protocol_version = session_.protocol_version;
    established.capabilities.assign(session_.capabilities.begin(), session_.capabilities.end());
    established.server_time = static_cast<int64_t>(std::time(nullptr));
    MessageSender::send_message(socket_, established);

    state_ = SessionState::ESTABLISHED;
    return session_;
}

bool ReceiverSession::serve_next_entry() {
    if (state_ != SessionState::ESTABLISHED) {
        throw std::logic_error(std::string("serve_next_entry in state ") + state_name(state_));
    }

    auto envelope = MessageReceiver::try_receive_envelope(socket_);
    if (!envelope) {
        debug("Sender closed the session");
        state_ = SessionState::CLOSED;
        return false;
    }

    handle_meta(protocol::decode<protocol::Meta>(*envelope));
    return true;
}

ReceiveSummary ReceiverSession::serve() {
    handshake();
    while (serve_next_entry()) {
    }
    return summary_;
}

void ReceiverSession::handle_meta(const protocol::Meta& meta) {
    expect_session(meta.session_id);
    const protocol::FileMeta& file = meta.file;
    state_ = SessionState::AWAITING_ADMISSION;

    if (verify_checksum_ && !file.checksum.empty() && file.checksum_alg != checksum::ALGORITHM_BLAKE2B) {
        reject(file, protocol::ErrorCode::PROTOCOL, "Unsupported checksum algorithm: " + file.checksum_alg);
        return;
    }

    admission::AdmissionDecision decision = admission_.evaluate(file);
    if (!decision.accepted) {
        reject(file, decision.error_code, decision.reason);
        return;
    }

    debug("Receiving " + std::string(file.is_dir ? "directory" : "file") + ": " + file.name +
          " (" + storage::format_size(file.size) + ") to " + decision.final_path.string());
    MessageSender::send_message(socket_, protocol::PreflightOk{
        session_.session_id, decision.destination_exists, decision.available_space});

    if (file.is_dir) {
        summary_.directories_created++;
        state_ = SessionState::ESTABLISHED;
        return;
    }

    auto start = MessageReceiver::receive_message<protocol::TransferStart>(socket_);
    expect_session(start.session_id);
    if (start.file_size != file.size) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::MALFORMED,
            "TransferStart announces " + std::to_string(start.file_size) +
            " bytes, Meta announced " + std::to_string(file.size));
    }

    state_ = SessionState::STREAMING;
    storage::PendingWrite pending(decision.final_path);
    checksum::StreamingChecksum hasher;
    uint64_t received = MessageReceiver::receive_file(socket_, pending, start.file_size,
        verify_checksum_ ? &hasher : nullptr, file.name, callbacks_.on_progress);

    state_ = SessionState::VERIFYING;
    protocol::TransferResult result;
    result.session_id = session_.session_id;
    result.received_bytes = received;
    if (verify_checksum_) {
        result.checksum = hasher.finalize();
    }

    bool checksum_match = !verify_checksum_ || file.checksum.empty() || result.checksum == file.checksum;
    if (checksum_match) {
        pending.commit();
        apply_attributes(decision.final_path, file);
        result.ok = true;
        result.code = protocol::ErrorCode::NONE;
        summary_.files_received++;
        summary_.bytes_received += received;
        if (callbacks_.on_status) callbacks_.on_status("File saved to: " + decision.final_path.string());
    } else {
        pending.discard();
        result.ok = false;
        result.code = protocol::ErrorCode::CHECKSUM;
        result.reason = "Checksum mismatch";
        summary_.entries_failed++;
        record_failure(result.code, "Checksum verification failed for " + file.name);
        if (callbacks_.on_status) callbacks_.on_status("Checksum verification failed: " + file.name);
    }

    MessageSender::send_message(socket_, result);
    state_ = SessionState::ESTABLISHED;
}

void ReceiverSession::reject(const protocol::FileMeta& file, protocol::ErrorCode code, const std::string& reason) {
    if (callbacks_.on_status) callbacks_.on_status("Skipping " + file.name + ": " + reason);
    MessageSender::send_message(socket_, protocol::PreflightFail{session_.session_id, code, reason});
    summary_.entries_skipped++;
    record_failure(code, reason);
    state_ = SessionState::ESTABLISHED;
}

void ReceiverSession::record_failure(protocol::ErrorCode code, const std::string& reason) {
    if (summary_.first_error == protocol::ErrorCode::NONE) {
        summary_.first_error = code;
        summary_.first_error_reason = reason;
    }
}

void ReceiverSession::apply_attributes(const fs::path& path, const protocol::FileMeta& file) const {
    if (file.mode != 0) {
        std::error_code ec;
        fs::permissions(path, static_cast<fs::perms>(file.mode & 0777), ec);
        if (ec) debug("chmod " + path.string() + ": " + ec.message());
    }
    if (file.mtime > 0) {
        struct timespec times[2];
        times[0].tv_sec = 0;
        times[0].tv_nsec = UTIME_OMIT;
        times[1].tv_sec = static_cast<time_t>(file.mtime);
        times[1].tv_nsec = 0;
        if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
            debug("utimensat failed for " + path.string());
        }
    }
}

void ReceiverSession::expect_session(const std::string& session_id) const {
    if (session_id != session_.session_id) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::SESSION_MISMATCH,
            "expected " + session_.session_id + ", got " + session_id);
    }
}

void ReceiverSession::debug(const std::string& message) const {
    if (callbacks_.on_debug) callbacks_.on_debug(message);
}

} // namespace transfer
