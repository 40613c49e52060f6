#include "networking.hpp"
#include "transfer.hpp"
#include "entries.hpp"
#include "diskspace.hpp"
#include "errors.hpp"
#include <thread>
#include <algorithm>

using boost::asio::ip::tcp;
namespace fs = std::filesystem;

namespace networking {

// ─── Sender ─────────────────────────────────────────────────────────────────

Sender::Sender(SendOptions options, SenderCallbacks callbacks)
    : options_(std::move(options)), callbacks_(std::move(callbacks)) {}

transfer::SessionCallbacks Sender::session_callbacks() const {
    return transfer::SessionCallbacks{callbacks_.on_status, callbacks_.on_debug, callbacks_.on_progress};
}

SendReport Sender::run(const fs::path& source) {
    const int max_attempts = std::max(1, options_.max_attempts);
    std::string last_error;
    errors::ExitCode last_code = errors::ExitCode::GENERAL_ERROR;

    for (int attempt_no = 1; attempt_no <= max_attempts; ++attempt_no) {
        if (callbacks_.on_attempt) callbacks_.on_attempt(attempt_no, max_attempts);

        try {
            SendReport report = attempt(source);
            report.attempts = attempt_no;
            return report;
        } catch (const errors::NcpError& e) {
            last_error = e.what();
            last_code = e.exit_code();
        } catch (const boost::system::system_error& e) {
            last_error = e.what();
            last_code = errors::ExitCode::IO_ERROR;
        } catch (const fs::filesystem_error& e) {
            last_error = e.what();
            last_code = errors::ExitCode::IO_ERROR;
        } catch (const std::exception& e) {
            last_error = e.what();
            last_code = errors::ExitCode::GENERAL_ERROR;
        }

        if (callbacks_.on_attempt_failed) callbacks_.on_attempt_failed(attempt_no, last_error);
        if (attempt_no < max_attempts) {
            if (callbacks_.on_status) callbacks_.on_status("Retrying in " +
                std::to_string(options_.retry_delay.count()) + " ms...");
            std::this_thread::sleep_for(options_.retry_delay);
        }
    }

    throw errors::RetriesExhausted(max_attempts, last_error, last_code);
}

SendReport Sender::attempt(const fs::path& source) {
    // Enumerated per attempt, the source may have changed in between
    std::vector<entries::Entry> items = entries::enumerate(source);
    if (options_.checksum) {
        if (callbacks_.on_debug) callbacks_.on_debug("Calculating checksums for " + source.string());
        entries::attach_checksums(items);
    }
    std::error_code fs_ec;
    const bool tree = fs::is_directory(source, fs_ec);

    if (callbacks_.on_status) {
        callbacks_.on_status("Connecting to " + options_.host + ":" + std::to_string(options_.port) + "...");
    }
    boost::asio::io_context io_context;
    tcp::socket socket(io_context);
    tcp::resolver resolver(io_context);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(options_.host, std::to_string(options_.port), ec);
    if (ec) {
        throw errors::IoError("Could not resolve " + options_.host + ": " + ec.message());
    }
    boost::asio::connect(socket, endpoints, ec);
    if (ec) {
        throw errors::IoError("Could not connect to " + options_.host + ":" +
                              std::to_string(options_.port) + ": " + ec.message());
    }

    transfer::SenderSession session(socket, transfer::generate_session_id(), session_callbacks());
    session.handshake(options_.client_name, options_.checksum);

    if (callbacks_.on_status) {
        callbacks_.on_status("Sending " + std::to_string(items.size()) + " entries (" +
                             storage::format_size(entries::total_size(items)) + ")");
    }

    SendReport report;
    size_t rejected = 0;
    protocol::ErrorCode first_rejection_code = protocol::ErrorCode::NONE;
    std::string first_rejection;

    for (const auto& entry : items) {
        transfer::EntryResult result = session.transfer_entry(entry, tree);
        const std::string name = entry.relative_path.generic_string();

        switch (result.status) {
            case transfer::EntryStatus::REJECTED:
                if (callbacks_.on_status) callbacks_.on_status("Receiver rejected " + name + ": " + result.reason);
                if (rejected++ == 0) {
                    first_rejection_code = result.error_code;
                    first_rejection = name + ": " + result.reason;
                }
                break;
            case transfer::EntryStatus::CREATED:
                report.directories_sent++;
                break;
            case transfer::EntryStatus::TRANSFERRED:
                if (!result.outcome.ok) {
                    if (result.outcome.error_code == protocol::ErrorCode::CHECKSUM) {
                        throw errors::IntegrityError("Checksum mismatch for " + name + ": " + result.outcome.reason);
                    }
                    throw errors::AdmissionError(result.outcome.error_code,
                                                 "Transfer of " + name + " failed: " + result.outcome.reason);
                }
                report.files_sent++;
                report.bytes_sent += result.outcome.received_bytes;
                if (callbacks_.on_status) callbacks_.on_status("Sent " + name);
                break;
        }
    }
    session.close();

    if (rejected > 0) {
        std::string message = "Entry rejected by receiver: " + first_rejection;
        if (rejected > 1) {
            message += " (and " + std::to_string(rejected - 1) + " more)";
        }
        throw errors::AdmissionError(first_rejection_code, message);
    }
    return report;
}

// ─── Receiver ───────────────────────────────────────────────────────────────

Receiver::Receiver(ReceiveOptions options, ReceiverCallbacks callbacks)
    : options_(std::move(options)), callbacks_(std::move(callbacks)), acceptor_(io_context_) {
    tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto results = resolver.resolve(options_.host, std::to_string(options_.port),
                                    tcp::resolver::passive, ec);
    if (ec || results.empty()) {
        throw errors::IoError("Could not resolve listen address " + options_.host + ": " + ec.message());
    }
    tcp::endpoint endpoint = results.begin()->endpoint();

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw errors::IoError("Could not listen on " + options_.host + ":" +
                              std::to_string(options_.port) + ": " + ec.message());
    }
    if (callbacks_.on_debug) {
        callbacks_.on_debug("TCP listener bound to " + options_.host + ":" + std::to_string(port()));
    }
}

unsigned short Receiver::port() const {
    return acceptor_.local_endpoint().port();
}

transfer::ReceiveSummary Receiver::run() {
    transfer::ReceiveSummary total;
    size_t served = 0;

    while (options_.max_sessions == 0 || served < options_.max_sessions) {
        tcp::socket socket(io_context_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) {
            throw errors::IoError("accept: " + ec.message());
        }

        auto peer = socket.remote_endpoint(ec);
        std::string peer_name = ec ? std::string("unknown peer")
                                   : peer.address().to_string() + ":" + std::to_string(peer.port());
        if (callbacks_.on_connection) callbacks_.on_connection(peer_name);

        total.merge(serve(socket));
        ++served;
    }
    return total;
}

transfer::ReceiveSummary Receiver::serve(tcp::socket& socket) {
    admission::AdmissionController admission(options_.destination, options_.overwrite,
                                             options_.disk_space, options_.prompt);
    transfer::ReceiverSession session(socket, admission, options_.checksum,
        transfer::SessionCallbacks{callbacks_.on_status, callbacks_.on_debug, callbacks_.on_progress});

    try {
        return session.serve();
    } catch (const boost::system::system_error& e) {
        throw errors::IoError(std::string("Session failed: ") + e.what());
    } catch (const fs::filesystem_error& e) {
        throw errors::io_error("Session failed", e.code());
    }
}

} // namespace networking
