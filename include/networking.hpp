#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <chrono>
#include <functional>
#include <filesystem>
#include <boost/asio.hpp>
#include "admission.hpp"
#include "session.hpp"

namespace networking {

using StatusCallback = std::function<void(const std::string&)>;

// Progress callback: filename, bytes_transferred, bytes_total, speed_mbps
using ProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;

struct SenderCallbacks {
    StatusCallback on_status;
    StatusCallback on_debug;
    ProgressCallback on_progress;
    std::function<void(int attempt, int max_attempts)> on_attempt;
    std::function<void(int attempt, const std::string&)> on_attempt_failed;
};

struct ReceiverCallbacks {
    StatusCallback on_status;
    StatusCallback on_debug;
    ProgressCallback on_progress;
    std::function<void(const std::string& peer)> on_connection;
};

struct SendOptions {
    std::string host;
    unsigned short port = 0;
    int max_attempts = 3;
    bool checksum = true;
    // Advisory only, the receiver's policy decides
    admission::OverwritePolicy overwrite = admission::OverwritePolicy::ASK;
    std::chrono::milliseconds retry_delay{1000};
    std::string client_name = "ncp";
};

struct ReceiveOptions {
    std::string host = "0.0.0.0";
    unsigned short port = 0; // 0 picks an ephemeral port
    std::filesystem::path destination;
    bool checksum = true;
    admission::OverwritePolicy overwrite = admission::OverwritePolicy::ASK;
    size_t max_sessions = 1; // 0 serves until an error
    admission::DiskSpaceQuery disk_space; // defaults to storage::available_bytes
    admission::OverwritePrompt prompt;
};

struct SendReport {
    int attempts = 0;
    size_t files_sent = 0;
    size_t directories_sent = 0;
    uint64_t bytes_sent = 0;
};

// Retry orchestrator: every attempt enumerates the source afresh, connects,
// and sends every entry. Any failure abandons the attempt.
class Sender {
public:
    explicit Sender(SendOptions options, SenderCallbacks callbacks = {});

    // Throws errors::RetriesExhausted after max_attempts failed attempts
    SendReport run(const std::filesystem::path& source);

private:
    SendReport attempt(const std::filesystem::path& source);
    transfer::SessionCallbacks session_callbacks() const;

    SendOptions options_;
    SenderCallbacks callbacks_;
};

// Accepts connections one at a time and serves each session to completion
class Receiver {
public:
    explicit Receiver(ReceiveOptions options, ReceiverCallbacks callbacks = {});

    unsigned short port() const;

    transfer::ReceiveSummary run();

private:
    transfer::ReceiveSummary serve(boost::asio::ip::tcp::socket& socket);

    ReceiveOptions options_;
    ReceiverCallbacks callbacks_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

} // namespace networking
