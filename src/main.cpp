#include <iostream>
#include <string>
#include <cstdint>
#include <vector>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <filesystem>
#include "networking.hpp"
#include "admission.hpp"
#include "diskspace.hpp"
#include "errors.hpp"

namespace fs = std::filesystem;

namespace {

int verbosity = 0;

void print_usage() {
    std::cerr << "Usage:\n"
              << "  ncp [-v|-vv] send --host H --port P [--retries N] [--checksum hash|none]\n"
              << "                    [--overwrite ask|yes|no] <src>\n"
              << "  ncp [-v|-vv] recv [--host H] --port P [--checksum hash|none]\n"
              << "                    [--overwrite ask|yes|no] [--sessions N] <dst>\n";
}

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CommandLine {
    std::string command;
    std::string host;
    bool has_host = false;
    unsigned short port = 0;
    bool has_port = false;
    int retries = 3;
    bool checksum = true;
    admission::OverwritePolicy overwrite = admission::OverwritePolicy::ASK;
    size_t sessions = 1;
    std::string path;
};

unsigned long parse_number(const std::string& flag, const std::string& value, unsigned long max) {
    try {
        size_t used = 0;
        unsigned long n = std::stoul(value, &used);
        if (used != value.size() || n > max) {
            throw UsageError("Invalid value for " + flag + ": " + value);
        }
        return n;
    } catch (const std::invalid_argument&) {
        throw UsageError("Invalid value for " + flag + ": " + value);
    } catch (const std::out_of_range&) {
        throw UsageError("Invalid value for " + flag + ": " + value);
    }
}

CommandLine parse_args(int argc, char* argv[]) {
    CommandLine cli;
    std::vector<std::string> args(argv + 1, argv + argc);

    size_t i = 0;
    for (; i < args.size() && args[i].size() > 1 && args[i][0] == '-' && args[i][1] != '-'; ++i) {
        const std::string& flag = args[i];
        if (std::all_of(flag.begin() + 1, flag.end(), [](char c) { return c == 'v'; })) {
            verbosity += static_cast<int>(flag.size() - 1);
        } else {
            throw UsageError("Unknown option: " + flag);
        }
    }
    if (i >= args.size()) {
        throw UsageError("Missing command");
    }
    cli.command = args[i++];
    if (cli.command != "send" && cli.command != "recv") {
        throw UsageError("Unknown command: " + cli.command);
    }
    if (cli.command == "recv") {
        cli.host = "0.0.0.0";
    }

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) throw UsageError("Missing value for " + arg);
            return args[++i];
        };

        if (arg == "--host") {
            cli.host = value();
            cli.has_host = true;
        } else if (arg == "--port") {
            cli.port = static_cast<unsigned short>(parse_number(arg, value(), 65535));
            cli.has_port = true;
        } else if (arg == "--retries" && cli.command == "send") {
            cli.retries = static_cast<int>(parse_number(arg, value(), 1000));
        } else if (arg == "--sessions" && cli.command == "recv") {
            cli.sessions = static_cast<size_t>(parse_number(arg, value(), 1000000));
        } else if (arg == "--checksum") {
            std::string mode = value();
            if (mode == "hash") {
                cli.checksum = true;
            } else if (mode == "none") {
                cli.checksum = false;
            } else {
                throw UsageError("Invalid value for --checksum: " + mode);
            }
        } else if (arg == "--overwrite") {
            std::string mode = value();
            if (!admission::parse_overwrite_policy(mode, cli.overwrite)) {
                throw UsageError("Invalid value for --overwrite: " + mode);
            }
        } else if (arg == "-v" || arg == "-vv") {
            verbosity += static_cast<int>(arg.size() - 1);
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        } else if (cli.path.empty()) {
            cli.path = arg;
        } else {
            throw UsageError("Unexpected argument: " + arg);
        }
    }

    if (cli.command == "send" && !cli.has_host) throw UsageError("--host is required");
    if (!cli.has_port) throw UsageError("--port is required");
    if (cli.path.empty()) {
        throw UsageError(cli.command == "send" ? "Missing source path" : "Missing destination path");
    }
    if (cli.command == "send" && cli.retries < 1) throw UsageError("--retries must be at least 1");
    return cli;
}

void log_info(const std::string& message) {
    if (verbosity >= 1) std::cerr << "[INFO] " << message << "\n";
}

void log_debug(const std::string& message) {
    if (verbosity >= 2) std::cerr << "[DEBUG] " << message << "\n";
}

// CLI mode: percent, speed and ETA on one line
void print_progress(const std::string& name, uint64_t done, uint64_t total, double speed_mbps) {
    int percent = (total > 0) ? static_cast<int>((done * 100.0) / total) : 100;
    double speed_bps = speed_mbps * 1024.0 * 1024.0;
    double eta_seconds = (speed_bps > 0) ? ((total - done) / speed_bps) : 0;
    int eta_min = static_cast<int>(eta_seconds) / 60;
    int eta_sec = static_cast<int>(eta_seconds) % 60;

    std::cout << "\r" << name << " " << percent << "% | "
              << std::fixed << std::setprecision(1) << speed_mbps << " MB/s | "
              << "ETA " << std::setfill('0') << std::setw(2) << eta_min << ":"
              << std::setfill('0') << std::setw(2) << eta_sec << "    " << std::flush;
    if (done == total) {
        std::cout << "\n";
    }
}

bool prompt_overwrite(const fs::path& path) {
    std::cout << "File " << path << " already exists. Overwrite? (y/N): " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

int run_send(const CommandLine& cli) {
    networking::SendOptions options;
    options.host = cli.host;
    options.port = cli.port;
    options.max_attempts = cli.retries;
    options.checksum = cli.checksum;
    options.overwrite = cli.overwrite;

    networking::SenderCallbacks callbacks;
    callbacks.on_status = [](const std::string& msg) { std::cout << msg << "\n"; };
    callbacks.on_debug = log_debug;
    callbacks.on_progress = print_progress;
    callbacks.on_attempt = [](int attempt, int max_attempts) {
        std::cout << "Attempt " << attempt << "/" << max_attempts << "\n";
    };
    callbacks.on_attempt_failed = [](int attempt, const std::string& error) {
        std::cerr << "Attempt " << attempt << " failed: " << error << "\n";
    };

    log_debug("Executing send command: " + cli.host + ":" + std::to_string(cli.port) + " -> " + cli.path);
    networking::Sender sender(options, callbacks);
    networking::SendReport report = sender.run(cli.path);

    std::cout << "Transfer completed successfully (" << report.files_sent << " files, "
              << report.directories_sent << " directories, "
              << storage::format_size(report.bytes_sent) << ")\n";
    return static_cast<int>(errors::ExitCode::SUCCESS);
}

int run_recv(const CommandLine& cli) {
    networking::ReceiveOptions options;
    options.host = cli.host;
    options.port = cli.port;
    options.destination = cli.path;
    options.checksum = cli.checksum;
    options.overwrite = cli.overwrite;
    options.max_sessions = cli.sessions;
    options.prompt = prompt_overwrite;

    networking::ReceiverCallbacks callbacks;
    callbacks.on_status = [](const std::string& msg) { std::cout << msg << "\n"; };
    callbacks.on_debug = log_debug;
    callbacks.on_progress = print_progress;
    callbacks.on_connection = [](const std::string& peer) {
        std::cout << "Connection from: " << peer << "\n";
    };

    log_debug("Executing recv command: " + cli.host + ":" + std::to_string(cli.port) + " -> " + cli.path);
    networking::Receiver receiver(options, callbacks);
    std::cout << "Listening on port " << receiver.port() << std::endl;

    transfer::ReceiveSummary summary = receiver.run();
    log_info("Received " + std::to_string(summary.files_received) + " files, " +
             std::to_string(summary.directories_created) + " directories, skipped " +
             std::to_string(summary.entries_skipped));

    if (summary.first_error != protocol::ErrorCode::NONE &&
        (summary.entries_failed > 0 || summary.first_error == protocol::ErrorCode::NO_SPACE)) {
        std::cerr << "Error: " << summary.first_error_reason << "\n";
        return static_cast<int>(errors::exit_code_for(summary.first_error));
    }
    std::cout << "Transfer completed successfully\n";
    return static_cast<int>(errors::ExitCode::SUCCESS);
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cli;
    try {
        cli = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage();
        return static_cast<int>(errors::ExitCode::GENERAL_ERROR);
    }

    log_info("Starting ncp with verbosity level " + std::to_string(verbosity));
    try {
        return cli.command == "send" ? run_send(cli) : run_recv(cli);
    } catch (const errors::NcpError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return static_cast<int>(e.exit_code());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return static_cast<int>(errors::ExitCode::GENERAL_ERROR);
    }
}
