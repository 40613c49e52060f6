#include <gtest/gtest.h>
#include <cctype>
#include <future>
#include <thread>
#include "networking.hpp"
#include "session.hpp"
#include "checksum.hpp"
#include "pending_write.hpp"
#include "errors.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using admission::AdmissionController;
using admission::OverwritePolicy;
using transfer::MessageReceiver;
using transfer::MessageSender;

namespace {

admission::DiskSpaceQuery plenty() {
    return [](const fs::path&) { return uint64_t(1) << 40; };
}

networking::ReceiveOptions receive_options(const fs::path& destination,
                                           OverwritePolicy policy = OverwritePolicy::ALWAYS_YES) {
    networking::ReceiveOptions options;
    options.host = "127.0.0.1";
    options.destination = destination;
    options.overwrite = policy;
    options.disk_space = plenty();
    return options;
}

networking::SendOptions send_options(unsigned short port) {
    networking::SendOptions options;
    options.host = "127.0.0.1";
    options.port = port;
    options.max_attempts = 1;
    options.retry_delay = std::chrono::milliseconds(10);
    return options;
}

bool has_part_files(const fs::path& root) {
    for (const auto& item : fs::recursive_directory_iterator(root)) {
        if (item.path().string().find(storage::PART_SUFFIX) != std::string::npos) return true;
    }
    return false;
}

} // namespace

TEST(Session, LargeFileArrivesIntact) {
    test_support::TempDir dir;
    std::string payload = test_support::make_payload(10 * 1024 * 1024 + 123);
    test_support::write_file(dir / "src" / "big.bin", payload);
    fs::create_directories(dir / "dst");

    networking::Receiver receiver(receive_options(dir / "dst"));
    auto received = std::async(std::launch::async, [&] { return receiver.run(); });

    networking::Sender sender(send_options(receiver.port()));
    networking::SendReport report = sender.run(dir / "src" / "big.bin");
    transfer::ReceiveSummary summary = received.get();

    EXPECT_EQ(report.attempts, 1);
    EXPECT_EQ(report.files_sent, 1u);
    EXPECT_EQ(report.bytes_sent, payload.size());
    EXPECT_EQ(summary.files_received, 1u);
    EXPECT_EQ(summary.first_error, protocol::ErrorCode::NONE);
    EXPECT_TRUE(test_support::read_file(dir / "dst" / "big.bin") == payload);
    EXPECT_FALSE(has_part_files(dir / "dst"));
}

TEST(Session, EmptyFileIsCreated) {
    test_support::TempDir dir;
    test_support::write_file(dir / "empty.txt", "");
    fs::create_directories(dir / "dst");

    networking::Receiver receiver(receive_options(dir / "dst"));
    auto received = std::async(std::launch::async, [&] { return receiver.run(); });
    networking::Sender sender(send_options(receiver.port()));
    sender.run(dir / "empty.txt");
    received.get();

    ASSERT_TRUE(fs::exists(dir / "dst" / "empty.txt"));
    EXPECT_EQ(fs::file_size(dir / "dst" / "empty.txt"), 0u);
}

TEST(Session, DirectoryTreeIntoNewDestination) {
    test_support::TempDir dir;
    fs::path src = dir / "root";
    test_support::write_file(src / "a.txt", "alpha");
    test_support::write_file(src / "b" / "c.txt", "charlie");
    test_support::write_file(src / "b" / "d" / "e.bin", test_support::make_payload(20000, 5));
    fs::create_directories(src / "empty");

    networking::Receiver receiver(receive_options(dir / "dst"));
    auto received = std::async(std::launch::async, [&] { return receiver.run(); });
    networking::Sender sender(send_options(receiver.port()));
    networking::SendReport report = sender.run(src);
    transfer::ReceiveSummary summary = received.get();

    EXPECT_EQ(report.files_sent, 3u);
    EXPECT_EQ(report.directories_sent, 3u);
    EXPECT_EQ(summary.directories_created, 3u);
    EXPECT_EQ(test_support::read_file(dir / "dst" / "a.txt"), "alpha");
    EXPECT_EQ(test_support::read_file(dir / "dst" / "b" / "c.txt"), "charlie");
    EXPECT_TRUE(test_support::read_file(dir / "dst" / "b" / "d" / "e.bin") ==
                test_support::make_payload(20000, 5));
    EXPECT_TRUE(fs::is_directory(dir / "dst" / "empty"));
}

TEST(Session, FileModeIsPreserved) {
    test_support::TempDir dir;
    test_support::write_file(dir / "script.sh", "#!/bin/sh\n");
    fs::permissions(dir / "script.sh", fs::perms::owner_all | fs::perms::group_read);
    fs::create_directories(dir / "dst");

    networking::Receiver receiver(receive_options(dir / "dst"));
    auto received = std::async(std::launch::async, [&] { return receiver.run(); });
    networking::Sender sender(send_options(receiver.port()));
    sender.run(dir / "script.sh");
    received.get();

    fs::perms perms = fs::status(dir / "dst" / "script.sh").permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_all | fs::perms::group_read);
}

TEST(Session, RejectedEntryDoesNotStopTheRest) {
    test_support::TempDir dir;
    fs::path src = dir / "root";
    test_support::write_file(src / "a.txt", "new a");
    test_support::write_file(src / "b.txt", "new b");
    test_support::write_file(dir / "dst" / "a.txt", "old a");

    networking::Receiver receiver(receive_options(dir / "dst", OverwritePolicy::ALWAYS_NO));
    auto received = std::async(std::launch::async, [&] { return receiver.run(); });
    networking::Sender sender(send_options(receiver.port()));

    try {
        sender.run(src);
        FAIL() << "expected RetriesExhausted";
    } catch (const errors::RetriesExhausted& e) {
        EXPECT_NE(std::string(e.what()).find("exists, skipping"), std::string::npos);
    }
    transfer::ReceiveSummary summary = received.get();

    EXPECT_EQ(summary.entries_skipped, 1u);
    EXPECT_EQ(summary.files_received, 1u);
    EXPECT_EQ(summary.first_error, protocol::ErrorCode::PERMISSION);
    EXPECT_EQ(test_support::read_file(dir / "dst" / "a.txt"), "old a");
    EXPECT_EQ(test_support::read_file(dir / "dst" / "b.txt"), "new b");
}

TEST(Session, InsufficientSpaceIsRejected) {
    test_support::TempDir dir;
    test_support::write_file(dir / "data.bin", std::string(1000, 'x'));
    fs::create_directories(dir / "dst");

    auto options = receive_options(dir / "dst");
    options.disk_space = [](const fs::path&) { return uint64_t(1099); };
    networking::Receiver receiver(options);
    auto received = std::async(std::launch::async, [&] { return receiver.run(); });
    networking::Sender sender(send_options(receiver.port()));

    try {
        sender.run(dir / "data.bin");
        FAIL() << "expected RetriesExhausted";
    } catch (const errors::RetriesExhausted& e) {
        EXPECT_NE(std::string(e.what()).find("Insufficient disk space"), std::string::npos);
    }
    EXPECT_EQ(received.get().first_error, protocol::ErrorCode::NO_SPACE);
    EXPECT_FALSE(fs::exists(dir / "dst" / "data.bin"));
}

TEST(Session, ChecksumMismatchLeavesNothingBehind) {
    test_support::TempDir dir;
    test_support::write_file(dir / "data.bin", test_support::make_payload(50000));
    fs::create_directories(dir / "dst");

    std::vector<entries::Entry> items = entries::enumerate(dir / "data.bin");
    entries::attach_checksums(items);
    items[0].checksum[0] ^= 0xff;

    test_support::SocketPair pair;
    AdmissionController admission(dir / "dst", OverwritePolicy::ALWAYS_YES, plenty());
    transfer::ReceiveSummary summary;
    std::thread receiver_thread([&] {
        transfer::ReceiverSession session(pair.server, admission, true);
        summary = session.serve();
    });

    transfer::SenderSession session(pair.client, transfer::generate_session_id());
    session.handshake("test");
    transfer::EntryResult result = session.transfer_entry(items[0], false);
    session.close();
    receiver_thread.join();

    EXPECT_EQ(result.status, transfer::EntryStatus::TRANSFERRED);
    EXPECT_FALSE(result.outcome.ok);
    EXPECT_EQ(result.outcome.error_code, protocol::ErrorCode::CHECKSUM);
    EXPECT_EQ(result.outcome.reason, "Checksum mismatch");
    EXPECT_EQ(summary.entries_failed, 1u);
    EXPECT_EQ(summary.first_error, protocol::ErrorCode::CHECKSUM);
    EXPECT_FALSE(fs::exists(dir / "dst" / "data.bin"));
    EXPECT_FALSE(has_part_files(dir / "dst"));
}

TEST(Session, HandshakeNegotiatesCapabilities) {
    test_support::TempDir dir;
    test_support::SocketPair pair;
    AdmissionController admission(dir.path(), OverwritePolicy::ALWAYS_YES, plenty());

    std::string seen_id;
    std::thread receiver_thread([&] {
        transfer::ReceiverSession session(pair.server, admission, true);
        session.serve();
        seen_id = session.session().session_id;
    });

    transfer::SenderSession session(pair.client, transfer::generate_session_id());
    const transfer::Session& established = session.handshake("test");
    EXPECT_EQ(session.state(), transfer::SessionState::ESTABLISHED);
    EXPECT_EQ(established.protocol_version, protocol::PROTOCOL_VERSION);
    EXPECT_TRUE(established.capabilities.count("checksum:blake2b"));
    EXPECT_TRUE(established.capabilities.count("directories"));
    EXPECT_EQ(established.keepalive_interval, std::chrono::seconds(30));
    session.close();
    receiver_thread.join();

    EXPECT_EQ(seen_id, established.session_id);
    EXPECT_EQ(session.state(), transfer::SessionState::CLOSED);
}

TEST(Session, SessionIdFormat) {
    std::string id = transfer::generate_session_id();
    ASSERT_EQ(id.size(), 8u + 16u);
    EXPECT_EQ(id.substr(0, 8), "session_");
    for (char c : id.substr(8)) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c))) << c;
    }
    EXPECT_NE(transfer::generate_session_id(), id);
}

TEST(Session, MismatchedSessionIdAbortsSender) {
    test_support::SocketPair pair;

    std::thread fake_receiver([&] {
        auto probe = MessageReceiver::receive_message<protocol::Probe>(pair.server);
        protocol::Established established;
        established.session_id = probe.session_id + "_other";
        established.protocol_version = protocol::PROTOCOL_VERSION;
        MessageSender::send_message(pair.server, established);
    });

    transfer::SenderSession session(pair.client, transfer::generate_session_id());
    try {
        session.handshake("test");
        ADD_FAILURE() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.kind(), errors::ProtocolErrorKind::SESSION_MISMATCH);
        EXPECT_EQ(e.exit_code(), errors::ExitCode::PROTOCOL_ERROR);
    }
    fake_receiver.join();
}

TEST(Session, MajorVersionMismatchAbortsReceiver) {
    test_support::TempDir dir;
    test_support::SocketPair pair;
    AdmissionController admission(dir.path(), OverwritePolicy::ALWAYS_YES, plenty());

    protocol::Probe probe;
    probe.session_id = "session_x";
    probe.protocol_version = "7.0.0";
    probe.client_name = "future";
    probe.keepalive_seconds = 30;
    MessageSender::send_message(pair.client, probe);

    transfer::ReceiverSession session(pair.server, admission, true);
    try {
        session.handshake();
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.kind(), errors::ProtocolErrorKind::VERSION_MISMATCH);
    }
}

TEST(Session, TruncatedStreamLeavesNoFile) {
    test_support::TempDir dir;
    test_support::SocketPair pair;
    AdmissionController admission(dir.path(), OverwritePolicy::ALWAYS_YES, plenty());

    std::thread fake_sender([&] {
        protocol::Probe probe;
        probe.session_id = "session_trunc";
        probe.protocol_version = protocol::PROTOCOL_VERSION;
        probe.client_name = "test";
        probe.keepalive_seconds = 30;
        MessageSender::send_message(pair.client, probe);
        MessageReceiver::receive_message<protocol::Established>(pair.client);

        protocol::Meta meta;
        meta.session_id = probe.session_id;
        meta.file.name = "cut.bin";
        meta.file.size = 100000;
        MessageSender::send_message(pair.client, meta);
        MessageReceiver::receive_message<protocol::PreflightOk>(pair.client);

        MessageSender::send_message(pair.client, protocol::TransferStart{probe.session_id, 100000});
        std::string partial = test_support::make_payload(30000);
        boost::asio::write(pair.client, boost::asio::buffer(partial));
        pair.client.close();
    });

    transfer::ReceiverSession session(pair.server, admission, true);
    try {
        session.serve();
        ADD_FAILURE() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.kind(), errors::ProtocolErrorKind::TRUNCATED);
    }
    fake_sender.join();

    EXPECT_FALSE(fs::exists(dir / "cut.bin"));
    EXPECT_FALSE(has_part_files(dir.path()));
}

TEST(Session, TransferStartMustMatchMeta) {
    test_support::TempDir dir;
    test_support::SocketPair pair;
    AdmissionController admission(dir.path(), OverwritePolicy::ALWAYS_YES, plenty());

    std::thread fake_sender([&] {
        protocol::Probe probe;
        probe.session_id = "session_size";
        probe.protocol_version = protocol::PROTOCOL_VERSION;
        probe.client_name = "test";
        MessageSender::send_message(pair.client, probe);
        MessageReceiver::receive_message<protocol::Established>(pair.client);

        protocol::Meta meta;
        meta.session_id = probe.session_id;
        meta.file.name = "f.bin";
        meta.file.size = 10;
        MessageSender::send_message(pair.client, meta);
        MessageReceiver::receive_message<protocol::PreflightOk>(pair.client);
        MessageSender::send_message(pair.client, protocol::TransferStart{probe.session_id, 20});
    });

    transfer::ReceiverSession session(pair.server, admission, true);
    try {
        session.serve();
        ADD_FAILURE() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.kind(), errors::ProtocolErrorKind::MALFORMED);
    }
    fake_sender.join();
    EXPECT_FALSE(fs::exists(dir / "f.bin"));
}
