// ============================================================
// test_fallback.cpp -- SendAgent / RecvAgent through storage
// ============================================================

#include <gtest/gtest.h>
#include "sender/send_agent.hpp"
#include "receiver/recv_agent.hpp"
#include "common/directory_storage.hpp"
#include "common/locator.hpp"
#include "common/utils.hpp"
#include "test_support.hpp"

using namespace testing_support;

class FallbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::get().set_transfer_error_file("");
        cfg_.block_size         = 4096;
        cfg_.workers            = 2;
        cfg_.window             = 4;
        cfg_.connect_timeout_ms = 300;
        cfg_.ack_timeout_ms     = 500;
        cfg_.max_retries        = 2;
        cfg_.backoff_base_ms    = 10;
        cfg_.backoff_cap_ms     = 40;
        cfg_.jitter_ms          = 0;
        cfg_.spool_dir          = (dir_.path() / "spool").string();
        fs::create_directories(cfg_.spool_dir);
        store_ = std::make_unique<DirectoryStorage>(dir_.path() / "store", 3600);
    }

    fs::path make_input(const std::string& name, const std::vector<u8>& data) {
        fs::path p = dir_.path() / name;
        write_file(p, data);
        return p;
    }

    ReceiveTarget out_file(const std::string& name) {
        ReceiveTarget t;
        t.out_path = dir_.path() / "out" / name;
        return t;
    }

    TempDir                           dir_;
    TransferConfig                    cfg_;
    std::unique_ptr<DirectoryStorage> store_;
};

TEST_F(FallbackTest, ForcedFallbackRoundTrip) {
    std::vector<u8> data = random_bytes(9 * 4096 + 321);
    data.insert(data.end(), 5 * 4096, 'q');
    fs::path in = make_input("report.bin", data);

    FakeConnectivity conn;
    SendAgent sender(&conn, store_.get(), cfg_);
    u64 before = utils::now_unix();
    SendResult sent = sender.send(in, "peer-a", true);

    EXPECT_EQ(sent.outcome, SendOutcome::FALLBACK);
    EXPECT_FALSE(sent.session_ran);
    EXPECT_EQ(conn.connect_attempts.load(), 0);
    EXPECT_EQ(locator::classify(sent.locator), LocatorKind::STORAGE);
    EXPECT_GE(sent.expires_at_unix, before + 3600);
    EXPECT_EQ(store_->stats().file_count, 1u);

    RecvAgent receiver(nullptr, store_.get(), cfg_);
    fs::path got = receiver.fetch(sent.locator, out_file("copy.bin"));
    EXPECT_EQ(got, dir_.path() / "out" / "copy.bin");
    EXPECT_EQ(read_file(got), data);
}

TEST_F(FallbackTest, UnreachablePeerFallsBack) {
    std::vector<u8> data = random_bytes(3 * 4096);
    fs::path in = make_input("a.bin", data);

    FakeConnectivity conn;
    SendAgent sender(&conn, store_.get(), cfg_);
    SendResult sent = sender.send(in, "10.9.9.9:1");

    EXPECT_EQ(sent.outcome, SendOutcome::FALLBACK);
    EXPECT_TRUE(sent.session_ran);
    EXPECT_EQ(sent.report.reason, EndReason::CONNECT_TIMEOUT);
    EXPECT_GE(conn.connect_attempts.load(), 1);

    RecvAgent receiver(nullptr, store_.get(), cfg_);
    ReceiveTarget t;
    t.out_dir = dir_.path() / "inbox";
    fs::path got = receiver.fetch(sent.locator, t);
    EXPECT_EQ(got, dir_.path() / "inbox" / "a.bin");
    EXPECT_EQ(read_file(got), data);
}

TEST_F(FallbackTest, RejectingPeerFallsBackWithPulledChunks) {
    std::vector<u8> data = random_bytes(10 * 4096 + 7);
    fs::path in = make_input("b.bin", data);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), [](u32, u32) { return Reply::REJECT; });
    rx.start();

    SendAgent sender(&conn, store_.get(), cfg_);
    SendResult sent = sender.send(in, "peer-a");
    rx.join();

    EXPECT_EQ(sent.outcome, SendOutcome::FALLBACK);
    EXPECT_EQ(sent.report.reason, EndReason::CHUNK_ABANDONED);
    EXPECT_EQ(sent.report.chunks_acked, 0u);
    EXPECT_GT(rx.chunk_frames, 0u);

    RecvAgent receiver(nullptr, store_.get(), cfg_);
    fs::path got = receiver.fetch(sent.locator, out_file("b.bin"));
    EXPECT_EQ(read_file(got), data);
}

TEST_F(FallbackTest, PartialPeerDeliveryIsNotRetriedThroughStorage) {
    std::vector<u8> data = random_bytes(4 * 4096);
    fs::path in = make_input("c.bin", data);
    cfg_.window         = 2;
    cfg_.ack_timeout_ms = 5000;

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), [](u32 index, u32) {
        return index == 2 ? Reply::HANG_UP : Reply::ACK;
    });
    rx.start();

    SendAgent sender(&conn, store_.get(), cfg_);
    try {
        sender.send(in, "peer-a");
        FAIL() << "expected transfer failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSFER_FAILED);
    }
    rx.join();
    EXPECT_EQ(store_->stats().file_count, 0u);
}

TEST_F(FallbackTest, PeerDeliveryYieldsPeerLocator) {
    std::vector<u8> data = random_bytes(5 * 4096);
    fs::path in = make_input("d.bin", data);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), [](u32, u32) { return Reply::ACK; });
    rx.start();

    SendAgent sender(&conn, store_.get(), cfg_);
    SendResult sent = sender.send(in, "10.0.0.2:9400");
    rx.join();

    EXPECT_EQ(sent.outcome, SendOutcome::PEER);
    auto peer = locator::parse_peer(sent.locator);
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->peer_id, "10.0.0.2:9400");
    EXPECT_EQ(rx.assembled(), data);
    EXPECT_EQ(store_->stats().file_count, 0u);
}

TEST_F(FallbackTest, NoPeerAndNoStorageIsAStorageFailure) {
    fs::path in = make_input("e.bin", random_bytes(100));
    SendAgent sender(nullptr, nullptr, cfg_);
    try {
        sender.send(in, "");
        FAIL() << "expected storage failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::STORAGE_FAILURE);
    }
}

TEST_F(FallbackTest, MissingInputIsAnIoFailure) {
    SendAgent sender(nullptr, store_.get(), cfg_);
    try {
        sender.send(dir_.path() / "nope.bin", "");
        FAIL() << "expected IO failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IO_FAILURE);
    }
}

TEST_F(FallbackTest, InvalidConfigurationIsRejected) {
    fs::path in = make_input("f.bin", random_bytes(100));
    cfg_.window = 0;
    SendAgent sender(nullptr, store_.get(), cfg_);
    EXPECT_THROW(sender.send(in, ""), std::invalid_argument);

    TransferConfig slow_connect;
    slow_connect.connect_timeout_ms = 5000;
    slow_connect.session_timeout_ms = 1000;
    EXPECT_THROW(slow_connect.validate(), std::invalid_argument);
    slow_connect.session_timeout_ms = 5000;
    EXPECT_NO_THROW(slow_connect.validate());
}

TEST_F(FallbackTest, CancelBeforeSendUploadsNothing) {
    fs::path in = make_input("g.bin", random_bytes(3 * 4096));
    FakeConnectivity conn;
    SendAgent sender(&conn, store_.get(), cfg_);
    sender.cancel();
    SendResult sent = sender.send(in, "peer-a");
    EXPECT_EQ(sent.outcome, SendOutcome::CANCELLED);
    EXPECT_TRUE(sent.locator.empty());
    EXPECT_EQ(store_->stats().file_count, 0u);
}

TEST_F(FallbackTest, CorruptPayloadFailsIntegrityAndLeavesNoOutput) {
    std::vector<u8> data = random_bytes(6 * 4096);
    fs::path in = make_input("h.bin", data);
    SendAgent sender(nullptr, store_.get(), cfg_);
    SendResult sent = sender.send(in, "", true);

    fs::path stored = DirectoryStorage::from_locator(sent.locator);
    std::vector<u8> bytes = read_file(stored);
    bytes[bytes.size() - 10] ^= 0x5A;    // inside the last chunk's payload
    write_file(stored, bytes);

    RecvAgent receiver(nullptr, store_.get(), cfg_);
    ReceiveTarget t = out_file("h.bin");
    try {
        receiver.fetch(sent.locator, t);
        FAIL() << "expected integrity failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INTEGRITY_FAILURE);
    }
    EXPECT_FALSE(fs::exists(t.out_path));
    EXPECT_FALSE(fs::exists(file_io::part_path(t.out_path)));
}

TEST_F(FallbackTest, CorruptManifestIsAProtocolFailure) {
    std::vector<u8> data = random_bytes(6 * 4096);
    fs::path in = make_input("i.bin", data);
    SendAgent sender(nullptr, store_.get(), cfg_);
    SendResult sent = sender.send(in, "", true);

    fs::path stored = DirectoryStorage::from_locator(sent.locator);
    std::vector<u8> bytes = read_file(stored);
    bytes[sizeof(BundleHeader) + 5 + 12] ^= 0x01;   // first chunk table entry
    write_file(stored, bytes);

    RecvAgent receiver(nullptr, store_.get(), cfg_);
    try {
        receiver.fetch(sent.locator, out_file("i.bin"));
        FAIL() << "expected protocol failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PROTOCOL_FAILURE);
    }
}

TEST_F(FallbackTest, EmptyFileRoundTrip) {
    fs::path in = make_input("empty.txt", {});
    SendAgent sender(nullptr, store_.get(), cfg_);
    SendResult sent = sender.send(in, "", true);
    EXPECT_EQ(sent.outcome, SendOutcome::FALLBACK);

    RecvAgent receiver(nullptr, store_.get(), cfg_);
    fs::path got = receiver.fetch(sent.locator, out_file("empty.txt"));
    EXPECT_TRUE(fs::exists(got));
    EXPECT_EQ(fs::file_size(got), 0u);
}

TEST_F(FallbackTest, MissingBundleIsAStorageFailure) {
    RecvAgent receiver(nullptr, store_.get(), cfg_);
    std::string loc = DirectoryStorage::to_locator(dir_.path() / "store" / "gone.shr");
    try {
        receiver.fetch(loc, out_file("x"));
        FAIL() << "expected storage failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::STORAGE_FAILURE);
    }
}

TEST_F(FallbackTest, GarbageLocatorIsRejected) {
    RecvAgent receiver(nullptr, store_.get(), cfg_);
    EXPECT_THROW(receiver.fetch("gopher://x/y", out_file("x")), TransferError);
}

TEST_F(FallbackTest, PeerLocatorWaitsForMatchingSession) {
    std::vector<u8> data = random_bytes(3 * 4096 + 50);
    FileId wanted = utils::generate_file_id();

    // Two sessions queue up: one for another file, then the one the
    // locator names. Both are fully buffered before the receiver runs.
    FakeConnectivity conn;
    auto decoy = make_stream_pair();
    auto real  = make_stream_pair();
    FrameChannel decoy_tx(*decoy.first);
    FrameChannel real_tx(*real.first);
    write_hello(decoy_tx, utils::generate_file_id(), "other.bin", 10, 4096);
    write_hello(real_tx, wanted, "wanted.bin", data.size(), 4096);
    for (u32 i = 0; i < 4; ++i) write_chunk(real_tx, data, 4096, i);
    real_tx.write_empty(MsgType::MT_SESSION_DONE);
    conn.offer(std::move(decoy.second));
    conn.offer(std::move(real.second));

    RecvAgent receiver(&conn, nullptr, cfg_);
    ReceiveTarget t;
    t.out_dir = dir_.path() / "inbox";
    fs::path got = receiver.fetch(locator::make_peer("10.0.0.7:9400", wanted), t);

    EXPECT_EQ(got, dir_.path() / "inbox" / "wanted.bin");
    EXPECT_EQ(read_file(got), data);
    EXPECT_FALSE(fs::exists(dir_.path() / "inbox" / "other.bin"));

    FrameHeader hdr;
    std::vector<u8> payload;
    ASSERT_EQ(decoy_tx.read_frame(hdr, payload, 1000), FrameStatus::FRAME);
    EXPECT_EQ(static_cast<MsgType>(hdr.msg_type), MsgType::MT_HELLO_NACK);
}

TEST_F(FallbackTest, StopEndsListen) {
    FakeConnectivity conn;
    RecvAgent receiver(&conn, nullptr, cfg_);
    std::thread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        receiver.stop();
    });
    ReceiveTarget t;
    t.out_dir = dir_.path() / "inbox";
    std::optional<ReceiveResult> r = receiver.listen(t);
    stopper.join();
    EXPECT_FALSE(r.has_value());
}
