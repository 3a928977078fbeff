// ============================================================
// test_transfer_session.cpp -- Sender session against scripted peers
// ============================================================

#include <gtest/gtest.h>
#include "sender/transfer_session.hpp"
#include "receiver/receive_session.hpp"
#include "common/utils.hpp"
#include "test_support.hpp"
#include <sstream>

using namespace testing_support;

static TransferConfig fast_config() {
    TransferConfig cfg;
    cfg.block_size         = 4096;
    cfg.workers            = 2;
    cfg.window             = 8;
    cfg.connect_timeout_ms = 1000;
    cfg.session_timeout_ms = 10000;
    cfg.ack_timeout_ms     = 1000;
    cfg.max_retries        = 3;
    cfg.backoff_base_ms    = 10;
    cfg.backoff_cap_ms     = 50;
    cfg.jitter_ms          = 0;
    return cfg;
}

// A file held in memory together with the source that chunks it
class Rig {
public:
    Rig(std::vector<u8> data, const TransferConfig& cfg)
        : data_(std::move(data))
        , in_(std::string(data_.begin(), data_.end()))
        , cfg_(cfg)
        , source_(in_, cfg_, (u64)data_.size())
    {
        file_.file_id    = utils::generate_file_id();
        file_.name       = "payload.bin";
        file_.total_size = data_.size();
    }

    const std::vector<u8>& data() const { return data_; }
    ChunkSource& source() { return source_; }
    const SessionFile& file() const { return file_; }
    const TransferConfig& cfg() const { return cfg_; }

private:
    std::vector<u8>    data_;
    std::istringstream in_;
    TransferConfig     cfg_;
    ChunkSource        source_;
    SessionFile        file_;
};

static ScriptedReceiver::Policy always(Reply r) {
    return [r](u32, u32) { return r; };
}

TEST(TransferSession, RejectedChunkIsResentOnce) {
    TransferConfig cfg = fast_config();
    cfg.block_size     = 4u * 1024u * 1024u;
    cfg.ack_timeout_ms = 5000;
    Rig rig(random_bytes(10u * 1024u * 1024u), cfg);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), [](u32 index, u32 nth) {
        return index == 1 && nth == 1 ? Reply::REJECT : Reply::ACK;
    });
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::COMPLETED);
    EXPECT_EQ(rep.chunks_acked, 3u);
    EXPECT_EQ(rep.resend_counts, (std::vector<u32>{0, 1, 0}));
    EXPECT_EQ(rep.frames_sent, 6u);   // hello, 4 chunk frames, done
    EXPECT_EQ(rx.total_size, rig.data().size());
    EXPECT_EQ(rx.seen[1], 2u);
    EXPECT_TRUE(rx.got_done);
    EXPECT_EQ(rx.assembled(), rig.data());
}

TEST(TransferSession, DeliversToRealReceiver) {
    TempDir dir;
    TransferConfig cfg = fast_config();
    std::vector<u8> data = random_bytes(37 * 4096 + 999);
    data.insert(data.end(), 20 * 4096, 0);
    Rig rig(data, cfg);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    std::unique_ptr<PipeStream> rx_stream = std::move(pair.second);

    ReceiveResult received;
    std::string rx_error;
    std::thread rx_thread([&] {
        ReceiveTarget target;
        target.out_dir = dir.path();
        try {
            ReceiveSession rs(*rx_stream, target, cfg, rig.file().file_id);
            received = rs.run();
        } catch (const std::exception& e) {
            rx_error = e.what();
        }
        rx_stream->close();
    });

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx_thread.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::COMPLETED);
    EXPECT_EQ(rx_error, "");
    EXPECT_EQ(received.outcome, ReceiveOutcome::COMPLETED);
    EXPECT_EQ(received.name, "payload.bin");
    EXPECT_EQ(received.chunks, 58u);
    EXPECT_EQ(read_file(dir.path() / "payload.bin"), data);
    EXPECT_FALSE(fs::exists(dir.path() / "payload.bin.part"));
}

TEST(TransferSession, NoStreamFallsBackWithinConnectTimeout) {
    TransferConfig cfg = fast_config();
    cfg.connect_timeout_ms = 300;
    Rig rig(random_bytes(9000), cfg);
    FakeConnectivity conn;

    TransferSession session(conn, "nobody", rig.source(), rig.file(), rig.cfg());
    u64 start = utils::steady_ms();
    SessionReport rep = session.run();
    u64 took = utils::steady_ms() - start;

    EXPECT_EQ(rep.outcome, SessionOutcome::FALLBACK_TRIGGERED);
    EXPECT_EQ(rep.reason, EndReason::CONNECT_TIMEOUT);
    EXPECT_EQ(rep.failure, ErrorKind::CONNECT_FAILURE);
    EXPECT_EQ(rep.frames_sent, 0u);
    EXPECT_GE(conn.connect_attempts.load(), 1);
    EXPECT_GE(took, 300u);
    EXPECT_LT(took, 800u);
    EXPECT_TRUE(session.take_pulled().empty());
}

TEST(TransferSession, UnansweredManifestFallsBack) {
    TransferConfig cfg = fast_config();
    cfg.connect_timeout_ms = 300;
    Rig rig(random_bytes(3 * 4096), cfg);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), always(Reply::ACK));
    rx.ignore_manifest = true;
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::FALLBACK_TRIGGERED);
    EXPECT_EQ(rep.reason, EndReason::CONNECT_TIMEOUT);
    EXPECT_EQ(rx.chunk_frames, 0u);
}

TEST(TransferSession, RefusedManifestFallsBack) {
    Rig rig(random_bytes(3 * 4096), fast_config());

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), always(Reply::ACK));
    rx.refuse_manifest = true;
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::FALLBACK_TRIGGERED);
    EXPECT_EQ(rep.reason, EndReason::PEER_REFUSED);
    EXPECT_EQ(rx.chunk_frames, 0u);
}

TEST(TransferSession, ChunkAbandonedAfterMaxRetries) {
    TransferConfig cfg = fast_config();
    cfg.max_retries = 3;
    Rig rig(random_bytes(1000), cfg);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), always(Reply::REJECT));
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::FALLBACK_TRIGGERED);
    EXPECT_EQ(rep.reason, EndReason::CHUNK_ABANDONED);
    EXPECT_EQ(rep.failure, ErrorKind::ABANDONED);
    EXPECT_EQ(rx.seen[0], 4u);
    EXPECT_TRUE(rx.got_error);

    std::vector<PreparedChunk> pulled = session.take_pulled();
    ASSERT_EQ(pulled.size(), 1u);
    EXPECT_EQ(pulled[0].desc.index, 0u);
    EXPECT_EQ(pulled[0].desc.original_len, 1000u);
}

TEST(TransferSession, SilentPeerTimesOutAndBacksOff) {
    TransferConfig cfg = fast_config();
    cfg.ack_timeout_ms = 60;
    cfg.max_retries    = 2;
    Rig rig(random_bytes(2 * 4096), cfg);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), always(Reply::SILENT));
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::FALLBACK_TRIGGERED);
    EXPECT_EQ(rep.reason, EndReason::CHUNK_ABANDONED);
    // Three sends of whichever chunk gave up first: 60 ms + 10 ms + 60 ms + 20 ms + 60 ms at least
    EXPECT_GE(rep.elapsed_ms, 210u);
    u32 most = std::max(rx.seen[0], rx.seen[1]);
    EXPECT_EQ(most, 3u);

    std::vector<PreparedChunk> pulled = session.take_pulled();
    ASSERT_EQ(pulled.size(), 2u);
    EXPECT_EQ(pulled[0].desc.index, 0u);
    EXPECT_EQ(pulled[1].desc.index, 1u);
}

TEST(TransferSession, SessionTimeoutWithNoAcksFallsBack) {
    TransferConfig cfg = fast_config();
    cfg.connect_timeout_ms = 300;
    cfg.session_timeout_ms = 400;
    cfg.ack_timeout_ms     = 300;
    cfg.max_retries        = 5;
    Rig rig(random_bytes(2 * 4096), cfg);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), always(Reply::SILENT));
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx.join();

    // Abandoning would need six ack timeouts; the session budget runs out first
    EXPECT_EQ(rep.outcome, SessionOutcome::FALLBACK_TRIGGERED);
    EXPECT_EQ(rep.reason, EndReason::SESSION_TIMEOUT);
    EXPECT_EQ(rep.chunks_acked, 0u);
    EXPECT_GE(rep.elapsed_ms, 400u);
    EXPECT_LT(rep.elapsed_ms, 1500u);
    EXPECT_EQ(session.take_pulled().size(), 2u);
}

TEST(TransferSession, SessionTimeoutAfterAnAckIsFatal) {
    TransferConfig cfg = fast_config();
    cfg.connect_timeout_ms = 300;
    cfg.session_timeout_ms = 400;
    cfg.ack_timeout_ms     = 300;
    cfg.max_retries        = 5;
    Rig rig(random_bytes(2 * 4096), cfg);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), [](u32 index, u32) {
        return index == 0 ? Reply::ACK : Reply::SILENT;
    });
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::TRANSFER_FAILED);
    EXPECT_EQ(rep.reason, EndReason::SESSION_TIMEOUT);
    EXPECT_EQ(rep.chunks_acked, 1u);
    EXPECT_LT(rep.elapsed_ms, 1500u);
    EXPECT_TRUE(rx.got_error);
}

TEST(TransferSession, ConnectWaitIsBoundedBySessionTimeout) {
    TransferConfig cfg = fast_config();
    cfg.connect_timeout_ms = 5000;
    cfg.session_timeout_ms = 250;
    Rig rig(random_bytes(9000), cfg);
    FakeConnectivity conn;

    TransferSession session(conn, "nobody", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();

    EXPECT_EQ(rep.outcome, SessionOutcome::FALLBACK_TRIGGERED);
    EXPECT_EQ(rep.reason, EndReason::CONNECT_TIMEOUT);
    EXPECT_LT(rep.elapsed_ms, 1000u);
}

TEST(TransferSession, DisconnectAfterAcksIsFatal) {
    TransferConfig cfg = fast_config();
    cfg.window         = 2;
    cfg.ack_timeout_ms = 5000;
    Rig rig(random_bytes(4 * 4096), cfg);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), [](u32 index, u32) {
        return index == 2 ? Reply::HANG_UP : Reply::ACK;
    });
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::TRANSFER_FAILED);
    EXPECT_EQ(rep.reason, EndReason::STREAM_FAILED);
    EXPECT_GE(rep.chunks_acked, 1u);
    EXPECT_LT(rep.chunks_acked, 4u);
}

TEST(TransferSession, DuplicateAcksDoNotCauseResends) {
    Rig rig(random_bytes(6 * 4096 + 1), fast_config());

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), always(Reply::ACK));
    rx.duplicate_acks = true;
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::COMPLETED);
    EXPECT_EQ(rep.resend_counts, std::vector<u32>(7, 0));
    EXPECT_EQ(rx.chunk_frames, 7u);
    EXPECT_EQ(rx.assembled(), rig.data());
}

TEST(TransferSession, WindowBoundsChunksInFlight) {
    TransferConfig cfg = fast_config();
    cfg.window            = 3;
    cfg.ack_timeout_ms    = 150;
    cfg.max_retries       = 1;
    cfg.connect_timeout_ms = 2000;
    Rig rig(random_bytes(10 * 4096), cfg);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), always(Reply::SILENT));
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::FALLBACK_TRIGGERED);
    // Nothing acked, so no index past the first window was ever sent
    for (const auto& kv : rx.seen) EXPECT_LT(kv.first, 3u);
    EXPECT_LE(session.take_pulled().size(), 3u);
}

TEST(TransferSession, CancelMidTransferNotifiesPeer) {
    TransferConfig cfg = fast_config();
    cfg.ack_timeout_ms = 200;
    cfg.max_retries    = 20;
    Rig rig(random_bytes(6 * 4096), cfg);

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), [](u32 index, u32) {
        return index == 0 ? Reply::ACK : Reply::SILENT;
    });
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    std::thread canceller([&] {
        u64 give_up = utils::steady_ms() + 5000;
        while (rx.frames_seen.load() < 2 && utils::steady_ms() < give_up) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        session.cancel();
    });
    SessionReport rep = session.run();
    canceller.join();
    rx.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::CANCELLED);
    EXPECT_EQ(rep.failure, ErrorKind::CANCELLED);
    EXPECT_TRUE(rx.got_cancel);
    EXPECT_FALSE(rx.got_done);
}

TEST(TransferSession, CancelBeforeRunSendsNothing) {
    Rig rig(random_bytes(4096), fast_config());
    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    session.cancel();
    SessionReport rep = session.run();

    EXPECT_EQ(rep.outcome, SessionOutcome::CANCELLED);
    EXPECT_EQ(rep.frames_sent, 0u);
    EXPECT_EQ(conn.connect_attempts.load(), 0);
}

TEST(TransferSession, EmptyFileCompletes) {
    Rig rig(std::vector<u8>(), fast_config());

    FakeConnectivity conn;
    auto pair = make_stream_pair();
    conn.offer(std::move(pair.first));
    ScriptedReceiver rx(std::move(pair.second), always(Reply::ACK));
    rx.start();

    TransferSession session(conn, "peer-a", rig.source(), rig.file(), rig.cfg());
    SessionReport rep = session.run();
    rx.join();

    EXPECT_EQ(rep.outcome, SessionOutcome::COMPLETED);
    EXPECT_EQ(rep.frames_sent, 2u);   // hello, done
    EXPECT_TRUE(rx.got_done);
    EXPECT_EQ(rx.chunk_frames, 0u);
}
