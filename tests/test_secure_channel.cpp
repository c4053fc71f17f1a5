#include <gtest/gtest.h>
#include "secure_channel.h"
#include <deque>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace filepunch;

namespace {

// One side of an in-memory link: datagrams the channel sent but the peer has not seen yet
struct Outbox {
    std::vector<std::vector<uint8_t>> datagrams;
};

struct Endpoint {
    std::shared_ptr<SecureChannel> channel;
    Outbox outbox;
    std::vector<std::vector<uint8_t>> received;
    bool established = false;
    int closed_calls = 0;
    CloseReason close_reason = CloseReason::NONE;
};

} // anonymous namespace

class SecureChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = Clock::now();
        rng_.seed(20240611);
        loss_rate_ = 0.0;
        reorder_rate_ = 0.0;
    }

    void TearDown() override {
        initiator_.channel.reset();
        responder_.channel.reset();
    }

    void make_pair(const ChannelConfig& initiator_config = ChannelConfig(),
                   const ChannelConfig& responder_config = ChannelConfig()) {
        initiator_.channel = make_channel(NoiseRole::INITIATOR, SocketAddress("203.0.113.9", 40000),
                                          initiator_config, initiator_);
        responder_.channel = make_channel(NoiseRole::RESPONDER, SocketAddress("198.51.100.7", 50000),
                                          responder_config, responder_);
    }

    std::shared_ptr<SecureChannel> make_channel(NoiseRole role, const SocketAddress& remote,
                                                const ChannelConfig& config, Endpoint& endpoint) {
        Outbox* outbox = &endpoint.outbox;
        auto channel = std::make_shared<SecureChannel>(role, noise_utils::generate_static_keypair(), remote, config,
                                                       [outbox](const std::vector<uint8_t>& datagram) {
                                                           outbox->datagrams.push_back(datagram);
                                                       });

        Endpoint* target = &endpoint;
        ChannelHandlers handlers;
        handlers.on_established = [target]() { target->established = true; };
        handlers.on_message = [target](const std::vector<uint8_t>& message) { target->received.push_back(message); };
        handlers.on_closed = [target](CloseReason reason) {
            target->closed_calls++;
            target->close_reason = reason;
        };
        channel->set_handlers(std::move(handlers));
        return channel;
    }

    bool chance(double rate) {
        return std::uniform_real_distribution<double>(0.0, 1.0)(rng_) < rate;
    }

    // Move one direction's datagrams across the lossy link
    void transfer(Endpoint& from, Endpoint& to, std::deque<std::vector<uint8_t>>& delayed) {
        std::vector<std::vector<uint8_t>> batch;
        batch.swap(from.outbox.datagrams);

        std::deque<std::vector<uint8_t>> late;
        late.swap(delayed);

        for (auto& datagram : batch) {
            if (chance(loss_rate_)) {
                continue;
            }
            if (chance(reorder_rate_)) {
                delayed.push_back(std::move(datagram));
                continue;
            }
            to.channel->on_datagram(datagram, now_);
        }
        // Held-back datagrams arrive after newer ones
        for (auto& datagram : late) {
            to.channel->on_datagram(datagram, now_);
        }
    }

    void step(std::chrono::milliseconds dt = std::chrono::milliseconds(10)) {
        transfer(initiator_, responder_, delayed_to_responder_);
        transfer(responder_, initiator_, delayed_to_initiator_);
        now_ += dt;
        initiator_.channel->on_tick(now_);
        responder_.channel->on_tick(now_);
    }

    template<typename Predicate>
    bool run_until(Predicate done, std::chrono::milliseconds limit) {
        TimePoint deadline = now_ + limit;
        while (!done()) {
            if (now_ >= deadline) {
                return false;
            }
            step();
        }
        return true;
    }

    void establish() {
        ASSERT_TRUE(responder_.channel->start(now_));
        ASSERT_TRUE(initiator_.channel->start(now_));
        ASSERT_TRUE(run_until([this] {
            return initiator_.channel->is_established() && responder_.channel->is_established();
        }, std::chrono::milliseconds(5000)));
    }

    static std::vector<uint8_t> numbered(uint32_t n) {
        std::string text = "message-" + std::to_string(n);
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    TimePoint now_;
    std::mt19937 rng_;
    double loss_rate_;
    double reorder_rate_;
    Endpoint initiator_;
    Endpoint responder_;
    std::deque<std::vector<uint8_t>> delayed_to_responder_;
    std::deque<std::vector<uint8_t>> delayed_to_initiator_;
};

TEST_F(SecureChannelTest, ClassifiesPacketTypes) {
    PacketType type;
    EXPECT_TRUE(classify_packet({0x01, 'F'}, type));
    EXPECT_EQ(type, PacketType::PUNCH);
    EXPECT_TRUE(classify_packet({0x05}, type));
    EXPECT_EQ(type, PacketType::TRANSPORT);
    EXPECT_FALSE(classify_packet({}, type));
    EXPECT_FALSE(classify_packet({0x00}, type));
    EXPECT_FALSE(classify_packet({0x06}, type));
}

TEST_F(SecureChannelTest, HandshakeCompletesOverCleanLink) {
    make_pair();
    establish();

    EXPECT_TRUE(initiator_.established);
    EXPECT_TRUE(responder_.established);
    EXPECT_EQ(initiator_.channel->state(), ChannelState::ESTABLISHED);
    EXPECT_EQ(responder_.channel->state(), ChannelState::ESTABLISHED);
}

TEST_F(SecureChannelTest, InitiatorSendsHandshakeInitImmediately) {
    make_pair();
    ASSERT_TRUE(initiator_.channel->start(now_));
    ASSERT_EQ(initiator_.outbox.datagrams.size(), 1u);
    EXPECT_EQ(initiator_.outbox.datagrams[0][0], static_cast<uint8_t>(PacketType::HANDSHAKE_INIT));

    ASSERT_TRUE(responder_.channel->start(now_));
    EXPECT_TRUE(responder_.outbox.datagrams.empty());
}

TEST_F(SecureChannelTest, DuplicateHandshakeInitGetsCachedResponse) {
    make_pair();
    ASSERT_TRUE(responder_.channel->start(now_));
    ASSERT_TRUE(initiator_.channel->start(now_));

    std::vector<uint8_t> msg1 = initiator_.outbox.datagrams.front();
    responder_.channel->on_datagram(msg1, now_);
    ASSERT_EQ(responder_.outbox.datagrams.size(), 1u);
    EXPECT_TRUE(responder_.channel->matches_first_message(msg1));

    responder_.channel->on_datagram(msg1, now_);
    ASSERT_EQ(responder_.outbox.datagrams.size(), 2u);
    EXPECT_EQ(responder_.outbox.datagrams[0], responder_.outbox.datagrams[1]);
    EXPECT_EQ(responder_.outbox.datagrams[1][0], static_cast<uint8_t>(PacketType::HANDSHAKE_RESPONSE));
}

TEST_F(SecureChannelTest, LossyReorderedLinkDeliversInOrderExactlyOnce) {
    loss_rate_ = 0.2;
    reorder_rate_ = 0.2;
    make_pair();
    establish();

    const uint32_t count = 200;
    for (uint32_t i = 0; i < count; ++i) {
        ASSERT_TRUE(initiator_.channel->send_message(numbered(i), now_));
        ASSERT_TRUE(responder_.channel->send_message(numbered(i + 1000), now_));
    }

    ASSERT_TRUE(run_until([&] {
        return initiator_.received.size() >= count && responder_.received.size() >= count &&
               initiator_.channel->unacknowledged_count() == 0 && responder_.channel->unacknowledged_count() == 0;
    }, std::chrono::milliseconds(60000)));

    // Let late retransmissions drain; nothing may be delivered twice
    run_until([] { return false; }, std::chrono::milliseconds(1000));

    ASSERT_EQ(responder_.received.size(), count);
    ASSERT_EQ(initiator_.received.size(), count);
    for (uint32_t i = 0; i < count; ++i) {
        EXPECT_EQ(responder_.received[i], numbered(i));
        EXPECT_EQ(initiator_.received[i], numbered(i + 1000));
    }
    EXPECT_TRUE(initiator_.channel->is_established());
    EXPECT_TRUE(responder_.channel->is_established());
}

TEST_F(SecureChannelTest, HandshakeSurvivesLostFirstMessage) {
    make_pair();
    ASSERT_TRUE(responder_.channel->start(now_));
    ASSERT_TRUE(initiator_.channel->start(now_));

    // Drop the first message 1
    initiator_.outbox.datagrams.clear();
    ASSERT_TRUE(run_until([this] {
        return initiator_.channel->is_established() && responder_.channel->is_established();
    }, std::chrono::milliseconds(5000)));
}

TEST_F(SecureChannelTest, MessagesQueuedDuringHandshakeAreFlushed) {
    make_pair();
    ASSERT_TRUE(responder_.channel->start(now_));
    ASSERT_TRUE(initiator_.channel->start(now_));
    ASSERT_TRUE(initiator_.channel->send_message(numbered(1), now_));
    ASSERT_TRUE(initiator_.channel->send_message(numbered(2), now_));

    ASSERT_TRUE(run_until([this] { return responder_.received.size() == 2; }, std::chrono::milliseconds(3000)));
    EXPECT_EQ(responder_.received[0], numbered(1));
    EXPECT_EQ(responder_.received[1], numbered(2));
}

TEST_F(SecureChannelTest, OversizedMessageIsRefused) {
    make_pair();
    establish();

    std::vector<uint8_t> limit(MAX_MESSAGE_SIZE, 0xab);
    std::vector<uint8_t> oversized(MAX_MESSAGE_SIZE + 1, 0xab);
    EXPECT_TRUE(initiator_.channel->send_message(limit, now_));
    EXPECT_FALSE(initiator_.channel->send_message(oversized, now_));

    ASSERT_TRUE(run_until([this] { return responder_.received.size() == 1; }, std::chrono::milliseconds(1000)));
    EXPECT_EQ(responder_.received[0], limit);
}

TEST_F(SecureChannelTest, CloseNotifiesPeer) {
    make_pair();
    establish();

    initiator_.channel->close();
    EXPECT_EQ(initiator_.channel->close_reason(), CloseReason::LOCAL);
    EXPECT_FALSE(initiator_.channel->send_message(numbered(1), now_));

    step();
    EXPECT_TRUE(responder_.channel->is_closed());
    EXPECT_EQ(responder_.channel->close_reason(), CloseReason::REMOTE);
    EXPECT_EQ(responder_.closed_calls, 1);
    EXPECT_EQ(initiator_.closed_calls, 1);

    // Closing twice reports once
    initiator_.channel->close();
    EXPECT_EQ(initiator_.closed_calls, 1);
}

TEST_F(SecureChannelTest, HandshakeTimesOutWithoutResponder) {
    make_pair();
    ASSERT_TRUE(initiator_.channel->start(now_));

    TimePoint started = now_;
    while (!initiator_.channel->is_closed() && now_ - started < std::chrono::milliseconds(6000)) {
        initiator_.outbox.datagrams.clear();
        now_ += std::chrono::milliseconds(10);
        initiator_.channel->on_tick(now_);
    }

    EXPECT_EQ(initiator_.channel->close_reason(), CloseReason::HANDSHAKE_TIMEOUT);
    EXPECT_TRUE(is_handshake_failure(initiator_.close_reason));
    EXPECT_GE(now_ - started, std::chrono::milliseconds(5000));
}

TEST_F(SecureChannelTest, InitiatorRetransmitsHandshakeInit) {
    make_pair();
    ASSERT_TRUE(initiator_.channel->start(now_));
    ASSERT_EQ(initiator_.outbox.datagrams.size(), 1u);

    now_ += std::chrono::milliseconds(199);
    initiator_.channel->on_tick(now_);
    EXPECT_EQ(initiator_.outbox.datagrams.size(), 1u);

    now_ += std::chrono::milliseconds(1);
    initiator_.channel->on_tick(now_);
    ASSERT_EQ(initiator_.outbox.datagrams.size(), 2u);
    EXPECT_EQ(initiator_.outbox.datagrams[0], initiator_.outbox.datagrams[1]);
}

TEST_F(SecureChannelTest, PrologueMismatchIsHandshakeFailure) {
    ChannelConfig other;
    other.prologue = {'x'};
    make_pair(ChannelConfig(), other);

    ASSERT_TRUE(responder_.channel->start(now_));
    ASSERT_TRUE(initiator_.channel->start(now_));
    run_until([this] { return initiator_.channel->is_closed(); }, std::chrono::milliseconds(1000));

    EXPECT_EQ(initiator_.channel->close_reason(), CloseReason::HANDSHAKE_FAILED);
    EXPECT_FALSE(initiator_.established);
}

TEST_F(SecureChannelTest, IdleChannelTimesOut) {
    make_pair();
    establish();

    // Cut the link entirely
    TimePoint cut = now_;
    while (!initiator_.channel->is_closed() && now_ - cut < std::chrono::milliseconds(12000)) {
        initiator_.outbox.datagrams.clear();
        responder_.outbox.datagrams.clear();
        now_ += std::chrono::milliseconds(50);
        initiator_.channel->on_tick(now_);
        responder_.channel->on_tick(now_);
    }

    EXPECT_EQ(initiator_.channel->close_reason(), CloseReason::IDLE_TIMEOUT);
    EXPECT_GE(now_ - cut, std::chrono::milliseconds(9900));
}

TEST_F(SecureChannelTest, KeepalivePreventsIdleTimeout) {
    make_pair();
    establish();

    run_until([] { return false; }, std::chrono::milliseconds(25000));
    EXPECT_TRUE(initiator_.channel->is_established());
    EXPECT_TRUE(responder_.channel->is_established());
}

TEST_F(SecureChannelTest, ForgedTransportPacketIsIgnored) {
    make_pair();
    establish();

    std::vector<uint8_t> forged = {0x05, 0, 0, 0, 0, 0, 0, 0, 0};
    forged.resize(forged.size() + 40, 0x42);
    responder_.channel->on_datagram(forged, now_);

    EXPECT_TRUE(responder_.channel->is_established());
    EXPECT_TRUE(responder_.received.empty());
}
