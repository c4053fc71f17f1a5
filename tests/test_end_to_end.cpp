#include <gtest/gtest.h>
#include "filepunch.h"
#include "punch_session.h"
#include "rendezvous_server.h"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace filepunch;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // anonymous namespace

// Publisher behind a NAT at 10.0.0.5:40000 that kept its port on 203.0.113.9
TEST(CandidateScenarioTest, PreservedPortIsTriedFirst) {
    PeerAddress publisher(SocketAddress("10.0.0.5", 40000), SocketAddress("203.0.113.9", 40000));

    std::vector<SocketAddress> candidates = order_candidates(publisher, SocketAddress("203.0.113.9", 40000));
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0], SocketAddress("203.0.113.9", 40000));
    EXPECT_EQ(candidates[1], SocketAddress("10.0.0.5", 40000));
}

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!init_socket_library()) {
            GTEST_SKIP() << "Socket library unavailable";
        }

        ServerConfig config;
        config.bind_ip = "127.0.0.1";
        config.bind_port = 0;
        server_ = std::make_unique<RendezvousServer>(config);
        if (!server_->start()) {
            GTEST_SKIP() << "Cannot bind loopback rendezvous server";
        }

        const std::string payload = "a file worth punching a hole for";
        content_id_ = compute_content_id(bytes(payload));
        file_size_ = payload.size();
    }

    void TearDown() override {
        if (subscriber_) {
            subscriber_->stop();
        }
        if (publisher_) {
            publisher_->stop();
        }
        subscriber_.reset();
        publisher_.reset();
        if (server_) {
            server_->stop();
        }
        cleanup_socket_library();
    }

    ClientSettings loopback_settings() const {
        ClientSettings settings;
        settings.server_address = "127.0.0.1";
        settings.server_port = server_->port();
        settings.bind_ip = "127.0.0.1";
        settings.port_mapping = PortMappingMode::NONE;
        settings.punch_interval_ms = 100;
        settings.punch_deadline_ms = 3000;
        settings.handshake_timeout_ms = 3000;
        settings.request_timeout_ms = 3000;
        return settings;
    }

    std::unique_ptr<RendezvousServer> server_;
    std::unique_ptr<FilePunchClient> publisher_;
    std::unique_ptr<FilePunchClient> subscriber_;
    ContentId content_id_;
    uint64_t file_size_ = 0;
};

TEST_F(EndToEndTest, SubscriberFetchesFromPublisher) {
    publisher_ = std::make_unique<FilePunchClient>(loopback_settings());
    subscriber_ = std::make_unique<FilePunchClient>(loopback_settings());
    ASSERT_TRUE(publisher_->start()) << publisher_->last_error_message();
    ASSERT_TRUE(subscriber_->start()) << subscriber_->last_error_message();

    EXPECT_EQ(publisher_->observed_address(), SocketAddress("127.0.0.1", publisher_->local_port()));

    // Outlives this test body if an assertion returns early
    struct ServeState {
        std::mutex mutex;
        std::condition_variable cv;
        bool served = false;
        bool served_ok = false;
        std::string request;
    };
    auto state = std::make_shared<ServeState>();

    ASSERT_TRUE(publisher_->publish(content_id_, file_size_, [state](const PeerSessionResult& result) {
        std::vector<uint8_t> message;
        std::string received;
        bool ok = result.success &&
                  result.connection->receive(message, std::chrono::milliseconds(3000));
        if (ok) {
            received.assign(message.begin(), message.end());
            ok = result.connection->send(bytes("chunk 0"));
        }
        std::lock_guard<std::mutex> lock(state->mutex);
        state->served = true;
        state->served_ok = ok;
        state->request = received;
        state->cv.notify_all();
    }));

    PeerSessionResult fetched = subscriber_->fetch(content_id_);
    ASSERT_TRUE(fetched.success) << error_kind_to_string(fetched.error) << ": " << fetched.error_message;
    EXPECT_EQ(fetched.file_size, file_size_);
    EXPECT_EQ(fetched.peer, SocketAddress("127.0.0.1", publisher_->local_port()));
    EXPECT_EQ(fetched.introduction.content_id, content_id_);
    ASSERT_NE(fetched.connection, nullptr);

    ASSERT_TRUE(fetched.connection->send(bytes("range 0")));
    std::vector<uint8_t> reply;
    ASSERT_TRUE(fetched.connection->receive(reply, std::chrono::milliseconds(3000)));
    EXPECT_EQ(std::string(reply.begin(), reply.end()), "chunk 0");

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        ASSERT_TRUE(state->cv.wait_for(lock, std::chrono::seconds(5), [&] { return state->served; }));
        EXPECT_TRUE(state->served_ok);
        EXPECT_EQ(state->request, "range 0");
    }

    fetched.connection->close();
}

TEST_F(EndToEndTest, UnknownContentIsDiscoveryError) {
    subscriber_ = std::make_unique<FilePunchClient>(loopback_settings());
    ASSERT_TRUE(subscriber_->start()) << subscriber_->last_error_message();

    PeerSessionResult fetched = subscriber_->fetch(compute_content_id(bytes("nobody has this")));
    EXPECT_FALSE(fetched.success);
    EXPECT_EQ(fetched.error, ErrorKind::DISCOVERY);
    EXPECT_EQ(fetched.connection, nullptr);
}

TEST_F(EndToEndTest, CancelledClientRefusesWork) {
    subscriber_ = std::make_unique<FilePunchClient>(loopback_settings());
    ASSERT_TRUE(subscriber_->start()) << subscriber_->last_error_message();

    subscriber_->cancel();
    EXPECT_TRUE(subscriber_->is_cancelled());

    PeerSessionResult fetched = subscriber_->fetch(content_id_);
    EXPECT_FALSE(fetched.success);
    EXPECT_EQ(fetched.error, ErrorKind::DISCOVERY);

    subscriber_->stop();
    EXPECT_FALSE(subscriber_->start());
}

TEST_F(EndToEndTest, UnreachableServerFailsStart) {
    ClientSettings settings = loopback_settings();
    server_->stop();
    settings.handshake_timeout_ms = 500;
    settings.request_timeout_ms = 500;

    subscriber_ = std::make_unique<FilePunchClient>(settings);
    EXPECT_FALSE(subscriber_->start());
    EXPECT_EQ(subscriber_->last_error(), ErrorKind::DISCOVERY);
    EXPECT_FALSE(subscriber_->is_running());
}

// Sessions served for earlier subscribers do not pile up on the publisher
TEST_F(EndToEndTest, PublisherReapsFinishedSessions) {
    publisher_ = std::make_unique<FilePunchClient>(loopback_settings());
    ASSERT_TRUE(publisher_->start()) << publisher_->last_error_message();

    ASSERT_TRUE(publisher_->publish(content_id_, file_size_, [](const PeerSessionResult& result) {
        std::vector<uint8_t> message;
        if (result.success && result.connection->receive(message, std::chrono::milliseconds(3000))) {
            result.connection->send(bytes("chunk 0"));
        }
    }));

    for (int i = 0; i < 4; ++i) {
        subscriber_ = std::make_unique<FilePunchClient>(loopback_settings());
        ASSERT_TRUE(subscriber_->start()) << subscriber_->last_error_message();

        PeerSessionResult fetched = subscriber_->fetch(content_id_);
        ASSERT_TRUE(fetched.success) << error_kind_to_string(fetched.error) << ": " << fetched.error_message;
        ASSERT_TRUE(fetched.connection->send(bytes("range 0")));
        std::vector<uint8_t> reply;
        ASSERT_TRUE(fetched.connection->receive(reply, std::chrono::milliseconds(3000)));
        fetched.connection->close();

        subscriber_->stop();
        subscriber_.reset();
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
        publisher_->cleanup_finished_threads();
        if (publisher_->get_active_thread_count() == 0) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_EQ(publisher_->get_active_thread_count(), 0u);
}
