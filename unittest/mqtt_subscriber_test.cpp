// ============================================================================
// MQTT SUBSCRIBER UNIT TESTS
// ============================================================================
// Message forwarding, connect options and shutdown while no broker answers
// ============================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <trafficmon/core/ingest/mqtt_subscriber.hpp>

using namespace TrafficMon;

namespace {

struct Received {
    std::string topic;
    uint64_t size;
    double timestamp;
};

// Loopback listener that never accepts; backlog fixes how many connects complete
class SilentListener {
public:
    explicit SilentListener(int backlog) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(fd_, backlog);

        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        addr_ = addr;
        port_ = ntohs(addr.sin_port);
    }

    ~SilentListener() {
        for (int fd : fillers_) close(fd);
        if (fd_ >= 0) close(fd_);
    }

    int port() const { return port_; }

    // Occupies the accept queue so further SYNs go unanswered
    void fillAcceptQueue(int connections) {
        for (int i = 0; i < connections; ++i) {
            int fd = socket(AF_INET, SOCK_STREAM, 0);
            fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
            connect(fd, reinterpret_cast<const sockaddr*>(&addr_), sizeof(addr_));
            fillers_.push_back(fd);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

private:
    int fd_ = -1;
    int port_ = 0;
    sockaddr_in addr_{};
    std::vector<int> fillers_;
};

int unusedPort() {
    SilentListener probe(1);
    return probe.port();
}

bool waitFor(const std::function<bool()>& cond, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return cond();
}

MqttSubscriber::Config testConfig(int port) {
    MqttSubscriber::Config config;
    config.port = port;
    config.client_id = "trafficmon-test";
    config.topic_filter = "zigbee2mqtt/#";
    config.reconnect_min_ms = 50;
    config.reconnect_max_ms = 200;
    config.connect_timeout_ms = 10000;
    return config;
}

} // anonymous namespace

TEST(MqttSubscriber, ServerUri) {
    EXPECT_EQ(MqttSubscriber::serverUri("127.0.0.1", 1883), "tcp://127.0.0.1:1883");
    EXPECT_EQ(MqttSubscriber::serverUri("broker.lan", 8883), "tcp://broker.lan:8883");
}

TEST(MqttSubscriber, ConnectOptionsFollowConfig) {
    auto config = testConfig(1883);
    config.keepalive_seconds = 30;
    config.username = "monitor";
    config.password = "secret";
    MqttSubscriber subscriber(config, nullptr);

    auto options = subscriber.connectOptions();
    EXPECT_EQ(options.get_keep_alive_interval(), std::chrono::seconds(30));
    EXPECT_TRUE(options.get_clean_session());
    EXPECT_TRUE(options.get_automatic_reconnect());
    EXPECT_EQ(options.get_user_name(), "monitor");
}

TEST(MqttSubscriber, PasswordIgnoredWithoutUsername) {
    auto config = testConfig(1883);
    config.password = "secret";
    MqttSubscriber subscriber(config, nullptr);

    auto options = subscriber.connectOptions();
    EXPECT_TRUE(options.get_user_name().empty());
    EXPECT_TRUE(options.get_password_str().empty());
}

TEST(MqttSubscriber, DeliverForwardsTopicAndPayloadSize) {
    std::vector<Received> received;
    MqttSubscriber subscriber(testConfig(1883),
        [&received](const std::string& topic, uint64_t size, double ts) {
            received.push_back({topic, size, ts});
        });

    double before = std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    subscriber.deliver(mqtt::make_message("zigbee2mqtt/lamp", std::string(25, 'x')));
    subscriber.deliver(mqtt::make_message("zigbee2mqtt/bridge/state", std::string()));

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].topic, "zigbee2mqtt/lamp");
    EXPECT_EQ(received[0].size, 25u);
    EXPECT_GE(received[0].timestamp, before - 1.0);
    EXPECT_EQ(received[1].topic, "zigbee2mqtt/bridge/state");
    EXPECT_EQ(received[1].size, 0u);
    EXPECT_EQ(subscriber.messagesReceived(), 2u);
}

TEST(MqttSubscriber, HandlerFailureIsContained) {
    int calls = 0;
    MqttSubscriber subscriber(testConfig(1883),
        [&calls](const std::string&, uint64_t, double) {
            ++calls;
            throw std::runtime_error("aggregator rejected message");
        });

    EXPECT_NO_THROW(subscriber.deliver(mqtt::make_message("zigbee2mqtt/a", std::string("1"))));
    EXPECT_NO_THROW(subscriber.deliver(mqtt::make_message("zigbee2mqtt/b", std::string("2"))));
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(subscriber.messagesReceived(), 2u);
}

TEST(MqttSubscriber, RetriesWhileBrokerRefuses) {
    MqttSubscriber subscriber(testConfig(unusedPort()), nullptr);
    subscriber.start();

    EXPECT_TRUE(waitFor([&]() { return subscriber.reconnects() >= 2; }, std::chrono::milliseconds(5000)));
    EXPECT_FALSE(subscriber.isConnected());

    auto begin = std::chrono::steady_clock::now();
    subscriber.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1000));
}

TEST(MqttSubscriber, StopIsPromptWhileBackingOff) {
    auto config = testConfig(unusedPort());
    config.reconnect_min_ms = 10000;
    config.reconnect_max_ms = 10000;
    MqttSubscriber subscriber(config, nullptr);
    subscriber.start();

    ASSERT_TRUE(waitFor([&]() { return subscriber.reconnects() >= 1; }, std::chrono::milliseconds(3000)));
    auto begin = std::chrono::steady_clock::now();
    subscriber.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1000));
}

TEST(MqttSubscriber, StopIsPromptWhileConnectIsPending) {
    SilentListener listener(0);
    listener.fillAcceptQueue(3);

    MqttSubscriber subscriber(testConfig(listener.port()), nullptr);
    subscriber.start();

    // Connect can neither complete nor fail before the 10s timeout
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    EXPECT_FALSE(subscriber.isConnected());

    auto begin = std::chrono::steady_clock::now();
    subscriber.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1000));
}

TEST(MqttSubscriber, StopWithoutStartIsSafe) {
    MqttSubscriber subscriber(testConfig(1883), nullptr);
    EXPECT_NO_THROW(subscriber.stop());
    EXPECT_FALSE(subscriber.isConnected());
}
