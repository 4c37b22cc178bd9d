#pragma once

#include <mqtt/async_client.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace TrafficMon {

/**
 * @brief Paho MQTT client adapter feeding the aggregator
 *
 * Subscribes to a single filter at QoS 0 and calls the handler for every
 * message with the topic, the payload size and the wall-clock arrival time.
 * The handler runs on the Paho callback thread only.
 *
 * The first connection is retried from the subscriber's own thread with
 * capped exponential backoff; after that Paho's automatic reconnect takes
 * over and the subscription is renewed on every (re)connect. Pending connects
 * are polled in short slices so stop() returns promptly.
 */
class MqttSubscriber {
public:
    using MessageHandler = std::function<void(const std::string& topic, uint64_t payload_size, double timestamp)>;

    struct Config {
        std::string host = "127.0.0.1";
        int port = 1883;
        std::string client_id = "trafficmon";
        std::string username;
        std::string password;
        uint16_t keepalive_seconds = 60;
        std::string topic_filter = "#";
        uint32_t reconnect_min_ms = 1000;
        uint32_t reconnect_max_ms = 30000;
        uint32_t connect_timeout_ms = 10000;
    };

    MqttSubscriber(Config config, MessageHandler handler);
    ~MqttSubscriber() noexcept;

    MqttSubscriber(const MqttSubscriber&) = delete;
    MqttSubscriber& operator=(const MqttSubscriber&) = delete;

    void start();
    void stop();

    // Entry point of the Paho message callback
    void deliver(const mqtt::const_message_ptr& msg);

    // "tcp://host:port"
    static std::string serverUri(const std::string& host, int port);
    mqtt::connect_options connectOptions() const;

    bool isConnected() const { return connected_.load(std::memory_order_acquire); }
    bool isSubscribed() const { return subscribed_.load(std::memory_order_acquire); }
    uint64_t messagesReceived() const { return totalMessages_.load(std::memory_order_relaxed); }
    uint64_t reconnects() const { return totalReconnects_.load(std::memory_order_relaxed); }

private:
    // Completion of the SUBSCRIBE issued from the connected handler
    class SubscribeListener : public virtual mqtt::iaction_listener {
    public:
        explicit SubscribeListener(MqttSubscriber& owner) : owner_(owner) {}
        void on_success(const mqtt::token& tok) override;
        void on_failure(const mqtt::token& tok) override;

    private:
        MqttSubscriber& owner_;
    };

    void runLoop();
    // Returns true once connected, false if stop() interrupted the attempt
    bool connectOnce();
    void waitBackoff(uint32_t delay_ms);
    void onConnected(const std::string& cause);
    void onConnectionLost(const std::string& cause);

    Config config_;
    MessageHandler handler_;
    std::unique_ptr<mqtt::async_client> client_;
    SubscribeListener subscribeListener_;

    std::atomic<bool> isRunning_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> subscribed_{false};
    std::thread connectThread_;

    // For interruptible backoff during shutdown
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;

    // Statistics
    std::atomic<uint64_t> totalMessages_{0};
    std::atomic<uint64_t> totalReconnects_{0};
    std::atomic<uint64_t> totalHandlerErrors_{0};

    static constexpr int kSubscribeQos = 0;
    static constexpr int kPollIntervalMs = 200;
    static constexpr int kDisconnectTimeoutMs = 1000;
};

} // namespace TrafficMon
