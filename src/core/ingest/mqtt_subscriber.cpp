#include <trafficmon/core/ingest/mqtt_subscriber.hpp>
#include <trafficmon/core/utils/clock.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace TrafficMon {

namespace {

// Paho takes retry and timeout intervals in whole seconds
std::chrono::seconds wholeSeconds(uint32_t ms) {
    return std::chrono::seconds(std::max<uint32_t>(ms / 1000, 1));
}

} // anonymous namespace

MqttSubscriber::MqttSubscriber(Config config, MessageHandler handler)
    : config_(std::move(config)),
      handler_(std::move(handler)),
      subscribeListener_(*this) {
}

MqttSubscriber::~MqttSubscriber() noexcept {
    stop();
}

std::string MqttSubscriber::serverUri(const std::string& host, int port) {
    return "tcp://" + host + ":" + std::to_string(port);
}

mqtt::connect_options MqttSubscriber::connectOptions() const {
    auto builder = mqtt::connect_options_builder()
        .keep_alive_interval(std::chrono::seconds(config_.keepalive_seconds))
        .connect_timeout(wholeSeconds(config_.connect_timeout_ms))
        .clean_session(true)
        .automatic_reconnect(wholeSeconds(config_.reconnect_min_ms),
                             wholeSeconds(std::max(config_.reconnect_max_ms, config_.reconnect_min_ms)));

    // A password without a username is not allowed in 3.1.1
    if (!config_.username.empty()) {
        builder.user_name(config_.username);
        if (!config_.password.empty()) builder.password(config_.password);
    }
    return builder.finalize();
}

void MqttSubscriber::start() {
    if (isRunning_.load(std::memory_order_acquire)) {
        return;
    }

    client_ = std::make_unique<mqtt::async_client>(serverUri(config_.host, config_.port), config_.client_id);
    client_->set_connected_handler([this](const std::string& cause) { onConnected(cause); });
    client_->set_connection_lost_handler([this](const std::string& cause) { onConnectionLost(cause); });
    client_->set_message_callback([this](mqtt::const_message_ptr msg) { deliver(msg); });

    isRunning_.store(true, std::memory_order_release);
    connectThread_ = std::thread(&MqttSubscriber::runLoop, this);
    spdlog::info("[MqttSubscriber] Started for {}:{} filter='{}'",
                 config_.host, config_.port, config_.topic_filter);
}

void MqttSubscriber::stop() {
    {
        std::lock_guard<std::mutex> lock(sleepMutex_);
        isRunning_.store(false, std::memory_order_release);
    }
    sleepCv_.notify_all();

    if (connectThread_.joinable()) {
        connectThread_.join();
    }
    if (!client_) {
        return;
    }

    try {
        if (client_->is_connected()) {
            client_->disconnect()->wait_for(std::chrono::milliseconds(kDisconnectTimeoutMs));
        }
    } catch (const mqtt::exception& e) {
        spdlog::warn("[MqttSubscriber] Disconnect failed: {}", e.what());
    }
    client_->disable_callbacks();
    client_.reset();
    connected_.store(false, std::memory_order_release);
    subscribed_.store(false, std::memory_order_release);

    spdlog::info("[MqttSubscriber] Stopped. Stats: messages={}, reconnects={}, errors={}",
                 totalMessages_.load(), totalReconnects_.load(), totalHandlerErrors_.load());
}

void MqttSubscriber::runLoop() {
    uint32_t delay_ms = config_.reconnect_min_ms;

    while (isRunning_.load(std::memory_order_acquire)) {
        try {
            // Once connected, reconnects belong to Paho
            connectOnce();
            return;
        } catch (const mqtt::exception& e) {
            spdlog::error("[MqttSubscriber] Failed to connect to {}:{}: {}",
                          config_.host, config_.port, e.what());
        }

        if (!isRunning_.load(std::memory_order_acquire)) break;

        totalReconnects_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[MqttSubscriber] Retrying {}:{} in {}ms", config_.host, config_.port, delay_ms);
        waitBackoff(delay_ms);
        delay_ms = std::min(delay_ms * 2, std::max(config_.reconnect_max_ms, config_.reconnect_min_ms));
    }
}

bool MqttSubscriber::connectOnce() {
    auto tok = client_->connect(connectOptions());
    // wait_for throws mqtt::exception when the attempt fails
    while (!tok->wait_for(std::chrono::milliseconds(kPollIntervalMs))) {
        if (!isRunning_.load(std::memory_order_acquire)) {
            spdlog::info("[MqttSubscriber] Connect to {}:{} abandoned on shutdown", config_.host, config_.port);
            return false;
        }
    }
    return true;
}

void MqttSubscriber::waitBackoff(uint32_t delay_ms) {
    std::unique_lock<std::mutex> lock(sleepMutex_);
    sleepCv_.wait_for(lock, std::chrono::milliseconds(delay_ms), [this]() {
        return !isRunning_.load(std::memory_order_acquire);
    });
}

void MqttSubscriber::onConnected(const std::string& /*cause*/) {
    connected_.store(true, std::memory_order_release);
    spdlog::info("[MqttSubscriber] Connected to MQTT broker at {}:{}", config_.host, config_.port);

    // Clean session: the subscription does not survive a reconnect
    try {
        client_->subscribe(config_.topic_filter, kSubscribeQos, nullptr, subscribeListener_);
    } catch (const mqtt::exception& e) {
        spdlog::error("[MqttSubscriber] Subscribe to {} failed: {}", config_.topic_filter, e.what());
    }
}

void MqttSubscriber::onConnectionLost(const std::string& cause) {
    connected_.store(false, std::memory_order_release);
    subscribed_.store(false, std::memory_order_release);
    totalReconnects_.fetch_add(1, std::memory_order_relaxed);
    spdlog::warn("[MqttSubscriber] Connection to {}:{} lost: {}",
                 config_.host, config_.port, cause.empty() ? "unknown cause" : cause);
}

void MqttSubscriber::deliver(const mqtt::const_message_ptr& msg) {
    if (!msg) return;

    const double ts = Clock::wall_seconds();
    totalMessages_.fetch_add(1, std::memory_order_relaxed);
    if (!handler_) return;

    const std::string& topic = msg->get_topic();
    try {
        handler_(topic, static_cast<uint64_t>(msg->get_payload().size()), ts);
    } catch (const std::exception& e) {
        totalHandlerErrors_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[MqttSubscriber] Message handler failed for '{}': {}", topic, e.what());
    }
}

void MqttSubscriber::SubscribeListener::on_success(const mqtt::token& /*tok*/) {
    owner_.subscribed_.store(true, std::memory_order_release);
    spdlog::info("[MqttSubscriber] Subscribed to {}", owner_.config_.topic_filter);
}

void MqttSubscriber::SubscribeListener::on_failure(const mqtt::token& tok) {
    spdlog::error("[MqttSubscriber] Subscription to {} refused (rc={})",
                  owner_.config_.topic_filter, tok.get_return_code());
}

} // namespace TrafficMon
