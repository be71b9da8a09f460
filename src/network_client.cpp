/*
 * Network Client Implementation
 */

#include "network_client.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace input_link {

namespace {

const char* LOG_TAG = "client";

using Clock = std::chrono::steady_clock;

Clock::duration to_duration(double seconds) {
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

}  // namespace

double reconnect_delay(double interval, int attempt) {
    if (attempt < 1) attempt = 1;
    double delay = interval * std::pow(2.0, attempt - 1);
    return std::min(delay, MAX_RECONNECT_DELAY);
}

NetworkClient::NetworkClient(const ClientConfig& config, StatusCallback status_callback,
                             MessageCallback message_callback)
    : config_(config),
      status_callback_(std::move(status_callback)),
      message_callback_(std::move(message_callback)),
      queue_(config.max_queue_size),
      running_(false),
      connected_(false),
      status_("stopped") {
}

NetworkClient::~NetworkClient() {
    stop();
}

std::string NetworkClient::uri() const {
    return "tcp://" + config_.host + ":" + std::to_string(config_.port);
}

std::string NetworkClient::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void NetworkClient::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
        log_warning(LOG_TAG) << "client is already running";
        return;
    }

    running_ = true;
    log_info(LOG_TAG) << "starting client to " << uri();

    connection_thread_ = std::thread(&NetworkClient::connectionLoop, this);
    sender_thread_ = std::thread(&NetworkClient::senderLoop, this);
}

void NetworkClient::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_) return;

    log_info(LOG_TAG) << "stopping client";
    {
        std::lock_guard<std::mutex> state_lock(mutex_);
        running_ = false;
        if (connection_) {
            connection_->shutdown();
        }
    }
    wake_.notify_all();

    if (connection_thread_.joinable()) connection_thread_.join();
    if (sender_thread_.joinable()) sender_thread_.join();

    connected_ = false;
    setStatus("disconnected");
    log_info(LOG_TAG) << "client stopped";
}

bool NetworkClient::sendControllerInput(const ControllerInputData& input_data) {
    return sendMessage(NetworkMessage::createControllerInput(input_data));
}

bool NetworkClient::sendMessage(const NetworkMessage& message) {
    if (!running_) {
        log_warning(LOG_TAG) << "cannot send " << to_string(message.messageType()) << " - client not running";
        return false;
    }
    if (!queue_.tryPush(message.toJson())) {
        log_debug(LOG_TAG) << "outbound queue full, dropping " << to_string(message.messageType());
        return false;
    }
    return true;
}

void NetworkClient::setStatus(const std::string& status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }
    if (!status_callback_) return;
    try {
        status_callback_(status);
    } catch (const std::exception& e) {
        log_error(LOG_TAG) << "status callback: " << e.what();
    }
}

bool NetworkClient::waitWhileRunning(double seconds) {
    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, to_duration(seconds), [this] { return !running_; });
    return running_;
}

void NetworkClient::connectionLoop() {
    int attempts = 0;

    while (running_) {
        setStatus("connecting");
        std::shared_ptr<TcpConnection> connection = connect_tcp(config_.host, config_.port, config_.connect_timeout_ms);

        if (connection) {
            bool keep = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (running_) {
                    connection_ = connection;
                    keep = true;
                }
            }
            if (keep) {
                connected_ = true;
                attempts = 0;
                log_info(LOG_TAG) << "connected to " << uri();
                setStatus("connected");
                wake_.notify_all();

                receiveLoop(*connection);

                connected_ = false;
                std::lock_guard<std::mutex> lock(mutex_);
                connection_.reset();
            }
            connection->shutdown();
        }
        setStatus("disconnected");

        if (!running_) break;

        if (config_.max_reconnect_attempts <= 0 || attempts < config_.max_reconnect_attempts) {
            ++attempts;
            double wait = reconnect_delay(config_.reconnect_interval, attempts);
            log_info(LOG_TAG) << "reconnecting in " << wait << "s (attempt " << attempts << ")";
            setStatus("reconnecting");
            if (!waitWhileRunning(wait)) break;
        } else {
            log_error(LOG_TAG) << "max reconnection attempts reached";
            setStatus("failed");
            break;
        }
    }
}

void NetworkClient::receiveLoop(TcpConnection& connection) {
    auto ping_interval = to_duration(config_.ping_interval);
    auto ping_timeout = to_duration(config_.ping_timeout);
    auto last_inbound = Clock::now();
    auto next_ping = last_inbound + ping_interval;
    std::string line;

    while (running_) {
        auto now = Clock::now();
        if (now - last_inbound >= ping_timeout) {
            log_warning(LOG_TAG) << "no traffic from " << connection.peer() << " for "
                                 << config_.ping_timeout << "s, closing";
            return;
        }
        if (now >= next_ping) {
            if (!connection.sendLine(NetworkMessage::createHeartbeat().toJson())) {
                log_warning(LOG_TAG) << "heartbeat to " << connection.peer() << " failed";
                return;
            }
            next_ping = now + ping_interval;
        }

        auto until = std::min(next_ping, last_inbound + ping_timeout) - now;
        int wait_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(until).count()) + 1;

        switch (connection.readLine(line, wait_ms)) {
            case TcpConnection::ReadResult::Timeout:
                continue;
            case TcpConnection::ReadResult::Closed:
                log_warning(LOG_TAG) << "connection to " << connection.peer() << " closed";
                return;
            case TcpConnection::ReadResult::Error:
                return;
            case TcpConnection::ReadResult::Line:
                break;
        }

        last_inbound = Clock::now();
        try {
            NetworkMessage message = NetworkMessage::fromJson(line);
            log_debug(LOG_TAG) << "received " << to_string(message.messageType());
            if (message_callback_) {
                try {
                    message_callback_(message);
                } catch (const std::exception& e) {
                    log_error(LOG_TAG) << "message callback: " << e.what();
                }
            }
        } catch (const DecodeError& e) {
            log_error(LOG_TAG) << "failed to parse received message: " << e.what();
        }
    }
}

void NetworkClient::senderLoop() {
    while (running_) {
        if (!connected_) {
            // Keep messages queued until a connection exists
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait_for(lock, std::chrono::milliseconds(100), [this] { return !running_ || connected_; });
            continue;
        }

        std::optional<std::string> frame = queue_.pop(std::chrono::milliseconds(100));
        if (!frame) continue;

        std::shared_ptr<TcpConnection> connection;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connection = connection_;
        }

        if (connection && connection->sendLine(*frame)) {
            continue;
        }

        log_debug(LOG_TAG) << "send failed, re-queueing message";
        if (!queue_.tryPushFront(std::move(*frame))) {
            log_warning(LOG_TAG) << "outbound queue full, dropping unsent message";
        }
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, std::chrono::milliseconds(100), [this] { return !running_; });
    }
}

}  // namespace input_link
