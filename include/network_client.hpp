/*
 * Network Client
 *
 * Keeps one outbound connection to a receiver and forwards queued messages
 * over it. Reconnects with exponential backoff:
 *
 *   stopped -> connecting -> connected -> disconnected -> reconnecting | failed
 *
 * Status changes are reported as strings through the status callback.
 */

#ifndef NETWORK_CLIENT_HPP
#define NETWORK_CLIENT_HPP

#include "bounded_queue.hpp"
#include "protocol.hpp"
#include "tcp_socket.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace input_link {

struct ClientConfig {
    std::string host = "127.0.0.1";
    unsigned short port = DEFAULT_PORT;
    double reconnect_interval = 1.0;  // seconds, doubled per attempt
    int max_reconnect_attempts = 10;  // <= 0 retries forever
    double ping_interval = 5.0;
    double ping_timeout = 20.0;
    size_t max_queue_size = 1000;
    int connect_timeout_ms = 5000;
};

// Upper bound on a single backoff wait, in seconds
constexpr double MAX_RECONNECT_DELAY = 30.0;

// min(interval * 2^(attempt - 1), 30)
double reconnect_delay(double interval, int attempt);

class NetworkClient {
public:
    using StatusCallback = std::function<void(const std::string&)>;
    using MessageCallback = std::function<void(const NetworkMessage&)>;

    explicit NetworkClient(const ClientConfig& config,
                           StatusCallback status_callback = StatusCallback(),
                           MessageCallback message_callback = MessageCallback());
    ~NetworkClient();

    NetworkClient(const NetworkClient&) = delete;
    NetworkClient& operator=(const NetworkClient&) = delete;

    void start();
    void stop();

    // Queue for delivery. False when the queue is full or the client is not
    // running; the sample is then lost and must not be retried.
    bool sendControllerInput(const ControllerInputData& input_data);
    bool sendMessage(const NetworkMessage& message);

    bool isRunning() const { return running_; }
    bool isConnected() const { return connected_; }
    size_t queueSize() const { return queue_.size(); }
    std::string status() const;
    std::string uri() const;

private:
    void connectionLoop();
    void senderLoop();
    void receiveLoop(TcpConnection& connection);
    void setStatus(const std::string& status);
    // Sleeps up to seconds; false if stop() interrupted it
    bool waitWhileRunning(double seconds);

    ClientConfig config_;
    StatusCallback status_callback_;
    MessageCallback message_callback_;

    BoundedQueue<std::string> queue_;
    std::atomic<bool> running_;
    std::atomic<bool> connected_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::shared_ptr<TcpConnection> connection_;
    std::string status_;

    std::mutex lifecycle_mutex_;
    std::thread connection_thread_;
    std::thread sender_thread_;
};

}  // namespace input_link

#endif // NETWORK_CLIENT_HPP
