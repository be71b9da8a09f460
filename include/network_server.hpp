/*
 * Network Server
 *
 * Accepts sender connections, decodes their messages and routes them by
 * type. One handler thread per connection; an accept thread owns the
 * listening socket.
 */

#ifndef NETWORK_SERVER_HPP
#define NETWORK_SERVER_HPP

#include "protocol.hpp"
#include "tcp_socket.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace input_link {

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = DEFAULT_PORT;  // 0 picks a free port
    double connection_timeout = 30.0;    // seconds of silence before a client is dropped
};

class NetworkServer {
public:
    using InputCallback = std::function<void(const ControllerInputData&)>;
    using MessageCallback = std::function<void(const NetworkMessage&, const std::string& client_id)>;
    using ClientCallback = std::function<void(const std::string& client_id)>;
    using ControllerDisconnectCallback = std::function<void(int controller_number)>;
    using StatusProvider = std::function<int()>;

    explicit NetworkServer(const ServerConfig& config);
    ~NetworkServer();

    NetworkServer(const NetworkServer&) = delete;
    NetworkServer& operator=(const NetworkServer&) = delete;

    // Callbacks must be installed before start()
    void setInputCallback(InputCallback callback) { input_callback_ = std::move(callback); }
    void setMessageCallback(MessageCallback callback) { message_callback_ = std::move(callback); }
    void setClientConnectedCallback(ClientCallback callback) { client_connected_callback_ = std::move(callback); }
    void setClientDisconnectedCallback(ClientCallback callback) { client_disconnected_callback_ = std::move(callback); }
    void setControllerDisconnectCallback(ControllerDisconnectCallback callback) {
        controller_disconnect_callback_ = std::move(callback);
    }
    // Supplies active_controllers for STATUS_RESPONSE
    void setStatusProvider(StatusProvider provider) { status_provider_ = std::move(provider); }

    bool start();
    void stop();

    // Returns the number of clients reached; clients that fail are disconnected
    int broadcastMessage(const NetworkMessage& message);
    bool sendToClient(const std::string& client_id, const NetworkMessage& message);

    // Safe to call repeatedly for the same id
    void disconnectClient(const std::string& client_id);

    bool running() const { return running_; }
    size_t clientCount() const;
    std::vector<std::string> clientIds() const;
    std::string address() const;
    unsigned short port() const;

private:
    struct Client {
        std::string id;
        std::shared_ptr<TcpConnection> connection;
        std::thread thread;
    };

    void acceptLoop();
    void handleClient(std::shared_ptr<Client> client);
    void processMessage(Client& client, const std::string& line, const NetworkMessage& message);
    void reapFinished();
    int activeControllers() const;

    ServerConfig config_;
    InputCallback input_callback_;
    MessageCallback message_callback_;
    ClientCallback client_connected_callback_;
    ClientCallback client_disconnected_callback_;
    ControllerDisconnectCallback controller_disconnect_callback_;
    StatusProvider status_provider_;

    TcpListener listener_;
    std::atomic<bool> running_;
    std::thread accept_thread_;
    std::mutex lifecycle_mutex_;

    mutable std::mutex clients_mutex_;
    std::map<std::string, std::shared_ptr<Client>> clients_;
    std::vector<std::thread> finished_;  // handler threads that removed themselves
};

}  // namespace input_link

#endif // NETWORK_SERVER_HPP
