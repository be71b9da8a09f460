/*
 * Network Server Implementation
 */

#include "network_server.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <cmath>

namespace input_link {

namespace {

const char* LOG_TAG = "server";

constexpr int ACCEPT_POLL_MS = 100;

}  // namespace

NetworkServer::NetworkServer(const ServerConfig& config)
    : config_(config), running_(false) {
}

NetworkServer::~NetworkServer() {
    stop();
}

std::string NetworkServer::address() const {
    return config_.host + ":" + std::to_string(port());
}

unsigned short NetworkServer::port() const {
    return listener_.isListening() ? listener_.port() : config_.port;
}

size_t NetworkServer::clientCount() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

std::vector<std::string> NetworkServer::clientIds() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : clients_) {
        ids.push_back(entry.first);
    }
    return ids;
}

int NetworkServer::activeControllers() const {
    if (!status_provider_) return 0;
    try {
        return status_provider_();
    } catch (const std::exception& e) {
        log_error(LOG_TAG) << "status provider: " << e.what();
        return 0;
    }
}

bool NetworkServer::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
        log_warning(LOG_TAG) << "server is already running";
        return true;
    }

    log_info(LOG_TAG) << "starting server on " << config_.host << ":" << config_.port;
    if (!listener_.listen(config_.host, config_.port)) {
        log_error(LOG_TAG) << "failed to start server on " << config_.host << ":" << config_.port;
        return false;
    }

    running_ = true;
    accept_thread_ = std::thread(&NetworkServer::acceptLoop, this);
    log_info(LOG_TAG) << "listening on " << address();
    return true;
}

void NetworkServer::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_) return;

    running_ = false;
    log_info(LOG_TAG) << "stopping server";

    if (accept_thread_.joinable()) accept_thread_.join();

    for (const auto& id : clientIds()) {
        disconnectClient(id);
    }
    reapFinished();

    listener_.close();
    log_info(LOG_TAG) << "server stopped";
}

void NetworkServer::acceptLoop() {
    while (running_) {
        reapFinished();

        std::unique_ptr<TcpConnection> connection = listener_.accept(ACCEPT_POLL_MS);
        if (!connection) continue;

        auto client = std::make_shared<Client>();
        client->id = generate_uuid();
        client->connection = std::move(connection);
        log_info(LOG_TAG) << "new client " << client->id << " from " << client->connection->peer();

        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            clients_[client->id] = client;
            client->thread = std::thread(&NetworkServer::handleClient, this, client);
        }
    }
}

void NetworkServer::reapFinished() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        finished.swap(finished_);
    }
    for (auto& thread : finished) {
        if (thread.joinable()) thread.join();
    }
}

void NetworkServer::handleClient(std::shared_ptr<Client> client) {
    TcpConnection& connection = *client->connection;

    if (client_connected_callback_) {
        try {
            client_connected_callback_(client->id);
        } catch (const std::exception& e) {
            log_error(LOG_TAG) << "client connected callback: " << e.what();
        }
    }

    NetworkMessage welcome = NetworkMessage::createStatusResponse(activeControllers(), "connected");
    if (!connection.sendLine(welcome.toJson())) {
        log_warning(LOG_TAG) << "client " << client->id << " closed before welcome";
        disconnectClient(client->id);
        return;
    }

    int timeout_ms = static_cast<int>(std::lround(config_.connection_timeout * 1000.0));
    std::string line;

    while (running_ && connection.isOpen()) {
        TcpConnection::ReadResult result = connection.readLine(line, timeout_ms);
        if (result == TcpConnection::ReadResult::Timeout) {
            log_warning(LOG_TAG) << "client " << client->id << " silent for "
                                 << config_.connection_timeout << "s, disconnecting";
            break;
        }
        if (result == TcpConnection::ReadResult::Closed) {
            log_info(LOG_TAG) << "client " << client->id << " disconnected";
            break;
        }
        if (result == TcpConnection::ReadResult::Error) {
            log_error(LOG_TAG) << "error reading from client " << client->id;
            break;
        }

        try {
            NetworkMessage message = NetworkMessage::fromJson(line);
            log_debug(LOG_TAG) << "received " << to_string(message.messageType()) << " from " << client->id;
            processMessage(*client, line, message);
        } catch (const DecodeError& e) {
            log_error(LOG_TAG) << "invalid message from client " << client->id << ": " << e.what();
            NetworkMessage error = NetworkMessage::createError("INVALID_MESSAGE", e.what());
            if (!connection.sendLine(error.toJson())) {
                log_debug(LOG_TAG) << "error reply to " << client->id << " not delivered";
            }
        }
    }

    disconnectClient(client->id);
}

void NetworkServer::processMessage(Client& client, const std::string& line, const NetworkMessage& message) {
    if (message_callback_) {
        try {
            message_callback_(message, client.id);
        } catch (const std::exception& e) {
            log_error(LOG_TAG) << "message callback: " << e.what();
        }
    }

    switch (message.messageType()) {
        case MessageType::ControllerInput: {
            std::optional<ControllerInputData> input = message.getControllerInputData();
            if (input && input_callback_) {
                try {
                    input_callback_(*input);
                } catch (const std::exception& e) {
                    log_error(LOG_TAG) << "input callback: " << e.what();
                }
            }
            break;
        }
        case MessageType::ControllerDisconnect: {
            std::optional<int> number = message.getControllerNumber();
            if (number && controller_disconnect_callback_) {
                try {
                    controller_disconnect_callback_(*number);
                } catch (const std::exception& e) {
                    log_error(LOG_TAG) << "controller disconnect callback: " << e.what();
                }
            }
            break;
        }
        case MessageType::StatusRequest: {
            NetworkMessage response = NetworkMessage::createStatusResponse(activeControllers(), "active");
            if (!client.connection->sendLine(response.toJson())) {
                log_debug(LOG_TAG) << "client " << client.id << " disconnected during status response";
            }
            break;
        }
        case MessageType::Heartbeat:
            if (!client.connection->sendLine(line)) {
                log_debug(LOG_TAG) << "client " << client.id << " disconnected during heartbeat response";
            }
            break;
        default:
            break;
    }
}

int NetworkServer::broadcastMessage(const NetworkMessage& message) {
    if (!running_) {
        log_warning(LOG_TAG) << "cannot broadcast - server not running";
        return 0;
    }

    std::vector<std::shared_ptr<Client>> targets;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (const auto& entry : clients_) {
            targets.push_back(entry.second);
        }
    }

    std::string frame = message.toJson();
    std::vector<std::string> failed;
    int sent = 0;
    for (const auto& client : targets) {
        if (!client->connection->isOpen()) continue;
        if (client->connection->sendLine(frame)) {
            ++sent;
        } else {
            log_debug(LOG_TAG) << "client " << client->id << " disconnected during broadcast";
            failed.push_back(client->id);
        }
    }

    for (const auto& id : failed) {
        disconnectClient(id);
    }
    return sent;
}

bool NetworkServer::sendToClient(const std::string& client_id, const NetworkMessage& message) {
    if (!running_) {
        log_warning(LOG_TAG) << "cannot send message - server not running";
        return false;
    }

    std::shared_ptr<Client> client;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = clients_.find(client_id);
        if (it != clients_.end()) client = it->second;
    }
    if (!client || !client->connection->isOpen()) {
        log_warning(LOG_TAG) << "client " << client_id << " not found or disconnected";
        return false;
    }

    if (!client->connection->sendLine(message.toJson())) {
        disconnectClient(client_id);
        return false;
    }
    return true;
}

void NetworkServer::disconnectClient(const std::string& client_id) {
    std::shared_ptr<Client> client;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = clients_.find(client_id);
        if (it == clients_.end()) return;
        client = it->second;
        clients_.erase(it);

        client->connection->shutdown();
        if (client->thread.get_id() == std::this_thread::get_id()) {
            finished_.push_back(std::move(client->thread));
        }
    }

    log_info(LOG_TAG) << "disconnecting client " << client_id;
    if (client->thread.joinable()) {
        client->thread.join();
    }

    if (client_disconnected_callback_) {
        try {
            client_disconnected_callback_(client_id);
        } catch (const std::exception& e) {
            log_error(LOG_TAG) << "client disconnected callback: " << e.what();
        }
    }
}

}  // namespace input_link
