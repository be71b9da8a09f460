/*
 * Input Link Wire Protocol
 *
 * One JSON object per message:
 *   { "message_id": "...", "message_type": "controller_input",
 *     "timestamp": 1700000000.123, "payload": { ... } }
 *
 * Unknown fields are ignored on read; missing or mistyped required fields
 * fail decoding with DecodeError.
 */

#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include "controller_types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace input_link {

constexpr unsigned short DEFAULT_PORT = 8765;

enum class MessageType {
    ControllerInput,
    ControllerConnect,
    ControllerDisconnect,
    StatusRequest,
    StatusResponse,
    Error,
    Heartbeat
};

const char* to_string(MessageType type);
bool parse_message_type(const std::string& text, MessageType& out);

class NetworkMessage {
public:
    NetworkMessage(MessageType type, nlohmann::json payload = nlohmann::json::object(),
                   std::string message_id = std::string(), double timestamp = 0.0);

    static NetworkMessage createControllerInput(const ControllerInputData& input_data,
                                                const std::string& message_id = std::string());
    static NetworkMessage createControllerConnect(int controller_number, const std::string& controller_id,
                                                  const std::string& message_id = std::string());
    static NetworkMessage createControllerDisconnect(int controller_number, const std::string& controller_id,
                                                     const std::string& message_id = std::string());
    static NetworkMessage createStatusRequest(const std::string& message_id = std::string());
    static NetworkMessage createStatusResponse(int active_controllers, const std::string& connection_status,
                                               const std::string& message_id = std::string());
    static NetworkMessage createError(const std::string& error_code, const std::string& error_description,
                                      const std::string& message_id = std::string());
    static NetworkMessage createHeartbeat(const std::string& message_id = std::string());

    std::string toJson() const;

    // Throws DecodeError on malformed or type-mismatched input
    static NetworkMessage fromJson(const std::string& text);

    // Only for ControllerInput messages; nothing for any other type
    std::optional<ControllerInputData> getControllerInputData() const;

    // controller_number of a ControllerConnect/ControllerDisconnect message
    std::optional<int> getControllerNumber() const;

    const std::string& messageId() const { return message_id_; }
    MessageType messageType() const { return message_type_; }
    double timestamp() const { return timestamp_; }
    const nlohmann::json& payload() const { return payload_; }

private:
    std::string message_id_;
    MessageType message_type_;
    double timestamp_;
    nlohmann::json payload_;
};

nlohmann::json input_data_to_json(const ControllerInputData& data);

// Throws DecodeError on missing/mistyped fields or out-of-range values
ControllerInputData input_data_from_json(const nlohmann::json& j);

// Random RFC 4122 version 4 identifier
std::string generate_uuid();

// Current UTC time as ISO 8601, e.g. 2024-01-31T12:00:00.123456+00:00
std::string iso8601_utc_now();

}  // namespace input_link

#endif // PROTOCOL_HPP
