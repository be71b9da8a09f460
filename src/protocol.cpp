/*
 * Input Link Wire Protocol Implementation
 */

#include "protocol.hpp"
#include "errors.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <random>

using nlohmann::json;

namespace input_link {

namespace {

struct TypeName {
    MessageType type;
    const char* name;
};

const std::array<TypeName, 7> MESSAGE_TYPE_NAMES = {{
    {MessageType::ControllerInput, "controller_input"},
    {MessageType::ControllerConnect, "controller_connect"},
    {MessageType::ControllerDisconnect, "controller_disconnect"},
    {MessageType::StatusRequest, "status_request"},
    {MessageType::StatusResponse, "status_response"},
    {MessageType::Error, "error"},
    {MessageType::Heartbeat, "heartbeat"},
}};

const json& require(const json& obj, const char* key, const char* context) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw DecodeError(std::string(context) + ": missing field '" + key + "'");
    }
    return *it;
}

std::string require_string(const json& obj, const char* key, const char* context) {
    const json& value = require(obj, key, context);
    if (!value.is_string()) {
        throw DecodeError(std::string(context) + ": field '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

long long require_integer(const json& obj, const char* key, const char* context) {
    const json& value = require(obj, key, context);
    if (!value.is_number_integer()) {
        throw DecodeError(std::string(context) + ": field '" + key + "' must be an integer");
    }
    return value.get<long long>();
}

void check_controller_reference(const json& payload, const char* context) {
    long long number = require_integer(payload, "controller_number", context);
    if (number < MIN_CONTROLLER_NUMBER || number > MAX_CONTROLLER_NUMBER) {
        throw DecodeError(std::string(context) + ": controller_number " + std::to_string(number) + " out of range");
    }
    require_string(payload, "controller_id", context);
}

void validate_payload(MessageType type, const json& payload) {
    switch (type) {
        case MessageType::ControllerInput:
            input_data_from_json(payload);
            break;
        case MessageType::ControllerConnect:
        case MessageType::ControllerDisconnect:
            check_controller_reference(payload, to_string(type));
            break;
        case MessageType::StatusResponse:
            require_integer(payload, "active_controllers", "status_response");
            require_string(payload, "connection_status", "status_response");
            require_string(payload, "server_time", "status_response");
            break;
        case MessageType::Error:
            require_string(payload, "error_code", "error");
            require_string(payload, "error_description", "error");
            break;
        case MessageType::StatusRequest:
        case MessageType::Heartbeat:
            break;
    }
}

}  // namespace

const char* to_string(MessageType type) {
    for (const auto& entry : MESSAGE_TYPE_NAMES) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

bool parse_message_type(const std::string& text, MessageType& out) {
    for (const auto& entry : MESSAGE_TYPE_NAMES) {
        if (text == entry.name) {
            out = entry.type;
            return true;
        }
    }
    return false;
}

std::string generate_uuid() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<unsigned long long> dist;

    unsigned long long hi = dist(rng);
    unsigned long long lo = dist(rng);
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  hi >> 32, (hi >> 16) & 0xffffULL, hi & 0xffffULL,
                  lo >> 48, lo & 0xffffffffffffULL);
    return buf;
}

std::string iso8601_utc_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm tm_utc;
    gmtime_r(&secs, &tm_utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06lld+00:00", date, static_cast<long long>(micros));
    return out;
}

json input_data_to_json(const ControllerInputData& data) {
    json buttons = json::object();
    for (const auto& field : BUTTON_FIELDS) {
        buttons[field.name] = data.buttons.*field.member;
    }
    json axes = json::object();
    for (const auto& field : AXIS_FIELDS) {
        axes[field.name] = data.axes.*field.member;
    }
    return json{
        {"controller_number", data.controller_number},
        {"controller_id", data.controller_id},
        {"input_method", to_string(data.input_method)},
        {"buttons", buttons},
        {"axes", axes},
        {"timestamp", data.timestamp},
    };
}

ControllerInputData input_data_from_json(const json& j) {
    const char* context = "controller_input";
    if (!j.is_object()) {
        throw DecodeError("controller_input: payload must be an object");
    }

    ControllerInputData data;
    long long number = require_integer(j, "controller_number", context);
    if (number < MIN_CONTROLLER_NUMBER || number > MAX_CONTROLLER_NUMBER) {
        throw DecodeError("controller_input: controller_number " + std::to_string(number) + " out of range");
    }
    data.controller_number = static_cast<int>(number);
    data.controller_id = trim(require_string(j, "controller_id", context));

    auto method = j.find("input_method");
    if (method != j.end()) {
        if (!method->is_string() || !parse_input_method(method->get<std::string>(), data.input_method)) {
            throw DecodeError("controller_input: invalid input_method");
        }
    }

    auto buttons = j.find("buttons");
    if (buttons != j.end()) {
        if (!buttons->is_object()) {
            throw DecodeError("controller_input: buttons must be an object");
        }
        for (const auto& field : BUTTON_FIELDS) {
            auto value = buttons->find(field.name);
            if (value == buttons->end()) continue;
            if (!value->is_boolean()) {
                throw DecodeError(std::string("controller_input: button '") + field.name + "' must be a boolean");
            }
            data.buttons.*field.member = value->get<bool>();
        }
    }

    auto axes = j.find("axes");
    if (axes != j.end()) {
        if (!axes->is_object()) {
            throw DecodeError("controller_input: axes must be an object");
        }
        for (const auto& field : AXIS_FIELDS) {
            auto value = axes->find(field.name);
            if (value == axes->end()) continue;
            if (!value->is_number()) {
                throw DecodeError(std::string("controller_input: axis '") + field.name + "' must be a number");
            }
            data.axes.*field.member = value->get<double>();
        }
        data.axes.clamp();
    }

    auto timestamp = j.find("timestamp");
    if (timestamp == j.end() || timestamp->is_null()) {
        data.timestamp = now_epoch_seconds();
    } else if (timestamp->is_number()) {
        data.timestamp = timestamp->get<double>();
    } else {
        throw DecodeError("controller_input: timestamp must be a number");
    }

    try {
        data.validate();
    } catch (const ValidationError& e) {
        throw DecodeError(std::string("controller_input: ") + e.what());
    }
    return data;
}

NetworkMessage::NetworkMessage(MessageType type, json payload, std::string message_id, double timestamp)
    : message_id_(message_id.empty() ? generate_uuid() : std::move(message_id)),
      message_type_(type),
      timestamp_(timestamp > 0.0 ? timestamp : now_epoch_seconds()),
      payload_(std::move(payload)) {
}

NetworkMessage NetworkMessage::createControllerInput(const ControllerInputData& input_data,
                                                     const std::string& message_id) {
    return NetworkMessage(MessageType::ControllerInput, input_data_to_json(input_data), message_id);
}

NetworkMessage NetworkMessage::createControllerConnect(int controller_number, const std::string& controller_id,
                                                       const std::string& message_id) {
    return NetworkMessage(MessageType::ControllerConnect,
                          json{{"controller_number", controller_number}, {"controller_id", controller_id}},
                          message_id);
}

NetworkMessage NetworkMessage::createControllerDisconnect(int controller_number, const std::string& controller_id,
                                                          const std::string& message_id) {
    return NetworkMessage(MessageType::ControllerDisconnect,
                          json{{"controller_number", controller_number}, {"controller_id", controller_id}},
                          message_id);
}

NetworkMessage NetworkMessage::createStatusRequest(const std::string& message_id) {
    return NetworkMessage(MessageType::StatusRequest, json::object(), message_id);
}

NetworkMessage NetworkMessage::createStatusResponse(int active_controllers, const std::string& connection_status,
                                                    const std::string& message_id) {
    return NetworkMessage(MessageType::StatusResponse,
                          json{
                              {"active_controllers", active_controllers},
                              {"connection_status", connection_status},
                              {"server_time", iso8601_utc_now()},
                          },
                          message_id);
}

NetworkMessage NetworkMessage::createError(const std::string& error_code, const std::string& error_description,
                                           const std::string& message_id) {
    return NetworkMessage(MessageType::Error,
                          json{{"error_code", error_code}, {"error_description", error_description}},
                          message_id);
}

NetworkMessage NetworkMessage::createHeartbeat(const std::string& message_id) {
    return NetworkMessage(MessageType::Heartbeat, json::object(), message_id);
}

std::string NetworkMessage::toJson() const {
    json j = {
        {"message_id", message_id_},
        {"message_type", to_string(message_type_)},
        {"timestamp", timestamp_},
        {"payload", payload_},
    };
    // Replace invalid UTF-8 instead of throwing on a peer-supplied string
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

NetworkMessage NetworkMessage::fromJson(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DecodeError(std::string("invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw DecodeError("message must be a JSON object");
    }

    std::string message_id = require_string(j, "message_id", "message");
    if (message_id.empty()) {
        throw DecodeError("message: message_id cannot be empty");
    }

    MessageType type;
    std::string type_name = require_string(j, "message_type", "message");
    if (!parse_message_type(type_name, type)) {
        throw DecodeError("message: unknown message_type '" + type_name + "'");
    }

    double timestamp = 0.0;
    auto ts = j.find("timestamp");
    if (ts != j.end()) {
        if (!ts->is_number()) {
            throw DecodeError("message: timestamp must be a number");
        }
        timestamp = ts->get<double>();
    }

    json payload = json::object();
    auto pl = j.find("payload");
    if (pl != j.end()) {
        if (!pl->is_object()) {
            throw DecodeError("message: payload must be an object");
        }
        payload = *pl;
    }

    validate_payload(type, payload);

    NetworkMessage message(type, std::move(payload), std::move(message_id), timestamp);
    if (ts != j.end()) {
        // Keep the sender's timestamp even when it is zero or negative
        message.timestamp_ = timestamp;
    }
    return message;
}

std::optional<ControllerInputData> NetworkMessage::getControllerInputData() const {
    if (message_type_ != MessageType::ControllerInput) {
        return std::nullopt;
    }
    return input_data_from_json(payload_);
}

std::optional<int> NetworkMessage::getControllerNumber() const {
    if (message_type_ != MessageType::ControllerConnect && message_type_ != MessageType::ControllerDisconnect) {
        return std::nullopt;
    }
    auto it = payload_.find("controller_number");
    if (it == payload_.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<int>();
}

}  // namespace input_link
