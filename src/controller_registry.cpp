/*
 * Physical Controller Registry Implementation
 */

#include "controller_registry.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>

namespace input_link {

ControllerRegistry::ControllerRegistry(std::unique_ptr<DeviceBackend> backend, bool auto_assign_numbers)
    : backend_(std::move(backend)), auto_assign_numbers_(auto_assign_numbers) {
}

ControllerRegistry::~ControllerRegistry() {
    cleanup();
}

void ControllerRegistry::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    initializeLocked();
}

void ControllerRegistry::initializeLocked() {
    if (initialized_) return;
    if (!backend_) {
        throw InitializationError("no device backend");
    }
    backend_->initialize();
    initialized_ = true;
    log_info("registry") << "Controller registry initialized";
}

bool ControllerRegistry::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

std::vector<DetectedController> ControllerRegistry::scanControllers() {
    std::lock_guard<std::mutex> lock(mutex_);
    initializeLocked();

    std::vector<DeviceInfo> visible = backend_->enumerateDevices();
    log_debug("registry") << "Found " << visible.size() << " device(s)";

    std::vector<std::string> current_order;
    for (const auto& info : visible) {
        DetectedController controller;
        controller.device_index = info.index;
        controller.device_id = info.instance_id;
        controller.name = info.name;
        controller.guid = info.guid;
        controller.num_axes = info.num_axes;
        controller.num_buttons = info.num_buttons;
        controller.num_hats = info.num_hats;
        controller.state = ConnectionState::Connected;

        std::string id = controller.identifier();
        DetectedController* existing = findLocked(id);
        if (existing) {
            // Known attachment: keep number and input method, refresh the rest
            controller.assigned_number = existing->assigned_number;
            controller.preferred_input_method = existing->preferred_input_method;
            if (existing->state != ConnectionState::Connected) {
                log_info("registry") << "Controller reconnected: " << controller.name;
            }
            *existing = controller;
        } else {
            controller.preferred_input_method = controller.getRecommendedInputMethod();
            if (auto_assign_numbers_) {
                controller.assigned_number = nextAvailableNumberLocked();
                if (!controller.assigned_number) {
                    log_warning("registry") << "No free controller number for " << controller.name;
                }
            }
            log_info("registry") << "Detected controller: " << controller.name
                                 << " (ID: " << controller.device_id << ")";
            controllers_[id] = controller;
        }
        current_order.push_back(id);
    }

    // Previously connected records that are no longer visible
    for (auto& entry : controllers_) {
        if (std::find(current_order.begin(), current_order.end(), entry.first) != current_order.end()) {
            continue;
        }
        if (entry.second.state == ConnectionState::Connected) {
            entry.second.state = ConnectionState::Disconnected;
            log_info("registry") << "Controller disconnected: " << entry.second.name;
        }
    }
    scan_order_ = std::move(current_order);

    std::vector<DetectedController> out;
    out.reserve(controllers_.size());
    for (const auto& id : scan_order_) {
        out.push_back(controllers_.at(id));
    }
    for (const auto& entry : controllers_) {
        if (entry.second.state != ConnectionState::Connected) {
            out.push_back(entry.second);
        }
    }
    return out;
}

std::vector<DetectedController> ControllerRegistry::getConnectedControllers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DetectedController> out;
    for (const auto& id : scan_order_) {
        const DetectedController& controller = controllers_.at(id);
        if (controller.state == ConnectionState::Connected) {
            out.push_back(controller);
        }
    }
    return out;
}

std::optional<DetectedController> ControllerRegistry::getControllerByIdentifier(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = controllers_.find(identifier);
    if (it == controllers_.end()) return std::nullopt;
    return it->second;
}

std::optional<DetectedController> ControllerRegistry::getControllerByDeviceId(int device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : controllers_) {
        if (entry.second.device_id == device_id) return entry.second;
    }
    return std::nullopt;
}

std::optional<DetectedController> ControllerRegistry::getControllerByIndex(int device_index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : scan_order_) {
        const DetectedController& controller = controllers_.at(id);
        if (controller.device_index == device_index) return controller;
    }
    return std::nullopt;
}

DetectedController* ControllerRegistry::findLocked(const std::string& identifier) {
    auto it = controllers_.find(identifier);
    return it == controllers_.end() ? nullptr : &it->second;
}

std::set<int> ControllerRegistry::assignedNumbersLocked() const {
    std::set<int> numbers;
    for (const auto& entry : controllers_) {
        if (entry.second.assigned_number) {
            numbers.insert(*entry.second.assigned_number);
        }
    }
    return numbers;
}

std::optional<int> ControllerRegistry::nextAvailableNumberLocked() const {
    std::set<int> used = assignedNumbersLocked();
    for (int n = MIN_CONTROLLER_NUMBER; n <= MAX_CONTROLLER_NUMBER; ++n) {
        if (!used.count(n)) return n;
    }
    return std::nullopt;
}

bool ControllerRegistry::assignControllerNumber(const std::string& identifier, int number) {
    if (!is_valid_controller_number(number)) {
        log_error("registry") << "Invalid controller number: " << number;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    DetectedController* controller = findLocked(identifier);

    if (!controller) {
        // Fallback: match by GUID prefix, preferring an unassigned candidate
        std::string guid_key = identifier.substr(0, identifier.find('_'));
        if (!guid_key.empty()) {
            for (auto& entry : controllers_) {
                if (entry.second.guid != guid_key) continue;
                if (!controller || (controller->assigned_number && !entry.second.assigned_number)) {
                    controller = &entry.second;
                }
            }
        }
    }

    if (!controller) {
        log_error("registry") << "Controller not found: " << identifier;
        return false;
    }

    for (auto& entry : controllers_) {
        DetectedController& other = entry.second;
        if (&other != controller && other.assigned_number == number) {
            other.assigned_number.reset();
            log_info("registry") << "Unassigned number " << number << " from " << other.name;
        }
    }

    controller->assigned_number = number;
    log_info("registry") << "Assigned controller number " << number << " to " << controller->name;
    return true;
}

bool ControllerRegistry::unassignController(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    DetectedController* controller = findLocked(identifier);
    if (!controller) {
        log_error("registry") << "Controller not found for unassign: " << identifier;
        return false;
    }
    if (controller->assigned_number) {
        controller->assigned_number.reset();
        log_info("registry") << "Unassigned number from " << controller->name;
    }
    return true;
}

bool ControllerRegistry::setInputMethod(const std::string& identifier, InputMethod method) {
    std::lock_guard<std::mutex> lock(mutex_);
    DetectedController* controller = findLocked(identifier);
    if (!controller) {
        log_error("registry") << "Controller not found: " << identifier;
        return false;
    }
    controller->preferred_input_method = method;
    log_info("registry") << "Set input method " << to_string(method) << " for " << controller->name;
    return true;
}

int ControllerRegistry::forgetDisconnected() {
    std::lock_guard<std::mutex> lock(mutex_);
    int dropped = 0;
    for (auto it = controllers_.begin(); it != controllers_.end();) {
        if (it->second.state != ConnectionState::Connected) {
            it = controllers_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

void ControllerRegistry::pumpEvents() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        backend_->pumpEvents();
    }
}

bool ControllerRegistry::readState(const DetectedController& controller, RawDeviceState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) return false;

    // The index is only meaningful while the same attachment still sits there
    auto it = controllers_.find(controller.identifier());
    if (it == controllers_.end() || it->second.state != ConnectionState::Connected) {
        return false;
    }
    return backend_->readState(it->second.device_index, state);
}

void ControllerRegistry::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) return;
    backend_->shutdown();
    initialized_ = false;
    log_info("registry") << "Controller registry cleaned up";
}

}  // namespace input_link
