/*
 * Virtual Controller Manager Implementation
 */

#include "virtual_controller_manager.hpp"
#include "logging.hpp"

namespace input_link {

namespace {

const char* LOG_TAG = "virtual-manager";

}  // namespace

VirtualControllerManager::VirtualControllerManager(const VirtualManagerConfig& config,
                                                   std::unique_ptr<VirtualControllerFactory> factory,
                                                   ControllerCallback creation_callback,
                                                   ControllerCallback destruction_callback)
    : config_(config),
      factory_(factory ? std::move(factory) : std::make_unique<VirtualControllerFactory>()),
      creation_callback_(std::move(creation_callback)),
      destruction_callback_(std::move(destruction_callback)),
      running_(false) {
}

VirtualControllerManager::~VirtualControllerManager() {
    stop();
}

void VirtualControllerManager::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        log_warning(LOG_TAG) << "virtual controller manager is already running";
        return;
    }
    running_ = true;
    log_info(LOG_TAG) << "virtual controller manager started";
}

void VirtualControllerManager::stop() {
    std::vector<int> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;

        while (!controllers_.empty()) {
            int number = controllers_.begin()->first;
            detachLocked(number);
            removed.push_back(number);
        }
        running_ = false;
    }

    for (int number : removed) {
        notify(destruction_callback_, number, "destruction");
    }
    log_info(LOG_TAG) << "virtual controller manager stopped";
}

bool VirtualControllerManager::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool VirtualControllerManager::numberAllowed(int controller_number) const {
    if (controller_number < MIN_CONTROLLER_NUMBER) return false;
    return config_.allow_extended_numbers || controller_number <= MAX_CONTROLLER_NUMBER;
}

bool VirtualControllerManager::atCapacity() const {
    return config_.max_controllers && controllers_.size() >= *config_.max_controllers;
}

void VirtualControllerManager::notify(const ControllerCallback& callback, int controller_number, const char* what) {
    if (!callback) return;
    try {
        callback(controller_number);
    } catch (const std::exception& e) {
        log_error(LOG_TAG) << "error in " << what << " callback: " << e.what();
    }
}

bool VirtualControllerManager::createLocked(int controller_number, const std::string& backend, bool& created) {
    created = false;

    if (!running_) {
        log_warning(LOG_TAG) << "cannot create controller - manager not running";
        return false;
    }
    if (!numberAllowed(controller_number)) {
        log_error(LOG_TAG) << "invalid controller number: " << controller_number;
        return false;
    }
    if (controllers_.count(controller_number)) {
        log_debug(LOG_TAG) << "controller " << controller_number << " already exists";
        return true;
    }
    if (atCapacity()) {
        log_error(LOG_TAG) << "maximum controllers (" << *config_.max_controllers << ") already created";
        return false;
    }

    try {
        std::unique_ptr<VirtualController> controller =
            factory_->create(backend.empty() ? config_.backend : backend, controller_number);
        if (!controller) {
            log_error(LOG_TAG) << "failed to create virtual controller " << controller_number;
            return false;
        }
        if (!controller->connect()) {
            log_error(LOG_TAG) << "failed to connect virtual controller " << controller_number;
            return false;
        }
        controllers_[controller_number] = std::move(controller);
    } catch (const std::exception& e) {
        log_error(LOG_TAG) << "failed to create virtual controller " << controller_number << ": " << e.what();
        return false;
    }

    log_info(LOG_TAG) << "virtual controller " << controller_number << " created and connected";
    created = true;
    return true;
}

bool VirtualControllerManager::createController(int controller_number, const std::string& backend) {
    bool created = false;
    bool ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ok = createLocked(controller_number, backend, created);
    }
    if (created) notify(creation_callback_, controller_number, "creation");
    return ok;
}

std::unique_ptr<VirtualController> VirtualControllerManager::detachLocked(int controller_number) {
    auto it = controllers_.find(controller_number);
    if (it == controllers_.end()) return nullptr;

    std::unique_ptr<VirtualController> controller = std::move(it->second);
    controllers_.erase(it);
    try {
        controller->disconnect();
    } catch (const std::exception& e) {
        log_error(LOG_TAG) << "error disconnecting virtual controller " << controller_number << ": " << e.what();
    }
    log_info(LOG_TAG) << "virtual controller " << controller_number << " removed";
    return controller;
}

bool VirtualControllerManager::removeController(int controller_number) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!detachLocked(controller_number)) {
            log_warning(LOG_TAG) << "controller " << controller_number << " does not exist";
            return false;
        }
    }
    notify(destruction_callback_, controller_number, "destruction");
    return true;
}

bool VirtualControllerManager::updateControllerState(const ControllerInputData& input_data) {
    int number = input_data.controller_number;
    bool created = false;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            log_warning(LOG_TAG) << "cannot update controller state - manager not running";
            return false;
        }

        if (!controllers_.count(number) && config_.auto_create && !atCapacity()) {
            log_info(LOG_TAG) << "auto-creating virtual controller " << number;
            createLocked(number, std::string(), created);
        }

        auto it = controllers_.find(number);
        if (it == controllers_.end()) {
            log_warning(LOG_TAG) << "virtual controller " << number << " not found";
        } else if (!it->second->isConnected()) {
            log_warning(LOG_TAG) << "virtual controller " << number << " not connected";
        } else {
            try {
                ok = it->second->updateState(input_data);
            } catch (const std::exception& e) {
                log_error(LOG_TAG) << "failed to update virtual controller " << number << ": " << e.what();
            }
        }
    }
    if (created) notify(creation_callback_, number, "creation");
    return ok;
}

bool VirtualControllerManager::resetController(int controller_number) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = controllers_.find(controller_number);
    if (it == controllers_.end()) {
        log_warning(LOG_TAG) << "virtual controller " << controller_number << " not found";
        return false;
    }
    try {
        it->second->resetState();
    } catch (const std::exception& e) {
        log_error(LOG_TAG) << "failed to reset virtual controller " << controller_number << ": " << e.what();
        return false;
    }
    return true;
}

void VirtualControllerManager::resetAllControllers() {
    for (int number : controllerNumbers()) {
        if (!resetController(number)) {
            log_debug(LOG_TAG) << "controller " << number << " gone before reset";
        }
    }
}

std::vector<VirtualControllerInfo> VirtualControllerManager::getControllerInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<VirtualControllerInfo> info;
    for (const auto& entry : controllers_) {
        info.push_back(VirtualControllerInfo{entry.first, entry.second->isConnected(), entry.second->backendName()});
    }
    return info;
}

bool VirtualControllerManager::isControllerActive(int controller_number) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = controllers_.find(controller_number);
    return it != controllers_.end() && it->second->isConnected();
}

int VirtualControllerManager::activeControllerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int count = 0;
    for (const auto& entry : controllers_) {
        if (entry.second->isConnected()) ++count;
    }
    return count;
}

std::vector<int> VirtualControllerManager::controllerNumbers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> numbers;
    for (const auto& entry : controllers_) {
        numbers.push_back(entry.first);
    }
    return numbers;
}

}  // namespace input_link
