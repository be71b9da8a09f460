/*
 * Virtual Controller Manager
 *
 * Owns controller_number -> VirtualController and serializes every
 * create/update/remove under one lock. Creation and destruction callbacks
 * run after the lock is released.
 */

#ifndef VIRTUAL_CONTROLLER_MANAGER_HPP
#define VIRTUAL_CONTROLLER_MANAGER_HPP

#include "controller_types.hpp"
#include "virtual_controller.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace input_link {

struct VirtualManagerConfig {
    std::optional<size_t> max_controllers = size_t(4);  // nullopt = no limit
    bool auto_create = true;
    // Lets direct callers use numbers above 8. Wire input stays in [1, 8],
    // so the receiver never sets it.
    bool allow_extended_numbers = false;
    std::string backend = "auto";
};

struct VirtualControllerInfo {
    int controller_number;
    bool connected;
    std::string backend;
};

class VirtualControllerManager {
public:
    using ControllerCallback = std::function<void(int controller_number)>;

    // A null factory means the platform's default bindings
    explicit VirtualControllerManager(const VirtualManagerConfig& config,
                                      std::unique_ptr<VirtualControllerFactory> factory = nullptr,
                                      ControllerCallback creation_callback = ControllerCallback(),
                                      ControllerCallback destruction_callback = ControllerCallback());
    ~VirtualControllerManager();

    VirtualControllerManager(const VirtualControllerManager&) = delete;
    VirtualControllerManager& operator=(const VirtualControllerManager&) = delete;

    void start();
    void stop();
    bool isRunning() const;

    // Succeeds if the controller already exists. backend overrides the
    // configured binding for this one controller.
    bool createController(int controller_number, const std::string& backend = std::string());
    bool removeController(int controller_number);
    bool updateControllerState(const ControllerInputData& input_data);
    bool resetController(int controller_number);
    void resetAllControllers();

    std::vector<VirtualControllerInfo> getControllerInfo() const;
    bool isControllerActive(int controller_number) const;
    int activeControllerCount() const;
    std::vector<int> controllerNumbers() const;

    const VirtualManagerConfig& config() const { return config_; }

private:
    bool numberAllowed(int controller_number) const;
    bool atCapacity() const;
    bool createLocked(int controller_number, const std::string& backend, bool& created);
    std::unique_ptr<VirtualController> detachLocked(int controller_number);
    void notify(const ControllerCallback& callback, int controller_number, const char* what);

    VirtualManagerConfig config_;
    std::unique_ptr<VirtualControllerFactory> factory_;
    ControllerCallback creation_callback_;
    ControllerCallback destruction_callback_;

    mutable std::mutex mutex_;
    std::map<int, std::unique_ptr<VirtualController>> controllers_;
    bool running_;
};

}  // namespace input_link

#endif // VIRTUAL_CONTROLLER_MANAGER_HPP
