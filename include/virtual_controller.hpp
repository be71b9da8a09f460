/*
 * Virtual Controller
 *
 * A platform virtual device fed with normalized input samples. The base
 * class keeps the last applied state and hands only changed buttons and
 * axes to the driver binding, followed by one flush per update.
 */

#ifndef VIRTUAL_CONTROLLER_HPP
#define VIRTUAL_CONTROLLER_HPP

#include "controller_types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace input_link {

class VirtualController {
public:
    explicit VirtualController(int controller_number);
    virtual ~VirtualController() = default;

    VirtualController(const VirtualController&) = delete;
    VirtualController& operator=(const VirtualController&) = delete;

    bool connect();

    // Releases everything, then tears the device down
    void disconnect();

    // False if not connected or the driver rejected a change
    bool updateState(const ControllerInputData& input_data);

    // Back to all-released, centered sticks, triggers at rest
    void resetState();

    int controllerNumber() const { return controller_number_; }
    bool isConnected() const { return connected_; }
    const ButtonState& appliedButtons() const { return applied_buttons_; }
    const AxisState& appliedAxes() const { return applied_axes_; }

    virtual const char* backendName() const = 0;

protected:
    virtual bool openDevice() = 0;
    virtual void closeDevice() = 0;

    // index into BUTTON_FIELDS / AXIS_FIELDS. appliedButtons() and
    // appliedAxes() already hold the new state when these run.
    virtual bool setButton(size_t index, bool pressed) = 0;
    virtual bool setAxis(size_t index, double value) = 0;
    virtual bool flush() = 0;

private:
    bool apply(const ButtonState& buttons, const AxisState& axes);

    int controller_number_;
    bool connected_;
    ButtonState applied_buttons_;
    AxisState applied_axes_;
};

using VirtualControllerCreator = std::function<std::unique_ptr<VirtualController>(int controller_number)>;

// Named table of virtual device bindings. "auto" resolves to the platform
// default; platforms without a binding have none.
class VirtualControllerFactory {
public:
    // Registers the bindings available on this platform
    VirtualControllerFactory();

    void registerBackend(const std::string& name, VirtualControllerCreator creator);
    bool hasBackend(const std::string& name) const;
    std::vector<std::string> backendNames() const;

    // nullptr (logged) if the backend is unknown or the platform has none
    std::unique_ptr<VirtualController> create(const std::string& backend, int controller_number) const;

    // Empty on unsupported platforms
    static std::string defaultBackend();

private:
    std::map<std::string, VirtualControllerCreator> creators_;
};

}  // namespace input_link

#endif // VIRTUAL_CONTROLLER_HPP
