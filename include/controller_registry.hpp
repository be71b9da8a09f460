/*
 * Physical Controller Registry
 *
 * Tracks physical controllers across repeated scans. Records are identified
 * by guid + instance id; assigned numbers survive rescans and records of
 * devices that disappear stay in place, marked disconnected.
 */

#ifndef CONTROLLER_REGISTRY_HPP
#define CONTROLLER_REGISTRY_HPP

#include "controller_types.hpp"
#include "device_backend.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace input_link {

class ControllerRegistry {
public:
    explicit ControllerRegistry(std::unique_ptr<DeviceBackend> backend, bool auto_assign_numbers = true);
    ~ControllerRegistry();

    ControllerRegistry(const ControllerRegistry&) = delete;
    ControllerRegistry& operator=(const ControllerRegistry&) = delete;

    // Starts the device backend. Idempotent; throws InitializationError.
    void initialize();

    // Re-enumerates visible devices and returns every known record
    // (connected ones in enumeration order, then disconnected ones)
    std::vector<DetectedController> scanControllers();

    // Connected records of the last scan; does not rescan
    std::vector<DetectedController> getConnectedControllers() const;

    std::optional<DetectedController> getControllerByIdentifier(const std::string& identifier) const;
    std::optional<DetectedController> getControllerByDeviceId(int device_id) const;
    std::optional<DetectedController> getControllerByIndex(int device_index) const;

    // Number must be in [1, 8]. Takes the number away from any other holder.
    bool assignControllerNumber(const std::string& identifier, int number);
    bool unassignController(const std::string& identifier);
    bool setInputMethod(const std::string& identifier, InputMethod method);

    // Drops disconnected records and frees their numbers. Returns how many were dropped.
    int forgetDisconnected();

    // Backend access for the capture loop
    void pumpEvents();
    bool readState(const DetectedController& controller, RawDeviceState& state);

    // Shuts the backend down. Idempotent.
    void cleanup();

    bool isInitialized() const;

private:
    std::unique_ptr<DeviceBackend> backend_;
    bool auto_assign_numbers_;
    bool initialized_ = false;

    mutable std::mutex mutex_;
    std::map<std::string, DetectedController> controllers_;  // by identifier
    std::vector<std::string> scan_order_;                   // connected identifiers, by index

    void initializeLocked();
    DetectedController* findLocked(const std::string& identifier);
    std::set<int> assignedNumbersLocked() const;
    std::optional<int> nextAvailableNumberLocked() const;
};

}  // namespace input_link

#endif // CONTROLLER_REGISTRY_HPP
