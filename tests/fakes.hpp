/*
 * Test doubles for the device backend and the virtual device binding
 */

#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

#include "device_backend.hpp"
#include "errors.hpp"
#include "virtual_controller.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace input_link {
namespace testing {

struct FakeDevice {
    DeviceInfo info;
    RawDeviceState state;
};

// Owned by the test; the backend only holds a reference to it
struct FakeDevices {
    std::mutex mutex;
    std::vector<FakeDevice> devices;
    bool fail_initialize = false;
    bool fail_reads = false;
    int initialize_calls = 0;
    int shutdown_calls = 0;

    void add(int instance_id, const std::string& guid, const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        FakeDevice device;
        device.info.instance_id = instance_id;
        device.info.guid = guid;
        device.info.name = name;
        device.info.num_axes = STANDARD_AXIS_COUNT;
        device.info.num_buttons = STANDARD_BUTTON_COUNT;
        device.info.num_hats = 1;
        device.state.axes.assign(STANDARD_AXIS_COUNT, 0.0);
        device.state.axes[4] = -1.0;
        device.state.axes[5] = -1.0;
        device.state.buttons.assign(STANDARD_BUTTON_COUNT, false);
        device.state.hats.assign(1, {0, 0});
        devices.push_back(device);
    }

    void remove(int instance_id) {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto it = devices.begin(); it != devices.end(); ++it) {
            if (it->info.instance_id == instance_id) {
                devices.erase(it);
                return;
            }
        }
    }

    template <typename Fn>
    void update(int instance_id, Fn fn) {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& device : devices) {
            if (device.info.instance_id == instance_id) fn(device.state);
        }
    }
};

class FakeBackend : public DeviceBackend {
public:
    explicit FakeBackend(std::shared_ptr<FakeDevices> devices) : devices_(std::move(devices)) {}

    void initialize() override {
        std::lock_guard<std::mutex> lock(devices_->mutex);
        ++devices_->initialize_calls;
        if (devices_->fail_initialize) throw InitializationError("fake backend refused to start");
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lock(devices_->mutex);
        ++devices_->shutdown_calls;
    }

    void pumpEvents() override {}

    std::vector<DeviceInfo> enumerateDevices() override {
        std::lock_guard<std::mutex> lock(devices_->mutex);
        std::vector<DeviceInfo> out;
        for (size_t i = 0; i < devices_->devices.size(); ++i) {
            DeviceInfo info = devices_->devices[i].info;
            info.index = static_cast<int>(i);
            out.push_back(info);
        }
        return out;
    }

    bool readState(int index, RawDeviceState& state) override {
        std::lock_guard<std::mutex> lock(devices_->mutex);
        if (devices_->fail_reads) return false;
        if (index < 0 || index >= static_cast<int>(devices_->devices.size())) return false;
        state = devices_->devices[index].state;
        return true;
    }

private:
    std::shared_ptr<FakeDevices> devices_;
};

// What every fake virtual controller did, keyed by controller number
struct VirtualProbe {
    struct Record {
        std::vector<std::string> log;
        std::set<std::string> pressed;
        std::map<std::string, double> axes;
        int flushes = 0;
        bool open = false;
    };

    std::mutex mutex;
    std::map<int, Record> records;
    bool fail_connect = false;
    // Number of upcoming button/axis writes the driver rejects
    int failing_writes = 0;
    int created = 0;

    Record record(int number) {
        std::lock_guard<std::mutex> lock(mutex);
        return records[number];
    }
};

class FakeVirtualController : public VirtualController {
public:
    FakeVirtualController(int number, std::shared_ptr<VirtualProbe> probe)
        : VirtualController(number), probe_(std::move(probe)) {}

    ~FakeVirtualController() override { disconnect(); }

    const char* backendName() const override { return "fake"; }

protected:
    bool openDevice() override {
        std::lock_guard<std::mutex> lock(probe_->mutex);
        if (probe_->fail_connect) return false;
        auto& record = probe_->records[controllerNumber()];
        record.log.push_back("open");
        record.open = true;
        return true;
    }

    void closeDevice() override {
        std::lock_guard<std::mutex> lock(probe_->mutex);
        auto& record = probe_->records[controllerNumber()];
        record.log.push_back("close");
        record.open = false;
    }

    bool setButton(size_t index, bool pressed) override {
        std::lock_guard<std::mutex> lock(probe_->mutex);
        auto& record = probe_->records[controllerNumber()];
        std::string name = BUTTON_FIELDS[index].name;
        if (probe_->failing_writes > 0) {
            --probe_->failing_writes;
            return false;
        }
        record.log.push_back(std::string(pressed ? "press " : "release ") + name);
        if (pressed) {
            record.pressed.insert(name);
        } else {
            record.pressed.erase(name);
        }
        return true;
    }

    bool setAxis(size_t index, double value) override {
        std::lock_guard<std::mutex> lock(probe_->mutex);
        auto& record = probe_->records[controllerNumber()];
        std::string name = AXIS_FIELDS[index].name;
        if (probe_->failing_writes > 0) {
            --probe_->failing_writes;
            return false;
        }
        record.log.push_back("axis " + name);
        record.axes[name] = value;
        return true;
    }

    bool flush() override {
        std::lock_guard<std::mutex> lock(probe_->mutex);
        ++probe_->records[controllerNumber()].flushes;
        return true;
    }

private:
    std::shared_ptr<VirtualProbe> probe_;
};

inline std::unique_ptr<VirtualControllerFactory> make_fake_factory(std::shared_ptr<VirtualProbe> probe) {
    auto factory = std::make_unique<VirtualControllerFactory>();
    factory->registerBackend("fake", [probe](int number) -> std::unique_ptr<VirtualController> {
        {
            std::lock_guard<std::mutex> lock(probe->mutex);
            ++probe->created;
        }
        return std::make_unique<FakeVirtualController>(number, probe);
    });
    return factory;
}

inline ControllerInputData make_input(int number, const std::string& id = "pad") {
    ControllerInputData data;
    data.controller_number = number;
    data.controller_id = id;
    data.timestamp = 1700000000.0;
    return data;
}

}  // namespace testing
}  // namespace input_link

#endif // TEST_FAKES_HPP
