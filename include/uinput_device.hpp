/*
 * uinput Device
 *
 * Creates a kernel input device through /dev/uinput and writes events to it.
 */

#ifndef UINPUT_DEVICE_HPP
#define UINPUT_DEVICE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace input_link {

struct UinputAxis {
    int code;
    int min;
    int max;
};

class UinputDevice {
public:
    UinputDevice(const std::string& name, uint16_t vendor, uint16_t product,
                 const std::string& uinput_path = "/dev/uinput");
    ~UinputDevice();

    UinputDevice(const UinputDevice&) = delete;
    UinputDevice& operator=(const UinputDevice&) = delete;

    bool create(const std::vector<int>& keys, const std::vector<UinputAxis>& axes);
    void destroy();

    bool emit(int type, int code, int value);
    bool sync();

    bool isReady() const { return ready_; }
    const std::string& name() const { return name_; }

private:
    bool enableEventTypes(bool keys, bool axes);

    std::string name_;
    uint16_t vendor_;
    uint16_t product_;
    std::string uinput_path_;
    int fd_;
    bool ready_;
};

}  // namespace input_link

#endif // UINPUT_DEVICE_HPP
