/*
 * uinput Device Implementation
 */

#include "uinput_device.hpp"
#include "logging.hpp"

#include <linux/uinput.h>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace input_link {

namespace {

const char* LOG_TAG = "uinput";

}  // namespace

UinputDevice::UinputDevice(const std::string& name, uint16_t vendor, uint16_t product,
                           const std::string& uinput_path)
    : name_(name), vendor_(vendor), product_(product), uinput_path_(uinput_path), fd_(-1), ready_(false) {
}

UinputDevice::~UinputDevice() {
    destroy();
}

bool UinputDevice::create(const std::vector<int>& keys, const std::vector<UinputAxis>& axes) {
    if (ready_) return true;

    fd_ = open(uinput_path_.c_str(), O_WRONLY | O_NONBLOCK);
    if (fd_ < 0) {
        log_error(LOG_TAG) << "open " << uinput_path_ << ": " << std::strerror(errno);
        return false;
    }

    if (!enableEventTypes(!keys.empty(), !axes.empty())) {
        destroy();
        return false;
    }

    for (int key : keys) {
        if (ioctl(fd_, UI_SET_KEYBIT, key) < 0) {
            log_error(LOG_TAG) << "UI_SET_KEYBIT " << key << ": " << std::strerror(errno);
            destroy();
            return false;
        }
    }

    struct uinput_user_dev uidev;
    std::memset(&uidev, 0, sizeof(uidev));
    std::strncpy(uidev.name, name_.c_str(), UINPUT_MAX_NAME_SIZE - 1);
    uidev.id.bustype = BUS_USB;
    uidev.id.vendor = vendor_;
    uidev.id.product = product_;
    uidev.id.version = 1;

    for (const auto& axis : axes) {
        if (ioctl(fd_, UI_SET_ABSBIT, axis.code) < 0) {
            log_error(LOG_TAG) << "UI_SET_ABSBIT " << axis.code << ": " << std::strerror(errno);
            destroy();
            return false;
        }
        uidev.absmin[axis.code] = axis.min;
        uidev.absmax[axis.code] = axis.max;
    }

    if (write(fd_, &uidev, sizeof(uidev)) != static_cast<ssize_t>(sizeof(uidev))) {
        log_error(LOG_TAG) << "write device description: " << std::strerror(errno);
        destroy();
        return false;
    }

    if (ioctl(fd_, UI_DEV_CREATE) < 0) {
        log_error(LOG_TAG) << "UI_DEV_CREATE: " << std::strerror(errno);
        destroy();
        return false;
    }

    ready_ = true;
    log_debug(LOG_TAG) << "created '" << name_ << "'";
    return true;
}

bool UinputDevice::enableEventTypes(bool keys, bool axes) {
    if (keys && ioctl(fd_, UI_SET_EVBIT, EV_KEY) < 0) {
        log_error(LOG_TAG) << "UI_SET_EVBIT EV_KEY: " << std::strerror(errno);
        return false;
    }
    if (axes && ioctl(fd_, UI_SET_EVBIT, EV_ABS) < 0) {
        log_error(LOG_TAG) << "UI_SET_EVBIT EV_ABS: " << std::strerror(errno);
        return false;
    }
    if (ioctl(fd_, UI_SET_EVBIT, EV_SYN) < 0) {
        log_error(LOG_TAG) << "UI_SET_EVBIT EV_SYN: " << std::strerror(errno);
        return false;
    }
    return true;
}

void UinputDevice::destroy() {
    if (fd_ >= 0) {
        if (ready_ && ioctl(fd_, UI_DEV_DESTROY) < 0) {
            log_warning(LOG_TAG) << "UI_DEV_DESTROY: " << std::strerror(errno);
        }
        close(fd_);
        fd_ = -1;
    }
    ready_ = false;
}

bool UinputDevice::emit(int type, int code, int value) {
    if (!ready_) return false;

    struct input_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.type = static_cast<__u16>(type);
    ev.code = static_cast<__u16>(code);
    ev.value = value;

    if (write(fd_, &ev, sizeof(ev)) != static_cast<ssize_t>(sizeof(ev))) {
        log_error(LOG_TAG) << "write event to '" << name_ << "': " << std::strerror(errno);
        return false;
    }
    return true;
}

bool UinputDevice::sync() {
    return emit(EV_SYN, SYN_REPORT, 0);
}

}  // namespace input_link
