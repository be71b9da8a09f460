/*
 * Host Events
 *
 * Typed notifications from the capture, network and virtual layers to the
 * host program. Producers push from their own threads; the host drains the
 * channel on its main thread.
 */

#ifndef HOST_EVENTS_HPP
#define HOST_EVENTS_HPP

#include "bounded_queue.hpp"
#include "controller_types.hpp"

#include <string>
#include <vector>

namespace input_link {

struct HostEvent {
    enum class Kind {
        ControllersDetected,
        ConnectionStatus,
        ControllerCreated,
        ControllerDestroyed,
        ClientConnected,
        ClientDisconnected
    };

    Kind kind;
    std::string text;  // status string or client id
    int controller_number = 0;
    std::vector<DetectedController> controllers;

    static HostEvent controllersDetected(std::vector<DetectedController> controllers) {
        HostEvent event{Kind::ControllersDetected};
        event.controllers = std::move(controllers);
        return event;
    }

    static HostEvent connectionStatus(const std::string& status) {
        HostEvent event{Kind::ConnectionStatus};
        event.text = status;
        return event;
    }

    static HostEvent controller(Kind kind, int number) {
        HostEvent event{kind};
        event.controller_number = number;
        return event;
    }

    static HostEvent client(Kind kind, const std::string& client_id) {
        HostEvent event{kind};
        event.text = client_id;
        return event;
    }
};

// Oldest events are dropped when the host falls behind
using HostEventChannel = BoundedQueue<HostEvent>;

}  // namespace input_link

#endif // HOST_EVENTS_HPP
