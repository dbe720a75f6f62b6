#include "event_queue.hpp"

namespace ippusb {
namespace pnp {

void EventQueue::post_hotplug() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hotplug_pending_ = true;
    }
    cv_.notify_all();
}

void EventQueue::post_terminate(const std::string &reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!terminate_requested_) {
            terminate_requested_ = true;
            terminate_reason_ = reason;
        }
    }
    cv_.notify_all();
}

PnpEvent EventQueue::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return terminate_requested_ || hotplug_pending_; });
    return take_locked();
}

PnpEvent EventQueue::take_locked() {
    PnpEvent event;
    if (terminate_requested_) {
        event.kind = PnpEvent::Kind::TERMINATE;
        event.reason = terminate_reason_;
        return event;
    }

    hotplug_pending_ = false;
    event.kind = PnpEvent::Kind::HOTPLUG;
    return event;
}

}  // namespace pnp
}  // namespace ippusb
