#pragma once

/**
 * @file event_queue.hpp
 * @brief Wake-up source of the PnP reconciliation loop
 *
 * Producers:
 * - USB transport hotplug callback (libusb event thread) -> post_hotplug()
 * - Signal handler watcher thread -> post_terminate()
 *
 * Consumer:
 * - FleetManager::run(), blocked in wait() between reconciliation cycles
 *
 * Hotplug notifications coalesce: every cycle re-enumerates the whole bus, so
 * ten notifications arriving during one cycle need exactly one more cycle.
 * Termination is sticky and takes priority over pending hotplug notifications.
 */

#include <condition_variable>
#include <mutex>
#include <string>

namespace ippusb {
namespace pnp {

struct PnpEvent {
    enum class Kind { HOTPLUG, TERMINATE };

    Kind kind = Kind::HOTPLUG;
    std::string reason;  // Set for TERMINATE, e.g. "SIGTERM"
};

// Source of loop wake-ups, injected into FleetManager
class IEventSource {
public:
    virtual ~IEventSource() = default;

    // Block until the next event is available
    virtual PnpEvent wait() = 0;
};

class EventQueue : public IEventSource {
public:
    EventQueue() = default;

    EventQueue(const EventQueue &) = delete;
    EventQueue &operator=(const EventQueue &) = delete;

    // Device presence may have changed. Safe from any thread, never blocks.
    void post_hotplug();

    // Ask the loop to stop. Only the first reason is kept.
    void post_terminate(const std::string &reason);

    PnpEvent wait() override;

private:
    // Requires mutex_ held and an event pending
    PnpEvent take_locked();

    std::mutex mutex_;
    std::condition_variable cv_;
    bool hotplug_pending_ = false;
    bool terminate_requested_ = false;
    std::string terminate_reason_;
};

}  // namespace pnp
}  // namespace ippusb
