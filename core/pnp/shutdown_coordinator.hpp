#pragma once

#include <chrono>
#include <cstddef>

#include "device/i_device.hpp"
#include "device_registry.hpp"

namespace ippusb {
namespace pnp {

constexpr std::chrono::milliseconds kDefaultShutdownGrace{5000};

// Outcome of one terminal drain, for logging and tests
struct ShutdownReport {
    size_t device_count = 0;
    size_t shutdown_errors = 0;  // shutdown() threw
    size_t overruns = 0;         // shutdown() returned after the shared deadline
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Brings every remaining device to CLOSED under one shared deadline
 *
 * The deadline is fixed once, when shutdown_all() starts, and handed to every
 * device. Each device runs shutdown(deadline) followed by close() on its own
 * task; all tasks run in parallel, so total latency is bounded by one grace
 * period regardless of fleet size (as long as devices honor the deadline).
 *
 * close() runs even if shutdown() throws. shutdown_all() returns only after
 * every task finished; a device that ignores its deadline delays the return
 * and is reported as an overrun.
 */
class ShutdownCoordinator {
public:
    explicit ShutdownCoordinator(std::chrono::milliseconds grace = kDefaultShutdownGrace) : grace_(grace) {}

    // Takes ownership of every device in the registry, leaving it empty
    ShutdownReport shutdown_all(DeviceRegistry &registry);

    std::chrono::milliseconds grace() const { return grace_; }

private:
    std::chrono::milliseconds grace_;
};

}  // namespace pnp
}  // namespace ippusb
