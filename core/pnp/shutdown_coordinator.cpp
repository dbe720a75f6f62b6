#include "shutdown_coordinator.hpp"

#include <exception>
#include <future>
#include <string>
#include <system_error>
#include <vector>

#include "logging/logger.hpp"

namespace ippusb {
namespace pnp {

namespace {

struct TaskResult {
    bool shutdown_failed = false;
    bool overran = false;
};

// Body of one per-device task. Never lets an exception escape, so the task
// always completes and close() always runs.
TaskResult shutdown_and_close(device::IDevice *dev, device::Deadline deadline) {
    TaskResult result;
    const std::string name = dev->addr().to_string();

    try {
        dev->shutdown(deadline);
    } catch (const std::exception &e) {
        result.shutdown_failed = true;
        LOG_ERROR("[Shutdown] " << name << ": shutdown failed: " << e.what());
    } catch (...) {
        result.shutdown_failed = true;
        LOG_ERROR("[Shutdown] " << name << ": shutdown failed: unknown exception");
    }

    const auto now = device::Clock::now();
    if (now > deadline) {
        result.overran = true;
        LOG_WARN("[Shutdown] " << name << ": shutdown overran deadline by "
                               << std::chrono::duration_cast<std::chrono::milliseconds>(now - deadline).count()
                               << "ms");
    }

    try {
        dev->close();
    } catch (const std::exception &e) {
        LOG_ERROR("[Shutdown] " << name << ": close failed: " << e.what());
    } catch (...) {
        LOG_ERROR("[Shutdown] " << name << ": close failed: unknown exception");
    }

    LOG_DEBUG("[Shutdown] " << name << ": closed");
    return result;
}

}  // namespace

ShutdownReport ShutdownCoordinator::shutdown_all(DeviceRegistry &registry) {
    const auto started = device::Clock::now();
    const device::Deadline deadline = started + grace_;

    ShutdownReport report;
    auto devices = registry.release_all();
    report.device_count = devices.size();

    if (devices.empty()) {
        return report;
    }

    LOG_INFO("[Shutdown] Closing " << devices.size() << " device(s), grace period " << grace_.count() << "ms");

    std::vector<std::future<TaskResult>> tasks;
    std::vector<TaskResult> results;
    tasks.reserve(devices.size());

    // Each task gets exclusive use of one device; `devices` keeps ownership
    // until every task has been joined.
    for (auto &dev : devices) {
        try {
            tasks.push_back(std::async(std::launch::async, shutdown_and_close, dev.get(), deadline));
        } catch (const std::system_error &e) {
            LOG_WARN("[Shutdown] Cannot spawn shutdown task (" << e.what() << "), closing inline");
            results.push_back(shutdown_and_close(dev.get(), deadline));
        }
    }

    // Join every task, including those that overran the deadline
    for (auto &task : tasks) {
        results.push_back(task.get());
    }
    devices.clear();

    for (const auto &result : results) {
        if (result.shutdown_failed) {
            report.shutdown_errors++;
        }
        if (result.overran) {
            report.overruns++;
        }
    }

    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(device::Clock::now() - started);

    if (report.overruns > 0) {
        LOG_WARN("[Shutdown] " << report.overruns << " device(s) did not honor the shutdown deadline");
    }
    LOG_INFO("[Shutdown] All devices closed in " << report.elapsed.count() << "ms");

    return report;
}

}  // namespace pnp
}  // namespace ippusb
