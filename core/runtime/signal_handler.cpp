#include "signal_handler.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"

namespace ippusb {
namespace runtime {

namespace {

constexpr int kHandledSignals[] = {SIGINT, SIGTERM, SIGHUP};
constexpr size_t kNumHandledSignals = sizeof(kHandledSignals) / sizeof(kHandledSignals[0]);

// Written by uninstall() to stop the watcher; no signal has number 0
constexpr unsigned char kStopByte = 0;

using SignalDisposition = void (*)(int);
SignalDisposition g_previous[kNumHandledSignals] = {};

}  // namespace

std::mutex SignalHandler::mutex_;
SignalHandler::Callback SignalHandler::callback_;
std::thread SignalHandler::watcher_;
std::atomic<int> SignalHandler::write_fd_{-1};
int SignalHandler::read_fd_ = -1;
bool SignalHandler::installed_ = false;

bool SignalHandler::open_pipe(std::string &error) {
    if (read_fd_ >= 0) {
        return true;
    }

    // Both ends non-blocking: the handler must never block, and install()
    // drains leftovers without waiting
    int fds[2];
    if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0) {
        error = std::string("Failed to create signal pipe: ") + std::strerror(errno);
        return false;
    }

    read_fd_ = fds[0];
    write_fd_.store(fds[1]);
    return true;
}

void SignalHandler::drain(int read_fd) {
    unsigned char buf[64];
    while (read(read_fd, buf, sizeof(buf)) > 0) {
    }
}

bool SignalHandler::install(Callback callback, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (installed_) {
        error = "Signal handler already installed";
        return false;
    }

    // The pipe stays open for the life of the process, so a handler still
    // running during uninstall() never writes to a closed or reused fd
    if (!open_pipe(error)) {
        return false;
    }

    // Bytes written by a handler racing the last uninstall()
    drain(read_fd_);

    callback_ = std::move(callback);

    try {
        watcher_ = std::thread(&SignalHandler::watch, read_fd_);
    } catch (const std::system_error &e) {
        error = std::string("Failed to start signal watcher: ") + e.what();
        callback_ = nullptr;
        return false;
    }

    for (size_t i = 0; i < kNumHandledSignals; ++i) {
        g_previous[i] = std::signal(kHandledSignals[i], handle_signal);
        if (g_previous[i] == SIG_ERR) {
            LOG_WARN("[Signal] Cannot install handler for " << signal_name(kHandledSignals[i]));
        }
    }

    installed_ = true;
    LOG_DEBUG("[Signal] Handlers installed for SIGINT, SIGTERM, SIGHUP");
    return true;
}

void SignalHandler::uninstall() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!installed_) {
        return;
    }

    for (size_t i = 0; i < kNumHandledSignals; ++i) {
        if (g_previous[i] != SIG_ERR) {
            std::signal(kHandledSignals[i], g_previous[i]);
        }
    }

    // A full pipe means the watcher has data to read; retry until it made room
    const int write_fd = write_fd_.load();
    while (true) {
        ssize_t written = write(write_fd, &kStopByte, 1);
        if (written == 1) {
            break;
        }
        if (written < 0 && errno != EAGAIN && errno != EINTR) {
            LOG_ERROR("[Signal] Cannot stop watcher: " << std::strerror(errno));
            break;
        }
        std::this_thread::yield();
    }

    if (watcher_.joinable()) {
        watcher_.join();
    }

    callback_ = nullptr;
    installed_ = false;
}

bool SignalHandler::is_installed() {
    std::lock_guard<std::mutex> lock(mutex_);
    return installed_;
}

const char *SignalHandler::signal_name(int signal) {
    switch (signal) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        case SIGHUP:
            return "SIGHUP";
        default:
            return "signal";
    }
}

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: errno save/restore and write(2) only
    int saved_errno = errno;
    int fd = write_fd_.load();
    if (fd >= 0) {
        unsigned char byte = static_cast<unsigned char>(signal);
        ssize_t written = write(fd, &byte, 1);
        (void)written;  // EAGAIN: a wake-up is already queued
    }
    errno = saved_errno;
}

void SignalHandler::watch(int read_fd) {
    while (true) {
        struct pollfd pfd = {read_fd, POLLIN, 0};
        int rc = poll(&pfd, 1, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[Signal] poll failed: " << std::strerror(errno));
            return;
        }

        unsigned char byte = 0;
        ssize_t n = read(read_fd, &byte, 1);
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        if (n <= 0 || byte == kStopByte) {
            return;
        }

        // callback_ is only reset after this thread is joined
        if (callback_) {
            callback_(static_cast<int>(byte));
        }
    }
}

}  // namespace runtime
}  // namespace ippusb
