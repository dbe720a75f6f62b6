#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ippusb {
namespace runtime {

// Turns SIGINT, SIGTERM and SIGHUP into calls of an ordinary callback.
//
// The signal handler itself only writes the signal number into a pipe
// (async-signal-safe); a watcher thread reads it and runs the callback, so the
// callback may lock mutexes, log, and so on.
class SignalHandler {
public:
    using Callback = std::function<void(int signal)>;

    // Returns false if already installed or the pipe/thread cannot be set up
    static bool install(Callback callback, std::string &error);

    // Restores the previous dispositions and stops the watcher thread
    static void uninstall();

    static bool is_installed();

    static const char *signal_name(int signal);

private:
    // Creates the self-pipe on first use; it is never closed
    static bool open_pipe(std::string &error);
    static void drain(int read_fd);

    static void handle_signal(int signal);
    static void watch(int read_fd);

    static std::mutex mutex_;
    static Callback callback_;
    static std::thread watcher_;
    static std::atomic<int> write_fd_;
    static int read_fd_;
    static bool installed_;
};

}  // namespace runtime
}  // namespace ippusb
