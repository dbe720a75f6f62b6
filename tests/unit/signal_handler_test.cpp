#include "runtime/signal_handler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace ippusb::runtime;

namespace {
// Sets a disposition for the scope of a test and puts the old one back
class SignalDispositionGuard {
public:
    SignalDispositionGuard(int signal, void (*handler)(int)) : signal_(signal) {
        previous_ = std::signal(signal, handler);
    }
    ~SignalDispositionGuard() { std::signal(signal_, previous_); }

private:
    int signal_;
    void (*previous_)(int);
};
}  // namespace

class SignalHandlerTest : public ::testing::Test {
protected:
    void TearDown() override { SignalHandler::uninstall(); }

    void on_signal(int signal) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            received.push_back(signal);
        }
        cv.notify_all();
    }

    bool wait_for_signals(size_t count) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(2), [this, count] { return received.size() >= count; });
    }

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<int> received;
};

TEST_F(SignalHandlerTest, InstallAndUninstall) {
    std::string error;
    ASSERT_TRUE(SignalHandler::install([this](int signal) { on_signal(signal); }, error)) << error;
    EXPECT_TRUE(SignalHandler::is_installed());

    SignalHandler::uninstall();
    EXPECT_FALSE(SignalHandler::is_installed());
}

TEST_F(SignalHandlerTest, SecondInstallFails) {
    std::string error;
    ASSERT_TRUE(SignalHandler::install([this](int signal) { on_signal(signal); }, error)) << error;

    EXPECT_FALSE(SignalHandler::install([](int) {}, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(SignalHandlerTest, UninstallWithoutInstallIsHarmless) {
    SignalHandler::uninstall();
    EXPECT_FALSE(SignalHandler::is_installed());
}

TEST_F(SignalHandlerTest, SignalReachesCallbackOnWatcherThread) {
    std::string error;
    ASSERT_TRUE(SignalHandler::install([this](int signal) { on_signal(signal); }, error)) << error;

    ASSERT_EQ(std::raise(SIGHUP), 0);

    ASSERT_TRUE(wait_for_signals(1));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(received[0], SIGHUP);
}

TEST_F(SignalHandlerTest, RepeatedSignalsAreHarmless) {
    std::string error;
    ASSERT_TRUE(SignalHandler::install([this](int signal) { on_signal(signal); }, error)) << error;

    ASSERT_EQ(std::raise(SIGTERM), 0);
    ASSERT_EQ(std::raise(SIGINT), 0);
    ASSERT_EQ(std::raise(SIGTERM), 0);

    ASSERT_TRUE(wait_for_signals(3));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(received[0], SIGTERM);
    EXPECT_EQ(received[1], SIGINT);
    EXPECT_EQ(received[2], SIGTERM);
}

TEST_F(SignalHandlerTest, ReinstallAfterUninstall) {
    std::string error;
    ASSERT_TRUE(SignalHandler::install([this](int signal) { on_signal(signal); }, error)) << error;
    SignalHandler::uninstall();

    ASSERT_TRUE(SignalHandler::install([this](int signal) { on_signal(signal); }, error)) << error;
    ASSERT_EQ(std::raise(SIGINT), 0);
    ASSERT_TRUE(wait_for_signals(1));
}

TEST_F(SignalHandlerTest, PreviousDispositionRestored) {
    SignalDispositionGuard guard(SIGHUP, SIG_IGN);

    std::string error;
    ASSERT_TRUE(SignalHandler::install([this](int signal) { on_signal(signal); }, error)) << error;
    SignalHandler::uninstall();

    // Ignored again, so the process survives
    ASSERT_EQ(std::raise(SIGHUP), 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_TRUE(received.empty());
}

TEST_F(SignalHandlerTest, SignalsRacingUninstallDoNotLeakIntoNextInstall) {
    SignalDispositionGuard guard(SIGHUP, SIG_IGN);

    std::atomic<bool> done{false};
    std::thread raiser([&done]() {
        while (!done.load()) {
            std::raise(SIGHUP);
        }
    });

    std::string error;
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(SignalHandler::install([](int) {}, error)) << error;
        SignalHandler::uninstall();
    }
    done.store(true);
    raiser.join();

    ASSERT_TRUE(SignalHandler::install([this](int signal) { on_signal(signal); }, error)) << error;
    ASSERT_EQ(std::raise(SIGINT), 0);
    ASSERT_TRUE(wait_for_signals(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    {
        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_EQ(received.size(), 1u);
        EXPECT_EQ(received[0], SIGINT);
    }

    // Before guard puts the default SIGHUP disposition back
    SignalHandler::uninstall();
}

TEST(SignalNameTest, KnownSignals) {
    EXPECT_STREQ(SignalHandler::signal_name(SIGINT), "SIGINT");
    EXPECT_STREQ(SignalHandler::signal_name(SIGTERM), "SIGTERM");
    EXPECT_STREQ(SignalHandler::signal_name(SIGHUP), "SIGHUP");
}
