#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace Yturl {

/**
 * Repeats an action on a fixed interval until cancelled
 * The first call happens in the constructor, on the caller's thread; the
 * destructor cancels and joins
 */
class PresenceLoop {
public:
    PresenceLoop(std::function<void()> action, std::chrono::milliseconds interval);
    ~PresenceLoop();

    // Prevent copying
    PresenceLoop(const PresenceLoop&) = delete;
    PresenceLoop& operator=(const PresenceLoop&) = delete;

    void cancel();

private:
    std::function<void()> action;
    std::chrono::milliseconds interval;
    std::mutex mutex;
    std::condition_variable condition;
    bool stopped;
    std::thread worker;

    void fire();
    void loop();
};

} // namespace Yturl
