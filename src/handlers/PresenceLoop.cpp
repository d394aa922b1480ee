#include "handlers/PresenceLoop.hpp"
#include "utils/Logger.hpp"

namespace Yturl {

PresenceLoop::PresenceLoop(std::function<void()> action, std::chrono::milliseconds interval)
    : action(std::move(action))
    , interval(interval)
    , stopped(false) {
    fire();
    worker = std::thread(&PresenceLoop::loop, this);
}

PresenceLoop::~PresenceLoop() {
    cancel();
}

void PresenceLoop::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopped = true;
    }
    condition.notify_all();

    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    }
}

void PresenceLoop::fire() {
    try {
        action();
    } catch (const std::exception& e) {
        LOG_BOT_WARN("Presence update failed: {}", e.what());
    }
}

void PresenceLoop::loop() {
    std::unique_lock<std::mutex> lock(mutex);
    while (!condition.wait_for(lock, interval, [this] { return stopped; })) {
        lock.unlock();
        fire();
        lock.lock();
    }
}

} // namespace Yturl
