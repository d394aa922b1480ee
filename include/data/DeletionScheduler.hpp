#pragma once

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>

namespace Yturl {

/**
 * Runs a task once after a delay
 */
class DeletionScheduler {
public:
    using Task = std::function<void()>;

    virtual ~DeletionScheduler() = default;

    virtual void scheduleAfter(std::chrono::milliseconds delay, Task task) = 0;
};

/**
 * Timer-backed scheduler on the server's io_context
 * Pending timers are dropped if the io_context stops first
 */
class AsioDeletionScheduler : public DeletionScheduler {
public:
    explicit AsioDeletionScheduler(boost::asio::io_context& ioc);

    void scheduleAfter(std::chrono::milliseconds delay, Task task) override;

private:
    boost::asio::io_context& ioc;
};

} // namespace Yturl
