#include "data/DeletionScheduler.hpp"
#include "utils/Logger.hpp"
#include <boost/asio/steady_timer.hpp>
#include <memory>

namespace Yturl {

AsioDeletionScheduler::AsioDeletionScheduler(boost::asio::io_context& ioc)
    : ioc(ioc) {
}

void AsioDeletionScheduler::scheduleAfter(std::chrono::milliseconds delay, Task task) {
    auto timer = std::make_shared<boost::asio::steady_timer>(ioc, delay);
    timer->async_wait([timer, task = std::move(task)](const boost::system::error_code& ec) {
        if (ec) {
            return;  // Cancelled on shutdown
        }
        try {
            task();
        } catch (const std::exception& e) {
            LOG_DL_ERROR("Scheduled deletion failed: {}", e.what());
        }
    });
}

} // namespace Yturl
