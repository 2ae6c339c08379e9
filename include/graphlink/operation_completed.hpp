#pragma once

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace graphlink {

/**
 * @brief Outcome record delivered to observers after every client operation.
 */
struct OperationCompletedArgs {
    std::string operation;                     ///< Operation name, e.g. "Connect"
    std::optional<Error> error;                ///< Set when the operation failed
    std::chrono::milliseconds time_taken{0};   ///< Wall time of the operation
    int resources_returned = 0;                ///< Number of resources the operation produced
    std::exception_ptr exception;              ///< Exception raised by the transport, if any

    bool has_error() const { return error.has_value(); }
};

/**
 * @brief Callback registry for OperationCompleted events.
 *
 * Subscribers run in subscription order on the thread that completed the
 * operation, outside the registry lock, so a callback may subscribe or
 * unsubscribe without deadlocking.
 *
 * @threadsafety subscribe()/unsubscribe()/notify() may be called concurrently
 */
class OperationNotifier {
public:
    using Callback = std::function<void(const OperationCompletedArgs&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        const SubscriptionId id = next_id_++;
        subscribers_.emplace_back(id, std::move(callback));
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
            if (it->first == id) {
                subscribers_.erase(it);
                return true;
            }
        }
        return false;
    }

    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.size();
    }

    /**
     * @brief Deliver @p args to every subscriber.
     *
     * A subscriber that throws is logged and skipped; the remaining
     * subscribers still run.
     */
    void notify(const OperationCompletedArgs& args) const {
        std::vector<std::pair<SubscriptionId, Callback>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = subscribers_;
        }

        for (const auto& [id, callback] : snapshot) {
            if (!callback) {
                continue;
            }
            try {
                callback(args);
            } catch (const std::exception& e) {
                spdlog::warn("OperationCompleted subscriber {} threw during '{}': {}",
                             id, args.operation, e.what());
            }
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<SubscriptionId, Callback>> subscribers_;
    SubscriptionId next_id_ = 1;
};

} // namespace graphlink
