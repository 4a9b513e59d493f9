#pragma once

#include <atomic>
#include <string>
#include "core/error_types.hpp"

/**
 * @brief Cooperative cancellation flag shared by a job's caller and its worker
 */
class CancellationToken
{
public:
    void cancel() noexcept { cancelled_.store(true); }

    bool isCancelled() const noexcept { return cancelled_.load(); }

    /**
     * @brief Throw CancelledError if cancellation was requested
     * @param stage Stage boundary name for the error message
     */
    void throwIfCancelled(const std::string &stage) const
    {
        if (cancelled_.load())
        {
            throw CancelledError("Job cancelled before " + stage);
        }
    }

private:
    std::atomic<bool> cancelled_{false};
};
