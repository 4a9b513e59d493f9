#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include "core/error_types.hpp"
#include "logging/logger.hpp"

extern "C"
{
#include <libavutil/error.h>
}

class ErrorRecovery
{
public:
    // Decides whether a caught exception deserves another attempt
    using RetryPredicate = std::function<bool(const std::exception &)>;

    /**
     * @brief Retry a callable with exponential backoff
     * @param func Callable to run
     * @param max_retries Total number of attempts (at least 1)
     * @param operation_name Name used in log messages
     * @param base_delay_ms Delay before the second attempt, doubled afterwards
     * @param should_retry Exceptions rejected by this predicate are rethrown immediately
     */
    template <typename Func>
    static auto retryWithBackoff(Func func, int max_retries, const std::string &operation_name,
                                 int base_delay_ms = 100, RetryPredicate should_retry = nullptr)
        -> decltype(func())
    {
        if (max_retries < 1)
            max_retries = 1;

        for (int attempt = 0; attempt < max_retries; ++attempt)
        {
            try
            {
                return func();
            }
            catch (const std::exception &e)
            {
                if (should_retry && !should_retry(e))
                {
                    throw;
                }
                if (attempt == max_retries - 1)
                {
                    Logger::error("Operation '" + operation_name + "' failed after " + std::to_string(max_retries) +
                                  " attempts: " + e.what());
                    throw;
                }

                int delay_ms = (1 << attempt) * base_delay_ms; // 100ms, 200ms, 400ms...
                Logger::warn("Operation '" + operation_name + "' failed, retrying in " +
                             std::to_string(delay_ms) + "ms (attempt " + std::to_string(attempt + 1) +
                             "/" + std::to_string(max_retries) + "): " + e.what());

                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
        }
        throw std::runtime_error("All retry attempts failed for operation: " + operation_name);
    }

    /**
     * @brief Retry only transient ComposeError failures
     */
    template <typename Func>
    static auto retryTransientCompose(Func func, int max_retries, const std::string &operation_name,
                                      int base_delay_ms)
        -> decltype(func())
    {
        return retryWithBackoff(
            func, max_retries, operation_name, base_delay_ms,
            [](const std::exception &e)
            {
                auto compose_error = dynamic_cast<const ComposeError *>(&e);
                return compose_error != nullptr && compose_error->isTransient();
            });
    }

    static std::string ffmpegErrorString(int error_code)
    {
        char err_buf[AV_ERROR_MAX_STRING_SIZE];
        av_strerror(error_code, err_buf, AV_ERROR_MAX_STRING_SIZE);
        return std::string(err_buf);
    }

    /**
     * @brief Whether an FFmpeg error code belongs to the I/O class
     */
    static bool isTransientFFmpegError(int error_code)
    {
        return error_code == AVERROR(EIO) || error_code == AVERROR(EAGAIN) ||
               error_code == AVERROR(EBUSY) || error_code == AVERROR(EINTR) ||
               error_code == AVERROR(ETIMEDOUT);
    }
};
