#ifndef HQA_RESOURCE_LIMITER_H
#define HQA_RESOURCE_LIMITER_H

#include "hqa/result.hpp"
#include "hqa/error.hpp"

#include <chrono>
#include <cstddef>
#include <stop_token>

namespace hqa::security {

    /**
     * Enforces the per-file time budget and findings ceiling during analysis.
     *
     * The budget is cooperative: call `start_timer()` before the work begins
     * and invoke `check_time_limit()` between stages and inside long loops.
     * A stop request on the supplied token is reported the same way as an
     * expired budget, with ErrorCode::Cancelled instead of ErrorCode::Timeout.
     */
    class ResourceLimiter {
    public:
        /**
         * Limits configuration for the resource checks.
         */
        struct Limits {
            std::chrono::milliseconds max_execution_time{30'000}; ///< Wall-clock budget per file
            std::size_t max_findings = 1000;                      ///< Max findings kept per file
        };

        /**
         * Construct a new ResourceLimiter.
         * @param limits The desired resource limits.
         * @param stop Optional cancellation token from the caller.
         */
        explicit ResourceLimiter(const Limits& limits, std::stop_token stop = {});

        /**
         * Start the internal execution timer.
         */
        void start_timer();

        /**
         * Check whether the budget expired or cancellation was requested.
         *
         * @return Ok while within budget; Timeout or Cancelled otherwise.
         */
        [[nodiscard]] Result<void, Error> check_time_limit() const;

        /**
         * Check whether the number of findings exceeds the ceiling.
         */
        [[nodiscard]] Result<void, Error> check_findings_limit(std::size_t count) const;

        [[nodiscard]] const Limits& limits() const noexcept { return limits_; }

        /**
         * Get the elapsed time since `start_timer()` was called.
         */
        [[nodiscard]] std::chrono::duration<double, std::milli> get_elapsed_time() const;

    private:
        Limits limits_;
        std::stop_token stop_;
        std::chrono::steady_clock::time_point start_time_;
        bool timer_started_ = false;
    };

} // namespace hqa::security

#endif // HQA_RESOURCE_LIMITER_H
