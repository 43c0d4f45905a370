#include "hqa/security/resource_limiter.h"

#include <string>
#include <utility>

namespace hqa::security {

    ResourceLimiter::ResourceLimiter(const Limits& limits, std::stop_token stop)
        : limits_(limits)
        , stop_(std::move(stop)) {}

    void ResourceLimiter::start_timer() {
        start_time_ = std::chrono::steady_clock::now();
        timer_started_ = true;
    }

    Result<void, Error> ResourceLimiter::check_time_limit() const
    {
        if (stop_.stop_requested()) {
            return Result<void, Error>::failure(Error::cancelled("Analysis cancelled by caller"));
        }

        if (!timer_started_) {
            return Result<void, Error>::success();
        }

        if (const auto elapsed = get_elapsed_time(); elapsed >= limits_.max_execution_time) {
            return Result<void, Error>::failure(Error::timeout(
                "Analysis time limit exceeded: " +
                std::to_string(static_cast<long long>(elapsed.count())) + "ms / " +
                std::to_string(limits_.max_execution_time.count()) + "ms"
            ));
        }

        return Result<void, Error>::success();
    }

    Result<void, Error> ResourceLimiter::check_findings_limit(const std::size_t count) const
    {
        if (count > limits_.max_findings) {
            return Result<void, Error>::failure(Error::resource_limit(
                "Findings limit exceeded: " + std::to_string(count) + " / " +
                std::to_string(limits_.max_findings)
            ));
        }

        return Result<void, Error>::success();
    }

    std::chrono::duration<double, std::milli> ResourceLimiter::get_elapsed_time() const {
        if (!timer_started_) {
            return std::chrono::duration<double, std::milli>::zero();
        }
        return std::chrono::steady_clock::now() - start_time_;
    }

} // namespace hqa::security
