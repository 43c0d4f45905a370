#ifndef HQA_ANALYSIS_METRICS_HPP
#define HQA_ANALYSIS_METRICS_HPP

/**
 * @file analysis_metrics.hpp
 * @brief Run-level counters shared by the guard and the coordinator.
 *
 * One instance is owned by whoever constructs the coordinator and handed
 * to collaborators through a shared_ptr. All updates are atomic, so files
 * may be analyzed from several caller threads at once.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace hqa::analysis {

    /**
     * Plain copy of the counters at one point in time.
     */
    struct MetricsSnapshot {
        std::size_t files_analyzed = 0;
        std::size_t total_findings = 0;
        std::size_t security_rejections = 0;
        std::size_t files_skipped = 0;
        std::size_t failed_files = 0;
        std::size_t timeouts = 0;
        double average_latency_ms = 0.0;
    };

    class AnalysisMetrics {
    public:
        void record_file(std::size_t findings, double latency_ms) noexcept;
        void record_rejection() noexcept;
        void record_skip() noexcept;
        void record_failure(bool timed_out) noexcept;

        [[nodiscard]] MetricsSnapshot snapshot() const noexcept;

        /**
         * Zero every counter.
         */
        void reset() noexcept;

    private:
        std::atomic<std::size_t> files_analyzed_{0};
        std::atomic<std::size_t> total_findings_{0};
        std::atomic<std::size_t> security_rejections_{0};
        std::atomic<std::size_t> files_skipped_{0};
        std::atomic<std::size_t> failed_files_{0};
        std::atomic<std::size_t> timeouts_{0};
        /// Latency sum in microseconds; the average is derived on snapshot.
        std::atomic<std::uint64_t> total_latency_us_{0};
    };

}  // namespace hqa::analysis

#endif // HQA_ANALYSIS_METRICS_HPP
