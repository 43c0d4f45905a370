#include "hqa/analysis/analysis_metrics.hpp"

#include <cmath>

namespace hqa::analysis {

    void AnalysisMetrics::record_file(const std::size_t findings, const double latency_ms) noexcept {
        const double clamped = latency_ms > 0.0 ? latency_ms : 0.0;
        total_latency_us_.fetch_add(static_cast<std::uint64_t>(std::llround(clamped * 1000.0)),
                                    std::memory_order_relaxed);
        total_findings_.fetch_add(findings, std::memory_order_relaxed);
        files_analyzed_.fetch_add(1, std::memory_order_relaxed);
    }

    void AnalysisMetrics::record_rejection() noexcept {
        security_rejections_.fetch_add(1, std::memory_order_relaxed);
    }

    void AnalysisMetrics::record_skip() noexcept {
        files_skipped_.fetch_add(1, std::memory_order_relaxed);
    }

    void AnalysisMetrics::record_failure(const bool timed_out) noexcept {
        failed_files_.fetch_add(1, std::memory_order_relaxed);
        if (timed_out) {
            timeouts_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    MetricsSnapshot AnalysisMetrics::snapshot() const noexcept {
        MetricsSnapshot snap;
        snap.files_analyzed = files_analyzed_.load(std::memory_order_relaxed);
        snap.total_findings = total_findings_.load(std::memory_order_relaxed);
        snap.security_rejections = security_rejections_.load(std::memory_order_relaxed);
        snap.files_skipped = files_skipped_.load(std::memory_order_relaxed);
        snap.failed_files = failed_files_.load(std::memory_order_relaxed);
        snap.timeouts = timeouts_.load(std::memory_order_relaxed);

        if (snap.files_analyzed > 0) {
            const auto total_us = static_cast<double>(total_latency_us_.load(std::memory_order_relaxed));
            snap.average_latency_ms = total_us / 1000.0 / static_cast<double>(snap.files_analyzed);
        }
        return snap;
    }

    void AnalysisMetrics::reset() noexcept {
        files_analyzed_.store(0, std::memory_order_relaxed);
        total_findings_.store(0, std::memory_order_relaxed);
        security_rejections_.store(0, std::memory_order_relaxed);
        files_skipped_.store(0, std::memory_order_relaxed);
        failed_files_.store(0, std::memory_order_relaxed);
        timeouts_.store(0, std::memory_order_relaxed);
        total_latency_us_.store(0, std::memory_order_relaxed);
    }

}  // namespace hqa::analysis
