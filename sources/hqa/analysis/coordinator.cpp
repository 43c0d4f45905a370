#include "hqa/analysis/coordinator.hpp"
#include "hqa/security/resource_limiter.h"
#include "hqa/security/sanitizer.h"
#include "hqa/extraction/source_text.hpp"
#include "hqa/utils/file_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <tuple>
#include <utility>

namespace hqa::analysis
{
    namespace {

        using Clock = std::chrono::steady_clock;

        security::ResourceLimiter::Limits limiter_limits(const heuristics::Limits& limits) {
            return {limits.analysis_time, limits.max_findings_per_file};
        }

        double elapsed_ms(const Clock::time_point start) {
            return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
        }

        std::string display_name(const fs::path& path) {
            return security::Sanitizer::sanitize_file_path(path.string());
        }

    }  // namespace

    AnalysisCoordinator::AnalysisCoordinator(core::Config config, std::shared_ptr<AnalysisMetrics> metrics)
        : AnalysisCoordinator(std::move(config), detectors::make_default_detectors(),
                              metrics::make_default_calculators(), std::move(metrics)) {}

    AnalysisCoordinator::AnalysisCoordinator(
        core::Config config,
        std::vector<std::unique_ptr<detectors::IDetector>> detectors,
        std::vector<std::unique_ptr<metrics::IMetricCalculator>> calculators,
        std::shared_ptr<AnalysisMetrics> metrics
    )
        : config_(std::move(config))
        , metrics_(metrics ? std::move(metrics) : std::make_shared<AnalysisMetrics>())
        , guard_(config_.heuristics.limits, metrics_)
        , extractor_(config_.heuristics.limits)
        , detectors_(std::move(detectors))
        , calculators_(std::move(calculators))
        , checkers_(principles::make_default_checkers(config_.heuristics, translator_)) {}

    void AnalysisCoordinator::ensure_initialized() const {
        std::call_once(init_flag_, [this] {
            if (!config_.i18n.catalog.empty()) {
                if (auto loaded = translator_.load_catalog(config_.i18n.catalog); loaded.is_err()) {
                    spdlog::warn("Message catalog not loaded: {}",
                                 security::Sanitizer::sanitize_error_message(loaded.error().to_string()));
                }
            }
            translator_.initialize();
        });
    }

    const i18n::Translator& AnalysisCoordinator::translator() const {
        ensure_initialized();
        return translator_;
    }

    std::vector<Finding> AnalysisCoordinator::analyze_file(
        const fs::path& path,
        const std::string_view language,
        const std::stop_token stop
    ) const {
        const auto parsed = parse_language(language);
        if (!parsed) {
            spdlog::debug("Skipping {}: unsupported language", display_name(path));
            metrics_->record_skip();
            return {};
        }

        try {
            ensure_initialized();
            auto context = guard_.load(path, *parsed);
            if (context.is_err()) {
                return {};
            }
            return run_analysis(context.value(), stop);
        } catch (const std::exception& e) {
            const auto error = Error::internal_error(e.what());
            spdlog::error("Analysis of {} failed: {}", display_name(path),
                          security::Sanitizer::sanitize_error_message(error.to_string()));
            metrics_->record_failure(false);
            return {};
        }
    }

    std::vector<Finding> AnalysisCoordinator::analyze_content(
        const fs::path& path,
        const std::string_view content,
        const std::string_view language,
        const std::stop_token stop
    ) const {
        const auto parsed = parse_language(language);
        if (!parsed) {
            spdlog::debug("Skipping {}: unsupported language", display_name(path));
            metrics_->record_skip();
            return {};
        }

        try {
            ensure_initialized();
            auto context = guard_.validate(path, content, *parsed);
            if (context.is_err()) {
                return {};
            }
            return run_analysis(context.value(), stop);
        } catch (const std::exception& e) {
            const auto error = Error::internal_error(e.what());
            spdlog::error("Analysis of {} failed: {}", display_name(path),
                          security::Sanitizer::sanitize_error_message(error.to_string()));
            metrics_->record_failure(false);
            return {};
        }
    }

    std::vector<Finding> AnalysisCoordinator::run_analysis(
        const AnalysisContext& context,
        const std::stop_token stop
    ) const {
        const auto start = Clock::now();
        const auto& limits = config_.heuristics.limits;

        security::ResourceLimiter limiter(limiter_limits(limits), stop);
        limiter.start_timer();

        const extraction::SourceText text(context.content);
        if (text.line_count() > limits.max_lines_per_file) {
            spdlog::warn("{} has {} lines, above the limit of {}; no findings reported",
                         context.display_path, text.line_count(), limits.max_lines_per_file);
            metrics_->record_file(0, elapsed_ms(start));
            return {};
        }

        auto units = extractor_.extract(text, &limiter);
        if (units.is_err()) {
            return abort_file(context, units.error());
        }

        std::vector<Finding> findings;

        const detectors::DetectionContext detection{text, config_.heuristics, translator_};
        for (const auto& detector : detectors_) {
            if (auto budget = limiter.check_time_limit(); budget.is_err()) {
                return abort_file(context, budget.error());
            }
            try {
                auto found = detector->detect(detection);
                findings.insert(findings.end(),
                                std::make_move_iterator(found.begin()),
                                std::make_move_iterator(found.end()));
            } catch (const std::exception& e) {
                const auto error = Error::analysis_error(e.what(), std::string(detector->name()));
                spdlog::warn("Detector failed on {}: {}", context.display_path,
                             security::Sanitizer::sanitize_error_message(error.to_string()));
            }
        }

        const metrics::MetricContext measurement{text, units.value(), config_.heuristics, translator_};
        for (const auto& calculator : calculators_) {
            if (auto budget = limiter.check_time_limit(); budget.is_err()) {
                return abort_file(context, budget.error());
            }
            try {
                auto found = calculator->calculate(measurement);
                findings.insert(findings.end(),
                                std::make_move_iterator(found.begin()),
                                std::make_move_iterator(found.end()));
            } catch (const std::exception& e) {
                const auto error = Error::analysis_error(e.what(), std::string(calculator->name()));
                spdlog::warn("Calculator failed on {}: {}", context.display_path,
                             security::Sanitizer::sanitize_error_message(error.to_string()));
            }
        }

        if (auto budget = limiter.check_findings_limit(findings.size()); budget.is_err()) {
            spdlog::warn("{}: {} findings, keeping the first {}", context.display_path, findings.size(),
                         limits.max_findings_per_file);
        }

        findings = finalize(std::move(findings), text);
        metrics_->record_file(findings.size(), elapsed_ms(start));
        return findings;
    }

    std::vector<Finding> AnalysisCoordinator::finalize(
        std::vector<Finding> findings,
        const extraction::SourceText& text
    ) const {
        const std::size_t line_count = std::max<std::size_t>(1, text.line_count());

        for (auto& finding : findings) {
            finding.line = std::clamp<std::size_t>(finding.line, 1, line_count);
            const std::size_t width = finding.line <= text.line_count()
                ? std::max<std::size_t>(1, text.line(finding.line - 1).size())
                : 1;
            finding.column = std::clamp<std::size_t>(finding.column, 1, width);
        }

        std::ranges::stable_sort(findings, [](const Finding& a, const Finding& b) {
            return std::tuple(a.line, a.column, static_cast<int>(a.type)) <
                   std::tuple(b.line, b.column, static_cast<int>(b.type));
        });

        if (findings.size() > config_.heuristics.limits.max_findings_per_file) {
            findings.resize(config_.heuristics.limits.max_findings_per_file);
        }

        return findings;
    }

    std::vector<Finding> AnalysisCoordinator::abort_file(const AnalysisContext& context, const Error& error) const {
        if (error.is_interruption()) {
            spdlog::warn("Analysis of {} stopped: {}", context.display_path,
                         security::Sanitizer::sanitize_error_message(error.message()));
        } else {
            spdlog::error("Analysis of {} failed: {}", context.display_path,
                          security::Sanitizer::sanitize_error_message(error.to_string()));
        }
        metrics_->record_failure(error.code() == ErrorCode::Timeout);
        return {};
    }

    ProjectReport AnalysisCoordinator::analyze_project(const fs::path& root, const std::string_view language) const {
        std::optional<Language> declared;
        if (!language.empty()) {
            declared = parse_language(language);
            if (!declared) {
                spdlog::warn("Unsupported language tag for project run");
                ProjectReport report;
                report.skipped.push_back({display_name(root), "unsupported-language"});
                metrics_->record_skip();
                compute_scores(report, {});
                report.metrics = metrics_->snapshot();
                return report;
            }
        }

        const auto& project = config_.heuristics.project;
        auto files = file_utils::list_source_files(root, project.ignore_dirs, project.max_files,
            [&declared](const fs::path& candidate) {
                const auto detected = language_from_extension(candidate);
                return detected.has_value() && (!declared || *detected == *declared);
            });

        if (files.is_err()) {
            spdlog::error("Project walk failed: {}", security::Sanitizer::sanitize_error_message(files.error().to_string()));
            ProjectReport report;
            report.skipped.push_back({display_name(root), error_code_to_string(files.error().code())});
            compute_scores(report, {});
            report.metrics = metrics_->snapshot();
            return report;
        }

        spdlog::info("Discovered {} source files", files.value().size());
        return analyze_files(files.value(), language);
    }

    ProjectReport AnalysisCoordinator::analyze_files(
        const std::vector<fs::path>& paths,
        const std::string_view language
    ) const {
        ProjectReport report;
        report.files_discovered = paths.size();

        const std::optional<Language> declared = language.empty()
            ? std::nullopt
            : parse_language(language);

        ensure_initialized();

        for (const auto& path : paths) {
            const auto resolved = language.empty() ? language_from_extension(path) : declared;
            if (!resolved) {
                report.skipped.push_back({display_name(path), "unsupported-language"});
                metrics_->record_skip();
                continue;
            }

            try {
                analyze_structure(path, *resolved, report);
            } catch (const std::exception& e) {
                spdlog::error("Principle check of {} failed: {}", display_name(path),
                              security::Sanitizer::sanitize_error_message(e.what()));
                report.skipped.push_back({display_name(path), "internal-error"});
                metrics_->record_failure(false);
            }
        }

        std::vector<Principle> checked;
        for (const auto& checker : checkers_) {
            checked.push_back(checker->principle());
        }
        compute_scores(report, checked);
        report.metrics = metrics_->snapshot();

        spdlog::info("Project analysis complete: {} of {} files analyzed, {} violations, score {:.1f}",
                     report.files_analyzed, report.files_discovered, report.violations.size(),
                     report.overall_score);
        return report;
    }

    void AnalysisCoordinator::analyze_structure(const fs::path& path, const Language language,
                                                ProjectReport& report) const {
        const auto start = Clock::now();

        auto context = guard_.load(path, language);
        if (context.is_err()) {
            report.skipped.push_back({display_name(path), security::to_string(context.error().reason)});
            return;
        }

        security::ResourceLimiter limiter(limiter_limits(config_.heuristics.limits));
        limiter.start_timer();

        auto structure = principles::build_file_structure(context.value(), config_.heuristics, &limiter);
        if (structure.is_err()) {
            const auto code = structure.error().code();
            report.skipped.push_back({context.value().display_path,
                                      code == ErrorCode::Timeout ? "timeout"
                                          : code == ErrorCode::Cancelled ? "cancelled" : "failed"});
            abort_file(context.value(), structure.error());
            return;
        }

        std::vector<Violation> file_violations;
        for (const auto& checker : checkers_) {
            if (!checker->supports_language(language)) {
                continue;
            }
            try {
                auto found = checker->check(structure.value());
                file_violations.insert(file_violations.end(),
                                       std::make_move_iterator(found.begin()),
                                       std::make_move_iterator(found.end()));
            } catch (const std::exception& e) {
                spdlog::warn("Checker {} failed on {}: {}", checker->name(), context.value().display_path,
                             security::Sanitizer::sanitize_error_message(e.what()));
            }
        }

        report.file_scores.push_back({context.value().display_path, file_score(file_violations),
                                      file_violations.size()});
        report.violations.insert(report.violations.end(),
                                  std::make_move_iterator(file_violations.begin()),
                                  std::make_move_iterator(file_violations.end()));
        ++report.files_analyzed;
        metrics_->record_file(0, elapsed_ms(start));
    }

}  // namespace hqa::analysis
