#pragma once

#include "config.hpp"
#include "feature_table.hpp"
#include "scan_source.hpp"
#include "algorithms/annotator.hpp"
#include "algorithms/trace_refiner.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lcfeat {

/**
 * @brief Outcome of processing one sample.
 */
struct SampleSummary {
    SampleId sample_id = 0;
    std::string name;
    Status status = Status::NOT_RUN;
    std::string message;
    std::size_t scans = 0;
    std::size_t traces = 0;
    std::size_t rois = 0;
    std::size_t dropped_empty = 0;
    std::size_t with_ms2 = 0;
};

/**
 * @brief Outcome of a whole run.
 */
struct RunSummary {
    std::vector<SampleSummary> samples;
    std::size_t features = 0;
    std::size_t groups = 0;
    std::size_t annotated = 0;
    bool cancelled = false;

    /// Number of samples processed without error
    [[nodiscard]] std::size_t succeeded() const noexcept {
        std::size_t n = 0;
        for (const auto& s : samples) {
            if (s.status == Status::OK) ++n;
        }
        return n;
    }
};

/**
 * @brief Feature table and summary of a run.
 */
struct RunResult {
    FeatureTable table;
    RunSummary summary;
};

/**
 * @brief Runs trace building, refinement, alignment, grouping and annotation.
 *
 * Samples are built and refined on parallel workers; a sample that fails
 * is reported in the summary and left out of the feature table while the
 * other samples continue. Alignment, grouping and annotation run after all
 * workers finish.
 */
class Pipeline {
public:
    /**
     * @brief Per-sample progress callback.
     *
     * @param sample Position of the sample in the run
     * @param current Scans consumed so far
     * @param total Total expected scans (0 if unknown)
     */
    using ProgressCallback =
        std::function<void(std::size_t sample, std::size_t current, std::size_t total)>;

    Pipeline() = default;
    explicit Pipeline(PipelineConfig config) : config_(std::move(config)) {}

    /**
     * @brief Process the samples of a run.
     *
     * @param samples One scan source per sample, consumed
     * @return Feature table over the successful samples and the run summary
     * @throws ConfigError if the configuration is invalid or there are no samples
     */
    RunResult run(const std::vector<std::unique_ptr<ScanSource>>& samples);

    /// Request cancellation; workers stop at their next scan
    void cancel() noexcept { cancelled_.store(true); }

    /// Whether cancellation was requested
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

    /**
     * @brief Get/set configuration
     */
    const PipelineConfig& config() const { return config_; }
    void setConfig(PipelineConfig config) { config_ = std::move(config); }

    /// Set the peak quality scorer (nullptr = ROIs stay unscored)
    void setPeakQualityScorer(algorithms::PeakQualityScorer scorer) {
        peak_scorer_ = std::move(scorer);
    }

    /// Set the spectral similarity scorer and its library
    void setSpectralScorer(algorithms::SpectralSimilarityScorer scorer,
                           algorithms::SpectralLibrary library) {
        spectral_scorer_ = std::move(scorer);
        library_ = std::move(library);
    }

    /// Set the progress callback (may be invoked from several threads)
    void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

private:
    PipelineConfig config_;
    algorithms::PeakQualityScorer peak_scorer_;
    algorithms::SpectralSimilarityScorer spectral_scorer_;
    algorithms::SpectralLibrary library_;
    ProgressCallback progress_;
    std::atomic<bool> cancelled_{false};

    /// Build and refine one sample
    std::shared_ptr<const SampleFeatureSet> processSample(ScanSource& source,
                                                          std::size_t position,
                                                          const PipelineConfig& config,
                                                          SampleSummary& summary);
};

/// Log a run summary
void logSummary(const RunSummary& summary);

} // namespace lcfeat
