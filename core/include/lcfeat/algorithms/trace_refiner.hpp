#pragma once

#include "../config.hpp"
#include "../sample_feature_set.hpp"
#include "trace_builder.hpp"
#include <functional>
#include <utility>
#include <vector>

namespace lcfeat {
namespace algorithms {

/**
 * @brief Peak quality scorer signature.
 *
 * Receives a batch of apex-centred, height-normalised profiles of equal
 * length and returns one probability in [0, 1] per profile. Must be
 * stateless.
 */
using PeakQualityScorer =
    std::function<std::vector<double>(const std::vector<std::vector<double>>& profiles)>;

/**
 * @brief Counters reported by the trace refiner
 */
struct RefineStats {
    std::size_t input = 0;
    std::size_t dropped_empty = 0;
    std::size_t split = 0;
    std::size_t discarded_short = 0;
    std::size_t with_ms2 = 0;
    std::size_t scored = 0;
};

/**
 * @brief Turns raw traces into the feature set of one sample.
 *
 * Steps, in order: drop empty traces, split multi-apex traces, attach the
 * best MS2 spectrum, discard short traces without MS2, score the rest.
 */
class TraceRefiner {
public:
    TraceRefiner() = default;
    explicit TraceRefiner(const TraceRefinerOptions& options,
                          PeakQualityScorer scorer = nullptr)
        : options_(options), scorer_(std::move(scorer)) {}

    /**
     * @brief Refine the traces of one sample.
     *
     * @param traces Trace builder output (consumed)
     * @param sample_id Sample identifier
     * @param sample_name Sample name
     * @return Feature set sorted by m/z
     */
    SampleFeatureSet refine(TraceSet traces, SampleId sample_id,
                            const std::string& sample_name);

    /**
     * @brief Point ranges of the pieces of a multi-apex trace.
     *
     * A cut is made at the lowest point between two local maxima when the
     * valley lies more than split_drop_ratio of the lower apex below it.
     *
     * @param intensity Intensities in scan order
     * @return Consecutive [first, last] ranges covering every point once
     */
    std::vector<std::pair<Index, Index>> findSplitRanges(
        const std::vector<Intensity>& intensity) const;

    /**
     * @brief Split a trace at its valleys.
     *
     * @return The pieces, or a single copy when no cut applies
     */
    std::vector<Roi> split(const Roi& roi) const;

    /**
     * @brief Attach to each trace the most intense MS2 acquired inside it.
     */
    void attachMs2(std::vector<Roi>& rois, const std::vector<Ms2Spectrum>& ms2) const;

    /**
     * @brief Score traces in batches; leaves them unscored if the scorer fails.
     *
     * @return Number of traces that received a score
     */
    std::size_t score(std::vector<Roi>& rois) const;

    /// Counters of the last refine() call
    [[nodiscard]] const RefineStats& stats() const noexcept { return stats_; }

    /**
     * @brief Get/set options
     */
    const TraceRefinerOptions& options() const { return options_; }
    void setOptions(const TraceRefinerOptions& opt) { options_ = opt; }

    /// Set the quality scorer (nullptr = skip scoring)
    void setScorer(PeakQualityScorer scorer) { scorer_ = std::move(scorer); }

private:
    TraceRefinerOptions options_;
    PeakQualityScorer scorer_;
    RefineStats stats_;
};

} // namespace algorithms
} // namespace lcfeat
