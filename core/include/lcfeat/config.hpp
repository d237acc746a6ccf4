#pragma once

#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lcfeat {

/**
 * @brief Options for ion trace construction
 */
struct TraceBuilderOptions {
    /// Maximum m/z distance between a centroid and an open trace
    MZ mz_tolerance_ms1 = 0.01;

    /// Centroids below this intensity are ignored
    Intensity intensity_threshold = 1000.0;

    /// A trace closes once it misses more than this many consecutive scans
    int max_gap_scans = 2;

    /// Fragment intensity threshold for MS2 cleaning (unset = intensity_threshold)
    std::optional<Intensity> ms2_intensity_threshold;

    /// Fragments at or above (precursor m/z - offset) are removed
    MZ ms2_precursor_offset = 1.5;
};

/**
 * @brief Options for trace refinement and quality scoring
 */
struct TraceRefinerOptions {
    /// Traces shorter than this are dropped unless they carry an MS2 spectrum
    std::size_t min_points = 5;

    /// Split traces with several apexes
    bool cut_long_traces = true;

    /// Relative valley depth (fraction of the lower apex) required to split
    double split_drop_ratio = 0.5;

    /// Precursor m/z tolerance for attaching MS2 spectra
    MZ mz_tolerance_ms2 = 0.015;

    /// Number of points in the profile passed to the quality scorer
    std::size_t profile_length = 64;

    /// Profiles per scorer invocation
    std::size_t scorer_batch_size = 1024;
};

/**
 * @brief Options for cross-sample alignment
 */
struct AlignmentOptions {
    /// m/z tolerance between a ROI and a cluster centroid
    MZ align_mz_tolerance = 0.01;

    /// Retention time tolerance between a ROI and a cluster centroid
    RetentionTime align_rt_tolerance = 0.3;

    /// Short ROIs without MS2 may only join clusters, never seed them
    bool discard_short_roi = true;

    /// Length below which a ROI counts as short
    std::size_t short_roi_length = 5;
};

/**
 * @brief Options for peak relationship grouping
 */
struct GroupingOptions {
    /// Minimum peak-peak correlation for an edge
    double ppr_threshold = 0.7;

    /// Minimum number of samples where both features are present
    std::size_t min_co_occurrence = 3;

    /// Maximum retention time difference between related features
    RetentionTime group_rt_tolerance = 0.1;

    /// m/z tolerance for isotope spacing
    MZ isotope_mz_tolerance = 0.005;

    /// Isotope mass increments (one per charge state considered)
    std::vector<double> isotope_mz_increments = {C13_MASS_DIFFERENCE,
                                                 C13_MASS_DIFFERENCE / 2};

    /// Highest isotope rank searched
    int max_isotope_rank = 3;

    /// A heavier isotope may not exceed this multiple of the lighter peak
    double max_isotope_ratio = 3.0;

    /// m/z tolerance for adduct mass differences
    MZ adduct_mz_tolerance = 0.01;

    /// Ion mode used to pick the default adduct table
    Polarity polarity = Polarity::POSITIVE;

    /// Adduct mass differences against the base ion (empty = defaults)
    std::map<std::string, double> adduct_mass_table;

    /// Search [2M+H]+ / [3M+H]+ style multimers
    bool include_multimers = true;

    /// Fragment m/z tolerance for in-source fragment detection
    MZ mz_tolerance_ms2 = 0.01;

    /// Retention time tolerance for in-source fragments
    RetentionTime isf_rt_tolerance = 0.1;
};

/**
 * @brief Options for library annotation
 */
struct AnnotationOptions {
    /// Number of ranked candidates kept per feature
    std::size_t annotation_top_k = 3;

    /// Matches below this similarity are discarded
    double min_similarity = 0.7;

    /// Query spectra per scorer invocation
    std::size_t scorer_batch_size = 256;
};

/**
 * @brief Immutable configuration snapshot for a whole run.
 */
struct PipelineConfig {
    TraceBuilderOptions trace_builder;
    TraceRefinerOptions trace_refiner;
    AlignmentOptions alignment;
    GroupingOptions grouping;
    AnnotationOptions annotation;

    /// Worker threads for per-sample processing (0 = available cores)
    int threads = 0;
};

/// Base ion name for a polarity and charge ([M+H]+, [M-H]-, [M+2H]2+ or [M-2H]2-)
std::string baseAdductName(Polarity polarity, ChargeState charge = 1);

/// Default adduct mass differences against the base ion
std::map<std::string, double> defaultAdductTable(Polarity polarity);

/**
 * @brief Check option values.
 *
 * @throws ConfigError on non-positive tolerances or out-of-range values
 */
void validate(const TraceBuilderOptions& options);
void validate(const TraceRefinerOptions& options);
void validate(const AlignmentOptions& options);
void validate(const GroupingOptions& options);
void validate(const AnnotationOptions& options);
void validate(const PipelineConfig& config);

} // namespace lcfeat
