#pragma once

#include "../config.hpp"
#include "../feature_table.hpp"
#include <memory>
#include <set>
#include <vector>

namespace lcfeat {
namespace algorithms {

/**
 * @brief Counters reported by the aligner
 */
struct AlignmentStats {
    std::size_t pooled = 0;
    std::size_t evictions = 0;
    std::size_t supporting = 0;
    std::size_t unassigned = 0;
    std::size_t features = 0;
};

/**
 * @brief Greedy cross-sample clustering of ROIs into consensus features.
 *
 * ROIs of all samples are pooled and visited in (m/z, rt) order. A ROI
 * joins the nearest cluster within tolerance that does not yet hold a ROI
 * of its sample; when it does, the ROI nearer to the centroid keeps the
 * slot and the other one is evicted and placed again. Centroids are
 * height-weighted means, and a change is only made when every member stays
 * within tolerance of the new centroid.
 */
class Aligner {
public:
    Aligner() = default;
    explicit Aligner(const AlignmentOptions& options)
        : options_(options) {}

    /**
     * @brief Align the feature sets of a run.
     *
     * @param samples Sample feature sets; slot i of each feature refers to samples[i]
     * @return Consensus features sorted by (m/z, rt)
     */
    FeatureTable align(std::vector<FeatureTable::SamplePtr> samples);

    /// Counters of the last align() call
    [[nodiscard]] const AlignmentStats& stats() const noexcept { return stats_; }

    /**
     * @brief Get/set options
     */
    const AlignmentOptions& options() const { return options_; }
    void setOptions(const AlignmentOptions& opt) { options_ = opt; }

private:
    struct Item {
        std::size_t slot;
        SampleId sample_id;
        Index roi_id;
        MZ mz;
        RetentionTime rt;
        Intensity height;
        double area;
        std::size_t length;
        bool anchor;
    };

    struct Cluster {
        std::size_t id;
        MZ mz;
        RetentionTime rt;
        std::vector<std::size_t> members;  // item indices
    };

    AlignmentOptions options_;
    AlignmentStats stats_;

    // Per-align state
    std::vector<Item> items_;
    std::vector<Cluster> clusters_;
    std::vector<std::size_t> active_;
    std::vector<std::set<std::size_t>> evicted_from_;

    /// Pool and sort the ROIs of all samples
    void pool(const std::vector<FeatureTable::SamplePtr>& samples);

    /// Normalised distance between an item and a cluster centroid
    double distance(const Item& item, const Cluster& cluster) const;

    /// Whether an item lies within both tolerances of a position
    bool within(const Item& item, MZ mz, RetentionTime rt) const;

    /// Place an item, evicting and re-placing as needed; false if nothing accepted it
    bool place(std::size_t item, bool allow_eviction);

    /// Try to commit a member set; updates the cluster on success
    bool tryCommit(Cluster& cluster, std::vector<std::size_t> members);

    /// Member of a cluster from the given sample slot, or npos
    std::size_t memberOfSlot(const Cluster& cluster, std::size_t slot) const;

    /// Start a new cluster from one item
    void seed(std::size_t item);

    /// Clusters whose centroid may still accept items
    void retire(MZ sweep_mz);

    FeatureTable buildTable(std::vector<FeatureTable::SamplePtr> samples) const;
};

/**
 * @brief Convenience function for alignment.
 */
inline FeatureTable alignSamples(std::vector<FeatureTable::SamplePtr> samples,
                                 const AlignmentOptions& options = {}) {
    Aligner aligner(options);
    return aligner.align(std::move(samples));
}

} // namespace algorithms
} // namespace lcfeat
