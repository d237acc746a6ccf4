#pragma once

#include "types.hpp"
#include "roi.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace lcfeat {

/**
 * @brief The refined ROIs of one sample.
 *
 * Owns every ROI detected in the sample. Filled by the trace refiner and
 * treated as read-only afterwards; consensus features refer to its ROIs
 * by id.
 */
class SampleFeatureSet {
public:
    using iterator = std::vector<Roi>::iterator;
    using const_iterator = std::vector<Roi>::const_iterator;

    SampleFeatureSet() = default;
    SampleFeatureSet(SampleId id, std::string name)
        : sample_id_(id), sample_name_(std::move(name)) {}

    // =========================================================================
    // Container Operations
    // =========================================================================

    /// Get number of ROIs
    [[nodiscard]] std::size_t size() const noexcept { return rois_.size(); }

    /// Check if empty
    [[nodiscard]] bool empty() const noexcept { return rois_.empty(); }

    /// Access ROI by id
    [[nodiscard]] const Roi& operator[](std::size_t i) const { return rois_[i]; }
    [[nodiscard]] const Roi& roi(std::size_t i) const { return rois_.at(i); }

    /// Iterator access
    const_iterator begin() const noexcept { return rois_.begin(); }
    const_iterator end() const noexcept { return rois_.end(); }

    /// Add a ROI; its id becomes its position
    void add(Roi roi) {
        roi.setId(rois_.size());
        rois_.push_back(std::move(roi));
    }

    /// Sort by (m/z centre, apex rt) and renumber
    void sortByMz() {
        std::stable_sort(rois_.begin(), rois_.end(),
            [](const Roi& a, const Roi& b) {
                if (a.mzCenter() != b.mzCenter()) return a.mzCenter() < b.mzCenter();
                return a.rtApex() < b.rtApex();
            });
        for (std::size_t i = 0; i < rois_.size(); ++i) {
            rois_[i].setId(i);
        }
    }

    /// Reserve capacity
    void reserve(std::size_t n) { rois_.reserve(n); }

    /// Get underlying vector
    [[nodiscard]] const std::vector<Roi>& rois() const noexcept { return rois_; }

    // =========================================================================
    // Search
    // =========================================================================

    /// Find ROIs whose m/z centre and apex rt lie within the given tolerances
    [[nodiscard]] std::vector<const Roi*> findRois(MZ mz, RetentionTime rt,
                                                   MZ mz_tol = 0.005,
                                                   RetentionTime rt_tol = 0.3) const {
        std::vector<const Roi*> result;
        for (const auto& roi : rois_) {
            if (std::abs(roi.mzCenter() - mz) <= mz_tol &&
                std::abs(roi.rtApex() - rt) <= rt_tol) {
                result.push_back(&roi);
            }
        }
        return result;
    }

    // =========================================================================
    // Metadata
    // =========================================================================

    [[nodiscard]] SampleId sampleId() const noexcept { return sample_id_; }
    void setSampleId(SampleId id) noexcept { sample_id_ = id; }

    [[nodiscard]] const std::string& sampleName() const noexcept {
        return sample_name_;
    }
    void setSampleName(std::string name) { sample_name_ = std::move(name); }

    /// Malformed (empty) traces dropped during refinement
    [[nodiscard]] std::size_t droppedEmpty() const noexcept { return dropped_empty_; }
    void setDroppedEmpty(std::size_t n) noexcept { dropped_empty_ = n; }

    /// Number of scans consumed by the trace builder
    [[nodiscard]] std::size_t scanCount() const noexcept { return scan_count_; }
    void setScanCount(std::size_t n) noexcept { scan_count_ = n; }

    /// Get custom metadata
    [[nodiscard]] const MetaData& metadata() const noexcept { return metadata_; }
    MetaData& metadata() noexcept { return metadata_; }

private:
    std::vector<Roi> rois_;
    SampleId sample_id_ = 0;
    std::string sample_name_;
    std::size_t dropped_empty_ = 0;
    std::size_t scan_count_ = 0;
    MetaData metadata_;
};

} // namespace lcfeat
