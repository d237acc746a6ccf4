#pragma once

#include "types.hpp"
#include <algorithm>
#include <numeric>
#include <optional>
#include <stdexcept>

namespace lcfeat {

/// Precursor information for MS/MS scans
struct Precursor {
    MZ mz = 0.0;
    Intensity intensity = 0.0;
};

/**
 * @brief One centroided scan of an LC-MS run.
 *
 * A Scan stores paired arrays of m/z values and intensities together with
 * its retention time, MS level and, for MS/MS scans, the precursor.
 * Scans are produced by a ScanSource and are not modified afterwards.
 */
class Scan {
public:
    /// Default constructor creates an empty MS1 scan
    Scan() = default;

    /// Construct from retention time, m/z and intensity vectors
    Scan(RetentionTime rt, std::vector<MZ> mz, std::vector<Intensity> intensity,
         MSLevel level = 1)
        : mz_(std::move(mz)), intensity_(std::move(intensity)),
          ms_level_(level), rt_(rt) {
        if (mz_.size() != intensity_.size()) {
            throw std::invalid_argument("m/z and intensity arrays must have same size");
        }
    }

    Scan(Scan&&) noexcept = default;
    Scan& operator=(Scan&&) noexcept = default;
    Scan(const Scan&) = default;
    Scan& operator=(const Scan&) = default;

    // =========================================================================
    // Data Access
    // =========================================================================

    /// Get number of centroids
    [[nodiscard]] std::size_t size() const noexcept { return mz_.size(); }

    /// Check if scan has no centroids
    [[nodiscard]] bool empty() const noexcept { return mz_.empty(); }

    /// Get m/z array
    [[nodiscard]] const std::vector<MZ>& mz() const noexcept { return mz_; }

    /// Get intensity array
    [[nodiscard]] const std::vector<Intensity>& intensity() const noexcept {
        return intensity_;
    }

    /// Get m/z at index
    [[nodiscard]] MZ mzAt(Index i) const { return mz_.at(i); }

    /// Get intensity at index
    [[nodiscard]] Intensity intensityAt(Index i) const { return intensity_.at(i); }

    // =========================================================================
    // Metadata
    // =========================================================================

    /// Get scan index in the run
    [[nodiscard]] Index index() const noexcept { return index_; }
    void setIndex(Index idx) noexcept { index_ = idx; }

    /// Get MS level (1 for MS1, 2 for MS/MS, etc.)
    [[nodiscard]] MSLevel msLevel() const noexcept { return ms_level_; }
    void setMsLevel(MSLevel level) noexcept { ms_level_ = level; }

    /// Get retention time in minutes
    [[nodiscard]] RetentionTime retentionTime() const noexcept { return rt_; }
    void setRetentionTime(RetentionTime rt) noexcept { rt_ = rt; }

    /// Get precursor (MS/MS scans only)
    [[nodiscard]] const std::optional<Precursor>& precursor() const noexcept {
        return precursor_;
    }
    void setPrecursor(Precursor p) { precursor_ = p; }

    // =========================================================================
    // Statistics
    // =========================================================================

    /// Check if data is sorted by m/z
    [[nodiscard]] bool isSortedByMz() const {
        return std::is_sorted(mz_.begin(), mz_.end());
    }

    /// Compute sum of intensities
    [[nodiscard]] Intensity totalIntensity() const {
        return std::accumulate(intensity_.begin(), intensity_.end(), 0.0);
    }

    /// Get base peak intensity
    [[nodiscard]] Intensity basePeakIntensity() const {
        if (intensity_.empty()) return 0.0;
        return *std::max_element(intensity_.begin(), intensity_.end());
    }

private:
    std::vector<MZ> mz_;
    std::vector<Intensity> intensity_;

    Index index_ = 0;
    MSLevel ms_level_ = 1;
    RetentionTime rt_ = 0.0;
    std::optional<Precursor> precursor_;
};

/**
 * @brief Cleaned fragmentation spectrum attached to ROIs.
 */
struct Ms2Spectrum {
    MZ precursor_mz = 0.0;
    Intensity precursor_intensity = 0.0;
    RetentionTime rt = 0.0;
    Index scan_index = 0;
    std::vector<MZ> mz;
    std::vector<Intensity> intensity;

    [[nodiscard]] std::size_t size() const noexcept { return mz.size(); }
    [[nodiscard]] bool empty() const noexcept { return mz.empty(); }

    [[nodiscard]] Intensity totalIntensity() const {
        return std::accumulate(intensity.begin(), intensity.end(), 0.0);
    }
};

/**
 * @brief Build a cleaned MS2 spectrum from an MS/MS scan.
 *
 * Removes fragments at or above (precursor m/z - precursor_offset), then
 * fragments below 1% of the base fragment, then fragments below the
 * absolute intensity threshold.
 *
 * @throws std::invalid_argument if the scan carries no precursor
 */
Ms2Spectrum cleanMs2(const Scan& scan, Intensity intensity_threshold,
                     MZ precursor_offset = 1.5);

} // namespace lcfeat
