#pragma once

#include "types.hpp"
#include "scan.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <vector>

namespace lcfeat {

/// One point of an ion trace
struct RoiPoint {
    Index scan_index = 0;
    RetentionTime rt = 0.0;
    MZ mz = 0.0;
    Intensity intensity = 0.0;
};

/**
 * @brief Region of interest: the trace of one ion over consecutive scans.
 *
 * A Roi stores its points in scan order together with cached statistics
 * (m/z centre, apex, height, area) that are kept current as points are
 * appended. Scan indices strictly increase within a Roi, so
 * rtStart() <= rtApex() <= rtEnd() always holds for a non-empty trace.
 */
class Roi {
public:
    Roi() = default;

    Roi(Roi&&) noexcept = default;
    Roi& operator=(Roi&&) noexcept = default;
    Roi(const Roi&) = default;
    Roi& operator=(const Roi&) = default;

    /// Build a trace from points in scan order
    static Roi fromPoints(const std::vector<RoiPoint>& points) {
        Roi roi;
        roi.points_.reserve(points.size());
        for (const auto& p : points) {
            roi.addPoint(p);
        }
        return roi;
    }

    // =========================================================================
    // Data Access
    // =========================================================================

    /// Get number of points
    [[nodiscard]] std::size_t length() const noexcept { return points_.size(); }

    /// Check if the trace has no points
    [[nodiscard]] bool empty() const noexcept { return points_.empty(); }

    /// Get all points
    [[nodiscard]] const std::vector<RoiPoint>& points() const noexcept {
        return points_;
    }

    /// Get point at index
    [[nodiscard]] const RoiPoint& pointAt(Index i) const { return points_.at(i); }

    // =========================================================================
    // Statistics
    // =========================================================================

    /// Intensity-weighted mean m/z of the trace
    [[nodiscard]] MZ mzCenter() const noexcept { return mz_center_; }

    /// Retention time of the first point
    [[nodiscard]] RetentionTime rtStart() const noexcept {
        return points_.empty() ? 0.0 : points_.front().rt;
    }

    /// Retention time of the last point
    [[nodiscard]] RetentionTime rtEnd() const noexcept {
        return points_.empty() ? 0.0 : points_.back().rt;
    }

    /// Retention time of the most intense point
    [[nodiscard]] RetentionTime rtApex() const noexcept { return rt_apex_; }

    /// Index of the most intense point
    [[nodiscard]] Index apexIndex() const noexcept { return apex_index_; }

    /// Maximum intensity
    [[nodiscard]] Intensity height() const noexcept { return height_; }

    /// Trapezoidal area over retention time
    [[nodiscard]] double area() const noexcept { return area_; }

    /// First and last scan index
    [[nodiscard]] Index firstScan() const noexcept {
        return points_.empty() ? 0 : points_.front().scan_index;
    }
    [[nodiscard]] Index lastScan() const noexcept {
        return points_.empty() ? 0 : points_.back().scan_index;
    }

    // =========================================================================
    // Building
    // =========================================================================

    /**
     * @brief Append a point.
     *
     * @throws std::invalid_argument if the scan index does not increase
     */
    void addPoint(const RoiPoint& p) {
        if (!points_.empty() && p.scan_index <= points_.back().scan_index) {
            throw std::invalid_argument("ROI scan indices must strictly increase");
        }

        if (!points_.empty()) {
            const RoiPoint& prev = points_.back();
            area_ += 0.5 * (p.intensity + prev.intensity) * (p.rt - prev.rt);
        }

        weight_sum_ += p.intensity;
        if (weight_sum_ > 0.0) {
            mz_center_ += (p.mz - mz_center_) * (p.intensity / weight_sum_);
        } else {
            mz_center_ += (p.mz - mz_center_) / static_cast<double>(points_.size() + 1);
        }

        if (points_.empty() || p.intensity > height_) {
            height_ = p.intensity;
            rt_apex_ = p.rt;
            apex_index_ = points_.size();
        }

        points_.push_back(p);
    }

    /// Consecutive scans without extension
    [[nodiscard]] int gapCounter() const noexcept { return gap_counter_; }
    void resetGap() noexcept { gap_counter_ = 0; }
    void incrementGap() noexcept { ++gap_counter_; }

    /// Whether the trace is closed for extension
    [[nodiscard]] bool closed() const noexcept { return closed_; }
    void close() noexcept { closed_ = true; }

    /// Copy of the points [first, last] as an independent closed trace
    [[nodiscard]] Roi extract(Index first, Index last) const {
        if (first > last || last >= points_.size()) {
            throw std::out_of_range("ROI point range out of bounds");
        }
        Roi piece = fromPoints(std::vector<RoiPoint>(
            points_.begin() + static_cast<std::ptrdiff_t>(first),
            points_.begin() + static_cast<std::ptrdiff_t>(last) + 1));
        piece.close();
        return piece;
    }

    /**
     * @brief Apex-centred intensity profile of fixed length.
     *
     * The trace is linearly resampled on a window symmetric around the
     * apex point and scaled by the height; positions outside the trace
     * are zero.
     */
    [[nodiscard]] std::vector<double> profile(std::size_t length) const;

    // =========================================================================
    // Evaluation
    // =========================================================================

    /// Identifier within the owning sample
    [[nodiscard]] Index id() const noexcept { return id_; }
    void setId(Index id) noexcept { id_ = id; }

    /// Peak quality probability (unset if unscored)
    [[nodiscard]] std::optional<double> quality() const noexcept { return quality_; }
    void setQuality(double q) noexcept { quality_ = q; }

    /// Best fragmentation spectrum acquired inside the trace
    [[nodiscard]] const std::optional<Ms2Spectrum>& bestMs2() const noexcept {
        return best_ms2_;
    }
    [[nodiscard]] bool hasMs2() const noexcept { return best_ms2_.has_value(); }
    void setBestMs2(Ms2Spectrum ms2) { best_ms2_ = std::move(ms2); }

private:
    std::vector<RoiPoint> points_;

    Index id_ = 0;

    // Cached statistics
    MZ mz_center_ = 0.0;
    double weight_sum_ = 0.0;
    RetentionTime rt_apex_ = 0.0;
    Index apex_index_ = 0;
    Intensity height_ = 0.0;
    double area_ = 0.0;

    // Building state
    int gap_counter_ = 0;
    bool closed_ = false;

    // Evaluation
    std::optional<double> quality_;
    std::optional<Ms2Spectrum> best_ms2_;
};

} // namespace lcfeat
