#pragma once

#include "types.hpp"
#include "scan.hpp"
#include "roi.hpp"
#include <vector>
#include <string>
#include <algorithm>
#include <limits>

namespace lcfeat {

/**
 * @brief Supplier of the scans of one sample, in acquisition order.
 *
 * Implementations wrap an instrument file reader or an in-memory run.
 * A source promises strictly increasing retention times and m/z-sorted
 * centroids; the trace builder verifies both.
 */
class ScanSource {
public:
    virtual ~ScanSource() = default;

    /**
     * @brief Get the next scan.
     *
     * @return Pointer valid until the next call, nullptr at the end
     */
    virtual const Scan* next() = 0;

    /// Restart from the first scan
    virtual void reset() = 0;

    /// Number of scans if known in advance (0 = unknown)
    [[nodiscard]] virtual std::size_t sizeHint() const { return 0; }

    /// Name of the sample this source belongs to
    [[nodiscard]] virtual const std::string& sampleName() const = 0;
};

/**
 * @brief In-memory scan source holding all scans of one run.
 */
class ScanList : public ScanSource {
public:
    ScanList() = default;
    explicit ScanList(std::string sample_name)
        : sample_name_(std::move(sample_name)) {}

    // =========================================================================
    // ScanSource
    // =========================================================================

    const Scan* next() override {
        if (cursor_ >= scans_.size()) return nullptr;
        return &scans_[cursor_++];
    }

    void reset() override { cursor_ = 0; }

    [[nodiscard]] std::size_t sizeHint() const override { return scans_.size(); }

    [[nodiscard]] const std::string& sampleName() const override {
        return sample_name_;
    }
    void setSampleName(std::string name) { sample_name_ = std::move(name); }

    // =========================================================================
    // Scan Access
    // =========================================================================

    /// Get number of scans
    [[nodiscard]] std::size_t size() const noexcept { return scans_.size(); }

    /// Check if the run has no scans
    [[nodiscard]] bool empty() const noexcept { return scans_.empty(); }

    /// Access scan by index
    [[nodiscard]] const Scan& operator[](std::size_t i) const { return scans_[i]; }

    /// Get all scans
    [[nodiscard]] const std::vector<Scan>& scans() const noexcept { return scans_; }

    /// Add a scan; its index becomes its position in the run
    void addScan(Scan s) {
        s.setIndex(scans_.size());
        rt_range_.extend(s.retentionTime());
        scans_.push_back(std::move(s));
    }

    /// Reserve capacity for scans
    void reserve(std::size_t n) { scans_.reserve(n); }

    /// Count scans at given MS level
    [[nodiscard]] std::size_t countScansByLevel(MSLevel level) const {
        return std::count_if(scans_.begin(), scans_.end(),
            [level](const Scan& s) { return s.msLevel() == level; });
    }

    /// Get overall RT range
    [[nodiscard]] const RTRange& rtRange() const noexcept { return rt_range_; }

    /**
     * @brief Extracted ion chromatogram of a target m/z.
     *
     * One point per MS1 scan with rt in [rt_low, rt_high]: the centroid
     * nearest to `mz` if it lies within `mz_tol`, otherwise a point with
     * zero m/z and intensity.
     */
    [[nodiscard]] std::vector<RoiPoint> extractIon(
        MZ mz, MZ mz_tol = 0.005, RetentionTime rt_low = 0.0,
        RetentionTime rt_high = std::numeric_limits<RetentionTime>::max()) const;

private:
    std::vector<Scan> scans_;
    std::size_t cursor_ = 0;
    RTRange rt_range_;
    std::string sample_name_;
};

} // namespace lcfeat
