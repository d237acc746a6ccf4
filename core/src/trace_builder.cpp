#include "lcfeat/algorithms/trace_builder.hpp"
#include "lcfeat/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

#include <boost/log/trivial.hpp>

namespace lcfeat {
namespace algorithms {

namespace {

struct Candidate {
    double distance;
    std::size_t centroid;
    std::size_t trace_id;
};

} // namespace

TraceSet TraceBuilder::build(ScanSource& source, const ProgressCallback& progress) {
    open_.clear();
    by_mz_.clear();
    next_trace_id_ = 0;

    TraceSet result;
    const Intensity ms2_threshold =
        options_.ms2_intensity_threshold.value_or(options_.intensity_threshold);
    const std::size_t total = source.sizeHint();

    bool has_previous = false;
    RetentionTime previous_rt = 0.0;
    std::size_t position = 0;

    while (const Scan* scan = source.next()) {
        checkScan(*scan, position, has_previous, previous_rt);
        has_previous = true;
        previous_rt = scan->retentionTime();

        if (scan->msLevel() == 1) {
            processMs1(*scan, position, result);
            ++result.ms1_count;
        } else if (scan->precursor()) {
            Ms2Spectrum ms2 = cleanMs2(*scan, ms2_threshold,
                                       options_.ms2_precursor_offset);
            ms2.scan_index = position;
            result.ms2.push_back(std::move(ms2));
        }

        ++position;
        if (progress && !progress(position, total)) {
            throw CancelledError("trace building stopped at scan " +
                                 std::to_string(position) + " of " +
                                 source.sampleName());
        }
    }

    // Close the remaining traces in creation order
    while (!open_.empty()) {
        closeTrace(open_.begin(), result);
    }
    by_mz_.clear();

    result.scan_count = position;
    BOOST_LOG_TRIVIAL(debug) << source.sampleName() << ": " << result.rois.size()
                             << " traces from " << result.ms1_count << " MS1 scans, "
                             << result.ms2.size() << " MS2 spectra";
    return result;
}

void TraceBuilder::checkScan(const Scan& scan, std::size_t position,
                             bool has_previous, RetentionTime previous_rt) const {
    if (has_previous && !(scan.retentionTime() > previous_rt)) {
        throw MalformedScanError("retention time " +
                                 std::to_string(scan.retentionTime()) +
                                 " does not increase", position);
    }
    if (!scan.isSortedByMz()) {
        throw MalformedScanError("centroids are not sorted by m/z", position);
    }
}

void TraceBuilder::processMs1(const Scan& scan, std::size_t position,
                              TraceSet& result) {
    const MZ tol = options_.mz_tolerance_ms1;
    const std::size_t n = scan.size();

    // Every (centroid, open trace) pair within tolerance
    std::vector<Candidate> candidates;
    std::vector<bool> eligible(n, false);
    for (std::size_t i = 0; i < n; ++i) {
        if (scan.intensityAt(i) < options_.intensity_threshold) continue;
        eligible[i] = true;

        const MZ mz = scan.mzAt(i);
        auto it = by_mz_.lower_bound(mz - tol);
        auto end = by_mz_.upper_bound(mz + tol);
        for (; it != end; ++it) {
            candidates.push_back({std::abs(it->first - mz), i, it->second});
        }
    }

    // Nearest pairs first; centroids are m/z-sorted so index order is m/z order
    std::sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) {
            if (a.distance != b.distance) return a.distance < b.distance;
            if (a.centroid != b.centroid) return a.centroid < b.centroid;
            return a.trace_id < b.trace_id;
        });

    std::vector<bool> centroid_used(n, false);
    std::map<std::size_t, std::size_t> extensions;  // trace id -> centroid
    for (const auto& c : candidates) {
        if (centroid_used[c.centroid] || extensions.count(c.trace_id)) continue;
        centroid_used[c.centroid] = true;
        extensions.emplace(c.trace_id, c.centroid);
    }

    const RetentionTime rt = scan.retentionTime();

    // Extend matched traces; every trace not extended accumulates a gap
    for (auto it = open_.begin(); it != open_.end();) {
        auto ext = extensions.find(it->first);
        Roi& roi = it->second;
        if (ext != extensions.end()) {
            unindex(it->first, roi.mzCenter());
            roi.addPoint({position, rt, scan.mzAt(ext->second),
                          scan.intensityAt(ext->second)});
            roi.resetGap();
            by_mz_.emplace(roi.mzCenter(), it->first);
            ++it;
            continue;
        }

        roi.incrementGap();
        if (roi.gapCounter() > options_.max_gap_scans) {
            auto next = std::next(it);
            unindex(it->first, roi.mzCenter());
            closeTrace(it, result);
            it = next;
        } else {
            ++it;
        }
    }

    // Unmatched centroids open new traces
    for (std::size_t i = 0; i < n; ++i) {
        if (!eligible[i] || centroid_used[i]) continue;
        Roi roi;
        roi.addPoint({position, rt, scan.mzAt(i), scan.intensityAt(i)});
        std::size_t id = next_trace_id_++;
        by_mz_.emplace(roi.mzCenter(), id);
        open_.emplace(id, std::move(roi));
    }
}

void TraceBuilder::unindex(std::size_t trace_id, MZ mz_center) {
    auto range = by_mz_.equal_range(mz_center);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second == trace_id) {
            by_mz_.erase(it);
            return;
        }
    }
}

void TraceBuilder::closeTrace(std::map<std::size_t, Roi>::iterator it,
                              TraceSet& result) {
    it->second.close();
    result.rois.push_back(std::move(it->second));
    open_.erase(it);
}

} // namespace algorithms
} // namespace lcfeat
