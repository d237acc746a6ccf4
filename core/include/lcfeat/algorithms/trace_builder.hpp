#pragma once

#include "../config.hpp"
#include "../roi.hpp"
#include "../scan_source.hpp"
#include <functional>
#include <map>
#include <vector>

namespace lcfeat {
namespace algorithms {

/**
 * @brief Progress callback signature.
 *
 * @param current Scans consumed so far
 * @param total Total expected scans (0 if unknown)
 * @return false to cancel, true to continue
 */
using ProgressCallback = std::function<bool(std::size_t current, std::size_t total)>;

/**
 * @brief Output of the trace builder for one sample.
 */
struct TraceSet {
    /// Closed ion traces in closing order
    std::vector<Roi> rois;

    /// Cleaned MS2 spectra in acquisition order
    std::vector<Ms2Spectrum> ms2;

    /// Scans consumed (all levels)
    std::size_t scan_count = 0;

    /// MS1 scans consumed
    std::size_t ms1_count = 0;
};

/**
 * @brief Streaming ROI construction from centroided scans.
 *
 * Keeps the open traces in an m/z-ordered index. Each MS1 centroid above
 * the intensity threshold extends the nearest open trace within the m/z
 * tolerance; when several centroids compete for one trace the nearest
 * wins and the others fall back to their next candidate or start a new
 * trace. Traces that miss more than max_gap_scans consecutive MS1 scans
 * are closed.
 *
 * A builder instance holds per-sample state only during build(); use one
 * instance per worker.
 */
class TraceBuilder {
public:
    TraceBuilder() = default;
    explicit TraceBuilder(const TraceBuilderOptions& options)
        : options_(options) {}

    /**
     * @brief Build the traces of one sample.
     *
     * @param source Scan source, consumed from its current position
     * @param progress Optional callback invoked between scans
     * @return Closed traces and cleaned MS2 spectra
     * @throws MalformedScanError if rt does not increase or centroids are unsorted
     * @throws CancelledError if the callback returns false
     */
    TraceSet build(ScanSource& source, const ProgressCallback& progress = nullptr);

    /**
     * @brief Get/set options
     */
    const TraceBuilderOptions& options() const { return options_; }
    void setOptions(const TraceBuilderOptions& opt) { options_ = opt; }

private:
    TraceBuilderOptions options_;

    // Per-build state
    std::map<std::size_t, Roi> open_;
    std::multimap<MZ, std::size_t> by_mz_;
    std::size_t next_trace_id_ = 0;

    /// Validate scan ordering against the previous scan
    void checkScan(const Scan& scan, std::size_t position, bool has_previous,
                   RetentionTime previous_rt) const;

    /// Match the centroids of one MS1 scan and update the open traces
    void processMs1(const Scan& scan, std::size_t position, TraceSet& result);

    /// Remove a trace from the m/z index
    void unindex(std::size_t trace_id, MZ mz_center);

    /// Close a trace and move it to the result
    void closeTrace(std::map<std::size_t, Roi>::iterator it, TraceSet& result);
};

/**
 * @brief Convenience function for trace building.
 */
inline TraceSet buildTraces(ScanSource& source,
                            const TraceBuilderOptions& options = {}) {
    TraceBuilder builder(options);
    return builder.build(source);
}

} // namespace algorithms
} // namespace lcfeat
