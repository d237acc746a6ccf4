#include "lcfeat/algorithms/trace_refiner.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

#include <boost/log/trivial.hpp>

namespace lcfeat {
namespace algorithms {

SampleFeatureSet TraceRefiner::refine(TraceSet traces, SampleId sample_id,
                                      const std::string& sample_name) {
    stats_ = RefineStats();
    stats_.input = traces.rois.size();

    std::vector<Roi> rois;
    rois.reserve(traces.rois.size());
    for (auto& roi : traces.rois) {
        if (roi.empty()) {
            ++stats_.dropped_empty;
            continue;
        }
        if (!options_.cut_long_traces) {
            rois.push_back(std::move(roi));
            continue;
        }
        auto pieces = split(roi);
        if (pieces.size() > 1) {
            stats_.split += pieces.size();
        }
        for (auto& piece : pieces) {
            rois.push_back(std::move(piece));
        }
    }
    if (stats_.dropped_empty > 0) {
        BOOST_LOG_TRIVIAL(warning) << sample_name << ": dropped "
                                   << stats_.dropped_empty << " empty traces";
    }

    attachMs2(rois, traces.ms2);

    auto short_end = std::remove_if(rois.begin(), rois.end(),
        [this](const Roi& r) {
            return r.length() < options_.min_points && !r.hasMs2();
        });
    stats_.discarded_short = static_cast<std::size_t>(std::distance(short_end, rois.end()));
    rois.erase(short_end, rois.end());

    stats_.with_ms2 = static_cast<std::size_t>(
        std::count_if(rois.begin(), rois.end(), [](const Roi& r) { return r.hasMs2(); }));
    stats_.scored = score(rois);

    SampleFeatureSet set(sample_id, sample_name);
    set.reserve(rois.size());
    for (auto& roi : rois) {
        set.add(std::move(roi));
    }
    set.sortByMz();
    set.setDroppedEmpty(stats_.dropped_empty);
    set.setScanCount(traces.scan_count);

    BOOST_LOG_TRIVIAL(debug) << sample_name << ": " << set.size() << " ROIs kept of "
                             << stats_.input << " (" << stats_.discarded_short
                             << " short, " << stats_.with_ms2 << " with MS2, "
                             << stats_.scored << " scored)";
    return set;
}

std::vector<std::pair<Index, Index>> TraceRefiner::findSplitRanges(
    const std::vector<Intensity>& intensity) const {
    std::vector<std::pair<Index, Index>> ranges;
    const std::size_t n = intensity.size();
    if (n == 0) return ranges;

    // Local maxima: strictly above the left neighbour, not below the right one
    std::vector<Index> maxima;
    for (std::size_t i = 0; i < n; ++i) {
        bool left = (i == 0) || intensity[i] > intensity[i - 1];
        bool right = (i + 1 == n) || intensity[i] >= intensity[i + 1];
        if (left && right) maxima.push_back(i);
    }

    Index start = 0;
    if (maxima.size() >= 2) {
        Index apex = maxima[0];
        for (std::size_t k = 1; k < maxima.size(); ++k) {
            Index next = maxima[k];
            auto valley_it = std::min_element(
                intensity.begin() + static_cast<std::ptrdiff_t>(apex),
                intensity.begin() + static_cast<std::ptrdiff_t>(next) + 1);
            auto valley = static_cast<Index>(valley_it - intensity.begin());
            double lower = std::min(intensity[apex], intensity[next]);

            if (lower - *valley_it > options_.split_drop_ratio * lower &&
                valley > start) {
                ranges.emplace_back(start, valley - 1);
                start = valley;
                apex = next;
            } else if (intensity[next] > intensity[apex]) {
                apex = next;
            }
        }
    }
    ranges.emplace_back(start, n - 1);
    return ranges;
}

std::vector<Roi> TraceRefiner::split(const Roi& roi) const {
    std::vector<Intensity> intensity;
    intensity.reserve(roi.length());
    for (const auto& p : roi.points()) {
        intensity.push_back(p.intensity);
    }

    auto ranges = findSplitRanges(intensity);
    std::vector<Roi> pieces;
    if (ranges.size() <= 1) {
        pieces.push_back(roi);
        return pieces;
    }

    pieces.reserve(ranges.size());
    for (const auto& [first, last] : ranges) {
        pieces.push_back(roi.extract(first, last));
    }
    return pieces;
}

void TraceRefiner::attachMs2(std::vector<Roi>& rois,
                             const std::vector<Ms2Spectrum>& ms2) const {
    if (ms2.empty() || rois.empty()) return;

    std::vector<Index> order(rois.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&rois](Index a, Index b) {
        return rois[a].mzCenter() < rois[b].mzCenter();
    });

    const MZ tol = options_.mz_tolerance_ms2;
    for (const auto& spectrum : ms2) {
        auto first = std::lower_bound(order.begin(), order.end(),
            spectrum.precursor_mz - tol,
            [&rois](Index i, MZ value) { return rois[i].mzCenter() < value; });

        for (auto it = first; it != order.end(); ++it) {
            Roi& roi = rois[*it];
            if (roi.mzCenter() > spectrum.precursor_mz + tol) break;
            if (spectrum.rt < roi.rtStart() || spectrum.rt > roi.rtEnd()) continue;

            if (!roi.hasMs2() ||
                spectrum.totalIntensity() > roi.bestMs2()->totalIntensity()) {
                roi.setBestMs2(spectrum);
            }
        }
    }
}

std::size_t TraceRefiner::score(std::vector<Roi>& rois) const {
    if (!scorer_ || rois.empty()) return 0;

    const std::size_t batch_size = std::max<std::size_t>(1, options_.scorer_batch_size);
    std::size_t scored = 0;

    for (std::size_t begin = 0; begin < rois.size(); begin += batch_size) {
        std::size_t end = std::min(rois.size(), begin + batch_size);

        std::vector<std::vector<double>> profiles;
        profiles.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            profiles.push_back(rois[i].profile(options_.profile_length));
        }

        std::vector<double> probabilities;
        try {
            probabilities = scorer_(profiles);
            if (probabilities.size() != profiles.size()) {
                throw std::runtime_error("expected " + std::to_string(profiles.size()) +
                                         " probabilities, got " +
                                         std::to_string(probabilities.size()));
            }
            for (double p : probabilities) {
                if (!(p >= 0.0 && p <= 1.0)) {
                    throw std::runtime_error("probability outside [0, 1]");
                }
            }
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "peak quality scorer unavailable, "
                                       << rois.size() - scored
                                       << " ROIs left unscored: " << e.what();
            return scored;
        }

        for (std::size_t i = begin; i < end; ++i) {
            rois[i].setQuality(probabilities[i - begin]);
        }
        scored += end - begin;
    }
    return scored;
}

} // namespace algorithms
} // namespace lcfeat
