#pragma once

#include "lcfeat/feature_table.hpp"
#include "lcfeat/roi.hpp"
#include "lcfeat/sample_feature_set.hpp"
#include "lcfeat/scan_source.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

namespace test_helpers {

using namespace lcfeat;

/// Triangular trace of constant m/z with its apex at `rt`
inline Roi makeRoi(MZ mz, RetentionTime rt, Intensity height, std::size_t length = 7,
                   RetentionTime rt_step = 0.01) {
    std::vector<RoiPoint> points;
    const auto center = static_cast<double>(length / 2);
    for (std::size_t i = 0; i < length; ++i) {
        double offset = static_cast<double>(i) - center;
        double intensity = height * (1.0 - std::abs(offset) / (center + 1.0));
        points.push_back({i + 1, rt + offset * rt_step, mz, intensity});
    }
    return Roi::fromPoints(points);
}

/// Sample feature set holding the given ROIs, ids in insertion order
inline std::shared_ptr<const SampleFeatureSet> makeSample(SampleId id, std::vector<Roi> rois) {
    auto sample = std::make_shared<SampleFeatureSet>(id, "sample_" + std::to_string(id));
    for (auto& roi : rois) {
        sample->add(std::move(roi));
    }
    return sample;
}

/// MS2 spectrum with the given fragments
inline Ms2Spectrum makeMs2(MZ precursor_mz, Intensity precursor_intensity, RetentionTime rt,
                           std::vector<MZ> fragments) {
    Ms2Spectrum ms2;
    ms2.precursor_mz = precursor_mz;
    ms2.precursor_intensity = precursor_intensity;
    ms2.rt = rt;
    ms2.mz = std::move(fragments);
    ms2.intensity.assign(ms2.mz.size(), 10000.0);
    return ms2;
}

/**
 * @brief A feature described by its position and per-sample heights.
 *
 * A height of 0 means the feature is absent in that sample.
 */
struct FeatureSpec {
    MZ mz;
    RetentionTime rt;
    std::vector<Intensity> heights;
    std::vector<Ms2Spectrum> ms2 = {};  // per sample, optional
};

/**
 * @brief Feature table built directly from specs, in the given order.
 *
 * Every present entry is backed by a real ROI in its sample.
 */
inline FeatureTable makeTable(const std::vector<FeatureSpec>& specs, std::size_t sample_count) {
    std::vector<std::shared_ptr<SampleFeatureSet>> samples;
    for (std::size_t s = 0; s < sample_count; ++s) {
        samples.push_back(std::make_shared<SampleFeatureSet>(
            static_cast<SampleId>(s), "sample_" + std::to_string(s)));
    }

    std::vector<ConsensusFeature> features;
    for (const auto& wanted : specs) {
        ConsensusFeature feature(wanted.mz, wanted.rt, sample_count);
        for (std::size_t s = 0; s < sample_count; ++s) {
            if (s >= wanted.heights.size() || wanted.heights[s] <= 0.0) continue;
            Roi roi = makeRoi(wanted.mz, wanted.rt, wanted.heights[s]);
            if (s < wanted.ms2.size() && !wanted.ms2[s].mz.empty()) {
                roi.setBestMs2(wanted.ms2[s]);
            }
            FeatureEntry entry{samples[s]->size(), roi.height(), roi.area()};
            samples[s]->add(std::move(roi));
            feature.setEntry(s, entry);
        }
        features.push_back(std::move(feature));
    }

    std::vector<FeatureTable::SamplePtr> shared(samples.begin(), samples.end());
    FeatureTable table(std::move(shared));
    for (auto& f : features) {
        table.add(std::move(f));
    }
    return table;
}

/// Gaussian elution profiles of a set of compounds sampled on a regular scan grid
struct Compound {
    MZ mz;
    RetentionTime rt;
    Intensity height;
};

inline std::unique_ptr<ScanList> makeRun(const std::string& name,
                                         const std::vector<Compound>& compounds,
                                         std::size_t scan_count = 100,
                                         RetentionTime rt_step = 0.02,
                                         RetentionTime sigma = 0.03) {
    std::vector<Compound> sorted = compounds;
    std::sort(sorted.begin(), sorted.end(),
        [](const Compound& a, const Compound& b) { return a.mz < b.mz; });

    auto run = std::make_unique<ScanList>(name);
    for (std::size_t i = 0; i < scan_count; ++i) {
        const RetentionTime rt = rt_step * static_cast<double>(i + 1);
        std::vector<MZ> mz;
        std::vector<Intensity> intensity;
        for (const auto& c : sorted) {
            double x = (rt - c.rt) / sigma;
            double value = c.height * std::exp(-0.5 * x * x);
            if (value >= 1.0) {
                mz.push_back(c.mz);
                intensity.push_back(value);
            }
        }
        run->addScan(Scan(rt, std::move(mz), std::move(intensity)));
    }
    return run;
}

} // namespace test_helpers
