#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "lcfeat/algorithms/aligner.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <set>
#include <stdexcept>
#include <tuple>

using namespace lcfeat;
using namespace lcfeat::algorithms;
using namespace test_helpers;
using Catch::Approx;

namespace {

// (sample id, roi id) pairs of every feature, independent of slot order
std::set<std::set<std::pair<SampleId, Index>>> memberships(const FeatureTable& table) {
    std::set<std::set<std::pair<SampleId, Index>>> result;
    for (const auto& feature : table) {
        std::set<std::pair<SampleId, Index>> members;
        for (std::size_t s = 0; s < table.sampleCount(); ++s) {
            const auto& e = feature.entry(s);
            if (e) members.emplace(table.sample(s).sampleId(), e->roi_id);
        }
        result.insert(members);
    }
    return result;
}

} // namespace

TEST_CASE("Alignment of matching ROIs", "[aligner]") {
    auto table = alignSamples({
        makeSample(0, {makeRoi(100.0, 4.95, 1000.0)}),
        makeSample(1, {makeRoi(100.0, 5.00, 1200.0)}),
        makeSample(2, {makeRoi(100.0, 5.05, 900.0)}),
    });

    REQUIRE(table.size() == 1);
    REQUIRE(table.sampleCount() == 3);

    const auto& feature = table[0];
    REQUIRE(feature.presentCount() == 3);
    REQUIRE(feature.mz() == Approx(100.0));
    double expected_rt = (4.95 * 1000.0 + 5.0 * 1200.0 + 5.05 * 900.0) / 3100.0;
    REQUIRE(feature.rt() == Approx(expected_rt));
    REQUIRE(feature.entry(1)->height == Approx(1200.0));
    REQUIRE(feature.maxHeight() == Approx(1200.0));
}

TEST_CASE("Alignment tolerances", "[aligner]") {
    SECTION("m/z outside tolerance") {
        auto table = alignSamples({
            makeSample(0, {makeRoi(100.0, 5.0, 1000.0)}),
            makeSample(1, {makeRoi(100.02, 5.0, 1000.0)}),
        });
        REQUIRE(table.size() == 2);
        REQUIRE(table[0].presentCount() == 1);
        REQUIRE(table[0].mz() < table[1].mz());
    }

    SECTION("rt outside tolerance") {
        auto table = alignSamples({
            makeSample(0, {makeRoi(100.0, 5.0, 1000.0)}),
            makeSample(1, {makeRoi(100.0, 5.5, 1000.0)}),
        });
        REQUIRE(table.size() == 2);
    }

    SECTION("Two ROIs of one sample never share a feature") {
        auto table = alignSamples({
            makeSample(0, {makeRoi(100.0, 5.0, 1000.0), makeRoi(100.0, 5.1, 1000.0)}),
        });
        REQUIRE(table.size() == 2);
    }

    SECTION("Null sample") {
        REQUIRE_THROWS_AS(alignSamples({makeSample(0, {}), nullptr}), std::invalid_argument);
    }
}

TEST_CASE("Alignment eviction", "[aligner]") {
    // Sample 0 holds X (rt 5.2) and Y (rt 5.0); Y is nearer to the cluster
    // seeded by P in sample 1 and takes the slot X first occupied
    Aligner aligner;
    auto table = aligner.align({
        makeSample(0, {makeRoi(100.000, 5.2, 1000.0), makeRoi(100.001, 5.0, 1000.0)}),
        makeSample(1, {makeRoi(100.000, 5.0, 10000.0)}),
    });

    REQUIRE(aligner.stats().evictions == 1);
    REQUIRE(table.size() == 2);

    auto shared = std::find_if(table.begin(), table.end(),
        [](const ConsensusFeature& f) { return f.presentCount() == 2; });
    REQUIRE(shared != table.end());
    REQUIRE(shared->entry(0)->roi_id == 1);
    REQUIRE(shared->entry(1)->roi_id == 0);
    REQUIRE(shared->rt() == Approx(5.0));

    auto alone = std::find_if(table.begin(), table.end(),
        [](const ConsensusFeature& f) { return f.presentCount() == 1; });
    REQUIRE(alone != table.end());
    REQUIRE(alone->entry(0)->roi_id == 0);
    REQUIRE(alone->rt() == Approx(5.2));
}

TEST_CASE("Alignment ties", "[aligner]") {
    SECTION("Equal distance keeps the more intense ROI") {
        Aligner aligner;
        auto table = aligner.align({
            makeSample(0, {makeRoi(100.0, 5.0, 500.0), makeRoi(100.0, 5.0, 2000.0)}),
            makeSample(1, {makeRoi(100.0, 5.0, 10000.0)}),
        });

        REQUIRE(aligner.stats().evictions == 0);
        REQUIRE(table.size() == 2);

        auto shared = std::find_if(table.begin(), table.end(),
            [](const ConsensusFeature& f) { return f.presentCount() == 2; });
        REQUIRE(shared != table.end());
        REQUIRE(shared->entry(0)->roi_id == 1);
        REQUIRE(shared->entry(1)->roi_id == 0);

        auto alone = std::find_if(table.begin(), table.end(),
            [](const ConsensusFeature& f) { return f.presentCount() == 1; });
        REQUIRE(alone != table.end());
        REQUIRE(alone->entry(0)->roi_id == 0);
        REQUIRE(alone->maxHeight() == Approx(500.0));
    }

    SECTION("Equidistant clusters go to the lower cluster id") {
        // The sample 1 ROI lies exactly between the two clusters in rt
        auto table = alignSamples({
            makeSample(0, {makeRoi(99.996, 4.75, 1000.0), makeRoi(99.996, 5.25, 1000.0)}),
            makeSample(1, {makeRoi(100.0, 5.0, 1000.0)}),
        });

        REQUIRE(table.size() == 2);
        auto shared = std::find_if(table.begin(), table.end(),
            [](const ConsensusFeature& f) { return f.presentCount() == 2; });
        REQUIRE(shared != table.end());
        REQUIRE(shared->entry(0)->roi_id == 0);
        REQUIRE(shared->entry(1)->roi_id == 0);
        REQUIRE(shared->rt() == Approx(4.875));
    }
}

TEST_CASE("Alignment does not depend on sample order", "[aligner]") {
    auto s0 = makeSample(0, {makeRoi(100.0, 5.0, 1000.0), makeRoi(150.0, 2.0, 3000.0),
                             makeRoi(100.004, 5.2, 800.0)});
    auto s1 = makeSample(1, {makeRoi(100.002, 5.1, 1500.0), makeRoi(150.003, 2.1, 2000.0)});
    auto s2 = makeSample(2, {makeRoi(99.998, 4.9, 900.0), makeRoi(300.0, 8.0, 5000.0)});

    auto forward = alignSamples({s0, s1, s2});
    auto backward = alignSamples({s2, s1, s0});

    REQUIRE(forward.size() == backward.size());
    REQUIRE(memberships(forward) == memberships(backward));
    for (std::size_t i = 0; i < forward.size(); ++i) {
        REQUIRE(forward[i].mz() == Approx(backward[i].mz()));
        REQUIRE(forward[i].rt() == Approx(backward[i].rt()));
    }
}

TEST_CASE("Alignment of jittered compounds", "[aligner]") {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> mz_jitter(-0.002, 0.002);
    std::uniform_real_distribution<double> rt_jitter(-0.05, 0.05);
    std::uniform_real_distribution<double> height(1000.0, 100000.0);

    const std::size_t compounds = 30;
    const std::size_t sample_count = 4;
    std::vector<FeatureTable::SamplePtr> samples;
    for (std::size_t s = 0; s < sample_count; ++s) {
        std::vector<Roi> rois;
        for (std::size_t k = 0; k < compounds; ++k) {
            MZ mz = 100.0 + 0.5 * static_cast<double>(k) + mz_jitter(rng);
            RetentionTime rt = 1.0 + 0.2 * static_cast<double>(k % 7) + rt_jitter(rng);
            rois.push_back(makeRoi(mz, rt, height(rng)));
        }
        samples.push_back(makeSample(static_cast<SampleId>(s), std::move(rois)));
    }

    AlignmentOptions options;
    Aligner aligner(options);
    auto table = aligner.align(samples);

    REQUIRE(table.size() == compounds);
    REQUIRE(aligner.stats().pooled == compounds * sample_count);

    std::set<std::pair<std::size_t, Index>> used;
    for (std::size_t f = 0; f < table.size(); ++f) {
        const auto& feature = table[f];
        REQUIRE(feature.id() == f);
        REQUIRE(feature.presentCount() == sample_count);
        if (f > 0) {
            REQUIRE(table[f - 1].mz() <= feature.mz());
        }
        for (std::size_t s = 0; s < sample_count; ++s) {
            const Roi* roi = table.roi(f, s);
            REQUIRE(roi != nullptr);
            REQUIRE(std::abs(roi->mzCenter() - feature.mz()) <= options.align_mz_tolerance);
            REQUIRE(std::abs(roi->rtApex() - feature.rt()) <= options.align_rt_tolerance);
            REQUIRE(used.emplace(s, roi->id()).second);
        }
    }
}

TEST_CASE("Alignment of short ROIs", "[aligner]") {
    auto long_sample = makeSample(0, {makeRoi(100.0, 5.0, 5000.0)});
    auto short_sample = makeSample(1, {makeRoi(100.001, 5.02, 3000.0, 3),
                                       makeRoi(200.0, 3.0, 3000.0, 3)});

    SECTION("Short ROIs join existing features but never seed them") {
        Aligner aligner;
        auto table = aligner.align({long_sample, short_sample});
        REQUIRE(table.size() == 1);
        REQUIRE(table[0].presentCount() == 2);
        REQUIRE(table[0].entry(1)->roi_id == 0);
        REQUIRE(aligner.stats().supporting == 1);
        REQUIRE(aligner.stats().unassigned == 1);
    }

    SECTION("Short ROIs with MS2 may seed features") {
        Roi roi = makeRoi(200.0, 3.0, 3000.0, 3);
        roi.setBestMs2(makeMs2(200.0, 1.0e5, 3.0, {80.0}));
        Aligner aligner;
        auto table = aligner.align({long_sample, makeSample(1, {std::move(roi)})});
        REQUIRE(table.size() == 2);
        REQUIRE(aligner.stats().unassigned == 0);
    }

    SECTION("Short ROIs seed features when not discarded") {
        AlignmentOptions options;
        options.discard_short_roi = false;
        Aligner aligner(options);
        auto table = aligner.align({long_sample, short_sample});
        REQUIRE(table.size() == 2);
        REQUIRE(table[0].presentCount() == 2);
        REQUIRE(table[1].presentCount() == 1);
        REQUIRE(table[1].mz() == Approx(200.0));
    }
}
