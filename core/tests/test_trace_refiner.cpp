#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "lcfeat/algorithms/trace_refiner.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using namespace lcfeat;
using namespace lcfeat::algorithms;
using namespace test_helpers;
using Catch::Approx;

namespace {

Roi traceFrom(MZ mz, const std::vector<Intensity>& intensity, RetentionTime rt0 = 1.0) {
    std::vector<RoiPoint> points;
    for (std::size_t i = 0; i < intensity.size(); ++i) {
        points.push_back({i, rt0 + 0.1 * static_cast<double>(i), mz, intensity[i]});
    }
    Roi roi = Roi::fromPoints(points);
    roi.close();
    return roi;
}

} // namespace

TEST_CASE("Trace splitting", "[trace_refiner]") {
    TraceRefiner refiner;

    SECTION("Two apexes with a deep valley") {
        std::vector<Intensity> intensity = {1000, 5000, 10000, 5000, 1000,
                                            5000, 10000, 5000, 1000};
        auto ranges = refiner.findSplitRanges(intensity);
        REQUIRE(ranges.size() == 2);
        REQUIRE(ranges[0].first == 0);
        REQUIRE(ranges[0].second == 3);
        REQUIRE(ranges[1].first == 4);
        REQUIRE(ranges[1].second == 8);
    }

    SECTION("Shallow valley is not cut") {
        std::vector<Intensity> intensity = {1000, 5000, 10000, 8000, 9000, 1000};
        auto ranges = refiner.findSplitRanges(intensity);
        REQUIRE(ranges.size() == 1);
        REQUIRE(ranges[0].first == 0);
        REQUIRE(ranges[0].second == 5);
    }

    SECTION("Pieces cover every point once") {
        Roi roi = traceFrom(150.0, {1000, 5000, 10000, 5000, 1000, 5000, 10000, 5000, 1000});
        auto pieces = refiner.split(roi);
        REQUIRE(pieces.size() == 2);
        REQUIRE(pieces[0].length() + pieces[1].length() == roi.length());
        REQUIRE(pieces[0].lastScan() < pieces[1].firstScan());
        REQUIRE(pieces[0].closed());
    }

    SECTION("Single apex stays whole") {
        Roi roi = traceFrom(150.0, {1000, 5000, 10000, 5000, 1000});
        auto pieces = refiner.split(roi);
        REQUIRE(pieces.size() == 1);
        REQUIRE(pieces[0].length() == 5);
    }
}

TEST_CASE("Trace refinement", "[trace_refiner]") {
    TraceRefinerOptions options;
    options.min_points = 3;

    SECTION("Multi-apex trace becomes two ROIs") {
        TraceSet traces;
        traces.rois.push_back(traceFrom(150.0, {1000, 5000, 10000, 5000, 1000,
                                                5000, 10000, 5000, 1000}));
        traces.scan_count = 9;

        TraceRefiner refiner(options);
        auto set = refiner.refine(std::move(traces), 2, "split");
        REQUIRE(set.size() == 2);
        REQUIRE(set.sampleId() == 2);
        REQUIRE(set.sampleName() == "split");
        REQUIRE(set.scanCount() == 9);
        REQUIRE(refiner.stats().split == 2);
        REQUIRE(set[0].id() == 0);
        REQUIRE(set[1].id() == 1);
    }

    SECTION("Empty traces are counted and dropped") {
        TraceSet traces;
        traces.rois.push_back(Roi());
        traces.rois.push_back(traceFrom(150.0, {1000, 5000, 1000}));

        TraceRefiner refiner(options);
        auto set = refiner.refine(std::move(traces), 0, "empty");
        REQUIRE(set.size() == 1);
        REQUIRE(set.droppedEmpty() == 1);
        REQUIRE(refiner.stats().dropped_empty == 1);
    }

    SECTION("Short traces are dropped unless they carry MS2") {
        TraceSet traces;
        traces.rois.push_back(traceFrom(100.0, {1000, 5000}));
        traces.rois.push_back(traceFrom(200.0, {1000, 5000}));
        traces.ms2.push_back(makeMs2(200.0, 1.0e5, 1.05, {80.0}));

        TraceRefiner refiner(options);
        auto set = refiner.refine(std::move(traces), 0, "short");
        REQUIRE(set.size() == 1);
        REQUIRE(set[0].mzCenter() == Approx(200.0));
        REQUIRE(set[0].hasMs2());
        REQUIRE(refiner.stats().discarded_short == 1);
        REQUIRE(refiner.stats().with_ms2 == 1);
    }

    SECTION("Output is sorted by m/z") {
        TraceSet traces;
        traces.rois.push_back(traceFrom(300.0, {1000, 5000, 1000}));
        traces.rois.push_back(traceFrom(100.0, {1000, 5000, 1000}));
        traces.rois.push_back(traceFrom(200.0, {1000, 5000, 1000}));

        auto set = TraceRefiner(options).refine(std::move(traces), 0, "sorted");
        REQUIRE(set.size() == 3);
        REQUIRE(set[0].mzCenter() < set[1].mzCenter());
        REQUIRE(set[1].mzCenter() < set[2].mzCenter());
    }
}

TEST_CASE("MS2 attachment", "[trace_refiner]") {
    TraceRefiner refiner;
    std::vector<Roi> rois = {traceFrom(200.0, {1000, 5000, 10000, 5000, 1000})};

    SECTION("The spectrum with the largest total intensity wins") {
        auto weak = makeMs2(200.005, 1.0e5, 1.2, {80.0});
        auto strong = makeMs2(200.004, 1.0e5, 1.3, {80.0, 90.0, 110.0});
        refiner.attachMs2(rois, {weak, strong});
        REQUIRE(rois[0].hasMs2());
        REQUIRE(rois[0].bestMs2()->size() == 3);
        REQUIRE(rois[0].bestMs2()->rt == Approx(1.3));
    }

    SECTION("Spectra outside the trace rt span are ignored") {
        refiner.attachMs2(rois, {makeMs2(200.0, 1.0e5, 1.5, {80.0})});
        REQUIRE_FALSE(rois[0].hasMs2());
    }

    SECTION("Spectra outside the precursor tolerance are ignored") {
        refiner.attachMs2(rois, {makeMs2(200.02, 1.0e5, 1.2, {80.0})});
        REQUIRE_FALSE(rois[0].hasMs2());
    }
}

TEST_CASE("Peak quality scoring", "[trace_refiner]") {
    TraceRefinerOptions options;
    options.profile_length = 8;
    options.scorer_batch_size = 2;

    std::vector<Roi> rois;
    for (int i = 0; i < 5; ++i) {
        rois.push_back(traceFrom(100.0 + i, {1000, 5000, 10000, 5000, 1000}));
    }

    SECTION("Scores every trace in batches") {
        std::size_t calls = 0;
        TraceRefiner refiner(options, [&](const std::vector<std::vector<double>>& profiles) {
            ++calls;
            for (const auto& p : profiles) {
                REQUIRE(p.size() == 8);
            }
            return std::vector<double>(profiles.size(), 0.9);
        });
        REQUIRE(refiner.score(rois) == 5);
        REQUIRE(calls == 3);
        for (const auto& roi : rois) {
            REQUIRE(roi.quality().has_value());
            REQUIRE(*roi.quality() == Approx(0.9));
        }
    }

    SECTION("Wrong result size leaves traces unscored") {
        TraceRefiner refiner(options, [](const std::vector<std::vector<double>>&) {
            return std::vector<double>{0.5};
        });
        REQUIRE(refiner.score(rois) == 0);
        for (const auto& roi : rois) {
            REQUIRE_FALSE(roi.quality().has_value());
        }
    }

    SECTION("Out-of-range probability is rejected") {
        TraceRefiner refiner(options, [](const std::vector<std::vector<double>>& profiles) {
            return std::vector<double>(profiles.size(), 1.5);
        });
        REQUIRE(refiner.score(rois) == 0);
    }

    SECTION("Throwing scorer does not fail refinement") {
        TraceRefiner refiner(options, [](const std::vector<std::vector<double>>&)
                                          -> std::vector<double> {
            throw std::runtime_error("model not loaded");
        });
        TraceSet traces;
        traces.rois = rois;
        auto set = refiner.refine(std::move(traces), 0, "unscored");
        REQUIRE(set.size() == 5);
        REQUIRE(refiner.stats().scored == 0);
        REQUIRE_FALSE(set[0].quality().has_value());
    }

    SECTION("No scorer leaves traces unscored") {
        TraceRefiner refiner(options);
        REQUIRE(refiner.score(rois) == 0);
    }
}
