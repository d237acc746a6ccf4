#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "lcfeat/algorithms/trace_builder.hpp"
#include "lcfeat/errors.hpp"

using namespace lcfeat;
using namespace lcfeat::algorithms;
using Catch::Approx;

namespace {

Scan ms1(RetentionTime rt, std::vector<MZ> mz, std::vector<Intensity> intensity) {
    return Scan(rt, std::move(mz), std::move(intensity));
}

Scan ms2(RetentionTime rt, MZ precursor, std::vector<MZ> mz, std::vector<Intensity> intensity) {
    Scan scan(rt, std::move(mz), std::move(intensity), 2);
    scan.setPrecursor({precursor, 1.0e6});
    return scan;
}

} // namespace

TEST_CASE("Trace building from steady ions", "[trace_builder]") {
    ScanList run("steady");
    for (int i = 0; i < 5; ++i) {
        run.addScan(ms1(0.1 * (i + 1), {100.0, 200.0}, {5000.0, 8000.0}));
    }

    TraceBuilder builder;
    auto traces = builder.build(run);

    REQUIRE(traces.scan_count == 5);
    REQUIRE(traces.ms1_count == 5);
    REQUIRE(traces.rois.size() == 2);
    REQUIRE(traces.rois[0].length() == 5);
    REQUIRE(traces.rois[0].mzCenter() == Approx(100.0));
    REQUIRE(traces.rois[1].mzCenter() == Approx(200.0));
    REQUIRE(traces.rois[1].height() == Approx(8000.0));
    REQUIRE(traces.rois[0].closed());
}

TEST_CASE("Trace building centroid assignment", "[trace_builder]") {
    SECTION("Nearest centroid extends the trace") {
        ScanList run;
        run.addScan(ms1(0.1, {100.000}, {5000.0}));
        run.addScan(ms1(0.2, {99.995, 100.002}, {5000.0, 5000.0}));

        auto traces = buildTraces(run);
        REQUIRE(traces.rois.size() == 2);
        REQUIRE(traces.rois[0].length() == 2);
        REQUIRE(traces.rois[0].pointAt(1).mz == Approx(100.002));
        REQUIRE(traces.rois[1].length() == 1);
        REQUIRE(traces.rois[1].mzCenter() == Approx(99.995));
    }

    SECTION("A centroid that loses one trace extends another") {
        ScanList run;
        run.addScan(ms1(0.1, {100.000, 100.008}, {5000.0, 5000.0}));
        run.addScan(ms1(0.2, {100.001, 100.002}, {5000.0, 5000.0}));

        auto traces = buildTraces(run);
        REQUIRE(traces.rois.size() == 2);
        REQUIRE(traces.rois[0].length() == 2);
        REQUIRE(traces.rois[0].pointAt(1).mz == Approx(100.001));
        REQUIRE(traces.rois[1].length() == 2);
        REQUIRE(traces.rois[1].pointAt(0).mz == Approx(100.008));
        REQUIRE(traces.rois[1].pointAt(1).mz == Approx(100.002));
    }

    SECTION("Centroids outside the tolerance start new traces") {
        ScanList run;
        run.addScan(ms1(0.1, {100.000}, {5000.0}));
        run.addScan(ms1(0.2, {100.020}, {5000.0}));

        auto traces = buildTraces(run);
        REQUIRE(traces.rois.size() == 2);
    }

    SECTION("Centroids below the intensity threshold are ignored") {
        ScanList run;
        run.addScan(ms1(0.1, {100.0, 150.0}, {5000.0, 999.0}));
        run.addScan(ms1(0.2, {100.0, 150.0}, {5000.0, 999.0}));

        auto traces = buildTraces(run);
        REQUIRE(traces.rois.size() == 1);
        REQUIRE(traces.rois[0].mzCenter() == Approx(100.0));
    }
}

TEST_CASE("Trace building gaps", "[trace_builder]") {
    TraceBuilderOptions options;
    options.max_gap_scans = 2;

    SECTION("A trace survives max_gap_scans missing scans") {
        ScanList run;
        run.addScan(ms1(0.1, {150.0}, {5000.0}));
        run.addScan(ms1(0.2, {}, {}));
        run.addScan(ms1(0.3, {}, {}));
        run.addScan(ms1(0.4, {150.0}, {5000.0}));

        auto traces = buildTraces(run, options);
        REQUIRE(traces.rois.size() == 1);
        REQUIRE(traces.rois[0].length() == 2);
    }

    SECTION("A longer gap closes the trace") {
        ScanList run;
        run.addScan(ms1(0.1, {150.0}, {5000.0}));
        run.addScan(ms1(0.2, {150.0}, {5000.0}));
        run.addScan(ms1(0.3, {}, {}));
        run.addScan(ms1(0.4, {}, {}));
        run.addScan(ms1(0.5, {}, {}));
        run.addScan(ms1(0.6, {150.0}, {5000.0}));

        auto traces = buildTraces(run, options);
        REQUIRE(traces.rois.size() == 2);
        REQUIRE(traces.rois[0].length() == 2);
        REQUIRE(traces.rois[0].rtEnd() == Approx(0.2));
        REQUIRE(traces.rois[1].length() == 1);
        REQUIRE(traces.rois[1].rtStart() == Approx(0.6));
    }

    SECTION("MS2 scans do not count as gaps") {
        ScanList run;
        run.addScan(ms1(0.10, {150.0}, {5000.0}));
        run.addScan(ms2(0.11, 150.0, {80.0}, {5000.0}));
        run.addScan(ms2(0.12, 150.0, {80.0}, {5000.0}));
        run.addScan(ms2(0.13, 150.0, {80.0}, {5000.0}));
        run.addScan(ms1(0.20, {150.0}, {5000.0}));

        auto traces = buildTraces(run, options);
        REQUIRE(traces.rois.size() == 1);
        REQUIRE(traces.rois[0].length() == 2);
        REQUIRE(traces.ms2.size() == 3);
        REQUIRE(traces.ms1_count == 2);
    }
}

TEST_CASE("Trace building collects cleaned MS2 spectra", "[trace_builder]") {
    ScanList run;
    run.addScan(ms1(0.1, {300.0}, {5000.0}));
    run.addScan(ms2(0.15, 300.0, {100.0, 150.0, 299.5}, {50000.0, 200.0, 90000.0}));
    run.addScan(Scan(0.17, {90.0}, {5000.0}, 2));  // no precursor

    auto traces = buildTraces(run);
    REQUIRE(traces.ms2.size() == 1);

    const auto& spectrum = traces.ms2[0];
    REQUIRE(spectrum.scan_index == 1);
    REQUIRE(spectrum.precursor_mz == Approx(300.0));
    REQUIRE(spectrum.rt == Approx(0.15));
    REQUIRE(spectrum.size() == 1);
    REQUIRE(spectrum.mz[0] == Approx(100.0));
}

TEST_CASE("Trace building rejects malformed scans", "[trace_builder]") {
    SECTION("Retention time must increase") {
        ScanList run;
        run.addScan(ms1(0.1, {100.0}, {5000.0}));
        run.addScan(ms1(0.2, {100.0}, {5000.0}));
        run.addScan(ms1(0.2, {100.0}, {5000.0}));

        TraceBuilder builder;
        try {
            builder.build(run);
            FAIL("expected MalformedScanError");
        } catch (const MalformedScanError& e) {
            REQUIRE(e.scanIndex() == 2);
        }
    }

    SECTION("Centroids must be sorted") {
        ScanList run;
        run.addScan(ms1(0.1, {200.0, 100.0}, {5000.0, 5000.0}));

        TraceBuilder builder;
        REQUIRE_THROWS_AS(builder.build(run), MalformedScanError);
    }
}

TEST_CASE("Trace building progress and cancellation", "[trace_builder]") {
    ScanList run;
    for (int i = 0; i < 10; ++i) {
        run.addScan(ms1(0.1 * (i + 1), {100.0}, {5000.0}));
    }

    SECTION("Progress reports every scan") {
        std::size_t calls = 0;
        std::size_t last_total = 0;
        TraceBuilder builder;
        builder.build(run, [&](std::size_t, std::size_t total) {
            ++calls;
            last_total = total;
            return true;
        });
        REQUIRE(calls == 10);
        REQUIRE(last_total == 10);
    }

    SECTION("Returning false cancels") {
        TraceBuilder builder;
        REQUIRE_THROWS_AS(
            builder.build(run, [](std::size_t current, std::size_t) { return current < 3; }),
            CancelledError);
    }
}
