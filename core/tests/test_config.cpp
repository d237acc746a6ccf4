#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "lcfeat/config.hpp"
#include "lcfeat/errors.hpp"
#include "lcfeat/logging.hpp"
#include "lcfeat/io/config_reader.hpp"

using namespace lcfeat;
using namespace lcfeat::io;
using Catch::Approx;

TEST_CASE("Configuration validation", "[config]") {
    SECTION("Defaults are valid") {
        REQUIRE_NOTHROW(validate(PipelineConfig()));
    }

    SECTION("Non-positive tolerances") {
        TraceBuilderOptions builder;
        builder.mz_tolerance_ms1 = 0.0;
        REQUIRE_THROWS_AS(validate(builder), ConfigError);

        AlignmentOptions alignment;
        alignment.align_rt_tolerance = -0.1;
        REQUIRE_THROWS_AS(validate(alignment), ConfigError);
    }

    SECTION("Out-of-range values") {
        TraceRefinerOptions refiner;
        refiner.split_drop_ratio = 1.5;
        REQUIRE_THROWS_AS(validate(refiner), ConfigError);

        GroupingOptions grouping;
        grouping.min_co_occurrence = 2;
        REQUIRE_THROWS_AS(validate(grouping), ConfigError);

        AnnotationOptions annotation;
        annotation.annotation_top_k = 0;
        REQUIRE_THROWS_AS(validate(annotation), ConfigError);
    }

    SECTION("Error messages name the option") {
        AlignmentOptions alignment;
        alignment.align_mz_tolerance = 0.0;
        try {
            validate(alignment);
            FAIL("expected ConfigError");
        } catch (const ConfigError& e) {
            REQUIRE(std::string(e.what()).find("align_mz_tolerance") != std::string::npos);
        }
    }
}

TEST_CASE("Adduct tables", "[config]") {
    REQUIRE(baseAdductName(Polarity::POSITIVE) == "[M+H]+");
    REQUIRE(baseAdductName(Polarity::NEGATIVE) == "[M-H]-");
    REQUIRE(baseAdductName(Polarity::POSITIVE, 2) == "[M+2H]2+");
    REQUIRE(baseAdductName(Polarity::NEGATIVE, 2) == "[M-2H]2-");

    GroupingOptions grouping;
    REQUIRE(grouping.isotope_mz_increments.size() == 2);
    REQUIRE(grouping.isotope_mz_increments[1] == Approx(C13_MASS_DIFFERENCE / 2));

    auto positive = defaultAdductTable(Polarity::POSITIVE);
    REQUIRE(positive.at("[M+Na]+") == Approx(21.981945));
    REQUIRE(positive.at("[M+H-H2O]+") < 0.0);

    auto negative = defaultAdductTable(Polarity::NEGATIVE);
    REQUIRE(negative.count("[M+Cl]-") == 1);
}

TEST_CASE("Configuration files", "[config]") {
    SECTION("Attributes override defaults") {
        auto config = ConfigReader::parseString(R"(
            <lcfeat threads="4">
              <traceBuilder mzToleranceMs1="0.005" intensityThreshold="5000"
                            maxGapScans="3" ms2IntensityThreshold="200"/>
              <traceRefiner minPoints="7" cutLongTraces="false"/>
              <alignment alignRtTolerance="0.2" discardShortRoi="0"/>
              <grouping polarity="negative" pprThreshold="0.8">
                <isotopeIncrement value="1.003355"/>
                <isotopeIncrement value="0.5016775"/>
                <adduct name="[M+Cl]-" mass="35.976677"/>
              </grouping>
              <annotation annotationTopK="5" minSimilarity="0.6"/>
            </lcfeat>)");

        REQUIRE(config.threads == 4);
        REQUIRE(config.trace_builder.mz_tolerance_ms1 == Approx(0.005));
        REQUIRE(config.trace_builder.intensity_threshold == Approx(5000.0));
        REQUIRE(config.trace_builder.max_gap_scans == 3);
        REQUIRE(*config.trace_builder.ms2_intensity_threshold == Approx(200.0));
        REQUIRE(config.trace_refiner.min_points == 7);
        REQUIRE_FALSE(config.trace_refiner.cut_long_traces);
        REQUIRE(config.alignment.align_rt_tolerance == Approx(0.2));
        REQUIRE(config.alignment.align_mz_tolerance == Approx(0.01));
        REQUIRE_FALSE(config.alignment.discard_short_roi);
        REQUIRE(config.grouping.polarity == Polarity::NEGATIVE);
        REQUIRE(config.grouping.ppr_threshold == Approx(0.8));
        REQUIRE(config.grouping.isotope_mz_increments.size() == 2);
        REQUIRE(config.grouping.adduct_mass_table.size() == 1);
        REQUIRE(config.grouping.adduct_mass_table.at("[M+Cl]-") == Approx(35.976677));
        REQUIRE(config.annotation.annotation_top_k == 5);
        REQUIRE(config.annotation.min_similarity == Approx(0.6));
    }

    SECTION("Empty root keeps every default") {
        auto config = ConfigReader::parseString("<lcfeat/>");
        REQUIRE(config.threads == 0);
        REQUIRE(config.trace_builder.max_gap_scans == 2);
        REQUIRE_FALSE(config.trace_builder.ms2_intensity_threshold.has_value());
        REQUIRE(config.grouping.min_co_occurrence == 3);
    }

    SECTION("Unparsable numbers") {
        REQUIRE_THROWS_AS(ConfigReader::parseString(
            "<lcfeat><alignment alignMzTolerance=\"ten\"/></lcfeat>"), ConfigError);
        REQUIRE_THROWS_AS(ConfigReader::parseString(
            "<lcfeat><traceRefiner minPoints=\"5.5\"/></lcfeat>"), ConfigError);
        REQUIRE_THROWS_AS(ConfigReader::parseString(
            "<lcfeat><traceRefiner minPoints=\"-1\"/></lcfeat>"), ConfigError);
        REQUIRE_THROWS_AS(ConfigReader::parseString(
            "<lcfeat><traceBuilder maxGapScans=\"5000000000\"/></lcfeat>"), ConfigError);
        REQUIRE_THROWS_AS(ConfigReader::parseString(
            "<lcfeat><traceBuilder maxGapScans=\"-5000000000\"/></lcfeat>"), ConfigError);
    }

    SECTION("Invalid values fail validation") {
        REQUIRE_THROWS_AS(ConfigReader::parseString(
            "<lcfeat><grouping minCoOccurrence=\"1\"/></lcfeat>"), ConfigError);
        REQUIRE_THROWS_AS(ConfigReader::parseString(
            "<lcfeat><grouping polarity=\"both\"/></lcfeat>"), ConfigError);
    }

    SECTION("Malformed documents") {
        REQUIRE_THROWS_AS(ConfigReader::parseString("<lcfeat"), ConfigError);
        REQUIRE_THROWS_AS(ConfigReader::parseString("<settings/>"), ConfigError);
        REQUIRE_THROWS_AS(ConfigReader::read("/nonexistent/lcfeat.xml"), ConfigError);
    }
}

TEST_CASE("Log level names", "[config]") {
    REQUIRE(parseLogLevel("debug") == LogLevel::DEBUG);
    REQUIRE(parseLogLevel("warning") == LogLevel::WARNING);
    REQUIRE_THROWS_AS(parseLogLevel("verbose"), ConfigError);
}
