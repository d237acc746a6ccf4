#include "lcfeat/config.hpp"
#include "lcfeat/errors.hpp"

namespace lcfeat {

namespace {

void requirePositive(double value, const char* name) {
    if (!(value > 0.0)) {
        throw ConfigError(std::string(name) + " must be positive, got " +
                          std::to_string(value));
    }
}

void requireFraction(double value, const char* name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigError(std::string(name) + " must lie in [0, 1], got " +
                          std::to_string(value));
    }
}

} // namespace

std::string baseAdductName(Polarity polarity, ChargeState charge) {
    if (charge == 2) {
        return polarity == Polarity::NEGATIVE ? "[M-2H]2-" : "[M+2H]2+";
    }
    return polarity == Polarity::NEGATIVE ? "[M-H]-" : "[M+H]+";
}

std::map<std::string, double> defaultAdductTable(Polarity polarity) {
    if (polarity == Polarity::NEGATIVE) {
        return {
            {"[M-H-H2O]-", -18.010564},
            {"[M+Cl]-", 35.976677},
            {"[M+CH3COO]-", 60.021129},
            {"[M+HCOO]-", 46.005479},
        };
    }
    return {
        {"[M+H-H2O]+", -18.010565},
        {"[M+Na]+", 21.981945},
        {"[M+K]+", 37.955882},
        {"[M+NH4]+", 17.02655},
    };
}

void validate(const TraceBuilderOptions& options) {
    requirePositive(options.mz_tolerance_ms1, "mz_tolerance_ms1");
    if (options.intensity_threshold < 0.0) {
        throw ConfigError("intensity_threshold must not be negative");
    }
    if (options.max_gap_scans < 0) {
        throw ConfigError("max_gap_scans must not be negative");
    }
    if (options.ms2_intensity_threshold && *options.ms2_intensity_threshold < 0.0) {
        throw ConfigError("ms2_intensity_threshold must not be negative");
    }
}

void validate(const TraceRefinerOptions& options) {
    if (options.min_points == 0) {
        throw ConfigError("min_points must be at least 1");
    }
    requireFraction(options.split_drop_ratio, "split_drop_ratio");
    requirePositive(options.mz_tolerance_ms2, "mz_tolerance_ms2");
    if (options.profile_length < 2) {
        throw ConfigError("profile_length must be at least 2");
    }
    if (options.scorer_batch_size == 0) {
        throw ConfigError("scorer_batch_size must be at least 1");
    }
}

void validate(const AlignmentOptions& options) {
    requirePositive(options.align_mz_tolerance, "align_mz_tolerance");
    requirePositive(options.align_rt_tolerance, "align_rt_tolerance");
}

void validate(const GroupingOptions& options) {
    if (!(options.ppr_threshold >= -1.0 && options.ppr_threshold <= 1.0)) {
        throw ConfigError("ppr_threshold must lie in [-1, 1]");
    }
    if (options.min_co_occurrence < 3) {
        throw ConfigError("min_co_occurrence must be at least 3");
    }
    requirePositive(options.group_rt_tolerance, "group_rt_tolerance");
    requirePositive(options.isotope_mz_tolerance, "isotope_mz_tolerance");
    requirePositive(options.adduct_mz_tolerance, "adduct_mz_tolerance");
    requirePositive(options.mz_tolerance_ms2, "mz_tolerance_ms2");
    requirePositive(options.isf_rt_tolerance, "isf_rt_tolerance");
    for (double increment : options.isotope_mz_increments) {
        requirePositive(increment, "isotope_mz_increments");
    }
    if (options.max_isotope_rank < 1) {
        throw ConfigError("max_isotope_rank must be at least 1");
    }
    requirePositive(options.max_isotope_ratio, "max_isotope_ratio");
}

void validate(const AnnotationOptions& options) {
    if (options.annotation_top_k == 0) {
        throw ConfigError("annotation_top_k must be at least 1");
    }
    requireFraction(options.min_similarity, "min_similarity");
    if (options.scorer_batch_size == 0) {
        throw ConfigError("scorer_batch_size must be at least 1");
    }
}

void validate(const PipelineConfig& config) {
    validate(config.trace_builder);
    validate(config.trace_refiner);
    validate(config.alignment);
    validate(config.grouping);
    validate(config.annotation);
    if (config.threads < 0) {
        throw ConfigError("threads must not be negative");
    }
}

} // namespace lcfeat
