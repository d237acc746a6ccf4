#include "lcfeat/io/config_reader.hpp"
#include "lcfeat/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

#include <pugixml.hpp>

namespace lcfeat {
namespace io {

namespace {

std::string where(const pugi::xml_node& node, const char* name) {
    return std::string(node.name()) + "/@" + name;
}

double parseDouble(const pugi::xml_node& node, const char* name, const char* text) {
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE) {
        throw ConfigError(where(node, name) + ": '" + text + "' is not a number");
    }
    return value;
}

long long parseInteger(const pugi::xml_node& node, const char* name, const char* text) {
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) {
        throw ConfigError(where(node, name) + ": '" + text + "' is not an integer");
    }
    return value;
}

void readDouble(const pugi::xml_node& node, const char* name, double& out) {
    if (auto attr = node.attribute(name)) {
        out = parseDouble(node, name, attr.value());
    }
}

void readInt(const pugi::xml_node& node, const char* name, int& out) {
    if (auto attr = node.attribute(name)) {
        long long value = parseInteger(node, name, attr.value());
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            throw ConfigError(where(node, name) + ": " + attr.value() + " is out of range");
        }
        out = static_cast<int>(value);
    }
}

void readSize(const pugi::xml_node& node, const char* name, std::size_t& out) {
    if (auto attr = node.attribute(name)) {
        long long value = parseInteger(node, name, attr.value());
        if (value < 0) {
            throw ConfigError(where(node, name) + " must not be negative");
        }
        out = static_cast<std::size_t>(value);
    }
}

void readBool(const pugi::xml_node& node, const char* name, bool& out) {
    if (auto attr = node.attribute(name)) {
        std::string text = attr.value();
        if (text == "true" || text == "1") {
            out = true;
        } else if (text == "false" || text == "0") {
            out = false;
        } else {
            throw ConfigError(where(node, name) + ": '" + text + "' is not a boolean");
        }
    }
}

void readTraceBuilder(const pugi::xml_node& node, TraceBuilderOptions& opt) {
    readDouble(node, "mzToleranceMs1", opt.mz_tolerance_ms1);
    readDouble(node, "intensityThreshold", opt.intensity_threshold);
    readInt(node, "maxGapScans", opt.max_gap_scans);
    if (auto attr = node.attribute("ms2IntensityThreshold")) {
        opt.ms2_intensity_threshold = parseDouble(node, "ms2IntensityThreshold", attr.value());
    }
    readDouble(node, "ms2PrecursorOffset", opt.ms2_precursor_offset);
}

void readTraceRefiner(const pugi::xml_node& node, TraceRefinerOptions& opt) {
    readSize(node, "minPoints", opt.min_points);
    readBool(node, "cutLongTraces", opt.cut_long_traces);
    readDouble(node, "splitDropRatio", opt.split_drop_ratio);
    readDouble(node, "mzToleranceMs2", opt.mz_tolerance_ms2);
    readSize(node, "profileLength", opt.profile_length);
    readSize(node, "scorerBatchSize", opt.scorer_batch_size);
}

void readAlignment(const pugi::xml_node& node, AlignmentOptions& opt) {
    readDouble(node, "alignMzTolerance", opt.align_mz_tolerance);
    readDouble(node, "alignRtTolerance", opt.align_rt_tolerance);
    readBool(node, "discardShortRoi", opt.discard_short_roi);
    readSize(node, "shortRoiLength", opt.short_roi_length);
}

void readGrouping(const pugi::xml_node& node, GroupingOptions& opt) {
    readDouble(node, "pprThreshold", opt.ppr_threshold);
    readSize(node, "minCoOccurrence", opt.min_co_occurrence);
    readDouble(node, "groupRtTolerance", opt.group_rt_tolerance);
    readDouble(node, "isotopeMzTolerance", opt.isotope_mz_tolerance);
    readInt(node, "maxIsotopeRank", opt.max_isotope_rank);
    readDouble(node, "maxIsotopeRatio", opt.max_isotope_ratio);
    readDouble(node, "adductMzTolerance", opt.adduct_mz_tolerance);
    readBool(node, "includeMultimers", opt.include_multimers);
    readDouble(node, "mzToleranceMs2", opt.mz_tolerance_ms2);
    readDouble(node, "isfRtTolerance", opt.isf_rt_tolerance);

    if (auto attr = node.attribute("polarity")) {
        std::string text = attr.value();
        if (text == "positive") {
            opt.polarity = Polarity::POSITIVE;
        } else if (text == "negative") {
            opt.polarity = Polarity::NEGATIVE;
        } else {
            throw ConfigError(where(node, "polarity") + ": '" + text +
                              "' is not 'positive' or 'negative'");
        }
    }

    if (node.child("isotopeIncrement")) {
        opt.isotope_mz_increments.clear();
        for (auto inc : node.children("isotopeIncrement")) {
            opt.isotope_mz_increments.push_back(
                parseDouble(inc, "value", inc.attribute("value").value()));
        }
    }

    for (auto adduct : node.children("adduct")) {
        std::string name = adduct.attribute("name").value();
        if (name.empty()) {
            throw ConfigError("grouping/adduct needs a name");
        }
        opt.adduct_mass_table[name] = parseDouble(adduct, "mass", adduct.attribute("mass").value());
    }
}

void readAnnotation(const pugi::xml_node& node, AnnotationOptions& opt) {
    readSize(node, "annotationTopK", opt.annotation_top_k);
    readDouble(node, "minSimilarity", opt.min_similarity);
    readSize(node, "scorerBatchSize", opt.scorer_batch_size);
}

PipelineConfig fromDocument(const pugi::xml_document& doc) {
    auto root = doc.child("lcfeat");
    if (!root) {
        throw ConfigError("no lcfeat element found");
    }

    PipelineConfig config;
    readInt(root, "threads", config.threads);
    readTraceBuilder(root.child("traceBuilder"), config.trace_builder);
    readTraceRefiner(root.child("traceRefiner"), config.trace_refiner);
    readAlignment(root.child("alignment"), config.alignment);
    readGrouping(root.child("grouping"), config.grouping);
    readAnnotation(root.child("annotation"), config.annotation);

    validate(config);
    return config;
}

} // namespace

PipelineConfig ConfigReader::parseString(const std::string& content) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(content.c_str());
    if (!result) {
        throw ConfigError("failed to parse content: " + std::string(result.description()));
    }
    return fromDocument(doc);
}

PipelineConfig ConfigReader::read(const std::string& filename) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(filename.c_str());
    if (!result) {
        throw ConfigError("failed to parse file " + filename + ": " +
                          std::string(result.description()));
    }
    return fromDocument(doc);
}

} // namespace io
} // namespace lcfeat
