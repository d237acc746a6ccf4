#include "lcfeat/io/feature_record.hpp"
#include "lcfeat/io/binary_array.hpp"
#include "lcfeat/errors.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <pugixml.hpp>

namespace lcfeat {
namespace io {

namespace {

constexpr const char* FORMAT_VERSION = "1";

// ============================================================================
// Writing
// ============================================================================

void appendArray(pugi::xml_node parent, const char* name, const std::vector<double>& values) {
    auto array = parent.append_child("binaryArray");
    array.append_attribute("name") = name;
    array.append_attribute("count") = static_cast<unsigned long long>(values.size());
    array.append_attribute("compression") = "zlib";
    array.text().set(encodeArray(values).c_str());
}

void appendMs2(pugi::xml_node parent, const Ms2Spectrum& ms2) {
    auto node = parent.append_child("ms2");
    node.append_attribute("precursorMz") = ms2.precursor_mz;
    node.append_attribute("precursorIntensity") = ms2.precursor_intensity;
    node.append_attribute("rt") = ms2.rt;
    node.append_attribute("scanIndex") = static_cast<unsigned long long>(ms2.scan_index);
    appendArray(node, "mz", ms2.mz);
    appendArray(node, "intensity", ms2.intensity);
}

void appendRoi(pugi::xml_node parent, const Roi& roi) {
    auto node = parent.append_child("roi");
    node.append_attribute("id") = static_cast<unsigned long long>(roi.id());
    node.append_attribute("mzCenter") = roi.mzCenter();
    node.append_attribute("rtApex") = roi.rtApex();
    node.append_attribute("height") = roi.height();
    node.append_attribute("area") = roi.area();
    if (roi.quality()) {
        node.append_attribute("quality") = *roi.quality();
    }

    std::vector<double> scan_index, rt, mz, intensity;
    scan_index.reserve(roi.length());
    for (const auto& p : roi.points()) {
        scan_index.push_back(static_cast<double>(p.scan_index));
        rt.push_back(p.rt);
        mz.push_back(p.mz);
        intensity.push_back(p.intensity);
    }

    auto points = node.append_child("points");
    points.append_attribute("count") = static_cast<unsigned long long>(roi.length());
    appendArray(points, "scanIndex", scan_index);
    appendArray(points, "rt", rt);
    appendArray(points, "mz", mz);
    appendArray(points, "intensity", intensity);

    if (roi.hasMs2()) {
        appendMs2(node, *roi.bestMs2());
    }
}

void appendGroupLabel(pugi::xml_node parent, const GroupLabel& label) {
    auto node = parent.append_child("group");
    node.append_attribute("id") = static_cast<unsigned long long>(label.group_id);
    node.append_attribute("role") = toString(label.role).c_str();
    node.append_attribute("representative") = label.representative;
    if (label.role == FeatureRole::ISOTOPE || label.isotope_rank > 0) {
        node.append_attribute("isotopeRank") = label.isotope_rank;
    }
    if (label.charge != 0) {
        node.append_attribute("charge") = static_cast<int>(label.charge);
    }
    if (!label.adduct.empty()) {
        node.append_attribute("adduct") = label.adduct.c_str();
    }
    if (label.parent) {
        node.append_attribute("parent") = static_cast<unsigned long long>(*label.parent);
    }
}

std::string saveToString(const pugi::xml_document& doc) {
    std::ostringstream out;
    doc.save(out, "  ");
    return out.str();
}

void saveToFile(const pugi::xml_document& doc, const std::string& filename) {
    if (!doc.save_file(filename.c_str(), "  ")) {
        throw RecordError("failed to write file: " + filename);
    }
}

void buildSampleDocument(pugi::xml_document& doc, const SampleFeatureSet& sample) {
    auto root = doc.append_child("sampleFeatureSet");
    root.append_attribute("version") = FORMAT_VERSION;
    root.append_attribute("sampleId") = static_cast<unsigned int>(sample.sampleId());
    root.append_attribute("name") = sample.sampleName().c_str();
    root.append_attribute("scanCount") = static_cast<unsigned long long>(sample.scanCount());
    root.append_attribute("droppedEmpty") =
        static_cast<unsigned long long>(sample.droppedEmpty());
    root.append_attribute("count") = static_cast<unsigned long long>(sample.size());

    for (const auto& [key, value] : sample.metadata()) {
        auto meta = root.append_child("meta");
        meta.append_attribute("key") = key.c_str();
        meta.append_attribute("value") = value.c_str();
    }
    for (const Roi& roi : sample) {
        appendRoi(root, roi);
    }
}

void buildTableDocument(pugi::xml_document& doc, const FeatureTable& table) {
    auto root = doc.append_child("featureTable");
    root.append_attribute("version") = FORMAT_VERSION;
    root.append_attribute("sampleCount") = static_cast<unsigned long long>(table.sampleCount());
    root.append_attribute("count") = static_cast<unsigned long long>(table.size());

    for (std::size_t s = 0; s < table.sampleCount(); ++s) {
        auto node = root.append_child("sample");
        node.append_attribute("slot") = static_cast<unsigned long long>(s);
        node.append_attribute("sampleId") = static_cast<unsigned int>(table.sample(s).sampleId());
        node.append_attribute("name") = table.sample(s).sampleName().c_str();
    }

    for (const auto& feature : table) {
        auto node = root.append_child("feature");
        node.append_attribute("id") = static_cast<unsigned long long>(feature.id());
        node.append_attribute("mz") = feature.mz();
        node.append_attribute("rt") = feature.rt();

        for (std::size_t s = 0; s < feature.sampleCount(); ++s) {
            const auto& e = feature.entry(s);
            if (!e) continue;
            auto entry = node.append_child("entry");
            entry.append_attribute("slot") = static_cast<unsigned long long>(s);
            entry.append_attribute("roiId") = static_cast<unsigned long long>(e->roi_id);
            entry.append_attribute("height") = e->height;
            entry.append_attribute("area") = e->area;
        }

        if (feature.group()) {
            appendGroupLabel(node, *feature.group());
        }

        for (const auto& a : feature.annotations()) {
            auto ann = node.append_child("annotation");
            ann.append_attribute("libraryId") = a.library_id.c_str();
            ann.append_attribute("name") = a.name.c_str();
            ann.append_attribute("formula") = a.formula.c_str();
            ann.append_attribute("similarity") = a.similarity;
            ann.append_attribute("matchedPeaks") = static_cast<unsigned long long>(a.matched_peaks);
        }
    }

    for (const auto& g : table.groups()) {
        auto node = root.append_child("relationshipGroup");
        node.append_attribute("id") = static_cast<unsigned long long>(g.id);
        node.append_attribute("representative") =
            static_cast<unsigned long long>(g.representative);
        for (Index m : g.members) {
            node.append_child("member").append_attribute("feature") =
                static_cast<unsigned long long>(m);
        }
    }
}

// ============================================================================
// Reading
// ============================================================================

pugi::xml_attribute requireAttribute(const pugi::xml_node& node, const char* name) {
    auto attr = node.attribute(name);
    if (!attr) {
        throw RecordError(std::string("<") + node.name() + "> is missing attribute '" +
                          name + "'");
    }
    return attr;
}

std::vector<double> readArray(const pugi::xml_node& parent, const char* name,
                              std::size_t expected) {
    auto array = parent.find_child_by_attribute("binaryArray", "name", name);
    if (!array) {
        throw RecordError(std::string("<") + parent.name() + "> has no '" + name + "' array");
    }
    auto values = decodeArray(array.text().get());
    if (values.size() != expected) {
        throw RecordError(std::string("array '") + name + "' holds " +
                          std::to_string(values.size()) + " values, expected " +
                          std::to_string(expected));
    }
    return values;
}

Ms2Spectrum readMs2(const pugi::xml_node& node) {
    Ms2Spectrum ms2;
    ms2.precursor_mz = requireAttribute(node, "precursorMz").as_double();
    ms2.precursor_intensity = node.attribute("precursorIntensity").as_double();
    ms2.rt = requireAttribute(node, "rt").as_double();
    ms2.scan_index = static_cast<Index>(node.attribute("scanIndex").as_ullong());

    auto mz_node = node.find_child_by_attribute("binaryArray", "name", "mz");
    if (!mz_node) throw RecordError("<ms2> has no 'mz' array");
    ms2.mz = decodeArray(mz_node.text().get());
    ms2.intensity = readArray(node, "intensity", ms2.mz.size());
    return ms2;
}

Roi readRoi(const pugi::xml_node& node) {
    auto points = node.child("points");
    if (!points) {
        throw RecordError("<roi> has no <points>");
    }
    const auto count = static_cast<std::size_t>(requireAttribute(points, "count").as_ullong());
    if (count == 0) {
        throw RecordError("<roi> has no points");
    }

    auto scan_index = readArray(points, "scanIndex", count);
    auto rt = readArray(points, "rt", count);
    auto mz = readArray(points, "mz", count);
    auto intensity = readArray(points, "intensity", count);

    std::vector<RoiPoint> pts(count);
    for (std::size_t i = 0; i < count; ++i) {
        const double index = scan_index[i];
        if (!std::isfinite(index) || index < 0.0 || std::floor(index) != index ||
            index >= static_cast<double>(std::numeric_limits<Index>::max())) {
            throw RecordError("invalid scan index " + std::to_string(index) + " in <roi>");
        }
        pts[i] = {static_cast<Index>(index), rt[i], mz[i], intensity[i]};
    }

    Roi roi;
    try {
        roi = Roi::fromPoints(pts);
    } catch (const std::invalid_argument& e) {
        throw RecordError(e.what());
    }
    roi.close();

    if (auto quality = node.attribute("quality")) {
        roi.setQuality(quality.as_double());
    }
    if (auto ms2 = node.child("ms2")) {
        roi.setBestMs2(readMs2(ms2));
    }
    return roi;
}

FeatureRole parseRole(const std::string& name) {
    for (auto role : {FeatureRole::SINGLETON, FeatureRole::MONOISOTOPIC, FeatureRole::ISOTOPE,
                      FeatureRole::ADDUCT, FeatureRole::IN_SOURCE_FRAGMENT}) {
        if (toString(role) == name) return role;
    }
    throw RecordError("unknown feature role '" + name + "'");
}

GroupLabel readGroupLabel(const pugi::xml_node& node) {
    GroupLabel label;
    label.group_id = static_cast<Index>(requireAttribute(node, "id").as_ullong());
    label.role = parseRole(requireAttribute(node, "role").value());
    label.representative = node.attribute("representative").as_bool();
    label.isotope_rank = node.attribute("isotopeRank").as_int();
    label.charge = static_cast<ChargeState>(node.attribute("charge").as_int());
    label.adduct = node.attribute("adduct").value();
    if (auto parent = node.attribute("parent")) {
        label.parent = static_cast<Index>(parent.as_ullong());
    }
    return label;
}

void loadString(pugi::xml_document& doc, const std::string& content) {
    pugi::xml_parse_result result = doc.load_string(content.c_str());
    if (!result) {
        throw RecordError("failed to parse content: " + std::string(result.description()));
    }
}

void loadFile(pugi::xml_document& doc, const std::string& filename) {
    pugi::xml_parse_result result = doc.load_file(filename.c_str());
    if (!result) {
        throw RecordError("failed to parse file " + filename + ": " +
                          std::string(result.description()));
    }
}

SampleFeatureSet sampleFromDocument(const pugi::xml_document& doc) {
    auto root = doc.child("sampleFeatureSet");
    if (!root) {
        throw RecordError("no sampleFeatureSet element found");
    }

    SampleFeatureSet sample(static_cast<SampleId>(requireAttribute(root, "sampleId").as_uint()),
                            root.attribute("name").value());
    sample.setScanCount(static_cast<std::size_t>(root.attribute("scanCount").as_ullong()));
    sample.setDroppedEmpty(static_cast<std::size_t>(root.attribute("droppedEmpty").as_ullong()));

    for (auto meta : root.children("meta")) {
        sample.metadata()[requireAttribute(meta, "key").value()] = meta.attribute("value").value();
    }

    for (auto node : root.children("roi")) {
        const auto id = static_cast<Index>(requireAttribute(node, "id").as_ullong());
        if (id != sample.size()) {
            throw RecordError("ROI id " + std::to_string(id) + " out of order");
        }
        sample.add(readRoi(node));
    }
    return sample;
}

FeatureTable tableFromDocument(const pugi::xml_document& doc,
                               std::vector<FeatureTable::SamplePtr> samples) {
    auto root = doc.child("featureTable");
    if (!root) {
        throw RecordError("no featureTable element found");
    }

    const auto sample_count =
        static_cast<std::size_t>(requireAttribute(root, "sampleCount").as_ullong());
    if (sample_count != samples.size()) {
        throw RecordError("table refers to " + std::to_string(sample_count) +
                          " samples, " + std::to_string(samples.size()) + " given");
    }
    for (const auto& s : samples) {
        if (!s) throw RecordError("null sample feature set");
    }
    for (auto node : root.children("sample")) {
        const auto slot = static_cast<std::size_t>(requireAttribute(node, "slot").as_ullong());
        if (slot >= samples.size() ||
            samples[slot]->sampleId() != requireAttribute(node, "sampleId").as_uint()) {
            throw RecordError("sample slot " + std::to_string(slot) +
                              " does not match the given samples");
        }
    }

    FeatureTable table(std::move(samples));
    for (auto node : root.children("feature")) {
        const auto id = static_cast<Index>(requireAttribute(node, "id").as_ullong());
        if (id != table.size()) {
            throw RecordError("feature id " + std::to_string(id) + " out of order");
        }

        ConsensusFeature feature(requireAttribute(node, "mz").as_double(),
                                 requireAttribute(node, "rt").as_double(), sample_count);
        for (auto entry : node.children("entry")) {
            const auto slot =
                static_cast<std::size_t>(requireAttribute(entry, "slot").as_ullong());
            const auto roi_id = static_cast<Index>(requireAttribute(entry, "roiId").as_ullong());
            if (slot >= sample_count || roi_id >= table.sample(slot).size()) {
                throw RecordError("feature " + std::to_string(id) +
                                  " refers to a missing ROI");
            }
            feature.setEntry(slot, {roi_id, entry.attribute("height").as_double(),
                                    entry.attribute("area").as_double()});
        }

        if (auto group = node.child("group")) {
            feature.setGroup(readGroupLabel(group));
        }

        std::vector<Annotation> annotations;
        for (auto ann : node.children("annotation")) {
            Annotation a;
            a.library_id = requireAttribute(ann, "libraryId").value();
            a.name = ann.attribute("name").value();
            a.formula = ann.attribute("formula").value();
            a.similarity = requireAttribute(ann, "similarity").as_double();
            a.matched_peaks = static_cast<std::size_t>(ann.attribute("matchedPeaks").as_ullong());
            annotations.push_back(std::move(a));
        }
        feature.setAnnotations(std::move(annotations));

        table.add(std::move(feature));
    }

    std::vector<RelationshipGroup> groups;
    for (auto node : root.children("relationshipGroup")) {
        RelationshipGroup g;
        g.id = static_cast<Index>(requireAttribute(node, "id").as_ullong());
        g.representative = static_cast<Index>(requireAttribute(node, "representative").as_ullong());
        for (auto member : node.children("member")) {
            const auto m = static_cast<Index>(requireAttribute(member, "feature").as_ullong());
            if (m >= table.size()) {
                throw RecordError("group " + std::to_string(g.id) +
                                  " refers to a missing feature");
            }
            g.members.push_back(m);
        }
        groups.push_back(std::move(g));
    }
    table.setGroups(std::move(groups));
    return table;
}

} // namespace

std::string FeatureRecordWriter::toString(const SampleFeatureSet& sample) {
    pugi::xml_document doc;
    buildSampleDocument(doc, sample);
    return saveToString(doc);
}

std::string FeatureRecordWriter::toString(const FeatureTable& table) {
    pugi::xml_document doc;
    buildTableDocument(doc, table);
    return saveToString(doc);
}

void FeatureRecordWriter::write(const SampleFeatureSet& sample, const std::string& filename) {
    pugi::xml_document doc;
    buildSampleDocument(doc, sample);
    saveToFile(doc, filename);
}

void FeatureRecordWriter::write(const FeatureTable& table, const std::string& filename) {
    pugi::xml_document doc;
    buildTableDocument(doc, table);
    saveToFile(doc, filename);
}

SampleFeatureSet FeatureRecordReader::parseSample(const std::string& content) {
    pugi::xml_document doc;
    loadString(doc, content);
    return sampleFromDocument(doc);
}

SampleFeatureSet FeatureRecordReader::readSample(const std::string& filename) {
    pugi::xml_document doc;
    loadFile(doc, filename);
    return sampleFromDocument(doc);
}

FeatureTable FeatureRecordReader::parseTable(const std::string& content,
                                             std::vector<FeatureTable::SamplePtr> samples) {
    pugi::xml_document doc;
    loadString(doc, content);
    return tableFromDocument(doc, std::move(samples));
}

FeatureTable FeatureRecordReader::readTable(const std::string& filename,
                                            std::vector<FeatureTable::SamplePtr> samples) {
    pugi::xml_document doc;
    loadFile(doc, filename);
    return tableFromDocument(doc, std::move(samples));
}

} // namespace io
} // namespace lcfeat
