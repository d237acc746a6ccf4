#pragma once

#include "../feature_table.hpp"
#include "../sample_feature_set.hpp"
#include <string>
#include <vector>

namespace lcfeat {
namespace io {

/**
 * @brief Writes sample feature sets and feature tables as XML records.
 *
 * ROI point arrays and MS2 peaks are stored as Base64 of zlib-compressed
 * little-endian float64 arrays, the encoding mzML uses for binary data.
 *
 * Usage:
 * @code
 * FeatureRecordWriter::write(sample, "sample_0.xml");
 * FeatureRecordWriter::write(table, "features.xml");
 * @endcode
 */
class FeatureRecordWriter {
public:
    /// Serialize a sample feature set to an XML string
    static std::string toString(const SampleFeatureSet& sample);

    /// Serialize a feature table (features, groups, annotations) to an XML string
    static std::string toString(const FeatureTable& table);

    /**
     * @brief Write a record to a file.
     *
     * @throws RecordError if the file cannot be written
     */
    static void write(const SampleFeatureSet& sample, const std::string& filename);
    static void write(const FeatureTable& table, const std::string& filename);
};

/**
 * @brief Reads the records written by FeatureRecordWriter.
 */
class FeatureRecordReader {
public:
    /**
     * @brief Parse a sample feature set.
     *
     * @throws RecordError on malformed XML, missing attributes or undecodable arrays
     */
    static SampleFeatureSet parseSample(const std::string& content);
    static SampleFeatureSet readSample(const std::string& filename);

    /**
     * @brief Parse a feature table.
     *
     * @param samples The samples the table refers to, in slot order
     * @throws RecordError on malformed XML or when an entry refers to a
     *         sample or ROI that does not exist
     */
    static FeatureTable parseTable(const std::string& content,
                                   std::vector<FeatureTable::SamplePtr> samples);
    static FeatureTable readTable(const std::string& filename,
                                  std::vector<FeatureTable::SamplePtr> samples);
};

} // namespace io
} // namespace lcfeat
