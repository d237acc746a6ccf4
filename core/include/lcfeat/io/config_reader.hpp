#pragma once

#include "../config.hpp"
#include <string>

namespace lcfeat {
namespace io {

/**
 * @brief Reads a pipeline configuration from an XML parameter file.
 *
 * The file holds one element per component; each attribute overrides
 * the option of the same name and absent attributes keep their defaults.
 * Unknown elements and attributes are ignored.
 *
 * @code
 * <lcfeat threads="4">
 *   <traceBuilder mzToleranceMs1="0.005" intensityThreshold="5000"/>
 *   <alignment alignRtTolerance="0.2"/>
 *   <grouping polarity="negative">
 *     <adduct name="[M+Cl]-" mass="35.976677"/>
 *   </grouping>
 * </lcfeat>
 * @endcode
 */
class ConfigReader {
public:
    /**
     * @brief Parse a configuration from a string.
     *
     * @throws ConfigError on malformed XML, unparsable values, or a
     *         configuration that fails validate()
     */
    static PipelineConfig parseString(const std::string& content);

    /**
     * @brief Read a configuration file.
     *
     * @throws ConfigError as parseString(), or if the file cannot be read
     */
    static PipelineConfig read(const std::string& filename);
};

} // namespace io
} // namespace lcfeat
