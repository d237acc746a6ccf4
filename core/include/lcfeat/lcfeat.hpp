#pragma once

/**
 * @file lcfeat.hpp
 * @brief Main header for the lcfeat library.
 *
 * Include this header to get access to all lcfeat functionality.
 *
 * @example
 * @code
 * #include <lcfeat/lcfeat.hpp>
 *
 * int main() {
 *     std::vector<std::unique_ptr<lcfeat::ScanSource>> samples;
 *     samples.push_back(std::make_unique<lcfeat::ScanList>(loadRun("qc_01")));
 *
 *     lcfeat::Pipeline pipeline(lcfeat::io::ConfigReader::read("lcfeat.xml"));
 *     auto result = pipeline.run(samples);
 *
 *     for (const auto& feature : result.table) {
 *         std::cout << feature.mz() << " @ " << feature.rt() << " min\n";
 *     }
 *     return 0;
 * }
 * @endcode
 */

// Core types
#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "logging.hpp"

// Data structures
#include "scan.hpp"
#include "scan_source.hpp"
#include "roi.hpp"
#include "sample_feature_set.hpp"
#include "feature_table.hpp"

// Algorithms
#include "algorithms/trace_builder.hpp"
#include "algorithms/trace_refiner.hpp"
#include "algorithms/aligner.hpp"
#include "algorithms/relationship_grapher.hpp"
#include "algorithms/annotator.hpp"

// Pipeline
#include "pipeline.hpp"

// I/O
#include "io/binary_array.hpp"
#include "io/feature_record.hpp"
#include "io/config_reader.hpp"

/**
 * @namespace lcfeat
 * @brief Root namespace for the lcfeat library.
 */

/**
 * @namespace lcfeat::io
 * @brief Record and configuration file I/O.
 */

/**
 * @namespace lcfeat::algorithms
 * @brief Trace building, alignment, grouping and annotation.
 */
