#pragma once

#include "../config.hpp"
#include "../feature_table.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lcfeat {
namespace algorithms {

/**
 * @brief A reference spectrum of a known compound.
 */
struct LibraryEntry {
    std::string id;
    std::string name;
    std::string formula;
    MZ precursor_mz = 0.0;
    std::vector<MZ> mz;
    std::vector<Intensity> intensity;
};

/// Reference spectra searched by the annotator
using SpectralLibrary = std::vector<LibraryEntry>;

/**
 * @brief One hit returned by the spectral similarity scorer.
 */
struct LibraryMatch {
    std::string library_id;
    double similarity = 0.0;
    std::size_t matched_peaks = 0;
};

/**
 * @brief Spectral similarity scorer signature.
 *
 * Receives a batch of query spectra and the library and returns, for
 * each query, its library hits. Must be deterministic.
 */
using SpectralSimilarityScorer = std::function<std::vector<std::vector<LibraryMatch>>(
    const std::vector<Ms2Spectrum>& queries, const SpectralLibrary& library)>;

/**
 * @brief Counters reported by the annotator
 */
struct AnnotationStats {
    std::size_t queries = 0;
    std::size_t annotated = 0;
    bool scorer_unavailable = false;
};

/**
 * @brief Attaches library identities to features that carry an MS2 spectrum.
 */
class Annotator {
public:
    Annotator() = default;
    Annotator(const AnnotationOptions& options, SpectralSimilarityScorer scorer)
        : options_(options), scorer_(std::move(scorer)) {}

    /**
     * @brief Annotate the features of a table.
     *
     * Hits below min_similarity are discarded; the rest are ranked by
     * similarity, matched peak count and library id, and the top
     * annotation_top_k are kept.
     *
     * @return Number of annotated features
     */
    std::size_t annotate(FeatureTable& table, const SpectralLibrary& library);

    /**
     * @brief Filter, rank and truncate the hits of one query.
     */
    std::vector<Annotation> rank(std::vector<LibraryMatch> matches,
                                 const SpectralLibrary& library) const;

    /// Counters of the last annotate() call
    [[nodiscard]] const AnnotationStats& stats() const noexcept { return stats_; }

    /**
     * @brief Get/set options
     */
    const AnnotationOptions& options() const { return options_; }
    void setOptions(const AnnotationOptions& opt) { options_ = opt; }

    /// Set the similarity scorer (nullptr = no annotation)
    void setScorer(SpectralSimilarityScorer scorer) { scorer_ = std::move(scorer); }

private:
    using LibraryIndex = std::unordered_map<std::string, const LibraryEntry*>;

    AnnotationOptions options_;
    SpectralSimilarityScorer scorer_;
    AnnotationStats stats_;

    static LibraryIndex indexLibrary(const SpectralLibrary& library);
    std::vector<Annotation> rankWith(std::vector<LibraryMatch> matches,
                                     const LibraryIndex& index) const;
};

} // namespace algorithms
} // namespace lcfeat
