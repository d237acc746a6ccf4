#pragma once

#include "../config.hpp"
#include "../feature_table.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lcfeat {
namespace algorithms {

/**
 * @brief Kind of relationship between two features
 */
enum class Relation : std::uint8_t {
    ISOTOPE = 0,
    ADDUCT,
    IN_SOURCE_FRAGMENT
};

/// Convert relation to string
inline std::string toString(Relation r) {
    switch (r) {
        case Relation::ISOTOPE: return "isotope";
        case Relation::ADDUCT: return "adduct";
        default: return "in-source fragment";
    }
}

/**
 * @brief A labelled edge of the feature relationship graph.
 *
 * `source` is the feature the relation starts from: the lighter isotope,
 * the base ion of an adduct, or the parent of a fragment. `target` is the
 * heavier isotope, the adduct form or the fragment.
 */
struct Edge {
    Index source = 0;
    Index target = 0;
    Relation relation = Relation::ISOTOPE;
    int isotope_rank = 0;
    ChargeState charge = 0;
    std::string adduct;
    double correlation = 0.0;
};

/**
 * @brief Counters reported by the grapher
 */
struct GroupingStats {
    std::size_t pairs_tested = 0;
    std::size_t undetermined = 0;
    std::size_t edges = 0;
    std::size_t groups = 0;
    std::size_t singletons = 0;
};

/**
 * @brief Groups consensus features that derive from one species.
 *
 * Two features are connected when their heights correlate across samples,
 * they co-elute, and their m/z difference is explained by an isotope
 * spacing, an adduct or multimer mass difference, or a fragment of the
 * heavier feature's MS2 spectrum. Connected components become groups.
 */
class RelationshipGrapher {
public:
    RelationshipGrapher() = default;
    explicit RelationshipGrapher(const GroupingOptions& options)
        : options_(options) {}

    /**
     * @brief Group the features of a table.
     *
     * Labels every feature and stores the groups in the table.
     *
     * @return The groups, ordered by their lowest member id
     */
    std::vector<RelationshipGroup> group(FeatureTable& table);

    /**
     * @brief All edges of the relationship graph.
     *
     * @return Edges ordered by (source, target)
     */
    std::vector<Edge> findEdges(const FeatureTable& table);

    /**
     * @brief Peak-peak correlation of two features.
     *
     * Pearson correlation of the heights over the samples where both are
     * present.
     *
     * @return Unset if fewer than min_co_occurrence samples are shared or
     *         either profile has zero variance
     */
    std::optional<double> correlation(const ConsensusFeature& a,
                                      const ConsensusFeature& b) const;

    /// Counters of the last group() call
    [[nodiscard]] const GroupingStats& stats() const noexcept { return stats_; }

    /**
     * @brief Get/set options
     */
    const GroupingOptions& options() const { return options_; }
    void setOptions(const GroupingOptions& opt) { options_ = opt; }

private:
    GroupingOptions options_;
    GroupingStats stats_;

    std::optional<Edge> relate(const FeatureTable& table, Index light, Index heavy,
                               double corr,
                               const std::map<std::string, double>& adducts) const;
};

} // namespace algorithms
} // namespace lcfeat
