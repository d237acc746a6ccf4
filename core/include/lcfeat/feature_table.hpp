#pragma once

#include "types.hpp"
#include "sample_feature_set.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lcfeat {

/**
 * @brief Presence of a consensus feature in one sample.
 */
struct FeatureEntry {
    Index roi_id = 0;
    Intensity height = 0.0;
    double area = 0.0;
};

/**
 * @brief Role of a feature inside its relationship group.
 */
enum class FeatureRole : std::uint8_t {
    SINGLETON = 0,
    MONOISOTOPIC,
    ISOTOPE,
    ADDUCT,
    IN_SOURCE_FRAGMENT
};

/// Convert role to string
inline std::string toString(FeatureRole r) {
    switch (r) {
        case FeatureRole::MONOISOTOPIC: return "monoisotopic";
        case FeatureRole::ISOTOPE: return "isotope";
        case FeatureRole::ADDUCT: return "adduct";
        case FeatureRole::IN_SOURCE_FRAGMENT: return "in-source fragment";
        default: return "singleton";
    }
}

/**
 * @brief Group membership of one feature.
 */
struct GroupLabel {
    Index group_id = 0;
    FeatureRole role = FeatureRole::SINGLETON;

    /// Isotope rank (0 for the monoisotopic feature of a chain)
    int isotope_rank = 0;

    /// Charge inferred from the isotope spacing (0 if unknown)
    ChargeState charge = 0;

    /// Adduct form: the base ion for MONOISOTOPIC and SINGLETON, the adduct for ADDUCT
    std::string adduct;

    /// Feature this one derives from, for ISOTOPE, ADDUCT and IN_SOURCE_FRAGMENT
    std::optional<Index> parent;

    bool representative = false;
};

/**
 * @brief A library identity proposed for a feature.
 */
struct Annotation {
    std::string library_id;
    std::string name;
    std::string formula;
    double similarity = 0.0;
    std::size_t matched_peaks = 0;
};

/**
 * @brief A chemical signal aligned across samples.
 *
 * Holds one optional entry per sample of the owning table. Every present
 * entry refers to a ROI whose m/z and rt lie within alignment tolerance of
 * the representative values.
 */
class ConsensusFeature {
public:
    ConsensusFeature() = default;
    ConsensusFeature(MZ mz, RetentionTime rt, std::size_t sample_count)
        : mz_(mz), rt_(rt), entries_(sample_count) {}

    // =========================================================================
    // Position
    // =========================================================================

    /// Get representative m/z
    [[nodiscard]] MZ mz() const noexcept { return mz_; }

    /// Get representative retention time
    [[nodiscard]] RetentionTime rt() const noexcept { return rt_; }

    // =========================================================================
    // Entries
    // =========================================================================

    /// Number of sample slots
    [[nodiscard]] std::size_t sampleCount() const noexcept { return entries_.size(); }

    /// Entry of one sample (empty if absent)
    [[nodiscard]] const std::optional<FeatureEntry>& entry(std::size_t sample) const {
        return entries_.at(sample);
    }
    void setEntry(std::size_t sample, FeatureEntry e) { entries_.at(sample) = e; }

    [[nodiscard]] const std::vector<std::optional<FeatureEntry>>& entries() const noexcept {
        return entries_;
    }

    /// Number of samples in which the feature is present
    [[nodiscard]] std::size_t presentCount() const noexcept {
        std::size_t n = 0;
        for (const auto& e : entries_) {
            if (e) ++n;
        }
        return n;
    }

    /// Mean height over the present entries
    [[nodiscard]] Intensity meanHeight() const noexcept {
        double sum = 0.0;
        std::size_t n = 0;
        for (const auto& e : entries_) {
            if (e) {
                sum += e->height;
                ++n;
            }
        }
        return n > 0 ? sum / static_cast<double>(n) : 0.0;
    }

    /// Largest height over the present entries
    [[nodiscard]] Intensity maxHeight() const noexcept {
        Intensity h = 0.0;
        for (const auto& e : entries_) {
            if (e && e->height > h) h = e->height;
        }
        return h;
    }

    // =========================================================================
    // Labels
    // =========================================================================

    /// Get feature ID
    [[nodiscard]] Index id() const noexcept { return id_; }
    void setId(Index id) noexcept { id_ = id; }

    /// Group membership (unset before grouping)
    [[nodiscard]] const std::optional<GroupLabel>& group() const noexcept { return group_; }
    void setGroup(GroupLabel label) { group_ = std::move(label); }

    /// Ranked annotations, best first
    [[nodiscard]] const std::vector<Annotation>& annotations() const noexcept {
        return annotations_;
    }
    void setAnnotations(std::vector<Annotation> a) { annotations_ = std::move(a); }

    /// Top-ranked annotation, if any
    [[nodiscard]] const Annotation* annotation() const noexcept {
        return annotations_.empty() ? nullptr : &annotations_.front();
    }

private:
    Index id_ = 0;
    MZ mz_ = 0.0;
    RetentionTime rt_ = 0.0;
    std::vector<std::optional<FeatureEntry>> entries_;
    std::optional<GroupLabel> group_;
    std::vector<Annotation> annotations_;
};

/**
 * @brief Features believed to derive from one chemical species.
 */
struct RelationshipGroup {
    Index id = 0;

    /// Member feature ids in ascending order
    std::vector<Index> members;

    Index representative = 0;
};

/**
 * @brief Consensus features of a run together with their samples.
 *
 * Sample slots are positions in samples(); the samples are shared and
 * read-only.
 */
class FeatureTable {
public:
    using SamplePtr = std::shared_ptr<const SampleFeatureSet>;
    using iterator = std::vector<ConsensusFeature>::iterator;
    using const_iterator = std::vector<ConsensusFeature>::const_iterator;

    FeatureTable() = default;
    explicit FeatureTable(std::vector<SamplePtr> samples)
        : samples_(std::move(samples)) {}

    // =========================================================================
    // Container Operations
    // =========================================================================

    /// Get number of features
    [[nodiscard]] std::size_t size() const noexcept { return features_.size(); }

    /// Check if empty
    [[nodiscard]] bool empty() const noexcept { return features_.empty(); }

    /// Access feature by index
    [[nodiscard]] ConsensusFeature& operator[](std::size_t i) { return features_[i]; }
    [[nodiscard]] const ConsensusFeature& operator[](std::size_t i) const {
        return features_[i];
    }

    /// Iterator access
    iterator begin() noexcept { return features_.begin(); }
    iterator end() noexcept { return features_.end(); }
    const_iterator begin() const noexcept { return features_.begin(); }
    const_iterator end() const noexcept { return features_.end(); }

    /// Add a feature; its id becomes its position
    void add(ConsensusFeature f) {
        f.setId(features_.size());
        features_.push_back(std::move(f));
    }

    /// Reserve capacity
    void reserve(std::size_t n) { features_.reserve(n); }

    /// Get underlying vector
    [[nodiscard]] const std::vector<ConsensusFeature>& features() const noexcept {
        return features_;
    }

    // =========================================================================
    // Samples
    // =========================================================================

    [[nodiscard]] std::size_t sampleCount() const noexcept { return samples_.size(); }

    [[nodiscard]] const SampleFeatureSet& sample(std::size_t i) const {
        return *samples_.at(i);
    }

    [[nodiscard]] const std::vector<SamplePtr>& samples() const noexcept {
        return samples_;
    }

    /// ROI behind an entry, or nullptr if the feature is absent in the sample
    [[nodiscard]] const Roi* roi(std::size_t feature, std::size_t sample) const {
        const auto& e = features_.at(feature).entry(sample);
        if (!e) return nullptr;
        return &samples_.at(sample)->roi(e->roi_id);
    }

    /**
     * @brief MS2 spectrum representing a feature.
     *
     * @return The best MS2 with the largest precursor intensity among the
     *         feature's entries, or nullptr if none carries one
     */
    [[nodiscard]] const Ms2Spectrum* bestMs2(std::size_t feature) const {
        const Ms2Spectrum* best = nullptr;
        for (std::size_t s = 0; s < samples_.size(); ++s) {
            const Roi* r = roi(feature, s);
            if (!r || !r->hasMs2()) continue;
            const Ms2Spectrum& ms2 = *r->bestMs2();
            if (!best || ms2.precursor_intensity > best->precursor_intensity) {
                best = &ms2;
            }
        }
        return best;
    }

    // =========================================================================
    // Groups
    // =========================================================================

    [[nodiscard]] const std::vector<RelationshipGroup>& groups() const noexcept {
        return groups_;
    }
    void setGroups(std::vector<RelationshipGroup> groups) { groups_ = std::move(groups); }

    /// Get custom metadata
    [[nodiscard]] const MetaData& metadata() const noexcept { return metadata_; }
    MetaData& metadata() noexcept { return metadata_; }

private:
    std::vector<SamplePtr> samples_;
    std::vector<ConsensusFeature> features_;
    std::vector<RelationshipGroup> groups_;
    MetaData metadata_;
};

} // namespace lcfeat
