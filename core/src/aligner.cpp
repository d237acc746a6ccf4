#include "lcfeat/algorithms/aligner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

#include <boost/log/trivial.hpp>

namespace lcfeat {
namespace algorithms {

namespace {

constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

// Clusters whose centroid lies this many m/z tolerances below the sweep
// position can no longer accept items
constexpr double RETIRE_WINDOW = 4.0;

} // namespace

FeatureTable Aligner::align(std::vector<FeatureTable::SamplePtr> samples) {
    stats_ = AlignmentStats();
    items_.clear();
    clusters_.clear();
    active_.clear();

    pool(samples);
    evicted_from_.assign(items_.size(), {});
    stats_.pooled = items_.size();

    // Pass 1: anchor-eligible ROIs build the clusters
    std::vector<std::size_t> deferred;
    for (std::size_t i = 0; i < items_.size(); ++i) {
        if (!items_[i].anchor) {
            deferred.push_back(i);
            continue;
        }
        retire(items_[i].mz);
        place(i, true);
    }

    // Pass 2: short ROIs join existing clusters as supporting members
    if (!deferred.empty() && !clusters_.empty()) {
        active_.resize(clusters_.size());
        std::iota(active_.begin(), active_.end(), 0);
        std::sort(active_.begin(), active_.end(), [this](std::size_t a, std::size_t b) {
            return clusters_[a].mz < clusters_[b].mz;
        });
    }
    for (std::size_t i : deferred) {
        if (!clusters_.empty() && place(i, false)) {
            ++stats_.supporting;
        } else {
            ++stats_.unassigned;
        }
    }

    FeatureTable table = buildTable(std::move(samples));
    stats_.features = table.size();

    BOOST_LOG_TRIVIAL(debug) << "aligned " << stats_.pooled << " ROIs into "
                             << stats_.features << " features (" << stats_.evictions
                             << " evictions, " << stats_.supporting << " supporting, "
                             << stats_.unassigned << " unassigned)";

    items_.clear();
    clusters_.clear();
    active_.clear();
    evicted_from_.clear();
    return table;
}

void Aligner::pool(const std::vector<FeatureTable::SamplePtr>& samples) {
    std::size_t total = 0;
    for (const auto& s : samples) {
        if (!s) throw std::invalid_argument("null sample feature set");
        total += s->size();
    }
    items_.reserve(total);

    for (std::size_t slot = 0; slot < samples.size(); ++slot) {
        const SampleFeatureSet& set = *samples[slot];
        for (const Roi& roi : set) {
            bool is_short = roi.length() < options_.short_roi_length && !roi.hasMs2();
            items_.push_back({slot, set.sampleId(), roi.id(), roi.mzCenter(), roi.rtApex(),
                              roi.height(), roi.area(), roi.length(),
                              !(options_.discard_short_roi && is_short)});
        }
    }

    std::sort(items_.begin(), items_.end(), [](const Item& a, const Item& b) {
        if (a.mz != b.mz) return a.mz < b.mz;
        if (a.rt != b.rt) return a.rt < b.rt;
        if (a.height != b.height) return a.height > b.height;
        if (a.length != b.length) return a.length > b.length;
        if (a.sample_id != b.sample_id) return a.sample_id < b.sample_id;
        return a.roi_id < b.roi_id;
    });
}

double Aligner::distance(const Item& item, const Cluster& cluster) const {
    double dmz = (item.mz - cluster.mz) / options_.align_mz_tolerance;
    double drt = (item.rt - cluster.rt) / options_.align_rt_tolerance;
    return std::sqrt(dmz * dmz + drt * drt);
}

bool Aligner::within(const Item& item, MZ mz, RetentionTime rt) const {
    return std::abs(item.mz - mz) <= options_.align_mz_tolerance &&
           std::abs(item.rt - rt) <= options_.align_rt_tolerance;
}

bool Aligner::place(std::size_t start, bool allow_eviction) {
    std::vector<std::size_t> pending{start};
    bool start_placed = false;

    while (!pending.empty()) {
        std::size_t x = pending.back();
        pending.pop_back();
        const Item& item = items_[x];

        // Candidate clusters, nearest first
        std::vector<std::pair<double, std::size_t>> candidates;
        if (allow_eviction) {
            for (std::size_t c : active_) {
                const Cluster& cluster = clusters_[c];
                if (evicted_from_[x].count(cluster.id)) continue;
                if (!within(item, cluster.mz, cluster.rt)) continue;
                candidates.emplace_back(distance(item, cluster), cluster.id);
            }
        } else {
            // Centroids moved by at most twice the tolerance since the index was sorted
            const MZ reach = 3.0 * options_.align_mz_tolerance;
            auto it = std::lower_bound(active_.begin(), active_.end(), item.mz - reach,
                [this](std::size_t c, MZ value) { return clusters_[c].mz < value; });
            for (; it != active_.end(); ++it) {
                const Cluster& cluster = clusters_[*it];
                if (cluster.mz > item.mz + reach) break;
                if (!within(item, cluster.mz, cluster.rt)) continue;
                if (memberOfSlot(cluster, item.slot) != npos) continue;
                candidates.emplace_back(distance(item, cluster), cluster.id);
            }
        }
        std::sort(candidates.begin(), candidates.end());

        bool placed = false;
        for (const auto& candidate : candidates) {
            Cluster& cluster = clusters_[candidate.second];
            std::size_t rival = memberOfSlot(cluster, item.slot);

            if (rival == npos) {
                std::vector<std::size_t> members = cluster.members;
                members.push_back(x);
                if (tryCommit(cluster, std::move(members))) {
                    placed = true;
                    break;
                }
                continue;
            }

            // Same sample already present: the nearer ROI keeps the slot
            double rival_distance = distance(items_[rival], cluster);
            bool wins = candidate.first < rival_distance ||
                        (candidate.first == rival_distance &&
                         item.height > items_[rival].height);
            if (!wins) continue;

            std::vector<std::size_t> members = cluster.members;
            std::replace(members.begin(), members.end(), rival, x);
            if (tryCommit(cluster, std::move(members))) {
                evicted_from_[rival].insert(cluster.id);
                pending.push_back(rival);
                ++stats_.evictions;
                placed = true;
                break;
            }
        }

        if (!placed && allow_eviction) {
            seed(x);
            placed = true;
        }
        if (x == start) start_placed = placed;
    }
    return start_placed;
}

bool Aligner::tryCommit(Cluster& cluster, std::vector<std::size_t> members) {
    double weight = 0.0;
    double mz = 0.0;
    double rt = 0.0;
    for (std::size_t m : members) {
        weight += items_[m].height;
        mz += items_[m].mz * items_[m].height;
        rt += items_[m].rt * items_[m].height;
    }
    if (weight > 0.0) {
        mz /= weight;
        rt /= weight;
    } else {
        mz = 0.0;
        rt = 0.0;
        for (std::size_t m : members) {
            mz += items_[m].mz;
            rt += items_[m].rt;
        }
        mz /= static_cast<double>(members.size());
        rt /= static_cast<double>(members.size());
    }

    for (std::size_t m : members) {
        if (!within(items_[m], mz, rt)) return false;
    }

    cluster.members = std::move(members);
    cluster.mz = mz;
    cluster.rt = rt;
    return true;
}

std::size_t Aligner::memberOfSlot(const Cluster& cluster, std::size_t slot) const {
    for (std::size_t m : cluster.members) {
        if (items_[m].slot == slot) return m;
    }
    return npos;
}

void Aligner::seed(std::size_t item) {
    Cluster cluster;
    cluster.id = clusters_.size();
    cluster.mz = items_[item].mz;
    cluster.rt = items_[item].rt;
    cluster.members.push_back(item);
    clusters_.push_back(std::move(cluster));
    active_.push_back(clusters_.back().id);
}

void Aligner::retire(MZ sweep_mz) {
    const MZ limit = sweep_mz - RETIRE_WINDOW * options_.align_mz_tolerance;
    active_.erase(std::remove_if(active_.begin(), active_.end(),
        [this, limit](std::size_t c) { return clusters_[c].mz < limit; }),
        active_.end());
}

FeatureTable Aligner::buildTable(std::vector<FeatureTable::SamplePtr> samples) const {
    const std::size_t sample_count = samples.size();

    std::vector<std::size_t> order(clusters_.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
        if (clusters_[a].mz != clusters_[b].mz) return clusters_[a].mz < clusters_[b].mz;
        return clusters_[a].rt < clusters_[b].rt;
    });

    FeatureTable table(std::move(samples));
    table.reserve(clusters_.size());
    for (std::size_t c : order) {
        const Cluster& cluster = clusters_[c];
        ConsensusFeature feature(cluster.mz, cluster.rt, sample_count);
        for (std::size_t m : cluster.members) {
            const Item& item = items_[m];
            feature.setEntry(item.slot, {item.roi_id, item.height, item.area});
        }
        table.add(std::move(feature));
    }
    return table;
}

} // namespace algorithms
} // namespace lcfeat
