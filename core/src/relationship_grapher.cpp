#include "lcfeat/algorithms/relationship_grapher.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <numeric>
#include <tuple>

#include <boost/log/trivial.hpp>

namespace lcfeat {
namespace algorithms {

namespace {

/// Union-find over feature indices
class DisjointSet {
public:
    explicit DisjointSet(std::size_t n) : parent_(n), rank_(n, 0) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    std::size_t find(std::size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (rank_[a] < rank_[b]) std::swap(a, b);
        parent_[b] = a;
        if (rank_[a] == rank_[b]) ++rank_[a];
    }

private:
    std::vector<std::size_t> parent_;
    std::vector<int> rank_;
};

std::string multimerName(int n, Polarity polarity) {
    return polarity == Polarity::NEGATIVE
        ? "[" + std::to_string(n) + "M-H]-"
        : "[" + std::to_string(n) + "M+H]+";
}

} // namespace

std::optional<double> RelationshipGrapher::correlation(const ConsensusFeature& a,
                                                       const ConsensusFeature& b) const {
    const std::size_t n = std::min(a.sampleCount(), b.sampleCount());
    std::vector<double> x;
    std::vector<double> y;
    for (std::size_t s = 0; s < n; ++s) {
        const auto& ea = a.entry(s);
        const auto& eb = b.entry(s);
        if (ea && eb) {
            x.push_back(ea->height);
            y.push_back(eb->height);
        }
    }
    if (x.size() < options_.min_co_occurrence) return std::nullopt;

    const double count = static_cast<double>(x.size());
    double mean_x = std::accumulate(x.begin(), x.end(), 0.0) / count;
    double mean_y = std::accumulate(y.begin(), y.end(), 0.0) / count;

    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - mean_x;
        double dy = y[i] - mean_y;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) return std::nullopt;

    return sxy / std::sqrt(sxx * syy);
}

std::optional<Edge> RelationshipGrapher::relate(
    const FeatureTable& table, Index light, Index heavy, double corr,
    const std::map<std::string, double>& adducts) const {
    const ConsensusFeature& l = table[light];
    const ConsensusFeature& h = table[heavy];
    const MZ delta = h.mz() - l.mz();

    // Isotope spacing
    for (double increment : options_.isotope_mz_increments) {
        for (int k = 1; k <= options_.max_isotope_rank; ++k) {
            if (std::abs(delta - increment * k) > options_.isotope_mz_tolerance) continue;
            if (h.meanHeight() > options_.max_isotope_ratio * l.meanHeight()) continue;

            Edge edge;
            edge.source = light;
            edge.target = heavy;
            edge.relation = Relation::ISOTOPE;
            edge.isotope_rank = k;
            edge.charge = static_cast<ChargeState>(
                std::lround(C13_MASS_DIFFERENCE / increment));
            edge.correlation = corr;
            return edge;
        }
    }

    // Adduct mass differences against the base ion
    for (const auto& [name, shift] : adducts) {
        bool lighter_adduct = shift < 0.0;
        if (std::abs(delta - std::abs(shift)) > options_.adduct_mz_tolerance) continue;

        Edge edge;
        edge.source = lighter_adduct ? heavy : light;
        edge.target = lighter_adduct ? light : heavy;
        edge.relation = Relation::ADDUCT;
        edge.adduct = name;
        edge.correlation = corr;
        return edge;
    }

    if (options_.include_multimers) {
        const double sign = options_.polarity == Polarity::NEGATIVE ? -1.0 : 1.0;
        for (int n = 2; n <= 3; ++n) {
            MZ expected = n * l.mz() - (n - 1) * sign * PROTON_MASS;
            if (std::abs(h.mz() - expected) > options_.adduct_mz_tolerance) continue;

            Edge edge;
            edge.source = light;
            edge.target = heavy;
            edge.relation = Relation::ADDUCT;
            edge.adduct = multimerName(n, options_.polarity);
            edge.correlation = corr;
            return edge;
        }
    }

    // In-source fragment of the heavier feature
    if (std::abs(h.rt() - l.rt()) > options_.isf_rt_tolerance) return std::nullopt;
    if (l.meanHeight() > h.meanHeight()) return std::nullopt;
    const Ms2Spectrum* ms2 = table.bestMs2(heavy);
    if (!ms2) return std::nullopt;

    for (MZ fragment : ms2->mz) {
        if (std::abs(fragment - l.mz()) <= options_.mz_tolerance_ms2) {
            Edge edge;
            edge.source = heavy;
            edge.target = light;
            edge.relation = Relation::IN_SOURCE_FRAGMENT;
            edge.correlation = corr;
            return edge;
        }
    }
    return std::nullopt;
}

std::vector<Edge> RelationshipGrapher::findEdges(const FeatureTable& table) {
    const std::size_t n = table.size();
    const auto adducts = options_.adduct_mass_table.empty()
        ? defaultAdductTable(options_.polarity)
        : options_.adduct_mass_table;

    // Only co-eluting pairs can be related
    std::vector<Index> by_rt(n);
    std::iota(by_rt.begin(), by_rt.end(), 0);
    std::sort(by_rt.begin(), by_rt.end(), [&table](Index a, Index b) {
        if (table[a].rt() != table[b].rt()) return table[a].rt() < table[b].rt();
        return a < b;
    });

    std::vector<Edge> edges;
    for (std::size_t i = 0; i < n; ++i) {
        const Index a = by_rt[i];
        for (std::size_t j = i + 1; j < n; ++j) {
            const Index b = by_rt[j];
            if (table[b].rt() - table[a].rt() > options_.group_rt_tolerance) break;

            ++stats_.pairs_tested;
            auto corr = correlation(table[a], table[b]);
            if (!corr) {
                ++stats_.undetermined;
                continue;
            }
            if (*corr < options_.ppr_threshold) continue;

            bool a_lighter = table[a].mz() < table[b].mz() ||
                             (table[a].mz() == table[b].mz() && a < b);
            Index light = a_lighter ? a : b;
            Index heavy = a_lighter ? b : a;
            if (auto edge = relate(table, light, heavy, *corr, adducts)) {
                edges.push_back(std::move(*edge));
            }
        }
    }

    std::sort(edges.begin(), edges.end(), [](const Edge& x, const Edge& y) {
        return std::tie(x.source, x.target) < std::tie(y.source, y.target);
    });
    return edges;
}

std::vector<RelationshipGroup> RelationshipGrapher::group(FeatureTable& table) {
    stats_ = GroupingStats();
    const std::size_t n = table.size();

    std::vector<Edge> edges = findEdges(table);
    stats_.edges = edges.size();

    DisjointSet components(n);
    for (const auto& e : edges) {
        components.unite(e.source, e.target);
    }

    std::vector<std::optional<GroupLabel>> labels(n);
    std::vector<bool> chain_head(n, false);

    // Isotope chains: the lightest unlabelled feature is rank 0 and the
    // chain is followed through already labelled isotopes
    for (std::size_t first = 0; first < edges.size();) {
        const Index m = edges[first].source;
        std::size_t last = first;
        while (last < edges.size() && edges[last].source == m) ++last;
        const std::size_t begin = first;
        first = last;
        if (labels[m]) continue;

        auto head_edge = std::find_if(edges.begin() + begin, edges.begin() + last,
            [&labels](const Edge& e) {
                return e.relation == Relation::ISOTOPE && !labels[e.target];
            });
        if (head_edge == edges.begin() + last) continue;

        GroupLabel head;
        head.role = FeatureRole::MONOISOTOPIC;
        head.charge = head_edge->charge;
        labels[m] = head;
        chain_head[m] = true;

        std::deque<Index> chain = {m};
        while (!chain.empty()) {
            const Index u = chain.front();
            chain.pop_front();
            auto it = std::lower_bound(edges.begin(), edges.end(), u,
                [](const Edge& e, Index source) { return e.source < source; });
            for (; it != edges.end() && it->source == u; ++it) {
                const Edge& e = *it;
                if (e.relation != Relation::ISOTOPE || labels[e.target]) continue;
                if (e.charge != head.charge) continue;

                GroupLabel iso;
                iso.role = FeatureRole::ISOTOPE;
                iso.isotope_rank = labels[u]->isotope_rank + e.isotope_rank;
                iso.charge = e.charge;
                iso.parent = m;
                labels[e.target] = iso;
                chain.push_back(e.target);
            }
        }
    }

    for (const auto& e : edges) {
        if (e.relation != Relation::ADDUCT || labels[e.target]) continue;
        GroupLabel adduct;
        adduct.role = FeatureRole::ADDUCT;
        adduct.adduct = e.adduct;
        adduct.parent = e.source;
        labels[e.target] = adduct;
    }

    for (const auto& e : edges) {
        if (e.relation != Relation::IN_SOURCE_FRAGMENT || labels[e.target]) continue;
        GroupLabel fragment;
        fragment.role = FeatureRole::IN_SOURCE_FRAGMENT;
        fragment.parent = e.source;
        labels[e.target] = fragment;
    }

    // Components in order of their lowest member
    std::vector<RelationshipGroup> groups;
    std::vector<std::size_t> group_of_root(n, n);
    for (Index m = 0; m < n; ++m) {
        std::size_t root = components.find(m);
        if (group_of_root[root] == n) {
            group_of_root[root] = groups.size();
            RelationshipGroup g;
            g.id = groups.size();
            groups.push_back(g);
        }
        groups[group_of_root[root]].members.push_back(m);
    }

    auto more_intense = [&table](Index a, Index b) {
        return table[a].meanHeight() > table[b].meanHeight();
    };

    for (auto& g : groups) {
        const bool singleton = g.members.size() == 1;

        Index rep = g.members.front();
        bool rep_is_head = chain_head[rep];
        for (Index m : g.members) {
            if (m == rep) continue;
            if (chain_head[m] && !rep_is_head) {
                rep = m;
                rep_is_head = true;
            } else if (chain_head[m] == rep_is_head && more_intense(m, rep)) {
                rep = m;
            }
        }
        g.representative = rep;

        for (Index m : g.members) {
            GroupLabel label = labels[m].value_or(GroupLabel());
            if (!labels[m]) {
                label.role = singleton ? FeatureRole::SINGLETON : FeatureRole::MONOISOTOPIC;
            }
            if (label.role == FeatureRole::SINGLETON || label.role == FeatureRole::MONOISOTOPIC) {
                label.adduct = baseAdductName(options_.polarity, label.charge);
            }
            label.group_id = g.id;
            label.representative = (m == rep);
            table[m].setGroup(std::move(label));
        }

        if (singleton) ++stats_.singletons;
    }
    stats_.groups = groups.size();

    BOOST_LOG_TRIVIAL(info) << "grouped " << n << " features into " << stats_.groups
                            << " groups (" << stats_.singletons << " singletons, "
                            << stats_.edges << " edges, " << stats_.undetermined
                            << " pairs undetermined)";

    table.setGroups(groups);
    return groups;
}

} // namespace algorithms
} // namespace lcfeat
