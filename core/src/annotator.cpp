#include "lcfeat/algorithms/annotator.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/log/trivial.hpp>

namespace lcfeat {
namespace algorithms {

std::size_t Annotator::annotate(FeatureTable& table, const SpectralLibrary& library) {
    stats_ = AnnotationStats();

    std::vector<Index> features;
    std::vector<Ms2Spectrum> queries;
    for (Index f = 0; f < table.size(); ++f) {
        if (const Ms2Spectrum* ms2 = table.bestMs2(f)) {
            features.push_back(f);
            queries.push_back(*ms2);
        }
    }
    stats_.queries = queries.size();
    if (queries.empty()) return 0;

    if (!scorer_) {
        stats_.scorer_unavailable = true;
        BOOST_LOG_TRIVIAL(warning) << "no spectral similarity scorer, "
                                   << queries.size() << " features left unannotated";
        return 0;
    }

    const LibraryIndex index = indexLibrary(library);
    const std::size_t batch_size = std::max<std::size_t>(1, options_.scorer_batch_size);
    for (std::size_t begin = 0; begin < queries.size(); begin += batch_size) {
        std::size_t end = std::min(queries.size(), begin + batch_size);
        std::vector<Ms2Spectrum> batch(queries.begin() + static_cast<std::ptrdiff_t>(begin),
                                       queries.begin() + static_cast<std::ptrdiff_t>(end));

        std::vector<std::vector<LibraryMatch>> hits;
        try {
            hits = scorer_(batch, library);
            if (hits.size() != batch.size()) {
                throw std::runtime_error("expected " + std::to_string(batch.size()) +
                                         " results, got " + std::to_string(hits.size()));
            }
        } catch (const std::exception& e) {
            stats_.scorer_unavailable = true;
            BOOST_LOG_TRIVIAL(warning) << "spectral similarity scorer unavailable, "
                                       << queries.size() - begin
                                       << " features left unannotated: " << e.what();
            break;
        }

        for (std::size_t i = begin; i < end; ++i) {
            auto ranked = rankWith(std::move(hits[i - begin]), index);
            if (!ranked.empty()) ++stats_.annotated;
            table[features[i]].setAnnotations(std::move(ranked));
        }
    }

    BOOST_LOG_TRIVIAL(info) << "annotated " << stats_.annotated << " of "
                            << stats_.queries << " features with MS2";
    return stats_.annotated;
}

Annotator::LibraryIndex Annotator::indexLibrary(const SpectralLibrary& library) {
    LibraryIndex index;
    for (const auto& entry : library) {
        index.emplace(entry.id, &entry);
    }
    return index;
}

std::vector<Annotation> Annotator::rank(std::vector<LibraryMatch> matches,
                                        const SpectralLibrary& library) const {
    return rankWith(std::move(matches), indexLibrary(library));
}

std::vector<Annotation> Annotator::rankWith(std::vector<LibraryMatch> matches,
                                            const LibraryIndex& index) const {
    matches.erase(std::remove_if(matches.begin(), matches.end(),
        [this](const LibraryMatch& m) { return !(m.similarity >= options_.min_similarity); }),
        matches.end());

    std::sort(matches.begin(), matches.end(), [](const LibraryMatch& a, const LibraryMatch& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        if (a.matched_peaks != b.matched_peaks) return a.matched_peaks > b.matched_peaks;
        return a.library_id < b.library_id;
    });
    if (matches.size() > options_.annotation_top_k) {
        matches.resize(options_.annotation_top_k);
    }

    std::vector<Annotation> ranked;
    ranked.reserve(matches.size());
    for (auto& m : matches) {
        Annotation a;
        a.library_id = std::move(m.library_id);
        a.similarity = m.similarity;
        a.matched_peaks = m.matched_peaks;
        auto it = index.find(a.library_id);
        if (it != index.end()) {
            a.name = it->second->name;
            a.formula = it->second->formula;
        }
        ranked.push_back(std::move(a));
    }
    return ranked;
}

} // namespace algorithms
} // namespace lcfeat
