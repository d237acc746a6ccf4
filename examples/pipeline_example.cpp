/**
 * Example usage of the lcfeat library.
 *
 * Usage:
 *   lcfeat_example [config.xml] [features.xml]
 */

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <vector>

#include "lcfeat/lcfeat.hpp"

using namespace lcfeat;

namespace {

struct Compound {
    MZ mz;
    RetentionTime rt;
    Intensity height;
};

/**
 * Create a synthetic run: Gaussian elution profiles on a regular scan grid,
 * with one MS/MS scan at the apex of the first compound.
 */
std::unique_ptr<ScanSource> createSyntheticRun(const std::string& name,
                                               std::vector<Compound> compounds,
                                               double scale, unsigned seed) {
    std::sort(compounds.begin(), compounds.end(),
        [](const Compound& a, const Compound& b) { return a.mz < b.mz; });

    std::mt19937 gen(seed);
    std::normal_distribution<> mz_noise(0.0, 0.0005);

    auto run = std::make_unique<ScanList>(name);
    const RetentionTime sigma = 0.03;
    bool ms2_done = false;
    for (int i = 1; i <= 300; ++i) {
        const RetentionTime rt = 0.02 * i;
        std::vector<MZ> mz;
        std::vector<Intensity> intensity;
        for (const auto& c : compounds) {
            double x = (rt - c.rt) / sigma;
            double value = scale * c.height * std::exp(-0.5 * x * x);
            if (value >= 100.0) {
                mz.push_back(c.mz + mz_noise(gen));
                intensity.push_back(value);
            }
        }
        run->addScan(Scan(rt, std::move(mz), std::move(intensity)));

        if (!ms2_done && rt >= compounds.front().rt) {
            Scan ms2(rt + 0.01, {91.054, 119.049, 137.060}, {4.0e4, 9.0e4, 2.5e4}, 2);
            ms2.setPrecursor({compounds.front().mz, scale * compounds.front().height});
            run->addScan(std::move(ms2));
            ms2_done = true;
        }
    }
    return run;
}

/// Cosine similarity of two centroided spectra with a fixed m/z tolerance
algorithms::LibraryMatch cosine(const Ms2Spectrum& query, const algorithms::LibraryEntry& ref) {
    double dot = 0.0, nq = 0.0, nr = 0.0;
    std::size_t matched = 0;
    for (Intensity v : query.intensity) nq += v * v;
    for (Intensity v : ref.intensity) nr += v * v;
    for (std::size_t i = 0; i < query.size(); ++i) {
        for (std::size_t j = 0; j < ref.mz.size(); ++j) {
            if (std::abs(query.mz[i] - ref.mz[j]) <= 0.01) {
                dot += query.intensity[i] * ref.intensity[j];
                ++matched;
                break;
            }
        }
    }
    double sim = (nq > 0.0 && nr > 0.0) ? dot / std::sqrt(nq * nr) : 0.0;
    return {ref.id, sim, matched};
}

void printTable(const FeatureTable& table) {
    std::cout << "========================================\n";
    std::cout << "Feature Table\n";
    std::cout << "========================================\n";

    for (const auto& f : table) {
        std::cout << "  #" << f.id() << "  m/z " << f.mz() << "  rt " << f.rt()
                  << "  present " << f.presentCount() << "/" << f.sampleCount();
        if (f.group()) {
            std::cout << "  group " << f.group()->group_id << " ("
                      << toString(f.group()->role);
            if (!f.group()->adduct.empty()) std::cout << " " << f.group()->adduct;
            if (f.group()->role == FeatureRole::ISOTOPE) {
                std::cout << " M+" << f.group()->isotope_rank;
            }
            std::cout << ")";
        }
        if (const Annotation* a = f.annotation()) {
            std::cout << "  " << a->name << " [" << a->similarity << "]";
        }
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "lcfeat Example\n\n";

    try {
        initLogging(LogLevel::INFO);

        PipelineConfig config;
        if (argc > 1) {
            config = io::ConfigReader::read(argv[1]);
        }
        config.trace_builder.intensity_threshold = 500.0;

        // Compound at m/z 138.055 with its 13C isotope and sodium adduct,
        // plus an unrelated compound
        const std::vector<Compound> compounds = {
            {138.0550, 2.0, 2.0e5},
            {138.0550 + C13_MASS_DIFFERENCE, 2.0, 2.0e4},
            {138.0550 + 21.981945, 2.0, 5.0e4},
            {245.1200, 4.5, 8.0e4},
        };

        std::vector<std::unique_ptr<ScanSource>> samples;
        const std::vector<double> scales = {0.6, 0.9, 1.0, 1.4};
        for (std::size_t s = 0; s < scales.size(); ++s) {
            samples.push_back(createSyntheticRun("sample_" + std::to_string(s), compounds,
                                                 scales[s], static_cast<unsigned>(s)));
        }

        algorithms::SpectralLibrary library = {
            {"LIB-0001", "Tyramine fragment ion", "C8H11NO", 138.0550,
             {91.054, 119.049, 137.060}, {45.0, 100.0, 30.0}},
            {"LIB-0002", "Unrelated", "C6H6", 79.054, {51.023, 77.039}, {40.0, 100.0}},
        };

        Pipeline pipeline(config);
        pipeline.setPeakQualityScorer([](const std::vector<std::vector<double>>& profiles) {
            // Fraction of the profile above half height as a crude shape score
            std::vector<double> scores;
            for (const auto& p : profiles) {
                auto above = std::count_if(p.begin(), p.end(), [](double v) { return v >= 0.5; });
                scores.push_back(1.0 - static_cast<double>(above) / static_cast<double>(p.size()));
            }
            return scores;
        });
        pipeline.setSpectralScorer(
            [](const std::vector<Ms2Spectrum>& queries, const algorithms::SpectralLibrary& lib) {
                std::vector<std::vector<algorithms::LibraryMatch>> hits(queries.size());
                for (std::size_t q = 0; q < queries.size(); ++q) {
                    for (const auto& entry : lib) {
                        hits[q].push_back(cosine(queries[q], entry));
                    }
                }
                return hits;
            },
            library);

        RunResult result = pipeline.run(samples);
        printTable(result.table);

        if (argc > 2) {
            io::FeatureRecordWriter::write(result.table, argv[2]);
            std::cout << "\nFeature table written to " << argv[2] << "\n";
        }

        if (!result.summary.succeeded()) {
            std::cerr << "No sample was processed\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
