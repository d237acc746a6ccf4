#include "lcfeat/pipeline.hpp"
#include "lcfeat/errors.hpp"
#include "lcfeat/algorithms/aligner.hpp"
#include "lcfeat/algorithms/relationship_grapher.hpp"
#include "lcfeat/algorithms/trace_builder.hpp"

#include <omp.h>

#include <boost/log/trivial.hpp>

namespace lcfeat {

RunResult Pipeline::run(const std::vector<std::unique_ptr<ScanSource>>& samples) {
    if (samples.empty()) {
        throw ConfigError("the run has no samples");
    }
    validate(config_);

    // Workers read this snapshot only
    const PipelineConfig config = config_;
    cancelled_.store(false);

    const std::size_t n = samples.size();
    RunResult result;
    result.summary.samples.resize(n);
    std::vector<std::shared_ptr<const SampleFeatureSet>> sets(n);

    const int threads = config.threads > 0 ? config.threads : omp_get_max_threads();
    BOOST_LOG_TRIVIAL(info) << "processing " << n << " samples on " << threads << " threads";

    #pragma omp parallel for schedule(dynamic, 1) num_threads(threads)
    for (long i = 0; i < static_cast<long>(n); ++i) {
        const auto position = static_cast<std::size_t>(i);
        SampleSummary& summary = result.summary.samples[position];
        summary.sample_id = static_cast<SampleId>(position);

        if (!samples[position]) {
            summary.status = Status::ERROR;
            summary.message = "no scan source";
            continue;
        }
        summary.name = samples[position]->sampleName();

        try {
            sets[position] = processSample(*samples[position], position, config, summary);
            summary.status = Status::OK;
        } catch (const MalformedScanError& e) {
            summary.status = Status::MALFORMED_SCAN;
            summary.message = e.what();
            BOOST_LOG_TRIVIAL(warning) << summary.name << ": " << e.what();
        } catch (const CancelledError& e) {
            summary.status = Status::CANCELLED;
            summary.message = e.what();
        } catch (const std::exception& e) {
            summary.status = Status::ERROR;
            summary.message = e.what();
            BOOST_LOG_TRIVIAL(error) << summary.name << ": " << e.what();
        }
    }

    if (cancelled_.load()) {
        result.summary.cancelled = true;
        logSummary(result.summary);
        return result;
    }

    std::vector<std::shared_ptr<const SampleFeatureSet>> succeeded;
    for (auto& set : sets) {
        if (set) succeeded.push_back(std::move(set));
    }

    algorithms::Aligner aligner(config.alignment);
    result.table = aligner.align(std::move(succeeded));
    result.summary.features = result.table.size();

    algorithms::RelationshipGrapher grapher(config.grouping);
    result.summary.groups = grapher.group(result.table).size();

    algorithms::Annotator annotator(config.annotation, spectral_scorer_);
    result.summary.annotated = annotator.annotate(result.table, library_);

    logSummary(result.summary);
    return result;
}

std::shared_ptr<const SampleFeatureSet> Pipeline::processSample(ScanSource& source,
                                                                std::size_t position,
                                                                const PipelineConfig& config,
                                                                SampleSummary& summary) {
    if (cancelled_.load()) {
        throw CancelledError(source.sampleName() + " not started");
    }

    algorithms::TraceBuilder builder(config.trace_builder);
    auto progress = [this, position](std::size_t current, std::size_t total) {
        if (progress_) progress_(position, current, total);
        return !cancelled_.load();
    };
    algorithms::TraceSet traces = builder.build(source, progress);
    summary.scans = traces.scan_count;
    summary.traces = traces.rois.size();

    algorithms::TraceRefiner refiner(config.trace_refiner, peak_scorer_);
    SampleFeatureSet set = refiner.refine(std::move(traces),
                                          static_cast<SampleId>(position),
                                          source.sampleName());
    summary.rois = set.size();
    summary.dropped_empty = set.droppedEmpty();
    summary.with_ms2 = refiner.stats().with_ms2;

    return std::make_shared<const SampleFeatureSet>(std::move(set));
}

void logSummary(const RunSummary& summary) {
    for (const auto& s : summary.samples) {
        auto line = s.name + ": " + toString(s.status);
        if (s.status == Status::OK) {
            BOOST_LOG_TRIVIAL(info) << line << ", " << s.scans << " scans, " << s.traces
                                    << " traces, " << s.rois << " ROIs ("
                                    << s.with_ms2 << " with MS2, " << s.dropped_empty
                                    << " empty dropped)";
        } else {
            BOOST_LOG_TRIVIAL(warning) << line << ": " << s.message;
        }
    }
    if (summary.cancelled) {
        BOOST_LOG_TRIVIAL(warning) << "run cancelled after " << summary.succeeded()
                                   << " of " << summary.samples.size() << " samples";
        return;
    }
    BOOST_LOG_TRIVIAL(info) << "run finished: " << summary.succeeded() << " of "
                            << summary.samples.size() << " samples, "
                            << summary.features << " features, " << summary.groups
                            << " groups, " << summary.annotated << " annotated";
}

} // namespace lcfeat
