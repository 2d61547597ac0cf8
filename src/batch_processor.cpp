/**
 * Batch Processor - Implementation
 */

#include "batch_processor.hpp"
#include "sequence_utils.hpp"
#include <chrono>
#include <exception>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace tfbs {

// ============================================================================
// BatchStats
// ============================================================================

void BatchStats::add(const SequenceResult& result) {
    sequences++;
    if (!result.sites.empty()) {
        sequences_with_sites++;
    }
    total_sites += result.sites.size();
    for (const auto& site : result.sites) {
        sites_per_motif[site.motif]++;
    }
}

std::string BatchStats::to_string() const {
    std::ostringstream oss;
    oss << "=== Scan Statistics ===\n";
    oss << "Sequences: " << sequences << "\n";
    oss << "Sequences with sites: " << sequences_with_sites << "\n";
    oss << "Total sites: " << total_sites << "\n";
    if (!sites_per_motif.empty()) {
        oss << "\nSites per motif:\n";
        for (const auto& pair : sites_per_motif) {
            oss << "  " << pair.first << ": " << pair.second << "\n";
        }
    }
    return oss.str();
}

// ============================================================================
// BatchProcessor
// ============================================================================

BatchProcessor::BatchProcessor(SharedMotifCollection motifs, const ScanParams& params,
                               const BatchOptions& options)
    : aggregator_(std::move(motifs), params), options_(options) {
    if (options_.threads < 0) {
        throw InvalidParameterError("threads", std::to_string(options_.threads),
                                    "must be 0 (all) or positive");
    }
}

int BatchProcessor::thread_count() const {
#ifdef _OPENMP
    return options_.threads > 0 ? options_.threads : omp_get_max_threads();
#else
    return 1;
#endif
}

SequenceResult BatchProcessor::process(const SequenceRecord& record) const {
    SequenceResult result;

    auto landscapes = aggregator_.landscapes(record.sequence);
    result.sites = aggregator_.sites(record.label, landscapes);

    result.summary.label = record.label;
    result.summary.length = record.sequence.size();
    result.summary.gc_content = gc_content(record.sequence);
    result.summary.has_restriction_site =
        has_restriction_sites(record.sequence, options_.restriction_sites);
    result.summary.sites = result.sites.size();
    for (const auto& landscape : landscapes) {
        result.summary.expected_bound += landscape.expected_bound();
    }

    if (options_.keep_landscapes) {
        result.landscape = dense_landscape(record.sequence.size(), landscapes);
    }

    return result;
}

std::vector<SequenceResult> BatchProcessor::run(const std::vector<SequenceRecord>& records) const {
    const int threads = thread_count();
    log(LogLevel::INFO, "Scanning " + std::to_string(records.size()) + " sequences against " +
                        std::to_string(aggregator_.motifs().size()) + " motifs using " +
                        std::to_string(threads) + " thread(s)");

    auto start = std::chrono::steady_clock::now();

    // Each iteration writes only its own slot, so output order is input order
    std::vector<SequenceResult> results(records.size());
    std::exception_ptr first_error = nullptr;
    const long n = static_cast<long>(records.size());

    #pragma omp parallel for schedule(dynamic, 16) num_threads(threads)
    for (long i = 0; i < n; ++i) {
        try {
            results[static_cast<size_t>(i)] = process(records[static_cast<size_t>(i)]);
        } catch (...) {
            #pragma omp critical
            {
                if (!first_error) first_error = std::current_exception();
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    auto end = std::chrono::steady_clock::now();
    log(LogLevel::INFO, "Scan finished in " + format_elapsed(start, end));

    return results;
}

std::vector<BindingSite> BatchProcessor::collect_sites(const std::vector<SequenceResult>& results) {
    size_t total = 0;
    for (const auto& result : results) {
        total += result.sites.size();
    }

    std::vector<BindingSite> sites;
    sites.reserve(total);
    for (const auto& result : results) {
        sites.insert(sites.end(), result.sites.begin(), result.sites.end());
    }
    return sites;
}

BatchStats BatchProcessor::summarize(const std::vector<SequenceResult>& results) {
    BatchStats stats;
    for (const auto& result : results) {
        stats.add(result);
    }
    return stats;
}

} // namespace tfbs
