/**
 * Batch Processor
 *
 * Applies the occupancy pipeline to every sequence of a batch in parallel
 * and collects the results in input order.
 */

#ifndef BATCH_PROCESSOR_HPP
#define BATCH_PROCESSOR_HPP

#include "tfbs_scanner.hpp"
#include "motif_matrix.hpp"
#include "occupancy.hpp"
#include <map>
#include <string>
#include <vector>

namespace tfbs {

/**
 * Per-sequence summary row
 */
struct SequenceSummary {
    std::string label;
    std::size_t length = 0;
    double gc_content = 0.0;
    bool has_restriction_site = false;
    std::size_t sites = 0;          // Sites retained after the cutoff
    double expected_bound = 0.0;    // Sum of all occupancies, all motifs, unfiltered
};

/**
 * Everything computed for one input sequence
 */
struct SequenceResult {
    std::vector<BindingSite> sites;
    SequenceSummary summary;
    DenseLandscape landscape;       // Only filled when BatchOptions::keep_landscapes is set
};

struct BatchOptions {
    int threads = 0;                            // 0 = OpenMP default
    bool keep_landscapes = false;
    std::vector<std::string> restriction_sites;
};

/**
 * Totals over a processed batch
 */
struct BatchStats {
    std::size_t sequences = 0;
    std::size_t sequences_with_sites = 0;
    std::size_t total_sites = 0;
    std::map<std::string, std::size_t> sites_per_motif;

    void add(const SequenceResult& result);
    std::string to_string() const;
};

class BatchProcessor {
public:
    BatchProcessor(SharedMotifCollection motifs, const ScanParams& params,
                   const BatchOptions& options = BatchOptions());

    /**
     * Full pipeline for a single sequence
     */
    SequenceResult process(const SequenceRecord& record) const;

    /**
     * Process all records; result i belongs to records[i] regardless of the
     * number of threads
     */
    std::vector<SequenceResult> run(const std::vector<SequenceRecord>& records) const;

    /**
     * Concatenate the sites of every result in order
     */
    static std::vector<BindingSite> collect_sites(const std::vector<SequenceResult>& results);

    static BatchStats summarize(const std::vector<SequenceResult>& results);

    /**
     * Thread count the batch will actually use
     */
    int thread_count() const;

    const LandscapeAggregator& aggregator() const { return aggregator_; }

private:
    LandscapeAggregator aggregator_;
    BatchOptions options_;
};

} // namespace tfbs

#endif // BATCH_PROCESSOR_HPP
