#pragma once

#include "config/CorrectionConfig.h"
#include "correct/BarcodeCorrector.h"
#include "correct/CorrectionCache.h"
#include "correct/CorrectionDecision.h"
#include "locate/BarcodeLocator.h"
#include "pipeline/ProcessingStats.h"
#include "priors/PriorTable.h"
#include "utils/ReadRecord.h"

#include <cstdint>
#include <memory>
#include <vector>

namespace bcfix::whitelist {
class WhitelistIndex;
}

namespace bcfix::pipeline {

struct ReadResult {
    locate::OrientationDecision orientation;
    correct::CorrectionDecision correction;
    // Set when the read could not be evaluated (e.g. missing or malformed qualities).
    bool invalid_input{false};
    // The normalised record to write.
    utils::ReadRecord output;
};

// Locates, corrects and normalises batches of reads across a pool of worker threads. Results come
// back in the order the reads were given. Each worker partition keeps its own correction cache
// for the lifetime of the processor.
class BarcodeProcessor {
public:
    static constexpr uint64_t PROGRESS_INTERVAL = 1'000'000;

    BarcodeProcessor(const whitelist::WhitelistIndex& index,
                     const priors::PriorTable& priors,
                     const config::CorrectionConfig& config,
                     int num_threads);

    // Evaluates one read. InputErrors are caught and reported in the result.
    ReadResult evaluate(const utils::ReadRecord& read, correct::CorrectionCache* cache) const;

    std::vector<ReadResult> process_batch(const std::vector<utils::ReadRecord>& reads);

    const ProcessingStats& stats() const { return m_stats; }

    void log_summary() const;

private:
    void log_progress();

    const locate::BarcodeLocator m_locator;
    const correct::BarcodeCorrector m_corrector;
    const int m_num_threads;
    std::vector<std::unique_ptr<correct::CorrectionCache>> m_caches;
    ProcessingStats m_stats;
    uint64_t m_next_progress{PROGRESS_INTERVAL};
};

// First pass of the two-pass design: tallies reads whose located barcode matches the whitelist
// exactly, using the same locator settings as the correction pass. Each worker partition tallies
// into its own accumulator for the whole pass; they are only combined once counting is done.
class PriorCounter {
public:
    PriorCounter(const whitelist::WhitelistIndex& index,
                 const config::LocatorConfig& config,
                 int num_threads);

    void count_batch(const std::vector<utils::ReadRecord>& reads);

    // Sum of the per-partition tallies. Call after the last batch.
    priors::PriorAccumulator merged_accumulator() const;
    priors::PriorTable finalize(double prior_floor) const;

    uint64_t num_reads() const { return m_num_reads; }

private:
    const whitelist::WhitelistIndex& m_index;
    const locate::BarcodeLocator m_locator;
    const int m_num_threads;
    std::vector<priors::PriorAccumulator> m_thread_accumulators;
    uint64_t m_num_reads{0};
};

}  // namespace bcfix::pipeline
