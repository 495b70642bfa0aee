#include "pipeline/BarcodeProcessor.h"

#include "normalize/ReadNormalizer.h"
#include "utils/batching.h"
#include "utils/errors.h"
#include "utils/log_utils.h"
#include "whitelist/WhitelistIndex.h"

#include <cxxpool.h>
#include <spdlog/spdlog.h>

#include <future>
#include <stdexcept>
#include <string>

namespace bcfix::pipeline {

namespace {

// Runs worker(tid, start, end) over contiguous partitions of [0, num_items) on a thread pool and
// waits for all of them. Returns the number of partitions used.
template <typename Worker>
std::size_t run_partitioned(const int32_t num_items,
                            const int32_t num_threads,
                            const Worker& worker,
                            const std::string& description) {
    const std::vector<utils::Interval> thread_chunks =
            utils::compute_partitions(num_items, num_threads);

    cxxpool::thread_pool pool{std::size(thread_chunks)};

    std::vector<std::future<void>> futures;
    futures.reserve(std::size(thread_chunks));
    for (int32_t tid = 0; tid < static_cast<int32_t>(std::size(thread_chunks)); ++tid) {
        const auto [chunk_start, chunk_end] = thread_chunks[tid];
        futures.emplace_back(pool.push(worker, tid, chunk_start, chunk_end));
    }

    try {
        for (auto& f : futures) {
            f.get();
        }
    } catch (const std::exception& e) {
        throw std::runtime_error{"Caught exception when " + description + ": " + e.what()};
    }
    return std::size(thread_chunks);
}

}  // namespace

BarcodeProcessor::BarcodeProcessor(const whitelist::WhitelistIndex& index,
                                   const priors::PriorTable& priors,
                                   const config::CorrectionConfig& config,
                                   int num_threads)
        : m_locator(index, config.locator),
          m_corrector(index, priors, config),
          m_num_threads(num_threads) {
    if (m_num_threads <= 0) {
        throw ConfigurationError("Number of threads must be > 0, given " +
                                 std::to_string(m_num_threads));
    }
    for (int i = 0; i < m_num_threads; ++i) {
        m_caches.emplace_back(std::make_unique<correct::CorrectionCache>(config.cache_size));
    }
}

ReadResult BarcodeProcessor::evaluate(const utils::ReadRecord& read,
                                      correct::CorrectionCache* cache) const {
    ReadResult result;
    try {
        result.orientation = m_locator.locate(read.sequence, read.qstring);
        if (result.orientation.found) {
            if (read.qstring.empty()) {
                throw InputError("Read has no base qualities.");
            }
            result.correction = m_corrector.correct(result.orientation.barcode,
                                                    result.orientation.qstring, cache);
        } else {
            result.correction.reject_reason = correct::RejectReason::no_candidates;
        }
    } catch (const InputError& e) {
        utils::trace_log("Read {} not evaluated: {}", read.id, e.what());
        result.invalid_input = true;
        result.correction = correct::CorrectionDecision{};
        result.correction.reject_reason = correct::RejectReason::invalid_input;
    }

    utils::trace_log("Read {}: {} offset {} {} {}", read.id,
                     result.orientation.found ? to_string(result.orientation.orientation)
                                              : "not_found",
                     result.orientation.offset, to_string(result.correction.status),
                     result.correction.barcode);

    result.output = normalize::normalize_read(read, result.orientation, result.correction);
    return result;
}

std::vector<ReadResult> BarcodeProcessor::process_batch(
        const std::vector<utils::ReadRecord>& reads) {
    if (reads.empty()) {
        return {};
    }

    std::vector<ReadResult> results(std::size(reads));
    std::vector<ProcessingStats> thread_stats(m_num_threads);

    const auto worker = [&](const int32_t tid, const int32_t start, const int32_t end) {
        auto* cache = m_caches[tid].get();
        auto& stats = thread_stats[tid];
        for (int32_t i = start; i < end; ++i) {
            results[i] = evaluate(reads[i], cache);
            stats.add(results[i]);
        }
    };

    run_partitioned(static_cast<int32_t>(std::size(reads)), m_num_threads, worker,
                    "correcting barcodes");

    for (const auto& stats : thread_stats) {
        m_stats += stats;
    }
    log_progress();
    return results;
}

void BarcodeProcessor::log_progress() {
    if (m_stats.total < m_next_progress) {
        return;
    }
    spdlog::info(
            "Processed {} records so far; {} matched whitelist before correction, {} matched "
            "whitelist after correction",
            m_stats.total, m_stats.matched_before_correction(), m_stats.matched_after_correction());
    m_next_progress = (m_stats.total / PROGRESS_INTERVAL + 1) * PROGRESS_INTERVAL;
}

void BarcodeProcessor::log_summary() const {
    spdlog::info(
            "Processed {} records; {} matched whitelist before correction, {} matched whitelist "
            "after correction",
            m_stats.total, m_stats.matched_before_correction(), m_stats.matched_after_correction());
    spdlog::info("Exact: {}, corrected: {}, ambiguous: {}, rejected: {}, not found: {}",
                 m_stats.exact, m_stats.corrected, m_stats.ambiguous, m_stats.rejected,
                 m_stats.not_found);
    spdlog::info("Orientation: {} forward, {} reverse complement", m_stats.forward,
                 m_stats.reverse_complement);
    if (m_stats.invalid > 0) {
        spdlog::warn("{} reads had invalid input and were not corrected.", m_stats.invalid);
    }

    uint64_t hits = 0;
    uint64_t misses = 0;
    for (const auto& cache : m_caches) {
        hits += cache->hits();
        misses += cache->misses();
    }
    spdlog::debug("Correction cache: {} hits, {} misses", hits, misses);
}

PriorCounter::PriorCounter(const whitelist::WhitelistIndex& index,
                           const config::LocatorConfig& config,
                           int num_threads)
        : m_index(index), m_locator(index, config), m_num_threads(num_threads) {
    if (m_num_threads <= 0) {
        throw ConfigurationError("Number of threads must be > 0, given " +
                                 std::to_string(m_num_threads));
    }
    m_thread_accumulators.reserve(m_num_threads);
    for (int i = 0; i < m_num_threads; ++i) {
        m_thread_accumulators.emplace_back(m_index);
    }
}

void PriorCounter::count_batch(const std::vector<utils::ReadRecord>& reads) {
    if (reads.empty()) {
        return;
    }

    const auto worker = [&](const int32_t tid, const int32_t start, const int32_t end) {
        auto& accumulator = m_thread_accumulators[tid];
        for (int32_t i = start; i < end; ++i) {
            try {
                const auto decision = m_locator.locate(reads[i].sequence, reads[i].qstring);
                if (decision.found && decision.distance == 0) {
                    accumulator.accumulate(decision.barcode);
                }
            } catch (const InputError& e) {
                utils::trace_log("Read {} not counted: {}", reads[i].id, e.what());
            }
        }
    };

    run_partitioned(static_cast<int32_t>(std::size(reads)), m_num_threads, worker,
                    "counting barcodes");

    m_num_reads += reads.size();
}

priors::PriorAccumulator PriorCounter::merged_accumulator() const {
    priors::PriorAccumulator merged(m_index);
    for (const auto& accumulator : m_thread_accumulators) {
        merged.merge(accumulator);
    }
    return merged;
}

priors::PriorTable PriorCounter::finalize(double prior_floor) const {
    return merged_accumulator().finalize(prior_floor);
}

}  // namespace bcfix::pipeline
