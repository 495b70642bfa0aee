#pragma once

#include <cstdint>
#include <vector>

namespace bcfix::utils {

struct Interval {
    int32_t start = 0;
    int32_t end = 0;

    int32_t length() const { return end - start; }
};

/**
 * \brief Utility function to determine partitions for multithreading. For example,
 *          num_items is the number of reads in a batch, while num_partitions is the number
 *          of threads. The items are then chunked into as equal number of bins as possible.
 * \param num_items Number of items to process.
 * \param num_partitions Number of threads/buckets/partitions to divide the items into.
 * \returns Vector of intervals which is the length of min(num_items, num_partitions). Each
 *          partition is given with a start (zero-based) and end (non-inclusive) item ID.
 */
std::vector<Interval> compute_partitions(int32_t num_items, int32_t num_partitions);

}  // namespace bcfix::utils
