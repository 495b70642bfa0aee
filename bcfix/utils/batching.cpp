#include "utils/batching.h"

#include <stdexcept>
#include <string>

namespace bcfix::utils {

std::vector<Interval> compute_partitions(const int32_t num_items, const int32_t num_partitions) {
    if (num_partitions <= 0) {
        throw std::invalid_argument("Number of partitions must be > 0, given " +
                                    std::to_string(num_partitions));
    }
    std::vector<Interval> chunks;
    const int32_t chunk_size = num_items / num_partitions;
    std::vector<int32_t> chunk_sizes(num_partitions, chunk_size);
    for (int32_t i = 0; i < (num_items % num_partitions); ++i) {
        ++chunk_sizes[i];
    }
    int32_t sum = 0;
    for (const int32_t v : chunk_sizes) {
        if (v == 0) {
            continue;
        }
        chunks.emplace_back(Interval{sum, sum + v});
        sum += v;
    }
    if (sum != num_items) {
        throw std::runtime_error{
                "Wrong sum of items divided into chunks! num_items = " + std::to_string(num_items) +
                ", num_partitions = " + std::to_string(num_partitions) +
                ", sum = " + std::to_string(sum)};
    }
    return chunks;
}

}  // namespace bcfix::utils
