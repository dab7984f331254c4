#include "democonv/split_partitioner.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

#include "democonv/errors.hpp"

namespace democonv {

SplitPartitioner::SplitPartitioner(const SplitConfig& config) : config_(config) {
    if (!(config_.val_ratio > 0.0 && config_.val_ratio < 1.0)) {
        throw std::invalid_argument("`val_ratio` must be in (0, 1), got " + std::to_string(config_.val_ratio));
    }
}

SplitAssignment SplitPartitioner::process(const std::vector<int>& demo_indices) const {
    if (demo_indices.empty()) {
        throw EmptyDatasetError("No demos to split into train and validation sets.");
    }

    std::vector<int> order(demo_indices);
    std::sort(order.begin(), order.end());

    // Fisher-Yates with plain modulo draws; std::shuffle and
    // std::uniform_int_distribution are implementation-defined.
    std::mt19937 rng(config_.seed);
    for (std::size_t i = order.size() - 1; i > 0; --i) {
        const std::size_t j = static_cast<std::size_t>(rng() % (i + 1));
        std::swap(order[i], order[j]);
    }

    const auto val_count = static_cast<std::size_t>(
        std::llround(config_.val_ratio * static_cast<double>(order.size())));

    SplitAssignment split;
    split.val.assign(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(val_count));
    split.train.assign(order.begin() + static_cast<std::ptrdiff_t>(val_count), order.end());
    std::sort(split.val.begin(), split.val.end());
    std::sort(split.train.begin(), split.train.end());
    return split;
}

} // namespace democonv
