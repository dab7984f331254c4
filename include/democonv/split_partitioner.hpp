#pragma once

#include <vector>

#include "democonv/config.hpp"

namespace democonv {

struct SplitAssignment {
    std::vector<int> train;
    std::vector<int> val;
};

// Seeded train/validation partition of demo indices.
// round(val_ratio * n) indices go to val, the rest to train; both lists are
// returned in ascending order. The shuffle draws straight from std::mt19937,
// whose sequence is fixed by the standard, so a seed gives the same split on
// every platform.
class SplitPartitioner {
public:
    // Throws std::invalid_argument if val_ratio is outside (0, 1).
    explicit SplitPartitioner(const SplitConfig& config);

    // Throws EmptyDatasetError if demo_indices is empty.
    SplitAssignment process(const std::vector<int>& demo_indices) const;

private:
    SplitConfig config_;
};

} // namespace democonv
