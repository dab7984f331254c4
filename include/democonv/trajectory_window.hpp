#pragma once

#include <Eigen/Core>

#include "democonv/types.hpp"

namespace democonv {

struct TrajectoryWindowConfig {
    int point_gap = 15;
    int future_points_count = 10;
};

// Future-trajectory labels: window i holds the positions at
// min(N - 1, i + k * point_gap) for k = 1..future_points_count, flattened.
// Near the end of a sequence the final position is repeated so every window
// has the same width.
// Throws std::invalid_argument if point_gap or future_points_count is < 1.
class TrajectoryWindowGenerator {
public:
    explicit TrajectoryWindowGenerator(const TrajectoryWindowConfig& config);

    Eigen::Index width() const { return 3 * static_cast<Eigen::Index>(config_.future_points_count); }

    // Single window for query index i; positions must be non-empty and
    // 0 <= i < positions.rows().
    Eigen::RowVectorXd window(const PositionMatrix& positions, Eigen::Index i) const;

    // One window per row of positions: (N, width()).
    WindowMatrix process(const PositionMatrix& positions) const;

private:
    TrajectoryWindowConfig config_;
};

} // namespace democonv
