#include "democonv/trajectory_window.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace democonv {

TrajectoryWindowGenerator::TrajectoryWindowGenerator(const TrajectoryWindowConfig& config) : config_(config) {
    if (config_.point_gap < 1) {
        throw std::invalid_argument("`point_gap` must be >= 1, got " + std::to_string(config_.point_gap));
    }
    if (config_.future_points_count < 1) {
        throw std::invalid_argument(
            "`future_points_count` must be >= 1, got " + std::to_string(config_.future_points_count));
    }
}

Eigen::RowVectorXd TrajectoryWindowGenerator::window(const PositionMatrix& positions, Eigen::Index i) const {
    const Eigen::Index n = positions.rows();
    if (i < 0 || i >= n) {
        throw std::out_of_range(
            "Window index " + std::to_string(i) + " outside sequence of length " + std::to_string(n));
    }

    Eigen::RowVectorXd out(width());
    for (Eigen::Index k = 1; k <= config_.future_points_count; ++k) {
        const Eigen::Index source = std::min(n - 1, i + k * config_.point_gap);
        out.segment<3>(3 * (k - 1)) = positions.row(source);
    }
    return out;
}

WindowMatrix TrajectoryWindowGenerator::process(const PositionMatrix& positions) const {
    WindowMatrix out(positions.rows(), width());
    for (Eigen::Index i = 0; i < positions.rows(); ++i) {
        out.row(i) = window(positions, i);
    }
    return out;
}

} // namespace democonv
