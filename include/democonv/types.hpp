#pragma once
// Matrix aliases shared across the conversion stages.
// All time-indexed matrices are row-major with one row per timestep, matching
// the HDF5 memory layout so they can be written without a transpose.

#include <Eigen/Core>

namespace democonv {

// [T, J] joint angles, efforts, velocities or commanded actions.
using JointMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// [T, 3] positions.
using PositionMatrix = Eigen::Matrix<double, Eigen::Dynamic, 3, Eigen::RowMajor>;

// [T, 3 * future_points_count] flattened trajectory windows.
using WindowMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

} // namespace democonv
