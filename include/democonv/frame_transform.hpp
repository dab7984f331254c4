#pragma once

#include <map>
#include <string>
#include <vector>

#include <Eigen/Core>
#include <Eigen/Geometry>

#include "democonv/types.hpp"

namespace democonv {

// Rigid transform mapping robot-base-frame points into one camera frame.
struct ExtrinsicCalibration {
    std::string name;
    Eigen::Matrix3d rotation = Eigen::Matrix3d::Identity();
    Eigen::Vector3d translation = Eigen::Vector3d::Zero();

    // Camera frame back to base frame.
    ExtrinsicCalibration inverse() const;
};

// Named calibrations known to a conversion run. Built once at startup and
// passed by const reference; lookups never fall back to a default.
class CalibrationRegistry {
public:
    // Throws std::invalid_argument on an empty name, a duplicate name, or a
    // rotation that is not a proper orthonormal matrix.
    void add(const ExtrinsicCalibration& calibration);

    // Throws UnknownCalibrationError if `name` was never added.
    const ExtrinsicCalibration& at(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    std::map<std::string, ExtrinsicCalibration> entries_;
};

// Points is (N, 3) in the base frame; returns (N, 3) in the camera frame.
// Rows are transformed independently.
class FrameTransformer {
public:
    explicit FrameTransformer(const ExtrinsicCalibration& calibration);
    PositionMatrix process(const PositionMatrix& points) const;

private:
    ExtrinsicCalibration calibration_;
};

} // namespace democonv
