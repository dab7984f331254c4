#include "democonv/frame_transform.hpp"

#include <cmath>
#include <stdexcept>

#include <Eigen/Dense>

#include "democonv/errors.hpp"

namespace democonv {
namespace {

constexpr double kRotationTolerance = 1e-3;

bool is_proper_rotation(const Eigen::Matrix3d& rotation) {
    const Eigen::Matrix3d gram = rotation.transpose() * rotation;
    if ((gram - Eigen::Matrix3d::Identity()).cwiseAbs().maxCoeff() > kRotationTolerance) {
        return false;
    }
    return std::abs(rotation.determinant() - 1.0) < kRotationTolerance;
}

} // namespace

ExtrinsicCalibration ExtrinsicCalibration::inverse() const {
    ExtrinsicCalibration inv;
    inv.name = name + "^-1";
    inv.rotation = rotation.transpose();
    inv.translation = -(rotation.transpose() * translation);
    return inv;
}

void CalibrationRegistry::add(const ExtrinsicCalibration& calibration) {
    if (calibration.name.empty()) {
        throw std::invalid_argument("Calibration name must not be empty.");
    }
    if (entries_.count(calibration.name) != 0) {
        throw std::invalid_argument("Duplicate calibration: " + calibration.name);
    }
    if (!is_proper_rotation(calibration.rotation)) {
        throw std::invalid_argument(
            "Calibration `" + calibration.name + "` rotation is not orthonormal with determinant +1.");
    }
    entries_.emplace(calibration.name, calibration);
}

const ExtrinsicCalibration& CalibrationRegistry::at(const std::string& name) const {
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        std::string known;
        for (const auto& key : names()) {
            known += known.empty() ? key : ", " + key;
        }
        throw UnknownCalibrationError(
            "Unknown calibration `" + name + "` (known: " + (known.empty() ? "none" : known) + ")");
    }
    return it->second;
}

bool CalibrationRegistry::contains(const std::string& name) const {
    return entries_.count(name) != 0;
}

std::vector<std::string> CalibrationRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) {
        out.push_back(kv.first);
    }
    return out;
}

FrameTransformer::FrameTransformer(const ExtrinsicCalibration& calibration) : calibration_(calibration) {}

PositionMatrix FrameTransformer::process(const PositionMatrix& points) const {
    PositionMatrix out(points.rows(), 3);
    if (points.rows() == 0) {
        return out;
    }
    out = (points * calibration_.rotation.transpose()).rowwise() + calibration_.translation.transpose();
    return out;
}

} // namespace democonv
