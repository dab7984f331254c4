#pragma once

#include <vector>

#include <Eigen/Core>
#include <Eigen/StdVector>

#include "democonv/types.hpp"

namespace democonv {

using ScrewAxis = Eigen::Matrix<double, 6, 1>; // [wx, wy, wz, vx, vy, vz]

// Product-of-exponentials description of a serial arm.
// Screw axes are expressed in the base (space) frame; `home` is the end-effector
// pose with every joint at zero.
struct KinematicModel {
    Eigen::Matrix4d home = Eigen::Matrix4d::Identity();
    Eigen::Matrix<double, 6, Eigen::Dynamic> screw_axes;

    Eigen::Index joint_count() const { return screw_axes.cols(); }
};

// Throws std::invalid_argument if `home` is not a rigid transform, there are no
// screw axes, or an axis has neither a unit rotation nor a unit translation part.
void validate_model(const KinematicModel& model);

// se(3) matrix exponential of `axis` scaled by `theta`.
Eigen::Matrix4d screw_exponential(const ScrewAxis& axis, double theta);

using PoseSequence = std::vector<Eigen::Matrix4d, Eigen::aligned_allocator<Eigen::Matrix4d>>;

// Forward kinematics over a joint-angle sequence.
// The model is held by reference and must outlive the engine; it is never
// mutated, so one model can back engines on several threads.
class KinematicsEngine {
public:
    explicit KinematicsEngine(const KinematicModel& model);

    // Throws ShapeMismatchError if angles.size() != joint_count().
    Eigen::Matrix4d forward(const Eigen::Ref<const Eigen::VectorXd>& angles) const;

    // Angles is (T, n); returns T poses.
    PoseSequence process(const JointMatrix& angles) const;

    // Angles is (T, n); returns (T, 3) end-effector translations.
    PositionMatrix positions(const JointMatrix& angles) const;

    const KinematicModel& model() const { return model_; }

private:
    const KinematicModel& model_;
};

} // namespace democonv
