#include "democonv/kinematics.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include <Eigen/Dense>

#include "democonv/errors.hpp"

namespace democonv {
namespace {

constexpr double kNearZero = 1e-9;
constexpr double kUnitTolerance = 1e-6;

Eigen::Matrix3d skew(const Eigen::Vector3d& v) {
    Eigen::Matrix3d m;
    m << 0.0, -v.z(), v.y(),
         v.z(), 0.0, -v.x(),
         -v.y(), v.x(), 0.0;
    return m;
}

} // namespace

void validate_model(const KinematicModel& model) {
    if (model.joint_count() == 0) {
        throw std::invalid_argument("Kinematic model has no screw axes.");
    }

    const Eigen::RowVector4d last_row = model.home.row(3);
    if (!last_row.isApprox(Eigen::RowVector4d(0.0, 0.0, 0.0, 1.0))) {
        throw std::invalid_argument("Kinematic home configuration last row must be [0, 0, 0, 1].");
    }
    const Eigen::Matrix3d rotation = model.home.topLeftCorner<3, 3>();
    if (!(rotation.transpose() * rotation).isApprox(Eigen::Matrix3d::Identity(), 1e-6)) {
        throw std::invalid_argument("Kinematic home configuration rotation is not orthonormal.");
    }

    for (Eigen::Index j = 0; j < model.joint_count(); ++j) {
        const double w_norm = model.screw_axes.col(j).head<3>().norm();
        const double v_norm = model.screw_axes.col(j).tail<3>().norm();
        const bool revolute = std::abs(w_norm - 1.0) < kUnitTolerance;
        const bool prismatic = w_norm < kNearZero && std::abs(v_norm - 1.0) < kUnitTolerance;
        if (!revolute && !prismatic) {
            throw std::invalid_argument(
                "Screw axis " + std::to_string(j) +
                " must have a unit angular part or a zero angular part with a unit linear part.");
        }
    }
}

Eigen::Matrix4d screw_exponential(const ScrewAxis& axis, double theta) {
    const Eigen::Vector3d w = axis.head<3>();
    const Eigen::Vector3d v = axis.tail<3>();

    Eigen::Matrix4d out = Eigen::Matrix4d::Identity();
    const double w_norm = w.norm();
    if (w_norm * std::abs(theta) < kNearZero) {
        out.topRightCorner<3, 1>() = v * theta;
        return out;
    }

    // Rotation angle and unit axis of the scaled twist.
    const double angle = w_norm * theta;
    const Eigen::Matrix3d w_hat = skew(w / w_norm);
    const Eigen::Matrix3d w_hat_sq = w_hat * w_hat;
    const double s = std::sin(angle);
    const double c = std::cos(angle);

    const Eigen::Matrix3d rotation = Eigen::Matrix3d::Identity() + s * w_hat + (1.0 - c) * w_hat_sq;
    const Eigen::Matrix3d g =
        Eigen::Matrix3d::Identity() * angle + (1.0 - c) * w_hat + (angle - s) * w_hat_sq;

    out.topLeftCorner<3, 3>() = rotation;
    out.topRightCorner<3, 1>() = g * (v / w_norm);
    return out;
}

KinematicsEngine::KinematicsEngine(const KinematicModel& model) : model_(model) {}

Eigen::Matrix4d KinematicsEngine::forward(const Eigen::Ref<const Eigen::VectorXd>& angles) const {
    if (angles.size() != model_.joint_count()) {
        throw ShapeMismatchError(
            "Joint vector has " + std::to_string(angles.size()) + " entries, kinematic model expects " +
            std::to_string(model_.joint_count()));
    }

    // Space-frame product of exponentials: e^[S1]q1 ... e^[Sn]qn M.
    Eigen::Matrix4d pose = Eigen::Matrix4d::Identity();
    for (Eigen::Index j = 0; j < model_.joint_count(); ++j) {
        pose = pose * screw_exponential(model_.screw_axes.col(j), angles(j));
    }
    return pose * model_.home;
}

PoseSequence KinematicsEngine::process(const JointMatrix& angles) const {
    if (angles.cols() != model_.joint_count()) {
        throw ShapeMismatchError(
            "Joint matrix has " + std::to_string(angles.cols()) + " columns, kinematic model expects " +
            std::to_string(model_.joint_count()));
    }

    PoseSequence poses;
    poses.reserve(static_cast<std::size_t>(angles.rows()));
    for (Eigen::Index t = 0; t < angles.rows(); ++t) {
        poses.push_back(forward(angles.row(t).transpose()));
    }
    return poses;
}

PositionMatrix KinematicsEngine::positions(const JointMatrix& angles) const {
    const PoseSequence poses = process(angles);
    PositionMatrix out(static_cast<Eigen::Index>(poses.size()), 3);
    for (Eigen::Index t = 0; t < out.rows(); ++t) {
        out.row(t) = poses[static_cast<std::size_t>(t)].topRightCorner<3, 1>().transpose();
    }
    return out;
}

} // namespace democonv
