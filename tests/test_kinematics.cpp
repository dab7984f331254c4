#include <cmath>
#include <stdexcept>

#include <gtest/gtest.h>

#include "democonv/config.hpp"
#include "democonv/errors.hpp"
#include "democonv/kinematics.hpp"

namespace democonv {
namespace {

constexpr double kPi = 3.14159265358979323846;

KinematicModel singleJoint(const ScrewAxis& axis, const Eigen::Vector3d& home_position) {
    KinematicModel model;
    model.home.topRightCorner<3, 1>() = home_position;
    model.screw_axes.resize(6, 1);
    model.screw_axes.col(0) = axis;
    return model;
}

} // namespace

TEST(KinematicsTest, ZeroAnglesReturnHomePose) {
    // Every joint at zero reproduces the home configuration for every row.
    const KinematicModel model = ConversionConfig::default_kinematic_model();
    const KinematicsEngine engine(model);

    const JointMatrix angles = JointMatrix::Zero(3, 6);
    const PoseSequence poses = engine.process(angles);
    ASSERT_EQ(poses.size(), 3u);
    for (const auto& pose : poses) {
        EXPECT_TRUE(pose.isApprox(model.home, 1e-12));
    }

    const PositionMatrix positions = engine.positions(angles);
    ASSERT_EQ(positions.rows(), 3);
    EXPECT_NEAR(positions(0, 0), 0.536494, 1e-12);
    EXPECT_NEAR(positions(0, 1), 0.0, 1e-12);
    EXPECT_NEAR(positions(0, 2), 0.42705, 1e-12);
}

TEST(KinematicsTest, RevoluteJointAboutZRotatesHomePoint) {
    ScrewAxis axis;
    axis << 0.0, 0.0, 1.0, 0.0, 0.0, 0.0;
    const KinematicModel model = singleJoint(axis, Eigen::Vector3d(1.0, 0.0, 0.0));
    const KinematicsEngine engine(model);

    Eigen::VectorXd angles(1);
    angles << kPi / 2.0;
    const Eigen::Matrix4d pose = engine.forward(angles);
    EXPECT_NEAR(pose(0, 3), 0.0, 1e-9);
    EXPECT_NEAR(pose(1, 3), 1.0, 1e-9);
    EXPECT_NEAR(pose(2, 3), 0.0, 1e-9);
}

TEST(KinematicsTest, RevoluteAxisOffsetFromOrigin) {
    // z axis through (1, 0, 0): v = -w x q.
    ScrewAxis axis;
    axis << 0.0, 0.0, 1.0, 0.0, -1.0, 0.0;
    const KinematicModel model = singleJoint(axis, Eigen::Vector3d(2.0, 0.0, 0.0));
    const KinematicsEngine engine(model);

    Eigen::VectorXd angles(1);
    angles << kPi;
    const Eigen::Matrix4d pose = engine.forward(angles);
    EXPECT_NEAR(pose(0, 3), 0.0, 1e-9);
    EXPECT_NEAR(pose(1, 3), 0.0, 1e-9);
    EXPECT_NEAR(pose(2, 3), 0.0, 1e-9);
}

TEST(KinematicsTest, PrismaticJointTranslatesAlongAxis) {
    ScrewAxis axis;
    axis << 0.0, 0.0, 0.0, 0.0, 0.0, 1.0;
    const KinematicModel model = singleJoint(axis, Eigen::Vector3d(0.5, 0.0, 0.1));
    const KinematicsEngine engine(model);

    Eigen::VectorXd angles(1);
    angles << 0.25;
    const Eigen::Matrix4d pose = engine.forward(angles);
    EXPECT_NEAR(pose(0, 3), 0.5, 1e-12);
    EXPECT_NEAR(pose(1, 3), 0.0, 1e-12);
    EXPECT_NEAR(pose(2, 3), 0.35, 1e-12);
    const Eigen::Matrix3d rotation = pose.topLeftCorner<3, 3>();
    EXPECT_TRUE(rotation.isApprox(Eigen::Matrix3d::Identity()));
}

TEST(KinematicsTest, ExponentialsComposeBaseToTip) {
    // Revolute z at the origin followed by prismatic x.
    KinematicModel model;
    model.screw_axes.resize(6, 2);
    model.screw_axes.col(0) << 0.0, 0.0, 1.0, 0.0, 0.0, 0.0;
    model.screw_axes.col(1) << 0.0, 0.0, 0.0, 1.0, 0.0, 0.0;
    const KinematicsEngine engine(model);

    Eigen::VectorXd angles(2);
    angles << kPi / 2.0, 0.5;
    const Eigen::Matrix4d pose = engine.forward(angles);
    EXPECT_NEAR(pose(0, 3), 0.0, 1e-9);
    EXPECT_NEAR(pose(1, 3), 0.5, 1e-9);
    EXPECT_NEAR(pose(2, 3), 0.0, 1e-9);
}

TEST(KinematicsTest, NegativeAngleInvertsExponential) {
    ScrewAxis axis;
    axis << 0.0, 1.0, 0.0, -0.42705, 0.0, 0.05955;
    const Eigen::Matrix4d forward = screw_exponential(axis, 0.7);
    const Eigen::Matrix4d backward = screw_exponential(axis, -0.7);
    EXPECT_TRUE((forward * backward).isApprox(Eigen::Matrix4d::Identity(), 1e-12));
}

TEST(KinematicsTest, RowsAreIndependent) {
    const KinematicModel model = ConversionConfig::default_kinematic_model();
    const KinematicsEngine engine(model);

    JointMatrix angles(2, 6);
    angles << 0.1, -0.2, 0.3, 0.0, 0.5, -0.1,
              0.4, 0.2, -0.3, 0.1, 0.0, 0.2;
    const PositionMatrix both = engine.positions(angles);
    const PositionMatrix second = engine.positions(angles.bottomRows(1));
    EXPECT_TRUE(both.row(1).isApprox(second.row(0), 1e-12));
}

TEST(KinematicsTest, WrongJointCountThrows) {
    const KinematicModel model = ConversionConfig::default_kinematic_model();
    const KinematicsEngine engine(model);

    EXPECT_THROW(engine.process(JointMatrix::Zero(4, 5)), ShapeMismatchError);
    EXPECT_THROW(engine.forward(Eigen::VectorXd::Zero(7)), ShapeMismatchError);
}

TEST(KinematicsTest, ValidateModelRejectsBadAxes) {
    KinematicModel model = ConversionConfig::default_kinematic_model();
    EXPECT_NO_THROW(validate_model(model));

    model.screw_axes(2, 0) = 2.0;
    EXPECT_THROW(validate_model(model), std::invalid_argument);

    KinematicModel empty;
    EXPECT_THROW(validate_model(empty), std::invalid_argument);

    KinematicModel bad_home = ConversionConfig::default_kinematic_model();
    bad_home.home(3, 0) = 1.0;
    EXPECT_THROW(validate_model(bad_home), std::invalid_argument);
}

} // namespace democonv
