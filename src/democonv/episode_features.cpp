#include "democonv/episode_features.hpp"

#include <string>

#include "democonv/errors.hpp"

namespace democonv {

FeatureExtractor::FeatureExtractor(const ArmSlice& slice,
                                   const KinematicsEngine& kinematics,
                                   const FrameTransformer& transformer,
                                   const TrajectoryWindowGenerator& windows)
    : slice_(slice), kinematics_(kinematics), transformer_(transformer), windows_(windows) {}

JointMatrix FeatureExtractor::arm_columns(const JointMatrix& joints, const RawEpisode& episode) const {
    if (joints.cols() < slice_.offset + slice_.width) {
        throw ShapeMismatchError("Episode " + episode.path.string() + " has " + std::to_string(joints.cols()) +
                                 " joint columns, arm slice needs columns [" + std::to_string(slice_.offset) +
                                 ", " + std::to_string(slice_.offset + slice_.width) + ")");
    }
    return joints.middleCols(slice_.offset, slice_.width);
}

PositionMatrix FeatureExtractor::camera_positions(const JointMatrix& joints) const {
    // FK only sees the arm joints; trailing slice columns (gripper) are ignored.
    const Eigen::Index n = kinematics_.model().joint_count();
    if (joints.cols() < n) {
        throw ShapeMismatchError("Joint matrix has " + std::to_string(joints.cols()) +
                                 " columns, kinematic model needs " + std::to_string(n));
    }
    const JointMatrix arm = joints.leftCols(n);
    return transformer_.process(kinematics_.positions(arm));
}

EpisodeFeatures FeatureExtractor::process(const RawEpisode& episode) const {
    EpisodeFeatures features;
    features.joint_positions = arm_columns(episode.joint_positions, episode);
    features.action_joints = arm_columns(episode.commanded_actions, episode);

    features.ee_pose = camera_positions(features.joint_positions);
    features.future_trajectory = windows_.process(features.ee_pose);

    // Action targets come from a second kinematics pass over the commanded
    // joints, not from the measured ones.
    features.action_xyz = camera_positions(features.action_joints);
    return features;
}

} // namespace democonv
