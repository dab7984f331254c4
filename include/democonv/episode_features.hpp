#pragma once
// Per-episode derived arrays: kinematics, camera-frame positions and trajectory labels.

#include "democonv/episode_file.hpp"
#include "democonv/frame_transform.hpp"
#include "democonv/kinematics.hpp"
#include "democonv/trajectory_window.hpp"
#include "democonv/types.hpp"

namespace democonv {

// Columns [offset, offset + width) of the bimanual joint vector.
struct ArmSlice {
    Eigen::Index offset = 0;
    Eigen::Index width = 0;
};

struct EpisodeFeatures {
    JointMatrix joint_positions;   // measured, arm slice
    PositionMatrix ee_pose;        // camera frame, from measured joints
    WindowMatrix future_trajectory; // windows over ee_pose
    JointMatrix action_joints;     // commanded, arm slice
    PositionMatrix action_xyz;     // camera frame, from commanded joints
};

// Stateless apart from const references to shared, read-only stages, so one
// instance can be used from several worker threads.
class FeatureExtractor {
public:
    FeatureExtractor(const ArmSlice& slice,
                     const KinematicsEngine& kinematics,
                     const FrameTransformer& transformer,
                     const TrajectoryWindowGenerator& windows);

    // Throws ShapeMismatchError if the episode has fewer joint columns than the slice needs.
    EpisodeFeatures process(const RawEpisode& episode) const;

    // Camera-frame end-effector positions for a full [T, J] joint matrix.
    PositionMatrix camera_positions(const JointMatrix& joints) const;

private:
    JointMatrix arm_columns(const JointMatrix& joints, const RawEpisode& episode) const;

    ArmSlice slice_;
    const KinematicsEngine& kinematics_;
    const FrameTransformer& transformer_;
    const TrajectoryWindowGenerator& windows_;
};

} // namespace democonv
