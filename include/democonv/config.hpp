#pragma once
// Conversion configuration: YAML file plus command-line overrides.

#include <cstdint>
#include <optional>
#include <string>

#include "democonv/frame_transform.hpp"
#include "democonv/kinematics.hpp"
#include "democonv/logger.hpp"
#include "democonv/trajectory_window.hpp"

namespace democonv {

enum class ArmSide {
    Left,
    Right
};

enum class SourceType {
    Hand,
    Robot
};

// Sampling parameters and stored label for one source type.
struct SourceProfile {
    SourceType type = SourceType::Robot;
    TrajectoryWindowConfig window;
    int label = 0;
};

struct EpisodeConfig {
    // One capture group holding the decimal episode index.
    std::string pattern = "^episode_([0-9]+)\\.(hdf5|h5)$";
};

struct ArmConfig {
    // Columns per arm in the bimanual joint vector (six joints plus gripper).
    int joints_per_arm = 7;
};

struct CameraMapping {
    std::string source;
    std::string output;
};

struct CameraConfig {
    CameraMapping front{"cam_high", "front_img_1"};
    CameraMapping wrist{"cam_{arm}_wrist", "{arm}_wrist_img"};
};

struct OutputConfig {
    std::string env_args = "{}";
    std::size_t chunk_cache_bytes = 2u * 1024u * 1024u;
    int image_compression_level = 0;
};

struct SplitConfig {
    double val_ratio = 0.2;
    std::uint32_t seed = 0;
    std::string train_key = "train";
    std::string val_key = "val";
};

struct ConversionOverrides {
    std::optional<std::string> config_path;
    std::optional<std::string> dataset_dir;
    std::optional<std::string> output_path;
    std::optional<std::string> calibration;
    std::optional<ArmSide> arm;
    std::optional<SourceType> source_type;
    std::optional<double> val_ratio;
    std::optional<std::uint32_t> seed;
    std::optional<int> workers;
    std::optional<LogLevel> log_level;

    // Throws std::invalid_argument on unknown flags, missing values or bad enum values.
    static ConversionOverrides from_args(int argc, char** argv);
};

struct ConversionConfig {
    std::string dataset_dir;
    std::string output_path;
    std::string calibration;
    ArmSide arm = ArmSide::Right;
    SourceType source_type = SourceType::Robot;

    LogLevel log_level = LogLevel::Info;
    int workers = 1;

    EpisodeConfig episodes;
    ArmConfig arm_layout;
    CameraConfig cameras;
    OutputConfig output;
    SplitConfig split;

    SourceProfile hand{SourceType::Hand, TrajectoryWindowConfig{4, 10}, 1};
    SourceProfile robot{SourceType::Robot, TrajectoryWindowConfig{15, 10}, 0};

    KinematicModel kinematics = default_kinematic_model();
    CalibrationRegistry calibrations;

    const SourceProfile& profile() const;

    // First column of the selected arm in the bimanual joint vector.
    int joint_offset() const;

    // Camera names with `{arm}` replaced by the selected side.
    CameraMapping front_camera() const;
    CameraMapping wrist_camera() const;

    void apply_overrides(const ConversionOverrides& overrides);

    // Throws std::invalid_argument if a required field is missing or a value is out of range.
    void validate() const;

    // ViperX-300s 6-DoF arm.
    static KinematicModel default_kinematic_model();
};

// Loads a converter YAML file from the given path.
// Applies hardcoded defaults first, then overrides with values from the file.
// Throws std::runtime_error if the file cannot be opened or parsed.
ConversionConfig load_config(const std::string& path);

ArmSide parse_arm(const std::string& value);
SourceType parse_source_type(const std::string& value);
const char* to_string(ArmSide arm);
const char* to_string(SourceType type);

} // namespace democonv
