#include "democonv/config.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace democonv {
namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string replace_arm(std::string value, ArmSide arm) {
    const std::string token = "{arm}";
    const std::string side = to_string(arm);
    std::size_t pos = 0;
    while ((pos = value.find(token, pos)) != std::string::npos) {
        value.replace(pos, token.size(), side);
        pos += side.size();
    }
    return value;
}

std::vector<double> read_row(const YAML::Node& node, std::size_t expected, const std::string& field) {
    if (!node.IsSequence() || node.size() != expected) {
        throw std::runtime_error(
            "Config field `" + field + "` must be a list of " + std::to_string(expected) + " numbers.");
    }
    std::vector<double> row;
    row.reserve(expected);
    for (const auto& value : node) {
        row.push_back(value.as<double>());
    }
    return row;
}

Eigen::Matrix4d read_matrix4(const YAML::Node& node, const std::string& field) {
    if (!node.IsSequence() || node.size() != 4) {
        throw std::runtime_error("Config field `" + field + "` must be a 4x4 list of rows.");
    }
    Eigen::Matrix4d m;
    for (std::size_t r = 0; r < 4; ++r) {
        const auto row = read_row(node[r], 4, field);
        for (std::size_t c = 0; c < 4; ++c) {
            m(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = row[c];
        }
    }
    return m;
}

Eigen::Matrix3d read_matrix3(const YAML::Node& node, const std::string& field) {
    if (!node.IsSequence() || node.size() != 3) {
        throw std::runtime_error("Config field `" + field + "` must be a 3x3 list of rows.");
    }
    Eigen::Matrix3d m;
    for (std::size_t r = 0; r < 3; ++r) {
        const auto row = read_row(node[r], 3, field);
        for (std::size_t c = 0; c < 3; ++c) {
            m(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = row[c];
        }
    }
    return m;
}

void read_profile(const YAML::Node& node, SourceProfile& profile) {
    if (!node) {
        return;
    }
    profile.window.point_gap = node["point_gap"].as<int>(profile.window.point_gap);
    profile.window.future_points_count =
        node["future_points_count"].as<int>(profile.window.future_points_count);
    profile.label = node["label"].as<int>(profile.label);
}

void read_camera(const YAML::Node& node, CameraMapping& mapping) {
    if (!node) {
        return;
    }
    mapping.source = node["source"].as<std::string>(mapping.source);
    mapping.output = node["output"].as<std::string>(mapping.output);
}

// Accepts `--name value` and `--name=value`.
bool match_flag(const std::string& arg, const std::string& name, int& i, int argc, char** argv, std::string& value) {
    if (arg == name) {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + name);
        }
        value = argv[++i];
        return true;
    }
    const std::string prefix = name + "=";
    if (arg.rfind(prefix, 0) == 0) {
        value = arg.substr(prefix.size());
        return true;
    }
    return false;
}

// Whole-string numeric parse; rejects trailing characters and out-of-range values.
long long parse_integer(const std::string& flag, const std::string& value, long long min, long long max) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value + " (expected an integer)");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value + " (expected an integer)");
    }
    if (parsed < min || parsed > max) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value + " (expected " +
                                    std::to_string(min) + ".." + std::to_string(max) + ")");
    }
    return parsed;
}

double parse_real(const std::string& flag, const std::string& value) {
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value + " (expected a number)");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value + " (expected a number)");
    }
    return parsed;
}

} // namespace

const char* to_string(ArmSide arm) {
    switch (arm) {
        case ArmSide::Left:
            return "left";
        case ArmSide::Right:
            return "right";
    }
    return "right";
}

const char* to_string(SourceType type) {
    switch (type) {
        case SourceType::Hand:
            return "hand";
        case SourceType::Robot:
            return "robot";
    }
    return "robot";
}

ArmSide parse_arm(const std::string& value) {
    const auto lower = to_lower(value);
    if (lower == "left") {
        return ArmSide::Left;
    }
    if (lower == "right") {
        return ArmSide::Right;
    }
    throw std::invalid_argument("Unknown arm: " + value + " (expected left or right)");
}

SourceType parse_source_type(const std::string& value) {
    const auto lower = to_lower(value);
    if (lower == "hand") {
        return SourceType::Hand;
    }
    if (lower == "robot") {
        return SourceType::Robot;
    }
    throw std::invalid_argument("Unknown data type: " + value + " (expected hand or robot)");
}

KinematicModel ConversionConfig::default_kinematic_model() {
    KinematicModel model;
    model.home << 1.0, 0.0, 0.0, 0.536494,
                  0.0, 1.0, 0.0, 0.0,
                  0.0, 0.0, 1.0, 0.42705,
                  0.0, 0.0, 0.0, 1.0;

    model.screw_axes.resize(6, 6);
    model.screw_axes.col(0) << 0.0, 0.0, 1.0, 0.0, 0.0, 0.0;
    model.screw_axes.col(1) << 0.0, 1.0, 0.0, -0.12705, 0.0, 0.0;
    model.screw_axes.col(2) << 0.0, 1.0, 0.0, -0.42705, 0.0, 0.05955;
    model.screw_axes.col(3) << 1.0, 0.0, 0.0, 0.0, 0.42705, 0.0;
    model.screw_axes.col(4) << 0.0, 1.0, 0.0, -0.42705, 0.0, 0.35955;
    model.screw_axes.col(5) << 1.0, 0.0, 0.0, 0.0, 0.42705, 0.0;
    return model;
}

const SourceProfile& ConversionConfig::profile() const {
    switch (source_type) {
        case SourceType::Hand:
            return hand;
        case SourceType::Robot:
            return robot;
    }
    return robot;
}

int ConversionConfig::joint_offset() const {
    return arm == ArmSide::Left ? 0 : arm_layout.joints_per_arm;
}

CameraMapping ConversionConfig::front_camera() const {
    return CameraMapping{replace_arm(cameras.front.source, arm), replace_arm(cameras.front.output, arm)};
}

CameraMapping ConversionConfig::wrist_camera() const {
    return CameraMapping{replace_arm(cameras.wrist.source, arm), replace_arm(cameras.wrist.output, arm)};
}

ConversionConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Failed to open config file: " + path);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    ConversionConfig cfg;
    try {
        if (root["log_level"]) {
            cfg.log_level = parse_log_level(root["log_level"].as<std::string>());
        }
        cfg.workers = root["workers"].as<int>(cfg.workers);

        cfg.episodes.pattern = root["episodes"]["pattern"].as<std::string>(cfg.episodes.pattern);
        cfg.arm_layout.joints_per_arm = root["arm"]["joints_per_arm"].as<int>(cfg.arm_layout.joints_per_arm);

        const YAML::Node kinematics = root["kinematics"];
        if (kinematics) {
            if (kinematics["home"]) {
                cfg.kinematics.home = read_matrix4(kinematics["home"], "kinematics.home");
            }
            if (kinematics["screw_axes"]) {
                const YAML::Node axes = kinematics["screw_axes"];
                if (!axes.IsSequence()) {
                    throw std::runtime_error("Config field `kinematics.screw_axes` must be a list of rows.");
                }
                cfg.kinematics.screw_axes.resize(6, static_cast<Eigen::Index>(axes.size()));
                for (std::size_t j = 0; j < axes.size(); ++j) {
                    const auto row = read_row(axes[j], 6, "kinematics.screw_axes");
                    for (std::size_t k = 0; k < 6; ++k) {
                        cfg.kinematics.screw_axes(static_cast<Eigen::Index>(k), static_cast<Eigen::Index>(j)) =
                            row[k];
                    }
                }
            }
        }
        validate_model(cfg.kinematics);

        const YAML::Node calibrations = root["calibrations"];
        if (calibrations) {
            for (const auto& entry : calibrations) {
                ExtrinsicCalibration calibration;
                calibration.name = entry.first.as<std::string>();
                const std::string field = "calibrations." + calibration.name;
                calibration.rotation = read_matrix3(entry.second["rotation"], field + ".rotation");
                const auto t = read_row(entry.second["translation"], 3, field + ".translation");
                calibration.translation = Eigen::Vector3d(t[0], t[1], t[2]);
                cfg.calibrations.add(calibration);
            }
        }

        read_profile(root["source_types"]["hand"], cfg.hand);
        read_profile(root["source_types"]["robot"], cfg.robot);

        read_camera(root["cameras"]["front"], cfg.cameras.front);
        read_camera(root["cameras"]["wrist"], cfg.cameras.wrist);

        cfg.output.env_args = root["output"]["env_args"].as<std::string>(cfg.output.env_args);
        cfg.output.chunk_cache_bytes =
            root["output"]["chunk_cache_bytes"].as<std::size_t>(cfg.output.chunk_cache_bytes);
        cfg.output.image_compression_level =
            root["output"]["image_compression_level"].as<int>(cfg.output.image_compression_level);

        cfg.split.val_ratio = root["split"]["val_ratio"].as<double>(cfg.split.val_ratio);
        cfg.split.seed = root["split"]["seed"].as<std::uint32_t>(cfg.split.seed);
        cfg.split.train_key = root["split"]["train_key"].as<std::string>(cfg.split.train_key);
        cfg.split.val_key = root["split"]["val_key"].as<std::string>(cfg.split.val_key);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    return cfg;
}

ConversionOverrides ConversionOverrides::from_args(int argc, char** argv) {
    ConversionOverrides overrides;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        std::string value;
        if (match_flag(arg, "--config", i, argc, argv, value)) {
            overrides.config_path = value;
        } else if (match_flag(arg, "--dataset", i, argc, argv, value)) {
            overrides.dataset_dir = value;
        } else if (match_flag(arg, "--out", i, argc, argv, value)) {
            overrides.output_path = value;
        } else if (match_flag(arg, "--extrinsics", i, argc, argv, value)) {
            overrides.calibration = value;
        } else if (match_flag(arg, "--arm", i, argc, argv, value)) {
            overrides.arm = parse_arm(value);
        } else if (match_flag(arg, "--data-type", i, argc, argv, value)) {
            overrides.source_type = parse_source_type(value);
        } else if (match_flag(arg, "--val-ratio", i, argc, argv, value)) {
            overrides.val_ratio = parse_real("--val-ratio", value);
        } else if (match_flag(arg, "--seed", i, argc, argv, value)) {
            overrides.seed = static_cast<std::uint32_t>(
                parse_integer("--seed", value, 0, std::numeric_limits<std::uint32_t>::max()));
        } else if (match_flag(arg, "--workers", i, argc, argv, value)) {
            overrides.workers =
                static_cast<int>(parse_integer("--workers", value, 1, std::numeric_limits<int>::max()));
        } else if (match_flag(arg, "--log-level", i, argc, argv, value)) {
            overrides.log_level = parse_log_level(value);
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    return overrides;
}

void ConversionConfig::apply_overrides(const ConversionOverrides& overrides) {
    if (overrides.dataset_dir.has_value()) {
        dataset_dir = *overrides.dataset_dir;
    }
    if (overrides.output_path.has_value()) {
        output_path = *overrides.output_path;
    }
    if (overrides.calibration.has_value()) {
        calibration = *overrides.calibration;
    }
    if (overrides.arm.has_value()) {
        arm = *overrides.arm;
    }
    if (overrides.source_type.has_value()) {
        source_type = *overrides.source_type;
    }
    if (overrides.val_ratio.has_value()) {
        split.val_ratio = *overrides.val_ratio;
    }
    if (overrides.seed.has_value()) {
        split.seed = *overrides.seed;
    }
    if (overrides.workers.has_value()) {
        workers = *overrides.workers;
    }
    if (overrides.log_level.has_value()) {
        log_level = *overrides.log_level;
    }
}

void ConversionConfig::validate() const {
    if (dataset_dir.empty()) {
        throw std::invalid_argument("Missing required argument --dataset");
    }
    if (output_path.empty()) {
        throw std::invalid_argument("Missing required argument --out");
    }
    if (calibration.empty()) {
        throw std::invalid_argument("Missing required argument --extrinsics");
    }
    if (!(split.val_ratio > 0.0 && split.val_ratio < 1.0)) {
        throw std::invalid_argument("`split.val_ratio` must be in (0, 1), got " + std::to_string(split.val_ratio));
    }
    if (split.train_key.empty() || split.val_key.empty() || split.train_key == split.val_key) {
        throw std::invalid_argument("Split filter keys must be non-empty and distinct.");
    }
    if (workers < 1) {
        throw std::invalid_argument("`workers` must be >= 1, got " + std::to_string(workers));
    }
    if (arm_layout.joints_per_arm < kinematics.joint_count()) {
        throw std::invalid_argument(
            "`arm.joints_per_arm` (" + std::to_string(arm_layout.joints_per_arm) +
            ") is smaller than the kinematic model joint count (" + std::to_string(kinematics.joint_count()) + ")");
    }
    if (output.image_compression_level < 0 || output.image_compression_level > 9) {
        throw std::invalid_argument("`output.image_compression_level` must be in [0, 9].");
    }
    if (cameras.front.output.empty() || cameras.wrist.output.empty()) {
        throw std::invalid_argument("Camera output names must not be empty.");
    }
    if (front_camera().output == wrist_camera().output) {
        throw std::invalid_argument("Front and wrist cameras map to the same output `" + front_camera().output + "`.");
    }
}

} // namespace democonv
