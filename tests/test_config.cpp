#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "EpisodeFixtures.hpp"
#include "democonv/config.hpp"

namespace democonv {
namespace {

ConversionOverrides parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "demo_converter");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return ConversionOverrides::from_args(static_cast<int>(argv.size()), argv.data());
}

ConversionConfig completeConfig() {
    ConversionConfig config;
    config.dataset_dir = "/tmp/episodes";
    config.output_path = "/tmp/out.hdf5";
    config.calibration = "front_rig_left";
    return config;
}

} // namespace

TEST(ConfigTest, ParsesConfigFile) {
    // Validates parsing of every section of the converter YAML.
    const auto root = fixtures::makeTempRoot("democonv_config");
    const auto path = root / "converter.yaml";
    std::ofstream out(path);
    out << "log_level: debug\n";
    out << "workers: 3\n";
    out << "episodes:\n  pattern: \"^ep([0-9]+)\\\\.h5$\"\n";
    out << "arm:\n  joints_per_arm: 8\n";
    out << "calibrations:\n";
    out << "  lab:\n";
    out << "    rotation: [[1, 0, 0], [0, 1, 0], [0, 0, 1]]\n";
    out << "    translation: [0.1, 0.2, 0.3]\n";
    out << "source_types:\n  hand:\n    point_gap: 6\n    label: 5\n";
    out << "cameras:\n  front:\n    source: cam_front\n    output: front_rgb\n";
    out << "output:\n  env_args: '{\"env_name\": \"sim\"}'\n  image_compression_level: 4\n";
    out << "split:\n  val_ratio: 0.3\n  seed: 17\n  train_key: train_set\n  val_key: valid\n";
    out.close();

    const auto config = load_config(path.string());
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.workers, 3);
    EXPECT_EQ(config.episodes.pattern, "^ep([0-9]+)\\.h5$");
    EXPECT_EQ(config.arm_layout.joints_per_arm, 8);
    ASSERT_TRUE(config.calibrations.contains("lab"));
    EXPECT_TRUE(config.calibrations.at("lab").translation.isApprox(Eigen::Vector3d(0.1, 0.2, 0.3)));
    EXPECT_EQ(config.hand.window.point_gap, 6);
    EXPECT_EQ(config.hand.window.future_points_count, 10);
    EXPECT_EQ(config.hand.label, 5);
    EXPECT_EQ(config.robot.window.point_gap, 15);
    EXPECT_EQ(config.cameras.front.source, "cam_front");
    EXPECT_EQ(config.cameras.front.output, "front_rgb");
    EXPECT_EQ(config.cameras.wrist.source, "cam_{arm}_wrist");
    EXPECT_EQ(config.output.env_args, "{\"env_name\": \"sim\"}");
    EXPECT_EQ(config.output.image_compression_level, 4);
    EXPECT_DOUBLE_EQ(config.split.val_ratio, 0.3);
    EXPECT_EQ(config.split.seed, 17u);
    EXPECT_EQ(config.split.train_key, "train_set");
    EXPECT_EQ(config.split.val_key, "valid");
    EXPECT_EQ(config.kinematics.joint_count(), 6);

    std::filesystem::remove_all(root);
}

TEST(ConfigTest, LoadsShippedConfig) {
    const auto config = load_config(std::string(DEMOCONV_SOURCE_DIR) + "/config/converter_config.yaml");
    EXPECT_TRUE(config.calibrations.contains("front_rig_left"));
    EXPECT_TRUE(config.calibrations.contains("front_rig_right"));
    EXPECT_EQ(config.hand.window.point_gap, 4);
    EXPECT_EQ(config.hand.label, 1);
    EXPECT_EQ(config.robot.window.point_gap, 15);
    EXPECT_EQ(config.robot.label, 0);
    EXPECT_TRUE(config.kinematics.home.isApprox(ConversionConfig::default_kinematic_model().home));
    EXPECT_TRUE(config.kinematics.screw_axes.isApprox(ConversionConfig::default_kinematic_model().screw_axes));
}

TEST(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(load_config("/tmp/democonv_missing_config.yaml"), std::runtime_error);
}

TEST(ConfigTest, InvalidCalibrationRejected) {
    // A non-orthonormal rotation never reaches the registry.
    const auto root = fixtures::makeTempRoot("democonv_config_bad");
    const auto path = root / "converter.yaml";
    std::ofstream out(path);
    out << "calibrations:\n";
    out << "  skewed:\n";
    out << "    rotation: [[2, 0, 0], [0, 1, 0], [0, 0, 1]]\n";
    out << "    translation: [0, 0, 0]\n";
    out.close();

    EXPECT_THROW(load_config(path.string()), std::runtime_error);
    std::filesystem::remove_all(root);
}

TEST(ConfigTest, OverridesApply) {
    // Ensures CLI overrides update only specified fields.
    const auto overrides = parseArgs({"--dataset", "/data/run1", "--out=/data/out.hdf5", "--extrinsics",
                                      "front_rig_right", "--arm", "left", "--data-type=hand", "--seed", "9"});

    ConversionConfig config;
    config.workers = 4;
    config.apply_overrides(overrides);
    EXPECT_EQ(config.dataset_dir, "/data/run1");
    EXPECT_EQ(config.output_path, "/data/out.hdf5");
    EXPECT_EQ(config.calibration, "front_rig_right");
    EXPECT_EQ(config.arm, ArmSide::Left);
    EXPECT_EQ(config.source_type, SourceType::Hand);
    EXPECT_EQ(config.split.seed, 9u);
    EXPECT_DOUBLE_EQ(config.split.val_ratio, 0.2);
    EXPECT_EQ(config.workers, 4);
    EXPECT_EQ(config.profile().window.point_gap, 4);
}

TEST(ConfigTest, RejectsBadArguments) {
    EXPECT_THROW(parseArgs({"--unknown"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--arm", "middle"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--data-type=sim"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--dataset"}), std::invalid_argument);
}

TEST(ConfigTest, RejectsMalformedNumbers) {
    // Numeric flags are parsed whole and range-checked.
    EXPECT_THROW(parseArgs({"--seed=abc"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--seed=-1"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--seed=4294967296"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--workers=x"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--workers", "0"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--workers=2threads"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--val-ratio=0.2x"}), std::invalid_argument);

    try {
        parseArgs({"--workers=x"});
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("--workers"), std::string::npos);
    }

    const auto overrides = parseArgs({"--seed=4294967295", "--workers", "8", "--val-ratio=0.25"});
    EXPECT_EQ(*overrides.seed, 4294967295u);
    EXPECT_EQ(*overrides.workers, 8);
    EXPECT_DOUBLE_EQ(*overrides.val_ratio, 0.25);
}

TEST(ConfigTest, ArmSelectsSliceAndCameras) {
    ConversionConfig config = completeConfig();
    config.arm = ArmSide::Left;
    EXPECT_EQ(config.joint_offset(), 0);
    EXPECT_EQ(config.wrist_camera().source, "cam_left_wrist");
    EXPECT_EQ(config.wrist_camera().output, "left_wrist_img");
    EXPECT_EQ(config.front_camera().source, "cam_high");
    EXPECT_EQ(config.front_camera().output, "front_img_1");

    config.arm = ArmSide::Right;
    EXPECT_EQ(config.joint_offset(), 7);
    EXPECT_EQ(config.wrist_camera().source, "cam_right_wrist");
    EXPECT_EQ(config.wrist_camera().output, "right_wrist_img");
}

TEST(ConfigTest, ValidateRejectsBadValues) {
    EXPECT_NO_THROW(completeConfig().validate());

    ConversionConfig missing = completeConfig();
    missing.calibration.clear();
    EXPECT_THROW(missing.validate(), std::invalid_argument);

    ConversionConfig ratio = completeConfig();
    ratio.split.val_ratio = 1.0;
    EXPECT_THROW(ratio.validate(), std::invalid_argument);

    ConversionConfig keys = completeConfig();
    keys.split.val_key = keys.split.train_key;
    EXPECT_THROW(keys.validate(), std::invalid_argument);

    ConversionConfig workers = completeConfig();
    workers.workers = 0;
    EXPECT_THROW(workers.validate(), std::invalid_argument);

    ConversionConfig narrow = completeConfig();
    narrow.arm_layout.joints_per_arm = 5;
    EXPECT_THROW(narrow.validate(), std::invalid_argument);

    ConversionConfig shared_output = completeConfig();
    shared_output.cameras.wrist.output = "front_img_1";
    EXPECT_THROW(shared_output.validate(), std::invalid_argument);

    ConversionConfig shared_after_arm = completeConfig();
    shared_after_arm.arm = ArmSide::Left;
    shared_after_arm.cameras.front.output = "left_wrist_img";
    EXPECT_THROW(shared_after_arm.validate(), std::invalid_argument);
}

} // namespace democonv
