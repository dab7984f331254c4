#include "democonv/converter.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#include "democonv/dataset_assembler.hpp"
#include "democonv/episode_file.hpp"
#include "democonv/errors.hpp"
#include "democonv/logger.hpp"
#include "democonv/split_partitioner.hpp"

namespace democonv {
namespace {

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        Logger::log(LogLevel::Warn, "Failed to remove partial output " + path.string() + ": " + ec.message());
    }
}

} // namespace

Converter::Converter(const ConversionConfig& config) : config_(config) {}

std::vector<CameraMapping> Converter::cameras() const {
    return {config_.front_camera(), config_.wrist_camera()};
}

std::vector<std::string> Converter::camera_sources() const {
    std::vector<std::string> sources;
    for (const auto& camera : cameras()) {
        sources.push_back(camera.source);
    }
    return sources;
}

ConversionSummary Converter::run() const {
    config_.validate();
    silence_hdf5_errors();

    const ExtrinsicCalibration& calibration = config_.calibrations.at(config_.calibration);
    const SourceProfile& profile = config_.profile();

    const EpisodeValidator validator(config_.episodes, camera_sources());
    const std::vector<EpisodeCandidate> candidates = validator.process(config_.dataset_dir);
    if (candidates.empty()) {
        throw EmptyDatasetError("No episode files found in " + config_.dataset_dir);
    }

    const KinematicsEngine kinematics(config_.kinematics);
    const FrameTransformer transformer(calibration);
    const TrajectoryWindowGenerator windows(profile.window);
    const ArmSlice slice{config_.joint_offset(), config_.arm_layout.joints_per_arm};
    const FeatureExtractor extractor(slice, kinematics, transformer, windows);

    std::vector<EpisodeFeatures> features = compute_features(candidates, extractor);

    const std::filesystem::path output(config_.output_path);
    const std::filesystem::path partial(config_.output_path + ".partial");
    if (output.has_parent_path()) {
        std::filesystem::create_directories(output.parent_path());
    }

    ConversionSummary summary;
    try {
        summary = write_output(partial, candidates, features);
        std::filesystem::rename(partial, output);
    } catch (...) {
        remove_quietly(partial);
        throw;
    }
    summary.output = output;

    std::ostringstream out;
    out << "Wrote " << summary.demo_indices.size() << " demos (" << summary.total_samples << " samples, "
        << summary.train_count << " train / " << summary.val_count << " val) to " << output.string();
    Logger::log(LogLevel::Info, out.str());
    return summary;
}

std::vector<EpisodeFeatures> Converter::compute_features(const std::vector<EpisodeCandidate>& candidates,
                                                         const FeatureExtractor& extractor) const {
    const std::size_t count = candidates.size();
    std::vector<EpisodeFeatures> results(count);
    std::vector<std::exception_ptr> errors(count);
    const std::vector<std::string> sources = camera_sources();

    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    const auto worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) {
                return;
            }
            try {
                RawEpisode episode;
                {
                    std::lock_guard<std::mutex> lock(hdf5_mutex());
                    const EpisodeFile file(candidates[i].path);
                    episode = file.load(candidates[i].index, sources);
                }
                results[i] = extractor.process(episode);
                Logger::log(LogLevel::Debug, "Computed features for " + demo_name(candidates[i].index));
            } catch (...) {
                errors[i] = std::current_exception();
                failed.store(true, std::memory_order_relaxed);
            }
        }
    };

    const std::size_t thread_count = std::min<std::size_t>(static_cast<std::size_t>(config_.workers), count);
    std::vector<std::thread> threads;
    threads.reserve(thread_count > 0 ? thread_count - 1 : 0);
    for (std::size_t t = 1; t < thread_count; ++t) {
        threads.emplace_back(worker);
    }
    worker();
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return results;
}

ConversionSummary Converter::write_output(const std::filesystem::path& path,
                                          const std::vector<EpisodeCandidate>& candidates,
                                          std::vector<EpisodeFeatures>& features) const {
    const SourceProfile& profile = config_.profile();
    const std::vector<CameraMapping> camera_map = cameras();

    DatasetAssembler assembler(path, config_.output);
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        EpisodeFeatures& f = features[i];

        DemoRecord record;
        record.index = candidates[i].index;
        record.source_type = profile.type;
        record.label = profile.label;
        record.num_samples = static_cast<hsize_t>(f.joint_positions.rows());
        record.joint_positions = std::move(f.joint_positions);
        record.ee_pose = std::move(f.ee_pose);
        record.actions = std::move(f.future_trajectory);
        record.actions_joints = std::move(f.action_joints);
        record.actions_xyz = std::move(f.action_xyz);
        record.cameras = camera_map;

        const EpisodeFile source(candidates[i].path);
        assembler.write_demo(record, source);
        Logger::log(LogLevel::Info, "Converted " + candidates[i].path.filename().string() + " -> " +
                                        demo_name(record.index) + " (" + std::to_string(record.num_samples) +
                                        " samples) [" + std::to_string(i + 1) + "/" +
                                        std::to_string(candidates.size()) + "]");
    }

    const SplitPartitioner partitioner(config_.split);
    const SplitAssignment split = partitioner.process(assembler.demo_indices());
    assembler.write_split(split, config_.split);

    ConversionSummary summary;
    summary.demo_indices = assembler.demo_indices();
    summary.total_samples = assembler.total_samples();
    summary.train_count = split.train.size();
    summary.val_count = split.val.size();
    assembler.close();
    return summary;
}

} // namespace democonv
