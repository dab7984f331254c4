#pragma once
// Output container: one demo group per episode plus split metadata.

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <H5Cpp.h>

#include "democonv/config.hpp"
#include "democonv/episode_file.hpp"
#include "democonv/split_partitioner.hpp"
#include "democonv/types.hpp"

namespace democonv {

struct DemoRecord {
    int index = 0;
    SourceType source_type = SourceType::Robot;
    int label = 0;
    hsize_t num_samples = 0;

    JointMatrix joint_positions;
    PositionMatrix ee_pose;
    WindowMatrix actions;
    JointMatrix actions_joints;
    PositionMatrix actions_xyz;

    // Source camera name -> obs dataset name, streamed from the episode file.
    std::vector<CameraMapping> cameras;
};

std::string demo_name(int index);

class DatasetAssembler {
public:
    // Creates (truncates) the container at `path` with an empty `data` group.
    // Throws std::runtime_error if the file cannot be created.
    DatasetAssembler(const std::filesystem::path& path, const OutputConfig& config);

    DatasetAssembler(const DatasetAssembler&) = delete;
    DatasetAssembler& operator=(const DatasetAssembler&) = delete;

    // Writes data/demo_<index>. Image frames are copied one at a time from `source`.
    // Throws DuplicateDemoIndexError if the group already exists and
    // ShapeMismatchError if a time-indexed array does not have num_samples rows.
    void write_demo(const DemoRecord& record, const EpisodeFile& source);

    // Persists split lists as mask/<train_key> and mask/<val_key>.
    void write_split(const SplitAssignment& split, const SplitConfig& config);

    // Writes the `total` attribute and closes the file.
    void close();

    const std::vector<int>& demo_indices() const { return demo_indices_; }
    std::uint64_t total_samples() const { return total_samples_; }

private:
    void write_images(H5::Group& obs, const CameraMapping& camera, const EpisodeFile& source, hsize_t num_samples);

    OutputConfig config_;
    H5::H5File file_;
    H5::Group data_;
    std::vector<int> demo_indices_;
    std::uint64_t total_samples_ = 0;
    bool closed_ = false;
};

} // namespace democonv
