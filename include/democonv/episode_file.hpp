#pragma once
// Read access to one raw episode container.

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <H5Cpp.h>

#include "democonv/types.hpp"

namespace democonv {

constexpr const char* kActionPath = "action";
constexpr const char* kQposPath = "observations/qpos";
constexpr const char* kQvelPath = "observations/qvel";
constexpr const char* kEffortPath = "observations/effort";
constexpr const char* kImagesPath = "observations/images";

struct ImageShape {
    hsize_t height = 0;
    hsize_t width = 0;
    hsize_t channels = 0;

    std::size_t frame_bytes() const { return static_cast<std::size_t>(height * width * channels); }
};

struct EpisodeSchema {
    hsize_t num_samples = 0;
    hsize_t joint_count = 0;
    std::map<std::string, ImageShape> cameras;
};

struct RawEpisode {
    std::filesystem::path path;
    int index = 0;

    JointMatrix joint_positions;
    JointMatrix joint_efforts;
    JointMatrix joint_velocities;
    JointMatrix commanded_actions;

    Eigen::Index num_samples() const { return joint_positions.rows(); }
};

// The HDF5 build is not assumed thread-safe; callers on worker threads hold
// this mutex around every HDF5 call.
std::mutex& hdf5_mutex();

// Turns off the HDF5 library's automatic error stack printing. Errors still
// surface as H5::Exception.
void silence_hdf5_errors();

// True if every component of `path` exists below `location`.
bool link_exists(const H5::Group& location, const std::string& path);

class EpisodeFile {
public:
    // Opens read-only. Throws CorruptInputError if the file is not a readable HDF5 container.
    explicit EpisodeFile(const std::filesystem::path& path);

    // Checks the episode schema: joint arrays are 2-D with a common shape,
    // listed cameras are [T, H, W, 3] uint8, and every array shares T > 0.
    // Throws CorruptInputError naming the file and the violated condition.
    EpisodeSchema read_schema(const std::vector<std::string>& cameras) const;

    // Reads a 2-D numeric dataset as doubles.
    JointMatrix read_joints(const std::string& dataset_path) const;

    // Joint arrays, after read_schema succeeds. Image streams stay on disk.
    RawEpisode load(int index, const std::vector<std::string>& cameras) const;

    ImageShape image_shape(const std::string& camera) const;

    // Copies frame `t` of `camera` into `out`, resized to one frame.
    void read_frame(const std::string& camera, hsize_t t, std::vector<std::uint8_t>& out) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    H5::H5File file_;
};

} // namespace democonv
