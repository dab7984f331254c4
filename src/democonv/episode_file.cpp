#include "democonv/episode_file.hpp"

#include <sstream>

#include "democonv/errors.hpp"

namespace democonv {
namespace {

H5::H5File open_read_only(const std::filesystem::path& path) {
    try {
        return H5::H5File(path.string(), H5F_ACC_RDONLY);
    } catch (const H5::Exception& e) {
        throw CorruptInputError("Failed to open episode " + path.string() + ": " + e.getDetailMsg());
    }
}

std::string dims_to_string(const std::vector<hsize_t>& dims) {
    std::ostringstream out;
    out << "(";
    for (std::size_t i = 0; i < dims.size(); ++i) {
        out << (i == 0 ? "" : ", ") << dims[i];
    }
    out << ")";
    return out.str();
}

std::vector<hsize_t> dataset_dims(const H5::DataSet& dataset) {
    const H5::DataSpace space = dataset.getSpace();
    const int rank = space.getSimpleExtentNdims();
    std::vector<hsize_t> dims(static_cast<std::size_t>(rank > 0 ? rank : 0));
    if (rank > 0) {
        space.getSimpleExtentDims(dims.data());
    }
    return dims;
}

} // namespace

std::mutex& hdf5_mutex() {
    static std::mutex mutex;
    return mutex;
}

void silence_hdf5_errors() {
    H5::Exception::dontPrint();
}

bool link_exists(const H5::Group& location, const std::string& path) {
    std::string partial;
    std::size_t start = 0;
    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const auto end = (slash == std::string::npos) ? path.size() : slash;
        partial += (partial.empty() ? "" : "/") + path.substr(start, end - start);
        if (H5Lexists(location.getId(), partial.c_str(), H5P_DEFAULT) <= 0) {
            return false;
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return true;
}

EpisodeFile::EpisodeFile(const std::filesystem::path& path) : path_(path), file_(open_read_only(path)) {}

EpisodeSchema EpisodeFile::read_schema(const std::vector<std::string>& cameras) const {
    const auto fail = [this](const std::string& reason) {
        return CorruptInputError("Episode " + path_.string() + ": " + reason);
    };

    EpisodeSchema schema;
    try {
        bool first = true;
        for (const char* name : {kActionPath, kQposPath, kQvelPath, kEffortPath}) {
            if (!link_exists(file_, name)) {
                throw fail(std::string("missing dataset `") + name + "`");
            }
            const H5::DataSet dataset = file_.openDataSet(name);
            const H5T_class_t type_class = dataset.getTypeClass();
            if (type_class != H5T_FLOAT && type_class != H5T_INTEGER) {
                throw fail(std::string("dataset `") + name + "` is not numeric");
            }
            const auto dims = dataset_dims(dataset);
            if (dims.size() != 2) {
                throw fail(std::string("dataset `") + name + "` must be 2-D, got shape " + dims_to_string(dims));
            }
            if (first) {
                schema.num_samples = dims[0];
                schema.joint_count = dims[1];
                first = false;
            } else if (dims[0] != schema.num_samples || dims[1] != schema.joint_count) {
                throw fail(std::string("dataset `") + name + "` shape " + dims_to_string(dims) +
                           " disagrees with `" + kActionPath + "` shape " +
                           dims_to_string({schema.num_samples, schema.joint_count}));
            }
        }
        if (schema.num_samples == 0) {
            throw fail("episode has no samples");
        }

        for (const auto& camera : cameras) {
            const std::string name = std::string(kImagesPath) + "/" + camera;
            if (!link_exists(file_, name)) {
                throw fail("missing camera `" + camera + "`");
            }
            const H5::DataSet dataset = file_.openDataSet(name);
            if (dataset.getTypeClass() != H5T_INTEGER || dataset.getIntType().getSize() != 1 ||
                dataset.getIntType().getSign() != H5T_SGN_NONE) {
                throw fail("camera `" + camera + "` is not uint8");
            }
            const auto dims = dataset_dims(dataset);
            if (dims.size() != 4 || dims[3] != 3) {
                throw fail("camera `" + camera + "` must be [T, H, W, 3], got shape " + dims_to_string(dims));
            }
            if (dims[0] != schema.num_samples) {
                throw fail("camera `" + camera + "` has " + std::to_string(dims[0]) + " frames, expected " +
                           std::to_string(schema.num_samples));
            }
            schema.cameras[camera] = ImageShape{dims[1], dims[2], dims[3]};
        }
    } catch (const H5::Exception& e) {
        throw fail("unreadable structure: " + e.getDetailMsg());
    }
    return schema;
}

JointMatrix EpisodeFile::read_joints(const std::string& dataset_path) const {
    try {
        const H5::DataSet dataset = file_.openDataSet(dataset_path);
        const auto dims = dataset_dims(dataset);
        if (dims.size() != 2) {
            throw CorruptInputError(
                "Episode " + path_.string() + ": dataset `" + dataset_path + "` must be 2-D");
        }
        JointMatrix out(static_cast<Eigen::Index>(dims[0]), static_cast<Eigen::Index>(dims[1]));
        dataset.read(out.data(), H5::PredType::NATIVE_DOUBLE);
        return out;
    } catch (const H5::Exception& e) {
        throw CorruptInputError(
            "Episode " + path_.string() + ": failed to read `" + dataset_path + "`: " + e.getDetailMsg());
    }
}

RawEpisode EpisodeFile::load(int index, const std::vector<std::string>& cameras) const {
    read_schema(cameras);

    RawEpisode episode;
    episode.path = path_;
    episode.index = index;
    episode.commanded_actions = read_joints(kActionPath);
    episode.joint_positions = read_joints(kQposPath);
    episode.joint_velocities = read_joints(kQvelPath);
    episode.joint_efforts = read_joints(kEffortPath);
    return episode;
}

ImageShape EpisodeFile::image_shape(const std::string& camera) const {
    try {
        const H5::DataSet dataset = file_.openDataSet(std::string(kImagesPath) + "/" + camera);
        const auto dims = dataset_dims(dataset);
        if (dims.size() != 4) {
            throw CorruptInputError("Episode " + path_.string() + ": camera `" + camera + "` must be 4-D");
        }
        return ImageShape{dims[1], dims[2], dims[3]};
    } catch (const H5::Exception& e) {
        throw CorruptInputError("Episode " + path_.string() + ": failed to open camera `" + camera +
                                "`: " + e.getDetailMsg());
    }
}

void EpisodeFile::read_frame(const std::string& camera, hsize_t t, std::vector<std::uint8_t>& out) const {
    try {
        const H5::DataSet dataset = file_.openDataSet(std::string(kImagesPath) + "/" + camera);
        H5::DataSpace file_space = dataset.getSpace();
        hsize_t dims[4] = {0, 0, 0, 0};
        file_space.getSimpleExtentDims(dims);
        if (t >= dims[0]) {
            throw CorruptInputError("Episode " + path_.string() + ": frame " + std::to_string(t) +
                                    " out of range for camera `" + camera + "`");
        }

        const hsize_t start[4] = {t, 0, 0, 0};
        const hsize_t count[4] = {1, dims[1], dims[2], dims[3]};
        file_space.selectHyperslab(H5S_SELECT_SET, count, start);
        const H5::DataSpace memory_space(4, count);

        out.resize(static_cast<std::size_t>(dims[1] * dims[2] * dims[3]));
        dataset.read(out.data(), H5::PredType::NATIVE_UINT8, memory_space, file_space);
    } catch (const H5::Exception& e) {
        throw CorruptInputError("Episode " + path_.string() + ": failed to read frame " + std::to_string(t) +
                                " of camera `" + camera + "`: " + e.getDetailMsg());
    }
}

} // namespace democonv
