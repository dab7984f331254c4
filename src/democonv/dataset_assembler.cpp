#include "democonv/dataset_assembler.hpp"

#include <cstdint>
#include <stdexcept>

#include "democonv/errors.hpp"

namespace democonv {
namespace {

constexpr std::size_t kChunkCacheSlots = 521;
constexpr double kChunkCachePreemption = 0.75;

H5::H5File create_file(const std::filesystem::path& path, const OutputConfig& config) {
    H5::FileAccPropList access;
    access.setCache(0, kChunkCacheSlots, config.chunk_cache_bytes, kChunkCachePreemption);
    try {
        return H5::H5File(path.string(), H5F_ACC_TRUNC, H5::FileCreatPropList::DEFAULT, access);
    } catch (const H5::Exception& e) {
        throw std::runtime_error("Failed to create output file " + path.string() + ": " + e.getDetailMsg());
    }
}

void write_int_attribute(H5::H5Object& object, const std::string& name, std::int64_t value) {
    const H5::DataSpace scalar(H5S_SCALAR);
    H5::Attribute attribute = object.createAttribute(name, H5::PredType::STD_I64LE, scalar);
    attribute.write(H5::PredType::NATIVE_INT64, &value);
}

void write_string_attribute(H5::H5Object& object, const std::string& name, const std::string& value) {
    const H5::DataSpace scalar(H5S_SCALAR);
    const H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
    H5::Attribute attribute = object.createAttribute(name, str_type, scalar);
    attribute.write(str_type, value);
}

template <typename Matrix>
void write_matrix(H5::Group& group, const std::string& name, const Matrix& matrix) {
    const hsize_t dims[2] = {static_cast<hsize_t>(matrix.rows()), static_cast<hsize_t>(matrix.cols())};
    const H5::DataSpace space(2, dims);
    H5::DataSet dataset = group.createDataSet(name, H5::PredType::IEEE_F64LE, space);
    dataset.write(matrix.data(), H5::PredType::NATIVE_DOUBLE);
}

template <typename Matrix>
void expect_rows(const Matrix& matrix, hsize_t rows, const std::string& name, int index) {
    if (static_cast<hsize_t>(matrix.rows()) != rows) {
        throw ShapeMismatchError(demo_name(index) + ": `" + name + "` has " + std::to_string(matrix.rows()) +
                                 " rows, expected " + std::to_string(rows));
    }
}

void write_names(H5::Group& group, const std::string& key, const std::vector<int>& indices) {
    std::vector<std::string> names;
    names.reserve(indices.size());
    for (const int index : indices) {
        names.push_back(demo_name(index));
    }
    std::vector<const char*> pointers;
    pointers.reserve(names.size());
    for (const auto& name : names) {
        pointers.push_back(name.c_str());
    }

    const H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
    const hsize_t dims[1] = {static_cast<hsize_t>(names.size())};
    const H5::DataSpace space(1, dims);
    H5::DataSet dataset = group.createDataSet(key, str_type, space);
    if (!pointers.empty()) {
        dataset.write(pointers.data(), str_type);
    }
}

} // namespace

std::string demo_name(int index) {
    return "demo_" + std::to_string(index);
}

DatasetAssembler::DatasetAssembler(const std::filesystem::path& path, const OutputConfig& config)
    : config_(config), file_(create_file(path, config)) {
    try {
        data_ = file_.createGroup("data");
        write_string_attribute(data_, "env_args", config_.env_args);
    } catch (const H5::Exception& e) {
        throw std::runtime_error("Failed to initialise output file " + path.string() + ": " + e.getDetailMsg());
    }
}

void DatasetAssembler::write_demo(const DemoRecord& record, const EpisodeFile& source) {
    if (closed_) {
        throw std::logic_error("DatasetAssembler::write_demo after close()");
    }

    const std::string name = demo_name(record.index);
    if (link_exists(data_, name)) {
        throw DuplicateDemoIndexError("Output already contains " + name + " (source " + source.path().string() + ")");
    }

    expect_rows(record.joint_positions, record.num_samples, "obs/joint_positions", record.index);
    expect_rows(record.ee_pose, record.num_samples, "obs/ee_pose", record.index);
    expect_rows(record.actions, record.num_samples, "actions", record.index);
    expect_rows(record.actions_joints, record.num_samples, "actions_joints", record.index);
    expect_rows(record.actions_xyz, record.num_samples, "actions_xyz", record.index);

    try {
        H5::Group demo = data_.createGroup(name);
        write_int_attribute(demo, "num_samples", static_cast<std::int64_t>(record.num_samples));
        write_string_attribute(demo, "source_type", to_string(record.source_type));

        const std::int64_t label = record.label;
        const hsize_t label_dims[1] = {1};
        const H5::DataSpace label_space(1, label_dims);
        H5::DataSet label_set = demo.createDataSet("label", H5::PredType::STD_I64LE, label_space);
        label_set.write(&label, H5::PredType::NATIVE_INT64);

        H5::Group obs = demo.createGroup("obs");
        for (const auto& camera : record.cameras) {
            write_images(obs, camera, source, record.num_samples);
        }
        write_matrix(obs, "joint_positions", record.joint_positions);
        write_matrix(obs, "ee_pose", record.ee_pose);

        write_matrix(demo, "actions", record.actions);
        write_matrix(demo, "actions_joints", record.actions_joints);
        write_matrix(demo, "actions_xyz", record.actions_xyz);
    } catch (const H5::Exception& e) {
        throw std::runtime_error("Failed to write " + name + ": " + e.getDetailMsg());
    }

    demo_indices_.push_back(record.index);
    total_samples_ += record.num_samples;
}

void DatasetAssembler::write_images(H5::Group& obs,
                                    const CameraMapping& camera,
                                    const EpisodeFile& source,
                                    hsize_t num_samples) {
    const ImageShape shape = source.image_shape(camera.source);

    // One chunk per frame so a loader can fetch a single frame without
    // touching the rest of the stream.
    const hsize_t dims[4] = {num_samples, shape.height, shape.width, shape.channels};
    const hsize_t chunk[4] = {1, shape.height, shape.width, shape.channels};
    H5::DSetCreatPropList properties;
    properties.setChunk(4, chunk);
    if (config_.image_compression_level > 0) {
        properties.setDeflate(config_.image_compression_level);
    }

    const H5::DataSpace space(4, dims);
    H5::DataSet dataset = obs.createDataSet(camera.output, H5::PredType::STD_U8LE, space, properties);
    const H5::DataSpace memory_space(4, chunk);

    std::vector<std::uint8_t> frame;
    frame.reserve(shape.frame_bytes());
    for (hsize_t t = 0; t < num_samples; ++t) {
        source.read_frame(camera.source, t, frame);
        H5::DataSpace file_space = dataset.getSpace();
        const hsize_t start[4] = {t, 0, 0, 0};
        file_space.selectHyperslab(H5S_SELECT_SET, chunk, start);
        dataset.write(frame.data(), H5::PredType::NATIVE_UINT8, memory_space, file_space);
    }
}

void DatasetAssembler::write_split(const SplitAssignment& split, const SplitConfig& config) {
    if (closed_) {
        throw std::logic_error("DatasetAssembler::write_split after close()");
    }
    if (link_exists(file_, "mask")) {
        throw std::runtime_error("Output already contains a split mask.");
    }
    try {
        H5::Group mask = file_.createGroup("mask");
        write_names(mask, config.train_key, split.train);
        write_names(mask, config.val_key, split.val);
    } catch (const H5::Exception& e) {
        throw std::runtime_error("Failed to write split mask: " + e.getDetailMsg());
    }
}

void DatasetAssembler::close() {
    if (closed_) {
        return;
    }
    try {
        write_int_attribute(data_, "total", static_cast<std::int64_t>(total_samples_));
        data_.close();
        file_.close();
    } catch (const H5::Exception& e) {
        throw std::runtime_error("Failed to finalise output file: " + e.getDetailMsg());
    }
    closed_ = true;
}

} // namespace democonv
