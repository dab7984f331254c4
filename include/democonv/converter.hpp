#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "democonv/config.hpp"
#include "democonv/episode_features.hpp"
#include "democonv/episode_validator.hpp"

namespace democonv {

struct ConversionSummary {
    std::filesystem::path output;
    std::vector<int> demo_indices;
    std::uint64_t total_samples = 0;
    std::size_t train_count = 0;
    std::size_t val_count = 0;
};

// Whole-directory conversion: validate every episode, compute features on
// worker threads, write demos sequentially, then persist the split.
// Output goes to `<output>.partial` and is renamed into place only when every
// stage succeeded; on failure the partial file is removed.
class Converter {
public:
    explicit Converter(const ConversionConfig& config);

    // Throws a ConversionError subclass (or std::runtime_error for I/O failures)
    // on the first problem found.
    ConversionSummary run() const;

private:
    std::vector<EpisodeFeatures> compute_features(const std::vector<EpisodeCandidate>& candidates,
                                                  const FeatureExtractor& extractor) const;

    ConversionSummary write_output(const std::filesystem::path& path,
                                   const std::vector<EpisodeCandidate>& candidates,
                                   std::vector<EpisodeFeatures>& features) const;

    std::vector<CameraMapping> cameras() const;
    std::vector<std::string> camera_sources() const;

    const ConversionConfig& config_;
};

} // namespace democonv
