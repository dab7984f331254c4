#include "democonv/episode_validator.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "democonv/episode_file.hpp"
#include "democonv/errors.hpp"
#include "democonv/logger.hpp"

namespace democonv {
namespace {

std::regex compile_pattern(const std::string& pattern) {
    try {
        std::regex re(pattern);
        if (re.mark_count() < 1) {
            throw std::invalid_argument("Episode pattern needs a capture group for the index: " + pattern);
        }
        return re;
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid episode pattern `" + pattern + "`: " + e.what());
    }
}

} // namespace

EpisodeValidator::EpisodeValidator(const EpisodeConfig& config, std::vector<std::string> cameras)
    : pattern_(compile_pattern(config.pattern)), cameras_(std::move(cameras)) {}

std::optional<int> EpisodeValidator::match(const std::filesystem::directory_entry& entry) const {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) {
        return std::nullopt;
    }

    const std::string name = entry.path().filename().string();
    std::smatch groups;
    if (!std::regex_match(name, groups, pattern_)) {
        return std::nullopt;
    }

    try {
        return std::stoi(groups[1].str());
    } catch (const std::exception&) {
        throw CorruptInputError("Episode " + entry.path().string() + ": index `" + groups[1].str() +
                                "` is not a valid integer");
    }
}

std::vector<EpisodeCandidate> EpisodeValidator::scan(const std::filesystem::path& directory) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw CorruptInputError("Dataset directory does not exist: " + directory.string());
    }

    std::map<int, std::filesystem::path> by_index;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        throw CorruptInputError("Failed to list dataset directory " + directory.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        const auto index = match(entry);
        if (!index.has_value()) {
            Logger::log(LogLevel::Debug, "Skipping " + entry.path().string());
            continue;
        }
        const auto inserted = by_index.emplace(*index, entry.path());
        if (!inserted.second) {
            throw DuplicateDemoIndexError("Episodes " + inserted.first->second.string() + " and " +
                                          entry.path().string() + " both map to demo_" +
                                          std::to_string(*index));
        }
    }

    std::vector<EpisodeCandidate> candidates;
    candidates.reserve(by_index.size());
    for (const auto& kv : by_index) {
        candidates.push_back(EpisodeCandidate{kv.second, kv.first});
    }
    return candidates;
}

std::vector<EpisodeCandidate> EpisodeValidator::process(const std::filesystem::path& directory) const {
    auto candidates = scan(directory);
    for (const auto& candidate : candidates) {
        const EpisodeFile file(candidate.path);
        const EpisodeSchema schema = file.read_schema(cameras_);
        std::string streams;
        for (const auto& camera : schema.cameras) {
            streams += ", " + camera.first + " " + std::to_string(camera.second.height) + "x" +
                       std::to_string(camera.second.width);
        }
        Logger::log(LogLevel::Debug, "Validated " + candidate.path.string() + " (" +
                                         std::to_string(schema.num_samples) + " samples" + streams + ")");
    }
    Logger::log(LogLevel::Info, "Validated " + std::to_string(candidates.size()) + " episodes in " +
                                    directory.string());
    return candidates;
}

} // namespace democonv
