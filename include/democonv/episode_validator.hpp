#pragma once
// Discovery and fail-fast validation of raw episode files.

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "democonv/config.hpp"

namespace democonv {

struct EpisodeCandidate {
    std::filesystem::path path;
    int index = 0;
};

class EpisodeValidator {
public:
    // Throws std::invalid_argument if the pattern is not a valid regex with a capture group.
    EpisodeValidator(const EpisodeConfig& config, std::vector<std::string> cameras);

    // Episode index if `entry` is a regular file whose name matches the pattern.
    // Never opens the file.
    std::optional<int> match(const std::filesystem::directory_entry& entry) const;

    // Candidates in `directory` ordered by index, without opening them.
    // Throws DuplicateDemoIndexError if two names map to the same index.
    std::vector<EpisodeCandidate> scan(const std::filesystem::path& directory) const;

    // scan() followed by opening and schema-checking every candidate.
    // Throws CorruptInputError on the first unreadable candidate.
    std::vector<EpisodeCandidate> process(const std::filesystem::path& directory) const;

private:
    std::regex pattern_;
    std::vector<std::string> cameras_;
};

} // namespace democonv
