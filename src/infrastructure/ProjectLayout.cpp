/**
 * @file ProjectLayout.cpp
 * @brief Implementation of ProjectLayout.
 */

#include "infrastructure/ProjectLayout.hpp"

#include <cctype>
#include <limits>

namespace novelstore::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kMetadataDirName = ".novel";
constexpr const char* kVersionPrefix = "v";
constexpr const char* kVersionSuffix = ".json";

} // namespace

fs::path ProjectLayout::GetMetadataDir(const fs::path& root) {
    return root / kMetadataDirName;
}

fs::path ProjectLayout::GetProjectFile(const fs::path& root) {
    return GetMetadataDir(root) / "project.json";
}

fs::path ProjectLayout::GetCharactersFile(const fs::path& root) {
    return GetMetadataDir(root) / "characters.json";
}

fs::path ProjectLayout::GetWorldFile(const fs::path& root) {
    return GetMetadataDir(root) / "world.json";
}

fs::path ProjectLayout::GetPlotFile(const fs::path& root) {
    return GetMetadataDir(root) / "plot.json";
}

fs::path ProjectLayout::GetConfigFile(const fs::path& root) {
    return GetMetadataDir(root) / "settings.json";
}

fs::path ProjectLayout::GetChaptersDir(const fs::path& root) {
    return root / "chapters";
}

fs::path ProjectLayout::GetDraftsDir(const fs::path& root) {
    return root / "drafts";
}

fs::path ProjectLayout::GetChapterDir(const fs::path& root, const domain::ChapterId& id) {
    return GetChaptersDir(root) / ("chapter-" + id.toString());
}

fs::path ProjectLayout::GetChapterMetadataFile(const fs::path& chapterDir) {
    return chapterDir / "metadata.json";
}

fs::path ProjectLayout::GetChapterContentFile(const fs::path& chapterDir) {
    return chapterDir / "content.md";
}

fs::path ProjectLayout::GetHistoryDir(const fs::path& chapterDir) {
    return chapterDir / "history";
}

fs::path ProjectLayout::GetVersionFile(const fs::path& chapterDir, std::uint32_t version) {
    return GetHistoryDir(chapterDir) / (kVersionPrefix + std::to_string(version) + kVersionSuffix);
}

std::optional<std::uint32_t> ProjectLayout::ParseVersionFileName(const std::string& filename) {
    const std::string prefix = kVersionPrefix;
    const std::string suffix = kVersionSuffix;
    if (filename.size() <= prefix.size() + suffix.size()) return std::nullopt;
    if (filename.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;

    std::string digits = filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size());
    std::uint64_t value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
        if (value > std::numeric_limits<std::uint32_t>::max()) return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace novelstore::infrastructure
