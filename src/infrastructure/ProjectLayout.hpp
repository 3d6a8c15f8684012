/**
 * @file ProjectLayout.hpp
 * @brief Every path of a project's on-disk tree.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "domain/Identifiers.hpp"

namespace novelstore::infrastructure {

/**
 * @class ProjectLayout
 * @brief Names every file and directory of a project tree.
 *
 * <root>/.novel/{project,characters,world,plot,settings}.json
 * <root>/chapters/chapter-<id>/{metadata.json,content.md,history/v<N>.json}
 * <root>/drafts/
 */
class ProjectLayout {
public:
    static std::filesystem::path GetMetadataDir(const std::filesystem::path& root);
    static std::filesystem::path GetProjectFile(const std::filesystem::path& root);
    static std::filesystem::path GetCharactersFile(const std::filesystem::path& root);
    static std::filesystem::path GetWorldFile(const std::filesystem::path& root);
    static std::filesystem::path GetPlotFile(const std::filesystem::path& root);
    static std::filesystem::path GetConfigFile(const std::filesystem::path& root);
    static std::filesystem::path GetChaptersDir(const std::filesystem::path& root);
    static std::filesystem::path GetDraftsDir(const std::filesystem::path& root);

    static std::filesystem::path GetChapterDir(const std::filesystem::path& root, const domain::ChapterId& id);
    static std::filesystem::path GetChapterMetadataFile(const std::filesystem::path& chapterDir);
    static std::filesystem::path GetChapterContentFile(const std::filesystem::path& chapterDir);
    static std::filesystem::path GetHistoryDir(const std::filesystem::path& chapterDir);
    static std::filesystem::path GetVersionFile(const std::filesystem::path& chapterDir, std::uint32_t version);

    /** @brief Extracts N from "vN.json"; nullopt for any other name. */
    static std::optional<std::uint32_t> ParseVersionFileName(const std::string& filename);
};

} // namespace novelstore::infrastructure
