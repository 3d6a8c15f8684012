/**
 * @file NovelProject.hpp
 * @brief Aggregate Root for a long-form writing project.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "domain/Chapter.hpp"
#include "domain/NovelSettings.hpp"
#include "domain/Volume.hpp"

namespace novelstore::domain {

/**
 * @class NovelProject
 * @brief Owns every volume and chapter of a project.
 *
 * Chapters live in a single arena keyed by id. Volumes and chapters refer to
 * each other only through ids; a volume's `chapterIds` is the authoritative
 * order and each chapter's `order` is a mirror of its index there.
 */
class NovelProject {
public:
    std::filesystem::path rootPath;
    std::string title;
    std::vector<Volume> volumes;
    std::map<ChapterId, Chapter> chapters;
    NovelSettings settings;
    TimePoint createdAt;
    TimePoint modifiedAt;
    std::uint64_t nextChapterId = 0; ///< Never reused, even after deletions.

    /**
     * @brief Fresh project with a single empty volume. Touches nothing on disk.
     */
    static NovelProject createNew(std::filesystem::path root, std::string title, const std::string& firstVolumeTitle);

    // --- Lookups ---
    Volume* findVolume(const VolumeId& id);
    const Volume* findVolume(const VolumeId& id) const;
    Chapter* findChapter(const ChapterId& id);
    const Chapter* findChapter(const ChapterId& id) const;

    /** @brief The volume whose chapter list contains `id`, if any. */
    Volume* volumeContaining(const ChapterId& id);

    // --- Queries ---

    /** @brief All chapters sorted by (volume order, chapter order). */
    std::vector<const Chapter*> allChaptersInOrder() const;

    /** @brief Chapters of one volume in stored order; empty for unknown volumes. */
    std::vector<const Chapter*> chaptersForVolume(const VolumeId& volumeId) const;

    // --- Maintenance ---
    ChapterId allocateChapterId();
    void renumberVolumes();
    void renumberChapters(const Volume& volume);
    void touch() { modifiedAt = std::chrono::system_clock::now(); }
};

} // namespace novelstore::domain
