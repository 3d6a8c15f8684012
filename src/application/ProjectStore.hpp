/**
 * @file ProjectStore.hpp
 * @brief Versioned, hierarchical store for a writing project (volumes, chapters, history).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/NovelProject.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace novelstore::application {

using domain::Chapter;
using domain::ChapterId;
using domain::ChapterStatus;
using domain::ChapterVersion;
using domain::NovelProject;
using domain::NovelSettings;
using domain::Volume;
using domain::VolumeId;

/**
 * @class ProjectStore
 * @brief Owns one open project and keeps its in-memory index and directory tree in step.
 *
 * Reads are served from memory. Mutations update memory, write the affected
 * chapter files and then persist the root metadata. Callers must serialize
 * access (see ProjectSession); the store does no locking of its own.
 *
 * Lookup misses on delete/rename/status operations are no-ops. Operations
 * that need the target to exist throw domain::NotFoundError.
 */
class ProjectStore {
public:
    ProjectStore(NovelProject project,
                 std::shared_ptr<infrastructure::PersistenceService> persistence,
                 infrastructure::StoreConfig config = {});

    /**
     * @brief Builds a fresh project with one empty default volume. Does not touch disk.
     */
    static ProjectStore Create(const std::filesystem::path& root,
                               const std::string& title,
                               infrastructure::StoreConfig config = {},
                               std::shared_ptr<infrastructure::PersistenceService> persistence = nullptr);

    /**
     * @brief Opens an existing project and rebuilds the chapter index from disk.
     * @throws domain::ParseError (Missing or Malformed) for the root metadata or a chapter document.
     * @throws domain::IoError if a directory cannot be scanned.
     */
    static ProjectStore Load(const std::filesystem::path& root,
                             std::shared_ptr<infrastructure::PersistenceService> persistence = nullptr);

    /** @brief Creates the directory skeleton (idempotent) and persists the current state. */
    void initialize();

    /** @brief Writes project.json and the three settings documents. */
    void persist();

    // --- Volumes ---
    VolumeId createVolume(const std::string& title);
    void deleteVolume(const VolumeId& id);
    void renameVolume(const VolumeId& id, const std::string& newTitle);

    // --- Chapters ---

    /**
     * @brief Creates an empty chapter at the end of a volume.
     * @param volumeId Target volume; the first volume when omitted.
     * @throws domain::NotFoundError if the target volume does not exist.
     */
    ChapterId createChapter(const std::string& title, const std::optional<VolumeId>& volumeId = std::nullopt);
    void deleteChapter(const ChapterId& id);
    void renameChapter(const ChapterId& id, const std::string& newTitle);

    /**
     * @brief Replaces a volume's chapter order.
     * @param newOrder Must list every chapter of the volume exactly once.
     * @throws domain::NotFoundError for an unknown volume.
     * @throws domain::InvalidArgumentError naming the first id that is unknown,
     *         belongs elsewhere, is repeated or is missing.
     */
    void reorderChaptersInVolume(const VolumeId& volumeId, const std::vector<ChapterId>& newOrder);

    /**
     * @brief Moves a chapter to `targetPosition` of another (or the same) volume.
     *
     * Positions past the end append. Both volumes are renumbered.
     */
    void moveChapterToVolume(const ChapterId& chapterId, const VolumeId& targetVolumeId, std::size_t targetPosition);
    void updateChapterStatus(const ChapterId& id, ChapterStatus status);

    // --- Versioning ---

    /**
     * @brief Replaces a chapter's content, snapshotting the previous content first.
     *
     * A snapshot is written only when the old content is non-empty and differs.
     * Root metadata is not re-persisted unless the config asks for it.
     */
    void updateChapterContent(const ChapterId& id,
                              const std::string& newContent,
                              const std::optional<std::string>& changeSummary = std::nullopt);

    /** @brief Prior versions, most recent first. */
    std::vector<ChapterVersion> getVersionHistory(const ChapterId& id) const;

    /**
     * @brief Makes a prior version current again, as a new version.
     * @throws domain::NotFoundError if the chapter or the version is unknown.
     */
    void restoreVersion(const ChapterId& id, std::uint32_t version);

    // --- Settings ---
    const NovelSettings& settings() const { return m_project.settings; }
    void updateSettings(NovelSettings settings);

    // --- Queries ---
    std::vector<const Chapter*> allChaptersInOrder() const;
    std::vector<const Chapter*> chaptersForVolume(const VolumeId& volumeId) const;
    const Chapter* chapter(const ChapterId& id) const { return m_project.findChapter(id); }
    const std::vector<Volume>& volumes() const { return m_project.volumes; }
    std::size_t chapterCount() const { return m_project.chapters.size(); }
    std::filesystem::path contentPath(const ChapterId& id) const;

    const NovelProject& project() const { return m_project; }
    const std::filesystem::path& projectRoot() const { return m_project.rootPath; }
    const std::string& title() const { return m_project.title; }
    const infrastructure::StoreConfig& config() const { return m_config; }

private:
    void writeJson(const std::filesystem::path& path, const nlohmann::json& document);
    nlohmann::json readJson(const std::filesystem::path& path) const;

    void writeChapterMetadata(const Chapter& chapter);
    void writeChapterContent(const Chapter& chapter);
    void writeVersion(const Chapter& chapter, const ChapterVersion& version);
    void removeChapterFiles(const Chapter& chapter);

    void loadSettings();
    void reloadChapters();
    std::optional<Chapter> loadChapterDirectory(const std::filesystem::path& dir) const;
    std::uint32_t deriveCurrentVersion(const std::filesystem::path& dir) const;
    void reconcileIndex();

    NovelProject m_project;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    infrastructure::StoreConfig m_config;
};

} // namespace novelstore::application
