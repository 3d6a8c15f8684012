/**
 * @file ProjectStore.cpp
 * @brief Implementation of ProjectStore.
 */

#include "application/ProjectStore.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <system_error>

#include "domain/StoreErrors.hpp"
#include "infrastructure/ProjectJsonCodec.hpp"
#include "infrastructure/ProjectLayout.hpp"

namespace novelstore::application {

namespace fs = std::filesystem;
using json = nlohmann::json;
using domain::InvalidArgumentError;
using domain::IoError;
using domain::NotFoundError;
using domain::ParseError;
using infrastructure::PersistenceService;
using infrastructure::ProjectJsonCodec;
using infrastructure::ProjectLayout;
using infrastructure::StoreConfig;

namespace {

std::vector<fs::path> ListDirectory(const fs::path& dir) {
    std::vector<fs::path> entries;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        throw IoError("read_dir", dir, ec.message());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

} // namespace

ProjectStore::ProjectStore(NovelProject project, std::shared_ptr<PersistenceService> persistence, StoreConfig config)
    : m_project(std::move(project)),
      m_persistence(persistence ? std::move(persistence) : std::make_shared<PersistenceService>()),
      m_config(std::move(config)) {}

ProjectStore ProjectStore::Create(const fs::path& root,
                                  const std::string& title,
                                  StoreConfig config,
                                  std::shared_ptr<PersistenceService> persistence) {
    auto project = NovelProject::createNew(root, title, config.defaultVolumeTitle);
    return ProjectStore(std::move(project), std::move(persistence), std::move(config));
}

ProjectStore ProjectStore::Load(const fs::path& root, std::shared_ptr<PersistenceService> persistence) {
    if (!persistence) {
        persistence = std::make_shared<PersistenceService>();
    }

    fs::path projectFile = ProjectLayout::GetProjectFile(root);
    if (!persistence->exists(projectFile)) {
        throw ParseError(ParseError::Reason::Missing, projectFile, "project metadata not found");
    }
    json document = ProjectJsonCodec::Parse(persistence->readText(projectFile), projectFile);
    NovelProject project = ProjectJsonCodec::ProjectFromJson(document, projectFile);
    project.rootPath = root;

    ProjectStore store(std::move(project), std::move(persistence), infrastructure::ConfigLoader::Load(root));
    store.loadSettings();
    store.reloadChapters();
    return store;
}

void ProjectStore::initialize() {
    const fs::path& root = m_project.rootPath;
    m_persistence->ensureDirectory(ProjectLayout::GetMetadataDir(root));
    m_persistence->ensureDirectory(ProjectLayout::GetChaptersDir(root));
    m_persistence->ensureDirectory(ProjectLayout::GetDraftsDir(root));

    if (!m_persistence->exists(ProjectLayout::GetConfigFile(root))) {
        if (!infrastructure::ConfigLoader::Save(root, m_config, *m_persistence)) {
            throw IoError("write", ProjectLayout::GetConfigFile(root), "could not write store configuration");
        }
    }

    persist();
}

void ProjectStore::persist() {
    const fs::path& root = m_project.rootPath;
    writeJson(ProjectLayout::GetProjectFile(root), ProjectJsonCodec::ProjectToJson(m_project));
    writeJson(ProjectLayout::GetCharactersFile(root), ProjectJsonCodec::CharactersToJson(m_project.settings.characters));
    writeJson(ProjectLayout::GetWorldFile(root), ProjectJsonCodec::WorldToJson(m_project.settings.world));
    writeJson(ProjectLayout::GetPlotFile(root), ProjectJsonCodec::PlotToJson(m_project.settings.plotPoints));
}

// --- Volumes ---

VolumeId ProjectStore::createVolume(const std::string& title) {
    VolumeId id = VolumeId::Generate();
    m_project.volumes.emplace_back(id, title, m_project.volumes.size());
    m_project.touch();
    persist();
    return id;
}

void ProjectStore::deleteVolume(const VolumeId& id) {
    auto it = std::find_if(m_project.volumes.begin(), m_project.volumes.end(),
                           [&](const Volume& v) { return v.id == id; });
    if (it == m_project.volumes.end()) return;

    std::set<ChapterId> doomed(it->chapterIds.begin(), it->chapterIds.end());
    for (const auto& [chapterId, chapter] : m_project.chapters) {
        if (chapter.volumeId == id) doomed.insert(chapterId);
    }

    for (const auto& chapterId : doomed) {
        auto chapterIt = m_project.chapters.find(chapterId);
        if (chapterIt == m_project.chapters.end()) continue;
        removeChapterFiles(chapterIt->second);
        m_project.chapters.erase(chapterIt);
        it->remove(chapterId);
    }

    m_project.volumes.erase(it);
    m_project.renumberVolumes();
    m_project.touch();
    persist();
}

void ProjectStore::renameVolume(const VolumeId& id, const std::string& newTitle) {
    Volume* volume = m_project.findVolume(id);
    if (!volume) return;

    volume->title = newTitle;
    volume->touch();
    m_project.touch();
    persist();
}

// --- Chapters ---

ChapterId ProjectStore::createChapter(const std::string& title, const std::optional<VolumeId>& volumeId) {
    Volume* volume = nullptr;
    if (volumeId) {
        volume = m_project.findVolume(*volumeId);
        if (!volume) throw NotFoundError("Volume not found: " + volumeId->toString());
    } else {
        if (m_project.volumes.empty()) throw NotFoundError("Project has no volume to hold a chapter");
        volume = &m_project.volumes.front();
    }

    ChapterId id = m_project.allocateChapterId();
    fs::path chapterDir = ProjectLayout::GetChapterDir(m_project.rootPath, id);
    Chapter chapter(id, title, volume->chapterIds.size(), volume->id, chapterDir);

    m_persistence->ensureDirectory(chapterDir);
    try {
        writeChapterMetadata(chapter);
        writeChapterContent(chapter);
    } catch (const domain::StoreError&) {
        // Keep "directory exists iff chapter exists" when the scaffold is incomplete.
        std::error_code ec;
        fs::remove_all(chapterDir, ec);
        if (ec) {
            std::cerr << "[ProjectStore] Could not clean up " << chapterDir << ": " << ec.message() << std::endl;
        }
        throw;
    }

    m_project.chapters.emplace(id, std::move(chapter));
    volume->chapterIds.push_back(id);
    volume->touch();
    m_project.touch();
    persist();
    return id;
}

void ProjectStore::deleteChapter(const ChapterId& id) {
    auto it = m_project.chapters.find(id);
    if (it == m_project.chapters.end()) return;

    removeChapterFiles(it->second);

    if (Volume* volume = m_project.volumeContaining(id)) {
        volume->remove(id);
        volume->touch();
        m_project.renumberChapters(*volume);
    }
    m_project.chapters.erase(it);

    for (auto& point : m_project.settings.plotPoints) {
        point.chapterIds.erase(std::remove(point.chapterIds.begin(), point.chapterIds.end(), id),
                               point.chapterIds.end());
    }

    m_project.touch();
    persist();
}

void ProjectStore::renameChapter(const ChapterId& id, const std::string& newTitle) {
    Chapter* chapter = m_project.findChapter(id);
    if (!chapter) return;

    chapter->title = newTitle;
    chapter->touch();
    writeChapterMetadata(*chapter);
    m_project.touch();
    persist();
}

void ProjectStore::reorderChaptersInVolume(const VolumeId& volumeId, const std::vector<ChapterId>& newOrder) {
    Volume* volume = m_project.findVolume(volumeId);
    if (!volume) throw NotFoundError("Volume not found: " + volumeId.toString());

    std::set<ChapterId> seen;
    for (const auto& id : newOrder) {
        const Chapter* chapter = m_project.findChapter(id);
        if (!chapter) {
            throw InvalidArgumentError("Chapter " + id.toString() + " not found", id.toString());
        }
        if (chapter->volumeId != volumeId || !volume->contains(id)) {
            throw InvalidArgumentError("Chapter " + id.toString() + " does not belong to volume " + volumeId.toString(),
                                       id.toString());
        }
        if (!seen.insert(id).second) {
            throw InvalidArgumentError("Chapter " + id.toString() + " listed more than once", id.toString());
        }
    }
    for (const auto& id : volume->chapterIds) {
        if (seen.count(id) == 0) {
            throw InvalidArgumentError("Ordering omits chapter " + id.toString() + " of volume " + volumeId.toString(),
                                       id.toString());
        }
    }

    volume->chapterIds = newOrder;
    m_project.renumberChapters(*volume);
    volume->touch();
    m_project.touch();
    persist();
}

void ProjectStore::moveChapterToVolume(const ChapterId& chapterId, const VolumeId& targetVolumeId, std::size_t targetPosition) {
    Chapter* chapter = m_project.findChapter(chapterId);
    if (!chapter) throw NotFoundError("Chapter not found: " + chapterId.toString());
    Volume* target = m_project.findVolume(targetVolumeId);
    if (!target) throw NotFoundError("Volume not found: " + targetVolumeId.toString());

    if (Volume* source = m_project.volumeContaining(chapterId)) {
        source->remove(chapterId);
        source->touch();
        m_project.renumberChapters(*source);
    }

    target->insert(chapterId, targetPosition);
    target->touch();
    chapter->volumeId = targetVolumeId;
    m_project.renumberChapters(*target);

    chapter->touch();
    writeChapterMetadata(*chapter);
    m_project.touch();
    persist();
}

void ProjectStore::updateChapterStatus(const ChapterId& id, ChapterStatus status) {
    Chapter* chapter = m_project.findChapter(id);
    if (!chapter) return;

    chapter->status = status;
    chapter->touch();
    writeChapterMetadata(*chapter);
    m_project.touch();
    persist();
}

// --- Versioning ---

void ProjectStore::updateChapterContent(const ChapterId& id,
                                        const std::string& newContent,
                                        const std::optional<std::string>& changeSummary) {
    Chapter* chapter = m_project.findChapter(id);
    if (!chapter) return;

    if (!chapter->content.empty() && chapter->content != newContent) {
        writeVersion(*chapter, chapter->snapshot(changeSummary.value_or(m_config.defaultChangeSummary)));
    }

    Chapter updated = *chapter;
    updated.updateContent(newContent);
    writeChapterContent(updated);
    writeChapterMetadata(updated);
    *chapter = std::move(updated);

    m_project.touch();
    if (m_config.persistIndexOnContentUpdate) {
        persist();
    }
}

std::vector<ChapterVersion> ProjectStore::getVersionHistory(const ChapterId& id) const {
    const Chapter* chapter = m_project.findChapter(id);
    if (!chapter) throw NotFoundError("Chapter not found: " + id.toString());

    std::vector<ChapterVersion> versions;
    fs::path historyDir = ProjectLayout::GetHistoryDir(chapter->dirPath);
    if (!m_persistence->exists(historyDir)) return versions;

    for (const auto& path : ListDirectory(historyDir)) {
        if (!ProjectLayout::ParseVersionFileName(path.filename().string())) continue;
        versions.push_back(ProjectJsonCodec::VersionFromJson(readJson(path), path));
    }

    std::sort(versions.begin(), versions.end(), [](const ChapterVersion& a, const ChapterVersion& b) {
        return a.version > b.version;
    });
    return versions;
}

void ProjectStore::restoreVersion(const ChapterId& id, std::uint32_t version) {
    const Chapter* chapter = m_project.findChapter(id);
    if (!chapter) throw NotFoundError("Chapter not found: " + id.toString());

    fs::path versionFile = ProjectLayout::GetVersionFile(chapter->dirPath, version);
    if (!m_persistence->exists(versionFile)) {
        throw NotFoundError("Version " + std::to_string(version) + " not found for chapter " + id.toString());
    }

    ChapterVersion snapshot = ProjectJsonCodec::VersionFromJson(readJson(versionFile), versionFile);
    updateChapterContent(id, snapshot.content, "Restored to version " + std::to_string(version));
}

// --- Settings & queries ---

void ProjectStore::updateSettings(NovelSettings settings) {
    m_project.settings = std::move(settings);
    m_project.touch();
    persist();
}

std::vector<const Chapter*> ProjectStore::allChaptersInOrder() const {
    return m_project.allChaptersInOrder();
}

std::vector<const Chapter*> ProjectStore::chaptersForVolume(const VolumeId& volumeId) const {
    return m_project.chaptersForVolume(volumeId);
}

fs::path ProjectStore::contentPath(const ChapterId& id) const {
    const Chapter* chapter = m_project.findChapter(id);
    if (!chapter) throw NotFoundError("Chapter not found: " + id.toString());
    return ProjectLayout::GetChapterContentFile(chapter->dirPath);
}

// --- File helpers ---

void ProjectStore::writeJson(const fs::path& path, const json& document) {
    m_persistence->writeText(path, document.dump(m_config.jsonIndent));
}

json ProjectStore::readJson(const fs::path& path) const {
    if (!m_persistence->exists(path)) {
        throw ParseError(ParseError::Reason::Missing, path, "document not found");
    }
    return ProjectJsonCodec::Parse(m_persistence->readText(path), path);
}

void ProjectStore::writeChapterMetadata(const Chapter& chapter) {
    writeJson(ProjectLayout::GetChapterMetadataFile(chapter.dirPath), ProjectJsonCodec::ChapterToJson(chapter));
}

void ProjectStore::writeChapterContent(const Chapter& chapter) {
    m_persistence->writeText(ProjectLayout::GetChapterContentFile(chapter.dirPath), chapter.content);
}

void ProjectStore::writeVersion(const Chapter& chapter, const ChapterVersion& version) {
    writeJson(ProjectLayout::GetVersionFile(chapter.dirPath, version.version), ProjectJsonCodec::VersionToJson(version));
}

void ProjectStore::removeChapterFiles(const Chapter& chapter) {
    if (m_persistence->exists(chapter.dirPath)) {
        m_persistence->removeAll(chapter.dirPath);
    }
}

// --- Loading ---

void ProjectStore::loadSettings() {
    const fs::path& root = m_project.rootPath;

    fs::path characters = ProjectLayout::GetCharactersFile(root);
    if (m_persistence->exists(characters)) {
        m_project.settings.characters = ProjectJsonCodec::CharactersFromJson(readJson(characters), characters);
    }
    fs::path world = ProjectLayout::GetWorldFile(root);
    if (m_persistence->exists(world)) {
        m_project.settings.world = ProjectJsonCodec::WorldFromJson(readJson(world), world);
    }
    fs::path plot = ProjectLayout::GetPlotFile(root);
    if (m_persistence->exists(plot)) {
        m_project.settings.plotPoints = ProjectJsonCodec::PlotFromJson(readJson(plot), plot);
    }
}

void ProjectStore::reloadChapters() {
    // The stored index is advisory; chapter directories are the truth.
    std::map<ChapterId, Chapter> indexed = std::move(m_project.chapters);
    m_project.chapters.clear();

    fs::path chaptersDir = ProjectLayout::GetChaptersDir(m_project.rootPath);
    if (m_persistence->exists(chaptersDir)) {
        for (const auto& path : ListDirectory(chaptersDir)) {
            std::error_code ec;
            if (!fs::is_directory(path, ec)) continue;

            auto chapter = loadChapterDirectory(path);
            if (!chapter) continue;

            if (m_project.chapters.count(chapter->id) > 0) {
                std::cerr << "[ProjectStore] Duplicate chapter id " << chapter->id << " in " << path
                          << ", keeping " << m_project.chapters[chapter->id].dirPath << std::endl;
                continue;
            }
            m_project.chapters.emplace(chapter->id, std::move(*chapter));
        }
    }

    for (const auto& [id, chapter] : indexed) {
        if (m_project.chapters.count(id) == 0) {
            std::cerr << "[ProjectStore] Indexed chapter " << id << " (" << chapter.title
                      << ") has no directory on disk; dropping it" << std::endl;
        }
    }

    reconcileIndex();
}

std::optional<Chapter> ProjectStore::loadChapterDirectory(const fs::path& dir) const {
    fs::path metadataFile = ProjectLayout::GetChapterMetadataFile(dir);
    if (!m_persistence->exists(metadataFile)) {
        return std::nullopt; // scaffolding not finalized yet
    }

    Chapter chapter = ProjectJsonCodec::ChapterFromJson(readJson(metadataFile), metadataFile);

    fs::path contentFile = ProjectLayout::GetChapterContentFile(dir);
    chapter.content = m_persistence->exists(contentFile) ? m_persistence->readText(contentFile) : std::string{};
    chapter.wordCount = domain::CountWords(chapter.content);
    chapter.dirPath = dir;
    chapter.currentVersion = deriveCurrentVersion(dir);
    return chapter;
}

std::uint32_t ProjectStore::deriveCurrentVersion(const fs::path& dir) const {
    fs::path historyDir = ProjectLayout::GetHistoryDir(dir);
    if (!m_persistence->exists(historyDir)) return 0;

    std::optional<std::uint32_t> latest;
    for (const auto& path : ListDirectory(historyDir)) {
        auto version = ProjectLayout::ParseVersionFileName(path.filename().string());
        if (version && (!latest || *version > *latest)) {
            latest = version;
        }
    }
    return latest ? *latest + 1 : 0;
}

void ProjectStore::reconcileIndex() {
    std::set<ChapterId> listed;

    for (auto& volume : m_project.volumes) {
        std::vector<ChapterId> kept;
        for (const auto& id : volume.chapterIds) {
            Chapter* chapter = m_project.findChapter(id);
            if (!chapter || listed.count(id) > 0) {
                std::cerr << "[ProjectStore] Dropping chapter " << id << " from volume '" << volume.title
                          << "' (" << (chapter ? "listed twice" : "not on disk") << ")" << std::endl;
                continue;
            }
            listed.insert(id);
            chapter->volumeId = volume.id;
            kept.push_back(id);
        }
        volume.chapterIds = std::move(kept);
    }

    for (auto& [id, chapter] : m_project.chapters) {
        if (listed.count(id) > 0) continue;

        Volume* home = m_project.findVolume(chapter.volumeId);
        if (!home) {
            if (m_project.volumes.empty()) {
                m_project.volumes.emplace_back(VolumeId::Generate(), m_config.defaultVolumeTitle, 0);
            }
            home = &m_project.volumes.front();
        }
        std::cerr << "[ProjectStore] Re-attaching orphan chapter " << id << " to volume '" << home->title << "'" << std::endl;
        home->chapterIds.push_back(id);
        chapter.volumeId = home->id;
        listed.insert(id);
    }

    std::stable_sort(m_project.volumes.begin(), m_project.volumes.end(),
                     [](const Volume& a, const Volume& b) { return a.order < b.order; });
    m_project.renumberVolumes();
    for (const auto& volume : m_project.volumes) {
        m_project.renumberChapters(volume);
    }

    if (!m_project.chapters.empty()) {
        std::uint64_t highest = m_project.chapters.rbegin()->first.value;
        m_project.nextChapterId = std::max(m_project.nextChapterId, highest + 1);
    }
}

} // namespace novelstore::application
