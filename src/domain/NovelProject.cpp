/**
 * @file NovelProject.cpp
 * @brief Implementation of the NovelProject aggregate.
 */

#include "domain/NovelProject.hpp"

#include <algorithm>
#include <tuple>

namespace novelstore::domain {

NovelProject NovelProject::createNew(std::filesystem::path root, std::string title, const std::string& firstVolumeTitle) {
    NovelProject project;
    project.rootPath = std::move(root);
    project.title = std::move(title);
    project.createdAt = std::chrono::system_clock::now();
    project.modifiedAt = project.createdAt;
    project.volumes.emplace_back(VolumeId::Generate(), firstVolumeTitle, 0);
    return project;
}

Volume* NovelProject::findVolume(const VolumeId& id) {
    auto it = std::find_if(volumes.begin(), volumes.end(), [&](const Volume& v) { return v.id == id; });
    return it == volumes.end() ? nullptr : &*it;
}

const Volume* NovelProject::findVolume(const VolumeId& id) const {
    auto it = std::find_if(volumes.begin(), volumes.end(), [&](const Volume& v) { return v.id == id; });
    return it == volumes.end() ? nullptr : &*it;
}

Chapter* NovelProject::findChapter(const ChapterId& id) {
    auto it = chapters.find(id);
    return it == chapters.end() ? nullptr : &it->second;
}

const Chapter* NovelProject::findChapter(const ChapterId& id) const {
    auto it = chapters.find(id);
    return it == chapters.end() ? nullptr : &it->second;
}

Volume* NovelProject::volumeContaining(const ChapterId& id) {
    for (auto& volume : volumes) {
        if (volume.contains(id)) return &volume;
    }
    return nullptr;
}

std::vector<const Chapter*> NovelProject::allChaptersInOrder() const {
    std::map<VolumeId, std::size_t> volumeOrder;
    for (const auto& volume : volumes) {
        volumeOrder[volume.id] = volume.order;
    }

    auto sortKey = [&](const Chapter* c) {
        auto it = volumeOrder.find(c->volumeId);
        std::size_t vo = it == volumeOrder.end() ? 0 : it->second;
        return std::make_tuple(vo, c->order, c->id.value);
    };

    std::vector<const Chapter*> ordered;
    ordered.reserve(chapters.size());
    for (const auto& [id, chapter] : chapters) {
        ordered.push_back(&chapter);
    }
    std::sort(ordered.begin(), ordered.end(), [&](const Chapter* a, const Chapter* b) {
        return sortKey(a) < sortKey(b);
    });
    return ordered;
}

std::vector<const Chapter*> NovelProject::chaptersForVolume(const VolumeId& volumeId) const {
    std::vector<const Chapter*> result;
    const Volume* volume = findVolume(volumeId);
    if (!volume) return result;

    for (const auto& chapterId : volume->chapterIds) {
        if (const Chapter* chapter = findChapter(chapterId)) {
            result.push_back(chapter);
        }
    }
    return result;
}

ChapterId NovelProject::allocateChapterId() {
    // Skip anything already present (e.g. a counter restored from stale metadata).
    while (chapters.count(ChapterId(nextChapterId)) > 0) {
        nextChapterId++;
    }
    return ChapterId(nextChapterId++);
}

void NovelProject::renumberVolumes() {
    for (std::size_t i = 0; i < volumes.size(); ++i) {
        volumes[i].order = i;
    }
}

void NovelProject::renumberChapters(const Volume& volume) {
    for (std::size_t i = 0; i < volume.chapterIds.size(); ++i) {
        if (Chapter* chapter = findChapter(volume.chapterIds[i])) {
            chapter->order = i;
        }
    }
}

} // namespace novelstore::domain
