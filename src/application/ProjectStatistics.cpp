/**
 * @file ProjectStatistics.cpp
 * @brief Implementation of ProjectStatistics and word-count formatting.
 */

#include "application/ProjectStatistics.hpp"

#include <cstdio>

namespace novelstore::application {

ProjectStatistics ProjectStatistics::Compute(const domain::NovelProject& project) {
    ProjectStatistics stats;

    for (const auto& volume : project.volumes) {
        VolumeStatistics vs;
        vs.volumeId = volume.id;
        vs.title = volume.title;
        for (const auto* chapter : project.chaptersForVolume(volume.id)) {
            vs.chapterCount++;
            vs.wordCount += chapter->wordCount;
        }
        stats.volumes.push_back(vs);
    }

    for (const auto& [id, chapter] : project.chapters) {
        stats.totalChapters++;
        stats.totalWords += chapter.wordCount;
        stats.chaptersByStatus[static_cast<std::size_t>(chapter.status)]++;
    }
    return stats;
}

std::string FormatWordCount(std::size_t count) {
    char buf[32];
    if (count >= 1000000) {
        std::snprintf(buf, sizeof(buf), "%.1fM", static_cast<double>(count) / 1000000.0);
    } else if (count >= 1000) {
        std::snprintf(buf, sizeof(buf), "%.1fk", static_cast<double>(count) / 1000.0);
    } else {
        return std::to_string(count);
    }
    return buf;
}

} // namespace novelstore::application
