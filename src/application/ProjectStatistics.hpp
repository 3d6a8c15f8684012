/**
 * @file ProjectStatistics.hpp
 * @brief Word and progress totals derived from a project's in-memory state.
 */

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "domain/NovelProject.hpp"

namespace novelstore::application {

struct VolumeStatistics {
    domain::VolumeId volumeId;
    std::string title;
    std::size_t chapterCount = 0;
    std::size_t wordCount = 0;
};

/**
 * @struct ProjectStatistics
 * @brief Snapshot of totals; recompute after mutations.
 */
struct ProjectStatistics {
    std::size_t totalWords = 0;
    std::size_t totalChapters = 0;
    std::vector<VolumeStatistics> volumes; ///< In volume order.
    std::array<std::size_t, domain::kChapterStatusCount> chaptersByStatus{};

    std::size_t countFor(domain::ChapterStatus status) const {
        return chaptersByStatus[static_cast<std::size_t>(status)];
    }

    static ProjectStatistics Compute(const domain::NovelProject& project);
};

/**
 * @brief Compact display form: "950", "1.2k", "3.4M".
 */
std::string FormatWordCount(std::size_t count);

} // namespace novelstore::application
