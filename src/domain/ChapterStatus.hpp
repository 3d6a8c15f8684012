/**
 * @file ChapterStatus.hpp
 * @brief Value Object describing how far along a chapter is.
 */

#pragma once

#include <optional>
#include <string>

namespace novelstore::domain {

/**
 * @enum ChapterStatus
 * @brief Progress of a single chapter.
 */
enum class ChapterStatus {
    NotStarted,     ///< Created, nothing written yet.
    InProgress,     ///< Currently being written.
    Draft,          ///< First draft complete.
    Review,         ///< Under review.
    Complete        ///< Finalized.
};

inline constexpr int kChapterStatusCount = 5;

inline std::string ChapterStatusToString(ChapterStatus status) {
    switch (status) {
        case ChapterStatus::NotStarted: return "NotStarted";
        case ChapterStatus::InProgress: return "InProgress";
        case ChapterStatus::Draft: return "Draft";
        case ChapterStatus::Review: return "Review";
        case ChapterStatus::Complete: return "Complete";
        default: return "Unknown";
    }
}

/**
 * @brief Parses the persisted name of a status.
 * @return std::nullopt for names this build does not know.
 */
inline std::optional<ChapterStatus> ChapterStatusFromString(const std::string& str) {
    if (str == "NotStarted") return ChapterStatus::NotStarted;
    if (str == "InProgress") return ChapterStatus::InProgress;
    if (str == "Draft") return ChapterStatus::Draft;
    if (str == "Review") return ChapterStatus::Review;
    if (str == "Complete") return ChapterStatus::Complete;
    return std::nullopt;
}

} // namespace novelstore::domain
