/**
 * @file Chapter.hpp
 * @brief Entity representing a versioned unit of prose, plus its snapshots.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "domain/ChapterStatus.hpp"
#include "domain/Identifiers.hpp"
#include "domain/WordCount.hpp"

namespace novelstore::domain {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @struct ChapterVersion
 * @brief Immutable snapshot of a chapter's content prior to a change.
 */
struct ChapterVersion {
    std::uint32_t version = 0;
    std::string content;
    std::size_t wordCount = 0;
    std::string summary;
    TimePoint timestamp;
};

/**
 * @class Chapter
 * @brief A titled unit of content living in exactly one volume.
 *
 * `order` mirrors the chapter's index in its volume's chapter list and
 * `wordCount` is derived from `content`; neither is authoritative.
 */
class Chapter {
public:
    ChapterId id;
    std::string title;
    std::size_t order = 0;
    VolumeId volumeId;
    std::filesystem::path dirPath;
    std::string content;
    std::size_t wordCount = 0;
    ChapterStatus status = ChapterStatus::NotStarted;
    std::uint32_t currentVersion = 0;
    TimePoint createdAt;
    TimePoint modifiedAt;

    Chapter() = default;

    Chapter(ChapterId chapterId, std::string t, std::size_t o, VolumeId volume, std::filesystem::path dir)
        : id(chapterId),
          title(std::move(t)),
          order(o),
          volumeId(std::move(volume)),
          dirPath(std::move(dir)),
          createdAt(std::chrono::system_clock::now()),
          modifiedAt(createdAt) {}

    /** @brief Replaces the content and advances the version counter. */
    void updateContent(const std::string& newContent) {
        content = newContent;
        wordCount = CountWords(content);
        currentVersion++;
        modifiedAt = std::chrono::system_clock::now();
    }

    /** @brief Builds the snapshot of the current state, tagged with the current version. */
    ChapterVersion snapshot(const std::string& summary) const {
        return ChapterVersion{currentVersion, content, wordCount, summary, std::chrono::system_clock::now()};
    }

    void touch() { modifiedAt = std::chrono::system_clock::now(); }
};

} // namespace novelstore::domain
