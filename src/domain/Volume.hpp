/**
 * @file Volume.hpp
 * @brief Named, ordered group of chapters.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "domain/Identifiers.hpp"

namespace novelstore::domain {

/**
 * @class Volume
 * @brief Holds the authoritative chapter order of one part of the work.
 */
class Volume {
public:
    VolumeId id;
    std::string title;
    std::size_t order = 0;
    std::vector<ChapterId> chapterIds;
    std::string description;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point modifiedAt;

    Volume() = default;

    Volume(VolumeId volumeId, std::string t, std::size_t o)
        : id(std::move(volumeId)),
          title(std::move(t)),
          order(o),
          createdAt(std::chrono::system_clock::now()),
          modifiedAt(createdAt) {}

    bool contains(const ChapterId& chapterId) const {
        return std::find(chapterIds.begin(), chapterIds.end(), chapterId) != chapterIds.end();
    }

    /** @brief Removes a chapter id. @return true if it was listed. */
    bool remove(const ChapterId& chapterId) {
        auto it = std::find(chapterIds.begin(), chapterIds.end(), chapterId);
        if (it == chapterIds.end()) return false;
        chapterIds.erase(it);
        return true;
    }

    /** @brief Inserts at `position`, clamped to the end of the list. */
    void insert(const ChapterId& chapterId, std::size_t position) {
        position = std::min(position, chapterIds.size());
        chapterIds.insert(chapterIds.begin() + static_cast<std::ptrdiff_t>(position), chapterId);
    }

    void touch() { modifiedAt = std::chrono::system_clock::now(); }
};

} // namespace novelstore::domain
