/**
 * @file Identifiers.hpp
 * @brief Value types identifying chapters and volumes.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace novelstore::domain {

/**
 * @struct ChapterId
 * @brief Numeric chapter identifier, allocated from a monotonic project counter.
 */
struct ChapterId {
    std::uint64_t value = 0;

    ChapterId() = default;
    explicit ChapterId(std::uint64_t v) : value(v) {}

    std::string toString() const { return std::to_string(value); }

    bool operator==(const ChapterId& other) const { return value == other.value; }
    bool operator!=(const ChapterId& other) const { return value != other.value; }
    bool operator<(const ChapterId& other) const { return value < other.value; }
};

inline std::ostream& operator<<(std::ostream& os, const ChapterId& id) {
    return os << id.value;
}

/**
 * @struct VolumeId
 * @brief Opaque volume identifier (lowercase random UUID).
 */
struct VolumeId {
    std::string value;

    VolumeId() = default;
    explicit VolumeId(std::string v) : value(std::move(v)) {}

    /** @brief Generates a fresh random identifier. */
    static VolumeId Generate();

    bool empty() const { return value.empty(); }
    const std::string& toString() const { return value; }

    bool operator==(const VolumeId& other) const { return value == other.value; }
    bool operator!=(const VolumeId& other) const { return value != other.value; }
    bool operator<(const VolumeId& other) const { return value < other.value; }
};

inline std::ostream& operator<<(std::ostream& os, const VolumeId& id) {
    return os << id.value;
}

} // namespace novelstore::domain

namespace std {

template <>
struct hash<novelstore::domain::ChapterId> {
    size_t operator()(const novelstore::domain::ChapterId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

template <>
struct hash<novelstore::domain::VolumeId> {
    size_t operator()(const novelstore::domain::VolumeId& id) const noexcept {
        return std::hash<std::string>{}(id.value);
    }
};

} // namespace std
