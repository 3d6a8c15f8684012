/**
 * @file Identifiers.cpp
 * @brief Volume identifier generation backed by libuuid.
 */

#include "domain/Identifiers.hpp"

#include <uuid/uuid.h>

namespace novelstore::domain {

VolumeId VolumeId::Generate() {
    uuid_t raw;
    uuid_generate_random(raw);

    char text[37]; // 36 chars + NUL
    uuid_unparse_lower(raw, text);
    return VolumeId(std::string(text));
}

} // namespace novelstore::domain
