/**
 * @file Uuid.cpp
 * @brief Implementation of the libuuid wrappers.
 */

#include "domain/common/Uuid.hpp"

#include <uuid/uuid.h>

namespace glucosetrail::domain {

std::string NewUuid() {
    uuid_t raw;
    uuid_generate_random(raw);
    char text[37];
    uuid_unparse_lower(raw, text);
    return std::string(text);
}

} // namespace glucosetrail::domain
