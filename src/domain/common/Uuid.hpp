/**
 * @file Uuid.hpp
 * @brief Identifier generation backed by libuuid.
 */

#pragma once

#include <string>

namespace glucosetrail::domain {

/** @brief Returns a fresh random (v4) UUID in lower-case canonical form. */
std::string NewUuid();

} // namespace glucosetrail::domain
