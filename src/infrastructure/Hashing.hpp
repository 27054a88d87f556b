/**
 * @file Hashing.hpp
 * @brief Content hashing and identifier generation.
 */

#pragma once
#include <string>

namespace ideasnapshot::infrastructure {

/** @brief Lowercase hex SHA-256 digest of @p text. */
std::string Sha256Hex(const std::string& text);

/** @brief Random RFC 4122 version-4 style identifier. Thread-safe. */
std::string GenerateId();

} // namespace ideasnapshot::infrastructure
