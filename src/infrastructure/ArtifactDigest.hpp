/**
 * @file ArtifactDigest.hpp
 * @brief SHA-256 of files on disk (OpenSSL EVP).
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace nodeforge::infrastructure {

class ArtifactDigest {
public:
    /** @brief Lowercase hex SHA-256 of the file, or nullopt if it cannot be read. */
    static std::optional<std::string> Sha256File(const std::filesystem::path& path);

    /** @brief Lowercase hex SHA-256 of an in-memory buffer. */
    static std::optional<std::string> Sha256(const std::string& data);
};

} // namespace nodeforge::infrastructure
