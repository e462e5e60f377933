/**
 * @file ArtifactDigest.cpp
 * @brief Implementation of ArtifactDigest.
 */

#include "infrastructure/ArtifactDigest.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

namespace nodeforge::infrastructure {

namespace {

constexpr size_t kChunkSize = 8192;

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string ToHex(const unsigned char* data, unsigned int len) {
    static const char* digits = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0f]);
    }
    return hex;
}

std::optional<std::string> Finish(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        return std::nullopt;
    }
    return ToHex(digest, len);
}

} // namespace

std::optional<std::string> ArtifactDigest::Sha256File(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[ArtifactDigest] Cannot open " << path << std::endl;
        return std::nullopt;
    }

    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        std::cerr << "[ArtifactDigest] Failed to initialize SHA-256 context" << std::endl;
        return std::nullopt;
    }

    std::vector<char> buffer(kChunkSize);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            std::cerr << "[ArtifactDigest] Digest update failed for " << path << std::endl;
            return std::nullopt;
        }
    }
    if (file.bad()) {
        std::cerr << "[ArtifactDigest] Read error on " << path << std::endl;
        return std::nullopt;
    }
    return Finish(ctx.get());
}

std::optional<std::string> ArtifactDigest::Sha256(const std::string& data) {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return std::nullopt;
    }
    return Finish(ctx.get());
}

} // namespace nodeforge::infrastructure
