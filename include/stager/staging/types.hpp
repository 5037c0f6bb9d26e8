#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace stager::staging {

using ByteBuffer = std::vector<std::uint8_t>;

/**
 * @brief Where a resource's bytes come from: a file on disk or a shared in-memory buffer
 */
using ResourceSource = std::variant<std::filesystem::path, std::shared_ptr<const ByteBuffer>>;

/**
 * @brief A named resource to stage, parsed from `name=path` or a bare path
 */
struct ResourceSpec {
    std::string logical_name;
    ResourceSource source;
};

/**
 * @brief 128-bit content digest plus the number of bytes it covers
 */
struct Fingerprint {
    std::string hex;        ///< 32 lowercase hex characters
    std::uint64_t size = 0;
};

/**
 * @brief Manifest entry handed back to the caller, one per staged resource
 */
struct StagedPackage {
    std::string name;       ///< Unique content name, `logical_name-hex`
    std::string location;   ///< Full destination key
    std::uint64_t size = 0;

    bool operator==(const StagedPackage& other) const {
        return name == other.name && location == other.location && size == other.size;
    }
};

/**
 * @brief Per-session options passed to the destination store when creating an object
 */
struct CreateOptions {
    std::uint32_t upload_buffer_size_bytes = 0;
    std::string content_type;
};

inline constexpr std::uint32_t kMaxUploadBufferSizeBytes = 1024 * 1024;
inline constexpr const char* kBinaryContentType = "application/octet-stream";

} // namespace stager::staging
