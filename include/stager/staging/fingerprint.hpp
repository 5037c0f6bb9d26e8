#pragma once

#include "stager/core/result.hpp"
#include "stager/staging/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace stager::staging {

/**
 * @brief Incremental MD5 over a byte stream, counting bytes as it goes.
 *
 * Feed chunks with update(), then call finish() once. Any digest engine
 * failure latches: later updates return false and finish() returns nullopt.
 */
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    [[nodiscard]] bool update(const std::uint8_t* data, std::size_t size) noexcept;

    [[nodiscard]] std::optional<Fingerprint> finish() noexcept;

    [[nodiscard]] std::uint64_t bytes_seen() const noexcept { return bytes_seen_; }

private:
    struct Context;

    std::unique_ptr<Context> context_;
    std::uint64_t bytes_seen_ = 0;
    bool healthy_ = false;
};

/**
 * @brief Streaming MD5 over a resource's bytes.
 *
 * The digest depends only on content, never on path, name or file metadata,
 * so identical bytes always produce the same fingerprint.
 */
class Fingerprinter {
public:
    static constexpr std::size_t kReadChunkSize = 64 * 1024;

    [[nodiscard]] stager::Result<Fingerprint> fingerprint(const ResourceSource& source) const;

    [[nodiscard]] stager::Result<Fingerprint> fingerprint(const ByteBuffer& bytes) const;
};

/// `name-hex`, the object name under the staging location.
std::string unique_content_name(const std::string& logical_name, const Fingerprint& fingerprint);

/// `base/name-hex`; a trailing '/' on @p staging_location is not doubled.
std::string destination_key(const std::string& staging_location,
                            const std::string& logical_name,
                            const Fingerprint& fingerprint);

} // namespace stager::staging
