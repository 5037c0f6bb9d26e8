#pragma once

#include "stager/core/result.hpp"
#include "stager/staging/types.hpp"
#include "stager/store/object_store.hpp"

#include <cstdint>
#include <string>

namespace stager::staging {

/**
 * @brief Read-only existence check against the destination store.
 *
 * Store failures come back as ProbeFailed, never folded into a yes/no answer.
 */
class ExistenceProber {
public:
    explicit ExistenceProber(store::ObjectStore& store) : store_(store) {}

    [[nodiscard]] stager::Result<bool> exists(const std::string& key) const;

private:
    store::ObjectStore& store_;
};

/**
 * @brief Writes a resource's full content to a destination key.
 *
 * Content is streamed in chunks of CreateOptions::upload_buffer_size_bytes and
 * committed only after the last chunk, so a failed transfer leaves nothing
 * visible. The streamed bytes are re-hashed and must match @p expected, the
 * fingerprint the key was derived from; otherwise the object is discarded
 * uncommitted. Uploading identical bytes to the same key again is harmless.
 */
class Uploader {
public:
    explicit Uploader(store::ObjectStore& store) : store_(store) {}

    [[nodiscard]] stager::Result<std::uint64_t> upload(const std::string& key,
                                                       const ResourceSource& source,
                                                       const Fingerprint& expected,
                                                       const CreateOptions& options) const;

private:
    store::ObjectStore& store_;
};

} // namespace stager::staging
