#pragma once

#include "stager/core/result.hpp"
#include "stager/staging/types.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace stager::staging {

using ChunkSink = std::function<stager::Result<void>(const std::uint8_t* data, std::size_t size)>;

/**
 * @brief Parse a `name=path` or bare-path entry into a ResourceSpec.
 *
 * The text before the first '=' is the logical name. Without a separator the
 * logical name is the final segment of the path. Fails with InvalidResourceSpec
 * when the path is not a readable regular file.
 */
stager::Result<ResourceSpec> resolve_resource(const std::string& entry);

/**
 * @brief Wrap an in-memory buffer as a resource named @p logical_name.
 */
stager::Result<ResourceSpec> make_buffer_resource(ByteBuffer bytes, std::string logical_name);

/**
 * @brief Stream the bytes of @p source to @p sink in chunks of at most @p chunk_size.
 *
 * Stops at the first error returned by the sink. Read failures on a file
 * source are reported as InvalidResourceSpec.
 */
stager::Result<void> for_each_chunk(const ResourceSource& source,
                                    std::size_t chunk_size,
                                    const ChunkSink& sink);

/// Human-readable description of a source for log lines and error messages.
std::string describe_source(const ResourceSource& source);

} // namespace stager::staging
