#include "stager/staging/transfer.hpp"

#include "stager/staging/fingerprint.hpp"
#include "stager/staging/resource.hpp"

#include <spdlog/spdlog.h>

namespace stager::staging {

stager::Result<bool> ExistenceProber::exists(const std::string& key) const {
    auto result = store_.exists(key);
    if (result.is_error()) {
        return stager::Err<bool>(ErrorKind::ProbeFailed,
                                 "Existence check failed for " + key + ": " + result.error().message);
    }
    return result;
}

stager::Result<std::uint64_t> Uploader::upload(const std::string& key,
                                               const ResourceSource& source,
                                               const Fingerprint& expected,
                                               const CreateOptions& options) const {
    if (options.upload_buffer_size_bytes == 0 || options.upload_buffer_size_bytes > kMaxUploadBufferSizeBytes) {
        return stager::Err<std::uint64_t>(ErrorKind::InvalidConfiguration,
                                          "upload buffer size must be in (0, " +
                                          std::to_string(kMaxUploadBufferSizeBytes) + "]");
    }

    auto created = store_.create(key, options);
    if (created.is_error()) {
        return stager::Err<std::uint64_t>(ErrorKind::UploadFailed,
                                          "Failed to create " + key + ": " + created.error().message);
    }
    auto object = std::move(created.value());

    ContentHasher hasher;
    auto streamed = for_each_chunk(source, options.upload_buffer_size_bytes,
        [&](const std::uint8_t* data, std::size_t size) -> stager::Result<void> {
            if (!hasher.update(data, size)) {
                return stager::Err<void>(ErrorKind::FingerprintFailed, "MD5 update failed while uploading");
            }
            return object->write(data, size);
        });
    if (streamed.is_error()) {
        // The uncommitted object is discarded when it goes out of scope
        const auto& error = streamed.error();
        if (error.kind == ErrorKind::InvalidResourceSpec) {
            return stager::Err<std::uint64_t>(error);
        }
        return stager::Err<std::uint64_t>(ErrorKind::UploadFailed,
                                          "Failed to write " + key + ": " + error.message);
    }

    // The key names the fingerprinted content; anything else must not become visible under it
    const auto written = hasher.bytes_seen();
    const auto uploaded = hasher.finish();
    if (!uploaded) {
        return stager::Err<std::uint64_t>(ErrorKind::UploadFailed, "Failed to verify content written to " + key);
    }
    if (uploaded->size != expected.size || uploaded->hex != expected.hex) {
        return stager::Err<std::uint64_t>(ErrorKind::UploadFailed,
                                          describe_source(source) + " changed while staging: fingerprinted " +
                                          std::to_string(expected.size) + " bytes (" + expected.hex +
                                          "), uploaded " + std::to_string(uploaded->size) + " bytes (" +
                                          uploaded->hex + ")");
    }

    if (auto committed = object->commit(); committed.is_error()) {
        return stager::Err<std::uint64_t>(ErrorKind::UploadFailed,
                                          "Failed to commit " + key + ": " + committed.error().message);
    }

    spdlog::debug("Uploaded {} bytes to {}", written, key);
    return stager::Ok(written);
}

} // namespace stager::staging
