#pragma once

#include "stager/core/result.hpp"
#include "stager/staging/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stager::staging {

/**
 * @brief Caller-supplied configuration for one Stager
 */
struct StagingConfig {
    static constexpr std::size_t kDefaultParallelism = 32;
    static constexpr std::int64_t kDefaultUploadBufferSizeBytes = 1024 * 1024;

    std::string staging_location;                          ///< Required destination base
    std::optional<std::int64_t> upload_buffer_size_bytes;  ///< Defaults to 1 MiB, clamped to 1 MiB
    std::optional<std::string> priority_artifact_path;     ///< Staged first, ahead of files_to_stage
    std::optional<std::string> auxiliary_binary_path;      ///< Staged last under kAuxiliaryBinaryName
    std::vector<std::string> files_to_stage;
    std::size_t parallelism = kDefaultParallelism;
};

inline constexpr const char* kPriorityArtifactName = "dataflow-worker.jar";
inline constexpr const char* kAuxiliaryBinaryName = "windmill_main";

/**
 * @brief Derive the store options for a staging call.
 *
 * Fails with InvalidConfiguration when the requested buffer size is not
 * positive; sizes above kMaxUploadBufferSizeBytes are clamped.
 */
stager::Result<CreateOptions> build_create_options(const StagingConfig& config);

/// Checks the fields every staging call needs (destination, parallelism).
stager::Result<void> validate_config(const StagingConfig& config);

/**
 * @brief Ordered entry list for a default staging run.
 *
 * The priority artifact, when set, is placed at index 0; the auxiliary
 * binary, when set, is appended. config.files_to_stage is not modified.
 */
std::vector<std::string> build_default_entries(const StagingConfig& config);

/// Load a StagingConfig from a JSON file.
stager::Result<StagingConfig> load_config(const std::filesystem::path& path);

/// Parse a StagingConfig from JSON text.
stager::Result<StagingConfig> parse_config(const std::string& text);

} // namespace stager::staging
