#include "stager/staging/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace stager::staging {
using json = nlohmann::json;

stager::Result<CreateOptions> build_create_options(const StagingConfig& config) {
    const std::int64_t requested =
        config.upload_buffer_size_bytes.value_or(StagingConfig::kDefaultUploadBufferSizeBytes);
    if (requested <= 0) {
        return stager::Err<CreateOptions>(ErrorKind::InvalidConfiguration,
                                          "upload_buffer_size_bytes must be > 0, got " + std::to_string(requested));
    }

    const auto clamped = std::min<std::int64_t>(requested, kMaxUploadBufferSizeBytes);
    CreateOptions options;
    options.upload_buffer_size_bytes = static_cast<std::uint32_t>(clamped);
    options.content_type = kBinaryContentType;
    return stager::Ok(options);
}

stager::Result<void> validate_config(const StagingConfig& config) {
    if (config.staging_location.empty()) {
        return stager::Err<void>(ErrorKind::InvalidConfiguration, "staging_location is required");
    }
    if (config.parallelism == 0) {
        return stager::Err<void>(ErrorKind::InvalidConfiguration, "parallelism must be > 0");
    }
    return stager::Ok();
}

std::vector<std::string> build_default_entries(const StagingConfig& config) {
    std::vector<std::string> entries;
    entries.reserve(config.files_to_stage.size() + 2);

    // The worker jar leads the classpath, matching the built-in worker order
    if (config.priority_artifact_path && !config.priority_artifact_path->empty()) {
        entries.push_back(std::string(kPriorityArtifactName) + "=" + *config.priority_artifact_path);
    }

    entries.insert(entries.end(), config.files_to_stage.begin(), config.files_to_stage.end());

    if (config.auxiliary_binary_path) {
        entries.push_back(std::string(kAuxiliaryBinaryName) + "=" + *config.auxiliary_binary_path);
    }
    return entries;
}

stager::Result<StagingConfig> parse_config(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        return stager::Err<StagingConfig>(ErrorKind::InvalidConfiguration,
                                          std::string("Malformed config: ") + e.what());
    }

    if (!document.is_object()) {
        return stager::Err<StagingConfig>(ErrorKind::InvalidConfiguration, "Config must be a JSON object");
    }

    StagingConfig config;
    try {
        config.staging_location = document.at("staging_location").get<std::string>();

        if (auto it = document.find("upload_buffer_size_bytes"); it != document.end() && !it->is_null()) {
            config.upload_buffer_size_bytes = it->get<std::int64_t>();
        }
        if (auto it = document.find("priority_artifact_path"); it != document.end() && !it->is_null()) {
            config.priority_artifact_path = it->get<std::string>();
        }
        if (auto it = document.find("auxiliary_binary_path"); it != document.end() && !it->is_null()) {
            config.auxiliary_binary_path = it->get<std::string>();
        }
        if (auto it = document.find("files_to_stage"); it != document.end()) {
            config.files_to_stage = it->get<std::vector<std::string>>();
        }
        if (auto it = document.find("parallelism"); it != document.end()) {
            const auto parallelism = it->get<std::int64_t>();
            if (parallelism <= 0) {
                return stager::Err<StagingConfig>(ErrorKind::InvalidConfiguration,
                                                  "parallelism must be > 0, got " + std::to_string(parallelism));
            }
            config.parallelism = static_cast<std::size_t>(parallelism);
        }
    } catch (const json::exception& e) {
        return stager::Err<StagingConfig>(ErrorKind::InvalidConfiguration,
                                          std::string("Invalid config field: ") + e.what());
    }

    if (auto valid = validate_config(config); valid.is_error()) {
        return stager::Err<StagingConfig>(valid.error());
    }
    return stager::Ok(std::move(config));
}

stager::Result<StagingConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return stager::Err<StagingConfig>(ErrorKind::InvalidConfiguration,
                                          std::string("Failed to open config file: ") + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

} // namespace stager::staging
