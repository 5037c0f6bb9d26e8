#include "stager/staging/stager.hpp"

#include "stager/events/events.hpp"
#include "stager/staging/resource.hpp"
#include "stager/staging/staging_pool.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <utility>

namespace stager::staging {
namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

// Runs one pipeline step, turning a stray exception into an error of that step
template<typename T, typename Fn>
stager::Result<T> guarded(ErrorKind kind, const std::string& context, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return stager::Err<T>(kind, context + ": " + e.what());
    }
}

// First-failure bookkeeping shared by the units of one batch
class BatchFailure {
public:
    void record(const std::string& entry, const Error& error) {
        failures_.fetch_add(1);
        aborted_.store(true);
        std::lock_guard lock(mutex_);
        if (!first_) {
            first_ = error;
            first_entry_ = entry;
        }
    }

    [[nodiscard]] bool aborted() const { return aborted_.load(); }

    [[nodiscard]] std::optional<Error> to_error(std::size_t total) const {
        std::lock_guard lock(mutex_);
        if (!first_) {
            return std::nullopt;
        }
        return Error{ErrorKind::PartialBatchFailure,
                     "Failed to stage " + std::to_string(failures_.load()) + " of " + std::to_string(total) +
                     " resources; first failure on '" + first_entry_ + "': " + first_->message,
                     first_->kind};
    }

private:
    mutable std::mutex mutex_;
    std::optional<Error> first_;
    std::string first_entry_;
    std::atomic<bool> aborted_{false};
    std::atomic<std::size_t> failures_{0};
};

} // namespace

Stager::Stager(StagingConfig config, store::ObjectStore& store, events::EventBus* bus)
    : config_(std::move(config)),
      store_(store),
      bus_(bus),
      prober_(store_),
      uploader_(store_) {}

stager::Result<Manifest> Stager::stage_default_files() const {
    return stage_files(build_default_entries(config_));
}

stager::Result<Manifest> Stager::stage_files(const std::vector<std::string>& entries) const {
    auto options = prepare();
    if (options.is_error()) {
        return stager::Err<Manifest>(options.error());
    }
    if (entries.empty()) {
        return stager::Ok(Manifest{});
    }

    spdlog::info("Staging {} files to {}", entries.size(), config_.staging_location);
    emit(events::StagingStartedEvent{config_.staging_location, entries.size()});
    const auto started = Clock::now();

    std::vector<std::optional<StagedResource>> slots(entries.size());
    BatchFailure failure;
    {
        StagingPool pool(config_.parallelism);
        const CreateOptions& create_options = options.value();
        for (std::size_t index = 0; index < entries.size(); ++index) {
            if (failure.aborted()) {
                break;
            }
            pool.submit([this, &entries, &slots, &failure, &create_options, index] {
                // Units queued before a failure was recorded do no work
                if (failure.aborted()) {
                    return;
                }
                auto staged = stage_entry(entries[index], create_options);
                if (staged.is_error()) {
                    spdlog::warn("Failed to stage {}: {}", entries[index], staged.error().describe());
                    emit(events::PackageFailedEvent{entries[index], staged.error()});
                    failure.record(entries[index], staged.error());
                    return;
                }
                slots[index] = std::move(staged.value());
            });
        }
        pool.wait();
    }

    if (auto error = failure.to_error(entries.size())) {
        spdlog::error("Staging to {} failed: {}", config_.staging_location, error->message);
        emit(events::StagingFailedEvent{config_.staging_location, *error});
        return stager::Err<Manifest>(*error);
    }

    Manifest manifest;
    manifest.reserve(slots.size());
    std::size_t uploaded = 0;
    std::size_t cached = 0;
    std::uint64_t bytes_uploaded = 0;
    for (auto& slot : slots) {
        if (!slot) {
            return stager::Err<Manifest>(Error{ErrorKind::PartialBatchFailure,
                                               "Staging finished with an unstaged resource"});
        }
        if (slot->uploaded) {
            ++uploaded;
            bytes_uploaded += slot->package.size;
        } else {
            ++cached;
        }
        manifest.push_back(std::move(slot->package));
    }

    spdlog::info("Staging files complete: {} files cached, {} files newly uploaded", cached, uploaded);
    emit(events::StagingCompletedEvent{config_.staging_location, uploaded, cached, bytes_uploaded,
                                       elapsed_since(started)});
    return stager::Ok(std::move(manifest));
}

stager::Result<StagedPackage> Stager::stage_to_file(ByteBuffer bytes, const std::string& base_name) const {
    auto options = prepare();
    if (options.is_error()) {
        return stager::Err<StagedPackage>(options.error());
    }

    auto spec = make_buffer_resource(std::move(bytes), base_name);
    if (spec.is_error()) {
        return stager::Err<StagedPackage>(spec.error());
    }

    emit(events::StagingStartedEvent{config_.staging_location, 1});
    const auto started = Clock::now();

    auto staged = stage_resource(spec.value(), options.value());
    if (staged.is_error()) {
        emit(events::PackageFailedEvent{base_name, staged.error()});
        emit(events::StagingFailedEvent{config_.staging_location, staged.error()});
        return stager::Err<StagedPackage>(staged.error());
    }

    const auto& result = staged.value();
    emit(events::StagingCompletedEvent{config_.staging_location,
                                       result.uploaded ? 1u : 0u,
                                       result.uploaded ? 0u : 1u,
                                       result.uploaded ? result.package.size : 0,
                                       elapsed_since(started)});
    return stager::Ok(result.package);
}

stager::Result<CreateOptions> Stager::prepare() const {
    if (auto valid = validate_config(config_); valid.is_error()) {
        return stager::Err<CreateOptions>(valid.error());
    }
    return build_create_options(config_);
}

stager::Result<Stager::StagedResource> Stager::stage_entry(const std::string& entry,
                                                           const CreateOptions& options) const {
    auto spec = guarded<ResourceSpec>(ErrorKind::InvalidResourceSpec, "Failed to resolve " + entry,
                                      [&] { return resolve_resource(entry); });
    if (spec.is_error()) {
        return stager::Err<StagedResource>(spec.error());
    }
    return stage_resource(spec.value(), options);
}

stager::Result<Stager::StagedResource> Stager::stage_resource(const ResourceSpec& spec,
                                                              const CreateOptions& options) const {
    const auto source = describe_source(spec.source);

    auto fingerprint = guarded<Fingerprint>(ErrorKind::FingerprintFailed, "Failed to fingerprint " + source,
                                            [&] { return fingerprinter_.fingerprint(spec.source); });
    if (fingerprint.is_error()) {
        return stager::Err<StagedResource>(fingerprint.error());
    }

    StagedResource staged;
    staged.package.name = unique_content_name(spec.logical_name, fingerprint.value());
    staged.package.location = destination_key(config_.staging_location, spec.logical_name, fingerprint.value());
    staged.package.size = fingerprint.value().size;
    const auto& key = staged.package.location;

    auto present = guarded<bool>(ErrorKind::ProbeFailed, "Failed to probe " + key,
                                 [&] { return prober_.exists(key); });
    if (present.is_error()) {
        return stager::Err<StagedResource>(present.error());
    }

    if (present.value()) {
        spdlog::debug("Skipping upload of {}: already present at {}", source, key);
        emit(events::PackageCachedEvent{staged.package.name, key, staged.package.size});
        return stager::Ok(std::move(staged));
    }

    spdlog::debug("Uploading {} to {}", source, key);
    const auto started = Clock::now();
    auto written = guarded<std::uint64_t>(ErrorKind::UploadFailed, "Failed to upload " + key,
                                          [&] { return uploader_.upload(key, spec.source, fingerprint.value(), options); });
    if (written.is_error()) {
        return stager::Err<StagedResource>(written.error());
    }

    staged.uploaded = true;
    emit(events::PackageUploadedEvent{staged.package.name, key, written.value(), elapsed_since(started)});
    return stager::Ok(std::move(staged));
}

} // namespace stager::staging
