#pragma once

#include "stager/core/result.hpp"
#include "stager/events/event_bus.hpp"
#include "stager/staging/config.hpp"
#include "stager/staging/fingerprint.hpp"
#include "stager/staging/manifest.hpp"
#include "stager/staging/transfer.hpp"
#include "stager/staging/types.hpp"
#include "stager/store/object_store.hpp"

#include <string>
#include <vector>

namespace stager::staging {

/**
 * @brief Stages local artifacts into a content-addressed destination.
 *
 * Each resource is resolved, fingerprinted, probed at `location/name-md5hex`
 * and uploaded only when absent. Batches run on a StagingPool owned by the
 * call; the returned manifest follows input order. Any per-resource failure
 * fails the whole call with PartialBatchFailure and no manifest.
 */
class Stager {
public:
    Stager(StagingConfig config, store::ObjectStore& store, events::EventBus* bus = nullptr);

    /// Stage config.files_to_stage plus the priority and auxiliary overrides.
    stager::Result<Manifest> stage_default_files() const;

    stager::Result<Manifest> stage_files(const std::vector<std::string>& entries) const;

    /// Stage an in-memory buffer under @p base_name without touching the filesystem.
    /// The buffer is moved into the resource; pass an rvalue to avoid a copy.
    stager::Result<StagedPackage> stage_to_file(ByteBuffer bytes, const std::string& base_name) const;

    [[nodiscard]] const StagingConfig& config() const noexcept { return config_; }

private:
    struct StagedResource {
        StagedPackage package;
        bool uploaded = false;
    };

    stager::Result<StagedResource> stage_entry(const std::string& entry, const CreateOptions& options) const;

    stager::Result<StagedResource> stage_resource(const ResourceSpec& spec, const CreateOptions& options) const;

    stager::Result<CreateOptions> prepare() const;

    template<typename Event>
    void emit(const Event& event) const {
        if (bus_ != nullptr) {
            bus_->emit(event);
        }
    }

    StagingConfig config_;
    store::ObjectStore& store_;
    events::EventBus* bus_;
    Fingerprinter fingerprinter_;
    ExistenceProber prober_;
    Uploader uploader_;
};

} // namespace stager::staging
