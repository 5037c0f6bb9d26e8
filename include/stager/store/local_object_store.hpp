#pragma once

#include "stager/store/object_store.hpp"

#include <atomic>
#include <filesystem>

namespace stager::store {

/**
 * @brief Object store backed by a local directory tree.
 *
 * Keys are filesystem paths, optionally prefixed with `file://`. Objects are
 * written to a hidden temporary sibling and renamed into place on commit.
 */
class LocalObjectStore : public ObjectStore {
public:
    static constexpr const char* kFileScheme = "file://";

    stager::Result<bool> exists(const std::string& key) override;

    stager::Result<std::unique_ptr<WritableObject>> create(const std::string& key,
                                                           const staging::CreateOptions& options) override;

    /// Filesystem path an object key maps to.
    static std::filesystem::path path_for_key(const std::string& key);

private:
    static stager::Result<void> ensure_parent_exists(const std::filesystem::path& path);

    std::atomic<std::uint64_t> temp_counter_{0};
};

} // namespace stager::store
