#pragma once

#include "stager/core/result.hpp"
#include "stager/staging/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace stager::store {

/**
 * @brief An object being written to the store.
 *
 * Written bytes become visible under the key only after commit() succeeds.
 * Destroying the object without a successful commit discards everything
 * written so far, so a failed transfer never shows up in exists().
 */
class WritableObject {
public:
    virtual ~WritableObject() = default;

    virtual stager::Result<void> write(const std::uint8_t* data, std::size_t size) = 0;

    virtual stager::Result<void> commit() = 0;
};

/**
 * @brief Destination store collaborator.
 *
 * Implementations must allow concurrent calls for distinct keys. exists() is
 * read-only; an Error means the answer is unknown, not that the object is absent.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual stager::Result<bool> exists(const std::string& key) = 0;

    virtual stager::Result<std::unique_ptr<WritableObject>> create(const std::string& key,
                                                                   const staging::CreateOptions& options) = 0;
};

} // namespace stager::store
