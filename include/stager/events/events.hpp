/**
 * @file events.hpp
 * @brief Event types emitted while staging artifacts
 *
 * NAMING CONVENTION:
 * Events are past-tense: PackageUploadedEvent, StagingFailedEvent
 *
 * WHO EMITS:
 * - Stager (staging coordinator), from the calling thread for batch
 *   events and from pool threads for per-package events
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent (log each step)
 * - MetricsComponent (count uploads, cache hits, bytes)
 */

#pragma once

#include "stager/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace stager::events {

// ════════════════════════════════════════════════════════
// Batch Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted before the first unit of a staging call is dispatched
 */
struct StagingStartedEvent {
    std::string staging_location;
    size_t resource_count;
    std::chrono::system_clock::time_point timestamp;

    StagingStartedEvent(std::string location, size_t count)
        : staging_location(std::move(location)),
          resource_count(count),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when every resource of a call has been staged
 */
struct StagingCompletedEvent {
    std::string staging_location;
    size_t uploaded;
    size_t cached;
    std::uint64_t bytes_uploaded;
    std::chrono::milliseconds duration;
    std::chrono::system_clock::time_point timestamp;

    StagingCompletedEvent(std::string location,
                          size_t up,
                          size_t hit,
                          std::uint64_t bytes,
                          std::chrono::milliseconds dur)
        : staging_location(std::move(location)),
          uploaded(up),
          cached(hit),
          bytes_uploaded(bytes),
          duration(dur),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when a call fails; carries the batch-level error
 */
struct StagingFailedEvent {
    std::string staging_location;
    Error error;
    std::chrono::system_clock::time_point timestamp;

    StagingFailedEvent(std::string location, Error err)
        : staging_location(std::move(location)),
          error(std::move(err)),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Package Events
// ════════════════════════════════════════════════════════

struct PackageUploadedEvent {
    std::string name;
    std::string location;
    std::uint64_t bytes;
    std::chrono::milliseconds duration;
};

/// The object was already present at its content-addressed key; nothing was written.
struct PackageCachedEvent {
    std::string name;
    std::string location;
    std::uint64_t size;
};

struct PackageFailedEvent {
    std::string entry;
    Error error;
};

} // namespace stager::events
