/**
 * @file components.hpp
 * @brief Observers that react to staging events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * Stager stager(config, store, &bus);
 */

#pragma once

#include "stager/events/event_bus.hpp"
#include "stager/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace stager::events {

/**
 * @brief Logger component - logs every staging event with spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<StagingStartedEvent>([this](const StagingStartedEvent& e) {
            on_staging_started(e);
        });

        bus_.subscribe<StagingCompletedEvent>([this](const StagingCompletedEvent& e) {
            on_staging_completed(e);
        });

        bus_.subscribe<StagingFailedEvent>([this](const StagingFailedEvent& e) {
            on_staging_failed(e);
        });

        bus_.subscribe<PackageUploadedEvent>([this](const PackageUploadedEvent& e) {
            on_package_uploaded(e);
        });

        bus_.subscribe<PackageCachedEvent>([this](const PackageCachedEvent& e) {
            on_package_cached(e);
        });

        bus_.subscribe<PackageFailedEvent>([this](const PackageFailedEvent& e) {
            on_package_failed(e);
        });
    }

private:
    void on_staging_started(const StagingStartedEvent& e) {
        spdlog::info("[StagingStarted] location={} resources={}", e.staging_location, e.resource_count);
    }

    void on_staging_completed(const StagingCompletedEvent& e) {
        spdlog::info("[StagingCompleted] location={} uploaded={} cached={} bytes={} duration={}ms",
                     e.staging_location, e.uploaded, e.cached, e.bytes_uploaded, e.duration.count());
    }

    void on_staging_failed(const StagingFailedEvent& e) {
        spdlog::error("[StagingFailed] location={} error={}", e.staging_location, e.error.describe());
    }

    void on_package_uploaded(const PackageUploadedEvent& e) {
        spdlog::debug("[PackageUploaded] name={} location={} bytes={} duration={}ms",
                      e.name, e.location, e.bytes, e.duration.count());
    }

    void on_package_cached(const PackageCachedEvent& e) {
        spdlog::debug("[PackageCached] name={} location={} size={}", e.name, e.location, e.size);
    }

    void on_package_failed(const PackageFailedEvent& e) {
        spdlog::warn("[PackageFailed] entry={} error={}", e.entry, e.error.describe());
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - counts staging outcomes
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * spdlog::info("Uploaded {} packages", stats.packages_uploaded.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> batches_started{0};
        std::atomic<uint64_t> batches_completed{0};
        std::atomic<uint64_t> batches_failed{0};
        std::atomic<uint64_t> packages_uploaded{0};
        std::atomic<uint64_t> packages_cached{0};
        std::atomic<uint64_t> packages_failed{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> bytes_cached{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<StagingStartedEvent>([this](const StagingStartedEvent&) {
            stats_.batches_started++;
        });

        bus_.subscribe<StagingCompletedEvent>([this](const StagingCompletedEvent&) {
            stats_.batches_completed++;
        });

        bus_.subscribe<StagingFailedEvent>([this](const StagingFailedEvent&) {
            stats_.batches_failed++;
        });

        bus_.subscribe<PackageUploadedEvent>([this](const PackageUploadedEvent& e) {
            stats_.packages_uploaded++;
            stats_.bytes_uploaded += e.bytes;
        });

        bus_.subscribe<PackageCachedEvent>([this](const PackageCachedEvent& e) {
            stats_.packages_cached++;
            stats_.bytes_cached += e.size;
        });

        bus_.subscribe<PackageFailedEvent>([this](const PackageFailedEvent&) {
            stats_.packages_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Staging Statistics:");
        spdlog::info("  Batches started:   {}", stats_.batches_started.load());
        spdlog::info("  Batches completed: {}", stats_.batches_completed.load());
        spdlog::info("  Batches failed:    {}", stats_.batches_failed.load());
        spdlog::info("  Packages uploaded: {}", stats_.packages_uploaded.load());
        spdlog::info("  Packages cached:   {}", stats_.packages_cached.load());
        spdlog::info("  Packages failed:   {}", stats_.packages_failed.load());
        spdlog::info("  Bytes uploaded:    {}", stats_.bytes_uploaded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace stager::events
