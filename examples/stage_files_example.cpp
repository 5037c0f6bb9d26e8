/**
 * @file stage_files_example.cpp
 * @brief Stages files into a local directory and prints the manifest
 *
 * USAGE:
 *   stage_files_example <config.json>
 *   stage_files_example <staging-dir> <file> [name=file ...]
 *
 * Running it twice against the same staging directory shows the
 * second run finding every package already present.
 */

#include "stager/events/components.hpp"
#include "stager/events/event_bus.hpp"
#include "stager/staging/config.hpp"
#include "stager/staging/manifest.hpp"
#include "stager/staging/stager.hpp"
#include "stager/store/local_object_store.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

using stager::staging::StagingConfig;

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 2) {
        spdlog::error("Usage: {} <config.json> | <staging-dir> <file> [name=file ...]", argv[0]);
        return 1;
    }

    StagingConfig config;
    if (argc == 2) {
        auto loaded = stager::staging::load_config(argv[1]);
        if (loaded.is_error()) {
            spdlog::error("Failed to load config: {}", loaded.error().describe());
            return 1;
        }
        config = std::move(loaded.value());
    } else {
        config.staging_location = argv[1];
        config.files_to_stage.assign(argv + 2, argv + argc);
    }

    // ────────────────────────────────────────────────────────
    // Observers
    // ────────────────────────────────────────────────────────

    stager::events::EventBus bus;
    stager::events::LoggerComponent logger(bus);
    stager::events::MetricsComponent metrics(bus);

    stager::store::LocalObjectStore store;
    stager::staging::Stager coordinator(config, store, &bus);

    auto manifest = coordinator.stage_default_files();
    metrics.print_stats();
    if (manifest.is_error()) {
        spdlog::error("Staging failed: {}", manifest.error().describe());
        return 1;
    }

    std::cout << stager::staging::manifest_to_json(manifest.value()) << std::endl;
    return 0;
}
