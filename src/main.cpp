/*
 * Copyright 2025 Conduit Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Conduit API Gateway - Main Entry Point
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>

#include "control/config.hpp"
#include "core/http_server.hpp"
#include "core/logging.hpp"
#include "gateway/factory.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_reload_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    } else if (signal == SIGHUP) {
        g_reload_requested = true;
    }
}

void log_validation(quill::Logger* logger, std::string_view what,
                    const conduit::control::ValidationResult& result) {
    for (const auto& warning : result.warnings) {
        LOG_WARNING(logger, "{}: {}", what, warning);
    }
    for (const auto& error : result.errors) {
        LOG_ERROR(logger, "{}: {}", what, error);
    }
}

void reload_definitions(conduit::gateway::Gateway& gateway) {
    auto* logger = conduit::logging::get_logger();

    auto endpoints = gateway.services.directory->reload();
    log_validation(logger, "Endpoint definitions", endpoints);

    auto environments = gateway.services.environments->reload();
    log_validation(logger, "Environment settings", environments);

    LOG_INFO(logger, "Definitions loaded: endpoints={}", gateway.services.directory->size());
}

// Components are built from the startup snapshot; a reload validates and publishes the
// new file, and changed sections take effect on the next start
void reload_configuration(conduit::control::ConfigManager& config_manager) {
    auto* logger = conduit::logging::get_logger();
    auto before = config_manager.get();

    if (!config_manager.reload()) {
        log_validation(logger, "Configuration reload", config_manager.last_validation());
        LOG_ERROR(logger, "Configuration reload failed, keeping the running configuration");
        return;
    }
    log_validation(logger, "Configuration reload", config_manager.last_validation());

    auto after = config_manager.get();
    auto changed = conduit::control::ConfigLoader::changed_sections(*before, *after);
    if (changed.empty()) {
        LOG_INFO(logger, "Configuration reloaded, no changes");
        return;
    }
    for (const auto& section : changed) {
        LOG_WARNING(logger, "Configuration section '{}' changed, restart to apply it", section);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    printf("Conduit API Gateway v0.1.0\n\n");

    if (argc < 3 || std::string(argv[1]) != "--config") {
        fprintf(stderr, "Usage: %s --config <config.json>\n", argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];

    printf("Loading configuration from %s...\n", config_path.c_str());
    conduit::control::ConfigManager config_manager;

    if (!config_manager.load(config_path)) {
        fprintf(stderr, "Failed to load configuration\n");

        const auto& validation = config_manager.last_validation();
        if (!validation.errors.empty()) {
            fprintf(stderr, "Configuration validation errors:\n");
            for (const auto& error : validation.errors) {
                fprintf(stderr, "  - %s\n", error.c_str());
            }
        }
        return EXIT_FAILURE;
    }

    auto config_ptr = config_manager.get();
    if (!config_ptr) {
        fprintf(stderr, "Failed to get configuration\n");
        return EXIT_FAILURE;
    }
    const conduit::control::Config& config = *config_ptr;

    conduit::logging::init_logging_system();
    auto* logger = conduit::logging::init_logger(config.logging);
    log_validation(logger, "Configuration", config_manager.last_validation());

    int exit_code = EXIT_SUCCESS;
    try {
        auto gateway = conduit::gateway::build_gateway(config);
        reload_definitions(gateway);
        gateway.services.health->start();

        conduit::core::HttpServer server(config.server, *gateway.dispatcher);

        std::signal(SIGINT, signal_handler);   // Ctrl+C
        std::signal(SIGTERM, signal_handler);  // Kill signal
        std::signal(SIGHUP, signal_handler);   // Reload configuration and definitions

        // Signal handlers only set flags; this thread acts on them
        std::atomic<bool> watcher_done{false};
        std::thread watcher([&] {
            while (!watcher_done.load()) {
                if (g_shutdown_requested.exchange(false)) {
                    LOG_INFO(logger, "Shutdown signal received, stopping");
                    server.stop();
                    return;
                }
                if (g_reload_requested.exchange(false)) {
                    LOG_INFO(logger, "SIGHUP received, reloading configuration and definitions");
                    reload_configuration(config_manager);
                    reload_definitions(gateway);
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        auto ec = server.run();
        watcher_done = true;
        watcher.join();

        if (ec) {
            LOG_ERROR(logger, "Server error: {}", ec.message());
            exit_code = EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        LOG_ERROR(logger, "Startup failed: {}", e.what());
        exit_code = EXIT_FAILURE;
    }

    LOG_INFO(logger, "Conduit stopped");
    conduit::logging::shutdown_logging();
    return exit_code;
}
