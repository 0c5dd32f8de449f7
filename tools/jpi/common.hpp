/**
 * jpi CLI - Common utilities and types
 */

#pragma once

#include "jpi/build_config.hpp"
#include "jpi/project_file.hpp"
#include "jpi/resolver.hpp"
#include "jpi/types.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace jpi::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string project = PROJECT_FILE_NAME;  // -p, --project
    bool json = false;                        // --json
    bool verbose = false;                     // -v, --verbose
    bool quiet = false;                       // -q, --quiet
};

inline void configure_logging(const GlobalOptions& opts) {
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode,
                        ErrorKind kind = ErrorKind::None) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (kind != ErrorKind::None) {
            j["kind"] = error_kind_to_string(kind);
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_resolution_errors(const std::vector<ResolutionError>& errors, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["kind"] = error_kind_to_string(ErrorKind::Resolution);
        j["errors"] = nlohmann::json::array();
        for (const auto& e : errors) {
            j["errors"].push_back({{"role", e.role},
                                   {"module", e.module.to_string()},
                                   {"reason", e.reason}});
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        for (const auto& e : errors) {
            std::cerr << "Error: " << e.message() << std::endl;
        }
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline nlohmann::json artifact_to_json(const ResolvedArtifact& artifact) {
    nlohmann::json j;
    j["id"] = artifact.id.to_string();
    j["type"] = artifact.type;
    if (!artifact.classifier.empty()) j["classifier"] = artifact.classifier;
    j["file"] = artifact.file;
    return j;
}

/**
 * Load the project file into `config`. Prints the error and returns false
 * on failure.
 */
inline bool load_project(const GlobalOptions& opts, BuildConfiguration& config) {
    auto loaded = load_project_file(opts.project, config);
    if (!loaded.ok) {
        print_error(opts.project + ": " + loaded.error, opts.json, loaded.error_kind);
        return false;
    }
    return true;
}

} // namespace jpi::cli
