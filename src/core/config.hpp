/**
 * @file config.hpp
 * @brief Service configuration with TOML deserialization.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace runbox {

struct ServiceConfig {
    uint32_t workers = 4;               ///< Fixed sandbox worker pool size
    uint32_t queue_capacity = 64;       ///< Jobs allowed to wait for a worker
};

/// Connection threads kept free for cancel and health while executes wait.
inline constexpr uint32_t kControlConnectionThreads = 4;

/**
 * Each execute holds a connection thread until its result is ready, so the
 * pool must outnumber every job that can be admitted at once. Otherwise the
 * overflow waits in the connection backlog and never gets its 503.
 */
struct ServerConfig {
    uint16_t port = 7070;
    uint64_t max_request_bytes = 1048576;
    uint32_t connection_threads = 0;    ///< 0 = workers + queue_capacity + control threads
};


/**
 * @brief Budget defaults and hard bounds.
 *
 * Overrides above `max` are clamped; overrides below `min` are rejected.
 */
struct LimitsConfig {
    ResourceBudget defaults{
        .cpu_time_ms = 2000,
        .wall_time_ms = 5000,
        .memory_bytes = 128ULL * 1024 * 1024,
        .max_output_bytes = 64 * 1024,
        .max_processes = 16
    };
    ResourceBudget max{
        .cpu_time_ms = 10000,
        .wall_time_ms = 15000,
        .memory_bytes = 512ULL * 1024 * 1024,
        .max_output_bytes = 1024 * 1024,
        .max_processes = 64
    };
    ResourceBudget min{
        .cpu_time_ms = 1,
        .wall_time_ms = 1,
        .memory_bytes = 1024 * 1024,
        .max_output_bytes = 1,
        .max_processes = 1
    };
};

struct SandboxConfig {
    std::filesystem::path scratch_root = "/tmp/runbox";
    std::filesystem::path cgroup_root;          ///< Empty = cgroup enforcement off
    uint32_t tick_ms = 10;                      ///< Supervision interval, <= 100
    uint64_t scratch_file_bytes = 16ULL * 1024 * 1024;
    uint32_t open_files = 64;
};

/**
 * @brief Launch configuration of one language runtime.
 *
 * `command` is an argv template; the element "{source}" is replaced with the
 * path of the source file inside the scratch area.
 */
struct LanguageConfig {
    std::vector<std::string> command;
    std::string source_file;
    std::vector<std::string> readonly_paths;    ///< Bound read-only into the job's root
    uint32_t address_space_factor = 8;          ///< RLIMIT_AS = memory * factor, 0 = off
};

struct TelemetryConfig {
    std::filesystem::path log_dir;              ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level service configuration.
 */
struct Config {
    ServiceConfig service;
    ServerConfig server;
    LimitsConfig limits;
    SandboxConfig sandbox;
    std::map<Language, LanguageConfig> languages;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file. Missing keys keep defaults.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration, including the builtin languages.
 */
Config default_config();

/**
 * @brief Check cross-field constraints of a configuration.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Connection pool size the server runs with.
 */
uint32_t effective_connection_threads(const Config& config) noexcept;

}  // namespace runbox
