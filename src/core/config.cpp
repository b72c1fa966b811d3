/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace runbox {

namespace {

constexpr Language kAllLanguages[] = {
    Language::Python, Language::JavaScript, Language::Shell
};

const std::vector<std::string> kRuntimePaths = {
    "/usr", "/lib", "/lib64", "/bin", "/etc/alternatives", "/etc/ld.so.cache"
};

void read_budget(const toml::node_view<toml::node>& table, ResourceBudget& budget) {
    if (!table.is_table()) return;
    budget.cpu_time_ms = static_cast<uint64_t>(
        table["cpu_time_ms"].value_or(static_cast<int64_t>(budget.cpu_time_ms)));
    budget.wall_time_ms = static_cast<uint64_t>(
        table["wall_time_ms"].value_or(static_cast<int64_t>(budget.wall_time_ms)));
    budget.memory_bytes = static_cast<uint64_t>(
        table["memory_bytes"].value_or(static_cast<int64_t>(budget.memory_bytes)));
    budget.max_output_bytes = static_cast<uint64_t>(
        table["max_output_bytes"].value_or(static_cast<int64_t>(budget.max_output_bytes)));
    budget.max_processes = static_cast<uint64_t>(
        table["max_processes"].value_or(static_cast<int64_t>(budget.max_processes)));
}

std::vector<std::string> read_string_array(const toml::node_view<toml::node>& node) {
    std::vector<std::string> out;
    if (const auto* arr = node.as_array()) {
        for (const auto& elem : *arr) {
            if (auto s = elem.value<std::string>()) {
                out.push_back(*s);
            }
        }
    }
    return out;
}

void read_language(const toml::node_view<toml::node>& table, LanguageConfig& lang) {
    if (!table.is_table()) return;
    if (auto cmd = read_string_array(table["command"]); !cmd.empty()) {
        lang.command = std::move(cmd);
    }
    lang.source_file = table["source_file"].value_or(std::string{lang.source_file});
    if (table["readonly_paths"].is_array()) {
        lang.readonly_paths = read_string_array(table["readonly_paths"]);
    }
    lang.address_space_factor = static_cast<uint32_t>(
        table["address_space_factor"].value_or(
            static_cast<int64_t>(lang.address_space_factor)));
}

bool budget_le(const ResourceBudget& a, const ResourceBudget& b) {
    return a.cpu_time_ms <= b.cpu_time_ms
        && a.wall_time_ms <= b.wall_time_ms
        && a.memory_bytes <= b.memory_bytes
        && a.max_output_bytes <= b.max_output_bytes
        && a.max_processes <= b.max_processes;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config = default_config();

        // [service]
        if (auto service = tbl["service"]; service.is_table()) {
            config.service.workers = static_cast<uint32_t>(
                service["workers"].value_or(int64_t{4}));
            config.service.queue_capacity = static_cast<uint32_t>(
                service["queue_capacity"].value_or(int64_t{64}));
        }

        // [server]
        if (auto server = tbl["server"]; server.is_table()) {
            config.server.port = static_cast<uint16_t>(
                server["port"].value_or(int64_t{7070}));
            config.server.max_request_bytes = static_cast<uint64_t>(
                server["max_request_bytes"].value_or(int64_t{1048576}));
            config.server.connection_threads = static_cast<uint32_t>(
                server["connection_threads"].value_or(int64_t{0}));
        }

        // [limits.default] / [limits.max] / [limits.min]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            read_budget(limits["default"], config.limits.defaults);
            read_budget(limits["max"], config.limits.max);
            read_budget(limits["min"], config.limits.min);
        }

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            config.sandbox.scratch_root =
                sandbox["scratch_root"].value_or(std::string{"/tmp/runbox"});
            config.sandbox.cgroup_root = sandbox["cgroup_root"].value_or(std::string{});
            config.sandbox.tick_ms = static_cast<uint32_t>(
                sandbox["tick_ms"].value_or(int64_t{10}));
            config.sandbox.scratch_file_bytes = static_cast<uint64_t>(
                sandbox["scratch_file_bytes"].value_or(int64_t{16 * 1024 * 1024}));
            config.sandbox.open_files = static_cast<uint32_t>(
                sandbox["open_files"].value_or(int64_t{64}));
        }

        // [languages.<name>]
        if (auto languages = tbl["languages"]; languages.is_table()) {
            for (auto lang : kAllLanguages) {
                read_language(languages[to_string(lang)], config.languages[lang]);
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        if (auto valid = validate_config(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    Config config;
    config.languages[Language::Python] = LanguageConfig{
        .command = {"/usr/bin/python3", "-I", "-B", "{source}"},
        .source_file = "main.py",
        .readonly_paths = kRuntimePaths,
        .address_space_factor = 8
    };
    // V8 reserves a large virtual address space up front.
    config.languages[Language::JavaScript] = LanguageConfig{
        .command = {"/usr/bin/node", "{source}"},
        .source_file = "main.js",
        .readonly_paths = kRuntimePaths,
        .address_space_factor = 0
    };
    config.languages[Language::Shell] = LanguageConfig{
        .command = {"/bin/sh", "{source}"},
        .source_file = "main.sh",
        .readonly_paths = kRuntimePaths,
        .address_space_factor = 8
    };
    return config;
}

Result<void> validate_config(const Config& config) {
    if (config.service.workers == 0) {
        return Error{ErrorCode::Config, "service.workers must be at least 1"};
    }
    const uint64_t admitted = uint64_t{config.service.workers} + config.service.queue_capacity;
    if (config.server.connection_threads != 0 && config.server.connection_threads <= admitted) {
        return Error{ErrorCode::Config,
                     "server.connection_threads must exceed service.workers + service.queue_capacity ("
                     + std::to_string(admitted) + ")"};
    }
    if (config.sandbox.tick_ms == 0 || config.sandbox.tick_ms > 100) {
        return Error{ErrorCode::Config, "sandbox.tick_ms must be within (0, 100]"};
    }
    if (!budget_le(config.limits.min, config.limits.max)) {
        return Error{ErrorCode::Config, "limits.min exceeds limits.max"};
    }
    if (!budget_le(config.limits.min, config.limits.defaults)
        || !budget_le(config.limits.defaults, config.limits.max)) {
        return Error{ErrorCode::Config, "limits.default must lie within [limits.min, limits.max]"};
    }
    if (config.sandbox.scratch_root.empty()) {
        return Error{ErrorCode::Config, "sandbox.scratch_root must be set"};
    }
    for (const auto& [lang, lang_config] : config.languages) {
        if (lang_config.command.empty() || lang_config.source_file.empty()) {
            return Error{ErrorCode::Config,
                         "language " + std::string{to_string(lang)} + " needs command and source_file"};
        }
    }
    return Result<void>{};
}

uint32_t effective_connection_threads(const Config& config) noexcept {
    if (config.server.connection_threads != 0) return config.server.connection_threads;
    return config.service.workers + config.service.queue_capacity + kControlConnectionThreads;
}

}  // namespace runbox
