#pragma once
/**
 * @file controller_config.hpp
 * @brief Controller configuration, layered from JSON and environment.
 *
 * ## Config loading, layered (priority low to high)
 *
 *  1. Built-in C++ defaults (the member initializers below)
 *  2. A JSON file: `--config <path>`, else `AGENTGATE_CONFIG_FILE`
 *  3. `AGENTGATE_PORT` / `AGENTGATE_SECRET_FILE` / `AGENTGATE_LOG_DIR`
 *     Environment overrides applied after file loading
 *
 * Relative paths (from the file or the environment) are resolved against the
 * directory of the config file, or the working directory without one.
 *
 * @code
 * {
 *   "listener":  { "bind_address": "0.0.0.0", "port": 50000, "backlog": 64 },
 *   "handshake": { "read_timeout_ms": 0 },
 *   "security":  { "secret_file": "secret.key" },
 *   "logging":   { "level": "info", "file": "", "syslog": false },
 *   "agents":    { "log_dir": "logs/agents", "names": ["agent-1"] }
 * }
 * @endcode
 */
#include "utils/logger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace agentgate::gate
{

struct ControllerConfig
{
    /// Reads one environment variable; injectable for tests.
    using EnvLookup = std::function<std::optional<std::string>(const char *name)>;

    // --- listener ---
    std::string bind_address{"0.0.0.0"};
    uint16_t port{50000};
    int backlog{64};

    // --- handshake ---
    std::chrono::milliseconds read_timeout{0};

    // --- security ---
    std::filesystem::path secret_file{"secret.key"};

    // --- logging ---
    utils::Logger::Level log_level{utils::Logger::Level::L_INFO};
    /// Empty: log to the console.
    std::filesystem::path log_file;
    /// Log to syslog (LOG_DAEMON) instead; takes precedence over log_file.
    bool log_syslog{false};

    // --- agents ---
    std::filesystem::path agent_log_dir{"logs/agents"};
    std::vector<std::string> agent_names;

    /// Directory relative paths were resolved against.
    std::filesystem::path base_dir;
    /// The file loaded, empty if only defaults and environment were used.
    std::filesystem::path source_file;

    /**
     * @brief Loads the layered configuration.
     * @param explicit_path `--config` argument; empty to consult AGENTGATE_CONFIG_FILE.
     * @throws ConfigError on unreadable files, malformed JSON or invalid values.
     */
    static ControllerConfig load(const std::filesystem::path &explicit_path,
                                 const EnvLookup &env = process_env);

    /**
     * @brief Applies one JSON layer on top of @p cfg. Unknown keys are ignored.
     * @throws ConfigError on a wrongly typed or out-of-range value.
     */
    static void apply_json(ControllerConfig &cfg, const nlohmann::json &j);

    /// Applies the AGENTGATE_* overrides. @throws ConfigError on an invalid value.
    static void apply_env(ControllerConfig &cfg, const EnvLookup &env);

    /// Reads the real process environment.
    static std::optional<std::string> process_env(const char *name);

    /// The effective configuration, paths as resolved.
    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace agentgate::gate
