/**
 * @file controller_config.cpp
 * @brief Layered loading of ControllerConfig.
 */
#include "controller_config.hpp"

#include "agentgate_service.hpp"
#include "errors.hpp"
#include "worker_registry.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>

namespace agentgate::gate
{

namespace fs = std::filesystem;

namespace
{

fs::path resolve_path(const fs::path &base_dir, const fs::path &raw)
{
    if (raw.empty() || raw.is_absolute() || base_dir.empty())
        return raw;
    return (base_dir / raw).lexically_normal();
}

nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        throw ConfigError(fmt::format("Cannot open config file '{}'", path.string()));
    }
    try
    {
        nlohmann::json j;
        f >> j;
        return j;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ConfigError(fmt::format("Malformed JSON in '{}': {}", path.string(), e.what()));
    }
}

template <typename T>
T get_as(const nlohmann::json &section, const char *section_name, const char *key)
{
    try
    {
        return section.at(key).get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ConfigError(fmt::format("{}.{}: {}", section_name, key, e.what()));
    }
}

uint16_t parse_port(int64_t value, const std::string &where)
{
    if (value < 0 || value > std::numeric_limits<uint16_t>::max())
    {
        throw ConfigError(fmt::format("{}: port {} out of range 0-65535", where, value));
    }
    return static_cast<uint16_t>(value);
}

} // namespace

std::optional<std::string> ControllerConfig::process_env(const char *name)
{
    const char *v = std::getenv(name);
    if (v == nullptr)
        return std::nullopt;
    return std::string(v);
}

void ControllerConfig::apply_json(ControllerConfig &cfg, const nlohmann::json &j)
{
    if (!j.is_object())
    {
        throw ConfigError("Config root must be a JSON object");
    }

    if (j.contains("listener"))
    {
        const auto &l = j.at("listener");
        if (l.contains("bind_address"))
            cfg.bind_address = get_as<std::string>(l, "listener", "bind_address");
        if (l.contains("port"))
            cfg.port = parse_port(get_as<int64_t>(l, "listener", "port"), "listener.port");
        if (l.contains("backlog"))
        {
            cfg.backlog = get_as<int>(l, "listener", "backlog");
            if (cfg.backlog <= 0)
                throw ConfigError("listener.backlog must be positive");
        }
    }
    if (j.contains("handshake"))
    {
        const auto &h = j.at("handshake");
        if (h.contains("read_timeout_ms"))
        {
            auto ms = get_as<int64_t>(h, "handshake", "read_timeout_ms");
            if (ms < 0)
                throw ConfigError("handshake.read_timeout_ms must not be negative");
            cfg.read_timeout = std::chrono::milliseconds(ms);
        }
    }
    if (j.contains("security"))
    {
        const auto &s = j.at("security");
        if (s.contains("secret_file"))
        {
            auto raw = get_as<std::string>(s, "security", "secret_file");
            if (raw.empty())
                throw ConfigError("security.secret_file must not be empty");
            cfg.secret_file = resolve_path(cfg.base_dir, raw);
        }
    }
    if (j.contains("logging"))
    {
        const auto &lg = j.at("logging");
        if (lg.contains("level"))
        {
            auto name = get_as<std::string>(lg, "logging", "level");
            if (!utils::parse_log_level(name, cfg.log_level))
                throw ConfigError(fmt::format("logging.level: unknown level '{}'", name));
        }
        if (lg.contains("file"))
            cfg.log_file = resolve_path(cfg.base_dir, get_as<std::string>(lg, "logging", "file"));
        if (lg.contains("syslog"))
            cfg.log_syslog = get_as<bool>(lg, "logging", "syslog");
    }
    if (j.contains("agents"))
    {
        const auto &a = j.at("agents");
        if (a.contains("log_dir"))
            cfg.agent_log_dir =
                resolve_path(cfg.base_dir, get_as<std::string>(a, "agents", "log_dir"));
        if (a.contains("names"))
        {
            auto names = get_as<std::vector<std::string>>(a, "agents", "names");
            for (const auto &n : names)
            {
                if (!WorkerRegistry::is_valid_name(n))
                    throw ConfigError(fmt::format("agents.names: invalid agent name '{}'",
                                                  format_tools::printable(n)));
            }
            cfg.agent_names = std::move(names);
        }
    }
}

void ControllerConfig::apply_env(ControllerConfig &cfg, const EnvLookup &env)
{
    if (auto v = env("AGENTGATE_PORT"))
    {
        try
        {
            size_t used = 0;
            long long port = std::stoll(*v, &used);
            if (used != v->size())
                throw std::invalid_argument("trailing characters");
            cfg.port = parse_port(port, "AGENTGATE_PORT");
        }
        catch (const std::logic_error &)
        {
            throw ConfigError(fmt::format("AGENTGATE_PORT: '{}' is not a port number", *v));
        }
    }
    if (auto v = env("AGENTGATE_SECRET_FILE"); v && !v->empty())
        cfg.secret_file = resolve_path(cfg.base_dir, *v);
    if (auto v = env("AGENTGATE_LOG_DIR"); v && !v->empty())
        cfg.agent_log_dir = resolve_path(cfg.base_dir, *v);
}

ControllerConfig ControllerConfig::load(const fs::path &explicit_path, const EnvLookup &env)
{
    ControllerConfig cfg;

    fs::path file = explicit_path;
    if (file.empty())
    {
        if (auto v = env("AGENTGATE_CONFIG_FILE"); v && !v->empty())
            file = *v;
    }

    if (!file.empty())
    {
        std::error_code ec;
        fs::path abs = fs::absolute(file, ec);
        cfg.source_file = ec ? file : abs.lexically_normal();
        cfg.base_dir = cfg.source_file.parent_path();
    }
    else
    {
        std::error_code ec;
        cfg.base_dir = fs::current_path(ec);
    }

    // Defaults are relative too.
    cfg.secret_file = resolve_path(cfg.base_dir, cfg.secret_file);
    cfg.agent_log_dir = resolve_path(cfg.base_dir, cfg.agent_log_dir);

    if (!cfg.source_file.empty())
    {
        apply_json(cfg, read_json_file(cfg.source_file));
    }
    apply_env(cfg, env);
    return cfg;
}

nlohmann::json ControllerConfig::to_json() const
{
    static constexpr const char *kLevelNames[] = {"trace", "debug", "info",
                                                  "warn",  "error", "system"};
    return {
        {"listener", {{"bind_address", bind_address}, {"port", port}, {"backlog", backlog}}},
        {"handshake", {{"read_timeout_ms", read_timeout.count()}}},
        {"security", {{"secret_file", secret_file.string()}}},
        {"logging",
         {{"level", kLevelNames[static_cast<int>(log_level)]},
          {"file", log_file.string()},
          {"syslog", log_syslog}}},
        {"agents", {{"log_dir", agent_log_dir.string()}, {"names", agent_names}}},
    };
}

} // namespace agentgate::gate
