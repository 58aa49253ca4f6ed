#include "agentgate_service.hpp"

#include "agent_listener.hpp"
#include "agent_log_sink.hpp"
#include "agent_protocol.hpp"
#include "channel.hpp"
#include "controller_config.hpp"
#include "errors.hpp"
#include "secret_store.hpp"
#include "worker_registry.hpp"

#include <syslog.h>

#include <csignal>
#include <cstring>
#include <iostream>

namespace
{
agentgate::gate::AgentListener *g_listener = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void signal_handler(int /*sig*/)
{
    if (g_listener != nullptr)
    {
        g_listener->stop();
    }
}

void print_usage(const char *argv0)
{
    std::cerr << "Usage: " << argv0 << " [--config <path>]\n";
}

int run_controller(const std::filesystem::path &config_path)
{
    using namespace agentgate::gate;
    using agentgate::utils::Logger;

    const ControllerConfig cfg = ControllerConfig::load(config_path);

    Logger &logger = Logger::instance();
    logger.set_level(cfg.log_level);
    if (cfg.log_syslog)
    {
        logger.set_syslog("agentgate-controller", LOG_PID, LOG_DAEMON);
    }
    else if (!cfg.log_file.empty())
    {
        logger.set_logfile(cfg.log_file.string());
    }
    LOGGER_INFO("agentgate-controller starting (config: {})",
                cfg.source_file.empty() ? std::string("built-in defaults")
                                        : cfg.source_file.string());
    LOGGER_DEBUG("Effective configuration: {}", cfg.to_json().dump());

    auto secrets = std::make_shared<FileSecretStore>(cfg.secret_file);
    LOGGER_INFO("Agent secret: {}", secrets->path().string());

    auto registry = std::make_shared<WorkerRegistry>(cfg.agent_names);
    if (registry->size() == 0)
    {
        LOGGER_WARN("No agents configured (agents.names); every connection will be rejected");
    }

    auto transport = std::make_shared<StreamChannelTransport>(
        [](Channel &channel, const std::string &payload)
        {
            LOGGER_DEBUG("[{}] received {} byte(s): {}", channel.name(), payload.size(),
                         agentgate::format_tools::printable(payload, 80));
        });

    ConnectionServices services;
    services.registry = registry;
    services.secrets = secrets;
    services.log_sink = std::make_shared<FileAgentLogSink>(cfg.agent_log_dir);
    services.transport = transport;
    services.read_timeout = cfg.read_timeout;

    AgentListener::Config lcfg;
    lcfg.bind_address = cfg.bind_address;
    lcfg.port = cfg.port;
    lcfg.backlog = cfg.backlog;
    lcfg.selector_timeout = cfg.read_timeout;

    AgentListener listener(lcfg);
    listener.register_protocol(std::make_shared<AgentConnectProtocol>(std::move(services)));

    g_listener = &listener;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    listener.run();

    g_listener = nullptr;
    registry->close_all();
    LOGGER_INFO("agentgate-controller stopped.");
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    std::filesystem::path config_path;
    for (int i = 1; i < argc; ++i) // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            print_usage(argv[0]);
            return 2;
        }
    }

    int rc = 1;
    try
    {
        rc = run_controller(config_path);
    }
    catch (const agentgate::gate::ConfigError &e)
    {
        LOGGER_ERROR("Configuration error: {}", e.what());
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("agentgate-controller failed\n{}", agentgate::gate::format_exception_trace(e));
    }

    agentgate::utils::Logger::instance().shutdown();
    return rc;
}
