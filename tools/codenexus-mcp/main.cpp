#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include <codenexus/app/services/project_context.hpp>
#include <codenexus/config/config_helpers.h>
#include <codenexus/mcp/mcp_server.h>
#include <codenexus/version.hpp>

namespace {

std::atomic<bool> g_shutdown{false};

void signalHandler(int) {
    g_shutdown = true;
}

void installSignalHandlers() {
#ifndef _WIN32
    // No SA_RESTART: a blocked stdin read must return so the server sees the flag
    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
#else
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#endif
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"CodeNexus MCP Server - tags, comments and relations for project files"};

    std::string config_path;
    std::string log_level;
    std::string log_file;

    app.add_option("-c,--config", config_path,
                   "Config file (default: $XDG_CONFIG_HOME/codenexus/config.toml)");
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_option("--log-file", log_file, "Log file path (optional)");
    app.set_version_flag("--version", std::string(CODENEXUS_VERSION_STRING));
    CLI11_PARSE(app, argc, argv);

    auto config = codenexus::config::load_config(codenexus::config::get_config_path(config_path));
    if (!config) {
        std::cerr << "Failed to load config: " << config.error().message << std::endl;
        return 1;
    }
    codenexus::config::NexusConfig settings = config.value();
    if (!log_level.empty()) {
        settings.logLevel = log_level;
    }

    try {
        // stdout carries the protocol stream; logs go to stderr
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 10 * 1024 * 1024, 3));
        }

        auto logger =
            std::make_shared<spdlog::logger>("codenexus-mcp", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::from_str(settings.logLevel));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("CodeNexus MCP Server v{}", CODENEXUS_VERSION_STRING);
    spdlog::info("Transport: STDIO");
    spdlog::debug("Data directory name: {}, backup on write: {}", settings.dataDirName,
                  settings.backupOnWrite);

    installSignalHandlers();

    try {
        auto projects = std::make_shared<codenexus::app::services::ProjectRegistry>(settings);
        std::unique_ptr<codenexus::mcp::ITransport> transport =
            std::make_unique<codenexus::mcp::StdioTransport>();

        codenexus::mcp::MCPServer server(std::move(transport), projects, &g_shutdown);
        server.start();

        if (g_shutdown) {
            spdlog::info("Shutdown requested by signal");
        }
        spdlog::info("Served {} project(s)", projects->size());
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
