#include <argparse/argparse.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

#include "api_server.hpp"
#include "config_manager.hpp"
#include "mcp_constants.hpp"
#include "mcp_server.hpp"
#include "stdio_transport.hpp"

using namespace toolhost;

std::atomic<bool> should_exit(false);
APIServer* api_server = nullptr;

void set_log_level(const std::string& log_level) {
    if (log_level == "debug") {
        crow::logger::setLogLevel(crow::LogLevel::Debug);
    } else if (log_level == "info") {
        crow::logger::setLogLevel(crow::LogLevel::Info);
    } else if (log_level == "warning") {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    } else if (log_level == "error") {
        crow::logger::setLogLevel(crow::LogLevel::Error);
    } else {
        std::cerr << "Invalid log level: " << log_level << ". Using default (info)." << std::endl;
        crow::logger::setLogLevel(crow::LogLevel::Info);
    }
}

std::shared_ptr<ConfigManager> initializeConfig(const std::string& config_file) {
    auto config_manager = std::make_shared<ConfigManager>(std::filesystem::path(config_file));
    try {
        config_manager->loadConfig();
    } catch (const std::exception& e) {
        throw std::runtime_error("Error while loading configuration, Details: " + std::string(e.what()));
    }
    return config_manager;
}

void logMetrics(const McpServer& server) {
    CROW_LOG_INFO << "Tool metrics at shutdown: " << server.metrics()->toJson().dump();
}

void terminateHandler() {
    CROW_LOG_ERROR << "Unhandled exception caught! toolhost is giving up";

    auto ex = std::current_exception();
    if (ex) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "exception caught: " << e.what();
        }
    }
    std::abort();
}

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        should_exit = true;
        if (api_server) {
            api_server->stop();
        }
    }
}

int main(int argc, char* argv[])
{
    std::set_terminate(terminateHandler);

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    static argparse::ArgumentParser program("toolhost", toolhost::mcp::constants::SERVER_VERSION);

    program.add_argument("-c", "--config")
        .help("Path to the toolhost.yaml configuration file")
        .default_value(std::string("toolhost.yaml"));

    program.add_argument("-p", "--port")
        .help("Port number for the HTTP transport")
        .default_value(-1)
        .scan<'i', int>();

    program.add_argument("--transport")
        .help("Transport to serve on (stdio, http)")
        .default_value(std::string(""));

    program.add_argument("--log-level")
        .help("Set the log level (debug, info, warning, error)")
        .default_value(std::string(""));

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string config_file = program.get<std::string>("--config");
    int cmd_port = program.get<int>("--port");
    std::string transport = program.get<std::string>("--transport");
    std::string log_level = program.get<std::string>("--log-level");

    // Command line level applies before the config is read so loading is logged at that level
    set_log_level(log_level.empty() ? "info" : log_level);

    std::shared_ptr<ConfigManager> config_manager;
    std::unique_ptr<McpServer> server;
    try {
        config_manager = initializeConfig(config_file);
        if (cmd_port != -1) {
            config_manager->setPort(cmd_port);
        }
        if (!transport.empty()) {
            config_manager->setTransportType(transport);
        }
        if (!log_level.empty()) {
            config_manager->setLogLevel(log_level);
        }
        config_manager->validateConfig();
        server = McpServer::fromConfig(*config_manager);
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << e.what();
        return 1;
    }

    const auto& config = config_manager->getConfig();
    set_log_level(config.log_level);

    if (config.transport.isHttp()) {
        APIServer http_server(*server, std::chrono::seconds(60), config.transport.max_stream_bytes);
        api_server = &http_server;
        CROW_LOG_INFO << "toolhost serving MCP over HTTP on port " << config.transport.port;
        http_server.run(config.transport.port, config.worker_threads);
        api_server = nullptr;
    } else {
        // Crow's default log sink is stderr, so stdout carries protocol frames only
        std::ios::sync_with_stdio(false);
        StdioTransport stdio(server->dispatcher(), config.worker_threads);
        stdio.serve(std::cin, std::cout);
    }

    logMetrics(*server);
    return 0;
}
