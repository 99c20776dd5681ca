#include <argparse/argparse.hpp>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

#include "api_server.hpp"
#include "server_config.hpp"

using namespace switchyard;

std::shared_ptr<ApiServer> api_server;

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

void terminateHandler() {
    CROW_LOG_ERROR << "Unhandled exception caught! switchyard is giving up";

    auto ex = std::current_exception();
    if (ex) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "exception caught: " << e.what();
        } catch (...) {
            CROW_LOG_ERROR << "non-standard exception caught";
        }
    }
    std::abort();
}

void signal_handler(int signal) {
    if (signal == SIGINT) {
        CROW_LOG_INFO << "Received SIGINT, shutting down...";
        if (api_server) {
            api_server->stop();
        }
    }
}

int main(int argc, char* argv[])
{
    std::set_terminate(terminateHandler);
#ifdef _WIN32
    signal(SIGINT, signal_handler);
#else
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
#endif

    static argparse::ArgumentParser program("switchyard");

    program.add_argument("-c", "--config")
        .help("Path to the switchyard.yaml configuration file")
        .default_value(std::string("switchyard.yaml"));

    program.add_argument("-p", "--port")
        .help("Port number for the web server")
        .default_value(-1)
        .scan<'i', int>();

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
    std::string log_level = program.get<std::string>("--log-level");

    auto loaded = ServerConfig::loadFile(config_file, program.is_used("--config"));
    if (!loaded) {
        std::cerr << "Failed to load configuration: " << loaded.error().toJson().dump() << std::endl;
        return 1;
    }
    ServerConfig config = std::move(loaded.value());

    if (cmd_port != -1) {
        config.port = cmd_port;
    }
    if (!log_level.empty()) {
        config.log_level = log_level;
    }
    set_log_level(config.log_level);

    try {
        api_server = std::make_shared<ApiServer>(config);
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Failed to set up routes: " << e.what();
        return 1;
    }

    std::thread server_thread([server = api_server]() {
        server->run();
    });

    CROW_LOG_INFO << "switchyard started on port " << config.port;

    server_thread.join();

    return 0;
}
