#include "config.h"
#include "logger.h"
#include "rendezvous_server.h"
#include "socket.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

namespace {

std::atomic<bool> g_stop_requested(false);

void handle_signal(int) {
    g_stop_requested.store(true);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "  -b, --bind-ip <ip>       Address to bind (default 0.0.0.0)\n";
    std::cout << "  -p, --bind-port <port>   UDP port to bind (default " << filepunch::DEFAULT_SERVER_PORT << ")\n";
    std::cout << "      --config <path>      JSON configuration file\n";
    std::cout << "      --log-level <level>  debug, info, warn or error\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\nCommand line values override the configuration file.\n";
}

bool parse_port(const std::string& text, uint16_t& port) {
    char* end = nullptr;
    unsigned long value = std::strtoul(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string bind_ip;
    std::string bind_port;
    std::string log_level;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        bool ok = true;
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-b" || arg == "--bind-ip") {
            ok = next(bind_ip);
        } else if (arg == "-p" || arg == "--bind-port") {
            ok = next(bind_port);
        } else if (arg == "--config") {
            ok = next(config_path);
        } else if (arg == "--log-level") {
            ok = next(log_level);
        } else {
            std::cerr << "Unknown option " << arg << "\n";
            ok = false;
        }
        if (!ok) {
            print_usage(argv[0]);
            return 1;
        }
    }

    filepunch::ServerConfig config;
    if (!config_path.empty() && !filepunch::load_server_config(config_path, config)) {
        LOG_MAIN_WARN("Continuing with default configuration");
    }

    if (!bind_ip.empty()) {
        config.bind_ip = bind_ip;
    }
    if (!bind_port.empty() && !parse_port(bind_port, config.bind_port)) {
        std::cerr << "Invalid port " << bind_port << "\n";
        return 1;
    }
    if (!log_level.empty() && !filepunch::parse_log_level(log_level, config.log_level)) {
        std::cerr << "Invalid log level " << log_level << "\n";
        return 1;
    }

    filepunch::Logger::getInstance().set_log_level(config.log_level);

    if (!filepunch::init_socket_library()) {
        LOG_MAIN_ERROR("Failed to initialize socket library");
        return 1;
    }

    LOG_MAIN_INFO("=== filepunch rendezvous server ===");

    filepunch::RendezvousServer server(config);
    if (!server.start()) {
        LOG_MAIN_ERROR("Failed to start server on " << config.bind_ip << ":" << config.bind_port);
        filepunch::cleanup_socket_library();
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    LOG_MAIN_INFO("Listening on " << config.bind_ip << ":" << server.port() << ", identity " << server.fingerprint());

    while (!g_stop_requested.load() && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_MAIN_INFO("Shutting down");
    server.stop();
    filepunch::cleanup_socket_library();
    return 0;
}
