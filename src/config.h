#pragma once

#include "logger.h"
#include "types.h"
#include <cstdint>
#include <string>

namespace filepunch {

/**
 * How the client obtains an externally reachable port
 */
enum class PortMappingMode {
    NONE,        // rely on the server's observation only
    FORWARD,     // a port forwarded by hand on the gateway
    PCP_NATPMP   // ask the gateway, PCP first then NAT-PMP
};

const char* port_mapping_mode_to_string(PortMappingMode mode);
bool parse_port_mapping_mode(const std::string& text, PortMappingMode& mode);

struct ServerConfig {
    std::string bind_ip;
    uint16_t bind_port;
    LogLevel log_level;
    uint32_t idle_timeout_ms;       // control connection dropped after this much silence
    std::string selection_policy;   // "first" or "random"

    ServerConfig()
        : bind_ip("0.0.0.0"),
          bind_port(DEFAULT_SERVER_PORT),
          log_level(LogLevel::INFO),
          idle_timeout_ms(10000),
          selection_policy("first") {}
};

struct ClientSettings {
    std::string server_address;
    uint16_t server_port;
    PortMappingMode port_mapping;
    uint16_t external_port;         // FORWARD mode
    std::string gateway;            // empty: default route
    std::string bind_ip;
    uint16_t local_port;            // 0: ephemeral
    uint32_t punch_interval_ms;
    uint32_t punch_deadline_ms;
    uint32_t handshake_timeout_ms;
    uint32_t request_timeout_ms;
    LogLevel log_level;

    ClientSettings()
        : server_address("127.0.0.1"),
          server_port(DEFAULT_SERVER_PORT),
          port_mapping(PortMappingMode::PCP_NATPMP),
          external_port(0),
          bind_ip("0.0.0.0"),
          local_port(0),
          punch_interval_ms(250),
          punch_deadline_ms(8000),
          handshake_timeout_ms(5000),
          request_timeout_ms(5000),
          log_level(LogLevel::INFO) {}
};

/**
 * Load server configuration from a JSON file. Missing keys keep their
 * defaults; a missing file yields the defaults.
 * @return false if the file exists but cannot be parsed (config keeps its defaults)
 */
bool load_server_config(const std::string& path, ServerConfig& config);

/**
 * Load client settings from a JSON file. Same rules as load_server_config().
 */
bool load_client_settings(const std::string& path, ClientSettings& settings);

bool save_client_settings(const std::string& path, const ClientSettings& settings);

// Parse from JSON text, exposed for tests
bool parse_server_config(const std::string& text, ServerConfig& config);
bool parse_client_settings(const std::string& text, ClientSettings& settings);
std::string serialize_client_settings(const ClientSettings& settings);

} // namespace filepunch
