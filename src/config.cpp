#include "config.h"
#include "fs.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace filepunch {

namespace {

uint16_t read_port(const nlohmann::json& config, const char* key, uint16_t fallback) {
    int value = config.value(key, static_cast<int>(fallback));
    if (value < 0 || value > 65535) {
        LOG_CONFIG_WARN("Ignoring out of range " << key << ": " << value);
        return fallback;
    }
    return static_cast<uint16_t>(value);
}

LogLevel read_log_level(const nlohmann::json& config, LogLevel fallback) {
    std::string name = config.value("log_level", log_level_to_string(fallback));
    LogLevel level = fallback;
    if (!parse_log_level(name, level)) {
        LOG_CONFIG_WARN("Unknown log_level '" << name << "', using " << log_level_to_string(fallback));
    }
    return level;
}

} // anonymous namespace

const char* port_mapping_mode_to_string(PortMappingMode mode) {
    switch (mode) {
        case PortMappingMode::NONE: return "none";
        case PortMappingMode::FORWARD: return "forward";
        case PortMappingMode::PCP_NATPMP: return "pcp_natpmp";
    }
    return "none";
}

bool parse_port_mapping_mode(const std::string& text, PortMappingMode& mode) {
    if (text == "none") {
        mode = PortMappingMode::NONE;
    } else if (text == "forward") {
        mode = PortMappingMode::FORWARD;
    } else if (text == "pcp_natpmp") {
        mode = PortMappingMode::PCP_NATPMP;
    } else {
        return false;
    }
    return true;
}

bool parse_server_config(const std::string& text, ServerConfig& config) {
    try {
        nlohmann::json json = nlohmann::json::parse(text);
        ServerConfig parsed;

        parsed.bind_ip = json.value("bind_ip", parsed.bind_ip);
        parsed.bind_port = read_port(json, "bind_port", parsed.bind_port);
        parsed.log_level = read_log_level(json, parsed.log_level);
        parsed.idle_timeout_ms = json.value("idle_timeout_ms", parsed.idle_timeout_ms);
        parsed.selection_policy = json.value("selection_policy", parsed.selection_policy);

        if (parsed.selection_policy != "first" && parsed.selection_policy != "random") {
            LOG_CONFIG_WARN("Unknown selection_policy '" << parsed.selection_policy << "', using first");
            parsed.selection_policy = "first";
        }

        config = parsed;
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse server configuration: " << e.what());
        return false;
    }
}

bool parse_client_settings(const std::string& text, ClientSettings& settings) {
    try {
        nlohmann::json json = nlohmann::json::parse(text);
        ClientSettings parsed;

        parsed.server_address = json.value("server_address", parsed.server_address);
        parsed.server_port = read_port(json, "server_port", parsed.server_port);

        std::string mode = json.value("port_mapping", std::string(port_mapping_mode_to_string(parsed.port_mapping)));
        if (!parse_port_mapping_mode(mode, parsed.port_mapping)) {
            LOG_CONFIG_WARN("Unknown port_mapping '" << mode << "', using "
                            << port_mapping_mode_to_string(parsed.port_mapping));
        }

        parsed.external_port = read_port(json, "external_port", parsed.external_port);
        parsed.gateway = json.value("gateway", parsed.gateway);
        parsed.bind_ip = json.value("bind_ip", parsed.bind_ip);
        parsed.local_port = read_port(json, "local_port", parsed.local_port);
        parsed.punch_interval_ms = json.value("punch_interval_ms", parsed.punch_interval_ms);
        parsed.punch_deadline_ms = json.value("punch_deadline_ms", parsed.punch_deadline_ms);
        parsed.handshake_timeout_ms = json.value("handshake_timeout_ms", parsed.handshake_timeout_ms);
        parsed.request_timeout_ms = json.value("request_timeout_ms", parsed.request_timeout_ms);
        parsed.log_level = read_log_level(json, parsed.log_level);

        if (parsed.port_mapping == PortMappingMode::FORWARD && parsed.external_port == 0) {
            LOG_CONFIG_WARN("port_mapping is forward but external_port is not set");
        }

        settings = parsed;
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse client settings: " << e.what());
        return false;
    }
}

std::string serialize_client_settings(const ClientSettings& settings) {
    nlohmann::json json;
    json["server_address"] = settings.server_address;
    json["server_port"] = settings.server_port;
    json["port_mapping"] = port_mapping_mode_to_string(settings.port_mapping);
    json["external_port"] = settings.external_port;
    json["gateway"] = settings.gateway;
    json["bind_ip"] = settings.bind_ip;
    json["local_port"] = settings.local_port;
    json["punch_interval_ms"] = settings.punch_interval_ms;
    json["punch_deadline_ms"] = settings.punch_deadline_ms;
    json["handshake_timeout_ms"] = settings.handshake_timeout_ms;
    json["request_timeout_ms"] = settings.request_timeout_ms;
    json["log_level"] = log_level_to_string(settings.log_level);
    return json.dump(4);
}

bool load_server_config(const std::string& path, ServerConfig& config) {
    if (!file_exists(path)) {
        LOG_CONFIG_INFO("No configuration at " << path << ", using defaults");
        return true;
    }

    std::string text;
    if (!read_file_text(path, text)) {
        LOG_CONFIG_ERROR("Cannot read " << path);
        return false;
    }

    LOG_CONFIG_DEBUG("Loading server configuration from " << path);
    return parse_server_config(text, config);
}

bool load_client_settings(const std::string& path, ClientSettings& settings) {
    if (!file_exists(path)) {
        LOG_CONFIG_INFO("No settings at " << path << ", using defaults");
        return true;
    }

    std::string text;
    if (!read_file_text(path, text)) {
        LOG_CONFIG_ERROR("Cannot read " << path);
        return false;
    }

    LOG_CONFIG_DEBUG("Loading client settings from " << path);
    return parse_client_settings(text, settings);
}

bool save_client_settings(const std::string& path, const ClientSettings& settings) {
    try {
        if (!create_file(path, serialize_client_settings(settings))) {
            LOG_CONFIG_ERROR("Failed to write settings to " << path);
            return false;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to serialize settings: " << e.what());
        return false;
    }

    LOG_CONFIG_INFO("Saved client settings to " << path);
    return true;
}

} // namespace filepunch
