#include "filepunch.h"
#include "fs.h"
#include "logger.h"
#include "transfer_protocol.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

using namespace filepunch;

namespace {

constexpr std::chrono::milliseconds TRANSFER_IDLE_TIMEOUT(30000);

std::atomic<bool> g_stop_requested(false);

void handle_signal(int) {
    g_stop_requested.store(true);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] pub <file>\n";
    std::cout << "       " << program_name << " [options] sub <content_id> [output]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -s, --server <host>          Rendezvous server (default 127.0.0.1)\n";
    std::cout << "      --server-port <port>     Rendezvous port (default " << DEFAULT_SERVER_PORT << ")\n";
    std::cout << "      --config <path>          JSON settings file\n";
    std::cout << "      --port-mapping <mode>    none, forward or pcp_natpmp\n";
    std::cout << "      --external-port <port>   Forwarded port for --port-mapping forward\n";
    std::cout << "      --gateway <ip>           Gateway to ask for a port mapping\n";
    std::cout << "      --bind-ip <ip>           Local address to bind\n";
    std::cout << "      --local-port <port>      Local UDP port (default ephemeral)\n";
    std::cout << "      --log-level <level>      debug, info, warn or error\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program_name << " -s rendezvous.example.org pub movie.mkv\n";
    std::cout << "  " << program_name << " -s rendezvous.example.org sub 9f86d081...0a08 movie.mkv\n";
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

/**
 * Answer range requests until the subscriber sends a zero-length range,
 * goes quiet or disconnects
 */
void serve_ranges(PeerConnection& connection, const std::string& path, uint64_t file_size) {
    std::vector<uint8_t> message;
    uint64_t served = 0;

    while (connection.receive(message, TRANSFER_IDLE_TIMEOUT)) {
        RangeRequest range;
        if (!decode_range_request(message, range)) {
            LOG_MAIN_WARN("Malformed range request from " << connection.remote_address());
            return;
        }

        RangeValidation validation = validate_range(range, file_size);
        if (validation == RangeValidation::REJECT) {
            LOG_MAIN_INFO("Subscriber " << connection.remote_address() << " finished after " << served << " bytes");
            return;
        }
        if (validation != RangeValidation::OK) {
            LOG_MAIN_WARN("Rejecting range " << range.start << "+" << range.length << ": "
                          << range_validation_to_string(validation));
            return;
        }

        uint64_t offset = range.start;
        uint64_t end = range.start + range.length;
        std::vector<uint8_t> chunk;
        while (offset < end) {
            size_t size = static_cast<size_t>(std::min<uint64_t>(MAX_MESSAGE_SIZE, end - offset));
            chunk.resize(size);
            if (!read_file_chunk(path, offset, chunk.data(), size)) {
                return;
            }
            if (!connection.send(chunk)) {
                LOG_MAIN_WARN("Subscriber " << connection.remote_address() << " went away");
                return;
            }
            offset += size;
        }
        served += range.length;
    }
}

/**
 * Pull the whole file range by range
 * @return true if every byte arrived and the digest matches
 */
bool fetch_ranges(PeerConnection& connection, const ContentId& content_id, uint64_t file_size,
                  const std::string& output) {
    ContentVerifier verifier(content_id);

    if (!create_file(output, "")) {
        LOG_MAIN_ERROR("Cannot create " << output);
        return false;
    }

    uint64_t offset = 0;
    std::vector<uint8_t> chunk;
    while (offset < file_size && !g_stop_requested.load()) {
        RangeRequest range(offset, std::min<uint64_t>(MAX_RANGE_LENGTH, file_size - offset));
        if (!connection.send(encode_range_request(range))) {
            LOG_MAIN_ERROR("Publisher closed the session at " << offset << " bytes");
            return false;
        }

        uint64_t end = range.start + range.length;
        while (offset < end) {
            if (!connection.receive(chunk, TRANSFER_IDLE_TIMEOUT)) {
                LOG_MAIN_ERROR("Transfer stalled at " << offset << " of " << file_size << " bytes");
                return false;
            }
            if (chunk.empty() || chunk.size() > end - offset) {
                LOG_MAIN_ERROR("Unexpected chunk of " << chunk.size() << " bytes at " << offset);
                return false;
            }
            if (!write_file_chunk(output, offset, chunk.data(), chunk.size())) {
                return false;
            }
            verifier.update(chunk);
            offset += chunk.size();
        }
        LOG_MAIN_DEBUG("Received " << offset << " / " << file_size << " bytes");
    }

    if (offset < file_size) {
        return false;
    }

    // Zero-length range: done
    if (!connection.send(encode_range_request(RangeRequest()))) {
        LOG_MAIN_DEBUG("Publisher closed before the final range");
    }
    connection.drain(std::chrono::milliseconds(2000));

    if (!verifier.verify()) {
        LOG_MAIN_ERROR("Content mismatch: expected " << content_id.to_hex() << ", got " << verifier.actual().to_hex());
        return false;
    }
    return true;
}

int run_publisher(FilePunchClient& client, const std::string& path) {
    ContentId content_id;
    uint64_t file_size = 0;
    if (!compute_content_id(path, content_id, file_size)) {
        LOG_MAIN_ERROR("Cannot read " << path);
        return 1;
    }

    std::cout << content_id.to_hex() << std::endl;

    bool published = client.publish(content_id, file_size, [path](const PeerSessionResult& result) {
        if (!result.success) {
            LOG_MAIN_WARN("Subscriber session failed (" << error_kind_to_string(result.error) << "): "
                          << result.error_message);
            return;
        }
        LOG_MAIN_INFO("Serving " << result.file_size << " bytes to " << result.peer);
        serve_ranges(*result.connection, path, result.file_size);
    });
    if (!published) {
        LOG_MAIN_ERROR("Publish failed: " << client.last_error_message());
        return 1;
    }

    LOG_MAIN_INFO("Published " << path << " (" << file_size << " bytes), press Ctrl+C to stop");
    while (!g_stop_requested.load() && client.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return 0;
}

int run_subscriber(FilePunchClient& client, const std::string& hex, std::string output) {
    ContentId content_id;
    if (!ContentId::from_hex(hex, content_id)) {
        std::cerr << "Invalid content id " << hex << "\n";
        return 1;
    }
    if (output.empty()) {
        output = content_id.to_hex();
    }

    PeerSessionResult result = client.fetch(content_id);
    if (!result.success) {
        LOG_MAIN_ERROR("Fetch failed (" << error_kind_to_string(result.error) << "): " << result.error_message);
        return 1;
    }

    LOG_MAIN_INFO("Downloading " << result.file_size << " bytes from " << result.peer << " to " << output);
    bool ok = fetch_ranges(*result.connection, content_id, result.file_size, output);
    result.connection->close();

    if (!ok) {
        delete_file(output);
        return 1;
    }

    LOG_MAIN_INFO("Saved " << output << ", content verified");
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    ClientSettings settings;
    std::string config_path;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
            if (arg == "--config") {
                config_path = argv[++i];
            } else {
                overrides.emplace_back(arg, argv[++i]);
            }
            continue;
        }
        positional.push_back(arg);
    }

    if (positional.size() < 2 || (positional[0] != "pub" && positional[0] != "sub")) {
        print_usage(argv[0]);
        return 1;
    }

    if (!config_path.empty() && !load_client_settings(config_path, settings)) {
        LOG_MAIN_WARN("Continuing with default settings");
    }

    // Command line values win over the settings file
    for (const auto& option : overrides) {
        const std::string& name = option.first;
        const std::string& value = option.second;
        bool ok = true;
        if (name == "-s" || name == "--server") {
            settings.server_address = value;
        } else if (name == "--server-port") {
            ok = parse_port(value, settings.server_port);
        } else if (name == "--port-mapping") {
            ok = parse_port_mapping_mode(value, settings.port_mapping);
        } else if (name == "--external-port") {
            ok = parse_port(value, settings.external_port);
        } else if (name == "--gateway") {
            settings.gateway = value;
        } else if (name == "--bind-ip") {
            settings.bind_ip = value;
        } else if (name == "--local-port") {
            ok = parse_port(value, settings.local_port);
        } else if (name == "--log-level") {
            ok = parse_log_level(value, settings.log_level);
        } else {
            std::cerr << "Unknown option " << name << "\n";
            ok = false;
        }
        if (!ok) {
            std::cerr << "Invalid value '" << value << "' for " << name << "\n";
            return 1;
        }
    }

    Logger::getInstance().set_log_level(settings.log_level);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    FilePunchClient client(settings);
    if (!client.start()) {
        LOG_MAIN_ERROR("Failed to start (" << error_kind_to_string(client.last_error()) << "): "
                       << client.last_error_message());
        return 1;
    }

    int status = positional[0] == "pub"
        ? run_publisher(client, positional[1])
        : run_subscriber(client, positional[1], positional.size() > 2 ? positional[2] : std::string());

    client.stop();
    cleanup_socket_library();
    return status;
}
