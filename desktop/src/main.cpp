#include "broker_client.h"
#include "broker_server.h"
#include "config_manager.h"
#include "file_io.h"
#include "logger.h"
#include "transfer_manager.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

using namespace litecdn;

namespace {

constexpr int kListTimeoutMs = 5000;

std::atomic<bool> g_stop_requested{false};

void on_stop_signal(int) {
    g_stop_requested = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] <command> [ARGS]\n\n"
              << "Commands:\n"
              << "  upload <local-path> <object-name>    Publish a file as an object\n"
              << "  download <local-path> <object-name>  Fetch an object into a file\n"
              << "  list                                 List objects held by the broker\n"
              << "  serve [--port PORT] [--store DIR]    Run a broker / storage node\n"
              << "\nOptions:\n"
              << "  --config FILE      Path to configuration file (default: config.json)\n"
              << "  --log-level LVL    Log level: debug|info|warning|error|none (default: from config)\n"
              << "  --broker HOST:PORT Broker to connect to (default: from config)\n"
              << "  --help             Show this help message\n"
              << std::endl;
}

bool parse_port(const std::string& text, int& out) {
    try {
        size_t used = 0;
        const int p = std::stoi(text, &used);
        if (used != text.size() || p < 0 || p > 65535) {
            return false;
        }
        out = p;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_broker_address(const std::string& text, std::string& host, int& port) {
    const size_t colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    host = text.substr(0, colon);
    return parse_port(text.substr(colon + 1), port) && port > 0;
}

// An explicit --config must load; otherwise the usual spots are tried and the
// built-in defaults apply when none exists.
bool load_configuration(const std::string& explicit_path, const char* argv0) {
    auto& cfg = ConfigManager::getInstance();
    if (!explicit_path.empty()) {
        if (!cfg.loadConfig(explicit_path)) {
            std::cerr << "Error: cannot load configuration from " << explicit_path << std::endl;
            return false;
        }
        return true;
    }

    std::vector<std::string> candidates = {"config.json", "../config.json", "../../config.json"};
    std::error_code ec;
    const std::filesystem::path exe_dir = std::filesystem::absolute(argv0, ec).parent_path();
    if (!ec) {
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
    }

    for (const auto& c : candidates) {
        if (std::filesystem::exists(c, ec) && cfg.loadConfig(c)) {
            return true;
        }
    }
    LOG_DEBUG("CLI: No configuration file found, using defaults");
    return true;
}

void print_error(const TransferResult& result) {
    std::cerr << "Error: " << result.error.to_string() << std::endl;
    if (!result.error.missing_indices.empty()) {
        std::cerr << "  missing chunk(s):";
        size_t shown = 0;
        for (uint32_t index : result.error.missing_indices) {
            if (shown++ == 32) {
                std::cerr << " ...";
                break;
            }
            std::cerr << " " << index;
        }
        std::cerr << " (" << result.error.missing_indices.size() << " total)" << std::endl;
    }
}

// ============================================================================
// COMMANDS
// ============================================================================

int run_serve(int port, const std::string& store_dir) {
    BrokerServer::Options options = BrokerServer::Options::from_config();
    if (!store_dir.empty()) {
        options.store_dir = store_dir;
    }

    BrokerServer server(options);
    std::string error;
    if (!server.start(port, &error)) {
        std::cerr << "Error: cannot start broker: " << error << std::endl;
        return 1;
    }
    std::cout << "litecdn broker listening on port " << server.port() << " (Ctrl-C to stop)" << std::endl;

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    server.stop();
    return 0;
}

bool connect_client(BrokerClient& client, const std::string& host, int port) {
    std::string error;
    if (!client.connect(host, port, ConfigManager::getInstance().getConnectTimeoutMs(), &error)) {
        std::cerr << "Error: cannot reach broker " << host << ":" << port << ": " << error << std::endl;
        return false;
    }
    return true;
}

int run_upload(const std::string& host, int port, const std::string& local_path, const std::string& object_name) {
    std::vector<uint8_t> data;
    std::string error;
    if (!read_file_bytes(local_path, data, &error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    const auto& cfg = ConfigManager::getInstance();
    BrokerClient client(cfg.getMaxMessageSize());
    if (!connect_client(client, host, port)) {
        return 2;
    }

    TransferManager manager(client, cfg.getResourceRoot(), static_cast<size_t>(cfg.getWorkerThreads()));
    TransferOptions options = TransferOptions::from_config();
    options.file_name = file_base_name(local_path);

    const size_t size = data.size();
    const TransferResult result = manager.upload(object_name, std::move(data), options);
    if (!result.success) {
        print_error(result);
        return 2;
    }
    std::cout << "Uploaded " << local_path << " as " << object_name << ": " << size << " bytes in "
              << result.manifest.chunk_count << " chunk(s), " << result.elapsed_ms << " ms" << std::endl;
    return 0;
}

int run_download(const std::string& host, int port, const std::string& local_path, const std::string& object_name) {
    const auto& cfg = ConfigManager::getInstance();
    BrokerClient client(cfg.getMaxMessageSize());
    if (!connect_client(client, host, port)) {
        return 2;
    }

    TransferManager manager(client, cfg.getResourceRoot(), static_cast<size_t>(cfg.getWorkerThreads()));
    const TransferResult result = manager.download(object_name, TransferOptions::from_config());
    if (!result.success) {
        print_error(result);
        return 2;
    }

    std::string error;
    if (!write_file_bytes(local_path, result.data, &error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    std::cout << "Downloaded " << object_name << " to " << local_path << ": " << result.data.size() << " bytes, "
              << result.retransmit_rounds << " retransmission request(s), " << result.elapsed_ms << " ms"
              << std::endl;
    return 0;
}

int run_list(const std::string& host, int port) {
    const auto& cfg = ConfigManager::getInstance();
    BrokerClient client(cfg.getMaxMessageSize());
    if (!connect_client(client, host, port)) {
        return 2;
    }

    TransferManager manager(client, cfg.getResourceRoot(), 1);
    std::vector<ObjectManifest> objects;
    std::string error;
    if (!manager.list_objects(kListTimeoutMs, objects, &error)) {
        std::cerr << "Error: " << error << std::endl;
        return 2;
    }

    if (objects.empty()) {
        std::cout << "No objects under " << cfg.getResourceRoot() << std::endl;
        return 0;
    }
    std::cout << std::left << std::setw(40) << "OBJECT" << std::right << std::setw(14) << "SIZE"
              << std::setw(8) << "CHUNKS" << "  " << "DIGEST" << std::endl;
    for (const auto& m : objects) {
        std::cout << std::left << std::setw(40) << m.object_id << std::right << std::setw(14) << m.total_size
                  << std::setw(8) << m.chunk_count << "  " << m.digest_algorithm << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Ignore SIGPIPE to prevent process termination on socket write errors
    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, on_stop_signal);
    signal(SIGTERM, on_stop_signal);

    std::string config_path;
    std::string log_level_arg;
    std::string broker_arg;
    std::vector<std::string> positional;
    int serve_port = -1;
    std::string store_dir;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" || arg == "--log-level" || arg == "--broker" || arg == "--port" ||
                   arg == "--store") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return 1;
            }
            const std::string value = argv[++i];
            if (arg == "--config") config_path = value;
            else if (arg == "--log-level") log_level_arg = value;
            else if (arg == "--broker") broker_arg = value;
            else if (arg == "--store") store_dir = value;
            else if (!parse_port(value, serve_port)) {
                std::cerr << "Error: Port must be between 0 and 65535" << std::endl;
                return 1;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    // quiet until the configuration says otherwise
    set_log_level(LogLevel::WARNING);
    if (!load_configuration(config_path, argv[0])) {
        return 1;
    }
    auto& cfg = ConfigManager::getInstance();

    LogLevel level = LogLevel::INFO;
    const std::string level_text = log_level_arg.empty() ? cfg.getLogLevel() : log_level_arg;
    if (!parse_log_level(level_text, level)) {
        std::cerr << "Error: unknown log level '" << level_text << "'" << std::endl;
        return 1;
    }
    set_log_level(level);
    if (cfg.isAsyncLogging()) {
        enable_async_logging();
    }
    setSessionId("litecdn");

    std::string host = cfg.getBrokerHost();
    int port = cfg.getBrokerPort();
    if (!broker_arg.empty() && !parse_broker_address(broker_arg, host, port)) {
        std::cerr << "Error: --broker expects HOST:PORT" << std::endl;
        return 1;
    }

    const std::string& command = positional[0];
    int rc = 1;
    if (command == "serve" && positional.size() == 1) {
        rc = run_serve(serve_port >= 0 ? serve_port : cfg.getBrokerPort(), store_dir);
    } else if (command == "upload" && positional.size() == 3) {
        rc = run_upload(host, port, positional[1], positional[2]);
    } else if (command == "download" && positional.size() == 3) {
        rc = run_download(host, port, positional[1], positional[2]);
    } else if (command == "list" && positional.size() == 1) {
        rc = run_list(host, port);
    } else {
        std::cerr << "Error: bad command line for '" << command << "'" << std::endl;
        print_usage(argv[0]);
    }

    disable_async_logging();
    return rc;
}
