#include <iostream>
#include <memory>
#include <chrono>
#include <thread>
#include <string>
#include <exception>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <curl/curl.h>

#include "../include/web_server.h"
#include "config_parser.h"
#include "env_file_loader.h"
#include "endpoint_logger.h"
#include "utils_router.h"
#include "routers/DomainQueryRouter.h"
#include "domain_query/WhoisLookupClient.hpp"
#include "domain_query/CurlWhoisTransport.hpp"

// Global flag for graceful shutdown
std::atomic<bool> server_running{true};

void signalHandler(int signum) {
    server_running = false;
}

static void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [config.json] [--host HOST] [--port PORT]" << std::endl;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);   // Ctrl+C
    std::signal(SIGTERM, signalHandler);  // Termination
    std::signal(SIGPIPE, SIG_IGN);        // Ignore broken pipe

    std::cout << "Domain Query Server v1.0.0" << std::endl;
    std::cout << "============================================================" << std::endl;

    // ======== COMMAND LINE ========

    std::string config_file = "config/server.json";
    std::string host_override;
    int port_override = -1;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--host" && i + 1 < argc) {
            host_override = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                port_override = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --port value: " << argv[i] << std::endl;
                return 1;
            }
        } else if (!arg.empty() && arg[0] != '-') {
            config_file = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // ======== LOAD CONFIGURATION ========

    ServerConfig config = ConfigParser::getDefaultConfig();
    if (!ConfigParser::parseConfig(config_file, config)) {
        std::cout << "Warning: Could not load config from " << config_file << ", using defaults" << std::endl;
        config = ConfigParser::getDefaultConfig();
    }

    const char* env_file = std::getenv("DOMAIN_QUERY_ENV_FILE");
    EnvFileLoader::load(env_file ? env_file : ".env");
    ConfigParser::applyEnvironment(config);

    if (!host_override.empty()) {
        config.host = host_override;
    }
    if (port_override >= 0) {
        config.port = port_override;
    }
    ConfigParser::validateConfig(config);

    // ======== LOOKUP CLIENT ========

    CURLcode curl_status = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (curl_status != CURLE_OK) {
        std::cerr << "Failed to initialize libcurl: " << curl_easy_strerror(curl_status) << std::endl;
        return 1;
    }

    WhoisLookupClient::ClientPolicy policy;
    policy.timeoutSeconds = config.whois_timeout;
    policy.maxRetries = config.whois_max_retries;
    policy.retryDelaySeconds = config.whois_retry_delay;
    policy.respectRateLimit = config.respect_rate_limit;

    auto transport = std::make_shared<CurlWhoisTransport>(config.whois_endpoint);
    auto lookup = std::make_shared<WhoisLookupClient>(transport, policy);

    // ======== ROUTES ========

    WebServer server;
    server.setConfig(config);

    UtilsRouter utils_router;
    utils_router.registerRoutes(
        [&server](const std::string& path, UtilsRouter::StructuredRouteHandler handler) {
            server.addStructuredRouteHandler(path, handler);
        });

    DomainQueryRouter domain_query_router(lookup, config.suffix_config_path);
    domain_query_router.registerRoutes(
        [&server](const std::string& path, DomainQueryRouter::StructuredRouteHandler handler) {
            server.addStructuredRouteHandler(path, handler);
        },
        [&server](const std::string& path, DomainQueryRouter::StreamingRouteHandler handler) {
            server.addStreamingRouteHandler(path, handler);
        });

    // ======== START SERVER ========

    if (!server.start()) {
        std::cerr << "Failed to start server! Try another port with --port or DOMAIN_QUERY_PORT." << std::endl;
        curl_global_cleanup();
        return 1;
    }

    ENDPOINT_LOG("server", "Server started on " + config.host + ":" + std::to_string(server.getBoundPort()));
    ENDPOINT_LOG("server", "Whois endpoint: " + config.whois_endpoint);
    ENDPOINT_LOG("server", "Suffix configuration: " + config.suffix_config_path);
    ENDPOINT_LOG("server", "Press Ctrl+C to stop the server.");
    ENDPOINT_LOG("server", std::string(60, '='));

    while (server_running && server.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ======== GRACEFUL SHUTDOWN ========

    ENDPOINT_LOG("server", "Initiating graceful shutdown...");
    // Returns only after every stream producer is done with libcurl
    server.stop();
    curl_global_cleanup();
    ENDPOINT_LOG("server", "HTTP server stopped gracefully.");

    return 0;
}
