#include "config_parser.h"
#include "endpoint_logger.h"
#include <fstream>
#include <iostream>
#include <cstdlib>

bool ConfigParser::parseConfig(const std::string& config_file, ServerConfig& config) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        return false;
    }

    try {
        nlohmann::json json_config;
        file >> json_config;
        return parseConfigJson(json_config, config);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error parsing config file " << config_file << ": " << e.what() << std::endl;
        return false;
    }
}

bool ConfigParser::parseConfigJson(const nlohmann::json& json_config, ServerConfig& config) {
    if (!json_config.is_object()) {
        std::cerr << "Error parsing config: top level must be an object" << std::endl;
        return false;
    }

    try {
        if (json_config.contains("host")) {
            config.host = json_config["host"].get<std::string>();
        }

        if (json_config.contains("port")) {
            config.port = json_config["port"].get<int>();
        }

        if (json_config.contains("connection_timeout")) {
            config.connection_timeout = json_config["connection_timeout"].get<int>();
        }

        if (json_config.contains("suffix_config_path")) {
            config.suffix_config_path = json_config["suffix_config_path"].get<std::string>();
        }

        // Upstream whois settings
        if (json_config.contains("whois_endpoint")) {
            config.whois_endpoint = json_config["whois_endpoint"].get<std::string>();
        }

        if (json_config.contains("whois_timeout")) {
            config.whois_timeout = json_config["whois_timeout"].get<int>();
        }

        if (json_config.contains("whois_max_retries")) {
            config.whois_max_retries = json_config["whois_max_retries"].get<int>();
        }

        if (json_config.contains("whois_retry_delay")) {
            config.whois_retry_delay = json_config["whois_retry_delay"].get<double>();
        }

        if (json_config.contains("respect_rate_limit")) {
            config.respect_rate_limit = json_config["respect_rate_limit"].get<bool>();
        }

        // Parse endpoint logging configuration
        if (json_config.contains("endpoint_logging")) {
            for (auto& [key, value] : json_config["endpoint_logging"].items()) {
                config.endpoint_logging[key] = value.get<bool>();
            }
        }
    } catch (const nlohmann::json::type_error& e) {
        std::cerr << "Error parsing config: " << e.what() << std::endl;
        return false;
    }

    validateConfig(config);
    return true;
}

ServerConfig ConfigParser::getDefaultConfig() {
    ServerConfig config;
    config.host = "0.0.0.0";
    config.port = 8000;
    config.connection_timeout = 30;
    config.suffix_config_path = "config/domain_suffixes.json";
    config.whois_endpoint = "https://api.whoiscx.com/whois/?domain={domain}";
    config.whois_timeout = 10;
    config.whois_max_retries = 1;
    config.whois_retry_delay = 2.0;
    config.respect_rate_limit = true;
    return config;
}

void ConfigParser::applyEnvironment(ServerConfig& config) {
    if (const char* host = std::getenv("DOMAIN_QUERY_HOST")) {
        if (*host) {
            config.host = host;
        }
    }

    if (const char* port = std::getenv("DOMAIN_QUERY_PORT")) {
        try {
            config.port = std::stoi(port);
        } catch (const std::exception&) {
            ENDPOINT_LOG_WARNING("config", std::string("Ignoring non-numeric DOMAIN_QUERY_PORT: ") + port);
        }
    }

    if (const char* suffix_path = std::getenv("DOMAIN_QUERY_CONFIG")) {
        if (*suffix_path) {
            config.suffix_config_path = suffix_path;
        }
    }

    validateConfig(config);
}

void ConfigParser::validateConfig(ServerConfig& config) {
    // Port 0 asks the kernel for an ephemeral port
    if (config.port < 0 || config.port > 65535) {
        std::cerr << "Warning: Invalid port " << config.port << ", using default 8000" << std::endl;
        config.port = 8000;
    }

    if (config.connection_timeout < 1) {
        std::cerr << "Warning: Invalid connection_timeout " << config.connection_timeout << ", using default 30" << std::endl;
        config.connection_timeout = 30;
    }

    if (config.whois_timeout < 1) {
        std::cerr << "Warning: Invalid whois_timeout " << config.whois_timeout << ", using default 10" << std::endl;
        config.whois_timeout = 10;
    }

    if (config.whois_max_retries < 0) {
        std::cerr << "Warning: Invalid whois_max_retries " << config.whois_max_retries << ", using 0" << std::endl;
        config.whois_max_retries = 0;
    }

    if (config.whois_retry_delay < 0.0) {
        std::cerr << "Warning: Invalid whois_retry_delay " << config.whois_retry_delay << ", using 0" << std::endl;
        config.whois_retry_delay = 0.0;
    }

    if (config.host.empty()) {
        config.host = "0.0.0.0";
    }

    if (config.suffix_config_path.empty()) {
        config.suffix_config_path = "config/domain_suffixes.json";
    }

    if (config.whois_endpoint.empty()) {
        config.whois_endpoint = "https://api.whoiscx.com/whois/?domain={domain}";
    }
}
