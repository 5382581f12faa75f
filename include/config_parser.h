#ifndef CONFIG_PARSER_H
#define CONFIG_PARSER_H

#include <string>
#include <nlohmann/json.hpp>
#include "web_server.h"

class ConfigParser {
public:
    static bool parseConfig(const std::string& config_file, ServerConfig& config);
    static bool parseConfigJson(const nlohmann::json& json_config, ServerConfig& config);
    static ServerConfig getDefaultConfig();

    // Overrides from DOMAIN_QUERY_HOST, DOMAIN_QUERY_PORT and DOMAIN_QUERY_CONFIG
    static void applyEnvironment(ServerConfig& config);

    static void validateConfig(ServerConfig& config);
};

#endif // CONFIG_PARSER_H
