#include "env_file_loader.h"
#include "endpoint_logger.h"
#include "domain_query/LineNormalizer.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>

std::map<std::string, std::string> EnvFileLoader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return {};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::map<std::string, std::string> values = parse(buffer.str());

    for (const auto& [key, value] : values) {
        // overwrite=0 keeps variables that are already present
        if (setenv(key.c_str(), value.c_str(), 0) != 0) {
            ENDPOINT_LOG_WARNING("config", "Could not export " + key + " from " + path);
        }
    }

    ENDPOINT_LOG("config", "Loaded " + std::to_string(values.size()) + " entries from " + path);
    return values;
}

std::map<std::string, std::string> EnvFileLoader::parse(const std::string& content) {
    std::map<std::string, std::string> values;
    std::istringstream stream(content);
    std::string raw;

    while (std::getline(stream, raw)) {
        std::string line = LineNormalizer::trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = LineNormalizer::trim(line.substr(0, eq));
        if (key.empty()) {
            continue;
        }
        values[key] = stripQuotes(LineNormalizer::trim(line.substr(eq + 1)));
    }
    return values;
}

std::string EnvFileLoader::stripQuotes(const std::string& value) {
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' || first == '\'') && first == last) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}
