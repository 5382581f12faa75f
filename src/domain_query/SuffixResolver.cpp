#include "SuffixResolver.hpp"
#include "LineNormalizer.hpp"
#include "endpoint_logger.h"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <system_error>

// A JSON value counts as enabled unless it is null, false, zero or empty
static bool isTruthy(const json& value) {
    if (value.is_null()) {
        return false;
    }
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() != 0;
    }
    if (value.is_string()) {
        return !value.get<std::string>().empty();
    }
    return !value.empty();
}

std::vector<std::string> SuffixResolver::resolveFile(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        throw ConfigError("Suffix configuration file not found: " + path +
                          (ec ? " (" + ec.message() + ")" : std::string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Unable to open suffix configuration file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    // Editors on some platforms prepend a UTF-8 BOM
    if (content.size() >= 3 && content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        content.erase(0, 3);
    }

    json document;
    try {
        document = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError("Suffix configuration is not valid JSON (" + path + "): " + e.what());
    }

    ENDPOINT_LOG("config", "Loaded suffix configuration from " + path);
    return resolveDocument(document);
}

std::vector<std::string> SuffixResolver::resolveDocument(const json& document) {
    const json* entries = &document;
    if (document.is_object()) {
        auto it = document.find("suffixes");
        if (it == document.end()) {
            throw ConfigError("Invalid suffix configuration: expected a \"suffixes\" array");
        }
        entries = &(*it);
    }

    if (!entries->is_array()) {
        throw ConfigError("Invalid suffix configuration: expected a \"suffixes\" array");
    }

    std::vector<std::string> suffixes;
    for (const auto& entry : *entries) {
        std::string suffix;
        bool enabled = true;

        if (entry.is_string()) {
            suffix = normalizeSuffix(entry.get<std::string>());
        } else if (entry.is_object()) {
            auto suffix_it = entry.find("suffix");
            if (suffix_it != entry.end() && suffix_it->is_string()) {
                suffix = normalizeSuffix(suffix_it->get<std::string>());
            }
            auto enabled_it = entry.find("enabled");
            if (enabled_it != entry.end()) {
                enabled = isTruthy(*enabled_it);
            }
        } else {
            continue;
        }

        if (suffix.empty() || !enabled) {
            continue;
        }
        suffixes.push_back(suffix);
    }

    if (suffixes.empty()) {
        throw ConfigError("No enabled domain suffixes, check the suffix configuration");
    }
    return suffixes;
}

std::string SuffixResolver::normalizeSuffix(const std::string& raw) {
    std::string suffix = LineNormalizer::trim(raw);

    size_t first = suffix.find_first_not_of('.');
    if (first == std::string::npos) {
        return "";
    }
    suffix.erase(0, first);

    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return suffix;
}
