#ifndef ENV_FILE_LOADER_H
#define ENV_FILE_LOADER_H

#include <string>
#include <map>

/**
 * Reads KEY=VALUE pairs from a dotenv-style file and exports them into the
 * process environment without overriding variables that are already set.
 * A missing file yields an empty map.
 */
class EnvFileLoader {
public:
    static std::map<std::string, std::string> load(const std::string& path);
    static std::map<std::string, std::string> parse(const std::string& content);

private:
    static std::string stripQuotes(const std::string& value);
};

#endif // ENV_FILE_LOADER_H
