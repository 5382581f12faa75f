#ifndef DOMAIN_QUERY_TYPES_H
#define DOMAIN_QUERY_TYPES_H

#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

/**
 * Base class for every failure raised by the domain query engine.
 * Routers catch this type and turn the message into an {"error": ...} payload.
 */
class DomainQueryError : public std::runtime_error {
public:
    explicit DomainQueryError(const std::string& message) : std::runtime_error(message) {}
};

// Suffix source missing, malformed, or empty after filtering
class ConfigError : public DomainQueryError {
public:
    explicit ConfigError(const std::string& message) : DomainQueryError(message) {}
};

// Empty operand while combining a fragment with a suffix
class ValidationError : public DomainQueryError {
public:
    explicit ValidationError(const std::string& message) : DomainQueryError(message) {}
};

// Upstream whois service failure (transport, malformed body, status, retries)
class LookupError : public DomainQueryError {
public:
    explicit LookupError(const std::string& message) : DomainQueryError(message) {}
};

/**
 * One completed whois check. Built once from a successful response.
 */
struct LookupResult {
    std::string domain;
    std::string domainSuffix;
    bool isRegistered = false;
    std::optional<std::string> queryTime;

    json toJson() const {
        json j;
        j["domain"] = domain;
        j["domain_suffix"] = domainSuffix;
        j["is_registered"] = isRegistered;
        if (queryTime) {
            j["query_time"] = *queryTime;
        } else {
            j["query_time"] = nullptr;
        }
        return j;
    }
};

#endif // DOMAIN_QUERY_TYPES_H
