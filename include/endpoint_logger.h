#ifndef ENDPOINT_LOGGER_H
#define ENDPOINT_LOGGER_H

#include <string>
#include <map>
#include <iostream>
#include <mutex>

/**
 * Centralized logging filtered per component group ("http", "whois",
 * "stream", ...). Filters come from the "endpoint_logging" section of the
 * server configuration; groups missing from the filter map are enabled.
 */
class EndpointLogger {
public:
    static EndpointLogger& getInstance();

    void setEndpointFilters(const std::map<std::string, bool>& filters);
    bool isLoggingEnabled(const std::string& endpoint_group) const;

    void log(const std::string& endpoint_group, const std::string& message);
    void logInfo(const std::string& endpoint_group, const std::string& message);
    void logWarning(const std::string& endpoint_group, const std::string& message);
    void logError(const std::string& endpoint_group, const std::string& message);

private:
    EndpointLogger() = default;
    ~EndpointLogger() = default;
    EndpointLogger(const EndpointLogger&) = delete;
    EndpointLogger& operator=(const EndpointLogger&) = delete;

    void write(std::ostream& out, const std::string& endpoint_group, const std::string& level,
               const std::string& message);
    static std::string currentTimestamp();

    std::map<std::string, bool> endpoint_filters_;
    mutable std::mutex mutex_;
};

#define ENDPOINT_LOG(group, message) \
    EndpointLogger::getInstance().log(group, message)

#define ENDPOINT_LOG_INFO(group, message) \
    EndpointLogger::getInstance().logInfo(group, message)

#define ENDPOINT_LOG_WARNING(group, message) \
    EndpointLogger::getInstance().logWarning(group, message)

#define ENDPOINT_LOG_ERROR(group, message) \
    EndpointLogger::getInstance().logError(group, message)

#define IS_ENDPOINT_LOGGING_ENABLED(group) \
    EndpointLogger::getInstance().isLoggingEnabled(group)

#endif // ENDPOINT_LOGGER_H
