#include "endpoint_logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

EndpointLogger& EndpointLogger::getInstance() {
    static EndpointLogger instance;
    return instance;
}

void EndpointLogger::setEndpointFilters(const std::map<std::string, bool>& filters) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoint_filters_ = filters;
}

bool EndpointLogger::isLoggingEnabled(const std::string& endpoint_group) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = endpoint_filters_.find(endpoint_group);
    if (it != endpoint_filters_.end()) {
        return it->second;
    }
    return true;
}

void EndpointLogger::log(const std::string& endpoint_group, const std::string& message) {
    write(std::cout, endpoint_group, "", message);
}

void EndpointLogger::logInfo(const std::string& endpoint_group, const std::string& message) {
    write(std::cout, endpoint_group, "INFO", message);
}

void EndpointLogger::logWarning(const std::string& endpoint_group, const std::string& message) {
    write(std::cout, endpoint_group, "WARNING", message);
}

void EndpointLogger::logError(const std::string& endpoint_group, const std::string& message) {
    write(std::cerr, endpoint_group, "ERROR", message);
}

void EndpointLogger::write(std::ostream& out, const std::string& endpoint_group, const std::string& level,
                           const std::string& message) {
    if (!isLoggingEnabled(endpoint_group)) {
        return;
    }

    std::ostringstream line;
    line << "[" << currentTimestamp() << "] [" << endpoint_group << "] ";
    if (!level.empty()) {
        line << "[" << level << "] ";
    }
    line << message;

    // Connection threads log concurrently; keep lines whole
    std::lock_guard<std::mutex> lock(mutex_);
    out << line.str() << std::endl;
}

std::string EndpointLogger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream timestamp;
    timestamp << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    timestamp << "." << std::setfill('0') << std::setw(3) << ms.count();
    return timestamp.str();
}
