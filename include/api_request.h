#pragma once

#include <string>
#include <chrono>
#include <memory>
#include <cstdlib>
#include <functional>
#include <nlohmann/json.hpp>
#include "endpoint_logger.h"

class StreamChannel;

/**
 * Structure containing complete API request information
 */
struct ApiRequest {
    // Request identification
    std::string route;              // API route (e.g., "/domain-query/batch")
    std::string method;             // HTTP method (GET, POST, etc.)
    std::string source_ip;          // Client IP address
    std::string user_agent;         // Client user agent

    // Request content
    std::string body;               // Raw request body
    nlohmann::json json_data;       // Parsed JSON data (if valid JSON)

    // Request metadata
    std::chrono::system_clock::time_point timestamp;
    std::string request_id;
    size_t content_length;
    bool is_json_valid;

    ApiRequest() : content_length(0), is_json_valid(false) {
        timestamp = std::chrono::system_clock::now();
    }

    void generateRequestId() {
        auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch()).count();
        request_id = "req_" + std::to_string(now) + "_" + std::to_string(rand() % 10000);
    }

    void parseJsonBody() {
        is_json_valid = false;
        if (body.empty()) {
            return;
        }
        try {
            json_data = nlohmann::json::parse(body);
            is_json_valid = true;
        } catch (const nlohmann::json::parse_error&) {
            // is_json_valid stays false; processors decide how to answer
        }
    }

    void logRequest() const {
        ENDPOINT_LOG("http", "Request " + request_id + ": " + method + " " + route +
                     " from " + source_ip + " (" + std::to_string(content_length) + " bytes" +
                     (is_json_valid ? ", json" : "") + ")");
    }
};

/**
 * Structure for API response
 */
struct ApiResponse {
    std::string body;
    int status_code;
    std::string content_type;

    ApiResponse() : status_code(200), content_type("application/json; charset=utf-8") {}

    void setJsonResponse(const nlohmann::json& json_data, int http_code = 200) {
        body = json_data.dump();
        status_code = http_code;
        content_type = "application/json; charset=utf-8";
    }

    void setErrorResponse(const std::string& message, int code = 400) {
        setJsonResponse(nlohmann::json{{"error", message}}, code);
    }
};

/**
 * Response for routes that deliver their body progressively.
 *
 * When `producer` is empty the `immediate` response is sent as-is (used for
 * request-level errors). Otherwise the producer runs on its own thread and
 * writes newline-delimited records into the channel until it returns.
 */
struct StreamingApiResponse {
    ApiResponse immediate;
    std::string content_type = "application/x-ndjson";
    std::function<void(const std::shared_ptr<StreamChannel>& channel)> producer;

    bool isStream() const { return static_cast<bool>(producer); }
};

using RouteProcessor = std::function<ApiResponse(const ApiRequest&)>;
using StreamingRouteProcessor = std::function<StreamingApiResponse(const ApiRequest&)>;
