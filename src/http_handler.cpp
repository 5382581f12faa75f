#include "http_handler.h"
#include "stream_channel.h"
#include "endpoint_logger.h"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <ctime>
#include <thread>
#include <system_error>
#include <nlohmann/json.hpp>

HttpHandler::HttpHandler() {
    // Initialize random seed for request IDs
    std::srand(std::time(nullptr));
}

HttpHandler::~HttpHandler() {
    closeStreams();
    waitForStreams();
}

enum MHD_Result HttpHandler::handleRequest(struct MHD_Connection* connection,
                              const char* url, const char* method,
                              const char* upload_data, size_t* upload_data_size,
                              ConnectionState& state) {

    if (!url || !method) {
        return sendErrorResponse(connection, MHD_HTTP_BAD_REQUEST, "Invalid request");
    }

    std::string url_str(url);
    std::string method_str(method);

    // Accumulate the upload until MHD reports no more data
    if (*upload_data_size > 0) {
        if (state.body.size() + *upload_data_size > MAX_BODY_SIZE) {
            state.body_too_large = true;
        } else {
            state.body.append(upload_data, *upload_data_size);
        }
        *upload_data_size = 0;
        return MHD_YES;
    }

    if (url_str.length() > 2048 || method_str.length() > 16) {
        return sendErrorResponse(connection, MHD_HTTP_URI_TOO_LONG, "Request URI too long");
    }

    if (state.body_too_large) {
        return sendErrorResponse(connection, MHD_HTTP_PAYLOAD_TOO_LARGE, "Request body too large");
    }

    if (method_str == "OPTIONS" && hasRoute(url_str)) {
        return sendCorsPreflight(connection);
    }

    auto structured_it = structured_route_processors_.find(url_str);
    if (structured_it != structured_route_processors_.end()) {
        ApiRequest api_request = buildApiRequest(connection, url_str, method_str, state.body);
        api_request.logRequest();

        try {
            ApiResponse api_response = structured_it->second(api_request);
            ENDPOINT_LOG("http", "Response " + api_request.request_id + ": " + std::to_string(api_response.status_code));
            return sendApiResponse(connection, api_response);
        } catch (const std::exception& e) {
            ENDPOINT_LOG_ERROR("http", "Error handling request " + url_str + ": " + e.what());
            return sendErrorResponse(connection, MHD_HTTP_INTERNAL_SERVER_ERROR, "Internal server error");
        }
    }

    auto streaming_it = streaming_route_processors_.find(url_str);
    if (streaming_it != streaming_route_processors_.end()) {
        ApiRequest api_request = buildApiRequest(connection, url_str, method_str, state.body);
        api_request.logRequest();

        try {
            StreamingApiResponse stream = streaming_it->second(api_request);
            if (!stream.isStream()) {
                ENDPOINT_LOG("http", "Response " + api_request.request_id + ": " +
                             std::to_string(stream.immediate.status_code));
                return sendApiResponse(connection, stream.immediate);
            }
            return sendStreamingResponse(connection, stream, api_request.request_id);
        } catch (const std::exception& e) {
            ENDPOINT_LOG_ERROR("http", "Error handling streaming request " + url_str + ": " + e.what());
            return sendErrorResponse(connection, MHD_HTTP_INTERNAL_SERVER_ERROR, "Internal server error");
        }
    }

    ENDPOINT_LOG("http", "No route for " + method_str + " " + url_str);
    return sendErrorResponse(connection, MHD_HTTP_NOT_FOUND, "Not Found");
}

void HttpHandler::addStructuredRouteHandler(const std::string& path, RouteProcessor processor) {
    structured_route_processors_[path] = processor;
}

void HttpHandler::addStreamingRouteHandler(const std::string& path, StreamingRouteProcessor processor) {
    streaming_route_processors_[path] = processor;
}

bool HttpHandler::hasRoute(const std::string& path) const {
    return structured_route_processors_.count(path) > 0 || streaming_route_processors_.count(path) > 0;
}

void HttpHandler::closeStreams() {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_closed_ = true;
    if (!active_streams_.empty()) {
        ENDPOINT_LOG("stream", "Closing " + std::to_string(active_streams_.size()) + " open stream(s)");
    }
    for (const auto& channel : active_streams_) {
        channel->close();
    }
}

void HttpHandler::waitForStreams() {
    std::unique_lock<std::mutex> lock(streams_mutex_);
    streams_cv_.wait(lock, [this] { return active_streams_.empty(); });
    streams_closed_ = false;
}

void HttpHandler::releaseStream(const std::shared_ptr<StreamChannel>& channel) {
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        active_streams_.erase(channel);
    }
    streams_cv_.notify_all();
}

ApiRequest HttpHandler::buildApiRequest(struct MHD_Connection* connection, const std::string& url,
                                        const std::string& method, const std::string& body) {
    ApiRequest request;
    request.route = url;
    request.method = method;
    request.generateRequestId();

    const char* client_ip = MHD_lookup_connection_value(connection, MHD_HEADER_KIND, "X-Forwarded-For");
    if (!client_ip) {
        client_ip = MHD_lookup_connection_value(connection, MHD_HEADER_KIND, "X-Real-IP");
    }
    request.source_ip = client_ip ? std::string(client_ip) : "unknown";

    const char* user_agent = MHD_lookup_connection_value(connection, MHD_HEADER_KIND, "User-Agent");
    request.user_agent = user_agent ? std::string(user_agent) : "unknown";

    request.body = body;
    request.content_length = body.length();
    request.parseJsonBody();
    return request;
}

enum MHD_Result HttpHandler::sendApiResponse(struct MHD_Connection* connection, const ApiResponse& response) {
    return sendResponse(connection, response.status_code, response.body, response.content_type);
}

enum MHD_Result HttpHandler::sendStreamingResponse(struct MHD_Connection* connection,
                                                   const StreamingApiResponse& stream,
                                                   const std::string& request_id) {
    auto channel = std::make_shared<StreamChannel>();
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        if (streams_closed_) {
            return sendErrorResponse(connection, MHD_HTTP_SERVICE_UNAVAILABLE, "Server is shutting down");
        }
        active_streams_.insert(channel);
    }

    // Owned by MHD from here on; released in streamFreeCallback
    auto* holder = new std::shared_ptr<StreamChannel>(channel);

    struct MHD_Response* response = MHD_create_response_from_callback(
        MHD_SIZE_UNKNOWN,
        STREAM_BLOCK_SIZE,
        &HttpHandler::streamReaderCallback,
        holder,
        &HttpHandler::streamFreeCallback
    );

    if (!response) {
        delete holder;
        releaseStream(channel);
        ENDPOINT_LOG_ERROR("http", "Failed to create streaming response for " + request_id);
        return sendErrorResponse(connection, MHD_HTTP_INTERNAL_SERVER_ERROR, "Failed to create response");
    }

    addCommonHeaders(response, stream.content_type);
    MHD_add_response_header(response, "X-Accel-Buffering", "no");
    MHD_add_response_header(response, MHD_HTTP_HEADER_CONNECTION, "close");

    enum MHD_Result ret = MHD_queue_response(connection, MHD_HTTP_OK, response);
    MHD_destroy_response(response);

    if (ret != MHD_YES) {
        ENDPOINT_LOG_ERROR("http", "MHD_queue_response failed for stream " + request_id);
        releaseStream(channel);
        return ret;
    }

    ENDPOINT_LOG("stream", "Stream " + request_id + " opened");
    auto producer = stream.producer;
    try {
        // Detached; waitForStreams() is what keeps this handler alive until it returns
        std::thread([this, producer, channel, request_id]() {
            try {
                producer(channel);
            } catch (const std::exception& e) {
                ENDPOINT_LOG_ERROR("stream", "Stream " + request_id + " producer failed: " + e.what());
            }
            channel->finish();
            ENDPOINT_LOG("stream", "Stream " + request_id + " finished");
            releaseStream(channel);
        }).detach();
    } catch (const std::system_error& e) {
        ENDPOINT_LOG_ERROR("stream", "Cannot start producer for " + request_id + ": " + e.what());
        channel->close();
        releaseStream(channel);
    }

    return ret;
}

enum MHD_Result HttpHandler::sendResponse(struct MHD_Connection* connection,
                             int status_code,
                             const std::string& content,
                             const std::string& content_type) {

    if (!connection) {
        return MHD_NO;
    }

    struct MHD_Response* response = MHD_create_response_from_buffer(
        content.length(),
        const_cast<char*>(content.c_str()),
        MHD_RESPMEM_MUST_COPY
    );

    if (!response) {
        std::cerr << "Critical: Failed to create MHD response" << std::endl;
        return MHD_NO;
    }

    addCommonHeaders(response, content_type);

    enum MHD_Result ret = MHD_queue_response(connection, status_code, response);
    if (ret != MHD_YES) {
        std::cerr << "Critical: MHD_queue_response failed with status: " << ret << std::endl;
    }

    MHD_destroy_response(response);
    return ret;
}

enum MHD_Result HttpHandler::sendJsonResponse(struct MHD_Connection* connection,
                                 int status_code,
                                 const std::string& json_content) {
    return sendResponse(connection, status_code, json_content, "application/json; charset=utf-8");
}

enum MHD_Result HttpHandler::sendErrorResponse(struct MHD_Connection* connection,
                                  int status_code,
                                  const std::string& error_message) {
    nlohmann::json error_json;
    error_json["error"] = error_message;

    return sendJsonResponse(connection, status_code, error_json.dump());
}

enum MHD_Result HttpHandler::sendCorsPreflight(struct MHD_Connection* connection) {
    struct MHD_Response* response = MHD_create_response_from_buffer(0, (void*)"", MHD_RESPMEM_PERSISTENT);
    if (!response) {
        return MHD_NO;
    }
    MHD_add_response_header(response, "Access-Control-Allow-Origin", "*");
    MHD_add_response_header(response, "Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    MHD_add_response_header(response, "Access-Control-Allow-Headers", "Content-Type, Accept, Origin");
    MHD_add_response_header(response, "Access-Control-Max-Age", "86400");
    enum MHD_Result ret = MHD_queue_response(connection, MHD_HTTP_NO_CONTENT, response);
    MHD_destroy_response(response);
    return ret;
}

void HttpHandler::addCommonHeaders(struct MHD_Response* response, const std::string& content_type) {
    MHD_add_response_header(response, "Content-Type", content_type.c_str());
    MHD_add_response_header(response, "X-Content-Type-Options", "nosniff");
    MHD_add_response_header(response, "Access-Control-Allow-Origin", "*");
    MHD_add_response_header(response, "Cache-Control", "no-cache, no-store, must-revalidate");
    MHD_add_response_header(response, "Server", "Domain-Query-Server/1.0");
}

ssize_t HttpHandler::streamReaderCallback(void* cls, uint64_t pos, char* buf, size_t max) {
    auto* holder = static_cast<std::shared_ptr<StreamChannel>*>(cls);
    size_t copied = (*holder)->read(buf, max);
    if (copied == 0) {
        return MHD_CONTENT_READER_END_OF_STREAM;
    }
    return static_cast<ssize_t>(copied);
}

void HttpHandler::streamFreeCallback(void* cls) {
    auto* holder = static_cast<std::shared_ptr<StreamChannel>*>(cls);
    // Completed, aborted by the client, or daemon shutdown: the producer sees a failed write
    (*holder)->close();
    delete holder;
}
