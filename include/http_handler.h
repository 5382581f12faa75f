#ifndef HTTP_HANDLER_H
#define HTTP_HANDLER_H

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <set>
#include <mutex>
#include <condition_variable>
#include <sys/types.h>
#include <microhttpd.h>
#include "api_request.h"

class StreamChannel;

/**
 * Per-connection state stored in MHD's con_cls slot. Created by WebServer on
 * the first callback of a request and deleted in its completion callback.
 */
struct ConnectionState {
    std::string body;
    bool body_too_large = false;
};

class HttpHandler {
public:
    static constexpr size_t MAX_BODY_SIZE = 10 * 1024 * 1024;
    static constexpr size_t STREAM_BLOCK_SIZE = 4096;

    HttpHandler();
    ~HttpHandler();

    // Returns MHD_YES while the upload is still arriving, then answers the request.
    enum MHD_Result handleRequest(struct MHD_Connection* connection,
                     const char* url, const char* method,
                     const char* upload_data, size_t* upload_data_size,
                     ConnectionState& state);

    void addStructuredRouteHandler(const std::string& path, RouteProcessor processor);
    void addStreamingRouteHandler(const std::string& path, StreamingRouteProcessor processor);

    bool hasRoute(const std::string& path) const;

    // Shutdown: closeStreams() makes every open producer's next write fail and
    // refuses new streams; waitForStreams() blocks until all producer threads
    // have returned, then accepts streams again.
    void closeStreams();
    void waitForStreams();

private:
    std::map<std::string, RouteProcessor> structured_route_processors_;
    std::map<std::string, StreamingRouteProcessor> streaming_route_processors_;

    // Channels whose producer thread is still running
    std::mutex streams_mutex_;
    std::condition_variable streams_cv_;
    std::set<std::shared_ptr<StreamChannel>> active_streams_;
    bool streams_closed_ = false;

    void releaseStream(const std::shared_ptr<StreamChannel>& channel);

    ApiRequest buildApiRequest(struct MHD_Connection* connection, const std::string& url,
                               const std::string& method, const std::string& body);
    enum MHD_Result sendApiResponse(struct MHD_Connection* connection, const ApiResponse& response);
    enum MHD_Result sendStreamingResponse(struct MHD_Connection* connection,
                                          const StreamingApiResponse& stream,
                                          const std::string& request_id);

    enum MHD_Result sendResponse(struct MHD_Connection* connection,
                    int status_code,
                    const std::string& content,
                    const std::string& content_type = "text/plain");

    enum MHD_Result sendJsonResponse(struct MHD_Connection* connection,
                        int status_code,
                        const std::string& json_content);

    enum MHD_Result sendErrorResponse(struct MHD_Connection* connection,
                         int status_code,
                         const std::string& error_message);

    enum MHD_Result sendCorsPreflight(struct MHD_Connection* connection);

    static void addCommonHeaders(struct MHD_Response* response, const std::string& content_type);

    // MHD content reader plumbing for streamed bodies
    static ssize_t streamReaderCallback(void* cls, uint64_t pos, char* buf, size_t max);
    static void streamFreeCallback(void* cls);
};

#endif // HTTP_HANDLER_H
