#ifndef WEB_SERVER_H
#define WEB_SERVER_H

#include <memory>
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <microhttpd.h>
#include "api_request.h"

class HttpHandler;

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    int connection_timeout = 30;

    // Domain query settings
    std::string suffix_config_path = "config/domain_suffixes.json";
    std::string whois_endpoint = "https://api.whoiscx.com/whois/?domain={domain}";
    int whois_timeout = 10;
    int whois_max_retries = 1;
    double whois_retry_delay = 2.0;
    bool respect_rate_limit = true;

    // Endpoint logging configuration
    std::map<std::string, bool> endpoint_logging = {
        {"http", true},
        {"server", true},
        {"domain-query", true},
        {"whois", true},
        {"stream", true},
        {"config", true}
    };
};

class WebServer {
public:
    WebServer();
    ~WebServer();

    // Configuration
    void setConfig(const ServerConfig& config);
    const ServerConfig& getConfig() const { return config_; }

    // Server lifecycle
    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // Actual listening port; differs from config when port 0 was requested
    int getBoundPort() const;

    // Structured API route handlers
    void addStructuredRouteHandler(const std::string& path, RouteProcessor processor);
    void addStreamingRouteHandler(const std::string& path, StreamingRouteProcessor processor);

private:
    ServerConfig config_;
    std::atomic<bool> running_;

    struct MHD_Daemon* http_daemon_;
    std::unique_ptr<HttpHandler> http_handler_;

    static enum MHD_Result accessHandlerCallback(void* cls, struct MHD_Connection* connection,
                                    const char* url, const char* method,
                                    const char* version, const char* upload_data,
                                    size_t* upload_data_size, void** con_cls);

    static void requestCompletedCallback(void* cls, struct MHD_Connection* connection,
                                       void** con_cls, enum MHD_RequestTerminationCode toe);

    enum MHD_Result handleRequest(struct MHD_Connection* connection,
                     const char* url, const char* method,
                     const char* upload_data, size_t* upload_data_size,
                     void** con_cls);
};

#endif // WEB_SERVER_H
