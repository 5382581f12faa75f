#include "../include/web_server.h"
#include "endpoint_logger.h"
#include "http_handler.h"
#include <iostream>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>

WebServer::WebServer()
   : running_(false), http_daemon_(nullptr) {
   http_handler_ = std::make_unique<HttpHandler>();
}

WebServer::~WebServer() {
   stop();
}

void WebServer::setConfig(const ServerConfig& config) {
   config_ = config;

   // Initialize endpoint logging filters
   EndpointLogger::getInstance().setEndpointFilters(config_.endpoint_logging);
}

static bool resolveListenAddress(const std::string& host, int port, struct sockaddr_in& addr) {
   std::memset(&addr, 0, sizeof(addr));
   addr.sin_family = AF_INET;
   addr.sin_port = htons(static_cast<uint16_t>(port));

   if (host.empty() || host == "0.0.0.0") {
       addr.sin_addr.s_addr = htonl(INADDR_ANY);
       return true;
   }
   if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
       return true;
   }

   struct addrinfo hints;
   std::memset(&hints, 0, sizeof(hints));
   hints.ai_family = AF_INET;
   hints.ai_socktype = SOCK_STREAM;
   struct addrinfo* result = nullptr;
   if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
       return false;
   }
   addr.sin_addr = reinterpret_cast<struct sockaddr_in*>(result->ai_addr)->sin_addr;
   freeaddrinfo(result);
   return true;
}

bool WebServer::start() {
   if (running_) {
       std::cerr << "Server is already running" << std::endl;
       return false;
   }

   struct sockaddr_in listen_addr;
   if (!resolveListenAddress(config_.host, config_.port, listen_addr)) {
       ENDPOINT_LOG_ERROR("server", "Cannot resolve listen host " + config_.host);
       return false;
   }

   // Streams block their connection thread, so each connection gets its own
   unsigned int flags = MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD | MHD_USE_ERROR_LOG;

   http_daemon_ = MHD_start_daemon(
       flags,
       static_cast<uint16_t>(config_.port),
       nullptr, nullptr,
       &WebServer::accessHandlerCallback, this,
       MHD_OPTION_SOCK_ADDR, reinterpret_cast<struct sockaddr*>(&listen_addr),
       MHD_OPTION_CONNECTION_TIMEOUT, (unsigned int)config_.connection_timeout,
       MHD_OPTION_NOTIFY_COMPLETED, &WebServer::requestCompletedCallback, this,
       MHD_OPTION_END
   );

   if (!http_daemon_) {
       std::cerr << "Failed to start HTTP server on " << config_.host << ":" << config_.port
                 << ". Port may be in use or permission denied." << std::endl;
       return false;
   }

   running_ = true;
   ENDPOINT_LOG_INFO("server", "HTTP server started on " + config_.host + ":" + std::to_string(getBoundPort()));
   return true;
}

void WebServer::stop() {
   if (!running_) {
       return;
   }

   running_ = false;

   // Unblocks stream readers so MHD can tear their connections down
   http_handler_->closeStreams();

   if (http_daemon_) {
       MHD_stop_daemon(http_daemon_);
       http_daemon_ = nullptr;
   }

   // A producer may still be inside a lookup; its next write fails and it returns
   http_handler_->waitForStreams();
   ENDPOINT_LOG_INFO("server", "HTTP server stopped");
}

int WebServer::getBoundPort() const {
   if (!http_daemon_) {
       return config_.port;
   }
   const union MHD_DaemonInfo* info = MHD_get_daemon_info(http_daemon_, MHD_DAEMON_INFO_BIND_PORT);
   if (!info || info->port == 0) {
       return config_.port;
   }
   return info->port;
}

void WebServer::addStructuredRouteHandler(const std::string& path, RouteProcessor processor) {
   http_handler_->addStructuredRouteHandler(path, processor);
}

void WebServer::addStreamingRouteHandler(const std::string& path, StreamingRouteProcessor processor) {
   http_handler_->addStreamingRouteHandler(path, processor);
}

// ======== HTTP REQUEST HANDLING ========

enum MHD_Result WebServer::accessHandlerCallback(void* cls, struct MHD_Connection* connection,
                                    const char* url, const char* method,
                                    const char* version, const char* upload_data,
                                    size_t* upload_data_size, void** con_cls) {

   WebServer* server = static_cast<WebServer*>(cls);
   return server->handleRequest(connection, url, method, upload_data, upload_data_size, con_cls);
}

void WebServer::requestCompletedCallback(void* cls, struct MHD_Connection* connection,
                                       void** con_cls, enum MHD_RequestTerminationCode toe) {
   if (con_cls && *con_cls != nullptr) {
       delete static_cast<ConnectionState*>(*con_cls);
       *con_cls = nullptr;
   }

   switch (toe) {
       case MHD_REQUEST_TERMINATED_COMPLETED_OK:
           break;
       case MHD_REQUEST_TERMINATED_WITH_ERROR:
           ENDPOINT_LOG_WARNING("http", "Request terminated with error - possible client disconnect");
           break;
       case MHD_REQUEST_TERMINATED_TIMEOUT_REACHED:
           ENDPOINT_LOG_WARNING("http", "Request terminated due to timeout");
           break;
       case MHD_REQUEST_TERMINATED_DAEMON_SHUTDOWN:
           ENDPOINT_LOG("http", "Request terminated due to server shutdown");
           break;
       case MHD_REQUEST_TERMINATED_CLIENT_ABORT:
           ENDPOINT_LOG("http", "Request terminated by client abort");
           break;
       default:
           ENDPOINT_LOG_WARNING("http", "Request terminated with unknown code: " + std::to_string(static_cast<int>(toe)));
           break;
   }
}

enum MHD_Result WebServer::handleRequest(struct MHD_Connection* connection,
                        const char* url, const char* method,
                        const char* upload_data, size_t* upload_data_size,
                        void** con_cls) {

   if (!connection || !url || !method) {
       return MHD_NO;
   }

   // First call only carries headers; allocate state and wait for the body
   if (nullptr == *con_cls) {
       *con_cls = new ConnectionState();
       return MHD_YES;
   }

   ConnectionState* state = static_cast<ConnectionState*>(*con_cls);
   return http_handler_->handleRequest(connection, url, method, upload_data, upload_data_size, *state);
}
