#include "utils_router.h"
#include "endpoint_logger.h"

UtilsRouter::UtilsRouter() : started_at_(std::chrono::steady_clock::now()) {
}

void UtilsRouter::registerRoutes(std::function<void(const std::string&, StructuredRouteHandler)> addStructuredRouteHandler) {
    ENDPOINT_LOG("server", "UtilsRouter: Registering utility routes...");

    addStructuredRouteHandler("/api/health", [this](const ApiRequest& request) {
        return this->handleHealthStructured(request);
    });

    ENDPOINT_LOG("server", "UtilsRouter: Utility routes registered successfully");
}

ApiResponse UtilsRouter::handleHealthStructured(const ApiRequest& request) {
    ApiResponse response;

    if (request.method != "GET") {
        response.setErrorResponse("Method not allowed", 405);
        return response;
    }

    json health;
    health["status"] = "ok";
    health["message"] = "Server is healthy";
    health["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    health["uptime_seconds"] = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_).count();
    health["request_id"] = request.request_id;

    response.setJsonResponse(health);
    return response;
}
