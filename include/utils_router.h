#pragma once

#include <string>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include "api_request.h"

using json = nlohmann::json;

/**
 * Utilities Router
 * Handles utility endpoints:
 * - /api/health
 */
class UtilsRouter {
public:
    using StructuredRouteHandler = std::function<ApiResponse(const ApiRequest&)>;

    UtilsRouter();
    ~UtilsRouter() = default;

    void registerRoutes(std::function<void(const std::string&, StructuredRouteHandler)> addStructuredRouteHandler);

private:
    std::chrono::steady_clock::time_point started_at_;

    ApiResponse handleHealthStructured(const ApiRequest& request);
};
