#pragma once

#include <string>
#include <memory>
#include <functional>
#include <nlohmann/json.hpp>
#include "api_request.h"
#include "domain_query/WhoisLookupClient.hpp"

using json = nlohmann::json;

/**
 * Domain availability endpoints:
 * - POST /domain-query/batch         all results in one JSON document
 * - POST /domain-query/batch-stream  newline-delimited progress events
 *
 * Both take {"text": "...", "lines": [...]} and combine every fragment with
 * the suffixes from the configured suffix file.
 */
class DomainQueryRouter {
public:
    using StructuredRouteHandler = std::function<ApiResponse(const ApiRequest&)>;
    using StreamingRouteHandler = std::function<StreamingApiResponse(const ApiRequest&)>;

    DomainQueryRouter(std::shared_ptr<DomainLookup> lookup, const std::string& suffix_config_path);
    ~DomainQueryRouter() = default;

    void registerRoutes(std::function<void(const std::string&, StructuredRouteHandler)> addStructuredRouteHandler,
                       std::function<void(const std::string&, StreamingRouteHandler)> addStreamingRouteHandler);

    ApiResponse handleBatch(const ApiRequest& request);
    StreamingApiResponse handleBatchStream(const ApiRequest& request);

private:
    std::shared_ptr<DomainLookup> lookup_;
    std::string suffix_config_path_;

    // Empty string when the body is acceptable, otherwise the error message
    std::string validateRequestBody(const ApiRequest& request) const;
};
