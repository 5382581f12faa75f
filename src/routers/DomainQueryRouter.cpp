#include "DomainQueryRouter.h"
#include "endpoint_logger.h"
#include "stream_channel.h"
#include "domain_query/BatchQueryEngine.hpp"
#include "domain_query/StreamingResponder.hpp"

static const char* NO_FRAGMENTS_MESSAGE = "No valid domain fragments";

DomainQueryRouter::DomainQueryRouter(std::shared_ptr<DomainLookup> lookup, const std::string& suffix_config_path)
    : lookup_(std::move(lookup)), suffix_config_path_(suffix_config_path) {
}

void DomainQueryRouter::registerRoutes(std::function<void(const std::string&, StructuredRouteHandler)> addStructuredRouteHandler,
                                       std::function<void(const std::string&, StreamingRouteHandler)> addStreamingRouteHandler) {
    ENDPOINT_LOG("domain-query", "DomainQueryRouter: Registering domain query routes...");

    addStructuredRouteHandler("/domain-query/batch", [this](const ApiRequest& request) {
        return this->handleBatch(request);
    });

    addStreamingRouteHandler("/domain-query/batch-stream", [this](const ApiRequest& request) {
        return this->handleBatchStream(request);
    });

    ENDPOINT_LOG("domain-query", "DomainQueryRouter: Using suffix configuration " + suffix_config_path_);
}

std::string DomainQueryRouter::validateRequestBody(const ApiRequest& request) const {
    if (request.body.empty()) {
        return "Request body is required";
    }
    if (!request.is_json_valid) {
        return "Invalid JSON format";
    }
    if (!request.json_data.is_object()) {
        return "Request body must be a JSON object";
    }

    auto text_it = request.json_data.find("text");
    if (text_it != request.json_data.end() && !text_it->is_null() && !text_it->is_string()) {
        return "Field 'text' must be a string";
    }

    auto lines_it = request.json_data.find("lines");
    if (lines_it != request.json_data.end() && !lines_it->is_null() && !lines_it->is_array()) {
        return "Field 'lines' must be an array";
    }
    return "";
}

ApiResponse DomainQueryRouter::handleBatch(const ApiRequest& request) {
    ApiResponse response;

    if (request.method != "POST") {
        response.setErrorResponse("Method not allowed", 405);
        return response;
    }

    std::string invalid = validateRequestBody(request);
    if (!invalid.empty()) {
        response.setErrorResponse(invalid);
        return response;
    }

    try {
        TextInputs inputs = BatchQueryEngine::inputsFromRequest(request.json_data);
        std::vector<LookupResult> results = BatchQueryEngine::runBatch(inputs, suffix_config_path_, *lookup_);
        if (results.empty()) {
            response.setErrorResponse(NO_FRAGMENTS_MESSAGE);
            return response;
        }

        json items = json::array();
        for (const auto& result : results) {
            items.push_back(result.toJson());
        }
        ENDPOINT_LOG_INFO("domain-query", "Batch " + request.request_id + " returned " +
                          std::to_string(results.size()) + " results");
        response.setJsonResponse(json{{"items", items}});
    } catch (const DomainQueryError& e) {
        ENDPOINT_LOG_ERROR("domain-query", "Batch " + request.request_id + " failed: " + e.what());
        response.setErrorResponse(e.what());
    }
    return response;
}

StreamingApiResponse DomainQueryRouter::handleBatchStream(const ApiRequest& request) {
    StreamingApiResponse stream;

    if (request.method != "POST") {
        stream.immediate.setErrorResponse("Method not allowed", 405);
        return stream;
    }

    std::string invalid = validateRequestBody(request);
    if (!invalid.empty()) {
        stream.immediate.setErrorResponse(invalid);
        return stream;
    }

    // Suffix and combination problems are reported before any byte is streamed
    std::vector<std::string> candidates;
    try {
        TextInputs inputs = BatchQueryEngine::inputsFromRequest(request.json_data);
        candidates = BatchQueryEngine::prepareCandidates(inputs, suffix_config_path_);
    } catch (const DomainQueryError& e) {
        ENDPOINT_LOG_ERROR("domain-query", "Stream " + request.request_id + " rejected: " + e.what());
        stream.immediate.setErrorResponse(e.what());
        return stream;
    }

    if (candidates.empty()) {
        stream.immediate.setErrorResponse(NO_FRAGMENTS_MESSAGE);
        return stream;
    }

    ENDPOINT_LOG_INFO("domain-query", "Stream " + request.request_id + " will check " +
                      std::to_string(candidates.size()) + " candidates");

    std::shared_ptr<DomainLookup> lookup = lookup_;
    std::string request_id = request.request_id;
    stream.producer = [lookup, candidates, request_id](const std::shared_ptr<StreamChannel>& channel) {
        StreamingResponder responder(*lookup, candidates);
        StreamingResponder::State state = responder.run([&channel](const json& event) {
            return channel->write(event.dump() + "\n");
        });
        ENDPOINT_LOG("stream", "Stream " + request_id + " ended " + StreamingResponder::stateToString(state) +
                     " after " + std::to_string(responder.getCompleted()) + "/" +
                     std::to_string(responder.getTotal()));
    };
    return stream;
}
