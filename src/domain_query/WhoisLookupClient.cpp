#include "WhoisLookupClient.hpp"
#include "endpoint_logger.h"
#include <thread>
#include <chrono>
#include <algorithm>
#include <cctype>

// Throttling hints seen in upstream error messages, matched case-insensitively
const std::vector<std::string> WhoisLookupClient::rateLimitTokens_ = {
    "rate", "limit", "频次", "超限"
};

WhoisLookupClient::WhoisLookupClient(std::shared_ptr<WhoisTransport> transport, const ClientPolicy& policy)
    : transport_(std::move(transport)), policy_(clampPolicy(policy)) {
    ENDPOINT_LOG("whois", "WhoisLookupClient initialized (timeout=" + std::to_string(policy_.timeoutSeconds) +
                 "s, max_retries=" + std::to_string(policy_.maxRetries) +
                 ", respect_rate_limit=" + (policy_.respectRateLimit ? "true" : "false") + ")");
}

void WhoisLookupClient::setPolicy(const ClientPolicy& policy) {
    policy_ = clampPolicy(policy);
}

LookupResult WhoisLookupClient::lookup(const std::string& domain) {
    if (!transport_) {
        throw LookupError("whois transport not configured");
    }

    std::string lastMessage = "unknown reason";
    for (int attempt = 0; attempt <= policy_.maxRetries; attempt++) {
        std::string body = transport_->fetch(domain, policy_.timeoutSeconds);

        json payload;
        try {
            payload = json::parse(body);
        } catch (const json::parse_error&) {
            throw LookupError("whois service returned non-JSON data");
        }

        if (isSuccessStatus(payload)) {
            return buildResult(domain, payload);
        }

        lastMessage = extractErrorMessage(payload);
        if (decideRetry(policy_, attempt, lastMessage) == RetryDecision::RETRY_AFTER_DELAY) {
            ENDPOINT_LOG_WARNING("whois", "Rate limited while querying " + domain + " (attempt " +
                                 std::to_string(attempt + 1) + "), retrying: " + lastMessage);
            if (policy_.retryDelaySeconds > 0) {
                std::this_thread::sleep_for(std::chrono::duration<double>(policy_.retryDelaySeconds));
            }
            continue;
        }
        break;
    }

    ENDPOINT_LOG_ERROR("whois", "Lookup failed for " + domain + ": " + lastMessage);
    throw LookupError("whois service returned an error: " + lastMessage);
}

WhoisLookupClient::RetryDecision WhoisLookupClient::decideRetry(const ClientPolicy& policy, int attempt,
                                                                const std::string& errorMessage) {
    if (!policy.respectRateLimit) {
        return RetryDecision::FAIL;
    }
    if (attempt >= policy.maxRetries) {
        return RetryDecision::FAIL;
    }
    return isRateLimited(errorMessage) ? RetryDecision::RETRY_AFTER_DELAY : RetryDecision::FAIL;
}

bool WhoisLookupClient::isRateLimited(const std::string& errorMessage) {
    std::string normalized = errorMessage;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& token : rateLimitTokens_) {
        if (normalized.find(token) != std::string::npos) {
            return true;
        }
    }
    return false;
}

LookupResult WhoisLookupClient::buildResult(const std::string& queriedDomain, const json& payload) {
    json data = json::object();
    auto data_it = payload.find("data");
    if (data_it != payload.end() && data_it->is_object()) {
        data = *data_it;
    }

    auto stringField = [&data](const char* key) -> std::string {
        auto it = data.find(key);
        return (it != data.end() && it->is_string()) ? it->get<std::string>() : std::string();
    };

    LookupResult result;

    std::string reportedDomain = stringField("domain");
    result.domain = reportedDomain.empty() ? queriedDomain : reportedDomain;

    std::string reportedSuffix = stringField("domain_suffix");
    if (reportedSuffix.empty()) {
        size_t dot = queriedDomain.find_last_of('.');
        reportedSuffix = (dot == std::string::npos) ? queriedDomain : queriedDomain.substr(dot + 1);
    }
    result.domainSuffix = reportedSuffix;

    // is_available == 0 means the name is taken; a missing flag is not a verdict
    auto available_it = data.find("is_available");
    if (available_it == data.end() || available_it->is_null()) {
        throw LookupError("whois response for " + queriedDomain + " is missing is_available");
    }
    if (available_it->is_boolean()) {
        result.isRegistered = !available_it->get<bool>();
    } else if (available_it->is_number()) {
        result.isRegistered = (available_it->get<double>() == 0);
    } else {
        throw LookupError("whois response for " + queriedDomain + " has a malformed is_available value");
    }

    auto time_it = data.find("query_time");
    if (time_it != data.end() && !time_it->is_null()) {
        result.queryTime = time_it->is_string() ? time_it->get<std::string>() : time_it->dump();
    }

    return result;
}

std::string WhoisLookupClient::extractErrorMessage(const json& payload) {
    if (payload.is_object()) {
        auto error_it = payload.find("error");
        if (error_it != payload.end() && error_it->is_string() && !error_it->get<std::string>().empty()) {
            return error_it->get<std::string>();
        }
    }
    return payload.dump();
}

WhoisLookupClient::ClientPolicy WhoisLookupClient::clampPolicy(const ClientPolicy& policy) {
    ClientPolicy clamped = policy;
    clamped.maxRetries = std::max(0, clamped.maxRetries);
    clamped.retryDelaySeconds = std::max(0.0, clamped.retryDelaySeconds);
    if (clamped.timeoutSeconds < 1) {
        clamped.timeoutSeconds = 1;
    }
    return clamped;
}

bool WhoisLookupClient::isSuccessStatus(const json& payload) {
    if (!payload.is_object()) {
        return false;
    }
    auto status_it = payload.find("status");
    if (status_it == payload.end()) {
        return false;
    }
    if (status_it->is_number()) {
        return status_it->get<double>() == 1;
    }
    return status_it->is_boolean() && status_it->get<bool>();
}
