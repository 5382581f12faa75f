#ifndef WHOIS_LOOKUP_CLIENT_H
#define WHOIS_LOOKUP_CLIENT_H

#include <string>
#include <vector>
#include <memory>
#include "DomainQueryTypes.hpp"

/**
 * Anything that can turn a domain into a LookupResult.
 * The batch and streaming paths depend on this seam only, so tests and
 * alternative backends can stand in for the remote service.
 */
class DomainLookup {
public:
    virtual ~DomainLookup() = default;
    virtual LookupResult lookup(const std::string& domain) = 0;
};

/**
 * Raw transport to the whois HTTP API. Returns the response body for one GET.
 * Network failures are reported as LookupError.
 */
class WhoisTransport {
public:
    virtual ~WhoisTransport() = default;
    virtual std::string fetch(const std::string& domain, int timeoutSeconds) = 0;
};

class WhoisLookupClient : public DomainLookup {
public:
    struct ClientPolicy {
        int timeoutSeconds = 10;
        int maxRetries = 1;
        double retryDelaySeconds = 2.0;
        bool respectRateLimit = true;
    };

    enum class RetryDecision {
        RETRY_AFTER_DELAY,
        FAIL
    };

    WhoisLookupClient(std::shared_ptr<WhoisTransport> transport, const ClientPolicy& policy);
    ~WhoisLookupClient() override = default;

    LookupResult lookup(const std::string& domain) override;

    // Not safe while a lookup is in flight on this instance.
    void setPolicy(const ClientPolicy& policy);
    const ClientPolicy& getPolicy() const { return policy_; }

    // attempt is zero-based; attempt 0 is the first request.
    static RetryDecision decideRetry(const ClientPolicy& policy, int attempt, const std::string& errorMessage);
    static bool isRateLimited(const std::string& errorMessage);

    // Interprets one decoded {status, data, error} envelope for a successful status.
    static LookupResult buildResult(const std::string& queriedDomain, const json& payload);
    static std::string extractErrorMessage(const json& payload);

private:
    std::shared_ptr<WhoisTransport> transport_;
    ClientPolicy policy_;

    static ClientPolicy clampPolicy(const ClientPolicy& policy);
    static bool isSuccessStatus(const json& payload);

    static const std::vector<std::string> rateLimitTokens_;
};

#endif // WHOIS_LOOKUP_CLIENT_H
