#ifndef CURL_WHOIS_TRANSPORT_H
#define CURL_WHOIS_TRANSPORT_H

#include <string>
#include "WhoisLookupClient.hpp"

/**
 * libcurl GET against a templated whois endpoint.
 * The "{domain}" placeholder in the template receives the URL-escaped domain.
 * curl_global_init() must have been called once by the process.
 */
class CurlWhoisTransport : public WhoisTransport {
public:
    static constexpr const char* DEFAULT_ENDPOINT = "https://api.whoiscx.com/whois/?domain={domain}";

    explicit CurlWhoisTransport(const std::string& endpointTemplate = DEFAULT_ENDPOINT);

    std::string fetch(const std::string& domain, int timeoutSeconds) override;

    std::string buildRequestUrl(const std::string& domain) const;

private:
    std::string endpointTemplate_;
};

#endif // CURL_WHOIS_TRANSPORT_H
