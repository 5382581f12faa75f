#include "CurlWhoisTransport.hpp"
#include "endpoint_logger.h"
#include <curl/curl.h>

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CurlWhoisTransport::CurlWhoisTransport(const std::string& endpointTemplate)
    : endpointTemplate_(endpointTemplate.empty() ? DEFAULT_ENDPOINT : endpointTemplate) {}

std::string CurlWhoisTransport::buildRequestUrl(const std::string& domain) const {
    std::string escaped = domain;
    CURL* curl = curl_easy_init();
    if (curl) {
        char* encoded = curl_easy_escape(curl, domain.c_str(), static_cast<int>(domain.length()));
        if (encoded) {
            escaped = encoded;
            curl_free(encoded);
        }
        curl_easy_cleanup(curl);
    }

    std::string url = endpointTemplate_;
    const std::string placeholder = "{domain}";
    size_t pos = url.find(placeholder);
    if (pos == std::string::npos) {
        return url + escaped;
    }
    url.replace(pos, placeholder.length(), escaped);
    return url;
}

std::string CurlWhoisTransport::fetch(const std::string& domain, int timeoutSeconds) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw LookupError("whois lookup failed: unable to initialize CURL");
    }

    std::string url = buildRequestUrl(domain);
    std::string response;

    ENDPOINT_LOG("whois", "GET " + url + " (timeout " + std::to_string(timeoutSeconds) + "s)");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "domain-query-server/1.0");

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw LookupError("whois lookup failed: " + std::string(curl_easy_strerror(res)));
    }
    if (http_code >= 400) {
        throw LookupError("whois lookup failed: HTTP " + std::to_string(http_code));
    }

    return response;
}
