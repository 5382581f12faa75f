#include "DomainQueryRouter.h"
#include "utils_router.h"
#include "web_server.h"
#include <curl/curl.h>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <atomic>
#include <thread>
#include <chrono>
#include <unistd.h>

static int failures = 0;

static void check(bool condition, const std::string& name) {
    std::cout << name << ": " << (condition ? "PASS" : "FAIL") << std::endl;
    if (!condition) {
        failures++;
    }
}

// Reports every domain as unregistered, optionally slowly
class StubLookup : public DomainLookup {
public:
    LookupResult lookup(const std::string& domain) override {
        calls++;
        inFlight++;
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        inFlight--;
        if (domain == failOn) {
            throw LookupError("whois service returned an error: stub failure");
        }
        LookupResult result;
        result.domain = domain;
        result.domainSuffix = domain.substr(domain.find_last_of('.') + 1);
        result.isRegistered = false;
        result.queryTime = std::string("2024-05-01 10:00:00");
        return result;
    }

    std::atomic<int> calls{0};
    std::atomic<int> inFlight{0};
    int delay_ms = 0;
    std::string failOn;
};

struct HttpResult {
    long status = 0;
    std::string body;
    std::string content_type;
    CURLcode code = CURLE_OK;
};

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

// Keeps the first line and then aborts the transfer
static size_t FirstLineCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* received = static_cast<std::string*>(userp);
    received->append((char*)contents, size * nmemb);
    if (received->find('\n') != std::string::npos) {
        return 0;
    }
    return size * nmemb;
}

static HttpResult request(const std::string& url, const std::string& method, const std::string& body,
                          bool stopAfterFirstLine = false) {
    HttpResult result;
    CURL* curl = curl_easy_init();
    if (!curl) {
        result.code = CURLE_FAILED_INIT;
        return result;
    }

    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stopAfterFirstLine ? FirstLineCallback : WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);

    result.code = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);
    char* content_type = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        result.content_type = content_type;
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return result;
}

static std::vector<json> parseEvents(const std::string& body) {
    std::vector<json> events;
    std::istringstream stream(body);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            events.push_back(json::parse(line));
        }
    }
    return events;
}

static std::string errorOf(const HttpResult& result) {
    json parsed = json::parse(result.body, nullptr, false);
    if (parsed.is_object() && parsed.contains("error") && parsed["error"].is_string()) {
        return parsed["error"].get<std::string>();
    }
    return "";
}

class ServerFixture {
public:
    ServerFixture(std::shared_ptr<StubLookup> lookup, const std::string& suffix_path)
        : router_(lookup, suffix_path) {
        ServerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.suffix_config_path = suffix_path;
        server_.setConfig(config);

        utils_.registerRoutes([this](const std::string& path, UtilsRouter::StructuredRouteHandler handler) {
            server_.addStructuredRouteHandler(path, handler);
        });
        router_.registerRoutes(
            [this](const std::string& path, DomainQueryRouter::StructuredRouteHandler handler) {
                server_.addStructuredRouteHandler(path, handler);
            },
            [this](const std::string& path, DomainQueryRouter::StreamingRouteHandler handler) {
                server_.addStreamingRouteHandler(path, handler);
            });
        started_ = server_.start();
    }

    bool started() const { return started_; }
    void stop() { server_.stop(); }
    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(server_.getBoundPort()) + path;
    }

private:
    UtilsRouter utils_;
    DomainQueryRouter router_;
    // Declared last so the daemon stops before the routers go away
    WebServer server_;
    bool started_ = false;
};

void testBatchEndpoint(ServerFixture& fixture) {
    std::cout << "\n--- Test 1: Batch endpoint ---" << std::endl;
    HttpResult result = request(fixture.url("/domain-query/batch"), "POST", R"({"text":"alpha"})");
    check(result.status == 200, "Batch returns 200");

    json body = json::parse(result.body, nullptr, false);
    bool shaped = body.is_object() && body.contains("items") && body["items"].is_array() && body["items"].size() == 1;
    check(shaped, "Batch returns one item");
    if (shaped) {
        const json& item = body["items"][0];
        check(item["domain"] == "alpha.com" && item["domain_suffix"] == "com", "Item carries the domain");
        check(item["is_registered"] == false, "Item reports unregistered");
        check(item["query_time"] == "2024-05-01 10:00:00", "Item carries query time");
    }

    HttpResult merged = request(fixture.url("/domain-query/batch"), "POST",
                                R"({"lines":["beta"],"text":"gamma"})");
    json mergedBody = json::parse(merged.body, nullptr, false);
    check(merged.status == 200 && mergedBody["items"].size() == 2 &&
          mergedBody["items"][0]["domain"] == "beta.com" && mergedBody["items"][1]["domain"] == "gamma.com",
          "Lines are queried before text");
}

void testBatchErrors(ServerFixture& fixture) {
    std::cout << "\n--- Test 2: Batch errors ---" << std::endl;
    HttpResult empty = request(fixture.url("/domain-query/batch"), "POST", R"({"text":"  \n "})");
    check(empty.status == 400 && errorOf(empty) == "No valid domain fragments", "Blank text rejected");

    HttpResult invalid = request(fixture.url("/domain-query/batch"), "POST", "{not json");
    check(invalid.status == 400 && !errorOf(invalid).empty(), "Invalid JSON rejected");

    HttpResult noBody = request(fixture.url("/domain-query/batch"), "POST", "");
    check(noBody.status == 400, "Empty body rejected");

    HttpResult wrongType = request(fixture.url("/domain-query/batch"), "POST", R"({"text":42})");
    check(wrongType.status == 400, "Non-string text rejected");

    HttpResult failing = request(fixture.url("/domain-query/batch"), "POST", R"({"text":"broken"})");
    check(failing.status == 400 && errorOf(failing) == "whois service returned an error: stub failure",
          "Lookup failure becomes an error payload");

    HttpResult wrongMethod = request(fixture.url("/domain-query/batch"), "GET", "");
    check(wrongMethod.status == 405, "GET on batch is 405");

    HttpResult unknown = request(fixture.url("/nope"), "GET", "");
    check(unknown.status == 404 && errorOf(unknown) == "Not Found", "Unknown route is 404");
}

void testStreamEndpoint(ServerFixture& fixture) {
    std::cout << "\n--- Test 3: Stream endpoint ---" << std::endl;
    HttpResult result = request(fixture.url("/domain-query/batch-stream"), "POST", R"({"text":"alpha"})");
    check(result.status == 200, "Stream returns 200");
    check(result.content_type.find("application/x-ndjson") == 0, "Stream is NDJSON");

    std::vector<json> events = parseEvents(result.body);
    check(events.size() == 3, "start, result, complete");
    if (events.size() == 3) {
        check(events[0]["type"] == "start" && events[0]["total"] == 1, "start event");
        check(events[1]["type"] == "result" && events[1]["domain"] == "alpha.com" &&
              events[1]["completed"] == 1 && events[1]["total"] == 1, "result event");
        check(events[2]["type"] == "complete" && events[2]["unregistered"] == json::array({"alpha.com"}),
              "complete event");
    }

    HttpResult failing = request(fixture.url("/domain-query/batch-stream"), "POST", R"({"text":"alpha\nbroken"})");
    std::vector<json> failEvents = parseEvents(failing.body);
    check(failing.status == 200 && !failEvents.empty() && failEvents.back()["type"] == "error",
          "Lookup failure ends the stream with an error event");

    HttpResult empty = request(fixture.url("/domain-query/batch-stream"), "POST", R"({"lines":[]})");
    check(empty.status == 400 && errorOf(empty) == "No valid domain fragments", "Empty stream request rejected");
}

void testHealth(ServerFixture& fixture) {
    std::cout << "\n--- Test 4: Health ---" << std::endl;
    HttpResult result = request(fixture.url("/api/health"), "GET", "");
    json body = json::parse(result.body, nullptr, false);
    check(result.status == 200 && body.is_object() && body["status"] == "ok", "Health reports ok");
}

void testStreamDisconnect(const std::string& suffix_path) {
    std::cout << "\n--- Test 5: Client disconnect stops lookups ---" << std::endl;
    auto lookup = std::make_shared<StubLookup>();
    lookup->delay_ms = 25;
    ServerFixture fixture(lookup, suffix_path);
    check(fixture.started(), "Second server started");

    std::string text;
    for (int i = 0; i < 40; i++) {
        text += "name" + std::to_string(i) + "\n";
    }
    json body = {{"text", text}};
    HttpResult result = request(fixture.url("/domain-query/batch-stream"), "POST", body.dump(), true);
    check(result.code == CURLE_WRITE_ERROR, "Client aborted after the first line");

    // Wait past the time the full run would take
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    int calls = lookup->calls;
    check(calls < 40, "Lookups stopped early (" + std::to_string(calls) + "/40)");
}

void testShutdownWaitsForStreams(const std::string& suffix_path) {
    std::cout << "\n--- Test 6: Shutdown waits for stream producers ---" << std::endl;
    auto lookup = std::make_shared<StubLookup>();
    lookup->delay_ms = 200;
    ServerFixture fixture(lookup, suffix_path);
    check(fixture.started(), "Third server started");

    std::string text;
    for (int i = 0; i < 40; i++) {
        text += "slow" + std::to_string(i) + "\n";
    }
    json body = {{"text", text}};
    std::string url = fixture.url("/domain-query/batch-stream");
    HttpResult result;
    std::thread client([&result, url, body]() {
        result = request(url, "POST", body.dump());
    });

    for (int i = 0; i < 100 && lookup->calls < 2; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    check(lookup->calls >= 2, "Stream is producing");

    fixture.stop();
    int callsAtStop = lookup->calls;
    check(lookup->inFlight == 0, "No lookup running once stop returns");

    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    check(lookup->calls == callsAtStop, "No lookup starts after stop");
    check(callsAtStop < 40, "Stream was cut short (" + std::to_string(callsAtStop) + "/40)");

    client.join();
    check(result.body.find("\"type\":\"start\"") != std::string::npos &&
          result.body.find("\"type\":\"complete\"") == std::string::npos,
          "Client saw the stream start but never a complete event");
}

int main() {
    std::cout << "Testing domain query HTTP server..." << std::endl;
    curl_global_init(CURL_GLOBAL_DEFAULT);

    std::filesystem::path suffix_path = std::filesystem::temp_directory_path() /
        ("server_suffixes_" + std::to_string(getpid()) + ".json");
    {
        std::ofstream out(suffix_path);
        out << R"(["com"])";
    }

    {
        auto lookup = std::make_shared<StubLookup>();
        lookup->failOn = "broken.com";
        ServerFixture fixture(lookup, suffix_path.string());
        check(fixture.started(), "Server started on an ephemeral port");
        if (fixture.started()) {
            testBatchEndpoint(fixture);
            testBatchErrors(fixture);
            testStreamEndpoint(fixture);
            testHealth(fixture);
        }
    }

    testStreamDisconnect(suffix_path.string());
    testShutdownWaitsForStreams(suffix_path.string());

    std::filesystem::remove(suffix_path);
    curl_global_cleanup();

    std::cout << "\n" << (failures == 0 ? "All tests passed" : std::to_string(failures) + " test(s) failed") << std::endl;
    return failures == 0 ? 0 : 1;
}
