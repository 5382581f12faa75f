#include "BatchQueryEngine.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <unistd.h>

static int failures = 0;

static void check(bool condition, const std::string& name) {
    std::cout << name << ": " << (condition ? "PASS" : "FAIL") << std::endl;
    if (!condition) {
        failures++;
    }
}

static std::string writeSuffixFile(const std::string& name, const std::string& content) {
    std::filesystem::path path = std::filesystem::temp_directory_path() /
        ("batch_query_" + std::to_string(getpid()) + "_" + name);
    std::ofstream out(path);
    out << content;
    return path.string();
}

// Absent entries show up as empty strings
static std::vector<std::string> flatten(const TextInputs& inputs) {
    std::vector<std::string> out;
    for (const auto& input : inputs) {
        out.push_back(input ? *input : "");
    }
    return out;
}

// Records every queried domain and reports all of them as unregistered
class RecordingLookup : public DomainLookup {
public:
    LookupResult lookup(const std::string& domain) override {
        domains.push_back(domain);
        if (domain == failOn) {
            throw LookupError("whois service returned an error: simulated");
        }
        LookupResult result;
        result.domain = domain;
        result.domainSuffix = domain.substr(domain.find_last_of('.') + 1);
        result.isRegistered = false;
        return result;
    }

    std::vector<std::string> domains;
    std::string failOn;
};

void testBatchOrder() {
    std::cout << "\n--- Test 1: Batch order ---" << std::endl;
    std::string path = writeSuffixFile("order.json", R"({"suffixes": ["com", "io"]})");
    RecordingLookup lookup;

    auto results = BatchQueryEngine::runBatch(TextInputs{std::string("alpha"), std::string("beta")}, path, lookup);
    std::vector<std::string> expected = {"alpha.com", "alpha.io", "beta.com", "beta.io"};

    std::vector<std::string> domains;
    for (const auto& result : results) {
        domains.push_back(result.domain);
    }
    check(domains == expected, "Results follow candidate order");
    check(lookup.domains == expected, "Lookups issued sequentially in candidate order");

    std::filesystem::remove(path);
}

void testEmptyInputSkipsSuffixes() {
    std::cout << "\n--- Test 2: Empty input ---" << std::endl;
    RecordingLookup lookup;
    auto results = BatchQueryEngine::runBatch(std::string(" \n\r\n "), "/nonexistent/suffixes.json", lookup);
    check(results.empty(), "Blank text yields no results");
    check(lookup.domains.empty(), "No lookups issued");
}

void testErrorsAbortBatch() {
    std::cout << "\n--- Test 3: Errors abort the batch ---" << std::endl;
    RecordingLookup lookup;
    bool configFailed = false;
    try {
        BatchQueryEngine::runBatch(std::string("alpha"), "/nonexistent/suffixes.json", lookup);
    } catch (const ConfigError&) {
        configFailed = true;
    }
    check(configFailed, "Missing suffix file raises ConfigError");

    std::string path = writeSuffixFile("abort.json", R"(["com"])");
    lookup.failOn = "beta.com";
    bool lookupFailed = false;
    try {
        BatchQueryEngine::runBatch(std::string("alpha\nbeta\ngamma"), path, lookup);
    } catch (const LookupError&) {
        lookupFailed = true;
    }
    check(lookupFailed, "Lookup failure propagates");
    check(lookup.domains == std::vector<std::string>({"alpha.com", "beta.com"}), "Nothing queried after the failure");

    std::filesystem::remove(path);
}

void testRequestInputs() {
    std::cout << "\n--- Test 4: Request body mapping ---" << std::endl;
    auto merged = flatten(BatchQueryEngine::inputsFromRequest(
        json::parse(R"({"text":"gamma","lines":["alpha", null, "beta"]})")));
    check(merged == std::vector<std::string>({"alpha", "", "beta", "gamma"}), "Lines come before text");

    auto textOnly = BatchQueryEngine::inputsFromRequest(json::parse(R"({"text":"alpha\nbeta"})"));
    check(textOnly.size() == 1 && textOnly[0] && *textOnly[0] == "alpha\nbeta", "Text only");

    auto linesOnly = BatchQueryEngine::inputsFromRequest(json::parse(R"({"lines":["alpha"],"text":""})"));
    check(linesOnly.size() == 1 && linesOnly[0] && *linesOnly[0] == "alpha", "Empty text is not appended");

    auto neither = BatchQueryEngine::inputsFromRequest(json::parse(R"({})"));
    check(neither.size() == 1 && neither[0] && neither[0]->empty(), "Neither field gives empty text");
}

int main() {
    std::cout << "Testing BatchQueryEngine..." << std::endl;

    testBatchOrder();
    testEmptyInputSkipsSuffixes();
    testErrorsAbortBatch();
    testRequestInputs();

    std::cout << "\n" << (failures == 0 ? "All tests passed" : std::to_string(failures) + " test(s) failed") << std::endl;
    return failures == 0 ? 0 : 1;
}
