#include "LineNormalizer.hpp"
#include <iostream>

static int failures = 0;

static void check(bool condition, const std::string& name) {
    std::cout << name << ": " << (condition ? "PASS" : "FAIL") << std::endl;
    if (!condition) {
        failures++;
    }
}

void testMixedLineEndings() {
    std::cout << "\n--- Test 1: Mixed line endings ---" << std::endl;
    auto fragments = LineNormalizer::normalize(std::string("example\n\n test  \r\nwhois.ai\rother"));
    check(fragments == std::vector<std::string>({"example", "test", "whois.ai", "other"}),
          "CRLF, CR and LF split in order");
}

void testBlankInput() {
    std::cout << "\n--- Test 2: Blank input ---" << std::endl;
    check(LineNormalizer::normalize(std::string("")).empty(), "Empty text yields nothing");
    check(LineNormalizer::normalize(std::string(" \t\r\n\n  \r")).empty(), "Whitespace-only text yields nothing");
}

void testDuplicatesKept() {
    std::cout << "\n--- Test 3: Duplicates ---" << std::endl;
    auto fragments = LineNormalizer::normalize(std::string("alpha\nalpha\n  alpha  "));
    check(fragments.size() == 3, "Duplicate lines are not collapsed");
}

void testMultipleBlobs() {
    std::cout << "\n--- Test 4: Several text blobs ---" << std::endl;
    std::vector<std::optional<std::string>> blobs = {
        std::string("one\ntwo"), std::nullopt, std::string(""), std::string("three\r\n")
    };
    auto fragments = LineNormalizer::normalize(blobs);
    check(fragments == std::vector<std::string>({"one", "two", "three"}),
          "Blobs are concatenated in order and absent ones skipped");

    // A line never spans two blobs
    std::vector<std::optional<std::string>> split = {std::string("al"), std::string("pha")};
    check(LineNormalizer::normalize(split).size() == 2, "Each blob is split independently");
}

void testTrim() {
    std::cout << "\n--- Test 5: Trim ---" << std::endl;
    check(LineNormalizer::trim("  a b \t") == "a b", "Inner whitespace survives");
    check(LineNormalizer::trim("   ").empty(), "All-space string trims to empty");
}

void testWideSpaces() {
    std::cout << "\n--- Test 6: Full-width and no-break spaces ---" << std::endl;
    const std::string ideographic = "\xE3\x80\x80";
    const std::string nbsp = "\xC2\xA0";

    check(LineNormalizer::trim(ideographic + "alpha" + ideographic) == "alpha", "Ideographic space stripped");
    check(LineNormalizer::trim(nbsp + " beta\t" + nbsp) == "beta", "No-break space stripped with ASCII space");
    check(LineNormalizer::trim("a" + ideographic + "b") == "a" + ideographic + "b", "Inner wide space survives");
    check(LineNormalizer::trim(ideographic + nbsp + ideographic).empty(), "Wide-space-only string trims to empty");

    // Same lead byte as U+3000 but a different character
    const std::string ideographicComma = "\xE3\x80\x81";
    check(LineNormalizer::trim(ideographicComma + "x") == ideographicComma + "x", "Other CJK punctuation kept");

    auto fragments = LineNormalizer::normalize(ideographic + "alpha\n" + nbsp + "\n\xE7\xA4\xBA\xE4\xBE\x8B" + ideographic);
    check(fragments == std::vector<std::string>({"alpha", "\xE7\xA4\xBA\xE4\xBE\x8B"}),
          "Pasted CJK lines normalize cleanly");
}

int main() {
    std::cout << "Testing LineNormalizer..." << std::endl;

    testMixedLineEndings();
    testBlankInput();
    testDuplicatesKept();
    testMultipleBlobs();
    testTrim();
    testWideSpaces();

    std::cout << "\n" << (failures == 0 ? "All tests passed" : std::to_string(failures) + " test(s) failed") << std::endl;
    return failures == 0 ? 0 : 1;
}
