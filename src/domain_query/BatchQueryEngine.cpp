#include "BatchQueryEngine.hpp"
#include "LineNormalizer.hpp"
#include "SuffixResolver.hpp"
#include "DomainCombiner.hpp"
#include "endpoint_logger.h"

std::vector<LookupResult> BatchQueryEngine::runBatch(const TextInputs& inputs,
                                                     const std::string& suffixSourcePath,
                                                     DomainLookup& client) {
    std::vector<std::string> candidates = prepareCandidates(inputs, suffixSourcePath);
    if (candidates.empty()) {
        return {};
    }

    ENDPOINT_LOG_INFO("domain-query", "Running batch of " + std::to_string(candidates.size()) + " candidates");

    std::vector<LookupResult> results;
    results.reserve(candidates.size());
    for (const auto& domain : candidates) {
        results.push_back(client.lookup(domain));
    }
    return results;
}

std::vector<LookupResult> BatchQueryEngine::runBatch(const std::string& text,
                                                     const std::string& suffixSourcePath,
                                                     DomainLookup& client) {
    return runBatch(TextInputs{text}, suffixSourcePath, client);
}

std::vector<std::string> BatchQueryEngine::prepareCandidates(const TextInputs& inputs,
                                                             const std::string& suffixSourcePath) {
    std::vector<std::string> fragments = LineNormalizer::normalize(inputs);
    if (fragments.empty()) {
        return {};
    }

    std::vector<std::string> suffixes = SuffixResolver::resolveFile(suffixSourcePath);
    return DomainCombiner::buildCandidates(fragments, suffixes);
}

TextInputs BatchQueryEngine::inputsFromRequest(const json& body) {
    std::string text;
    auto text_it = body.find("text");
    if (text_it != body.end() && text_it->is_string()) {
        text = text_it->get<std::string>();
    }

    TextInputs lines;
    auto lines_it = body.find("lines");
    if (lines_it != body.end() && lines_it->is_array()) {
        for (const auto& line : *lines_it) {
            if (line.is_null()) {
                lines.emplace_back(std::nullopt);
            } else if (line.is_string()) {
                lines.emplace_back(line.get<std::string>());
            } else {
                lines.emplace_back(line.dump());
            }
        }
    }

    if (!lines.empty()) {
        if (!text.empty()) {
            lines.emplace_back(text);
        }
        return lines;
    }
    return TextInputs{text};
}
