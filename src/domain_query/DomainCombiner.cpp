#include "DomainCombiner.hpp"
#include "LineNormalizer.hpp"

std::string DomainCombiner::combine(const std::string& base, const std::string& suffix) {
    std::string cleanBase = LineNormalizer::trim(base);
    size_t first = cleanBase.find_first_not_of('.');
    size_t last = cleanBase.find_last_not_of('.');
    cleanBase = (first == std::string::npos) ? "" : cleanBase.substr(first, last - first + 1);

    std::string cleanSuffix = LineNormalizer::trim(suffix);
    size_t suffixStart = cleanSuffix.find_first_not_of('.');
    cleanSuffix = (suffixStart == std::string::npos) ? "" : cleanSuffix.substr(suffixStart);

    if (cleanBase.empty() || cleanSuffix.empty()) {
        throw ValidationError("Base fragment or suffix is empty, cannot build a domain");
    }
    return cleanBase + "." + cleanSuffix;
}

std::vector<std::string> DomainCombiner::buildCandidates(const std::vector<std::string>& fragments,
                                                         const std::vector<std::string>& suffixes) {
    std::vector<std::string> candidates;
    candidates.reserve(fragments.size() * suffixes.size());
    for (const auto& fragment : fragments) {
        for (const auto& suffix : suffixes) {
            candidates.push_back(combine(fragment, suffix));
        }
    }
    return candidates;
}
