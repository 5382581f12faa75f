#ifndef SUFFIX_RESOLVER_H
#define SUFFIX_RESOLVER_H

#include <string>
#include <vector>
#include "DomainQueryTypes.hpp"

/**
 * Loads the list of enabled domain suffixes.
 *
 * Accepted documents:
 *   ["com", "io"]
 *   {"suffixes": ["com", {"suffix": ".NET", "enabled": false}]}
 *
 * Suffixes come back trimmed, without leading dots and lower-cased, in
 * document order. Duplicates are kept. An entry's "enabled" key defaults to
 * true; null, false, 0, "" and empty containers disable it. Throws ConfigError when the source is
 * missing or malformed, or when nothing is left enabled.
 */
class SuffixResolver {
public:
    static std::vector<std::string> resolveFile(const std::string& path);
    static std::vector<std::string> resolveDocument(const json& document);

    static std::string normalizeSuffix(const std::string& raw);
};

#endif // SUFFIX_RESOLVER_H
