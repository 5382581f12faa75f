#ifndef DOMAIN_COMBINER_H
#define DOMAIN_COMBINER_H

#include <string>
#include <vector>
#include "DomainQueryTypes.hpp"

class DomainCombiner {
public:
    // Throws ValidationError if either operand is empty once dots are trimmed.
    static std::string combine(const std::string& base, const std::string& suffix);

    // Outer product, fragment-major: a.com, a.io, b.com, b.io
    static std::vector<std::string> buildCandidates(const std::vector<std::string>& fragments,
                                                    const std::vector<std::string>& suffixes);
};

#endif // DOMAIN_COMBINER_H
