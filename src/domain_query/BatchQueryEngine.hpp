#ifndef BATCH_QUERY_ENGINE_H
#define BATCH_QUERY_ENGINE_H

#include <string>
#include <vector>
#include <optional>
#include "DomainQueryTypes.hpp"
#include "WhoisLookupClient.hpp"

using TextInputs = std::vector<std::optional<std::string>>;

class BatchQueryEngine {
public:
    /**
     * Normalizes the inputs, resolves suffixes from suffixSourcePath and looks
     * every candidate up in order. Returns an empty list without touching the
     * suffix source when no fragment survives normalization. The first
     * ConfigError, ValidationError or LookupError aborts the whole batch.
     */
    static std::vector<LookupResult> runBatch(const TextInputs& inputs,
                                              const std::string& suffixSourcePath,
                                              DomainLookup& client);

    static std::vector<LookupResult> runBatch(const std::string& text,
                                              const std::string& suffixSourcePath,
                                              DomainLookup& client);

    // Empty when there are no fragments; otherwise resolves suffixes and combines.
    static std::vector<std::string> prepareCandidates(const TextInputs& inputs,
                                                      const std::string& suffixSourcePath);

    /**
     * Maps a request body {"text": "...", "lines": [...]} to normalizer inputs:
     * lines followed by text when both are present, otherwise whichever is
     * non-empty, otherwise an empty text.
     */
    static TextInputs inputsFromRequest(const json& body);
};

#endif // BATCH_QUERY_ENGINE_H
