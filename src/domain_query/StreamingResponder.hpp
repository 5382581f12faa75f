#ifndef STREAMING_RESPONDER_H
#define STREAMING_RESPONDER_H

#include <string>
#include <vector>
#include <functional>
#include "DomainQueryTypes.hpp"
#include "WhoisLookupClient.hpp"

/**
 * Drives a candidate list through a DomainLookup and reports progress as
 * events: one "start", one "result" per completed lookup, then either a
 * "complete" summary or a single "error".
 *
 * The writer returns false once the consumer has gone away. That moves the
 * responder to ABORTED without raising; no further lookups are issued.
 */
class StreamingResponder {
public:
    enum class State {
        START,
        RUNNING,
        COMPLETED,
        ABORTED
    };

    using EventWriter = std::function<bool(const json& event)>;

    StreamingResponder(DomainLookup& client, std::vector<std::string> candidates);

    State run(const EventWriter& writer);

    State getState() const { return state_; }
    size_t getCompleted() const { return completed_; }
    size_t getTotal() const { return candidates_.size(); }
    const std::vector<std::string>& getUnregistered() const { return unregistered_; }

    static std::string stateToString(State state);

private:
    DomainLookup& client_;
    std::vector<std::string> candidates_;
    State state_;
    size_t completed_;
    std::vector<std::string> unregistered_;

    json makeStartEvent() const;
    json makeResultEvent(const LookupResult& result) const;
    json makeErrorEvent(const std::string& message) const;
    json makeCompleteEvent() const;
};

#endif // STREAMING_RESPONDER_H
