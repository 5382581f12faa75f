#include "StreamingResponder.hpp"
#include "endpoint_logger.h"

StreamingResponder::StreamingResponder(DomainLookup& client, std::vector<std::string> candidates)
    : client_(client), candidates_(std::move(candidates)), state_(State::START), completed_(0) {}

StreamingResponder::State StreamingResponder::run(const EventWriter& writer) {
    if (state_ != State::START) {
        return state_;
    }

    if (!writer(makeStartEvent())) {
        ENDPOINT_LOG("stream", "Consumer disconnected before start event");
        state_ = State::ABORTED;
        return state_;
    }
    state_ = State::RUNNING;

    for (const auto& domain : candidates_) {
        LookupResult result;
        try {
            result = client_.lookup(domain);
        } catch (const DomainQueryError& e) {
            ENDPOINT_LOG_ERROR("stream", "Lookup failed after " + std::to_string(completed_) + "/" +
                               std::to_string(candidates_.size()) + ": " + e.what());
            if (!writer(makeErrorEvent(e.what()))) {
                ENDPOINT_LOG("stream", "Consumer disconnected before error event");
            }
            state_ = State::ABORTED;
            return state_;
        }

        completed_++;
        if (!result.isRegistered) {
            unregistered_.push_back(result.domain);
        }

        if (!writer(makeResultEvent(result))) {
            ENDPOINT_LOG("stream", "Consumer disconnected at " + std::to_string(completed_) + "/" +
                         std::to_string(candidates_.size()) + ", stopping lookups");
            state_ = State::ABORTED;
            return state_;
        }
    }

    state_ = State::COMPLETED;
    if (!writer(makeCompleteEvent())) {
        ENDPOINT_LOG("stream", "Consumer disconnected before complete event");
    }
    return state_;
}

std::string StreamingResponder::stateToString(State state) {
    switch (state) {
        case State::START: return "start";
        case State::RUNNING: return "running";
        case State::COMPLETED: return "completed";
        case State::ABORTED: return "aborted";
        default: return "unknown";
    }
}

json StreamingResponder::makeStartEvent() const {
    return json{{"type", "start"}, {"total", candidates_.size()}};
}

json StreamingResponder::makeResultEvent(const LookupResult& result) const {
    json event = result.toJson();
    event["type"] = "result";
    event["completed"] = completed_;
    event["total"] = candidates_.size();
    return event;
}

json StreamingResponder::makeErrorEvent(const std::string& message) const {
    return json{
        {"type", "error"},
        {"error", message},
        {"completed", completed_},
        {"total", candidates_.size()}
    };
}

json StreamingResponder::makeCompleteEvent() const {
    return json{
        {"type", "complete"},
        {"total", candidates_.size()},
        {"completed", completed_},
        {"unregistered", unregistered_}
    };
}
