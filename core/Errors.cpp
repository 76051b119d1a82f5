#include "Errors.hpp"
#include <iostream>
#include <unordered_map>

namespace iotagent {

std::string errorCodeToString(ErrorCode code) {
    static const std::unordered_map<ErrorCode, std::string> codeMap = {
        {ErrorCode::None, "none"},
        {ErrorCode::Connection, "connection_error"},
        {ErrorCode::SessionLost, "session_lost"},
        {ErrorCode::Timeout, "timeout"},
        {ErrorCode::Cancelled, "cancelled"},
        {ErrorCode::Backpressure, "backpressure"},
        {ErrorCode::DeliveryFailure, "delivery_failure"},
        {ErrorCode::Closed, "closed"},
        {ErrorCode::InvalidArgument, "invalid_argument"},
        {ErrorCode::HandlerFailure, "handler_failure"},
        {ErrorCode::Subscription, "subscription_error"},
        {ErrorCode::Parse, "parse_error"},
        {ErrorCode::Http, "http_error"}
    };

    auto it = codeMap.find(code);
    return (it != codeMap.end()) ? it->second : "unknown";
}

void logError(const AgentError& error) {
    std::cerr << "[Agent] " << errorCodeToString(error.code);
    if (!error.topic.empty()) {
        std::cerr << " on " << error.topic;
    }
    std::cerr << ": " << error.message << std::endl;
}

} // namespace iotagent
