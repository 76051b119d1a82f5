#pragma once

#include <functional>
#include <string>

namespace iotagent {

enum class ErrorCode {
    None,
    Connection,        // handshake or authentication failure
    SessionLost,       // disconnect while an operation was outstanding
    Timeout,           // call deadline exceeded
    Cancelled,         // explicit cancel or shutdown
    Backpressure,      // outbound queue full
    DeliveryFailure,   // retry ceiling exceeded or abandoned at shutdown
    Closed,            // operation after disconnect()
    InvalidArgument,
    HandlerFailure,    // subscription handler threw
    Subscription,      // broker refused a subscription
    Parse,             // malformed platform message
    Http               // platform HTTP API call failed
};

struct AgentError {
    ErrorCode code = ErrorCode::None;
    std::string message;
    std::string topic;
};

using ErrorSink = std::function<void(const AgentError&)>;

std::string errorCodeToString(ErrorCode code);

// Default sink: one line on std::cerr.
void logError(const AgentError& error);

} // namespace iotagent
