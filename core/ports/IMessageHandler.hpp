#pragma once

#include "../Message.hpp"
#include <functional>
#include <memory>

namespace iotagent::ports {

class IMessageHandler {
public:
    virtual ~IMessageHandler() = default;

    // May throw; the router reports the failure and keeps dispatching
    virtual void onMessage(const Message& message) = 0;
};

class FunctionHandler : public IMessageHandler {
public:
    using Callback = std::function<void(const Message&)>;

    explicit FunctionHandler(Callback callback) : callback_(std::move(callback)) {}

    void onMessage(const Message& message) override {
        callback_(message);
    }

private:
    Callback callback_;
};

inline std::shared_ptr<IMessageHandler> makeHandler(FunctionHandler::Callback callback) {
    if (!callback) return nullptr;
    return std::make_shared<FunctionHandler>(std::move(callback));
}

} // namespace iotagent::ports
