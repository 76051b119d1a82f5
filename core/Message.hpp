#pragma once

#include <optional>
#include <string>

namespace iotagent {

enum class QoS : int {
    AtMostOnce = 0,
    AtLeastOnce = 1,
    ExactlyOnce = 2
};

struct Message {
    std::string topic;
    std::string payload;
    QoS qos = QoS::AtMostOnce;
    std::optional<std::string> correlationId;
};

int qosToInt(QoS qos);

// Throws std::invalid_argument for levels outside 0..2.
QoS qosFromInt(int level);

std::string qosToString(QoS qos);

} // namespace iotagent
