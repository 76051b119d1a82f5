#include "Message.hpp"
#include <stdexcept>

namespace iotagent {

int qosToInt(QoS qos) {
    return static_cast<int>(qos);
}

QoS qosFromInt(int level) {
    switch (level) {
        case 0: return QoS::AtMostOnce;
        case 1: return QoS::AtLeastOnce;
        case 2: return QoS::ExactlyOnce;
        default:
            throw std::invalid_argument("QoS level out of range: " + std::to_string(level));
    }
}

std::string qosToString(QoS qos) {
    switch (qos) {
        case QoS::AtMostOnce: return "at_most_once";
        case QoS::AtLeastOnce: return "at_least_once";
        case QoS::ExactlyOnce: return "exactly_once";
    }
    return "unknown";
}

} // namespace iotagent
