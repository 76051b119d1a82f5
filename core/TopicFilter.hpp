#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace iotagent {

/**
 * @brief MQTT topic helpers shared by the router and the correlator
 *
 * Filters use the standard MQTT syntax: "+" matches exactly one level,
 * "#" matches any number of trailing levels (including none) and must be the
 * last level. Filters starting with a wildcard never match topics that start
 * with '$'.
 */
class TopicFilter {
public:
    static std::vector<std::string_view> split(std::string_view topic);

    /// Topic a message may be published to (non-empty, no wildcards)
    static bool isValidTopicName(std::string_view topic);

    /// Pattern a subscription may be registered with
    static bool isValidFilter(std::string_view filter);

    /// True if @p topic is matched by @p filter; both must be valid
    static bool matches(std::string_view filter, std::string_view topic);

    /**
     * @brief Extract the request id carried as "$rid=<id>" in a topic
     * @return The id, or std::nullopt if the topic carries none
     * @note The id ends at the next '&' or at the end of the topic
     */
    static std::optional<std::string> extractRequestId(std::string_view topic);

    /// "<topic>/?$rid=<id>" (no extra '/' if topic already ends with one)
    static std::string withRequestId(std::string_view topic, std::string_view requestId);
};

} // namespace iotagent
