#include "TopicFilter.hpp"

namespace iotagent {

namespace {
constexpr std::string_view kRequestIdKey = "$rid=";
}

std::vector<std::string_view> TopicFilter::split(std::string_view topic) {
    std::vector<std::string_view> levels;
    std::size_t start = 0;
    while (true) {
        std::size_t slash = topic.find('/', start);
        if (slash == std::string_view::npos) {
            levels.push_back(topic.substr(start));
            break;
        }
        levels.push_back(topic.substr(start, slash - start));
        start = slash + 1;
    }
    return levels;
}

bool TopicFilter::isValidTopicName(std::string_view topic) {
    if (topic.empty()) return false;
    return topic.find_first_of(std::string_view("+#\0", 3)) == std::string_view::npos;
}

bool TopicFilter::isValidFilter(std::string_view filter) {
    if (filter.empty() || filter.find('\0') != std::string_view::npos) {
        return false;
    }

    auto levels = split(filter);
    for (std::size_t i = 0; i < levels.size(); ++i) {
        const auto level = levels[i];
        if (level.find('#') != std::string_view::npos) {
            // '#' must be a whole level and the last one
            if (level != "#" || i + 1 != levels.size()) return false;
        }
        if (level.find('+') != std::string_view::npos && level != "+") {
            return false;
        }
    }
    return true;
}

bool TopicFilter::matches(std::string_view filter, std::string_view topic) {
    if (filter.empty() || topic.empty()) return false;

    if (topic.front() == '$' && (filter.front() == '+' || filter.front() == '#')) {
        return false;
    }

    auto filterLevels = split(filter);
    auto topicLevels = split(topic);

    std::size_t i = 0;
    for (; i < filterLevels.size(); ++i) {
        const auto level = filterLevels[i];
        if (level == "#") {
            return true;
        }
        if (i >= topicLevels.size()) {
            return false;
        }
        if (level != "+" && level != topicLevels[i]) {
            return false;
        }
    }
    return i == topicLevels.size();
}

std::optional<std::string> TopicFilter::extractRequestId(std::string_view topic) {
    auto pos = topic.find(kRequestIdKey);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }

    auto start = pos + kRequestIdKey.size();
    auto end = topic.find('&', start);
    auto id = topic.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    if (id.empty()) {
        return std::nullopt;
    }
    return std::string(id);
}

std::string TopicFilter::withRequestId(std::string_view topic, std::string_view requestId) {
    std::string result(topic);
    if (result.empty() || result.back() != '/') {
        result += '/';
    }
    result += "?";
    result += kRequestIdKey;
    result += requestId;
    return result;
}

} // namespace iotagent
