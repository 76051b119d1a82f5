#include "PlatformCodec.hpp"
#include "PlatformConfig.hpp"
#include <algorithm>
#include <type_traits>
#include <unordered_map>

namespace iotagent {

namespace {

// Missing and null are the same thing on this wire
const nlohmann::json& requireKey(const nlohmann::json& json, const char* key, const char* name) {
    if (!json.is_object()) {
        throw PlatformParseError(std::string("Expected an object for ") + name);
    }
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        throw PlatformParseError(std::string("Key \"") + key + "\" missing in " + name);
    }
    return *it;
}

template <typename T>
T requireValue(const nlohmann::json& json, const char* key, const char* name) {
    const auto& value = requireKey(json, key, name);
    try {
        return value.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw PlatformParseError(std::string("Key \"") + key + "\" has wrong type in " + name + ": " + e.what());
    }
}

// Epoch microseconds: an integer that is not negative
std::uint64_t requireMicros(const nlohmann::json& json, const char* key, const char* name) {
    const auto& value = requireKey(json, key, name);
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (!value.is_number_integer()) {
        throw PlatformParseError(std::string("Key \"") + key + "\" must be an integer in " + name);
    }
    throw PlatformParseError(std::string("Key \"") + key + "\" must not be negative in " + name);
}

template <typename T>
std::optional<T> optionalValue(const nlohmann::json& json, const char* key, const char* name) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    return requireValue<T>(json, key, name);
}

// Absent or null collections read as empty
nlohmann::json collectionOrEmpty(const nlohmann::json& json, const char* key, bool array) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return array ? nlohmann::json::array() : nlohmann::json::object();
    }
    return *it;
}

const nlohmann::json& requireArray(const nlohmann::json& json, const char* key, const char* name) {
    const auto& value = requireKey(json, key, name);
    if (!value.is_array()) {
        throw PlatformParseError(std::string("Key \"") + key + "\" must be an array in " + name);
    }
    return value;
}

nlohmann::json parseDocument(const std::string& text, const char* what) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw PlatformParseError(std::string("Malformed ") + what + ": " + e.what());
    }
}

} // namespace

std::string commandStatusToString(CommandStatus status) {
    static const std::unordered_map<CommandStatus, std::string> statusMap = {
        {CommandStatus::New, "new"},
        {CommandStatus::Sending, "sending"},
        {CommandStatus::Sent, "sent"},
        {CommandStatus::Received, "received"},
        {CommandStatus::Skipped, "skipped"},
        {CommandStatus::Done, "done"},
        {CommandStatus::Failed, "failed"}
    };

    auto it = statusMap.find(status);
    return (it != statusMap.end()) ? it->second : "new";
}

CommandStatus stringToCommandStatus(const std::string& str) {
    static const std::unordered_map<std::string, CommandStatus> statusMap = {
        {"new", CommandStatus::New},
        {"sending", CommandStatus::Sending},
        {"sent", CommandStatus::Sent},
        {"received", CommandStatus::Received},
        {"skipped", CommandStatus::Skipped},
        {"done", CommandStatus::Done},
        {"failed", CommandStatus::Failed}
    };

    auto it = statusMap.find(str);
    if (it == statusMap.end()) {
        throw PlatformParseError("parse command_status failed, value '" + str + "' is unknown");
    }
    return it->second;
}

std::string PlatformCodec::serialize(const EventMessage& message) {
    return eventToJson(message).dump();
}

std::string PlatformCodec::serialize(const CommandStatusMessage& message) {
    return statusToJson(message).dump();
}

std::string PlatformCodec::serializeLogs(const std::vector<LogRecord>& records) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& record : records) {
        j.push_back(logToJson(record));
    }
    return j.dump();
}

CommandMessage PlatformCodec::parseCommandMessage(const std::string& json) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw PlatformParseError(std::string("Malformed command message: ") + e.what());
    }
    return jsonToCommandMessage(parsed);
}

nlohmann::json PlatformCodec::valueToJson(const TagValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Location>) {
            return {{"lat", v.lat}, {"lng", v.lng}};
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            return v.micros;
        } else {
            return v;
        }
    }, value);
}

nlohmann::json PlatformCodec::eventToJson(const EventMessage& message) {
    nlohmann::json tags = nlohmann::json::array();
    for (const auto& tag : message.tags) {
        tags.push_back({
            {"id", tag.id},
            {"value", valueToJson(tag.value)},
            {"timestamp", tag.timestamp}
        });
    }

    nlohmann::json j;
    j["tags"] = tags;
    return j;
}

nlohmann::json PlatformCodec::statusToJson(const CommandStatusMessage& message) {
    nlohmann::json j;
    j["id"] = message.id;
    j["status"] = commandStatusToString(message.status);
    if (message.reason) {
        j["reason"] = *message.reason;
    } else {
        j["reason"] = nullptr;
    }
    j["timestamp"] = message.timestamp;
    return j;
}

nlohmann::json PlatformCodec::logToJson(const LogRecord& record) {
    return {
        {"level", static_cast<int>(record.level)},
        {"message", record.message}
    };
}

CommandMessage PlatformCodec::jsonToCommandMessage(const nlohmann::json& json) {
    CommandMessage message;

    if (json.is_object() && json.contains("command") && !json["command"].is_null()) {
        message.command = jsonToCommand(json["command"]);
    }

    const auto& devices = requireKey(json, "devices", "command message input");
    if (!devices.is_array()) {
        throw PlatformParseError("Key \"devices\" must be an array in command message input");
    }
    for (const auto& device : devices) {
        message.devices.push_back(jsonToDeviceCommand(device));
    }
    return message;
}

Command PlatformCodec::jsonToCommand(const nlohmann::json& json) {
    Command command;
    command.id = requireValue<std::string>(json, "id", "command input");

    const auto& tags = requireKey(json, "tags", "command input");
    command.timestamp = requireMicros(json, "timestamp", "command input");

    if (!tags.is_array()) {
        throw PlatformParseError("Key \"tags\" must be an array in command input");
    }
    for (const auto& tag : tags) {
        command.tags.push_back(jsonToCommandTag(tag));
    }
    return command;
}

DeviceCommand PlatformCodec::jsonToDeviceCommand(const nlohmann::json& json) {
    DeviceCommand device;
    device.deviceId = requireValue<std::int64_t>(json, "device_id", "device_command input");
    device.command = jsonToCommand(requireKey(json, "command", "device_command input"));
    return device;
}

CommandTag PlatformCodec::jsonToCommandTag(const nlohmann::json& json) {
    CommandTag tag;
    tag.id = requireValue<std::int64_t>(json, "id", "command tag input");
    tag.value = jsonToValue(requireKey(json, "value", "command tag input"));
    return tag;
}

TagValue PlatformCodec::jsonToValue(const nlohmann::json& json) {
    if (json.is_boolean()) {
        return json.get<bool>();
    }
    if (json.is_number_integer()) {
        return json.get<std::int64_t>();
    }
    if (json.is_number_float()) {
        return json.get<double>();
    }
    if (json.is_string()) {
        return json.get<std::string>();
    }
    if (json.is_object() && json.contains("lat") && json.contains("lng") &&
        json["lat"].is_number() && json["lng"].is_number()) {
        Location location;
        location.lat = json["lat"].get<double>();
        location.lng = json["lng"].get<double>();
        return location;
    }
    throw PlatformParseError("Unsupported tag value: " + json.dump());
}

PlatformConfig PlatformCodec::parseConfig(const std::string& json) {
    return jsonToConfig(parseDocument(json, "config"));
}

AgentDevicesCommands PlatformCodec::parseCommands(const std::string& json) {
    auto parsed = parseDocument(json, "command list");
    AgentDevicesCommands commands;

    if (parsed.is_object() && parsed.contains("command") && !parsed["command"].is_null()) {
        commands.command = jsonToCommandRecord(parsed["command"]);
    }
    for (const auto& device : requireArray(parsed, "devices", "agent_devices_commands input")) {
        DeviceCommandRecord record;
        record.deviceId = requireValue<std::int64_t>(device, "device_id", "device_command input");
        record.command = jsonToCommandRecord(requireKey(device, "command", "device_command input"));
        commands.devices.push_back(std::move(record));
    }
    return commands;
}

VersionedDeviceConfig PlatformCodec::parseVersionedDeviceConfig(const std::string& json) {
    return jsonToVersionedDeviceConfig(parseDocument(json, "versioned device config"));
}

PlatformConfig PlatformCodec::jsonToConfig(const nlohmann::json& json) {
    PlatformConfig config;
    const auto& agent = requireKey(json, "agent", "config input");
    config.version = requireValue<std::string>(json, "version", "config input");
    config.agent = jsonToAgentInfo(agent);
    return config;
}

AgentInfo PlatformCodec::jsonToAgentInfo(const nlohmann::json& json) {
    AgentInfo agent;
    agent.id = requireValue<std::int64_t>(json, "id", "agent input");
    agent.configId = optionalValue<std::int64_t>(json, "config_id", "agent input");
    agent.name = requireValue<std::string>(json, "name", "agent input");
    agent.tag = jsonToTag(requireKey(json, "tag", "agent input"));
    for (const auto& device : requireArray(json, "devices", "agent input")) {
        agent.devices.push_back(jsonToDevice(device));
    }
    return agent;
}

Device PlatformCodec::jsonToDevice(const nlohmann::json& json) {
    Device device;
    device.id = requireValue<std::int64_t>(json, "id", "device input");
    device.name = requireValue<std::string>(json, "name", "device input");
    device.tag = jsonToTag(requireKey(json, "tag", "device input"));
    device.driverConfig = collectionOrEmpty(json, "driver_config", false);
    device.driver = jsonToDriver(requireKey(json, "driver", "device input"));
    device.configId = optionalValue<std::int64_t>(json, "config_id", "device input");
    return device;
}

Tag PlatformCodec::jsonToTag(const nlohmann::json& json) {
    Tag tag;
    tag.id = requireValue<std::int64_t>(json, "id", "tag input");
    tag.name = requireValue<std::string>(json, "name", "tag input");
    tag.type = jsonToTagType(requireKey(json, "type", "tag input"));
    tag.properties = requireKey(json, "properties", "tag input");
    tag.attrs = collectionOrEmpty(json, "attrs", false);
    tag.driverConfig = collectionOrEmpty(json, "driver_config", false);

    auto children = collectionOrEmpty(json, "children", true);
    if (!children.is_array()) {
        throw PlatformParseError("Key \"children\" must be an array in tag input");
    }
    for (const auto& raw : children) {
        Tag child = jsonToTag(raw);
        // A repeated name replaces the earlier child
        auto it = std::find_if(tag.children.begin(), tag.children.end(),
                               [&child](const Tag& existing) { return existing.name == child.name; });
        if (it != tag.children.end()) {
            *it = std::move(child);
        } else {
            tag.children.push_back(std::move(child));
        }
    }
    return tag;
}

TagType PlatformCodec::jsonToTagType(const nlohmann::json& json) {
    TagType type;
    type.id = requireValue<std::int64_t>(json, "id", "tag type input");
    type.name = requireValue<std::string>(json, "name", "tag type input");
    return type;
}

Driver PlatformCodec::jsonToDriver(const nlohmann::json& json) {
    Driver driver;
    driver.id = requireValue<std::int64_t>(json, "id", "driver input");
    driver.name = requireValue<std::string>(json, "name", "driver input");
    driver.protocol = optionalValue<std::string>(json, "protocol", "driver input");
    return driver;
}

CommandRecord PlatformCodec::jsonToCommandRecord(const nlohmann::json& json) {
    CommandRecord command;
    command.id = requireValue<std::string>(json, "id", "command extended input");
    const auto& tags = requireArray(json, "tags", "command extended input");
    command.createdAt = requireMicros(json, "created_at", "command extended input");
    command.updatedAt = requireMicros(json, "updated_at", "command extended input");
    command.status = stringToCommandStatus(requireValue<std::string>(json, "status", "command extended input"));
    command.reason = optionalValue<std::string>(json, "reason", "command extended input");

    for (const auto& raw : tags) {
        CommandTag tag;
        tag.id = requireValue<std::int64_t>(raw, "tag_id", "command tag input");
        tag.value = jsonToValue(requireKey(raw, "value", "command tag input"));
        command.tags.push_back(std::move(tag));
    }
    return command;
}

VersionedDeviceConfig PlatformCodec::jsonToVersionedDeviceConfig(const nlohmann::json& json) {
    VersionedDeviceConfig config;
    config.id = requireValue<std::int64_t>(json, "id", "versioned_device_config input");
    config.deviceId = requireValue<std::int64_t>(json, "device_id", "versioned_device_config input");
    if (json.contains("created_at") && !json["created_at"].is_null()) {
        config.createdAt = requireMicros(json, "created_at", "versioned_device_config input");
    }
    config.deviceConfig = collectionOrEmpty(json, "device_config", false);
    return config;
}

} // namespace iotagent
