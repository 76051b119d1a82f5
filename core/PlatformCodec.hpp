#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace iotagent {

class PlatformParseError : public std::runtime_error {
public:
    explicit PlatformParseError(const std::string& what) : std::runtime_error(what) {}
};

struct Location {
    double lat = 0.0;
    double lng = 0.0;
};

// Microseconds since the Unix epoch
struct Timestamp {
    std::uint64_t micros = 0;
};

using TagValue = std::variant<std::int64_t, double, bool, std::string, Location, Timestamp>;

struct EventTag {
    std::int64_t id = 0;
    TagValue value;
    std::uint64_t timestamp = 0;
};

struct EventMessage {
    std::vector<EventTag> tags;
};

enum class LogLevel {
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5
};

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string message;
};

enum class CommandStatus {
    New,
    Sending,
    Sent,
    Received,
    Skipped,
    Done,
    Failed
};

struct CommandStatusMessage {
    std::string id;
    CommandStatus status = CommandStatus::New;
    std::uint64_t timestamp = 0;
    std::optional<std::string> reason;
};

struct CommandTag {
    std::int64_t id = 0;
    TagValue value;
};

struct Command {
    std::string id;
    std::vector<CommandTag> tags;
    std::uint64_t timestamp = 0;
};

struct DeviceCommand {
    std::int64_t deviceId = 0;
    Command command;
};

struct CommandMessage {
    std::optional<Command> command;     ///< Command for the agent itself
    std::vector<DeviceCommand> devices;
};

// HTTP API documents, defined in PlatformConfig.hpp
struct PlatformConfig;
struct AgentInfo;
struct Device;
struct Tag;
struct TagType;
struct Driver;
struct VersionedDeviceConfig;
struct CommandRecord;
struct AgentDevicesCommands;

std::string commandStatusToString(CommandStatus status);
CommandStatus stringToCommandStatus(const std::string& str);   // throws PlatformParseError

class PlatformCodec {
public:
    static std::string serialize(const EventMessage& message);
    static std::string serialize(const CommandStatusMessage& message);
    static std::string serializeLogs(const std::vector<LogRecord>& records);

    // Throws PlatformParseError for malformed JSON or missing keys
    static CommandMessage parseCommandMessage(const std::string& json);

    static nlohmann::json eventToJson(const EventMessage& message);
    static nlohmann::json statusToJson(const CommandStatusMessage& message);
    static nlohmann::json logToJson(const LogRecord& record);
    static nlohmann::json valueToJson(const TagValue& value);

    static CommandMessage jsonToCommandMessage(const nlohmann::json& json);
    static Command jsonToCommand(const nlohmann::json& json);
    static DeviceCommand jsonToDeviceCommand(const nlohmann::json& json);
    static CommandTag jsonToCommandTag(const nlohmann::json& json);
    static TagValue jsonToValue(const nlohmann::json& json);

    // HTTP API responses; same error contract as parseCommandMessage
    static PlatformConfig parseConfig(const std::string& json);
    static AgentDevicesCommands parseCommands(const std::string& json);
    static VersionedDeviceConfig parseVersionedDeviceConfig(const std::string& json);

    static PlatformConfig jsonToConfig(const nlohmann::json& json);
    static AgentInfo jsonToAgentInfo(const nlohmann::json& json);
    static Device jsonToDevice(const nlohmann::json& json);
    static Tag jsonToTag(const nlohmann::json& json);
    static TagType jsonToTagType(const nlohmann::json& json);
    static Driver jsonToDriver(const nlohmann::json& json);
    static CommandRecord jsonToCommandRecord(const nlohmann::json& json);
    static VersionedDeviceConfig jsonToVersionedDeviceConfig(const nlohmann::json& json);
};

} // namespace iotagent
