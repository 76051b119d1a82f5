/**
 * @file PlatformConfig.hpp
 * @brief Agent configuration and command records served by the platform HTTP API
 *
 * The configuration describes the agent, its devices and their tag trees.
 * Tag ids from this tree are what events and command tags refer to, e.g.
 * the "$state/$status" tag under the agent's root tag.
 */

#pragma once

#include "PlatformCodec.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace iotagent {

struct TagType {
    std::int64_t id = 0;
    std::string name;
};

struct Driver {
    std::int64_t id = 0;
    std::string name;
    std::optional<std::string> protocol;
};

/// Node of a tag tree; child names are unique
struct Tag {
    std::int64_t id = 0;
    std::string name;
    TagType type;
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json attrs = nlohmann::json::object();
    nlohmann::json driverConfig = nlohmann::json::object();
    std::vector<Tag> children;

    const Tag* child(const std::string& childName) const;

    /**
     * @brief Walk down the tree by child names
     * @param path Names separated by '/', e.g. "$state/$config/$updated_at"
     * @return The tag, or nullptr when a name on the way is missing
     */
    const Tag* find(const std::string& path) const;
};

struct Device {
    std::int64_t id = 0;
    std::string name;
    Driver driver;
    Tag tag;
    nlohmann::json driverConfig = nlohmann::json::object();
    std::optional<std::int64_t> configId;
};

struct AgentInfo {
    std::int64_t id = 0;
    std::string name;
    Tag tag;
    std::vector<Device> devices;
    std::optional<std::int64_t> configId;
};

struct PlatformConfig {
    AgentInfo agent;
    std::string version;
};

struct VersionedDeviceConfig {
    std::int64_t id = 0;
    std::int64_t deviceId = 0;
    std::optional<std::uint64_t> createdAt;     ///< Epoch microseconds
    nlohmann::json deviceConfig = nlohmann::json::object();
};

/// Command as listed by the HTTP API, with its processing state
struct CommandRecord {
    std::string id;
    std::vector<CommandTag> tags;
    std::uint64_t createdAt = 0;                ///< Epoch microseconds
    std::uint64_t updatedAt = 0;
    CommandStatus status = CommandStatus::New;
    std::optional<std::string> reason;
};

struct DeviceCommandRecord {
    std::int64_t deviceId = 0;
    CommandRecord command;
};

struct AgentDevicesCommands {
    std::optional<CommandRecord> command;
    std::vector<DeviceCommandRecord> devices;
};

} // namespace iotagent
