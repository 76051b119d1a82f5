/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the agent runtime
 *
 * Reads the flat subset of TOML the agent needs: [section] headers and
 * key = value lines with optional quotes and trailing # comments.
 *
 * Supported Sections:
 * - [broker]: endpoint, client id, credentials and TLS files
 * - [session]: keepalive, connect timeout and reconnect backoff
 * - [publisher]: outbound queue capacity, in-flight window and retries
 * - [rpc]: call timeout and response topic
 * - [platform]: IoT platform client id, agent id, agent token and HTTP API URL
 *
 * Environment variables override file values: IOT_BROKER_URI, IOT_CLIENT_ID,
 * IOT_USERNAME, IOT_PASSWORD, IOT_PLATFORM_CLIENT_ID, IOT_AGENT_ID,
 * IOT_AGENT_TOKEN, IOT_PLATFORM_HTTP_URL.
 */

#pragma once

#include "AgentConfig.hpp"
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace iotagent {

/**
 * @brief TOML configuration loader with environment overrides
 *
 * Unknown keys are reported on std::cerr and ignored. Malformed numbers and
 * unreadable files throw std::runtime_error.
 */
class TomlConfig {
public:
    /**
     * @brief Load configuration file and apply environment overrides
     * @param filename Path to TOML configuration file
     * @return Agent configuration (not yet resolved or validated)
     * @throws std::runtime_error if the file cannot be read or a value is malformed
     */
    static AgentConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open config file: " + filename);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        AgentConfig config = loadFromString(buffer.str());
        applyEnvironment(config);
        validateCertificatePaths(config);
        return config;
    }

    /**
     * @brief Parse configuration text
     * @throws std::runtime_error if a value is malformed
     */
    static AgentConfig loadFromString(const std::string& text) {
        AgentConfig config;
        std::istringstream input(text);

        std::string currentSection;
        std::string line;
        int lineNumber = 0;
        while (std::getline(input, line)) {
            ++lineNumber;
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                std::cerr << "[Config] Ignoring line " << lineNumber << ": " << line << std::endl;
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            if (!applyValue(config, currentSection, key, value)) {
                std::cerr << "[Config] Unknown key " << currentSection << "." << key << std::endl;
            }
        }

        return config;
    }

    /// Apply IOT_* environment overrides
    static void applyEnvironment(AgentConfig& config) {
        std::string value;
        if (!(value = safeGetEnv("IOT_BROKER_URI")).empty()) config.broker.uri = value;
        if (!(value = safeGetEnv("IOT_CLIENT_ID")).empty()) config.broker.clientId = value;
        if (!(value = safeGetEnv("IOT_USERNAME")).empty()) config.broker.username = value;
        if (!(value = safeGetEnv("IOT_PASSWORD")).empty()) config.broker.password = value;
        if (!(value = safeGetEnv("IOT_PLATFORM_CLIENT_ID")).empty()) {
            config.platform.clientId = toInt64("IOT_PLATFORM_CLIENT_ID", value);
        }
        if (!(value = safeGetEnv("IOT_AGENT_ID")).empty()) {
            config.platform.agentId = toInt64("IOT_AGENT_ID", value);
        }
        if (!(value = safeGetEnv("IOT_AGENT_TOKEN")).empty()) config.platform.agentToken = value;
        if (!(value = safeGetEnv("IOT_PLATFORM_HTTP_URL")).empty()) config.platform.httpUrl = value;
    }

    /**
     * @brief Safe environment variable getter
     * @param name Environment variable name
     * @return Environment variable value or empty string if not found
     */
    static std::string safeGetEnv(const char* name) {
#ifdef _WIN32
        char* buffer = nullptr;
        size_t size = 0;
        if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
            std::string result(buffer);
            free(buffer);
            return result;
        }
        return "";
#else
        const char* value = std::getenv(name);
        return value ? std::string(value) : "";
#endif
    }

private:
    static bool applyValue(AgentConfig& config, const std::string& section,
                           const std::string& key, const std::string& value) {
        const std::string name = section + "." + key;

        if (section == "broker") {
            if (key == "uri") config.broker.uri = value;
            else if (key == "client_id") config.broker.clientId = value;
            else if (key == "username") config.broker.username = value;
            else if (key == "password") config.broker.password = value;
            else if (key == "ca_path") config.broker.caPath = value;
            else if (key == "cert_path") config.broker.certPath = value;
            else if (key == "key_path") config.broker.keyPath = value;
            else if (key == "verify_server") config.broker.verifyServer = toBool(value);
            else return false;
        } else if (section == "session") {
            if (key == "keepalive_seconds") config.session.keepaliveInterval = std::chrono::seconds(toInt(name, value));
            else if (key == "keepalive_timeout_seconds") config.session.keepaliveTimeout = std::chrono::seconds(toInt(name, value));
            else if (key == "connect_timeout_seconds") config.session.connectTimeout = std::chrono::seconds(toInt(name, value));
            else if (key == "backoff_base_ms") config.session.backoffBase = std::chrono::milliseconds(toInt(name, value));
            else if (key == "backoff_cap_ms") config.session.backoffCap = std::chrono::milliseconds(toInt(name, value));
            else if (key == "backoff_jitter_pct") config.session.backoffJitterPct = toInt(name, value);
            else if (key == "keepalive_topic") config.session.keepaliveTopic = value;
            else return false;
        } else if (section == "publisher") {
            if (key == "queue_capacity") config.publisher.queueCapacity = static_cast<std::size_t>(toInt(name, value));
            else if (key == "max_inflight") config.publisher.maxInflight = static_cast<std::size_t>(toInt(name, value));
            else if (key == "max_retries") config.publisher.maxRetries = toInt(name, value);
            else if (key == "ack_timeout_ms") config.publisher.ackTimeout = std::chrono::milliseconds(toInt(name, value));
            else if (key == "retry_delay_ms") config.publisher.retryDelay = std::chrono::milliseconds(toInt(name, value));
            else if (key == "default_qos") {
                try {
                    config.publisher.defaultQos = qosFromInt(toInt(name, value));
                } catch (const std::invalid_argument& e) {
                    throw std::runtime_error("[Config] " + name + ": " + e.what());
                }
            }
            else return false;
        } else if (section == "rpc") {
            if (key == "default_timeout_ms") config.rpc.defaultTimeout = std::chrono::milliseconds(toInt(name, value));
            else if (key == "response_topic") config.rpc.responseTopic = value;
            else return false;
        } else if (section == "platform") {
            if (key == "client_id") config.platform.clientId = toInt64(name, value);
            else if (key == "agent_id") config.platform.agentId = toInt64(name, value);
            else if (key == "agent_token") config.platform.agentToken = value;
            else if (key == "http_url") config.platform.httpUrl = value;
            else if (key == "http_timeout_ms") config.platform.httpTimeout = std::chrono::milliseconds(toInt(name, value));
            else return false;
        } else {
            return false;
        }
        return true;
    }

    static int toInt(const std::string& name, const std::string& value) {
        try {
            size_t used = 0;
            int result = std::stoi(value, &used);
            if (used != value.size()) {
                throw std::invalid_argument(value);
            }
            return result;
        } catch (const std::exception&) {
            throw std::runtime_error("[Config] " + name + " expects an integer, got '" + value + "'");
        }
    }

    static std::int64_t toInt64(const std::string& name, const std::string& value) {
        try {
            size_t used = 0;
            long long result = std::stoll(value, &used);
            if (used != value.size()) {
                throw std::invalid_argument(value);
            }
            return static_cast<std::int64_t>(result);
        } catch (const std::exception&) {
            throw std::runtime_error("[Config] " + name + " expects an integer, got '" + value + "'");
        }
    }

    static bool toBool(const std::string& value) {
        return value == "true" || value == "1";
    }

    /**
     * @brief Warn about TLS files that do not exist
     * @param config Agent configuration to check
     */
    static void validateCertificatePaths(const AgentConfig& config) {
        namespace fs = std::filesystem;

        for (const auto* path : {&config.broker.caPath, &config.broker.certPath, &config.broker.keyPath}) {
            if (!path->empty() && !fs::exists(*path)) {
                std::cerr << "[Config] Warning: TLS file not found: " << *path << std::endl;
            }
        }
    }

    /**
     * @brief Drop a trailing # comment that is not inside quotes
     * @param line Line to strip (modified in place)
     */
    static void stripComment(std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                line.erase(i);
                return;
            }
        }
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace iotagent
