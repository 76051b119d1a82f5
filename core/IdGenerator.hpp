#pragma once

#include <string>

namespace iotagent {

class IIdGenerator {
public:
    virtual ~IIdGenerator() = default;
    virtual std::string next() = 0;
};

/**
 * @brief Random RFC 4122 version 4 UUIDs from the OpenSSL CSPRNG
 *
 * Used for correlation ids and for generated MQTT client ids.
 * @throws std::runtime_error from next() if OpenSSL cannot supply entropy
 */
class UuidGenerator : public IIdGenerator {
public:
    std::string next() override;
};

} // namespace iotagent
