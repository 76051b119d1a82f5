#include "IdGenerator.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace iotagent {

std::string UuidGenerator::next() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("UuidGenerator: RAND_bytes failed, OpenSSL error " +
                                 std::to_string(ERR_get_error()));
    }

    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

} // namespace iotagent
