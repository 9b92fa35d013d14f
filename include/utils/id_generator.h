#pragma once

#include <string>

namespace vesta {
namespace utils {

class IdGenerator {
public:
    /// Random RFC 4122 version-4 UUID, lowercase hex with dashes.
    /// @throws std::runtime_error if the OpenSSL RNG fails
    static std::string uuid4();

    /// True for the 8-4-4-4-12 hex layout produced by uuid4()
    static bool isUuid(const std::string& s);

    /// True for a 24-character hex string (MongoDB ObjectId textual form)
    static bool isObjectIdHex(const std::string& s);
};

} // namespace utils
} // namespace vesta
