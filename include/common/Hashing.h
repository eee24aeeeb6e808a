#pragma once

#include <string>
#include <vector>

namespace optionlab {
namespace utils {

class Hashing {
public:
    // Lowercase hex SHA-256 of the bytes
    static std::string sha256Hex(const std::string& data);

    // Digest of the lines joined with '\n', each line terminated
    static std::string sha256Hex(const std::vector<std::string>& lines);
};

} // namespace utils
} // namespace optionlab
