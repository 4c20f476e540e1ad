#pragma once

#include <string>
#include <vector>
#include <cstddef>

// SHA-256 content digests, rendered as lowercase hex (64 chars).
class Hasher {
public:
    static std::string digest(const char* data, size_t size);
    static std::string digest(const std::vector<char>& data);

    static constexpr size_t kDigestHexLength = 64;
};
