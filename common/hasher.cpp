#include "hasher.hpp"
#include <sstream>
#include <iomanip>
#include <openssl/sha.h>

std::string Hasher::digest(const char* data, size_t size) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data), size, hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string Hasher::digest(const std::vector<char>& data) {
    return digest(data.data(), data.size());
}
