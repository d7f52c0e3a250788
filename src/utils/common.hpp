#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace execbox::utils {

std::string EncodeBase64(const std::vector<unsigned char>& data);

// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
std::string RandomHex(std::size_t bytes);

inline long long ElapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

}  // namespace execbox::utils
