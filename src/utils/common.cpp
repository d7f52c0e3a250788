#include "utils/common.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace execbox::utils {

std::string EncodeBase64(const std::vector<unsigned char>& data) {
    static const char table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);
    std::size_t i = 0;
    while (i < data.size()) {
        const std::size_t start = i;
        const unsigned int octet_a = i < data.size() ? data[i++] : 0;
        const unsigned int octet_b = i < data.size() ? data[i++] : 0;
        const unsigned int octet_c = i < data.size() ? data[i++] : 0;

        const unsigned int triple = (octet_a << 16) + (octet_b << 8) + octet_c;
        encoded.push_back(table[(triple >> 18) & 0x3F]);
        encoded.push_back(table[(triple >> 12) & 0x3F]);
        encoded.push_back(start + 1 < data.size() ? table[(triple >> 6) & 0x3F] : '=');
        encoded.push_back(start + 2 < data.size() ? table[triple & 0x3F] : '=');
    }
    return encoded;
}

std::string RandomHex(std::size_t bytes) {
    std::vector<unsigned char> data(bytes);
    if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
        char buffer[256];
        ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + buffer);
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : data) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

}  // namespace execbox::utils
