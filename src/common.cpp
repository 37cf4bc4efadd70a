#include "trustpath/common.hpp"
#include <sodium.h>

namespace trustpath {

std::string bytes_to_hex(const bytes& data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

std::string hash_to_hex(const Hash256& hash) {
    return bytes_to_hex(bytes(hash.begin(), hash.end()));
}

std::string base64_encode(const bytes& data) {
    const int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string encoded(sodium_base64_encoded_len(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    encoded.resize(encoded.size() - 1);  // drop the terminator
    return encoded;
}

std::optional<bytes> base64_decode(const std::string& encoded) {
    bytes decoded(encoded.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(), encoded.data(), encoded.size(),
                          nullptr, &decoded_len, &end, sodium_base64_VARIANT_ORIGINAL) != 0) {
        return std::nullopt;
    }
    if (end != encoded.data() + encoded.size()) {
        return std::nullopt;
    }
    decoded.resize(decoded_len);
    return decoded;
}

std::string short_id(const std::string& id, size_t len) {
    return id.size() <= len ? id : id.substr(0, len);
}

} // namespace trustpath
