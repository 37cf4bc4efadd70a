#include "blake3.hpp"
#include <blake3.h>

namespace trustpath::crypto {

Hash256 Blake3::hash(const bytes& data) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.data(), data.size());
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

Hash256 Blake3::hash_parts(const std::vector<const bytes*>& parts) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    for (const bytes* part : parts) {
        byte length[8];
        uint64_t n = part->size();
        for (size_t i = 0; i < sizeof(length); ++i) {
            length[i] = static_cast<byte>(n >> (8 * i));
        }
        blake3_hasher_update(&hasher, length, sizeof(length));
        blake3_hasher_update(&hasher, part->data(), part->size());
    }
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

} // namespace trustpath::crypto
