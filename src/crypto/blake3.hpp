#pragma once

#include "trustpath/common.hpp"
#include <vector>

namespace trustpath::crypto {

/**
 * BLAKE3 fingerprints for record memoization
 */
class Blake3 {
public:
    static Hash256 hash(const bytes& data);

    /**
     * Hash several byte ranges as one message. Each part is prefixed with
     * its length (u64 little-endian), so part boundaries are unambiguous.
     */
    static Hash256 hash_parts(const std::vector<const bytes*>& parts);
};

} // namespace trustpath::crypto
