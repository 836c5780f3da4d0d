#pragma once

#include <cstdint>
#include <vector>

#include "vidlift/core/result.h"

namespace vidlift::client {

/// @brief Half-open byte range `[offset, offset + length)` of the source file.
struct ByteRange {
    std::uint64_t offset{0};
    std::uint64_t length{0};

    std::uint64_t end() const { return offset + length; }
    bool operator==(const ByteRange& other) const {
        return offset == other.offset && length == other.length;
    }
    bool operator!=(const ByteRange& other) const { return !(*this == other); }
};

/// @brief Number of parts for `total_bytes` split at `part_size` (1 for an empty file).
std::uint64_t CountParts(std::uint64_t total_bytes, std::uint64_t part_size);

/// @brief Splits `[0, total_bytes)` into ascending contiguous ranges of `part_size` bytes.
///
/// The last range holds the remainder. An empty file yields one zero-length range so the
/// session still has a part to finalize. Deterministic in its inputs, which is what lets a
/// retried session match parts by index.
core::Result<std::vector<ByteRange>> SplitIntoParts(std::uint64_t total_bytes,
                                                    std::uint64_t part_size);

/// @brief Smallest part size >= `target_part_size` keeping the part count within `max_parts`.
core::Result<std::uint64_t> ChoosePartSize(std::uint64_t total_bytes,
                                           std::uint64_t target_part_size, int max_parts);

}  // namespace vidlift::client
