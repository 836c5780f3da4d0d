#include "vidlift/client/chunker.h"

namespace vidlift::client {

std::uint64_t CountParts(std::uint64_t total_bytes, std::uint64_t part_size) {
    if (part_size == 0) {
        return 0;
    }
    if (total_bytes == 0) {
        return 1;
    }
    return (total_bytes + part_size - 1) / part_size;
}

core::Result<std::vector<ByteRange>> SplitIntoParts(std::uint64_t total_bytes,
                                                    std::uint64_t part_size) {
    if (part_size == 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "part size must be positive"};
    }

    std::vector<ByteRange> ranges;
    if (total_bytes == 0) {
        ranges.push_back(ByteRange{0, 0});
        return ranges;
    }

    ranges.reserve(static_cast<std::size_t>(CountParts(total_bytes, part_size)));
    std::uint64_t offset = 0;
    while (offset < total_bytes) {
        const std::uint64_t remaining = total_bytes - offset;
        const std::uint64_t length = remaining < part_size ? remaining : part_size;
        ranges.push_back(ByteRange{offset, length});
        offset += length;
    }
    return ranges;
}

core::Result<std::uint64_t> ChoosePartSize(std::uint64_t total_bytes,
                                           std::uint64_t target_part_size, int max_parts) {
    if (target_part_size == 0 || max_parts <= 0) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "part size and part ceiling must be positive"};
    }
    const auto ceiling = static_cast<std::uint64_t>(max_parts);
    if (CountParts(total_bytes, target_part_size) <= ceiling) {
        return target_part_size;
    }
    // Round up so ceiling * size always covers the file.
    return (total_bytes + ceiling - 1) / ceiling;
}

}  // namespace vidlift::client
