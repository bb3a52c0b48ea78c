#pragma once

#include "cloudup/backend/backend.hpp"
#include "cloudup/core/result.hpp"
#include "cloudup/upload/types.hpp"

#include <cstdint>
#include <vector>

namespace cloudup::upload {

class ChunkPlanner {
public:
    /**
     * @brief Split [0, total_length) into ordered, contiguous chunks
     *
     * Non-final chunks are max_chunk long; the final chunk holds the
     * remainder. Fails with Validation for an empty file or for inconsistent
     * constraints (min_chunk > max_chunk, max_chunk not a multiple of
     * alignment).
     */
    static Result<std::vector<ChunkDescriptor>> plan(std::uint64_t total_length,
                                                     const backend::ChunkConstraints& constraints);

    /**
     * @brief What is left of `chunk` after the backend stored `accepted` bytes
     *
     * Keeps the chunk index so progress is still reported against the
     * original chunk.
     */
    static Result<ChunkDescriptor> remainder(const ChunkDescriptor& chunk, std::uint64_t accepted);
};

} // namespace cloudup::upload
