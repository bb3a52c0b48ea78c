#include "cloudup/upload/chunk_planner.hpp"

#include <string>

namespace cloudup::upload {

Result<std::vector<ChunkDescriptor>> ChunkPlanner::plan(std::uint64_t total_length,
                                                        const backend::ChunkConstraints& constraints) {
    using Plan = std::vector<ChunkDescriptor>;

    if (total_length == 0) {
        return Err<Plan>(Error::validation("Cannot plan an upload of zero bytes"));
    }
    if (constraints.max_chunk == 0) {
        return Err<Plan>(Error::validation("Backend declared max_chunk of zero"));
    }
    if (constraints.alignment == 0) {
        return Err<Plan>(Error::validation("Backend declared alignment of zero"));
    }
    if (constraints.min_chunk > constraints.max_chunk) {
        return Err<Plan>(Error::validation("Backend declared min_chunk " + std::to_string(constraints.min_chunk) +
                                           " above max_chunk " + std::to_string(constraints.max_chunk)));
    }
    if (constraints.max_chunk % constraints.alignment != 0) {
        return Err<Plan>(Error::validation("Backend declared max_chunk " + std::to_string(constraints.max_chunk) +
                                           " that is not a multiple of alignment " +
                                           std::to_string(constraints.alignment)));
    }

    Plan plan;
    if (constraints.max_chunk >= total_length) {
        plan.push_back(ChunkDescriptor{0, 0, total_length, true});
        return Ok(std::move(plan));
    }

    plan.reserve(static_cast<std::size_t>(total_length / constraints.max_chunk + 1));
    std::uint64_t offset = 0;
    std::uint32_t index = 0;
    while (total_length - offset > constraints.max_chunk) {
        plan.push_back(ChunkDescriptor{index++, offset, constraints.max_chunk, false});
        offset += constraints.max_chunk;
    }
    plan.push_back(ChunkDescriptor{index, offset, total_length - offset, true});
    return Ok(std::move(plan));
}

Result<ChunkDescriptor> ChunkPlanner::remainder(const ChunkDescriptor& chunk, std::uint64_t accepted) {
    if (accepted == 0 || accepted >= chunk.length) {
        return Err<ChunkDescriptor>(Error::protocol("Backend acknowledged " + std::to_string(accepted) +
                                                    " of " + std::to_string(chunk.length) +
                                                    " bytes, which is not a partial acceptance"));
    }
    ChunkDescriptor rest = chunk;
    rest.offset = chunk.offset + accepted;
    rest.length = chunk.length - accepted;
    return Ok(rest);
}

} // namespace cloudup::upload
