#include "cloudup/backend/local_backend.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace cloudup::backend {
namespace fs = std::filesystem;

LocalBackend::LocalBackend(fs::path folder, std::uint64_t chunk_size)
    : folder_(std::move(folder)), chunk_size_(std::max<std::uint64_t>(chunk_size, 1)) {}

ChunkConstraints LocalBackend::chunk_constraints(std::uint64_t) const {
    return ChunkConstraints{1, chunk_size_, 1};
}

fs::path LocalBackend::staging_path_for(const fs::path& destination) {
    return destination.parent_path() / ("." + destination.filename().string() + ".partial");
}

Result<SessionHandle> LocalBackend::initiate(const upload::UploadTarget& target, const auth::Credential&) {
    const fs::path relative(target.remote_path);
    if (target.remote_path.empty() || relative.has_root_path()) {
        return Err<SessionHandle>(Error::validation("Remote path must be relative to the upload folder: " +
                                                    target.remote_path));
    }
    if (std::any_of(relative.begin(), relative.end(), [](const fs::path& part) { return part == ".."; })) {
        return Err<SessionHandle>(Error::validation("Remote path may not leave the upload folder: " +
                                                    target.remote_path));
    }
    if (!relative.has_filename()) {
        return Err<SessionHandle>(Error::validation("Remote path has no file name: " + target.remote_path));
    }

    const fs::path destination = folder_ / relative;
    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return Err<SessionHandle>(res.error());
    }

    const fs::path staging = staging_path_for(destination);
    std::ofstream create(staging, std::ios::binary | std::ios::trunc);
    if (!create) {
        return Err<SessionHandle>(Error::protocol("Failed to create staging file: " + staging.string()));
    }

    SessionHandle handle;
    handle.location = staging.string();
    handle.resource_path = destination.string();
    handle.total_length = target.total_length;
    handle.remote_allocated = true;
    return Ok(std::move(handle));
}

Result<ChunkResult> LocalBackend::upload_chunk(const SessionHandle& handle,
                                               const upload::ChunkDescriptor& chunk,
                                               const std::vector<std::uint8_t>& bytes,
                                               const auth::Credential&) {
    if (bytes.size() != chunk.length) {
        return Err<ChunkResult>(Error::validation("Chunk buffer holds " + std::to_string(bytes.size()) +
                                                  " bytes, descriptor says " + std::to_string(chunk.length)));
    }

    std::fstream file(handle.location, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        return Err<ChunkResult>(Error::protocol("Failed to open staging file: " + handle.location));
    }

    file.seekp(static_cast<std::streamoff>(chunk.offset));
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        return Err<ChunkResult>(Error::protocol("Failed to write " + std::to_string(bytes.size()) +
                                                " bytes at offset " + std::to_string(chunk.offset) + " of " +
                                                handle.location));
    }
    file.flush();
    return Ok(ChunkResult::accepted_all());
}

Result<std::string> LocalBackend::finalize(const SessionHandle& handle, const auth::Credential&) {
    const fs::path staging(handle.location);
    std::error_code ec;
    const auto written = fs::file_size(staging, ec);
    if (ec) {
        return Err<std::string>(Error::protocol("Staging file missing: " + staging.string()));
    }
    if (written != handle.total_length) {
        return Err<std::string>(Error::protocol("Staging file holds " + std::to_string(written) +
                                                " bytes, expected " + std::to_string(handle.total_length)));
    }

    fs::rename(staging, handle.resource_path, ec);
    if (ec) {
        return Err<std::string>(Error::protocol("Failed to move staging file to " + handle.resource_path + ": " +
                                                ec.message()));
    }
    return Ok(handle.resource_path);
}

void LocalBackend::abort(const SessionHandle& handle, const auth::Credential&) {
    std::error_code ec;
    fs::remove(handle.location, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging file {}: {}", handle.location, ec.message());
    }
}

Result<void> LocalBackend::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(Error::protocol("Failed to create directory: " + parent.string()));
    }
    return Ok();
}

} // namespace cloudup::backend
