#include "cloudup/io/byte_source.hpp"

#include <string>

namespace cloudup::io {
namespace fs = std::filesystem;

namespace {

Error out_of_range(std::uint64_t offset, std::uint64_t length, std::uint64_t size) {
    return Error::validation("Read of " + std::to_string(length) + " bytes at offset " + std::to_string(offset) +
                             " exceeds source size " + std::to_string(size));
}

} // namespace

FileByteSource::FileByteSource(OpenTag, fs::path path, std::ifstream stream, std::uint64_t size)
    : path_(std::move(path)), stream_(std::move(stream)), size_(size) {}

Result<std::shared_ptr<FileByteSource>> FileByteSource::open(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::shared_ptr<FileByteSource>>(
            Error::validation("Cannot stat source file " + path.string() + ": " + ec.message()));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::shared_ptr<FileByteSource>>(
            Error::validation("Failed to open source file: " + path.string()));
    }

    return Ok(std::make_shared<FileByteSource>(OpenTag{}, path, std::move(input), size));
}

Result<std::vector<std::uint8_t>> FileByteSource::read_range(std::uint64_t offset, std::uint64_t length) {
    if (offset > size_ || length > size_ - offset) {
        return Err<std::vector<std::uint8_t>>(out_of_range(offset, length, size_));
    }

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(length));
    std::lock_guard lock(mutex_);
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(stream_.gcount()) != length) {
        return Err<std::vector<std::uint8_t>>(
            Error::validation("Short read from " + path_.string() + " at offset " + std::to_string(offset)));
    }
    return Ok(std::move(buffer));
}

Result<std::vector<std::uint8_t>> MemoryByteSource::read_range(std::uint64_t offset, std::uint64_t length) {
    if (offset > data_.size() || length > data_.size() - offset) {
        return Err<std::vector<std::uint8_t>>(out_of_range(offset, length, data_.size()));
    }
    const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return Ok(std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(length)));
}

} // namespace cloudup::io
