#pragma once

#include "cloudup/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <vector>

namespace cloudup::io {

/**
 * @brief Random-access source of the bytes being uploaded
 *
 * read_range() returns exactly `length` bytes or an error; a source that
 * ends early is reported as Validation because it no longer matches the
 * upload target it was paired with.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual std::uint64_t size() const = 0;

    virtual Result<std::vector<std::uint8_t>> read_range(std::uint64_t offset, std::uint64_t length) = 0;
};

class FileByteSource : public ByteSource {
    struct OpenTag {};

public:
    static Result<std::shared_ptr<FileByteSource>> open(const std::filesystem::path& path);

    /// Only reachable through open(), which validates the file first
    FileByteSource(OpenTag, std::filesystem::path path, std::ifstream stream, std::uint64_t size);

    [[nodiscard]] std::uint64_t size() const override { return size_; }

    Result<std::vector<std::uint8_t>> read_range(std::uint64_t offset, std::uint64_t length) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;   // guards the shared stream position
    std::ifstream stream_;
    std::uint64_t size_ = 0;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    [[nodiscard]] std::uint64_t size() const override { return data_.size(); }

    Result<std::vector<std::uint8_t>> read_range(std::uint64_t offset, std::uint64_t length) override;

private:
    std::vector<std::uint8_t> data_;
};

} // namespace cloudup::io
