#include "cloudup/io/byte_source.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using cloudup::ErrorKind;
using cloudup::io::FileByteSource;
using cloudup::io::MemoryByteSource;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("cloudup_byte_source_test_" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

std::string as_string(const std::vector<std::uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST(ByteSourceTest, FileSourceReadsArbitraryRanges) {
    const auto dir = create_temp_dir();
    const fs::path file = dir / "input.txt";
    {
        std::ofstream out(file, std::ios::binary);
        out << "0123456789abcdef";
    }

    auto source = FileByteSource::open(file);
    ASSERT_TRUE(source.is_ok());
    EXPECT_EQ(source.value()->size(), 16u);

    auto tail = source.value()->read_range(10, 6);
    ASSERT_TRUE(tail.is_ok());
    EXPECT_EQ(as_string(tail.value()), "abcdef");

    // Earlier range after a later one: the stream position is not sticky
    auto head = source.value()->read_range(0, 4);
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(as_string(head.value()), "0123");

    auto empty = source.value()->read_range(16, 0);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());

    fs::remove_all(dir);
}

TEST(ByteSourceTest, OpenedFileSourceOutlivesItsResult) {
    const auto dir = create_temp_dir();
    const fs::path file = dir / "shared.bin";
    {
        std::ofstream out(file, std::ios::binary);
        out << "shared";
    }

    std::shared_ptr<cloudup::io::ByteSource> held;
    {
        auto opened = FileByteSource::open(file);
        ASSERT_TRUE(opened.is_ok());
        EXPECT_EQ(opened.value()->path(), file);
        held = opened.value();
    }
    EXPECT_EQ(held.use_count(), 1);

    auto bytes = held->read_range(0, 6);
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(as_string(bytes.value()), "shared");

    held.reset();
    fs::remove_all(dir);
}

TEST(ByteSourceTest, FileSourceRejectsReadsPastEnd) {
    const auto dir = create_temp_dir();
    const fs::path file = dir / "short.bin";
    {
        std::ofstream out(file, std::ios::binary);
        out << "abc";
    }

    auto source = FileByteSource::open(file);
    ASSERT_TRUE(source.is_ok());
    auto past = source.value()->read_range(2, 5);
    ASSERT_TRUE(past.is_error());
    EXPECT_EQ(past.error().kind, ErrorKind::Validation);

    fs::remove_all(dir);
}

TEST(ByteSourceTest, MissingFileIsValidationError) {
    auto source = FileByteSource::open(fs::temp_directory_path() / "cloudup_no_such_file.bin");
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().kind, ErrorKind::Validation);
}

TEST(ByteSourceTest, MemorySourceChecksBounds) {
    MemoryByteSource source({'h', 'e', 'l', 'l', 'o'});
    EXPECT_EQ(source.size(), 5u);

    auto middle = source.read_range(1, 3);
    ASSERT_TRUE(middle.is_ok());
    EXPECT_EQ(as_string(middle.value()), "ell");

    EXPECT_TRUE(source.read_range(6, 0).is_error());
    EXPECT_TRUE(source.read_range(4, 2).is_error());
}
