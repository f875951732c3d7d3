#include <gtest/gtest.h>
#include "uplift/transfer/byte_source.hpp"
#include <filesystem>
#include <fstream>
#include <numeric>
#include <stdexcept>

using namespace uplift::transfer;

namespace {

std::vector<std::uint8_t> drain(ByteSource& source, size_t buffer_size) {
    std::vector<std::uint8_t> out;
    std::vector<std::uint8_t> buffer(buffer_size);
    while (size_t n = source.read(buffer)) {
        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n));
    }
    return out;
}

std::vector<std::uint8_t> pattern(size_t size) {
    std::vector<std::uint8_t> data(size);
    std::iota(data.begin(), data.end(), static_cast<std::uint8_t>(0));
    return data;
}

} // namespace

class FileSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = "test_source.bin";
        data = pattern(100000);
        std::ofstream file(test_file, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    
    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }
    
    std::string test_file;
    std::vector<std::uint8_t> data;
};

TEST_F(FileSourceTest, ReportsSizeAndContent) {
    FileSource source(test_file);
    
    ASSERT_TRUE(source.size().has_value());
    EXPECT_EQ(*source.size(), data.size());
    EXPECT_EQ(drain(source, 4096), data);
    
    std::vector<std::uint8_t> buffer(16);
    EXPECT_EQ(source.read(buffer), 0u);
}

TEST_F(FileSourceTest, MissingFileThrows) {
    EXPECT_THROW(FileSource("no_such_video.mp4"), SourceError);
}

TEST_F(FileSourceTest, DirectoryThrows) {
    EXPECT_THROW(FileSource(std::filesystem::current_path()), SourceError);
}

TEST(MemorySourceTest, ReadsInOrder) {
    MemorySource source(std::string("hello world"));
    
    EXPECT_EQ(source.size(), 11u);
    std::vector<std::uint8_t> buffer(5);
    EXPECT_EQ(source.read(buffer), 5u);
    EXPECT_EQ(std::string(buffer.begin(), buffer.end()), "hello");
    
    auto rest = drain(source, 4);
    EXPECT_EQ(std::string(rest.begin(), rest.end()), " world");
}

TEST(BoundedSourceTest, SplitsSharedSourceIntoChunks) {
    auto inner = std::make_shared<MemorySource>(pattern(1000));
    
    BoundedSource first(inner, 600);
    BoundedSource second(inner, 400);
    
    EXPECT_EQ(first.size(), 600u);
    auto a = drain(first, 256);
    auto b = drain(second, 256);
    
    auto expected = pattern(1000);
    EXPECT_EQ(a, std::vector<std::uint8_t>(expected.begin(), expected.begin() + 600));
    EXPECT_EQ(b, std::vector<std::uint8_t>(expected.begin() + 600, expected.end()));
    EXPECT_EQ(first.remaining(), 0u);
    EXPECT_EQ(second.remaining(), 0u);
}

TEST(BoundedSourceTest, ShortInnerSourceThrows) {
    auto inner = std::make_shared<MemorySource>(pattern(100));
    BoundedSource chunk(inner, 200);
    
    std::vector<std::uint8_t> buffer(150);
    EXPECT_EQ(chunk.read(buffer), 100u);
    EXPECT_THROW(chunk.read(buffer), SourceError);
}

TEST(BoundedSourceTest, NullInnerRejected) {
    EXPECT_THROW(BoundedSource(nullptr, 10), std::invalid_argument);
}
