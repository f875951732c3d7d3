#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace uplift::transfer {

// Raised when an input stream cannot be opened or read.
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A pull-based byte stream. HTTP request bodies are ByteSources.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Fills at most buffer.size() bytes and returns the count; 0 means end of
    // stream. Throws SourceError on failure.
    virtual size_t read(std::span<std::uint8_t> buffer) = 0;

    // Total length, if the source knows it.
    virtual std::optional<uint64_t> size() const = 0;
};

class FileSource : public ByteSource {
public:
    explicit FileSource(const std::filesystem::path& path);

    size_t read(std::span<std::uint8_t> buffer) override;
    std::optional<uint64_t> size() const override { return size_; }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream file_;
    uint64_t size_;
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<std::uint8_t> data);
    explicit MemorySource(const std::string& text);

    size_t read(std::span<std::uint8_t> buffer) override;
    std::optional<uint64_t> size() const override { return data_.size(); }

private:
    std::vector<std::uint8_t> data_;
    size_t position_ = 0;
};

// Exposes the next `limit` bytes of a shared source. One upload chunk is a
// BoundedSource over the whole media stream.
class BoundedSource : public ByteSource {
public:
    BoundedSource(std::shared_ptr<ByteSource> inner, uint64_t limit);

    size_t read(std::span<std::uint8_t> buffer) override;
    std::optional<uint64_t> size() const override { return limit_; }

    uint64_t remaining() const { return limit_ - consumed_; }

private:
    std::shared_ptr<ByteSource> inner_;
    uint64_t limit_;
    uint64_t consumed_ = 0;
};

} // namespace uplift::transfer
