#include "uplift/transfer/byte_source.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace uplift::transfer {

FileSource::FileSource(const std::filesystem::path& path)
    : path_(path)
    , size_(0)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        throw SourceError("Error opening " + path_.string() + ": not a regular file");
    }

    size_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw SourceError("Error stating file " + path_.string() + ": " + ec.message());
    }

    file_.open(path_, std::ios::binary);
    if (!file_.is_open()) {
        throw SourceError("Error opening " + path_.string() + ": " + std::strerror(errno));
    }
}

size_t FileSource::read(std::span<std::uint8_t> buffer) {
    if (buffer.empty() || file_.eof()) {
        return 0;
    }

    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (file_.bad()) {
        throw SourceError("Error reading " + path_.string());
    }

    return static_cast<size_t>(file_.gcount());
}

MemorySource::MemorySource(std::vector<std::uint8_t> data)
    : data_(std::move(data)) {
}

MemorySource::MemorySource(const std::string& text)
    : data_(text.begin(), text.end()) {
}

size_t MemorySource::read(std::span<std::uint8_t> buffer) {
    size_t n = std::min(buffer.size(), data_.size() - position_);
    if (n > 0) {
        std::memcpy(buffer.data(), data_.data() + position_, n);
        position_ += n;
    }
    return n;
}

BoundedSource::BoundedSource(std::shared_ptr<ByteSource> inner, uint64_t limit)
    : inner_(std::move(inner))
    , limit_(limit) {
    if (!inner_) {
        throw std::invalid_argument("BoundedSource requires a source");
    }
}

size_t BoundedSource::read(std::span<std::uint8_t> buffer) {
    if (remaining() == 0 || buffer.empty()) {
        return 0;
    }

    auto want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), remaining()));
    size_t n = inner_->read(buffer.first(want));
    if (n == 0) {
        // The declared chunk length promised more than the source holds.
        throw SourceError("Source ended after " + std::to_string(consumed_) +
                          " of " + std::to_string(limit_) + " bytes");
    }

    consumed_ += n;
    return n;
}

} // namespace uplift::transfer
