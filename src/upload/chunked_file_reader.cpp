#include "chunkup/upload/chunked_file_reader.hpp"
#include "chunkup/upload/checksum.hpp"

#include <algorithm>
#include <limits>
#include <system_error>

namespace chunkup::upload {
namespace fs = std::filesystem;

ChunkedFileReader::ChunkedFileReader(fs::path path,
                                     std::ifstream stream,
                                     std::uint64_t file_size,
                                     std::uint64_t chunk_size,
                                     std::uint32_t chunk_count)
    : path_(std::move(path)),
      stream_(std::move(stream)),
      file_size_(file_size),
      chunk_size_(chunk_size),
      chunk_count_(chunk_count) {}

UploadResult<ChunkedFileReader> ChunkedFileReader::open(const fs::path& path, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        return Err<ChunkedFileReader>(make_error(ErrorKind::InvalidArgument, "chunk_size must be > 0"));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<ChunkedFileReader>(make_error(ErrorKind::Io, "Failed to open source file: " + path.string()));
    }

    std::error_code ec;
    const auto size = static_cast<std::uint64_t>(fs::file_size(path, ec));
    if (ec) {
        return Err<ChunkedFileReader>(make_error(ErrorKind::Io, "Failed to size " + path.string() + ": " + ec.message()));
    }

    const std::uint64_t chunks = std::max<std::uint64_t>(1, (size + chunk_size - 1) / chunk_size);
    if (chunks > std::numeric_limits<std::uint32_t>::max()) {
        return Err<ChunkedFileReader>(make_error(ErrorKind::InvalidArgument,
            "chunk_size " + std::to_string(chunk_size) + " yields too many chunks for " + path.string()));
    }

    return Ok<UploadError>(ChunkedFileReader(path, std::move(input), size, chunk_size,
                                             static_cast<std::uint32_t>(chunks)));
}

UploadResult<std::optional<FileChunk>> ChunkedFileReader::next() {
    if (exhausted()) {
        return Ok<UploadError>(std::optional<FileChunk>{});
    }

    auto chunk = read_chunk(next_index_);
    if (chunk.is_error()) {
        return Err<std::optional<FileChunk>>(chunk.error());
    }

    ++next_index_;
    return Ok<UploadError>(std::optional<FileChunk>(chunk.take_value()));
}

UploadResult<FileChunk> ChunkedFileReader::read_chunk(std::uint32_t index) {
    if (index >= chunk_count_) {
        return Err<FileChunk>(make_error(ErrorKind::InvalidArgument,
            "chunk index " + std::to_string(index) + " out of range for " + path_.string()));
    }

    const std::uint64_t offset = static_cast<std::uint64_t>(index) * chunk_size_;
    const std::uint64_t length = std::min(chunk_size_, file_size_ - offset);

    FileChunk chunk;
    chunk.part_number = index + 1;
    chunk.offset = offset;
    chunk.bytes.resize(static_cast<std::size_t>(length));

    if (length > 0) {
        stream_.clear();
        stream_.seekg(static_cast<std::streamoff>(offset));
        if (!stream_) {
            return Err<FileChunk>(make_error(ErrorKind::Io,
                "Failed to seek to offset " + std::to_string(offset) + " in " + path_.string()));
        }

        stream_.read(reinterpret_cast<char*>(chunk.bytes.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::uint64_t>(stream_.gcount()) != length) {
            return Err<FileChunk>(make_error(ErrorKind::Io,
                "Short read of part " + std::to_string(chunk.part_number) + " from " + path_.string()));
        }
    }

    auto checksum = sha256_hex(chunk.bytes);
    if (checksum.is_error()) {
        return Err<FileChunk>(make_error(ErrorKind::Io, checksum.error()));
    }
    chunk.checksum = checksum.take_value();
    return Ok<UploadError>(std::move(chunk));
}

} // namespace chunkup::upload
