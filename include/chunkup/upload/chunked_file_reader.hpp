#pragma once

#include "chunkup/core/error.hpp"
#include "chunkup/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>

namespace chunkup::upload {

/**
 * @brief Splits a file on disk into fixed-size, checksummed chunks
 *
 * Chunk i covers bytes [i * chunk_size, min((i + 1) * chunk_size, size)) and
 * carries part number i + 1. The last chunk may be short. A zero-byte file
 * still yields one (empty) chunk so that it can be sent as a single part.
 *
 * The sequence is deterministic: rewind() or re-opening the file replays
 * the same chunks. Reads are lazy, one chunk per next() call, so at most
 * one chunk's worth of memory is held per call.
 *
 * THREAD SAFETY: None. A reader belongs to exactly one transaction.
 */
class ChunkedFileReader {
public:
    static UploadResult<ChunkedFileReader> open(const std::filesystem::path& path,
                                                std::uint64_t chunk_size);

    ChunkedFileReader(ChunkedFileReader&&) = default;
    ChunkedFileReader& operator=(ChunkedFileReader&&) = default;

    ChunkedFileReader(const ChunkedFileReader&) = delete;
    ChunkedFileReader& operator=(const ChunkedFileReader&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t file_size() const noexcept { return file_size_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint32_t chunk_count() const noexcept { return chunk_count_; }
    [[nodiscard]] bool exhausted() const noexcept { return next_index_ >= chunk_count_; }

    /**
     * @brief Read the next chunk in part-number order
     *
     * RETURNS: the chunk, std::nullopt once every chunk was produced, or an
     * Io error if the file could not be seeked or read in full.
     */
    UploadResult<std::optional<FileChunk>> next();

    /// Random access to chunk `index` (0-based); does not move the cursor.
    UploadResult<FileChunk> read_chunk(std::uint32_t index);

    /// Restart the sequence from the first chunk.
    void rewind() noexcept { next_index_ = 0; }

private:
    ChunkedFileReader(std::filesystem::path path,
                      std::ifstream stream,
                      std::uint64_t file_size,
                      std::uint64_t chunk_size,
                      std::uint32_t chunk_count);

    std::filesystem::path path_;
    std::ifstream stream_;
    std::uint64_t file_size_ = 0;
    std::uint64_t chunk_size_ = 0;
    std::uint32_t chunk_count_ = 0;
    std::uint32_t next_index_ = 0;
};

} // namespace chunkup::upload
