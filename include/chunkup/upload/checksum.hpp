#pragma once

#include "chunkup/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkup::upload {

/// Lower-case hex SHA-256 digest of `size` bytes at `data`.
Result<std::string> sha256_hex(const std::uint8_t* data, std::size_t size);

inline Result<std::string> sha256_hex(const std::vector<std::uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

} // namespace chunkup::upload
