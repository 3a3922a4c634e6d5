#pragma once

#include "chunkup/core/error.hpp"
#include "chunkup/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkup::config {

/**
 * @brief Tunables of the upload engine
 *
 * JSON form (every key optional):
 * {
 *   "chunk_size": 5242880,
 *   "min_part_size": 5242880,
 *   "part_concurrency": 3,
 *   "file_concurrency": 4,
 *   "worker_threads": 4,
 *   "progress_capacity": 0,
 *   "encryption": "aws:kms",
 *   "max_attempts": 1,
 *   "log_level": "info"
 * }
 */
struct UploaderConfig {
    std::uint64_t chunk_size = upload::kMinPartSize;
    std::uint64_t min_part_size = upload::kMinPartSize;   ///< Files below this are sent with a single put
    std::size_t part_concurrency = upload::kDefaultPartConcurrency;
    std::size_t file_concurrency = upload::kDefaultFileConcurrency;
    std::size_t worker_threads = 4;
    std::size_t progress_capacity = 0;                    ///< 0 = unbounded progress channel
    upload::ServerSideEncryption encryption = upload::ServerSideEncryption::KMS;
    std::size_t max_attempts = 1;                         ///< 1 = never retry a file
    std::string log_level = "info";
};

/**
 * @brief Check the bounds of a configuration
 *
 * FAILS WITH: InvalidArgument for zero sizes, bounds or attempts, for a
 * chunk size below the minimum part size, or for an unknown log level
 */
UploadResult<void> validate(const UploaderConfig& config);

/// Parses and validates; missing keys keep their defaults.
UploadResult<UploaderConfig> config_from_json(const nlohmann::json& json);

/// Reads a JSON file, then behaves like config_from_json().
UploadResult<UploaderConfig> load_config(const std::filesystem::path& path);

nlohmann::json to_json(const UploaderConfig& config);

/// "aws:kms" or "AES256".
UploadResult<upload::ServerSideEncryption> parse_encryption(const std::string& name);

/**
 * @brief Parse the temporary credentials issued for one batch
 *
 * Accepts the platform's response body:
 * {
 *   "tempCredentials": {"accessKey": "...", "secretKey": "...",
 *                       "sessionToken": "...", "region": "..."},
 *   "encryptionKeyId": "...",
 *   "s3Bucket": "...",
 *   "s3Key": "<key prefix>"
 * }
 */
UploadResult<upload::UploadCredential> credential_from_json(const nlohmann::json& json);

/// Set the level of spdlog's default logger ("trace" .. "off").
UploadResult<void> configure_logging(const std::string& level);

} // namespace chunkup::config
