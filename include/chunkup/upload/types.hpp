#pragma once

#include "chunkup/core/error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chunkup::upload {

constexpr std::uint64_t kKiB = 1024;
constexpr std::uint64_t kMiB = kKiB * kKiB;

/// Smallest part the backend accepts in a multipart upload (the last part is exempt).
constexpr std::uint64_t kMinPartSize = 5 * kMiB;

/// Largest part number the backend accepts.
constexpr std::uint32_t kMaxPartCount = 10000;

constexpr std::size_t kDefaultPartConcurrency = 3;
constexpr std::size_t kDefaultFileConcurrency = 4;

/**
 * @brief One checksummed slice of a file, ready to be sent as a part
 */
struct FileChunk {
    std::uint32_t part_number = 0;   ///< 1-based
    std::uint64_t offset = 0;        ///< Byte offset of the chunk within the file
    std::vector<std::uint8_t> bytes;
    std::string checksum;            ///< Hex SHA-256 of `bytes`
};

/**
 * @brief Proof of receipt for one uploaded part
 */
struct CompletedPart {
    std::uint32_t part_number = 0;
    std::string entity_tag;
};

inline bool operator<(const CompletedPart& lhs, const CompletedPart& rhs) {
    return lhs.part_number < rhs.part_number;
}

struct ObjectLocation {
    std::string bucket;
    std::string key;
};

enum class ServerSideEncryption {
    KMS,
    AES256
};

/// Wire name of the encryption scheme ("aws:kms" / "AES256").
const char* to_string(ServerSideEncryption encryption) noexcept;

struct EncryptionSettings {
    ServerSideEncryption scheme = ServerSideEncryption::KMS;
    std::string key_id;   ///< KMS key id, empty for AES256
};

/**
 * @brief Temporary, scoped credentials issued by the platform for one batch
 */
struct UploadCredential {
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    std::string region;
    std::string bucket;
    std::string key_prefix;
    std::string encryption_key_id;
};

/// "<key_prefix>/data/<import_id>/<file_name>"
std::string make_upload_key(const std::string& key_prefix,
                            const std::string& import_id,
                            const std::string& file_name);

/**
 * @brief A local file scheduled for upload
 */
struct UploadFile {
    std::filesystem::path path;
    std::string file_name;
    std::uint64_t size = 0;

    /// Resolves `path`, checks that it is a regular file and captures its size.
    static UploadResult<UploadFile> from_path(const std::filesystem::path& path);
};

// ════════════════════════════════════════════════════════
// Transaction outcomes
// ════════════════════════════════════════════════════════

struct CompletedTransaction {
    std::string session_id;   ///< Empty for single-shot puts
    std::string receipt;
    std::vector<CompletedPart> parts;
};

struct AbortedTransaction {
    UploadError cause;
    std::optional<std::string> abort_receipt;   ///< Set when the abort call succeeded
    std::optional<UploadError> abort_error;     ///< Set when the abort call itself failed

    /// True when the server-side multipart state is unknown.
    [[nodiscard]] bool abort_failed() const noexcept { return abort_error.has_value(); }
};

/**
 * @brief Terminal state of one file's upload
 */
struct TransactionOutcome {
    UploadFile file;
    bool multipart = false;
    std::size_t attempts = 1;
    std::variant<CompletedTransaction, AbortedTransaction> result;

    [[nodiscard]] bool is_completed() const noexcept { return result.index() == 0; }
    [[nodiscard]] bool is_aborted() const noexcept { return result.index() == 1; }

    const CompletedTransaction& completed() const { return std::get<CompletedTransaction>(result); }
    const AbortedTransaction& aborted() const { return std::get<AbortedTransaction>(result); }
};

} // namespace chunkup::upload
