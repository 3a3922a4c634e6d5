#include "chunkup/storage/local_object_store.hpp"
#include "chunkup/upload/checksum.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace chunkup::storage {
namespace fs = std::filesystem;

namespace {

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(std::string("Failed to create directory: ") + parent.string());
    }
    return Ok();
}

// Writes next to `destination` and renames, so readers never see a partial object.
Result<void> write_atomically(const fs::path& destination, const std::vector<std::uint8_t>& data) {
    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return res;
    }

    fs::path temp = destination;
    temp += ".partial";

    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(std::string("Failed to create file: ") + temp.string());
        }
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!output) {
            return Err<void>(std::string("Failed to write file: ") + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, destination, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Err<void>(std::string("Failed to move file into place: ") + destination.string());
    }
    return Ok();
}

bool same_location(const upload::ObjectLocation& lhs, const upload::ObjectLocation& rhs) {
    return lhs.bucket == rhs.bucket && lhs.key == rhs.key;
}

} // namespace

LocalObjectStore::LocalObjectStore(fs::path root, std::size_t io_threads)
    : root_(std::move(root)),
      pool_(io_threads == 0 ? 1 : io_threads) {}

LocalObjectStore::~LocalObjectStore() {
    pool_.join();
}

// ════════════════════════════════════════════════════════
// Async entry points
// ════════════════════════════════════════════════════════

void LocalObjectStore::async_create_multipart_upload(const upload::ObjectLocation& location,
                                                     const upload::EncryptionSettings& encryption,
                                                     StoreHandler handler) {
    spdlog::debug("[LocalStore] create {}/{} (encryption {})", location.bucket, location.key,
                  upload::to_string(encryption.scheme));
    asio::post(pool_, [this, location, handler = std::move(handler)]() {
        handler(create_session(location));
    });
}

void LocalObjectStore::async_upload_part(const std::string& session_id,
                                         std::uint32_t part_number,
                                         const upload::ObjectLocation& location,
                                         upload::FileChunk chunk,
                                         StoreHandler handler) {
    asio::post(pool_, [this, session_id, part_number, location, chunk = std::move(chunk),
                       handler = std::move(handler)]() {
        handler(store_part(session_id, part_number, location, chunk));
    });
}

void LocalObjectStore::async_complete_multipart_upload(const std::string& session_id,
                                                       const upload::ObjectLocation& location,
                                                       std::vector<upload::CompletedPart> parts,
                                                       StoreHandler handler) {
    asio::post(pool_, [this, session_id, location, parts = std::move(parts), handler = std::move(handler)]() {
        handler(complete_session(session_id, location, parts));
    });
}

void LocalObjectStore::async_abort_multipart_upload(const std::string& session_id,
                                                    const upload::ObjectLocation& location,
                                                    StoreHandler handler) {
    asio::post(pool_, [this, session_id, location, handler = std::move(handler)]() {
        handler(abort_session(session_id, location));
    });
}

void LocalObjectStore::async_put_object(const upload::ObjectLocation& location,
                                        std::vector<std::uint8_t> body,
                                        const upload::EncryptionSettings& encryption,
                                        StoreHandler handler) {
    spdlog::debug("[LocalStore] put {}/{} ({} bytes, encryption {})", location.bucket, location.key,
                  body.size(), upload::to_string(encryption.scheme));
    asio::post(pool_, [this, location, body = std::move(body), handler = std::move(handler)]() {
        handler(put(location, body));
    });
}

// ════════════════════════════════════════════════════════
// Operations (run on the I/O pool)
// ════════════════════════════════════════════════════════

Result<fs::path> LocalObjectStore::object_path(const upload::ObjectLocation& location) const {
    if (location.bucket.empty() || location.key.empty()) {
        return Err<fs::path>(std::string("InvalidRequest: bucket and key must not be empty"));
    }

    const fs::path relative = fs::path(location.bucket) / fs::path(location.key).relative_path();
    for (const auto& element : relative) {
        if (element.string() == "..") {
            return Err<fs::path>("InvalidRequest: key escapes the bucket: " + location.key);
        }
    }
    if (location.bucket.front() == '.') {
        return Err<fs::path>("InvalidRequest: invalid bucket name: " + location.bucket);
    }

    return Ok(root_ / relative);
}

std::size_t LocalObjectStore::open_sessions() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

Result<std::string> LocalObjectStore::create_session(const upload::ObjectLocation& location) {
    if (auto path = object_path(location); path.is_error()) {
        return Err<std::string>(path.error());
    }

    const std::string session_id = "upload-" + std::to_string(next_session_.fetch_add(1));

    std::error_code ec;
    fs::create_directories(staging_dir(session_id), ec);
    if (ec) {
        return Err<std::string>("Failed to create staging area for " + session_id + ": " + ec.message());
    }

    {
        std::lock_guard lock(mutex_);
        sessions_.emplace(session_id, Session{location, {}});
    }

    return Ok(session_id);
}

Result<void> LocalObjectStore::check_session(const std::string& session_id,
                                             const upload::ObjectLocation& location) const {
    std::lock_guard lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<void>("NoSuchUpload: " + session_id);
    }
    if (!same_location(it->second.location, location)) {
        return Err<void>("InvalidRequest: session " + session_id + " belongs to another object");
    }
    return Ok();
}

Result<std::string> LocalObjectStore::store_part(const std::string& session_id,
                                                 std::uint32_t part_number,
                                                 const upload::ObjectLocation& location,
                                                 const upload::FileChunk& chunk) {
    if (part_number == 0 || part_number > upload::kMaxPartCount) {
        return Err<std::string>("InvalidArgument: part number " + std::to_string(part_number) + " out of range");
    }

    if (auto res = check_session(session_id, location); res.is_error()) {
        return Err<std::string>(res.error());
    }

    auto digest = upload::sha256_hex(chunk.bytes);
    if (digest.is_error()) {
        return Err<std::string>(digest.error());
    }
    if (!chunk.checksum.empty() && chunk.checksum != digest.value()) {
        return Err<std::string>("BadDigest: chunk hash mismatch for part " + std::to_string(part_number));
    }

    const auto staging_path = part_path(staging_dir(session_id), part_number);
    if (auto res = write_atomically(staging_path, chunk.bytes); res.is_error()) {
        return Err<std::string>(res.error());
    }

    std::lock_guard lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        // Aborted while the part was being written
        return Err<std::string>("NoSuchUpload: " + session_id);
    }
    it->second.parts[part_number] = digest.value();
    return Ok(digest.take_value());
}

Result<std::string> LocalObjectStore::complete_session(const std::string& session_id,
                                                       const upload::ObjectLocation& location,
                                                       const std::vector<upload::CompletedPart>& parts) {
    if (auto res = check_session(session_id, location); res.is_error()) {
        return Err<std::string>(res.error());
    }

    if (parts.empty()) {
        return Err<std::string>(std::string("MalformedXML: no parts given"));
    }

    {
        std::lock_guard lock(mutex_);
        const auto& staged = sessions_.at(session_id).parts;
        std::uint32_t previous = 0;
        for (const auto& part : parts) {
            if (part.part_number <= previous) {
                return Err<std::string>(std::string("InvalidPartOrder: parts must be sorted ascending"));
            }
            previous = part.part_number;

            const auto it = staged.find(part.part_number);
            if (it == staged.end() || it->second != part.entity_tag) {
                return Err<std::string>("InvalidPart: part " + std::to_string(part.part_number) + " not found");
            }
        }
    }

    auto destination = object_path(location);
    if (destination.is_error()) {
        return Err<std::string>(destination.error());
    }
    if (auto res = ensure_parent_exists(destination.value()); res.is_error()) {
        return Err<std::string>(res.error());
    }

    const auto staging = staging_dir(session_id);
    fs::path assembled = staging / "assembled";
    {
        std::ofstream output(assembled, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<std::string>("Failed to create assembly file: " + assembled.string());
        }

        for (const auto& part : parts) {
            std::ifstream input(part_path(staging, part.part_number), std::ios::binary);
            if (!input) {
                return Err<std::string>("Staged part missing: " + std::to_string(part.part_number));
            }
            // Streaming an empty rdbuf sets failbit, so empty parts are skipped
            if (input.peek() == std::ifstream::traits_type::eof()) {
                continue;
            }
            output << input.rdbuf();
            if (!output) {
                return Err<std::string>("Failed to append part " + std::to_string(part.part_number));
            }
        }
    }

    std::error_code ec;
    fs::rename(assembled, destination.value(), ec);
    if (ec) {
        return Err<std::string>("Failed to move object into place: " + destination.value().string());
    }

    {
        std::lock_guard lock(mutex_);
        sessions_.erase(session_id);
    }
    fs::remove_all(staging, ec);
    if (ec) {
        spdlog::warn("[LocalStore] Could not clean staging area {}: {}", staging.string(), ec.message());
    }

    spdlog::debug("[LocalStore] completed {}/{} from {} parts", location.bucket, location.key, parts.size());
    return Ok(location.bucket + "/" + location.key);
}

Result<std::string> LocalObjectStore::abort_session(const std::string& session_id,
                                                    const upload::ObjectLocation& location) {
    if (auto res = check_session(session_id, location); res.is_error()) {
        return Err<std::string>(res.error());
    }

    {
        std::lock_guard lock(mutex_);
        sessions_.erase(session_id);
    }

    std::error_code ec;
    fs::remove_all(staging_dir(session_id), ec);
    if (ec) {
        return Err<std::string>("Failed to remove staged parts of " + session_id + ": " + ec.message());
    }

    return Ok("aborted " + session_id);
}

Result<std::string> LocalObjectStore::put(const upload::ObjectLocation& location,
                                          const std::vector<std::uint8_t>& body) {
    auto destination = object_path(location);
    if (destination.is_error()) {
        return Err<std::string>(destination.error());
    }

    if (auto res = write_atomically(destination.value(), body); res.is_error()) {
        return Err<std::string>(res.error());
    }

    return Ok(location.bucket + "/" + location.key);
}

fs::path LocalObjectStore::staging_dir(const std::string& session_id) const {
    return root_ / ".multipart" / session_id;
}

fs::path LocalObjectStore::part_path(const fs::path& staging, std::uint32_t part_number) {
    return staging / ("part-" + std::to_string(part_number));
}

} // namespace chunkup::storage
