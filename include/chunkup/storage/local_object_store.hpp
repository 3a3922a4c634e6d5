#pragma once

#include "chunkup/storage/object_store.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkup::storage {

namespace asio = boost::asio;

/**
 * @brief ObjectStore backed by a directory tree
 *
 * Objects land at `<root>/<bucket>/<key>`. Multipart parts are staged under
 * `<root>/.multipart/<session>/` and concatenated on completion, with the
 * same rules a real backend applies:
 * - a part's checksum is verified on receipt; its entity tag is its SHA-256
 * - completion needs a non-empty, strictly ascending part list whose
 *   entity tags match the staged parts
 * - complete and abort invalidate the session id
 *
 * Disk work runs on a private thread pool, so handlers are never invoked
 * from the initiating call.
 *
 * THREAD SAFETY: All operations may be called concurrently.
 */
class LocalObjectStore final : public ObjectStore {
public:
    explicit LocalObjectStore(std::filesystem::path root, std::size_t io_threads = 2);

    /// Waits for every pending operation.
    ~LocalObjectStore() override;

    LocalObjectStore(const LocalObjectStore&) = delete;
    LocalObjectStore& operator=(const LocalObjectStore&) = delete;

    void async_create_multipart_upload(const upload::ObjectLocation& location,
                                       const upload::EncryptionSettings& encryption,
                                       StoreHandler handler) override;

    void async_upload_part(const std::string& session_id,
                           std::uint32_t part_number,
                           const upload::ObjectLocation& location,
                           upload::FileChunk chunk,
                           StoreHandler handler) override;

    void async_complete_multipart_upload(const std::string& session_id,
                                         const upload::ObjectLocation& location,
                                         std::vector<upload::CompletedPart> parts,
                                         StoreHandler handler) override;

    void async_abort_multipart_upload(const std::string& session_id,
                                      const upload::ObjectLocation& location,
                                      StoreHandler handler) override;

    void async_put_object(const upload::ObjectLocation& location,
                          std::vector<std::uint8_t> body,
                          const upload::EncryptionSettings& encryption,
                          StoreHandler handler) override;

    const std::filesystem::path& root() const noexcept { return root_; }

    /// Where an object for `location` is (or would be) stored.
    Result<std::filesystem::path> object_path(const upload::ObjectLocation& location) const;

    /// Number of multipart sessions neither completed nor aborted.
    std::size_t open_sessions() const;

private:
    struct Session {
        upload::ObjectLocation location;
        std::map<std::uint32_t, std::string> parts;   // part number -> entity tag
    };

    Result<std::string> create_session(const upload::ObjectLocation& location);
    Result<std::string> store_part(const std::string& session_id,
                                   std::uint32_t part_number,
                                   const upload::ObjectLocation& location,
                                   const upload::FileChunk& chunk);
    Result<std::string> complete_session(const std::string& session_id,
                                         const upload::ObjectLocation& location,
                                         const std::vector<upload::CompletedPart>& parts);
    Result<std::string> abort_session(const std::string& session_id,
                                      const upload::ObjectLocation& location);
    Result<std::string> put(const upload::ObjectLocation& location,
                            const std::vector<std::uint8_t>& body);

    Result<void> check_session(const std::string& session_id, const upload::ObjectLocation& location) const;

    std::filesystem::path staging_dir(const std::string& session_id) const;
    static std::filesystem::path part_path(const std::filesystem::path& staging, std::uint32_t part_number);

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
    std::atomic<std::uint64_t> next_session_{1};
    asio::thread_pool pool_;
};

} // namespace chunkup::storage
