#pragma once

#include "chunkup/core/error.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/storage/object_store.hpp"
#include "chunkup/upload/progress.hpp"
#include "chunkup/upload/types.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace chunkup::upload {

namespace asio = boost::asio;

/**
 * @brief Per-transaction state shared by every part of one file
 *
 * bytes_sent is written only by PartUploader, on the transaction strand.
 * Once draining is set, parts that still land are not counted as progress.
 */
struct PartTarget {
    std::optional<std::string> session_id;
    ObjectLocation location;
    std::string import_id;
    std::string file_id;
    std::optional<std::uint64_t> file_size;
    std::uint64_t bytes_sent = 0;
    bool draining = false;
};

/**
 * @brief Uploads one chunk into one part slot of an open transaction
 *
 * Exactly one store call per async_upload(); no retries at this layer.
 * On success the file's cumulative byte counter is bumped and exactly one
 * ProgressUpdate is published (channel + callback) before the handler
 * runs. Handlers always run on the transaction strand.
 */
class PartUploader {
public:
    using Handler = std::function<void(UploadResult<CompletedPart>)>;

    PartUploader(asio::strand<asio::any_io_executor> strand,
                 std::shared_ptr<storage::ObjectStore> store,
                 ProgressSender progress,
                 std::shared_ptr<ProgressCallback> callback,
                 events::EventBus& bus);

    /**
     * @brief Upload `chunk` as part `chunk.part_number` of `target`
     *
     * FAILS WITH:
     * - MissingSession if target has no session id (no store call made)
     * - Part if the store rejected the part or the transport failed
     */
    void async_upload(std::shared_ptr<PartTarget> target, FileChunk chunk, Handler handler) const;

private:
    asio::strand<asio::any_io_executor> strand_;
    std::shared_ptr<storage::ObjectStore> store_;
    ProgressSender progress_;
    std::shared_ptr<ProgressCallback> callback_;
    events::EventBus* bus_;
};

} // namespace chunkup::upload
