#pragma once

#include "chunkup/config/config.hpp"
#include "chunkup/core/error.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/events/event_queue.hpp"
#include "chunkup/storage/object_store.hpp"
#include "chunkup/upload/progress.hpp"
#include "chunkup/upload/scheduler.hpp"
#include "chunkup/upload/types.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/thread_pool.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkup::upload {

namespace asio = boost::asio;

/**
 * @brief Blocking view over the outcomes of one batch
 *
 * Outcomes arrive in completion order. next() returns std::nullopt once
 * every file of the batch was reported.
 *
 * THREAD SAFETY: One consumer at a time.
 */
class OutcomeStream {
public:
    /// BLOCKS: until the next outcome or the end of the batch
    std::optional<TransactionOutcome> next();

    /// Drains the stream; blocks until the batch is done.
    std::vector<TransactionOutcome> collect();

    /// Set once the batch finished.
    std::optional<BatchSummary> summary() const;

private:
    friend class Uploader;

    struct State {
        events::ThreadSafeQueue<TransactionOutcome> outcomes;
        mutable std::mutex mutex;
        std::optional<BatchSummary> summary;
    };

    explicit OutcomeStream(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

/**
 * @brief Entry point for uploading batches of files
 *
 * Owns the worker threads every transaction runs on and the batch-wide
 * progress channel; the store is shared with the caller.
 *
 * USAGE:
 * Uploader uploader(config, store, bus);
 * auto tracker = uploader.progress();
 * auto stream = uploader.upload(files, import_id, credential);
 * while (auto outcome = stream.value().next()) { ... }
 */
class Uploader {
public:
    Uploader(config::UploaderConfig config,
             std::shared_ptr<storage::ObjectStore> store,
             events::EventBus& bus);

    /// Waits for running batches.
    ~Uploader();

    Uploader(const Uploader&) = delete;
    Uploader& operator=(const Uploader&) = delete;

    /**
     * @brief Hand out the tracker fed by every batch of this uploader
     *
     * FAILS WITH: InvalidArgument on the second call
     */
    UploadResult<ProgressTracker> progress();

    /**
     * @brief Start uploading `files` under `<key_prefix>/data/<import_id>/`
     *
     * FAILS WITH: NoFiles for an empty batch, InvalidArgument for a bad
     * credential (no store call made)
     */
    UploadResult<OutcomeStream> upload(std::vector<UploadFile> files,
                                       std::string import_id,
                                       const UploadCredential& credential,
                                       std::shared_ptr<ProgressCallback> callback = nullptr);

    /// Waits for every batch to finish; no upload() may follow.
    void wait();

    asio::any_io_executor executor() { return pool_.get_executor(); }

    const config::UploaderConfig& config() const noexcept { return config_; }

private:
    config::UploaderConfig config_;
    std::shared_ptr<storage::ObjectStore> store_;
    events::EventBus* bus_;
    asio::thread_pool pool_;

    std::mutex mutex_;
    ProgressSender sender_;
    std::optional<ProgressReceiver> receiver_;
};

} // namespace chunkup::upload
