#pragma once

#include "chunkup/core/error.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/storage/object_store.hpp"
#include "chunkup/upload/progress.hpp"
#include "chunkup/upload/types.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace chunkup::upload {

namespace asio = boost::asio;

/// True when re-running the whole file could succeed: a transport-level
/// failure whose abort (if any) went through.
bool is_retryable(const TransactionOutcome& outcome);

/**
 * @brief Decides whether a failed file is uploaded again from scratch
 *
 * Consulted by the scheduler only; nothing below it retries.
 */
class RetryPolicy {
public:
    virtual ~RetryPolicy() = default;

    /// `attempt` is the 1-based number of the attempt that just failed.
    virtual bool should_retry(const TransactionOutcome& outcome, std::size_t attempt) const = 0;
};

class NoRetry final : public RetryPolicy {
public:
    bool should_retry(const TransactionOutcome&, std::size_t) const override { return false; }
};

/// Retries retryable failures until `max_attempts` attempts were made.
class LimitedRetry final : public RetryPolicy {
public:
    explicit LimitedRetry(std::size_t max_attempts) : max_attempts_(max_attempts) {}

    bool should_retry(const TransactionOutcome& outcome, std::size_t attempt) const override {
        return attempt < max_attempts_ && is_retryable(outcome);
    }

private:
    std::size_t max_attempts_;
};

/**
 * @brief Final accounting of a batch
 */
struct BatchSummary {
    std::string import_id;
    std::size_t files = 0;
    std::size_t completed = 0;
    std::size_t aborted = 0;
    std::size_t abort_failures = 0;   ///< Aborted files whose server-side state is unknown
    std::uint64_t bytes_uploaded = 0;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool all_completed() const noexcept { return completed == files; }
};

/**
 * @brief Uploads a batch of files, each independently
 *
 * Files below min_part_size go out with one put; larger files get their own
 * MultipartUploadCoordinator. At most file_concurrency files are in progress
 * at once, independently of each file's part bound. A failing file never
 * cancels its siblings.
 *
 * Outcomes are delivered in completion order through on_outcome, one per
 * file; on_done fires once after the last one. Both run on the scheduler's
 * strand, never concurrently with each other.
 *
 * EXAMPLE:
 * auto scheduler = BatchUploadScheduler::create(executor, store, options, sender, callback, bus);
 * scheduler->start(files, "import-1", credential,
 *     [](TransactionOutcome outcome) { ... },
 *     [](BatchSummary summary) { ... });
 */
class BatchUploadScheduler : public std::enable_shared_from_this<BatchUploadScheduler> {
public:
    struct Options {
        std::uint64_t chunk_size = kMinPartSize;
        std::uint64_t min_part_size = kMinPartSize;
        std::size_t part_concurrency = kDefaultPartConcurrency;
        std::size_t file_concurrency = kDefaultFileConcurrency;
        ServerSideEncryption encryption = ServerSideEncryption::KMS;
        std::shared_ptr<RetryPolicy> retry;   ///< nullptr = NoRetry
    };

    using OutcomeHandler = std::function<void(TransactionOutcome)>;
    using DoneHandler = std::function<void(BatchSummary)>;

    static std::shared_ptr<BatchUploadScheduler> create(asio::any_io_executor executor,
                                                        std::shared_ptr<storage::ObjectStore> store,
                                                        Options options,
                                                        ProgressSender progress,
                                                        std::shared_ptr<ProgressCallback> callback,
                                                        events::EventBus& bus);

    BatchUploadScheduler(const BatchUploadScheduler&) = delete;
    BatchUploadScheduler& operator=(const BatchUploadScheduler&) = delete;

    /**
     * @brief Begin uploading `files`
     *
     * Returns as soon as the batch is queued.
     *
     * FAILS WITH (synchronously, no store call made):
     * - NoFiles for an empty batch
     * - InvalidArgument for a second start(), zero bounds, or a credential
     *   without a bucket
     */
    UploadResult<void> start(std::vector<UploadFile> files,
                             std::string import_id,
                             const UploadCredential& credential,
                             OutcomeHandler on_outcome,
                             DoneHandler on_done);

private:
    struct Job {
        UploadFile file;
        ObjectLocation location;
        std::size_t attempt = 1;
        std::chrono::steady_clock::time_point started_at;
    };

    BatchUploadScheduler(asio::any_io_executor executor,
                         std::shared_ptr<storage::ObjectStore> store,
                         Options options,
                         ProgressSender progress,
                         std::shared_ptr<ProgressCallback> callback,
                         events::EventBus& bus);

    void launch_pending();
    void run_job(Job job);
    void run_multipart(Job job);
    void run_put(Job job);
    void on_job_done(Job job, TransactionOutcome outcome);

    /// Reports `job` as aborted without a server-side session.
    void fail_job(Job job, bool multipart, UploadError cause);

    void publish_put_progress(const Job& job);

    asio::any_io_executor executor_;
    asio::strand<asio::any_io_executor> strand_;
    std::shared_ptr<storage::ObjectStore> store_;
    Options options_;
    ProgressSender progress_;
    std::shared_ptr<ProgressCallback> callback_;
    events::EventBus* bus_;

    std::atomic<bool> started_{false};
    std::string import_id_;
    EncryptionSettings encryption_;
    OutcomeHandler on_outcome_;
    DoneHandler on_done_;

    // Owned by the strand
    std::deque<Job> pending_;
    std::size_t active_ = 0;
    BatchSummary summary_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace chunkup::upload
