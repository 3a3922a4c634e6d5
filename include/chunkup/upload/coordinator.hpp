#pragma once

#include "chunkup/core/error.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/storage/object_store.hpp"
#include "chunkup/upload/chunked_file_reader.hpp"
#include "chunkup/upload/part_uploader.hpp"
#include "chunkup/upload/progress.hpp"
#include "chunkup/upload/transaction.hpp"
#include "chunkup/upload/types.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chunkup::upload {

namespace asio = boost::asio;

/**
 * @brief Drives one file's multipart transaction from initiation to a
 * terminal state
 *
 * Lifecycle (start()):
 * 1. create multipart upload -> session id (failure is terminal, no abort)
 * 2. read chunks and upload them with at most part_concurrency in flight
 * 3. every part succeeded: complete with parts sorted by part number
 * 4. any part or read failed: stop dispatching, drain in-flight parts,
 *    abort exactly once; the first failure is kept as the cause
 * 5. completion rejected: abort to release the stored parts
 *
 * All bookkeeping happens on a private strand, so store completions that
 * arrive on arbitrary threads never race. The object keeps itself alive
 * (shared_from_this) while operations are pending.
 *
 * The step operations (async_initiate, async_upload_parts, async_complete,
 * async_abort) expose the same lifecycle one stage at a time. They cannot be
 * mixed with start().
 */
class MultipartUploadCoordinator : public std::enable_shared_from_this<MultipartUploadCoordinator> {
public:
    struct Options {
        std::uint64_t chunk_size = kMinPartSize;
        std::size_t part_concurrency = kDefaultPartConcurrency;
        EncryptionSettings encryption;
    };

    using OutcomeHandler = std::function<void(TransactionOutcome)>;
    using SessionHandler = std::function<void(UploadResult<std::string>)>;
    using PartsHandler = std::function<void(UploadResult<std::vector<CompletedPart>>)>;
    using ReceiptHandler = std::function<void(UploadResult<std::string>)>;

    /**
     * @brief Open the file and prepare a transaction
     *
     * FAILS WITH:
     * - InvalidArgument for a zero chunk size or part bound, or when the
     *   file needs more than kMaxPartCount parts
     * - Io if the file cannot be opened
     */
    static UploadResult<std::shared_ptr<MultipartUploadCoordinator>> create(
        asio::any_io_executor executor,
        std::shared_ptr<storage::ObjectStore> store,
        UploadFile file,
        std::string import_id,
        ObjectLocation location,
        Options options,
        ProgressSender progress,
        std::shared_ptr<ProgressCallback> callback,
        events::EventBus& bus);

    MultipartUploadCoordinator(const MultipartUploadCoordinator&) = delete;
    MultipartUploadCoordinator& operator=(const MultipartUploadCoordinator&) = delete;

    /**
     * @brief Run the whole lifecycle
     *
     * `handler` is invoked exactly once, on the transaction strand, with the
     * terminal outcome.
     *
     * RETURNS: InvalidArgument if the transaction was already started
     */
    UploadResult<void> start(OutcomeHandler handler);

    /// Create the multipart upload; handler receives the session id.
    void async_initiate(SessionHandler handler);

    /**
     * @brief Upload every chunk of the file
     *
     * Handler receives the collected parts sorted by part number, or the
     * first failure once every in-flight part drained.
     *
     * FAILS WITH: MissingSession if no session is open
     */
    void async_upload_parts(PartsHandler handler);

    /// FAILS WITH: MissingSession if no session is open
    void async_complete(ReceiptHandler handler);

    /// FAILS WITH: MissingSession if no session is open
    void async_abort(ReceiptHandler handler);

    const UploadFile& file() const noexcept { return file_; }
    const ObjectLocation& location() const noexcept { return transaction_.location(); }
    std::uint32_t part_count() const noexcept { return reader_.chunk_count(); }

    /// Only meaningful on the strand or once the transaction finished.
    TransactionState state() const noexcept { return transaction_.state(); }

private:
    MultipartUploadCoordinator(asio::any_io_executor executor,
                               std::shared_ptr<storage::ObjectStore> store,
                               UploadFile file,
                               std::string import_id,
                               ObjectLocation location,
                               Options options,
                               ChunkedFileReader reader,
                               ProgressSender progress,
                               std::shared_ptr<ProgressCallback> callback,
                               events::EventBus& bus);

    void do_initiate(SessionHandler handler);
    void do_upload_parts(PartsHandler handler);
    void do_complete(ReceiptHandler handler);
    void do_abort(ReceiptHandler handler);

    void dispatch_parts();
    void on_part_done(UploadResult<CompletedPart> result);
    void finish_parts();

    void abort_with_cause(UploadError cause);
    void finish(std::variant<CompletedTransaction, AbortedTransaction> result);

    enum class Mode { Idle, Driven, Stepped };

    // False once start() owns the transaction.
    bool claim_stepping();

    asio::strand<asio::any_io_executor> strand_;
    std::shared_ptr<storage::ObjectStore> store_;
    UploadFile file_;
    Options options_;
    ChunkedFileReader reader_;
    MultipartTransaction transaction_;
    std::shared_ptr<PartTarget> target_;
    PartUploader uploader_;
    events::EventBus* bus_;

    std::atomic<Mode> mode_{Mode::Idle};
    OutcomeHandler outcome_handler_;

    // Part dispatch state, owned by the strand
    PartsHandler parts_handler_;
    std::size_t in_flight_ = 0;
    bool parts_uploaded_ = false;
    std::optional<UploadError> first_error_;
};

} // namespace chunkup::upload
