#include "chunkup/upload/coordinator.hpp"
#include "chunkup/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <chrono>

namespace chunkup::upload {
namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

UploadResult<std::shared_ptr<MultipartUploadCoordinator>> MultipartUploadCoordinator::create(
    asio::any_io_executor executor,
    std::shared_ptr<storage::ObjectStore> store,
    UploadFile file,
    std::string import_id,
    ObjectLocation location,
    Options options,
    ProgressSender progress,
    std::shared_ptr<ProgressCallback> callback,
    events::EventBus& bus) {
    using Ptr = std::shared_ptr<MultipartUploadCoordinator>;

    if (options.part_concurrency == 0) {
        return Err<Ptr>(make_error(ErrorKind::InvalidArgument, "part concurrency must be at least 1"));
    }

    auto reader = ChunkedFileReader::open(file.path, options.chunk_size);
    if (reader.is_error()) {
        return Err<Ptr>(reader.error());
    }

    if (reader.value().chunk_count() > kMaxPartCount) {
        return Err<Ptr>(make_error(ErrorKind::InvalidArgument,
            file.path.string() + " needs " + std::to_string(reader.value().chunk_count()) +
            " parts, more than the " + std::to_string(kMaxPartCount) + " allowed; raise the chunk size"));
    }

    // Private constructor: make_shared cannot reach it
    Ptr coordinator(new MultipartUploadCoordinator(
        std::move(executor), std::move(store), std::move(file), std::move(import_id), std::move(location),
        std::move(options), reader.take_value(), std::move(progress), std::move(callback), bus));
    return Ok<UploadError>(std::move(coordinator));
}

MultipartUploadCoordinator::MultipartUploadCoordinator(asio::any_io_executor executor,
                                                       std::shared_ptr<storage::ObjectStore> store,
                                                       UploadFile file,
                                                       std::string import_id,
                                                       ObjectLocation location,
                                                       Options options,
                                                       ChunkedFileReader reader,
                                                       ProgressSender progress,
                                                       std::shared_ptr<ProgressCallback> callback,
                                                       events::EventBus& bus)
    : strand_(asio::make_strand(std::move(executor))),
      store_(std::move(store)),
      file_(std::move(file)),
      options_(std::move(options)),
      reader_(std::move(reader)),
      transaction_(file_.path.string(), std::move(location)),
      target_(std::make_shared<PartTarget>()),
      uploader_(strand_, store_, std::move(progress), std::move(callback), bus),
      bus_(&bus) {
    target_->location = transaction_.location();
    target_->import_id = std::move(import_id);
    target_->file_id = transaction_.file_id();
    target_->file_size = file_.size;
}

UploadResult<void> MultipartUploadCoordinator::start(OutcomeHandler handler) {
    Mode expected = Mode::Idle;
    if (!mode_.compare_exchange_strong(expected, Mode::Driven)) {
        return Err<void>(make_error(ErrorKind::InvalidArgument,
            "upload of " + transaction_.file_id() + " was already started"));
    }

    outcome_handler_ = std::move(handler);

    auto self = shared_from_this();
    asio::post(strand_, [self]() {
        self->do_initiate([self](UploadResult<std::string> session) {
            if (session.is_error()) {
                AbortedTransaction aborted;
                aborted.cause = session.error();
                self->finish(std::move(aborted));
                return;
            }

            self->do_upload_parts([self](UploadResult<std::vector<CompletedPart>> parts) {
                if (parts.is_error()) {
                    self->abort_with_cause(parts.error());
                    return;
                }

                self->do_complete([self](UploadResult<std::string> receipt) {
                    if (receipt.is_error()) {
                        // Completion was rejected: the stored parts still cost money
                        self->abort_with_cause(receipt.error());
                        return;
                    }

                    CompletedTransaction completed;
                    completed.session_id = self->transaction_.last_session_id();
                    completed.receipt = receipt.take_value();
                    completed.parts = self->transaction_.sorted_parts();
                    self->finish(std::move(completed));
                });
            });
        });
    });

    return Ok<UploadError>();
}

bool MultipartUploadCoordinator::claim_stepping() {
    Mode expected = Mode::Idle;
    if (mode_.compare_exchange_strong(expected, Mode::Stepped)) {
        return true;
    }
    return expected == Mode::Stepped;
}

void MultipartUploadCoordinator::async_initiate(SessionHandler handler) {
    if (!claim_stepping()) {
        asio::post(strand_, [handler = std::move(handler)]() {
            handler(Err<std::string>(make_error(ErrorKind::InvalidArgument, "transaction is driven by start()")));
        });
        return;
    }

    asio::post(strand_, [self = shared_from_this(), handler = std::move(handler)]() mutable {
        self->do_initiate(std::move(handler));
    });
}

void MultipartUploadCoordinator::async_upload_parts(PartsHandler handler) {
    if (!claim_stepping()) {
        asio::post(strand_, [handler = std::move(handler)]() {
            handler(Err<std::vector<CompletedPart>>(
                make_error(ErrorKind::InvalidArgument, "transaction is driven by start()")));
        });
        return;
    }

    asio::post(strand_, [self = shared_from_this(), handler = std::move(handler)]() mutable {
        self->do_upload_parts(std::move(handler));
    });
}

void MultipartUploadCoordinator::async_complete(ReceiptHandler handler) {
    if (!claim_stepping()) {
        asio::post(strand_, [handler = std::move(handler)]() {
            handler(Err<std::string>(make_error(ErrorKind::InvalidArgument, "transaction is driven by start()")));
        });
        return;
    }

    asio::post(strand_, [self = shared_from_this(), handler = std::move(handler)]() mutable {
        self->do_complete(std::move(handler));
    });
}

void MultipartUploadCoordinator::async_abort(ReceiptHandler handler) {
    if (!claim_stepping()) {
        asio::post(strand_, [handler = std::move(handler)]() {
            handler(Err<std::string>(make_error(ErrorKind::InvalidArgument, "transaction is driven by start()")));
        });
        return;
    }

    asio::post(strand_, [self = shared_from_this(), handler = std::move(handler)]() mutable {
        self->do_abort(std::move(handler));
    });
}

// ════════════════════════════════════════════════════════
// Stages (always run on the strand)
// ════════════════════════════════════════════════════════

void MultipartUploadCoordinator::do_initiate(SessionHandler handler) {
    if (transaction_.state() != TransactionState::Uninitiated) {
        handler(Err<std::string>(make_error(ErrorKind::InvalidArgument,
            "upload of " + transaction_.file_id() + " was already initiated")));
        return;
    }

    spdlog::debug("Creating multipart upload for {} -> {}/{}",
                  transaction_.file_id(), transaction_.location().bucket, transaction_.location().key);

    auto self = shared_from_this();
    store_->async_create_multipart_upload(transaction_.location(), options_.encryption,
        [self, handler = std::move(handler)](Result<std::string> result) mutable {
            asio::post(self->strand_, [self, handler = std::move(handler), result = std::move(result)]() mutable {
                auto& transaction = self->transaction_;

                std::optional<UploadError> failure;
                if (result.is_error()) {
                    failure = make_error(ErrorKind::Initiation,
                        "could not create multipart upload for " + transaction.file_id() + ": " + result.error());
                } else {
                    auto initiated = transaction.initiate(result.take_value());
                    if (initiated.is_error()) {
                        failure = make_error(ErrorKind::Initiation, initiated.error().message);
                    }
                }

                if (failure) {
                    // No session exists, so there is nothing to abort on the store
                    auto closed = transaction.transition_to(TransactionState::Aborted);
                    if (closed.is_error()) {
                        spdlog::error("{}", closed.error().describe());
                    }
                    spdlog::warn("Upload of {} failed before it started: {}", transaction.file_id(), failure->message);

                    events::TransactionAbortedEvent event;
                    event.file_id = transaction.file_id();
                    event.cause = *failure;
                    self->bus_->emit(event);

                    handler(Err<std::string>(std::move(*failure)));
                    return;
                }

                const std::string& session_id = *transaction.session_id();
                self->target_->session_id = session_id;

                spdlog::info("Initiated multipart upload for {} (session {}, {} parts)",
                             transaction.file_id(), session_id, self->reader_.chunk_count());

                events::TransactionStartedEvent event;
                event.file_id = transaction.file_id();
                event.session_id = session_id;
                event.total_bytes = self->file_.size;
                event.total_parts = self->reader_.chunk_count();
                self->bus_->emit(event);

                handler(Ok<UploadError>(session_id));
            });
        });
}

void MultipartUploadCoordinator::do_upload_parts(PartsHandler handler) {
    auto session = transaction_.require_session();
    if (session.is_error()) {
        handler(Err<std::vector<CompletedPart>>(session.error()));
        return;
    }

    auto moved = transaction_.transition_to(TransactionState::PartsInFlight);
    if (moved.is_error()) {
        handler(Err<std::vector<CompletedPart>>(moved.error()));
        return;
    }

    parts_handler_ = std::move(handler);
    dispatch_parts();
}

void MultipartUploadCoordinator::dispatch_parts() {
    // Chunks are read only when a slot is free, so memory stays bounded by
    // part_concurrency chunks no matter how large the file is.
    while (!first_error_ && in_flight_ < options_.part_concurrency && !reader_.exhausted()) {
        auto chunk = reader_.next();
        if (chunk.is_error()) {
            spdlog::warn("Stopped reading {}: {}", transaction_.file_id(), chunk.error().message);
            first_error_ = chunk.error();
            target_->draining = true;
            break;
        }
        if (!chunk.value().has_value()) {
            break;
        }

        ++in_flight_;
        uploader_.async_upload(target_, std::move(*chunk.value()),
            [self = shared_from_this()](UploadResult<CompletedPart> result) {
                self->on_part_done(std::move(result));
            });
    }

    if (in_flight_ == 0 && (first_error_ || reader_.exhausted())) {
        finish_parts();
    }
}

void MultipartUploadCoordinator::on_part_done(UploadResult<CompletedPart> result) {
    --in_flight_;

    if (result.is_ok()) {
        transaction_.add_part(result.take_value());
    } else if (!first_error_) {
        spdlog::warn("Part upload failed, no further parts of {} will be sent: {}",
                     transaction_.file_id(), result.error().message);
        first_error_ = result.error();
        target_->draining = true;
    } else {
        spdlog::debug("Discarding result of drained part: {}", result.error().message);
    }

    dispatch_parts();
}

void MultipartUploadCoordinator::finish_parts() {
    if (!parts_handler_) {
        return;
    }
    auto handler = std::move(parts_handler_);
    parts_handler_ = nullptr;

    if (first_error_) {
        handler(Err<std::vector<CompletedPart>>(*first_error_));
        return;
    }

    parts_uploaded_ = true;
    handler(Ok<UploadError>(transaction_.sorted_parts()));
}

void MultipartUploadCoordinator::do_complete(ReceiptHandler handler) {
    auto session = transaction_.require_session();
    if (session.is_error()) {
        handler(Err<std::string>(session.error()));
        return;
    }

    if (!parts_uploaded_) {
        handler(Err<std::string>(make_error(ErrorKind::InvalidArgument,
            "cannot complete " + transaction_.file_id() + " before every part was uploaded")));
        return;
    }

    auto moved = transaction_.transition_to(TransactionState::Completing);
    if (moved.is_error()) {
        handler(Err<std::string>(moved.error()));
        return;
    }

    const std::string session_id = *transaction_.session_id();
    auto parts = transaction_.sorted_parts();
    spdlog::debug("Completing {} with {} parts (session {})", transaction_.file_id(), parts.size(), session_id);

    auto self = shared_from_this();
    store_->async_complete_multipart_upload(session_id, transaction_.location(), std::move(parts),
        [self, handler = std::move(handler)](Result<std::string> result) mutable {
            asio::post(self->strand_, [self, handler = std::move(handler), result = std::move(result)]() mutable {
                auto& transaction = self->transaction_;

                if (result.is_error()) {
                    handler(Err<std::string>(make_error(ErrorKind::Completion,
                        "completing upload of " + transaction.file_id() + " failed: " + result.error())));
                    return;
                }

                auto closed = transaction.transition_to(TransactionState::Completed);
                if (closed.is_error()) {
                    handler(Err<std::string>(closed.error()));
                    return;
                }
                self->target_->session_id.reset();

                events::TransactionCompletedEvent event;
                event.file_id = transaction.file_id();
                event.session_id = transaction.last_session_id();
                event.total_bytes = self->file_.size;
                event.parts = static_cast<std::uint32_t>(transaction.parts().size());
                event.multipart = true;
                event.duration = elapsed_since(transaction.started_at());
                self->bus_->emit(event);

                handler(Ok<UploadError>(result.take_value()));
            });
        });
}

void MultipartUploadCoordinator::do_abort(ReceiptHandler handler) {
    auto session = transaction_.require_session();
    if (session.is_error()) {
        handler(Err<std::string>(session.error()));
        return;
    }

    auto moved = transaction_.transition_to(TransactionState::Aborting);
    if (moved.is_error()) {
        handler(Err<std::string>(moved.error()));
        return;
    }

    const std::string session_id = *transaction_.session_id();
    spdlog::info("Aborting multipart upload of {} (session {})", transaction_.file_id(), session_id);

    auto self = shared_from_this();
    store_->async_abort_multipart_upload(session_id, transaction_.location(),
        [self, session_id, handler = std::move(handler)](Result<std::string> result) mutable {
            asio::post(self->strand_, [self, session_id, handler = std::move(handler),
                                       result = std::move(result)]() mutable {
                auto& transaction = self->transaction_;

                auto closed = transaction.transition_to(TransactionState::Aborted);
                if (closed.is_error()) {
                    spdlog::error("{}", closed.error().describe());
                }
                self->target_->session_id.reset();

                events::TransactionAbortedEvent event;
                event.file_id = transaction.file_id();
                event.session_id = session_id;
                event.cause = self->first_error_.value_or(
                    make_error(ErrorKind::Abort, "upload of " + transaction.file_id() + " aborted by caller"));

                if (result.is_error()) {
                    auto error = make_error(ErrorKind::Abort,
                        "abort of session " + session_id + " for " + transaction.file_id() +
                        " failed, server-side state unknown: " + result.error());
                    event.abort_error = error;
                    self->bus_->emit(event);
                    handler(Err<std::string>(std::move(error)));
                    return;
                }

                self->bus_->emit(event);
                handler(Ok<UploadError>(result.take_value()));
            });
        });
}

void MultipartUploadCoordinator::abort_with_cause(UploadError cause) {
    if (!first_error_) {
        first_error_ = cause;
    }

    do_abort([self = shared_from_this(), cause](UploadResult<std::string> result) {
        AbortedTransaction aborted;
        aborted.cause = cause;
        if (result.is_ok()) {
            aborted.abort_receipt = result.take_value();
        } else {
            aborted.abort_error = result.error();
        }
        self->finish(std::move(aborted));
    });
}

void MultipartUploadCoordinator::finish(std::variant<CompletedTransaction, AbortedTransaction> result) {
    if (!outcome_handler_) {
        return;
    }
    auto handler = std::move(outcome_handler_);
    outcome_handler_ = nullptr;

    TransactionOutcome outcome;
    outcome.file = file_;
    outcome.multipart = true;
    outcome.result = std::move(result);
    handler(std::move(outcome));
}

} // namespace chunkup::upload
