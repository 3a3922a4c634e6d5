#include "chunkup/upload/scheduler.hpp"
#include "chunkup/events/events.hpp"
#include "chunkup/upload/chunked_file_reader.hpp"
#include "chunkup/upload/coordinator.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace chunkup::upload {

bool is_retryable(const TransactionOutcome& outcome) {
    if (!outcome.is_aborted()) {
        return false;
    }

    const auto& aborted = outcome.aborted();
    if (aborted.abort_failed()) {
        return false;
    }

    switch (aborted.cause.kind) {
        case ErrorKind::Initiation:
        case ErrorKind::Part:
        case ErrorKind::Io:
        case ErrorKind::Completion:
        case ErrorKind::Put:
            return true;
        default:
            return false;
    }
}

std::shared_ptr<BatchUploadScheduler> BatchUploadScheduler::create(asio::any_io_executor executor,
                                                                   std::shared_ptr<storage::ObjectStore> store,
                                                                   Options options,
                                                                   ProgressSender progress,
                                                                   std::shared_ptr<ProgressCallback> callback,
                                                                   events::EventBus& bus) {
    return std::shared_ptr<BatchUploadScheduler>(new BatchUploadScheduler(
        std::move(executor), std::move(store), std::move(options), std::move(progress), std::move(callback), bus));
}

BatchUploadScheduler::BatchUploadScheduler(asio::any_io_executor executor,
                                           std::shared_ptr<storage::ObjectStore> store,
                                           Options options,
                                           ProgressSender progress,
                                           std::shared_ptr<ProgressCallback> callback,
                                           events::EventBus& bus)
    : executor_(executor),
      strand_(asio::make_strand(executor)),
      store_(std::move(store)),
      options_(std::move(options)),
      progress_(std::move(progress)),
      callback_(callback ? std::move(callback) : std::make_shared<NoProgress>()),
      bus_(&bus) {
    if (!options_.retry) {
        options_.retry = std::make_shared<NoRetry>();
    }
}

UploadResult<void> BatchUploadScheduler::start(std::vector<UploadFile> files,
                                               std::string import_id,
                                               const UploadCredential& credential,
                                               OutcomeHandler on_outcome,
                                               DoneHandler on_done) {
    if (files.empty()) {
        return Err<void>(make_error(ErrorKind::NoFiles, "no files to upload for import " + import_id));
    }
    if (options_.file_concurrency == 0 || options_.part_concurrency == 0 || options_.chunk_size == 0) {
        return Err<void>(make_error(ErrorKind::InvalidArgument, "chunk size and concurrency bounds must be > 0"));
    }
    if (credential.bucket.empty()) {
        return Err<void>(make_error(ErrorKind::InvalidArgument, "upload credential has no bucket"));
    }

    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return Err<void>(make_error(ErrorKind::InvalidArgument, "batch " + import_id + " was already started"));
    }

    import_id_ = std::move(import_id);
    encryption_.scheme = options_.encryption;
    if (encryption_.scheme == ServerSideEncryption::KMS) {
        encryption_.key_id = credential.encryption_key_id;
    }
    on_outcome_ = std::move(on_outcome);
    on_done_ = std::move(on_done);

    std::uint64_t total_bytes = 0;
    for (auto& file : files) {
        total_bytes += file.size;

        Job job;
        job.location.bucket = credential.bucket;
        job.location.key = make_upload_key(credential.key_prefix, import_id_, file.file_name);
        job.file = std::move(file);
        pending_.push_back(std::move(job));
    }

    summary_.import_id = import_id_;
    summary_.files = pending_.size();
    started_at_ = std::chrono::steady_clock::now();

    events::BatchStartedEvent event;
    event.import_id = import_id_;
    event.file_count = summary_.files;
    event.total_bytes = total_bytes;
    bus_->emit(event);

    asio::post(strand_, [self = shared_from_this()]() {
        self->launch_pending();
    });
    return Ok<UploadError>();
}

void BatchUploadScheduler::launch_pending() {
    while (active_ < options_.file_concurrency && !pending_.empty()) {
        Job job = std::move(pending_.front());
        pending_.pop_front();
        ++active_;
        run_job(std::move(job));
    }
}

void BatchUploadScheduler::run_job(Job job) {
    job.started_at = std::chrono::steady_clock::now();
    if (job.file.size < options_.min_part_size) {
        run_put(std::move(job));
    } else {
        run_multipart(std::move(job));
    }
}

void BatchUploadScheduler::run_multipart(Job job) {
    MultipartUploadCoordinator::Options options;
    options.chunk_size = options_.chunk_size;
    options.part_concurrency = options_.part_concurrency;
    options.encryption = encryption_;

    auto self = shared_from_this();
    auto created = MultipartUploadCoordinator::create(executor_, store_, job.file, import_id_, job.location,
                                                      options, progress_, callback_, *bus_);
    if (created.is_error()) {
        fail_job(std::move(job), true, created.error());
        return;
    }

    auto coordinator = created.take_value();
    auto started = coordinator->start([self, job](TransactionOutcome outcome) {
        asio::post(self->strand_, [self, job, outcome = std::move(outcome)]() mutable {
            self->on_job_done(std::move(job), std::move(outcome));
        });
    });
    if (started.is_error()) {
        spdlog::error("Could not start upload of {}: {}", job.file.path.string(), started.error().describe());
        fail_job(std::move(job), true, started.error());
    }
}

void BatchUploadScheduler::run_put(Job job) {
    auto self = shared_from_this();

    auto fail = [&](UploadError cause) {
        fail_job(std::move(job), false, std::move(cause));
    };

    // One chunk spanning the whole file
    auto reader = ChunkedFileReader::open(job.file.path, std::max<std::uint64_t>(job.file.size, 1));
    if (reader.is_error()) {
        fail(reader.error());
        return;
    }
    if (reader.value().chunk_count() != 1) {
        fail(make_error(ErrorKind::Io, job.file.path.string() + " changed size since it was scheduled"));
        return;
    }

    auto chunk = reader.value().next();
    if (chunk.is_error()) {
        fail(chunk.error());
        return;
    }
    if (!chunk.value().has_value()) {
        fail(make_error(ErrorKind::Io, "Nothing read from " + job.file.path.string()));
        return;
    }

    spdlog::debug("Uploading {} with a single put ({} bytes)", job.file.path.string(), job.file.size);

    auto location = job.location;
    store_->async_put_object(location, std::move(chunk.value()->bytes), encryption_,
        [self, job](Result<std::string> result) {
            asio::post(self->strand_, [self, job, result = std::move(result)]() mutable {
                TransactionOutcome outcome;
                outcome.file = job.file;
                outcome.multipart = false;

                if (result.is_error()) {
                    AbortedTransaction aborted;
                    aborted.cause = make_error(ErrorKind::Put,
                        "put of " + job.file.path.string() + " failed: " + result.error());
                    outcome.result = std::move(aborted);

                    events::TransactionAbortedEvent event;
                    event.file_id = job.file.path.string();
                    event.cause = outcome.aborted().cause;
                    self->bus_->emit(event);
                } else {
                    self->publish_put_progress(job);

                    events::TransactionCompletedEvent event;
                    event.file_id = job.file.path.string();
                    event.total_bytes = job.file.size;
                    event.parts = 1;
                    event.multipart = false;
                    event.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - job.started_at);
                    self->bus_->emit(event);

                    CompletedTransaction completed;
                    completed.receipt = result.take_value();
                    outcome.result = std::move(completed);
                }

                self->on_job_done(std::move(job), std::move(outcome));
            });
        });
}

void BatchUploadScheduler::fail_job(Job job, bool multipart, UploadError cause) {
    TransactionOutcome outcome;
    outcome.file = job.file;
    outcome.multipart = multipart;
    AbortedTransaction aborted;
    aborted.cause = std::move(cause);
    outcome.result = std::move(aborted);

    asio::post(strand_, [self = shared_from_this(), job = std::move(job), outcome = std::move(outcome)]() mutable {
        self->on_job_done(std::move(job), std::move(outcome));
    });
}

void BatchUploadScheduler::publish_put_progress(const Job& job) {
    ProgressUpdate update;
    update.part_number = 1;
    update.multipart = false;
    update.import_id = import_id_;
    update.file_id = job.file.path.string();
    update.bytes_sent = job.file.size;
    update.file_size = job.file.size;

    try {
        callback_->on_update(update);
    } catch (const std::exception& e) {
        spdlog::warn("Progress callback threw for {}: {}", update.file_id, e.what());
    }
    progress_.send(std::move(update));
}

void BatchUploadScheduler::on_job_done(Job job, TransactionOutcome outcome) {
    outcome.attempts = job.attempt;

    if (outcome.is_aborted() && options_.retry->should_retry(outcome, job.attempt)) {
        spdlog::warn("Retrying {} (attempt {} failed: {})",
                     job.file.path.string(), job.attempt, outcome.aborted().cause.describe());
        ++job.attempt;
        run_job(std::move(job));
        return;
    }

    --active_;
    if (outcome.is_completed()) {
        ++summary_.completed;
        summary_.bytes_uploaded += job.file.size;
    } else {
        ++summary_.aborted;
        if (outcome.aborted().abort_failed()) {
            ++summary_.abort_failures;
        }
    }

    if (on_outcome_) {
        on_outcome_(std::move(outcome));
    }

    launch_pending();

    if (summary_.completed + summary_.aborted < summary_.files) {
        return;
    }

    summary_.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);

    events::BatchCompletedEvent event;
    event.import_id = summary_.import_id;
    event.completed = summary_.completed;
    event.aborted = summary_.aborted;
    event.duration = summary_.duration;
    bus_->emit(event);

    auto done = std::move(on_done_);
    on_done_ = nullptr;
    if (done) {
        done(summary_);
    }
}

} // namespace chunkup::upload
