#include "chunkup/upload/uploader.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::upload {

std::optional<TransactionOutcome> OutcomeStream::next() {
    return state_->outcomes.pop();
}

std::vector<TransactionOutcome> OutcomeStream::collect() {
    std::vector<TransactionOutcome> outcomes;
    while (auto outcome = next()) {
        outcomes.push_back(std::move(*outcome));
    }
    return outcomes;
}

std::optional<BatchSummary> OutcomeStream::summary() const {
    std::lock_guard lock(state_->mutex);
    return state_->summary;
}

Uploader::Uploader(config::UploaderConfig config,
                   std::shared_ptr<storage::ObjectStore> store,
                   events::EventBus& bus)
    : config_(std::move(config)),
      store_(std::move(store)),
      bus_(&bus),
      pool_(config_.worker_threads == 0 ? 1 : config_.worker_threads) {
    auto channel = make_progress_channel(config_.progress_capacity);
    sender_ = channel.first;
    receiver_.emplace(std::move(channel.second));

    spdlog::debug("Uploader ready: {} workers, chunk {} bytes, {} parts x {} files in flight",
                  config_.worker_threads, config_.chunk_size, config_.part_concurrency, config_.file_concurrency);
}

Uploader::~Uploader() {
    wait();
}

UploadResult<ProgressTracker> Uploader::progress() {
    std::lock_guard lock(mutex_);
    if (!receiver_) {
        return Err<ProgressTracker>(make_error(ErrorKind::InvalidArgument,
            "the progress tracker was already handed out"));
    }

    ProgressTracker tracker(std::move(*receiver_));
    receiver_.reset();
    return Ok<UploadError>(std::move(tracker));
}

UploadResult<OutcomeStream> Uploader::upload(std::vector<UploadFile> files,
                                             std::string import_id,
                                             const UploadCredential& credential,
                                             std::shared_ptr<ProgressCallback> callback) {
    BatchUploadScheduler::Options options;
    options.chunk_size = config_.chunk_size;
    options.min_part_size = config_.min_part_size;
    options.part_concurrency = config_.part_concurrency;
    options.file_concurrency = config_.file_concurrency;
    options.encryption = config_.encryption;
    if (config_.max_attempts > 1) {
        options.retry = std::make_shared<LimitedRetry>(config_.max_attempts);
    }

    ProgressSender sender;
    {
        std::lock_guard lock(mutex_);
        // Nobody can drain the channel until the tracker is handed out
        if (!receiver_) {
            sender = sender_;
        }
    }

    auto scheduler = BatchUploadScheduler::create(pool_.get_executor(), store_, std::move(options),
                                                  std::move(sender), std::move(callback), *bus_);

    auto state = std::make_shared<OutcomeStream::State>();
    auto started = scheduler->start(std::move(files), std::move(import_id), credential,
        [state](TransactionOutcome outcome) {
            state->outcomes.push(std::move(outcome));
        },
        [state](BatchSummary summary) {
            {
                std::lock_guard lock(state->mutex);
                state->summary = std::move(summary);
            }
            state->outcomes.shutdown();
        });

    if (started.is_error()) {
        return Err<OutcomeStream>(started.error());
    }
    return Ok<UploadError>(OutcomeStream(std::move(state)));
}

void Uploader::wait() {
    pool_.join();
}

} // namespace chunkup::upload
