#include "chunkup/upload/progress.hpp"

#include <limits>

namespace chunkup::upload {

double ProgressUpdate::percent_done() const noexcept {
    if (!file_size.has_value()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    // An empty file is complete as soon as its single (empty) part lands.
    if (*file_size == 0) {
        return 100.0;
    }
    return static_cast<double>(bytes_sent) / static_cast<double>(*file_size) * 100.0;
}

bool ProgressUpdate::completed() const noexcept {
    // NaN compares false, so an unknown size is never "completed".
    return percent_done() >= 100.0;
}

bool ProgressSender::send(ProgressUpdate update) const {
    auto queue = queue_.lock();
    if (!queue) {
        return false;
    }
    return queue->try_push(std::move(update));
}

ProgressReceiver::~ProgressReceiver() {
    if (queue_) {
        queue_->shutdown();
    }
}

std::optional<ProgressUpdate> ProgressReceiver::try_receive() {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->try_pop();
}

std::pair<ProgressSender, ProgressReceiver> make_progress_channel(std::size_t capacity) {
    auto queue = std::make_shared<ProgressQueue>(capacity);
    ProgressSender sender{std::weak_ptr<ProgressQueue>(queue)};
    return {std::move(sender), ProgressReceiver(std::move(queue))};
}

double BatchProgress::percent_done() const noexcept {
    if (!size_known) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (total_bytes == 0) {
        return files > 0 && files_completed == files ? 100.0 : 0.0;
    }
    return static_cast<double>(bytes_sent) / static_cast<double>(total_bytes) * 100.0;
}

ProgressTracker::ProgressTracker(ProgressReceiver receiver)
    : receiver_(std::move(receiver)) {}

std::size_t ProgressTracker::poll() {
    if (!receiver_) {
        return 0;
    }

    std::size_t drained = 0;
    while (auto update = receiver_->try_receive()) {
        record(std::move(*update));
        ++drained;
    }
    return drained;
}

void ProgressTracker::record(ProgressUpdate update) {
    auto key = update.file_id;
    files_.insert_or_assign(std::move(key), std::move(update));
}

std::optional<ProgressUpdate> ProgressTracker::find(const std::string& file_id) const {
    const auto it = files_.find(file_id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

BatchProgress ProgressTracker::batch_progress() const {
    BatchProgress progress;
    for (const auto& [file_id, update] : files_) {
        ++progress.files;
        progress.bytes_sent += update.bytes_sent;
        if (update.file_size.has_value()) {
            progress.total_bytes += *update.file_size;
        } else {
            progress.size_known = false;
        }
        if (update.completed()) {
            ++progress.files_completed;
        }
    }
    return progress;
}

} // namespace chunkup::upload
