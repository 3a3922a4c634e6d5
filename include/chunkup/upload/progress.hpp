#pragma once

#include "chunkup/events/event_queue.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace chunkup::upload {

/**
 * @brief Immutable progress report, emitted once per uploaded part
 */
struct ProgressUpdate {
    std::uint32_t part_number = 0;
    bool multipart = true;
    std::string import_id;
    std::string file_id;                      ///< Local path of the file
    std::uint64_t bytes_sent = 0;             ///< Cumulative for the file
    std::optional<std::uint64_t> file_size;   ///< nullopt when unknown

    /// Percentage sent; NaN while the file size is unknown.
    [[nodiscard]] double percent_done() const noexcept;

    /// True once percent_done() >= 100.
    [[nodiscard]] bool completed() const noexcept;
};

/**
 * @brief Push-style observer called on every successful part
 *
 * Implementations are invoked from upload tasks and must be thread-safe.
 */
class ProgressCallback {
public:
    virtual ~ProgressCallback() = default;
    virtual void on_update(const ProgressUpdate& update) = 0;
};

/// Default callback: ignores every update.
class NoProgress final : public ProgressCallback {
public:
    void on_update(const ProgressUpdate&) override {}
};

using ProgressQueue = events::ThreadSafeQueue<ProgressUpdate>;

/**
 * @brief Producer end of the progress channel
 *
 * Copies are cheap and may be shared by every part task. Sending never
 * blocks and never fails the caller: updates are dropped when the
 * receiver is gone or a bounded channel is full.
 */
class ProgressSender {
public:
    ProgressSender() = default;
    explicit ProgressSender(std::weak_ptr<ProgressQueue> queue) : queue_(std::move(queue)) {}

    /// RETURNS: true if the update was queued.
    bool send(ProgressUpdate update) const;

    [[nodiscard]] bool connected() const { return !queue_.expired(); }

private:
    std::weak_ptr<ProgressQueue> queue_;
};

/**
 * @brief Consumer end of the progress channel
 *
 * Dropping the receiver disconnects every sender.
 */
class ProgressReceiver {
public:
    explicit ProgressReceiver(std::shared_ptr<ProgressQueue> queue) : queue_(std::move(queue)) {}
    ~ProgressReceiver();

    ProgressReceiver(ProgressReceiver&&) noexcept = default;
    ProgressReceiver& operator=(ProgressReceiver&&) noexcept = default;

    ProgressReceiver(const ProgressReceiver&) = delete;
    ProgressReceiver& operator=(const ProgressReceiver&) = delete;

    /// Non-blocking receive.
    std::optional<ProgressUpdate> try_receive();

private:
    std::shared_ptr<ProgressQueue> queue_;
};

/// capacity == 0 creates an unbounded channel.
std::pair<ProgressSender, ProgressReceiver> make_progress_channel(std::size_t capacity = 0);

/**
 * @brief Aggregate over every file seen by a tracker
 */
struct BatchProgress {
    std::size_t files = 0;
    std::size_t files_completed = 0;
    std::uint64_t bytes_sent = 0;
    std::uint64_t total_bytes = 0;    ///< Sum of the known file sizes
    bool size_known = true;           ///< False if any file size is unknown

    [[nodiscard]] double percent_done() const noexcept;
};

/**
 * @brief Aggregates progress updates per file
 *
 * The tracker is the only writer of its map. poll() drains the channel at
 * the owner's cadence; snapshot() has no side effects.
 *
 * THREAD SAFETY: None. Owned and queried by one consumer thread; upload
 * tasks only ever touch the channel.
 */
class ProgressTracker {
public:
    ProgressTracker() = default;
    explicit ProgressTracker(ProgressReceiver receiver);

    /**
     * @brief Drain every pending update from the channel
     *
     * RETURNS: number of updates recorded
     * BLOCKS: No
     */
    std::size_t poll();

    /// Latest update for a file replaces the previous one.
    void record(ProgressUpdate update);

    [[nodiscard]] std::unordered_map<std::string, ProgressUpdate> snapshot() const { return files_; }

    [[nodiscard]] std::optional<ProgressUpdate> find(const std::string& file_id) const;

    [[nodiscard]] BatchProgress batch_progress() const;

private:
    std::optional<ProgressReceiver> receiver_;
    std::unordered_map<std::string, ProgressUpdate> files_;
};

} // namespace chunkup::upload
