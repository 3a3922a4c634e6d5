/**
 * @file components.hpp
 * @brief Event-driven observers for upload batches
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Both react to every transaction event published on `bus`
 */

#pragma once

#include "chunkup/events/event_bus.hpp"
#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace chunkup::events {

/**
 * @brief Logs every upload lifecycle event through spdlog
 *
 * Part events are logged at debug level; transaction and batch events at
 * info; aborts at warn, or error when the abort itself failed.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        batch_started_id_ = bus_.subscribe<BatchStartedEvent>([this](const BatchStartedEvent& e) {
            on_batch_started(e);
        });

        batch_completed_id_ = bus_.subscribe<BatchCompletedEvent>([this](const BatchCompletedEvent& e) {
            on_batch_completed(e);
        });

        started_id_ = bus_.subscribe<TransactionStartedEvent>([this](const TransactionStartedEvent& e) {
            on_transaction_started(e);
        });

        part_id_ = bus_.subscribe<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            on_part_uploaded(e);
        });

        completed_id_ = bus_.subscribe<TransactionCompletedEvent>([this](const TransactionCompletedEvent& e) {
            on_transaction_completed(e);
        });

        aborted_id_ = bus_.subscribe<TransactionAbortedEvent>([this](const TransactionAbortedEvent& e) {
            on_transaction_aborted(e);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<BatchStartedEvent>(batch_started_id_);
        bus_.unsubscribe<BatchCompletedEvent>(batch_completed_id_);
        bus_.unsubscribe<TransactionStartedEvent>(started_id_);
        bus_.unsubscribe<PartUploadedEvent>(part_id_);
        bus_.unsubscribe<TransactionCompletedEvent>(completed_id_);
        bus_.unsubscribe<TransactionAbortedEvent>(aborted_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_batch_started(const BatchStartedEvent& e) {
        spdlog::info("[BatchStarted] import={} files={} bytes={}", e.import_id, e.file_count, e.total_bytes);
    }

    void on_batch_completed(const BatchCompletedEvent& e) {
        spdlog::info("[BatchCompleted] import={} completed={} aborted={} duration={}ms",
                     e.import_id, e.completed, e.aborted, e.duration.count());
    }

    void on_transaction_started(const TransactionStartedEvent& e) {
        spdlog::info("[UploadStarted] session={} path={} bytes={} parts={}",
                     e.session_id, e.file_id, e.total_bytes, e.total_parts);
    }

    void on_part_uploaded(const PartUploadedEvent& e) {
        spdlog::debug("[PartUploaded] session={} path={} part={} bytes={} sent={}",
                      e.session_id, e.file_id, e.part_number, e.part_bytes, e.bytes_sent);
    }

    void on_transaction_completed(const TransactionCompletedEvent& e) {
        spdlog::info("[UploadCompleted] session={} path={} bytes={} parts={} multipart={} duration={}ms",
                     e.session_id, e.file_id, e.total_bytes, e.parts, e.multipart, e.duration.count());
    }

    void on_transaction_aborted(const TransactionAbortedEvent& e) {
        if (e.abort_error) {
            spdlog::error("[UploadAbortFailed] session={} path={} cause=\"{}\" abort=\"{}\"",
                          e.session_id, e.file_id, e.cause.describe(), e.abort_error->describe());
            return;
        }
        spdlog::warn("[UploadAborted] session={} path={} cause=\"{}\"",
                     e.session_id, e.file_id, e.cause.describe());
    }

    EventBus& bus_;
    std::size_t batch_started_id_ = 0;
    std::size_t batch_completed_id_ = 0;
    std::size_t started_id_ = 0;
    std::size_t part_id_ = 0;
    std::size_t completed_id_ = 0;
    std::size_t aborted_id_ = 0;
};

/**
 * @brief Counts transfers for monitoring
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().bytes_uploaded.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> batches_started{0};
        std::atomic<std::uint64_t> batches_completed{0};
        std::atomic<std::uint64_t> transactions_started{0};
        std::atomic<std::uint64_t> parts_uploaded{0};
        std::atomic<std::uint64_t> part_bytes_uploaded{0};
        std::atomic<std::uint64_t> files_uploaded{0};
        std::atomic<std::uint64_t> bytes_uploaded{0};
        std::atomic<std::uint64_t> files_aborted{0};
        std::atomic<std::uint64_t> abort_failures{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        ids_[0] = bus_.subscribe<BatchStartedEvent>([this](const BatchStartedEvent&) {
            stats_.batches_started++;
        });

        ids_[1] = bus_.subscribe<BatchCompletedEvent>([this](const BatchCompletedEvent&) {
            stats_.batches_completed++;
        });

        ids_[2] = bus_.subscribe<TransactionStartedEvent>([this](const TransactionStartedEvent&) {
            stats_.transactions_started++;
        });

        ids_[3] = bus_.subscribe<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            stats_.parts_uploaded++;
            stats_.part_bytes_uploaded += e.part_bytes;
        });

        ids_[4] = bus_.subscribe<TransactionCompletedEvent>([this](const TransactionCompletedEvent& e) {
            stats_.files_uploaded++;
            stats_.bytes_uploaded += e.total_bytes;
        });

        ids_[5] = bus_.subscribe<TransactionAbortedEvent>([this](const TransactionAbortedEvent& e) {
            stats_.files_aborted++;
            if (e.abort_error) {
                stats_.abort_failures++;
            }
        });
    }

    ~MetricsComponent() {
        bus_.unsubscribe<BatchStartedEvent>(ids_[0]);
        bus_.unsubscribe<BatchCompletedEvent>(ids_[1]);
        bus_.unsubscribe<TransactionStartedEvent>(ids_[2]);
        bus_.unsubscribe<PartUploadedEvent>(ids_[3]);
        bus_.unsubscribe<TransactionCompletedEvent>(ids_[4]);
        bus_.unsubscribe<TransactionAbortedEvent>(ids_[5]);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Batches:         {}/{}", stats_.batches_completed.load(), stats_.batches_started.load());
        spdlog::info("  Multipart txns:  {}", stats_.transactions_started.load());
        spdlog::info("  Parts uploaded:  {}", stats_.parts_uploaded.load());
        spdlog::info("  Files uploaded:  {}", stats_.files_uploaded.load());
        spdlog::info("  Bytes uploaded:  {}", stats_.bytes_uploaded.load());
        spdlog::info("  Files aborted:   {}", stats_.files_aborted.load());
        spdlog::info("  Abort failures:  {}", stats_.abort_failures.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
    std::size_t ids_[6] = {};
};

} // namespace chunkup::events
