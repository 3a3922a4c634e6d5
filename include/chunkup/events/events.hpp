/**
 * @file events.hpp
 * @brief Event type definitions for the upload engine
 *
 * WHY THIS FILE EXISTS:
 * Defines the lifecycle events published while a batch is uploading.
 * Observers (logging, metrics) subscribe to them on the EventBus without
 * the upload path knowing who listens.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: PartUploadedEvent, TransactionAbortedEvent
 */

#pragma once

#include "chunkup/core/error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chunkup::events {

// ════════════════════════════════════════════════════════
// Batch Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a batch is accepted by the scheduler
 *
 * WHO EMITS: BatchUploadScheduler::start()
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct BatchStartedEvent {
    std::string import_id;
    std::size_t file_count = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted once every file of a batch reached a terminal outcome
 *
 * WHO EMITS: BatchUploadScheduler
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct BatchCompletedEvent {
    std::string import_id;
    std::size_t completed = 0;
    std::size_t aborted = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Transaction Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the store issued a session id for a multipart upload
 */
struct TransactionStartedEvent {
    std::string file_id;
    std::string session_id;
    std::uint64_t total_bytes = 0;
    std::uint32_t total_parts = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PartUploadedEvent {
    std::string file_id;
    std::string session_id;
    std::uint32_t part_number = 0;
    std::uint64_t part_bytes = 0;
    std::uint64_t bytes_sent = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a file arrived intact (multipart completion or put)
 */
struct TransactionCompletedEvent {
    std::string file_id;
    std::string session_id;   ///< Empty for single-shot puts
    std::uint64_t total_bytes = 0;
    std::uint32_t parts = 0;
    bool multipart = true;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a file's upload ended without the object being stored
 *
 * abort_error is set when the abort call itself failed; the server-side
 * multipart state is then unknown.
 */
struct TransactionAbortedEvent {
    std::string file_id;
    std::string session_id;
    UploadError cause;
    std::optional<UploadError> abort_error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace chunkup::events
