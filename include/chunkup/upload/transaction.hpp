#pragma once

#include "chunkup/core/error.hpp"
#include "chunkup/upload/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace chunkup::upload {

enum class TransactionState {
    Uninitiated,
    Initiated,
    PartsInFlight,
    Completing,
    Completed,
    Aborting,
    Aborted
};

const char* to_string(TransactionState state) noexcept;

/**
 * @brief Bookkeeping and state machine of one multipart upload
 *
 * Legal transitions:
 *   Uninitiated   -> Initiated | Aborted (initiation failed, nothing to abort)
 *   Initiated     -> PartsInFlight | Aborting
 *   PartsInFlight -> Completing | Aborting
 *   Completing    -> Completed | Aborting (completion rejected)
 *   Aborting      -> Aborted
 *
 * The session id is usable from initiate() until a terminal state is
 * reached; afterwards require_session() reports MissingSession.
 */
class MultipartTransaction {
public:
    MultipartTransaction(std::string file_id, ObjectLocation location);

    [[nodiscard]] TransactionState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& file_id() const noexcept { return file_id_; }
    [[nodiscard]] const ObjectLocation& location() const noexcept { return location_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return state_ == TransactionState::Completed || state_ == TransactionState::Aborted;
    }

    /// Session id while the transaction is open.
    [[nodiscard]] const std::optional<std::string>& session_id() const noexcept { return session_id_; }

    /// Session id the transaction was (or is) bound to, kept after it closed.
    [[nodiscard]] const std::string& last_session_id() const noexcept { return last_session_id_; }

    UploadResult<void> initiate(std::string session_id);
    UploadResult<void> transition_to(TransactionState next_state);

    /// MissingSession unless a session is open.
    UploadResult<void> require_session() const;

    void add_part(CompletedPart part);
    [[nodiscard]] const std::vector<CompletedPart>& parts() const noexcept { return parts_; }

    /// Collected parts ordered by part number, as the backend requires.
    [[nodiscard]] std::vector<CompletedPart> sorted_parts() const;

    [[nodiscard]] std::chrono::steady_clock::time_point started_at() const noexcept { return started_at_; }

private:
    [[nodiscard]] bool can_transition(TransactionState target) const noexcept;

    std::string file_id_;
    ObjectLocation location_;
    TransactionState state_ = TransactionState::Uninitiated;
    std::optional<std::string> session_id_;
    std::string last_session_id_;
    std::vector<CompletedPart> parts_;
    std::chrono::steady_clock::time_point started_at_{std::chrono::steady_clock::now()};
};

} // namespace chunkup::upload
