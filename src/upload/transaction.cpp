#include "chunkup/upload/transaction.hpp"

#include <algorithm>
#include <unordered_map>

namespace chunkup::upload {
namespace {

bool is_progressive(TransactionState current, TransactionState target) {
    static const std::unordered_map<TransactionState, std::vector<TransactionState>> transitions {
        {TransactionState::Uninitiated, {TransactionState::Initiated, TransactionState::Aborted}},
        {TransactionState::Initiated, {TransactionState::PartsInFlight, TransactionState::Aborting}},
        {TransactionState::PartsInFlight, {TransactionState::Completing, TransactionState::Aborting}},
        {TransactionState::Completing, {TransactionState::Completed, TransactionState::Aborting}},
        {TransactionState::Aborting, {TransactionState::Aborted}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(TransactionState state) noexcept {
    switch (state) {
        case TransactionState::Uninitiated: return "uninitiated";
        case TransactionState::Initiated: return "initiated";
        case TransactionState::PartsInFlight: return "parts-in-flight";
        case TransactionState::Completing: return "completing";
        case TransactionState::Completed: return "completed";
        case TransactionState::Aborting: return "aborting";
        case TransactionState::Aborted: return "aborted";
    }
    return "unknown";
}

MultipartTransaction::MultipartTransaction(std::string file_id, ObjectLocation location)
    : file_id_(std::move(file_id)),
      location_(std::move(location)) {}

UploadResult<void> MultipartTransaction::initiate(std::string session_id) {
    if (session_id.empty()) {
        return Err<void>(make_error(ErrorKind::MissingSession,
            "store returned no upload session id for " + file_id_));
    }

    auto transition = transition_to(TransactionState::Initiated);
    if (transition.is_error()) {
        return transition;
    }

    last_session_id_ = session_id;
    session_id_ = std::move(session_id);
    return Ok<UploadError>();
}

UploadResult<void> MultipartTransaction::transition_to(TransactionState next_state) {
    if (!can_transition(next_state)) {
        return Err<void>(make_error(ErrorKind::InvalidArgument,
            std::string("Illegal transaction state transition ") + to_string(state_) + " -> " + to_string(next_state)));
    }

    state_ = next_state;
    if (is_terminal()) {
        session_id_.reset();
    }
    return Ok<UploadError>();
}

UploadResult<void> MultipartTransaction::require_session() const {
    if (!session_id_.has_value()) {
        return Err<void>(make_error(ErrorKind::MissingSession,
            "no open upload session for " + file_id_));
    }
    return Ok<UploadError>();
}

void MultipartTransaction::add_part(CompletedPart part) {
    parts_.push_back(std::move(part));
}

std::vector<CompletedPart> MultipartTransaction::sorted_parts() const {
    auto sorted = parts_;
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

bool MultipartTransaction::can_transition(TransactionState target) const noexcept {
    if (is_terminal()) {
        return false;
    }
    return is_progressive(state_, target);
}

} // namespace chunkup::upload
