#pragma once

#include "chunkup/core/result.hpp"

#include <string>

namespace chunkup {

/**
 * @brief Classification of every failure the upload engine can report
 *
 * Precondition kinds (InvalidArgument, NoFiles, MissingSession) are raised
 * before any network call is made. The remaining kinds describe which
 * stage of a transaction failed.
 */
enum class ErrorKind {
    InvalidArgument,
    NoFiles,
    MissingSession,
    Initiation,
    Part,
    Io,
    Completion,
    Abort,
    Put
};

const char* to_string(ErrorKind kind) noexcept;

struct UploadError {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;

    UploadError() = default;
    UploadError(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    /// True for failures that happen before any store call is issued.
    [[nodiscard]] bool is_precondition() const noexcept {
        return kind == ErrorKind::InvalidArgument
            || kind == ErrorKind::NoFiles
            || kind == ErrorKind::MissingSession;
    }

    /// "<kind>: <message>", used in log lines and outcome summaries.
    [[nodiscard]] std::string describe() const;
};

template<typename T>
using UploadResult = Result<T, UploadError>;

inline UploadError make_error(ErrorKind kind, std::string message) {
    return UploadError{kind, std::move(message)};
}

} // namespace chunkup
