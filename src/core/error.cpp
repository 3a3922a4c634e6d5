#include "chunkup/core/error.hpp"

namespace chunkup {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "invalid argument";
        case ErrorKind::NoFiles: return "no files";
        case ErrorKind::MissingSession: return "missing upload session";
        case ErrorKind::Initiation: return "initiation failed";
        case ErrorKind::Part: return "part upload failed";
        case ErrorKind::Io: return "io error";
        case ErrorKind::Completion: return "completion failed";
        case ErrorKind::Abort: return "abort failed";
        case ErrorKind::Put: return "put object failed";
    }
    return "unknown";
}

std::string UploadError::describe() const {
    std::string out = to_string(kind);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

} // namespace chunkup
