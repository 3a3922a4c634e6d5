#include "chunkup/upload/types.hpp"

#include <system_error>

namespace chunkup::upload {
namespace fs = std::filesystem;

const char* to_string(ServerSideEncryption encryption) noexcept {
    switch (encryption) {
        case ServerSideEncryption::KMS: return "aws:kms";
        case ServerSideEncryption::AES256: return "AES256";
    }
    return "aws:kms";
}

std::string make_upload_key(const std::string& key_prefix,
                            const std::string& import_id,
                            const std::string& file_name) {
    return key_prefix + "/data/" + import_id + "/" + file_name;
}

UploadResult<UploadFile> UploadFile::from_path(const fs::path& path) {
    std::error_code ec;
    const fs::path resolved = fs::canonical(path, ec);
    if (ec) {
        return Err<UploadFile>(make_error(ErrorKind::Io, "Could not read: " + path.string() + " (" + ec.message() + ")"));
    }

    if (!fs::is_regular_file(resolved, ec)) {
        return Err<UploadFile>(make_error(ErrorKind::Io, "Not a file: " + resolved.string()));
    }

    const auto size = fs::file_size(resolved, ec);
    if (ec) {
        return Err<UploadFile>(make_error(ErrorKind::Io, "Failed to stat " + resolved.string() + ": " + ec.message()));
    }

    UploadFile file;
    file.path = resolved;
    file.file_name = resolved.filename().string();
    file.size = static_cast<std::uint64_t>(size);
    return Ok<UploadError>(std::move(file));
}

} // namespace chunkup::upload
