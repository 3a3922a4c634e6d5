#include "chunkup/config/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace chunkup::config {

using json = nlohmann::json;

namespace {

UploadResult<spdlog::level::level_enum> parse_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str() maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        return Err<spdlog::level::level_enum>(make_error(ErrorKind::InvalidArgument, "unknown log level: " + name));
    }
    return Ok<UploadError>(level);
}

} // namespace

UploadResult<void> validate(const UploaderConfig& config) {
    if (config.chunk_size == 0 || config.min_part_size == 0) {
        return Err<void>(make_error(ErrorKind::InvalidArgument, "chunk_size and min_part_size must be > 0"));
    }
    if (config.chunk_size < config.min_part_size) {
        return Err<void>(make_error(ErrorKind::InvalidArgument,
            "chunk_size " + std::to_string(config.chunk_size) + " is below the minimum part size " +
            std::to_string(config.min_part_size)));
    }
    if (config.part_concurrency == 0 || config.file_concurrency == 0) {
        return Err<void>(make_error(ErrorKind::InvalidArgument, "part and file concurrency must be at least 1"));
    }
    if (config.worker_threads == 0) {
        return Err<void>(make_error(ErrorKind::InvalidArgument, "worker_threads must be at least 1"));
    }
    if (config.max_attempts == 0) {
        return Err<void>(make_error(ErrorKind::InvalidArgument, "max_attempts must be at least 1"));
    }
    if (auto level = parse_level(config.log_level); level.is_error()) {
        return Err<void>(level.error());
    }
    return Ok<UploadError>();
}

UploadResult<upload::ServerSideEncryption> parse_encryption(const std::string& name) {
    if (name == "aws:kms" || name == "kms" || name == "KMS") {
        return Ok<UploadError>(upload::ServerSideEncryption::KMS);
    }
    if (name == "AES256") {
        return Ok<UploadError>(upload::ServerSideEncryption::AES256);
    }
    return Err<upload::ServerSideEncryption>(make_error(ErrorKind::InvalidArgument,
        "unknown server-side encryption: " + name));
}

UploadResult<UploaderConfig> config_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<UploaderConfig>(make_error(ErrorKind::InvalidArgument, "configuration must be a JSON object"));
    }

    UploaderConfig config;
    try {
        config.chunk_size = j.value("chunk_size", config.chunk_size);
        config.min_part_size = j.value("min_part_size", config.min_part_size);
        config.part_concurrency = j.value("part_concurrency", config.part_concurrency);
        config.file_concurrency = j.value("file_concurrency", config.file_concurrency);
        config.worker_threads = j.value("worker_threads", config.worker_threads);
        config.progress_capacity = j.value("progress_capacity", config.progress_capacity);
        config.max_attempts = j.value("max_attempts", config.max_attempts);
        config.log_level = j.value("log_level", config.log_level);

        if (j.contains("encryption")) {
            auto encryption = parse_encryption(j.at("encryption").get<std::string>());
            if (encryption.is_error()) {
                return Err<UploaderConfig>(encryption.error());
            }
            config.encryption = encryption.value();
        }
    } catch (const json::exception& e) {
        return Err<UploaderConfig>(make_error(ErrorKind::InvalidArgument,
            std::string("invalid configuration: ") + e.what()));
    }

    if (auto valid = validate(config); valid.is_error()) {
        return Err<UploaderConfig>(valid.error());
    }
    return Ok<UploadError>(std::move(config));
}

UploadResult<UploaderConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<UploaderConfig>(make_error(ErrorKind::Io, "Failed to open config file: " + path.string()));
    }

    json j = json::parse(input, nullptr, false);
    if (j.is_discarded()) {
        return Err<UploaderConfig>(make_error(ErrorKind::InvalidArgument, "Malformed JSON in " + path.string()));
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return config_from_json(j);
}

json to_json(const UploaderConfig& config) {
    return json{
        {"chunk_size", config.chunk_size},
        {"min_part_size", config.min_part_size},
        {"part_concurrency", config.part_concurrency},
        {"file_concurrency", config.file_concurrency},
        {"worker_threads", config.worker_threads},
        {"progress_capacity", config.progress_capacity},
        {"encryption", upload::to_string(config.encryption)},
        {"max_attempts", config.max_attempts},
        {"log_level", config.log_level}
    };
}

UploadResult<upload::UploadCredential> credential_from_json(const json& j) {
    upload::UploadCredential credential;
    try {
        const auto& temp = j.at("tempCredentials");
        credential.access_key = temp.at("accessKey").get<std::string>();
        credential.secret_key = temp.at("secretKey").get<std::string>();
        credential.session_token = temp.at("sessionToken").get<std::string>();
        credential.region = temp.value("region", std::string());
        credential.encryption_key_id = j.value("encryptionKeyId", std::string());
        credential.bucket = j.at("s3Bucket").get<std::string>();
        credential.key_prefix = j.at("s3Key").get<std::string>();
    } catch (const json::exception& e) {
        return Err<upload::UploadCredential>(make_error(ErrorKind::InvalidArgument,
            std::string("invalid upload credential: ") + e.what()));
    }

    if (credential.bucket.empty()) {
        return Err<upload::UploadCredential>(make_error(ErrorKind::InvalidArgument, "upload credential has no bucket"));
    }
    return Ok<UploadError>(std::move(credential));
}

UploadResult<void> configure_logging(const std::string& level) {
    auto parsed = parse_level(level);
    if (parsed.is_error()) {
        return Err<void>(parsed.error());
    }
    spdlog::set_level(parsed.value());
    return Ok<UploadError>();
}

} // namespace chunkup::config
