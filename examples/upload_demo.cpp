/**
 * @file upload_demo.cpp
 * @brief Upload a batch of local files into a directory-backed object store
 *
 * USAGE:
 *   upload_demo [--root DIR] [--config FILE] [--credential FILE]
 *               [--import-id ID] [--chunk-size BYTES] FILE...
 *
 * Objects land under <root>/<bucket>/<prefix>/data/<import-id>/<file name>.
 * Progress is printed while the batch runs; per-file outcomes and the
 * batch summary are printed at the end.
 */

#include "chunkup/config/config.hpp"
#include "chunkup/events/components.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/storage/local_object_store.hpp"
#include "chunkup/upload/uploader.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <optional>
#include <thread>

using namespace chunkup;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void print_usage(const char* program) {
    spdlog::info("Usage: {} [--root DIR] [--config FILE] [--credential FILE] "
                 "[--import-id ID] [--chunk-size BYTES] FILE...", program);
}

UploadResult<upload::UploadCredential> read_credential(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<upload::UploadCredential>(make_error(ErrorKind::Io, "Failed to open credential file: " + path.string()));
    }
    json j = json::parse(input, nullptr, false);
    if (j.is_discarded()) {
        return Err<upload::UploadCredential>(make_error(ErrorKind::InvalidArgument, "Malformed JSON in " + path.string()));
    }
    return config::credential_from_json(j);
}

upload::UploadCredential local_credential() {
    upload::UploadCredential credential;
    credential.access_key = "local";
    credential.secret_key = "local";
    credential.session_token = "local";
    credential.bucket = "uploads";
    credential.key_prefix = "demo";
    return credential;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    fs::path root = fs::current_path() / "object_store";
    std::optional<fs::path> config_path;
    std::optional<fs::path> credential_path;
    std::optional<std::uint64_t> chunk_size;
    std::string import_id = "import-" + std::to_string(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
    std::vector<fs::path> paths;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--root" && i + 1 < argc) {
                root = fs::path(argv[++i]);
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = fs::path(argv[++i]);
            } else if (arg == "--credential" && i + 1 < argc) {
                credential_path = fs::path(argv[++i]);
            } else if (arg == "--import-id" && i + 1 < argc) {
                import_id = argv[++i];
            } else if (arg == "--chunk-size" && i + 1 < argc) {
                chunk_size = std::stoull(argv[++i]);
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                paths.emplace_back(arg);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Invalid argument: {}", e.what());
        print_usage(argv[0]);
        return 2;
    }

    if (paths.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    config::UploaderConfig settings;
    if (config_path) {
        auto loaded = config::load_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return 1;
        }
        settings = loaded.take_value();
    }
    if (chunk_size) {
        settings.chunk_size = *chunk_size;
        if (auto valid = config::validate(settings); valid.is_error()) {
            spdlog::error("{}", valid.error().describe());
            return 1;
        }
    }
    if (auto logging = config::configure_logging(settings.log_level); logging.is_error()) {
        spdlog::error("{}", logging.error().describe());
        return 1;
    }

    upload::UploadCredential credential = local_credential();
    if (credential_path) {
        auto parsed = read_credential(*credential_path);
        if (parsed.is_error()) {
            spdlog::error("{}", parsed.error().describe());
            return 1;
        }
        credential = parsed.take_value();
    }

    std::vector<upload::UploadFile> files;
    for (const auto& path : paths) {
        auto file = upload::UploadFile::from_path(path);
        if (file.is_error()) {
            spdlog::error("{}", file.error().describe());
            return 1;
        }
        files.push_back(file.take_value());
    }

    // ════════════════════════════════════════════════════════
    // Wire up store, bus and uploader
    // ════════════════════════════════════════════════════════

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    auto store = std::make_shared<storage::LocalObjectStore>(root);
    upload::Uploader uploader(settings, store, bus);

    auto tracker = uploader.progress();
    if (tracker.is_error()) {
        spdlog::error("{}", tracker.error().describe());
        return 1;
    }

    spdlog::info("Uploading {} file(s) to {} (bucket {}, import {})",
                 files.size(), root.string(), credential.bucket, import_id);

    auto stream = uploader.upload(std::move(files), import_id, credential);
    if (stream.is_error()) {
        spdlog::error("{}", stream.error().describe());
        return 1;
    }

    // Outcomes are read on a helper thread so progress can be polled here
    std::vector<upload::TransactionOutcome> outcomes;
    std::thread collector([&]() { outcomes = stream.value().collect(); });

    while (!stream.value().summary()) {
        if (tracker.value().poll() > 0) {
            const auto batch = tracker.value().batch_progress();
            spdlog::info("Progress: {}/{} files, {} bytes ({:.1f}%)",
                         batch.files_completed, batch.files, batch.bytes_sent, batch.percent_done());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    collector.join();
    tracker.value().poll();

    for (const auto& outcome : outcomes) {
        if (outcome.is_completed()) {
            spdlog::info("  OK      {} -> {}", outcome.file.file_name, outcome.completed().receipt);
        } else {
            const auto& aborted = outcome.aborted();
            spdlog::warn("  FAILED  {}: {}", outcome.file.file_name, aborted.cause.describe());
            if (aborted.abort_failed()) {
                spdlog::warn("          abort failed too: {}", aborted.abort_error->describe());
            }
        }
    }

    const auto summary = *stream.value().summary();
    spdlog::info("Batch {}: {}/{} files uploaded in {} ms",
                 summary.import_id, summary.completed, summary.files, summary.duration.count());
    metrics.print_stats();

    return summary.all_completed() ? 0 : 1;
}
