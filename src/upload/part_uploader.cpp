#include "chunkup/upload/part_uploader.hpp"
#include "chunkup/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <exception>

namespace chunkup::upload {

PartUploader::PartUploader(asio::strand<asio::any_io_executor> strand,
                           std::shared_ptr<storage::ObjectStore> store,
                           ProgressSender progress,
                           std::shared_ptr<ProgressCallback> callback,
                           events::EventBus& bus)
    : strand_(std::move(strand)),
      store_(std::move(store)),
      progress_(std::move(progress)),
      callback_(callback ? std::move(callback) : std::make_shared<NoProgress>()),
      bus_(&bus) {}

void PartUploader::async_upload(std::shared_ptr<PartTarget> target, FileChunk chunk, Handler handler) const {
    const std::uint32_t part_number = chunk.part_number;

    if (!target->session_id.has_value()) {
        auto error = make_error(ErrorKind::MissingSession,
            "cannot upload part " + std::to_string(part_number) + " of " + target->file_id + " without a session");
        asio::post(strand_, [handler = std::move(handler), error = std::move(error)]() {
            handler(Err<CompletedPart>(error));
        });
        return;
    }

    const std::uint64_t part_bytes = chunk.bytes.size();
    const std::string session_id = *target->session_id;

    spdlog::debug("Uploading part {} of {} ({} bytes, session {})", part_number, target->file_id, part_bytes, session_id);

    // Everything the completion needs is captured by value: the store may
    // call back on any thread, and the work is re-dispatched onto the strand.
    store_->async_upload_part(session_id, part_number, target->location, std::move(chunk),
        [strand = strand_, progress = progress_, callback = callback_, bus = bus_,
         target, session_id, part_number, part_bytes, handler = std::move(handler)](Result<std::string> result) {
            asio::post(strand, [progress, callback, bus, target, session_id, part_number, part_bytes,
                                handler, result = std::move(result)]() mutable {
                if (result.is_error()) {
                    handler(Err<CompletedPart>(make_error(ErrorKind::Part,
                        "part " + std::to_string(part_number) + " of " + target->file_id + ": " + result.error())));
                    return;
                }

                if (result.value().empty()) {
                    handler(Err<CompletedPart>(make_error(ErrorKind::Part,
                        "part " + std::to_string(part_number) + " of " + target->file_id + ": store returned no entity tag")));
                    return;
                }

                if (target->draining) {
                    spdlog::debug("Part {} of {} landed after the transaction failed", part_number, target->file_id);
                    handler(Ok<UploadError>(CompletedPart{part_number, result.take_value()}));
                    return;
                }

                target->bytes_sent += part_bytes;

                ProgressUpdate update;
                update.part_number = part_number;
                update.multipart = true;
                update.import_id = target->import_id;
                update.file_id = target->file_id;
                update.bytes_sent = target->bytes_sent;
                update.file_size = target->file_size;

                try {
                    callback->on_update(update);
                } catch (const std::exception& e) {
                    spdlog::warn("Progress callback threw for {}: {}", target->file_id, e.what());
                }

                if (!progress.send(update)) {
                    spdlog::trace("Progress update for {} part {} dropped", target->file_id, part_number);
                }

                events::PartUploadedEvent event;
                event.file_id = target->file_id;
                event.session_id = session_id;
                event.part_number = part_number;
                event.part_bytes = part_bytes;
                event.bytes_sent = target->bytes_sent;
                bus->emit(event);

                handler(Ok<UploadError>(CompletedPart{part_number, result.take_value()}));
            });
        });
}

} // namespace chunkup::upload
