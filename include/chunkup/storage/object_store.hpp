#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace chunkup::storage {

/**
 * @brief Completion handler for every store operation
 *
 * Receives the operation's token on success (session id, entity tag or
 * receipt) or a transport/backend error message. Handlers may be invoked
 * on any thread; callers re-dispatch onto their own strand.
 */
using StoreHandler = std::function<void(Result<std::string>)>;

/**
 * @brief Object-storage capability consumed by the upload engine
 *
 * The vendor wire format lives behind this interface. Implementations must
 * invoke each handler exactly once and must not invoke it inline from the
 * initiating call. Timeouts are reported as ordinary errors.
 *
 * One instance is shared (std::shared_ptr) by every concurrent part task of
 * a batch and must be safe to call concurrently.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /// Handler receives the new upload session id.
    virtual void async_create_multipart_upload(const upload::ObjectLocation& location,
                                               const upload::EncryptionSettings& encryption,
                                               StoreHandler handler) = 0;

    /// Handler receives the part's entity tag.
    virtual void async_upload_part(const std::string& session_id,
                                   std::uint32_t part_number,
                                   const upload::ObjectLocation& location,
                                   upload::FileChunk chunk,
                                   StoreHandler handler) = 0;

    /// `parts` is sorted ascending by part number. Handler receives a receipt.
    virtual void async_complete_multipart_upload(const std::string& session_id,
                                                 const upload::ObjectLocation& location,
                                                 std::vector<upload::CompletedPart> parts,
                                                 StoreHandler handler) = 0;

    /// Handler receives a receipt.
    virtual void async_abort_multipart_upload(const std::string& session_id,
                                              const upload::ObjectLocation& location,
                                              StoreHandler handler) = 0;

    /// Single-shot upload used for files below the minimum part size.
    virtual void async_put_object(const upload::ObjectLocation& location,
                                  std::vector<std::uint8_t> body,
                                  const upload::EncryptionSettings& encryption,
                                  StoreHandler handler) = 0;
};

} // namespace chunkup::storage
