#pragma once

#include "chunkup/storage/object_store.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace chunkup::testing {

namespace asio = boost::asio;

/**
 * @brief Scripted in-memory ObjectStore for driving the upload engine
 *
 * Every completion is delivered through a steady_timer on the given
 * executor, so handlers never run inline and arrival order can be scripted
 * per part. Failures are injected per object key.
 */
class FakeObjectStore : public storage::ObjectStore {
public:
    using DelayFn = std::function<std::chrono::milliseconds(const std::string& key, std::uint32_t part_number)>;

    struct Call {
        std::string op;
        std::string key;
        std::string session_id;
        std::uint32_t part_number = 0;
    };

    explicit FakeObjectStore(asio::any_io_executor executor) : executor_(std::move(executor)) {}

    // ════════════════════════════════════════════════════════
    // Scripting
    // ════════════════════════════════════════════════════════

    void set_part_delay(DelayFn delay) {
        std::lock_guard lock(mutex_);
        part_delay_ = std::move(delay);
    }

    void fail_create(const std::string& key, std::string message) { set_failure("create", key, 0, std::move(message)); }
    void fail_part(const std::string& key, std::uint32_t part, std::string message) { set_failure("part", key, part, std::move(message)); }
    void fail_complete(const std::string& key, std::string message) { set_failure("complete", key, 0, std::move(message)); }
    void fail_abort(const std::string& key, std::string message) { set_failure("abort", key, 0, std::move(message)); }
    void fail_put(const std::string& key, std::string message) { set_failure("put", key, 0, std::move(message)); }

    /// Fails only the first `times` calls of `op` for `key`.
    void fail_times(const std::string& op, const std::string& key, std::uint32_t part, std::size_t times, std::string message) {
        std::lock_guard lock(mutex_);
        failures_[{op, key, part}] = Failure{std::move(message), times};
    }

    /// While set, create_multipart_upload succeeds with an empty session id.
    void return_empty_session(bool empty) {
        std::lock_guard lock(mutex_);
        empty_session_ = empty;
    }

    // ════════════════════════════════════════════════════════
    // Observation
    // ════════════════════════════════════════════════════════

    std::vector<Call> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    std::size_t count(const std::string& op, const std::string& key = {}) const {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(calls_.begin(), calls_.end(), [&](const Call& call) {
            return call.op == op && (key.empty() || call.key == key);
        }));
    }

    /// Part list passed to the last complete call for `key`.
    std::optional<std::vector<upload::CompletedPart>> completed_parts(const std::string& key) const {
        std::lock_guard lock(mutex_);
        const auto it = completed_parts_.find(key);
        if (it == completed_parts_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Bytes of the object assembled by complete (or put) for `key`.
    std::optional<std::vector<std::uint8_t>> object(const std::string& key) const {
        std::lock_guard lock(mutex_);
        const auto it = objects_.find(key);
        if (it == objects_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Highest number of concurrently outstanding part uploads seen for `key`.
    std::size_t max_parts_in_flight(const std::string& key) const {
        std::lock_guard lock(mutex_);
        const auto it = max_in_flight_.find(key);
        return it == max_in_flight_.end() ? 0 : it->second;
    }

    /// Highest number of multipart sessions open at the same time.
    std::size_t max_open_files() const {
        std::lock_guard lock(mutex_);
        return max_open_files_;
    }

    static std::string etag_for(const std::string& key, std::uint32_t part_number) {
        return "etag-" + key + "-" + std::to_string(part_number);
    }

    // ════════════════════════════════════════════════════════
    // ObjectStore
    // ════════════════════════════════════════════════════════

    void async_create_multipart_upload(const upload::ObjectLocation& location,
                                       const upload::EncryptionSettings&,
                                       storage::StoreHandler handler) override {
        Result<std::string> result = Ok(std::string());
        {
            std::lock_guard lock(mutex_);
            calls_.push_back({"create", location.key, {}, 0});
            if (auto failure = take_failure("create", location.key, 0)) {
                result = Err<std::string>(*failure);
            } else {
                const std::string session_id = empty_session_ ? std::string() : "session-" + std::to_string(++next_session_);
                result = Ok(session_id);
                ++open_files_;
                max_open_files_ = std::max(max_open_files_, open_files_);
            }
        }
        deliver(std::chrono::milliseconds(1), std::move(handler), std::move(result));
    }

    void async_upload_part(const std::string& session_id,
                           std::uint32_t part_number,
                           const upload::ObjectLocation& location,
                           upload::FileChunk chunk,
                           storage::StoreHandler handler) override {
        Result<std::string> result = Ok(etag_for(location.key, part_number));
        std::chrono::milliseconds delay{1};
        {
            std::lock_guard lock(mutex_);
            calls_.push_back({"part", location.key, session_id, part_number});
            if (part_delay_) {
                delay = part_delay_(location.key, part_number);
            }
            auto& in_flight = in_flight_[location.key];
            ++in_flight;
            max_in_flight_[location.key] = std::max(max_in_flight_[location.key], in_flight);

            if (auto failure = take_failure("part", location.key, part_number)) {
                result = Err<std::string>(*failure);
            } else {
                parts_[location.key][part_number] = std::move(chunk.bytes);
            }
        }

        const std::string key = location.key;
        deliver(delay, [this, key, handler = std::move(handler)](Result<std::string> r) {
            {
                std::lock_guard lock(mutex_);
                --in_flight_[key];
            }
            handler(std::move(r));
        }, std::move(result));
    }

    void async_complete_multipart_upload(const std::string& session_id,
                                         const upload::ObjectLocation& location,
                                         std::vector<upload::CompletedPart> parts,
                                         storage::StoreHandler handler) override {
        Result<std::string> result = Ok("receipt-" + location.key);
        {
            std::lock_guard lock(mutex_);
            calls_.push_back({"complete", location.key, session_id, 0});
            completed_parts_[location.key] = parts;
            if (auto failure = take_failure("complete", location.key, 0)) {
                result = Err<std::string>(*failure);
            } else {
                std::vector<std::uint8_t> assembled;
                for (const auto& part : parts) {
                    const auto& bytes = parts_[location.key][part.part_number];
                    assembled.insert(assembled.end(), bytes.begin(), bytes.end());
                }
                objects_[location.key] = std::move(assembled);
                --open_files_;
            }
        }
        deliver(std::chrono::milliseconds(1), std::move(handler), std::move(result));
    }

    void async_abort_multipart_upload(const std::string& session_id,
                                      const upload::ObjectLocation& location,
                                      storage::StoreHandler handler) override {
        Result<std::string> result = Ok("aborted-" + location.key);
        {
            std::lock_guard lock(mutex_);
            calls_.push_back({"abort", location.key, session_id, 0});
            if (auto failure = take_failure("abort", location.key, 0)) {
                result = Err<std::string>(*failure);
            }
            --open_files_;
        }
        deliver(std::chrono::milliseconds(1), std::move(handler), std::move(result));
    }

    void async_put_object(const upload::ObjectLocation& location,
                          std::vector<std::uint8_t> body,
                          const upload::EncryptionSettings&,
                          storage::StoreHandler handler) override {
        Result<std::string> result = Ok("put-" + location.key);
        {
            std::lock_guard lock(mutex_);
            calls_.push_back({"put", location.key, {}, 0});
            if (auto failure = take_failure("put", location.key, 0)) {
                result = Err<std::string>(*failure);
            } else {
                objects_[location.key] = std::move(body);
            }
        }
        deliver(std::chrono::milliseconds(1), std::move(handler), std::move(result));
    }

private:
    struct Failure {
        std::string message;
        std::size_t remaining = static_cast<std::size_t>(-1);
    };

    using FailureKey = std::tuple<std::string, std::string, std::uint32_t>;

    void set_failure(const std::string& op, const std::string& key, std::uint32_t part, std::string message) {
        std::lock_guard lock(mutex_);
        failures_[{op, key, part}] = Failure{std::move(message)};
    }

    // Caller holds mutex_.
    std::optional<std::string> take_failure(const std::string& op, const std::string& key, std::uint32_t part) {
        const auto it = failures_.find({op, key, part});
        if (it == failures_.end() || it->second.remaining == 0) {
            return std::nullopt;
        }
        --it->second.remaining;
        return it->second.message;
    }

    void deliver(std::chrono::milliseconds delay, storage::StoreHandler handler, Result<std::string> result) {
        auto timer = std::make_shared<asio::steady_timer>(executor_, delay);
        timer->async_wait([timer, handler = std::move(handler), result = std::move(result)](const boost::system::error_code&) {
            handler(result);
        });
    }

    asio::any_io_executor executor_;
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::map<FailureKey, Failure> failures_;
    DelayFn part_delay_;
    bool empty_session_ = false;
    std::size_t next_session_ = 0;

    std::map<std::string, std::size_t> in_flight_;
    std::map<std::string, std::size_t> max_in_flight_;
    std::size_t open_files_ = 0;
    std::size_t max_open_files_ = 0;

    std::map<std::string, std::map<std::uint32_t, std::vector<std::uint8_t>>> parts_;
    std::map<std::string, std::vector<upload::CompletedPart>> completed_parts_;
    std::map<std::string, std::vector<std::uint8_t>> objects_;
};

} // namespace chunkup::testing
