#include "chunkup/storage/local_object_store.hpp"
#include "chunkup/upload/checksum.hpp"
#include "support/test_files.hpp"

#include <gtest/gtest.h>

#include <future>

namespace fs = std::filesystem;
using chunkup::Result;
using chunkup::storage::LocalObjectStore;
using chunkup::storage::StoreHandler;
using chunkup::testing::create_temp_dir;
using chunkup::testing::make_bytes;
using chunkup::testing::read_file;
using chunkup::upload::CompletedPart;
using chunkup::upload::EncryptionSettings;
using chunkup::upload::FileChunk;
using chunkup::upload::ObjectLocation;

namespace {

const ObjectLocation kLocation{"bucket", "prefix/data/import-1/report.csv"};

// Blocks until the store answers.
template<typename Fn>
Result<std::string> await(Fn&& start) {
    std::promise<Result<std::string>> promise;
    auto future = promise.get_future();
    start(StoreHandler([&promise](Result<std::string> result) { promise.set_value(std::move(result)); }));
    return future.get();
}

FileChunk make_chunk(std::uint32_t part_number, std::vector<std::uint8_t> bytes) {
    FileChunk chunk;
    chunk.part_number = part_number;
    chunk.checksum = chunkup::upload::sha256_hex(bytes).value();
    chunk.bytes = std::move(bytes);
    return chunk;
}

class LocalObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = create_temp_dir("local_store");
        store = std::make_unique<LocalObjectStore>(root);
    }

    void TearDown() override {
        store.reset();
        fs::remove_all(root);
    }

    std::string create(const ObjectLocation& location = kLocation) {
        auto session = await([&](StoreHandler h) {
            store->async_create_multipart_upload(location, EncryptionSettings{}, std::move(h));
        });
        EXPECT_TRUE(session.is_ok());
        return session.is_ok() ? session.value() : std::string();
    }

    Result<std::string> upload_part(const std::string& session, std::uint32_t part, std::vector<std::uint8_t> bytes,
                                    const ObjectLocation& location = kLocation) {
        return await([&](StoreHandler h) {
            store->async_upload_part(session, part, location, make_chunk(part, std::move(bytes)), std::move(h));
        });
    }

    Result<std::string> complete(const std::string& session, std::vector<CompletedPart> parts) {
        return await([&](StoreHandler h) {
            store->async_complete_multipart_upload(session, kLocation, std::move(parts), std::move(h));
        });
    }

    Result<std::string> abort_upload(const std::string& session) {
        return await([&](StoreHandler h) {
            store->async_abort_multipart_upload(session, kLocation, std::move(h));
        });
    }

    fs::path root;
    std::unique_ptr<LocalObjectStore> store;
};

} // namespace

TEST_F(LocalObjectStoreTest, MultipartUploadAssemblesObject) {
    const auto session = create();
    EXPECT_EQ(store->open_sessions(), 1u);

    const auto first = make_bytes(100, 1);
    const auto second = make_bytes(40, 2);

    // Parts may arrive in any order
    auto etag2 = upload_part(session, 2, second);
    auto etag1 = upload_part(session, 1, first);
    ASSERT_TRUE(etag1.is_ok());
    ASSERT_TRUE(etag2.is_ok());
    EXPECT_EQ(etag1.value(), chunkup::upload::sha256_hex(first).value());

    auto receipt = complete(session, {{1, etag1.value()}, {2, etag2.value()}});
    ASSERT_TRUE(receipt.is_ok()) << receipt.error();
    EXPECT_EQ(receipt.value(), "bucket/prefix/data/import-1/report.csv");

    auto expected = first;
    expected.insert(expected.end(), second.begin(), second.end());
    EXPECT_EQ(read_file(store->object_path(kLocation).value()), expected);

    EXPECT_EQ(store->open_sessions(), 0u);
    EXPECT_FALSE(fs::exists(root / ".multipart" / session));
}

TEST_F(LocalObjectStoreTest, CompleteRejectsUnsortedParts) {
    const auto session = create();
    auto etag1 = upload_part(session, 1, make_bytes(10, 1));
    auto etag2 = upload_part(session, 2, make_bytes(10, 2));

    auto receipt = complete(session, {{2, etag2.value()}, {1, etag1.value()}});
    ASSERT_TRUE(receipt.is_error());
    EXPECT_NE(receipt.error().find("InvalidPartOrder"), std::string::npos);

    // The session survives a rejected completion
    EXPECT_EQ(store->open_sessions(), 1u);
    EXPECT_FALSE(fs::exists(store->object_path(kLocation).value()));
}

TEST_F(LocalObjectStoreTest, CompleteRejectsUnknownOrStaleEntityTags) {
    const auto session = create();
    auto etag1 = upload_part(session, 1, make_bytes(10, 1));
    ASSERT_TRUE(etag1.is_ok());

    auto wrong_tag = complete(session, {{1, "not-the-etag"}});
    ASSERT_TRUE(wrong_tag.is_error());
    EXPECT_NE(wrong_tag.error().find("InvalidPart"), std::string::npos);

    auto missing_part = complete(session, {{1, etag1.value()}, {2, "etag"}});
    ASSERT_TRUE(missing_part.is_error());

    auto empty = complete(session, {});
    ASSERT_TRUE(empty.is_error());
}

TEST_F(LocalObjectStoreTest, CorruptedChunkIsRejected) {
    const auto session = create();

    auto chunk = make_chunk(1, make_bytes(32));
    chunk.bytes[0] ^= 0xFF;

    auto result = await([&](StoreHandler h) {
        store->async_upload_part(session, 1, kLocation, std::move(chunk), std::move(h));
    });
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("BadDigest"), std::string::npos);
}

TEST_F(LocalObjectStoreTest, AbortDiscardsStagedParts) {
    const auto session = create();
    ASSERT_TRUE(upload_part(session, 1, make_bytes(10)).is_ok());
    EXPECT_TRUE(fs::exists(root / ".multipart" / session / "part-1"));

    auto receipt = abort_upload(session);
    ASSERT_TRUE(receipt.is_ok());
    EXPECT_EQ(receipt.value(), "aborted " + session);
    EXPECT_FALSE(fs::exists(root / ".multipart" / session));
    EXPECT_EQ(store->open_sessions(), 0u);

    // The session id is dead after abort
    EXPECT_TRUE(upload_part(session, 2, make_bytes(10)).is_error());
    EXPECT_TRUE(abort_upload(session).is_error());
}

TEST_F(LocalObjectStoreTest, UnknownSessionIsRejected) {
    auto part = upload_part("upload-404", 1, make_bytes(10));
    ASSERT_TRUE(part.is_error());
    EXPECT_NE(part.error().find("NoSuchUpload"), std::string::npos);

    auto receipt = complete("upload-404", {{1, "etag"}});
    ASSERT_TRUE(receipt.is_error());
    EXPECT_NE(receipt.error().find("NoSuchUpload"), std::string::npos);
}

TEST_F(LocalObjectStoreTest, SessionIsBoundToItsObject) {
    const auto session = create();
    auto part = upload_part(session, 1, make_bytes(10), ObjectLocation{"bucket", "another/key"});
    ASSERT_TRUE(part.is_error());
    EXPECT_NE(part.error().find("InvalidRequest"), std::string::npos);
}

TEST_F(LocalObjectStoreTest, PartNumbersOutOfRangeAreRejected) {
    const auto session = create();
    EXPECT_TRUE(upload_part(session, 0, make_bytes(10)).is_error());
    EXPECT_TRUE(upload_part(session, chunkup::upload::kMaxPartCount + 1, make_bytes(10)).is_error());
}

TEST_F(LocalObjectStoreTest, KeysCannotEscapeTheRoot) {
    EXPECT_TRUE(store->object_path(ObjectLocation{"bucket", "../../etc/passwd"}).is_error());
    EXPECT_TRUE(store->object_path(ObjectLocation{"bucket", "a/../../b"}).is_error());
    EXPECT_TRUE(store->object_path(ObjectLocation{".multipart", "key"}).is_error());
    EXPECT_TRUE(store->object_path(ObjectLocation{"", "key"}).is_error());
    EXPECT_TRUE(store->object_path(ObjectLocation{"bucket", ""}).is_error());

    auto session = await([&](StoreHandler h) {
        store->async_create_multipart_upload(ObjectLocation{"bucket", "../escape"}, EncryptionSettings{}, std::move(h));
    });
    EXPECT_TRUE(session.is_error());
}

TEST_F(LocalObjectStoreTest, PutWritesWholeObject) {
    const auto body = make_bytes(64);
    auto receipt = await([&](StoreHandler h) {
        store->async_put_object(kLocation, body, EncryptionSettings{}, std::move(h));
    });
    ASSERT_TRUE(receipt.is_ok());
    EXPECT_EQ(receipt.value(), "bucket/prefix/data/import-1/report.csv");

    const auto path = store->object_path(kLocation).value();
    EXPECT_EQ(read_file(path), body);
    EXPECT_FALSE(fs::exists(fs::path(path.string() + ".partial")));
}

TEST_F(LocalObjectStoreTest, PutAcceptsEmptyBody) {
    auto receipt = await([&](StoreHandler h) {
        store->async_put_object(kLocation, {}, EncryptionSettings{}, std::move(h));
    });
    ASSERT_TRUE(receipt.is_ok());
    EXPECT_EQ(fs::file_size(store->object_path(kLocation).value()), 0u);
}

TEST_F(LocalObjectStoreTest, SingleEmptyPartCompletesToEmptyObject) {
    const auto session = create();

    auto etag = upload_part(session, 1, {});
    ASSERT_TRUE(etag.is_ok()) << etag.error();

    auto receipt = complete(session, {{1, etag.value()}});
    ASSERT_TRUE(receipt.is_ok()) << receipt.error();
    EXPECT_EQ(fs::file_size(store->object_path(kLocation).value()), 0u);
    EXPECT_EQ(store->open_sessions(), 0u);
}

TEST_F(LocalObjectStoreTest, EmptyPartBetweenOthersIsSkipped) {
    const auto session = create();
    const auto first = make_bytes(30, 1);
    const auto third = make_bytes(20, 3);

    auto etag1 = upload_part(session, 1, first);
    auto etag2 = upload_part(session, 2, {});
    auto etag3 = upload_part(session, 3, third);
    ASSERT_TRUE(etag1.is_ok() && etag2.is_ok() && etag3.is_ok());

    auto receipt = complete(session, {{1, etag1.value()}, {2, etag2.value()}, {3, etag3.value()}});
    ASSERT_TRUE(receipt.is_ok()) << receipt.error();

    auto expected = first;
    expected.insert(expected.end(), third.begin(), third.end());
    EXPECT_EQ(read_file(store->object_path(kLocation).value()), expected);
}
