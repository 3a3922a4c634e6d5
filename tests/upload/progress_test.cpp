#include "chunkup/upload/progress.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <thread>
#include <vector>

using chunkup::upload::BatchProgress;
using chunkup::upload::ProgressTracker;
using chunkup::upload::ProgressUpdate;
using chunkup::upload::make_progress_channel;

namespace {

ProgressUpdate make_update(const std::string& file_id, std::uint32_t part, std::uint64_t sent,
                           std::optional<std::uint64_t> size) {
    ProgressUpdate update;
    update.part_number = part;
    update.import_id = "import-1";
    update.file_id = file_id;
    update.bytes_sent = sent;
    update.file_size = size;
    return update;
}

} // namespace

TEST(ProgressUpdateTest, PercentDone) {
    EXPECT_DOUBLE_EQ(make_update("/a", 1, 50, 200).percent_done(), 25.0);
    EXPECT_FALSE(make_update("/a", 1, 50, 200).completed());

    EXPECT_DOUBLE_EQ(make_update("/a", 4, 200, 200).percent_done(), 100.0);
    EXPECT_TRUE(make_update("/a", 4, 200, 200).completed());
}

TEST(ProgressUpdateTest, UnknownSizeIsNotANumber) {
    const auto update = make_update("/a", 1, 50, std::nullopt);
    EXPECT_TRUE(std::isnan(update.percent_done()));
    EXPECT_FALSE(update.completed());
}

TEST(ProgressUpdateTest, EmptyFileIsCompleteAfterItsOnlyPart) {
    const auto update = make_update("/empty", 1, 0, 0);
    EXPECT_DOUBLE_EQ(update.percent_done(), 100.0);
    EXPECT_TRUE(update.completed());
}

TEST(ProgressTrackerTest, LatestUpdateReplacesPrevious) {
    ProgressTracker tracker;

    tracker.record(make_update("/a", 1, 100, 300));
    tracker.record(make_update("/b", 1, 10, 10));
    tracker.record(make_update("/a", 2, 200, 300));

    const auto snapshot = tracker.snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot.at("/a").bytes_sent, 200u);
    EXPECT_EQ(snapshot.at("/a").part_number, 2u);
    EXPECT_EQ(snapshot.at("/b").bytes_sent, 10u);

    ASSERT_TRUE(tracker.find("/a").has_value());
    EXPECT_FALSE(tracker.find("/missing").has_value());
}

TEST(ProgressTrackerTest, SnapshotHasNoSideEffects) {
    auto [sender, receiver] = make_progress_channel();
    ProgressTracker tracker(std::move(receiver));

    sender.send(make_update("/a", 1, 100, 300));

    // Nothing recorded until the owner polls
    EXPECT_TRUE(tracker.snapshot().empty());
    EXPECT_TRUE(tracker.snapshot().empty());

    EXPECT_EQ(tracker.poll(), 1u);
    EXPECT_EQ(tracker.snapshot().size(), 1u);
    EXPECT_EQ(tracker.snapshot().size(), 1u);
    EXPECT_EQ(tracker.poll(), 0u);
}

TEST(ProgressChannelTest, DrainsEveryPendingUpdateInOrder) {
    auto [sender, receiver] = make_progress_channel();
    ProgressTracker tracker(std::move(receiver));

    for (std::uint32_t part = 1; part <= 5; ++part) {
        EXPECT_TRUE(sender.send(make_update("/a", part, part * 100ull, 500)));
    }

    EXPECT_EQ(tracker.poll(), 5u);
    EXPECT_EQ(tracker.find("/a")->bytes_sent, 500u);
    EXPECT_TRUE(tracker.find("/a")->completed());
}

TEST(ProgressChannelTest, FullChannelDropsInsteadOfBlocking) {
    auto [sender, receiver] = make_progress_channel(2);
    ProgressTracker tracker(std::move(receiver));

    EXPECT_TRUE(sender.send(make_update("/a", 1, 1, 10)));
    EXPECT_TRUE(sender.send(make_update("/a", 2, 2, 10)));
    EXPECT_FALSE(sender.send(make_update("/a", 3, 3, 10)));

    EXPECT_EQ(tracker.poll(), 2u);
    EXPECT_EQ(tracker.find("/a")->bytes_sent, 2u);
}

TEST(ProgressChannelTest, SendingWithoutReceiverIsHarmless) {
    auto channel = make_progress_channel();
    auto sender = channel.first;
    EXPECT_TRUE(sender.connected());

    {
        auto receiver = std::move(channel.second);
    }

    EXPECT_FALSE(sender.connected());
    EXPECT_FALSE(sender.send(make_update("/a", 1, 1, 10)));

    // A default sender was never connected
    chunkup::upload::ProgressSender unconnected;
    EXPECT_FALSE(unconnected.send(make_update("/a", 1, 1, 10)));
}

TEST(ProgressChannelTest, ManyProducersOneConsumer) {
    auto [sender, receiver] = make_progress_channel();
    ProgressTracker tracker(std::move(receiver));

    std::vector<std::thread> producers;
    for (int file = 0; file < 4; ++file) {
        producers.emplace_back([sender = sender, file]() {
            for (std::uint32_t part = 1; part <= 50; ++part) {
                sender.send(make_update("/file" + std::to_string(file), part, part * 10ull, 500));
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_EQ(tracker.poll(), 200u);
    ASSERT_EQ(tracker.snapshot().size(), 4u);
    for (const auto& [file_id, update] : tracker.snapshot()) {
        EXPECT_EQ(update.bytes_sent, 500u) << file_id;
    }
}

TEST(ProgressTrackerTest, BatchProgressAggregatesFiles) {
    ProgressTracker tracker;
    tracker.record(make_update("/a", 2, 100, 100));
    tracker.record(make_update("/b", 1, 50, 200));

    BatchProgress batch = tracker.batch_progress();
    EXPECT_EQ(batch.files, 2u);
    EXPECT_EQ(batch.files_completed, 1u);
    EXPECT_EQ(batch.bytes_sent, 150u);
    EXPECT_EQ(batch.total_bytes, 300u);
    EXPECT_TRUE(batch.size_known);
    EXPECT_DOUBLE_EQ(batch.percent_done(), 50.0);

    tracker.record(make_update("/c", 1, 10, std::nullopt));
    batch = tracker.batch_progress();
    EXPECT_FALSE(batch.size_known);
    EXPECT_TRUE(std::isnan(batch.percent_done()));
}
