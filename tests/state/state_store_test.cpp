#include "chunkbus/state/state_store.hpp"
#include "chunkbus/transfer/chunker.hpp"
#include "chunkbus/transfer/codec.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace chunkbus;
using namespace chunkbus::state;

namespace {

transfer::Manifest make_manifest(const std::string& file_id, std::size_t size = 3000) {
    transfer::MemoryByteSource source(transfer::Bytes(size, 0x11));
    return transfer::build_manifest(source, transfer::ManifestOptions{file_id, "x.bin", "application/octet-stream", 1000})
        .value();
}

/// Counts puts and bytes written per record part.
class CountingRecordStore : public MemoryRecordStore {
public:
    Result<void> put(const RecordKey& key, const std::string& blob) override {
        auto& counter = key.part == RecordPart::Manifest ? manifest : progress;
        counter.puts++;
        counter.bytes += blob.size();
        counter.largest = std::max(counter.largest, blob.size());
        return MemoryRecordStore::put(key, blob);
    }

    struct Counter {
        std::size_t puts = 0;
        std::size_t bytes = 0;
        std::size_t largest = 0;
    };
    Counter manifest;
    Counter progress;
};

void put_with_manifest(MemoryRecordStore& records, const std::string& file_id, Role role,
                       const transfer::Manifest& manifest, const nlohmann::json& progress) {
    ASSERT_TRUE(records.put({file_id, role, RecordPart::Manifest}, transfer::manifest_to_json(manifest).dump()).is_ok());
    ASSERT_TRUE(records.put({file_id, role}, progress.dump()).is_ok());
}

} // namespace

TEST(TransferStateStoreTest, PublisherRecordRoundTrip) {
    MemoryRecordStore records;
    TransferStateStore store(records);

    PublisherRecord record;
    record.manifest = make_manifest("f1");
    record.source = "/data/x.bin";
    record.retry_queue = {0, 2};
    record.next_first_pass_index = 2;
    ASSERT_TRUE(store.save_publisher(record).is_ok());
    EXPECT_GT(record.last_update, 0);

    auto loaded = store.load_publisher("f1");
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(loaded.value().has_value());
    const auto& restored = *loaded.value();
    EXPECT_EQ(restored.manifest, record.manifest);
    EXPECT_EQ(restored.source, "/data/x.bin");
    EXPECT_EQ(restored.retry_queue, (std::set<std::uint32_t>{0, 2}));
    EXPECT_EQ(restored.next_first_pass_index, 2u);
    EXPECT_FALSE(restored.first_pass_done());
    EXPECT_FALSE(restored.acknowledged);
}

TEST(TransferStateStoreTest, SubscriberRecordWithoutManifest) {
    MemoryRecordStore records;
    TransferStateStore store(records);

    SubscriberRecord record;
    record.file_id = "early";
    ASSERT_TRUE(store.save_subscriber(record).is_ok());

    auto loaded = store.load_subscriber("early");
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_FALSE(loaded.value()->manifest.has_value());
    EXPECT_EQ(loaded.value()->received.total(), 0u);
}

TEST(TransferStateStoreTest, SubscriberBitmapPersists) {
    MemoryRecordStore records;
    TransferStateStore store(records);

    SubscriberRecord record;
    record.file_id = "f1";
    record.manifest = make_manifest("f1");
    record.received = transfer::ChunkBitmap(3);
    record.received.set(1);
    record.destination = "memory:f1";
    record.acked = true;
    ASSERT_TRUE(store.save_subscriber(record).is_ok());

    auto loaded = store.load_subscriber("f1").value();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->received, record.received);
    EXPECT_EQ(loaded->destination, "memory:f1");
    EXPECT_TRUE(loaded->acked);
    EXPECT_FALSE(loaded->ack_sent);
}

TEST(TransferStateStoreTest, LastUpdateNeverDecreases) {
    MemoryRecordStore records;
    TransferStateStore store(records);

    SubscriberRecord record;
    record.file_id = "f1";
    record.last_update = TransferStateStore::now_ms() + 3600 * 1000;  // clock stepped back since
    const auto before = record.last_update;
    ASSERT_TRUE(store.save_subscriber(record).is_ok());
    EXPECT_EQ(record.last_update, before);
}

TEST(TransferStateStoreTest, CorruptRecordIsStateStoreError) {
    MemoryRecordStore records;
    TransferStateStore store(records);
    ASSERT_TRUE(records.put({"f1", Role::Subscriber}, "{not json").is_ok());
    ASSERT_TRUE(records.put({"f2", Role::Subscriber}, R"({"file_id":"f2","received":"zz"})").is_ok());

    auto first = store.load_subscriber("f1");
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(first.error().code, ErrorCode::StateStore);
    EXPECT_TRUE(store.load_subscriber("f2").is_error());
}

TEST(TransferStateStoreTest, PurgeRemovesOnlyOldCompletedRecords) {
    MemoryRecordStore records;
    TransferStateStore store(records);

    // Written through the raw store so last_update can lie in the past.
    PublisherRecord old_acked;
    old_acked.manifest = make_manifest("old-acked");
    old_acked.acknowledged = true;
    old_acked.last_update = 1000;
    put_with_manifest(records, "old-acked", Role::Publisher, old_acked.manifest, publisher_record_to_json(old_acked));

    PublisherRecord old_pending = old_acked;
    old_pending.manifest = make_manifest("old-pending");
    old_pending.acknowledged = false;
    put_with_manifest(records, "old-pending", Role::Publisher, old_pending.manifest,
                      publisher_record_to_json(old_pending));

    SubscriberRecord old_sent;
    old_sent.file_id = "old-sent";
    old_sent.acked = true;
    old_sent.ack_sent = true;
    old_sent.last_update = 1000;
    ASSERT_TRUE(records.put({"old-sent", Role::Subscriber}, subscriber_record_to_json(old_sent).dump()).is_ok());

    SubscriberRecord fresh_sent;
    fresh_sent.file_id = "fresh-sent";
    fresh_sent.acked = true;
    fresh_sent.ack_sent = true;
    ASSERT_TRUE(store.save_subscriber(fresh_sent).is_ok());

    auto purged = store.purge_completed(std::chrono::hours(1));
    ASSERT_TRUE(purged.is_ok());
    EXPECT_EQ(purged.value(), 2u);

    EXPECT_FALSE(store.load_publisher("old-acked").value().has_value());
    EXPECT_FALSE(records.get({"old-acked", Role::Publisher, RecordPart::Manifest}).value().has_value());
    EXPECT_TRUE(store.load_publisher("old-pending").value().has_value());
    EXPECT_FALSE(store.load_subscriber("old-sent").value().has_value());
    EXPECT_TRUE(store.load_subscriber("fresh-sent").value().has_value());
}

TEST(TransferStateStoreTest, ManifestWrittenOncePerTransfer) {
    CountingRecordStore records;
    TransferStateStore store(records);

    SubscriberRecord record;
    record.file_id = "big";
    record.manifest = make_manifest("big", 500 * 1000);
    record.received = transfer::ChunkBitmap(500);
    for (std::uint32_t index = 0; index < 500; ++index) {
        record.received.set(index);
        ASSERT_TRUE(store.save_subscriber(record).is_ok());
    }

    EXPECT_EQ(records.manifest.puts, 1u);
    EXPECT_EQ(records.progress.puts, 500u);
    // A progress write carries the bitmap, never the 500 chunk digests.
    EXPECT_LT(records.progress.largest, 500u);
    EXPECT_GT(records.manifest.largest, 500u * 64u);

    auto loaded = store.load_subscriber("big").value();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->manifest, record.manifest);
    EXPECT_TRUE(loaded->received.complete());
}

TEST(TransferStateStoreTest, ChangedManifestIsRewritten) {
    CountingRecordStore records;
    TransferStateStore store(records);

    PublisherRecord record;
    record.manifest = make_manifest("f1");
    ASSERT_TRUE(store.save_publisher(record).is_ok());
    ASSERT_TRUE(store.save_publisher(record).is_ok());
    EXPECT_EQ(records.manifest.puts, 1u);

    record.manifest = make_manifest("f1", 4500);
    ASSERT_TRUE(store.save_publisher(record).is_ok());
    EXPECT_EQ(records.manifest.puts, 2u);
    EXPECT_EQ(store.load_publisher("f1").value()->manifest.total_chunks, 5u);

    // After removal the manifest must be written again, even if unchanged.
    ASSERT_TRUE(store.remove("f1", Role::Publisher).is_ok());
    ASSERT_TRUE(store.save_publisher(record).is_ok());
    EXPECT_EQ(records.manifest.puts, 3u);
}

TEST(TransferStateStoreTest, PublisherProgressWithoutManifestIsError) {
    MemoryRecordStore records;
    TransferStateStore store(records);
    ASSERT_TRUE(records.put({"orphan", Role::Publisher}, R"({"file_id":"orphan"})").is_ok());

    auto loaded = store.load_publisher("orphan");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::StateStore);
}
