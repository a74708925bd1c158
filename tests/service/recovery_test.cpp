#include "chunkbus/service/receiver.hpp"
#include "chunkbus/service/sender.hpp"
#include "support/transfer_fixture.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace chunkbus;
using chunkbus::test_support::make_pattern;
using chunkbus::test_support::TransferTest;

namespace {

/// Drops every chunk from `first_lost` onward, on both chunk channels.
transport::FaultHook lose_chunks_from(std::uint32_t first_lost) {
    return [first_lost](const transport::Envelope& envelope) {
        const auto ref = transfer::parse_topic("test", envelope.topic);
        if (ref && (ref->kind == transfer::TopicKind::Chunk || ref->kind == transfer::TopicKind::Retry)) {
            auto chunk = transfer::decode_chunk(envelope.payload);
            if (chunk.is_ok() && chunk.value().chunk_index >= first_lost) {
                return transport::FaultAction::Drop;
            }
        }
        return transport::FaultAction::Deliver;
    };
}

class RecoveryTest : public TransferTest {
protected:
    service::SourceOpener opener_for(const transfer::Bytes& data) {
        return [data](const std::string& locator) -> Result<std::unique_ptr<transfer::ByteSource>> {
            if (locator != "mem://payload") {
                return Err<std::unique_ptr<transfer::ByteSource>>(ErrorCode::SourceUnavailable,
                                                                  "Unknown locator " + locator);
            }
            return Ok<std::unique_ptr<transfer::ByteSource>>(
                std::make_unique<transfer::MemoryByteSource>(data, locator));
        };
    }

    void send_partially(const transfer::Bytes& data, const std::string& file_id) {
        bus.set_fault_hook(lose_chunks_from(2));
        service::ReceiverService receiver(bus, receiver_store, events, config, storage);
        receiver.listen_all();
        service::SenderService sender(bus, sender_store, events, config);

        ASSERT_TRUE(sender.send(std::make_unique<transfer::MemoryByteSource>(data, "mem://payload"),
                                transfer::ManifestOptions{file_id, file_id + ".bin",
                                                          "application/octet-stream", 0}).is_ok());
        bus.drain();
        receiver.tick();
        sender.poll();
        bus.drain();

        ASSERT_EQ(receiver.subscriber(file_id)->record().received.count(), 2u);
        ASSERT_FALSE(sender.all_acknowledged());
        bus.set_fault_hook({});
    }
};

} // namespace

TEST_F(RecoveryTest, BothSidesResumeAfterRestart) {
    const auto data = make_pattern(4000, 11);
    send_partially(data, "restart");
    ASSERT_EQ(bus.subscription_count(), 0u);
    const auto accepted_before = recorder.accepted.size();

    service::ReceiverService receiver(bus, receiver_store, events, config, storage);
    receiver.listen_all();
    auto restored = receiver.recover();
    ASSERT_TRUE(restored.is_ok());
    EXPECT_EQ(restored.value(), 1u);
    EXPECT_EQ(receiver.subscriber("restart")->state(), session::SubscriberState::Receiving);

    service::SenderService sender(bus, sender_store, events, config);
    auto resumed = sender.recover(opener_for(data));
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_EQ(resumed.value(), 1u);
    bus.drain();

    EXPECT_TRUE(sender.all_acknowledged());
    EXPECT_TRUE(receiver.all_complete());
    EXPECT_EQ(storage.contents("restart"), data);
    // Only the two chunks lost before the restart travel again.
    EXPECT_EQ(recorder.accepted.size() - accepted_before, 2u);
    EXPECT_TRUE(recorder.started.back().resumed);
}

TEST_F(RecoveryTest, SenderWithUnreadableSourceFails) {
    const auto data = make_pattern(4000, 12);
    send_partially(data, "lost-source");

    service::SenderService sender(bus, sender_store, events, config);
    auto resumed = sender.recover([](const std::string& locator) -> Result<std::unique_ptr<transfer::ByteSource>> {
        return Err<std::unique_ptr<transfer::ByteSource>>(ErrorCode::SourceUnavailable, locator + " is gone");
    });
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_EQ(resumed.value(), 0u);

    // The failed publisher is dropped, its record kept
    EXPECT_EQ(sender.publisher("lost-source"), nullptr);
    EXPECT_TRUE(sender.file_ids().empty());
    EXPECT_TRUE(sender.all_acknowledged());
    EXPECT_EQ(bus.subscription_count(), 0u);
    ASSERT_FALSE(recorder.failed.empty());
    EXPECT_EQ(recorder.failed.back().file_id, "lost-source");
    EXPECT_EQ(recorder.failed.back().error.code, ErrorCode::SourceUnavailable);
    auto record = sender_store.load_publisher("lost-source");
    ASSERT_TRUE(record.is_ok());
    ASSERT_TRUE(record.value().has_value());
    EXPECT_FALSE(record.value()->acknowledged);

    // Once the source is back, the same id resumes and completes
    service::ReceiverService receiver(bus, receiver_store, events, config, storage);
    receiver.listen_all();
    ASSERT_TRUE(receiver.recover().is_ok());
    auto retried = sender.recover(opener_for(data));
    ASSERT_TRUE(retried.is_ok());
    EXPECT_EQ(retried.value(), 1u);
    bus.drain();

    EXPECT_TRUE(sender.all_acknowledged());
    EXPECT_EQ(storage.contents("lost-source"), data);
}

TEST_F(RecoveryTest, AcknowledgedTransfersAreNotResumed) {
    const auto data = make_pattern(2500, 13);
    {
        service::ReceiverService receiver(bus, receiver_store, events, config, storage);
        receiver.listen_all();
        service::SenderService sender(bus, sender_store, events, config);
        ASSERT_TRUE(sender.send(std::make_unique<transfer::MemoryByteSource>(data, "mem://payload"),
                                transfer::ManifestOptions{"finished", "", "application/octet-stream", 0}).is_ok());
        bus.drain();
        ASSERT_TRUE(sender.all_acknowledged());
    }

    bus.clear_history();
    service::SenderService sender(bus, sender_store, events, config);
    auto resumed = sender.recover(opener_for(data));
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_EQ(resumed.value(), 0u);
    EXPECT_EQ(sender.publisher("finished"), nullptr);
    EXPECT_TRUE(bus.history().empty());
}

TEST_F(RecoveryTest, RestoredCompleteReceiverStaysSilent) {
    const auto data = make_pattern(2500, 14);
    {
        service::ReceiverService receiver(bus, receiver_store, events, config, storage);
        receiver.listen_all();
        service::SenderService sender(bus, sender_store, events, config);
        ASSERT_TRUE(sender.send(std::make_unique<transfer::MemoryByteSource>(data),
                                transfer::ManifestOptions{"kept", "", "application/octet-stream", 0}).is_ok());
        bus.drain();
        ASSERT_TRUE(receiver.all_complete());
    }

    bus.clear_history();
    service::ReceiverService receiver(bus, receiver_store, events, config, storage);
    ASSERT_TRUE(receiver.recover().is_ok());
    receiver.tick();
    bus.drain();

    EXPECT_EQ(receiver.subscriber("kept")->state(), session::SubscriberState::Complete);
    EXPECT_TRUE(bus.history().empty());
    EXPECT_EQ(storage.contents("kept"), data);
}

TEST_F(RecoveryTest, PurgeDropsOnlyFinishedRecords) {
    const auto data = make_pattern(4000, 15);
    send_partially(data, "open");
    {
        service::ReceiverService receiver(bus, receiver_store, events, config, storage);
        receiver.listen_all();
        service::SenderService sender(bus, sender_store, events, config);
        ASSERT_TRUE(sender.send(std::make_unique<transfer::MemoryByteSource>(make_pattern(1000)),
                                transfer::ManifestOptions{"done", "", "application/octet-stream", 0}).is_ok());
        bus.drain();
        ASSERT_TRUE(sender.all_acknowledged());
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    service::SenderService sender(bus, sender_store, events, config);
    service::ReceiverService receiver(bus, receiver_store, events, config, storage);
    auto sender_purged = sender.purge_completed(std::chrono::milliseconds(0));
    auto receiver_purged = receiver.purge_completed(std::chrono::milliseconds(0));
    ASSERT_TRUE(sender_purged.is_ok());
    ASSERT_TRUE(receiver_purged.is_ok());
    EXPECT_EQ(sender_purged.value(), 1u);
    EXPECT_EQ(receiver_purged.value(), 1u);

    EXPECT_FALSE(sender_store.load_publisher("done").value().has_value());
    EXPECT_TRUE(sender_store.load_publisher("open").value().has_value());
    EXPECT_TRUE(receiver_store.load_subscriber("open").value().has_value());
}
