#include "chunkbus/state/record_store.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace chunkbus::state;
namespace fs = std::filesystem;

namespace {

class DirectoryRecordStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("chunkbus_records_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    fs::path root_;
};

} // namespace

TEST(MemoryRecordStoreTest, PutGetRemove) {
    MemoryRecordStore store;
    const RecordKey key{"f1", Role::Subscriber};

    auto missing = store.get(key);
    ASSERT_TRUE(missing.is_ok());
    EXPECT_FALSE(missing.value().has_value());

    ASSERT_TRUE(store.put(key, "one").is_ok());
    ASSERT_TRUE(store.put(key, "two").is_ok());
    EXPECT_EQ(*store.get(key).value(), "two");
    EXPECT_EQ(store.size(), 1u);

    // Same file_id, other role: separate record
    EXPECT_FALSE(store.get({"f1", Role::Publisher}).value().has_value());

    ASSERT_TRUE(store.remove(key).is_ok());
    ASSERT_TRUE(store.remove(key).is_ok());
    EXPECT_EQ(store.size(), 0u);
}

TEST(MemoryRecordStoreTest, ListByRole) {
    MemoryRecordStore store;
    ASSERT_TRUE(store.put({"a", Role::Publisher}, "x").is_ok());
    ASSERT_TRUE(store.put({"b", Role::Subscriber}, "y").is_ok());
    ASSERT_TRUE(store.put({"c", Role::Subscriber}, "z").is_ok());

    auto subscribers = store.list(Role::Subscriber).value();
    std::sort(subscribers.begin(), subscribers.end());
    EXPECT_EQ(subscribers, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(store.list(Role::Publisher).value(), (std::vector<std::string>{"a"}));
}

TEST_F(DirectoryRecordStoreTest, SurvivesReopen) {
    {
        DirectoryRecordStore store(root_);
        ASSERT_TRUE(store.put({"report.pdf-10-ab", Role::Publisher}, R"({"k":1})").is_ok());
    }

    DirectoryRecordStore reopened(root_);
    auto blob = reopened.get({"report.pdf-10-ab", Role::Publisher});
    ASSERT_TRUE(blob.is_ok());
    ASSERT_TRUE(blob.value().has_value());
    EXPECT_EQ(*blob.value(), R"({"k":1})");
    EXPECT_TRUE(fs::exists(root_ / "publisher" / "report.pdf-10-ab.json"));
}

TEST_F(DirectoryRecordStoreTest, EncodesUnsafeIds) {
    DirectoryRecordStore store(root_);
    const std::string id = "dir/name with space";
    ASSERT_TRUE(store.put({id, Role::Subscriber}, "{}").is_ok());

    EXPECT_EQ(store.list(Role::Subscriber).value(), (std::vector<std::string>{id}));
    EXPECT_TRUE(store.get({id, Role::Subscriber}).value().has_value());
}

TEST_F(DirectoryRecordStoreTest, IgnoresLeftoverTemporaries) {
    DirectoryRecordStore store(root_);
    ASSERT_TRUE(store.put({"f1", Role::Subscriber}, "{}").is_ok());
    {
        std::ofstream stray(root_ / "subscriber" / "f2.json.tmp");
        stray << "partial";
    }

    EXPECT_EQ(store.list(Role::Subscriber).value(), (std::vector<std::string>{"f1"}));
}

TEST_F(DirectoryRecordStoreTest, ListOnEmptyRootIsEmpty) {
    DirectoryRecordStore store(root_);
    auto ids = store.list(Role::Publisher);
    ASSERT_TRUE(ids.is_ok());
    EXPECT_TRUE(ids.value().empty());
    EXPECT_TRUE(store.remove({"nothing", Role::Publisher}).is_ok());
}

TEST_F(DirectoryRecordStoreTest, ManifestPartsLiveBesideProgress) {
    DirectoryRecordStore store(root_);
    ASSERT_TRUE(store.put({"f1", Role::Subscriber}, R"({"p":1})").is_ok());
    ASSERT_TRUE(store.put({"f1", Role::Subscriber, RecordPart::Manifest}, R"({"m":1})").is_ok());

    EXPECT_TRUE(fs::exists(root_ / "subscriber" / "manifests" / "f1.json"));
    EXPECT_EQ(store.list(Role::Subscriber).value(), (std::vector<std::string>{"f1"}));
    EXPECT_EQ(*store.get({"f1", Role::Subscriber}).value(), R"({"p":1})");
    EXPECT_EQ(*store.get({"f1", Role::Subscriber, RecordPart::Manifest}).value(), R"({"m":1})");

    ASSERT_TRUE(store.remove({"f1", Role::Subscriber}).is_ok());
    EXPECT_TRUE(store.get({"f1", Role::Subscriber, RecordPart::Manifest}).value().has_value());
}

TEST(MemoryRecordStoreTest, ManifestPartsNotListed) {
    MemoryRecordStore store;
    ASSERT_TRUE(store.put({"f1", Role::Publisher, RecordPart::Manifest}, "{}").is_ok());
    EXPECT_TRUE(store.list(Role::Publisher).value().empty());
    ASSERT_TRUE(store.put({"f1", Role::Publisher}, "{}").is_ok());
    EXPECT_EQ(store.list(Role::Publisher).value(), (std::vector<std::string>{"f1"}));
}

TEST(FileNameEncodingTest, RoundTripsAndRejectsMalformed) {
    EXPECT_EQ(encode_file_name("a/b c"), "a%2Fb%20c");
    EXPECT_EQ(decode_file_name("a%2Fb%20c"), std::optional<std::string>("a/b c"));
    EXPECT_FALSE(decode_file_name("bad%2").has_value());
    EXPECT_FALSE(decode_file_name("bad%zz").has_value());
}
