#include "chunkbus/storage/storage.hpp"
#include "chunkbus/transfer/chunker.hpp"
#include "chunkbus/transfer/digest.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace chunkbus;
using namespace chunkbus::storage;
namespace fs = std::filesystem;

namespace {

transfer::Manifest manifest_for(const std::string& file_id, const std::string& name, const Bytes& data) {
    transfer::MemoryByteSource source(data);
    return transfer::build_manifest(source, transfer::ManifestOptions{file_id, name, "application/octet-stream", 4})
        .value();
}

} // namespace

TEST(FileStorageTest, PositionalWritesReassembleSource) {
    const auto root = fs::temp_directory_path() / "chunkbus_storage_test";
    fs::remove_all(root);

    const Bytes data{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    const auto manifest = manifest_for("f1", "out.bin", data);

    FileStorageProvider provider(root);
    EXPECT_EQ(provider.path_for(manifest), root / "f1" / "out.bin");

    auto storage = provider.open(manifest);
    ASSERT_TRUE(storage.is_ok());
    EXPECT_EQ(storage.value()->size(), 10u);

    ASSERT_TRUE(storage.value()->write_at(8, Bytes{9, 10}).is_ok());
    ASSERT_TRUE(storage.value()->write_at(0, Bytes{1, 2, 3, 4}).is_ok());
    ASSERT_TRUE(storage.value()->write_at(4, Bytes{5, 6, 7, 8}).is_ok());
    ASSERT_TRUE(storage.value()->write_at(4, Bytes{5, 6, 7, 8}).is_ok());

    auto digest = storage.value()->digest();
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value(), manifest.file_digest);
    EXPECT_EQ(fs::file_size(provider.path_for(manifest)), 10u);

    // Never extends past the declared size
    auto past_end = storage.value()->write_at(8, Bytes{9, 10, 11});
    ASSERT_TRUE(past_end.is_error());
    EXPECT_EQ(past_end.error().code, ErrorCode::StorageWrite);

    fs::remove_all(root);
}

TEST(FileStorageTest, ReopenPreservesWrittenBytes) {
    const auto root = fs::temp_directory_path() / "chunkbus_storage_reopen";
    fs::remove_all(root);

    const Bytes data{1, 2, 3, 4, 5, 6};
    const auto manifest = manifest_for("f2", "", data);
    FileStorageProvider provider(root);
    EXPECT_EQ(provider.path_for(manifest), root / "f2" / "f2.bin");

    {
        auto storage = provider.open(manifest);
        ASSERT_TRUE(storage.is_ok());
        ASSERT_TRUE(storage.value()->write_at(0, Bytes{1, 2, 3, 4}).is_ok());
    }

    auto reopened = provider.open(manifest);
    ASSERT_TRUE(reopened.is_ok());
    auto head = reopened.value()->read_at(0, 4);
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(head.value(), (Bytes{1, 2, 3, 4}));

    fs::remove_all(root);
}

TEST(FileStorageTest, RemoteNameCannotEscapeRoot) {
    const auto manifest = manifest_for("f3", "../../etc/passwd", Bytes{1});
    FileStorageProvider provider("/tmp/root");
    EXPECT_EQ(provider.path_for(manifest), fs::path("/tmp/root") / "f3" / "passwd");
}

TEST(MemoryStorageTest, InjectedFailuresAndSharedBlob) {
    const Bytes data{1, 2, 3, 4, 5, 6, 7, 8};
    const auto manifest = manifest_for("f1", "", data);

    MemoryStorageProvider provider;
    provider.fail_writes_at("f1", 4);

    auto storage = provider.open(manifest);
    ASSERT_TRUE(storage.is_ok());
    ASSERT_TRUE(storage.value()->write_at(0, Bytes{1, 2, 3, 4}).is_ok());

    auto failed = storage.value()->write_at(4, Bytes{5, 6, 7, 8});
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::StorageWrite);

    provider.clear_failures("f1");
    ASSERT_TRUE(storage.value()->write_at(4, Bytes{5, 6, 7, 8}).is_ok());

    // A second handle sees the same bytes, as after a restart
    auto reopened = provider.open(manifest);
    ASSERT_TRUE(reopened.is_ok());
    EXPECT_EQ(reopened.value()->digest().value(), manifest.file_digest);
    EXPECT_EQ(provider.contents("f1"), data);
    EXPECT_EQ(provider.blob("f1")->writes, 2u);
}
