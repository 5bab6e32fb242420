#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chunkshare/storage/chunk_store.h"
#include "test_support.h"

using chunkshare::core::ErrorCode;
using chunkshare::storage::ChunkStore;
using chunkshare::testing::Sha256Hex;
using chunkshare::testing::TempDir;

namespace {

std::string ReadAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void Put(ChunkStore& store, const std::string& session, int index, const std::string& body) {
    std::istringstream in(body);
    ASSERT_TRUE(store.WriteChunk(session, index, in).ok());
}

}  // namespace

TEST(ChunkStore, StagingHashesAndCommitPublishes) {
    TempDir dir;
    ChunkStore store(dir.Sub("tmp"), dir.Sub("files"));

    std::istringstream body("abc");
    auto staged = store.StageChunk("s1", body);
    ASSERT_TRUE(staged.ok());
    EXPECT_EQ(staged.value().size_bytes, 3u);
    EXPECT_EQ(staged.value().sha256,
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(store.ReadChunk("s1", 0).code(), ErrorCode::kNotFound);

    auto committed = store.CommitChunk(staged.value(), 0);
    ASSERT_TRUE(committed.ok());
    auto path = store.ReadChunk("s1", 0);
    ASSERT_TRUE(path.ok());
    EXPECT_EQ(ReadAll(path.value()), "abc");
    EXPECT_FALSE(std::filesystem::exists(staged.value().stage_path));
}

TEST(ChunkStore, StagingOverLimitIsRejectedAndRemoved) {
    TempDir dir;
    ChunkStore store(dir.Sub("tmp"), dir.Sub("files"));

    std::istringstream body(std::string(20000, 'x'));
    auto staged = store.StageChunk("s1", body, 10000);
    ASSERT_FALSE(staged.ok());
    EXPECT_EQ(staged.code(), ErrorCode::kPayloadTooLarge);

    // Only the (empty) session directory remains.
    EXPECT_TRUE(std::filesystem::is_empty(store.SessionDir("s1")));
}

TEST(ChunkStore, MergeConcatenatesInIndexOrder) {
    TempDir dir;
    ChunkStore store(dir.Sub("tmp"), dir.Sub("files"));
    Put(store, "s1", 2, "cccc");
    Put(store, "s1", 0, "aaaa");
    Put(store, "s1", 1, "bbbb");

    const auto target = store.FinalFilePath("f1");
    auto merged = store.MergeChunks("s1", 3, target);
    ASSERT_TRUE(merged.ok());
    EXPECT_EQ(merged.value(), 12u);
    EXPECT_EQ(ReadAll(target), "aaaabbbbcccc");

    auto digest = store.ComputeDigest(target);
    ASSERT_TRUE(digest.ok());
    EXPECT_EQ(digest.value(), Sha256Hex("aaaabbbbcccc"));
}

TEST(ChunkStore, MergeWithMissingChunkLeavesNoOutput) {
    TempDir dir;
    ChunkStore store(dir.Sub("tmp"), dir.Sub("files"));
    Put(store, "s1", 0, "aaaa");
    Put(store, "s1", 2, "cccc");

    const auto target = store.FinalFilePath("f1");
    auto merged = store.MergeChunks("s1", 3, target);
    ASSERT_FALSE(merged.ok());
    EXPECT_EQ(merged.code(), ErrorCode::kMissingChunk);
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_TRUE(std::filesystem::is_empty(std::filesystem::path(target).parent_path()));
}

TEST(ChunkStore, ConcurrentMergesIntoOneTargetBothSucceed) {
    TempDir dir;
    ChunkStore store(dir.Sub("tmp"), dir.Sub("files"));
    std::string expected;
    for (int index = 0; index < 8; ++index) {
        const std::string body(64 * 1024, static_cast<char>('a' + index));
        Put(store, "s1", index, body);
        expected += body;
    }

    const auto target = store.FinalFilePath("f1");
    for (int round = 0; round < 5; ++round) {
        std::atomic<int> failures{0};
        std::vector<std::thread> workers;
        for (int i = 0; i < 2; ++i) {
            workers.emplace_back([&] {
                if (!store.MergeChunks("s1", 8, target).ok()) {
                    ++failures;
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        EXPECT_EQ(failures.load(), 0) << "round " << round;
        EXPECT_EQ(ReadAll(target), expected);
    }
    // Only the promoted file remains beside the target.
    int entries = 0;
    for (const auto& entry :
         std::filesystem::directory_iterator(std::filesystem::path(target).parent_path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1);
}

TEST(ChunkStore, CleanupAndRemoval) {
    TempDir dir;
    ChunkStore store(dir.Sub("tmp"), dir.Sub("files"));
    Put(store, "s1", 0, "aaaa");
    ASSERT_TRUE(store.MergeChunks("s1", 1, store.FinalFilePath("f1")).ok());

    store.CleanupSession("s1");
    EXPECT_FALSE(std::filesystem::exists(store.SessionDir("s1")));

    ASSERT_TRUE(store.RemoveFinalFile("f1").ok());
    EXPECT_FALSE(std::filesystem::exists(store.FinalFilePath("f1")));
}

TEST(ChunkStore, RejectsUnsafeNames) {
    EXPECT_TRUE(ChunkStore::IsSafeName("3f2c7a1e-0b6d-4c4e-9f0a-2b1d3c4e5f60"));
    EXPECT_TRUE(ChunkStore::IsSafeName("abc_123"));
    EXPECT_FALSE(ChunkStore::IsSafeName(""));
    EXPECT_FALSE(ChunkStore::IsSafeName(".."));
    EXPECT_FALSE(ChunkStore::IsSafeName("a/b"));
    EXPECT_FALSE(ChunkStore::IsSafeName("a\\b"));

    TempDir dir;
    ChunkStore store(dir.Sub("tmp"), dir.Sub("files"));
    std::istringstream body("x");
    EXPECT_EQ(store.StageChunk("../escape", body).code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(store.RemoveFinalFile("../escape").code(), ErrorCode::kInvalidArgument);
}
