#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chunkshare/metadata/sqlite_repository.h"
#include "chunkshare/storage/chunk_store.h"
#include "chunkshare/upload/finalize_worker.h"
#include "chunkshare/upload/session_manager.h"
#include "test_support.h"

using chunkshare::metadata::FileStatus;
using chunkshare::metadata::SessionStatus;
using chunkshare::testing::SeedPrincipal;
using chunkshare::testing::Sha256Hex;
using chunkshare::testing::TempDir;
using chunkshare::upload::FinalizeJob;
using chunkshare::upload::FinalizeOutcome;

namespace {

class CapturingQueue : public chunkshare::upload::FinalizeQueue {
public:
    void Submit(const FinalizeJob& job) override { last = job; }
    FinalizeJob last;
};

class FinalizeWorkerTest : public ::testing::Test {
protected:
    FinalizeWorkerTest()
        : repo_(dir_.Sub("meta.db")),
          store_(dir_.Sub("tmp"), dir_.Sub("files")),
          manager_(repo_, store_, queue_, chunkshare::core::UploadConfig{}),
          worker_(repo_, store_) {}

    // Uploads `chunks` and requests finalize; the declared digest is `declared`.
    FinalizeJob Upload(const std::string& owner, const std::vector<std::string>& chunks,
                       const std::string& declared) {
        std::string content;
        for (const auto& chunk : chunks) {
            content += chunk;
        }
        chunkshare::upload::CreateSessionRequest request;
        request.filename = "notes.txt";
        request.mime_type = "text/plain";
        request.size_bytes = content.size();
        request.total_chunks = static_cast<int>(chunks.size());
        request.file_sha256 = declared;
        auto session = manager_.CreateSession(repo_.GetPrincipal(owner).value(), request);
        EXPECT_TRUE(session.ok());
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            std::istringstream in(chunks[i]);
            EXPECT_TRUE(manager_.AcceptChunk(session.value().id, static_cast<int>(i), in, {}).ok());
        }
        auto ticket = manager_.RequestFinalize(session.value().id, declared);
        EXPECT_TRUE(ticket.ok());
        return queue_.last;
    }

    TempDir dir_;
    chunkshare::metadata::SqliteRepository repo_;
    chunkshare::storage::ChunkStore store_;
    CapturingQueue queue_;
    chunkshare::upload::SessionManager manager_;
    chunkshare::upload::FinalizeWorker worker_;
};

std::string ReadAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

TEST_F(FinalizeWorkerTest, MergesVerifiesAndChargesQuota) {
    SeedPrincipal(repo_, "alice");
    const auto job = Upload("alice", {"aaaa", "bbbb", "cccc"}, Sha256Hex("aaaabbbbcccc"));

    EXPECT_EQ(worker_.Finalize(job), FinalizeOutcome::kReady);

    auto file = repo_.GetStoredFile(job.file_id);
    ASSERT_TRUE(file.ok());
    EXPECT_EQ(file.value().status, FileStatus::kReady);
    EXPECT_EQ(file.value().size_bytes, 12u);
    EXPECT_TRUE(file.value().completed_at.has_value());
    EXPECT_EQ(ReadAll(file.value().storage_path), "aaaabbbbcccc");
    EXPECT_EQ(repo_.GetUploadSession(job.session_id).value().status, SessionStatus::kCompleted);
    EXPECT_EQ(repo_.GetPrincipal("alice").value().used_bytes, 12u);
    EXPECT_FALSE(std::filesystem::exists(store_.SessionDir(job.session_id)));
}

TEST_F(FinalizeWorkerTest, RedeliveryIsSkippedWithoutDoubleCharge) {
    SeedPrincipal(repo_, "alice");
    const auto job = Upload("alice", {"aaaa"}, Sha256Hex("aaaa"));

    EXPECT_EQ(worker_.Finalize(job), FinalizeOutcome::kReady);
    EXPECT_EQ(worker_.Finalize(job), FinalizeOutcome::kSkipped);
    EXPECT_EQ(repo_.GetPrincipal("alice").value().used_bytes, 4u);
}

TEST_F(FinalizeWorkerTest, DigestMismatchFailsWithoutCharging) {
    SeedPrincipal(repo_, "alice");
    // The declared digest passes the request gate but does not match the merged bytes.
    const auto job = Upload("alice", {"aaaa", "bbbb"}, Sha256Hex("something else"));

    EXPECT_EQ(worker_.Finalize(job), FinalizeOutcome::kFailed);

    auto file = repo_.GetStoredFile(job.file_id);
    ASSERT_TRUE(file.ok());
    EXPECT_EQ(file.value().status, FileStatus::kError);
    EXPECT_FALSE(std::filesystem::exists(file.value().storage_path));
    EXPECT_EQ(repo_.GetUploadSession(job.session_id).value().status, SessionStatus::kFailed);
    EXPECT_EQ(repo_.GetPrincipal("alice").value().used_bytes, 0u);
}

TEST_F(FinalizeWorkerTest, QuotaIsRecheckedAtPromotion) {
    SeedPrincipal(repo_, "alice", 100, 0);
    const auto over = Upload("alice", {std::string(20, 'x')}, Sha256Hex(std::string(20, 'x')));
    const auto under = Upload("alice", {std::string(5, 'y')}, Sha256Hex(std::string(5, 'y')));

    // Usage grows to 90 between the request and the merge.
    ASSERT_TRUE(repo_.AdjustUsedBytes("alice", 90).ok());

    EXPECT_EQ(worker_.Finalize(over), FinalizeOutcome::kFailed);
    EXPECT_EQ(repo_.GetStoredFile(over.file_id).value().status, FileStatus::kError);
    EXPECT_EQ(repo_.GetPrincipal("alice").value().used_bytes, 90u);

    EXPECT_EQ(worker_.Finalize(under), FinalizeOutcome::kReady);
    EXPECT_EQ(repo_.GetPrincipal("alice").value().used_bytes, 95u);
}

TEST_F(FinalizeWorkerTest, ConcurrentDeliveriesOfOneJobPromoteOnce) {
    SeedPrincipal(repo_, "alice");
    std::vector<std::string> chunks;
    std::string content;
    for (int i = 0; i < 16; ++i) {
        chunks.emplace_back(std::string(4096, static_cast<char>('a' + i)));
        content += chunks.back();
    }

    for (int round = 0; round < 5; ++round) {
        const auto job = Upload("alice", chunks, Sha256Hex(content));
        std::vector<FinalizeOutcome> outcomes(2);
        std::vector<std::thread> workers;
        for (std::size_t i = 0; i < outcomes.size(); ++i) {
            workers.emplace_back([&, i] { outcomes[i] = worker_.Finalize(job); });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        std::sort(outcomes.begin(), outcomes.end());
        EXPECT_EQ(outcomes,
                  (std::vector<FinalizeOutcome>{FinalizeOutcome::kReady, FinalizeOutcome::kSkipped}))
            << "round " << round;
        auto file = repo_.GetStoredFile(job.file_id);
        ASSERT_TRUE(file.ok());
        EXPECT_EQ(file.value().status, FileStatus::kReady);
        EXPECT_EQ(ReadAll(file.value().storage_path), content);
        EXPECT_EQ(repo_.GetUploadSession(job.session_id).value().status,
                  SessionStatus::kCompleted);
    }
    EXPECT_EQ(repo_.GetPrincipal("alice").value().used_bytes, 5u * content.size());
}

TEST_F(FinalizeWorkerTest, ClaimedJobIsSkippedUntilRecoveryReleasesIt) {
    SeedPrincipal(repo_, "alice");
    const auto job = Upload("alice", {"aaaa"}, Sha256Hex("aaaa"));
    ASSERT_TRUE(repo_.ClaimFinalize(job.file_id, "previous-process").value());

    EXPECT_EQ(worker_.Finalize(job), FinalizeOutcome::kSkipped);
    EXPECT_EQ(repo_.GetStoredFile(job.file_id).value().status, FileStatus::kPending);

    ASSERT_TRUE(manager_.RecoverPendingFinalizations(10).ok());
    EXPECT_EQ(worker_.Finalize(job), FinalizeOutcome::kReady);
}

TEST_F(FinalizeWorkerTest, ConcurrentSessionsCannotOvershootQuota) {
    SeedPrincipal(repo_, "alice", 10, 0);
    const auto first = Upload("alice", {"aaaaaaaa"}, Sha256Hex("aaaaaaaa"));
    const auto second = Upload("alice", {"bbbbbbbb"}, Sha256Hex("bbbbbbbb"));

    std::vector<FinalizeOutcome> outcomes(2);
    std::thread a([&] { outcomes[0] = worker_.Finalize(first); });
    std::thread b([&] { outcomes[1] = worker_.Finalize(second); });
    a.join();
    b.join();

    std::sort(outcomes.begin(), outcomes.end());
    EXPECT_EQ(outcomes,
              (std::vector<FinalizeOutcome>{FinalizeOutcome::kReady, FinalizeOutcome::kFailed}));
    EXPECT_EQ(repo_.GetPrincipal("alice").value().used_bytes, 8u);

    int ready = 0;
    for (const auto& job : {first, second}) {
        const auto file = repo_.GetStoredFile(job.file_id).value();
        if (file.status == FileStatus::kReady) {
            ++ready;
            EXPECT_TRUE(std::filesystem::exists(file.storage_path));
        } else {
            EXPECT_EQ(file.status, FileStatus::kError);
            EXPECT_FALSE(std::filesystem::exists(file.storage_path));
            EXPECT_EQ(repo_.GetUploadSession(job.session_id).value().status,
                      SessionStatus::kFailed);
        }
    }
    EXPECT_EQ(ready, 1);
}

TEST_F(FinalizeWorkerTest, MissingChunkOnDiskFailsTheSession) {
    SeedPrincipal(repo_, "alice");
    const auto job = Upload("alice", {"aaaa", "bbbb"}, Sha256Hex("aaaabbbb"));
    std::filesystem::remove(store_.ChunkPath(job.session_id, 1));

    EXPECT_EQ(worker_.Finalize(job), FinalizeOutcome::kFailed);
    EXPECT_EQ(repo_.GetUploadSession(job.session_id).value().status, SessionStatus::kFailed);
}

TEST_F(FinalizeWorkerTest, UnknownJobIsAborted) {
    EXPECT_EQ(worker_.Finalize(FinalizeJob{"missing", "missing"}), FinalizeOutcome::kAborted);
}
