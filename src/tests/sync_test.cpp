#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include "fingerprint/fingerprint_cache.hpp"
#include "store/store.hpp"
#include "sync/sync_planner.hpp"
#include "utils/positional_file.hpp"
#include "mock_endpoint.hpp"
#include "test_utils.hpp"

using namespace cloudsync;
using namespace cloudsync::sync;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;

namespace {

FileTree tree_of(const std::vector<FileEntry>& entries) {
  FileTree tree;
  for (const auto& entry : entries) {
    tree[entry.relative_path] = entry;
  }
  return tree;
}

} // namespace

//==============================================
// DIFF
//==============================================

TEST(SyncDiffTest, ClassifiesEveryPath) {
  FileTree local = tree_of({{"a", 10, 100}, {"b", 5, 100}});
  FileTree remote = tree_of({{"a", 10, 100}, {"c", 3, 50}});

  std::vector<SyncDiffEntry> expected = {
    {"a", SyncAction::Skip},
    {"b", SyncAction::CreateRemote},
    {"c", SyncAction::DeleteRemote},
  };
  EXPECT_EQ(diff(local, remote), expected);
}

TEST(SyncDiffTest, SizeOrMtimeChangeMeansUpdate) {
  FileTree remote = tree_of({{"size", 10, 100}, {"mtime", 10, 100}, {"same", 10, 100}});
  FileTree local = tree_of({{"size", 11, 100}, {"mtime", 10, 101}, {"same", 10, 100}});

  std::vector<SyncDiffEntry> expected = {
    {"mtime", SyncAction::UpdateRemote},
    {"same", SyncAction::Skip},
    {"size", SyncAction::UpdateRemote},
  };
  EXPECT_EQ(diff(local, remote), expected);
}

TEST(SyncDiffTest, OneSidedTrees) {
  FileTree tree = tree_of({{"x/1", 1, 1}, {"x/2", 2, 2}});
  EXPECT_TRUE(diff({}, {}).empty());

  for (const auto& entry : diff(tree, {})) {
    EXPECT_EQ(entry.action, SyncAction::CreateRemote);
  }
  for (const auto& entry : diff({}, tree)) {
    EXPECT_EQ(entry.action, SyncAction::DeleteRemote);
  }
  EXPECT_STREQ(to_string(SyncAction::DeleteRemote), "delete");
}

//==============================================
// TREES
//==============================================

TEST(FileTreeTest, RemoteEntriesRelativeToDirectory) {
  std::vector<transfer::RemoteEntry> entries = {
    {"/backup/a.txt", 1, 1, 10, std::nullopt},
    {"/backup/sub/b.txt", 2, 2, 20, std::nullopt},
    {"/elsewhere/c.txt", 3, 3, 30, std::nullopt},
  };

  FileTree tree = remote_tree_from(entries, "/backup/");
  ASSERT_EQ(tree.size(), 2u);
  EXPECT_EQ(tree.at("sub/b.txt").size, 2u);
  EXPECT_EQ(tree.at("a.txt").mtime, 10);

  EXPECT_EQ(remote_tree_from(entries, "/").size(), 3u);
  EXPECT_EQ(remote_tree_from(entries, "/").count("elsewhere/c.txt"), 1u);
}

TEST(FileTreeTest, JoinUsesOneSeparator) {
  EXPECT_EQ(join_remote("/backup", "a/b.txt"), "/backup/a/b.txt");
  EXPECT_EQ(join_remote("/backup/", "a.txt"), "/backup/a.txt");
  EXPECT_EQ(join_remote("/", "a.txt"), "/a.txt");
}

TEST(FileTreeTest, LocalScanSkipsPartialDownloads) {
  test::init_test_logging();
  test::TempDir dir("scan_test");
  test::write_file(dir / "top.txt", std::string("top"));
  test::write_file(dir.path() / "nested" / "deep" / "leaf.bin", std::string("leaf!"));
  test::write_file(dir / "incoming.bin.cspart", std::string("partial"));
  utils::set_file_mtime(dir / "top.txt", 1500000000);

  FileTree tree = scan_local_tree(dir.path());
  ASSERT_EQ(tree.size(), 2u);
  EXPECT_EQ(tree.at("top.txt").size, 3u);
  EXPECT_EQ(tree.at("top.txt").mtime, 1500000000);
  EXPECT_EQ(tree.at("nested/deep/leaf.bin").size, 5u);

  EXPECT_THROW(scan_local_tree(dir / "missing"), std::filesystem::filesystem_error);
}

//==============================================
// PLANNER
//==============================================

class SyncPlannerTest : public ::testing::Test {
protected:
  test::TempDir dir{"sync_test"};
  store::LocalStore store{dir / "store"};
  NiceMock<test::MockEndpoint> endpoint;
  config::TransferConfig config;
  config::Session session;
  std::filesystem::path local_root = dir / "local";

  void SetUp() override {
    test::init_test_logging();
    config.chunk_size = 64;
    config.backoff_base = std::chrono::milliseconds(1);
    config.backoff_cap = std::chrono::milliseconds(2);
    session.user_id = "sync-user";
    session.secret = "sync secret";
    session.cipher.kdf_iterations = 1000;
    endpoint.delegate_to(store);

    test::write_file(local_root / "a.txt", std::string("alpha content"));
    test::write_file(local_root / "sub" / "b.txt", std::string("bravo content, a little longer"));
    utils::set_file_mtime(local_root / "a.txt", 1600000000);
    utils::set_file_mtime(local_root / "sub" / "b.txt", 1600000100);
  }

  SyncReport run_sync(transfer::RemoteEndpoint& remote, const std::string& remote_root = "/backup") {
    transfer::TransferScheduler scheduler(remote, config, std::make_shared<fingerprint::MemoryFingerprintCache>());
    SyncPlanner planner(scheduler, remote);
    return planner.execute(planner.plan(local_root, remote_root), local_root, remote_root, session);
  }

  std::vector<SyncDiffEntry> plan(const std::string& remote_root = "/backup") {
    transfer::TransferScheduler scheduler(store, config);
    return SyncPlanner(scheduler, store).plan(local_root, remote_root);
  }

  static bool all_skip(const std::vector<SyncDiffEntry>& entries) {
    return std::all_of(entries.begin(), entries.end(),
                       [](const SyncDiffEntry& e) { return e.action == SyncAction::Skip; });
  }
};

TEST_F(SyncPlannerTest, FirstSyncCreatesEverything) {
  std::vector<SyncDiffEntry> expected = {
    {"a.txt", SyncAction::CreateRemote},
    {"sub/b.txt", SyncAction::CreateRemote},
  };
  EXPECT_EQ(plan(), expected);

  SyncReport report = run_sync(store);
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.count(SyncAction::CreateRemote), 2u);
  EXPECT_TRUE(store.has("/backup/a.txt"));
  EXPECT_TRUE(store.has("/backup/sub/b.txt"));
  EXPECT_EQ(store.stat("/backup/a.txt")->mtime, 1600000000);

  // Nothing left to do afterwards
  EXPECT_TRUE(all_skip(plan()));
}

TEST_F(SyncPlannerTest, EncryptedSyncConverges) {
  session.cipher.algorithm = crypto::Algorithm::Aes256Cbc;
  ASSERT_TRUE(run_sync(store).ok());

  auto entry = store.stat("/backup/sub/b.txt");
  ASSERT_TRUE(entry.has_value());
  EXPECT_GT(entry->stored_size, entry->size);
  EXPECT_TRUE(all_skip(plan()));
}

TEST_F(SyncPlannerTest, UpdatesAndDeletes) {
  ASSERT_TRUE(run_sync(store).ok());

  test::write_file(local_root / "a.txt", std::string("alpha content, edited"));
  std::filesystem::remove(local_root / "sub" / "b.txt");
  test::write_file(local_root / "c.txt", std::string("charlie"));

  std::vector<SyncDiffEntry> expected = {
    {"a.txt", SyncAction::UpdateRemote},
    {"c.txt", SyncAction::CreateRemote},
    {"sub/b.txt", SyncAction::DeleteRemote},
  };
  EXPECT_EQ(plan(), expected);

  SyncReport report = run_sync(store);
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.count(SyncAction::UpdateRemote), 1u);
  EXPECT_EQ(report.count(SyncAction::DeleteRemote), 1u);
  EXPECT_FALSE(store.has("/backup/sub/b.txt"));
  EXPECT_EQ(store.stat("/backup/a.txt")->size, std::string("alpha content, edited").size());
  EXPECT_TRUE(all_skip(plan()));
}

TEST_F(SyncPlannerTest, KnownContentIsRapidUploaded) {
  ASSERT_TRUE(run_sync(store, "/first").ok());

  SyncReport report = run_sync(store, "/second");
  ASSERT_TRUE(report.ok());
  ASSERT_EQ(report.outcomes.size(), 2u);
  for (const auto& outcome : report.outcomes) {
    EXPECT_TRUE(outcome.rapid_uploaded) << outcome.relative_path;
  }
  EXPECT_TRUE(store.has("/second/sub/b.txt"));
}

TEST_F(SyncPlannerTest, UploadFailureIsReportedPerPath) {
  config.retry_limit = 2;
  ON_CALL(endpoint, upload_chunk("/backup/a.txt", _, _)).WillByDefault(Throw(transfer::RemoteError(403, "denied")));

  SyncReport report = run_sync(endpoint);
  EXPECT_FALSE(report.ok());
  EXPECT_EQ(report.failures(), 1u);
  for (const auto& outcome : report.outcomes) {
    if (outcome.relative_path == "a.txt") {
      EXPECT_FALSE(outcome.ok);
      EXPECT_NE(outcome.message.find("denied"), std::string::npos);
    } else {
      EXPECT_TRUE(outcome.ok) << outcome.message;
    }
  }
  EXPECT_TRUE(store.has("/backup/sub/b.txt"));
}

TEST_F(SyncPlannerTest, DeletesAreBatched) {
  ASSERT_TRUE(run_sync(store).ok());
  std::filesystem::remove_all(local_root);
  std::filesystem::create_directories(local_root);

  EXPECT_CALL(endpoint, remove(std::vector<std::string>{"/backup/a.txt", "/backup/sub/b.txt"})).Times(1);
  SyncReport report = run_sync(endpoint);
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.count(SyncAction::DeleteRemote), 2u);
  EXPECT_TRUE(store.list("/backup").empty());
}

TEST_F(SyncPlannerTest, FailedBatchDeleteMarksDeletions) {
  ASSERT_TRUE(run_sync(store).ok());
  std::filesystem::remove(local_root / "sub" / "b.txt");
  test::write_file(local_root / "new.txt", std::string("new"));

  ON_CALL(endpoint, remove(_)).WillByDefault(Throw(transfer::RemoteError(500, "batch rejected")));
  SyncReport report = run_sync(endpoint);
  EXPECT_EQ(report.failures(), 1u);
  for (const auto& outcome : report.outcomes) {
    EXPECT_EQ(outcome.ok, outcome.action != SyncAction::DeleteRemote) << outcome.relative_path;
  }
  EXPECT_TRUE(store.has("/backup/new.txt"));
  EXPECT_TRUE(store.has("/backup/sub/b.txt"));
}
