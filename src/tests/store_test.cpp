#include <gtest/gtest.h>
#include <sstream>
#include <filesystem>
#include <functional>
#include <set>
#include <thread>
#include "crypto/cipher_suite.hpp"
#include "fingerprint/fingerprint_codec.hpp"
#include "store/store.hpp"
#include "test_utils.hpp"

using namespace cloudsync;
using namespace cloudsync::store;

class StoreTest : public ::testing::Test {
protected:
  test::TempDir dir{"store_test"};
  std::unique_ptr<LocalStore> store;

  void SetUp() override {
    test::init_test_logging();
    store = std::make_unique<LocalStore>(dir.path());
    ASSERT_NE(store, nullptr);
  }

  static fingerprint::FileFingerprint fingerprint_of(const std::string& data, const std::string& name) {
    std::istringstream input(data);
    return fingerprint::compute(input, name);
  }

  static std::vector<uint8_t> bytes_of(const std::string& data) {
    return std::vector<uint8_t>(data.begin(), data.end());
  }

  // Uploads `data` in chunks of `chunk_size` and commits it
  void put(const std::string& remote, const std::string& data, int64_t mtime = 1000, std::size_t chunk_size = 4) {
    std::vector<std::string> tokens;
    std::size_t index = 0;
    for (std::size_t offset = 0; offset < data.size() || tokens.empty(); offset += chunk_size) {
      tokens.push_back(store->upload_chunk(remote, index++, bytes_of(data.substr(offset, chunk_size))));
    }
    ASSERT_NO_THROW(store->commit_upload(remote, tokens, data.size(), mtime, std::nullopt)) << remote;
  }

  std::string get(const std::string& remote) {
    auto bytes = store->download_range(remote, 0, static_cast<std::size_t>(store->remote_size(remote)));
    return std::string(bytes.begin(), bytes.end());
  }

  static void expect_remote_error(const std::function<void()>& fn, int code) {
    try {
      fn();
      FAIL() << "Expected RemoteError " << code;
    } catch (const transfer::RemoteError& e) {
      EXPECT_EQ(e.code(), code) << e.what();
    }
  }
};

TEST_F(StoreTest, ChunksAssembleInTokenOrder) {
  const std::string data = "Hello, Store! Chunked content.";
  put("/docs/hello.txt", data, 1234);

  EXPECT_TRUE(store->has("/docs/hello.txt"));
  EXPECT_EQ(get("/docs/hello.txt"), data);

  auto entry = store->stat("/docs/hello.txt");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->path, "/docs/hello.txt");
  EXPECT_EQ(entry->size, data.size());
  EXPECT_EQ(entry->stored_size, data.size());
  EXPECT_EQ(entry->mtime, 1234);
  ASSERT_TRUE(entry->fingerprint.has_value());
  EXPECT_TRUE(entry->fingerprint->same_content(fingerprint_of(data, "hello.txt")));
  EXPECT_EQ(entry->fingerprint->filename, "hello.txt");

  // Staged chunks are gone after the commit
  EXPECT_TRUE(std::filesystem::is_empty(dir.path() / "staging"));
}

TEST_F(StoreTest, TokenNamesIndexAndDigest) {
  std::string token = store->upload_chunk("/t.bin", 7, bytes_of("123456789"));
  EXPECT_EQ(token, "7-25f9e794323b453885f5181f1b624d0b");

  // Same bytes, same token
  EXPECT_EQ(store->upload_chunk("/t.bin", 7, bytes_of("123456789")), token);
}

TEST_F(StoreTest, RangesAreServedPositionally) {
  put("/range.txt", "0123456789abcdef");
  auto middle = store->download_range("/range.txt", 4, 6);
  EXPECT_EQ(std::string(middle.begin(), middle.end()), "456789");

  // Short at the end, empty past it
  EXPECT_EQ(store->download_range("/range.txt", 14, 10).size(), 2u);
  EXPECT_TRUE(store->download_range("/range.txt", 100, 10).empty());
}

TEST_F(StoreTest, EmptyObject) {
  put("/empty", "");
  EXPECT_TRUE(store->has("/empty"));
  EXPECT_EQ(store->remote_size("/empty"), 0u);
  EXPECT_EQ(get("/empty"), "");
}

TEST_F(StoreTest, BadCommitsAreRefused) {
  std::string token = store->upload_chunk("/bad.txt", 0, bytes_of("content"));

  expect_remote_error([&] { store->commit_upload("/bad.txt", {token, "1-bogus"}, 7, 0, std::nullopt); },
                      LocalStore::BAD_REQUEST);
  expect_remote_error([&] { store->commit_upload("/bad.txt", {token}, 8, 0, std::nullopt); },
                      LocalStore::BAD_REQUEST);
  expect_remote_error([&] {
    store->commit_upload("/bad.txt", {token}, 7, 0, fingerprint_of("CONTENT", "bad.txt"));
  }, LocalStore::BAD_REQUEST);

  EXPECT_FALSE(store->has("/bad.txt"));

  // The staged chunk is still usable
  store->commit_upload("/bad.txt", {token}, 7, 0, fingerprint_of("content", "bad.txt"));
  EXPECT_EQ(get("/bad.txt"), "content");
}

TEST_F(StoreTest, DamagedEnvelopeIsRefused) {
  std::vector<uint8_t> bytes = {'C', 'S', 'E', 'V', 9, 1, 0, 0, 1, 2, 3, 4};
  std::string token = store->upload_chunk("/damaged", 0, bytes);
  expect_remote_error([&] { store->commit_upload("/damaged", {token}, bytes.size(), 0, std::nullopt); },
                      LocalStore::BAD_REQUEST);
  EXPECT_FALSE(store->has("/damaged"));
}

TEST_F(StoreTest, EncryptedObjectsReportPlaintextSize) {
  crypto::CipherSuite suite(crypto::Envelope::LATEST_VERSION, 1000);
  auto plain = test::random_bytes(100);
  auto handle = suite.open_encryptor("store secret", crypto::Algorithm::ChaCha20, plain.size());

  std::vector<uint8_t> stored = handle.envelope.serialize();
  handle.stream->update(plain.data(), plain.size(), stored);
  handle.stream->finalize(stored);

  auto fp = fingerprint_of(std::string(plain.begin(), plain.end()), "secret.bin");
  std::string token = store->upload_chunk("/secret.bin", 0, stored);
  store->commit_upload("/secret.bin", {token}, plain.size(), 77, fp);

  auto entry = store->stat("/secret.bin");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->size, 100u);
  EXPECT_EQ(entry->stored_size, stored.size());
  EXPECT_EQ(store->remote_size("/secret.bin"), stored.size());
  ASSERT_TRUE(entry->fingerprint.has_value());
  EXPECT_EQ(*entry->fingerprint, fp);

  // Ciphertext never serves rapid uploads
  EXPECT_EQ(store->indexed_objects(), 0u);
  EXPECT_FALSE(store->rapid_upload("/other.bin", fp, 0));
}

TEST_F(StoreTest, RapidUploadCopiesKnownContent) {
  const std::string data = "shared content used twice";
  put("/one/original.txt", data, 10);
  auto fp = fingerprint_of(data, "whatever.txt");

  EXPECT_TRUE(store->rapid_upload("/two/copy.txt", fp, 20));
  EXPECT_EQ(get("/two/copy.txt"), data);
  auto entry = store->stat("/two/copy.txt");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->mtime, 20);
  EXPECT_EQ(entry->fingerprint->filename, "copy.txt");
  EXPECT_EQ(store->indexed_objects(), 2u);

  // Unknown content, or known MD5 with another length
  EXPECT_FALSE(store->rapid_upload("/three.txt", fingerprint_of("other", "x"), 0));
  auto wrong_length = fp;
  wrong_length.length += 1;
  EXPECT_FALSE(store->rapid_upload("/three.txt", wrong_length, 0));
  EXPECT_FALSE(store->has("/three.txt"));
}

TEST_F(StoreTest, IndexSurvivesRestart) {
  put("/persist.txt", "persisted content");
  store = std::make_unique<LocalStore>(dir.path());

  EXPECT_EQ(store->indexed_objects(), 1u);
  EXPECT_TRUE(store->rapid_upload("/copy.txt", fingerprint_of("persisted content", "copy.txt"), 0));
}

TEST_F(StoreTest, MissingObjects) {
  EXPECT_FALSE(store->has("/nope"));
  EXPECT_FALSE(store->stat("/nope").has_value());
  expect_remote_error([&] { store->remote_size("/nope"); }, LocalStore::NOT_FOUND);
  expect_remote_error([&] { store->download_range("/nope", 0, 1); }, LocalStore::NOT_FOUND);
}

TEST_F(StoreTest, ListIsRecursiveAndSorted) {
  put("/a/x", "1");
  put("/a/b/y", "22");
  put("/ab/z", "333");
  put("/c", "4444");

  std::vector<std::string> below_a;
  for (const auto& entry : store->list("/a")) {
    below_a.push_back(entry.path);
  }
  EXPECT_EQ(below_a, (std::vector<std::string>{"/a/b/y", "/a/x"}));
  EXPECT_EQ(store->list("/a/").size(), 2u);
  EXPECT_EQ(store->list("/").size(), 4u);
  EXPECT_TRUE(store->list("/missing").empty());
}

TEST_F(StoreTest, OverwriteReplacesObject) {
  put("/file", "first version");
  put("/file", "second, longer version", 2000);

  EXPECT_EQ(get("/file"), "second, longer version");
  EXPECT_EQ(store->stat("/file")->mtime, 2000);
  EXPECT_EQ(store->indexed_objects(), 1u);
  EXPECT_FALSE(store->rapid_upload("/copy", fingerprint_of("first version", "copy"), 0));
}

TEST_F(StoreTest, RemoveSkipsMissingPaths) {
  put("/keep", "keep me");
  put("/drop", "drop me");

  EXPECT_NO_THROW(store->remove({"/drop", "/never-existed"}));
  EXPECT_FALSE(store->has("/drop"));
  EXPECT_TRUE(store->has("/keep"));
  EXPECT_EQ(store->indexed_objects(), 1u);
  EXPECT_EQ(store->list("/").size(), 1u);
}

TEST_F(StoreTest, ConcurrentChunkUploads) {
  const std::size_t chunk_count = 16;
  std::vector<std::string> tokens(chunk_count);
  std::vector<std::thread> threads;
  std::string expected;
  for (std::size_t i = 0; i < chunk_count; ++i) {
    expected += std::string(100, static_cast<char>('a' + i));
  }

  for (std::size_t i = 0; i < chunk_count; ++i) {
    threads.emplace_back([&, i]() {
      tokens[i] = store->upload_chunk("/parallel", i, bytes_of(expected.substr(i * 100, 100)));
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  store->commit_upload("/parallel", tokens, expected.size(), 0, std::nullopt);
  EXPECT_EQ(get("/parallel"), expected);
}
