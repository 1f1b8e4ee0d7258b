#include <gtest/gtest.h>
#include <sstream>
#include <filesystem>
#include "store/store.hpp"
#include "test_utils.hpp"
#include <thread>
#include <atomic>

using namespace blobxfer::store;

class StoreTest : public ::testing::Test {
protected:
  TempDir dir{"blobxfer_store_test_"};
  std::unique_ptr<Store> store;

  void SetUp() override {
    store = std::make_unique<Store>(dir.path() / "objects", 16);
    ASSERT_TRUE(std::filesystem::is_directory(store->base_path()));
  }

  void store_and_verify(const std::string& key, const std::string& data) {
    std::istringstream input(data);
    ASSERT_TRUE(store->store(key, input)) << "Failed to store key: " << key;
    ASSERT_TRUE(store->has(key)) << "Key should exist after storing: " << key;

    std::ostringstream output;
    ASSERT_TRUE(store->get(key, output)) << "Failed to retrieve key: " << key;
    ASSERT_EQ(output.str(), data) << "Data mismatch for key: " << key;
  }

  void expect_retrieval_fails(const std::string& key) {
    EXPECT_FALSE(store->has(key)) << "Key should not exist: " << key;
    std::ostringstream output;
    EXPECT_THROW(store->get(key, output), ObjectNotFoundError)
      << "Getting non-existent key should throw: " << key;
  }

  size_t count_files() const {
    size_t count = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(store->base_path())) {
      if (entry.is_regular_file()) {
        ++count;
      }
    }
    return count;
  }
};

TEST_F(StoreTest, BasicOperations) {
  store_and_verify("/user/report.pdf", "Hello, Store!");
  store_and_verify("/user/empty", "");
  expect_retrieval_fails("/user/missing");
}

TEST_F(StoreTest, ContentAddressedLayout) {
  std::filesystem::path path = store->resolve_key_path("/user/report.pdf");
  std::filesystem::path relative = std::filesystem::relative(path, store->base_path());

  std::vector<std::string> parts;
  for (const auto& part : relative) {
    parts.push_back(part.string());
  }
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(parts[0].size(), 2u);
  EXPECT_EQ(parts[1].size(), 2u);
  EXPECT_EQ(parts[2].size(), 2u);
  EXPECT_EQ(parts[3].size(), 64u - 6u);
  EXPECT_EQ(path, store->resolve_key_path("/user/report.pdf"));
  EXPECT_NE(path, store->resolve_key_path("/user/report.pdf2"));
}

TEST_F(StoreTest, ChunkCallbackReportsProgress) {
  const std::string data(100, 'x');
  std::vector<std::uint64_t> seen;

  std::istringstream input(data);
  ASSERT_TRUE(store->store("chunked", input, [&seen](std::uint64_t bytes) {
    seen.push_back(bytes);
    return true;
  }));

  // 16 byte chunks
  ASSERT_EQ(seen.size(), 7u);
  EXPECT_EQ(seen.front(), 16u);
  EXPECT_EQ(seen.back(), 100u);

  std::vector<std::uint64_t> read;
  std::ostringstream output;
  ASSERT_TRUE(store->get("chunked", output, [&read](std::uint64_t bytes) {
    read.push_back(bytes);
    return true;
  }));
  EXPECT_EQ(read.back(), 100u);
  EXPECT_EQ(output.str(), data);
}

TEST_F(StoreTest, AbortedStoreKeepsPreviousObject) {
  store_and_verify("doc", "original");

  std::istringstream replacement(std::string(64, 'r'));
  EXPECT_FALSE(store->store("doc", replacement, [](std::uint64_t bytes) { return bytes < 32; }));

  std::ostringstream output;
  store->get("doc", output);
  EXPECT_EQ(output.str(), "original");
  EXPECT_EQ(count_files(), 1u) << "Aborted store must not leave staging files";
}

TEST_F(StoreTest, RemoveCleansUpDirectories) {
  store_and_verify("doc", "content");
  std::filesystem::path first_level = store->base_path() /
    std::filesystem::relative(store->resolve_key_path("doc"), store->base_path()).begin()->string();

  ASSERT_NO_THROW(store->remove("doc"));
  EXPECT_FALSE(store->has("doc"));
  EXPECT_FALSE(std::filesystem::exists(first_level));
  EXPECT_TRUE(std::filesystem::exists(store->base_path()));

  EXPECT_THROW(store->remove("doc"), ObjectNotFoundError);
}

TEST_F(StoreTest, ErrorHandling) {
  std::stringstream bad_stream;
  bad_stream.setstate(std::ios::badbit);
  EXPECT_THROW(store->store("bad_stream", bad_stream), StoreError);
  EXPECT_THROW(store->get_file_size("bad_stream"), ObjectNotFoundError);

  store_and_verify("temp_key", "temp_data");
  ASSERT_NO_THROW(store->clear());
  expect_retrieval_fails("temp_key");
}

TEST_F(StoreTest, EdgeCaseKeys) {
  const std::string data = "Test data";
  for (const auto& key : {std::string(), std::string("../path/traversal"), std::string(1024, 'a'),
                          std::string("/absolute/path"), std::string("\\windows\\path")}) {
    store_and_verify(key, data);
    EXPECT_EQ(store->resolve_key_path(key).parent_path().parent_path().parent_path().parent_path(),
              store->base_path()) << "Keys never escape the store: " << key;
  }
}

TEST_F(StoreTest, OverwriteAndSize) {
  const std::string large_data(1024 * 1024, 'X');
  store_and_verify("advanced_test", large_data);
  ASSERT_EQ(store->get_file_size("advanced_test"), large_data.size());

  const std::string updated_data = "Updated content";
  store_and_verify("advanced_test", updated_data);
  ASSERT_EQ(store->get_file_size("advanced_test"), updated_data.size());
}

TEST_F(StoreTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 50;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          std::string key = "concurrent_" + std::to_string(i) + "_" + std::to_string(j);
          std::istringstream input("Data for " + key);
          std::ostringstream output;
          if (store->store(key, input) && store->get(key, output) && output.str() == "Data for " + key) {
            successful_ops++;
          }
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops.load(), num_threads * ops_per_thread);
}
